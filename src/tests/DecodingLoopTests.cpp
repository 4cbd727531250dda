// SPDX-License-Identifier: Apache-2.0
#include <decoding/DecodingLoop.hpp>

#include "TestModel.hpp"

#include <catch2/catch_test_macros.hpp>

#include <array>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <stop_token>
#include <string>
#include <thread>

using namespace storyloom;
using namespace storyloom::test;

namespace
{

auto config(int maxNewTokens) -> SamplingConfig
{
    auto c = SamplingConfig {};
    c.maxNewTokens = maxNewTokens;
    return c;
}

auto asText(std::span<const TokenId> tokens) -> std::string
{
    auto text = std::string {};
    for (auto const t: tokens)
        text += static_cast<char>(t);
    return text;
}

} // namespace

TEST_CASE("DecodingLoop stops after maxNewTokens", "[decoding]")
{
    auto const model = FakeModel([](auto) -> Result<TokenDistribution> { return oneHot(token('a')); });
    auto loop = DecodingLoop(model, config(40));
    auto random = SeededRandom(1);

    auto const result = loop.run({}, random);
    REQUIRE(result.has_value());
    CHECK(result->reason == StopReason::MaxTokens);
    CHECK(result->tokens.size() == 40);
    CHECK(loop.history().size() == 40);
    CHECK(model.calls() == 40);
    CHECK(loop.state() == DecodeState::Stopped);
}

TEST_CASE("DecodingLoop stops at end-of-sequence without emitting it", "[decoding]")
{
    auto const model = FakeModel(scriptedReplies({ "abc" }));
    auto loop = DecodingLoop(model, config(40));
    auto random = SeededRandom(1);

    auto emitted = std::string {};
    auto const result = loop.run({}, random, {}, [&](TokenId t) { emitted += static_cast<char>(t); });
    REQUIRE(result.has_value());
    CHECK(result->reason == StopReason::EndOfSequence);
    CHECK(asText(result->tokens) == "abc");
    CHECK(emitted == "abc");
    CHECK(asText(loop.history().tokens()) == "abc");
}

TEST_CASE("DecodingLoop honors stop tokens after the minimum count", "[decoding]")
{
    auto const model = FakeModel(scriptedReplies({ "a>bc>def" }));
    auto loop = DecodingLoop(model, config(40));
    loop.setOptions(DecodeOptions { .stopTokens = { token('>') }, .minTokensBeforeStop = 2 });
    auto random = SeededRandom(1);

    auto const result = loop.run({}, random);
    REQUIRE(result.has_value());
    CHECK(result->reason == StopReason::StopToken);
    CHECK(asText(result->tokens) == "a>bc>");
}

TEST_CASE("DecodingLoop sees prompt followed by history", "[decoding]")
{
    auto seen = std::string {};
    auto const model = FakeModel([&](std::span<const TokenId> context) -> Result<TokenDistribution> {
        seen = asText(context);
        return oneHot(token('z'));
    });
    auto const seed = std::vector<TokenId> { token('h') };
    auto loop = DecodingLoop(model, config(2), GenerationHistory(seed));
    auto random = SeededRandom(1);

    auto const prompt = std::array<TokenId, 2> { token('p'), token('q') };
    REQUIRE(loop.run(prompt, random).has_value());
    CHECK(seen == "pqhz");
    CHECK(asText(loop.history().tokens()) == "hzz");
}

TEST_CASE("DecodingLoop cancellation mid-step leaves the history as before the step", "[decoding]")
{
    auto source = std::stop_source {};
    auto calls = 0;
    auto const model = FakeModel([&](auto) -> Result<TokenDistribution> {
        if (++calls == 3)
            source.request_stop(); // the model answers, but too late
        return oneHot(token('x'));
    });
    auto loop = DecodingLoop(model, config(40));
    auto random = SeededRandom(1);

    auto emitted = 0;
    auto const result = loop.run({}, random, source.get_token(), [&](TokenId) { ++emitted; });
    REQUIRE(result.has_value());
    CHECK(result->cancelled());
    CHECK(result->tokens.size() == 2);
    CHECK(loop.history().size() == 2);
    CHECK(emitted == 2);
}

TEST_CASE("DecodingLoop hands its stop token to the model", "[decoding]")
{
    auto source = std::stop_source {};
    auto calls = 0;
    auto sawStop = false;
    auto const model = FakeModel([&](std::span<const TokenId>, std::stop_token stop) -> Result<TokenDistribution> {
        if (++calls == 3)
        {
            source.request_stop(); // Ctrl-C while the model is busy
            sawStop = stop.stop_requested();
            return makeError(ErrorCode::Cancelled, "abandoned");
        }
        return oneHot(token('x'));
    });
    auto loop = DecodingLoop(model, config(40));
    auto random = SeededRandom(1);

    auto const result = loop.run({}, random, source.get_token());
    REQUIRE(result.has_value());
    CHECK(sawStop);
    CHECK(result->cancelled());
    CHECK(result->tokens.size() == 2);
    CHECK(loop.history().size() == 2);
}

TEST_CASE("DecodingLoop abandons a waiting model call when a stop is requested", "[decoding]")
{
    auto mutex = std::mutex {};
    auto never = std::condition_variable_any {};
    auto started = std::atomic<bool> { false };
    auto abandoned = std::atomic<bool> { false };
    auto const model = FakeModel([&](std::span<const TokenId>, std::stop_token stop) -> Result<TokenDistribution> {
        started = true;
        auto lock = std::unique_lock(mutex);
        never.wait_for(lock, stop, std::chrono::seconds(10), [] { return false; });
        abandoned = stop.stop_requested();
        return makeError(ErrorCode::Cancelled, "abandoned");
    });
    auto loop = DecodingLoop(model, config(40));
    auto random = SeededRandom(1);

    auto source = std::stop_source {};
    auto canceller = std::jthread([&] {
        while (!started)
            std::this_thread::yield();
        source.request_stop();
    });

    auto const result = loop.run({}, random, source.get_token());
    canceller.join();

    REQUIRE(result.has_value());
    CHECK(abandoned);
    CHECK(result->cancelled());
    CHECK(result->tokens.empty());
    CHECK(loop.history().size() == 0);
    CHECK(model.calls() == 1);
}

TEST_CASE("DecodingLoop does not call the model once cancelled", "[decoding]")
{
    auto const model = FakeModel([](auto) -> Result<TokenDistribution> { return oneHot(token('x')); });
    auto loop = DecodingLoop(model, config(40));
    auto random = SeededRandom(1);

    auto source = std::stop_source {};
    source.request_stop();
    auto const result = loop.run({}, random, source.get_token());
    REQUIRE(result.has_value());
    CHECK(result->cancelled());
    CHECK(result->tokens.empty());
    CHECK(model.calls() == 0);
}

TEST_CASE("DecodingLoop reports model failures as GenerationFailed", "[decoding]")
{
    auto calls = 0;
    auto const model = FakeModel([&](auto) -> Result<TokenDistribution> {
        if (++calls == 3)
            return makeError(ErrorCode::IoError, "device lost");
        return oneHot(token('y'));
    });
    auto loop = DecodingLoop(model, config(40));
    auto random = SeededRandom(1);

    auto const result = loop.run({}, random);
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code == ErrorCode::GenerationFailed);
    CHECK(loop.history().size() == 2);
    CHECK(loop.state() == DecodeState::Stopped);
    CHECK(calls == 3); // no retry
}

TEST_CASE("DecodingLoop reports malformed distributions as GenerationFailed", "[decoding]")
{
    auto const model = FakeModel([](auto) -> Result<TokenDistribution> { return TokenDistribution {}; });
    auto loop = DecodingLoop(model, config(5));
    auto random = SeededRandom(1);

    auto const result = loop.run({}, random);
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code == ErrorCode::GenerationFailed);
    CHECK(loop.history().empty());
}

TEST_CASE("DecodingLoop is reproducible for a fixed seed", "[decoding]")
{
    auto const model = FakeModel([](auto) -> Result<TokenDistribution> {
        auto scores = std::vector<double>(VocabularySize, 0.0);
        for (auto ch = 'a'; ch <= 'z'; ++ch)
            scores[static_cast<std::size_t>(token(ch))] = 1.0;
        return TokenDistribution(std::move(scores));
    });

    auto c = config(30);
    c.temperature = 1.0f;
    c.topK = 0;
    c.topP = 1.0f;

    auto runWithSeed = [&](std::uint64_t seed) {
        auto loop = DecodingLoop(model, c);
        auto random = SeededRandom(seed);
        return loop.run({}, random).value().tokens;
    };

    CHECK(runWithSeed(7) == runWithSeed(7));
    CHECK(runWithSeed(7) != runWithSeed(8));
}
