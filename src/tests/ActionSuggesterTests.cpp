// SPDX-License-Identifier: Apache-2.0
#include <story/ActionSuggester.hpp>

#include "TestModel.hpp"

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <stop_token>
#include <string>
#include <vector>

using namespace storyloom;
using namespace storyloom::test;

namespace
{

auto suggestionConfig(int minLength) -> SamplingConfig
{
    auto c = SamplingConfig {};
    c.temperature = 1.0f;
    c.repetitionPenalty = 1.0f;
    c.topK = 0;
    c.topP = 1.0f;
    c.maxNewTokens = 40;
    c.minLength = minLength;
    return c;
}

auto texts(const SuggestionSet& set) -> std::vector<std::string>
{
    auto result = std::vector<std::string> {};
    for (const auto& candidate: set.candidates)
        result.push_back(candidate.text);
    return result;
}

const auto Prompt = std::vector<TokenId> { token('>'), token(' ') };

} // namespace

TEST_CASE("extractActionLine keeps the first trimmed line before any action marker", "[suggest]")
{
    CHECK(extractActionLine("  open the door \n> You run") == "open the door");
    CHECK(extractActionLine("walk north > look") == "walk north");
    CHECK(extractActionLine("\n\n") == "");
}

TEST_CASE("suggestActions drops short candidates and keeps run order", "[suggest]")
{
    auto const model = FakeModel(scriptedReplies({ "open the door", "x", "run away", "y", "look around" }));
    auto const suggester = ActionSuggester(model, SuggestionOptions { .decode = {}, .prefix = {}, .parallel = false });
    auto random = ScriptedRandom({ 0.5 });

    auto const set = suggester.suggestActions(Prompt, 5, suggestionConfig(2), random);

    CHECK(set.requested == 5);
    CHECK(set.shortfall() == 2);
    CHECK(set.failed == 0);
    CHECK_FALSE(set.cancelled);
    CHECK(texts(set) == std::vector<std::string> { "open the door", "run away", "look around" });
    REQUIRE(set.candidates.size() == 3);
    CHECK(set.candidates[0].run == 0);
    CHECK(set.candidates[1].run == 2);
    CHECK(set.candidates[2].run == 4);
    CHECK(set.candidates[1].sampling.minLength == 2);
    CHECK(random.forks() == 5);
}

TEST_CASE("suggestActions prepends the prefix", "[suggest]")
{
    auto const model = FakeModel(scriptedReplies({ "open the door" }));
    auto const suggester = ActionSuggester(model, SuggestionOptions { .decode = {}, .prefix = "You", .parallel = false });
    auto random = ScriptedRandom({ 0.5 });

    auto const set = suggester.suggestActions(Prompt, 1, suggestionConfig(2), random);
    CHECK(texts(set) == std::vector<std::string> { "You open the door" });
}

TEST_CASE("suggestActions counts failed runs as missing", "[suggest]")
{
    auto script = std::vector<Result<TokenDistribution>> {
        oneHot(token('a')),
        oneHot(token('b')),
        oneHot(EndOfSequence),
        makeError(ErrorCode::IoError, "decode failed"),
        oneHot(token('c')),
        oneHot(token('d')),
        oneHot(EndOfSequence),
    };
    auto next = std::size_t { 0 };
    auto const model = FakeModel([&](auto) { return script[std::min(next++, script.size() - 1)]; });
    auto const suggester = ActionSuggester(model, SuggestionOptions { .decode = {}, .prefix = {}, .parallel = false });
    auto random = ScriptedRandom({ 0.5 });

    auto const set = suggester.suggestActions(Prompt, 3, suggestionConfig(2), random);
    CHECK(set.failed == 1);
    CHECK(set.shortfall() == 1);
    CHECK(texts(set) == std::vector<std::string> { "ab", "cd" });
}

TEST_CASE("suggestActions stops the remaining runs on cancellation", "[suggest]")
{
    auto source = std::stop_source {};
    auto calls = 0;
    auto const model = FakeModel([&](auto) -> Result<TokenDistribution> {
        ++calls;
        if (calls == 3) // first run was "ab", the second is interrupted
            return oneHot(EndOfSequence);
        if (calls == 5)
            source.request_stop();
        return oneHot(token(calls < 3 ? static_cast<char>('a' + calls - 1) : 'z'));
    });
    auto const suggester = ActionSuggester(model, SuggestionOptions { .decode = {}, .prefix = {}, .parallel = false });
    auto random = ScriptedRandom({ 0.5 });

    auto const set = suggester.suggestActions(Prompt, 4, suggestionConfig(1), random, source.get_token());
    CHECK(set.cancelled);
    CHECK(texts(set) == std::vector<std::string> { "ab" });
    CHECK(calls == 5);
}

TEST_CASE("suggestActions stops each run at a newline", "[suggest]")
{
    auto const model = FakeModel(scriptedReplies({ " climb the tree\nYou fall" }));
    auto const options = SuggestionOptions {
        .decode = DecodeOptions { .stopTokens = { token('\n') }, .minTokensBeforeStop = 1 },
        .prefix = {},
        .parallel = false,
    };
    auto const suggester = ActionSuggester(model, options);
    auto random = ScriptedRandom({ 0.5 });

    auto const set = suggester.suggestActions(Prompt, 1, suggestionConfig(2), random);
    CHECK(texts(set) == std::vector<std::string> { "climb the tree" });
}

TEST_CASE("Parallel suggestions match sequential ones for the same seed", "[suggest]")
{
    auto contextMismatch = std::atomic<bool> { false };
    auto const model = FakeModel([&](std::span<const TokenId> context) -> Result<TokenDistribution> {
        if (context.size() < Prompt.size() || context[0] != Prompt[0] || context[1] != Prompt[1])
            contextMismatch = true;

        auto const offset = context.size() - Prompt.size();
        if (offset == 0)
        {
            auto scores = std::vector<double>(VocabularySize, 0.0);
            for (auto ch = 'a'; ch <= 'e'; ++ch)
                scores[static_cast<std::size_t>(token(ch))] = 1.0;
            return TokenDistribution(std::move(scores));
        }
        if (offset < 4)
            return oneHot(context.back());
        return oneHot(EndOfSequence);
    });

    auto run = [&](bool parallel) {
        auto const suggester =
            ActionSuggester(model, SuggestionOptions { .decode = {}, .prefix = {}, .parallel = parallel });
        auto random = SeededRandom(99);
        return suggester.suggestActions(Prompt, 6, suggestionConfig(2), random);
    };

    auto const sequential = run(false);
    auto const parallel = run(true);

    CHECK(sequential.candidates.size() == 6);
    CHECK(texts(parallel) == texts(sequential));
    CHECK_FALSE(contextMismatch.load());
    for (const auto& text: texts(parallel))
        CHECK(text.size() == 4);
}

TEST_CASE("suggestActions with a zero count does nothing", "[suggest]")
{
    auto const model = FakeModel(scriptedReplies({ "unused" }));
    auto const suggester = ActionSuggester(model);
    auto random = ScriptedRandom({ 0.5 });

    auto const set = suggester.suggestActions(Prompt, 0, suggestionConfig(2), random);
    CHECK(set.candidates.empty());
    CHECK(set.requested == 0);
    CHECK(model.calls() == 0);
}
