// SPDX-License-Identifier: Apache-2.0
#include <sampling/Sampler.hpp>

#include "TestModel.hpp"

#include <catch2/catch_test_macros.hpp>

#include <array>

using namespace storyloom;
using storyloom::test::ScriptedRandom;

TEST_CASE("sample maps the draw through the cumulative distribution", "[sampler]")
{
    auto const dist = TokenDistribution({ 0.2f, 0.0f, 0.5f, 0.3f });

    auto check = [&](double draw, TokenId expected) {
        auto random = ScriptedRandom({ draw });
        auto const result = sample(dist, random);
        REQUIRE(result.has_value());
        CHECK(*result == expected);
    };

    check(0.0, 0);
    check(0.19, 0);
    check(0.21, 2);
    check(0.69, 2);
    check(0.71, 3);
    check(0.999999, 3);
}

TEST_CASE("sample never returns a zero-mass token", "[sampler]")
{
    auto const dist = TokenDistribution({ 0.0f, 1.0f, 0.0f });
    for (auto const draw: { 0.0, 0.5, 0.9999999 })
    {
        auto random = ScriptedRandom({ draw });
        CHECK(sample(dist, random).value() == 1);
    }
}

TEST_CASE("sample is reproducible for a fixed seed", "[sampler]")
{
    auto const dist = TokenDistribution({ 0.1f, 0.2f, 0.3f, 0.4f });
    auto a = SeededRandom(42);
    auto b = SeededRandom(42);
    for (auto i = 0; i < 50; ++i)
        CHECK(sample(dist, a).value() == sample(dist, b).value());
}

TEST_CASE("sample fails on an empty distribution", "[sampler]")
{
    auto random = ScriptedRandom({ 0.5 });
    auto const result = sample(TokenDistribution {}, random);
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code == ErrorCode::InvalidArgument);
}

TEST_CASE("Sampler penalizes before filtering", "[sampler]")
{
    // Token 0 leads until the penalty of 4 drops it to 0.15, behind token 1.
    auto const config = SamplingConfig {
        .temperature = 1.0f,
        .repetitionPenalty = 4.0f,
        .repetitionWindow = 0,
        .topK = 1,
        .topP = 1.0f,
        .maxNewTokens = 1,
        .minLength = 0,
    };
    auto const sampler = Sampler(config);
    auto const scores = TokenDistribution({ 0.6f, 0.4f });
    auto random = ScriptedRandom({ 0.0 });

    auto const fresh = std::array<TokenId, 1> { 1 };
    CHECK(sampler.next(scores, fresh, random).value() == 0);

    auto const repeated = std::array<TokenId, 1> { 0 };
    CHECK(sampler.next(scores, repeated, random).value() == 1);
}

TEST_CASE("Sampler only penalizes within the repetition window", "[sampler]")
{
    auto const config = SamplingConfig {
        .temperature = 1.0f,
        .repetitionPenalty = 4.0f,
        .repetitionWindow = 1,
        .topK = 1,
        .topP = 1.0f,
        .maxNewTokens = 1,
        .minLength = 0,
    };
    auto const sampler = Sampler(config);
    auto random = ScriptedRandom({ 0.0 });

    auto const context = std::array<TokenId, 2> { 0, 1 };
    CHECK(sampler.next(TokenDistribution({ 0.6f, 0.4f }), context, random).value() == 0);
}
