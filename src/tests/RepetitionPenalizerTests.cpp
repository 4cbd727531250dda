// SPDX-License-Identifier: Apache-2.0
#include <sampling/RepetitionPenalizer.hpp>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <array>

using namespace storyloom;
using Catch::Approx;

TEST_CASE("penalize divides repeated tokens by the penalty", "[penalty]")
{
    auto const recent = std::array<TokenId, 3> { 1, 3, 1 };
    auto const result = penalize(TokenDistribution({ 0.2f, 0.4f, 0.1f, 0.3f }), recent, 2.0f);

    CHECK(result[0] == 0.2f);
    CHECK(result[1] == Approx(0.2f)); // once per distinct token, not per occurrence
    CHECK(result[2] == 0.1f);
    CHECK(result[3] == Approx(0.15f));
}

TEST_CASE("penalize with 1.0 is the identity", "[penalty]")
{
    auto const recent = std::array<TokenId, 2> { 0, 1 };
    auto const result = penalize(TokenDistribution({ 0.5f, 0.5f }), recent, 1.0f);
    CHECK(result[0] == 0.5f);
    CHECK(result[1] == 0.5f);
}

TEST_CASE("penalize below 1 boosts repeated tokens", "[penalty]")
{
    auto const recent = std::array<TokenId, 1> { 0 };
    auto const result = penalize(TokenDistribution({ 0.2f, 0.8f }), recent, 0.5f);
    CHECK(result[0] == Approx(0.4f));
    CHECK(result[1] == 0.8f);
}

TEST_CASE("penalize with 0 keeps only repeated tokens", "[penalty]")
{
    auto const recent = std::array<TokenId, 1> { 2 };

    SECTION("repeated tokens with mass survive alone")
    {
        auto const result = penalize(TokenDistribution({ 0.3f, 0.3f, 0.4f }), recent, 0.0f);
        CHECK(result[0] == 0.0f);
        CHECK(result[1] == 0.0f);
        CHECK(result[2] == 0.4f);
    }

    SECTION("without mass on repeated tokens the distribution is unchanged")
    {
        auto const result = penalize(TokenDistribution({ 0.5f, 0.5f, 0.0f }), recent, 0.0f);
        CHECK(result[0] == 0.5f);
        CHECK(result[1] == 0.5f);
    }
}

TEST_CASE("penalize ignores tokens outside the vocabulary", "[penalty]")
{
    auto const recent = std::array<TokenId, 2> { -1, 7 };
    auto const result = penalize(TokenDistribution({ 0.5f, 0.5f }), recent, 2.0f);
    CHECK(result[0] == 0.5f);
    CHECK(result[1] == 0.5f);
}

TEST_CASE("recentWindow returns the trailing tokens", "[penalty]")
{
    auto const tokens = std::array<TokenId, 5> { 1, 2, 3, 4, 5 };

    CHECK(recentWindow(tokens, 2).size() == 2);
    CHECK(recentWindow(tokens, 2).front() == 4);
    CHECK(recentWindow(tokens, 0).size() == 5);
    CHECK(recentWindow(tokens, 10).size() == 5);
}
