// SPDX-License-Identifier: Apache-2.0
#include "DistributionFilter.hpp"

#include <core/Log.hpp>

#include <algorithm>
#include <cmath>
#include <limits>
#include <vector>

namespace storyloom
{

namespace
{

    /// @brief Returns the ids of all tokens with mass, ordered by descending score, then ascending id.
    auto rankedCandidates(const TokenDistribution& distribution) -> std::vector<TokenId>
    {
        auto ids = std::vector<TokenId> {};
        ids.reserve(distribution.supportSize());
        for (auto i = std::size_t { 0 }; i < distribution.size(); ++i)
        {
            if (distribution.scores()[i] > 0.0)
                ids.push_back(static_cast<TokenId>(i));
        }

        std::ranges::stable_sort(ids, [&](TokenId a, TokenId b) { return distribution[a] > distribution[b]; });
        return ids;
    }

    /// @brief Zeroes every token that is not in @p keep.
    void retainOnly(TokenDistribution& distribution, std::span<const TokenId> keep)
    {
        auto kept = std::vector<double>(distribution.size(), 0.0);
        for (auto const id: keep)
            kept[static_cast<std::size_t>(id)] = distribution[id];
        distribution = TokenDistribution(std::move(kept));
    }

    /// @brief Recovers from an empty candidate set by falling back to a uniform distribution.
    void ensureCandidates(TokenDistribution& distribution)
    {
        if (distribution.normalize())
            return;

        log::debug("Empty candidate set over {} tokens, falling back to uniform", distribution.size());
        distribution = TokenDistribution::uniform(distribution.size());
    }

} // namespace

auto applyTemperature(TokenDistribution& distribution, float temperature) -> VoidResult
{
    if (!std::isfinite(temperature) || temperature <= 0.0f)
        return makeConfigError("temperature", std::format("must be > 0 (got {})", temperature));

    distribution.sanitize();

    auto scores = distribution.scores();
    auto maxLog = -std::numeric_limits<double>::infinity();
    for (auto const score: scores)
    {
        if (score > 0.0)
            maxLog = std::max(maxLog, std::log(score) / temperature);
    }

    if (std::isinf(maxLog))
    {
        ensureCandidates(distribution);
        return {};
    }

    for (auto& score: scores)
    {
        if (score > 0.0)
            score = std::exp(std::log(score) / temperature - maxLog);
    }

    ensureCandidates(distribution);
    return {};
}

void applyTopK(TokenDistribution& distribution, int topK)
{
    if (topK <= 0 || static_cast<std::size_t>(topK) >= distribution.supportSize())
        return;

    auto ranked = rankedCandidates(distribution);
    ranked.resize(static_cast<std::size_t>(topK));
    retainOnly(distribution, ranked);
    ensureCandidates(distribution);
}

void applyTopP(TokenDistribution& distribution, float topP)
{
    if (topP >= 1.0f)
        return;

    auto const ranked = rankedCandidates(distribution);
    auto const mass = distribution.total();
    if (ranked.empty() || !(mass > 0.0))
    {
        ensureCandidates(distribution);
        return;
    }

    auto cumulative = 0.0;
    auto cutoff = ranked.size();
    for (auto i = std::size_t { 0 }; i < ranked.size(); ++i)
    {
        cumulative += distribution[ranked[i]] / mass;
        if (cumulative >= static_cast<double>(topP))
        {
            cutoff = i + 1;
            break;
        }
    }

    retainOnly(distribution, std::span(ranked).first(cutoff));
    ensureCandidates(distribution);
}

auto filterDistribution(TokenDistribution distribution, float temperature, int topK, float topP)
    -> Result<TokenDistribution>
{
    if (distribution.empty())
        return makeError(ErrorCode::InvalidArgument, "Cannot filter an empty distribution");

    if (auto result = applyTemperature(distribution, temperature); !result)
        return std::unexpected(result.error());

    applyTopK(distribution, topK);
    applyTopP(distribution, topP);
    return distribution;
}

} // namespace storyloom
