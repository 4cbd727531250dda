// SPDX-License-Identifier: Apache-2.0
#include "RepetitionPenalizer.hpp"

#include <vector>

namespace storyloom
{

namespace
{

    auto repeatedMask(const TokenDistribution& distribution, std::span<const TokenId> recent) -> std::vector<bool>
    {
        auto mask = std::vector<bool>(distribution.size(), false);
        for (auto const token: recent)
        {
            if (distribution.contains(token))
                mask[static_cast<std::size_t>(token)] = true;
        }
        return mask;
    }

} // namespace

auto recentWindow(std::span<const TokenId> tokens, int window) -> std::span<const TokenId>
{
    if (window <= 0 || static_cast<std::size_t>(window) >= tokens.size())
        return tokens;
    return tokens.last(static_cast<std::size_t>(window));
}

auto penalize(TokenDistribution distribution, std::span<const TokenId> recent, float penalty) -> TokenDistribution
{
    if (penalty == 1.0f || recent.empty() || distribution.empty())
        return distribution;

    auto const repeated = repeatedMask(distribution, recent);
    auto scores = distribution.scores();

    if (penalty <= 0.0f)
    {
        auto repeatedMass = 0.0;
        for (auto i = std::size_t { 0 }; i < scores.size(); ++i)
        {
            if (repeated[i])
                repeatedMass += scores[i];
        }
        if (!(repeatedMass > 0.0))
            return distribution;

        for (auto i = std::size_t { 0 }; i < scores.size(); ++i)
        {
            if (!repeated[i])
                scores[i] = 0.0;
        }
        return distribution;
    }

    for (auto i = std::size_t { 0 }; i < scores.size(); ++i)
    {
        if (repeated[i])
            scores[i] /= penalty;
    }
    return distribution;
}

} // namespace storyloom
