// SPDX-License-Identifier: Apache-2.0
#include "TokenDistribution.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>
#include <utility>

namespace storyloom
{

TokenDistribution::TokenDistribution(std::vector<double> scores): _scores(std::move(scores))
{
}

auto TokenDistribution::fromLogits(std::span<const float> logits) -> TokenDistribution
{
    auto maxLogit = -std::numeric_limits<double>::infinity();
    for (auto const logit: logits)
    {
        if (std::isfinite(logit))
            maxLogit = std::max(maxLogit, static_cast<double>(logit));
    }
    if (std::isinf(maxLogit))
        return uniform(logits.size());

    auto probabilities = std::vector<double>(logits.size(), 0.0);
    for (auto i = std::size_t { 0 }; i < logits.size(); ++i)
    {
        if (std::isfinite(logits[i]))
            probabilities[i] = std::exp(static_cast<double>(logits[i]) - maxLogit);
    }

    auto distribution = TokenDistribution(std::move(probabilities));
    distribution.normalize();
    return distribution;
}

auto TokenDistribution::uniform(std::size_t vocabularySize) -> TokenDistribution
{
    if (vocabularySize == 0)
        return TokenDistribution {};
    return TokenDistribution(std::vector<double>(vocabularySize, 1.0 / static_cast<double>(vocabularySize)));
}

auto TokenDistribution::total() const -> double
{
    return std::accumulate(_scores.begin(), _scores.end(), 0.0, [](double sum, double s) { return sum + s; });
}

auto TokenDistribution::supportSize() const -> std::size_t
{
    return static_cast<std::size_t>(std::ranges::count_if(_scores, [](double s) { return s > 0.0; }));
}

auto TokenDistribution::normalize() -> bool
{
    auto const sum = total();
    if (!(sum > 0.0))
        return false;

    for (auto& score: _scores)
        score /= sum;
    return true;
}

void TokenDistribution::sanitize()
{
    for (auto& score: _scores)
    {
        if (!std::isfinite(score) || score < 0.0)
            score = 0.0;
    }
}

} // namespace storyloom
