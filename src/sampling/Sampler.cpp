// SPDX-License-Identifier: Apache-2.0
#include "Sampler.hpp"

#include <core/Log.hpp>
#include <sampling/DistributionFilter.hpp>
#include <sampling/RepetitionPenalizer.hpp>

namespace storyloom
{

auto sample(const TokenDistribution& distribution, RandomSource& random) -> Result<TokenId>
{
    if (distribution.empty())
        return makeError(ErrorCode::InvalidArgument, "Cannot sample from an empty distribution");

    auto const scores = distribution.scores();
    auto const mass = distribution.total();
    if (!(mass > 0.0))
        return random.nextInt(0, static_cast<int>(scores.size()) - 1);

    auto const target = random.nextUnit() * mass;
    auto cumulative = 0.0;
    auto last = TokenId { -1 };
    for (auto i = std::size_t { 0 }; i < scores.size(); ++i)
    {
        if (!(scores[i] > 0.0))
            continue;
        cumulative += scores[i];
        last = static_cast<TokenId>(i);
        if (target < cumulative)
            return last;
    }

    // Rounding left the draw just above the accumulated mass.
    return last;
}

Sampler::Sampler(SamplingConfig config): _config(config)
{
}

auto Sampler::next(const TokenDistribution& scores, std::span<const TokenId> context, RandomSource& random) const
    -> Result<TokenId>
{
    auto penalized = penalize(scores, recentWindow(context, _config.repetitionWindow), _config.repetitionPenalty);

    auto filtered = filterDistribution(std::move(penalized), _config.temperature, _config.topK, _config.topP);
    if (!filtered)
        return std::unexpected(filtered.error());

    log::trace("Sampling among {} candidates", filtered->supportSize());
    return sample(*filtered, random);
}

} // namespace storyloom
