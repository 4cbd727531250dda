// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Random.hpp>
#include <sampling/SamplingConfig.hpp>
#include <sampling/TokenDistribution.hpp>

#include <span>

namespace storyloom
{

/// @brief Draws one token from @p distribution by inverse-CDF sampling.
///
/// Consumes exactly one value from @p random. The distribution need not be
/// normalized. The returned token always has a non-zero score; an all-zero
/// distribution is sampled uniformly.
/// @return The drawn token, or InvalidArgument for an empty distribution.
[[nodiscard]] auto sample(const TokenDistribution& distribution, RandomSource& random) -> Result<TokenId>;

/// @brief The per-step token selection chain: penalize, filter, sample.
class Sampler
{
  public:
    explicit Sampler(SamplingConfig config);

    /// @brief Selects the next token.
    /// @param scores The model's distribution for the next position.
    /// @param context All tokens preceding the next position; the trailing
    ///        repetition window of it is penalized.
    /// @param random Random stream for the draw.
    [[nodiscard]] auto next(const TokenDistribution& scores, std::span<const TokenId> context, RandomSource& random) const
        -> Result<TokenId>;

    [[nodiscard]] auto config() const noexcept -> const SamplingConfig& { return _config; }

  private:
    SamplingConfig _config;
};

} // namespace storyloom
