// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <sampling/TokenDistribution.hpp>

namespace storyloom
{

/// @brief Rescales scores in log space by 1/temperature and renormalizes.
///
/// Zero scores stay zero. If no token carries mass the distribution is
/// replaced by a uniform one over the whole vocabulary.
/// @return InvalidConfig if @p temperature is not strictly positive.
[[nodiscard]] auto applyTemperature(TokenDistribution& distribution, float temperature) -> VoidResult;

/// @brief Keeps the @p topK highest scores (ties go to the lower token id) and renormalizes.
///
/// A value of 0, or one at least as large as the number of candidates, keeps everything.
void applyTopK(TokenDistribution& distribution, int topK);

/// @brief Keeps the smallest highest-probability prefix whose mass reaches @p topP and renormalizes.
///
/// The highest scoring token always survives. topP >= 1 keeps everything.
void applyTopP(TokenDistribution& distribution, float topP);

/// @brief Temperature, then top-k, then top-p.
///
/// The result is a normalized distribution with at least one candidate. An
/// all-zero input yields a uniform distribution over the full vocabulary.
/// @return The filtered distribution, InvalidConfig for a non-positive temperature,
///         or InvalidArgument for an empty vocabulary.
[[nodiscard]] auto filterDistribution(TokenDistribution distribution, float temperature, int topK, float topP)
    -> Result<TokenDistribution>;

} // namespace storyloom
