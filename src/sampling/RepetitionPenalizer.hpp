// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <sampling/TokenDistribution.hpp>

#include <span>

namespace storyloom
{

/// @brief Returns the trailing @p window tokens of @p tokens (all of them if @p window is 0).
[[nodiscard]] auto recentWindow(std::span<const TokenId> tokens, int window) -> std::span<const TokenId>;

/// @brief Adjusts the scores of tokens that already occur in @p recent.
///
/// Each distinct token in @p recent is penalized once, no matter how often it occurs.
/// A penalty above 1 divides its score by the penalty, a penalty in [0, 1) scales it
/// up by 1/penalty, and a penalty of 1 returns the input unchanged. A penalty of 0 is
/// the limit of that scaling: only repeated tokens keep their mass, unless none of them
/// has any, in which case the input is returned unchanged. Token ids outside the
/// vocabulary are ignored.
[[nodiscard]] auto penalize(TokenDistribution distribution, std::span<const TokenId> recent, float penalty)
    -> TokenDistribution;

} // namespace storyloom
