// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace storyloom
{

/// @brief Identifier of a vocabulary entry.
using TokenId = std::int32_t;

/// @brief Non-negative scores over the whole vocabulary, indexed by token id.
///
/// Scores need not sum to 1. Operations that need probabilities call normalize().
/// Scores are kept in double precision so that unlikely tokens keep a nonzero
/// mass that a high temperature can still bring back.
class TokenDistribution
{
  public:
    TokenDistribution() = default;
    explicit TokenDistribution(std::vector<double> scores);

    /// @brief Converts raw model logits into probabilities (softmax).
    ///
    /// Non-finite logits get zero mass. If no logit is finite the result is uniform.
    [[nodiscard]] static auto fromLogits(std::span<const float> logits) -> TokenDistribution;

    /// @brief Creates a uniform distribution over @p vocabularySize tokens.
    [[nodiscard]] static auto uniform(std::size_t vocabularySize) -> TokenDistribution;

    [[nodiscard]] auto size() const noexcept -> std::size_t { return _scores.size(); }
    [[nodiscard]] auto empty() const noexcept -> bool { return _scores.empty(); }

    [[nodiscard]] auto operator[](TokenId token) const -> double { return _scores[static_cast<std::size_t>(token)]; }
    [[nodiscard]] auto operator[](TokenId token) -> double& { return _scores[static_cast<std::size_t>(token)]; }

    [[nodiscard]] auto scores() const noexcept -> std::span<const double> { return _scores; }
    [[nodiscard]] auto scores() noexcept -> std::span<double> { return _scores; }

    /// @brief Returns true if @p token is a valid index into this distribution.
    [[nodiscard]] auto contains(TokenId token) const noexcept -> bool
    {
        return token >= 0 && static_cast<std::size_t>(token) < _scores.size();
    }

    /// @brief Sum of all scores.
    [[nodiscard]] auto total() const -> double;

    /// @brief Number of tokens with a score greater than zero.
    [[nodiscard]] auto supportSize() const -> std::size_t;

    /// @brief Scales all scores so they sum to 1.
    /// @return false if the total mass is zero, in which case the scores are left as they are.
    auto normalize() -> bool;

    /// @brief Replaces negative, NaN and infinite scores by zero.
    void sanitize();

  private:
    std::vector<double> _scores;
};

} // namespace storyloom
