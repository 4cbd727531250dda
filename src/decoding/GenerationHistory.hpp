// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <sampling/TokenDistribution.hpp>

#include <span>
#include <utility>
#include <vector>

namespace storyloom
{

/// @brief Tokens emitted so far by one decoding loop, oldest first.
///
/// Only ever appended to. Each generation owns its own instance; concurrent
/// runs get copies, never shared references.
class GenerationHistory
{
  public:
    GenerationHistory() = default;

    /// @brief Creates a history seeded with @p tokens (e.g. the prompt of a suggestion run).
    explicit GenerationHistory(std::vector<TokenId> tokens): _tokens(std::move(tokens)) {}

    void append(TokenId token) { _tokens.push_back(token); }

    [[nodiscard]] auto tokens() const noexcept -> std::span<const TokenId> { return _tokens; }
    [[nodiscard]] auto size() const noexcept -> std::size_t { return _tokens.size(); }
    [[nodiscard]] auto empty() const noexcept -> bool { return _tokens.empty(); }

  private:
    std::vector<TokenId> _tokens;
};

} // namespace storyloom
