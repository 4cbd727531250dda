// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <sampling/TokenDistribution.hpp>

#include <cstddef>
#include <span>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace storyloom
{

/// @brief The model seen by the decoding loop: a next-token scorer over a fixed vocabulary.
///
/// A single instance is shared by the narrative loop and all concurrent suggestion
/// runs, so implementations must tolerate concurrent calls.
class TokenScorer
{
  public:
    virtual ~TokenScorer() = default;

    /// @brief Scores every vocabulary entry as the continuation of @p context.
    /// @param stop Cancellation signal. Once it is requested the computation is abandoned.
    /// @return A distribution of vocabulary size, GenerationFailed, or Cancelled.
    [[nodiscard]] virtual auto scoreNextToken(std::span<const TokenId> context, std::stop_token stop) const
        -> Result<TokenDistribution> = 0;

    /// @brief Returns true if @p token ends a sequence.
    [[nodiscard]] virtual auto isEndOfSequence(TokenId token) const -> bool = 0;
};

/// @brief Conversion between text and token ids.
class Tokenizer
{
  public:
    virtual ~Tokenizer() = default;

    /// @brief Splits @p text into tokens without adding special tokens.
    [[nodiscard]] virtual auto tokenize(std::string_view text) const -> Result<std::vector<TokenId>> = 0;

    /// @brief Renders a single token as text.
    [[nodiscard]] virtual auto tokenToPiece(TokenId token) const -> std::string = 0;

    /// @brief Renders a token sequence as text.
    [[nodiscard]] virtual auto detokenize(std::span<const TokenId> tokens) const -> std::string
    {
        auto text = std::string {};
        for (auto const token: tokens)
            text += tokenToPiece(token);
        return text;
    }
};

/// @brief A complete text model: scorer plus tokenizer.
class LanguageModel: public TokenScorer, public Tokenizer
{
  public:
    /// @brief Number of entries in the vocabulary.
    [[nodiscard]] virtual auto vocabularySize() const -> std::size_t = 0;

    /// @brief Maximum number of tokens the model can attend to.
    [[nodiscard]] virtual auto contextSize() const -> int = 0;
};

} // namespace storyloom
