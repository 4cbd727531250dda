// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Random.hpp>
#include <decoding/DecodingLoop.hpp>
#include <llm/LanguageModel.hpp>
#include <sampling/SamplingConfig.hpp>

#include <functional>
#include <span>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace storyloom
{

/// @brief Marker some models print instead of emitting their end-of-sequence token.
inline constexpr auto EndOfTextMarker = std::string_view { "<|endoftext|>" };

/// @brief Callback invoked with the text of every emitted token.
using TextCallback = std::function<void(std::string_view piece)>;

/// @brief Text produced by one generation.
struct GeneratedText
{
    std::string text;
    std::size_t tokenCount = 0;
    StopReason reason = StopReason::None;

    [[nodiscard]] auto cancelled() const noexcept -> bool { return reason == StopReason::Cancelled; }
};

/// @brief Shortens @p parts until their total length is at most @p maxTokens.
///
/// Repeatedly drops the oldest (first) token of the currently longest part, so
/// short parts such as the story context survive while long history is trimmed.
void truncateLongestFirst(std::vector<std::vector<TokenId>>& parts, std::size_t maxTokens);

/// @brief Text-level front end of the decoding loop.
///
/// Tokenizes prompt parts, fits them into the model context, runs a fresh
/// DecodingLoop and renders the emitted tokens as text.
class TextGenerator
{
  public:
    explicit TextGenerator(const LanguageModel& model);

    /// @brief Tokenizes and concatenates @p parts, leaving room for @p maxNewTokens.
    [[nodiscard]] auto encodePrompt(std::span<const std::string> parts, int maxNewTokens) const
        -> Result<std::vector<TokenId>>;

    /// @brief Tokens whose text is exactly one of @p markers, for use as stop tokens.
    [[nodiscard]] auto stopTokensFor(std::span<const std::string_view> markers) const -> std::vector<TokenId>;

    /// @brief Generates a continuation of @p parts.
    /// @return The rendered text, cut at the end-of-text marker, or GenerationFailed.
    [[nodiscard]] auto generate(std::span<const std::string> parts,
                                const SamplingConfig& config,
                                const DecodeOptions& options,
                                RandomSource& random,
                                std::stop_token stop = {},
                                const TextCallback& onText = {}) const -> Result<GeneratedText>;

  private:
    const LanguageModel& _model;
};

} // namespace storyloom
