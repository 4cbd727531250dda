// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Random.hpp>
#include <decoding/GenerationHistory.hpp>
#include <llm/LanguageModel.hpp>
#include <sampling/Sampler.hpp>
#include <sampling/SamplingConfig.hpp>

#include <functional>
#include <span>
#include <stop_token>
#include <string_view>
#include <vector>

namespace storyloom
{

/// @brief Lifecycle of a decoding loop.
enum class DecodeState
{
    Running,   ///< Waiting on the model or selecting the next token.
    Extending, ///< Appending the selected token and emitting it.
    Stopped,
};

/// @brief Why a decoding run ended.
enum class StopReason
{
    None,
    MaxTokens,
    EndOfSequence,
    StopToken,
    Cancelled,
};

[[nodiscard]] constexpr auto stopReasonName(StopReason reason) -> std::string_view
{
    switch (reason)
    {
        case StopReason::None: return "none";
        case StopReason::MaxTokens: return "max tokens";
        case StopReason::EndOfSequence: return "end of sequence";
        case StopReason::StopToken: return "stop token";
        case StopReason::Cancelled: return "cancelled";
    }
    return "unknown";
}

/// @brief Optional stop conditions beyond the length bound and end-of-sequence.
struct DecodeOptions
{
    /// @brief Tokens that end the run once emitted. The stop token itself is kept.
    std::vector<TokenId> stopTokens;

    /// @brief Stop tokens are ignored until at least this many tokens were emitted before them.
    int minTokensBeforeStop = 0;
};

/// @brief Outcome of one call to DecodingLoop::run().
struct DecodeResult
{
    std::vector<TokenId> tokens; ///< Tokens emitted by this run, in order.
    StopReason reason = StopReason::None;

    [[nodiscard]] auto cancelled() const noexcept -> bool { return reason == StopReason::Cancelled; }
};

/// @brief Callback invoked for every emitted token.
using TokenCallback = std::function<void(TokenId token)>;

/// @brief Turns model distributions into a token sequence, one token per step.
///
/// Every step asks the model for the distribution following prompt + history,
/// runs it through the Sampler (penalize, filter, sample), appends the chosen
/// token to the history and emits it. A step is atomic: when the model fails or
/// a stop is requested while the model is busy, the history is left exactly as
/// it was before the step. The model receives the stop token and abandons a
/// call in flight once a stop is requested.
class DecodingLoop
{
  public:
    /// @param model The shared model; it must outlive the loop.
    /// @param config Snapshot of the sampling parameters for this loop.
    /// @param history Initial history, empty or seeded by the caller.
    DecodingLoop(const TokenScorer& model, SamplingConfig config, GenerationHistory history = {});

    /// @brief Runs until the length bound, end-of-sequence, a stop token, or cancellation.
    /// @param prompt Tokens preceding the history in the model context.
    /// @param random Random stream for sampling.
    /// @param stop Cancellation signal, checked between steps and passed into each model call.
    /// @param onToken Invoked for each emitted token.
    /// @return The emitted tokens and stop reason, or GenerationFailed. Cancellation is not an error.
    [[nodiscard]] auto run(std::span<const TokenId> prompt,
                           RandomSource& random,
                           std::stop_token stop = {},
                           const TokenCallback& onToken = {}) -> Result<DecodeResult>;

    void setOptions(DecodeOptions options) { _options = std::move(options); }

    [[nodiscard]] auto state() const noexcept -> DecodeState { return _state; }
    [[nodiscard]] auto history() const noexcept -> const GenerationHistory& { return _history; }
    [[nodiscard]] auto config() const noexcept -> const SamplingConfig& { return _sampler.config(); }

  private:
    const TokenScorer& _model;
    Sampler _sampler;
    GenerationHistory _history;
    DecodeOptions _options;
    DecodeState _state = DecodeState::Running;

    [[nodiscard]] auto isStopToken(TokenId token) const -> bool;
};

} // namespace storyloom
