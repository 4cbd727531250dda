// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Random.hpp>
#include <decoding/DecodingLoop.hpp>
#include <llm/LanguageModel.hpp>
#include <sampling/SamplingConfig.hpp>

#include <span>
#include <stop_token>
#include <string>
#include <vector>

namespace storyloom
{

/// @brief A suggested player action and the parameters that produced it.
struct ActionCandidate
{
    std::string text;
    SamplingConfig sampling;
    std::size_t run = 0; ///< Index of the run that produced it.
};

/// @brief The suggestions of one turn.
///
/// Fewer candidates than requested is a normal outcome, not an error.
struct SuggestionSet
{
    std::vector<ActionCandidate> candidates; ///< In generation order.
    std::size_t requested = 0;
    std::size_t failed = 0; ///< Runs that ended with GenerationFailed.
    bool cancelled = false;

    /// @brief Number of requested suggestions that are missing.
    [[nodiscard]] auto shortfall() const noexcept -> std::size_t
    {
        return requested > candidates.size() ? requested - candidates.size() : 0;
    }
};

/// @brief Options shaping how suggestion runs are turned into text.
struct SuggestionOptions
{
    DecodeOptions decode;      ///< Stop tokens, typically the newline.
    std::string prefix;        ///< Prepended to accepted candidates (e.g. "You").
    bool parallel = true;      ///< Run the decoding loops on worker threads.
};

/// @brief Generates several independent candidate actions for the player.
///
/// Every run decodes from a fresh history seeded only with the prompt context,
/// so no run sees another's output.
class ActionSuggester
{
  public:
    explicit ActionSuggester(const LanguageModel& model, SuggestionOptions options = {});

    /// @brief Runs @p count independent decoding loops and keeps the usable results.
    /// @param promptContext Tokens every run starts from.
    /// @param count Number of runs.
    /// @param perAction Sampling for the runs; minLength is the minimum trimmed length of a candidate.
    /// @param random Parent stream; each run receives its own fork, taken in run order.
    /// @param stop Cancellation signal, observed between and within runs.
    [[nodiscard]] auto suggestActions(std::span<const TokenId> promptContext,
                                      int count,
                                      const SamplingConfig& perAction,
                                      RandomSource& random,
                                      std::stop_token stop = {}) const -> SuggestionSet;

  private:
    const LanguageModel& _model;
    SuggestionOptions _options;

    struct RunOutcome;

    [[nodiscard]] auto runOnce(std::span<const TokenId> promptContext,
                               const SamplingConfig& perAction,
                               RandomSource& random,
                               std::stop_token stop) const -> RunOutcome;
};

/// @brief Reduces raw generated text to a single trimmed action line.
[[nodiscard]] auto extractActionLine(std::string_view generated) -> std::string;

} // namespace storyloom
