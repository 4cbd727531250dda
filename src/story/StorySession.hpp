// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Random.hpp>
#include <decoding/TextGenerator.hpp>
#include <llm/LanguageModel.hpp>
#include <sampling/SamplingConfig.hpp>
#include <story/ActionSuggester.hpp>
#include <story/OutcomeResolver.hpp>
#include <story/Story.hpp>

#include <optional>
#include <stop_token>
#include <string>
#include <string_view>

namespace storyloom
{

/// @brief Everything a story session needs from the configuration.
struct SessionConfig
{
    SamplingConfig story;
    SamplingConfig suggestions { .temperature = 0.65f, .maxNewTokens = 40, .minLength = 2 };
    int suggestionCount = 5;
    bool parallelSuggestions = true;
    bool diceEnabled = true;
    DicePolicy dicePolicy;
    DiceHints diceHints;
    int memory = 20;          ///< Turns kept in the prompt.
    int maxAttempts = 20;     ///< Generations tried before giving up on an empty result.
    double loopThreshold = 0.9; ///< Similarity above which a result counts as a loop.
};

/// @brief How a turn ended.
enum class TurnStatus
{
    Continued, ///< The result was added to the story.
    Looping,   ///< The result repeated the previous one and was reverted.
    Won,
    Died,
    Empty,     ///< The model produced nothing usable; the story is unchanged.
    Cancelled, ///< Generation was cancelled; the story is unchanged.
};

/// @brief What happened in one turn, for presentation.
struct TurnResult
{
    std::string action; ///< The action line that went into the prompt.
    std::string text;   ///< The narration shown to the player.
    std::optional<DiceOutcome> outcome;
    TurnStatus status = TurnStatus::Continued;
};

/// @brief Runs the turn cycle of one story: roll, frame the action, narrate, suggest.
class StorySession
{
  public:
    /// @param model The shared model; it must outlive the session.
    /// @param config Snapshot of the session settings.
    /// @param random Random stream for sampling and dice; it must outlive the session.
    StorySession(const LanguageModel& model, SessionConfig config, RandomSource& random);

    /// @brief Begins a new story and narrates its opening.
    /// @param context Background text that leads every prompt.
    /// @param prompt The opening passage the model continues.
    /// @param onText Receives raw text as it is generated, before cleanup.
    [[nodiscard]] auto start(std::string context,
                             std::string prompt,
                             std::stop_token stop = {},
                             const TextCallback& onText = {}) -> Result<TurnResult>;

    /// @brief Plays one player action.
    ///
    /// Blank input continues the story without an action. On GenerationFailed
    /// or cancellation the story is unchanged.
    [[nodiscard]] auto act(std::string_view rawAction, std::stop_token stop = {}, const TextCallback& onText = {})
        -> Result<TurnResult>;

    /// @brief Generates action suggestions for the current story state.
    [[nodiscard]] auto suggestActions(std::stop_token stop = {}) -> SuggestionSet;

    /// @brief Removes the last turn. @return false if there was none.
    auto revert() -> bool;

    [[nodiscard]] auto hasStory() const noexcept -> bool { return _story.has_value(); }

    /// @brief The current story. Only valid if hasStory().
    [[nodiscard]] auto story() const -> const Story& { return *_story; }

    [[nodiscard]] auto config() const noexcept -> const SessionConfig& { return _config; }

  private:
    SessionConfig _config;
    RandomSource& _random;
    TextGenerator _generator;
    ActionSuggester _suggester;
    OutcomeResolver _resolver;
    DecodeOptions _storyStops;
    std::optional<Story> _story;

    /// @brief Generates a cleaned story continuation, retrying while it comes out empty.
    [[nodiscard]] auto narrate(const std::vector<std::string>& parts, std::stop_token stop, const TextCallback& onText)
        -> Result<GeneratedText>;
};

} // namespace storyloom
