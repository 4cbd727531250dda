// SPDX-License-Identifier: Apache-2.0
#include "StorySession.hpp"

#include <core/Log.hpp>
#include <story/ActionFormatter.hpp>
#include <story/StoryText.hpp>

#include <algorithm>
#include <array>
#include <utility>

namespace storyloom
{

namespace
{

    /// @brief A story continuation never stops on an action marker within its first tokens,
    ///        where models tend to emit stray markup.
    constexpr auto MinTokensBeforeActionStop = 5;

    /// @brief Attempts after which the narration may keep text that starts an action.
    constexpr auto AllowActionAfterAttempts = 6;

    constexpr auto ActionMarkers = std::array { std::string_view { ">" }, std::string_view { " >" } };
    constexpr auto LineMarkers = std::array { std::string_view { "\n" } };

    /// @brief Prompt cue the model completes with a player action.
    constexpr auto SuggestionCue = std::string_view { "\n> You" };

} // namespace

StorySession::StorySession(const LanguageModel& model, SessionConfig config, RandomSource& random):
    _config(std::move(config)),
    _random(random),
    _generator(model),
    _suggester(model,
               SuggestionOptions {
                   .decode = DecodeOptions { .stopTokens = _generator.stopTokensFor(LineMarkers), .minTokensBeforeStop = 1 },
                   .prefix = "You",
                   .parallel = _config.parallelSuggestions,
               }),
    _resolver(_config.dicePolicy),
    _storyStops { .stopTokens = _generator.stopTokensFor(ActionMarkers), .minTokensBeforeStop = MinTokensBeforeActionStop }
{
}

auto StorySession::start(std::string context, std::string prompt, std::stop_token stop, const TextCallback& onText)
    -> Result<TurnResult>
{
    log::info("Starting a new story");
    _story.reset();

    auto parts = std::vector<std::string> {};
    if (!context.empty())
        parts.push_back(context);
    parts.push_back(prompt);

    auto narration = narrate(parts, std::move(stop), onText);
    if (!narration)
        return std::unexpected(narration.error());
    if (narration->cancelled())
        return TurnResult { .action = {}, .text = {}, .outcome = std::nullopt, .status = TurnStatus::Cancelled };

    auto opening = prompt + narration->text;
    _story.emplace(std::move(context), opening);
    return TurnResult { .action = {}, .text = std::move(opening), .outcome = std::nullopt, .status = TurnStatus::Continued };
}

auto StorySession::act(std::string_view rawAction, std::stop_token stop, const TextCallback& onText)
    -> Result<TurnResult>
{
    if (!_story)
        return makeError(ErrorCode::InvalidArgument, "No story has been started");

    auto turn = TurnResult {};
    if (parseAction(rawAction))
        turn.outcome = _resolver.resolve(_config.diceEnabled, _random);
    turn.action = formatAction(rawAction, turn.outcome, _config.diceHints);

    auto const parts = _story->promptParts(turn.action, static_cast<std::size_t>(_config.memory));
    auto narration = narrate(parts, std::move(stop), onText);
    if (!narration)
        return std::unexpected(narration.error());

    if (narration->cancelled())
    {
        turn.status = TurnStatus::Cancelled;
        return turn;
    }

    if (narration->text.empty())
    {
        log::warning("Model generated empty text {} times, try another action", _config.maxAttempts);
        turn.status = TurnStatus::Empty;
        return turn;
    }

    turn.text = std::move(narration->text);
    auto const previous = _story->latestResult();
    _story->addTurn(turn.action, turn.text);

    if (_story->turns().size() >= 2 && similarity(turn.text, previous) > _config.loopThreshold)
    {
        log::info("Result repeats the previous one, reverting the turn");
        _story->revert();
        turn.status = TurnStatus::Looping;
        return turn;
    }

    if (playerWon(turn.text))
        turn.status = TurnStatus::Won;
    else if (playerDied(turn.text))
        turn.status = TurnStatus::Died;
    return turn;
}

auto StorySession::suggestActions(std::stop_token stop) -> SuggestionSet
{
    if (!_story || _config.suggestionCount <= 0)
        return SuggestionSet {};

    auto parts = _story->promptParts({}, static_cast<std::size_t>(_config.memory));
    parts.emplace_back(SuggestionCue);

    auto prompt = _generator.encodePrompt(parts, _config.suggestions.maxNewTokens);
    if (!prompt)
    {
        log::error("Cannot build the suggestion prompt: {}", prompt.error());
        auto set = SuggestionSet {};
        set.requested = static_cast<std::size_t>(_config.suggestionCount);
        set.failed = set.requested;
        return set;
    }

    return _suggester.suggestActions(*prompt, _config.suggestionCount, _config.suggestions, _random, std::move(stop));
}

auto StorySession::revert() -> bool
{
    return _story && _story->revert();
}

auto StorySession::narrate(const std::vector<std::string>& parts, std::stop_token stop, const TextCallback& onText)
    -> Result<GeneratedText>
{
    auto const attempts = std::max(_config.maxAttempts, 1);
    auto last = GeneratedText {};

    for (auto attempt = 0; attempt < attempts; ++attempt)
    {
        auto generated = _generator.generate(parts, _config.story, _storyStops, _random, stop, onText);
        if (!generated)
            return std::unexpected(generated.error());
        if (generated->cancelled())
            return generated;

        auto cleaned = cleanResult(generated->text);
        if (cleaned.empty() && attempt >= AllowActionAfterAttempts)
        {
            cleaned = cleanResult(generated->text, true);
            log::info("Empty result after formatting, keeping action text: '{}'", cleaned);
        }

        if (!cleaned.empty())
        {
            generated->text = std::move(cleaned);
            return generated;
        }

        log::info("Model generated empty text, trying again ({}/{})", attempt + 1, attempts);
        last = std::move(*generated);
        last.text.clear();
    }

    return last;
}

} // namespace storyloom
