// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <story/OutcomeResolver.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace storyloom
{

/// @brief A player action reduced to a second person verb phrase.
struct PlayerAction
{
    std::string phrase;     ///< "open the door", "say \"hello\"".
    std::string terminator; ///< Sentence terminator to restore, empty for speech.
};

/// @brief Normalizes raw player input.
///
/// Quoted input becomes speech ("say ..."). Otherwise first person pronouns are
/// turned into second person, a leading "you" is dropped, the first letter is
/// lowercased and a trailing '.', '!' or '?' is split off.
/// @return The action, or std::nullopt for input without an action phrase, such as
///         blank input or a lone "I." (continue the story).
[[nodiscard]] auto parseAction(std::string_view raw) -> std::optional<PlayerAction>;

/// @brief Renders raw input as the action line spliced into the prompt ("\n> You open the door.\n").
///
/// With an @p outcome the phrase is framed by the matching entry of @p hints.
/// @return The prompt line, empty for blank input.
[[nodiscard]] auto formatAction(std::string_view raw, const std::optional<DiceOutcome>& outcome, const DiceHints& hints)
    -> std::string;

} // namespace storyloom
