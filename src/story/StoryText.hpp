// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <string>
#include <string_view>

namespace storyloom
{

/// @brief Cuts @p text after its last complete sentence.
///
/// Text from the first '<' (a leaked special marker) is always dropped. Text
/// from the first '>' (the model inventing the player's next action) is
/// dropped unless @p allowAction is set. Text without any sentence terminator
/// is kept whole.
[[nodiscard]] auto cutTrailingSentence(std::string_view text, bool allowAction = false) -> std::string;

/// @brief Tidies generated story text for display and for the story record.
///
/// Cuts the trailing sentence, removes '#' and '*', turns ."  into ". and
/// collapses blank lines. The case of the first letter is preserved.
/// @return The cleaned text, possibly empty.
[[nodiscard]] auto cleanResult(std::string_view text, bool allowAction = false) -> std::string;

/// @brief Rewrites first person pronouns ("I", "my", "I'm", ...) in second person.
[[nodiscard]] auto toSecondPerson(std::string_view text) -> std::string;

/// @brief Similarity ratio in [0, 1] of two texts, 2 * LCS / (|a| + |b|) over characters.
[[nodiscard]] auto similarity(std::string_view a, std::string_view b) -> double;

/// @brief True if @p text narrates the player's death.
[[nodiscard]] auto playerDied(std::string_view text) -> bool;

/// @brief True if @p text narrates the player winning the story.
[[nodiscard]] auto playerWon(std::string_view text) -> bool;

} // namespace storyloom
