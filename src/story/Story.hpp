// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace storyloom
{

/// @brief The text record of one adventure: its context, opening, and every turn since.
class Story
{
  public:
    /// @brief One player action and the narration that followed it.
    struct Turn
    {
        std::string action;
        std::string result;
    };

    /// @param context Background text that always leads the prompt.
    /// @param start The opening passage (prompt plus its first continuation).
    Story(std::string context, std::string start);

    void addTurn(std::string action, std::string result);

    /// @brief Removes the most recent turn.
    /// @return false if there is no turn to remove.
    auto revert() -> bool;

    /// @brief The narration of the last turn, or the opening passage.
    [[nodiscard]] auto latestResult() const -> const std::string&;

    /// @brief Prompt parts for the next generation: context, recent story, next action.
    ///
    /// Only the last @p memory turns are included; older ones are summarized by
    /// their absence. The parts are meant for longest-first truncation, so the
    /// recent story is a single part that loses its oldest text first.
    [[nodiscard]] auto promptParts(std::string_view nextAction, std::size_t memory) const -> std::vector<std::string>;

    /// @brief The full story as one text.
    [[nodiscard]] auto toString() const -> std::string;

    [[nodiscard]] auto context() const noexcept -> const std::string& { return _context; }
    [[nodiscard]] auto start() const noexcept -> const std::string& { return _start; }
    [[nodiscard]] auto turns() const noexcept -> const std::vector<Turn>& { return _turns; }

  private:
    std::string _context;
    std::string _start;
    std::vector<Turn> _turns;
};

} // namespace storyloom
