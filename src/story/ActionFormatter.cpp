// SPDX-License-Identifier: Apache-2.0
#include "ActionFormatter.hpp"

#include <story/StoryText.hpp>

#include <cctype>
#include <format>

namespace storyloom
{

namespace
{

    constexpr auto Whitespace = std::string_view { " \t\r\n" };

    auto trim(std::string_view text) -> std::string_view
    {
        auto const first = text.find_first_not_of(Whitespace);
        if (first == std::string_view::npos)
            return {};
        return text.substr(first, text.find_last_not_of(Whitespace) - first + 1);
    }

    auto startsWithWord(std::string_view text, std::string_view word) -> bool
    {
        if (text.size() < word.size())
            return false;
        for (auto i = std::size_t { 0 }; i < word.size(); ++i)
        {
            if (std::tolower(static_cast<unsigned char>(text[i])) != word[i])
                return false;
        }
        return text.size() == word.size() || std::isspace(static_cast<unsigned char>(text[word.size()]));
    }

} // namespace

auto parseAction(std::string_view raw) -> std::optional<PlayerAction>
{
    auto const input = trim(raw);
    if (input.empty())
        return std::nullopt;

    if (input.front() == '"')
        return PlayerAction { .phrase = std::format("say {}", input), .terminator = {} };

    auto sentence = toSecondPerson(input);

    auto terminator = std::string { "." };
    if (auto const last = sentence.empty() ? '\0' : sentence.back(); last == '.' || last == '!' || last == '?')
    {
        terminator = std::string(1, last);
        sentence.pop_back();
    }

    auto phrase = std::string(trim(sentence));
    if (startsWithWord(phrase, "you"))
        phrase = std::string(trim(std::string_view(phrase).substr(3)));

    // Nothing left but a pronoun or punctuation.
    if (phrase.empty())
        return std::nullopt;

    phrase.front() = static_cast<char>(std::tolower(static_cast<unsigned char>(phrase.front())));

    return PlayerAction { .phrase = std::move(phrase), .terminator = std::move(terminator) };
}

auto formatAction(std::string_view raw, const std::optional<DiceOutcome>& outcome, const DiceHints& hints)
    -> std::string
{
    auto const action = parseAction(raw);
    if (!action)
        return {};

    auto const sentence = outcome ? hints.frame(*outcome, action->phrase)
                                  : std::format("You {}{}", action->phrase, action->terminator);
    return std::format("\n> {}\n", sentence);
}

} // namespace storyloom
