// SPDX-License-Identifier: Apache-2.0
#include "StoryText.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <regex>
#include <span>
#include <vector>

namespace storyloom
{

namespace
{

    auto replaceAll(std::string text, std::string_view from, std::string_view to) -> std::string
    {
        auto pos = std::size_t { 0 };
        while ((pos = text.find(from, pos)) != std::string::npos)
        {
            text.replace(pos, from.size(), to);
            pos += to.size();
        }
        return text;
    }

    auto lowercase(std::string_view text) -> std::string
    {
        auto result = std::string(text);
        std::ranges::transform(result, result.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return result;
    }

    auto matchesAny(std::string_view text, std::span<const std::regex> patterns) -> bool
    {
        auto const lowered = lowercase(text);
        return std::ranges::any_of(patterns, [&](const std::regex& pattern) { return std::regex_search(lowered, pattern); });
    }

    auto deathPatterns() -> const std::vector<std::regex>&
    {
        static auto const patterns = std::vector<std::regex> {
            std::regex(R"(\byou('re| are) (dead|killed|slain|no more|nonexistent)\b)"),
            std::regex(R"(\byou (die|pass away|perish|suffocate|drown|bleed out)\b)"),
            std::regex(R"(\byou('ve| have) (died|perished|suffocated|drowned|been (killed|slain))\b)"),
            std::regex(R"(\byou (\w+ )?(yourself )?to death\b)"),
            std::regex(R"(\byou (\w+ ){0,3}(collapse|bleed out|chok(e|ed|ing)|drown|dissolve) (\w+ ){0,3}and (die(d)?|pass away)\b)"),
        };
        return patterns;
    }

    auto victoryPatterns() -> const std::vector<std::regex>&
    {
        static auto const patterns = std::vector<std::regex> {
            std::regex(R"(\byou ((\w+ ){0,3}and )?live happily ever after\b)"),
            std::regex(R"(\byou ((\w+ ){0,3}and )?live (forever|eternally|for eternity)\b)"),
            std::regex(R"(\byou ((\w+ ){0,3}and )?(are|become|turn into) ((a|now) )?(deity|god|immortal)\b)"),
            std::regex(R"(\byou ((\w+ ){0,3}and )?((go|get) (in)?to|arrive (at|in)) (heaven|paradise)\b)"),
            std::regex(R"(\byou ((\w+ ){0,3}and )?celebrate your (victory|triumph)\b)"),
            std::regex(R"(\byou ((\w+ ){0,3}and )?retire\b)"),
        };
        return patterns;
    }

    struct PronounRule
    {
        std::string_view first;
        std::string_view second;
    };

    constexpr auto PronounRules = std::array {
        PronounRule { "I'm", "you're" },     PronounRule { "I've", "you've" },  PronounRule { "I'll", "you'll" },
        PronounRule { "I'd", "you'd" },      PronounRule { "I am", "you are" }, PronounRule { "I was", "you were" },
        PronounRule { "myself", "yourself" }, PronounRule { "mine", "yours" },   PronounRule { "my", "your" },
        PronounRule { "me", "you" },         PronounRule { "I", "you" },
    };

    auto isWordChar(char c) -> bool
    {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '\'';
    }

} // namespace

auto cutTrailingSentence(std::string_view text, bool allowAction) -> std::string
{
    auto end = text.size();
    if (auto const special = text.find('<'); special != std::string_view::npos)
        end = special;
    if (!allowAction)
    {
        if (auto const action = text.find('>'); action != std::string_view::npos)
            end = std::min(end, action);
    }

    auto const body = text.substr(0, end);
    auto const lastStop = body.find_last_of(".!?");
    if (lastStop == std::string_view::npos)
        return std::string(body);

    // Keep a closing quote that belongs to the final sentence.
    auto cut = lastStop + 1;
    if (cut < body.size() && body[cut] == '"')
        ++cut;
    return std::string(body.substr(0, cut));
}

auto cleanResult(std::string_view text, bool allowAction) -> std::string
{
    auto result = cutTrailingSentence(text, allowAction);
    if (result.empty())
        return result;

    auto const firstUpper = std::isupper(static_cast<unsigned char>(result.front())) != 0;

    result = replaceAll(std::move(result), ".\"", "\".");
    std::erase(result, '#');
    std::erase(result, '*');
    while (result.find("\n\n") != std::string::npos)
        result = replaceAll(std::move(result), "\n\n", "\n");

    if (!result.empty() && !firstUpper)
        result.front() = static_cast<char>(std::tolower(static_cast<unsigned char>(result.front())));
    return result;
}

auto toSecondPerson(std::string_view text) -> std::string
{
    auto result = std::string {};
    result.reserve(text.size() + 16);

    auto i = std::size_t { 0 };
    while (i < text.size())
    {
        auto const atWordStart = i == 0 || !isWordChar(text[i - 1]);
        auto matched = false;
        if (atWordStart)
        {
            for (auto const& rule: PronounRules)
            {
                auto const candidate = text.substr(i, rule.first.size());
                auto const next = i + rule.first.size();
                auto const atWordEnd = next >= text.size() || !isWordChar(text[next]);
                auto const sameWord =
                    candidate.size() == rule.first.size()
                    && std::ranges::equal(candidate, rule.first, [&](char a, char b) {
                           // "I" must match exactly, the other pronouns case-insensitively.
                           return rule.first.starts_with("I")
                                      ? a == b
                                      : std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b));
                       });
                if (sameWord && atWordEnd)
                {
                    auto replacement = std::string(rule.second);
                    if (std::isupper(static_cast<unsigned char>(text[i])) && rule.first.front() != 'I')
                        replacement.front() = static_cast<char>(std::toupper(static_cast<unsigned char>(replacement.front())));
                    result += replacement;
                    i = next;
                    matched = true;
                    break;
                }
            }
        }
        if (!matched)
            result += text[i++];
    }
    return result;
}

auto similarity(std::string_view a, std::string_view b) -> double
{
    if (a.empty() && b.empty())
        return 1.0;

    auto previous = std::vector<std::size_t>(b.size() + 1, 0);
    auto current = std::vector<std::size_t>(b.size() + 1, 0);
    for (auto i = std::size_t { 1 }; i <= a.size(); ++i)
    {
        for (auto j = std::size_t { 1 }; j <= b.size(); ++j)
        {
            current[j] = a[i - 1] == b[j - 1] ? previous[j - 1] + 1 : std::max(previous[j], current[j - 1]);
        }
        std::swap(previous, current);
    }

    auto const common = previous[b.size()];
    return 2.0 * static_cast<double>(common) / static_cast<double>(a.size() + b.size());
}

auto playerDied(std::string_view text) -> bool
{
    return matchesAny(text, deathPatterns());
}

auto playerWon(std::string_view text) -> bool
{
    return matchesAny(text, victoryPatterns());
}

} // namespace storyloom
