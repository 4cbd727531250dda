// SPDX-License-Identifier: Apache-2.0
#include "Story.hpp"

#include <algorithm>
#include <utility>

namespace storyloom
{

Story::Story(std::string context, std::string start): _context(std::move(context)), _start(std::move(start))
{
}

void Story::addTurn(std::string action, std::string result)
{
    _turns.push_back(Turn { .action = std::move(action), .result = std::move(result) });
}

auto Story::revert() -> bool
{
    if (_turns.empty())
        return false;
    _turns.pop_back();
    return true;
}

auto Story::latestResult() const -> const std::string&
{
    return _turns.empty() ? _start : _turns.back().result;
}

auto Story::promptParts(std::string_view nextAction, std::size_t memory) const -> std::vector<std::string>
{
    auto recent = _start;
    auto const skipped = _turns.size() - std::min(memory, _turns.size());
    for (auto i = skipped; i < _turns.size(); ++i)
    {
        recent += _turns[i].action;
        recent += _turns[i].result;
    }

    auto parts = std::vector<std::string> {};
    if (!_context.empty())
        parts.push_back(_context);
    parts.push_back(std::move(recent));
    if (!nextAction.empty())
        parts.emplace_back(nextAction);
    return parts;
}

auto Story::toString() const -> std::string
{
    auto text = _context + _start;
    for (const auto& turn: _turns)
    {
        text += turn.action;
        text += turn.result;
    }
    return text;
}

} // namespace storyloom
