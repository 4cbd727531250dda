// SPDX-License-Identifier: Apache-2.0
#include "SequenceCache.hpp"

#include <algorithm>
#include <iterator>

namespace storyloom
{

namespace
{

    auto commonPrefix(std::span<const TokenId> context, const std::vector<TokenId>& cached) -> std::size_t
    {
        auto const mismatch = std::ranges::mismatch(context, cached);
        return static_cast<std::size_t>(std::distance(context.begin(), mismatch.in1));
    }

} // namespace

SequenceCache::SequenceCache(int sequences): _slots(static_cast<std::size_t>(std::max(sequences, 1)))
{
}

auto SequenceCache::plan(std::span<const TokenId> context) -> Plan
{
    auto common = std::vector<std::size_t>(_slots.size());
    auto best = std::size_t { 0 };
    auto bestExtendable = std::optional<std::size_t> {};
    for (auto i = std::size_t { 0 }; i < _slots.size(); ++i)
    {
        common[i] = commonPrefix(context, _slots[i].tokens);
        if (common[i] > common[best])
            best = i;
        // A slot whose whole content is a prefix of the context is extended in place.
        if (common[i] == _slots[i].tokens.size() && (!bestExtendable || common[i] > common[*bestExtendable]))
            bestExtendable = i;
    }

    // The last position is decoded again for its logits.
    auto const limit = context.empty() ? std::size_t { 0 } : context.size() - 1;

    auto plan = Plan {};
    if (bestExtendable && common[*bestExtendable] >= common[best])
    {
        plan.sequence = static_cast<int>(*bestExtendable);
        plan.keep = std::min(common[*bestExtendable], limit);
    }
    else if (_slots.size() > 1)
    {
        // Fork the shared prefix into another slot rather than cutting the best one back.
        plan.sequence = static_cast<int>(leastRecentlyUsed(best));
        plan.copyFrom = static_cast<int>(best);
        plan.keep = std::min(common[best], limit);
    }
    else
    {
        plan.sequence = static_cast<int>(best);
        plan.keep = std::min(common[best], limit);
    }

    auto& slot = _slots[static_cast<std::size_t>(plan.sequence)];
    if (plan.copyFrom)
        slot.tokens.assign(context.begin(), context.begin() + static_cast<std::ptrdiff_t>(plan.keep));
    else
        slot.tokens.resize(plan.keep);
    slot.lastUse = ++_clock;
    return plan;
}

void SequenceCache::append(int sequence, std::span<const TokenId> tokens)
{
    auto& slot = _slots[static_cast<std::size_t>(sequence)];
    slot.tokens.insert(slot.tokens.end(), tokens.begin(), tokens.end());
}

void SequenceCache::truncate(int sequence, std::size_t length)
{
    auto& slot = _slots[static_cast<std::size_t>(sequence)];
    if (length < slot.tokens.size())
        slot.tokens.resize(length);
}

auto SequenceCache::tokens(int sequence) const -> const std::vector<TokenId>&
{
    return _slots[static_cast<std::size_t>(sequence)].tokens;
}

auto SequenceCache::leastRecentlyUsed(std::size_t except) const -> std::size_t
{
    auto victim = except == 0 ? std::size_t { 1 } : std::size_t { 0 };
    for (auto i = std::size_t { 0 }; i < _slots.size(); ++i)
    {
        if (i != except && _slots[i].lastUse < _slots[victim].lastUse)
            victim = i;
    }
    return victim;
}

} // namespace storyloom
