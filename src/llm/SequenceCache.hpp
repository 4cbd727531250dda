// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <sampling/TokenDistribution.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace storyloom
{

/// @brief Bookkeeping for the token sequences held in a multi-sequence KV cache.
///
/// Slot i mirrors llama sequence id i. plan() picks the slot a context is
/// decoded into, so that interleaved generations sharing a prompt each extend
/// their own slot instead of evicting one another. Not thread-safe.
class SequenceCache
{
  public:
    /// @brief How to bring a slot to a new context.
    struct Plan
    {
        int sequence = 0;            ///< Slot to decode into.
        std::optional<int> copyFrom; ///< Slot whose first @c keep tokens replace the target's content.
        std::size_t keep = 0;        ///< Cached tokens that stay; later positions are removed.
    };

    explicit SequenceCache(int sequences = 1);

    /// @brief Chooses a slot for a non-empty @p context and records the kept prefix as its content.
    ///
    /// At least the last token of @p context is always left to decode, since
    /// its logits are what the caller is after.
    [[nodiscard]] auto plan(std::span<const TokenId> context) -> Plan;

    /// @brief Records @p tokens as decoded at the end of @p sequence.
    void append(int sequence, std::span<const TokenId> tokens);

    /// @brief Drops everything in @p sequence past @p length tokens.
    void truncate(int sequence, std::size_t length);

    [[nodiscard]] auto tokens(int sequence) const -> const std::vector<TokenId>&;
    [[nodiscard]] auto sequences() const noexcept -> int { return static_cast<int>(_slots.size()); }

  private:
    struct Slot
    {
        std::vector<TokenId> tokens;
        std::uint64_t lastUse = 0;
    };

    std::vector<Slot> _slots;
    std::uint64_t _clock = 0;

    [[nodiscard]] auto leastRecentlyUsed(std::size_t except) const -> std::size_t;
};

} // namespace storyloom
