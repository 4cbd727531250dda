// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Random.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace storyloom
{

/// @brief Narrative tier of a d20 roll.
enum class DiceTier
{
    CriticalFailure,
    Failure,
    Success,
    CriticalSuccess,
};

[[nodiscard]] constexpr auto diceTierName(DiceTier tier) -> std::string_view
{
    switch (tier)
    {
        case DiceTier::CriticalFailure: return "critical failure";
        case DiceTier::Failure: return "failure";
        case DiceTier::Success: return "success";
        case DiceTier::CriticalSuccess: return "critical success";
    }
    return "unknown";
}

/// @brief A single d20 roll and the tier it falls into.
struct DiceOutcome
{
    int roll = 0;
    DiceTier tier = DiceTier::Success;
};

/// @brief Partition of [1, 20] into tiers by inclusive upper bounds.
///
/// Rolls up to criticalFailureMax are critical failures, up to failureMax
/// failures, up to successMax successes, everything above critical successes.
/// Equal bounds leave a tier empty.
struct DicePolicy
{
    int criticalFailureMax = 1;
    int failureMax = 9;
    int successMax = 19;

    [[nodiscard]] auto validate(std::string_view section) const -> VoidResult;
    [[nodiscard]] auto tierFor(int roll) const -> DiceTier;
};

/// @brief Framing clauses spliced into the prompt, one per tier.
///
/// Each template contains exactly one "{}", replaced by the action phrase
/// ("open the door").
struct DiceHints
{
    std::string criticalFailure = "You try to {}, but it goes horribly wrong.";
    std::string failure = "You try to {}, but fail.";
    std::string success = "You {}.";
    std::string criticalSuccess = "You {}, and it works out better than you could have hoped.";

    [[nodiscard]] auto validate(std::string_view section) const -> VoidResult;
    [[nodiscard]] auto forTier(DiceTier tier) const -> const std::string&;

    /// @brief Frames @p actionPhrase with the template of @p outcome's tier.
    [[nodiscard]] auto frame(const DiceOutcome& outcome, std::string_view actionPhrase) const -> std::string;
};

/// @brief Rolls the d20 that decides how a player action turns out.
///
/// The outcome only ever reaches the model as text in the next prompt.
class OutcomeResolver
{
  public:
    explicit OutcomeResolver(DicePolicy policy = {});

    /// @brief Rolls once if @p enabled.
    /// @return The outcome, or std::nullopt when the dice mechanic is disabled.
    [[nodiscard]] auto resolve(bool enabled, RandomSource& random) const -> std::optional<DiceOutcome>;

    [[nodiscard]] auto policy() const noexcept -> const DicePolicy& { return _policy; }

  private:
    DicePolicy _policy;
};

} // namespace storyloom
