// SPDX-License-Identifier: Apache-2.0
#include "OutcomeResolver.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

namespace storyloom
{

namespace
{

    constexpr auto DieFaces = 20;
    constexpr auto Placeholder = std::string_view { "{}" };

    auto validateTemplate(std::string_view key, const std::string& hint) -> VoidResult
    {
        auto const first = hint.find(Placeholder);
        if (first == std::string::npos)
            return makeConfigError(key, "must contain a {} placeholder for the action");
        if (hint.find(Placeholder, first + Placeholder.size()) != std::string::npos)
            return makeConfigError(key, "must contain exactly one {} placeholder");
        return {};
    }

} // namespace

auto DicePolicy::validate(std::string_view section) const -> VoidResult
{
    if (criticalFailureMax < 0 || criticalFailureMax > DieFaces)
        return makeConfigError(json::qualifiedKey(section, "criticalFailureMax"), "must be in [0, 20]");
    if (failureMax < criticalFailureMax || failureMax > DieFaces)
        return makeConfigError(json::qualifiedKey(section, "failureMax"), "must be in [criticalFailureMax, 20]");
    if (successMax < failureMax || successMax > DieFaces)
        return makeConfigError(json::qualifiedKey(section, "successMax"), "must be in [failureMax, 20]");
    return {};
}

auto DicePolicy::tierFor(int roll) const -> DiceTier
{
    if (roll <= criticalFailureMax)
        return DiceTier::CriticalFailure;
    if (roll <= failureMax)
        return DiceTier::Failure;
    if (roll <= successMax)
        return DiceTier::Success;
    return DiceTier::CriticalSuccess;
}

auto DiceHints::validate(std::string_view section) const -> VoidResult
{
    if (auto r = validateTemplate(json::qualifiedKey(section, "criticalFailure"), criticalFailure); !r)
        return r;
    if (auto r = validateTemplate(json::qualifiedKey(section, "failure"), failure); !r)
        return r;
    if (auto r = validateTemplate(json::qualifiedKey(section, "success"), success); !r)
        return r;
    return validateTemplate(json::qualifiedKey(section, "criticalSuccess"), criticalSuccess);
}

auto DiceHints::forTier(DiceTier tier) const -> const std::string&
{
    switch (tier)
    {
        case DiceTier::CriticalFailure: return criticalFailure;
        case DiceTier::Failure: return failure;
        case DiceTier::Success: return success;
        case DiceTier::CriticalSuccess: return criticalSuccess;
    }
    return success;
}

auto DiceHints::frame(const DiceOutcome& outcome, std::string_view actionPhrase) const -> std::string
{
    auto framed = forTier(outcome.tier);
    if (auto const pos = framed.find(Placeholder); pos != std::string::npos)
        framed.replace(pos, Placeholder.size(), actionPhrase);
    return framed;
}

OutcomeResolver::OutcomeResolver(DicePolicy policy): _policy(policy)
{
}

auto OutcomeResolver::resolve(bool enabled, RandomSource& random) const -> std::optional<DiceOutcome>
{
    if (!enabled)
        return std::nullopt;

    auto const roll = random.nextInt(1, DieFaces);
    auto const outcome = DiceOutcome { .roll = roll, .tier = _policy.tierFor(roll) };
    log::debug("Rolled {} ({})", outcome.roll, diceTierName(outcome.tier));
    return outcome;
}

} // namespace storyloom
