// SPDX-License-Identifier: Apache-2.0
#include "ActionSuggester.hpp"

#include <core/Log.hpp>
#include <decoding/GenerationHistory.hpp>

#include <algorithm>
#include <memory>
#include <optional>
#include <thread>
#include <utility>

namespace storyloom
{

struct ActionSuggester::RunOutcome
{
    std::optional<std::string> text; ///< Set for a completed run.
    bool failed = false;
    bool cancelled = false;
};

namespace
{

    constexpr auto Whitespace = std::string_view { " \t\r\n" };

    auto trim(std::string_view text) -> std::string_view
    {
        auto const first = text.find_first_not_of(Whitespace);
        if (first == std::string_view::npos)
            return {};
        auto const last = text.find_last_not_of(Whitespace);
        return text.substr(first, last - first + 1);
    }

} // namespace

auto extractActionLine(std::string_view generated) -> std::string
{
    auto line = trim(generated);
    if (auto const newline = line.find('\n'); newline != std::string_view::npos)
        line = trim(line.substr(0, newline));
    if (auto const marker = line.find('>'); marker != std::string_view::npos)
        line = trim(line.substr(0, marker));
    return std::string(line);
}

ActionSuggester::ActionSuggester(const LanguageModel& model, SuggestionOptions options):
    _model(model), _options(std::move(options))
{
}

auto ActionSuggester::runOnce(std::span<const TokenId> promptContext,
                              const SamplingConfig& perAction,
                              RandomSource& random,
                              std::stop_token stop) const -> RunOutcome
{
    auto loop = DecodingLoop(
        _model, perAction, GenerationHistory(std::vector<TokenId>(promptContext.begin(), promptContext.end())));
    loop.setOptions(_options.decode);

    auto decoded = loop.run({}, random, std::move(stop));
    if (!decoded)
    {
        log::warning("Action suggestion failed: {}", decoded.error().message);
        return RunOutcome { .text = std::nullopt, .failed = true, .cancelled = false };
    }
    if (decoded->cancelled())
        return RunOutcome { .text = std::nullopt, .failed = false, .cancelled = true };

    return RunOutcome { .text = extractActionLine(_model.detokenize(decoded->tokens)), .failed = false, .cancelled = false };
}

auto ActionSuggester::suggestActions(std::span<const TokenId> promptContext,
                                     int count,
                                     const SamplingConfig& perAction,
                                     RandomSource& random,
                                     std::stop_token stop) const -> SuggestionSet
{
    auto set = SuggestionSet {};
    set.requested = static_cast<std::size_t>(std::max(count, 0));
    if (set.requested == 0)
        return set;

    // Streams are forked up front and in run order so the result does not depend on scheduling.
    auto streams = std::vector<std::unique_ptr<RandomSource>> {};
    streams.reserve(set.requested);
    for (auto i = std::size_t { 0 }; i < set.requested; ++i)
        streams.push_back(random.fork());

    auto outcomes = std::vector<RunOutcome>(set.requested);

    if (_options.parallel && set.requested > 1)
    {
        auto workers = std::vector<std::jthread> {};
        workers.reserve(set.requested);
        for (auto i = std::size_t { 0 }; i < set.requested; ++i)
        {
            workers.emplace_back([&, i] { outcomes[i] = runOnce(promptContext, perAction, *streams[i], stop); });
        }
    }
    else
    {
        for (auto i = std::size_t { 0 }; i < set.requested; ++i)
        {
            if (stop.stop_requested())
            {
                outcomes[i].cancelled = true;
                continue;
            }
            outcomes[i] = runOnce(promptContext, perAction, *streams[i], stop);
        }
    }

    for (auto i = std::size_t { 0 }; i < outcomes.size(); ++i)
    {
        auto& outcome = outcomes[i];
        set.cancelled = set.cancelled || outcome.cancelled;
        if (outcome.failed)
            ++set.failed;
        if (!outcome.text)
            continue;

        if (std::cmp_less(outcome.text->size(), perAction.minLength))
        {
            log::debug("Dropping suggestion {} shorter than {} characters: '{}'", i, perAction.minLength, *outcome.text);
            continue;
        }

        auto text = _options.prefix.empty() ? std::move(*outcome.text)
                                            : std::format("{} {}", _options.prefix, *outcome.text);
        set.candidates.push_back(ActionCandidate { .text = std::move(text), .sampling = perAction, .run = i });
    }

    if (set.shortfall() > 0)
        log::info("Generated {} of {} requested action suggestions", set.candidates.size(), set.requested);
    return set;
}

} // namespace storyloom
