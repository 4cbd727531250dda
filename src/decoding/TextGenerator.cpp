// SPDX-License-Identifier: Apache-2.0
#include "TextGenerator.hpp"

#include <core/Log.hpp>

#include <algorithm>
#include <numeric>

namespace storyloom
{

void truncateLongestFirst(std::vector<std::vector<TokenId>>& parts, std::size_t maxTokens)
{
    auto total = std::accumulate(
        parts.begin(), parts.end(), std::size_t { 0 }, [](std::size_t sum, const auto& part) { return sum + part.size(); });

    while (total > maxTokens)
    {
        auto longest = std::ranges::max_element(parts, {}, [](const auto& part) { return part.size(); });
        longest->erase(longest->begin());
        --total;
    }
}

TextGenerator::TextGenerator(const LanguageModel& model): _model(model)
{
}

auto TextGenerator::encodePrompt(std::span<const std::string> parts, int maxNewTokens) const
    -> Result<std::vector<TokenId>>
{
    auto const budget = _model.contextSize() - maxNewTokens;
    if (budget <= 0)
        return makeError(ErrorCode::InvalidArgument,
                         std::format("maxNewTokens ({}) leaves no room in a context of {} tokens",
                                     maxNewTokens,
                                     _model.contextSize()));

    auto encoded = std::vector<std::vector<TokenId>> {};
    encoded.reserve(parts.size());
    for (const auto& part: parts)
    {
        auto tokens = _model.tokenize(part);
        if (!tokens)
            return std::unexpected(tokens.error());
        encoded.push_back(std::move(*tokens));
    }

    truncateLongestFirst(encoded, static_cast<std::size_t>(budget));

    auto prompt = std::vector<TokenId> {};
    for (auto& part: encoded)
        prompt.insert(prompt.end(), part.begin(), part.end());
    return prompt;
}

auto TextGenerator::stopTokensFor(std::span<const std::string_view> markers) const -> std::vector<TokenId>
{
    auto tokens = std::vector<TokenId> {};
    for (auto const marker: markers)
    {
        auto encoded = _model.tokenize(marker);
        if (encoded && encoded->size() == 1)
            tokens.push_back(encoded->front());
        else
            log::debug("Stop marker '{}' is not a single token, ignoring", marker);
    }
    return tokens;
}

auto TextGenerator::generate(std::span<const std::string> parts,
                             const SamplingConfig& config,
                             const DecodeOptions& options,
                             RandomSource& random,
                             std::stop_token stop,
                             const TextCallback& onText) const -> Result<GeneratedText>
{
    auto prompt = encodePrompt(parts, config.maxNewTokens);
    if (!prompt)
        return std::unexpected(prompt.error());

    log::trace("Prompt: {}", _model.detokenize(*prompt));

    auto loop = DecodingLoop(_model, config);
    loop.setOptions(options);

    auto forward = TokenCallback {};
    if (onText)
        forward = [&](TokenId token) { onText(_model.tokenToPiece(token)); };

    auto decoded = loop.run(*prompt, random, std::move(stop), forward);
    if (!decoded)
        return std::unexpected(decoded.error());

    auto text = _model.detokenize(decoded->tokens);
    if (auto const marker = text.find(EndOfTextMarker); marker != std::string::npos)
        text.erase(marker);

    log::debug("Generated {} tokens ({}): {}", decoded->tokens.size(), stopReasonName(decoded->reason), text);
    return GeneratedText {
        .text = std::move(text),
        .tokenCount = decoded->tokens.size(),
        .reason = decoded->reason,
    };
}

} // namespace storyloom
