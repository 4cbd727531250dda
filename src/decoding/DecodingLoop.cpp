// SPDX-License-Identifier: Apache-2.0
#include "DecodingLoop.hpp"

#include <core/Log.hpp>

#include <algorithm>
#include <utility>

namespace storyloom
{

DecodingLoop::DecodingLoop(const TokenScorer& model, SamplingConfig config, GenerationHistory history):
    _model(model), _sampler(config), _history(std::move(history))
{
}

auto DecodingLoop::run(std::span<const TokenId> prompt,
                       RandomSource& random,
                       std::stop_token stop,
                       const TokenCallback& onToken) -> Result<DecodeResult>
{
    _state = DecodeState::Running;

    auto context = std::vector<TokenId>(prompt.begin(), prompt.end());
    context.insert(context.end(), _history.tokens().begin(), _history.tokens().end());

    auto result = DecodeResult {};
    auto const maxNewTokens = static_cast<std::size_t>(_sampler.config().maxNewTokens);

    auto finish = [&](StopReason reason) -> Result<DecodeResult> {
        _state = DecodeState::Stopped;
        result.reason = reason;
        log::debug("Decoding stopped after {} tokens ({})", result.tokens.size(), stopReasonName(reason));
        return std::move(result);
    };

    while (true)
    {
        if (stop.stop_requested())
            return finish(StopReason::Cancelled);
        if (result.tokens.size() >= maxNewTokens)
            return finish(StopReason::MaxTokens);

        auto scores = _model.scoreNextToken(context, stop);

        // A call abandoned on cancellation, or one that outlived it, leaves the history untouched.
        if (stop.stop_requested() || (!scores && scores.error().code == ErrorCode::Cancelled))
            return finish(StopReason::Cancelled);

        if (!scores)
        {
            _state = DecodeState::Stopped;
            return makeError(ErrorCode::GenerationFailed,
                             std::format("Model failed after {} tokens: {}", result.tokens.size(), scores.error().message));
        }

        auto token = _sampler.next(*scores, context, random);
        if (!token)
        {
            _state = DecodeState::Stopped;
            return makeError(ErrorCode::GenerationFailed,
                             std::format("Malformed model distribution: {}", token.error().message));
        }

        if (_model.isEndOfSequence(*token))
            return finish(StopReason::EndOfSequence);

        _state = DecodeState::Extending;
        auto const emittedBefore = result.tokens.size();
        _history.append(*token);
        context.push_back(*token);
        result.tokens.push_back(*token);
        if (onToken)
            onToken(*token);
        _state = DecodeState::Running;

        if (isStopToken(*token) && std::cmp_greater_equal(emittedBefore, _options.minTokensBeforeStop))
            return finish(StopReason::StopToken);
    }
}

auto DecodingLoop::isStopToken(TokenId token) const -> bool
{
    return std::ranges::find(_options.stopTokens, token) != _options.stopTokens.end();
}

} // namespace storyloom
