// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Random.hpp>
#include <llm/LanguageModel.hpp>

#include <algorithm>
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>
#include <utility>
#include <vector>

namespace storyloom::test
{

/// @brief Byte vocabulary plus one end-of-sequence token.
inline constexpr auto VocabularySize = std::size_t { 257 };
inline constexpr auto EndOfSequence = TokenId { 256 };

inline auto token(char ch) -> TokenId
{
    return static_cast<TokenId>(static_cast<unsigned char>(ch));
}

/// @brief A distribution with all mass on @p id.
inline auto oneHot(TokenId id) -> TokenDistribution
{
    auto scores = std::vector<double>(VocabularySize, 0.0);
    scores[static_cast<std::size_t>(id)] = 1.0;
    return TokenDistribution(std::move(scores));
}

/// @brief Byte-level model whose next-token scores come from a test-supplied function.
class FakeModel final: public LanguageModel
{
  public:
    using ScoreFunction = std::function<Result<TokenDistribution>(std::span<const TokenId> context)>;
    using StoppableScoreFunction =
        std::function<Result<TokenDistribution>(std::span<const TokenId> context, std::stop_token stop)>;

    explicit FakeModel(ScoreFunction score, int contextSize = 4096):
        _score([score = std::move(score)](std::span<const TokenId> context, std::stop_token) { return score(context); }),
        _contextSize(contextSize)
    {
    }

    explicit FakeModel(StoppableScoreFunction score, int contextSize = 4096):
        _score(std::move(score)), _contextSize(contextSize)
    {
    }

    [[nodiscard]] auto scoreNextToken(std::span<const TokenId> context, std::stop_token stop) const
        -> Result<TokenDistribution> override
    {
        ++_calls;
        return _score(context, std::move(stop));
    }

    [[nodiscard]] auto isEndOfSequence(TokenId id) const -> bool override { return id == EndOfSequence; }

    [[nodiscard]] auto tokenize(std::string_view text) const -> Result<std::vector<TokenId>> override
    {
        auto tokens = std::vector<TokenId> {};
        tokens.reserve(text.size());
        for (auto const ch: text)
            tokens.push_back(token(ch));
        return tokens;
    }

    [[nodiscard]] auto tokenToPiece(TokenId id) const -> std::string override
    {
        if (id < 0 || id >= EndOfSequence)
            return {};
        return std::string(1, static_cast<char>(id));
    }

    [[nodiscard]] auto vocabularySize() const -> std::size_t override { return VocabularySize; }
    [[nodiscard]] auto contextSize() const -> int override { return _contextSize; }

    [[nodiscard]] auto calls() const -> int { return _calls.load(); }

  private:
    StoppableScoreFunction _score;
    int _contextSize;
    mutable std::atomic<int> _calls { 0 };
};

/// @brief Text the model has produced since the end of @p prompt, rendered as bytes.
inline auto generatedSince(std::span<const TokenId> context, std::size_t promptLength) -> std::string
{
    auto text = std::string {};
    for (auto i = promptLength; i < context.size(); ++i)
        text += static_cast<char>(context[i]);
    return text;
}

/// @brief Score function that answers each generation with the next of @p replies.
///
/// Each reply is emitted byte by byte and ended with end-of-sequence, which
/// moves on to the next reply; after the last one the final reply repeats.
/// A generation that stops before end-of-sequence leaves the rest of its reply
/// to the next one. Not thread-safe.
inline auto scriptedReplies(std::vector<std::string> replies) -> FakeModel::ScoreFunction
{
    struct State
    {
        std::vector<std::string> replies;
        std::size_t current = 0;
        std::size_t emitted = 0;
    };
    auto state = std::make_shared<State>(State { .replies = std::move(replies), .current = 0, .emitted = 0 });

    return [state](std::span<const TokenId>) -> Result<TokenDistribution> {
        auto const index = std::min(state->current, state->replies.size() - 1);
        auto const& reply = state->replies[index];
        if (state->emitted >= reply.size())
        {
            state->emitted = 0;
            ++state->current;
            return oneHot(EndOfSequence);
        }
        return oneHot(token(reply[state->emitted++]));
    };
}

/// @brief Random source that replays fixed sequences.
///
/// Forks replay the same sequences from the start.
class ScriptedRandom final: public RandomSource
{
  public:
    explicit ScriptedRandom(std::vector<double> units, std::vector<int> ints = {}):
        _units(std::move(units)), _ints(std::move(ints))
    {
    }

    [[nodiscard]] auto nextUnit() -> double override
    {
        if (_units.empty())
            return 0.0;
        return _units[_unitIndex++ % _units.size()];
    }

    [[nodiscard]] auto nextInt(int low, int high) -> int override
    {
        if (_ints.empty())
            return low;
        return std::clamp(_ints[_intIndex++ % _ints.size()], low, high);
    }

    [[nodiscard]] auto fork() -> std::unique_ptr<RandomSource> override
    {
        ++_forks;
        return std::make_unique<ScriptedRandom>(_units, _ints);
    }

    [[nodiscard]] auto forks() const noexcept -> int { return _forks; }

  private:
    std::vector<double> _units;
    std::vector<int> _ints;
    std::size_t _unitIndex = 0;
    std::size_t _intIndex = 0;
    int _forks = 0;
};

} // namespace storyloom::test
