// SPDX-License-Identifier: Apache-2.0
#include "LlamaModel.hpp"

#include <core/Log.hpp>
#include <llm/SequenceCache.hpp>

#include <llama.h>

#include <algorithm>
#include <format>
#include <mutex>
#include <optional>
#include <span>
#include <stop_token>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace storyloom
{

namespace
{

    /// @brief Line buffer for llama.cpp log continuation messages.
    auto llamaLineBuffer = std::string {};

    /// @brief Maps ggml_log_level to storyloom::log::Level.
    auto mapGgmlLevel(ggml_log_level level) -> std::optional<log::Level>
    {
        switch (level)
        {
            case GGML_LOG_LEVEL_ERROR: return log::Level::Error;
            case GGML_LOG_LEVEL_WARN: return log::Level::Warning;
            case GGML_LOG_LEVEL_INFO: return log::Level::Debug;
            case GGML_LOG_LEVEL_DEBUG: return log::Level::Trace;
            default: return std::nullopt;
        }
    }

    /// @brief Forwards llama.cpp log output to storyloom::log, one complete line at a time.
    ///
    /// llama.cpp's own info chatter is demoted to debug so it stays out of the story.
    void llamaLogCallback(ggml_log_level level, char const* text, void* /*userData*/)
    {
        if (level == GGML_LOG_LEVEL_NONE || text == nullptr)
            return;

        llamaLineBuffer += std::string_view { text };

        while (true)
        {
            auto const nlPos = llamaLineBuffer.find('\n');
            if (nlPos == std::string::npos)
                break;

            auto line = llamaLineBuffer.substr(0, nlPos);
            auto const end = line.find_last_not_of(" \t\r");
            if (end != std::string::npos)
                line = line.substr(0, end + 1);

            if (!line.empty())
                log::write(mapGgmlLevel(level).value_or(log::Level::Debug), line);

            llamaLineBuffer.erase(0, nlPos + 1);
        }
    }

} // namespace

struct LlamaModel::Impl
{
    llama_model* model = nullptr;
    llama_context* ctx = nullptr;
    llama_vocab const* vocab = nullptr;
    int ctxSize = 0;
    std::size_t batchSize = 0;

    mutable std::mutex mutex;
    mutable llama_batch batch {};
    mutable bool batchAllocated = false;
    mutable SequenceCache sequences;
    mutable std::stop_token activeStop; ///< Stop token of the call currently decoding.

    ~Impl()
    {
        if (batchAllocated)
            llama_batch_free(batch);
        if (ctx)
            llama_free(ctx);
        if (model)
            llama_model_free(model);
    }

    /// @brief Abort callback polled by llama_decode between compute steps.
    static auto abortRequested(void* data) -> bool
    {
        return static_cast<Impl const*>(data)->activeStop.stop_requested();
    }

    void fillBatch(std::span<const llama_token> tokens, std::size_t position, llama_seq_id seq, bool wantLogits) const
    {
        batch.n_tokens = static_cast<int32_t>(tokens.size());
        for (auto i = std::size_t { 0 }; i < tokens.size(); ++i)
        {
            batch.token[i] = tokens[i];
            batch.pos[i] = static_cast<llama_pos>(position + i);
            batch.n_seq_id[i] = 1;
            batch.seq_id[i][0] = seq;
            batch.logits[i] = wantLogits && i + 1 == tokens.size();
        }
    }

    /// @brief Frees the cells of every sequence but @p keep.
    /// @return false if there was nothing to free.
    auto evictOthers(int keep) const -> bool
    {
        auto* mem = llama_get_memory(ctx);
        auto evicted = 0;
        for (auto seq = 0; seq < sequences.sequences(); ++seq)
        {
            if (seq == keep || sequences.tokens(seq).empty())
                continue;
            llama_memory_seq_rm(mem, seq, -1, -1);
            sequences.truncate(seq, 0);
            ++evicted;
        }
        if (evicted > 0)
            log::debug("KV cache full, dropped {} cached sequences", evicted);
        return evicted > 0;
    }

    /// @brief Brings a KV cache sequence to @p context and leaves the logits of its last token ready.
    ///
    /// On failure or cancellation the sequence keeps exactly the tokens recorded for it.
    auto sync(std::span<const llama_token> context, const std::stop_token& stop) const -> VoidResult
    {
        auto* mem = llama_get_memory(ctx);
        auto const plan = sequences.plan(context);
        auto const seq = static_cast<llama_seq_id>(plan.sequence);

        if (plan.copyFrom)
        {
            llama_memory_seq_rm(mem, seq, -1, -1);
            llama_memory_seq_cp(mem, static_cast<llama_seq_id>(*plan.copyFrom), seq, 0, static_cast<llama_pos>(plan.keep));
        }
        else if (!llama_memory_seq_rm(mem, seq, static_cast<llama_pos>(plan.keep), -1))
        {
            llama_memory_seq_rm(mem, seq, -1, -1);
            sequences.truncate(plan.sequence, 0);
        }

        auto offset = sequences.tokens(plan.sequence).size();
        while (offset < context.size())
        {
            if (stop.stop_requested())
                return makeError(ErrorCode::Cancelled, "Model call abandoned");

            auto const count = std::min(context.size() - offset, batchSize);
            auto const chunk = context.subspan(offset, count);
            fillBatch(chunk, offset, seq, offset + count == context.size());

            auto const status = llama_decode(ctx, batch);
            if (status != 0)
            {
                // Drop whatever the interrupted call left in the sequence.
                llama_memory_seq_rm(mem, seq, static_cast<llama_pos>(offset), -1);

                if (status == 2 || stop.stop_requested())
                    return makeError(ErrorCode::Cancelled, "Model call abandoned");
                if (status == 1 && evictOthers(plan.sequence))
                    continue;
                return makeError(ErrorCode::GenerationFailed, std::format("llama_decode failed ({})", status));
            }

            sequences.append(plan.sequence, chunk);
            offset += count;
        }
        return {};
    }
};

LlamaModel::LlamaModel(): _impl(std::make_unique<Impl>())
{
}

LlamaModel::~LlamaModel() = default;

auto LlamaModel::load(const LlamaModelConfig& config) -> VoidResult
{
    log::info("Loading model: {}", config.modelPath);

    llama_log_set(llamaLogCallback, nullptr);

    auto modelParams = llama_model_default_params();
    if (config.forceCpu)
        modelParams.n_gpu_layers = 0;
    else if (config.gpuLayers >= 0)
        modelParams.n_gpu_layers = config.gpuLayers;
    else
        modelParams.n_gpu_layers = 999; // Auto: offload as many as possible

    auto* model = llama_model_load_from_file(config.modelPath.c_str(), modelParams);
    if (!model)
        return makeError(ErrorCode::ModelLoadError, std::format("Failed to load model: {}", config.modelPath));

    auto const sequences = std::clamp(config.sequences, 1, static_cast<int>(llama_max_parallel_sequences()));

    auto ctxParams = llama_context_default_params();
    ctxParams.n_ctx = static_cast<uint32_t>(config.contextSize + (sequences - 1) * std::max(config.sequenceTokens, 0));
    ctxParams.n_seq_max = static_cast<uint32_t>(sequences);
    ctxParams.kv_unified = true;
    ctxParams.n_threads = config.threads > 0 ? config.threads
                                             : static_cast<int32_t>(std::thread::hardware_concurrency());
    ctxParams.n_threads_batch = ctxParams.n_threads;

    auto* ctx = llama_init_from_model(model, ctxParams);
    if (!ctx)
    {
        llama_model_free(model);
        return makeError(ErrorCode::ModelLoadError, "Failed to create llama context");
    }

    _impl->model = model;
    _impl->ctx = ctx;
    _impl->vocab = llama_model_get_vocab(model);
    _impl->ctxSize = config.contextSize;
    _impl->batchSize = static_cast<std::size_t>(llama_n_batch(ctx));
    _impl->batch = llama_batch_init(static_cast<int32_t>(_impl->batchSize), 0, 1);
    _impl->batchAllocated = true;
    _impl->sequences = SequenceCache(sequences);
    llama_set_abort_callback(ctx, &Impl::abortRequested, _impl.get());

    log::info("Model loaded (context size: {}, sequences: {}, vocabulary: {}, cpu only: {})",
              _impl->ctxSize,
              sequences,
              vocabularySize(),
              config.forceCpu);
    return {};
}

auto LlamaModel::isLoaded() const -> bool
{
    return _impl->model != nullptr && _impl->ctx != nullptr;
}

auto LlamaModel::scoreNextToken(std::span<const TokenId> context, std::stop_token stop) const
    -> Result<TokenDistribution>
{
    if (!isLoaded())
        return makeError(ErrorCode::GenerationFailed, "No model loaded");

    auto tokens = std::vector<llama_token>(context.begin(), context.end());
    if (tokens.empty())
        tokens.push_back(llama_vocab_bos(_impl->vocab));

    if (std::cmp_greater(tokens.size(), _impl->ctxSize))
        return makeError(ErrorCode::GenerationFailed,
                         std::format("Context of {} tokens exceeds the model context of {}",
                                     tokens.size(),
                                     _impl->ctxSize));

    auto lock = std::lock_guard(_impl->mutex);
    if (stop.stop_requested())
        return makeError(ErrorCode::Cancelled, "Model call abandoned");

    _impl->activeStop = stop;
    auto synced = _impl->sync(tokens, stop);
    _impl->activeStop = {};
    if (!synced)
        return std::unexpected(synced.error());

    auto const* logits = llama_get_logits_ith(_impl->ctx, -1);
    if (!logits)
        return makeError(ErrorCode::GenerationFailed, "Model produced no logits");

    return TokenDistribution::fromLogits(std::span<const float>(logits, vocabularySize()));
}

auto LlamaModel::isEndOfSequence(TokenId token) const -> bool
{
    return isLoaded() && llama_vocab_is_eog(_impl->vocab, token);
}

auto LlamaModel::tokenize(std::string_view text) const -> Result<std::vector<TokenId>>
{
    if (!isLoaded())
        return makeError(ErrorCode::GenerationFailed, "No model loaded");

    auto tokens = std::vector<llama_token>(text.size() + 8);
    auto count = llama_tokenize(
        _impl->vocab, text.data(), static_cast<int32_t>(text.size()), tokens.data(), static_cast<int32_t>(tokens.size()), false, false);

    if (count < 0)
    {
        tokens.resize(static_cast<std::size_t>(-count));
        count = llama_tokenize(
            _impl->vocab, text.data(), static_cast<int32_t>(text.size()), tokens.data(), static_cast<int32_t>(tokens.size()), false, false);
    }

    if (count < 0)
        return makeError(ErrorCode::GenerationFailed, "Tokenization failed");

    tokens.resize(static_cast<std::size_t>(count));
    return std::vector<TokenId>(tokens.begin(), tokens.end());
}

auto LlamaModel::tokenToPiece(TokenId token) const -> std::string
{
    if (!isLoaded())
        return {};

    auto piece = std::string(64, '\0');
    auto length = llama_token_to_piece(_impl->vocab, token, piece.data(), static_cast<int32_t>(piece.size()), 0, false);
    if (length < 0)
    {
        piece.resize(static_cast<std::size_t>(-length));
        length = llama_token_to_piece(_impl->vocab, token, piece.data(), static_cast<int32_t>(piece.size()), 0, false);
    }

    piece.resize(static_cast<std::size_t>(std::max(length, 0)));
    return piece;
}

auto LlamaModel::vocabularySize() const -> std::size_t
{
    if (!isLoaded())
        return 0;
    return static_cast<std::size_t>(llama_vocab_n_tokens(_impl->vocab));
}

auto LlamaModel::contextSize() const -> int
{
    return _impl->ctxSize;
}

} // namespace storyloom
