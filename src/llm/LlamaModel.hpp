// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <llm/LanguageModel.hpp>

#include <memory>
#include <string>

namespace storyloom
{

/// @brief Configuration for the local llama.cpp backend.
struct LlamaModelConfig
{
    std::string modelPath;
    int contextSize = 1024;
    int gpuLayers = -1; // -1 means auto
    int threads = 0;    // 0 means auto
    bool forceCpu = false;
    int sequences = 1;      ///< Concurrent generations that keep a KV cache sequence of their own.
    int sequenceTokens = 0; ///< KV cells added per sequence beyond the first.
};

/// @brief Runs a GGUF model through llama.cpp and exposes it as a LanguageModel.
///
/// Every generation extends its own KV cache sequence, forked from the
/// sequence sharing the longest prefix, so extending a context by one token
/// costs one decode even while several generations interleave. Calls are
/// serialized internally; the llama context is not reentrant. A call in
/// flight is aborted between and within decode batches once its stop token
/// is triggered.
class LlamaModel final: public LanguageModel
{
  public:
    LlamaModel();
    ~LlamaModel() override;

    LlamaModel(const LlamaModel&) = delete;
    LlamaModel& operator=(const LlamaModel&) = delete;

    /// @brief Loads a GGUF model from disk.
    /// @return Success or ModelLoadError.
    [[nodiscard]] auto load(const LlamaModelConfig& config) -> VoidResult;

    /// @brief Returns true if a model is currently loaded.
    [[nodiscard]] auto isLoaded() const -> bool;

    [[nodiscard]] auto scoreNextToken(std::span<const TokenId> context, std::stop_token stop) const
        -> Result<TokenDistribution> override;
    [[nodiscard]] auto isEndOfSequence(TokenId token) const -> bool override;
    [[nodiscard]] auto tokenize(std::string_view text) const -> Result<std::vector<TokenId>> override;
    [[nodiscard]] auto tokenToPiece(TokenId token) const -> std::string override;
    [[nodiscard]] auto vocabularySize() const -> std::size_t override;
    [[nodiscard]] auto contextSize() const -> int override;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace storyloom
