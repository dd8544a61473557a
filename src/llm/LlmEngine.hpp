// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>
#include <llm/Sampler.hpp>
#include <llm/TextGenerator.hpp>

#include <memory>
#include <span>
#include <string>

struct llama_model;
struct llama_context;

namespace mindcast
{

/// @brief Configuration for the LLM engine.
struct LlmEngineConfig
{
    std::string modelPath;
    int contextSize = 8192;
    int gpuLayers = -1; // -1 means auto
    int threads = 0;    // 0 means auto
};

/// @brief Wraps llama.cpp as the local generative text service.
class LlmEngine: public TextGenerator
{
  public:
    LlmEngine();
    ~LlmEngine() override;

    LlmEngine(const LlmEngine&) = delete;
    LlmEngine& operator=(const LlmEngine&) = delete;
    LlmEngine(LlmEngine&&) noexcept;
    LlmEngine& operator=(LlmEngine&&) noexcept;

    /// @brief Loads a GGUF model from disk.
    /// @param config The engine configuration including model path.
    /// @return Success or an error.
    [[nodiscard]] auto load(const LlmEngineConfig& config) -> VoidResult;

    /// @brief Generates the assistant reply for a conversation.
    /// @param messages The conversation history.
    /// @param sampler Sampling configuration.
    /// @return The generated text or an error.
    [[nodiscard]] auto complete(std::span<const ChatMessage> messages, const SamplerConfig& sampler)
        -> Result<std::string> override;

    /// @brief Returns true if a model is currently loaded.
    [[nodiscard]] auto isLoaded() const -> bool;

    /// @brief Returns the model's context size.
    [[nodiscard]] auto contextSize() const -> int;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace mindcast
