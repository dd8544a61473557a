// SPDX-License-Identifier: Apache-2.0
#include "LlmEngine.hpp"

#include <core/Log.hpp>

#include <llama.h>

#include <algorithm>
#include <array>
#include <format>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace mindcast
{

struct LlmEngine::Impl
{
    llama_model* model = nullptr;
    llama_context* ctx = nullptr;
    int ctxSize = 0;

    ~Impl()
    {
        if (ctx)
            llama_free(ctx);
        if (model)
            llama_model_free(model);
    }
};

namespace
{

    /// @brief Line buffer for llama.cpp log continuation messages.
    auto llamaLineBuffer = std::string {};

    /// @brief Maps ggml_log_level to mindcast::log::Level.
    /// @param level The ggml log level.
    /// @return The corresponding log level, or std::nullopt for GGML_LOG_LEVEL_NONE.
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

    /// @brief Log callback for llama.cpp that forwards complete lines to mindcast::log.
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
            {
                auto const logLevel = mapGgmlLevel(level).value_or(log::Level::Debug);
                log::write(logLevel, line);
            }

            llamaLineBuffer.erase(0, nlPos + 1);
        }
    }

} // namespace

LlmEngine::LlmEngine(): _impl(std::make_unique<Impl>())
{
}

LlmEngine::~LlmEngine() = default;

LlmEngine::LlmEngine(LlmEngine&&) noexcept = default;

LlmEngine& LlmEngine::operator=(LlmEngine&&) noexcept = default;

auto LlmEngine::load(const LlmEngineConfig& config) -> VoidResult
{
    if (config.modelPath.empty())
        return makeError(ErrorCode::ModelLoadError, "No model path configured (llm.modelPath)");

    log::info("Loading model: {}", config.modelPath);

    llama_log_set(llamaLogCallback, nullptr);

    auto modelParams = llama_model_default_params();
    if (config.gpuLayers >= 0)
        modelParams.n_gpu_layers = config.gpuLayers;
    else
        modelParams.n_gpu_layers = 999; // Auto: offload as many as possible

    auto* model = llama_model_load_from_file(config.modelPath.c_str(), modelParams);
    if (!model)
        return makeError(ErrorCode::ModelLoadError,
                         std::format("Failed to load model: {}", config.modelPath));

    auto ctxParams = llama_context_default_params();
    ctxParams.n_ctx = static_cast<uint32_t>(config.contextSize);
    ctxParams.n_threads = config.threads > 0 ? static_cast<uint32_t>(config.threads)
                                             : static_cast<uint32_t>(std::thread::hardware_concurrency());
    ctxParams.n_threads_batch = ctxParams.n_threads;

    auto* ctx = llama_init_from_model(model, ctxParams);
    if (!ctx)
    {
        llama_model_free(model);
        return makeError(ErrorCode::ModelLoadError, "Failed to create llama context");
    }

    _impl->model = model;
    _impl->ctx = ctx;
    _impl->ctxSize = config.contextSize;

    log::info("Model loaded successfully (context size: {})", config.contextSize);
    return {};
}

auto LlmEngine::complete(std::span<const ChatMessage> messages, const SamplerConfig& sampler)
    -> Result<std::string>
{
    if (!isLoaded())
        return makeError(ErrorCode::InferenceError, "No model loaded");

    auto const* tmpl = llama_model_chat_template(_impl->model, nullptr);
    auto chatTemplate = tmpl ? std::string(tmpl) : std::string("chatml");

    // llama_chat_message only borrows the strings
    auto llamaMsgs = std::vector<llama_chat_message> {};
    llamaMsgs.reserve(messages.size());
    auto roleStrings = std::vector<std::string> {};
    roleStrings.reserve(messages.size());

    auto promptChars = size_t { 0 };
    for (const auto& msg: messages)
    {
        roleStrings.emplace_back(roleToString(msg.role));
        llamaMsgs.push_back(llama_chat_message {
            .role = roleStrings.back().c_str(),
            .content = msg.content.c_str(),
        });
        promptChars += msg.content.size();
    }

    auto buf = std::vector<char>(std::max(static_cast<size_t>(_impl->ctxSize) * 4, promptChars * 2 + 1024));
    auto len = llama_chat_apply_template(chatTemplate.c_str(),
                                         llamaMsgs.data(),
                                         llamaMsgs.size(),
                                         true,
                                         buf.data(),
                                         static_cast<int32_t>(buf.size()));
    if (len > static_cast<int32_t>(buf.size()))
    {
        buf.resize(static_cast<size_t>(len));
        len = llama_chat_apply_template(chatTemplate.c_str(),
                                        llamaMsgs.data(),
                                        llamaMsgs.size(),
                                        true,
                                        buf.data(),
                                        static_cast<int32_t>(buf.size()));
    }

    if (len < 0)
        return makeError(ErrorCode::InferenceError, "Failed to apply chat template");

    auto prompt = std::string(buf.data(), static_cast<size_t>(len));

    auto const vocabModel = llama_model_get_vocab(_impl->model);
    auto tokens = std::vector<llama_token>(static_cast<size_t>(_impl->ctxSize));
    auto const nTokens = llama_tokenize(vocabModel,
                                        prompt.c_str(),
                                        static_cast<int32_t>(prompt.size()),
                                        tokens.data(),
                                        static_cast<int32_t>(tokens.size()),
                                        true,
                                        true);

    if (nTokens < 0)
        return makeError(ErrorCode::InferenceError,
                         std::format("Prompt does not fit into the context window ({} tokens)", _impl->ctxSize));
    tokens.resize(static_cast<size_t>(nTokens));

    auto* mem = llama_get_memory(_impl->ctx);
    if (mem)
        llama_memory_clear(mem, true);

    auto batch = llama_batch_get_one(tokens.data(), nTokens);
    if (llama_decode(_impl->ctx, batch) != 0)
        return makeError(ErrorCode::InferenceError, "Failed to decode prompt");

    auto* smpl = llama_sampler_chain_init(llama_sampler_chain_default_params());
    llama_sampler_chain_add(smpl, llama_sampler_init_temp(sampler.temperature));
    llama_sampler_chain_add(smpl, llama_sampler_init_top_k(sampler.topK));
    llama_sampler_chain_add(smpl, llama_sampler_init_top_p(sampler.topP, 1));
    llama_sampler_chain_add(
        smpl,
        llama_sampler_init_dist(sampler.seed < 0 ? LLAMA_DEFAULT_SEED : static_cast<uint32_t>(sampler.seed)));

    auto text = std::string {};
    auto const maxTokens = std::min(_impl->ctxSize - nTokens, sampler.maxTokens);

    for (auto i = 0; i < maxTokens; ++i)
    {
        auto const newTokenId = llama_sampler_sample(smpl, _impl->ctx, -1);

        if (llama_vocab_is_eog(vocabModel, newTokenId))
            break;

        auto tokenBuf = std::array<char, 256> {};
        auto const tokenLen = llama_token_to_piece(
            vocabModel, newTokenId, tokenBuf.data(), static_cast<int32_t>(tokenBuf.size()), 0, true);

        if (tokenLen > 0)
            text.append(tokenBuf.data(), static_cast<size_t>(tokenLen));

        // llama_batch_get_one requires non-const pointer
        auto mutableTokenId = newTokenId;
        auto singleTokenBatch = llama_batch_get_one(&mutableTokenId, 1);
        if (llama_decode(_impl->ctx, singleTokenBatch) != 0)
        {
            llama_sampler_free(smpl);
            return makeError(ErrorCode::InferenceError, "Failed to decode generated token");
        }
    }

    llama_sampler_free(smpl);
    return text;
}

auto LlmEngine::isLoaded() const -> bool
{
    return _impl->model != nullptr && _impl->ctx != nullptr;
}

auto LlmEngine::contextSize() const -> int
{
    return _impl->ctxSize;
}

} // namespace mindcast
