// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>
#include <llm/Sampler.hpp>

#include <span>
#include <string>

namespace mindcast
{

/// @brief Abstract interface for the generative text service used by the content stages.
class TextGenerator
{
  public:
    virtual ~TextGenerator() = default;

    /// @brief Produces the assistant reply for the given conversation.
    /// @param messages The conversation history, system prompt first.
    /// @param sampler Sampling configuration (temperature etc.).
    /// @return The reply text or an error.
    [[nodiscard]] virtual auto complete(std::span<const ChatMessage> messages, const SamplerConfig& sampler)
        -> Result<std::string> = 0;
};

} // namespace mindcast
