// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Log.hpp>
#include <llm/ChatSession.hpp>
#include <llm/TextGenerator.hpp>
#include <pipeline/Request.hpp>

#include <format>
#include <string>
#include <string_view>

namespace mindcast
{

/// @brief Asks the generator for a free-text reply to the session's last user message.
[[nodiscard]] inline auto generateText(TextGenerator& generator,
                                       const ChatSession& session,
                                       const SamplerConfig& sampler,
                                       std::string_view purpose) -> Result<std::string>
{
    log::debug("Requesting {} (prompt: {})", purpose, log::preview(session.lastUserMessage()));
    auto reply = generator.complete(session.messages(), sampler);
    if (reply)
        log::debug("{} reply: {}", purpose, log::preview(*reply));
    return reply;
}

/// @brief Renders the request as a short list for prompts.
[[nodiscard]] inline auto describeRequest(const MeditationRequest& request) -> std::string
{
    return std::format("- Emotional state: {}\n"
                       "- Meditation style: {}\n"
                       "- Theme: {}\n"
                       "- Duration: {} minutes\n"
                       "- Voice: {}\n"
                       "- Language: {}\n"
                       "- Soundscape: {}\n",
                       enumName(request.emotionalState),
                       enumName(request.style),
                       enumName(request.theme),
                       request.durationMinutes,
                       enumName(request.voice),
                       request.languageCode,
                       enumName(request.soundscape));
}

/// @brief Trims surrounding whitespace.
[[nodiscard]] inline auto trimmed(std::string_view text) -> std::string_view
{
    auto const first = text.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos)
        return {};
    auto const last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

} // namespace mindcast
