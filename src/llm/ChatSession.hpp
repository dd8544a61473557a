// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Types.hpp>

#include <string>
#include <vector>

namespace mindcast
{

/// @brief Manages conversation history for one text-generation exchange.
class ChatSession
{
  public:
    /// @brief Constructs a ChatSession with an optional system prompt.
    /// @param systemPrompt The system prompt to prepend to conversations.
    explicit ChatSession(std::string systemPrompt = "");

    /// @brief Adds a user message to the conversation.
    /// @param content The user's message text.
    void addUserMessage(std::string content);

    /// @brief Adds an assistant message to the conversation.
    /// @param content The assistant's response text.
    void addAssistantMessage(std::string content);

    /// @brief Returns all messages in the conversation, including the system prompt.
    [[nodiscard]] auto messages() const -> const std::vector<ChatMessage>&;

    /// @brief Clears all messages except the system prompt.
    void clear();

    /// @brief Returns the number of messages (excluding system prompt).
    [[nodiscard]] auto messageCount() const -> size_t;

    /// @brief Returns the system prompt.
    [[nodiscard]] auto systemPrompt() const -> const std::string&;

    /// @brief Returns the content of the most recent user message, or an empty string.
    [[nodiscard]] auto lastUserMessage() const -> std::string;

  private:
    std::string _systemPrompt;
    std::vector<ChatMessage> _messages;

    void ensureSystemPrompt();
};

} // namespace mindcast
