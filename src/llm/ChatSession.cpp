// SPDX-License-Identifier: Apache-2.0
#include "ChatSession.hpp"

#include <utility>

namespace mindcast
{

ChatSession::ChatSession(std::string systemPrompt): _systemPrompt(std::move(systemPrompt))
{
    ensureSystemPrompt();
}

void ChatSession::addUserMessage(std::string content)
{
    _messages.push_back(ChatMessage {
        .role = Role::User,
        .content = std::move(content),
    });
}

void ChatSession::addAssistantMessage(std::string content)
{
    _messages.push_back(ChatMessage {
        .role = Role::Assistant,
        .content = std::move(content),
    });
}

auto ChatSession::messages() const -> const std::vector<ChatMessage>&
{
    return _messages;
}

void ChatSession::clear()
{
    _messages.clear();
    ensureSystemPrompt();
}

auto ChatSession::messageCount() const -> size_t
{
    if (_systemPrompt.empty())
        return _messages.size();
    return _messages.empty() ? 0 : _messages.size() - 1;
}

auto ChatSession::systemPrompt() const -> const std::string&
{
    return _systemPrompt;
}

auto ChatSession::lastUserMessage() const -> std::string
{
    for (auto it = _messages.rbegin(); it != _messages.rend(); ++it)
    {
        if (it->role == Role::User)
            return it->content;
    }
    return {};
}

void ChatSession::ensureSystemPrompt()
{
    if (!_systemPrompt.empty())
    {
        _messages.insert(_messages.begin(),
                         ChatMessage {
                             .role = Role::System,
                             .content = _systemPrompt,
                         });
    }
}

} // namespace mindcast
