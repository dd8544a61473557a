// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <string>
#include <string_view>

namespace mindcast
{

/// @brief The role of a message participant in a text-generation conversation.
enum class Role
{
    System,
    User,
    Assistant,
};

/// @brief Converts a Role enum to its string representation.
/// @param role The role to convert.
/// @return The string representation.
[[nodiscard]] constexpr auto roleToString(Role role) -> std::string_view
{
    switch (role)
    {
        case Role::System: return "system";
        case Role::User: return "user";
        case Role::Assistant: return "assistant";
    }
    return "unknown";
}

/// @brief Parses a string to a Role enum value.
/// @param str The string to parse.
/// @return The corresponding Role, or Role::User if unknown.
[[nodiscard]] constexpr auto roleFromString(std::string_view str) -> Role
{
    if (str == "system")
        return Role::System;
    if (str == "assistant")
        return Role::Assistant;
    return Role::User;
}

/// @brief A single message in a text-generation conversation.
struct ChatMessage
{
    Role role = Role::User;
    std::string content;
};

} // namespace mindcast
