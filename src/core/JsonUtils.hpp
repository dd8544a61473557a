// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <nlohmann/json.hpp>

#include <format>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "Error.hpp"

namespace mindcast::json
{

/// @brief Parses a JSON string, returning a Result.
/// @param input The JSON string to parse.
/// @param code The error code to report on a parse failure.
/// @return The parsed JSON object or an Error.
[[nodiscard]] inline auto parse(std::string_view input, ErrorCode code = ErrorCode::MalformedResponse)
    -> Result<nlohmann::json>
{
    try
    {
        return nlohmann::json::parse(input);
    }
    catch (const nlohmann::json::parse_error& e)
    {
        return makeError(code, std::format("JSON parse error: {}", e.what()));
    }
}

/// @brief Extracts a required string field from a JSON object.
/// @param obj The JSON object.
/// @param key The field name.
/// @return The string value or an Error.
[[nodiscard]] inline auto getString(const nlohmann::json& obj, std::string_view key) -> Result<std::string>
{
    auto keyStr = std::string(key);
    if (!obj.is_object() || !obj.contains(keyStr) || !obj[keyStr].is_string())
        return makeError(ErrorCode::MalformedResponse, std::format("Missing or invalid string field: {}", key));
    return obj[keyStr].get<std::string>();
}

/// @brief Extracts an optional string field from a JSON object.
/// @param obj The JSON object.
/// @param key The field name.
/// @param defaultValue The value to return if the field is missing.
/// @return The string value or the default.
[[nodiscard]] inline auto getStringOr(const nlohmann::json& obj,
                                      std::string_view key,
                                      std::string_view defaultValue) -> std::string
{
    auto keyStr = std::string(key);
    if (obj.is_object() && obj.contains(keyStr) && obj[keyStr].is_string())
        return obj[keyStr].get<std::string>();
    return std::string(defaultValue);
}

/// @brief Extracts a string field that may be absent or null.
[[nodiscard]] inline auto getOptionalString(const nlohmann::json& obj, std::string_view key)
    -> std::optional<std::string>
{
    auto keyStr = std::string(key);
    if (obj.is_object() && obj.contains(keyStr) && obj[keyStr].is_string())
        return obj[keyStr].get<std::string>();
    return std::nullopt;
}

/// @brief Extracts an optional integer field from a JSON object.
/// @param obj The JSON object.
/// @param key The field name.
/// @param defaultValue The value to return if the field is missing.
/// @return The integer value or the default.
[[nodiscard]] inline auto getIntOr(const nlohmann::json& obj, std::string_view key, int defaultValue) -> int
{
    auto keyStr = std::string(key);
    if (obj.is_object() && obj.contains(keyStr) && obj[keyStr].is_number_integer())
        return obj[keyStr].get<int>();
    return defaultValue;
}

/// @brief Extracts an optional floating point field from a JSON object.
/// @param obj The JSON object.
/// @param key The field name.
/// @param defaultValue The value to return if the field is missing.
/// @return The value or the default.
[[nodiscard]] inline auto getDoubleOr(const nlohmann::json& obj, std::string_view key, double defaultValue)
    -> double
{
    auto keyStr = std::string(key);
    if (obj.is_object() && obj.contains(keyStr) && obj[keyStr].is_number())
        return obj[keyStr].get<double>();
    return defaultValue;
}

/// @brief Extracts an optional float field from a JSON object.
[[nodiscard]] inline auto getFloatOr(const nlohmann::json& obj, std::string_view key, float defaultValue)
    -> float
{
    return static_cast<float>(getDoubleOr(obj, key, defaultValue));
}

/// @brief Extracts an optional boolean field from a JSON object.
/// @param obj The JSON object.
/// @param key The field name.
/// @param defaultValue The value to return if the field is missing.
/// @return The boolean value or the default.
[[nodiscard]] inline auto getBoolOr(const nlohmann::json& obj, std::string_view key, bool defaultValue)
    -> bool
{
    auto keyStr = std::string(key);
    if (obj.is_object() && obj.contains(keyStr) && obj[keyStr].is_boolean())
        return obj[keyStr].get<bool>();
    return defaultValue;
}

/// @brief Extracts an array of strings, skipping non-string entries.
/// @param obj The JSON object.
/// @param key The field name.
/// @param defaultValue The value to return if the field is missing or not an array.
[[nodiscard]] inline auto getStringArrayOr(const nlohmann::json& obj,
                                           std::string_view key,
                                           std::vector<std::string> defaultValue) -> std::vector<std::string>
{
    auto keyStr = std::string(key);
    if (!obj.is_object() || !obj.contains(keyStr) || !obj[keyStr].is_array())
        return defaultValue;

    auto values = std::vector<std::string> {};
    for (const auto& item: obj[keyStr])
    {
        if (item.is_string())
            values.push_back(item.get<std::string>());
    }
    return values;
}

} // namespace mindcast::json
