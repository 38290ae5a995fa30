// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "Error.hpp"

namespace mcpvisor::json
{

/// @brief Parses a JSON string, returning a Result.
/// @param input The JSON string to parse.
/// @return The parsed JSON value or a ProtocolError.
[[nodiscard]] inline auto parse(std::string_view input) -> Result<nlohmann::json>
{
    try
    {
        return nlohmann::json::parse(input);
    }
    catch (const nlohmann::json::parse_error& e)
    {
        return makeError(ErrorCode::ProtocolError, std::format("JSON parse error: {}", e.what()));
    }
}

/// @brief Extracts a required string field from a JSON object.
[[nodiscard]] inline auto getString(const nlohmann::json& obj, std::string_view key) -> Result<std::string>
{
    auto const it = obj.find(std::string(key));
    if (it == obj.end() || !it->is_string())
        return makeError(ErrorCode::ProtocolError, std::format("Missing or invalid string field: {}", key));
    return it->get<std::string>();
}

/// @brief Extracts an optional string field from a JSON object.
[[nodiscard]] inline auto getStringOr(const nlohmann::json& obj,
                                      std::string_view key,
                                      std::string_view defaultValue) -> std::string
{
    if (!obj.is_object())
        return std::string(defaultValue);
    auto const it = obj.find(std::string(key));
    if (it != obj.end() && it->is_string())
        return it->get<std::string>();
    return std::string(defaultValue);
}

/// @brief Extracts an optional integer field from a JSON object.
[[nodiscard]] inline auto getIntOr(const nlohmann::json& obj, std::string_view key, int defaultValue) -> int
{
    if (!obj.is_object())
        return defaultValue;
    auto const it = obj.find(std::string(key));
    if (it != obj.end() && it->is_number_integer())
        return it->get<int>();
    return defaultValue;
}

/// @brief Extracts an optional boolean field from a JSON object.
[[nodiscard]] inline auto getBoolOr(const nlohmann::json& obj, std::string_view key, bool defaultValue)
    -> bool
{
    if (!obj.is_object())
        return defaultValue;
    auto const it = obj.find(std::string(key));
    if (it != obj.end() && it->is_boolean())
        return it->get<bool>();
    return defaultValue;
}

/// @brief Extracts an optional millisecond duration stored as an integer.
[[nodiscard]] inline auto getMillisOr(const nlohmann::json& obj,
                                      std::string_view key,
                                      std::chrono::milliseconds defaultValue) -> std::chrono::milliseconds
{
    if (!obj.is_object())
        return defaultValue;
    auto const it = obj.find(std::string(key));
    if (it != obj.end() && it->is_number_integer())
        return std::chrono::milliseconds(it->get<int64_t>());
    return defaultValue;
}

/// @brief Extracts an array of strings, skipping non-string elements.
[[nodiscard]] inline auto getStringArray(const nlohmann::json& obj, std::string_view key)
    -> std::vector<std::string>
{
    auto values = std::vector<std::string> {};
    if (!obj.is_object())
        return values;
    auto const it = obj.find(std::string(key));
    if (it == obj.end() || !it->is_array())
        return values;
    for (const auto& item: *it)
    {
        if (item.is_string())
            values.push_back(item.get<std::string>());
    }
    return values;
}

/// @brief Extracts an object of string values, skipping non-string members.
[[nodiscard]] inline auto getStringMap(const nlohmann::json& obj, std::string_view key)
    -> std::map<std::string, std::string>
{
    auto values = std::map<std::string, std::string> {};
    if (!obj.is_object())
        return values;
    auto const it = obj.find(std::string(key));
    if (it == obj.end() || !it->is_object())
        return values;
    for (const auto& [name, value]: it->items())
    {
        if (value.is_string())
            values[name] = value.get<std::string>();
    }
    return values;
}

} // namespace mcpvisor::json
