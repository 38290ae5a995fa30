// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace mcpvisor
{

/// @brief A tool exactly as a server announces it in a `tools/list` result.
struct ToolDefinition
{
    std::string name;
    std::string description;
    nlohmann::json inputSchema;
};

/// @brief Converts a raw `tools/list` entry into a ToolDefinition.
///
/// Missing fields are defaulted: empty description and an empty object schema.
[[nodiscard]] inline auto toolDefinitionFromJson(const nlohmann::json& toolJson) -> ToolDefinition
{
    auto tool = ToolDefinition {};
    if (!toolJson.is_object())
        return tool;

    if (auto const it = toolJson.find("name"); it != toolJson.end() && it->is_string())
        tool.name = it->get<std::string>();
    if (auto const it = toolJson.find("description"); it != toolJson.end() && it->is_string())
        tool.description = it->get<std::string>();
    if (auto const it = toolJson.find("inputSchema"); it != toolJson.end())
        tool.inputSchema = *it;
    else
        tool.inputSchema = nlohmann::json::object();
    return tool;
}

/// @brief Converts a ToolDefinition back into its wire representation.
[[nodiscard]] inline auto toJson(const ToolDefinition& tool) -> nlohmann::json
{
    return nlohmann::json {
        { "name", tool.name },
        { "description", tool.description },
        { "inputSchema", tool.inputSchema },
    };
}

/// @brief The result of executing a tool call on a server.
struct ToolResult
{
    std::string content;    // text items of the result, joined by newlines
    nlohmann::json raw;     // the untouched `tools/call` result object
    bool isError = false;   // the server flagged the call as failed (`isError: true`)
};

} // namespace mcpvisor
