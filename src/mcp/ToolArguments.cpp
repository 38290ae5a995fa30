// SPDX-License-Identifier: Apache-2.0
#include "ToolArguments.hpp"

#include <cmath>
#include <format>
#include <string>
#include <vector>

namespace mcpvisor
{

namespace
{
    auto matchesType(const nlohmann::json& value, std::string_view type) -> bool
    {
        if (type == "string")
            return value.is_string();
        if (type == "number")
            return value.is_number();
        if (type == "integer")
        {
            if (value.is_number_integer())
                return true;
            if (!value.is_number_float())
                return false;
            auto const number = value.get<double>();
            return std::isfinite(number) && std::floor(number) == number;
        }
        if (type == "boolean")
            return value.is_boolean();
        if (type == "object")
            return value.is_object();
        if (type == "array")
            return value.is_array();
        if (type == "null")
            return value.is_null();
        return true; // not a primitive type we check
    }

    auto matchesDeclaredType(const nlohmann::json& value, const nlohmann::json& declared) -> bool
    {
        if (declared.is_string())
            return matchesType(value, declared.get<std::string>());

        if (!declared.is_array())
            return true;

        for (const auto& type: declared)
        {
            if (!type.is_string() || matchesType(value, type.get<std::string>()))
                return true;
        }
        return declared.empty();
    }
} // namespace

auto normalizeToolArguments(nlohmann::json params) -> Result<nlohmann::json>
{
    if (params.is_null())
        return nlohmann::json::object();

    if (!params.is_object())
        return makeError(ErrorCode::InvalidArgument,
                         std::format("Tool parameters must be a JSON object, got {}", params.type_name()));

    if (auto const it = params.find("kwargs"); it != params.end() && it->is_object())
        return nlohmann::json(*it);

    return params;
}

auto validateToolArguments(std::string_view toolName,
                           const nlohmann::json& schema,
                           const nlohmann::json& arguments) -> VoidResult
{
    if (!arguments.is_object())
        return makeError(ErrorCode::InvalidArgument,
                         std::format("Arguments for tool '{}' must be a JSON object", toolName));

    if (!schema.is_object())
        return {};

    auto problems = std::vector<std::string> {};

    if (auto const required = schema.find("required"); required != schema.end() && required->is_array())
    {
        for (const auto& name: *required)
        {
            if (name.is_string() && !arguments.contains(name.get<std::string>()))
                problems.push_back(std::format("missing required parameter '{}'", name.get<std::string>()));
        }
    }

    if (auto const properties = schema.find("properties"); properties != schema.end() && properties->is_object())
    {
        for (const auto& [name, value]: arguments.items())
        {
            auto const property = properties->find(name);
            if (property == properties->end() || !property->is_object())
                continue;

            auto const declared = property->find("type");
            if (declared != property->end() && !matchesDeclaredType(value, *declared))
                problems.push_back(
                    std::format("parameter '{}' must be of type {}, got {}", name, declared->dump(), value.type_name()));
        }
    }

    if (problems.empty())
        return {};

    auto message = std::format("Invalid arguments for tool '{}'", toolName);
    for (size_t i = 0; i < problems.size(); ++i)
        message += std::format("{} {}", i == 0 ? ":" : ";", problems[i]);
    return makeError(ErrorCode::InvalidArgument, std::move(message));
}

} // namespace mcpvisor
