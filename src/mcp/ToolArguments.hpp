// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <nlohmann/json.hpp>

#include <string_view>

namespace mcpvisor
{

/// @brief Brings tool-call parameters into the shape servers expect.
///
/// Null becomes an empty object. Parameters wrapped in a `kwargs` object (as some agent
/// frameworks send them) are unwrapped.
/// @return The arguments object, or InvalidArgument when the parameters are not a JSON object.
[[nodiscard]] auto normalizeToolArguments(nlohmann::json params) -> Result<nlohmann::json>;

/// @brief Checks arguments against a tool's input schema.
///
/// Verifies the schema's `required` properties and the primitive JSON `type` of every
/// declared property that is present. Other schema keywords are not interpreted.
/// @return Success, or InvalidArgument listing every violation.
[[nodiscard]] auto validateToolArguments(std::string_view toolName,
                                         const nlohmann::json& schema,
                                         const nlohmann::json& arguments) -> VoidResult;

} // namespace mcpvisor
