// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <mcp/ServerConfig.hpp>

#include <vector>

namespace mcpvisor
{

/// @brief Persistence port for the server registry.
class ConfigStorage
{
  public:
    virtual ~ConfigStorage() = default;

    /// @brief Replaces the persisted server configurations.
    [[nodiscard]] virtual auto save(const std::vector<ServerConfig>& configs) -> VoidResult = 0;

    /// @brief Reads the persisted server configurations; none persisted yields an empty list.
    [[nodiscard]] virtual auto load() -> Result<std::vector<ServerConfig>> = 0;
};

} // namespace mcpvisor
