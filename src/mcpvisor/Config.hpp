// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <mcp/ConfigStorage.hpp>
#include <mcp/ServerConfig.hpp>
#include <mcp/ServerManager.hpp>
#include <mcp/ToolDiscovery.hpp>

#include <chrono>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace mcpvisor
{

/// @brief Top-level application configuration.
struct AppConfig
{
    std::string logLevel = "info";
    std::chrono::milliseconds requestTimeout { 30000 };

    /// @brief Directories prepended to PATH of every spawned server.
    std::vector<std::string> customPaths;

    bool autoSave = true;
    std::chrono::milliseconds autoSaveDelay { 1000 };
    DiscoveryConfig discovery;
    std::map<std::string, ServerConfig> mcpServers;
};

/// @brief Loads the application configuration from the default config path.
///
/// A missing file yields the defaults.
/// @return The loaded configuration or an error.
[[nodiscard]] auto loadConfig() -> Result<AppConfig>;

/// @brief Loads the application configuration from a specific file path.
/// @param path The path to the config file.
/// @return The loaded configuration or an error.
[[nodiscard]] auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>;

/// @brief Parses a configuration document.
[[nodiscard]] auto appConfigFromJson(const nlohmann::json& root) -> Result<AppConfig>;

/// @brief Saves the application configuration to a file.
/// @param path The path to the config file.
/// @param config The configuration to save.
/// @return Success or an error.
[[nodiscard]] auto saveConfigToFile(std::string_view path, const AppConfig& config) -> VoidResult;

/// @brief Returns the default config directory path for the current platform.
///
/// On Linux: $XDG_CONFIG_HOME/mcpvisor or ~/.config/mcpvisor
/// On macOS: ~/Library/Application Support/mcpvisor
[[nodiscard]] auto defaultConfigDir() -> std::string;

/// @brief Returns the default config file path for the current platform.
[[nodiscard]] auto defaultConfigPath() -> std::string;

/// @brief Derives the manager settings from the application configuration.
[[nodiscard]] auto makeManagerOptions(const AppConfig& config) -> ManagerOptions;

/// @brief Persists the server registry in the "mcpServers" section of a config file.
///
/// Saving rewrites only that section; every other section of the file is kept as it is.
class JsonFileConfigStorage: public ConfigStorage
{
  public:
    explicit JsonFileConfigStorage(std::string path);

    [[nodiscard]] auto save(const std::vector<ServerConfig>& configs) -> VoidResult override;
    [[nodiscard]] auto load() -> Result<std::vector<ServerConfig>> override;

    [[nodiscard]] auto path() const noexcept -> const std::string& { return _path; }

  private:
    std::string _path;
};

} // namespace mcpvisor
