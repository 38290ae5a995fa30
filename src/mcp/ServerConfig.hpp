// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mcpvisor
{

/// @brief How the engine talks to a server.
enum class TransportKind
{
    Stdio, ///< Spawned subprocess, newline-delimited JSON over stdin/stdout.
    Sse,   ///< Persistent socket connection to a URL.
};

[[nodiscard]] constexpr auto transportKindName(TransportKind kind) -> std::string_view
{
    switch (kind)
    {
        case TransportKind::Stdio: return "stdio";
        case TransportKind::Sse: return "sse";
    }
    return "stdio";
}

/// @brief Parses "stdio", "sse" (or "websocket") into a TransportKind.
[[nodiscard]] constexpr auto transportKindFromString(std::string_view name) -> std::optional<TransportKind>
{
    if (name == "stdio")
        return TransportKind::Stdio;
    if (name == "sse" || name == "websocket")
        return TransportKind::Sse;
    return std::nullopt;
}

/// @brief Periodic liveness probe settings.
struct HealthCheckConfig
{
    std::chrono::milliseconds interval { 30000 };
    std::chrono::milliseconds timeout { 5000 };
    int failureThreshold = 3; // consecutive failed probes before the server counts as unhealthy
};

/// @brief Configuration of one MCP server.
///
/// Member initializers are the configuration defaults. A configuration is validated as a whole
/// with validateServerConfig() before it is used.
struct ServerConfig
{
    std::string id; ///< Unique key, immutable once registered.
    std::string name;
    std::string description;

    TransportKind transport = TransportKind::Stdio;
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;
    std::string cwd;
    std::string url;

    bool autoRestart = true;
    int maxRestarts = 3;
    std::chrono::milliseconds startupTimeout { 10000 };
    std::chrono::milliseconds shutdownTimeout { 5000 };
    std::optional<HealthCheckConfig> healthCheck = HealthCheckConfig {}; ///< nullopt disables probing.

    std::vector<std::string> tags;
    bool enabled = true;
    std::string version;

    /// @brief Returns the name, or the id when no name is set.
    [[nodiscard]] auto displayName() const -> const std::string& { return name.empty() ? id : name; }
};

/// @brief A partial configuration; every engaged field replaces the corresponding field.
///
/// The id is never part of an update.
struct ServerConfigUpdate
{
    std::optional<std::string> name;
    std::optional<std::string> description;
    std::optional<TransportKind> transport;
    std::optional<std::string> command;
    std::optional<std::vector<std::string>> args;
    std::optional<std::map<std::string, std::string>> env;
    std::optional<std::string> cwd;
    std::optional<std::string> url;
    std::optional<bool> autoRestart;
    std::optional<int> maxRestarts;
    std::optional<std::chrono::milliseconds> startupTimeout;
    std::optional<std::chrono::milliseconds> shutdownTimeout;
    std::optional<std::optional<HealthCheckConfig>> healthCheck;
    std::optional<std::vector<std::string>> tags;
    std::optional<bool> enabled;
    std::optional<std::string> version;
};

/// @brief Merges an update into a configuration; the result still needs validation.
[[nodiscard]] auto applyUpdate(ServerConfig config, const ServerConfigUpdate& update) -> ServerConfig;

/// @brief Validates a configuration.
/// @return Every violated rule as a message; empty when the configuration is valid.
[[nodiscard]] auto validateServerConfig(const ServerConfig& config) -> std::vector<std::string>;

/// @brief Validates a configuration into a Result.
/// @return Success, or a ConfigValidationError listing every violated rule.
[[nodiscard]] auto checkServerConfig(const ServerConfig& config) -> VoidResult;

/// @brief Creates a stdio configuration from the defaults.
[[nodiscard]] auto makeStdioServerConfig(std::string id, std::string command, std::vector<std::string> args = {})
    -> ServerConfig;

/// @brief Creates a socket configuration from the defaults.
[[nodiscard]] auto makeSocketServerConfig(std::string id, std::string url) -> ServerConfig;

/// @brief Serializes a configuration in the persisted JSON layout.
[[nodiscard]] auto toJson(const ServerConfig& config) -> nlohmann::json;

/// @brief Reads a configuration from its persisted JSON layout.
///
/// Absent fields take their defaults; `"healthCheck": null` (or false) disables probing.
/// @param fallbackId Used when the object carries no "id" (e.g. when keyed by id in a map).
/// @return The configuration (not yet validated), or a ConfigError for ill-typed fields.
[[nodiscard]] auto serverConfigFromJson(const nlohmann::json& value, std::string_view fallbackId = {})
    -> Result<ServerConfig>;

/// @brief A predefined configuration for a commonly used server.
struct ServerTemplate
{
    std::string name;
    std::string description;
    std::string command;
    std::vector<std::string> args;
    std::vector<std::string> tags;
};

/// @brief Returns the built-in templates keyed by template id.
[[nodiscard]] auto serverTemplates() -> const std::map<std::string, ServerTemplate>&;

/// @brief Creates a configuration with the given id from a built-in template.
/// @return The configuration, or an InvalidArgument error for an unknown template.
[[nodiscard]] auto makeServerConfigFromTemplate(std::string_view templateId, std::string id) -> Result<ServerConfig>;

} // namespace mcpvisor
