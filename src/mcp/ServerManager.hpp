// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Async.hpp>
#include <core/Error.hpp>
#include <core/Signal.hpp>
#include <core/Types.hpp>
#include <mcp/ConfigStorage.hpp>
#include <mcp/Server.hpp>
#include <mcp/ServerConfig.hpp>
#include <mcp/ToolDiscovery.hpp>

#include <boost/asio/io_context.hpp>

#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mcpvisor
{

/// @brief Settings of a ServerManager.
struct ManagerOptions
{
    DiscoveryConfig discovery;
    ServerOptions server;
    bool autoStart = true; // start enabled auto-restarting servers when they are added
    bool autoSave = true;
    std::chrono::milliseconds autoSaveDelay { 1000 };
};

/// @brief Registry-wide counters.
struct ManagerStats
{
    size_t totalServers = 0;
    size_t runningServers = 0;
    size_t healthyServers = 0;
    size_t totalTools = 0;
    std::chrono::milliseconds uptime { 0 };
    std::optional<SystemTime> lastSave;
};

/// @brief Snapshot of one server for status listings.
struct ServerStatusReport
{
    ServerStatus status = ServerStatus::Stopped;
    ServerHealth health = ServerHealth::Unknown;
    ServerStats stats;
};

/// @brief Outcome of testServerConnection().
struct ConnectionTestResult
{
    bool success = false;
    std::string error;
    size_t toolCount = 0;
    std::string serverName;
    std::string serverVersion;
    std::chrono::milliseconds latency { 0 };
};

/// @brief Events raised by a ServerManager. Server events carry the server id first.
struct ManagerEvents
{
    Signal<const std::string&, const ServerConfig&> serverAdded;
    Signal<const std::string&> serverRemoved;
    Signal<const std::string&, ServerStatus, ServerStatus> serverStatusChanged; // id, new, previous
    Signal<const std::string&, ServerHealth, ServerHealth> serverHealthChanged; // id, new, previous
    Signal<const std::string&, const Error&> serverError;
    Signal<const std::string&, const RestartEvent&> serverRestart;
    Signal<const std::string&, const std::vector<ToolMetadata>&> toolsDiscovered;
    Signal<size_t> configurationSaved;  // number of servers
    Signal<size_t> configurationLoaded; // number of servers
    Signal<const Error&> error;
};

/// @brief Registry of supervised MCP servers.
///
/// Owns every Server and the shared ToolDiscovery, routes tool calls to servers and persists
/// the registry through a ConfigStorage. Bulk operations run per server concurrently and never
/// let one server's failure abort the others. Must be created with std::make_shared.
class ServerManager: public std::enable_shared_from_this<ServerManager>
{
  public:
    ServerManager(boost::asio::io_context& io, ManagerOptions options = {});
    ~ServerManager();

    ServerManager(const ServerManager&) = delete;
    ServerManager& operator=(const ServerManager&) = delete;

    /// @brief Validates and registers a server, starting it when it is enabled and auto-restarting.
    ///
    /// The configuration's id is replaced by @p id. A failed auto-start is logged; the server
    /// stays registered.
    /// @return Success, or a ConfigValidationError for a duplicate id or an invalid configuration.
    [[nodiscard]] auto addServer(std::string id, ServerConfig config) -> Task<VoidResult>;

    /// @brief Stops a server and drops it together with its cached tools.
    [[nodiscard]] auto removeServer(std::string id) -> Task<VoidResult>;

    /// @brief Merges @p update into a server's configuration, restarting it if it was running.
    [[nodiscard]] auto updateServerConfig(std::string id, ServerConfigUpdate update) -> Task<VoidResult>;

    /// @brief Starts a server. A running server is left alone; a failed one is reset first.
    [[nodiscard]] auto startServer(std::string id) -> Task<VoidResult>;
    [[nodiscard]] auto stopServer(std::string id) -> Task<VoidResult>;
    [[nodiscard]] auto restartServer(std::string id) -> Task<VoidResult>;

    /// @brief Starts every enabled server concurrently.
    /// @return The outcome per server.
    [[nodiscard]] auto startAllServers() -> Task<std::map<std::string, VoidResult>>;

    /// @brief Stops every server concurrently.
    [[nodiscard]] auto stopAllServers() -> Task<std::map<std::string, VoidResult>>;

    /// @brief Rediscovers the tools of every server.
    /// @return One entry per registered server; servers that are down or fail map to an empty list.
    [[nodiscard]] auto refreshAllTools() -> Task<std::map<std::string, std::vector<ToolMetadata>>>;

    /// @brief Rediscovers the tools of one running server.
    [[nodiscard]] auto refreshServerTools(std::string id) -> Task<Result<std::vector<ToolMetadata>>>;

    /// @brief Calls a tool on a running server.
    ///
    /// The parameters are normalized and checked against the tool's input schema first.
    /// Failures are annotated with the server and tool and are never retried.
    [[nodiscard]] auto executeToolCall(std::string serverId, std::string toolName, nlohmann::json params)
        -> Task<Result<ToolResult>>;

    /// @brief Starts a throwaway server for @p config outside the registry and reports how it went.
    ///
    /// The server is always stopped again.
    [[nodiscard]] auto testServerConnection(ServerConfig config) -> Task<ConnectionTestResult>;

    /// @brief Probes every running server once.
    /// @return Per server id whether it answered.
    [[nodiscard]] auto performHealthCheck() -> Task<std::map<std::string, bool>>;

    /// @brief Returns the unexpired cached tools of all servers.
    [[nodiscard]] auto getAllDiscoveredTools() const -> std::vector<ToolMetadata>;
    [[nodiscard]] auto getToolsFromServer(std::string_view id) const -> std::vector<ToolMetadata>;

    [[nodiscard]] auto getServerIds() const -> std::vector<std::string>;
    [[nodiscard]] auto getServer(std::string_view id) const -> std::shared_ptr<Server>;
    [[nodiscard]] auto hasServer(std::string_view id) const -> bool;
    [[nodiscard]] auto serverCount() const -> size_t { return _servers.size(); }
    [[nodiscard]] auto getServerConfig(std::string_view id) const -> std::optional<ServerConfig>;
    [[nodiscard]] auto getServerStats(std::string_view id) const -> std::optional<ServerStats>;
    [[nodiscard]] auto getServerStatuses() const -> std::map<std::string, ServerStatusReport>;
    [[nodiscard]] auto getManagerStats() const -> ManagerStats;

    /// @brief Sets the persistence port used by save/loadConfiguration and auto-save.
    void setStorage(std::shared_ptr<ConfigStorage> storage);

    /// @brief Enables or disables the debounced save after registry changes.
    void setAutoSave(bool enabled, std::chrono::milliseconds delay = std::chrono::milliseconds(1000));

    /// @brief Writes all server configurations to the storage now.
    [[nodiscard]] auto saveConfiguration() -> VoidResult;

    /// @brief Registers every persisted server configuration.
    ///
    /// Entries that fail to register are reported through the error event and skipped.
    /// @return The number of servers registered.
    [[nodiscard]] auto loadConfiguration() -> Task<Result<size_t>>;

    /// @brief Flushes a pending save, stops all servers and empties the registry.
    [[nodiscard]] auto shutdown() -> Task<void>;

    [[nodiscard]] auto discovery() const -> const std::shared_ptr<ToolDiscovery>& { return _discovery; }
    [[nodiscard]] auto events() -> ManagerEvents& { return _events; }

  private:
    struct ServerEntry
    {
        std::shared_ptr<Server> server;
        std::vector<Connection> connections;
    };

    boost::asio::io_context& _io;
    ManagerOptions _options;
    std::shared_ptr<ToolDiscovery> _discovery;
    std::map<std::string, ServerEntry, std::less<>> _servers;
    std::shared_ptr<ConfigStorage> _storage;
    std::shared_ptr<AsyncEvent> _autoSaveCancel;
    bool _savePending = false;
    bool _loading = false;
    std::chrono::steady_clock::time_point _startTime;
    std::optional<SystemTime> _lastSave;
    std::vector<Connection> _discoveryConnections;
    ManagerEvents _events;

    void registerServer(const std::shared_ptr<Server>& server);
    void scheduleAutoSave();
    [[nodiscard]] auto findServer(std::string_view id) const -> Result<std::shared_ptr<Server>>;
};

} // namespace mcpvisor
