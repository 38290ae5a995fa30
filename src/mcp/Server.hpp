// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Async.hpp>
#include <core/Error.hpp>
#include <core/Signal.hpp>
#include <core/Types.hpp>
#include <mcp/McpClient.hpp>
#include <mcp/ServerConfig.hpp>
#include <mcp/Transport.hpp>

#include <boost/asio/io_context.hpp>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mcpvisor
{

/// @brief Lifecycle state of a supervised server.
enum class ServerStatus
{
    Stopped,
    Starting,
    Running,
    Stopping,
    Crashed,
    Failed,
    Restarting,
};

[[nodiscard]] constexpr auto serverStatusName(ServerStatus status) -> std::string_view
{
    switch (status)
    {
        case ServerStatus::Stopped: return "stopped";
        case ServerStatus::Starting: return "starting";
        case ServerStatus::Running: return "running";
        case ServerStatus::Stopping: return "stopping";
        case ServerStatus::Crashed: return "crashed";
        case ServerStatus::Failed: return "failed";
        case ServerStatus::Restarting: return "restarting";
    }
    return "stopped";
}

/// @brief Liveness of a server, independent of its status.
enum class ServerHealth
{
    Healthy,
    Unhealthy,
    Unknown,
};

[[nodiscard]] constexpr auto serverHealthName(ServerHealth health) -> std::string_view
{
    switch (health)
    {
        case ServerHealth::Healthy: return "healthy";
        case ServerHealth::Unhealthy: return "unhealthy";
        case ServerHealth::Unknown: return "unknown";
    }
    return "unknown";
}

using SystemTime = std::chrono::system_clock::time_point;

/// @brief Runtime counters of a server. Counters only grow, except restartCount.
struct ServerStats
{
    std::optional<int> pid;
    std::optional<SystemTime> startTime;
    std::chrono::milliseconds uptime { 0 }; // derived from startTime while running
    int restartCount = 0;                   // reset by a start that completes
    std::optional<SystemTime> lastRestart;
    size_t toolCount = 0;
    std::optional<SystemTime> lastToolDiscovery;
    uint64_t toolCallCount = 0;
    std::optional<SystemTime> lastToolCall;
    uint64_t errorCount = 0;
    std::optional<SystemTime> lastErrorTime;
    std::string lastError;
};

/// @brief Announces an automatic restart attempt.
struct RestartEvent
{
    int attempt = 0;
    int maxAttempts = 0;
    std::chrono::milliseconds delay { 0 };
};

/// @brief Events raised by a Server.
struct ServerEvents
{
    Signal<ServerStatus, ServerStatus> statusChanged; // new, previous
    Signal<ServerHealth, ServerHealth> healthChanged; // new, previous
    Signal<const Error&> error;
    Signal<const RestartEvent&> restart;
    Signal<const std::vector<ToolDefinition>&> toolsDiscovered;
    Signal<> toolsChanged;
    Signal<std::string_view> diagnostic;
};

/// @brief Creates the transport for a server configuration.
using TransportFactory = std::function<Result<std::shared_ptr<Transport>>(
    boost::asio::io_context& io, const ServerConfig& config, const std::vector<std::string>& customPaths)>;

/// @brief Builds a StdioTransport or SocketTransport, depending on the configured kind.
[[nodiscard]] auto createTransport(boost::asio::io_context& io,
                                   const ServerConfig& config,
                                   const std::vector<std::string>& customPaths) -> Result<std::shared_ptr<Transport>>;

/// @brief Engine-wide settings shared by all servers.
struct ServerOptions
{
    TransportFactory transportFactory = createTransport;
    std::vector<std::string> customPaths; // prepended to PATH of spawned servers
    std::chrono::milliseconds restartBaseDelay { 1000 };
    std::chrono::milliseconds restartMaxDelay { 30000 };
    std::chrono::milliseconds requestTimeout { 30000 };
    std::chrono::milliseconds restartPause { 1000 }; // between stop and start in restart()
};

/// @brief Computes the backoff before restart attempt @p restartCount.
/// @return min(base * 2^restartCount, cap).
[[nodiscard]] constexpr auto restartDelay(int restartCount,
                                          std::chrono::milliseconds base = std::chrono::milliseconds(1000),
                                          std::chrono::milliseconds cap = std::chrono::milliseconds(30000))
    -> std::chrono::milliseconds
{
    auto delay = base;
    for (int i = 0; i < restartCount && delay < cap; ++i)
        delay *= 2;
    return std::min(delay, cap);
}

/// @brief Supervises one MCP server: its client connection, health probing and restarts.
///
/// The server owns its McpClient and the client's transport. Status changes happen only
/// inside the server and are announced through events(). Must be created via create().
class Server: public std::enable_shared_from_this<Server>
{
  public:
    /// @brief Validates @p config and creates a stopped server for it.
    [[nodiscard]] static auto create(boost::asio::io_context& io, ServerConfig config, ServerOptions options = {})
        -> Result<std::shared_ptr<Server>>;

    Server(boost::asio::io_context& io, ServerConfig config, ServerOptions options);
    ~Server();

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    /// @brief Connects to the server and discovers its tools.
    ///
    /// Valid from stopped and crashed, and only for an enabled configuration. On failure the
    /// partially created connection is torn down and the server is left failed.
    [[nodiscard]] auto start() -> Task<VoidResult>;

    /// @brief Disconnects gracefully, forcing the connection closed after the shutdown timeout.
    ///
    /// Cancels pending health probes and restarts. Always ends in stopped.
    [[nodiscard]] auto stop() -> Task<void>;

    /// @brief Stops, pauses briefly, then starts again.
    [[nodiscard]] auto restart() -> Task<VoidResult>;

    /// @brief Merges @p update into the configuration.
    ///
    /// A running server is stopped first and started again afterwards when it is still enabled.
    /// @return Success, or a ConfigValidationError leaving the configuration untouched.
    [[nodiscard]] auto updateConfig(ServerConfigUpdate update) -> Task<VoidResult>;

    /// @brief Lists the tools of a running server.
    [[nodiscard]] auto listTools(std::optional<std::chrono::milliseconds> timeout = std::nullopt)
        -> Task<Result<std::vector<ToolDefinition>>>;

    /// @brief Calls a tool on a running server.
    [[nodiscard]] auto callTool(std::string name, nlohmann::json arguments) -> Task<Result<ToolResult>>;

    /// @brief Probes the server once without touching its health state.
    /// @return True if a running server answered a tools/list within the health-check timeout.
    [[nodiscard]] auto performHealthCheck() -> Task<bool>;

    /// @brief Cancels all timers and closes the connection immediately, without events.
    void shutdown();

    [[nodiscard]] auto status() const noexcept -> ServerStatus { return _status; }
    [[nodiscard]] auto health() const noexcept -> ServerHealth { return _health; }
    [[nodiscard]] auto stats() const -> ServerStats;
    [[nodiscard]] auto config() const noexcept -> const ServerConfig& { return _config; }
    [[nodiscard]] auto id() const noexcept -> const std::string& { return _config.id; }
    [[nodiscard]] auto name() const -> const std::string& { return _config.displayName(); }
    [[nodiscard]] auto isRunning() const noexcept -> bool { return _status == ServerStatus::Running; }
    [[nodiscard]] auto isHealthy() const noexcept -> bool { return _health == ServerHealth::Healthy; }

    /// @brief Returns the current client, or nullptr when not connected.
    [[nodiscard]] auto client() const noexcept -> const std::shared_ptr<McpClient>& { return _client; }

    /// @brief Returns an id that changes whenever the server is started or stopped.
    [[nodiscard]] auto session() const noexcept -> uint64_t { return _session; }

    [[nodiscard]] auto events() -> ServerEvents& { return _events; }

  private:
    boost::asio::io_context& _io;
    ServerConfig _config;
    ServerOptions _options;
    ServerStatus _status = ServerStatus::Stopped;
    ServerHealth _health = ServerHealth::Unknown;
    ServerStats _stats;
    std::shared_ptr<McpClient> _client;
    std::vector<Connection> _clientConnections;
    uint64_t _session = 0;
    std::shared_ptr<AsyncEvent> _cancel; // set when the current session ends
    int _consecutiveFailures = 0;
    ServerEvents _events;

    auto beginSession() -> uint64_t;
    void setStatus(ServerStatus status);
    void setHealth(ServerHealth health);
    void recordError(const Error& error);
    void wireClient(const std::shared_ptr<McpClient>& client, uint64_t session);
    void retireClient();
    [[nodiscard]] auto failStartup(Error error, bool automatic) -> VoidResult;
    void startHealthLoop(uint64_t session);
    [[nodiscard]] auto checkHealth() -> Task<void>;
    void handleConnectionLoss(const Error& error);
    void handleHealthFailure();
    void scheduleRestartOrGiveUp();
    void scheduleRestart();
};

} // namespace mcpvisor
