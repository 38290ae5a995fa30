// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Async.hpp>
#include <core/Error.hpp>
#include <core/Signal.hpp>
#include <core/Types.hpp>
#include <mcp/Transport.hpp>

#include <boost/asio/io_context.hpp>

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace mcpvisor
{

/// @brief Identity and timing parameters of an McpClient.
struct ClientOptions
{
    std::string clientName = "mcpvisor";
    std::string clientVersion = "0.1.0";
    std::string protocolVersion = "2024-11-05";
    std::chrono::milliseconds requestTimeout { 30000 };
};

/// @brief MCP server capabilities reported during initialization.
struct McpServerCapabilities
{
    bool hasTools = false;
    bool hasResources = false;
    bool hasPrompts = false;
    std::string serverName;
    std::string serverVersion;
    std::string protocolVersion;
};

/// @brief Events raised by an McpClient.
struct ClientEvents
{
    Signal<const McpServerCapabilities&> initialized;
    Signal<const std::string&, const nlohmann::json&> notification; // method, params
    Signal<> toolsChanged;
    Signal<const Error&> error;
    Signal<const DisconnectInfo&> disconnected;
    Signal<std::string_view> diagnostic;
};

/// @brief Client for the Model Context Protocol (MCP).
///
/// Handles the MCP lifecycle on top of one transport: the initialize handshake, request/response
/// correlation by id with per-request timeouts, notifications in both directions, and the
/// tools/list and tools/call methods. All members must be used from the io_context's thread.
class McpClient
{
  public:
    /// @brief Constructs an McpClient with the given transport.
    /// @param io The event loop that drives the transport and all timers.
    /// @param transport The transport to use for communication.
    /// @param options Client identity and default request timeout.
    McpClient(boost::asio::io_context& io, std::shared_ptr<Transport> transport, ClientOptions options = {});
    ~McpClient();

    McpClient(const McpClient&) = delete;
    McpClient& operator=(const McpClient&) = delete;

    /// @brief Opens the transport and performs the MCP initialize handshake.
    ///
    /// On handshake failure the transport is disconnected again.
    /// @return The server's capabilities or an error.
    [[nodiscard]] auto connect() -> Task<Result<McpServerCapabilities>>;

    /// @brief Rejects all pending requests and disconnects the transport gracefully.
    [[nodiscard]] auto disconnect() -> Task<void>;

    /// @brief Rejects all pending requests and closes the transport immediately.
    void close();

    /// @brief Sends a request and waits for its response.
    ///
    /// A JSON-RPC error response is reported as ProtocolError, an expired deadline as
    /// RequestTimeoutError and a lost connection as ConnectionError.
    /// @param method The method name.
    /// @param params The parameters, or null for none.
    /// @param timeout Overrides the default request timeout for this call.
    /// @return The `result` member of the response.
    [[nodiscard]] auto request(std::string method,
                               nlohmann::json params = nullptr,
                               std::optional<std::chrono::milliseconds> timeout = std::nullopt)
        -> Task<Result<nlohmann::json>>;

    /// @brief Sends a notification (no id, no response).
    [[nodiscard]] auto notify(std::string method, nlohmann::json params = nullptr) -> Task<VoidResult>;

    /// @brief Lists available tools from the server.
    /// @return A vector of tool definitions or an error.
    [[nodiscard]] auto listTools(std::optional<std::chrono::milliseconds> timeout = std::nullopt)
        -> Task<Result<std::vector<ToolDefinition>>>;

    /// @brief Calls a tool on the server.
    ///
    /// A JSON-RPC error is returned as ToolExecutionError. A result flagged with `isError`
    /// is returned as a value with ToolResult::isError set.
    /// @param name The tool name.
    /// @param arguments The tool arguments.
    /// @return The tool result or an error.
    [[nodiscard]] auto callTool(std::string name,
                                nlohmann::json arguments,
                                std::optional<std::chrono::milliseconds> timeout = std::nullopt)
        -> Task<Result<ToolResult>>;

    /// @brief Returns the server capabilities (valid after connect).
    [[nodiscard]] auto capabilities() const -> const McpServerCapabilities&;

    /// @brief Returns true if the handshake completed and the connection is still up.
    [[nodiscard]] auto isInitialized() const -> bool;

    [[nodiscard]] auto isConnected() const -> bool;

    /// @brief Returns the number of requests awaiting a response.
    [[nodiscard]] auto pendingRequestCount() const -> size_t;

    [[nodiscard]] auto requestTimeout() const -> std::chrono::milliseconds { return _options.requestTimeout; }
    void setRequestTimeout(std::chrono::milliseconds timeout) { _options.requestTimeout = timeout; }

    [[nodiscard]] auto transport() const -> const std::shared_ptr<Transport>& { return _transport; }

    [[nodiscard]] auto events() -> ClientEvents& { return _events; }

  private:
    struct PendingRequest
    {
        PendingRequest(boost::asio::io_context& io, std::string method): method(std::move(method)), done(io) {}

        std::string method;
        AsyncEvent done;
        std::optional<Result<nlohmann::json>> result;
    };

    boost::asio::io_context& _io;
    std::shared_ptr<Transport> _transport;
    ClientOptions _options;
    McpServerCapabilities _capabilities;
    int64_t _nextId = 1;
    bool _initialized = false;
    std::map<int64_t, std::shared_ptr<PendingRequest>> _pending;
    ClientEvents _events;
    std::vector<Connection> _transportConnections;

    void handleMessage(const nlohmann::json& raw);
    void handleIncomingRequest(const nlohmann::json& id, const std::string& method);
    void handleNotification(const std::string& method, const nlohmann::json& params);
    void handleDisconnect(const DisconnectInfo& info);
    void rejectAll(const Error& error);
};

} // namespace mcpvisor
