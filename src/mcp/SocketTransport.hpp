// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <mcp/Transport.hpp>

#include <boost/asio/io_context.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace mcpvisor
{

namespace detail
{
    class SocketChannel;
}

/// @brief Configuration for a socket connection to an MCP server.
struct SocketTransportConfig
{
    std::string url; // http, https, ws or wss
    std::chrono::milliseconds connectTimeout { 10000 };
    std::chrono::milliseconds shutdownTimeout { 5000 };
    bool verifyPeer = true; // verify the server certificate on wss
};

/// @brief Transport that talks to an MCP server over a persistent WebSocket.
///
/// Each JSON-RPC message travels in one text frame. http and https URLs are upgraded as
/// ws and wss. Must be created with std::make_shared.
class SocketTransport: public Transport, public std::enable_shared_from_this<SocketTransport>
{
  public:
    SocketTransport(boost::asio::io_context& io, SocketTransportConfig config);
    ~SocketTransport() override;

    SocketTransport(const SocketTransport&) = delete;
    SocketTransport& operator=(const SocketTransport&) = delete;

    [[nodiscard]] auto connect() -> Task<VoidResult> override;
    [[nodiscard]] auto send(const nlohmann::json& message) -> Task<VoidResult> override;
    [[nodiscard]] auto disconnect() -> Task<void> override;
    void close() override;
    [[nodiscard]] auto isConnected() const -> bool override;

    /// @brief Returns the configured URL.
    [[nodiscard]] auto url() const -> const std::string& { return _config.url; }

  private:
    boost::asio::io_context& _io;
    SocketTransportConfig _config;
    std::shared_ptr<detail::SocketChannel> _channel;
    AsyncLock _writeLock;
    bool _connected = false;
    bool _announced = false;
    uint64_t _session = 0;

    [[nodiscard]] auto readLoop(std::shared_ptr<detail::SocketChannel> channel, uint64_t session) -> Task<void>;
    void announceDisconnect(bool expected, std::string reason);
};

} // namespace mcpvisor
