// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Async.hpp>
#include <core/Error.hpp>
#include <core/Signal.hpp>

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace mcpvisor
{

/// @brief Describes why a transport connection ended.
struct DisconnectInfo
{
    bool expected = true; // false when the peer went away on its own
    std::string reason;
};

/// @brief Events raised by a transport, dispatched synchronously on the io_context thread.
struct TransportEvents
{
    Signal<> connected;
    Signal<const nlohmann::json&> message;
    Signal<const Error&> error;
    Signal<const DisconnectInfo&> disconnected;
    Signal<std::string_view> diagnostic;
};

/// @brief Abstract interface for MCP transport communication.
///
/// A transport carries whole JSON-RPC messages to and from one server. Implementations are
/// owned through std::shared_ptr and must be closed (via disconnect() or close()) by their owner.
class Transport
{
  public:
    virtual ~Transport() = default;

    /// @brief Establishes the channel (spawns the process or opens the socket).
    /// @return Success, or a ConnectionError if already connected or the channel cannot be opened.
    [[nodiscard]] virtual auto connect() -> Task<VoidResult> = 0;

    /// @brief Sends a JSON message to the server.
    ///
    /// Each message is written as one unit; concurrent sends never interleave.
    /// @param message The JSON message to send.
    /// @return Success or an error.
    [[nodiscard]] virtual auto send(const nlohmann::json& message) -> Task<VoidResult> = 0;

    /// @brief Shuts the channel down gracefully, forcing it after the shutdown timeout.
    [[nodiscard]] virtual auto disconnect() -> Task<void> = 0;

    /// @brief Tears the channel down immediately.
    virtual void close() = 0;

    /// @brief Returns true if the transport is connected.
    [[nodiscard]] virtual auto isConnected() const -> bool = 0;

    /// @brief Returns the id of the server process, if the transport owns one.
    [[nodiscard]] virtual auto processId() const -> std::optional<int> { return std::nullopt; }

    /// @brief Returns the event channels of this transport.
    [[nodiscard]] auto events() -> TransportEvents& { return _events; }

  protected:
    TransportEvents _events;
};

} // namespace mcpvisor
