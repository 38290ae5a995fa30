// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace mcpvisor::jsonrpc
{

/// @brief Standard JSON-RPC 2.0 error codes used by the client.
namespace errors
{
    constexpr int ParseError = -32700;
    constexpr int InvalidRequest = -32600;
    constexpr int MethodNotFound = -32601;
    constexpr int InvalidParams = -32602;
    constexpr int InternalError = -32603;
} // namespace errors

/// @brief Represents a JSON-RPC 2.0 error.
struct RpcError
{
    int code = 0;
    std::string message;
    nlohmann::json data;
};

/// @brief The three kinds of JSON-RPC 2.0 envelopes.
enum class MessageKind
{
    Request,
    Response,
    Notification,
};

/// @brief A parsed and classified JSON-RPC 2.0 message.
///
/// Requests carry an id and a method, notifications a method but no id, and responses an id
/// with either a result or an error (or neither, which callers may treat as an empty result).
struct Message
{
    MessageKind kind = MessageKind::Notification;
    nlohmann::json id;
    std::string method;
    nlohmann::json params;
    std::optional<nlohmann::json> result;
    std::optional<RpcError> error;

    /// @brief Returns the numeric id, if the id is an integer.
    [[nodiscard]] auto numericId() const -> std::optional<int64_t>
    {
        if (id.is_number_integer())
            return id.get<int64_t>();
        return std::nullopt;
    }
};

/// @brief Builds a JSON-RPC 2.0 request message.
/// @param id The request ID.
/// @param method The method name.
/// @param params Optional parameters.
/// @return The JSON-RPC request object.
[[nodiscard]] auto makeRequest(int64_t id, std::string_view method, nlohmann::json params = nullptr)
    -> nlohmann::json;

/// @brief Builds a JSON-RPC 2.0 notification message (no id).
/// @param method The method name.
/// @param params Optional parameters.
/// @return The JSON-RPC notification object.
[[nodiscard]] auto makeNotification(std::string_view method, nlohmann::json params = nullptr)
    -> nlohmann::json;

/// @brief Builds a successful JSON-RPC 2.0 response.
[[nodiscard]] auto makeResult(const nlohmann::json& id, nlohmann::json result) -> nlohmann::json;

/// @brief Builds a JSON-RPC 2.0 error response.
[[nodiscard]] auto makeErrorResponse(const nlohmann::json& id, int code, std::string_view message)
    -> nlohmann::json;

/// @brief Parses and classifies a JSON-RPC 2.0 message.
/// @param message The JSON message to parse.
/// @return The classified message, or a ProtocolError for a malformed envelope.
[[nodiscard]] auto parseMessage(const nlohmann::json& message) -> Result<Message>;

/// @brief Serializes a message for the wire.
/// @return The compact JSON text, or a ProtocolError if a string in @p message is not valid UTF-8.
[[nodiscard]] auto serialize(const nlohmann::json& message) -> Result<std::string>;

} // namespace mcpvisor::jsonrpc
