// SPDX-License-Identifier: Apache-2.0
#include "JsonRpc.hpp"

#include <format>

namespace mcpvisor::jsonrpc
{

auto makeRequest(int64_t id, std::string_view method, nlohmann::json params) -> nlohmann::json
{
    auto msg = nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", id },
        { "method", method },
    };

    if (!params.is_null())
        msg["params"] = std::move(params);

    return msg;
}

auto makeNotification(std::string_view method, nlohmann::json params) -> nlohmann::json
{
    auto msg = nlohmann::json {
        { "jsonrpc", "2.0" },
        { "method", method },
    };

    if (!params.is_null())
        msg["params"] = std::move(params);

    return msg;
}

auto makeResult(const nlohmann::json& id, nlohmann::json result) -> nlohmann::json
{
    return nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", id },
        { "result", std::move(result) },
    };
}

auto makeErrorResponse(const nlohmann::json& id, int code, std::string_view message) -> nlohmann::json
{
    return nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", id },
        { "error", { { "code", code }, { "message", message } } },
    };
}

auto parseMessage(const nlohmann::json& message) -> Result<Message>
{
    if (!message.is_object())
        return makeError(ErrorCode::ProtocolError, "JSON-RPC message is not an object");

    if (!message.contains("jsonrpc") || message["jsonrpc"] != "2.0")
        return makeError(ErrorCode::ProtocolError, "Not a valid JSON-RPC 2.0 message");

    auto parsed = Message {};

    auto const hasId = message.contains("id") && !message["id"].is_null();
    if (hasId)
    {
        parsed.id = message["id"];
        if (!parsed.id.is_number_integer() && !parsed.id.is_string())
            return makeError(ErrorCode::ProtocolError, "JSON-RPC id must be a number or a string");
    }

    if (message.contains("method"))
    {
        if (!message["method"].is_string())
            return makeError(ErrorCode::ProtocolError, "JSON-RPC method must be a string");
        parsed.method = message["method"].get<std::string>();
        parsed.params = message.value("params", nlohmann::json {});
    }

    if (message.contains("result"))
    {
        parsed.result = message["result"];
    }
    else if (message.contains("error"))
    {
        auto const& err = message["error"];
        if (!err.is_object())
            return makeError(ErrorCode::ProtocolError, "JSON-RPC error must be an object");
        parsed.error = RpcError {
            .code = err.value("code", 0),
            .message = err.value("message", "Unknown error"),
            .data = err.value("data", nlohmann::json {}),
        };
    }

    if (!parsed.method.empty() && !parsed.result && !parsed.error)
        parsed.kind = hasId ? MessageKind::Request : MessageKind::Notification;
    else if (hasId)
        parsed.kind = MessageKind::Response;
    else
        return makeError(ErrorCode::ProtocolError, "JSON-RPC message has neither id nor method");

    return parsed;
}

auto serialize(const nlohmann::json& message) -> Result<std::string>
{
    try
    {
        return message.dump();
    }
    catch (const nlohmann::json::type_error& e)
    {
        return makeError(ErrorCode::ProtocolError, std::format("Cannot serialize message: {}", e.what()));
    }
}

} // namespace mcpvisor::jsonrpc
