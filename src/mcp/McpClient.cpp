// SPDX-License-Identifier: Apache-2.0
#include "McpClient.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <mcp/JsonRpc.hpp>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>

#include <exception>
#include <format>

namespace mcpvisor
{

namespace
{
    constexpr auto ToolsListChanged = std::string_view("notifications/tools/list_changed");
}

McpClient::McpClient(boost::asio::io_context& io, std::shared_ptr<Transport> transport, ClientOptions options):
    _io(io), _transport(std::move(transport)), _options(std::move(options))
{
    auto& events = _transport->events();
    _transportConnections.push_back(events.message.connect([this](const nlohmann::json& msg) { handleMessage(msg); }));
    _transportConnections.push_back(events.error.connect([this](const Error& error) { _events.error.emit(error); }));
    _transportConnections.push_back(
        events.disconnected.connect([this](const DisconnectInfo& info) { handleDisconnect(info); }));
    _transportConnections.push_back(
        events.diagnostic.connect([this](std::string_view text) { _events.diagnostic.emit(text); }));
}

McpClient::~McpClient()
{
    _transportConnections.clear();
    rejectAll(Error { ErrorCode::ConnectionError, "Connection closed" });
}

auto McpClient::connect() -> Task<Result<McpServerCapabilities>>
{
    if (_initialized)
        co_return makeError(ErrorCode::InvalidState, "Client already connected");

    auto const opened = co_await _transport->connect();
    if (!opened)
        co_return withContext(opened.error(), "Failed to connect transport");

    auto params = nlohmann::json {
        { "protocolVersion", _options.protocolVersion },
        { "capabilities", nlohmann::json::object() },
        { "clientInfo",
          nlohmann::json {
              { "name", _options.clientName },
              { "version", _options.clientVersion },
          } },
    };

    auto const result = co_await request("initialize", std::move(params));
    if (!result)
    {
        co_await _transport->disconnect();
        co_return withContext(result.error(), "MCP initialization failed");
    }

    auto const serverInfo = result->is_object() ? result->value("serverInfo", nlohmann::json {}) : nlohmann::json {};
    _capabilities = McpServerCapabilities {};
    _capabilities.serverName = json::getStringOr(serverInfo, "name", "unknown");
    _capabilities.serverVersion = json::getStringOr(serverInfo, "version", "unknown");
    _capabilities.protocolVersion = json::getStringOr(*result, "protocolVersion", _options.protocolVersion);

    if (result->is_object() && result->contains("capabilities"))
    {
        auto const& caps = (*result)["capabilities"];
        _capabilities.hasTools = caps.contains("tools");
        _capabilities.hasResources = caps.contains("resources");
        _capabilities.hasPrompts = caps.contains("prompts");
    }

    // Send initialized notification
    auto const notified = co_await notify("notifications/initialized");
    if (!notified)
    {
        co_await _transport->disconnect();
        co_return withContext(notified.error(), "MCP initialization failed");
    }

    _initialized = true;
    log::info("MCP server initialized: {} v{}", _capabilities.serverName, _capabilities.serverVersion);
    _events.initialized.emit(_capabilities);
    co_return _capabilities;
}

auto McpClient::disconnect() -> Task<void>
{
    _initialized = false;
    rejectAll(Error { ErrorCode::ConnectionError, "Connection closed" });
    auto const transport = _transport;
    co_await transport->disconnect();
}

void McpClient::close()
{
    _initialized = false;
    rejectAll(Error { ErrorCode::ConnectionError, "Connection closed" });
    _transport->close();
}

auto McpClient::request(std::string method,
                        nlohmann::json params,
                        std::optional<std::chrono::milliseconds> timeout) -> Task<Result<nlohmann::json>>
{
    if (!_transport->isConnected())
        co_return makeError(ErrorCode::ConnectionError, "Transport not connected");

    auto const id = _nextId++;
    auto const limit = timeout.value_or(_options.requestTimeout);
    auto const deadline = std::chrono::steady_clock::now() + limit;
    auto pending = std::make_shared<PendingRequest>(_io, method);
    _pending.emplace(id, pending);

    log::trace("MCP request #{}: {}", id, method);
    auto sent = VoidResult {};
    try
    {
        sent = co_await _transport->send(jsonrpc::makeRequest(id, method, std::move(params)));
    }
    catch (const std::exception& e)
    {
        sent = makeError(ErrorCode::ProtocolError, std::format("Failed to send request '{}': {}", method, e.what()));
    }
    if (!sent)
    {
        _pending.erase(id);
        if (!pending->result)
            co_return std::unexpected(sent.error());
    }

    if (!co_await pending->done.waitUntil(deadline))
    {
        _pending.erase(id);
        co_return makeError(ErrorCode::RequestTimeoutError,
                            std::format("Request '{}' timed out after {} ms", method, limit.count()));
    }

    co_return std::move(*pending->result);
}

auto McpClient::notify(std::string method, nlohmann::json params) -> Task<VoidResult>
{
    if (!_transport->isConnected())
        co_return makeError(ErrorCode::ConnectionError, "Transport not connected");

    co_return co_await _transport->send(jsonrpc::makeNotification(method, std::move(params)));
}

auto McpClient::listTools(std::optional<std::chrono::milliseconds> timeout)
    -> Task<Result<std::vector<ToolDefinition>>>
{
    if (!_initialized)
        co_return makeError(ErrorCode::InvalidState, "Client not initialized");

    auto const result = co_await request("tools/list", nullptr, timeout);
    if (!result)
        co_return std::unexpected(result.error());

    auto tools = std::vector<ToolDefinition> {};
    if (!result->is_object() || !result->contains("tools") || !(*result)["tools"].is_array())
        co_return tools;

    for (const auto& toolJson: (*result)["tools"])
    {
        if (toolJson.is_object())
            tools.push_back(toolDefinitionFromJson(toolJson));
    }

    co_return tools;
}

auto McpClient::callTool(std::string name,
                         nlohmann::json arguments,
                         std::optional<std::chrono::milliseconds> timeout) -> Task<Result<ToolResult>>
{
    if (!_initialized)
        co_return makeError(ErrorCode::InvalidState, "Client not initialized");

    auto params = nlohmann::json {
        { "name", name },
        { "arguments", std::move(arguments) },
    };

    auto result = co_await request("tools/call", std::move(params), timeout);
    if (!result)
    {
        if (result.error().code == ErrorCode::ProtocolError)
            co_return makeError(ErrorCode::ToolExecutionError, result.error().message);
        co_return std::unexpected(result.error());
    }

    auto toolResult = ToolResult {};
    toolResult.isError = json::getBoolOr(*result, "isError", false);

    if (result->is_object() && result->contains("content") && (*result)["content"].is_array())
    {
        for (const auto& item: (*result)["content"])
        {
            if (json::getStringOr(item, "type", "") == "text")
            {
                if (!toolResult.content.empty())
                    toolResult.content += "\n";
                toolResult.content += json::getStringOr(item, "text", "");
            }
        }
    }
    toolResult.raw = std::move(*result);

    log::debug("Tool '{}' returned: {} (isError: {})", name, toolResult.content, toolResult.isError);
    co_return toolResult;
}

auto McpClient::capabilities() const -> const McpServerCapabilities&
{
    return _capabilities;
}

auto McpClient::isInitialized() const -> bool
{
    return _initialized;
}

auto McpClient::isConnected() const -> bool
{
    return _transport->isConnected();
}

auto McpClient::pendingRequestCount() const -> size_t
{
    return _pending.size();
}

void McpClient::handleMessage(const nlohmann::json& raw)
{
    auto message = jsonrpc::parseMessage(raw);
    if (!message)
    {
        log::warning("Discarding invalid MCP message: {}", message.error().message);
        _events.error.emit(message.error());
        return;
    }

    // Server requests number their ids independently of ours. One only answers an in-flight request
    // when it repeats that request's method, which is what an echoing server sends back.
    if (auto const id = message->numericId(); id && message->kind != jsonrpc::MessageKind::Notification)
    {
        auto const it = _pending.find(*id);
        auto const answers = it != _pending.end()
                             && (message->kind == jsonrpc::MessageKind::Response || message->method == it->second->method);
        if (answers)
        {
            auto pending = it->second;
            _pending.erase(it);
            if (message->error)
                pending->result = makeError(
                    ErrorCode::ProtocolError,
                    std::format("RPC error {}: {}", message->error->code, message->error->message));
            else
                pending->result = message->result.value_or(nlohmann::json::object());
            pending->done.set();
            return;
        }
    }

    switch (message->kind)
    {
        case jsonrpc::MessageKind::Request: handleIncomingRequest(message->id, message->method); break;
        case jsonrpc::MessageKind::Notification: handleNotification(message->method, message->params); break;
        case jsonrpc::MessageKind::Response: {
            auto const error = Error { ErrorCode::ProtocolError,
                                       std::format("Received response for unknown request id {}", message->id.dump()) };
            log::warning("{}", error.message);
            _events.error.emit(error);
            break;
        }
    }
}

void McpClient::handleIncomingRequest(const nlohmann::json& id, const std::string& method)
{
    auto response = method == "ping"
                        ? jsonrpc::makeResult(id, nlohmann::json::object())
                        : jsonrpc::makeErrorResponse(
                              id, jsonrpc::errors::MethodNotFound, std::format("Method not found: {}", method));

    boost::asio::co_spawn(
        _io,
        [transport = _transport, response = std::move(response), method]() -> Task<void> {
            auto const sent = co_await transport->send(response);
            if (!sent)
                log::debug("Failed to answer server request '{}': {}", method, sent.error().message);
        },
        boost::asio::detached);
}

void McpClient::handleNotification(const std::string& method, const nlohmann::json& params)
{
    log::debug("MCP notification: {}", method);
    if (method == ToolsListChanged)
        _events.toolsChanged.emit();
    _events.notification.emit(method, params);
}

void McpClient::handleDisconnect(const DisconnectInfo& info)
{
    _initialized = false;
    rejectAll(Error { ErrorCode::ConnectionError, "Connection closed" });
    _events.disconnected.emit(info);
}

void McpClient::rejectAll(const Error& error)
{
    auto pending = std::exchange(_pending, {});
    for (auto& [id, request]: pending)
    {
        request->result = std::unexpected(error);
        request->done.set();
    }
}

} // namespace mcpvisor
