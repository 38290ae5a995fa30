// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Async.hpp>
#include <mcp/JsonRpc.hpp>
#include <mcp/Server.hpp>
#include <mcp/Transport.hpp>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>

#include <catch2/catch_test_macros.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <chrono>
#include <exception>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace mcpvisor::test
{

using namespace std::chrono_literals;

/// @brief Drives @p io until @p done returns true or @p timeout elapses.
/// @return True if the predicate became true.
inline auto runUntil(boost::asio::io_context& io,
                     const std::function<bool()>& done,
                     std::chrono::milliseconds timeout = 5s) -> bool
{
    auto const deadline = std::chrono::steady_clock::now() + timeout;
    while (!done())
    {
        if (std::chrono::steady_clock::now() >= deadline)
            return false;
        if (io.stopped())
            io.restart();
        io.run_one_for(5ms);
    }
    return true;
}

/// @brief Runs @p task to completion on @p io and returns its value.
template <typename T>
auto runTask(boost::asio::io_context& io, Task<T> task, std::chrono::milliseconds timeout = 5s) -> T
{
    auto result = std::optional<T> {};
    boost::asio::co_spawn(
        io,
        [&result, task = std::move(task)]() mutable -> Task<void> { result.emplace(co_await std::move(task)); },
        [](std::exception_ptr error) {
            if (error)
                std::rethrow_exception(error);
        });
    REQUIRE(runUntil(io, [&] { return result.has_value(); }, timeout));
    return std::move(*result);
}

inline void runTask(boost::asio::io_context& io, Task<void> task, std::chrono::milliseconds timeout = 5s)
{
    auto done = false;
    boost::asio::co_spawn(
        io,
        [&done, task = std::move(task)]() mutable -> Task<void> {
            co_await std::move(task);
            done = true;
        },
        [](std::exception_ptr error) {
            if (error)
                std::rethrow_exception(error);
        });
    REQUIRE(runUntil(io, [&] { return done; }, timeout));
}

/// @brief Builds a tool definition in the `tools/list` wire format.
inline auto makeToolJson(std::string name, std::string description, nlohmann::json properties = nlohmann::json::object(),
                         std::vector<std::string> required = {}) -> nlohmann::json
{
    auto schema = nlohmann::json { { "type", "object" }, { "properties", std::move(properties) } };
    if (!required.empty())
        schema["required"] = required;
    return nlohmann::json {
        { "name", std::move(name) },
        { "description", std::move(description) },
        { "inputSchema", std::move(schema) },
    };
}

/// @brief In-process MCP server speaking JSON-RPC through the Transport interface.
///
/// Answers initialize, ping, tools/list and tools/call asynchronously on the io_context.
class MockTransport: public Transport, public std::enable_shared_from_this<MockTransport>
{
  public:
    explicit MockTransport(boost::asio::io_context& io): _io(io) {}

    std::vector<nlohmann::json> tools;
    std::string serverName = "mock-server";
    std::string serverVersion = "1.0.0";
    bool refuseConnect = false;     // connect() fails with a ConnectionError
    bool answerInitialize = true;   // false leaves the handshake hanging
    bool answerToolsList = true;    // false leaves tools/list (and thereby health probes) hanging
    std::function<nlohmann::json(const std::string& name, const nlohmann::json& arguments)> onCall;

    std::vector<nlohmann::json> sent;
    int connectCount = 0;

    auto connect() -> Task<VoidResult> override
    {
        if (_connected)
            co_return makeError(ErrorCode::ConnectionError, "Transport already connected");
        if (refuseConnect)
            co_return makeError(ErrorCode::ConnectionError, "Connection refused");

        ++connectCount;
        _connected = true;
        _events.connected.emit();
        co_return VoidResult {};
    }

    auto send(const nlohmann::json& message) -> Task<VoidResult> override
    {
        if (!_connected)
            co_return makeError(ErrorCode::ConnectionError, "Transport not connected");

        if (auto const serialized = jsonrpc::serialize(message); !serialized)
            co_return std::unexpected(serialized.error());

        sent.push_back(message);
        if (auto response = answer(message))
        {
            boost::asio::post(_io, [weak = weak_from_this(), response = std::move(*response)]() {
                if (auto self = weak.lock(); self && self->_connected)
                    self->_events.message.emit(response);
            });
        }
        co_return VoidResult {};
    }

    auto disconnect() -> Task<void> override
    {
        close();
        co_return;
    }

    void close() override
    {
        if (!_connected)
            return;
        _connected = false;
        _events.disconnected.emit(DisconnectInfo { .expected = true, .reason = "closed" });
    }

    [[nodiscard]] auto isConnected() const -> bool override { return _connected; }
    [[nodiscard]] auto processId() const -> std::optional<int> override { return 4242; }

    /// @brief Drops the connection as if the server process had died.
    void crash()
    {
        if (!_connected)
            return;
        _connected = false;
        _events.disconnected.emit(DisconnectInfo { .expected = false, .reason = "process exited with code 1" });
    }

    /// @brief Delivers a server-initiated notification.
    void notify(std::string_view method) { _events.message.emit(jsonrpc::makeNotification(method)); }

    /// @brief Returns the requests sent so far with the given method.
    [[nodiscard]] auto requestsFor(std::string_view method) const -> std::vector<nlohmann::json>
    {
        auto matching = std::vector<nlohmann::json> {};
        for (const auto& message: sent)
        {
            if (message.contains("id") && message.value("method", "") == method)
                matching.push_back(message);
        }
        return matching;
    }

  private:
    boost::asio::io_context& _io;
    bool _connected = false;

    auto answer(const nlohmann::json& message) -> std::optional<nlohmann::json>
    {
        if (!message.contains("id") || !message.contains("method"))
            return std::nullopt;

        auto const& id = message["id"];
        auto const method = message.value("method", "");
        auto const params = message.value("params", nlohmann::json::object());

        if (method == "initialize")
        {
            if (!answerInitialize)
                return std::nullopt;
            return jsonrpc::makeResult(
                id,
                nlohmann::json {
                    { "protocolVersion", "2024-11-05" },
                    { "serverInfo", { { "name", serverName }, { "version", serverVersion } } },
                    { "capabilities", { { "tools", nlohmann::json::object() } } },
                });
        }
        if (method == "ping")
            return jsonrpc::makeResult(id, nlohmann::json::object());
        if (method == "tools/list")
        {
            if (!answerToolsList)
                return std::nullopt;
            return jsonrpc::makeResult(id, nlohmann::json { { "tools", tools } });
        }
        if (method == "tools/call")
        {
            auto const name = params.value("name", "");
            auto const arguments = params.value("arguments", nlohmann::json::object());
            if (onCall)
                return jsonrpc::makeResult(id, onCall(name, arguments));

            auto const known = std::ranges::any_of(tools, [&](const auto& tool) { return tool["name"] == name; });
            if (!known)
                return jsonrpc::makeErrorResponse(id, jsonrpc::errors::InvalidParams, "Unknown tool: " + name);
            return jsonrpc::makeResult(
                id,
                nlohmann::json {
                    { "content", nlohmann::json::array({ { { "type", "text" }, { "text", "called " + name } } }) },
                });
        }
        return jsonrpc::makeErrorResponse(id, jsonrpc::errors::MethodNotFound, "Method not found: " + method);
    }
};

/// @brief Transport factory handing out MockTransports and remembering them per server id.
class MockTransportFactory
{
  public:
    explicit MockTransportFactory(std::vector<nlohmann::json> tools = {}): tools(std::move(tools)) {}

    std::vector<nlohmann::json> tools;
    std::function<void(MockTransport&)> configure;
    std::map<std::string, std::vector<std::shared_ptr<MockTransport>>> created;

    [[nodiscard]] auto factory() -> TransportFactory
    {
        return [this](boost::asio::io_context& io, const ServerConfig& config, const std::vector<std::string>&)
                   -> Result<std::shared_ptr<Transport>> {
            auto transport = std::make_shared<MockTransport>(io);
            transport->tools = tools;
            if (configure)
                configure(*transport);
            created[config.id].push_back(transport);
            return transport;
        };
    }

    /// @brief Returns the transport created last for @p serverId.
    [[nodiscard]] auto latest(const std::string& serverId) const -> std::shared_ptr<MockTransport>
    {
        auto const it = created.find(serverId);
        if (it == created.end() || it->second.empty())
            return nullptr;
        return it->second.back();
    }

    [[nodiscard]] auto count(const std::string& serverId) const -> size_t
    {
        auto const it = created.find(serverId);
        return it == created.end() ? 0 : it->second.size();
    }
};

/// @brief Server options using @p factory and short restart delays.
inline auto mockServerOptions(MockTransportFactory& factory) -> ServerOptions
{
    auto options = ServerOptions {};
    options.transportFactory = factory.factory();
    options.restartBaseDelay = 10ms;
    options.restartMaxDelay = 100ms;
    options.restartPause = 1ms;
    options.requestTimeout = 1s;
    return options;
}

} // namespace mcpvisor::test
