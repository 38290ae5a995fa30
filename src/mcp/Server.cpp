// SPDX-License-Identifier: Apache-2.0
#include "Server.hpp"

#include <core/Log.hpp>
#include <mcp/SocketTransport.hpp>
#include <mcp/StdioTransport.hpp>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/post.hpp>

#include <format>

namespace mcpvisor
{

namespace
{
    auto now() -> SystemTime
    {
        return std::chrono::system_clock::now();
    }

    auto disconnectClient(std::shared_ptr<McpClient> client) -> Task<VoidResult>
    {
        co_await client->disconnect();
        co_return VoidResult {};
    }
} // namespace

auto createTransport(boost::asio::io_context& io,
                     const ServerConfig& config,
                     const std::vector<std::string>& customPaths) -> Result<std::shared_ptr<Transport>>
{
    switch (config.transport)
    {
        case TransportKind::Stdio: {
            auto transportConfig = StdioTransportConfig {
                .command = config.command,
                .args = config.args,
                .env = config.env,
                .cwd = config.cwd,
                .customPaths = customPaths,
                .shutdownTimeout = config.shutdownTimeout,
            };
            return std::make_shared<StdioTransport>(io, std::move(transportConfig));
        }
        case TransportKind::Sse: {
            if (config.url.empty())
                return makeError(ErrorCode::ConfigError, "URL is required for SSE transport");
            auto transportConfig = SocketTransportConfig {
                .url = config.url,
                .connectTimeout = config.startupTimeout,
                .shutdownTimeout = config.shutdownTimeout,
            };
            return std::make_shared<SocketTransport>(io, std::move(transportConfig));
        }
    }
    return makeError(ErrorCode::InvalidArgument, "Unsupported transport type");
}

auto Server::create(boost::asio::io_context& io, ServerConfig config, ServerOptions options)
    -> Result<std::shared_ptr<Server>>
{
    if (auto const valid = checkServerConfig(config); !valid)
        return std::unexpected(valid.error());
    return std::make_shared<Server>(io, std::move(config), std::move(options));
}

Server::Server(boost::asio::io_context& io, ServerConfig config, ServerOptions options):
    _io(io), _config(std::move(config)), _options(std::move(options)), _cancel(std::make_shared<AsyncEvent>(io))
{
}

Server::~Server()
{
    _clientConnections.clear();
    _cancel->set();
    if (_client)
        _client->close();
}

auto Server::start() -> Task<VoidResult>
{
    auto self = shared_from_this();

    if (!_config.enabled)
    {
        // A restart scheduled before the server was disabled has nothing left to do.
        if (_status == ServerStatus::Restarting)
            setStatus(ServerStatus::Stopped);
        co_return makeError(ErrorCode::InvalidState, std::format("Server '{}' is disabled", id()));
    }

    if (_status != ServerStatus::Stopped && _status != ServerStatus::Crashed && _status != ServerStatus::Restarting)
        co_return makeError(ErrorCode::InvalidState,
                            std::format("Server '{}' cannot be started while {}", id(), serverStatusName(_status)));

    auto const automatic = _status == ServerStatus::Restarting;
    auto const session = beginSession();
    setStatus(ServerStatus::Starting);
    log::info("Starting MCP server '{}'", id());

    auto transport = _options.transportFactory(_io, _config, _options.customPaths);
    if (!transport)
        co_return failStartup(transport.error(), automatic);

    auto client = std::make_shared<McpClient>(
        _io, std::move(*transport), ClientOptions { .requestTimeout = _options.requestTimeout });
    _client = client;
    wireClient(client, session);

    // Startup guard: closing the client fails the pending handshake.
    auto const startupTimeout = _config.startupTimeout;
    auto const guard = std::make_shared<AsyncEvent>(_io);
    auto const timedOut = std::make_shared<bool>(false);
    boost::asio::co_spawn(
        _io,
        [guard, timedOut, weakClient = std::weak_ptr<McpClient>(client), startupTimeout]() -> Task<void> {
            if (co_await guard->waitFor(startupTimeout))
                co_return;
            *timedOut = true;
            if (auto client = weakClient.lock())
                client->close();
        },
        boost::asio::detached);

    auto const connected = co_await client->connect();
    guard->set();

    if (session != _session)
        co_return makeError(ErrorCode::InvalidState, std::format("Start of server '{}' was aborted", id()));

    if (!connected)
    {
        auto error = *timedOut ? Error { ErrorCode::RequestTimeoutError,
                                         std::format("Startup timeout after {} ms", startupTimeout.count()) }
                               : connected.error();
        co_return failStartup(std::move(error), automatic);
    }

    _stats.startTime = now();
    _stats.pid = client->transport()->processId();
    startHealthLoop(session);

    auto const tools = co_await client->listTools();
    if (session != _session)
        co_return makeError(ErrorCode::InvalidState, std::format("Start of server '{}' was aborted", id()));
    if (!tools)
        co_return failStartup(withContext(tools.error(), "Initial tool discovery failed").error(), automatic);

    _stats.restartCount = 0;
    _stats.toolCount = tools->size();
    _stats.lastToolDiscovery = now();
    setStatus(ServerStatus::Running);
    setHealth(ServerHealth::Healthy);
    log::info("MCP server '{}' running with {} tools", id(), tools->size());

    _events.toolsDiscovered.emit(*tools);
    co_return VoidResult {};
}

auto Server::stop() -> Task<void>
{
    auto self = shared_from_this();

    if (_status == ServerStatus::Stopped || _status == ServerStatus::Stopping)
        co_return;

    log::info("Stopping MCP server '{}'", id());
    beginSession();
    setStatus(ServerStatus::Stopping);
    _clientConnections.clear();

    if (auto client = std::exchange(_client, nullptr))
    {
        auto const done = co_await withTimeout<void>(
            _io, disconnectClient(client), _config.shutdownTimeout, "Shutdown timeout");
        if (!done)
            log::warning("MCP server '{}' did not shut down within {} ms, forcing termination",
                         id(),
                         _config.shutdownTimeout.count());
        client->close();
    }

    _stats.pid.reset();
    _stats.startTime.reset();
    setStatus(ServerStatus::Stopped);
}

auto Server::restart() -> Task<VoidResult>
{
    auto self = shared_from_this();
    co_await stop();
    co_await sleepFor(_io, _options.restartPause);
    co_return co_await start();
}

auto Server::updateConfig(ServerConfigUpdate update) -> Task<VoidResult>
{
    auto self = shared_from_this();

    auto merged = applyUpdate(_config, update);
    merged.id = _config.id;
    if (auto const valid = checkServerConfig(merged); !valid)
        co_return std::unexpected(valid.error());

    auto const wasRunning = _status == ServerStatus::Running;
    if (wasRunning || (!merged.enabled && _status != ServerStatus::Stopped))
        co_await stop();

    _config = std::move(merged);
    log::debug("Configuration of MCP server '{}' updated", id());

    if (wasRunning && _config.enabled)
        co_return co_await start();
    co_return VoidResult {};
}

auto Server::listTools(std::optional<std::chrono::milliseconds> timeout)
    -> Task<Result<std::vector<ToolDefinition>>>
{
    auto self = shared_from_this();
    if (_status != ServerStatus::Running || !_client)
        co_return makeError(ErrorCode::ServerNotRunningError,
                            std::format("Server '{}' is not running (status: {})", id(), serverStatusName(_status)));

    auto client = _client;
    auto tools = co_await client->listTools(timeout);
    if (!tools)
    {
        recordError(tools.error());
        co_return std::unexpected(tools.error());
    }

    _stats.toolCount = tools->size();
    _stats.lastToolDiscovery = now();
    co_return tools;
}

auto Server::callTool(std::string name, nlohmann::json arguments) -> Task<Result<ToolResult>>
{
    auto self = shared_from_this();
    if (_status != ServerStatus::Running || !_client)
        co_return makeError(ErrorCode::ServerNotRunningError,
                            std::format("Server '{}' is not running (status: {})", id(), serverStatusName(_status)));

    ++_stats.toolCallCount;
    _stats.lastToolCall = now();

    auto client = _client;
    auto result = co_await client->callTool(std::move(name), std::move(arguments));
    if (!result)
        recordError(result.error());
    co_return result;
}

auto Server::performHealthCheck() -> Task<bool>
{
    auto self = shared_from_this();
    if (_status != ServerStatus::Running || !_client)
        co_return false;

    auto client = _client;
    auto const timeout = _config.healthCheck.value_or(HealthCheckConfig {}).timeout;
    auto const probe = co_await client->listTools(timeout);
    if (!probe)
    {
        log::warning("Health check failed for MCP server '{}': {}", id(), probe.error().message);
        co_return false;
    }
    co_return true;
}

void Server::shutdown()
{
    beginSession();
    _clientConnections.clear();
    if (auto client = std::exchange(_client, nullptr))
        client->close();
    _stats.pid.reset();
    _status = ServerStatus::Stopped;
    _health = ServerHealth::Unknown;
}

auto Server::stats() const -> ServerStats
{
    auto stats = _stats;
    if (_status == ServerStatus::Running && _stats.startTime)
        stats.uptime = std::chrono::duration_cast<std::chrono::milliseconds>(now() - *_stats.startTime);
    return stats;
}

auto Server::beginSession() -> uint64_t
{
    _cancel->set();
    _cancel = std::make_shared<AsyncEvent>(_io);
    _consecutiveFailures = 0;
    return ++_session;
}

void Server::setStatus(ServerStatus status)
{
    if (status == _status)
        return;

    auto const previous = std::exchange(_status, status);
    log::debug("MCP server '{}' status: {} -> {}", id(), serverStatusName(previous), serverStatusName(status));
    _events.statusChanged.emit(status, previous);

    if (status != ServerStatus::Running)
        setHealth(ServerHealth::Unknown);
}

void Server::setHealth(ServerHealth health)
{
    if (health == _health)
        return;

    auto const previous = std::exchange(_health, health);
    _events.healthChanged.emit(health, previous);
}

void Server::recordError(const Error& error)
{
    ++_stats.errorCount;
    _stats.lastErrorTime = now();
    _stats.lastError = error.message;
}

void Server::wireClient(const std::shared_ptr<McpClient>& client, uint64_t session)
{
    auto& events = client->events();

    _clientConnections.push_back(events.diagnostic.connect([this, session](std::string_view text) {
        if (session != _session)
            return;
        log::debug("[{}] {}", id(), text);
        _events.diagnostic.emit(text);
    }));

    _clientConnections.push_back(events.error.connect([this, session](const Error& error) {
        if (session != _session)
            return;
        if (error.code == ErrorCode::ConnectionError && _status == ServerStatus::Running)
        {
            handleConnectionLoss(error);
            return;
        }
        log::warning("MCP server '{}' reported an error: {}", id(), error.message);
        recordError(error);
        _events.error.emit(error);
    }));

    _clientConnections.push_back(events.disconnected.connect([this, session](const DisconnectInfo& info) {
        if (session != _session || _status != ServerStatus::Running)
            return;
        handleConnectionLoss(
            Error { ErrorCode::ConnectionError, std::format("Connection lost: {}", info.reason) });
    }));

    _clientConnections.push_back(events.toolsChanged.connect([this, session]() {
        if (session == _session)
            _events.toolsChanged.emit();
    }));
}

void Server::retireClient()
{
    _clientConnections.clear();
    auto client = std::exchange(_client, nullptr);
    if (!client)
        return;

    client->close();

    // We may be running inside one of the client's own event handlers.
    boost::asio::post(_io, [client = std::move(client)]() {});
}

auto Server::failStartup(Error error, bool automatic) -> VoidResult
{
    log::error("MCP server '{}' failed to start: {}", id(), error.message);
    recordError(error);
    beginSession();
    retireClient();
    _stats.pid.reset();
    _stats.startTime.reset();

    if (automatic)
    {
        setStatus(ServerStatus::Crashed);
        _events.error.emit(error);
        scheduleRestartOrGiveUp();
    }
    else
    {
        setStatus(ServerStatus::Failed);
        _events.error.emit(error);
    }

    return std::unexpected(std::move(error));
}

void Server::startHealthLoop(uint64_t session)
{
    if (!_config.healthCheck)
        return;

    auto const interval = _config.healthCheck->interval;
    boost::asio::co_spawn(
        _io,
        [weak = weak_from_this(), cancel = _cancel, interval, session]() -> Task<void> {
            while (!co_await cancel->waitFor(interval))
            {
                auto self = weak.lock();
                if (!self || self->_session != session)
                    co_return;
                co_await self->checkHealth();
            }
        },
        boost::asio::detached);
}

auto Server::checkHealth() -> Task<void>
{
    auto self = shared_from_this();
    if (_status != ServerStatus::Running || !_config.healthCheck)
        co_return;

    auto const session = _session;
    auto const healthy = co_await performHealthCheck();
    if (session != _session || _status != ServerStatus::Running)
        co_return;

    if (healthy)
    {
        _consecutiveFailures = 0;
        setHealth(ServerHealth::Healthy);
        co_return;
    }

    ++_consecutiveFailures;
    auto const threshold = _config.healthCheck->failureThreshold;
    log::debug("MCP server '{}' failed {}/{} health checks", id(), _consecutiveFailures, threshold);
    if (_consecutiveFailures >= threshold)
        handleHealthFailure();
}

void Server::handleHealthFailure()
{
    auto const error = Error { ErrorCode::ConnectionError,
                               std::format("Server '{}' failed {} consecutive health checks", id(), _consecutiveFailures) };
    _consecutiveFailures = 0;
    recordError(error);
    setHealth(ServerHealth::Unhealthy);
    _events.error.emit(error);

    if (!_config.autoRestart)
        return;

    beginSession();
    retireClient();
    _stats.pid.reset();

    if (_stats.restartCount >= _config.maxRestarts)
    {
        log::error("MCP server '{}' exceeded {} restarts, giving up", id(), _config.maxRestarts);
        setStatus(ServerStatus::Failed);
        return;
    }
    scheduleRestart();
}

void Server::handleConnectionLoss(const Error& error)
{
    log::warning("MCP server '{}' crashed: {}", id(), error.message);
    recordError(error);
    beginSession();
    retireClient();
    _stats.pid.reset();
    setStatus(ServerStatus::Crashed);
    _events.error.emit(error);
    scheduleRestartOrGiveUp();
}

void Server::scheduleRestartOrGiveUp()
{
    if (!_config.autoRestart || _status != ServerStatus::Crashed)
        return;

    if (_stats.restartCount >= _config.maxRestarts)
    {
        log::error("MCP server '{}' exceeded {} restarts, giving up", id(), _config.maxRestarts);
        setStatus(ServerStatus::Failed);
        return;
    }
    scheduleRestart();
}

void Server::scheduleRestart()
{
    setStatus(ServerStatus::Restarting);
    ++_stats.restartCount;
    _stats.lastRestart = now();

    auto const delay = restartDelay(_stats.restartCount, _options.restartBaseDelay, _options.restartMaxDelay);
    log::info("Restarting MCP server '{}' in {} ms (attempt {}/{})",
              id(),
              delay.count(),
              _stats.restartCount,
              _config.maxRestarts);
    _events.restart.emit(RestartEvent {
        .attempt = _stats.restartCount,
        .maxAttempts = _config.maxRestarts,
        .delay = delay,
    });

    boost::asio::co_spawn(
        _io,
        [weak = weak_from_this(), cancel = _cancel, session = _session, delay]() -> Task<void> {
            if (co_await cancel->waitFor(delay))
                co_return;
            auto self = weak.lock();
            if (!self || self->_session != session || self->_status != ServerStatus::Restarting)
                co_return;
            auto const started = co_await self->start();
            if (!started)
                log::debug("Restart of MCP server '{}' failed: {}", self->id(), started.error().message);
        },
        boost::asio::detached);
}

} // namespace mcpvisor
