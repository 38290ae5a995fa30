// SPDX-License-Identifier: Apache-2.0
#include "ServerManager.hpp"

#include <core/Log.hpp>
#include <mcp/ToolArguments.hpp>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>

#include <format>
#include <utility>

namespace mcpvisor
{

namespace
{
    template <typename T>
    auto tagged(std::string id, Task<T> task) -> Task<std::pair<std::string, T>>
    {
        auto value = co_await std::move(task);
        co_return std::pair<std::string, T> { std::move(id), std::move(value) };
    }

    auto elapsedSince(std::chrono::steady_clock::time_point start) -> std::chrono::milliseconds
    {
        return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
    }
} // namespace

ServerManager::ServerManager(boost::asio::io_context& io, ManagerOptions options):
    _io(io),
    _options(std::move(options)),
    _discovery(std::make_shared<ToolDiscovery>(io, _options.discovery)),
    _autoSaveCancel(std::make_shared<AsyncEvent>(io)),
    _startTime(std::chrono::steady_clock::now())
{
    auto& events = _discovery->events();
    _discoveryConnections.push_back(
        events.toolsDiscovered.connect([this](const std::string& id, const std::vector<ToolMetadata>& tools) {
            _events.toolsDiscovered.emit(id, tools);
        }));
    _discoveryConnections.push_back(events.discoveryError.connect([](const std::string& id, const Error& error) {
        log::debug("Tool discovery for MCP server '{}' failed: {}", id, error.message);
    }));
}

ServerManager::~ServerManager()
{
    _autoSaveCancel->set();
    for (auto& [id, entry]: _servers)
    {
        entry.connections.clear();
        entry.server->shutdown();
    }
    _discoveryConnections.clear();
    _discovery->shutdown();
}

auto ServerManager::addServer(std::string id, ServerConfig config) -> Task<VoidResult>
{
    auto self = shared_from_this();

    if (_servers.contains(id))
        co_return makeError(ErrorCode::ConfigValidationError, std::format("Server with ID '{}' already exists", id));

    config.id = id;
    auto created = Server::create(_io, std::move(config), _options.server);
    if (!created)
        co_return std::unexpected(created.error());

    auto server = std::move(*created);
    registerServer(server);
    log::info("Added MCP server '{}'", id);
    scheduleAutoSave();

    // While loading, all servers are started together once the registry is complete.
    if (_options.autoStart && !_loading && server->config().enabled && server->config().autoRestart)
    {
        auto const started = co_await server->start();
        if (!started)
            log::warning("Failed to start MCP server '{}': {}", id, started.error().message);
    }

    _events.serverAdded.emit(id, server->config());
    co_return VoidResult {};
}

auto ServerManager::removeServer(std::string id) -> Task<VoidResult>
{
    auto self = shared_from_this();

    auto server = findServer(id);
    if (!server)
        co_return std::unexpected(server.error());

    co_await (*server)->stop();

    _discovery->stopAutoDiscovery(id);
    _discovery->clearServerCache(id);
    if (auto const it = _servers.find(id); it != _servers.end() && it->second.server == *server)
        _servers.erase(it);

    log::info("Removed MCP server '{}'", id);
    scheduleAutoSave();
    _events.serverRemoved.emit(id);
    co_return VoidResult {};
}

auto ServerManager::updateServerConfig(std::string id, ServerConfigUpdate update) -> Task<VoidResult>
{
    auto self = shared_from_this();

    auto server = findServer(id);
    if (!server)
        co_return std::unexpected(server.error());

    auto const updated = co_await (*server)->updateConfig(std::move(update));
    if (!updated && updated.error().code == ErrorCode::ConfigValidationError)
        co_return updated;

    log::info("Updated configuration of MCP server '{}'", id);
    scheduleAutoSave();
    co_return updated;
}

auto ServerManager::startServer(std::string id) -> Task<VoidResult>
{
    auto self = shared_from_this();

    auto server = findServer(id);
    if (!server)
        co_return std::unexpected(server.error());

    if ((*server)->isRunning())
        co_return VoidResult {};

    // An explicit start is the caller's retry of a server that gave up.
    if ((*server)->status() == ServerStatus::Failed)
        co_await (*server)->stop();

    co_return co_await (*server)->start();
}

auto ServerManager::stopServer(std::string id) -> Task<VoidResult>
{
    auto self = shared_from_this();

    auto server = findServer(id);
    if (!server)
        co_return std::unexpected(server.error());

    co_await (*server)->stop();
    co_return VoidResult {};
}

auto ServerManager::restartServer(std::string id) -> Task<VoidResult>
{
    auto self = shared_from_this();

    auto server = findServer(id);
    if (!server)
        co_return std::unexpected(server.error());

    log::info("Restarting MCP server '{}'", id);
    co_return co_await (*server)->restart();
}

auto ServerManager::startAllServers() -> Task<std::map<std::string, VoidResult>>
{
    auto self = shared_from_this();

    auto tasks = std::vector<Task<std::pair<std::string, VoidResult>>> {};
    for (const auto& [id, entry]: _servers)
    {
        if (entry.server->config().enabled)
            tasks.push_back(tagged(id, startServer(id)));
    }

    auto results = std::map<std::string, VoidResult> {};
    for (auto& [id, result]: co_await waitAll(_io, std::move(tasks)))
    {
        if (!result)
            log::warning("Failed to start MCP server '{}': {}", id, result.error().message);
        results.emplace(id, std::move(result));
    }
    co_return results;
}

auto ServerManager::stopAllServers() -> Task<std::map<std::string, VoidResult>>
{
    auto self = shared_from_this();

    auto tasks = std::vector<Task<std::pair<std::string, VoidResult>>> {};
    for (const auto& [id, entry]: _servers)
        tasks.push_back(tagged(id, stopServer(id)));

    auto results = std::map<std::string, VoidResult> {};
    for (auto& [id, result]: co_await waitAll(_io, std::move(tasks)))
        results.emplace(id, std::move(result));
    co_return results;
}

auto ServerManager::refreshAllTools() -> Task<std::map<std::string, std::vector<ToolMetadata>>>
{
    auto self = shared_from_this();

    auto results = std::map<std::string, std::vector<ToolMetadata>> {};
    auto tasks = std::vector<Task<std::pair<std::string, Result<std::vector<ToolMetadata>>>>> {};
    for (const auto& [id, entry]: _servers)
    {
        results[id] = {};
        if (entry.server->isRunning())
            tasks.push_back(tagged(id, _discovery->refreshTools(entry.server)));
    }

    for (auto& [id, tools]: co_await waitAll(_io, std::move(tasks)))
    {
        if (!tools)
        {
            log::warning("Failed to refresh tools of MCP server '{}': {}", id, tools.error().message);
            continue;
        }
        results[id] = std::move(*tools);
    }
    co_return results;
}

auto ServerManager::refreshServerTools(std::string id) -> Task<Result<std::vector<ToolMetadata>>>
{
    auto self = shared_from_this();

    auto server = findServer(id);
    if (!server)
        co_return std::unexpected(server.error());

    if (!(*server)->isRunning())
        co_return makeError(ErrorCode::ServerNotRunningError,
                            std::format("Server '{}' is not running (status: {})",
                                        id,
                                        serverStatusName((*server)->status())));

    co_return co_await _discovery->refreshTools(*server);
}

auto ServerManager::executeToolCall(std::string serverId, std::string toolName, nlohmann::json params)
    -> Task<Result<ToolResult>>
{
    auto self = shared_from_this();

    auto found = findServer(serverId);
    if (!found)
        co_return std::unexpected(found.error());
    auto server = std::move(*found);

    if (!server->isRunning())
        co_return makeError(ErrorCode::ServerNotRunningError,
                            std::format("Server '{}' is not running (status: {})",
                                        serverId,
                                        serverStatusName(server->status())));

    auto arguments = normalizeToolArguments(std::move(params));
    if (!arguments)
        co_return std::unexpected(arguments.error());

    auto tool = _discovery->getTool(serverId, toolName);
    if (!tool)
    {
        auto const discovered = co_await _discovery->discoverTools(server);
        if (discovered)
            tool = _discovery->getTool(serverId, toolName);
    }

    if (tool)
    {
        if (auto const valid = validateToolArguments(toolName, tool->inputSchema, *arguments); !valid)
            co_return std::unexpected(valid.error());
    }

    log::debug("Calling tool '{}' on MCP server '{}'", toolName, serverId);
    auto const startedAt = std::chrono::steady_clock::now();
    auto result = co_await server->callTool(toolName, std::move(*arguments));
    _discovery->updateToolStats(serverId, toolName, elapsedSince(startedAt), result && !result->isError);

    if (!result)
        co_return withContext(result.error(), std::format("Tool '{}' on server '{}' failed", toolName, serverId));
    co_return result;
}

auto ServerManager::testServerConnection(ServerConfig config) -> Task<ConnectionTestResult>
{
    auto self = shared_from_this();

    auto result = ConnectionTestResult {};
    auto const startedAt = std::chrono::steady_clock::now();

    if (config.id.empty())
        config.id = "connection-test";
    config.enabled = true;
    config.autoRestart = false;

    auto created = Server::create(_io, std::move(config), _options.server);
    if (!created)
    {
        result.error = created.error().message;
        result.latency = elapsedSince(startedAt);
        co_return result;
    }

    auto server = std::move(*created);
    auto const started = co_await server->start();
    if (started && server->isRunning())
    {
        result.success = true;
        result.toolCount = server->stats().toolCount;
        if (auto const& client = server->client())
        {
            result.serverName = client->capabilities().serverName;
            result.serverVersion = client->capabilities().serverVersion;
        }
    }
    else
    {
        result.error = started ? "Server failed to start properly" : started.error().message;
    }

    co_await server->stop();
    result.latency = elapsedSince(startedAt);
    log::debug("Connection test of '{}' finished in {} ms", server->id(), result.latency.count());
    co_return result;
}

auto ServerManager::performHealthCheck() -> Task<std::map<std::string, bool>>
{
    auto self = shared_from_this();

    auto tasks = std::vector<Task<std::pair<std::string, bool>>> {};
    for (const auto& [id, entry]: _servers)
        tasks.push_back(tagged(id, entry.server->performHealthCheck()));

    auto results = std::map<std::string, bool> {};
    for (auto& [id, healthy]: co_await waitAll(_io, std::move(tasks)))
        results[id] = healthy;
    co_return results;
}

auto ServerManager::getAllDiscoveredTools() const -> std::vector<ToolMetadata>
{
    return _discovery->getAllTools();
}

auto ServerManager::getToolsFromServer(std::string_view id) const -> std::vector<ToolMetadata>
{
    return _discovery->getToolsFromServer(id);
}

auto ServerManager::getServerIds() const -> std::vector<std::string>
{
    auto ids = std::vector<std::string> {};
    ids.reserve(_servers.size());
    for (const auto& [id, entry]: _servers)
        ids.push_back(id);
    return ids;
}

auto ServerManager::getServer(std::string_view id) const -> std::shared_ptr<Server>
{
    auto const it = _servers.find(id);
    return it != _servers.end() ? it->second.server : nullptr;
}

auto ServerManager::hasServer(std::string_view id) const -> bool
{
    return _servers.contains(id);
}

auto ServerManager::getServerConfig(std::string_view id) const -> std::optional<ServerConfig>
{
    if (auto const server = getServer(id))
        return server->config();
    return std::nullopt;
}

auto ServerManager::getServerStats(std::string_view id) const -> std::optional<ServerStats>
{
    if (auto const server = getServer(id))
        return server->stats();
    return std::nullopt;
}

auto ServerManager::getServerStatuses() const -> std::map<std::string, ServerStatusReport>
{
    auto statuses = std::map<std::string, ServerStatusReport> {};
    for (const auto& [id, entry]: _servers)
    {
        statuses[id] = ServerStatusReport {
            .status = entry.server->status(),
            .health = entry.server->health(),
            .stats = entry.server->stats(),
        };
    }
    return statuses;
}

auto ServerManager::getManagerStats() const -> ManagerStats
{
    auto stats = ManagerStats {};
    stats.totalServers = _servers.size();
    for (const auto& [id, entry]: _servers)
    {
        if (entry.server->isRunning())
            ++stats.runningServers;
        if (entry.server->isHealthy())
            ++stats.healthyServers;
    }
    stats.totalTools = _discovery->getAllTools().size();
    stats.uptime = elapsedSince(_startTime);
    stats.lastSave = _lastSave;
    return stats;
}

void ServerManager::setStorage(std::shared_ptr<ConfigStorage> storage)
{
    _storage = std::move(storage);
}

void ServerManager::setAutoSave(bool enabled, std::chrono::milliseconds delay)
{
    _options.autoSave = enabled;
    _options.autoSaveDelay = delay;
    if (!enabled)
        _autoSaveCancel->set();
}

auto ServerManager::saveConfiguration() -> VoidResult
{
    if (!_storage)
        return makeError(ErrorCode::InvalidState, "No configuration storage set");

    auto configs = std::vector<ServerConfig> {};
    configs.reserve(_servers.size());
    for (const auto& [id, entry]: _servers)
        configs.push_back(entry.server->config());

    _savePending = false;
    if (auto const saved = _storage->save(configs); !saved)
    {
        log::error("Failed to save MCP server configuration: {}", saved.error().message);
        _events.error.emit(saved.error());
        return saved;
    }

    _lastSave = std::chrono::system_clock::now();
    log::debug("Saved configuration of {} MCP servers", configs.size());
    _events.configurationSaved.emit(configs.size());
    return {};
}

auto ServerManager::loadConfiguration() -> Task<Result<size_t>>
{
    auto self = shared_from_this();

    if (!_storage)
        co_return makeError(ErrorCode::InvalidState, "No configuration storage set");

    auto configs = _storage->load();
    if (!configs)
    {
        log::error("Failed to load MCP server configuration: {}", configs.error().message);
        _events.error.emit(configs.error());
        co_return std::unexpected(configs.error());
    }

    _loading = true;
    auto loaded = std::vector<std::string> {};
    for (auto& config: *configs)
    {
        auto id = config.id;
        auto const added = co_await addServer(id, std::move(config));
        if (!added)
        {
            log::warning("Skipping MCP server '{}': {}", id, added.error().message);
            _events.error.emit(added.error());
            continue;
        }
        loaded.push_back(std::move(id));
    }
    _loading = false;

    if (_options.autoStart)
    {
        auto tasks = std::vector<Task<std::pair<std::string, VoidResult>>> {};
        for (const auto& id: loaded)
        {
            auto const server = getServer(id);
            if (server && server->config().enabled && server->config().autoRestart)
                tasks.push_back(tagged(id, startServer(id)));
        }
        for (auto const& [id, started]: co_await waitAll(_io, std::move(tasks)))
        {
            if (!started)
                log::warning("Failed to start MCP server '{}': {}", id, started.error().message);
        }
    }

    log::info("Loaded {} MCP servers", loaded.size());
    _events.configurationLoaded.emit(loaded.size());
    co_return loaded.size();
}

auto ServerManager::shutdown() -> Task<void>
{
    auto self = shared_from_this();

    _autoSaveCancel->set();
    if (_savePending && _storage)
    {
        if (auto const saved = saveConfiguration(); !saved)
            log::warning("Configuration was not saved on shutdown");
    }

    auto const stopped = co_await stopAllServers();
    for (auto& [id, entry]: _servers)
    {
        entry.connections.clear();
        entry.server->shutdown();
    }
    _servers.clear();
    _discovery->shutdown();
    log::info("MCP server manager shut down ({} servers stopped)", stopped.size());
}

void ServerManager::registerServer(const std::shared_ptr<Server>& server)
{
    auto const id = server->id();
    auto const weak = std::weak_ptr<Server>(server);
    auto& events = server->events();

    auto entry = ServerEntry { .server = server, .connections = {} };

    entry.connections.push_back(
        events.statusChanged.connect([this, id, weak](ServerStatus status, ServerStatus previous) {
            log::debug("MCP server '{}' status changed from {} to {}",
                       id,
                       serverStatusName(previous),
                       serverStatusName(status));
            if (status == ServerStatus::Running)
            {
                if (auto const running = weak.lock())
                    _discovery->startAutoDiscovery(running);
            }
            else if (previous == ServerStatus::Running)
            {
                _discovery->stopAutoDiscovery(id);
                _discovery->clearServerCache(id);
            }
            _events.serverStatusChanged.emit(id, status, previous);
        }));

    entry.connections.push_back(
        events.healthChanged.connect([this, id](ServerHealth health, ServerHealth previous) {
            _events.serverHealthChanged.emit(id, health, previous);
        }));

    entry.connections.push_back(events.error.connect([this, id](const Error& error) {
        log::debug("MCP server '{}' error: {}", id, error.message);
        _events.serverError.emit(id, error);
    }));

    entry.connections.push_back(events.restart.connect([this, id](const RestartEvent& restart) {
        _events.serverRestart.emit(id, restart);
    }));

    entry.connections.push_back(
        events.toolsDiscovered.connect([this, weak](const std::vector<ToolDefinition>& tools) {
            if (auto const owner = weak.lock())
                _discovery->ingest(*owner, tools);
        }));

    entry.connections.push_back(events.toolsChanged.connect([this, id]() {
        log::info("Tools of MCP server '{}' changed, refreshing", id);
        boost::asio::co_spawn(
            _io,
            [self = shared_from_this(), id]() -> Task<void> {
                auto const tools = co_await self->refreshServerTools(id);
                if (!tools)
                    log::warning("Failed to refresh tools of MCP server '{}': {}", id, tools.error().message);
            },
            boost::asio::detached);
    }));

    _servers.emplace(id, std::move(entry));
}

void ServerManager::scheduleAutoSave()
{
    if (!_options.autoSave || !_storage || _loading)
        return;

    _autoSaveCancel->set();
    _autoSaveCancel = std::make_shared<AsyncEvent>(_io);
    _savePending = true;

    boost::asio::co_spawn(
        _io,
        [weak = weak_from_this(), cancel = _autoSaveCancel, delay = _options.autoSaveDelay]() -> Task<void> {
            if (co_await cancel->waitFor(delay))
                co_return;
            auto self = weak.lock();
            if (!self || !self->_savePending)
                co_return;
            if (auto const saved = self->saveConfiguration(); !saved)
                log::debug("Auto-save skipped: {}", saved.error().message);
        },
        boost::asio::detached);
}

auto ServerManager::findServer(std::string_view id) const -> Result<std::shared_ptr<Server>>
{
    auto const it = _servers.find(id);
    if (it == _servers.end())
        return makeError(ErrorCode::ServerNotFoundError, std::format("Server '{}' not found", id));
    return it->second.server;
}

} // namespace mcpvisor
