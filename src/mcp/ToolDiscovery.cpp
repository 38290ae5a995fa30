// SPDX-License-Identifier: Apache-2.0
#include "ToolDiscovery.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>

#include <algorithm>
#include <cctype>
#include <format>
#include <utility>

namespace mcpvisor
{

namespace
{
    using ServerTools = std::pair<std::string, std::vector<ToolMetadata>>;

    auto toLower(std::string_view text) -> std::string
    {
        auto lower = std::string(text);
        std::ranges::transform(lower, lower.begin(), [](unsigned char c) { return std::tolower(c); });
        return lower;
    }

    auto containsAny(std::string_view text, std::initializer_list<std::string_view> needles) -> bool
    {
        return std::ranges::any_of(needles, [text](std::string_view needle) { return text.contains(needle); });
    }

    auto epochMillis(SystemTime time) -> int64_t
    {
        return std::chrono::duration_cast<std::chrono::milliseconds>(time.time_since_epoch()).count();
    }

    auto hasValidSchema(const ToolDefinition& tool) -> bool
    {
        return !tool.name.empty() && tool.inputSchema.is_object()
               && json::getStringOr(tool.inputSchema, "type", "") == "object";
    }

    auto discoverOrEmpty(std::shared_ptr<ToolDiscovery> discovery, std::shared_ptr<Server> server)
        -> Task<ServerTools>
    {
        auto tools = co_await discovery->discoverTools(server);
        if (!tools)
        {
            log::warning("Failed to discover tools from server '{}': {}", server->id(), tools.error().message);
            co_return ServerTools { server->id(), {} };
        }
        co_return ServerTools { server->id(), std::move(*tools) };
    }
} // namespace

auto toJson(const ToolMetadata& tool) -> nlohmann::json
{
    auto stats = nlohmann::json {
        { "callCount", tool.stats.callCount },
        { "averageExecutionTime", tool.stats.averageExecutionTimeMs },
        { "successRate", tool.stats.successRate },
    };
    if (tool.stats.lastUsed)
        stats["lastUsed"] = epochMillis(*tool.stats.lastUsed);

    return nlohmann::json {
        { "name", tool.name },
        { "description", tool.description },
        { "inputSchema", tool.inputSchema },
        { "serverId", tool.serverId },
        { "serverName", tool.serverName },
        { "discoveredAt", epochMillis(tool.discoveredAt) },
        { "lastUpdated", epochMillis(tool.lastUpdated) },
        { "schemaHash", tool.schemaHash },
        { "available", tool.available },
        { "category", tool.category },
        { "tags", tool.tags },
        { "stats", std::move(stats) },
    };
}

auto toolSchemaHash(const ToolDefinition& tool) -> std::string
{
    // Object keys are sorted, so the dump is canonical.
    auto const canonical = toJson(tool).dump();

    auto hash = uint64_t { 14695981039346656037ull };
    for (unsigned char const c: canonical)
    {
        hash ^= c;
        hash *= 1099511628211ull;
    }
    return std::format("{:016x}", hash);
}

auto inferToolCategory(const ToolDefinition& tool) -> std::string
{
    auto const name = toLower(tool.name);
    auto const description = toLower(tool.description);

    if (containsAny(name, { "file", "read", "write" }))
        return "filesystem";
    if (containsAny(name, { "git", "commit", "branch" }))
        return "version-control";
    if (containsAny(name, { "db", "sql", "query" }))
        return "database";
    if (containsAny(name, { "http", "api", "request" }))
        return "network";
    if (containsAny(description, { "search", "find" }))
        return "search";
    return "general";
}

ToolDiscovery::ToolDiscovery(boost::asio::io_context& io, DiscoveryConfig config): _io(io), _config(std::move(config))
{
}

ToolDiscovery::~ToolDiscovery()
{
    for (auto& [serverId, cancel]: _autoDiscovery)
        cancel->set();
}

auto ToolDiscovery::ingest(const Server& server, const std::vector<ToolDefinition>& tools)
    -> std::vector<ToolMetadata>
{
    auto const& serverId = server.id();
    auto const now = std::chrono::system_clock::now();

    auto previous = ServerCache {};
    if (auto it = _cache.find(serverId); it != _cache.end())
        previous = std::move(it->second);

    auto discovered = std::vector<ToolMetadata> {};
    for (const auto& tool: tools)
    {
        if (_config.validateSchemas && !hasValidSchema(tool))
        {
            log::warning("Invalid tool schema for '{}' from server '{}'",
                         tool.name.empty() ? "unknown" : tool.name,
                         serverId);
            continue;
        }

        if (std::ranges::any_of(discovered, [&](const ToolMetadata& known) { return known.name == tool.name; }))
            continue;

        if (discovered.size() >= _config.maxToolsPerServer)
        {
            log::warning("Server '{}' offers more than {} tools, ignoring the rest", serverId, _config.maxToolsPerServer);
            break;
        }

        auto metadata = ToolMetadata {};
        metadata.name = tool.name;
        metadata.description = tool.description;
        metadata.inputSchema = tool.inputSchema;
        metadata.serverId = serverId;
        metadata.serverName = server.name();
        metadata.discoveredAt = now;
        metadata.lastUpdated = now;
        metadata.schemaHash = toolSchemaHash(tool);
        metadata.category = inferToolCategory(tool);
        metadata.tags = server.config().tags;

        if (auto const old = previous.find(tool.name); old != previous.end())
        {
            metadata.discoveredAt = old->second.tool.discoveredAt;
            metadata.stats = old->second.tool.stats;
        }

        discovered.push_back(std::move(metadata));
    }

    if (discovered.empty())
    {
        _cache.erase(serverId);
    }
    else
    {
        auto const expires = Clock::now() + _config.cacheTtl;
        auto& cache = _cache[serverId];
        cache.clear();
        for (const auto& tool: discovered)
            cache.emplace(tool.name, CacheEntry { .tool = tool, .expires = expires });
    }

    for (const auto& tool: discovered)
    {
        auto const old = previous.find(tool.name);
        if (old == previous.end())
            _events.toolAdded.emit(tool);
        else if (old->second.tool.schemaHash != tool.schemaHash)
            _events.toolUpdated.emit(tool, old->second.tool);
    }

    for (const auto& [name, entry]: previous)
    {
        if (std::ranges::none_of(discovered, [&](const ToolMetadata& tool) { return tool.name == name; }))
            _events.toolRemoved.emit(serverId, name);
    }

    log::debug("Discovered {} tools from server '{}'", discovered.size(), serverId);
    _events.toolsDiscovered.emit(serverId, discovered);
    _events.cacheUpdated.emit(serverId, discovered.size());
    return discovered;
}

auto ToolDiscovery::discoverTools(std::shared_ptr<Server> server) -> Task<Result<std::vector<ToolMetadata>>>
{
    auto self = shared_from_this();
    auto const serverId = server->id();

    if (auto const it = _inFlight.find(serverId); it != _inFlight.end())
    {
        auto const inFlight = it->second;
        co_await inFlight->done.wait();
        co_return *inFlight->result;
    }

    if (hasFreshCache(serverId))
    {
        ++_hits;
        co_return getToolsFromServer(serverId);
    }
    ++_misses;

    auto const inFlight = std::make_shared<InFlight>(_io);
    _inFlight.emplace(serverId, inFlight);

    auto result = co_await performDiscovery(server);

    if (auto const it = _inFlight.find(serverId); it != _inFlight.end() && it->second == inFlight)
        _inFlight.erase(it);
    inFlight->result = result;
    inFlight->done.set();

    if (!result)
        _events.discoveryError.emit(serverId, result.error());
    co_return result;
}

auto ToolDiscovery::discoverToolsFromServers(std::vector<std::shared_ptr<Server>> servers)
    -> Task<std::map<std::string, std::vector<ToolMetadata>>>
{
    auto self = shared_from_this();

    auto tasks = std::vector<Task<ServerTools>> {};
    tasks.reserve(servers.size());
    for (auto& server: servers)
        tasks.push_back(discoverOrEmpty(self, std::move(server)));

    auto results = std::map<std::string, std::vector<ToolMetadata>> {};
    for (auto& [serverId, tools]: co_await waitAll(_io, std::move(tasks)))
        results[serverId] = std::move(tools);
    co_return results;
}

auto ToolDiscovery::refreshTools(std::shared_ptr<Server> server) -> Task<Result<std::vector<ToolMetadata>>>
{
    auto self = shared_from_this();
    if (auto const it = _cache.find(server->id()); it != _cache.end())
    {
        for (auto& [name, entry]: it->second)
            entry.expires = Clock::time_point::min();
    }
    co_return co_await discoverTools(std::move(server));
}

auto ToolDiscovery::performDiscovery(std::shared_ptr<Server> server) -> Task<Result<std::vector<ToolMetadata>>>
{
    auto const serverId = server->id();
    if (!server->isRunning())
        co_return makeError(ErrorCode::ServerNotRunningError,
                            std::format("Server '{}' is not running (status: {})",
                                        serverId,
                                        serverStatusName(server->status())));

    auto const session = server->session();
    auto const tools = co_await withTimeout<std::vector<ToolDefinition>>(
        _io,
        server->listTools(),
        _config.discoveryTimeout,
        std::format("Tool discovery timed out for server {}", serverId));
    if (server->session() != session || !server->isRunning())
        co_return makeError(ErrorCode::ServerNotRunningError,
                            std::format("Discarded tools of server '{}': it stopped during discovery", serverId));

    if (!tools)
        co_return std::unexpected(tools.error());

    co_return ingest(*server, *tools);
}

auto ToolDiscovery::getAllTools() const -> std::vector<ToolMetadata>
{
    auto tools = std::vector<ToolMetadata> {};
    for (const auto& [serverId, cache]: _cache)
    {
        for (const auto& [name, entry]: cache)
        {
            if (!isExpired(entry))
                tools.push_back(entry.tool);
        }
    }
    return tools;
}

auto ToolDiscovery::getToolsFromServer(std::string_view serverId) const -> std::vector<ToolMetadata>
{
    auto tools = std::vector<ToolMetadata> {};
    auto const it = _cache.find(serverId);
    if (it == _cache.end())
        return tools;

    for (const auto& [name, entry]: it->second)
    {
        if (!isExpired(entry))
            tools.push_back(entry.tool);
    }
    return tools;
}

auto ToolDiscovery::getTool(std::string_view serverId, std::string_view toolName) const
    -> std::optional<ToolMetadata>
{
    auto const server = _cache.find(serverId);
    if (server == _cache.end())
        return std::nullopt;

    auto const entry = server->second.find(toolName);
    if (entry == server->second.end() || isExpired(entry->second))
        return std::nullopt;
    return entry->second.tool;
}

auto ToolDiscovery::searchTools(std::string_view query) const -> std::vector<ToolMetadata>
{
    auto const needle = toLower(query);
    auto tools = getAllTools();
    std::erase_if(tools, [&](const ToolMetadata& tool) {
        return !toLower(tool.name).contains(needle) && !toLower(tool.description).contains(needle)
               && std::ranges::none_of(tool.tags, [&](const std::string& tag) { return toLower(tag).contains(needle); });
    });
    return tools;
}

auto ToolDiscovery::getToolsByCategory(std::string_view category) const -> std::vector<ToolMetadata>
{
    auto tools = getAllTools();
    std::erase_if(tools, [&](const ToolMetadata& tool) {
        return tool.category != category
               && std::ranges::none_of(tool.tags, [&](const std::string& tag) { return tag == category; });
    });
    return tools;
}

auto ToolDiscovery::cachedServerIds() const -> std::vector<std::string>
{
    auto ids = std::vector<std::string> {};
    for (const auto& [serverId, cache]: _cache)
        ids.push_back(serverId);
    return ids;
}

void ToolDiscovery::startAutoDiscovery(std::shared_ptr<Server> server)
{
    if (!_config.autoDiscovery)
        return;

    auto const serverId = server->id();
    stopAutoDiscovery(serverId);

    auto cancel = std::make_shared<AsyncEvent>(_io);
    _autoDiscovery.emplace(serverId, cancel);

    boost::asio::co_spawn(
        _io,
        [weakSelf = weak_from_this(),
         weakServer = std::weak_ptr<Server>(server),
         cancel,
         interval = _config.discoveryInterval]() -> Task<void> {
            while (!co_await cancel->waitFor(interval))
            {
                auto self = weakSelf.lock();
                auto server = weakServer.lock();
                if (!self || !server)
                    co_return;
                if (!server->isRunning())
                    continue;

                auto const tools = co_await self->discoverTools(server);
                if (!tools)
                    log::debug("Auto-discovery failed for server '{}': {}", server->id(), tools.error().message);
            }
        },
        boost::asio::detached);
}

void ToolDiscovery::stopAutoDiscovery(std::string_view serverId)
{
    auto const it = _autoDiscovery.find(serverId);
    if (it == _autoDiscovery.end())
        return;
    it->second->set();
    _autoDiscovery.erase(it);
}

void ToolDiscovery::clearServerCache(std::string_view serverId)
{
    auto const id = std::string(serverId);
    _cache.erase(id);
    _events.cacheUpdated.emit(id, 0);
}

void ToolDiscovery::clearAllCache()
{
    auto const ids = cachedServerIds();
    _cache.clear();
    for (const auto& serverId: ids)
        _events.cacheUpdated.emit(serverId, 0);
}

void ToolDiscovery::updateToolStats(std::string_view serverId,
                                    std::string_view toolName,
                                    std::chrono::milliseconds executionTime,
                                    bool success)
{
    auto const server = _cache.find(serverId);
    if (server == _cache.end())
        return;
    auto const entry = server->second.find(toolName);
    if (entry == server->second.end())
        return;

    auto& stats = entry->second.tool.stats;
    ++stats.callCount;
    stats.lastUsed = std::chrono::system_clock::now();

    auto const calls = static_cast<double>(stats.callCount);
    stats.averageExecutionTimeMs += (static_cast<double>(executionTime.count()) - stats.averageExecutionTimeMs) / calls;
    stats.successRate += ((success ? 1.0 : 0.0) - stats.successRate) / calls;
}

auto ToolDiscovery::cacheStats() const -> DiscoveryCacheStats
{
    auto stats = DiscoveryCacheStats {};
    for (const auto& [serverId, cache]: _cache)
    {
        auto const fresh = std::ranges::count_if(cache, [](const auto& item) { return !isExpired(item.second); });
        if (fresh == 0)
            continue;
        ++stats.totalServers;
        stats.totalTools += static_cast<size_t>(fresh);
    }

    stats.hits = _hits;
    stats.misses = _misses;
    if (_hits + _misses > 0)
        stats.hitRate = static_cast<double>(_hits) / static_cast<double>(_hits + _misses);
    if (stats.totalServers > 0)
        stats.averageToolsPerServer = static_cast<double>(stats.totalTools) / static_cast<double>(stats.totalServers);
    return stats;
}

void ToolDiscovery::shutdown()
{
    for (auto& [serverId, cancel]: _autoDiscovery)
        cancel->set();
    _autoDiscovery.clear();
    _inFlight.clear();
    clearAllCache();
}

auto ToolDiscovery::hasFreshCache(std::string_view serverId) const -> bool
{
    auto const it = _cache.find(serverId);
    if (it == _cache.end())
        return false;
    return std::ranges::any_of(it->second, [](const auto& item) { return !isExpired(item.second); });
}

auto ToolDiscovery::isExpired(const CacheEntry& entry) -> bool
{
    return Clock::now() >= entry.expires;
}

} // namespace mcpvisor
