// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Async.hpp>
#include <core/Error.hpp>
#include <core/Signal.hpp>
#include <core/Types.hpp>
#include <mcp/Server.hpp>

#include <boost/asio/io_context.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mcpvisor
{

/// @brief Settings of the tool cache and the periodic rediscovery.
struct DiscoveryConfig
{
    std::chrono::milliseconds cacheTtl { 300000 };
    std::chrono::milliseconds discoveryInterval { 60000 };
    bool autoDiscovery = true;
    size_t maxToolsPerServer = 100;
    bool validateSchemas = true; // skip tools without a name or an object input schema
    std::chrono::milliseconds discoveryTimeout { 10000 };
};

/// @brief How often and how well a tool has been used.
struct ToolUsageStats
{
    uint64_t callCount = 0;
    std::optional<SystemTime> lastUsed;
    double averageExecutionTimeMs = 0.0; // running mean over callCount calls
    double successRate = 1.0;            // running mean of successful calls
};

/// @brief A discovered tool together with where and when it was found.
struct ToolMetadata
{
    std::string name;
    std::string description;
    nlohmann::json inputSchema;

    std::string serverId; // owning server, for lookup only
    std::string serverName;
    SystemTime discoveredAt;
    SystemTime lastUpdated;
    std::string schemaHash;
    bool available = true;
    std::string category;
    std::vector<std::string> tags;
    ToolUsageStats stats;
};

/// @brief Serializes tool metadata for display and export.
[[nodiscard]] auto toJson(const ToolMetadata& tool) -> nlohmann::json;

/// @brief Fingerprints a tool's name, description and input schema.
/// @return A 64-bit FNV-1a hash in hex, stable across runs.
[[nodiscard]] auto toolSchemaHash(const ToolDefinition& tool) -> std::string;

/// @brief Guesses a category ("filesystem", "version-control", "database", "network",
///        "search" or "general") from a tool's name and description.
[[nodiscard]] auto inferToolCategory(const ToolDefinition& tool) -> std::string;

/// @brief Cache counters.
struct DiscoveryCacheStats
{
    size_t totalServers = 0;
    size_t totalTools = 0;
    uint64_t hits = 0;
    uint64_t misses = 0;
    double hitRate = 0.0;
    double averageToolsPerServer = 0.0;
};

/// @brief Events raised by ToolDiscovery.
struct ToolDiscoveryEvents
{
    Signal<const std::string&, const std::vector<ToolMetadata>&> toolsDiscovered; // server id, tools
    Signal<const ToolMetadata&> toolAdded;
    Signal<const ToolMetadata&, const ToolMetadata&> toolUpdated; // current, previous
    Signal<const std::string&, const std::string&> toolRemoved;   // server id, tool name
    Signal<const std::string&, const Error&> discoveryError;
    Signal<const std::string&, size_t> cacheUpdated; // server id, cached tool count
};

/// @brief Caches the tools of all servers and keeps them current.
///
/// Every server's tools live in one generation keyed by tool name; a new discovery replaces
/// the generation and reports the difference as added, updated and removed tools. Entries
/// expire after DiscoveryConfig::cacheTtl and are invisible to lookups from then on.
class ToolDiscovery: public std::enable_shared_from_this<ToolDiscovery>
{
  public:
    ToolDiscovery(boost::asio::io_context& io, DiscoveryConfig config = {});
    ~ToolDiscovery();

    ToolDiscovery(const ToolDiscovery&) = delete;
    ToolDiscovery& operator=(const ToolDiscovery&) = delete;

    /// @brief Converts a raw tool list of @p server into metadata and caches it.
    /// @return The tools that made it into the cache.
    auto ingest(const Server& server, const std::vector<ToolDefinition>& tools) -> std::vector<ToolMetadata>;

    /// @brief Returns the cached tools of @p server, discovering them when the cache is empty or expired.
    ///
    /// Concurrent calls for the same server share one tools/list request. A result that arrives
    /// after the server was stopped or restarted is discarded.
    [[nodiscard]] auto discoverTools(std::shared_ptr<Server> server) -> Task<Result<std::vector<ToolMetadata>>>;

    /// @brief Discovers the tools of several servers concurrently.
    /// @return One entry per server; a failed server maps to an empty list.
    [[nodiscard]] auto discoverToolsFromServers(std::vector<std::shared_ptr<Server>> servers)
        -> Task<std::map<std::string, std::vector<ToolMetadata>>>;

    /// @brief Expires the cache of @p server and discovers its tools again.
    [[nodiscard]] auto refreshTools(std::shared_ptr<Server> server) -> Task<Result<std::vector<ToolMetadata>>>;

    [[nodiscard]] auto getAllTools() const -> std::vector<ToolMetadata>;
    [[nodiscard]] auto getToolsFromServer(std::string_view serverId) const -> std::vector<ToolMetadata>;
    [[nodiscard]] auto getTool(std::string_view serverId, std::string_view toolName) const
        -> std::optional<ToolMetadata>;

    /// @brief Case-insensitive substring search over names, descriptions and tags.
    [[nodiscard]] auto searchTools(std::string_view query) const -> std::vector<ToolMetadata>;

    /// @brief Returns tools whose inferred category or one of whose tags equals @p category.
    [[nodiscard]] auto getToolsByCategory(std::string_view category) const -> std::vector<ToolMetadata>;

    /// @brief Returns the ids of servers with cached tools.
    [[nodiscard]] auto cachedServerIds() const -> std::vector<std::string>;

    /// @brief Rediscovers the tools of @p server every discovery interval while it runs.
    void startAutoDiscovery(std::shared_ptr<Server> server);
    void stopAutoDiscovery(std::string_view serverId);

    void clearServerCache(std::string_view serverId);
    void clearAllCache();

    /// @brief Records one call of a cached tool.
    void updateToolStats(std::string_view serverId,
                         std::string_view toolName,
                         std::chrono::milliseconds executionTime,
                         bool success);

    [[nodiscard]] auto cacheStats() const -> DiscoveryCacheStats;
    [[nodiscard]] auto config() const noexcept -> const DiscoveryConfig& { return _config; }

    /// @brief Stops all auto-discovery loops and clears the cache.
    void shutdown();

    [[nodiscard]] auto events() -> ToolDiscoveryEvents& { return _events; }

  private:
    using Clock = std::chrono::steady_clock;

    struct CacheEntry
    {
        ToolMetadata tool;
        Clock::time_point expires;
    };

    using ServerCache = std::map<std::string, CacheEntry, std::less<>>;

    struct InFlight
    {
        explicit InFlight(boost::asio::io_context& io): done(io) {}
        AsyncEvent done;
        std::optional<Result<std::vector<ToolMetadata>>> result;
    };

    boost::asio::io_context& _io;
    DiscoveryConfig _config;
    std::map<std::string, ServerCache, std::less<>> _cache;
    std::map<std::string, std::shared_ptr<InFlight>, std::less<>> _inFlight;
    std::map<std::string, std::shared_ptr<AsyncEvent>, std::less<>> _autoDiscovery;
    uint64_t _hits = 0;
    uint64_t _misses = 0;
    ToolDiscoveryEvents _events;

    [[nodiscard]] auto performDiscovery(std::shared_ptr<Server> server) -> Task<Result<std::vector<ToolMetadata>>>;
    [[nodiscard]] auto hasFreshCache(std::string_view serverId) const -> bool;
    [[nodiscard]] static auto isExpired(const CacheEntry& entry) -> bool;
};

} // namespace mcpvisor
