// SPDX-License-Identifier: Apache-2.0
#include "TestUtils.hpp"

#include <mcp/ToolDiscovery.hpp>

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <algorithm>

using namespace mcpvisor;
using namespace mcpvisor::test;

namespace
{
auto tool(std::string name, std::string description = {}) -> ToolDefinition
{
    return ToolDefinition {
        .name = std::move(name),
        .description = std::move(description),
        .inputSchema = { { "type", "object" }, { "properties", nlohmann::json::object() } },
    };
}

auto names(const std::vector<ToolMetadata>& tools) -> std::vector<std::string>
{
    auto result = std::vector<std::string> {};
    for (const auto& metadata: tools)
        result.push_back(metadata.name);
    std::ranges::sort(result);
    return result;
}

auto stoppedServer(boost::asio::io_context& io, std::string id, std::vector<std::string> tags = {})
    -> std::shared_ptr<Server>
{
    auto config = makeStdioServerConfig(std::move(id), "mock");
    config.tags = std::move(tags);
    auto server = Server::create(io, std::move(config));
    REQUIRE(server.has_value());
    return *server;
}

struct DiscoveryEvents
{
    std::vector<std::string> added;
    std::vector<std::string> updated;
    std::vector<std::string> removed;
    std::vector<std::pair<std::string, size_t>> cacheUpdates;
    std::vector<std::pair<std::string, Error>> errors;
    std::vector<Connection> connections;

    explicit DiscoveryEvents(ToolDiscovery& discovery)
    {
        auto& events = discovery.events();
        connections.push_back(events.toolAdded.connect([this](const ToolMetadata& t) { added.push_back(t.name); }));
        connections.push_back(events.toolUpdated.connect(
            [this](const ToolMetadata& current, const ToolMetadata&) { updated.push_back(current.name); }));
        connections.push_back(events.toolRemoved.connect(
            [this](const std::string&, const std::string& name) { removed.push_back(name); }));
        connections.push_back(events.cacheUpdated.connect(
            [this](const std::string& serverId, size_t count) { cacheUpdates.emplace_back(serverId, count); }));
        connections.push_back(events.discoveryError.connect(
            [this](const std::string& serverId, const Error& error) { errors.emplace_back(serverId, error); }));
    }
};
} // namespace

TEST_CASE("inferToolCategory", "[discovery]")
{
    CHECK(inferToolCategory(tool("read_file")) == "filesystem");
    CHECK(inferToolCategory(tool("WriteNotes")) == "filesystem");
    CHECK(inferToolCategory(tool("git_commit")) == "version-control");
    CHECK(inferToolCategory(tool("create_branch")) == "version-control");
    CHECK(inferToolCategory(tool("run_query")) == "database");
    CHECK(inferToolCategory(tool("sql_exec")) == "database");
    CHECK(inferToolCategory(tool("http_get")) == "network");
    CHECK(inferToolCategory(tool("call_api")) == "network");
    CHECK(inferToolCategory(tool("lookup", "Search the index")) == "search");
    CHECK(inferToolCategory(tool("locate", "Find things")) == "search");
    CHECK(inferToolCategory(tool("echo", "Echoes input")) == "general");
}

TEST_CASE("toolSchemaHash", "[discovery]")
{
    auto const hash = toolSchemaHash(tool("echo", "Echoes input"));
    CHECK(hash.size() == 16);
    CHECK(hash == toolSchemaHash(tool("echo", "Echoes input")));
    CHECK(hash != toolSchemaHash(tool("echo", "Echoes its input")));
    CHECK(hash != toolSchemaHash(tool("echo2", "Echoes input")));
}

TEST_CASE("ToolDiscovery::ingest", "[discovery]")
{
    auto io = boost::asio::io_context {};
    auto discovery = std::make_shared<ToolDiscovery>(io);
    auto events = DiscoveryEvents { *discovery };
    auto server = stoppedServer(io, "fs", { "files" });

    auto const first = discovery->ingest(*server, { tool("read_file", "Read"), tool("write_file", "Write") });
    REQUIRE(first.size() == 2);
    CHECK(first[0].serverId == "fs");
    CHECK(first[0].serverName == "fs");
    CHECK(first[0].category == "filesystem");
    CHECK(first[0].tags == std::vector<std::string> { "files" });
    CHECK(first[0].available);
    CHECK(events.added == std::vector<std::string> { "read_file", "write_file" });
    CHECK(events.cacheUpdates.back() == std::pair<std::string, size_t> { "fs", 2 });
    CHECK(names(discovery->getToolsFromServer("fs")) == std::vector<std::string> { "read_file", "write_file" });

    SECTION("a new generation is reported as a difference")
    {
        auto const discoveredAt = discovery->getTool("fs", "read_file")->discoveredAt;

        discovery->ingest(*server, { tool("read_file", "Read a file"), tool("list_dir", "List") });

        CHECK(events.added == std::vector<std::string> { "read_file", "write_file", "list_dir" });
        CHECK(events.updated == std::vector<std::string> { "read_file" });
        CHECK(events.removed == std::vector<std::string> { "write_file" });
        CHECK(!discovery->getTool("fs", "write_file").has_value());
        REQUIRE(discovery->getTool("fs", "read_file").has_value());
        CHECK(discovery->getTool("fs", "read_file")->description == "Read a file");
        CHECK(discovery->getTool("fs", "read_file")->discoveredAt == discoveredAt);
    }

    SECTION("unchanged tools raise no events")
    {
        discovery->ingest(*server, { tool("read_file", "Read"), tool("write_file", "Write") });
        CHECK(events.added.size() == 2);
        CHECK(events.updated.empty());
        CHECK(events.removed.empty());
    }

    SECTION("an empty list removes the server from the cache")
    {
        discovery->ingest(*server, {});
        CHECK(events.removed.size() == 2);
        CHECK(discovery->cachedServerIds().empty());
        CHECK(discovery->getAllTools().empty());
        CHECK(events.cacheUpdates.back() == std::pair<std::string, size_t> { "fs", 0 });
    }

    SECTION("usage statistics survive a rediscovery")
    {
        discovery->updateToolStats("fs", "read_file", 100ms, true);
        discovery->updateToolStats("fs", "read_file", 300ms, false);
        discovery->updateToolStats("fs", "unknown", 300ms, false);

        auto const stats = discovery->getTool("fs", "read_file")->stats;
        CHECK(stats.callCount == 2);
        CHECK(stats.lastUsed.has_value());
        CHECK_THAT(stats.averageExecutionTimeMs, Catch::Matchers::WithinAbs(200.0, 0.001));
        CHECK_THAT(stats.successRate, Catch::Matchers::WithinAbs(0.5, 0.001));

        discovery->ingest(*server, { tool("read_file", "Read") });
        CHECK(discovery->getTool("fs", "read_file")->stats.callCount == 2);
    }
}

TEST_CASE("ToolDiscovery schema validation and limits", "[discovery]")
{
    auto io = boost::asio::io_context {};
    auto server = stoppedServer(io, "mixed");

    auto noType = tool("no_type");
    noType.inputSchema = nlohmann::json::object();
    auto const tools = std::vector { tool("good"), noType, tool(""), tool("good"), tool("also_good") };

    SECTION("invalid and duplicate tools are skipped")
    {
        auto discovery = std::make_shared<ToolDiscovery>(io);
        CHECK(names(discovery->ingest(*server, tools)) == std::vector<std::string> { "also_good", "good" });
    }

    SECTION("validation can be disabled")
    {
        auto discovery = std::make_shared<ToolDiscovery>(io, DiscoveryConfig { .validateSchemas = false });
        CHECK(names(discovery->ingest(*server, tools)) == std::vector<std::string> { "", "also_good", "good", "no_type" });
    }

    SECTION("tools beyond the limit are dropped")
    {
        auto discovery = std::make_shared<ToolDiscovery>(io, DiscoveryConfig { .maxToolsPerServer = 1 });
        CHECK(names(discovery->ingest(*server, tools)) == std::vector<std::string> { "good" });
    }
}

TEST_CASE("ToolDiscovery cache expiry", "[discovery]")
{
    auto io = boost::asio::io_context {};
    auto server = stoppedServer(io, "ttl");
    auto discovery = std::make_shared<ToolDiscovery>(io, DiscoveryConfig { .cacheTtl = 0ms });

    discovery->ingest(*server, { tool("echo") });
    CHECK(discovery->getAllTools().empty());
    CHECK(!discovery->getTool("ttl", "echo").has_value());
    CHECK(discovery->cacheStats().totalTools == 0);
}

TEST_CASE("ToolDiscovery search and categories", "[discovery]")
{
    auto io = boost::asio::io_context {};
    auto discovery = std::make_shared<ToolDiscovery>(io);
    auto dev = stoppedServer(io, "dev", { "dev" });
    auto other = stoppedServer(io, "other");

    discovery->ingest(*dev, { tool("read_file"), tool("git_commit"), tool("run_query") });
    discovery->ingest(*other, { tool("http_get"), tool("lookup", "Search the index"), tool("echo") });

    CHECK(discovery->getAllTools().size() == 6);
    CHECK(names(discovery->searchTools("FILE")) == std::vector<std::string> { "read_file" });
    CHECK(names(discovery->searchTools("index")) == std::vector<std::string> { "lookup" });
    CHECK(names(discovery->searchTools("dev")) == std::vector<std::string> { "git_commit", "read_file", "run_query" });
    CHECK(discovery->searchTools("nothing").empty());

    CHECK(names(discovery->getToolsByCategory("database")) == std::vector<std::string> { "run_query" });
    CHECK(names(discovery->getToolsByCategory("search")) == std::vector<std::string> { "lookup" });
    CHECK(names(discovery->getToolsByCategory("general")) == std::vector<std::string> { "echo" });
    CHECK(discovery->getToolsByCategory("dev").size() == 3);

    auto const stats = discovery->cacheStats();
    CHECK(stats.totalServers == 2);
    CHECK(stats.totalTools == 6);
    CHECK_THAT(stats.averageToolsPerServer, Catch::Matchers::WithinAbs(3.0, 0.001));

    auto events = DiscoveryEvents { *discovery };
    discovery->clearServerCache("dev");
    CHECK(discovery->cachedServerIds() == std::vector<std::string> { "other" });
    CHECK(events.cacheUpdates == std::vector<std::pair<std::string, size_t>> { { "dev", 0 } });

    discovery->clearAllCache();
    CHECK(discovery->getAllTools().empty());
}

TEST_CASE("ToolDiscovery discovers tools from running servers", "[discovery]")
{
    auto io = boost::asio::io_context {};
    auto factory = MockTransportFactory { { makeToolJson("read_file", "Read"), makeToolJson("echo", "Echo") } };
    auto discovery = std::make_shared<ToolDiscovery>(io);
    auto events = DiscoveryEvents { *discovery };

    auto server = *Server::create(io, makeStdioServerConfig("live", "mock"), mockServerOptions(factory));
    REQUIRE(runTask(io, server->start()).has_value());
    auto const transport = factory.latest("live");
    auto const listsAfterStart = transport->requestsFor("tools/list").size();

    SECTION("the cache serves repeated lookups")
    {
        auto const first = runTask(io, discovery->discoverTools(server));
        REQUIRE(first.has_value());
        CHECK(first->size() == 2);

        auto const second = runTask(io, discovery->discoverTools(server));
        REQUIRE(second.has_value());
        CHECK(second->size() == 2);
        CHECK(transport->requestsFor("tools/list").size() == listsAfterStart + 1);

        auto stats = discovery->cacheStats();
        CHECK(stats.hits == 1);
        CHECK(stats.misses == 1);
        CHECK_THAT(stats.hitRate, Catch::Matchers::WithinAbs(0.5, 0.001));

        REQUIRE(runTask(io, discovery->refreshTools(server)).has_value());
        CHECK(transport->requestsFor("tools/list").size() == listsAfterStart + 2);
        CHECK(discovery->cacheStats().misses == 2);
    }

    SECTION("concurrent lookups share one request")
    {
        auto results = std::vector<Result<std::vector<ToolMetadata>>> {};
        for (int i = 0; i < 3; ++i)
            boost::asio::co_spawn(
                io,
                [&]() -> Task<void> { results.push_back(co_await discovery->discoverTools(server)); },
                boost::asio::detached);

        REQUIRE(runUntil(io, [&] { return results.size() == 3; }));
        CHECK(std::ranges::all_of(results, [](const auto& result) { return result && result->size() == 2; }));
        CHECK(transport->requestsFor("tools/list").size() == listsAfterStart + 1);
    }

    SECTION("stopped servers report an error")
    {
        runTask(io, server->stop());
        auto const result = runTask(io, discovery->discoverTools(server));
        REQUIRE(!result.has_value());
        CHECK(result.error().code == ErrorCode::ServerNotRunningError);
        REQUIRE(events.errors.size() == 1);
        CHECK(events.errors[0].first == "live");
    }

    SECTION("tools arriving after the server stopped are discarded")
    {
        transport->answerToolsList = false;

        auto result = std::optional<Result<std::vector<ToolMetadata>>> {};
        boost::asio::co_spawn(
            io,
            [&]() -> Task<void> { result.emplace(co_await discovery->discoverTools(server)); },
            boost::asio::detached);
        REQUIRE(runUntil(io, [&] { return transport->requestsFor("tools/list").size() == listsAfterStart + 1; }));

        auto stopped = false;
        boost::asio::co_spawn(
            io,
            [&]() -> Task<void> {
                co_await server->stop();
                stopped = true;
            },
            boost::asio::detached);
        auto const request = transport->requestsFor("tools/list").back();
        transport->events().message.emit(
            jsonrpc::makeResult(request["id"], nlohmann::json { { "tools", transport->tools } }));

        REQUIRE(runUntil(io, [&] { return result.has_value() && stopped; }));
        REQUIRE(!result->has_value());
        CHECK(result->error().code == ErrorCode::ServerNotRunningError);
        CHECK(discovery->getToolsFromServer("live").empty());
        CHECK(discovery->getAllTools().empty());
        CHECK(events.added.empty());
    }

    SECTION("a stop while the listing is outstanding reports the server as not running")
    {
        transport->answerToolsList = false;

        auto result = std::optional<Result<std::vector<ToolMetadata>>> {};
        boost::asio::co_spawn(
            io,
            [&]() -> Task<void> { result.emplace(co_await discovery->discoverTools(server)); },
            boost::asio::detached);
        REQUIRE(runUntil(io, [&] { return transport->requestsFor("tools/list").size() == listsAfterStart + 1; }));

        runTask(io, server->stop());
        REQUIRE(runUntil(io, [&] { return result.has_value(); }));
        REQUIRE(!result->has_value());
        CHECK(result->error().code == ErrorCode::ServerNotRunningError);
        CHECK(discovery->getToolsFromServer("live").empty());
    }

    SECTION("bulk discovery maps failed servers to empty lists")
    {
        auto idle = *Server::create(io, makeStdioServerConfig("idle", "mock"), mockServerOptions(factory));
        auto const results = runTask(io, discovery->discoverToolsFromServers({ server, idle }));
        REQUIRE(results.size() == 2);
        CHECK(results.at("live").size() == 2);
        CHECK(results.at("idle").empty());
    }

    SECTION("auto-discovery polls while the server runs")
    {
        auto polling = std::make_shared<ToolDiscovery>(
            io, DiscoveryConfig { .cacheTtl = 0ms, .discoveryInterval = 10ms });
        polling->startAutoDiscovery(server);
        REQUIRE(runUntil(io, [&] { return transport->requestsFor("tools/list").size() >= listsAfterStart + 3; }));

        polling->stopAutoDiscovery("live");
        auto const polled = transport->requestsFor("tools/list").size();
        runUntil(io, [] { return false; }, 50ms);
        CHECK(transport->requestsFor("tools/list").size() <= polled + 1);
    }
}
