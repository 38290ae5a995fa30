// SPDX-License-Identifier: Apache-2.0
#include "App.hpp"

#include <core/Async.hpp>
#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <core/Signal.hpp>
#include <mcp/ServerManager.hpp>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include <algorithm>
#include <csignal>
#include <exception>
#include <format>
#include <functional>
#include <print>
#include <string>
#include <vector>

namespace mcpvisor
{

namespace
{
    auto formatUptime(std::chrono::milliseconds uptime) -> std::string
    {
        auto const seconds = std::chrono::duration_cast<std::chrono::seconds>(uptime).count();
        if (seconds < 60)
            return std::format("{}s", seconds);
        if (seconds < 3600)
            return std::format("{}m{:02}s", seconds / 60, seconds % 60);
        return std::format("{}h{:02}m", seconds / 3600, (seconds % 3600) / 60);
    }

    auto matchesCategory(const ToolMetadata& tool, std::string_view category) -> bool
    {
        if (tool.category == category)
            return true;
        return std::ranges::any_of(tool.tags, [category](const auto& tag) { return tag == category; });
    }
} // namespace

struct App::Impl
{
    AppConfig config;
    std::string configPath;
    boost::asio::io_context io;
    std::shared_ptr<ServerManager> manager;
    std::vector<Connection> connections;
    std::shared_ptr<AsyncEvent> stopRequested;

    Impl(AppConfig cfg, std::string path):
        config(std::move(cfg)), configPath(std::move(path)), stopRequested(std::make_shared<AsyncEvent>(io))
    {
    }

    /// @brief Creates the manager backed by the config file.
    /// @param autoStart Whether loading the registry starts the eligible servers.
    void createManager(bool autoStart)
    {
        auto options = makeManagerOptions(config);
        options.autoStart = autoStart;
        manager = std::make_shared<ServerManager>(io, std::move(options));
        manager->setStorage(std::make_shared<JsonFileConfigStorage>(configPath));
    }

    /// @brief Runs @p command on the event loop, shutting the manager down afterwards.
    /// @return The command's exit code.
    auto run(std::function<Task<int>()> command) -> int
    {
        auto signals = boost::asio::signal_set(io, SIGINT, SIGTERM);
        signals.async_wait([this](const boost::system::error_code& ec, int signo) {
            if (ec)
                return;
            log::info("Received signal {}, shutting down", signo);
            stopRequested->set();
            boost::asio::co_spawn(io, manager->shutdown(), boost::asio::detached);
        });

        auto exitCode = 1;
        boost::asio::co_spawn(
            io,
            [this, command = std::move(command)]() -> Task<int> {
                auto const code = co_await command();
                co_await manager->shutdown();
                co_return code;
            },
            [&](std::exception_ptr error, int code) {
                signals.cancel();
                if (error)
                {
                    try
                    {
                        std::rethrow_exception(error);
                    }
                    catch (const std::exception& e)
                    {
                        log::error("Command failed: {}", e.what());
                    }
                    exitCode = 1;
                }
                else
                    exitCode = code;
                io.stop();
            });

        io.run();
        return exitCode;
    }

    /// @brief Loads the persisted registry.
    /// @return False after reporting a failure.
    auto load() -> Task<bool>
    {
        auto const loaded = co_await manager->loadConfiguration();
        if (!loaded)
        {
            std::println(stderr, "Failed to load server configuration: {}", loaded.error().message);
            co_return false;
        }
        co_return true;
    }

    void watchEvents()
    {
        auto& events = manager->events();
        connections.push_back(
            events.serverStatusChanged.connect([](const std::string& id, ServerStatus status, ServerStatus previous) {
                log::info("[{}] {} -> {}", id, serverStatusName(previous), serverStatusName(status));
            }));
        connections.push_back(
            events.serverHealthChanged.connect([](const std::string& id, ServerHealth health, ServerHealth previous) {
                log::info("[{}] health {} -> {}", id, serverHealthName(previous), serverHealthName(health));
            }));
        connections.push_back(events.serverError.connect(
            [](const std::string& id, const Error& error) { log::warning("[{}] {}", id, error); }));
        connections.push_back(events.serverRestart.connect([](const std::string& id, const RestartEvent& restart) {
            log::info("[{}] restart {}/{} in {} ms",
                      id,
                      restart.attempt,
                      restart.maxAttempts,
                      restart.delay.count());
        }));
        connections.push_back(
            events.toolsDiscovered.connect([](const std::string& id, const std::vector<ToolMetadata>& tools) {
                log::info("[{}] {} tools available", id, tools.size());
            }));

        auto& discovery = manager->discovery()->events();
        connections.push_back(discovery.toolAdded.connect(
            [](const ToolMetadata& tool) { log::info("[{}] tool added: {}", tool.serverId, tool.name); }));
        connections.push_back(discovery.toolUpdated.connect([](const ToolMetadata& tool, const ToolMetadata&) {
            log::info("[{}] tool updated: {}", tool.serverId, tool.name);
        }));
        connections.push_back(
            discovery.toolRemoved.connect([](const std::string& serverId, const std::string& name) {
                log::info("[{}] tool removed: {}", serverId, name);
            }));
    }
};

App::App(AppConfig config, std::string configPath):
    _impl(std::make_unique<Impl>(std::move(config), std::move(configPath)))
{
}

App::~App() = default;

auto App::listServers() -> int
{
    _impl->createManager(true);
    return _impl->run([this]() -> Task<int> {
        if (!co_await _impl->load())
            co_return 1;

        auto const& manager = *_impl->manager;
        if (manager.serverCount() == 0)
        {
            std::println("No MCP servers configured in {}", _impl->configPath);
            co_return 0;
        }

        std::println("{:<20} {:<11} {:<10} {:>5} {:>8} {:>8}  {}",
                     "ID", "STATUS", "HEALTH", "TOOLS", "PID", "UPTIME", "NAME");
        for (const auto& [id, report]: manager.getServerStatuses())
        {
            auto const config = manager.getServerConfig(id);
            std::println("{:<20} {:<11} {:<10} {:>5} {:>8} {:>8}  {}",
                         id,
                         serverStatusName(report.status),
                         serverHealthName(report.health),
                         report.stats.toolCount,
                         report.stats.pid ? std::to_string(*report.stats.pid) : "-",
                         report.stats.startTime ? formatUptime(report.stats.uptime) : "-",
                         config ? config->displayName() : id);
            if (!report.stats.lastError.empty())
                std::println("{:<20} last error: {}", "", report.stats.lastError);
        }

        auto const stats = manager.getManagerStats();
        std::println("\n{} servers, {} running, {} healthy, {} tools",
                     stats.totalServers,
                     stats.runningServers,
                     stats.healthyServers,
                     stats.totalTools);
        co_return 0;
    });
}

auto App::listTools(std::string search, std::string category) -> int
{
    _impl->createManager(true);
    return _impl->run([this, search = std::move(search), category = std::move(category)]() -> Task<int> {
        if (!co_await _impl->load())
            co_return 1;

        auto const& discovery = *_impl->manager->discovery();
        auto tools = search.empty() ? discovery.getAllTools() : discovery.searchTools(search);
        if (!category.empty())
            std::erase_if(tools, [&](const ToolMetadata& tool) { return !matchesCategory(tool, category); });

        if (tools.empty())
        {
            std::println("No tools found");
            co_return 0;
        }

        for (const auto& tool: tools)
        {
            std::println("{}/{} [{}]", tool.serverId, tool.name, tool.category);
            if (!tool.description.empty())
                std::println("    {}", tool.description);
        }
        co_return 0;
    });
}

auto App::callTool(std::string serverId, std::string toolName, std::string paramsJson) -> int
{
    auto params = nlohmann::json::object();
    if (!paramsJson.empty())
    {
        auto parsed = json::parse(paramsJson);
        if (!parsed)
        {
            std::println(stderr, "Invalid --params: {}", parsed.error().message);
            return 1;
        }
        params = std::move(*parsed);
    }

    _impl->createManager(false);
    return _impl->run([this,
                       serverId = std::move(serverId),
                       toolName = std::move(toolName),
                       params = std::move(params)]() mutable -> Task<int> {
        if (!co_await _impl->load())
            co_return 1;

        auto& manager = *_impl->manager;
        if (auto const started = co_await manager.startServer(serverId); !started)
        {
            std::println(stderr, "Failed to start server '{}': {}", serverId, started.error().message);
            co_return 1;
        }

        auto const result = co_await manager.executeToolCall(serverId, toolName, std::move(params));
        if (!result)
        {
            std::println(stderr, "{}", result.error().message);
            co_return 1;
        }

        if (!result->content.empty())
            std::println("{}", result->content);
        else
            std::println("{}", result->raw.dump(2));
        co_return result->isError ? 1 : 0;
    });
}

auto App::testServer(std::string serverId) -> int
{
    _impl->createManager(false);
    return _impl->run([this, serverId = std::move(serverId)]() -> Task<int> {
        if (!co_await _impl->load())
            co_return 1;

        auto& manager = *_impl->manager;
        auto const config = manager.getServerConfig(serverId);
        if (!config)
        {
            std::println(stderr, "Server '{}' not found", serverId);
            co_return 1;
        }

        auto const result = co_await manager.testServerConnection(*config);
        if (!result.success)
        {
            std::println("{}: FAILED after {} ms: {}", serverId, result.latency.count(), result.error);
            co_return 1;
        }

        std::println("{}: OK in {} ms", serverId, result.latency.count());
        if (!result.serverName.empty())
            std::println("  server: {} {}", result.serverName, result.serverVersion);
        std::println("  tools:  {}", result.toolCount);
        co_return 0;
    });
}

auto App::watch() -> int
{
    _impl->createManager(true);
    _impl->watchEvents();
    return _impl->run([this]() -> Task<int> {
        if (!co_await _impl->load())
            co_return 1;

        log::info("Supervising {} MCP servers, press Ctrl+C to stop", _impl->manager->serverCount());
        co_await _impl->stopRequested->wait();
        co_return 0;
    });
}

auto App::addServer(ServerConfig config) -> int
{
    _impl->createManager(false);
    return _impl->run([this, config = std::move(config)]() mutable -> Task<int> {
        if (!co_await _impl->load())
            co_return 1;

        auto& manager = *_impl->manager;
        auto id = config.id;
        if (auto const added = co_await manager.addServer(id, std::move(config)); !added)
        {
            std::println(stderr, "{}", added.error().message);
            co_return 1;
        }
        if (auto const saved = manager.saveConfiguration(); !saved)
        {
            std::println(stderr, "Failed to save configuration: {}", saved.error().message);
            co_return 1;
        }

        std::println("Added server '{}'", id);
        co_return 0;
    });
}

auto App::removeServer(std::string serverId) -> int
{
    _impl->createManager(false);
    return _impl->run([this, serverId = std::move(serverId)]() -> Task<int> {
        if (!co_await _impl->load())
            co_return 1;

        auto& manager = *_impl->manager;
        if (auto const removed = co_await manager.removeServer(serverId); !removed)
        {
            std::println(stderr, "{}", removed.error().message);
            co_return 1;
        }
        if (auto const saved = manager.saveConfiguration(); !saved)
        {
            std::println(stderr, "Failed to save configuration: {}", saved.error().message);
            co_return 1;
        }

        std::println("Removed server '{}'", serverId);
        co_return 0;
    });
}

} // namespace mcpvisor
