// SPDX-License-Identifier: Apache-2.0
#include <core/Log.hpp>
#include <mcp/ServerConfig.hpp>
#include <mcpvisor/App.hpp>
#include <mcpvisor/Config.hpp>

#include <CLI/CLI.hpp>

#include <filesystem>
#include <format>
#include <print>
#include <string>
#include <vector>

int main(int argc, char** argv)
{
    auto app = CLI::App { "mcpvisor - supervisor and client for Model Context Protocol servers" };
    app.require_subcommand(1);

    auto configPath = std::string {};
    auto verbose = false;

    app.add_option("-c,--config", configPath, "Path to config file");
    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");

    auto* servers = app.add_subcommand("servers", "Start the configured servers and show their status");

    auto search = std::string {};
    auto category = std::string {};
    auto* tools = app.add_subcommand("tools", "List the tools of all configured servers");
    tools->add_option("--search", search, "Case-insensitive text to look for in names, descriptions and tags");
    tools->add_option("--category", category, "Only show tools of this category or tag");

    auto serverId = std::string {};
    auto toolName = std::string {};
    auto params = std::string {};
    auto* call = app.add_subcommand("call", "Call a tool on a server");
    call->add_option("server", serverId, "Server id")->required();
    call->add_option("tool", toolName, "Tool name")->required();
    call->add_option("--params", params, "Tool parameters as a JSON object");

    auto* test = app.add_subcommand("test", "Test the connection to a configured server");
    test->add_option("server", serverId, "Server id")->required();

    auto* watch = app.add_subcommand("watch", "Supervise all servers until interrupted");

    auto command = std::string {};
    auto args = std::vector<std::string> {};
    auto url = std::string {};
    auto templateId = std::string {};
    auto name = std::string {};
    auto disabled = false;
    auto* add = app.add_subcommand("add", "Add a server to the configuration");
    add->add_option("id", serverId, "Server id")->required();
    auto* commandOption = add->add_option("--command", command, "Executable of a stdio server");
    add->add_option("--arg", args, "Argument passed to the command (repeatable)")->needs(commandOption);
    auto* urlOption = add->add_option("--url", url, "URL of a socket server (ws:// or wss://)");
    auto* templateOption = add->add_option("--template", templateId, "Create the server from a built-in template");
    add->add_option("--name", name, "Display name");
    add->add_flag("--disabled", disabled, "Add the server disabled");
    commandOption->excludes(urlOption)->excludes(templateOption);
    urlOption->excludes(templateOption);

    auto* remove = app.add_subcommand("remove", "Remove a server from the configuration");
    remove->add_option("id", serverId, "Server id")->required();

    CLI11_PARSE(app, argc, argv);

    // Load config
    if (configPath.empty())
        configPath = mcpvisor::defaultConfigPath();
    auto configResult = std::filesystem::exists(configPath) ? mcpvisor::loadConfigFromFile(configPath)
                                                            : mcpvisor::Result<mcpvisor::AppConfig> {};
    if (!configResult)
    {
        mcpvisor::log::error("Failed to load config: {}", configResult.error().message);
        return 1;
    }

    auto& config = *configResult;
    if (auto const level = mcpvisor::log::levelFromString(config.logLevel))
        mcpvisor::log::setLevel(*level);
    if (verbose)
        mcpvisor::log::setLevel(mcpvisor::log::Level::Debug);

    auto application = mcpvisor::App(std::move(config), configPath);

    if (*servers)
        return application.listServers();
    if (*tools)
        return application.listTools(search, category);
    if (*call)
        return application.callTool(serverId, toolName, params);
    if (*test)
        return application.testServer(serverId);
    if (*watch)
        return application.watch();
    if (*remove)
        return application.removeServer(serverId);

    // add
    auto serverConfig = mcpvisor::ServerConfig {};
    if (!templateId.empty())
    {
        auto fromTemplate = mcpvisor::makeServerConfigFromTemplate(templateId, serverId);
        if (!fromTemplate)
        {
            std::println(stderr, "{}", fromTemplate.error().message);
            return 1;
        }
        serverConfig = std::move(*fromTemplate);
    }
    else if (!url.empty())
        serverConfig = mcpvisor::makeSocketServerConfig(serverId, url);
    else if (!command.empty())
        serverConfig = mcpvisor::makeStdioServerConfig(serverId, command, args);
    else
    {
        std::println(stderr, "add needs one of --command, --url or --template");
        return 1;
    }

    if (!name.empty())
        serverConfig.name = name;
    serverConfig.enabled = !disabled;
    return application.addServer(std::move(serverConfig));
}
