// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <mcp/ServerConfig.hpp>
#include <mcpvisor/Config.hpp>

#include <memory>
#include <string>

namespace mcpvisor
{

/// @brief Command-line front end: wires the server manager to the config file and runs one command.
///
/// Every command returns a process exit code. SIGINT and SIGTERM shut the manager down and end
/// the running command.
class App
{
  public:
    /// @brief Constructs the application.
    /// @param config The loaded application configuration.
    /// @param configPath The file the server registry is persisted to.
    App(AppConfig config, std::string configPath);
    ~App();

    App(const App&) = delete;
    App& operator=(const App&) = delete;

    /// @brief Prints the status of every configured server after starting the eligible ones.
    [[nodiscard]] auto listServers() -> int;

    /// @brief Prints the discovered tools, optionally filtered by a search text and a category.
    [[nodiscard]] auto listTools(std::string search, std::string category) -> int;

    /// @brief Starts one server, calls one of its tools and prints the result.
    /// @param paramsJson The tool parameters as a JSON text.
    [[nodiscard]] auto callTool(std::string serverId, std::string toolName, std::string paramsJson) -> int;

    /// @brief Runs a connection test against a configured server.
    [[nodiscard]] auto testServer(std::string serverId) -> int;

    /// @brief Supervises all servers and logs their events until a termination signal arrives.
    [[nodiscard]] auto watch() -> int;

    /// @brief Registers and persists a new server without starting it.
    [[nodiscard]] auto addServer(ServerConfig config) -> int;

    /// @brief Removes a server from the persisted registry.
    [[nodiscard]] auto removeServer(std::string serverId) -> int;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace mcpvisor
