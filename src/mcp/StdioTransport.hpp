// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <mcp/Transport.hpp>

#include <boost/asio/io_context.hpp>

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace mcpvisor
{

/// @brief Configuration for spawning an MCP server process.
struct StdioTransportConfig
{
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;
    std::string cwd;                      // working directory; empty inherits ours
    std::vector<std::string> customPaths; // prepended to PATH
    std::chrono::milliseconds shutdownTimeout { 5000 };
};

/// @brief Builds the environment for a child process.
///
/// The current environment is inherited, @p customPaths are prepended to PATH and
/// @p overrides replace inherited entries.
[[nodiscard]] auto buildChildEnvironment(const std::vector<std::string>& customPaths,
                                         const std::map<std::string, std::string>& overrides)
    -> std::map<std::string, std::string>;

/// @brief Transport that communicates with an MCP server via stdio pipes.
///
/// Spawns a child process and exchanges newline-delimited JSON over its stdin/stdout.
/// The child's stderr is forwarded as diagnostic text. Must be created with std::make_shared.
class StdioTransport: public Transport, public std::enable_shared_from_this<StdioTransport>
{
  public:
    StdioTransport(boost::asio::io_context& io, StdioTransportConfig config);
    ~StdioTransport() override;

    StdioTransport(const StdioTransport&) = delete;
    StdioTransport& operator=(const StdioTransport&) = delete;

    [[nodiscard]] auto connect() -> Task<VoidResult> override;
    [[nodiscard]] auto send(const nlohmann::json& message) -> Task<VoidResult> override;
    [[nodiscard]] auto disconnect() -> Task<void> override;
    void close() override;
    [[nodiscard]] auto isConnected() const -> bool override;
    [[nodiscard]] auto processId() const -> std::optional<int> override;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;

    [[nodiscard]] auto readStdout(uint64_t session) -> Task<void>;
    [[nodiscard]] auto readStderr(uint64_t session) -> Task<void>;
    [[nodiscard]] auto reapChild(std::chrono::milliseconds timeout) -> Task<std::string>;
    void closePipes();
    void announceDisconnect(bool expected, std::string reason);
};

} // namespace mcpvisor
