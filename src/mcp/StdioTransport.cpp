// SPDX-License-Identifier: Apache-2.0
#include "StdioTransport.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <mcp/JsonRpc.hpp>
#include <mcp/MessageFramer.hpp>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>

#include <array>
#include <cstring>
#include <format>

#include <sys/wait.h>

#include <fcntl.h>
#include <signal.h>
#include <spawn.h>
#include <unistd.h>

extern char** environ;

namespace mcpvisor
{

namespace
{
    constexpr auto ReapPollInterval = std::chrono::milliseconds(20);

    auto describeExitStatus(int status) -> std::string
    {
        if (WIFEXITED(status))
            return std::format("Process exited with code {}", WEXITSTATUS(status));
        if (WIFSIGNALED(status))
            return std::format("Process terminated by signal {}", WTERMSIG(status));
        return "Process exited";
    }

    auto makePipe(int fds[2]) -> bool
    {
        if (::pipe(fds) != 0)
            return false;
        ::fcntl(fds[0], F_SETFD, FD_CLOEXEC);
        ::fcntl(fds[1], F_SETFD, FD_CLOEXEC);
        return true;
    }

    void closePipe(int fds[2])
    {
        ::close(fds[0]);
        ::close(fds[1]);
    }

    auto resolveExecutable(const std::string& command, std::string_view searchPath) -> std::string
    {
        if (command.find('/') != std::string::npos)
            return command;

        while (!searchPath.empty())
        {
            auto const sep = searchPath.find(':');
            auto const dir = searchPath.substr(0, sep);
            auto const candidate = std::format("{}/{}", dir.empty() ? "." : dir, command);
            if (::access(candidate.c_str(), X_OK) == 0)
                return candidate;
            if (sep == std::string_view::npos)
                break;
            searchPath.remove_prefix(sep + 1);
        }
        return command;
    }
} // namespace

auto buildChildEnvironment(const std::vector<std::string>& customPaths,
                           const std::map<std::string, std::string>& overrides)
    -> std::map<std::string, std::string>
{
    auto env = std::map<std::string, std::string> {};
    if (environ)
    {
        for (auto** e = environ; *e; ++e)
        {
            auto const entry = std::string_view(*e);
            auto const eq = entry.find('=');
            if (eq == std::string_view::npos || eq == 0)
                continue;
            env.emplace(std::string(entry.substr(0, eq)), std::string(entry.substr(eq + 1)));
        }
    }

    if (!customPaths.empty())
    {
        auto path = std::string {};
        for (const auto& entry: customPaths)
        {
            if (entry.empty())
                continue;
            if (!path.empty())
                path += ':';
            path += entry;
        }
        if (auto const it = env.find("PATH"); it != env.end() && !it->second.empty())
            path = path.empty() ? it->second : std::format("{}:{}", path, it->second);
        env["PATH"] = std::move(path);
    }

    for (const auto& [key, value]: overrides)
        env[key] = value;

    return env;
}

struct StdioTransport::Impl
{
    Impl(boost::asio::io_context& io, StdioTransportConfig config):
        io(io), config(std::move(config)), stdinPipe(io), stdoutPipe(io), stderrPipe(io), writeLock(io)
    {
    }

    boost::asio::io_context& io;
    StdioTransportConfig config;
    boost::asio::posix::stream_descriptor stdinPipe;
    boost::asio::posix::stream_descriptor stdoutPipe;
    boost::asio::posix::stream_descriptor stderrPipe;
    pid_t childPid = -1;
    bool connected = false;
    bool announced = false;
    uint64_t session = 0;
    MessageFramer stdoutFramer;
    MessageFramer stderrFramer;
    AsyncLock writeLock;
};

StdioTransport::StdioTransport(boost::asio::io_context& io, StdioTransportConfig config):
    _impl(std::make_unique<Impl>(io, std::move(config)))
{
}

StdioTransport::~StdioTransport()
{
    closePipes();
    if (_impl->childPid > 0)
    {
        ::kill(_impl->childPid, SIGKILL);
        int status = 0;
        ::waitpid(_impl->childPid, &status, 0);
        _impl->childPid = -1;
    }
}

auto StdioTransport::connect() -> Task<VoidResult>
{
    auto const& config = _impl->config;

    if (_impl->connected)
        co_return makeError(ErrorCode::ConnectionError, "Transport already connected");
    if (config.command.empty())
        co_return makeError(ErrorCode::ConnectionError, "No command configured");

    // Writes to an exited child must fail with EPIPE rather than terminate this process.
    static auto const sigpipeIgnored = [] {
        ::signal(SIGPIPE, SIG_IGN);
        return true;
    }();
    (void) sigpipeIgnored;

    int stdinPipe[2];
    int stdoutPipe[2];
    int stderrPipe[2];

    if (!makePipe(stdinPipe))
        co_return makeError(ErrorCode::ConnectionError, "Failed to create stdin pipe");
    if (!makePipe(stdoutPipe))
    {
        closePipe(stdinPipe);
        co_return makeError(ErrorCode::ConnectionError, "Failed to create stdout pipe");
    }
    if (!makePipe(stderrPipe))
    {
        closePipe(stdinPipe);
        closePipe(stdoutPipe);
        co_return makeError(ErrorCode::ConnectionError, "Failed to create stderr pipe");
    }

    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    posix_spawn_file_actions_adddup2(&actions, stdinPipe[0], STDIN_FILENO);
    posix_spawn_file_actions_adddup2(&actions, stdoutPipe[1], STDOUT_FILENO);
    posix_spawn_file_actions_adddup2(&actions, stderrPipe[1], STDERR_FILENO);
    if (!config.cwd.empty())
        posix_spawn_file_actions_addchdir_np(&actions, config.cwd.c_str());

    // Build environment (inherit + custom PATH entries + config overrides)
    auto const env = buildChildEnvironment(config.customPaths, config.env);
    auto envStrings = std::vector<std::string> {};
    envStrings.reserve(env.size());
    for (const auto& [key, value]: env)
        envStrings.push_back(std::format("{}={}", key, value));

    auto envp = std::vector<char*> {};
    for (auto& s: envStrings)
        envp.push_back(s.data());
    envp.push_back(nullptr);

    // Resolve against the child's PATH, which may include custom entries.
    auto const pathIt = env.find("PATH");
    auto executable =
        resolveExecutable(config.command, pathIt != env.end() ? std::string_view(pathIt->second) : "");

    // Build argv
    auto argv = std::vector<char*> {};
    auto cmdCopy = config.command;
    argv.push_back(cmdCopy.data());
    auto argCopies = std::vector<std::string>(config.args);
    for (auto& arg: argCopies)
        argv.push_back(arg.data());
    argv.push_back(nullptr);

    pid_t pid = -1;
    auto const status = posix_spawnp(&pid, executable.c_str(), &actions, nullptr, argv.data(), envp.data());
    posix_spawn_file_actions_destroy(&actions);

    ::close(stdinPipe[0]);
    ::close(stdoutPipe[1]);
    ::close(stderrPipe[1]);

    if (status != 0)
    {
        ::close(stdinPipe[1]);
        ::close(stdoutPipe[0]);
        ::close(stderrPipe[0]);
        co_return makeError(ErrorCode::ConnectionError,
                            std::format("Failed to spawn process '{}': {}", config.command, strerror(status)));
    }

    _impl->childPid = pid;
    _impl->stdinPipe.assign(stdinPipe[1]);
    _impl->stdoutPipe.assign(stdoutPipe[0]);
    _impl->stderrPipe.assign(stderrPipe[0]);
    _impl->stdoutFramer.reset();
    _impl->stderrFramer.reset();
    _impl->connected = true;
    _impl->announced = false;
    auto const session = ++_impl->session;

    auto self = shared_from_this();
    boost::asio::co_spawn(
        _impl->io, [self, session]() { return self->readStdout(session); }, boost::asio::detached);
    boost::asio::co_spawn(
        _impl->io, [self, session]() { return self->readStderr(session); }, boost::asio::detached);

    log::info("MCP server started: {} (pid {})", config.command, pid);
    _events.connected.emit();
    co_return VoidResult {};
}

auto StdioTransport::send(const nlohmann::json& message) -> Task<VoidResult>
{
    if (!_impl->connected)
        co_return makeError(ErrorCode::ConnectionError, "Transport not connected");

    auto serialized = jsonrpc::serialize(message);
    if (!serialized)
        co_return std::unexpected(serialized.error());
    auto const data = std::move(*serialized) + "\n";

    auto const guard = co_await _impl->writeLock.acquire();
    if (!_impl->connected)
        co_return makeError(ErrorCode::ConnectionError, "Transport not connected");

    auto ec = boost::system::error_code {};
    co_await boost::asio::async_write(
        _impl->stdinPipe, boost::asio::buffer(data), boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    if (ec)
        co_return makeError(ErrorCode::ConnectionError,
                            std::format("Failed to write to process stdin: {}", ec.message()));

    co_return VoidResult {};
}

auto StdioTransport::disconnect() -> Task<void>
{
    if (!_impl->connected && _impl->childPid <= 0)
        co_return;

    auto self = shared_from_this();
    auto const wasConnected = _impl->connected;
    _impl->connected = false;
    ++_impl->session;

    // Closing stdin is the polite request to exit; SIGTERM follows right away.
    auto ec = boost::system::error_code {};
    _impl->stdinPipe.close(ec);
    if (_impl->childPid > 0)
    {
        ::kill(_impl->childPid, SIGTERM);
        auto const exitStatus = co_await reapChild(_impl->config.shutdownTimeout);
        log::debug("MCP server '{}' stopped: {}", _impl->config.command, exitStatus);
    }

    closePipes();
    if (wasConnected)
        announceDisconnect(true, "Disconnected");
}

void StdioTransport::close()
{
    auto const wasConnected = _impl->connected;
    _impl->connected = false;
    ++_impl->session;

    closePipes();
    if (_impl->childPid > 0)
    {
        ::kill(_impl->childPid, SIGKILL);
        int status = 0;
        ::waitpid(_impl->childPid, &status, 0);
        _impl->childPid = -1;
    }

    log::debug("MCP transport closed");
    if (wasConnected)
        announceDisconnect(true, "Transport closed");
}

auto StdioTransport::isConnected() const -> bool
{
    return _impl->connected;
}

auto StdioTransport::processId() const -> std::optional<int>
{
    if (_impl->childPid > 0)
        return static_cast<int>(_impl->childPid);
    return std::nullopt;
}

auto StdioTransport::readStdout(uint64_t session) -> Task<void>
{
    auto buffer = std::array<char, 4096> {};
    auto ec = boost::system::error_code {};

    while (true)
    {
        auto const bytesRead = co_await _impl->stdoutPipe.async_read_some(
            boost::asio::buffer(buffer), boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        if (ec || session != _impl->session)
            break;

        for (const auto& line: _impl->stdoutFramer.feed(std::string_view(buffer.data(), bytesRead)))
        {
            auto message = json::parse(line);
            if (!message)
            {
                log::warning("Malformed message from '{}': {}", _impl->config.command, message.error().message);
                _events.error.emit(message.error());
                continue;
            }
            _events.message.emit(*message);
            if (session != _impl->session)
                co_return;
        }
    }

    if (session != _impl->session)
        co_return;

    // The server closed its stdout on its own.
    _impl->connected = false;
    ++_impl->session;
    auto closeError = boost::system::error_code {};
    _impl->stdinPipe.close(closeError);
    auto const reason = co_await reapChild(_impl->config.shutdownTimeout);
    closePipes();

    log::warning("MCP server '{}' exited unexpectedly: {}", _impl->config.command, reason);
    announceDisconnect(false, reason);
}

auto StdioTransport::readStderr(uint64_t session) -> Task<void>
{
    auto buffer = std::array<char, 4096> {};
    auto ec = boost::system::error_code {};

    while (true)
    {
        auto const bytesRead = co_await _impl->stderrPipe.async_read_some(
            boost::asio::buffer(buffer), boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        if (ec || session != _impl->session)
            co_return;

        for (const auto& line: _impl->stderrFramer.feed(std::string_view(buffer.data(), bytesRead)))
        {
            log::debug("[{} stderr] {}", _impl->config.command, line);
            _events.diagnostic.emit(line);
        }
    }
}

auto StdioTransport::reapChild(std::chrono::milliseconds timeout) -> Task<std::string>
{
    auto const deadline = std::chrono::steady_clock::now() + timeout;
    while (_impl->childPid > 0)
    {
        int status = 0;
        auto const result = ::waitpid(_impl->childPid, &status, WNOHANG);
        if (result == _impl->childPid)
        {
            _impl->childPid = -1;
            co_return describeExitStatus(status);
        }
        if (result < 0)
        {
            _impl->childPid = -1;
            co_return "Process exited";
        }

        if (std::chrono::steady_clock::now() >= deadline)
        {
            log::warning("MCP server '{}' did not exit within {} ms, killing it",
                         _impl->config.command,
                         timeout.count());
            ::kill(_impl->childPid, SIGKILL);
            ::waitpid(_impl->childPid, &status, 0);
            _impl->childPid = -1;
            co_return "Process killed after shutdown timeout";
        }

        co_await sleepFor(_impl->io, ReapPollInterval);
    }
    co_return "Process exited";
}

void StdioTransport::closePipes()
{
    auto ec = boost::system::error_code {};
    _impl->stdinPipe.close(ec);
    _impl->stdoutPipe.close(ec);
    _impl->stderrPipe.close(ec);
}

void StdioTransport::announceDisconnect(bool expected, std::string reason)
{
    if (_impl->announced)
        return;
    _impl->announced = true;
    _events.disconnected.emit(DisconnectInfo { .expected = expected, .reason = std::move(reason) });
}

} // namespace mcpvisor
