// SPDX-License-Identifier: Apache-2.0
#include "SocketTransport.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <mcp/JsonRpc.hpp>
#include <mcp/Url.hpp>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>

#include <format>

#include <openssl/err.h>
#include <openssl/ssl.h>

namespace mcpvisor
{

namespace beast = boost::beast;
namespace websocket = boost::beast::websocket;
namespace ssl = boost::asio::ssl;
using tcp = boost::asio::ip::tcp;

/// @brief One WebSocket connection, plain or TLS.
class detail::SocketChannel
{
  public:
    virtual ~SocketChannel() = default;

    [[nodiscard]] virtual auto open(const Url& url, std::chrono::milliseconds timeout)
        -> Task<boost::system::error_code> = 0;
    [[nodiscard]] virtual auto write(std::string_view text) -> Task<boost::system::error_code> = 0;
    [[nodiscard]] virtual auto read(std::string& text) -> Task<boost::system::error_code> = 0;
    [[nodiscard]] virtual auto closeGracefully(std::chrono::milliseconds timeout) -> Task<void> = 0;
    virtual void abort() = 0;
};

namespace
{
    auto hostHeader(const Url& url) -> std::string
    {
        auto const defaultPort = url.isSecure() ? "443" : "80";
        if (url.port == defaultPort)
            return url.host;
        return std::format("{}:{}", url.host, url.port);
    }

    template <typename Stream>
    class WebSocketChannel: public detail::SocketChannel
    {
      public:
        template <typename... Args>
        explicit WebSocketChannel(Args&&... args): _ws(std::forward<Args>(args)...)
        {
        }

        auto write(std::string_view text) -> Task<boost::system::error_code> override
        {
            auto ec = boost::system::error_code {};
            co_await _ws.async_write(boost::asio::buffer(text.data(), text.size()),
                                     boost::asio::redirect_error(boost::asio::use_awaitable, ec));
            co_return ec;
        }

        auto read(std::string& text) -> Task<boost::system::error_code> override
        {
            auto buffer = beast::flat_buffer {};
            auto ec = boost::system::error_code {};
            co_await _ws.async_read(buffer, boost::asio::redirect_error(boost::asio::use_awaitable, ec));
            if (!ec)
                text = beast::buffers_to_string(buffer.data());
            co_return ec;
        }

        auto closeGracefully(std::chrono::milliseconds timeout) -> Task<void> override
        {
            if (!_ws.is_open())
                co_return;

            auto opt = websocket::stream_base::timeout {};
            opt.handshake_timeout = timeout;
            opt.idle_timeout = websocket::stream_base::none();
            opt.keep_alive_pings = false;
            _ws.set_option(opt);

            auto ec = boost::system::error_code {};
            co_await _ws.async_close(websocket::close_code::normal,
                                     boost::asio::redirect_error(boost::asio::use_awaitable, ec));
            if (ec)
                log::debug("WebSocket close handshake failed: {}", ec.message());
        }

        void abort() override { beast::get_lowest_layer(_ws).close(); }

      protected:
        auto connectAndUpgrade(const Url& url, std::chrono::milliseconds timeout, auto&& betweenSteps)
            -> Task<boost::system::error_code>
        {
            auto ec = boost::system::error_code {};
            auto resolver = tcp::resolver(_ws.get_executor());
            auto const endpoints = co_await resolver.async_resolve(
                url.host, url.port, boost::asio::redirect_error(boost::asio::use_awaitable, ec));
            if (ec)
                co_return ec;

            auto& socket = beast::get_lowest_layer(_ws);
            socket.expires_after(timeout);
            co_await socket.async_connect(endpoints, boost::asio::redirect_error(boost::asio::use_awaitable, ec));
            if (ec)
                co_return ec;

            ec = co_await betweenSteps();
            if (ec)
                co_return ec;

            // The websocket stream manages its own timeouts from here on.
            socket.expires_never();
            _ws.set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));
            _ws.set_option(websocket::stream_base::decorator([](websocket::request_type& req) {
                req.set(beast::http::field::user_agent, "mcpvisor");
            }));
            _ws.text(true);

            co_await _ws.async_handshake(
                hostHeader(url), url.target, boost::asio::redirect_error(boost::asio::use_awaitable, ec));
            co_return ec;
        }

        websocket::stream<Stream> _ws;
    };

    class PlainChannel: public WebSocketChannel<beast::tcp_stream>
    {
      public:
        explicit PlainChannel(boost::asio::io_context& io): WebSocketChannel(io) {}

        auto open(const Url& url, std::chrono::milliseconds timeout) -> Task<boost::system::error_code> override
        {
            co_return co_await connectAndUpgrade(
                url, timeout, []() -> Task<boost::system::error_code> { co_return boost::system::error_code {}; });
        }
    };

    class TlsChannel: public WebSocketChannel<beast::ssl_stream<beast::tcp_stream>>
    {
      public:
        TlsChannel(boost::asio::io_context& io, std::shared_ptr<ssl::context> context):
            WebSocketChannel(io, *context), _context(std::move(context))
        {
        }

        auto open(const Url& url, std::chrono::milliseconds timeout) -> Task<boost::system::error_code> override
        {
            auto& tls = _ws.next_layer();
            if (!SSL_set_tlsext_host_name(tls.native_handle(), url.host.c_str()))
                co_return boost::system::error_code(static_cast<int>(::ERR_get_error()),
                                                    boost::asio::error::get_ssl_category());
            SSL_set1_host(tls.native_handle(), url.host.c_str());

            co_return co_await connectAndUpgrade(url, timeout, [&tls]() -> Task<boost::system::error_code> {
                auto ec = boost::system::error_code {};
                co_await tls.async_handshake(ssl::stream_base::client,
                                             boost::asio::redirect_error(boost::asio::use_awaitable, ec));
                co_return ec;
            });
        }

      private:
        std::shared_ptr<ssl::context> _context;
    };
} // namespace

SocketTransport::SocketTransport(boost::asio::io_context& io, SocketTransportConfig config):
    _io(io), _config(std::move(config)), _writeLock(io)
{
}

SocketTransport::~SocketTransport()
{
    if (_channel)
        _channel->abort();
}

auto SocketTransport::connect() -> Task<VoidResult>
{
    if (_connected)
        co_return makeError(ErrorCode::ConnectionError, "Transport already connected");

    auto url = parseUrl(_config.url);
    if (!url)
        co_return makeError(ErrorCode::ConnectionError, url.error().message);

    if (url->scheme == "http")
        url->scheme = "ws";
    else if (url->scheme == "https")
        url->scheme = "wss";

    auto channel = std::shared_ptr<detail::SocketChannel> {};
    if (url->isSecure())
    {
        auto context = std::make_shared<ssl::context>(ssl::context::tls_client);
        context->set_default_verify_paths();
        context->set_verify_mode(_config.verifyPeer ? ssl::verify_peer : ssl::verify_none);
        channel = std::make_shared<TlsChannel>(_io, std::move(context));
    }
    else
    {
        channel = std::make_shared<PlainChannel>(_io);
    }

    auto self = shared_from_this();
    auto const ec = co_await channel->open(*url, _config.connectTimeout);
    if (ec)
    {
        channel->abort();
        co_return makeError(ErrorCode::ConnectionError,
                            std::format("Failed to connect to {}: {}", _config.url, ec.message()));
    }

    _channel = channel;
    _connected = true;
    _announced = false;
    auto const session = ++_session;

    boost::asio::co_spawn(
        _io, [self, channel, session]() { return self->readLoop(channel, session); }, boost::asio::detached);

    log::info("MCP server connected: {}", _config.url);
    _events.connected.emit();
    co_return VoidResult {};
}

auto SocketTransport::send(const nlohmann::json& message) -> Task<VoidResult>
{
    if (!_connected)
        co_return makeError(ErrorCode::ConnectionError, "Transport not connected");

    auto serialized = jsonrpc::serialize(message);
    if (!serialized)
        co_return std::unexpected(serialized.error());
    auto const data = std::move(*serialized);
    auto channel = _channel;

    auto const guard = co_await _writeLock.acquire();
    if (!_connected || channel != _channel)
        co_return makeError(ErrorCode::ConnectionError, "Transport not connected");

    if (auto const ec = co_await channel->write(data); ec)
        co_return makeError(ErrorCode::ConnectionError, std::format("Failed to send message: {}", ec.message()));

    co_return VoidResult {};
}

auto SocketTransport::disconnect() -> Task<void>
{
    if (!_connected)
        co_return;

    auto self = shared_from_this();
    auto channel = _channel;
    _connected = false;
    ++_session;

    co_await channel->closeGracefully(_config.shutdownTimeout);
    channel->abort();
    announceDisconnect(true, "Disconnected");
}

void SocketTransport::close()
{
    auto const wasConnected = _connected;
    _connected = false;
    ++_session;
    if (_channel)
        _channel->abort();

    log::debug("MCP transport closed");
    if (wasConnected)
        announceDisconnect(true, "Transport closed");
}

auto SocketTransport::isConnected() const -> bool
{
    return _connected;
}

auto SocketTransport::readLoop(std::shared_ptr<detail::SocketChannel> channel, uint64_t session) -> Task<void>
{
    auto text = std::string {};
    auto ec = boost::system::error_code {};

    while (true)
    {
        ec = co_await channel->read(text);
        if (ec || session != _session)
            break;

        auto message = json::parse(text);
        if (!message)
        {
            log::warning("Malformed message from '{}': {}", _config.url, message.error().message);
            _events.error.emit(message.error());
            continue;
        }
        _events.message.emit(*message);
        if (session != _session)
            co_return;
    }

    if (session != _session)
        co_return;

    _connected = false;
    ++_session;
    channel->abort();

    auto const reason = std::format("Connection closed by server: {}", ec.message());
    log::warning("MCP server '{}': {}", _config.url, reason);
    announceDisconnect(false, reason);
}

void SocketTransport::announceDisconnect(bool expected, std::string reason)
{
    if (_announced)
        return;
    _announced = true;
    _events.disconnected.emit(DisconnectInfo { .expected = expected, .reason = std::move(reason) });
}

} // namespace mcpvisor
