//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: CdpConnection.cpp
// Purpose: DevTools protocol websocket client (Boost.Beast, OpenSSL for wss://)
//==========================================================================================================

#include "dtmcp/browser/CdpConnection.hpp"

#include <atomic>
#include <cstdint>
#include <unordered_map>
#include <utility>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>

#include <openssl/ssl.h>

#include <fmt/format.h>

#include "dtmcp/async/AsyncMutex.hpp"
#include "dtmcp/errors/Errors.h"
#include "dtmcp/version.h"
#include "logging/Logger.h"

namespace dtmcp {
namespace browser {

namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
namespace ssl = boost::asio::ssl;
using tcp = net::ip::tcp;

namespace {

// Screenshots and traces arrive as single large frames
constexpr std::size_t kMaxMessageBytes = 256u * 1024u * 1024u;

std::string userAgent() {
    return std::string("dtmcp/") + getVersionString();
}

std::shared_ptr<ssl::context> makeClientTlsContext() {
    auto ctx = std::make_shared<ssl::context>(ssl::context::tls_client);
    try {
        ctx->set_default_verify_paths();
    } catch (const std::exception& e) {
        LOG_DEBUG("TLS: set_default_verify_paths failed: {}", e.what());
    }
    ctx->set_verify_mode(ssl::verify_peer);
    return ctx;
}

void setServerName(SSL* handle, const std::string& host) {
    if (!::SSL_set_tlsext_host_name(handle, host.c_str())) {
        throw errors::BrowserConnectionError(fmt::format("TLS: failed to set SNI hostname {}", host));
    }
    (void)::SSL_set1_host(handle, host.c_str());
}

//----------------------------------------------------------------------------------------------------------
// WsStream: type-erased text websocket over plain TCP or TLS
//----------------------------------------------------------------------------------------------------------
class WsStream {
public:
    virtual ~WsStream() = default;
    virtual net::awaitable<void> Write(std::string text) = 0;
    virtual net::awaitable<std::string> Read() = 0;
    virtual void Close() = 0;
};

template <typename NextLayer>
class BeastWsStream : public WsStream {
public:
    template <typename... Args>
    explicit BeastWsStream(Args&&... args) : ws_(std::forward<Args>(args)...) {}

    websocket::stream<NextLayer>& socket() { return ws_; }

    net::awaitable<void> Write(std::string text) override {
        ws_.text(true);
        co_await ws_.async_write(net::buffer(text), net::use_awaitable);
    }

    net::awaitable<std::string> Read() override {
        buffer_.clear();
        co_await ws_.async_read(buffer_, net::use_awaitable);
        co_return beast::buffers_to_string(buffer_.data());
    }

    void Close() override {
        beast::get_lowest_layer(ws_).close();
    }

private:
    websocket::stream<NextLayer> ws_;
    beast::flat_buffer buffer_;
};

template <typename NextLayer>
net::awaitable<void> websocketHandshake(websocket::stream<NextLayer>& ws, const UrlParts& url,
                                        const std::map<std::string, std::string>& headers) {
    ws.set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));
    ws.set_option(websocket::stream_base::decorator([headers](websocket::request_type& req) {
        req.set(http::field::user_agent, userAgent());
        for (const auto& [name, value] : headers) {
            req.set(name, value);
        }
    }));
    ws.read_message_max(kMaxMessageBytes);
    co_await ws.async_handshake(url.host + ":" + url.port, url.target, net::use_awaitable);
}

struct PendingCommand {
    explicit PendingCommand(const net::any_io_executor& ex) : timer(ex) {}
    net::steady_timer timer;
    bool done{false};
    std::optional<JSONValue> result;
    std::optional<errors::CdpError> error;
};

} // namespace

std::optional<UrlParts> ParseUrl(const std::string& url) {
    UrlParts parts;
    std::size_t schemeEnd = url.find("://");
    if (schemeEnd == std::string::npos) {
        return std::nullopt;
    }
    parts.scheme = url.substr(0, schemeEnd);
    if (parts.scheme != "http" && parts.scheme != "https" && parts.scheme != "ws" && parts.scheme != "wss") {
        return std::nullopt;
    }
    std::size_t pos = schemeEnd + 3;
    std::size_t slash = url.find('/', pos);
    std::string hostPort;
    if (slash == std::string::npos) {
        hostPort = url.substr(pos);
        parts.target = "/";
    } else {
        hostPort = url.substr(pos, slash - pos);
        parts.target = url.substr(slash);
    }
    if (hostPort.empty()) {
        return std::nullopt;
    }

    const bool secure = (parts.scheme == "https" || parts.scheme == "wss");
    std::size_t colon = std::string::npos;
    if (hostPort.front() == '[') {
        std::size_t close = hostPort.find(']');
        if (close == std::string::npos) {
            return std::nullopt;
        }
        parts.host = hostPort.substr(1, close - 1);
        if (close + 1 < hostPort.size() && hostPort[close + 1] == ':') {
            colon = close + 1;
        }
    } else {
        colon = hostPort.find(':');
        parts.host = hostPort.substr(0, colon);
    }
    if (colon != std::string::npos) {
        parts.port = hostPort.substr(colon + 1);
    }
    if (parts.port.empty()) {
        parts.port = secure ? "443" : "80";
    }
    if (parts.host.empty()) {
        return std::nullopt;
    }
    return parts;
}

net::awaitable<std::string> DiscoverWebSocketUrl(std::string browserUrl) {
    auto parts = ParseUrl(browserUrl);
    if (!parts.has_value() || (parts->scheme != "http" && parts->scheme != "https")) {
        throw errors::BrowserConnectionError(fmt::format("Invalid browser URL: {}", browserUrl));
    }
    std::string target = parts->target;
    while (!target.empty() && target.back() == '/') {
        target.pop_back();
    }
    target += "/json/version";

    auto executor = co_await net::this_coro::executor;
    http::response<http::string_body> res;
    try {
        tcp::resolver resolver(executor);
        auto results = co_await resolver.async_resolve(parts->host, parts->port, net::use_awaitable);

        http::request<http::string_body> req{http::verb::get, target, 11};
        req.set(http::field::host, parts->host + ":" + parts->port);
        req.set(http::field::user_agent, userAgent());
        req.set(http::field::accept, "application/json");
        req.set(http::field::connection, "close");
        beast::flat_buffer buffer;

        if (parts->scheme == "https") {
            auto ctx = makeClientTlsContext();
            beast::ssl_stream<beast::tcp_stream> stream(executor, *ctx);
            setServerName(stream.native_handle(), parts->host);
            beast::get_lowest_layer(stream).expires_after(std::chrono::seconds(15));
            co_await beast::get_lowest_layer(stream).async_connect(results, net::use_awaitable);
            co_await stream.async_handshake(ssl::stream_base::client, net::use_awaitable);
            co_await http::async_write(stream, req, net::use_awaitable);
            co_await http::async_read(stream, buffer, res, net::use_awaitable);
            beast::get_lowest_layer(stream).close();
        } else {
            beast::tcp_stream stream(executor);
            stream.expires_after(std::chrono::seconds(15));
            co_await stream.async_connect(results, net::use_awaitable);
            co_await http::async_write(stream, req, net::use_awaitable);
            co_await http::async_read(stream, buffer, res, net::use_awaitable);
            boost::system::error_code ec;
            stream.socket().shutdown(tcp::socket::shutdown_both, ec);
        }
    } catch (const boost::system::system_error& e) {
        throw errors::BrowserConnectionError(
            fmt::format("Failed to fetch browser webSocket URL from {}: {}", browserUrl, e.code().message()));
    }

    if (res.result() != http::status::ok) {
        throw errors::BrowserConnectionError(
            fmt::format("Failed to fetch browser webSocket URL from {}: HTTP {}", browserUrl, res.result_int()));
    }
    JSONValue body;
    try {
        body = ParseJSON(res.body());
    } catch (const std::exception& e) {
        throw errors::BrowserConnectionError(fmt::format("Invalid /json/version reply from {}: {}", browserUrl, e.what()));
    }
    auto ws = json::GetString(body, "webSocketDebuggerUrl");
    if (!ws.has_value() || ws->empty()) {
        throw errors::BrowserConnectionError(fmt::format("No webSocketDebuggerUrl in /json/version reply from {}", browserUrl));
    }
    co_return *ws;
}

//==========================================================================================================
// CdpConnection::Impl
//==========================================================================================================
class CdpConnection::Impl {
public:
    Impl(net::any_io_executor ex, Options o) : executor(std::move(ex)), options(std::move(o)) {}

    net::any_io_executor executor;
    Options options;
    std::shared_ptr<ssl::context> tls;
    std::unique_ptr<WsStream> stream;
    std::atomic<bool> connected{false};
    bool finished{false};
    int64_t nextId{0};
    std::unordered_map<int64_t, std::shared_ptr<PendingCommand>> pending;
    async::AsyncMutex writeMutex;
    std::map<IBrowser::SubscriptionId, IBrowser::EventHandler> subscribers;
    IBrowser::SubscriptionId nextSubscription{0};
    std::function<void()> onClose;

    static net::awaitable<void> readLoop(std::shared_ptr<Impl> self) {
        std::string reason = "DevTools connection closed";
        try {
            while (self->connected) {
                std::string text = co_await self->stream->Read();
                self->dispatch(text);
            }
        } catch (const boost::system::system_error& e) {
            if (self->connected) {
                reason = fmt::format("DevTools connection lost: {}", e.code().message());
                LOG_WARN("{} ({})", reason, self->options.url);
            }
        }
        self->shutdown(reason);
    }

    void dispatch(const std::string& text) {
        JSONValue msg;
        try {
            msg = ParseJSON(text);
        } catch (const std::exception& e) {
            LOG_WARN("Dropping malformed DevTools message: {}", e.what());
            return;
        }

        if (auto id = json::GetInt(msg, "id")) {
            auto it = pending.find(*id);
            if (it == pending.end()) {
                LOG_DEBUG("DevTools reply for unknown command id {}", *id);
                return;
            }
            auto cmd = it->second;
            pending.erase(it);
            if (const JSONValue* err = json::Find(msg, "error")) {
                cmd->error = errors::CdpError(json::GetString(*err, "message").value_or("unknown error"),
                                              static_cast<int>(json::GetInt(*err, "code").value_or(0)));
            } else if (const JSONValue* r = json::Find(msg, "result")) {
                cmd->result = *r;
            } else {
                cmd->result = JSONValue{JSONValue::Object{}};
            }
            cmd->done = true;
            cmd->timer.cancel();
            return;
        }

        auto method = json::GetString(msg, "method");
        if (!method.has_value()) {
            return;
        }
        static const JSONValue kNoParams{JSONValue::Object{}};
        const JSONValue* params = json::Find(msg, "params");
        const std::string sessionId = json::GetString(msg, "sessionId").value_or("");
        // Handlers may unsubscribe while being notified
        auto handlers = subscribers;
        for (auto& [subscription, handler] : handlers) {
            try {
                handler(*method, params ? *params : kNoParams, sessionId);
            } catch (const std::exception& e) {
                LOG_WARN("DevTools event handler {} for {} failed: {}", subscription, *method, e.what());
            }
        }
    }

    void shutdown(const std::string& reason) {
        if (finished) {
            return;
        }
        finished = true;
        connected = false;
        if (stream) {
            stream->Close();
        }
        for (auto& [id, cmd] : pending) {
            cmd->error = errors::CdpError(reason);
            cmd->done = true;
            cmd->timer.cancel();
        }
        pending.clear();
        if (onClose) {
            auto hook = std::move(onClose);
            onClose = nullptr;
            try {
                hook();
            } catch (const std::exception& e) {
                LOG_WARN("DevTools close hook failed: {}", e.what());
            }
        }
    }
};

net::awaitable<std::shared_ptr<CdpConnection>> CdpConnection::Connect(Options options) {
    auto parts = ParseUrl(options.url);
    if (!parts.has_value() || (parts->scheme != "ws" && parts->scheme != "wss")) {
        throw errors::BrowserConnectionError(fmt::format("Invalid DevTools websocket URL: {}", options.url));
    }
    auto executor = co_await net::this_coro::executor;
    auto impl = std::make_shared<Impl>(executor, options);
    try {
        tcp::resolver resolver(executor);
        auto results = co_await resolver.async_resolve(parts->host, parts->port, net::use_awaitable);
        if (parts->scheme == "wss") {
            impl->tls = makeClientTlsContext();
            auto ws = std::make_unique<BeastWsStream<beast::ssl_stream<beast::tcp_stream>>>(executor, *impl->tls);
            auto& s = ws->socket();
            setServerName(s.next_layer().native_handle(), parts->host);
            beast::get_lowest_layer(s).expires_after(options.connectTimeout);
            co_await beast::get_lowest_layer(s).async_connect(results, net::use_awaitable);
            co_await s.next_layer().async_handshake(ssl::stream_base::client, net::use_awaitable);
            beast::get_lowest_layer(s).expires_never();
            co_await websocketHandshake(s, *parts, options.headers);
            impl->stream = std::move(ws);
        } else {
            auto ws = std::make_unique<BeastWsStream<beast::tcp_stream>>(executor);
            auto& s = ws->socket();
            beast::get_lowest_layer(s).expires_after(options.connectTimeout);
            co_await beast::get_lowest_layer(s).async_connect(results, net::use_awaitable);
            beast::get_lowest_layer(s).expires_never();
            co_await websocketHandshake(s, *parts, options.headers);
            impl->stream = std::move(ws);
        }
    } catch (const boost::system::system_error& e) {
        throw errors::BrowserConnectionError(
            fmt::format("Failed to connect to DevTools endpoint {}: {}", options.url, e.code().message()));
    }

    impl->connected = true;
    net::co_spawn(executor, Impl::readLoop(impl), net::detached);
    LOG_INFO("Connected to DevTools endpoint {}", options.url);
    co_return std::shared_ptr<CdpConnection>(new CdpConnection(impl));
}

CdpConnection::CdpConnection(std::shared_ptr<Impl> impl) : pImpl(std::move(impl)) {}

CdpConnection::~CdpConnection() {
    Close();
}

net::awaitable<JSONValue> CdpConnection::Send(std::string method, JSONValue params, std::string sessionId) {
    auto impl = pImpl;
    if (!impl->connected) {
        throw errors::CdpError(fmt::format("{}: DevTools connection is closed", method));
    }
    const int64_t id = ++impl->nextId;
    auto cmd = std::make_shared<PendingCommand>(impl->executor);
    cmd->timer.expires_after(impl->options.commandTimeout);
    impl->pending[id] = cmd;

    json::ObjectBuilder message;
    message.Set("id", id).Set("method", method).Set("params", std::move(params));
    if (!sessionId.empty()) {
        message.Set("sessionId", sessionId);
    }
    LOG_DEBUG("CDP -> {} (id={}{}{})", method, id, sessionId.empty() ? "" : " session=", sessionId);

    bool writeFailed = false;
    std::string writeError;
    try {
        auto lock = co_await impl->writeMutex.Acquire();
        co_await impl->stream->Write(SerializeJSON(message.Build()));
    } catch (const boost::system::system_error& e) {
        writeFailed = true;
        writeError = e.code().message();
    }
    if (writeFailed) {
        impl->pending.erase(id);
        throw errors::CdpError(fmt::format("{}: failed to send command: {}", method, writeError));
    }

    if (!cmd->done) {
        boost::system::error_code ec;
        co_await cmd->timer.async_wait(net::redirect_error(net::use_awaitable, ec));
    }
    if (!cmd->done) {
        impl->pending.erase(id);
        throw errors::CdpError(fmt::format("{} timed out after {} ms", method, impl->options.commandTimeout.count()));
    }
    if (cmd->error.has_value()) {
        throw errors::CdpError(fmt::format("Protocol error ({}): {}", method, cmd->error->what()), cmd->error->code());
    }
    co_return std::move(*cmd->result);
}

IBrowser::SubscriptionId CdpConnection::Subscribe(EventHandler handler) {
    const auto id = ++pImpl->nextSubscription;
    pImpl->subscribers[id] = std::move(handler);
    return id;
}

void CdpConnection::Unsubscribe(SubscriptionId id) {
    pImpl->subscribers.erase(id);
}

bool CdpConnection::IsConnected() const {
    return pImpl->connected;
}

std::string CdpConnection::Endpoint() const {
    return pImpl->options.url;
}

void CdpConnection::Close() {
    pImpl->shutdown("DevTools connection closed");
}

void CdpConnection::SetOnClose(std::function<void()> hook) {
    if (pImpl->finished) {
        if (hook) {
            hook();
        }
        return;
    }
    pImpl->onClose = std::move(hook);
}

} // namespace browser
} // namespace dtmcp
