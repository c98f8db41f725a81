//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/dtmcp/HTTPServer.cpp
// Purpose: Multi-session HTTP listener using Boost.Beast
//==========================================================================================================

#include <atomic>
#include <chrono>
#include <ctime>
#include <thread>
#include <utility>

#include <boost/asio.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <fmt/chrono.h>
#include <fmt/format.h>

#include "dtmcp/HTTPServer.hpp"
#include "dtmcp/JSONRPCTypes.h"
#include "dtmcp/Protocol.h"
#include "logging/Logger.h"

namespace dtmcp {
using tcp = net::ip::tcp;

namespace {

std::string isoTimestampNow() {
    const auto now = std::chrono::system_clock::now();
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
    const std::time_t seconds = std::chrono::system_clock::to_time_t(now);
    return fmt::format("{:%Y-%m-%dT%H:%M:%S}.{:03d}Z", fmt::gmtime(seconds), static_cast<int>(millis));
}

} // namespace

class HTTPServer::Impl {
public:
    HTTPServer::Options opts;
    ServerFactory factory;
    std::shared_ptr<SessionRegistry> registry{std::make_shared<SessionRegistry>()};
    std::atomic<bool> running{false};
    std::atomic<uint16_t> boundPort{0};

    net::io_context ioc;
    std::unique_ptr<tcp::acceptor> acceptor;
    std::thread ioThread;

    ITransport::ErrorHandler errorHandler;

    Impl(HTTPServer::Options o, ServerFactory f) : opts(std::move(o)), factory(std::move(f)) {}

    ~Impl() {
        if (ioThread.joinable()) {
            ioc.stop();
            ioThread.join();
        }
    }

    void setError(const std::string& msg) {
        if (errorHandler) {
            errorHandler(msg);
        } else {
            LOG_ERROR("{}", msg);
        }
    }

    static Response textResponse(const Request& req, http::status status, std::string body,
                                 const char* contentType = "text/plain") {
        Response res{status, req.version()};
        res.keep_alive(req.keep_alive());
        res.set(http::field::content_type, contentType);
        res.body() = std::move(body);
        res.prepare_payload();
        return res;
    }

    Response health(const Request& req) const {
        JSONValue body = json::ObjectBuilder()
                             .Set("status", "healthy")
                             .Set("timestamp", isoTimestampNow())
                             .Build();
        return textResponse(req, http::status::ok, SerializeJSON(body), "application/json");
    }

    //==========================================================================================================
    // createSession
    // Purpose: New server instance plus adapter; the adapter registers itself once initialize succeeds.
    //          A request that does not initialize leaves nothing behind.
    //==========================================================================================================
    net::awaitable<Response> createSession(const Request& req) {
        std::shared_ptr<StreamableHttpTransport> transport;
        bool failed = false;
        std::string failure;
        try {
            std::shared_ptr<Server> server = factory();
            transport = std::make_shared<StreamableHttpTransport>(registry->EventsFor(server));
            server->Connect(*transport);
        } catch (const std::exception& e) {
            failed = true;
            failure = e.what();
        }
        if (failed) {
            LOG_ERROR("HTTP connection error: {}", failure);
            co_return textResponse(req, http::status::internal_server_error, "Internal server error");
        }
        co_return co_await forward(transport, req);
    }

    net::awaitable<Response> forward(std::shared_ptr<StreamableHttpTransport> transport, const Request& req) {
        std::string failure;
        try {
            co_return co_await transport->HandleRequest(req);
        } catch (const std::exception& e) {
            failure = e.what();
        }
        LOG_ERROR("HTTP connection error: {}", failure);
        co_return textResponse(req, http::status::internal_server_error, "Internal server error");
    }

    net::awaitable<Response> route(const Request& req) {
        const std::string target(req.target().data(), req.target().size());
        const std::string path = target.substr(0, target.find('?'));

        if (path == opts.healthPath) {
            co_return health(req);
        }
        if (path != opts.mcpPath) {
            co_return textResponse(req, http::status::not_found, "Not Found");
        }

        const auto header = req[SESSION_ID_HEADER];
        if (!header.empty()) {
            auto session = registry->Find(std::string(header));
            if (!session) {
                co_return textResponse(req, http::status::not_found, "Session not found");
            }
            // Local reference keeps the adapter alive if a DELETE removes it mid-request
            std::shared_ptr<StreamableHttpTransport> transport = session->transport;
            co_return co_await forward(std::move(transport), req);
        }
        if (req.method() == http::verb::post) {
            co_return co_await createSession(req);
        }
        co_return textResponse(req, http::status::bad_request, "Invalid request");
    }

    net::awaitable<void> connection(tcp::socket socket) {
        try {
            boost::beast::tcp_stream stream(std::move(socket));
            boost::beast::flat_buffer buffer;
            for (;;) {
                Request req;
                co_await http::async_read(stream, buffer, req, net::use_awaitable);
                Response res = co_await route(req);
                const bool keepAlive = res.keep_alive();
                co_await http::async_write(stream, res, net::use_awaitable);
                if (!keepAlive) {
                    break;
                }
            }
            boost::system::error_code ec;
            stream.socket().shutdown(tcp::socket::shutdown_send, ec);
        } catch (const boost::system::system_error& e) {
            if (e.code() == http::error::end_of_stream) {
                // peer closed a keep-alive connection
            } else if (running.load()) {
                setError(std::string("HTTPServer connection error: ") + e.what());
            }
        } catch (const std::exception& e) {
            if (running.load()) {
                setError(std::string("HTTPServer connection error: ") + e.what());
            }
        }
        co_return;
    }

    void bind() {
        tcp::resolver resolver(ioc);
        auto results = resolver.resolve(opts.address, std::to_string(opts.port));
        tcp::endpoint ep = *results.begin();

        acceptor = std::make_unique<tcp::acceptor>(ioc);
        acceptor->open(ep.protocol());
        acceptor->set_option(tcp::acceptor::reuse_address(true));
        acceptor->bind(ep);
        acceptor->listen();
        boundPort.store(acceptor->local_endpoint().port());
    }

    net::awaitable<void> acceptLoop() {
        try {
            while (running.load()) {
                tcp::socket socket = co_await acceptor->async_accept(net::use_awaitable);
                net::co_spawn(ioc, connection(std::move(socket)), net::detached);
            }
        } catch (const std::exception& e) {
            if (running.load()) {
                setError(std::string("HTTPServer accept error: ") + e.what());
            }
        }
        co_return;
    }

    void logStart() const {
        const uint16_t port = boundPort.load();
        if (opts.isProduction) {
            LOG_INFO("Chrome DevTools MCP Server listening on Port {}", port);
            return;
        }
        LOG_INFO("Chrome DevTools MCP Server listening on http://localhost:{}", port);
        const std::string url = fmt::format("http://localhost:{}{}", port, opts.mcpPath);
        JSONValue snippet = json::ObjectBuilder()
                                .Set("mcpServers", json::ObjectBuilder()
                                                       .Set("chrome-devtools", json::ObjectBuilder().Set("url", url).Build())
                                                       .Build())
                                .Build();
        fmt::print(stderr, "\nPut this in your client config:\n{}\n", SerializeJSON(snippet));
        fmt::print(stderr, "\nEndpoints:\n  - MCP: {}\n  - Health: http://localhost:{}{}\n", url, port, opts.healthPath);
    }
};

HTTPServer::HTTPServer(Options opts, ServerFactory factory)
    : pImpl(std::make_unique<Impl>(std::move(opts), std::move(factory))) {}

HTTPServer::~HTTPServer() {
    Stop();
}

std::future<void> HTTPServer::Start() {
    pImpl->bind();
    pImpl->running.store(true);
    pImpl->logStart();

    std::promise<void> ready;
    auto fut = ready.get_future();
    pImpl->ioThread = std::thread([this, pr = std::move(ready)]() mutable {
        net::co_spawn(pImpl->ioc, pImpl->acceptLoop(), net::detached);
        pr.set_value();
        try {
            pImpl->ioc.run();
        } catch (const std::exception& e) {
            pImpl->setError(std::string("HTTPServer I/O error: ") + e.what());
        }
    });
    return fut;
}

std::future<void> HTTPServer::Stop() {
    std::promise<void> done;
    auto fut = done.get_future();
    pImpl->running.store(false);
    if (pImpl->acceptor) {
        net::post(pImpl->ioc, [impl = pImpl.get()] {
            boost::system::error_code ec;
            impl->acceptor->close(ec);
        });
    }
    pImpl->ioc.stop();
    if (pImpl->ioThread.joinable()) {
        pImpl->ioThread.join();
    }
    done.set_value();
    return fut;
}

uint16_t HTTPServer::LocalPort() const {
    return pImpl->boundPort.load();
}

std::shared_ptr<SessionRegistry> HTTPServer::Sessions() const {
    return pImpl->registry;
}

void HTTPServer::SetErrorHandler(ITransport::ErrorHandler handler) {
    pImpl->errorHandler = std::move(handler);
}

net::awaitable<HTTPServer::Response> HTTPServer::Route(const Request& req) {
    co_return co_await pImpl->route(req);
}

} // namespace dtmcp
