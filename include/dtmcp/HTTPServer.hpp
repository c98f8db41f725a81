//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: HTTPServer.hpp
// Purpose: Coroutine-based multi-session HTTP listener using Boost.Beast
//==========================================================================================================

#pragma once

#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <string>

#include <utility>

#include <boost/asio/awaitable.hpp>
#include <boost/beast/http.hpp>

#include "dtmcp/Server.h"
#include "dtmcp/SessionRegistry.hpp"
#include "dtmcp/Transport.h"

namespace dtmcp {

class HTTPServer {
public:
    using Request = http::request<http::string_body>;
    using Response = http::response<http::string_body>;
    using ServerFactory = std::function<std::shared_ptr<Server>()>;

    //==========================================================================================================
    // Options
    // Fields:
    //   address: Bind address (loopback unless running in production)
    //   port: Listen port; 0 picks an ephemeral port (see LocalPort)
    //   mcpPath: Protocol traffic path
    //   healthPath: Liveness probe path
    //   isProduction: Controls the startup banner
    //==========================================================================================================
    struct Options {
        std::string address{"127.0.0.1"};
        uint16_t port{3000};
        std::string mcpPath{"/mcp"};
        std::string healthPath{"/health"};
        bool isProduction{false};
    };

    HTTPServer(Options opts, ServerFactory factory);
    ~HTTPServer();

    HTTPServer(const HTTPServer&) = delete;
    HTTPServer& operator=(const HTTPServer&) = delete;

    //==========================================================================================================
    // Binds the listening socket, then runs the accept loop on a background I/O thread.
    // Returns:
    //   Future that becomes ready once the I/O context is running.
    // Throws:
    //   boost::system::system_error when the address cannot be bound.
    //==========================================================================================================
    std::future<void> Start();

    //==========================================================================================================
    // Stops the server: closes the acceptor, stops the I/O context and joins the background thread.
    //==========================================================================================================
    std::future<void> Stop();

    // Port actually bound (useful when Options::port is 0). Zero before Start().
    uint16_t LocalPort() const;

    std::shared_ptr<SessionRegistry> Sessions() const;

    void SetErrorHandler(ITransport::ErrorHandler handler);

    //==========================================================================================================
    // Route
    // Purpose: Answer one HTTP request. `/mcp` traffic goes to the session named by the mcp-session-id
    //          header, or to a freshly created session for a header-less POST. `/health` answers the
    //          liveness payload. Anything else is 404.
    //==========================================================================================================
    net::awaitable<Response> Route(const Request& req);

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace dtmcp
