//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: StreamableHttpTransport.hpp
// Purpose: Per-session streamable HTTP transport adapter (one JSON-RPC message per POST)
//==========================================================================================================

#pragma once

#include <functional>
#include <memory>
#include <string>

#include <utility>

#include <boost/asio/awaitable.hpp>
#include <boost/beast/http.hpp>

#include "dtmcp/Transport.h"

namespace dtmcp {

namespace http = boost::beast::http;

class StreamableHttpTransport;

//==========================================================================================================
// ISessionEvents
// Purpose: Lifecycle events raised by a session adapter. The session registry consumes them.
//==========================================================================================================
class ISessionEvents {
public:
    virtual ~ISessionEvents() = default;

    // Raised once, when the initialize request assigns the session id.
    virtual void OnSessionInitialized(const std::string& sessionId,
                                      const std::shared_ptr<StreamableHttpTransport>& transport) = 0;

    // Raised once, when an initialized session is closed (DELETE or Close()).
    virtual void OnSessionClosed(const std::string& sessionId) = 0;
};

// Random (v4) UUID string used as session identifier.
std::string GenerateSessionId();

//==========================================================================================================
// StreamableHttpTransport
// Purpose: Turns HTTP requests addressed to one session into JSON-RPC traffic for the connected server.
// Notes:
//   - POST initialize assigns the session id (returned in the mcp-session-id header). Every later
//     request must carry that id; a different id answers 404, a missing one 400.
//   - Requests answer 200 with the JSON-RPC response; notifications and responses answer 202.
//   - DELETE closes the session. GET answers 405 since no server-initiated stream is offered.
//   - Must be owned by a std::shared_ptr (the initialized event hands out a shared reference).
//==========================================================================================================
class StreamableHttpTransport : public ITransport, public std::enable_shared_from_this<StreamableHttpTransport> {
public:
    using Request = http::request<http::string_body>;
    using Response = http::response<http::string_body>;
    using IdGenerator = std::function<std::string()>;

    explicit StreamableHttpTransport(std::shared_ptr<ISessionEvents> events, IdGenerator idGenerator = {});
    ~StreamableHttpTransport() override;

    net::awaitable<Response> HandleRequest(const Request& request);

    void SetRequestHandler(RequestHandler handler) override;
    void SetNotificationHandler(NotificationHandler handler) override;
    void SetErrorHandler(ErrorHandler handler) override;

    bool IsConnected() const override;
    std::string GetSessionId() const override;
    void Close() override;

    bool IsInitialized() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace dtmcp
