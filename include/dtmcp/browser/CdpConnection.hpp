//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: CdpConnection.hpp
// Purpose: DevTools protocol client over a Boost.Beast websocket (ws:// or wss://)
//==========================================================================================================

#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>

#include <boost/asio/awaitable.hpp>

#include "dtmcp/browser/Browser.h"

namespace dtmcp {
namespace browser {

//==========================================================================================================
// UrlParts
// Purpose: Small URL split adequate for scheme://host[:port]/path endpoints.
//==========================================================================================================
struct UrlParts {
    std::string scheme;
    std::string host;
    std::string port;
    std::string target;   // path + query, always starts with '/'
};

// Returns std::nullopt when the scheme is missing or not one of http, https, ws, wss.
std::optional<UrlParts> ParseUrl(const std::string& url);

//==========================================================================================================
// DiscoverWebSocketUrl
// Purpose: GET <browserUrl>/json/version and return its webSocketDebuggerUrl.
// Throws:
//   errors::BrowserConnectionError when the endpoint is unreachable or the reply lacks the field.
//==========================================================================================================
net::awaitable<std::string> DiscoverWebSocketUrl(std::string browserUrl);

//==========================================================================================================
// CdpConnection
// Purpose: IBrowser implementation multiplexing commands by id over one websocket.
// Notes:
//   - A reader coroutine runs for the lifetime of the socket and routes replies to waiting Send()
//     calls and events to every subscriber.
//   - Writes are serialized; each command waits at most commandTimeout for its reply.
//   - Close() is idempotent and runs the close hook once (used to terminate a launched browser).
//==========================================================================================================
class CdpConnection : public IBrowser {
public:
    struct Options {
        std::string url;
        std::map<std::string, std::string> headers;
        std::chrono::milliseconds connectTimeout{15000};
        std::chrono::milliseconds commandTimeout{30000};
    };

    // Throws errors::BrowserConnectionError when the websocket handshake fails.
    static net::awaitable<std::shared_ptr<CdpConnection>> Connect(Options options);

    ~CdpConnection() override;

    net::awaitable<JSONValue> Send(std::string method, JSONValue params, std::string sessionId) override;
    SubscriptionId Subscribe(EventHandler handler) override;
    void Unsubscribe(SubscriptionId id) override;
    bool IsConnected() const override;
    std::string Endpoint() const override;
    void Close() override;

    // Hook invoked exactly once when the connection ends (Close() or peer disconnect).
    void SetOnClose(std::function<void()> hook);

private:
    class Impl;
    explicit CdpConnection(std::shared_ptr<Impl> impl);
    std::shared_ptr<Impl> pImpl;
};

} // namespace browser
} // namespace dtmcp
