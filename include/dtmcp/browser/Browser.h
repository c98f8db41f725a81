//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Browser.h
// Purpose: Browser automation driver interfaces (DevTools protocol connection and launch/connect)
//==========================================================================================================

#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <utility>

#include <boost/asio/awaitable.hpp>

#include "dtmcp/Config.h"
#include "dtmcp/JSONRPCTypes.h"

namespace dtmcp {
namespace browser {

namespace net = boost::asio;

//==========================================================================================================
// ConnectOptions
// Purpose: Attach to an already running browser. Exactly one of browserUrl / wsEndpoint is set.
//==========================================================================================================
struct ConnectOptions {
    std::optional<std::string> browserUrl;   // http://host:port, resolved through /json/version
    std::optional<std::string> wsEndpoint;   // ws:// or wss:// used as-is
    std::map<std::string, std::string> wsHeaders;
    bool devtools{false};
};

//==========================================================================================================
// LaunchOptions
// Purpose: Start a new browser process owned by the returned handle.
//==========================================================================================================
struct LaunchOptions {
    bool headless{false};
    std::optional<std::string> executablePath;
    std::optional<std::string> channel;
    bool isolated{false};
    std::optional<Viewport> viewport;
    std::vector<std::string> args;
    bool acceptInsecureCerts{false};
    bool devtools{false};
    std::optional<std::string> logFile;      // browser stdout/stderr destination
};

//==========================================================================================================
// IBrowser
// Purpose: A live DevTools protocol connection to one browser.
// Notes:
//   - Send() resolves with the command's `result` object or throws errors::CdpError.
//   - sessionId addresses a flattened target session; empty targets the browser itself.
//   - Handle identity is meaningful: the context resolver rebuilds its context whenever the driver
//     hands out a different IBrowser instance.
//==========================================================================================================
class IBrowser {
public:
    using EventHandler = std::function<void(const std::string& method,
                                            const JSONValue& params,
                                            const std::string& sessionId)>;
    using SubscriptionId = uint64_t;

    virtual ~IBrowser() = default;

    virtual net::awaitable<JSONValue> Send(std::string method, JSONValue params, std::string sessionId) = 0;

    // Events arrive on the connection's executor. Several contexts may share one browser.
    virtual SubscriptionId Subscribe(EventHandler handler) = 0;
    virtual void Unsubscribe(SubscriptionId id) = 0;

    virtual bool IsConnected() const = 0;
    virtual std::string Endpoint() const = 0;
    virtual void Close() = 0;
};

//==========================================================================================================
// IBrowserDriver
// Purpose: Produces IBrowser handles. Both operations throw errors::BrowserConnectionError on failure.
//==========================================================================================================
class IBrowserDriver {
public:
    virtual ~IBrowserDriver() = default;

    virtual net::awaitable<std::shared_ptr<IBrowser>> ConnectExisting(ConnectOptions options) = 0;
    virtual net::awaitable<std::shared_ptr<IBrowser>> LaunchNew(LaunchOptions options) = 0;
};

} // namespace browser
} // namespace dtmcp
