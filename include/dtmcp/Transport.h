//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Transport.h
// Purpose: Transport adapter interface a server instance connects to
//==========================================================================================================

#pragma once

#include <functional>
#include <memory>
#include <string>

#include <utility>

#include <boost/asio/awaitable.hpp>

namespace dtmcp {

namespace net = boost::asio;

class JSONRPCRequest;
class JSONRPCResponse;
class JSONRPCNotification;

//==========================================================================================================
// ITransport
// Purpose: One logical client connection. The transport owns framing and I/O; the connected server
//          supplies handlers for incoming messages.
//==========================================================================================================
class ITransport {
public:
    virtual ~ITransport() = default;

    /////////////////////////////////////////// Request handling ///////////////////////////////////////////
    //==========================================================================================================
    // Registers the handler invoked for every incoming request. The transport writes the returned
    // response back to the peer. The request stays alive until the returned awaitable completes.
    //==========================================================================================================
    using RequestHandler = std::function<net::awaitable<std::unique_ptr<JSONRPCResponse>>(const JSONRPCRequest&)>;
    virtual void SetRequestHandler(RequestHandler handler) = 0;

    /////////////////////////////////////////// Notification handling ///////////////////////////////////////////
    using NotificationHandler = std::function<void(std::unique_ptr<JSONRPCNotification>)>;
    virtual void SetNotificationHandler(NotificationHandler handler) = 0;

    /////////////////////////////////////////// Error handling ///////////////////////////////////////////
    using ErrorHandler = std::function<void(const std::string& error)>;
    virtual void SetErrorHandler(ErrorHandler handler) = 0;

    /////////////////////////////////////////// Connection lifecycle ///////////////////////////////////////////
    virtual bool IsConnected() const = 0;

    // Session identifier for diagnostics; empty until one is assigned.
    virtual std::string GetSessionId() const = 0;

    virtual void Close() = 0;
};

} // namespace dtmcp
