//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Server.h
// Purpose: Server instance bound to one logical client connection
//==========================================================================================================

#pragma once

#include <memory>
#include <string>
#include <vector>

#include <utility>

#include <boost/asio/awaitable.hpp>

#include "dtmcp/Config.h"
#include "dtmcp/ContextResolver.h"
#include "dtmcp/JSONRPCTypes.h"
#include "dtmcp/Protocol.h"
#include "dtmcp/Transport.h"
#include "dtmcp/async/AsyncMutex.hpp"
#include "dtmcp/browser/Browser.h"
#include "dtmcp/tools/ToolDefinition.h"

namespace dtmcp {

//==========================================================================================================
// Server
// Purpose: Owns the registered tool subset, the dispatch guard and the context resolver of one
//          connection, and answers the protocol methods a client sends.
// Notes:
//   - Tool invocations run one at a time in arrival order. The guard covers context resolution,
//     the handler body and response finalization.
//   - Instances are shared_ptr managed so an in-flight call keeps its instance alive after the owning
//     session has gone away.
//==========================================================================================================
class Server : public std::enable_shared_from_this<Server> {
public:
    // Server with the catalogue filtered by the configuration.
    static std::shared_ptr<Server> Create(const Config& config, std::shared_ptr<browser::IBrowserDriver> driver);

    // Server exposing exactly `tools` (assumed already assembled).
    static std::shared_ptr<Server> Create(const Config& config, std::vector<tools::ToolDescriptor> tools,
                                          std::shared_ptr<browser::IBrowserDriver> driver);

    ~Server();
    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    //======================================================================================================
    // Connect
    // Purpose: Install this server's request/notification/error handlers on a transport.
    //======================================================================================================
    void Connect(ITransport& transport);

    net::awaitable<std::unique_ptr<JSONRPCResponse>> HandleRequest(const JSONRPCRequest& request);
    void HandleNotification(const JSONRPCNotification& notification);

    //======================================================================================================
    // CallTool
    // Purpose: Run the invocation pipeline for a registered tool.
    // Returns:
    //   The finalized result; isError is set when only finalization failed.
    // Throws:
    //   Whatever the context resolution or the handler raised (after logging it).
    //======================================================================================================
    net::awaitable<CallToolResult> CallTool(const tools::ToolDescriptor& tool, JSONValue arguments);

    std::vector<Tool> ListTools() const;
    const tools::ToolDescriptor* FindTool(const std::string& name) const;

    const ContextResolver& Resolver() const;
    const async::AsyncMutex& Guard() const;
    bool IsInitialized() const;

private:
    class Impl;
    explicit Server(std::unique_ptr<Impl> impl);
    std::unique_ptr<Impl> pImpl;
};

} // namespace dtmcp
