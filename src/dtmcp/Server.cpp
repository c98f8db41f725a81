//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Server.cpp
// Purpose: Protocol method dispatch and the tool invocation pipeline
//==========================================================================================================

#include "dtmcp/Server.h"

#include <algorithm>

#include <fmt/format.h>

#include "dtmcp/McpContext.h"
#include "dtmcp/McpResponse.h"
#include "dtmcp/errors/Errors.h"
#include "dtmcp/tools/ToolRegistry.h"
#include "dtmcp/version.h"
#include "logging/Logger.h"

namespace dtmcp {

class Server::Impl {
public:
    Impl(const Config& config, std::vector<tools::ToolDescriptor> tools,
         std::shared_ptr<browser::IBrowserDriver> driver)
        : tools(std::move(tools)), resolver(config, std::move(driver)) {}

    std::unique_ptr<JSONRPCResponse> handleInitialize(const JSONRPCRequest& req) {
        LOG_DEBUG("Handling initialize request");
        std::string version = PROTOCOL_VERSION;
        if (req.params.has_value()) {
            auto requested = json::GetString(*req.params, "protocolVersion");
            const auto& supported = SupportedProtocolVersions();
            if (requested.has_value() && std::find(supported.begin(), supported.end(), *requested) != supported.end()) {
                version = *requested;
            }
        }
        initialized = true;

        JSONValue capabilities = json::ObjectBuilder()
                                     .Set("tools", JSONValue{JSONValue::Object{}})
                                     .Set("logging", JSONValue{JSONValue::Object{}})
                                     .Build();
        JSONValue serverInfo = json::ObjectBuilder()
                                   .Set("name", ServerIdentity::Name)
                                   .Set("title", ServerIdentity::Title)
                                   .Set("version", getVersionString())
                                   .Build();
        JSONValue result = json::ObjectBuilder()
                               .Set("protocolVersion", version)
                               .Set("capabilities", std::move(capabilities))
                               .Set("serverInfo", std::move(serverInfo))
                               .Build();
        return std::make_unique<JSONRPCResponse>(req.id, std::move(result));
    }

    std::unique_ptr<JSONRPCResponse> handleToolsList(const JSONRPCRequest& req) const {
        JSONValue::Array list;
        for (const auto& descriptor : tools) {
            Tool tool = tools::ToProtocolTool(descriptor);
            JSONValue annotations = json::ObjectBuilder()
                                        .Set("category", tool.category)
                                        .Set("readOnlyHint", tool.readOnlyHint)
                                        .Build();
            list.push_back(std::make_shared<JSONValue>(json::ObjectBuilder()
                                                           .Set("name", tool.name)
                                                           .Set("description", tool.description)
                                                           .Set("inputSchema", tool.inputSchema)
                                                           .Set("annotations", std::move(annotations))
                                                           .Build()));
        }
        return std::make_unique<JSONRPCResponse>(req.id, json::ObjectBuilder().Set("tools", JSONValue{std::move(list)}).Build());
    }

    const tools::ToolDescriptor* findTool(const std::string& name) const {
        auto it = std::find_if(tools.begin(), tools.end(),
                               [&](const tools::ToolDescriptor& d) { return d.name == name; });
        return it == tools.end() ? nullptr : &*it;
    }

    //==========================================================================================================
    // callTool
    // Purpose: guard -> resolve context -> detect devtools windows -> handler -> finalize.
    // Notes:
    //   A failure while finalizing becomes an error-flagged result. Anything raised earlier is logged
    //   and rethrown. The guard is released on every path when `lock` leaves scope.
    //==========================================================================================================
    net::awaitable<CallToolResult> callTool(const tools::ToolDescriptor& tool, JSONValue arguments) {
        auto lock = co_await guard.Acquire();
        try {
            LOG_INFO("{} request: {}", tool.name, SerializeJSON(arguments));
            std::shared_ptr<McpContext> context = co_await resolver.GetContext();
            LOG_INFO("{} context: resolved", tool.name);
            co_await context->DetectOpenDevToolsWindows();

            McpResponse response;
            tools::ToolRequest request(std::move(arguments));
            co_await tool.handler(request, response, *context);

            CallToolResult result;
            try {
                result.content = co_await response.Handle(tool.name, *context);
            } catch (const std::exception& e) {
                std::string text = e.what();
                if (text.empty()) {
                    text = fmt::format("{} failed while building the response", tool.name);
                }
                result.content = {MakeTextContent(text)};
                result.isError = true;
            }
            co_return result;
        } catch (const std::exception& e) {
            LOG_ERROR("{} error: {}", tool.name, e.what());
            throw;
        }
    }

    net::awaitable<std::unique_ptr<JSONRPCResponse>> handleToolsCall(const JSONRPCRequest& req) {
        LOG_DEBUG("Handling tools/call request");
        std::optional<std::string> name;
        JSONValue arguments{JSONValue::Object{}};
        if (req.params.has_value()) {
            name = json::GetString(*req.params, "name");
            if (const JSONValue* args = json::Find(*req.params, "arguments")) {
                if (!args->IsNull()) {
                    arguments = *args;
                }
            }
        }
        if (!name.has_value() || name->empty()) {
            errors::McpError e; e.code = JSONRPCErrorCodes::InvalidParams; e.message = "Invalid params";
            co_return errors::makeErrorResponse(req.id, e);
        }
        if (!arguments.IsObject()) {
            errors::McpError e; e.code = JSONRPCErrorCodes::InvalidParams; e.message = "Tool arguments must be an object";
            co_return errors::makeErrorResponse(req.id, e);
        }
        const tools::ToolDescriptor* tool = findTool(*name);
        if (tool == nullptr) {
            errors::McpError e; e.code = JSONRPCErrorCodes::ToolNotFound; e.message = "Tool not found";
            e.data = json::ObjectBuilder().Set("name", *name).Build();
            co_return errors::makeErrorResponse(req.id, e);
        }

        errors::McpError err;
        try {
            CallToolResult result = co_await callTool(*tool, std::move(arguments));
            co_return std::make_unique<JSONRPCResponse>(req.id, result.ToJSON());
        } catch (const errors::InvalidParamsError& e) {
            err.code = JSONRPCErrorCodes::InvalidParams;
            err.message = e.what();
        } catch (const std::exception& e) {
            err.code = JSONRPCErrorCodes::InternalError;
            err.message = e.what();
        }
        co_return errors::makeErrorResponse(req.id, err);
    }

    std::vector<tools::ToolDescriptor> tools;
    ContextResolver resolver;
    async::AsyncMutex guard;
    bool initialized{false};
};

Server::Server(std::unique_ptr<Impl> impl) : pImpl(std::move(impl)) {}

Server::~Server() = default;

std::shared_ptr<Server> Server::Create(const Config& config, std::shared_ptr<browser::IBrowserDriver> driver) {
    return Create(config, tools::AssembleTools(tools::AllTools(), config), std::move(driver));
}

std::shared_ptr<Server> Server::Create(const Config& config, std::vector<tools::ToolDescriptor> tools,
                                       std::shared_ptr<browser::IBrowserDriver> driver) {
    auto impl = std::make_unique<Impl>(config, std::move(tools), std::move(driver));
    return std::shared_ptr<Server>(new Server(std::move(impl)));
}

namespace {

// Holds a strong reference for the duration of the request so a closed session does not
// destroy the server under an in-flight call.
net::awaitable<std::unique_ptr<JSONRPCResponse>> dispatchTo(std::weak_ptr<Server> weak, const JSONRPCRequest& request) {
    auto self = weak.lock();
    if (!self) {
        co_return CreateErrorResponse(request.id, JSONRPCErrorCodes::InternalError, "Server is closed");
    }
    co_return co_await self->HandleRequest(request);
}

} // namespace

void Server::Connect(ITransport& transport) {
    std::weak_ptr<Server> weak = weak_from_this();
    transport.SetRequestHandler([weak](const JSONRPCRequest& request) {
        return dispatchTo(weak, request);
    });
    transport.SetNotificationHandler([weak](std::unique_ptr<JSONRPCNotification> notification) {
        if (auto self = weak.lock(); self && notification) {
            self->HandleNotification(*notification);
        }
    });
    transport.SetErrorHandler([](const std::string& error) {
        LOG_ERROR("Transport error: {}", error);
    });
}

net::awaitable<std::unique_ptr<JSONRPCResponse>> Server::HandleRequest(const JSONRPCRequest& request) {
    const std::string& method = request.method;
    if (method == Methods::Initialize) {
        co_return pImpl->handleInitialize(request);
    }
    if (method == Methods::Ping) {
        co_return std::make_unique<JSONRPCResponse>(request.id, JSONValue{JSONValue::Object{}});
    }
    if (method == Methods::ListTools) {
        co_return pImpl->handleToolsList(request);
    }
    if (method == Methods::CallTool) {
        co_return co_await pImpl->handleToolsCall(request);
    }
    if (method == Methods::SetLogLevel) {
        auto level = request.params ? json::GetString(*request.params, "level") : std::nullopt;
        LOG_DEBUG("Client requested log level {}", level.value_or("<none>"));
        co_return std::make_unique<JSONRPCResponse>(request.id, JSONValue{JSONValue::Object{}});
    }
    errors::McpError e;
    e.code = JSONRPCErrorCodes::MethodNotFound;
    e.message = "Method not found: " + method;
    co_return errors::makeErrorResponse(request.id, e);
}

void Server::HandleNotification(const JSONRPCNotification& notification) {
    if (notification.method == Methods::Initialized) {
        LOG_DEBUG("Client finished initialization");
    } else if (notification.method == Methods::Cancelled) {
        LOG_DEBUG("Ignoring cancellation notification");
    } else {
        LOG_DEBUG("Ignoring notification {}", notification.method);
    }
}

net::awaitable<CallToolResult> Server::CallTool(const tools::ToolDescriptor& tool, JSONValue arguments) {
    co_return co_await pImpl->callTool(tool, std::move(arguments));
}

std::vector<Tool> Server::ListTools() const {
    std::vector<Tool> out;
    for (const auto& descriptor : pImpl->tools) {
        out.push_back(tools::ToProtocolTool(descriptor));
    }
    return out;
}

const tools::ToolDescriptor* Server::FindTool(const std::string& name) const {
    return pImpl->findTool(name);
}

const ContextResolver& Server::Resolver() const {
    return pImpl->resolver;
}

const async::AsyncMutex& Server::Guard() const {
    return pImpl->guard;
}

bool Server::IsInitialized() const {
    return pImpl->initialized;
}

} // namespace dtmcp
