//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: StreamableHttpTransport.cpp
// Purpose: Session validation and JSON-RPC dispatch for the streamable HTTP adapter
//==========================================================================================================

#include "dtmcp/StreamableHttpTransport.hpp"

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

#include "dtmcp/JSONRPCTypes.h"
#include "dtmcp/Protocol.h"
#include "logging/Logger.h"

namespace dtmcp {

std::string GenerateSessionId() {
    static thread_local boost::uuids::random_generator generator;
    return boost::uuids::to_string(generator());
}

class StreamableHttpTransport::Impl {
public:
    Impl(StreamableHttpTransport* owner, std::shared_ptr<ISessionEvents> events, IdGenerator idGenerator)
        : owner(owner), events(std::move(events)), idGenerator(std::move(idGenerator)) {
        if (!this->idGenerator) {
            this->idGenerator = GenerateSessionId;
        }
    }

    Response makeResponse(const Request& req, http::status status, std::string body,
                          const char* contentType = "application/json") const {
        Response res{status, req.version()};
        res.keep_alive(req.keep_alive());
        if (!body.empty()) {
            res.set(http::field::content_type, contentType);
        }
        if (initialized) {
            res.set(SESSION_ID_HEADER, sessionId);
        }
        res.body() = std::move(body);
        res.prepare_payload();
        return res;
    }

    Response makeError(const Request& req, http::status status, int code, const std::string& message) const {
        return makeResponse(req, status, CreateErrorResponse(nullptr, code, message)->Serialize());
    }

    // Non-initialize traffic must name this session
    std::optional<Response> validateSession(const Request& req) const {
        if (!initialized) {
            return makeError(req, http::status::bad_request, JSONRPCErrorCodes::InvalidRequest,
                             "Bad Request: Server not initialized");
        }
        const auto header = req[SESSION_ID_HEADER];
        if (header.empty()) {
            return makeError(req, http::status::bad_request, JSONRPCErrorCodes::InvalidRequest,
                             "Bad Request: Mcp-Session-Id header is required");
        }
        if (std::string(header) != sessionId || closed) {
            return makeError(req, http::status::not_found, JSONRPCErrorCodes::InvalidRequest, "Session not found");
        }
        return std::nullopt;
    }

    net::awaitable<Response> handlePost(const Request& req) {
        JSONValue message;
        try {
            message = ParseJSON(req.body());
        } catch (const std::exception& e) {
            co_return makeError(req, http::status::bad_request, JSONRPCErrorCodes::ParseError,
                                std::string("Parse error: ") + e.what());
        }
        if (message.IsArray()) {
            co_return makeError(req, http::status::bad_request, JSONRPCErrorCodes::InvalidRequest,
                                "Batch messages are not supported");
        }
        const MessageKind kind = ClassifyMessage(message);
        if (kind == MessageKind::Invalid) {
            co_return makeError(req, http::status::bad_request, JSONRPCErrorCodes::InvalidRequest,
                                "Invalid Request: not a JSON-RPC 2.0 message");
        }

        const bool isInitialize = kind == MessageKind::Request &&
                                  json::GetString(message, "method").value_or("") == Methods::Initialize;
        if (isInitialize) {
            if (initialized) {
                co_return makeError(req, http::status::bad_request, JSONRPCErrorCodes::InvalidRequest,
                                    "Invalid Request: Server already initialized");
            }
            sessionId = idGenerator();
            initialized = true;
            if (events) {
                events->OnSessionInitialized(sessionId, owner->shared_from_this());
            }
        } else if (auto rejected = validateSession(req)) {
            co_return std::move(*rejected);
        }

        if (kind == MessageKind::Notification) {
            auto note = std::make_unique<JSONRPCNotification>();
            if (note->FromJSON(message) && notificationHandler) {
                try {
                    notificationHandler(std::move(note));
                } catch (const std::exception& e) {
                    reportError(std::string("Notification handler error: ") + e.what());
                }
            }
            co_return makeResponse(req, http::status::accepted, std::string());
        }
        if (kind == MessageKind::Response) {
            // No server-initiated requests are ever sent, so client responses are dropped
            co_return makeResponse(req, http::status::accepted, std::string());
        }

        JSONRPCRequest rpc;
        if (!rpc.FromJSON(message)) {
            co_return makeError(req, http::status::bad_request, JSONRPCErrorCodes::InvalidRequest, "Invalid Request");
        }
        std::unique_ptr<JSONRPCResponse> out;
        if (requestHandler) {
            try {
                out = co_await requestHandler(rpc);
            } catch (const std::exception& e) {
                out = CreateErrorResponse(rpc.id, JSONRPCErrorCodes::InternalError, e.what());
            }
        }
        if (!out) {
            out = CreateErrorResponse(rpc.id, JSONRPCErrorCodes::InternalError, "No response from handler");
        }
        co_return makeResponse(req, http::status::ok, out->Serialize());
    }

    Response handleDelete(const Request& req) {
        if (auto rejected = validateSession(req)) {
            return std::move(*rejected);
        }
        Response res = makeResponse(req, http::status::ok, std::string());
        close();
        return res;
    }

    void close() {
        if (closed) {
            return;
        }
        closed = true;
        if (initialized && events) {
            events->OnSessionClosed(sessionId);
        }
    }

    void reportError(const std::string& msg) {
        if (errorHandler) {
            errorHandler(msg);
        } else {
            LOG_ERROR("{}", msg);
        }
    }

    StreamableHttpTransport* owner;
    std::shared_ptr<ISessionEvents> events;
    IdGenerator idGenerator;
    std::string sessionId;
    bool initialized{false};
    bool closed{false};

    RequestHandler requestHandler;
    NotificationHandler notificationHandler;
    ErrorHandler errorHandler;
};

StreamableHttpTransport::StreamableHttpTransport(std::shared_ptr<ISessionEvents> events, IdGenerator idGenerator)
    : pImpl(std::make_unique<Impl>(this, std::move(events), std::move(idGenerator))) {}

StreamableHttpTransport::~StreamableHttpTransport() = default;

net::awaitable<StreamableHttpTransport::Response> StreamableHttpTransport::HandleRequest(const Request& request) {
    switch (request.method()) {
        case http::verb::post:
            co_return co_await pImpl->handlePost(request);
        case http::verb::delete_:
            co_return pImpl->handleDelete(request);
        default: {
            Response res = pImpl->makeError(request, http::status::method_not_allowed,
                                            JSONRPCErrorCodes::InvalidRequest, "Method not allowed.");
            res.set(http::field::allow, "POST, DELETE");
            co_return res;
        }
    }
}

void StreamableHttpTransport::SetRequestHandler(RequestHandler handler) {
    pImpl->requestHandler = std::move(handler);
}

void StreamableHttpTransport::SetNotificationHandler(NotificationHandler handler) {
    pImpl->notificationHandler = std::move(handler);
}

void StreamableHttpTransport::SetErrorHandler(ErrorHandler handler) {
    pImpl->errorHandler = std::move(handler);
}

bool StreamableHttpTransport::IsConnected() const {
    return !pImpl->closed;
}

std::string StreamableHttpTransport::GetSessionId() const {
    return pImpl->sessionId;
}

void StreamableHttpTransport::Close() {
    pImpl->close();
}

bool StreamableHttpTransport::IsInitialized() const {
    return pImpl->initialized;
}

} // namespace dtmcp
