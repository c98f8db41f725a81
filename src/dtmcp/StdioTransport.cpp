//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: StdioTransport.cpp
// Purpose: Newline-delimited JSON-RPC over POSIX stream descriptors
//==========================================================================================================

#include "dtmcp/StdioTransport.hpp"

#include <utility>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>
#include <boost/asio/read_until.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>

#include <fmt/format.h>

#include "dtmcp/JSONRPCTypes.h"
#include "dtmcp/async/AsyncMutex.hpp"
#include "logging/Logger.h"

namespace dtmcp {

const char* const STDIO_DISCLAIMER =
    "chrome-devtools-mcp exposes content of the browser instance to the MCP clients allowing them to "
    "inspect, debug, and modify any data in the browser or DevTools. Avoid sharing sensitive or personal "
    "information that you do not want to share with MCP clients.";

class StdioTransport::Impl {
public:
    Impl(net::any_io_executor executor, int inputFd, int outputFd)
        : input(executor, inputFd), output(executor, outputFd), idle(executor) {}

    // Counts one dispatched request for as long as it is alive
    class InFlight {
    public:
        explicit InFlight(Impl& impl) : impl_(&impl) { ++impl_->inFlight; }
        InFlight(InFlight&& other) noexcept : impl_(std::exchange(other.impl_, nullptr)) {}
        InFlight(const InFlight&) = delete;
        InFlight& operator=(const InFlight&) = delete;
        InFlight& operator=(InFlight&&) = delete;
        ~InFlight() {
            if (impl_ && --impl_->inFlight == 0) {
                impl_->idle.cancel();
            }
        }

    private:
        Impl* impl_;
    };

    // Parks until every dispatched request has written its reply
    net::awaitable<void> drain() {
        while (inFlight > 0) {
            idle.expires_at(net::steady_timer::time_point::max());
            boost::system::error_code ec;
            co_await idle.async_wait(net::redirect_error(net::use_awaitable, ec));
        }
    }

    void reportError(const std::string& msg) {
        if (errorHandler) {
            errorHandler(msg);
        } else {
            LOG_ERROR("{}", msg);
        }
    }

    net::awaitable<void> writeFrame(std::string frame) {
        frame.push_back('\n');
        auto lock = co_await writeGuard.Acquire();
        if (!output.is_open()) {
            co_return;
        }
        boost::system::error_code ec;
        co_await net::async_write(output, net::buffer(frame), net::redirect_error(net::use_awaitable, ec));
        if (ec) {
            reportError("stdio write error: " + ec.message());
        }
    }

    static net::awaitable<void> dispatch(std::shared_ptr<StdioTransport> self, JSONRPCRequest request,
                                         InFlight token) {
        Impl& impl = *self->pImpl;
        InFlight pending = std::move(token);
        std::unique_ptr<JSONRPCResponse> out;
        std::string failure;
        try {
            if (impl.requestHandler) {
                out = co_await impl.requestHandler(request);
            }
        } catch (const std::exception& e) {
            failure = e.what();
        }
        if (!failure.empty()) {
            out = CreateErrorResponse(request.id, JSONRPCErrorCodes::InternalError, failure);
        } else if (!out) {
            out = CreateErrorResponse(request.id, JSONRPCErrorCodes::InternalError, "No response from handler");
        }
        co_await impl.writeFrame(out->Serialize());
    }

    //==========================================================================================================
    // handleLine
    // Purpose: Decode one frame. Malformed frames get an error reply with a null id.
    //==========================================================================================================
    net::awaitable<void> handleLine(std::shared_ptr<StdioTransport> self, const std::string& line) {
        JSONValue message;
        std::string parseFailure;
        try {
            message = ParseJSON(line);
        } catch (const std::exception& e) {
            parseFailure = e.what();
        }
        if (!parseFailure.empty()) {
            co_await writeFrame(
                CreateErrorResponse(nullptr, JSONRPCErrorCodes::ParseError, "Parse error: " + parseFailure)->Serialize());
            co_return;
        }
        if (message.IsArray()) {
            co_await writeFrame(CreateErrorResponse(nullptr, JSONRPCErrorCodes::InvalidRequest,
                                                    "Batch messages are not supported")->Serialize());
            co_return;
        }

        switch (ClassifyMessage(message)) {
            case MessageKind::Request: {
                JSONRPCRequest request;
                if (!request.FromJSON(message)) {
                    co_await writeFrame(
                        CreateErrorResponse(nullptr, JSONRPCErrorCodes::InvalidRequest, "Invalid Request")->Serialize());
                    co_return;
                }
                net::co_spawn(input.get_executor(), dispatch(std::move(self), std::move(request), InFlight(*this)),
                              net::detached);
                co_return;
            }
            case MessageKind::Notification: {
                auto note = std::make_unique<JSONRPCNotification>();
                if (note->FromJSON(message) && notificationHandler) {
                    try {
                        notificationHandler(std::move(note));
                    } catch (const std::exception& e) {
                        reportError(std::string("Notification handler error: ") + e.what());
                    }
                }
                co_return;
            }
            case MessageKind::Response:
                // No server-initiated requests are sent, so there is nothing to correlate
                LOG_DEBUG("Ignoring client response on stdio");
                co_return;
            case MessageKind::Invalid:
                break;
        }
        co_await writeFrame(CreateErrorResponse(nullptr, JSONRPCErrorCodes::InvalidRequest,
                                                "Invalid Request: not a JSON-RPC 2.0 message")->Serialize());
    }

    net::posix::stream_descriptor input;
    net::posix::stream_descriptor output;
    async::AsyncMutex writeGuard;
    std::size_t maxFrameBytes{DEFAULT_MAX_FRAME_BYTES};
    bool printDisclaimer{true};
    bool connected{false};
    std::size_t inFlight{0};
    net::steady_timer idle;

    RequestHandler requestHandler;
    NotificationHandler notificationHandler;
    ErrorHandler errorHandler;
};

StdioTransport::StdioTransport(net::any_io_executor executor, int inputFd, int outputFd)
    : pImpl(std::make_unique<Impl>(std::move(executor), inputFd, outputFd)) {}

StdioTransport::~StdioTransport() = default;

net::awaitable<void> StdioTransport::Run() {
    auto self = shared_from_this();
    pImpl->connected = true;
    if (pImpl->printDisclaimer) {
        fmt::print(stderr, "{}\n", STDIO_DISCLAIMER);
    }
    LOG_INFO("Chrome DevTools MCP Server connected via STDIO");

    std::string buffer;
    for (;;) {
        boost::system::error_code ec;
        const std::size_t n = co_await net::async_read_until(
            pImpl->input, net::dynamic_buffer(buffer, pImpl->maxFrameBytes), '\n',
            net::redirect_error(net::use_awaitable, ec));
        if (ec) {
            if (ec == net::error::eof) {
                // A final frame without a trailing newline is still a frame
                if (!buffer.empty()) {
                    std::string last = std::move(buffer);
                    buffer.clear();
                    co_await pImpl->handleLine(self, last);
                }
                LOG_DEBUG("stdin closed");
            } else if (ec == net::error::not_found) {
                pImpl->reportError("stdio frame exceeds maximum size");
            } else if (ec != net::error::operation_aborted) {
                pImpl->reportError("stdio read error: " + ec.message());
            }
            break;
        }
        std::string line = buffer.substr(0, n - 1);
        buffer.erase(0, n);
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.find_first_not_of(" \t") == std::string::npos) {
            continue;
        }
        co_await pImpl->handleLine(self, line);
    }
    pImpl->connected = false;
    // Requests already read run to completion before the session is reported finished
    co_await pImpl->drain();
}

void StdioTransport::SetRequestHandler(RequestHandler handler) {
    pImpl->requestHandler = std::move(handler);
}

void StdioTransport::SetNotificationHandler(NotificationHandler handler) {
    pImpl->notificationHandler = std::move(handler);
}

void StdioTransport::SetErrorHandler(ErrorHandler handler) {
    pImpl->errorHandler = std::move(handler);
}

bool StdioTransport::IsConnected() const {
    return pImpl->connected;
}

std::string StdioTransport::GetSessionId() const {
    return "stdio";
}

void StdioTransport::Close() {
    boost::system::error_code ec;
    pImpl->input.close(ec);
    pImpl->connected = false;
}

void StdioTransport::SetMaxFrameBytes(std::size_t maxBytes) {
    pImpl->maxFrameBytes = maxBytes;
}

void StdioTransport::SetPrintDisclaimer(bool enabled) {
    pImpl->printDisclaimer = enabled;
}

} // namespace dtmcp
