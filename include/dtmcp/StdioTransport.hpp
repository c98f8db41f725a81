//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: StdioTransport.hpp
// Purpose: Single-session transport over a pair of POSIX stream descriptors (stdin/stdout)
//==========================================================================================================

#pragma once

#include <cstddef>
#include <memory>
#include <string>

#include <utility>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>

#include "dtmcp/Transport.h"

namespace dtmcp {

// Operator-facing notice printed once when the stdio session connects.
extern const char* const STDIO_DISCLAIMER;

//==========================================================================================================
// StdioTransport
// Purpose: JSON-RPC transport for local tool integrations. One newline-delimited JSON message per line
//          on input, one per line on output.
// Notes:
//   - Takes ownership of both descriptors (pass dup()'d copies of the standard streams).
//   - Each request is dispatched on its own coroutine; replies are written whole, one at a time.
//   - Must be owned by a std::shared_ptr while Run() is active.
//==========================================================================================================
class StdioTransport : public ITransport, public std::enable_shared_from_this<StdioTransport> {
public:
    static constexpr std::size_t DEFAULT_MAX_FRAME_BYTES = 64 * 1024 * 1024;

    StdioTransport(net::any_io_executor executor, int inputFd, int outputFd);
    ~StdioTransport() override;

    //==========================================================================================================
    // Run
    // Purpose: Print the disclaimer, then read and dispatch frames until end of input or Close().
    // Notes:
    //   Completes only after every request it dispatched has been answered.
    //==========================================================================================================
    net::awaitable<void> Run();

    void SetRequestHandler(RequestHandler handler) override;
    void SetNotificationHandler(NotificationHandler handler) override;
    void SetErrorHandler(ErrorHandler handler) override;

    bool IsConnected() const override;
    std::string GetSessionId() const override;
    void Close() override;

    void SetMaxFrameBytes(std::size_t maxBytes);
    void SetPrintDisclaimer(bool enabled);

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace dtmcp
