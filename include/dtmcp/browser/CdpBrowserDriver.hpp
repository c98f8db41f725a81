//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: CdpBrowserDriver.hpp
// Purpose: IBrowserDriver backed by real Chrome instances (connect over CDP or launch locally)
//==========================================================================================================

#pragma once

#include <chrono>
#include <memory>
#include <string>

#include "dtmcp/async/AsyncMutex.hpp"
#include "dtmcp/browser/Browser.h"

namespace dtmcp {
namespace browser {

//==========================================================================================================
// CdpBrowserDriver
// Purpose: Process-wide browser provider shared by every server instance.
// Notes:
//   - The produced handle is memoized while it stays connected, so repeated calls return the same
//     IBrowser. A dropped connection (browser closed or crashed) yields a fresh handle next time.
//   - Concurrent callers are serialized so one launch serves them all.
//==========================================================================================================
class CdpBrowserDriver : public IBrowserDriver {
public:
    struct Timeouts {
        std::chrono::milliseconds launch{15000};
        std::chrono::milliseconds command{30000};
    };

    CdpBrowserDriver() = default;
    explicit CdpBrowserDriver(Timeouts timeouts) : timeouts_(timeouts) {}
    ~CdpBrowserDriver() override;

    net::awaitable<std::shared_ptr<IBrowser>> ConnectExisting(ConnectOptions options) override;
    net::awaitable<std::shared_ptr<IBrowser>> LaunchNew(LaunchOptions options) override;

    // Closes the memoized browser (terminating it when it was launched here). Later connect or
    // launch requests throw errors::BrowserConnectionError.
    void Shutdown();
    bool IsShutDown() const { return shutDown_; }

private:
    void ensureRunning() const;
    bool reusable(const std::string& key) const;

    Timeouts timeouts_;
    async::AsyncMutex mutex_;
    std::shared_ptr<IBrowser> browser_;
    std::string browserKey_;
    bool shutDown_{false};
};

} // namespace browser
} // namespace dtmcp
