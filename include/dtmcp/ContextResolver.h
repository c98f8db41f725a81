//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ContextResolver.h
// Purpose: Lazily produce (or reuse) the automation context of one server instance
//==========================================================================================================

#pragma once

#include <memory>

#include <utility>

#include <boost/asio/awaitable.hpp>

#include "dtmcp/Config.h"
#include "dtmcp/McpContext.h"
#include "dtmcp/browser/Browser.h"

namespace dtmcp {

//==========================================================================================================
// ContextResolver
// Purpose: Explicit resolved-or-rebuild state: Unresolved -> Resolved(browser) -> Resolved(newBrowser).
// Notes:
//   - A remote endpoint in the configuration means connect; otherwise launch.
//   - The context is rebuilt only when the driver returns a different IBrowser handle.
//   - Failures propagate to the caller and leave the previous state untouched, so the next call
//     tries again from scratch.
//==========================================================================================================
class ContextResolver {
public:
    enum class State {
        Unresolved,
        Resolved
    };

    ContextResolver(Config config, std::shared_ptr<browser::IBrowserDriver> driver);

    net::awaitable<std::shared_ptr<McpContext>> GetContext();

    State GetState() const { return context_ ? State::Resolved : State::Unresolved; }
    const std::shared_ptr<McpContext>& Current() const { return context_; }

    static browser::ConnectOptions MakeConnectOptions(const Config& config);
    // Extra arguments are the configured chrome args followed by --proxy-server when set.
    static browser::LaunchOptions MakeLaunchOptions(const Config& config);

private:
    Config config_;
    std::shared_ptr<browser::IBrowserDriver> driver_;
    std::shared_ptr<McpContext> context_;
};

} // namespace dtmcp
