//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: CdpBrowserDriver.cpp
// Purpose: Connect-or-launch browser provider with handle memoization
//==========================================================================================================

#include "dtmcp/browser/CdpBrowserDriver.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/this_coro.hpp>

#include <fmt/format.h>

#include "dtmcp/browser/CdpConnection.hpp"
#include "dtmcp/browser/ChromeLauncher.hpp"
#include "dtmcp/errors/Errors.h"
#include "logging/Logger.h"

namespace dtmcp {
namespace browser {

CdpBrowserDriver::~CdpBrowserDriver() {
    Shutdown();
}

void CdpBrowserDriver::ensureRunning() const {
    if (shutDown_) {
        throw errors::BrowserConnectionError("The browser driver has been shut down");
    }
}

bool CdpBrowserDriver::reusable(const std::string& key) const {
    return browser_ && browser_->IsConnected() && browserKey_ == key;
}

net::awaitable<std::shared_ptr<IBrowser>> CdpBrowserDriver::ConnectExisting(ConnectOptions options) {
    if (!options.wsEndpoint.has_value() && !options.browserUrl.has_value()) {
        throw errors::BrowserConnectionError("Either a browser URL or a websocket endpoint is required to connect");
    }
    auto lock = co_await mutex_.Acquire();
    ensureRunning();
    const std::string key = options.wsEndpoint.has_value() ? *options.wsEndpoint : *options.browserUrl;
    if (reusable(key)) {
        co_return browser_;
    }

    CdpConnection::Options connOpts;
    connOpts.commandTimeout = timeouts_.command;
    connOpts.headers = options.wsHeaders;
    if (options.wsEndpoint.has_value()) {
        connOpts.url = *options.wsEndpoint;
    } else {
        LOG_INFO("Resolving DevTools endpoint from {}", *options.browserUrl);
        connOpts.url = co_await DiscoverWebSocketUrl(*options.browserUrl);
    }
    auto connection = co_await CdpConnection::Connect(connOpts);
    if (shutDown_) {
        connection->Close();
        ensureRunning();
    }
    browser_ = connection;
    browserKey_ = key;
    co_return browser_;
}

net::awaitable<std::shared_ptr<IBrowser>> CdpBrowserDriver::LaunchNew(LaunchOptions options) {
    auto lock = co_await mutex_.Acquire();
    ensureRunning();
    const std::string key = "launch";
    if (reusable(key)) {
        co_return browser_;
    }

    auto executable = ResolveChromeExecutable(options.executablePath, options.channel);
    if (!executable.has_value()) {
        throw errors::BrowserConnectionError(fmt::format(
            "Could not find a Chrome executable for channel '{}' (looked for {}). "
            "Install Chrome or pass --executable-path.",
            options.channel.value_or("stable"),
            options.executablePath.value_or(ChannelExecutablePath(options.channel))));
    }
    const std::string userDataDir = options.isolated ? CreateTemporaryProfileDir() : DefaultUserDataDir(options.channel);
    ChromeCommandLine commandLine = BuildChromeCommandLine(options, *executable, userDataDir);

    std::shared_ptr<ChromeProcess> process = ChromeProcess::Spawn(commandLine, options.logFile, options.isolated);
    std::string endpoint = co_await process->WaitForEndpoint(timeouts_.launch);

    CdpConnection::Options connOpts;
    connOpts.url = endpoint;
    connOpts.commandTimeout = timeouts_.command;
    auto connection = co_await CdpConnection::Connect(connOpts);
    // The process lives as long as the connection does. It is stopped on the I/O executor so the
    // SIGTERM grace period never blocks other sessions.
    auto executor = co_await net::this_coro::executor;
    connection->SetOnClose([process, executor]() {
        LOG_INFO("Closing launched browser pid={}", process->Pid());
        net::co_spawn(executor, ChromeProcess::Stop(process), net::detached);
    });
    if (shutDown_) {
        connection->Close();
        ensureRunning();
    }
    browser_ = connection;
    browserKey_ = key;
    co_return browser_;
}

void CdpBrowserDriver::Shutdown() {
    shutDown_ = true;
    if (browser_) {
        browser_->Close();
        browser_.reset();
        browserKey_.clear();
    }
}

} // namespace browser
} // namespace dtmcp
