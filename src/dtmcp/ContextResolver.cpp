//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ContextResolver.cpp
// Purpose: Connect-or-launch decision and context memoization
//==========================================================================================================

#include "dtmcp/ContextResolver.h"

#include "logging/Logger.h"

namespace dtmcp {

ContextResolver::ContextResolver(Config config, std::shared_ptr<browser::IBrowserDriver> driver)
    : config_(std::move(config)), driver_(std::move(driver)) {}

browser::ConnectOptions ContextResolver::MakeConnectOptions(const Config& config) {
    browser::ConnectOptions options;
    options.browserUrl = config.browserUrl;
    options.wsEndpoint = config.wsEndpoint;
    options.wsHeaders = config.wsHeaders;
    options.devtools = config.experimentalDevtools;
    return options;
}

browser::LaunchOptions ContextResolver::MakeLaunchOptions(const Config& config) {
    browser::LaunchOptions options;
    options.headless = config.headless;
    options.executablePath = config.executablePath;
    options.channel = config.channel;
    options.isolated = config.isolated;
    options.viewport = config.viewport;
    options.args = config.chromeArgs;
    if (config.proxyServer.has_value()) {
        options.args.push_back("--proxy-server=" + *config.proxyServer);
    }
    options.acceptInsecureCerts = config.acceptInsecureCerts;
    options.devtools = config.experimentalDevtools;
    options.logFile = config.logFile;
    return options;
}

net::awaitable<std::shared_ptr<McpContext>> ContextResolver::GetContext() {
    std::shared_ptr<browser::IBrowser> browser;
    if (config_.browserUrl.has_value() || config_.wsEndpoint.has_value()) {
        browser = co_await driver_->ConnectExisting(MakeConnectOptions(config_));
    } else {
        browser = co_await driver_->LaunchNew(MakeLaunchOptions(config_));
    }

    if (!context_ || context_->Browser() != browser) {
        if (context_) {
            LOG_INFO("Browser connection changed, rebuilding context");
        }
        McpContext::Options options;
        options.experimentalDevToolsDebugging = config_.experimentalDevtools;
        options.experimentalIncludeAllPages = config_.experimentalIncludeAllPages;
        // Assigned only on success; a failed build keeps whatever was there before
        context_ = co_await McpContext::From(browser, options);
    }
    co_return context_;
}

} // namespace dtmcp
