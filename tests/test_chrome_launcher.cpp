//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_chrome_launcher.cpp
// Purpose: Chrome command line, DevToolsActivePort and endpoint URL parsing tests
//==========================================================================================================

#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <memory>
#include <string>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

#include "dtmcp/browser/CdpBrowserDriver.hpp"
#include "dtmcp/browser/CdpConnection.hpp"
#include "dtmcp/browser/ChromeLauncher.hpp"
#include "dtmcp/errors/Errors.h"
#include "fakes/FakeBrowser.hpp"

using namespace dtmcp;
using namespace dtmcp::browser;
using dtmcp::fakes::RunSync;

namespace {

bool hasArg(const ChromeCommandLine& cmd, const std::string& arg) {
    return std::find(cmd.args.begin(), cmd.args.end(), arg) != cmd.args.end();
}

} // namespace

TEST(ChromeLauncher, CommandLineCarriesProfileAndOptions) {
    LaunchOptions options;
    options.headless = true;
    options.viewport = Viewport{1024, 768};
    options.acceptInsecureCerts = true;
    options.args = {"--proxy-server=http://proxy:8080"};
    ChromeCommandLine cmd = BuildChromeCommandLine(options, "/usr/bin/chrome", "/tmp/profile");

    EXPECT_EQ(cmd.executable, "/usr/bin/chrome");
    EXPECT_EQ(cmd.userDataDir, "/tmp/profile");
    EXPECT_TRUE(hasArg(cmd, "--remote-debugging-port=0"));
    EXPECT_TRUE(hasArg(cmd, "--user-data-dir=/tmp/profile"));
    EXPECT_TRUE(hasArg(cmd, "--headless=new"));
    EXPECT_TRUE(hasArg(cmd, "--window-size=1024,768"));
    EXPECT_TRUE(hasArg(cmd, "--ignore-certificate-errors"));
    EXPECT_TRUE(hasArg(cmd, "--proxy-server=http://proxy:8080"));
    EXPECT_FALSE(hasArg(cmd, "--auto-open-devtools-for-tabs"));
    ASSERT_FALSE(cmd.args.empty());
    EXPECT_EQ(cmd.args.back(), "about:blank");
}

TEST(ChromeLauncher, DevtoolsFlagOpensDevtoolsForTabs) {
    LaunchOptions options;
    options.devtools = true;
    ChromeCommandLine cmd = BuildChromeCommandLine(options, "chrome", "/p");
    EXPECT_TRUE(hasArg(cmd, "--auto-open-devtools-for-tabs"));
    EXPECT_FALSE(hasArg(cmd, "--headless=new"));
}

TEST(ChromeLauncher, ParsesDevToolsActivePort) {
    auto endpoint = ParseDevToolsActivePort("9222\n/devtools/browser/abc-123\n");
    ASSERT_TRUE(endpoint.has_value());
    EXPECT_EQ(*endpoint, "ws://127.0.0.1:9222/devtools/browser/abc-123");

    EXPECT_FALSE(ParseDevToolsActivePort("").has_value());
    EXPECT_FALSE(ParseDevToolsActivePort("9222\n").has_value());
    EXPECT_FALSE(ParseDevToolsActivePort("port\n/devtools/browser/x\n").has_value());
    EXPECT_FALSE(ParseDevToolsActivePort("0\n/devtools/browser/x\n").has_value());
}

TEST(ChromeLauncher, ChannelPathsAndProfileDirsDifferPerChannel) {
    EXPECT_EQ(ChannelExecutablePath(std::nullopt), "/opt/google/chrome/chrome");
    EXPECT_EQ(ChannelExecutablePath(std::string("beta")), "/opt/google/chrome-beta/chrome");
    EXPECT_NE(DefaultUserDataDir(std::string("canary")), DefaultUserDataDir(std::nullopt));
    EXPECT_NE(DefaultUserDataDir(std::nullopt).find("chrome-profile-stable"), std::string::npos);
}

TEST(ChromeLauncher, MissingExplicitExecutableIsNotResolved) {
    EXPECT_FALSE(ResolveChromeExecutable(std::string("/nonexistent/dtmcp/chrome"), std::nullopt).has_value());
}

TEST(ChromeLauncher, TemporaryProfileDirIsCreated) {
    std::string dir = CreateTemporaryProfileDir();
    EXPECT_TRUE(std::filesystem::is_directory(dir));
    std::filesystem::remove_all(dir);
}

TEST(ChromeProcess, StopEscalatesWithoutBlockingTheExecutor) {
    // A child that ignores SIGTERM forces the full grace period and a SIGKILL
    ChromeCommandLine commandLine;
    commandLine.executable = "/bin/sh";
    commandLine.args = {"-c", "trap '' TERM; exec sleep 30"};
    commandLine.userDataDir = CreateTemporaryProfileDir();
    std::shared_ptr<ChromeProcess> process = ChromeProcess::Spawn(commandLine, std::nullopt, true);

    net::io_context ioc;
    int ticks = 0;
    bool stopped = false;
    auto ticker = [&]() -> net::awaitable<void> {
        net::steady_timer timer(co_await net::this_coro::executor);
        while (!stopped) {
            timer.expires_after(std::chrono::milliseconds(10));
            co_await timer.async_wait(net::use_awaitable);
            ++ticks;
        }
    };
    auto stop = [&]() -> net::awaitable<void> {
        // Let the shell install its trap first
        net::steady_timer settle(co_await net::this_coro::executor, std::chrono::milliseconds(200));
        co_await settle.async_wait(net::use_awaitable);
        co_await ChromeProcess::Stop(process);
        stopped = true;
    };
    net::co_spawn(ioc, ticker(), net::detached);
    RunSync(ioc, stop());

    EXPECT_TRUE(process->HasExited());
    EXPECT_GE(ticks, 50);
    const std::string profile = process->UserDataDir();
    process.reset();
    EXPECT_FALSE(std::filesystem::exists(profile));
}

TEST(CdpBrowserDriver, RefusesWorkAfterShutdown) {
    net::io_context ioc;
    CdpBrowserDriver driver;
    driver.Shutdown();
    EXPECT_TRUE(driver.IsShutDown());

    EXPECT_THROW(RunSync(ioc, driver.LaunchNew(LaunchOptions{})), errors::BrowserConnectionError);
    ConnectOptions connect;
    connect.wsEndpoint = "ws://127.0.0.1:9/devtools/browser/x";
    EXPECT_THROW(RunSync(ioc, driver.ConnectExisting(connect)), errors::BrowserConnectionError);
}

TEST(CdpUrl, SplitsEndpointUrls) {
    auto ws = ParseUrl("ws://127.0.0.1:9222/devtools/browser/x");
    ASSERT_TRUE(ws.has_value());
    EXPECT_EQ(ws->scheme, "ws");
    EXPECT_EQ(ws->host, "127.0.0.1");
    EXPECT_EQ(ws->port, "9222");
    EXPECT_EQ(ws->target, "/devtools/browser/x");

    auto https = ParseUrl("https://example.com");
    ASSERT_TRUE(https.has_value());
    EXPECT_EQ(https->port, "443");
    EXPECT_EQ(https->target, "/");

    auto v6 = ParseUrl("http://[::1]:9222/json/version");
    ASSERT_TRUE(v6.has_value());
    EXPECT_EQ(v6->host, "::1");
    EXPECT_EQ(v6->port, "9222");

    EXPECT_FALSE(ParseUrl("ftp://x").has_value());
    EXPECT_FALSE(ParseUrl("localhost:9222").has_value());
    EXPECT_FALSE(ParseUrl("http://").has_value());
}
