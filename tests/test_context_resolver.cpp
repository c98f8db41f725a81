//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_context_resolver.cpp
// Purpose: Connect-or-launch selection and context reuse
//==========================================================================================================

#include <gtest/gtest.h>

#include <algorithm>
#include <memory>

#include <boost/asio/io_context.hpp>

#include "dtmcp/ContextResolver.h"
#include "dtmcp/errors/Errors.h"
#include "fakes/FakeBrowser.hpp"

using namespace dtmcp;
using dtmcp::fakes::FakeBrowser;
using dtmcp::fakes::FakeDriver;
using dtmcp::fakes::RunSync;

TEST(ContextResolver, LaunchesWithoutRemoteEndpoint) {
    net::io_context ioc;
    auto driver = std::make_shared<FakeDriver>();
    Config config;
    config.headless = true;
    config.channel = "beta";
    ContextResolver resolver(config, driver);
    EXPECT_EQ(resolver.GetState(), ContextResolver::State::Unresolved);

    auto context = RunSync(ioc, resolver.GetContext());
    ASSERT_NE(context, nullptr);
    EXPECT_EQ(resolver.GetState(), ContextResolver::State::Resolved);
    EXPECT_EQ(driver->launchCalls, 1);
    EXPECT_EQ(driver->connectCalls, 0);
    EXPECT_TRUE(driver->lastLaunch.headless);
    EXPECT_EQ(driver->lastLaunch.channel.value_or(""), "beta");
}

TEST(ContextResolver, ConnectsWhenBrowserUrlConfigured) {
    net::io_context ioc;
    auto driver = std::make_shared<FakeDriver>();
    Config config;
    config.browserUrl = "http://127.0.0.1:9222";
    ContextResolver resolver(config, driver);
    RunSync(ioc, resolver.GetContext());
    EXPECT_EQ(driver->connectCalls, 1);
    EXPECT_EQ(driver->launchCalls, 0);
    EXPECT_EQ(driver->lastConnect.browserUrl.value_or(""), "http://127.0.0.1:9222");
}

TEST(ContextResolver, ProxyServerBecomesChromeArgument) {
    Config config;
    config.chromeArgs = {"--mute-audio"};
    config.proxyServer = "http://proxy:3128";
    auto options = ContextResolver::MakeLaunchOptions(config);
    ASSERT_EQ(options.args.size(), 2u);
    EXPECT_EQ(options.args[0], "--mute-audio");
    EXPECT_EQ(options.args[1], "--proxy-server=http://proxy:3128");
}

TEST(ContextResolver, ReusesContextForSameBrowser) {
    net::io_context ioc;
    auto driver = std::make_shared<FakeDriver>();
    ContextResolver resolver(Config{}, driver);
    auto first = RunSync(ioc, resolver.GetContext());
    auto second = RunSync(ioc, resolver.GetContext());
    EXPECT_EQ(first, second);
    EXPECT_EQ(driver->launchCalls, 2);
    EXPECT_EQ(driver->fakeBrowser->CountCalls("Target.createTarget"), 1u);
}

TEST(ContextResolver, RebuildsContextWhenBrowserChanges) {
    net::io_context ioc;
    auto driver = std::make_shared<FakeDriver>();
    ContextResolver resolver(Config{}, driver);
    auto first = RunSync(ioc, resolver.GetContext());

    driver->fakeBrowser = std::make_shared<FakeBrowser>("ws://fake/devtools/browser/2");
    auto second = RunSync(ioc, resolver.GetContext());
    EXPECT_NE(first, second);
    EXPECT_EQ(second->Browser()->Endpoint(), "ws://fake/devtools/browser/2");
}

TEST(ContextResolver, FailureLeavesStateUntouched) {
    net::io_context ioc;
    auto driver = std::make_shared<FakeDriver>();
    driver->failWith = "Could not find Chrome";
    ContextResolver resolver(Config{}, driver);
    EXPECT_THROW(RunSync(ioc, resolver.GetContext()), errors::BrowserConnectionError);
    EXPECT_EQ(resolver.GetState(), ContextResolver::State::Unresolved);

    driver->failWith.clear();
    auto context = RunSync(ioc, resolver.GetContext());
    EXPECT_NE(context, nullptr);
    EXPECT_EQ(resolver.GetState(), ContextResolver::State::Resolved);

    // A failing rebuild keeps the previous context
    driver->fakeBrowser = std::make_shared<FakeBrowser>();
    driver->fakeBrowser->failures["Target.getTargets"] = "Target closed";
    EXPECT_THROW(RunSync(ioc, resolver.GetContext()), errors::CdpError);
    EXPECT_EQ(resolver.Current(), context);
}
