//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_session_registry.cpp
// Purpose: Session registry bookkeeping and adapter lifecycle events
//==========================================================================================================

#include <gtest/gtest.h>

#include <memory>
#include <string>

#include <boost/asio/io_context.hpp>

#include "dtmcp/SessionRegistry.hpp"
#include "fakes/FakeBrowser.hpp"

using namespace dtmcp;
using dtmcp::fakes::FakeDriver;
using dtmcp::fakes::RunSync;

namespace {

StreamableHttpTransport::Request initializeRequest() {
    StreamableHttpTransport::Request req{http::verb::post, "/mcp", 11};
    req.set(http::field::content_type, "application/json");
    req.body() = R"({"jsonrpc":"2.0","id":1,"method":"initialize","params":{"protocolVersion":"2025-06-18"}})";
    req.prepare_payload();
    return req;
}

} // namespace

TEST(SessionRegistry, InsertRejectsEmptyAndDuplicateIds) {
    auto registry = std::make_shared<SessionRegistry>();
    EXPECT_FALSE(registry->Insert(Session{"", nullptr, nullptr}));
    EXPECT_TRUE(registry->Insert(Session{"a", nullptr, nullptr}));
    EXPECT_FALSE(registry->Insert(Session{"a", nullptr, nullptr}));
    EXPECT_EQ(registry->Size(), 1u);
    EXPECT_TRUE(registry->Contains("a"));
}

TEST(SessionRegistry, FindAndRemove) {
    auto registry = std::make_shared<SessionRegistry>();
    auto server = Server::Create(Config{}, std::make_shared<FakeDriver>());
    registry->Insert(Session{"b", nullptr, server});
    registry->Insert(Session{"a", nullptr, nullptr});

    auto found = registry->Find("b");
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->server, server);
    EXPECT_FALSE(registry->Find("c").has_value());
    EXPECT_EQ(registry->Ids(), (std::vector<std::string>{"a", "b"}));

    EXPECT_TRUE(registry->Remove("b"));
    EXPECT_FALSE(registry->Remove("b"));
    EXPECT_FALSE(registry->Contains("b"));
    EXPECT_EQ(registry->Size(), 1u);
}

TEST(SessionRegistry, AdapterEventsRegisterAndUnregisterTheSession) {
    net::io_context ioc;
    auto registry = std::make_shared<SessionRegistry>();
    auto server = Server::Create(Config{}, std::make_shared<FakeDriver>());
    auto transport = std::make_shared<StreamableHttpTransport>(registry->EventsFor(server),
                                                               [] { return std::string("session-1"); });
    server->Connect(*transport);
    EXPECT_EQ(registry->Size(), 0u);

    auto initialize = initializeRequest();
    auto res = RunSync(ioc, transport->HandleRequest(initialize));
    EXPECT_EQ(res.result(), http::status::ok);

    auto session = registry->Find("session-1");
    ASSERT_TRUE(session.has_value());
    EXPECT_EQ(session->transport, transport);
    EXPECT_EQ(session->server, server);

    transport->Close();
    EXPECT_FALSE(registry->Contains("session-1"));
    transport->Close();
    EXPECT_EQ(registry->Size(), 0u);
}

TEST(SessionRegistry, EventsOutliveTheRegistrySafely) {
    net::io_context ioc;
    auto registry = std::make_shared<SessionRegistry>();
    auto transport = std::make_shared<StreamableHttpTransport>(
        registry->EventsFor(Server::Create(Config{}, std::make_shared<FakeDriver>())));
    registry.reset();
    auto initialize = initializeRequest();
    auto res = RunSync(ioc, transport->HandleRequest(initialize));
    EXPECT_EQ(res.result(), http::status::ok);
    EXPECT_TRUE(transport->IsInitialized());
    transport->Close();
    EXPECT_FALSE(transport->IsConnected());
}
