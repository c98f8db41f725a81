//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_stdio_transport.cpp
// Purpose: Newline-delimited JSON-RPC over pipes
//==========================================================================================================

#include <gtest/gtest.h>

#include <unistd.h>

#include <chrono>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

#include "dtmcp/JSONRPCTypes.h"
#include "dtmcp/Server.h"
#include "dtmcp/StdioTransport.hpp"
#include "fakes/FakeBrowser.hpp"

using namespace dtmcp;
using dtmcp::fakes::FakeDriver;
using dtmcp::fakes::RunSync;

namespace {

//==========================================================================================================
// PipeHarness
// Purpose: Feeds a transport through one pipe and collects its output from another.
//==========================================================================================================
class PipeHarness {
public:
    PipeHarness() {
        EXPECT_EQ(::pipe(in_), 0);
        EXPECT_EQ(::pipe(out_), 0);
        transport = std::make_shared<StdioTransport>(ioc.get_executor(), in_[0], out_[1]);
        transport->SetPrintDisclaimer(false);
    }

    ~PipeHarness() {
        closeInput();
        if (out_[0] >= 0) {
            ::close(out_[0]);
        }
    }

    void write(const std::string& data) {
        ASSERT_EQ(::write(in_[1], data.data(), data.size()), static_cast<ssize_t>(data.size()));
    }

    void closeInput() {
        if (in_[1] >= 0) {
            ::close(in_[1]);
            in_[1] = -1;
        }
    }

    // Releases the transport (closing its output end) and returns every line it wrote.
    std::vector<std::string> drain() {
        transport.reset();
        std::string all;
        char chunk[4096];
        for (;;) {
            const ssize_t n = ::read(out_[0], chunk, sizeof(chunk));
            if (n <= 0) {
                break;
            }
            all.append(chunk, static_cast<std::size_t>(n));
        }
        std::vector<std::string> lines;
        std::size_t start = 0;
        for (std::size_t pos = all.find('\n'); pos != std::string::npos; pos = all.find('\n', start)) {
            lines.push_back(all.substr(start, pos - start));
            start = pos + 1;
        }
        EXPECT_EQ(start, all.size()) << "unterminated output frame";
        return lines;
    }

    net::io_context ioc;
    std::shared_ptr<StdioTransport> transport;

private:
    int in_[2]{-1, -1};
    int out_[2]{-1, -1};
};

std::map<std::string, JSONValue> byId(const std::vector<std::string>& lines) {
    std::map<std::string, JSONValue> out;
    for (const auto& line : lines) {
        JSONValue v = ParseJSON(line);
        const JSONValue* id = json::Find(v, "id");
        out.emplace(id ? SerializeJSON(*id) : std::string("null"), std::move(v));
    }
    return out;
}

int64_t errorCode(const JSONValue& message) {
    const JSONValue* error = json::Find(message, "error");
    return error ? json::GetInt(*error, "code").value_or(0) : 0;
}

} // namespace

TEST(StdioTransport, AnswersRequestsAndSkipsNotifications) {
    PipeHarness harness;
    auto server = Server::Create(Config{}, std::make_shared<FakeDriver>());
    server->Connect(*harness.transport);

    harness.write(R"({"jsonrpc":"2.0","id":1,"method":"initialize","params":{"protocolVersion":"2025-06-18"}})" "\n");
    harness.write(R"({"jsonrpc":"2.0","method":"notifications/initialized"})" "\n");
    harness.write("\n   \n");
    harness.write(R"({"jsonrpc":"2.0","id":2,"method":"ping"})" "\r\n");
    harness.write(R"({"jsonrpc":"2.0","id":3,"method":"tools/list"})");
    harness.closeInput();

    RunSync(harness.ioc, harness.transport->Run());
    EXPECT_FALSE(harness.transport->IsConnected());
    auto replies = byId(harness.drain());

    ASSERT_EQ(replies.size(), 3u);
    ASSERT_TRUE(replies.count("1"));
    const JSONValue* result = json::Find(replies.at("1"), "result");
    ASSERT_NE(result, nullptr);
    EXPECT_EQ(json::GetString(*result, "protocolVersion").value_or(""), "2025-06-18");
    EXPECT_TRUE(replies.count("2"));
    ASSERT_TRUE(replies.count("3"));
    EXPECT_NE(json::Find(replies.at("3"), "result"), nullptr);
    EXPECT_TRUE(server->IsInitialized());
}

TEST(StdioTransport, MalformedFramesGetNullIdErrors) {
    PipeHarness harness;
    harness.write("{not json\n[1,2]\n{\"id\":7}\n");
    harness.closeInput();

    RunSync(harness.ioc, harness.transport->Run());
    auto lines = harness.drain();
    ASSERT_EQ(lines.size(), 3u);
    std::vector<int64_t> codes;
    for (const auto& line : lines) {
        JSONValue v = ParseJSON(line);
        const JSONValue* id = json::Find(v, "id");
        ASSERT_NE(id, nullptr);
        EXPECT_TRUE(id->IsNull());
        codes.push_back(errorCode(v));
    }
    EXPECT_EQ(codes, (std::vector<int64_t>{JSONRPCErrorCodes::ParseError, JSONRPCErrorCodes::InvalidRequest,
                                           JSONRPCErrorCodes::InvalidRequest}));
}

TEST(StdioTransport, EndOfInputWaitsForToolCallsInFlight) {
    PipeHarness harness;
    auto driver = std::make_shared<FakeDriver>();
    driver->fakeBrowser->latency = std::chrono::milliseconds(50);
    auto server = Server::Create(Config{}, driver);
    server->Connect(*harness.transport);

    harness.write(R"({"jsonrpc":"2.0","id":1,"method":"tools/call","params":{"name":"list_pages","arguments":{}}})" "\n");
    harness.write(R"({"jsonrpc":"2.0","id":2,"method":"tools/call","params":{"name":"list_pages","arguments":{}}})" "\n");
    harness.closeInput();

    bool guardHeldAtReturn = true;
    auto session = [&]() -> net::awaitable<void> {
        co_await harness.transport->Run();
        guardHeldAtReturn = server->Guard().IsLocked();
        // What the entry point does once the session is over
        driver->fakeBrowser->Close();
    };
    RunSync(harness.ioc, session());
    EXPECT_FALSE(guardHeldAtReturn);
    EXPECT_EQ(driver->launchCalls, 1);

    auto replies = byId(harness.drain());
    ASSERT_EQ(replies.size(), 2u);
    for (const char* id : {"1", "2"}) {
        ASSERT_TRUE(replies.count(id)) << id;
        const JSONValue* result = json::Find(replies.at(id), "result");
        ASSERT_NE(result, nullptr) << id;
        EXPECT_FALSE(json::GetBool(*result, "isError").value_or(false)) << id;
        EXPECT_NE(SerializeJSON(*result).find("## Pages"), std::string::npos) << id;
    }
}

TEST(StdioTransport, HandlerExceptionBecomesInternalError) {
    PipeHarness harness;
    harness.transport->SetRequestHandler([](const JSONRPCRequest&) -> net::awaitable<std::unique_ptr<JSONRPCResponse>> {
        throw std::runtime_error("handler failed");
        co_return nullptr;
    });
    harness.write(R"({"jsonrpc":"2.0","id":"a","method":"ping"})" "\n");
    harness.closeInput();

    RunSync(harness.ioc, harness.transport->Run());
    auto replies = byId(harness.drain());
    ASSERT_TRUE(replies.count("\"a\""));
    EXPECT_EQ(errorCode(replies.at("\"a\"")), JSONRPCErrorCodes::InternalError);
}

TEST(StdioTransport, OversizedFrameEndsTheSession) {
    PipeHarness harness;
    std::vector<std::string> errors;
    harness.transport->SetErrorHandler([&errors](const std::string& e) { errors.push_back(e); });
    harness.transport->SetMaxFrameBytes(32);
    harness.write(std::string(100, 'x') + "\n");

    RunSync(harness.ioc, harness.transport->Run());
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0], "stdio frame exceeds maximum size");
}

TEST(StdioTransport, CloseStopsReading) {
    PipeHarness harness;
    std::weak_ptr<StdioTransport> weak = harness.transport;
    auto closer = [weak]() -> net::awaitable<void> {
        net::steady_timer timer(co_await net::this_coro::executor);
        timer.expires_after(std::chrono::milliseconds(20));
        co_await timer.async_wait(net::use_awaitable);
        if (auto transport = weak.lock()) {
            transport->Close();
        }
    };
    net::co_spawn(harness.ioc, closer, net::detached);

    RunSync(harness.ioc, harness.transport->Run());
    EXPECT_FALSE(harness.transport->IsConnected());
    EXPECT_EQ(harness.transport->GetSessionId(), "stdio");
}
