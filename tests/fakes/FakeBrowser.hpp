//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: FakeBrowser.hpp
// Purpose: In-process IBrowser / IBrowserDriver doubles and a helper to drive coroutines in tests
//==========================================================================================================

#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/use_future.hpp>

#include "dtmcp/JSONRPCTypes.h"
#include "dtmcp/browser/Browser.h"
#include "dtmcp/errors/Errors.h"

namespace dtmcp {
namespace fakes {

namespace net = boost::asio;

// Runs `op` to completion on `ioc` and returns its result (rethrowing its exception).
template <typename T>
T RunSync(net::io_context& ioc, net::awaitable<T> op) {
    auto fut = net::co_spawn(ioc, std::move(op), net::use_future);
    ioc.restart();
    ioc.run();
    return fut.get();
}

//==========================================================================================================
// FakeBrowser
// Purpose: Minimal target model answering the Target.* commands the context issues. Every command is
//          recorded; other commands answer {} unless a canned result or failure is registered.
//==========================================================================================================
class FakeBrowser : public browser::IBrowser {
public:
    struct Target {
        std::string targetId;
        std::string type{"page"};
        std::string url{"about:blank"};
        std::string title;
    };

    struct Call {
        std::string method;
        JSONValue params;
        std::string sessionId;
    };

    FakeBrowser() = default;
    explicit FakeBrowser(std::string endpoint) : endpoint(std::move(endpoint)) {}

    std::string AddPage(const std::string& url, const std::string& type = "page") {
        Target t;
        t.targetId = "T" + std::to_string(nextTarget++);
        t.type = type;
        t.url = url;
        targets.push_back(t);
        return t.targetId;
    }

    // Dispatches a protocol event to every subscriber.
    void Emit(const std::string& method, const JSONValue& params, const std::string& sessionId) {
        auto copy = subscribers;
        for (auto& [id, handler] : copy) {
            handler(method, params, sessionId);
        }
    }

    // Session id the fake hands out when attaching to `targetId`.
    static std::string SessionFor(const std::string& targetId) { return "S-" + targetId; }

    std::size_t CountCalls(const std::string& method) const {
        std::size_t n = 0;
        for (const auto& c : calls) {
            if (c.method == method) {
                ++n;
            }
        }
        return n;
    }

    net::awaitable<JSONValue> Send(std::string method, JSONValue params, std::string sessionId) override {
        calls.push_back(Call{method, params, sessionId});
        if (latency.count() > 0) {
            net::steady_timer timer(co_await net::this_coro::executor);
            timer.expires_after(latency);
            co_await timer.async_wait(net::use_awaitable);
        }
        if (auto failure = failures.find(method); failure != failures.end()) {
            throw errors::CdpError(failure->second, -32000);
        }
        if (auto canned = results.find(method); canned != results.end()) {
            co_return canned->second;
        }
        if (method == "Target.getTargets") {
            JSONValue::Array infos;
            for (const auto& t : targets) {
                infos.push_back(std::make_shared<JSONValue>(json::ObjectBuilder()
                                                                .Set("targetId", t.targetId)
                                                                .Set("type", t.type)
                                                                .Set("url", t.url)
                                                                .Set("title", t.title)
                                                                .Build()));
            }
            co_return json::ObjectBuilder().Set("targetInfos", JSONValue{std::move(infos)}).Build();
        }
        if (method == "Target.attachToTarget") {
            co_return json::ObjectBuilder()
                .Set("sessionId", SessionFor(json::GetString(params, "targetId").value_or("")))
                .Build();
        }
        if (method == "Target.createTarget") {
            std::string id = AddPage(json::GetString(params, "url").value_or("about:blank"));
            co_return json::ObjectBuilder().Set("targetId", id).Build();
        }
        if (method == "Target.closeTarget") {
            auto id = json::GetString(params, "targetId").value_or("");
            for (auto it = targets.begin(); it != targets.end(); ++it) {
                if (it->targetId == id) {
                    targets.erase(it);
                    break;
                }
            }
            co_return json::ObjectBuilder().Set("success", true).Build();
        }
        if (method == "Page.navigate") {
            auto url = json::GetString(params, "url").value_or("");
            for (auto& t : targets) {
                if (SessionFor(t.targetId) == sessionId) {
                    t.url = url;
                }
            }
            co_return json::ObjectBuilder().Set("frameId", "F1").Build();
        }
        co_return JSONValue{JSONValue::Object{}};
    }

    SubscriptionId Subscribe(EventHandler handler) override {
        const SubscriptionId id = nextSubscription++;
        subscribers[id] = std::move(handler);
        return id;
    }

    void Unsubscribe(SubscriptionId id) override { subscribers.erase(id); }

    bool IsConnected() const override { return connected; }
    std::string Endpoint() const override { return endpoint; }
    void Close() override {
        connected = false;
        ++closeCount;
    }

    std::string endpoint{"ws://fake/devtools/browser/1"};
    std::vector<Target> targets;
    std::vector<Call> calls;
    std::map<std::string, std::string> failures;   // method -> error message
    std::map<std::string, JSONValue> results;      // method -> canned result
    std::chrono::milliseconds latency{0};
    bool connected{true};
    int closeCount{0};
    std::map<SubscriptionId, EventHandler> subscribers;

private:
    int nextTarget{1};
    SubscriptionId nextSubscription{1};
};

//==========================================================================================================
// FakeDriver
// Purpose: Hands out a fixed browser; counts and records every request. `failWith` makes the next
//          requests throw errors::BrowserConnectionError.
//==========================================================================================================
class FakeDriver : public browser::IBrowserDriver {
public:
    FakeDriver() : fakeBrowser(std::make_shared<FakeBrowser>()) {}
    explicit FakeDriver(std::shared_ptr<FakeBrowser> b) : fakeBrowser(std::move(b)) {}

    net::awaitable<std::shared_ptr<browser::IBrowser>> ConnectExisting(browser::ConnectOptions options) override {
        ++connectCalls;
        lastConnect = std::move(options);
        if (!failWith.empty()) {
            throw errors::BrowserConnectionError(failWith);
        }
        co_return fakeBrowser;
    }

    net::awaitable<std::shared_ptr<browser::IBrowser>> LaunchNew(browser::LaunchOptions options) override {
        ++launchCalls;
        lastLaunch = std::move(options);
        if (!failWith.empty()) {
            throw errors::BrowserConnectionError(failWith);
        }
        co_return fakeBrowser;
    }

    std::shared_ptr<FakeBrowser> fakeBrowser;
    std::string failWith;
    int connectCalls{0};
    int launchCalls{0};
    browser::ConnectOptions lastConnect;
    browser::LaunchOptions lastLaunch;
};

} // namespace fakes
} // namespace dtmcp
