//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_async_mutex.cpp
// Purpose: FIFO coroutine mutex ordering and release tests
//==========================================================================================================

#include <gtest/gtest.h>

#include <chrono>
#include <stdexcept>
#include <string>
#include <vector>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>

#include "dtmcp/async/AsyncMutex.hpp"

using namespace dtmcp;
namespace net = boost::asio;

namespace {

net::awaitable<void> holdFor(async::AsyncMutex& mutex, std::vector<std::string>& trace, std::string name,
                             std::chrono::milliseconds hold) {
    auto lock = co_await mutex.Acquire();
    trace.push_back(name + ":enter");
    net::steady_timer timer(co_await net::this_coro::executor);
    timer.expires_after(hold);
    co_await timer.async_wait(net::use_awaitable);
    trace.push_back(name + ":exit");
}

net::awaitable<void> throwWhileHolding(async::AsyncMutex& mutex) {
    auto lock = co_await mutex.Acquire();
    throw std::runtime_error("boom");
}

} // namespace

TEST(AsyncMutex, UncontendedAcquireIsImmediate) {
    net::io_context ioc;
    async::AsyncMutex mutex;
    bool owned = false;
    net::co_spawn(ioc, [&]() -> net::awaitable<void> {
        auto lock = co_await mutex.Acquire();
        owned = lock.OwnsLock();
        EXPECT_TRUE(mutex.IsLocked());
    }, net::detached);
    ioc.run();
    EXPECT_TRUE(owned);
    EXPECT_FALSE(mutex.IsLocked());
}

TEST(AsyncMutex, HoldersNeverOverlapAndRunInArrivalOrder) {
    net::io_context ioc;
    async::AsyncMutex mutex;
    std::vector<std::string> trace;
    // The first holder is the slowest; later arrivals must still wait their turn
    net::co_spawn(ioc, holdFor(mutex, trace, "a", std::chrono::milliseconds(30)), net::detached);
    net::co_spawn(ioc, holdFor(mutex, trace, "b", std::chrono::milliseconds(1)), net::detached);
    net::co_spawn(ioc, holdFor(mutex, trace, "c", std::chrono::milliseconds(1)), net::detached);
    ioc.run();

    std::vector<std::string> expected{"a:enter", "a:exit", "b:enter", "b:exit", "c:enter", "c:exit"};
    EXPECT_EQ(trace, expected);
    EXPECT_FALSE(mutex.IsLocked());
    EXPECT_EQ(mutex.WaiterCount(), 0u);
}

TEST(AsyncMutex, ExceptionReleasesTheLock) {
    net::io_context ioc;
    async::AsyncMutex mutex;
    std::vector<std::string> trace;
    bool threw = false;
    net::co_spawn(ioc, throwWhileHolding(mutex), [&](std::exception_ptr e) { threw = e != nullptr; });
    net::co_spawn(ioc, holdFor(mutex, trace, "next", std::chrono::milliseconds(1)), net::detached);
    ioc.run();
    EXPECT_TRUE(threw);
    ASSERT_EQ(trace.size(), 2u);
    EXPECT_EQ(trace.front(), "next:enter");
    EXPECT_FALSE(mutex.IsLocked());
}

TEST(AsyncMutex, ExplicitReleaseIsIdempotent) {
    net::io_context ioc;
    async::AsyncMutex mutex;
    net::co_spawn(ioc, [&]() -> net::awaitable<void> {
        auto lock = co_await mutex.Acquire();
        lock.Release();
        EXPECT_FALSE(lock.OwnsLock());
        EXPECT_FALSE(mutex.IsLocked());
        lock.Release();
        auto again = co_await mutex.Acquire();
        EXPECT_TRUE(again.OwnsLock());
    }, net::detached);
    ioc.run();
    EXPECT_FALSE(mutex.IsLocked());
}
