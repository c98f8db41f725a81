//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: AsyncMutex.hpp
// Purpose: FIFO mutual exclusion for Boost.Asio coroutines running on one io_context
//==========================================================================================================

#pragma once

#include <cstddef>
#include <deque>
#include <memory>
#include <utility>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

namespace dtmcp {
namespace async {

namespace net = boost::asio;

//==========================================================================================================
// AsyncMutex
// Purpose: Suspends coroutines (instead of blocking threads) until the lock is available.
// Notes:
//   - Waiters are resumed strictly in arrival order. Ownership is handed directly to the next
//     waiter on release, so a newcomer can never overtake a queued coroutine.
//   - Not thread-safe: all Acquire() calls must run on the same single-threaded executor.
//   - Each waiter parks on a steady_timer that never expires; release() cancels it to resume.
//==========================================================================================================
class AsyncMutex {
public:
    //======================================================================================================
    // Lock
    // Purpose: Move-only RAII ownership token. Destruction (or Release()) releases exactly once.
    //======================================================================================================
    class Lock {
    public:
        Lock() = default;
        explicit Lock(AsyncMutex* owner) : owner_(owner) {}
        Lock(const Lock&) = delete;
        Lock& operator=(const Lock&) = delete;
        Lock(Lock&& other) noexcept : owner_(std::exchange(other.owner_, nullptr)) {}
        Lock& operator=(Lock&& other) noexcept {
            if (this != &other) {
                Release();
                owner_ = std::exchange(other.owner_, nullptr);
            }
            return *this;
        }
        ~Lock() { Release(); }

        void Release() noexcept {
            if (owner_) {
                std::exchange(owner_, nullptr)->release();
            }
        }

        bool OwnsLock() const noexcept { return owner_ != nullptr; }

    private:
        AsyncMutex* owner_{nullptr};
    };

    AsyncMutex() = default;
    AsyncMutex(const AsyncMutex&) = delete;
    AsyncMutex& operator=(const AsyncMutex&) = delete;

    //======================================================================================================
    // Acquire
    // Purpose: Returns once the caller owns the mutex; suspends while another holder is active.
    //======================================================================================================
    net::awaitable<Lock> Acquire() {
        if (!locked_) {
            locked_ = true;
            co_return Lock(this);
        }
        auto executor = co_await net::this_coro::executor;
        auto waiter = std::make_shared<net::steady_timer>(executor, net::steady_timer::time_point::max());
        waiters_.push_back(waiter);
        boost::system::error_code ec;
        co_await waiter->async_wait(net::redirect_error(net::use_awaitable, ec));
        // release() kept locked_ set and passed ownership to us
        co_return Lock(this);
    }

    bool IsLocked() const noexcept { return locked_; }
    std::size_t WaiterCount() const noexcept { return waiters_.size(); }

private:
    void release() noexcept {
        if (waiters_.empty()) {
            locked_ = false;
            return;
        }
        auto next = std::move(waiters_.front());
        waiters_.pop_front();
        next->cancel();
    }

    bool locked_{false};
    std::deque<std::shared_ptr<net::steady_timer>> waiters_;
};

} // namespace async
} // namespace dtmcp
