//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Signal.h
// Purpose: One-shot awaitable event for Boost.Asio coroutines, built on a never-expiring steady_timer
//==========================================================================================================

#pragma once

#include <chrono>
#include <memory>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

namespace mcphost {
namespace async {

namespace net = boost::asio;

//==========================================================================================================
// Signal
// Purpose: Lets any number of coroutines suspend until fire() is called once. The timer never expires on
//          its own; fire() cancels it, which completes every pending wait. Waiters re-check the flag so a
//          cancel issued for another reason only causes a re-wait.
// Notes:
//   Not thread-safe. All calls must happen on the executor the Signal was created with.
//==========================================================================================================
class Signal {
public:
    explicit Signal(const net::any_io_executor& ex)
        : timer_(ex, net::steady_timer::time_point::max()) {}

    Signal(const Signal&) = delete;
    Signal& operator=(const Signal&) = delete;

    void fire() {
        if (fired_) {
            return;
        }
        fired_ = true;
        timer_.cancel();
    }

    bool fired() const { return fired_; }

    net::awaitable<void> wait() {
        while (!fired_) {
            boost::system::error_code ec;
            co_await timer_.async_wait(net::redirect_error(net::use_awaitable, ec));
        }
    }

    //------------------------------------------------------------------------------------------------------
    // waitFor
    // Purpose: Waits for fire() or until the timeout elapses, whichever comes first.
    // Returns: true when the signal fired, false on timeout.
    //------------------------------------------------------------------------------------------------------
    net::awaitable<bool> waitFor(std::chrono::steady_clock::duration timeout) {
        if (fired_) {
            co_return true;
        }
        auto ex = co_await net::this_coro::executor;
        struct WaitState { bool timedOut{false}; bool done{false}; };
        auto state = std::make_shared<WaitState>();
        net::steady_timer deadline(ex, timeout);
        deadline.async_wait([this, state](const boost::system::error_code& ec) {
            if (!ec && !state->done) {
                state->timedOut = true;
                timer_.cancel();
            }
        });
        while (!fired_ && !state->timedOut) {
            boost::system::error_code ec;
            co_await timer_.async_wait(net::redirect_error(net::use_awaitable, ec));
        }
        state->done = true;
        deadline.cancel();
        co_return fired_;
    }

private:
    net::steady_timer timer_;
    bool fired_{false};
};

} // namespace async
} // namespace mcphost
