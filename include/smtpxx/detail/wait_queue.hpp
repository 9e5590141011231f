/*

wait_queue.hpp
--------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

FIFO of suspended coroutines, each parked on its own steady_timer.
Used by the pool (acquire wait), the rate limiter (concurrency permits) and
async_mutex.

*/


#pragma once

#include <algorithm>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <utility>

#include <smtpxx/detail/asio_decl.hpp>

namespace smtpxx::detail
{

class wait_queue
{
    struct waiter_t
    {
        explicit waiter_t(smtpxx::asio::any_io_executor executor)
            : timer(std::move(executor))
        {
        }

        smtpxx::asio::steady_timer timer;
        bool notified{false};
    };

public:
    using ticket = std::shared_ptr<waiter_t>;
    using time_point = smtpxx::asio::steady_timer::time_point;

    explicit wait_queue(smtpxx::asio::any_io_executor executor)
        : executor_(std::move(executor))
    {
    }

    wait_queue(const wait_queue&) = delete;
    wait_queue& operator=(const wait_queue&) = delete;

    /**
     * Registers a waiter. Call this while the condition being waited on is
     * still known to be false, so a notify issued before wait() is not lost.
     */
    [[nodiscard]] ticket enqueue(time_point deadline = time_point::max())
    {
        auto waiter = std::make_shared<waiter_t>(executor_);
        waiter->timer.expires_at(deadline);
        std::lock_guard<std::mutex> guard(mutex_);
        waiters_.push_back(waiter);
        return waiter;
    }

    /// Suspends until notified (true) or until the deadline or cancellation (false).
    smtpxx::asio::awaitable<bool> wait(ticket waiter)
    {
        smtpxx::asio::error_code ec;
        co_await waiter->timer.async_wait(smtpxx::asio::redirect_error(smtpxx::asio::use_awaitable, ec));

        std::lock_guard<std::mutex> guard(mutex_);
        if (waiter->notified)
            co_return true;

        auto it = std::find(waiters_.begin(), waiters_.end(), waiter);
        if (it != waiters_.end())
            waiters_.erase(it);
        co_return false;
    }

    /// Withdraws a ticket that will not be waited on. Returns true if it had already been notified.
    bool cancel(const ticket& waiter)
    {
        std::lock_guard<std::mutex> guard(mutex_);
        auto it = std::find(waiters_.begin(), waiters_.end(), waiter);
        if (it != waiters_.end())
        {
            waiters_.erase(it);
            return false;
        }
        return waiter->notified;
    }

    /// Wakes the oldest waiter. Returns false when nobody was waiting.
    bool notify_one()
    {
        std::lock_guard<std::mutex> guard(mutex_);
        if (waiters_.empty())
            return false;
        wake(waiters_.front());
        waiters_.pop_front();
        return true;
    }

    std::size_t notify_all()
    {
        std::lock_guard<std::mutex> guard(mutex_);
        const std::size_t count = waiters_.size();
        for (auto& waiter : waiters_)
            wake(waiter);
        waiters_.clear();
        return count;
    }

    [[nodiscard]] std::size_t size() const
    {
        std::lock_guard<std::mutex> guard(mutex_);
        return waiters_.size();
    }

private:
    static void wake(const ticket& waiter)
    {
        waiter->notified = true;
        // An expiry in the past also completes a wait that has not started yet.
        waiter->timer.expires_at(time_point::min());
    }

    smtpxx::asio::any_io_executor executor_;
    mutable std::mutex mutex_;
    std::deque<ticket> waiters_;
};

} // namespace smtpxx::detail
