/*

async_mutex.hpp
---------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <mutex>
#include <utility>

#include <smtpxx/detail/asio_decl.hpp>
#include <smtpxx/detail/result.hpp>
#include <smtpxx/detail/wait_queue.hpp>

namespace smtpxx::detail
{

/// Coroutine mutex with FIFO hand-off; never blocks the calling thread.
class async_mutex
{
public:
    class scoped_lock
    {
    public:
        scoped_lock() noexcept = default;

        scoped_lock(const scoped_lock&) = delete;
        scoped_lock& operator=(const scoped_lock&) = delete;

        scoped_lock(scoped_lock&& other) noexcept
            : mutex_(std::exchange(other.mutex_, nullptr))
        {
        }

        scoped_lock& operator=(scoped_lock&& other) noexcept
        {
            if (this != &other)
            {
                unlock();
                mutex_ = std::exchange(other.mutex_, nullptr);
            }
            return *this;
        }

        ~scoped_lock()
        {
            unlock();
        }

        [[nodiscard]] bool owns_lock() const noexcept { return mutex_ != nullptr; }

    private:
        friend class async_mutex;

        explicit scoped_lock(async_mutex& mutex) noexcept
            : mutex_(&mutex)
        {
        }

        void unlock() noexcept
        {
            if (mutex_ != nullptr)
            {
                mutex_->unlock();
                mutex_ = nullptr;
            }
        }

        async_mutex* mutex_{nullptr};
    };

    explicit async_mutex(smtpxx::asio::any_io_executor executor)
        : waiters_(std::move(executor))
    {
    }

    async_mutex(const async_mutex&) = delete;
    async_mutex& operator=(const async_mutex&) = delete;

    /// Lock the mutex asynchronously; fails with net_cancelled if the wait is aborted.
    smtpxx::asio::awaitable<result<scoped_lock>> lock()
    {
        wait_queue::ticket waiter;
        {
            std::lock_guard<std::mutex> guard(state_mutex_);
            if (!locked_)
            {
                locked_ = true;
                co_return scoped_lock(*this);
            }
            waiter = waiters_.enqueue();
        }

        // Ownership is handed over directly by unlock().
        if (!co_await waiters_.wait(waiter))
            co_return fail<scoped_lock>(errc::net_cancelled, "async_mutex lock cancelled");
        co_return scoped_lock(*this);
    }

private:
    void unlock() noexcept
    {
        std::lock_guard<std::mutex> guard(state_mutex_);
        if (!waiters_.notify_one())
            locked_ = false;
    }

    std::mutex state_mutex_;
    bool locked_{false};
    wait_queue waiters_;
};

} // namespace smtpxx::detail
