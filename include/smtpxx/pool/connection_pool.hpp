/*

pool/connection_pool.hpp
------------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <chrono>
#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include <smtpxx/detail/asio_decl.hpp>
#include <smtpxx/detail/error_detail.hpp>
#include <smtpxx/detail/log.hpp>
#include <smtpxx/detail/result.hpp>
#include <smtpxx/detail/wait_queue.hpp>
#include <smtpxx/pool/pool_config.hpp>
#include <smtpxx/smtp/transport.hpp>

namespace smtpxx::pool
{

class connection_pool;


/**
 * Exclusive, move-only handle on a pooled connection.
 * Returns the connection to the pool exactly once, on release() or destruction.
 * A lease that outlives its pool just closes the connection.
 */
class lease
{
public:
    lease() = default;

    lease(lease&& other) noexcept
        : pool_(std::move(other.pool_)),
          conn_(std::move(other.conn_))
    {
    }

    lease& operator=(lease&& other) noexcept
    {
        if (this != &other)
        {
            release();
            pool_ = std::move(other.pool_);
            conn_ = std::move(other.conn_);
        }
        return *this;
    }

    // Non-copyable
    lease(const lease&) = delete;
    lease& operator=(const lease&) = delete;

    ~lease()
    {
        release();
    }

    /// Access the underlying transport
    smtp::transport& operator*() { return *conn_; }
    const smtp::transport& operator*() const { return *conn_; }

    smtp::transport* operator->() { return conn_.get(); }
    const smtp::transport* operator->() const { return conn_.get(); }

    smtp::transport* get() { return conn_.get(); }
    const smtp::transport* get() const { return conn_.get(); }

    explicit operator bool() const noexcept { return conn_ != nullptr; }

    /// Ensures the connection is destroyed instead of reused.
    void invalidate() noexcept
    {
        if (conn_)
            conn_->mark_unhealthy();
    }

    /// Explicitly release back to pool (normally done by destructor)
    void release();

private:
    friend class connection_pool;

    lease(std::weak_ptr<connection_pool> pool, std::unique_ptr<smtp::transport> conn)
        : pool_(std::move(pool)),
          conn_(std::move(conn))
    {
    }

    std::weak_ptr<connection_pool> pool_;
    std::unique_ptr<smtp::transport> conn_;
};


/**
 * Bounded set of SMTP transports with async acquire.
 *
 * A slot is reserved before the factory suspends, so concurrent acquirers can
 * never push the pool past max_connections. Callers that find the pool full
 * park on a wait_queue until a connection is returned, a slot frees up or
 * acquire_timeout elapses. Always create it through make_pool(): leases and
 * the maintenance task keep weak references to it.
 */
class connection_pool : public std::enable_shared_from_this<connection_pool>
{
public:
    using factory_type = std::function<smtpxx::asio::awaitable<result<std::unique_ptr<smtp::transport>>>()>;

    /**
     * Create a connection pool.
     *
     * @param executor The executor for async operations
     * @param config Pool configuration
     * @param factory Function that opens a new connection
     */
    connection_pool(smtpxx::asio::any_io_executor executor, pool_config config, factory_type factory)
        : executor_(std::move(executor)),
          config_(std::move(config)),
          factory_(std::move(factory)),
          waiters_(executor_)
    {
    }

    ~connection_pool()
    {
        if (maintenance_timer_)
            maintenance_timer_->cancel();
    }

    // Non-copyable, non-movable
    connection_pool(const connection_pool&) = delete;
    connection_pool& operator=(const connection_pool&) = delete;

    /**
     * Acquire a connection from the pool.
     * Creates a new connection if no healthy idle one exists and the pool is
     * under its maximum; waits otherwise.
     *
     * @return A lease that returns the connection on destruction, or
     *         pool_exhausted on timeout, pool_closed, or the factory's error.
     */
    smtpxx::asio::awaitable<result<lease>> acquire()
    {
        const auto deadline = std::chrono::steady_clock::now() + config_.acquire_timeout;
        bool waited = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++stats_.acquires;
        }

        while (true)
        {
            std::unique_ptr<smtp::transport> conn;
            std::vector<std::unique_ptr<smtp::transport>> stale;
            bool create = false;
            detail::wait_queue::ticket waiter;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (closed_)
                    co_return fail<lease>(errc::pool_closed, "Connection pool is closed.");

                while (!idle_.empty() && !conn)
                {
                    auto candidate = std::move(idle_.back());
                    idle_.pop_back();
                    if (expired(*candidate) || !candidate->healthy())
                    {
                        --total_;
                        ++stats_.destroyed;
                        ++stats_.recycled;
                        stale.push_back(std::move(candidate));
                        continue;
                    }
                    conn = std::move(candidate);
                    ++in_use_;
                }

                if (!conn)
                {
                    if (total_ < config_.max_connections)
                    {
                        ++total_;
                        ++in_use_;
                        create = true;
                    }
                    else
                    {
                        waiter = waiters_.enqueue(deadline);
                        ++pending_;
                    }
                }
            }
            for (auto& old : stale)
                dispose(std::move(old));

            if (conn)
            {
                if (config_.validate_on_acquire && !co_await probe(*conn))
                {
                    SMTPXX_DEBUG("POOL", "Connection validation failed, recycling");
                    drop(std::move(conn));
                    continue;
                }
                {
                    std::lock_guard<std::mutex> lock(mutex_);
                    if (waited)
                        ++stats_.waits;
                    else
                        ++stats_.hits;
                }
                co_return make_lease(std::move(conn));
            }

            if (create)
            {
                auto made = co_await factory_();
                if (!made)
                {
                    SMTPXX_WARN("POOL", "Failed to create connection: " + made.error().to_string());
                    {
                        std::lock_guard<std::mutex> lock(mutex_);
                        --total_;
                        --in_use_;
                        ++stats_.failed;
                    }
                    waiters_.notify_one();
                    co_return fail<lease>(std::move(made).error());
                }
                {
                    std::lock_guard<std::mutex> lock(mutex_);
                    ++stats_.created;
                    if (waited)
                        ++stats_.waits;
                }
                SMTPXX_DEBUG("POOL", "connection created to " + (*made)->host() + ", total=" + std::to_string(status().total));
                co_return make_lease(std::move(made).value());
            }

            SMTPXX_DEBUG("POOL", "Pool at capacity, waiting for connection...");
            const bool notified = co_await waiters_.wait(waiter);
            waited = true;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                --pending_;
                if (!notified)
                {
                    ++stats_.timeouts;
                    co_return fail<lease>(errc::pool_exhausted, "Timed out waiting for a pooled connection.",
                        detail::error_detail()
                            .add_int("max_connections", config_.max_connections)
                            .add_ms("acquire_timeout", config_.acquire_timeout).str());
                }
            }
        }
    }

    /**
     * Pre-create connections until min_idle are idle.
     * @return The first creation error, if any.
     */
    smtpxx::asio::awaitable<result<void>> warmup()
    {
        SMTPXX_INFO("POOL", "Warming up pool with " + std::to_string(config_.min_idle) + " connections");
        co_return co_await top_up();
    }

    /**
     * Closes idle connections with QUIT and fails every later acquire with
     * pool_closed. Leased connections are closed when they come back.
     */
    smtpxx::asio::awaitable<void> close()
    {
        std::deque<std::unique_ptr<smtp::transport>> idle;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_)
                co_return;
            closed_ = true;
            idle.swap(idle_);
            total_ -= idle.size();
            stats_.destroyed += idle.size();
        }
        if (maintenance_timer_)
            maintenance_timer_->cancel();
        waiters_.notify_all();

        for (auto& conn : idle)
            co_await conn->close();
        SMTPXX_INFO("POOL", "Pool closed");
    }

    /**
     * Starts the periodic eviction / probe / top-up task when
     * health_check_enabled is set. Calling it twice has no effect.
     */
    void start_maintenance()
    {
        if (!config_.health_check_enabled || maintenance_timer_)
            return;
        maintenance_timer_ = std::make_shared<smtpxx::asio::steady_timer>(executor_);
        smtpxx::asio::co_spawn(executor_, maintenance_loop(weak_from_this(), maintenance_timer_,
            config_.health_check_interval), smtpxx::asio::detached);
    }

    /**
     * One maintenance pass: evict expired or broken idle connections, probe
     * the rest with NOOP, then top up to min_idle.
     */
    smtpxx::asio::awaitable<void> run_maintenance()
    {
        std::vector<std::unique_ptr<smtp::transport>> evicted;
        std::deque<std::unique_ptr<smtp::transport>> probing;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_)
                co_return;
            while (!idle_.empty())
            {
                auto conn = std::move(idle_.front());
                idle_.pop_front();
                if (expired(*conn) || !conn->healthy())
                {
                    --total_;
                    ++stats_.destroyed;
                    ++stats_.recycled;
                    evicted.push_back(std::move(conn));
                }
                else
                {
                    probing.push_back(std::move(conn));
                }
            }
        }
        if (!evicted.empty())
            SMTPXX_DEBUG("POOL", "evicting " + std::to_string(evicted.size()) + " idle connection(s)");
        for (auto& conn : evicted)
            co_await conn->close();

        for (auto& conn : probing)
        {
            if (co_await probe(*conn))
            {
                {
                    std::lock_guard<std::mutex> lock(mutex_);
                    if (!closed_)
                    {
                        idle_.push_back(std::move(conn));
                        waiters_.notify_one();
                        continue;
                    }
                    --total_;
                    ++stats_.destroyed;
                }
                co_await conn->close();
                continue;
            }
            SMTPXX_DEBUG("POOL", "NOOP probe failed, closing connection to " + conn->host());
            {
                std::lock_guard<std::mutex> lock(mutex_);
                --total_;
                ++stats_.destroyed;
            }
            waiters_.notify_one();
            co_await conn->close();
        }

        auto topped = co_await top_up();
        if (!topped)
            SMTPXX_WARN("POOL", "Failed to top up idle connections: " + topped.error().to_string());
    }

    [[nodiscard]] pool_status status() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pool_status out;
        out.total = total_;
        out.idle = idle_.size();
        out.in_use = in_use_;
        out.pending = pending_;
        out.max_size = config_.max_connections;
        return out;
    }

    [[nodiscard]] pool_stats stats() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return stats_;
    }

    [[nodiscard]] bool closed() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    /**
     * Get the pool configuration.
     */
    [[nodiscard]] const pool_config& config() const noexcept { return config_; }

private:
    friend class lease;

    lease make_lease(std::unique_ptr<smtp::transport> conn)
    {
        return lease(weak_from_this(), std::move(conn));
    }

    [[nodiscard]] bool expired(const smtp::transport& conn) const
    {
        const auto now = std::chrono::steady_clock::now();
        if (config_.max_lifetime.count() > 0 && now - conn.created_at() >= config_.max_lifetime)
            return true;
        if (config_.idle_timeout.count() > 0 && now - conn.idle_since() >= config_.idle_timeout)
            return true;
        return false;
    }

    smtpxx::asio::awaitable<bool> probe(smtp::transport& conn)
    {
        auto rep = co_await conn.send_command("NOOP");
        if (!rep || rep->status != 250)
        {
            conn.mark_unhealthy();
            co_return false;
        }
        co_return true;
    }

    /// Creates connections straight into the idle set until min_idle are idle.
    smtpxx::asio::awaitable<result<void>> top_up()
    {
        while (true)
        {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (closed_)
                    co_return fail(errc::pool_closed, "Connection pool is closed.");
                if (idle_.size() >= config_.min_idle || total_ >= config_.max_connections)
                    co_return ok();
                ++total_;
            }

            auto made = co_await factory_();
            std::lock_guard<std::mutex> lock(mutex_);
            if (!made)
            {
                --total_;
                ++stats_.failed;
                co_return fail(std::move(made).error());
            }
            ++stats_.created;
            idle_.push_back(std::move(made).value());
            waiters_.notify_one();
        }
    }

    /// Called by lease::release().
    void give_back(std::unique_ptr<smtp::transport> conn)
    {
        const bool reusable = conn->healthy() && !smtp::is_mid_transaction(conn->state());
        if (reusable)
            conn->mark_idle();
        else
            conn->mark_unhealthy();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            --in_use_;
            if (reusable && !closed_ && !expired(*conn))
            {
                idle_.push_back(std::move(conn));
                waiters_.notify_one();
                return;
            }
            --total_;
            ++stats_.destroyed;
        }
        waiters_.notify_one();
        dispose(std::move(conn));
    }

    /// Destroys a connection that never made it back to the idle set.
    void drop(std::unique_ptr<smtp::transport> conn)
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            --in_use_;
            --total_;
            ++stats_.destroyed;
        }
        waiters_.notify_one();
        dispose(std::move(conn));
    }

    void dispose(std::unique_ptr<smtp::transport> conn)
    {
        SMTPXX_DEBUG("POOL", "connection to " + conn->host() + " destroyed");
        smtpxx::asio::co_spawn(executor_, close_connection(std::move(conn)), smtpxx::asio::detached);
    }

    static smtpxx::asio::awaitable<void> close_connection(std::unique_ptr<smtp::transport> conn)
    {
        co_await conn->close();
    }

    static smtpxx::asio::awaitable<void> maintenance_loop(std::weak_ptr<connection_pool> weak,
        std::shared_ptr<smtpxx::asio::steady_timer> timer, std::chrono::seconds interval)
    {
        while (true)
        {
            timer->expires_after(interval);
            smtpxx::asio::error_code ec;
            co_await timer->async_wait(smtpxx::asio::redirect_error(smtpxx::asio::use_awaitable, ec));
            if (ec)
                co_return;

            auto self = weak.lock();
            if (!self || self->closed())
                co_return;
            co_await self->run_maintenance();
        }
    }

    smtpxx::asio::any_io_executor executor_;
    pool_config config_;
    factory_type factory_;
    detail::wait_queue waiters_;
    std::shared_ptr<smtpxx::asio::steady_timer> maintenance_timer_;

    mutable std::mutex mutex_;
    std::deque<std::unique_ptr<smtp::transport>> idle_;
    std::size_t total_{0};
    std::size_t in_use_{0};
    std::size_t pending_{0};
    bool closed_{false};
    pool_stats stats_;
};


inline void lease::release()
{
    if (!conn_)
        return;
    if (auto pool = pool_.lock())
        pool->give_back(std::move(conn_));
    conn_.reset();
    pool_.reset();
}


/**
 * Create a shared pool; the maintenance task starts when enabled.
 */
inline std::shared_ptr<connection_pool> make_pool(smtpxx::asio::any_io_executor executor, pool_config config,
    connection_pool::factory_type factory)
{
    auto pool = std::make_shared<connection_pool>(std::move(executor), std::move(config), std::move(factory));
    pool->start_maintenance();
    return pool;
}

} // namespace smtpxx::pool
