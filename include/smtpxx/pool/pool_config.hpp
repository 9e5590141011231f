/*

pool/pool_config.hpp
--------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <chrono>
#include <cstddef>

#include <smtpxx/detail/error_detail.hpp>
#include <smtpxx/detail/result.hpp>

namespace smtpxx::pool
{

/**
 * Configuration for connection pools.
 */
struct pool_config
{
    /// Maximum concurrent connections
    std::size_t max_connections = 5;

    /// Idle connections kept warm by warmup() and the maintenance task
    std::size_t min_idle = 1;

    /// Timeout when waiting to acquire a connection
    std::chrono::milliseconds acquire_timeout{30000};

    /// Close idle connections after this duration (0 = never)
    std::chrono::seconds idle_timeout{300};

    /// Recycle connections after this duration (0 = never)
    std::chrono::seconds max_lifetime{3600};

    /// Run the background eviction / NOOP probe / top-up task
    bool health_check_enabled = true;
    std::chrono::seconds health_check_interval{60};

    /// Probe an idle connection with NOOP before handing it out
    bool validate_on_acquire = false;

    [[nodiscard]] result<void> validate() const
    {
        if (max_connections == 0)
            return fail(errc::config_invalid, "Pool max_connections must be at least 1.");
        if (min_idle > max_connections)
            return fail(errc::config_invalid, "Pool min_idle exceeds max_connections.",
                detail::error_detail().add_int("min_idle", min_idle).add_int("max_connections", max_connections).str());
        if (acquire_timeout.count() <= 0)
            return fail(errc::config_invalid, "Pool acquire_timeout must be positive.");
        if (health_check_enabled && health_check_interval.count() <= 0)
            return fail(errc::config_invalid, "Pool health_check_interval must be positive.");
        return ok();
    }

    // ==================== Factory Methods ====================

    /// Configuration for bulk operations (newsletters, etc.)
    static pool_config bulk_sending()
    {
        pool_config cfg;
        cfg.min_idle = 2;
        cfg.max_connections = 20;
        cfg.idle_timeout = std::chrono::seconds{60};
        cfg.max_lifetime = std::chrono::seconds{1800};
        return cfg;
    }
};


/**
 * Point-in-time view of the pool.
 */
struct pool_status
{
    std::size_t total = 0;     ///< All connections (idle + in_use + being created or probed)
    std::size_t idle = 0;      ///< Available in pool
    std::size_t in_use = 0;    ///< Currently leased
    std::size_t pending = 0;   ///< Callers waiting for a connection
    std::size_t max_size = 0;

    /// Pool utilization (in_use / max)
    [[nodiscard]] double utilization() const noexcept
    {
        return max_size > 0 ? static_cast<double>(in_use) / static_cast<double>(max_size) : 0.0;
    }
};


/**
 * Cumulative pool counters for monitoring.
 */
struct pool_stats
{
    std::size_t created = 0;    ///< Connections opened since start
    std::size_t destroyed = 0;  ///< Connections closed since start
    std::size_t failed = 0;     ///< Connection attempts that failed
    std::size_t recycled = 0;   ///< Closed because of idle_timeout or max_lifetime
    std::size_t acquires = 0;   ///< Total acquire() calls
    std::size_t hits = 0;       ///< Served from the idle set
    std::size_t waits = 0;      ///< Had to wait for a connection
    std::size_t timeouts = 0;   ///< Timed out waiting

    /// Hit rate (hits / acquires)
    [[nodiscard]] double hit_rate() const noexcept
    {
        return acquires > 0 ? static_cast<double>(hits) / static_cast<double>(acquires) : 0.0;
    }
};

} // namespace smtpxx::pool
