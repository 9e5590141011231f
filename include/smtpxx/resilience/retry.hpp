/*

retry.hpp
---------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <random>

namespace smtpxx::resilience
{

/**
 * Retry policy configuration.
 * Controls how many attempts one logical send gets and how long to back off in between.
 */
struct retry_policy
{
    /// Disabled means exactly one attempt.
    bool enabled = true;

    /// Total attempts including the first one.
    std::size_t max_attempts = 3;

    /// Delay before the first retry.
    std::chrono::milliseconds initial_delay{500};

    /// Upper bound of any delay, applied before and after jitter.
    std::chrono::milliseconds max_delay{30000};

    /// Multiplier for exponential backoff (2.0 doubles the delay each retry).
    double multiplier = 2.0;

    /// Spread each delay uniformly over [1 - JITTER_FACTOR, 1 + JITTER_FACTOR].
    bool jitter = true;

    static constexpr double JITTER_FACTOR = 0.25;

    /// Create a policy that never retries.
    static retry_policy disabled()
    {
        retry_policy policy;
        policy.enabled = false;
        return policy;
    }

    [[nodiscard]] std::size_t attempts() const noexcept
    {
        return enabled ? std::max<std::size_t>(max_attempts, 1) : 1;
    }

    /// Delay before retry `retry` (1-based): initial * multiplier^(retry-1), capped.
    [[nodiscard]] std::chrono::milliseconds base_delay(std::size_t retry) const
    {
        const double cap = static_cast<double>(max_delay.count());
        double delay_ms = static_cast<double>(initial_delay.count());
        for (std::size_t i = 1; i < retry; ++i)
        {
            delay_ms *= multiplier;
            if (delay_ms >= cap)
                break;
        }
        delay_ms = std::min(delay_ms, cap);
        return std::chrono::milliseconds(static_cast<long long>(delay_ms));
    }

    template<class Rng>
    [[nodiscard]] std::chrono::milliseconds calculate_delay(std::size_t retry, Rng& rng) const
    {
        auto delay = base_delay(retry);
        if (!jitter)
            return delay;

        std::uniform_real_distribution<double> dist(1.0 - JITTER_FACTOR, 1.0 + JITTER_FACTOR);
        const double jittered = static_cast<double>(delay.count()) * dist(rng);
        delay = std::chrono::milliseconds(static_cast<long long>(jittered));
        return std::min(delay, max_delay);
    }

    [[nodiscard]] std::chrono::milliseconds calculate_delay(std::size_t retry) const
    {
        thread_local std::mt19937 rng(std::random_device{}());
        return calculate_delay(retry, rng);
    }
};

} // namespace smtpxx::resilience
