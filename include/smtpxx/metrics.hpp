/*

metrics.hpp
-----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <map>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>

#include <smtpxx/config.hpp>
#include <smtpxx/detail/log.hpp>
#include <smtpxx/detail/result.hpp>
#include <smtpxx/resilience/circuit_breaker.hpp>

namespace smtpxx
{

/**
 * Receiver of client events. Every hook defaults to a no-op; calls are made
 * inline on the sending coroutine, so implementations should be quick.
 */
class metrics_sink
{
public:
    virtual ~metrics_sink() = default;

    virtual void on_send_success(std::chrono::milliseconds /*duration*/, std::size_t /*accepted_recipients*/) {}
    virtual void on_send_failure(errc /*code*/, std::chrono::milliseconds /*duration*/) {}
    virtual void on_auth_attempt(std::string_view /*mechanism*/, bool /*success*/) {}
    virtual void on_tls_upgrade() {}
    virtual void on_retry(std::size_t /*attempt*/, std::chrono::milliseconds /*delay*/) {}
    virtual void on_circuit_state_change(resilience::circuit_state /*from*/, resilience::circuit_state /*to*/) {}
};

namespace detail
{

/// Calls a sink hook; a throwing sink is logged and never disturbs the send.
template<class Fn>
void notify(metrics_sink* sink, Fn&& fn) noexcept
{
    if (sink == nullptr)
        return;
#if SMTPXX_THROWING_ENABLED
    try
    {
        fn(*sink);
    }
    catch (const std::exception& exc)
    {
        SMTPXX_WARN("METRICS", std::string("metrics sink threw: ") + exc.what());
    }
    catch (...)
    {
        SMTPXX_WARN("METRICS", "metrics sink threw a non-standard exception");
    }
#else
    fn(*sink);
#endif
}

} // namespace detail

/**
 * Lock-free counters for the common events plus per-mechanism auth outcomes.
 */
class counting_metrics : public metrics_sink
{
public:
    struct snapshot
    {
        std::uint64_t sends_succeeded = 0;
        std::uint64_t sends_failed = 0;
        std::uint64_t recipients_accepted = 0;
        std::uint64_t auth_succeeded = 0;
        std::uint64_t auth_failed = 0;
        std::uint64_t tls_upgrades = 0;
        std::uint64_t retries = 0;
        std::uint64_t circuit_transitions = 0;
        std::chrono::milliseconds total_send_time{0};
        std::map<std::string, std::uint64_t> auth_by_mechanism;
        std::map<errc, std::uint64_t> failures_by_code;
    };

    void on_send_success(std::chrono::milliseconds duration, std::size_t accepted_recipients) override
    {
        sends_succeeded_.fetch_add(1, std::memory_order_relaxed);
        recipients_accepted_.fetch_add(accepted_recipients, std::memory_order_relaxed);
        send_time_ms_.fetch_add(static_cast<std::uint64_t>(duration.count()), std::memory_order_relaxed);
    }

    void on_send_failure(errc code, std::chrono::milliseconds duration) override
    {
        sends_failed_.fetch_add(1, std::memory_order_relaxed);
        send_time_ms_.fetch_add(static_cast<std::uint64_t>(duration.count()), std::memory_order_relaxed);
        std::lock_guard<std::mutex> lock(mutex_);
        ++failures_by_code_[code];
    }

    void on_auth_attempt(std::string_view mechanism, bool success) override
    {
        (success ? auth_succeeded_ : auth_failed_).fetch_add(1, std::memory_order_relaxed);
        std::lock_guard<std::mutex> lock(mutex_);
        ++auth_by_mechanism_[std::string(mechanism)];
    }

    void on_tls_upgrade() override
    {
        tls_upgrades_.fetch_add(1, std::memory_order_relaxed);
    }

    void on_retry(std::size_t, std::chrono::milliseconds) override
    {
        retries_.fetch_add(1, std::memory_order_relaxed);
    }

    void on_circuit_state_change(resilience::circuit_state, resilience::circuit_state) override
    {
        circuit_transitions_.fetch_add(1, std::memory_order_relaxed);
    }

    [[nodiscard]] snapshot get() const
    {
        snapshot out;
        out.sends_succeeded = sends_succeeded_.load(std::memory_order_relaxed);
        out.sends_failed = sends_failed_.load(std::memory_order_relaxed);
        out.recipients_accepted = recipients_accepted_.load(std::memory_order_relaxed);
        out.auth_succeeded = auth_succeeded_.load(std::memory_order_relaxed);
        out.auth_failed = auth_failed_.load(std::memory_order_relaxed);
        out.tls_upgrades = tls_upgrades_.load(std::memory_order_relaxed);
        out.retries = retries_.load(std::memory_order_relaxed);
        out.circuit_transitions = circuit_transitions_.load(std::memory_order_relaxed);
        out.total_send_time = std::chrono::milliseconds(
            static_cast<std::chrono::milliseconds::rep>(send_time_ms_.load(std::memory_order_relaxed)));
        std::lock_guard<std::mutex> lock(mutex_);
        out.auth_by_mechanism = auth_by_mechanism_;
        out.failures_by_code = failures_by_code_;
        return out;
    }

private:
    std::atomic<std::uint64_t> sends_succeeded_{0};
    std::atomic<std::uint64_t> sends_failed_{0};
    std::atomic<std::uint64_t> recipients_accepted_{0};
    std::atomic<std::uint64_t> auth_succeeded_{0};
    std::atomic<std::uint64_t> auth_failed_{0};
    std::atomic<std::uint64_t> tls_upgrades_{0};
    std::atomic<std::uint64_t> retries_{0};
    std::atomic<std::uint64_t> circuit_transitions_{0};
    std::atomic<std::uint64_t> send_time_ms_{0};
    mutable std::mutex mutex_;
    std::map<std::string, std::uint64_t> auth_by_mechanism_;
    std::map<errc, std::uint64_t> failures_by_code_;
};

} // namespace smtpxx
