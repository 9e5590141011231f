/*

circuit_breaker.hpp
-------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <chrono>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <ostream>
#include <string_view>
#include <utility>

#include <smtpxx/detail/error_detail.hpp>
#include <smtpxx/detail/result.hpp>

namespace smtpxx::resilience
{

enum class circuit_state
{
    closed,
    open,
    half_open
};

[[nodiscard]] constexpr std::string_view to_string(circuit_state state) noexcept
{
    switch (state)
    {
        case circuit_state::closed: return "closed";
        case circuit_state::open: return "open";
        case circuit_state::half_open: return "half_open";
    }
    return "unknown";
}

inline std::ostream& operator<<(std::ostream& os, circuit_state state)
{
    return os << to_string(state);
}

struct circuit_breaker_config
{
    bool enabled = true;
    /// Failures inside failure_window that open the circuit.
    std::size_t failure_threshold = 5;
    std::chrono::steady_clock::duration failure_window = std::chrono::seconds{60};
    /// Time spent open before trial calls are let through.
    std::chrono::steady_clock::duration recovery_timeout = std::chrono::seconds{30};
    /// Consecutive half-open successes that close the circuit.
    std::size_t success_threshold = 3;
    /// Concurrent trial calls while half-open.
    std::size_t half_open_max_calls = 1;
};

struct circuit_stats
{
    circuit_state state = circuit_state::closed;
    std::size_t failure_count = 0;
    std::size_t success_count = 0;
    std::size_t trial_calls_in_flight = 0;
    std::size_t rejected_calls = 0;
    std::chrono::steady_clock::time_point last_transition{};
};

/**
 * Fail-fast guard shared by every caller targeting one destination.
 *
 * Callers ask allow() before each attempt and report the outcome with
 * record_success(), record_failure() or record_neutral(). Open circuits turn
 * half-open lazily, on the next allow() or state() after recovery_timeout.
 * All state sits behind a std::mutex; no lock is held across a suspension.
 */
class circuit_breaker
{
public:
    using clock = std::chrono::steady_clock;
    using transition_fn = std::function<void(circuit_state from, circuit_state to)>;

    explicit circuit_breaker(circuit_breaker_config config = {}, transition_fn on_transition = {})
        : config_(std::move(config)),
          on_transition_(std::move(on_transition)),
          last_transition_(clock::now())
    {
    }

    circuit_breaker(const circuit_breaker&) = delete;
    circuit_breaker& operator=(const circuit_breaker&) = delete;

    /// Admits one attempt, or fails with circuit_open without any I/O.
    [[nodiscard]] result<void> allow()
    {
        if (!config_.enabled)
            return ok();

        std::optional<std::pair<circuit_state, circuit_state>> transition;
        result<void> verdict = ok();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            const auto now = clock::now();
            transition = refresh_locked(now);
            switch (state_)
            {
                case circuit_state::closed:
                    break;
                case circuit_state::open:
                    ++rejected_;
                    verdict = fail(errc::circuit_open, "Circuit breaker is open.",
                        detail::error_detail().add_ms("retry_after",
                            std::chrono::duration_cast<std::chrono::milliseconds>(
                                last_transition_ + config_.recovery_timeout - now)).str());
                    break;
                case circuit_state::half_open:
                    if (trials_in_flight_ >= config_.half_open_max_calls)
                    {
                        ++rejected_;
                        verdict = fail(errc::circuit_open, "Circuit breaker is half-open; trial call in progress.");
                    }
                    else
                    {
                        ++trials_in_flight_;
                    }
                    break;
            }
        }
        notify(transition);
        return verdict;
    }

    void record_success()
    {
        if (!config_.enabled)
            return;

        std::optional<std::pair<circuit_state, circuit_state>> transition;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            switch (state_)
            {
                case circuit_state::closed:
                    failures_.clear();
                    break;
                case circuit_state::half_open:
                    release_trial_locked();
                    if (++successes_ >= config_.success_threshold)
                        transition = transition_locked(circuit_state::closed, clock::now());
                    break;
                case circuit_state::open:
                    break;
            }
        }
        notify(transition);
    }

    void record_failure()
    {
        if (!config_.enabled)
            return;

        std::optional<std::pair<circuit_state, circuit_state>> transition;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            const auto now = clock::now();
            switch (state_)
            {
                case circuit_state::closed:
                    failures_.push_back(now);
                    prune_locked(now);
                    if (failures_.size() >= config_.failure_threshold)
                        transition = transition_locked(circuit_state::open, now);
                    break;
                case circuit_state::half_open:
                    release_trial_locked();
                    transition = transition_locked(circuit_state::open, now);
                    break;
                case circuit_state::open:
                    break;
            }
        }
        notify(transition);
    }

    /// Outcome that says nothing about the destination's health (e.g. a rejected login).
    void record_neutral()
    {
        if (!config_.enabled)
            return;
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == circuit_state::half_open)
            release_trial_locked();
    }

    [[nodiscard]] circuit_state state()
    {
        std::optional<std::pair<circuit_state, circuit_state>> transition;
        circuit_state current;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            transition = refresh_locked(clock::now());
            current = state_;
        }
        notify(transition);
        return current;
    }

    [[nodiscard]] circuit_stats stats()
    {
        std::optional<std::pair<circuit_state, circuit_state>> transition;
        circuit_stats out;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            const auto now = clock::now();
            transition = refresh_locked(now);
            prune_locked(now);
            out.state = state_;
            out.failure_count = failures_.size();
            out.success_count = successes_;
            out.trial_calls_in_flight = trials_in_flight_;
            out.rejected_calls = rejected_;
            out.last_transition = last_transition_;
        }
        notify(transition);
        return out;
    }

    /// Forces the circuit closed and forgets every counter.
    void reset()
    {
        std::optional<std::pair<circuit_state, circuit_state>> transition;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (state_ != circuit_state::closed)
                transition = transition_locked(circuit_state::closed, clock::now());
            failures_.clear();
            rejected_ = 0;
        }
        notify(transition);
    }

    [[nodiscard]] const circuit_breaker_config& config() const noexcept { return config_; }

private:
    using transition_t = std::optional<std::pair<circuit_state, circuit_state>>;

    transition_t refresh_locked(clock::time_point now)
    {
        if (state_ == circuit_state::open && now - last_transition_ >= config_.recovery_timeout)
            return transition_locked(circuit_state::half_open, now);
        return std::nullopt;
    }

    transition_t transition_locked(circuit_state to, clock::time_point now)
    {
        const circuit_state from = state_;
        state_ = to;
        last_transition_ = now;
        failures_.clear();
        successes_ = 0;
        trials_in_flight_ = 0;
        return std::make_pair(from, to);
    }

    void prune_locked(clock::time_point now)
    {
        while (!failures_.empty() && now - failures_.front() > config_.failure_window)
            failures_.pop_front();
    }

    void release_trial_locked() noexcept
    {
        if (trials_in_flight_ > 0)
            --trials_in_flight_;
    }

    void notify(const transition_t& transition) const
    {
        if (transition && on_transition_)
            on_transition_(transition->first, transition->second);
    }

    circuit_breaker_config config_;
    transition_fn on_transition_;
    std::mutex mutex_;
    circuit_state state_{circuit_state::closed};
    std::deque<clock::time_point> failures_;
    std::size_t successes_{0};
    std::size_t trials_in_flight_{0};
    std::size_t rejected_{0};
    clock::time_point last_transition_;
};

} // namespace smtpxx::resilience
