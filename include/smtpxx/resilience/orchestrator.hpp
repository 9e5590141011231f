/*

orchestrator.hpp
----------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>

#include <smtpxx/detail/asio_decl.hpp>
#include <smtpxx/detail/awaitable_traits.hpp>
#include <smtpxx/detail/log.hpp>
#include <smtpxx/detail/result.hpp>
#include <smtpxx/metrics.hpp>
#include <smtpxx/resilience/circuit_breaker.hpp>
#include <smtpxx/resilience/rate_limiter.hpp>
#include <smtpxx/resilience/retry.hpp>

namespace smtpxx::resilience
{

struct resilience_config
{
    retry_policy retry;
    circuit_breaker_config circuit;
    rate_limit_config rate_limit;
};

/**
 * Wraps one logical operation in the three resilience layers, in this order:
 * rate limiter admission (once), then per attempt the circuit breaker check
 * and the operation itself, with backoff between retryable failures.
 *
 * The breaker and limiter are owned here and shared by every operation that
 * goes through the same orchestrator.
 */
class orchestrator
{
public:
    orchestrator(smtpxx::asio::any_io_executor executor, resilience_config config,
        std::shared_ptr<metrics_sink> metrics = nullptr)
        : executor_(executor),
          retry_(config.retry),
          metrics_(std::move(metrics)),
          limiter_(executor, config.rate_limit),
          breaker_(config.circuit, [this](circuit_state from, circuit_state to)
          {
              on_transition(from, to);
          })
    {
    }

    orchestrator(const orchestrator&) = delete;
    orchestrator& operator=(const orchestrator&) = delete;

    /**
     * Runs `op` until it succeeds, fails terminally or the attempts run out.
     *
     * @param op Callable taking the 1-based attempt number and returning
     *           awaitable<result<T>>. Each call must start from scratch.
     * @return   The last attempt's result, or rate_limited / circuit_open
     *           when the operation was never attempted.
     */
    template<class Op>
    auto execute(Op op) -> smtpxx::asio::awaitable<detail::awaitable_value_t<std::invoke_result_t<Op&, std::size_t>>>
    {
        using result_t = detail::awaitable_value_t<std::invoke_result_t<Op&, std::size_t>>;
        using value_t = typename result_t::value_type;

        auto permit = co_await limiter_.acquire();
        if (!permit)
        {
            SMTPXX_WARN("RATE", permit.error().message);
            co_return fail<value_t>(std::move(permit).error());
        }

        const std::size_t attempts = retry_.attempts();
        for (std::size_t attempt = 1; ; ++attempt)
        {
            if (auto admitted = breaker_.allow(); !admitted)
                co_return fail<value_t>(std::move(admitted).error());

            result_t res = co_await op(attempt);
            if (res)
            {
                breaker_.record_success();
                co_return res;
            }

            if (counts_toward_circuit(res.error()))
                breaker_.record_failure();
            else
                breaker_.record_neutral();

            if (attempt >= attempts || !is_retryable(res.error()))
                co_return res;

            const auto delay = retry_.calculate_delay(attempt);
            SMTPXX_INFO("RETRY", "attempt " + std::to_string(attempt + 1) + " of " + std::to_string(attempts)
                + " in " + std::to_string(delay.count()) + "ms after " + res.error().to_string());
            detail::notify(metrics_.get(), [&](metrics_sink& sink) { sink.on_retry(attempt, delay); });

            smtpxx::asio::steady_timer timer(executor_);
            timer.expires_after(delay);
            smtpxx::asio::error_code ec;
            co_await timer.async_wait(smtpxx::asio::redirect_error(smtpxx::asio::use_awaitable, ec));
            if (ec)
                co_return fail<value_t>(errc::net_cancelled, "Retry backoff cancelled.", {}, ec);
        }
    }

    [[nodiscard]] circuit_breaker& breaker() noexcept { return breaker_; }
    [[nodiscard]] rate_limiter& limiter() noexcept { return limiter_; }
    [[nodiscard]] const retry_policy& retry() const noexcept { return retry_; }

    /// Closes the circuit and refills the bucket.
    void reset()
    {
        breaker_.reset();
        limiter_.reset();
    }

private:
    void on_transition(circuit_state from, circuit_state to)
    {
        SMTPXX_WARN("CIRCUIT", std::string("circuit ") + std::string(to_string(from)) + " -> " + std::string(to_string(to)));
        detail::notify(metrics_.get(), [&](metrics_sink& sink) { sink.on_circuit_state_change(from, to); });
    }

    smtpxx::asio::any_io_executor executor_;
    retry_policy retry_;
    std::shared_ptr<metrics_sink> metrics_;
    rate_limiter limiter_;
    circuit_breaker breaker_;
};

} // namespace smtpxx::resilience
