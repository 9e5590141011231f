/*

test_orchestrator.cpp
---------------------

Copyright (C) 2025, Sylvain Guinebert.

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#define BOOST_TEST_MODULE orchestrator_test

#include <boost/test/unit_test.hpp>

#include <chrono>
#include <memory>
#include <utility>
#include <vector>

#include <smtpxx/metrics.hpp>
#include <smtpxx/resilience/orchestrator.hpp>

using namespace smtpxx;
using resilience::circuit_state;
using resilience::orchestrator;
using resilience::resilience_config;

namespace
{

template<class F>
auto run(F&& f)
{
    asio::io_context ctx;
    auto fut = asio::co_spawn(ctx, std::forward<F>(f), asio::use_future);
    ctx.run();
    return fut.get();
}

resilience_config quick_config()
{
    resilience_config cfg;
    cfg.retry.max_attempts = 3;
    cfg.retry.initial_delay = std::chrono::milliseconds{1};
    cfg.retry.max_delay = std::chrono::milliseconds{5};
    cfg.retry.jitter = false;
    cfg.circuit.failure_threshold = 5;
    return cfg;
}

/// Operation that fails with the given errors in turn, then succeeds with 42.
struct scripted_op
{
    std::vector<error_info> failures;
    std::vector<std::size_t>* attempts;

    asio::awaitable<result<int>> operator()(std::size_t attempt)
    {
        attempts->push_back(attempt);
        if (attempt <= failures.size())
            co_return fail<int>(failures[attempt - 1]);
        co_return 42;
    }
};

error_info transient()
{
    return make_error(errc::net_connection_reset, "Connection reset.");
}

} // namespace


BOOST_AUTO_TEST_CASE(success_on_first_attempt)
{
    std::vector<std::size_t> attempts;
    run([&attempts]() -> asio::awaitable<void>
    {
        orchestrator orch(co_await asio::this_coro::executor, quick_config());
        auto res = co_await orch.execute(scripted_op{{}, &attempts});
        BOOST_REQUIRE(res.has_value());
        BOOST_TEST(res.value() == 42);
    });
    BOOST_TEST(attempts.size() == 1u);
}

BOOST_AUTO_TEST_CASE(retryable_errors_are_retried)
{
    std::vector<std::size_t> attempts;
    auto metrics = std::make_shared<counting_metrics>();
    run([&attempts, metrics]() -> asio::awaitable<void>
    {
        orchestrator orch(co_await asio::this_coro::executor, quick_config(), metrics);
        scripted_op res_op{{transient(), transient()}, &attempts};
        auto res = co_await orch.execute(std::move(res_op));
        BOOST_REQUIRE(res.has_value());
        BOOST_TEST(orch.breaker().stats().failure_count == 0u);
    });
    const std::vector<std::size_t> expected{1, 2, 3};
    BOOST_TEST(attempts == expected, boost::test_tools::per_element());
    BOOST_TEST(metrics->get().retries == 2u);
}

BOOST_AUTO_TEST_CASE(attempts_run_out)
{
    std::vector<std::size_t> attempts;
    run([&attempts]() -> asio::awaitable<void>
    {
        orchestrator orch(co_await asio::this_coro::executor, quick_config());
        scripted_op res_op{{transient(), transient(), transient(), transient()}, &attempts};
        auto res = co_await orch.execute(std::move(res_op));
        BOOST_REQUIRE(!res.has_value());
        BOOST_TEST(res.error().code == errc::net_connection_reset);
        BOOST_TEST(orch.breaker().stats().failure_count == 3u);
    });
    BOOST_TEST(attempts.size() == 3u);
}

BOOST_AUTO_TEST_CASE(auth_failure_is_not_retried)
{
    std::vector<std::size_t> attempts;
    run([&attempts]() -> asio::awaitable<void>
    {
        orchestrator orch(co_await asio::this_coro::executor, quick_config());
        scripted_op res_op{{make_error(errc::auth_failed, "Authentication failed.")}, &attempts};
        auto res = co_await orch.execute(std::move(res_op));
        BOOST_REQUIRE(!res.has_value());
        BOOST_TEST(res.error().code == errc::auth_failed);
        // a rejected login says nothing about the server's health
        BOOST_TEST(orch.breaker().stats().failure_count == 0u);
    });
    BOOST_TEST(attempts.size() == 1u);
}

BOOST_AUTO_TEST_CASE(failure_after_payload_started_is_not_retried)
{
    std::vector<std::size_t> attempts;
    run([&attempts]() -> asio::awaitable<void>
    {
        auto err = transient();
        err.payload_started = true;
        orchestrator orch(co_await asio::this_coro::executor, quick_config());
        scripted_op res_op{{err}, &attempts};
        auto res = co_await orch.execute(std::move(res_op));
        BOOST_REQUIRE(!res.has_value());
        BOOST_TEST(res.error().payload_started);
    });
    BOOST_TEST(attempts.size() == 1u);
}

BOOST_AUTO_TEST_CASE(open_circuit_skips_the_operation)
{
    std::vector<std::size_t> attempts;
    auto metrics = std::make_shared<counting_metrics>();
    run([&attempts, metrics]() -> asio::awaitable<void>
    {
        auto cfg = quick_config();
        cfg.retry = resilience::retry_policy::disabled();
        cfg.circuit.failure_threshold = 2;
        cfg.circuit.recovery_timeout = std::chrono::minutes{5};
        orchestrator orch(co_await asio::this_coro::executor, cfg, metrics);

        for (int i = 0; i < 2; ++i)
        {
            std::vector<std::size_t> ignored;
            scripted_op res_op{{transient()}, &ignored};
            auto res = co_await orch.execute(std::move(res_op));
            BOOST_TEST(!res.has_value());
        }
        BOOST_TEST(orch.breaker().state() == circuit_state::open);

        auto res = co_await orch.execute(scripted_op{{}, &attempts});
        BOOST_REQUIRE(!res.has_value());
        BOOST_TEST(res.error().code == errc::circuit_open);

        orch.reset();
        BOOST_TEST(orch.breaker().state() == circuit_state::closed);
    });
    BOOST_TEST(attempts.empty());
    BOOST_TEST(metrics->get().circuit_transitions == 2u);
}

BOOST_AUTO_TEST_CASE(circuit_opening_mid_retry_stops_the_loop)
{
    std::vector<std::size_t> attempts;
    run([&attempts]() -> asio::awaitable<void>
    {
        auto cfg = quick_config();
        cfg.retry.max_attempts = 5;
        cfg.circuit.failure_threshold = 2;
        cfg.circuit.recovery_timeout = std::chrono::minutes{5};
        orchestrator orch(co_await asio::this_coro::executor, cfg);

        scripted_op res_op{{transient(), transient(), transient()}, &attempts};
        auto res = co_await orch.execute(std::move(res_op));
        BOOST_REQUIRE(!res.has_value());
        BOOST_TEST(res.error().code == errc::circuit_open);
    });
    BOOST_TEST(attempts.size() == 2u);
}

BOOST_AUTO_TEST_CASE(rate_limit_rejects_before_any_attempt)
{
    std::vector<std::size_t> attempts;
    run([&attempts]() -> asio::awaitable<void>
    {
        auto cfg = quick_config();
        cfg.rate_limit = resilience::rate_limit_config::per_minute(1);
        orchestrator orch(co_await asio::this_coro::executor, cfg);

        auto first = co_await orch.execute(scripted_op{{}, &attempts});
        BOOST_TEST(first.has_value());

        auto second = co_await orch.execute(scripted_op{{}, &attempts});
        BOOST_REQUIRE(!second.has_value());
        BOOST_TEST(second.error().code == errc::rate_limited);
    });
    BOOST_TEST(attempts.size() == 1u);
}

BOOST_AUTO_TEST_CASE(retries_do_not_consume_rate_tokens)
{
    std::vector<std::size_t> attempts;
    run([&attempts]() -> asio::awaitable<void>
    {
        auto cfg = quick_config();
        cfg.rate_limit = resilience::rate_limit_config::per_minute(1);
        orchestrator orch(co_await asio::this_coro::executor, cfg);

        scripted_op res_op{{transient(), transient()}, &attempts};
        auto res = co_await orch.execute(std::move(res_op));
        BOOST_TEST(res.has_value());
    });
    BOOST_TEST(attempts.size() == 3u);
}
