/*

test_rate_limiter.cpp
---------------------

Copyright (C) 2025, Sylvain Guinebert.

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#define BOOST_TEST_MODULE rate_limiter_test

#include <boost/test/unit_test.hpp>

#include <chrono>
#include <thread>
#include <vector>

#include <smtpxx/resilience/rate_limiter.hpp>

using namespace smtpxx;
using resilience::limit_action;
using resilience::rate_limit_config;
using resilience::rate_limiter;

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

rate_limit_config tokens(std::size_t n, std::chrono::milliseconds window, limit_action action)
{
    rate_limit_config cfg;
    cfg.enabled = true;
    cfg.max_operations = n;
    cfg.window = window;
    cfg.on_limit = action;
    return cfg;
}

} // namespace


BOOST_AUTO_TEST_CASE(disabled_limiter_admits_everything)
{
    run([]() -> asio::awaitable<void>
    {
        rate_limiter limiter(co_await asio::this_coro::executor);
        for (int i = 0; i < 100; ++i)
        {
            auto permit = co_await limiter.acquire();
            BOOST_REQUIRE(permit.has_value());
            BOOST_TEST(!permit->holds_slot());
        }
        BOOST_TEST(limiter.try_acquire());
    });
}

BOOST_AUTO_TEST_CASE(reject_when_bucket_empty)
{
    run([]() -> asio::awaitable<void>
    {
        rate_limiter limiter(co_await asio::this_coro::executor, tokens(2, std::chrono::minutes{1}, limit_action::reject));
        auto first = co_await limiter.acquire();
        auto second = co_await limiter.acquire();
        BOOST_TEST(first.has_value());
        BOOST_TEST(second.has_value());

        auto third = co_await limiter.acquire();
        BOOST_REQUIRE(!third.has_value());
        BOOST_TEST(third.error().code == errc::rate_limited);
        BOOST_TEST(third.error().detail.find("retry_after=") != std::string::npos);
        BOOST_TEST(is_retryable(third.error()));
        BOOST_TEST(limiter.time_until_available().count() > 0);
    });
}

BOOST_AUTO_TEST_CASE(try_acquire_takes_tokens)
{
    asio::io_context ctx;
    rate_limiter limiter(ctx.get_executor(), tokens(3, std::chrono::minutes{1}, limit_action::reject));
    BOOST_TEST(limiter.try_acquire());
    BOOST_TEST(limiter.try_acquire());
    BOOST_TEST(limiter.try_acquire());
    BOOST_TEST(!limiter.try_acquire());
    BOOST_TEST(limiter.available_tokens() < 1.0);

    limiter.reset();
    BOOST_TEST(limiter.available_tokens() == 3.0);
}

BOOST_AUTO_TEST_CASE(bucket_refills_over_time)
{
    asio::io_context ctx;
    rate_limiter limiter(ctx.get_executor(), tokens(1, std::chrono::milliseconds{40}, limit_action::reject));
    BOOST_TEST(limiter.try_acquire());
    BOOST_TEST(!limiter.try_acquire());
    std::this_thread::sleep_for(std::chrono::milliseconds{60});
    BOOST_TEST(limiter.try_acquire());
}

BOOST_AUTO_TEST_CASE(wait_mode_suspends_until_refill)
{
    run([]() -> asio::awaitable<void>
    {
        rate_limiter limiter(co_await asio::this_coro::executor, tokens(1, std::chrono::milliseconds{50}, limit_action::wait));
        auto first = co_await limiter.acquire();
        BOOST_TEST(first.has_value());

        const auto start = std::chrono::steady_clock::now();
        auto second = co_await limiter.acquire();
        BOOST_TEST(second.has_value());
        const bool waited = std::chrono::steady_clock::now() - start >= std::chrono::milliseconds{30};
        BOOST_TEST(waited);
    });
}

BOOST_AUTO_TEST_CASE(wait_with_timeout_gives_up)
{
    run([]() -> asio::awaitable<void>
    {
        auto cfg = tokens(1, std::chrono::seconds{10}, limit_action::wait_with_timeout);
        cfg.wait_timeout = std::chrono::milliseconds{20};
        rate_limiter limiter(co_await asio::this_coro::executor, cfg);
        auto first = co_await limiter.acquire();
        BOOST_TEST(first.has_value());

        auto second = co_await limiter.acquire();
        BOOST_REQUIRE(!second.has_value());
        BOOST_TEST(second.error().code == errc::rate_limited);
    });
}

BOOST_AUTO_TEST_CASE(concurrency_cap_rejects)
{
    run([]() -> asio::awaitable<void>
    {
        rate_limit_config cfg;
        cfg.enabled = true;
        cfg.max_concurrent = 1;
        rate_limiter limiter(co_await asio::this_coro::executor, cfg);

        auto first = co_await limiter.acquire();
        BOOST_REQUIRE(first.has_value());
        BOOST_TEST(first->holds_slot());
        BOOST_TEST(limiter.in_flight() == 1u);

        auto second = co_await limiter.acquire();
        BOOST_REQUIRE(!second.has_value());
        BOOST_TEST(second.error().code == errc::rate_limited);

        first->release();
        BOOST_TEST(limiter.in_flight() == 0u);
        auto third = co_await limiter.acquire();
        BOOST_TEST(third.has_value());
    });
}

BOOST_AUTO_TEST_CASE(concurrency_slot_handed_to_waiter)
{
    asio::io_context ctx;
    rate_limit_config cfg;
    cfg.enabled = true;
    cfg.max_concurrent = 1;
    cfg.on_limit = limit_action::wait;
    rate_limiter limiter(ctx.get_executor(), cfg);

    std::vector<int> order;
    auto worker = [&limiter, &order](int id) -> asio::awaitable<void>
    {
        auto permit = co_await limiter.acquire();
        BOOST_REQUIRE(permit.has_value());
        order.push_back(id);
        asio::steady_timer timer(co_await asio::this_coro::executor);
        timer.expires_after(std::chrono::milliseconds{10});
        co_await timer.async_wait(asio::use_awaitable);
        order.push_back(-id);
    };
    asio::co_spawn(ctx, worker(1), asio::detached);
    asio::co_spawn(ctx, worker(2), asio::detached);
    ctx.run();

    const std::vector<int> expected{1, -1, 2, -2};
    BOOST_TEST(order == expected, boost::test_tools::per_element());
    BOOST_TEST(limiter.in_flight() == 0u);
}
