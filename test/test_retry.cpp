/*

test_retry.cpp
--------------

Copyright (C) 2025, Sylvain Guinebert.

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#define BOOST_TEST_MODULE retry_test

#include <boost/test/unit_test.hpp>

#include <chrono>
#include <random>

#include <smtpxx/resilience/retry.hpp>

using smtpxx::resilience::retry_policy;
using std::chrono::milliseconds;


BOOST_AUTO_TEST_CASE(exponential_backoff_without_jitter)
{
    retry_policy policy;
    policy.jitter = false;
    BOOST_TEST(policy.calculate_delay(1).count() == 500);
    BOOST_TEST(policy.calculate_delay(2).count() == 1000);
    BOOST_TEST(policy.calculate_delay(3).count() == 2000);
    BOOST_TEST(policy.calculate_delay(4).count() == 4000);
}

BOOST_AUTO_TEST_CASE(backoff_is_capped)
{
    retry_policy policy;
    policy.jitter = false;
    BOOST_TEST(policy.calculate_delay(7).count() == 30000);
    BOOST_TEST(policy.calculate_delay(60).count() == 30000);

    policy.max_delay = milliseconds{1500};
    BOOST_TEST(policy.calculate_delay(3).count() == 1500);
}

BOOST_AUTO_TEST_CASE(jitter_stays_within_a_quarter)
{
    retry_policy policy;
    std::mt19937 rng(42);
    for (int i = 0; i < 500; ++i)
    {
        const auto delay = policy.calculate_delay(2, rng).count();
        BOOST_TEST(delay >= 750);
        BOOST_TEST(delay <= 1250);
    }
}

BOOST_AUTO_TEST_CASE(jitter_never_exceeds_max_delay)
{
    retry_policy policy;
    std::mt19937 rng(7);
    for (int i = 0; i < 200; ++i)
        BOOST_TEST(policy.calculate_delay(10, rng).count() <= 30000);
}

BOOST_AUTO_TEST_CASE(attempt_count)
{
    retry_policy policy;
    BOOST_TEST(policy.attempts() == 3u);

    policy.max_attempts = 0;
    BOOST_TEST(policy.attempts() == 1u);

    BOOST_TEST(retry_policy::disabled().attempts() == 1u);
}

BOOST_AUTO_TEST_CASE(custom_multiplier)
{
    retry_policy policy;
    policy.jitter = false;
    policy.initial_delay = milliseconds{100};
    policy.multiplier = 3.0;
    BOOST_TEST(policy.calculate_delay(3).count() == 900);
}
