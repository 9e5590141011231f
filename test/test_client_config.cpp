/*

test_client_config.cpp
----------------------

Copyright (C) 2025, Sylvain Guinebert.

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#define BOOST_TEST_MODULE client_config_test

#include <boost/test/unit_test.hpp>

#include <chrono>

#include <smtpxx/client_config.hpp>

using namespace smtpxx;

namespace
{

client_config valid_config()
{
    client_config cfg;
    cfg.host = "smtp.example.com";
    return cfg;
}

void expect_invalid(const client_config& cfg)
{
    auto res = cfg.validate();
    BOOST_REQUIRE(!res.has_value());
    BOOST_TEST(res.error().code == errc::config_invalid);
    BOOST_TEST(category(res.error().code) == error_category::configuration);
}

} // namespace


BOOST_AUTO_TEST_CASE(defaults_are_valid)
{
    const auto cfg = valid_config();
    BOOST_TEST(cfg.validate().has_value());
    BOOST_TEST(cfg.port == 587);
    BOOST_TEST(cfg.tls_policy == net::tls_policy::opportunistic);
    BOOST_TEST(!cfg.credentials);
}

BOOST_AUTO_TEST_CASE(submission_preset)
{
    const auto cfg = client_config::submission("smtp.example.com", "user", "secret");
    BOOST_TEST(cfg.validate().has_value());
    BOOST_TEST(cfg.port == 587);
    BOOST_TEST(cfg.tls_policy == net::tls_policy::required);
    BOOST_REQUIRE(cfg.credentials);
}

BOOST_AUTO_TEST_CASE(host_is_required)
{
    client_config cfg;
    expect_invalid(cfg);

    cfg.host = "smtp.example.com\r\nRCPT TO:<x@example.com>";
    expect_invalid(cfg);
}

BOOST_AUTO_TEST_CASE(port_and_timeouts)
{
    auto cfg = valid_config();
    cfg.port = 0;
    expect_invalid(cfg);

    cfg = valid_config();
    cfg.connect_timeout = std::chrono::seconds{0};
    expect_invalid(cfg);

    cfg = valid_config();
    cfg.command_timeout = -std::chrono::seconds{1};
    expect_invalid(cfg);
}

BOOST_AUTO_TEST_CASE(client_id_must_be_one_token)
{
    auto cfg = valid_config();
    cfg.client_id = "my host";
    expect_invalid(cfg);

    cfg.client_id = "host\r\nQUIT";
    expect_invalid(cfg);
}

BOOST_AUTO_TEST_CASE(pool_limits)
{
    auto cfg = valid_config();
    cfg.pool.max_connections = 0;
    expect_invalid(cfg);

    cfg = valid_config();
    cfg.pool.max_connections = 2;
    cfg.pool.min_idle = 3;
    expect_invalid(cfg);
}

BOOST_AUTO_TEST_CASE(retry_limits)
{
    auto cfg = valid_config();
    cfg.retry.max_attempts = 0;
    expect_invalid(cfg);

    cfg = valid_config();
    cfg.retry.multiplier = 0.5;
    expect_invalid(cfg);

    cfg = valid_config();
    cfg.retry.initial_delay = std::chrono::minutes{2};
    expect_invalid(cfg);

    // a disabled policy is not checked
    cfg.retry.enabled = false;
    BOOST_TEST(cfg.validate().has_value());
}

BOOST_AUTO_TEST_CASE(circuit_and_rate_limits)
{
    auto cfg = valid_config();
    cfg.circuit_breaker.failure_threshold = 0;
    expect_invalid(cfg);

    cfg = valid_config();
    cfg.rate_limit.enabled = true;
    expect_invalid(cfg);

    cfg.rate_limit.max_operations = 0;
    expect_invalid(cfg);

    cfg.rate_limit = resilience::rate_limit_config::per_minute(30);
    BOOST_TEST(cfg.validate().has_value());

    cfg.rate_limit.max_concurrent = 0;
    expect_invalid(cfg);
}

BOOST_AUTO_TEST_CASE(effective_client_id)
{
    auto cfg = valid_config();
    BOOST_TEST(cfg.effective_client_id() == "localhost");

    cfg.client_id = "relay.example.org";
    BOOST_TEST(cfg.effective_client_id() == "relay.example.org");

    cfg.client_id.clear();
    BOOST_TEST(!cfg.effective_client_id().empty());
}
