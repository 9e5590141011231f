/*

test_oauth2_token_source.cpp
----------------------------

Copyright (C) 2025, Sylvain Guinebert.

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#define BOOST_TEST_MODULE oauth2_token_source_test

#include <boost/test/unit_test.hpp>

#include <chrono>

#include <smtpxx/oauth2/token_source.hpp>

using namespace smtpxx;


BOOST_AUTO_TEST_CASE(refresh_called_when_expired)
{
    int calls = 0;
    const auto now = std::chrono::system_clock::now();
    oauth2::token initial{"old_access", "refresh", now - std::chrono::minutes{5}};

    oauth2::token_source source(initial,
        [&](const oauth2::token& current) -> result<oauth2::token> {
            ++calls;
            BOOST_TEST(current.access_token == "old_access");
            return oauth2::token{"new_access", current.refresh_token,
                std::chrono::system_clock::now() + std::chrono::hours{1}};
        });

    auto res = source.get_access_token();
    BOOST_TEST(calls == 1);
    BOOST_REQUIRE(res.has_value());
    BOOST_TEST(res.value() == "new_access");
    BOOST_TEST(source.refresh_count() == 1u);

    // cached afterwards
    BOOST_TEST(source.get_access_token().value() == "new_access");
    BOOST_TEST(calls == 1);
}

BOOST_AUTO_TEST_CASE(refresh_not_called_when_valid)
{
    int calls = 0;
    const auto now = std::chrono::system_clock::now();
    oauth2::token initial{"access", "refresh", now + std::chrono::minutes{10}};

    oauth2::token_source source(initial,
        [&](const oauth2::token&) -> result<oauth2::token> {
            ++calls;
            return fail<oauth2::token>(errc::net_io_failed, "refresh should not be called");
        });

    auto res = source.get_access_token();
    BOOST_TEST(calls == 0);
    BOOST_REQUIRE(res.has_value());
    BOOST_TEST(res.value() == "access");
    BOOST_TEST(source.can_refresh());
}

BOOST_AUTO_TEST_CASE(token_inside_skew_is_refreshed)
{
    int calls = 0;
    const auto now = std::chrono::system_clock::now();
    oauth2::token initial{"access", "refresh", now + std::chrono::seconds{10}};

    oauth2::token_source source(initial,
        [&](const oauth2::token& current) -> result<oauth2::token> {
            ++calls;
            return oauth2::token{"renewed", current.refresh_token, now + std::chrono::hours{1}};
        });

    BOOST_TEST(source.get_access_token().value() == "renewed");
    BOOST_TEST(calls == 1);
}

BOOST_AUTO_TEST_CASE(forced_refresh_ignores_expiry)
{
    const auto later = std::chrono::system_clock::now() + std::chrono::hours{1};
    oauth2::token_source source(oauth2::token{"cached", "refresh", later},
        [later](const oauth2::token&) -> result<oauth2::token> {
            return oauth2::token{"forced", "refresh", later};
        });

    BOOST_TEST(source.get_access_token().value() == "cached");
    BOOST_TEST(source.refresh_access_token().value() == "forced");
    BOOST_TEST(source.refresh_count() == 1u);
}

BOOST_AUTO_TEST_CASE(refresh_error_propagated)
{
    int calls = 0;
    const auto now = std::chrono::system_clock::now();
    oauth2::token initial{"access", "refresh", now - std::chrono::minutes{1}};

    oauth2::token_source source(initial,
        [&](const oauth2::token&) -> result<oauth2::token> {
            ++calls;
            return fail<oauth2::token>(errc::net_io_failed, "refresh failed");
        });

    auto res = source.get_access_token();
    BOOST_TEST(calls == 1);
    BOOST_REQUIRE(!res.has_value());
    BOOST_TEST(to_string(res.error().code) == "net_io_failed");
    BOOST_TEST(source.refresh_count() == 0u);
}

BOOST_AUTO_TEST_CASE(empty_refreshed_token_is_rejected)
{
    const auto now = std::chrono::system_clock::now();
    oauth2::token_source source(oauth2::token{"access", "refresh", now},
        [now](const oauth2::token&) -> result<oauth2::token> {
            return oauth2::token{"", "refresh", now + std::chrono::hours{1}};
        });

    auto res = source.get_access_token();
    BOOST_REQUIRE(!res.has_value());
    BOOST_TEST(res.error().code == errc::auth_failed);
}

BOOST_AUTO_TEST_CASE(missing_refresh_function)
{
    oauth2::token_source source(oauth2::token{"access", "", {}}, {});
    BOOST_TEST(!source.can_refresh());

    // a default expiry never counts as valid
    auto res = source.get_access_token();
    BOOST_REQUIRE(!res.has_value());
    BOOST_TEST(res.error().code == errc::config_invalid);
}
