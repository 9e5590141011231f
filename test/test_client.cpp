/*

test_client.cpp
---------------

Copyright (C) 2025, Sylvain Guinebert.

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#define BOOST_TEST_MODULE client_test

#include <boost/test/unit_test.hpp>

#include <algorithm>
#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include <smtpxx/client.hpp>
#include <smtpxx/smtp/memory_transport.hpp>
#include <smtpxx/throwing.hpp>

using namespace smtpxx;
using resilience::circuit_state;

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

client_config memory_config()
{
    client_config cfg;
    cfg.host = "mock.example";
    cfg.client_id = "client.example";
    cfg.pool.health_check_enabled = false;
    cfg.pool.min_idle = 0;
    cfg.pool.acquire_timeout = std::chrono::milliseconds{200};
    cfg.retry.initial_delay = std::chrono::milliseconds{1};
    cfg.retry.max_delay = std::chrono::milliseconds{5};
    cfg.retry.jitter = false;
    return cfg;
}

client_options memory_options(std::shared_ptr<smtp::memory_server> server,
    std::shared_ptr<metrics_sink> metrics = nullptr)
{
    client_options opts;
    opts.metrics = std::move(metrics);
    opts.connector = [server]()
    {
        return smtp::memory_transport::connect(server);
    };
    return opts;
}

std::unique_ptr<client> make_client(asio::any_io_executor executor, client_config cfg, client_options opts)
{
    auto made = client::create(executor, std::move(cfg), std::move(opts));
    BOOST_REQUIRE(made.has_value());
    return std::move(made).value();
}

email simple_email(std::string to = "a@example.com")
{
    email mail;
    mail.from = "sender@example.com";
    mail.to = {std::move(to)};
    mail.content = "Subject: hi\r\n\r\nbody\r\n";
    return mail;
}

error_info connection_reset()
{
    return make_error(errc::net_connection_reset, "Connection reset by peer.");
}

} // namespace


BOOST_AUTO_TEST_CASE(send_reports_server_queue_id)
{
    auto server = std::make_shared<smtp::memory_server>();
    auto metrics = std::make_shared<counting_metrics>();
    run([server, metrics]() -> asio::awaitable<void>
    {
        auto smtp_client = make_client(co_await asio::this_coro::executor, memory_config(),
            memory_options(server, metrics));

        auto mail = simple_email();
        mail.cc = {"b@example.com"};
        mail.bcc = {"c@example.com"};
        auto sent = co_await smtp_client->send(mail);
        BOOST_REQUIRE(sent.has_value());
        BOOST_TEST(sent->complete_success());
        BOOST_TEST(sent->accepted.size() == 3u);
        BOOST_REQUIRE(sent->server_id.has_value());
        BOOST_TEST(*sent->server_id == "4F2A9C");
        BOOST_TEST(sent->response == "250 2.0.0 Ok: queued as 4F2A9C");
        BOOST_TEST(sent->message_id.front() == '<');
        BOOST_TEST(sent->message_id.find("@client.example>") != std::string::npos);

        const auto status = smtp_client->pool_status();
        BOOST_TEST(status.idle == 1u);
        BOOST_TEST(status.in_use == 0u);
    });

    const auto snap = metrics->get();
    BOOST_TEST(snap.sends_succeeded == 1u);
    BOOST_TEST(snap.recipients_accepted == 3u);
    BOOST_TEST(snap.tls_upgrades == 1u);
    BOOST_TEST(server->count("RCPT TO:") == 3u);
}

BOOST_AUTO_TEST_CASE(partial_rejection_is_a_success)
{
    auto server = std::make_shared<smtp::memory_server>();
    server->rejected_recipients = {"b@example.com"};
    run([server]() -> asio::awaitable<void>
    {
        auto smtp_client = make_client(co_await asio::this_coro::executor, memory_config(), memory_options(server));
        auto mail = simple_email();
        mail.to.push_back("b@example.com");

        auto sent = co_await smtp_client->send(mail);
        BOOST_REQUIRE(sent.has_value());
        BOOST_TEST(!sent->complete_success());
        BOOST_TEST(sent->accepted.size() == 1u);
        BOOST_REQUIRE(sent->rejected.size() == 1u);
        BOOST_TEST(sent->rejected.front().address == "b@example.com");
        BOOST_TEST(sent->rejected.front().status == 550);
    });
}

BOOST_AUTO_TEST_CASE(pooled_connection_is_not_renegotiated)
{
    auto server = std::make_shared<smtp::memory_server>();
    run([server]() -> asio::awaitable<void>
    {
        auto smtp_client = make_client(co_await asio::this_coro::executor, memory_config(), memory_options(server));
        auto first = co_await smtp_client->send(simple_email());
        auto second = co_await smtp_client->send(simple_email("b@example.com"));
        BOOST_TEST(first.has_value());
        BOOST_TEST(second.has_value());
        BOOST_TEST(smtp_client->pool_stats().hits == 1u);
    });
    BOOST_TEST(server->connects == 1u);
    BOOST_TEST(server->count("STARTTLS") == 1u);
    BOOST_TEST(server->count("EHLO") == 2u);
    BOOST_TEST(server->count("MAIL FROM:") == 2u);
}

BOOST_AUTO_TEST_CASE(transient_failure_is_retried_on_a_new_connection)
{
    auto server = std::make_shared<smtp::memory_server>();
    auto failures = std::make_shared<int>(1);
    server->io_failure = [failures](const std::string& command) -> std::optional<error_info>
    {
        if (command.rfind("MAIL FROM:", 0) == 0 && *failures > 0)
        {
            --*failures;
            return connection_reset();
        }
        return std::nullopt;
    };
    auto metrics = std::make_shared<counting_metrics>();

    run([server, metrics]() -> asio::awaitable<void>
    {
        auto smtp_client = make_client(co_await asio::this_coro::executor, memory_config(),
            memory_options(server, metrics));
        auto sent = co_await smtp_client->send(simple_email());
        BOOST_TEST(sent.has_value());
        BOOST_TEST(smtp_client->pool_stats().destroyed == 1u);
    });

    BOOST_TEST(server->connects == 2u);
    BOOST_TEST(server->payloads.size() == 1u);
    BOOST_TEST(metrics->get().retries == 1u);
    BOOST_TEST(metrics->get().sends_succeeded == 1u);
}

BOOST_AUTO_TEST_CASE(permanent_rejection_is_not_retried)
{
    auto server = std::make_shared<smtp::memory_server>();
    server->mail_from_reply = smtp::reply{550, {"5.7.1 Sender rejected"}};
    auto metrics = std::make_shared<counting_metrics>();

    run([server, metrics]() -> asio::awaitable<void>
    {
        auto smtp_client = make_client(co_await asio::this_coro::executor, memory_config(),
            memory_options(server, metrics));
        auto sent = co_await smtp_client->send(simple_email());
        BOOST_REQUIRE(!sent.has_value());
        BOOST_TEST(sent.error().code == errc::smtp_mail_from_rejected);
        BOOST_TEST(sent.error().smtp_status == 550);
        BOOST_TEST(smtp_client->circuit_stats().failure_count == 0u);
    });

    BOOST_TEST(server->count("MAIL FROM:") == 1u);
    const auto snap = metrics->get();
    BOOST_TEST(snap.sends_failed == 1u);
    BOOST_TEST(snap.failures_by_code.at(errc::smtp_mail_from_rejected) == 1u);
}

BOOST_AUTO_TEST_CASE(failure_after_payload_is_not_retried)
{
    auto server = std::make_shared<smtp::memory_server>();
    server->io_failure = [](const std::string& command) -> std::optional<error_info>
    {
        if (command == "<payload>")
            return connection_reset();
        return std::nullopt;
    };

    run([server]() -> asio::awaitable<void>
    {
        auto smtp_client = make_client(co_await asio::this_coro::executor, memory_config(), memory_options(server));
        auto sent = co_await smtp_client->send(simple_email());
        BOOST_REQUIRE(!sent.has_value());
        BOOST_TEST(sent.error().payload_started);
        BOOST_TEST(sent.error().code == errc::net_connection_reset);
    });

    // a second copy could be delivered twice
    BOOST_TEST(server->payloads.size() == 1u);
}

BOOST_AUTO_TEST_CASE(auth_failure_is_not_retried)
{
    auto server = std::make_shared<smtp::memory_server>();
    server->auth_accept = false;

    run([server]() -> asio::awaitable<void>
    {
        auto cfg = memory_config();
        cfg.credentials = std::make_shared<smtp::static_credentials>(smtp::password_credentials{"user", "wrong", {}});
        auto smtp_client = make_client(co_await asio::this_coro::executor, cfg, memory_options(server));
        auto sent = co_await smtp_client->send(simple_email());
        BOOST_REQUIRE(!sent.has_value());
        BOOST_TEST(sent.error().code == errc::auth_failed);
        BOOST_TEST(smtp_client->circuit_state() == circuit_state::closed);
    });

    BOOST_TEST(server->count("AUTH") == 1u);
    BOOST_TEST(server->count("MAIL FROM:") == 0u);
}

BOOST_AUTO_TEST_CASE(circuit_opens_after_repeated_connect_failures)
{
    auto server = std::make_shared<smtp::memory_server>();
    server->connect_failure = []() -> std::optional<error_info>
    {
        return make_error(errc::net_connection_refused, "Connection refused.");
    };

    run([server]() -> asio::awaitable<void>
    {
        auto cfg = memory_config();
        cfg.retry = resilience::retry_policy::disabled();
        cfg.circuit_breaker.failure_threshold = 2;
        cfg.circuit_breaker.recovery_timeout = std::chrono::minutes{5};
        auto smtp_client = make_client(co_await asio::this_coro::executor, cfg, memory_options(server));

        for (int i = 0; i < 2; ++i)
        {
            auto sent = co_await smtp_client->send(simple_email());
            BOOST_REQUIRE(!sent.has_value());
            BOOST_TEST(sent.error().code == errc::net_connection_refused);
        }
        BOOST_TEST(smtp_client->circuit_state() == circuit_state::open);

        auto blocked = co_await smtp_client->send(simple_email());
        BOOST_REQUIRE(!blocked.has_value());
        BOOST_TEST(blocked.error().code == errc::circuit_open);
        BOOST_TEST(smtp_client->circuit_stats().rejected_calls == 1u);

        smtp_client->reset_resilience();
        BOOST_TEST(smtp_client->circuit_state() == circuit_state::closed);
    });

    BOOST_TEST(server->connects == 0u);
}

BOOST_AUTO_TEST_CASE(rate_limit_applies_to_sends)
{
    auto server = std::make_shared<smtp::memory_server>();
    run([server]() -> asio::awaitable<void>
    {
        auto cfg = memory_config();
        cfg.rate_limit = resilience::rate_limit_config::per_minute(1);
        auto smtp_client = make_client(co_await asio::this_coro::executor, cfg, memory_options(server));

        auto first = co_await smtp_client->send(simple_email());
        BOOST_TEST(first.has_value());
        auto second = co_await smtp_client->send(simple_email());
        BOOST_REQUIRE(!second.has_value());
        BOOST_TEST(second.error().code == errc::rate_limited);
    });
    BOOST_TEST(server->count("MAIL FROM:") == 1u);
}

BOOST_AUTO_TEST_CASE(batch_isolates_failures)
{
    auto server = std::make_shared<smtp::memory_server>();
    run([server]() -> asio::awaitable<void>
    {
        auto smtp_client = make_client(co_await asio::this_coro::executor, memory_config(), memory_options(server));

        std::vector<email> mails{simple_email("a@example.com"), simple_email("not an address"),
            simple_email("c@example.com")};
        auto batch = co_await smtp_client->send_batch(mails);

        BOOST_TEST(batch.total == 3u);
        BOOST_TEST(batch.succeeded == 2u);
        BOOST_TEST(batch.failed == 1u);
        BOOST_TEST(!batch.complete_success());
        BOOST_REQUIRE(batch.results.size() == 3u);
        BOOST_TEST(batch.results[0].has_value());
        BOOST_REQUIRE(!batch.results[1].has_value());
        BOOST_TEST(batch.results[1].error().code == errc::invalid_address);
        BOOST_TEST(batch.results[2].has_value());
    });
    BOOST_TEST(server->payloads.size() == 2u);
}

BOOST_AUTO_TEST_CASE(empty_batch)
{
    auto server = std::make_shared<smtp::memory_server>();
    run([server]() -> asio::awaitable<void>
    {
        auto smtp_client = make_client(co_await asio::this_coro::executor, memory_config(), memory_options(server));
        auto batch = co_await smtp_client->send_batch({});
        BOOST_TEST(batch.total == 0u);
        BOOST_TEST(batch.complete_success());
    });
    BOOST_TEST(server->connects == 0u);
}

BOOST_AUTO_TEST_CASE(test_connection_reports_session)
{
    auto server = std::make_shared<smtp::memory_server>();
    run([server]() -> asio::awaitable<void>
    {
        auto cfg = memory_config();
        cfg.credentials = std::make_shared<smtp::static_credentials>(smtp::password_credentials{"user", "pass", {}});
        auto smtp_client = make_client(co_await asio::this_coro::executor, cfg, memory_options(server));

        auto info = co_await smtp_client->test_connection();
        BOOST_REQUIRE(info.has_value());
        BOOST_TEST(info->host == "mock.example");
        BOOST_TEST(info->port == 587);
        BOOST_TEST(info->tls);
        BOOST_TEST(info->tls_version == "TLSv1.3");
        BOOST_TEST(info->banner == "mock.example ESMTP ready");
        BOOST_TEST(info->authenticated_user == "user");
        const auto& caps = info->capabilities;
        BOOST_TEST((std::find(caps.begin(), caps.end(), "AUTH PLAIN LOGIN") != caps.end()));

        // outside the pool
        BOOST_TEST(smtp_client->pool_status().total == 0u);
    });
    BOOST_TEST(server->count("QUIT") == 1u);
    BOOST_TEST(server->count("MAIL FROM:") == 0u);
}

BOOST_AUTO_TEST_CASE(test_connection_failure_closes)
{
    auto server = std::make_shared<smtp::memory_server>();
    server->auth_accept = false;
    run([server]() -> asio::awaitable<void>
    {
        auto cfg = memory_config();
        cfg.credentials = std::make_shared<smtp::static_credentials>(smtp::password_credentials{"user", "pass", {}});
        auto smtp_client = make_client(co_await asio::this_coro::executor, cfg, memory_options(server));

        auto info = co_await smtp_client->test_connection();
        BOOST_REQUIRE(!info.has_value());
        BOOST_TEST(info.error().code == errc::auth_failed);
    });
    BOOST_TEST(server->closes == 1u);
}

BOOST_AUTO_TEST_CASE(shutdown_closes_the_pool)
{
    auto server = std::make_shared<smtp::memory_server>();
    run([server]() -> asio::awaitable<void>
    {
        auto smtp_client = make_client(co_await asio::this_coro::executor, memory_config(), memory_options(server));
        auto sent = co_await smtp_client->send(simple_email());
        BOOST_TEST(sent.has_value());

        co_await smtp_client->shutdown();
        auto after = co_await smtp_client->send(simple_email());
        BOOST_REQUIRE(!after.has_value());
        BOOST_TEST(after.error().code == errc::pool_closed);
    });
    BOOST_TEST(server->count("QUIT") == 1u);
}

BOOST_AUTO_TEST_CASE(warmup_opens_min_idle)
{
    auto server = std::make_shared<smtp::memory_server>();
    run([server]() -> asio::awaitable<void>
    {
        auto cfg = memory_config();
        cfg.pool.min_idle = 2;
        auto smtp_client = make_client(co_await asio::this_coro::executor, cfg, memory_options(server));
        auto warmed = co_await smtp_client->warmup();
        BOOST_TEST(warmed.has_value());
        BOOST_TEST(smtp_client->pool_status().idle == 2u);
    });
    BOOST_TEST(server->connects == 2u);
}

BOOST_AUTO_TEST_CASE(invalid_config_is_refused)
{
    asio::io_context ctx;
    client_config cfg;
    auto made = client::create(ctx.get_executor(), cfg);
    BOOST_REQUIRE(!made.has_value());
    BOOST_TEST(made.error().code == errc::config_invalid);
}

BOOST_AUTO_TEST_CASE(unwrap_throws_error_info)
{
    auto server = std::make_shared<smtp::memory_server>();
    server->mail_from_reply = smtp::reply{553, {"5.1.8 Bad sender domain"}};
    run([server]() -> asio::awaitable<void>
    {
        auto smtp_client = make_client(co_await asio::this_coro::executor, memory_config(), memory_options(server));
        auto sent = co_await smtp_client->send(simple_email());
        try
        {
            auto value = unwrap(std::move(sent));
            BOOST_FAIL("expected an exception, got " + value.response);
        }
        catch (const smtpxx::exception& exc)
        {
            BOOST_TEST(exc.code() == errc::smtp_mail_from_rejected);
            BOOST_TEST(exc.info().smtp_status == 553);
            BOOST_TEST(std::string(exc.what()).find("553") != std::string::npos);
        }
    });
}


namespace
{

asio::awaitable<void> write_text(asio::tcp::socket& socket, std::string text)
{
    co_await asio::async_write(socket, asio::buffer(text), asio::use_awaitable);
}

asio::awaitable<std::string> read_text(asio::tcp::socket& socket, std::string& buffer, std::string_view delimiter)
{
    const std::size_t n = co_await asio::async_read_until(socket, asio::dynamic_buffer(buffer), delimiter,
        asio::use_awaitable);
    std::string text = buffer.substr(0, n - delimiter.size());
    buffer.erase(0, n);
    co_return text;
}

/// Minimal plaintext ESMTP server for one connection; records what it was sent.
asio::awaitable<void> loopback_server(asio::tcp::acceptor& acceptor, std::vector<std::string>& commands,
    std::string& payload)
{
    auto socket = co_await acceptor.async_accept(asio::use_awaitable);
    std::string buffer;
    co_await write_text(socket, "220 loopback ESMTP ready\r\n");

    while (true)
    {
        const std::string line = co_await read_text(socket, buffer, "\r\n");
        commands.push_back(line);

        if (line.rfind("EHLO", 0) == 0)
            co_await write_text(socket, "250-loopback greets you\r\n250-SIZE 1000000\r\n250 8BITMIME\r\n");
        else if (line.rfind("MAIL FROM:", 0) == 0)
            co_await write_text(socket, "250 2.1.0 Ok\r\n");
        else if (line.rfind("RCPT TO:", 0) == 0)
            co_await write_text(socket, "250 2.1.5 Ok\r\n");
        else if (line == "DATA")
        {
            co_await write_text(socket, "354 End data with <CR><LF>.<CR><LF>\r\n");
            payload = co_await read_text(socket, buffer, "\r\n.\r\n");
            co_await write_text(socket, "250 2.0.0 Ok: queued as LOOP1\r\n");
        }
        else if (line == "QUIT")
        {
            co_await write_text(socket, "221 2.0.0 Bye\r\n");
            co_return;
        }
        else
            co_await write_text(socket, "502 5.5.2 Command not recognized\r\n");
    }
}

} // namespace


BOOST_AUTO_TEST_CASE(sends_over_tcp)
{
    asio::io_context ctx;
    asio::tcp::acceptor acceptor(ctx, asio::tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0));
    const auto port = acceptor.local_endpoint().port();

    std::vector<std::string> commands;
    std::string payload;
    asio::co_spawn(ctx, loopback_server(acceptor, commands, payload), asio::detached);

    auto fut = asio::co_spawn(ctx, [port]() -> asio::awaitable<result<send_result>>
    {
        client_config cfg;
        cfg.host = "127.0.0.1";
        cfg.port = port;
        cfg.client_id = "client.example";
        cfg.tls_policy = net::tls_policy::none;
        cfg.pool.health_check_enabled = false;
        cfg.connect_timeout = std::chrono::seconds{5};
        cfg.command_timeout = std::chrono::seconds{5};
        auto made = client::create(co_await asio::this_coro::executor, cfg);
        if (!made)
            co_return fail<send_result>(std::move(made).error());
        auto smtp_client = std::move(made).value();

        email mail;
        mail.from = "sender@example.com";
        mail.to = {"rcpt@example.com"};
        mail.content = "Subject: loopback\r\n\r\n.leading dot\r\n";
        auto sent = co_await smtp_client->send(mail);
        co_await smtp_client->shutdown();
        co_return sent;
    }, asio::use_future);
    ctx.run();

    auto sent = fut.get();
    BOOST_REQUIRE(sent.has_value());
    BOOST_REQUIRE(sent->server_id.has_value());
    BOOST_TEST(*sent->server_id == "LOOP1");

    const std::vector<std::string> expected{
        "EHLO client.example",
        "MAIL FROM:<sender@example.com> SIZE=35",
        "RCPT TO:<rcpt@example.com>",
        "DATA",
        "QUIT"};
    BOOST_TEST(commands == expected, boost::test_tools::per_element());
    BOOST_TEST(payload == "Subject: loopback\r\n\r\n..leading dot");
}
