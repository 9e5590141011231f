/*

smtp_batch.cpp
--------------

Sends a small newsletter batch with pooling, retry and rate limiting,
using the exception-based helpers.

Usage: smtp_batch <host> <user> <password> <to>...


Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#include <chrono>
#include <iostream>
#include <string>
#include <vector>
#include <smtpxx/smtpxx.hpp>
#include <smtpxx/throwing.hpp>
#include "example_util.hpp"


using std::cout;
using std::endl;


smtpxx::asio::awaitable<void> send_all(smtpxx::client_config config, std::vector<std::string> recipients)
{
    auto client = smtpxx::unwrap(smtpxx::client::create(co_await smtpxx::asio::this_coro::executor,
        std::move(config)));
    smtpxx::unwrap(co_await client->warmup());

    std::vector<smtpxx::email> mails;
    for (auto& to : recipients)
    {
        smtpxx::email mail;
        mail.from = env_or("SMTPXX_FROM", "newsletter@example.com");
        mail.to = {to};
        mail.content = "To: " + to + "\r\n"
                       "Subject: Monthly news\r\n"
                       "\r\n"
                       "Nothing happened this month.\r\n";
        mails.push_back(std::move(mail));
    }

    const auto batch = co_await client->send_batch(mails);
    for (std::size_t i = 0; i < batch.results.size(); ++i)
    {
        const auto& res = batch.results[i];
        if (res)
            cout << recipients[i] << ": " << res->response << endl;
        else
            cout << recipients[i] << ": " << res.error().to_string() << endl;
    }
    cout << batch.succeeded << "/" << batch.total << " sent in " << batch.duration.count() << "ms" << endl;

    const auto pool = client->pool_status();
    const auto circuit = client->circuit_stats();
    cout << "pool: total=" << pool.total << " idle=" << pool.idle << ", circuit: " << circuit.state << endl;

    co_await client->shutdown();
}


int main(int argc, char* argv[])
{
    if (argc < 5)
    {
        std::cerr << "usage: " << argv[0] << " <host> <user> <password> <to>..." << endl;
        return 64;
    }

    auto config = smtpxx::client_config::submission(argv[1], argv[2], argv[3]);
    config.pool = smtpxx::pool::pool_config::bulk_sending();
    config.pool.health_check_enabled = false;
    config.rate_limit = smtpxx::resilience::rate_limit_config::per_minute(30,
        smtpxx::resilience::limit_action::wait);
    config.retry.max_attempts = 4;

    std::vector<std::string> recipients(argv + 4, argv + argc);

    try
    {
        smtpxx::asio::io_context io_ctx;
        auto done = smtpxx::asio::co_spawn(io_ctx, send_all(std::move(config), std::move(recipients)),
            smtpxx::asio::use_future);
        io_ctx.run();
        done.get();
    }
    catch (const smtpxx::exception& exc)
    {
        print_error(exc.info());
        return 1;
    }
    return 0;
}
