/*

smtp_send.cpp
-------------

Sends one message through a submission server with STARTTLS and password
login, then prints the connection diagnostics.

Usage: smtp_send <host> <user> <password> <to>


Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#include <iostream>
#include <memory>
#include <string>
#include <smtpxx/smtpxx.hpp>
#include "example_util.hpp"


using std::cout;
using std::endl;


smtpxx::asio::awaitable<int> run(smtpxx::client_config config, std::string to)
{
    auto metrics = std::make_shared<smtpxx::counting_metrics>();
    smtpxx::client_options options;
    options.metrics = metrics;

    auto made = smtpxx::client::create(co_await smtpxx::asio::this_coro::executor, std::move(config), options);
    if (!made)
    {
        print_error(made.error());
        co_return 1;
    }
    auto& client = *made.value();

    auto info = co_await client.test_connection();
    if (!info)
    {
        print_error(info.error());
        co_return 1;
    }
    cout << "Connected to " << info->host << ":" << info->port << " (" << (info->tls ? info->tls_version : "plaintext")
         << ") as " << info->authenticated_user << endl;
    cout << "Banner: " << info->banner << endl;
    for (const auto& line : info->capabilities)
        cout << "  " << line << endl;

    smtpxx::email mail;
    mail.from = info->authenticated_user;
    mail.to = {std::move(to)};
    mail.content = "From: " + mail.from + "\r\n"
                   "To: " + mail.to.front() + "\r\n"
                   "Subject: smtpxx test\r\n"
                   "\r\n"
                   "Hello from smtpxx.\r\n";

    auto sent = co_await client.send(mail);
    co_await client.shutdown();
    if (!sent)
    {
        print_error(sent.error());
        co_return 1;
    }

    cout << "Sent " << sent->message_id << " in " << sent->duration.count() << "ms: " << sent->response << endl;
    for (const auto& rejected : sent->rejected)
        cout << "  rejected " << rejected.address << ": " << rejected.status << " " << rejected.message << endl;

    const auto snap = metrics->get();
    cout << "sends=" << snap.sends_succeeded << " retries=" << snap.retries << " tls=" << snap.tls_upgrades << endl;
    co_return sent->complete_success() ? 0 : 2;
}


int main(int argc, char* argv[])
{
    if (argc != 5)
    {
        std::cerr << "usage: " << argv[0] << " <host> <user> <password> <to>" << endl;
        return 64;
    }

    smtpxx::log::logger::instance().set_level(
        env_or("SMTPXX_TRACE", "").empty() ? smtpxx::log::level::info : smtpxx::log::level::trace);
    smtpxx::log::logger::instance().set_trace_enabled(!env_or("SMTPXX_TRACE", "").empty());

    auto config = smtpxx::client_config::submission(argv[1], argv[2], argv[3]);

    smtpxx::asio::io_context io_ctx;
    auto status = smtpxx::asio::co_spawn(io_ctx, run(std::move(config), argv[4]), smtpxx::asio::use_future);
    io_ctx.run();
    return status.get();
}
