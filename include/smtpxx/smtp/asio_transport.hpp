/*

asio_transport.hpp
------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include <smtpxx/detail/append.hpp>
#include <smtpxx/detail/asio_decl.hpp>
#include <smtpxx/detail/async_mutex.hpp>
#include <smtpxx/detail/log.hpp>
#include <smtpxx/detail/result.hpp>
#include <smtpxx/detail/sanitize.hpp>
#include <smtpxx/net/deadline.hpp>
#include <smtpxx/net/dialog.hpp>
#include <smtpxx/net/error_mapping.hpp>
#include <smtpxx/net/tls_context.hpp>
#include <smtpxx/net/tls_options.hpp>
#include <smtpxx/net/upgradable_stream.hpp>
#include <smtpxx/smtp/error_mapping.hpp>
#include <smtpxx/smtp/transport.hpp>
#include <smtpxx/smtp/types.hpp>

namespace smtpxx::smtp
{

struct asio_transport_options
{
    std::string host;
    std::uint16_t port = 587;
    net::tls_policy tls_policy = net::tls_policy::opportunistic;
    net::tls_options tls;
    /// Shared by every connection of a pool; built from `tls` when empty.
    std::shared_ptr<asio::ssl::context> tls_context;
    std::chrono::steady_clock::duration connect_timeout = std::chrono::seconds{30};
    std::chrono::steady_clock::duration command_timeout = std::chrono::seconds{60};
    std::size_t max_line_length = net::DEFAULT_MAX_LINE_LENGTH;
    bool redact_secrets_in_trace = true;
};

/**
TCP/TLS transport over Boost.Asio. Commands on one connection are serialized by
an async_mutex so a command and its reply are never interleaved with another.
**/
class asio_transport final : public transport
{
public:
    using options = asio_transport_options;
    using dialog_type = net::dialog<net::upgradable_stream>;

    /**
    Resolves, connects, performs the handshake in implicit TLS mode and reads the greeting.

    @param executor Executor the connection runs on.
    @param opts     Destination and TLS settings.
    @return         Transport in the `connected` state, or the network, TLS or greeting error.
    **/
    static asio::awaitable<result<std::unique_ptr<asio_transport>>> connect(asio::any_io_executor executor, options opts)
    {
        using ptr_t = std::unique_ptr<asio_transport>;

        if (opts.host.empty())
            co_return fail<ptr_t>(errc::config_invalid, "SMTP host is empty.");
        if (auto valid = detail::ensure_no_crlf_or_nul(opts.host, "host"); !valid)
            co_return fail<ptr_t>(std::move(valid).error());

        if (opts.tls_policy != net::tls_policy::none && !opts.tls_context)
        {
            auto ctx = net::make_tls_context(opts.tls);
            if (!ctx)
                co_return fail<ptr_t>(std::move(ctx).error());
            opts.tls_context = std::move(ctx).value();
        }

        asio::tcp::resolver resolver(executor);
        asio::tcp::socket socket(executor);
        net::deadline guard(executor, opts.connect_timeout, [&resolver, &socket]()
        {
            resolver.cancel();
            asio::error_code ignore_ec;
            socket.close(ignore_ec);
        });

        asio::error_code ec;
        auto endpoints = co_await resolver.async_resolve(opts.host, std::to_string(opts.port),
            asio::redirect_error(asio::use_awaitable, ec));
        if (ec)
            co_return fail<ptr_t>(net::make_net_error(net::io_stage::resolve, ec, guard.expired(),
                net::make_net_detail(opts.host, opts.port, net::io_stage::resolve, "resolve")));

        co_await asio::async_connect(socket, endpoints, asio::redirect_error(asio::use_awaitable, ec));
        guard.disarm();
        if (ec)
            co_return fail<ptr_t>(net::make_net_error(net::io_stage::connect, ec, guard.expired(),
                net::make_net_detail(opts.host, opts.port, net::io_stage::connect, "connect")));

        const bool implicit_tls = opts.tls_policy == net::tls_policy::implicit;
        ptr_t conn(new asio_transport(executor, std::move(opts), std::move(socket)));
        SMTPXX_DEBUG("SMTP", "connected to " + conn->host() + ":" + std::to_string(conn->port()));

        if (implicit_tls)
        {
            auto tls = co_await conn->handshake();
            if (!tls)
                co_return fail<ptr_t>(std::move(tls).error());
        }

        auto greeting = co_await conn->read_reply();
        if (!greeting)
            co_return fail<ptr_t>(std::move(greeting).error());
        if (greeting->status != 220)
            co_return fail<ptr_t>(make_smtp_error(command_kind::greeting, *greeting, conn->host()));

        conn->set_banner(greeting->lines.empty() ? std::string() : greeting->lines.front());
        conn->set_state(transaction_state::connected);
        co_return std::move(conn);
    }

    asio::awaitable<result<reply>> send_command(std::string line) override
    {
        auto lock = co_await mutex_.lock();
        if (!lock)
            co_return fail<reply>(std::move(lock).error());
        if (auto valid = detail::ensure_no_crlf_or_nul(line, "command"); !valid)
            co_return fail<reply>(std::move(valid).error());
        if (state() == transaction_state::closed)
            co_return fail<reply>(errc::smtp_invalid_state, "Connection is closed.");

        auto written = co_await dialog_.write_line(line);
        if (!written)
        {
            mark_unhealthy();
            co_return fail<reply>(std::move(written).error());
        }
        co_return co_await read_reply_impl();
    }

    asio::awaitable<result<void>> send_payload(std::string_view data) override
    {
        auto lock = co_await mutex_.lock();
        if (!lock)
            co_return fail(std::move(lock).error());
        if (state() == transaction_state::closed)
            co_return fail(errc::smtp_invalid_state, "Connection is closed.");

        trace_payload(data.size());
        auto written = co_await dialog_.write_raw(data);
        if (!written)
        {
            mark_unhealthy();
            co_return written;
        }
        co_return ok();
    }

    asio::awaitable<result<reply>> read_reply() override
    {
        auto lock = co_await mutex_.lock();
        if (!lock)
            co_return fail<reply>(std::move(lock).error());
        co_return co_await read_reply_impl();
    }

    asio::awaitable<result<void>> upgrade_tls() override
    {
        auto lock = co_await mutex_.lock();
        if (!lock)
            co_return fail(std::move(lock).error());
        if (tls_)
            co_return ok();
        if (!opts_.tls_context)
            co_return fail(errc::config_invalid, "TLS upgrade requested with TLS disabled.");
        // Anything already buffered was sent in plaintext before the handshake.
        if (dialog_.has_buffered_input())
        {
            mark_unhealthy();
            co_return fail(errc::smtp_bad_reply, "Unexpected data received before the TLS handshake.");
        }
        co_return co_await handshake();
    }

    asio::awaitable<void> close() override
    {
        if (state() == transaction_state::closed)
            co_return;

        auto lock = co_await mutex_.lock();
        if (lock && healthy() && state() != transaction_state::initial)
        {
            dialog_.timeout(std::min<std::chrono::steady_clock::duration>(opts_.command_timeout, QUIT_TIMEOUT));
            auto quit = co_await quit_impl();
            if (!quit)
                SMTPXX_DEBUG("SMTP", "QUIT failed: " + quit.error().message);
        }
        dialog_.stream().close();
        mark_unhealthy();
        set_state(transaction_state::closed);
        SMTPXX_DEBUG("SMTP", "connection to " + host() + " closed");
    }

    [[nodiscard]] bool is_tls() const noexcept override { return tls_; }
    [[nodiscard]] std::string tls_version() const override { return tls_version_; }

private:
    static constexpr std::chrono::seconds QUIT_TIMEOUT{5};

    asio_transport(asio::any_io_executor executor, options opts, asio::tcp::socket socket)
        : transport(opts.host, opts.port),
          executor_(executor),
          opts_(std::move(opts)),
          dialog_(net::upgradable_stream(std::move(socket)), opts_.max_line_length, opts_.command_timeout),
          mutex_(executor_)
    {
        dialog_.set_trace_protocol("SMTP");
        dialog_.set_trace_redaction(opts_.redact_secrets_in_trace);
        dialog_.set_peer(opts_.host, opts_.port);
    }

    asio::awaitable<result<void>> handshake()
    {
        auto& stream = dialog_.stream();
        net::deadline guard(executor_, opts_.connect_timeout, [&stream]()
        {
            asio::error_code ignore_ec;
            stream.lowest_layer().cancel(ignore_ec);
        });
        auto res = co_await stream.start_tls(*opts_.tls_context, host(), opts_.tls);
        guard.disarm();
        if (!res)
        {
            mark_unhealthy();
            if (guard.expired())
                co_return fail(errc::net_timeout, "TLS handshake timed out.",
                    net::make_net_detail(host(), port(), net::io_stage::handshake, "handshake").str());
            co_return res;
        }

        tls_ = true;
        tls_version_ = stream.tls_version();
        SMTPXX_DEBUG("SMTP", "TLS established with " + host() + " (" + tls_version_ + ")");
        co_return ok();
    }

    asio::awaitable<result<void>> quit_impl()
    {
        auto written = co_await dialog_.write_line("QUIT");
        if (!written)
            co_return written;
        auto rep = co_await read_reply_impl();
        if (!rep)
            co_return fail(std::move(rep).error());
        co_return ok();
    }

    /// Reads a reply of the form `ddd-text` ... `ddd text`; every line must carry the same code.
    asio::awaitable<result<reply>> read_reply_impl()
    {
        reply rep;
        while (true)
        {
            auto line_res = co_await dialog_.read_line();
            if (!line_res)
            {
                mark_unhealthy();
                co_return fail<reply>(std::move(line_res).error());
            }
            const std::string& line = *line_res;

            if (line.size() < 3
                || !std::isdigit(static_cast<unsigned char>(line[0]))
                || !std::isdigit(static_cast<unsigned char>(line[1]))
                || !std::isdigit(static_cast<unsigned char>(line[2])))
                co_return bad_reply(line);

            const int code = (line[0] - '0') * 100 + (line[1] - '0') * 10 + (line[2] - '0');
            bool last = true;
            if (line.size() >= 4)
            {
                if (line[3] == '-')
                    last = false;
                else if (line[3] != ' ')
                    co_return bad_reply(line);
            }

            if (rep.status == 0)
                rep.status = code;
            else if (rep.status != code)
                co_return bad_reply(line);

            rep.lines.push_back(line.size() > 4 ? line.substr(4) : std::string());
            if (last)
                break;
        }
        co_return rep;
    }

    result<reply> bad_reply(std::string_view line)
    {
        mark_unhealthy();
        return fail<reply>(errc::smtp_bad_reply, "Malformed SMTP reply.",
            detail::error_detail().add("host", host()).add("line", line).str());
    }

    void trace_payload(std::size_t bytes) const
    {
        auto& logger = log::logger::instance();
        if (!logger.is_trace_enabled())
            return;
        std::string line;
        detail::append_sv(line, "DATA payload bytes=");
        detail::append_uint(line, static_cast<std::uint64_t>(bytes));
        logger.trace_protocol("SMTP", log::direction::send, line);
    }

    asio::any_io_executor executor_;
    options opts_;
    dialog_type dialog_;
    detail::async_mutex mutex_;
    bool tls_{false};
    std::string tls_version_;
};

} // namespace smtpxx::smtp
