/*

dialog.hpp
----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include <smtpxx/detail/asio_decl.hpp>
#include <smtpxx/detail/log.hpp>
#include <smtpxx/detail/redact.hpp>
#include <smtpxx/detail/result.hpp>
#include <smtpxx/net/error_mapping.hpp>


namespace smtpxx
{
namespace net
{

constexpr std::size_t DEFAULT_MAX_LINE_LENGTH = 8192;
constexpr std::size_t MAX_ALLOWED_LINE_LENGTH = 1024 * 1024;

/**
Dealing with network in a line oriented fashion.
Wraps a Boost.Asio stream (socket, ssl stream, upgradable_stream).
Every operation is bounded by the optional timeout; expiry cancels the socket.
**/
template<typename Stream>
class dialog
{
public:
    using duration = std::chrono::steady_clock::duration;

    dialog(Stream stream,
        std::size_t max_line_length = DEFAULT_MAX_LINE_LENGTH,
        std::optional<duration> timeout = std::nullopt)
        : stream_(std::move(stream)),
          max_line_length_(std::min(max_line_length, MAX_ALLOWED_LINE_LENGTH)),
          timeout_(timeout)
    {
    }

    dialog(const dialog&) = delete;
    dialog& operator=(const dialog&) = delete;

    void set_trace_protocol(std::string protocol)
    {
        trace_protocol_ = std::move(protocol);
    }

    void set_trace_redaction(bool enabled) noexcept
    {
        redact_secrets_in_trace_ = enabled;
    }

    /// Host and port quoted in error details.
    void set_peer(std::string host, std::uint16_t port)
    {
        host_ = std::move(host);
        port_ = port;
    }

    /**
    Sending a line to network.

    @param line Line to send (CRLF added if missing).
    **/
    asio::awaitable<result<void>> write_line(std::string_view line)
    {
        std::string payload = normalize_line(line);
        trace_line(log::direction::send, payload);
        co_return co_await write_impl(payload, "write_line");
    }

    /**
    Writing raw bytes to network (message payload). Not traced line by line.

    @param data Bytes to write.
    **/
    asio::awaitable<result<void>> write_raw(std::string_view data)
    {
        co_return co_await write_impl(data, "write_raw");
    }

    /**
    Receiving a line from network, without its CRLF.

    @return Line, or net_* on I/O failure, smtp_bad_reply when the line exceeds the limit.
    **/
    asio::awaitable<result<std::string>> read_line()
    {
        auto pos = read_buffer_.find('\n');
        if (pos == std::string::npos)
        {
            const std::size_t max_size = std::max(read_buffer_.size(), max_line_length_ + 2);
            auto outcome = co_await run_with_timeout([this, max_size](auto token)
            {
                return asio::async_read_until(stream_, asio::dynamic_buffer(read_buffer_, max_size), '\n', token);
            });
            if (outcome.ec == asio::error::not_found)
                co_return fail<std::string>(errc::smtp_bad_reply, "Line too long.",
                    make_net_detail(host_, port_, io_stage::read, "read_line").add_int("max_line_length", max_line_length_).str());
            if (outcome.ec)
                co_return fail<std::string>(make_net_error(io_stage::read, outcome.ec, outcome.timed_out,
                    make_net_detail(host_, port_, io_stage::read, "read_line")));
            pos = read_buffer_.find('\n');
            if (pos == std::string::npos)
                co_return fail<std::string>(errc::net_io_failed, "Incomplete line.");
        }

        const std::size_t line_length = (pos > 0 && read_buffer_[pos - 1] == '\r') ? pos - 1 : pos;
        if (line_length > max_line_length_)
            co_return fail<std::string>(errc::smtp_bad_reply, "Line too long.");
        std::string line = read_buffer_.substr(0, line_length);
        read_buffer_.erase(0, pos + 1);
        trace_line(log::direction::receive, line);
        co_return line;
    }

    /// Bytes already received but not consumed; non-empty before STARTTLS means injected plaintext.
    [[nodiscard]] bool has_buffered_input() const noexcept { return !read_buffer_.empty(); }

    [[nodiscard]] Stream& stream() noexcept { return stream_; }

    void timeout(std::optional<duration> value) noexcept { timeout_ = value; }
    [[nodiscard]] std::optional<duration> timeout() const noexcept { return timeout_; }

protected:
    struct io_outcome
    {
        asio::error_code ec;
        bool timed_out = false;
    };

    struct timeout_state
    {
        bool done = false;
        bool timed_out = false;
    };

    template<typename Initiate>
    asio::awaitable<io_outcome> run_with_timeout(Initiate initiate)
    {
        io_outcome outcome;
        auto state = std::make_shared<timeout_state>();
        std::optional<asio::steady_timer> timer;
        if (timeout_.has_value())
        {
            timer.emplace(stream_.get_executor());
            timer->expires_after(*timeout_);
            timer->async_wait([this, state](const asio::error_code& timer_ec)
            {
                if (timer_ec || state->done)
                    return;
                state->timed_out = true;
                asio::error_code ignore_ec;
                stream_.lowest_layer().cancel(ignore_ec);
            });
        }

        co_await initiate(asio::redirect_error(asio::use_awaitable, outcome.ec));
        state->done = true;
        if (timer)
            timer->cancel();
        // A timer that fired after the operation completed is not a timeout.
        outcome.timed_out = state->timed_out && outcome.ec == asio::error::operation_aborted;
        co_return outcome;
    }

    asio::awaitable<result<void>> write_impl(std::string_view data, std::string_view op)
    {
        auto outcome = co_await run_with_timeout([this, data](auto token)
        {
            return asio::async_write(stream_, asio::buffer(data.data(), data.size()), token);
        });
        if (outcome.ec)
            co_return fail(make_net_error(io_stage::write, outcome.ec, outcome.timed_out,
                make_net_detail(host_, port_, io_stage::write, op)));
        co_return ok();
    }

    static std::string normalize_line(std::string_view line)
    {
        while (!line.empty() && (line.back() == '\n' || line.back() == '\r'))
            line.remove_suffix(1);
        std::string out;
        out.reserve(line.size() + 2);
        out.append(line.data(), line.size());
        out += "\r\n";
        return out;
    }

    void trace_line(log::direction dir, std::string_view data) const
    {
        auto& logger = log::logger::instance();
        if (!logger.is_trace_enabled())
            return;
        if (dir == log::direction::send && redact_secrets_in_trace_)
        {
            logger.trace_protocol(trace_protocol_, dir, detail::redact_line(data));
            return;
        }
        logger.trace_protocol(trace_protocol_, dir, data);
    }

    Stream stream_;
    std::string read_buffer_;
    std::size_t max_line_length_;
    std::optional<duration> timeout_;
    std::string host_;
    std::uint16_t port_{0};

    std::string trace_protocol_{"SMTP"};
    bool redact_secrets_in_trace_{true};
};

} // namespace net
} // namespace smtpxx
