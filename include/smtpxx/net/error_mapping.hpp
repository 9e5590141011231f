/*

error_mapping.hpp
-----------------

Centralized mapping between Asio error codes and smtpxx::errc for network I/O.

*/

#pragma once

#include <cstdint>
#include <string_view>
#include <system_error>

#include <smtpxx/detail/asio_decl.hpp>
#include <smtpxx/detail/error_detail.hpp>
#include <smtpxx/detail/result.hpp>

namespace smtpxx::net
{

enum class io_stage
{
    resolve,
    connect,
    read,
    write,
    handshake
};

[[nodiscard]] constexpr std::string_view stage_name(io_stage stage) noexcept
{
    switch (stage)
    {
        case io_stage::resolve: return "resolve";
        case io_stage::connect: return "connect";
        case io_stage::read: return "read";
        case io_stage::write: return "write";
        case io_stage::handshake: return "handshake";
    }
    return "unknown";
}

[[nodiscard]] inline errc map_net_error(io_stage stage, const smtpxx::asio::error_code& ec, bool timeout_triggered) noexcept
{
    namespace error = smtpxx::asio::error;
    if (timeout_triggered || ec == error::timed_out)
        return errc::net_timeout;
    if (ec == error::operation_aborted)
        return errc::net_cancelled;
    if (ec == error::eof || ec == smtpxx::asio::ssl::error::stream_truncated)
        return errc::net_eof;
    if (ec == error::connection_refused)
        return errc::net_connection_refused;
    if (ec == error::connection_reset || ec == error::broken_pipe || ec == error::connection_aborted)
        return errc::net_connection_reset;
    if (ec == error::host_not_found || ec == error::host_not_found_try_again)
        return errc::net_resolve_failed;

    switch (stage)
    {
        case io_stage::resolve: return errc::net_resolve_failed;
        case io_stage::connect: return errc::net_connect_failed;
        case io_stage::read: return errc::net_io_failed;
        case io_stage::write: return errc::net_io_failed;
        case io_stage::handshake: return errc::tls_handshake_failed;
    }
    return errc::net_io_failed;
}

[[nodiscard]] inline detail::error_detail make_net_detail(std::string_view host, std::uint16_t port,
    io_stage stage, std::string_view op)
{
    detail::error_detail out;
    out.add("proto", "SMTP");
    out.add("host", host);
    out.add_int("port", port);
    out.add("stage", stage_name(stage));
    out.add("op", op);
    return out;
}

/// Builds the error_info for a failed network operation.
[[nodiscard]] inline error_info make_net_error(io_stage stage, const smtpxx::asio::error_code& ec,
    bool timeout_triggered, detail::error_detail context)
{
    const errc code = map_net_error(stage, ec, timeout_triggered);
    if (ec)
        context.add_ec("asio", ec);
    std::string message(stage_name(stage));
    message += timeout_triggered ? " timed out." : " failed.";
    return make_error(code, std::move(message), context.str(), ec);
}

} // namespace smtpxx::net
