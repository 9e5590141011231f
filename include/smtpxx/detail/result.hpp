/*

result.hpp
----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Error handling types using std::expected (C++23).
Fallible operations return result<T>; throwing.hpp offers an opt-in bridge.

*/

#pragma once

#include <cstdint>
#include <expected>
#include <ostream>
#include <source_location>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace smtpxx
{

/// Error codes for smtpxx operations
enum class errc : std::uint16_t
{
    // Configuration (100-199)
    config_invalid = 100,
    starttls_unavailable = 101,
    auth_tls_required = 102,
    auth_mechanism_unsupported = 103,

    // Network and TLS (200-299)
    net_resolve_failed = 200,
    net_connect_failed = 201,
    net_connection_refused = 202,
    net_connection_reset = 203,
    net_timeout = 204,
    net_eof = 205,
    net_io_failed = 206,
    net_cancelled = 207,
    tls_handshake_failed = 220,
    tls_verify_failed = 221,
    tls_pinning_failed = 222,

    // SMTP protocol (300-399)
    smtp_bad_reply = 300,
    smtp_invalid_state = 301,
    smtp_greeting_rejected = 302,
    smtp_service_not_available = 303,
    smtp_temporary_failure = 304,
    smtp_permanent_failure = 305,
    smtp_mail_from_rejected = 306,
    smtp_data_rejected = 307,
    smtp_message_too_large = 308,
    smtp_all_recipients_rejected = 309,

    // Authentication (400-499)
    auth_failed = 400,

    // Resilience and pooling (500-599)
    pool_exhausted = 500,
    pool_closed = 501,
    circuit_open = 510,
    rate_limited = 520,

    // Input validation (700-799)
    invalid_argument = 700,
    invalid_address = 701,

    // Internal (900-999)
    internal_error = 900,
};

[[nodiscard]] constexpr std::string_view to_string(errc code) noexcept
{
    switch (code)
    {
        case errc::config_invalid: return "config_invalid";
        case errc::starttls_unavailable: return "starttls_unavailable";
        case errc::auth_tls_required: return "auth_tls_required";
        case errc::auth_mechanism_unsupported: return "auth_mechanism_unsupported";
        case errc::net_resolve_failed: return "net_resolve_failed";
        case errc::net_connect_failed: return "net_connect_failed";
        case errc::net_connection_refused: return "net_connection_refused";
        case errc::net_connection_reset: return "net_connection_reset";
        case errc::net_timeout: return "net_timeout";
        case errc::net_eof: return "net_eof";
        case errc::net_io_failed: return "net_io_failed";
        case errc::net_cancelled: return "net_cancelled";
        case errc::tls_handshake_failed: return "tls_handshake_failed";
        case errc::tls_verify_failed: return "tls_verify_failed";
        case errc::tls_pinning_failed: return "tls_pinning_failed";
        case errc::smtp_bad_reply: return "smtp_bad_reply";
        case errc::smtp_invalid_state: return "smtp_invalid_state";
        case errc::smtp_greeting_rejected: return "smtp_greeting_rejected";
        case errc::smtp_service_not_available: return "smtp_service_not_available";
        case errc::smtp_temporary_failure: return "smtp_temporary_failure";
        case errc::smtp_permanent_failure: return "smtp_permanent_failure";
        case errc::smtp_mail_from_rejected: return "smtp_mail_from_rejected";
        case errc::smtp_data_rejected: return "smtp_data_rejected";
        case errc::smtp_message_too_large: return "smtp_message_too_large";
        case errc::smtp_all_recipients_rejected: return "smtp_all_recipients_rejected";
        case errc::auth_failed: return "auth_failed";
        case errc::pool_exhausted: return "pool_exhausted";
        case errc::pool_closed: return "pool_closed";
        case errc::circuit_open: return "circuit_open";
        case errc::rate_limited: return "rate_limited";
        case errc::invalid_argument: return "invalid_argument";
        case errc::invalid_address: return "invalid_address";
        case errc::internal_error: return "internal_error";
    }
    return "unknown";
}

inline std::ostream& operator<<(std::ostream& os, errc code)
{
    return os << to_string(code);
}

/// Coarse error taxonomy used by callers and the resilience layer
enum class error_category : std::uint8_t
{
    configuration,
    network,
    protocol,
    authentication,
    recipients,
    pool,
    circuit_open,
    rate_limit,
    input,
    internal
};

[[nodiscard]] constexpr std::string_view to_string(error_category cat) noexcept
{
    switch (cat)
    {
        case error_category::configuration: return "configuration";
        case error_category::network: return "network";
        case error_category::protocol: return "protocol";
        case error_category::authentication: return "authentication";
        case error_category::recipients: return "recipients";
        case error_category::pool: return "pool";
        case error_category::circuit_open: return "circuit_open";
        case error_category::rate_limit: return "rate_limit";
        case error_category::input: return "input";
        case error_category::internal: return "internal";
    }
    return "unknown";
}

inline std::ostream& operator<<(std::ostream& os, error_category cat)
{
    return os << to_string(cat);
}

[[nodiscard]] constexpr error_category category(errc code) noexcept
{
    switch (code)
    {
        case errc::config_invalid:
        case errc::starttls_unavailable:
        case errc::auth_tls_required:
        case errc::auth_mechanism_unsupported:
            return error_category::configuration;
        case errc::auth_failed:
            return error_category::authentication;
        case errc::smtp_all_recipients_rejected:
            return error_category::recipients;
        case errc::pool_exhausted:
        case errc::pool_closed:
            return error_category::pool;
        case errc::circuit_open:
            return error_category::circuit_open;
        case errc::rate_limited:
            return error_category::rate_limit;
        case errc::invalid_argument:
        case errc::invalid_address:
            return error_category::input;
        case errc::internal_error:
            return error_category::internal;
        default:
            break;
    }
    const auto value = static_cast<std::uint16_t>(code);
    if (value >= 200 && value < 300)
        return error_category::network;
    return error_category::protocol;
}

/// Error payload carried by result<T>
struct error_info
{
    errc code = errc::internal_error;
    std::string message;
    std::string detail;
    std::error_code sys;
    int smtp_status = 0;
    std::string enhanced_status;
    /// Set once DATA was accepted; such failures must never be retried.
    bool payload_started = false;
    std::source_location where = std::source_location::current();

    [[nodiscard]] error_category kind() const noexcept { return category(code); }

    [[nodiscard]] bool is(errc c) const noexcept { return code == c; }

    [[nodiscard]] std::string to_string() const
    {
        std::string out;
        out.append("[");
        out.append(smtpxx::to_string(code));
        out.append("] ");
        out.append(message);
        if (smtp_status != 0)
        {
            out.append(" (");
            out.append(std::to_string(smtp_status));
            if (!enhanced_status.empty())
            {
                out.push_back(' ');
                out.append(enhanced_status);
            }
            out.push_back(')');
        }
        return out;
    }
};

template<typename T>
using result = std::expected<T, error_info>;

namespace detail
{

[[nodiscard]] inline std::unexpected<error_info> make_unexpected(error_info info)
{
    return std::unexpected<error_info>(std::move(info));
}

} // namespace detail

[[nodiscard]] inline error_info make_error(errc code, std::string message, std::string detail = {},
    std::error_code sys = {}, std::source_location where = std::source_location::current())
{
    error_info info;
    info.code = code;
    info.message = message.empty() ? std::string(to_string(code)) : std::move(message);
    info.detail = std::move(detail);
    info.sys = sys;
    info.where = where;
    return info;
}

[[nodiscard]] inline result<void> ok()
{
    return result<void>{};
}

template<typename T>
[[nodiscard]] result<std::decay_t<T>> ok(T&& value)
{
    return result<std::decay_t<T>>(std::forward<T>(value));
}

template<typename T = void>
[[nodiscard]] result<T> fail(error_info info)
{
    return detail::make_unexpected(std::move(info));
}

template<typename T = void>
[[nodiscard]] result<T> fail(errc code, std::string message = {}, std::string detail = {},
    std::error_code sys = {}, std::source_location where = std::source_location::current())
{
    return detail::make_unexpected(make_error(code, std::move(message), std::move(detail), sys, where));
}

/// SMTP statuses that signal a transient condition worth another attempt.
[[nodiscard]] constexpr bool is_retryable_smtp_status(int status) noexcept
{
    return status == 421 || status == 450 || status == 451 || status == 452;
}

/**
 * Whether a fresh attempt (new lease, new transaction) may succeed.
 * Failures after the payload started are terminal to avoid duplicate delivery.
 */
[[nodiscard]] inline bool is_retryable(const error_info& err) noexcept
{
    if (err.payload_started)
        return false;

    switch (err.code)
    {
        case errc::net_connect_failed:
        case errc::net_connection_refused:
        case errc::net_connection_reset:
        case errc::net_timeout:
        case errc::net_eof:
        case errc::net_io_failed:
        case errc::tls_handshake_failed:
        case errc::smtp_service_not_available:
        case errc::pool_exhausted:
        case errc::rate_limited:
            return true;
        case errc::smtp_temporary_failure:
        case errc::smtp_mail_from_rejected:
            return is_retryable_smtp_status(err.smtp_status);
        default:
            return false;
    }
}

/// Failures that reflect the destination's health and feed the circuit breaker.
[[nodiscard]] inline bool counts_toward_circuit(const error_info& err) noexcept
{
    switch (err.code)
    {
        case errc::net_connect_failed:
        case errc::net_connection_refused:
        case errc::net_connection_reset:
        case errc::net_timeout:
        case errc::net_eof:
        case errc::net_io_failed:
        case errc::tls_handshake_failed:
        case errc::smtp_service_not_available:
        case errc::pool_exhausted:
            return true;
        default:
            return false;
    }
}

} // namespace smtpxx
