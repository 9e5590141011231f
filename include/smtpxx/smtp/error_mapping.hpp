/*

error_mapping.hpp
-----------------

Centralized mapping between SMTP reply codes and smtpxx::errc.

*/

#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include <smtpxx/detail/error_detail.hpp>
#include <smtpxx/detail/result.hpp>
#include <smtpxx/smtp/types.hpp>

namespace smtpxx::smtp
{

enum class command_kind
{
    greeting,
    ehlo,
    helo,
    starttls,
    auth,
    mail_from,
    rcpt_to,
    data_cmd,
    data_body,
    rset,
    noop,
    quit,
    other
};

[[nodiscard]] constexpr std::string_view command_name(command_kind k) noexcept
{
    switch (k)
    {
        case command_kind::greeting: return "greeting";
        case command_kind::ehlo: return "ehlo";
        case command_kind::helo: return "helo";
        case command_kind::starttls: return "starttls";
        case command_kind::auth: return "auth";
        case command_kind::mail_from: return "mail_from";
        case command_kind::rcpt_to: return "rcpt_to";
        case command_kind::data_cmd: return "data_cmd";
        case command_kind::data_body: return "data_body";
        case command_kind::rset: return "rset";
        case command_kind::noop: return "noop";
        case command_kind::quit: return "quit";
        case command_kind::other: return "other";
    }
    return "other";
}

[[nodiscard]] constexpr bool is_temporary(int code) noexcept
{
    return code >= 400 && code < 500;
}

[[nodiscard]] constexpr bool is_permanent(int code) noexcept
{
    return code >= 500 && code < 600;
}

[[nodiscard]] constexpr errc map_smtp_reply(command_kind k, int code) noexcept
{
    if (code == 421)
        return errc::smtp_service_not_available;

    switch (k)
    {
        case command_kind::greeting:
        case command_kind::ehlo:
        case command_kind::helo:
            if (is_temporary(code) || is_permanent(code))
                return errc::smtp_greeting_rejected;
            break;
        case command_kind::starttls:
            if (is_temporary(code) || is_permanent(code))
                return errc::starttls_unavailable;
            break;
        case command_kind::auth:
            if (is_temporary(code) || is_permanent(code))
                return errc::auth_failed;
            break;
        case command_kind::mail_from:
            if (code == 552)
                return errc::smtp_message_too_large;
            if (is_temporary(code) || is_permanent(code))
                return errc::smtp_mail_from_rejected;
            break;
        case command_kind::data_cmd:
            if (code != 354)
                return errc::smtp_data_rejected;
            break;
        case command_kind::data_body:
            if (code == 552)
                return errc::smtp_message_too_large;
            if (is_temporary(code) || is_permanent(code))
                return errc::smtp_data_rejected;
            break;
        default:
            break;
    }

    if (is_temporary(code))
        return errc::smtp_temporary_failure;
    if (is_permanent(code))
        return errc::smtp_permanent_failure;

    return errc::smtp_bad_reply;
}

[[nodiscard]] inline detail::error_detail make_smtp_detail(
    std::string_view host,
    command_kind k,
    std::string_view cmd_line,
    const reply& r)
{
    detail::error_detail out;
    out.add("proto", "SMTP");
    out.add("host", host);
    out.add("command", command_name(k));
    if (!cmd_line.empty())
        out.add("command.line", detail::redact_line(cmd_line));
    out.add_int("reply.code", static_cast<std::uint64_t>(r.status));
    out.add_lines("reply.line", r.lines);
    return out;
}

/**
 * Error for an unexpected reply. Carries the SMTP status and enhanced status
 * so the resilience layer can judge whether another attempt makes sense.
 */
[[nodiscard]] inline error_info make_smtp_error(command_kind k, const reply& r,
    std::string_view host = {}, std::string_view cmd_line = {})
{
    std::string message(command_name(k));
    message += " rejected: ";
    message += r.to_string();

    error_info err = make_error(map_smtp_reply(k, r.status), std::move(message),
        make_smtp_detail(host, k, cmd_line, r).str());
    err.smtp_status = r.status;
    if (auto enhanced = enhanced_status::find(r))
        err.enhanced_status = enhanced->to_string();
    return err;
}

} // namespace smtpxx::smtp
