/*

engine.hpp
----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_set>
#include <utility>
#include <vector>


#include <smtpxx/detail/append.hpp>
#include <smtpxx/detail/asio_decl.hpp>
#include <smtpxx/detail/error_detail.hpp>
#include <smtpxx/detail/log.hpp>
#include <smtpxx/detail/result.hpp>
#include <smtpxx/detail/sanitize.hpp>
#include <smtpxx/metrics.hpp>
#include <smtpxx/net/tls_options.hpp>
#include <smtpxx/smtp/auth.hpp>
#include <smtpxx/smtp/error_mapping.hpp>
#include <smtpxx/smtp/transport.hpp>
#include <smtpxx/smtp/types.hpp>

namespace smtpxx::smtp
{

struct engine_options
{
    /// Name announced in EHLO/HELO.
    std::string client_id = "localhost";
    net::tls_policy tls_policy = net::tls_policy::opportunistic;
    /// No AUTH when empty.
    std::shared_ptr<credential_provider> credentials;
    auth_options auth;
    /// Local ceiling on the payload size; 0 disables the check.
    std::size_t max_message_size = 10 * 1024 * 1024;
};

/// Envelope and transfer bytes of one transaction.
struct envelope
{
    std::string sender;
    std::vector<std::string> recipients;
    std::string payload;
};

struct transaction_result
{
    std::vector<std::string> accepted;
    std::vector<recipient_rejection> rejected;
    reply final_reply;
};

/**
Drives the SMTP dialogue on one transport: capability negotiation, TLS
upgrade, authentication and the MAIL / RCPT / DATA transaction.

The engine holds no connection state of its own; everything lives on the
transport so a pooled connection keeps its negotiation across leases.
**/
class engine
{
public:
    engine(transport& conn, const engine_options& opts, metrics_sink* metrics = nullptr)
        : conn_(conn),
          opts_(opts),
          metrics_(metrics)
    {
    }

    /**
    Brings a connection from `connected` to a state that can start a
    transaction. Steps already done on a reused connection are skipped.

    @return Error of the first failing step; the connection is then marked unhealthy.
    **/
    asio::awaitable<result<void>> ensure_ready()
    {
        auto res = co_await ensure_ready_impl();
        if (!res)
            conn_.mark_unhealthy();
        co_return res;
    }

    /// EHLO, falling back to HELO when the server does not know EHLO.
    asio::awaitable<result<void>> greet()
    {
        if (!can_greet(conn_.state()))
            co_return invalid_state("EHLO");

        std::string cmd;
        detail::append_sv(cmd, "EHLO ");
        detail::append_sv(cmd, opts_.client_id);
        auto rep = co_await conn_.send_command(cmd);
        if (!rep)
            co_return fail(std::move(rep).error());

        if (rep->status == 250)
        {
            conn_.set_capabilities(capabilities::from_ehlo(*rep));
            const auto& caps = conn_.caps();
            SMTPXX_DEBUG("SMTP", "EHLO accepted by " + conn_.host() + ", "
                + std::to_string(rep->lines.size() > 0 ? rep->lines.size() - 1 : 0) + " extension(s)"
                + (caps.pipelining() ? ", pipelining" : "")
                + (caps.enhanced_status_codes() ? ", enhanced status codes" : ""));
        }
        else if (allows_helo_fallback(rep->status))
        {
            SMTPXX_DEBUG("SMTP", "EHLO refused with " + std::to_string(rep->status) + ", falling back to HELO");
            cmd.clear();
            detail::append_sv(cmd, "HELO ");
            detail::append_sv(cmd, opts_.client_id);
            auto helo = co_await conn_.send_command(cmd);
            if (!helo)
                co_return fail(std::move(helo).error());
            if (helo->status != 250)
                co_return fail(make_smtp_error(command_kind::helo, *helo, conn_.host(), cmd));
            conn_.set_capabilities(capabilities::helo_only(*helo));
        }
        else
        {
            co_return fail(make_smtp_error(command_kind::ehlo, *rep, conn_.host(), cmd));
        }

        if (conn_.state() == transaction_state::connected)
            conn_.set_state(transaction_state::greeted);
        co_return ok();
    }

    /**
    STARTTLS according to the configured policy. After the handshake the
    capabilities are discarded and EHLO is sent again.
    **/
    asio::awaitable<result<void>> start_tls()
    {
        const auto policy = opts_.tls_policy;
        if (policy == net::tls_policy::none || policy == net::tls_policy::implicit || conn_.is_tls())
            co_return ok();
        if (!can_starttls(conn_.state()))
            co_return invalid_state("STARTTLS");

        if (!conn_.caps().starttls())
        {
            if (policy == net::tls_policy::required)
                co_return fail(errc::starttls_unavailable, "STARTTLS required but not advertised.",
                    detail::error_detail().add("host", conn_.host())
                        .add_bool("helo_only", conn_.caps().is_helo_only()).str());
            SMTPXX_DEBUG("SMTP", "STARTTLS not advertised by " + conn_.host() + ", staying in plaintext");
            co_return ok();
        }

        auto rep = co_await conn_.send_command("STARTTLS");
        if (!rep)
            co_return fail(std::move(rep).error());
        if (rep->status != 220)
        {
            if (policy == net::tls_policy::required)
                co_return fail(make_smtp_error(command_kind::starttls, *rep, conn_.host(), "STARTTLS"));
            SMTPXX_WARN("SMTP", "STARTTLS refused by " + conn_.host() + " (" + rep->to_string()
                + "), continuing without encryption");
            co_return ok();
        }

        auto upgraded = co_await conn_.upgrade_tls();
        if (!upgraded)
            co_return upgraded;
        detail::notify(metrics_, [](metrics_sink& sink) { sink.on_tls_upgrade(); });

        conn_.reset_capabilities();
        conn_.set_state(transaction_state::tls_established);
        co_return co_await greet();
    }

    /// AUTH with the configured credential provider; a no-op without one.
    asio::awaitable<result<void>> authenticate()
    {
        if (!opts_.credentials || conn_.state() == transaction_state::authenticated)
            co_return ok();
        if (!can_authenticate(conn_.state()))
            co_return invalid_state("AUTH");

        authenticator auth(conn_, opts_.auth);
        auto mech = co_await auth.authenticate(*opts_.credentials);
        if (auto tried = auth.last_mechanism())
        {
            const bool success = mech.has_value();
            detail::notify(metrics_, [&](metrics_sink& sink) { sink.on_auth_attempt(to_string(*tried), success); });
        }
        if (!mech)
            co_return fail(std::move(mech).error());

        conn_.set_state(transaction_state::authenticated);
        SMTPXX_DEBUG("SMTP", "authenticated as " + conn_.authenticated_user() + " using "
            + std::string(to_string(*mech)));
        co_return ok();
    }

    /**
    Runs MAIL FROM, one RCPT TO per distinct recipient, then DATA.

    Per-recipient rejections are reported in the result, not as errors.
    Once DATA is accepted any failure carries payload_started.
    **/
    asio::awaitable<result<transaction_result>> run_transaction(const envelope& env)
    {
        if (!can_mail_from(conn_.state()))
            co_return invalid_state_for<transaction_result>("MAIL FROM");
        if (env.recipients.empty())
            co_return fail<transaction_result>(errc::invalid_argument, "No recipients.");
        if (auto valid = detail::ensure_no_crlf_or_nul(env.sender, "sender"); !valid)
            co_return fail<transaction_result>(std::move(valid).error());
        for (const auto& rcpt : env.recipients)
        {
            if (auto valid = detail::ensure_no_crlf_or_nul(rcpt, "recipient"); !valid)
                co_return fail<transaction_result>(std::move(valid).error());
        }

        const auto& caps = conn_.caps();
        const std::size_t size = env.payload.size();
        if (opts_.max_message_size > 0 && size > opts_.max_message_size)
            co_return too_large(size, opts_.max_message_size, "max_message_size");
        if (auto limit = caps.max_size(); limit && *limit > 0 && size > *limit)
            co_return too_large(size, static_cast<std::size_t>(*limit), "server SIZE");

        std::string cmd;
        detail::append_sv(cmd, "MAIL FROM:");
        detail::append_angle_addr(cmd, env.sender);
        if (caps.max_size())
            detail::append_param(cmd, "SIZE", std::to_string(size));
        if (caps.eight_bit_mime() && contains_8bit(env.payload))
            detail::append_param(cmd, "BODY", "8BITMIME");
        if (caps.smtputf8() && envelope_needs_utf8(env))
            detail::append_param(cmd, "SMTPUTF8", {});

        auto rep = co_await conn_.send_command(cmd);
        if (!rep)
            co_return fail<transaction_result>(std::move(rep).error());
        if (!rep->is_positive_completion())
            co_return fail<transaction_result>(refused(command_kind::mail_from, *rep, cmd));
        conn_.set_state(transaction_state::in_transaction);

        transaction_result out;
        std::unordered_set<std::string> seen;
        for (const auto& rcpt : env.recipients)
        {
            if (!seen.insert(mailbox_key(rcpt)).second)
                continue;
            if (!can_rcpt_to(conn_.state()))
                co_return invalid_state_for<transaction_result>("RCPT TO");

            cmd.clear();
            detail::append_sv(cmd, "RCPT TO:");
            detail::append_angle_addr(cmd, rcpt);
            rep = co_await conn_.send_command(cmd);
            if (!rep)
                co_return fail<transaction_result>(std::move(rep).error());
            if (rep->status == 421)
                co_return fail<transaction_result>(refused(command_kind::rcpt_to, *rep, cmd));
            if (rep->is_positive_completion())
            {
                out.accepted.push_back(rcpt);
                conn_.set_state(transaction_state::recipients_added);
            }
            else
            {
                SMTPXX_DEBUG("SMTP", "recipient " + rcpt + " rejected: " + rep->to_string());
                out.rejected.push_back(recipient_rejection{rcpt, rep->status, rep->message()});
            }
        }

        if (out.accepted.empty())
        {
            auto rset = co_await reset();
            if (!rset)
                conn_.mark_unhealthy();
            detail::error_detail rejected;
            for (const auto& r : out.rejected)
                rejected.add(r.address, std::to_string(r.status) + " " + r.message);
            error_info err = make_error(errc::smtp_all_recipients_rejected, "All recipients were rejected.",
                rejected.str());
            err.smtp_status = out.rejected.back().status;
            co_return fail<transaction_result>(std::move(err));
        }

        if (!can_data(conn_.state()))
            co_return invalid_state_for<transaction_result>("DATA");
        rep = co_await conn_.send_command("DATA");
        if (!rep)
            co_return fail<transaction_result>(std::move(rep).error());
        if (rep->status != 354)
        {
            error_info err = refused(command_kind::data_cmd, *rep, "DATA");
            if (!conn_.healthy())
                co_return fail<transaction_result>(std::move(err));
            auto rset = co_await reset();
            if (!rset)
                conn_.mark_unhealthy();
            co_return fail<transaction_result>(std::move(err));
        }
        conn_.set_state(transaction_state::sending_data);

        auto sent = co_await conn_.send_payload(prepare_payload(env.payload));
        if (!sent)
            co_return payload_failure(std::move(sent).error());

        rep = co_await conn_.read_reply();
        if (!rep)
            co_return payload_failure(std::move(rep).error());
        if (!rep->is_positive_completion())
        {
            // The server discards the transaction after its final reply.
            conn_.restore_stable_state();
            co_return payload_failure(refused(command_kind::data_body, *rep));
        }

        conn_.set_state(transaction_state::complete);
        conn_.restore_stable_state();
        out.final_reply = std::move(*rep);
        co_return out;
    }

    /// RSET; on 250 the connection goes back to its last stable state.
    asio::awaitable<result<void>> reset()
    {
        if (!can_reset(conn_.state()))
            co_return invalid_state("RSET");
        auto rep = co_await conn_.send_command("RSET");
        if (!rep)
            co_return fail(std::move(rep).error());
        if (rep->status != 250)
            co_return fail(make_smtp_error(command_kind::rset, *rep, conn_.host(), "RSET"));
        conn_.restore_stable_state();
        co_return ok();
    }

    asio::awaitable<result<reply>> noop()
    {
        if (conn_.state() == transaction_state::closed)
            co_return fail<reply>(errc::smtp_invalid_state, "Connection is closed.");
        auto rep = co_await conn_.send_command("NOOP");
        if (!rep)
            co_return rep;
        if (rep->status != 250)
            co_return fail<reply>(make_smtp_error(command_kind::noop, *rep, conn_.host(), "NOOP"));
        co_return rep;
    }

    /**
    Wire form of a payload: line endings normalized to CRLF, lines starting
    with a dot doubled, and the end-of-data marker appended.
    **/
    [[nodiscard]] static std::string prepare_payload(std::string_view data)
    {
        std::string out;
        out.reserve(data.size() + data.size() / 64 + 5);
        bool line_start = true;
        for (std::size_t i = 0; i < data.size(); ++i)
        {
            const char ch = data[i];
            if (ch == '\r' || ch == '\n')
            {
                if (ch == '\r' && i + 1 < data.size() && data[i + 1] == '\n')
                    ++i;
                detail::append_crlf(out);
                line_start = true;
                continue;
            }
            if (line_start && ch == '.')
                out.push_back('.');
            out.push_back(ch);
            line_start = false;
        }

        if (out.size() >= 2 && out[out.size() - 2] == '\r' && out[out.size() - 1] == '\n')
            out += ".\r\n";
        else
            out += "\r\n.\r\n";
        return out;
    }

    [[nodiscard]] static bool contains_8bit(std::string_view data) noexcept
    {
        for (unsigned char ch : data)
        {
            if (ch > 127)
                return true;
        }
        return false;
    }

private:
    asio::awaitable<result<void>> ensure_ready_impl()
    {
        switch (conn_.state())
        {
            case transaction_state::closed:
            case transaction_state::initial:
                co_return invalid_state("EHLO");
            case transaction_state::in_transaction:
            case transaction_state::recipients_added:
            case transaction_state::sending_data:
                co_return invalid_state("MAIL FROM");
            default:
                break;
        }

        if (conn_.state() == transaction_state::connected)
        {
            auto greeted = co_await greet();
            if (!greeted)
                co_return greeted;
        }
        if (conn_.state() == transaction_state::greeted)
        {
            auto tls = co_await start_tls();
            if (!tls)
                co_return tls;
        }
        co_return co_await authenticate();
    }

    static bool allows_helo_fallback(int status) noexcept
    {
        return status == 500 || status == 502 || status == 504;
    }

    static bool envelope_needs_utf8(const envelope& env) noexcept
    {
        if (contains_8bit(env.sender))
            return true;
        for (const auto& rcpt : env.recipients)
        {
            if (contains_8bit(rcpt))
                return true;
        }
        return false;
    }

    result<void> invalid_state(std::string_view command) const
    {
        return invalid_state_for<void>(command);
    }

    template<class T>
    result<T> invalid_state_for(std::string_view command) const
    {
        std::string message(command);
        message += " not allowed in state ";
        message += to_string(conn_.state());
        return fail<T>(errc::smtp_invalid_state, std::move(message),
            detail::error_detail().add("host", conn_.host()).add("state", to_string(conn_.state())).str());
    }

    static result<transaction_result> too_large(std::size_t size, std::size_t limit, std::string_view source)
    {
        return fail<transaction_result>(errc::smtp_message_too_large, "Message exceeds the size limit.",
            detail::error_detail().add_int("size", size).add_int("limit", limit).add("limit.source", source).str());
    }

    /// A 421 means the server is closing the channel; the connection is not reused.
    error_info refused(command_kind kind, const reply& rep, std::string_view cmd = {})
    {
        if (rep.status == 421)
            conn_.mark_unhealthy();
        return make_smtp_error(kind, rep, conn_.host(), cmd);
    }

    result<transaction_result> payload_failure(error_info err)
    {
        err.payload_started = true;
        if (is_mid_transaction(conn_.state()))
            conn_.mark_unhealthy();
        return fail<transaction_result>(std::move(err));
    }

    transport& conn_;
    const engine_options& opts_;
    metrics_sink* metrics_;
};

} // namespace smtpxx::smtp
