/*

memory_transport.hpp
--------------------

Scripted in-process SMTP peer. Lets the engine, pool and client run without a
socket: replies follow a small server model configured through memory_server,
and every command and payload is recorded for inspection.

*/

#pragma once

#include <cctype>
#include <deque>
#include <functional>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <boost/algorithm/string/case_conv.hpp>

#include <smtpxx/codec/base64.hpp>
#include <smtpxx/detail/asio_decl.hpp>
#include <smtpxx/detail/result.hpp>
#include <smtpxx/smtp/error_mapping.hpp>
#include <smtpxx/smtp/transport.hpp>
#include <smtpxx/smtp/types.hpp>

namespace smtpxx::smtp
{

/// Behaviour and recordings shared by every memory_transport opened against it.
struct memory_server
{
    std::string host = "mock.example";
    std::uint16_t port = 587;

    reply greeting{220, {"mock.example ESMTP ready"}};
    /// Extension lines of the EHLO reply, after the greeting line.
    std::vector<std::string> ehlo_extensions{"PIPELINING", "SIZE 10485760", "8BITMIME", "STARTTLS",
        "ENHANCEDSTATUSCODES", "AUTH PLAIN LOGIN"};
    /// Extension lines advertised once TLS is active; falls back to ehlo_extensions when empty.
    std::vector<std::string> ehlo_extensions_tls;
    bool ehlo_supported = true;
    reply helo_reply{250, {"mock.example"}};
    reply starttls_reply{220, {"2.0.0 Ready to start TLS"}};
    bool tls_handshake_fails = false;

    /// Outcome of successive AUTH exchanges; `auth_accept` once exhausted.
    std::deque<bool> auth_outcomes;
    bool auth_accept = true;
    std::string cram_md5_challenge = "<1896.697170952@postoffice.reston.mci.com>";

    reply mail_from_reply{250, {"2.1.0 Ok"}};
    /// Lower-case addresses refused at RCPT TO.
    std::set<std::string> rejected_recipients;
    reply rcpt_reject_reply{550, {"5.1.1 User unknown"}};
    reply data_reply{354, {"End data with <CR><LF>.<CR><LF>"}};
    reply final_reply{250, {"2.0.0 Ok: queued as 4F2A9C"}};
    reply noop_reply{250, {"2.0.0 Ok"}};

    /// Consulted before the built-in model; returning a reply overrides it.
    std::function<std::optional<reply>(const std::string& command)> handler;
    /// Fails the connect attempt when set.
    std::function<std::optional<error_info>()> connect_failure;
    /// Fails a command (or "<payload>") at the I/O level when it returns an error.
    std::function<std::optional<error_info>(const std::string& command)> io_failure;

    std::vector<std::string> commands;
    std::vector<std::string> payloads;
    std::size_t connects = 0;
    std::size_t tls_upgrades = 0;
    std::size_t closes = 0;

    [[nodiscard]] std::size_t count(std::string_view prefix) const
    {
        std::size_t n = 0;
        for (const auto& cmd : commands)
        {
            if (cmd.compare(0, prefix.size(), prefix) == 0)
                ++n;
        }
        return n;
    }
};

/**
Transport bound to a memory_server. Intended for single-threaded io_context use.
**/
class memory_transport final : public transport
{
public:
    explicit memory_transport(std::shared_ptr<memory_server> server)
        : transport(server->host, server->port),
          server_(std::move(server))
    {
    }

    /// Counterpart of asio_transport::connect: "reads" the greeting.
    static asio::awaitable<result<std::unique_ptr<transport>>> connect(std::shared_ptr<memory_server> server)
    {
        using ptr_t = std::unique_ptr<transport>;
        if (server->connect_failure)
        {
            if (auto err = server->connect_failure())
                co_return fail<ptr_t>(std::move(*err));
        }
        ++server->connects;

        auto conn = std::make_unique<memory_transport>(server);
        if (server->greeting.status != 220)
            co_return fail<ptr_t>(make_smtp_error(command_kind::greeting, server->greeting, server->host));
        conn->set_banner(server->greeting.lines.empty() ? std::string() : server->greeting.lines.front());
        conn->set_state(transaction_state::connected);
        co_return ptr_t(std::move(conn));
    }

    asio::awaitable<result<reply>> send_command(std::string line) override
    {
        if (state() == transaction_state::closed)
            co_return fail<reply>(errc::smtp_invalid_state, "Connection is closed.");
        server_->commands.push_back(line);
        if (auto err = injected_failure(line))
            co_return fail<reply>(std::move(*err));
        co_return respond(line);
    }

    asio::awaitable<result<void>> send_payload(std::string_view data) override
    {
        if (state() == transaction_state::closed)
            co_return fail(errc::smtp_invalid_state, "Connection is closed.");
        server_->payloads.emplace_back(data);
        if (auto err = injected_failure("<payload>"))
            co_return fail(std::move(*err));
        pending_.push_back(server_->final_reply);
        co_return ok();
    }

    asio::awaitable<result<reply>> read_reply() override
    {
        if (pending_.empty())
        {
            mark_unhealthy();
            co_return fail<reply>(errc::net_eof, "No reply pending.");
        }
        reply rep = std::move(pending_.front());
        pending_.pop_front();
        co_return rep;
    }

    asio::awaitable<result<void>> upgrade_tls() override
    {
        if (tls_)
            co_return ok();
        if (server_->tls_handshake_fails)
        {
            mark_unhealthy();
            co_return fail(errc::tls_handshake_failed, "TLS handshake failed.");
        }
        ++server_->tls_upgrades;
        tls_ = true;
        co_return ok();
    }

    asio::awaitable<void> close() override
    {
        if (state() == transaction_state::closed)
            co_return;
        if (healthy())
            server_->commands.push_back("QUIT");
        ++server_->closes;
        mark_unhealthy();
        set_state(transaction_state::closed);
    }

    [[nodiscard]] bool is_tls() const noexcept override { return tls_; }
    [[nodiscard]] std::string tls_version() const override { return tls_ ? "TLSv1.3" : std::string(); }

private:
    enum class auth_step
    {
        none,
        login_user,
        login_password,
        cram_md5,
        oauth_error
    };

    std::optional<error_info> injected_failure(const std::string& command)
    {
        if (!server_->io_failure)
            return std::nullopt;
        auto err = server_->io_failure(command);
        if (err)
            mark_unhealthy();
        return err;
    }

    bool next_auth_outcome()
    {
        if (server_->auth_outcomes.empty())
            return server_->auth_accept;
        const bool outcome = server_->auth_outcomes.front();
        server_->auth_outcomes.pop_front();
        return outcome;
    }

    reply auth_final()
    {
        if (next_auth_outcome())
            return reply{235, {"2.7.0 Authentication successful"}};
        return reply{535, {"5.7.8 Authentication credentials invalid"}};
    }

    reply respond(const std::string& line)
    {
        if (server_->handler)
        {
            if (auto custom = server_->handler(line))
                return *custom;
        }

        if (step_ != auth_step::none)
            return continue_auth(line);

        const auto space = line.find(' ');
        const std::string verb = boost::algorithm::to_upper_copy(line.substr(0, space));
        const std::string arg = space == std::string::npos ? std::string() : line.substr(space + 1);

        if (verb == "EHLO")
        {
            if (!server_->ehlo_supported)
                return reply{502, {"5.5.2 Command not recognized"}};
            reply rep{250, {server_->host + " Hello " + arg}};
            const auto& ext = tls_ && !server_->ehlo_extensions_tls.empty()
                ? server_->ehlo_extensions_tls : server_->ehlo_extensions;
            rep.lines.insert(rep.lines.end(), ext.begin(), ext.end());
            return rep;
        }
        if (verb == "HELO")
            return server_->helo_reply;
        if (verb == "STARTTLS")
            return server_->starttls_reply;
        if (verb == "AUTH")
            return start_auth(arg);
        if (verb == "MAIL")
            return server_->mail_from_reply;
        if (verb == "RCPT")
            return rcpt(arg);
        if (verb == "DATA")
            return server_->data_reply;
        if (verb == "RSET")
            return reply{250, {"2.0.0 Ok"}};
        if (verb == "NOOP")
            return server_->noop_reply;
        if (verb == "QUIT")
            return reply{221, {"2.0.0 Bye"}};
        return reply{502, {"5.5.2 Command not recognized"}};
    }

    reply start_auth(const std::string& arg)
    {
        const auto space = arg.find(' ');
        const std::string mech = boost::algorithm::to_upper_copy(arg.substr(0, space));
        const bool initial_response = space != std::string::npos;

        if (mech == "LOGIN")
        {
            step_ = auth_step::login_user;
            return reply{334, {"VXNlcm5hbWU6"}};
        }
        if (mech == "CRAM-MD5")
        {
            step_ = auth_step::cram_md5;
            return reply{334, {base64::encode(server_->cram_md5_challenge)}};
        }
        if (mech == "PLAIN")
        {
            if (!initial_response)
                return reply{334, {""}};
            return auth_final();
        }
        if (mech == "XOAUTH2" || mech == "OAUTHBEARER")
        {
            if (next_auth_outcome())
                return reply{235, {"2.7.0 Accepted"}};
            step_ = auth_step::oauth_error;
            return reply{334, {"eyJzdGF0dXMiOiI0MDEiLCJzY2hlbWVzIjoiYmVhcmVyIn0="}};
        }
        return reply{504, {"5.5.4 Unrecognized authentication type"}};
    }

    reply continue_auth(const std::string& line)
    {
        const auth_step step = step_;
        step_ = auth_step::none;
        if (line == "*")
            return reply{501, {"5.7.0 Authentication aborted"}};

        switch (step)
        {
            case auth_step::login_user:
                step_ = auth_step::login_password;
                return reply{334, {"UGFzc3dvcmQ6"}};
            case auth_step::login_password:
            case auth_step::cram_md5:
                return auth_final();
            case auth_step::oauth_error:
                return reply{535, {"5.7.8 Username and Password not accepted"}};
            case auth_step::none:
                break;
        }
        return reply{503, {"5.5.1 Bad sequence of commands"}};
    }

    reply rcpt(const std::string& arg)
    {
        const auto open = arg.find('<');
        const auto close = arg.find('>', open == std::string::npos ? 0 : open);
        std::string address = (open != std::string::npos && close != std::string::npos)
            ? arg.substr(open + 1, close - open - 1) : arg;
        boost::algorithm::to_lower(address);
        if (server_->rejected_recipients.count(address) != 0)
            return server_->rcpt_reject_reply;
        return reply{250, {"2.1.5 Ok"}};
    }

    std::shared_ptr<memory_server> server_;
    std::deque<reply> pending_;
    auth_step step_{auth_step::none};
    bool tls_{false};
};

} // namespace smtpxx::smtp
