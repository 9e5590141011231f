/*

transport.hpp
-------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

#include <smtpxx/detail/asio_decl.hpp>
#include <smtpxx/detail/result.hpp>
#include <smtpxx/smtp/types.hpp>

namespace smtpxx::smtp
{

/**
 * One SMTP connection, plaintext or encrypted.
 *
 * A transport moves commands and replies; it does not decide what to send.
 * The negotiated capabilities and the transaction state live here so they
 * survive between transactions run on a pooled connection.
 */
class transport
{
public:
    using clock = std::chrono::steady_clock;

    transport(std::string host, std::uint16_t port)
        : host_(std::move(host)),
          port_(port),
          created_at_(clock::now()),
          idle_since_(created_at_)
    {
    }

    virtual ~transport() = default;

    transport(const transport&) = delete;
    transport& operator=(const transport&) = delete;

    /// Writes one command line and reads its (possibly multi-line) reply.
    virtual asio::awaitable<result<reply>> send_command(std::string line) = 0;

    /// Writes message bytes verbatim; the caller applies dot-stuffing and the terminator.
    virtual asio::awaitable<result<void>> send_payload(std::string_view data) = 0;

    virtual asio::awaitable<result<reply>> read_reply() = 0;

    /// Runs the TLS handshake on the existing connection (after a 220 to STARTTLS).
    virtual asio::awaitable<result<void>> upgrade_tls() = 0;

    /// Sends QUIT when possible and drops the connection. Never fails.
    virtual asio::awaitable<void> close() = 0;

    [[nodiscard]] virtual bool is_tls() const noexcept = 0;
    [[nodiscard]] virtual std::string tls_version() const = 0;

    [[nodiscard]] const std::string& host() const noexcept { return host_; }
    [[nodiscard]] std::uint16_t port() const noexcept { return port_; }

    [[nodiscard]] const capabilities& caps() const noexcept { return capabilities_; }
    [[nodiscard]] bool capabilities_known() const noexcept { return capabilities_known_; }

    void set_capabilities(capabilities caps)
    {
        capabilities_ = std::move(caps);
        capabilities_known_ = true;
    }

    void reset_capabilities()
    {
        capabilities_ = capabilities{};
        capabilities_known_ = false;
    }

    [[nodiscard]] transaction_state state() const noexcept { return state_; }

    /// Latest state in which no transaction was open.
    [[nodiscard]] transaction_state stable_state() const noexcept { return stable_state_; }

    void set_state(transaction_state state) noexcept
    {
        state_ = state;
        if (is_stable(state))
            stable_state_ = state;
    }

    void restore_stable_state() noexcept
    {
        state_ = stable_state_;
    }

    [[nodiscard]] const std::string& banner() const noexcept { return banner_; }

    [[nodiscard]] const std::string& authenticated_user() const noexcept { return authenticated_user_; }
    void set_authenticated_user(std::string user) { authenticated_user_ = std::move(user); }

    [[nodiscard]] bool healthy() const noexcept { return healthy_ && state_ != transaction_state::closed; }
    void mark_unhealthy() noexcept { healthy_ = false; }

    [[nodiscard]] clock::time_point created_at() const noexcept { return created_at_; }
    /// Start of the current idle period, reset when a lease hands the connection back.
    /// Health probes go through send_command() and leave it alone.
    [[nodiscard]] clock::time_point idle_since() const noexcept { return idle_since_; }
    void mark_idle() noexcept { idle_since_ = clock::now(); }

protected:
    void set_banner(std::string banner) { banner_ = std::move(banner); }

private:
    std::string host_;
    std::uint16_t port_;
    capabilities capabilities_;
    bool capabilities_known_{false};
    transaction_state state_{transaction_state::initial};
    transaction_state stable_state_{transaction_state::initial};
    std::string banner_;
    std::string authenticated_user_;
    bool healthy_{true};
    clock::time_point created_at_;
    clock::time_point idle_since_;
};

} // namespace smtpxx::smtp
