/*

client_config.hpp
-----------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

#include <smtpxx/detail/asio_decl.hpp>
#include <smtpxx/detail/error_detail.hpp>
#include <smtpxx/detail/result.hpp>
#include <smtpxx/detail/sanitize.hpp>
#include <smtpxx/net/dialog.hpp>
#include <smtpxx/net/tls_options.hpp>
#include <smtpxx/pool/pool_config.hpp>
#include <smtpxx/resilience/circuit_breaker.hpp>
#include <smtpxx/resilience/rate_limiter.hpp>
#include <smtpxx/resilience/retry.hpp>
#include <smtpxx/smtp/auth.hpp>

namespace smtpxx
{

/**
 * Everything a client needs to reach and use one submission server.
 * Copied by the client at construction; later changes have no effect.
 */
struct client_config
{
    std::string host;
    std::uint16_t port = 587;
    net::tls_policy tls_policy = net::tls_policy::opportunistic;
    net::tls_options tls;

    /// No AUTH when empty.
    std::shared_ptr<smtp::credential_provider> credentials;
    /// Pinned mechanism and cleartext policy.
    smtp::auth_options auth;

    std::chrono::steady_clock::duration connect_timeout = std::chrono::seconds{30};
    std::chrono::steady_clock::duration command_timeout = std::chrono::seconds{60};
    std::size_t max_message_size = 10 * 1024 * 1024;
    std::size_t max_line_length = net::DEFAULT_MAX_LINE_LENGTH;
    bool redact_secrets_in_trace = true;

    pool::pool_config pool;
    resilience::retry_policy retry;
    resilience::circuit_breaker_config circuit_breaker;
    resilience::rate_limit_config rate_limit;

    /// EHLO name; the local host name is used when empty.
    std::string client_id = "localhost";

    /**
     * Password login on the submission port with STARTTLS required.
     */
    static client_config submission(std::string host, std::string username, std::string password)
    {
        client_config cfg;
        cfg.host = std::move(host);
        cfg.port = 587;
        cfg.tls_policy = net::tls_policy::required;
        cfg.credentials = std::make_shared<smtp::static_credentials>(
            smtp::password_credentials{std::move(username), std::move(password), {}});
        return cfg;
    }

    [[nodiscard]] result<void> validate() const
    {
        if (host.empty())
            return fail(errc::config_invalid, "SMTP host is empty.");
        if (auto valid = detail::ensure_no_crlf_or_nul(host, "host"); !valid)
            return fail(errc::config_invalid, valid.error().message);
        if (port == 0)
            return fail(errc::config_invalid, "SMTP port must not be 0.");
        if (auto valid = detail::ensure_no_crlf_or_nul(client_id, "client_id");
            !valid || client_id.find(' ') != std::string::npos)
            return fail(errc::config_invalid, "client_id must be a single token.");
        if (connect_timeout <= std::chrono::steady_clock::duration::zero()
            || command_timeout <= std::chrono::steady_clock::duration::zero())
            return fail(errc::config_invalid, "Timeouts must be positive.");

        if (tls_policy != net::tls_policy::none)
        {
            if (auto valid = tls.validate(); !valid)
                return valid;
        }
        if (auto valid = pool.validate(); !valid)
            return valid;

        if (retry.enabled)
        {
            if (retry.max_attempts == 0)
                return fail(errc::config_invalid, "retry.max_attempts must be at least 1.");
            if (retry.multiplier < 1.0)
                return fail(errc::config_invalid, "retry.multiplier must be at least 1.0.");
            if (retry.initial_delay > retry.max_delay)
                return fail(errc::config_invalid, "retry.initial_delay exceeds retry.max_delay.",
                    detail::error_detail().add_ms("initial_delay", retry.initial_delay)
                        .add_ms("max_delay", retry.max_delay).str());
        }

        if (circuit_breaker.enabled
            && (circuit_breaker.failure_threshold == 0 || circuit_breaker.success_threshold == 0
                || circuit_breaker.half_open_max_calls == 0))
            return fail(errc::config_invalid, "Circuit breaker thresholds must be at least 1.");

        if (rate_limit.enabled)
        {
            if (!rate_limit.max_operations && !rate_limit.max_concurrent)
                return fail(errc::config_invalid, "Rate limiting enabled without any limit.");
            if (rate_limit.max_operations && (*rate_limit.max_operations == 0
                || rate_limit.window <= std::chrono::steady_clock::duration::zero()))
                return fail(errc::config_invalid, "rate_limit.max_operations and window must be positive.");
            if (rate_limit.max_concurrent && *rate_limit.max_concurrent == 0)
                return fail(errc::config_invalid, "rate_limit.max_concurrent must be at least 1.");
        }
        return ok();
    }

    /// client_id, else the local host name, else "localhost".
    [[nodiscard]] std::string effective_client_id() const
    {
        if (!client_id.empty())
            return client_id;
        asio::error_code ec;
        std::string name = asio::ip::host_name(ec);
        if (ec || name.empty())
            return "localhost";
        return name;
    }
};

} // namespace smtpxx
