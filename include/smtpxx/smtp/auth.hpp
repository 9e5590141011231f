/*

auth.hpp
--------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include <boost/algorithm/string/predicate.hpp>

#include <smtpxx/detail/asio_decl.hpp>
#include <smtpxx/detail/log.hpp>
#include <smtpxx/detail/result.hpp>
#include <smtpxx/detail/sanitize.hpp>
#include <smtpxx/detail/sasl.hpp>
#include <smtpxx/oauth2/token_source.hpp>
#include <smtpxx/smtp/error_mapping.hpp>
#include <smtpxx/smtp/transport.hpp>
#include <smtpxx/smtp/types.hpp>

namespace smtpxx::smtp
{

struct password_credentials
{
    std::string username;
    std::string password;
    std::string authzid;
};

struct oauth2_credentials
{
    std::string username;
    std::string access_token;
};

struct bearer_credentials
{
    std::string token;
};

using credentials = std::variant<password_credentials, oauth2_credentials, bearer_credentials>;

/// Identity the credentials authenticate as; empty for bare bearer tokens.
[[nodiscard]] inline std::string username_of(const credentials& creds)
{
    return std::visit([](const auto& c) -> std::string
    {
        using T = std::decay_t<decltype(c)>;
        if constexpr (std::is_same_v<T, bearer_credentials>)
            return std::string();
        else
            return c.username;
    }, creds);
}

/// Loggable rendering; secrets are never included.
[[nodiscard]] inline std::string to_string(const credentials& creds)
{
    return std::visit([](const auto& c) -> std::string
    {
        using T = std::decay_t<decltype(c)>;
        if constexpr (std::is_same_v<T, password_credentials>)
            return "password(user=" + c.username + ", password=<redacted>)";
        else if constexpr (std::is_same_v<T, oauth2_credentials>)
            return "oauth2(user=" + c.username + ", token=<redacted>)";
        else
            return "bearer(token=<redacted>)";
    }, creds);
}

/**
 * Source of credentials, consulted once per authentication attempt.
 */
class credential_provider
{
public:
    virtual ~credential_provider() = default;

    virtual asio::awaitable<result<credentials>> get() = 0;

    /// The server answered 535 to the credentials of the last get().
    virtual void on_rejected() noexcept {}
};

class static_credentials final : public credential_provider
{
public:
    explicit static_credentials(credentials creds)
        : creds_(std::move(creds))
    {
    }

    asio::awaitable<result<credentials>> get() override
    {
        co_return creds_;
    }

private:
    credentials creds_;
};

/**
 * XOAUTH2/OAUTHBEARER credentials backed by a token_source. After a rejection
 * the next get() refreshes the token through the source's refresh function,
 * even when the cached one has not expired.
 */
class oauth2_credential_provider final : public credential_provider
{
public:
    oauth2_credential_provider(std::string username, std::shared_ptr<oauth2::token_source> source)
        : username_(std::move(username)),
          source_(std::move(source))
    {
    }

    asio::awaitable<result<credentials>> get() override
    {
        if (rejected_.exchange(false))
        {
            SMTPXX_INFO("AUTH", "refreshing rejected OAuth2 access token for " + username_);
            co_return wrap(source_->refresh_access_token());
        }
        co_return wrap(source_->get_access_token());
    }

    void on_rejected() noexcept override
    {
        if (source_->can_refresh())
            rejected_.store(true);
    }

private:
    result<credentials> wrap(result<std::string> token) const
    {
        if (!token)
            return fail<credentials>(std::move(token).error());
        return credentials{oauth2_credentials{username_, std::move(token).value()}};
    }

    std::string username_;
    std::shared_ptr<oauth2::token_source> source_;
    std::atomic<bool> rejected_{false};
};

enum class mechanism
{
    login,
    plain,
    cram_md5,
    xoauth2,
    oauthbearer
};

[[nodiscard]] constexpr std::string_view to_string(mechanism mech) noexcept
{
    switch (mech)
    {
        case mechanism::login: return "LOGIN";
        case mechanism::plain: return "PLAIN";
        case mechanism::cram_md5: return "CRAM-MD5";
        case mechanism::xoauth2: return "XOAUTH2";
        case mechanism::oauthbearer: return "OAUTHBEARER";
    }
    return "UNKNOWN";
}

inline std::ostream& operator<<(std::ostream& os, mechanism mech)
{
    return os << to_string(mech);
}

/// Higher is stronger: OAUTHBEARER > XOAUTH2 > CRAM-MD5 > PLAIN > LOGIN.
[[nodiscard]] constexpr int priority(mechanism mech) noexcept
{
    switch (mech)
    {
        case mechanism::oauthbearer: return 5;
        case mechanism::xoauth2: return 4;
        case mechanism::cram_md5: return 3;
        case mechanism::plain: return 2;
        case mechanism::login: return 1;
    }
    return 0;
}

/// Mechanisms that put the secret on the wire as-is.
[[nodiscard]] constexpr bool is_cleartext(mechanism mech) noexcept
{
    return mech == mechanism::plain || mech == mechanism::login;
}

[[nodiscard]] inline std::optional<mechanism> parse_mechanism(std::string_view name)
{
    for (mechanism mech : {mechanism::login, mechanism::plain, mechanism::cram_md5,
        mechanism::xoauth2, mechanism::oauthbearer})
    {
        if (boost::algorithm::iequals(name, to_string(mech)))
            return mech;
    }
    return std::nullopt;
}

/// Mechanisms the credential shape can drive.
[[nodiscard]] inline std::vector<mechanism> mechanisms_for(const credentials& creds)
{
    switch (creds.index())
    {
        case 0: return {mechanism::cram_md5, mechanism::plain, mechanism::login};
        case 1: return {mechanism::xoauth2, mechanism::oauthbearer};
        default: return {mechanism::oauthbearer};
    }
}

struct auth_options
{
    /// Pinned mechanism; must be advertised or selection fails.
    std::optional<mechanism> preferred;
    /// Permits PLAIN and LOGIN on a plaintext connection.
    bool allow_cleartext = false;
};

/**
 * Picks the mechanism for one authentication attempt. Deterministic for a
 * given advertisement, credential shape and TLS state.
 */
[[nodiscard]] inline result<mechanism> select_mechanism(const std::vector<std::string>& advertised,
    const credentials& creds, bool is_tls, const auth_options& opts)
{
    if (advertised.empty())
        return fail<mechanism>(errc::auth_mechanism_unsupported, "Server does not advertise AUTH.");

    auto is_advertised = [&advertised](mechanism mech)
    {
        for (const auto& name : advertised)
        {
            if (boost::algorithm::iequals(name, to_string(mech)))
                return true;
        }
        return false;
    };
    const auto usable = mechanisms_for(creds);
    auto is_usable = [&usable](mechanism mech)
    {
        for (mechanism m : usable)
        {
            if (m == mech)
                return true;
        }
        return false;
    };

    if (opts.preferred.has_value())
    {
        const mechanism mech = *opts.preferred;
        if (!is_advertised(mech))
            return fail<mechanism>(errc::auth_mechanism_unsupported,
                "AUTH " + std::string(to_string(mech)) + " not advertised by the server.");
        if (!is_usable(mech))
            return fail<mechanism>(errc::auth_mechanism_unsupported,
                "AUTH " + std::string(to_string(mech)) + " cannot be driven by these credentials.");
        if (is_cleartext(mech) && !is_tls && !opts.allow_cleartext)
            return fail<mechanism>(errc::auth_tls_required,
                "AUTH " + std::string(to_string(mech)) + " requires TLS; enable allow_cleartext_auth to override.");
        return mech;
    }

    std::optional<mechanism> best;
    bool blocked_by_tls = false;
    for (mechanism mech : usable)
    {
        if (!is_advertised(mech))
            continue;
        if (is_cleartext(mech) && !is_tls && !opts.allow_cleartext)
        {
            blocked_by_tls = true;
            continue;
        }
        if (!best || priority(mech) > priority(*best))
            best = mech;
    }

    if (best)
        return *best;
    if (blocked_by_tls)
        return fail<mechanism>(errc::auth_tls_required,
            "Only cleartext AUTH mechanisms are available on an unencrypted connection.");
    return fail<mechanism>(errc::auth_mechanism_unsupported,
        "No advertised AUTH mechanism matches the configured credentials.");
}

/**
 * Runs SASL exchanges over a transport. Any non-success reply ends the
 * exchange with auth_failed; there is no fallback to another mechanism.
 */
class authenticator
{
public:
    authenticator(transport& conn, auth_options opts)
        : conn_(conn),
          opts_(std::move(opts))
    {
    }

    /**
     * Selects a mechanism from the server's advertisement and authenticates once.
     * A 535 is reported to the provider so its next get() can hand out new credentials.
     *
     * @return Mechanism that succeeded.
     */
    asio::awaitable<result<mechanism>> authenticate(credential_provider& provider)
    {
        auto creds = co_await provider.get();
        if (!creds)
            co_return fail<mechanism>(std::move(creds).error());

        auto mech = co_await select_and_run(*creds);
        if (!mech && mech.error().code == errc::auth_failed && mech.error().smtp_status == 535)
            provider.on_rejected();
        co_return mech;
    }

    /// Exact wire sequence of one mechanism.
    asio::awaitable<result<void>> run(const credentials& creds, mechanism mech)
    {
        last_mechanism_ = mech;
        switch (mech)
        {
            case mechanism::plain: co_return co_await run_plain(creds);
            case mechanism::login: co_return co_await run_login(creds);
            case mechanism::cram_md5: co_return co_await run_cram_md5(creds);
            case mechanism::xoauth2: co_return co_await run_xoauth2(creds);
            case mechanism::oauthbearer: co_return co_await run_oauthbearer(creds);
        }
        co_return fail(errc::auth_mechanism_unsupported, "Unknown AUTH mechanism.");
    }

    [[nodiscard]] std::optional<mechanism> last_mechanism() const noexcept { return last_mechanism_; }

private:
    asio::awaitable<result<mechanism>> select_and_run(const credentials& creds)
    {
        auto mech = select_mechanism(conn_.caps().auth_mechanisms(), creds, conn_.is_tls(), opts_);
        if (!mech)
            co_return fail<mechanism>(std::move(mech).error());
        SMTPXX_DEBUG("AUTH", "authenticating " + to_string(creds) + " with " + std::string(to_string(*mech)));

        auto res = co_await run(creds, *mech);
        if (!res)
            co_return fail<mechanism>(std::move(res).error());
        conn_.set_authenticated_user(username_of(creds));
        co_return *mech;
    }

    asio::awaitable<result<void>> run_plain(const credentials& creds)
    {
        const auto* pw = std::get_if<password_credentials>(&creds);
        if (pw == nullptr)
            co_return wrong_shape(mechanism::plain);
        if (auto valid = validate_secret(pw->username, pw->password); !valid)
            co_return valid;

        const std::string initial = sasl::encode_plain(pw->username, pw->password, pw->authzid);
        auto rep = co_await conn_.send_command("AUTH PLAIN " + initial);
        if (!rep)
            co_return fail(std::move(rep).error());
        // Servers that ignore the initial response ask for it with an empty challenge.
        if (rep->status == 334)
        {
            rep = co_await conn_.send_command(initial);
            if (!rep)
                co_return fail(std::move(rep).error());
        }
        co_return finish(*rep, "AUTH PLAIN");
    }

    asio::awaitable<result<void>> run_login(const credentials& creds)
    {
        const auto* pw = std::get_if<password_credentials>(&creds);
        if (pw == nullptr)
            co_return wrong_shape(mechanism::login);
        if (auto valid = validate_secret(pw->username, pw->password); !valid)
            co_return valid;

        auto rep = co_await conn_.send_command("AUTH LOGIN");
        if (!rep)
            co_return fail(std::move(rep).error());
        if (rep->status != 334)
            co_return rejected(*rep, "AUTH LOGIN");

        rep = co_await conn_.send_command(sasl::encode_login(pw->username));
        if (!rep)
            co_return fail(std::move(rep).error());
        if (rep->status != 334)
            co_return rejected(*rep, "AUTH LOGIN");

        rep = co_await conn_.send_command(sasl::encode_login(pw->password));
        if (!rep)
            co_return fail(std::move(rep).error());
        co_return finish(*rep, "AUTH LOGIN");
    }

    asio::awaitable<result<void>> run_cram_md5(const credentials& creds)
    {
        const auto* pw = std::get_if<password_credentials>(&creds);
        if (pw == nullptr)
            co_return wrong_shape(mechanism::cram_md5);
        if (auto valid = validate_secret(pw->username, pw->password); !valid)
            co_return valid;

        auto rep = co_await conn_.send_command("AUTH CRAM-MD5");
        if (!rep)
            co_return fail(std::move(rep).error());
        if (rep->status != 334 || rep->lines.empty())
            co_return rejected(*rep, "AUTH CRAM-MD5");

        auto response = sasl::encode_cram_md5(pw->username, pw->password, rep->lines.front());
        if (!response)
        {
            // Abort the exchange so the connection is back at command level.
            auto cancel = co_await conn_.send_command("*");
            if (!cancel)
                co_return fail(std::move(cancel).error());
            co_return fail(errc::auth_failed, "Malformed CRAM-MD5 challenge.", response.error().message);
        }

        rep = co_await conn_.send_command(*response);
        if (!rep)
            co_return fail(std::move(rep).error());
        co_return finish(*rep, "AUTH CRAM-MD5");
    }

    asio::awaitable<result<void>> run_xoauth2(const credentials& creds)
    {
        const auto* oauth = std::get_if<oauth2_credentials>(&creds);
        if (oauth == nullptr)
            co_return wrong_shape(mechanism::xoauth2);
        if (auto valid = validate_secret(oauth->username, oauth->access_token); !valid)
            co_return valid;

        co_return co_await run_bearer_exchange("AUTH XOAUTH2 ",
            sasl::encode_xoauth2(oauth->username, oauth->access_token));
    }

    asio::awaitable<result<void>> run_oauthbearer(const credentials& creds)
    {
        std::string username;
        std::string token;
        if (const auto* oauth = std::get_if<oauth2_credentials>(&creds))
        {
            username = oauth->username;
            token = oauth->access_token;
        }
        else if (const auto* bearer = std::get_if<bearer_credentials>(&creds))
        {
            token = bearer->token;
        }
        else
        {
            co_return wrong_shape(mechanism::oauthbearer);
        }
        if (auto valid = validate_secret(username, token); !valid)
            co_return valid;

        co_return co_await run_bearer_exchange("AUTH OAUTHBEARER ",
            sasl::encode_oauthbearer(username, token, conn_.host(), conn_.port()));
    }

    /// A 334 carries the server's JSON error; an empty line fetches the final reply.
    asio::awaitable<result<void>> run_bearer_exchange(std::string_view prefix, std::string initial)
    {
        const std::string label(prefix.substr(0, prefix.size() - 1));
        auto rep = co_await conn_.send_command(std::string(prefix) + initial);
        if (!rep)
            co_return fail(std::move(rep).error());
        if (rep->status == 334)
        {
            rep = co_await conn_.send_command("");
            if (!rep)
                co_return fail(std::move(rep).error());
        }
        co_return finish(*rep, label);
    }

    result<void> finish(const reply& rep, std::string_view label)
    {
        if (rep.is_positive_completion())
            return ok();
        return rejected(rep, label);
    }

    result<void> rejected(const reply& rep, std::string_view label)
    {
        error_info err = make_smtp_error(command_kind::auth, rep, conn_.host(), label);
        err.code = errc::auth_failed;
        return fail(std::move(err));
    }

    static result<void> wrong_shape(mechanism mech)
    {
        return fail(errc::auth_mechanism_unsupported,
            "Credentials cannot drive AUTH " + std::string(to_string(mech)) + ".");
    }

    static result<void> validate_secret(std::string_view username, std::string_view secret)
    {
        if (auto valid = detail::ensure_no_crlf_or_nul(username, "username"); !valid)
            return valid;
        return detail::ensure_no_crlf_or_nul(secret, "secret");
    }

    transport& conn_;
    auth_options opts_;
    std::optional<mechanism> last_mechanism_;
};

} // namespace smtpxx::smtp
