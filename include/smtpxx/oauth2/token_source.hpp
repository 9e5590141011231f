/*

token_source.hpp
----------------

Thread-safe access token cache. Acquisition is delegated to a caller-provided
refresh function; smtpxx never talks to a token endpoint itself.

*/

#pragma once

#include <chrono>
#include <functional>
#include <mutex>
#include <string>
#include <utility>

#include <smtpxx/detail/result.hpp>
#include <smtpxx/oauth2/token.hpp>

namespace smtpxx::oauth2
{

class token_source
{
public:
    using refresh_fn = std::function<smtpxx::result<token>(const token& current)>;

    token_source(token initial, refresh_fn fn, std::chrono::seconds skew = std::chrono::seconds{30})
        : current_(std::move(initial)),
          refresh_(std::move(fn)),
          skew_(skew)
    {
    }

    /// Cached token, refreshed first when it is about to expire.
    smtpxx::result<std::string> get_access_token()
    {
        return get_access_token(false);
    }

    /// Unconditional refresh, used after the server rejected the cached token.
    smtpxx::result<std::string> refresh_access_token()
    {
        return get_access_token(true);
    }

    [[nodiscard]] bool can_refresh() const noexcept
    {
        return static_cast<bool>(refresh_);
    }

    [[nodiscard]] std::size_t refresh_count() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return refreshes_;
    }

private:
    smtpxx::result<std::string> get_access_token(bool force_refresh)
    {
        token snapshot;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            const auto now = std::chrono::system_clock::now();
            if (!force_refresh && !current_.expired(now, skew_))
                return smtpxx::ok(current_.access_token);
            snapshot = current_;
        }

        if (!refresh_)
            return smtpxx::fail<std::string>(smtpxx::errc::config_invalid,
                "oauth2 refresh function missing");

        // The refresh function runs unlocked; it may block on the caller's HTTP client.
        auto refreshed = refresh_(snapshot);
        if (!refreshed)
            return smtpxx::fail<std::string>(std::move(refreshed).error());
        if (refreshed->access_token.empty())
            return smtpxx::fail<std::string>(smtpxx::errc::auth_failed,
                "oauth2 refresh returned an empty access token");

        std::lock_guard<std::mutex> lock(mutex_);
        current_ = std::move(refreshed).value();
        ++refreshes_;
        return smtpxx::ok(current_.access_token);
    }

    mutable std::mutex mutex_;
    token current_;
    refresh_fn refresh_;
    std::chrono::seconds skew_;
    std::size_t refreshes_{0};
};

} // namespace smtpxx::oauth2
