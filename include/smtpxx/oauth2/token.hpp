/*

token.hpp
---------

OAuth2 bearer token as handed over by the caller's token endpoint client.

*/

#pragma once

#include <chrono>
#include <string>

namespace smtpxx::oauth2
{

struct token
{
    std::string access_token;
    std::string refresh_token;
    std::chrono::system_clock::time_point expires_at{};

    /// True when the token expires within `skew` from `now`; a default expiry never counts as valid.
    [[nodiscard]] bool expired(std::chrono::system_clock::time_point now,
        std::chrono::seconds skew = std::chrono::seconds{30}) const noexcept
    {
        return expires_at <= now + skew;
    }
};

} // namespace smtpxx::oauth2
