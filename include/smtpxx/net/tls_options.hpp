/*

tls_options.hpp
---------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>
#include <openssl/ssl.h>

#include <smtpxx/config.hpp>
#include <smtpxx/detail/result.hpp>
#include <smtpxx/net/cert_pins.hpp>

namespace smtpxx::net
{

/**
When and how the SMTP channel gets encrypted.
**/
enum class tls_policy
{
    none,          ///< Never encrypt.
    opportunistic, ///< STARTTLS when advertised, plaintext otherwise.
    required,      ///< STARTTLS must succeed before anything else.
    implicit       ///< TLS from the first byte (port 465).
};

[[nodiscard]] constexpr std::string_view to_string(tls_policy policy) noexcept
{
    switch (policy)
    {
        case tls_policy::none: return "none";
        case tls_policy::opportunistic: return "opportunistic";
        case tls_policy::required: return "required";
        case tls_policy::implicit: return "implicit";
    }
    return "unknown";
}

inline std::ostream& operator<<(std::ostream& os, tls_policy policy)
{
    return os << to_string(policy);
}

enum class verify_mode
{
    none,
    peer
};

struct tls_options
{
    verify_mode verify = verify_mode::peer;
    bool verify_host = true;
    std::optional<int> min_tls_version = TLS1_2_VERSION;
    std::string cipher_list;
    bool use_default_verify_paths = true;
    std::vector<std::string> ca_files;
    std::vector<std::string> ca_paths;
    std::vector<std::string> pinned_spki_sha256;
    std::vector<std::string> pinned_cert_sha256;
    bool allow_self_signed = false;
    bool allow_expired = false;

    [[nodiscard]] bool insecure() const noexcept
    {
        return verify == verify_mode::none || !verify_host || allow_self_signed || allow_expired;
    }

    /// Rejects settings that weaken certificate checks unless the build opted in.
    [[nodiscard]] result<void> validate() const
    {
        if (insecure() && !SMTPXX_INSECURE_TLS_ALLOWED)
            return fail(errc::config_invalid,
                "Disabling certificate verification requires a build with SMTPXX_ALLOW_INSECURE_TLS.");
        if (min_tls_version.has_value() && *min_tls_version < TLS1_2_VERSION && !SMTPXX_INSECURE_TLS_ALLOWED)
            return fail(errc::config_invalid, "Minimum TLS version below 1.2 is not allowed.");
        if (auto pins = cert_pins::parse(pinned_cert_sha256, pinned_spki_sha256); !pins)
            return fail(errc::config_invalid, pins.error().message);
        return ok();
    }
};

} // namespace smtpxx::net
