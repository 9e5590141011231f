/*

cert_pins.hpp
-------------

Certificate and SPKI SHA-256 pinning for SMTP servers, checked after the TLS
handshake on top of the regular chain verification.


Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <algorithm>
#include <array>
#include <cctype>
#include <iterator>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <boost/algorithm/hex.hpp>
#include <boost/algorithm/string/case_conv.hpp>
#include <openssl/sha.h>
#include <openssl/ssl.h>
#include <openssl/x509.h>

#include <smtpxx/codec/base64.hpp>
#include <smtpxx/detail/result.hpp>

namespace smtpxx::net
{

/**
Canonical form of a pin: hex digests lose separators and case, base64 digests
keep their case and get their padding back.
**/
[[nodiscard]] inline std::string normalize_fingerprint(std::string_view input)
{
    std::string compact;
    std::copy_if(input.begin(), input.end(), std::back_inserter(compact),
        [](char ch) { return !std::isspace(static_cast<unsigned char>(ch)); });

    std::string hex;
    std::copy_if(compact.begin(), compact.end(), std::back_inserter(hex),
        [](char ch) { return ch != ':' && ch != '-'; });
    boost::algorithm::to_lower(hex);
    if (!hex.empty() && hex.find_first_not_of("0123456789abcdef") == std::string::npos)
        return hex;

    compact.append((4 - compact.size() % 4) % 4, '=');
    return compact;
}

[[nodiscard]] inline bool constant_time_equals(std::string_view a, std::string_view b) noexcept
{
    const std::size_t longest = std::max(a.size(), b.size());
    unsigned diff = a.size() == b.size() ? 0U : 1U;
    for (std::size_t i = 0; i < longest; ++i)
    {
        const unsigned lhs = i < a.size() ? static_cast<unsigned char>(a[i]) : 0U;
        const unsigned rhs = i < b.size() ? static_cast<unsigned char>(b[i]) : 0U;
        diff |= lhs ^ rhs;
    }
    return diff == 0;
}


/**
Parsed set of pins. A connection passes when any pin matches, whichever of the
two lists it comes from. An empty set accepts every peer.
**/
class cert_pins
{
public:
    using digest = std::array<unsigned char, SHA256_DIGEST_LENGTH>;

    [[nodiscard]] static result<cert_pins> parse(const std::vector<std::string>& cert_sha256,
        const std::vector<std::string>& spki_sha256)
    {
        cert_pins pins;
        if (auto parsed = add_all(cert_sha256, "certificate", pins.cert_); !parsed)
            return fail<cert_pins>(std::move(parsed).error());
        if (auto parsed = add_all(spki_sha256, "SPKI", pins.spki_); !parsed)
            return fail<cert_pins>(std::move(parsed).error());
        return pins;
    }

    [[nodiscard]] bool empty() const noexcept
    {
        return cert_.empty() && spki_.empty();
    }

    /// Matches the peer certificate of an established TLS session.
    [[nodiscard]] result<void> check(SSL* session) const
    {
        if (empty())
            return ok();

        std::unique_ptr<X509, decltype(&X509_free)> peer(SSL_get_peer_certificate(session), X509_free);
        if (!peer)
            return fail(errc::tls_pinning_failed, "TLS pinning failure: no peer certificate.");

        if (!cert_.empty())
        {
            auto hashed = der_sha256(peer.get(), &i2d_X509);
            if (!hashed)
                return fail(errc::tls_pinning_failed, "TLS pinning failure: unable to hash certificate.");
            if (matches(cert_, *hashed))
                return ok();
        }
        if (!spki_.empty())
        {
            X509_PUBKEY* key = X509_get_X509_PUBKEY(peer.get());
            if (key == nullptr)
                return fail(errc::tls_pinning_failed, "TLS pinning failure: unable to hash SPKI.");
            auto hashed = der_sha256(key, &i2d_X509_PUBKEY);
            if (!hashed)
                return fail(errc::tls_pinning_failed, "TLS pinning failure: unable to hash SPKI.");
            if (matches(spki_, *hashed))
                return ok();
        }
        return fail(errc::tls_pinning_failed, "TLS pinning failure: certificate mismatch.");
    }

private:
    std::vector<std::string> cert_;
    std::vector<std::string> spki_;

    static result<void> add_all(const std::vector<std::string>& input, const char* kind, std::vector<std::string>& out)
    {
        constexpr std::size_t HEX_SIZE = SHA256_DIGEST_LENGTH * 2;
        constexpr std::size_t BASE64_SIZE = (SHA256_DIGEST_LENGTH + 2) / 3 * 4;
        for (const auto& pin : input)
        {
            std::string normalized = normalize_fingerprint(pin);
            if (normalized.empty())
                continue;
            if (normalized.size() != HEX_SIZE && normalized.size() != BASE64_SIZE)
                return fail(errc::tls_pinning_failed, std::string("TLS pinning failure: invalid ") + kind + " pin.");
            out.push_back(std::move(normalized));
        }
        return ok();
    }

    /// SHA-256 over the DER form written by an OpenSSL `i2d_*` function.
    template<class Object, class Encoder>
    static result<digest> der_sha256(Object* object, Encoder encode)
    {
        const int size = encode(object, nullptr);
        if (size <= 0)
            return fail<digest>(errc::tls_pinning_failed, "DER encoding failed.");
        std::vector<unsigned char> der(static_cast<std::size_t>(size));
        unsigned char* cursor = der.data();
        if (encode(object, &cursor) != size)
            return fail<digest>(errc::tls_pinning_failed, "DER encoding failed.");
        digest out{};
        SHA256(der.data(), der.size(), out.data());
        return out;
    }

    static bool matches(const std::vector<std::string>& pins, const digest& value)
    {
        const std::string_view raw(reinterpret_cast<const char*>(value.data()), value.size());
        std::string hex;
        boost::algorithm::hex(raw.begin(), raw.end(), std::back_inserter(hex));
        boost::algorithm::to_lower(hex);
        const std::string b64 = base64::encode(raw);

        bool found = false;
        for (const auto& pin : pins)
            found |= constant_time_equals(pin, hex) | constant_time_equals(pin, b64);
        return found;
    }
};

} // namespace smtpxx::net
