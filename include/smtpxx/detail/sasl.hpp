/*

sasl.hpp
--------

SASL encoding helpers for smtpxx.
Implements the client messages of PLAIN, LOGIN, CRAM-MD5, XOAUTH2 and OAUTHBEARER.

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <smtpxx/codec/base64.hpp>
#include <smtpxx/detail/append.hpp>
#include <smtpxx/detail/result.hpp>

namespace smtpxx::sasl
{

/**
 * Encode credentials for SASL PLAIN mechanism (RFC 4616).
 * Format: authzid \0 username \0 password (then base64 encoded).
 * An empty authzid yields the usual leading NUL.
 */
inline std::string encode_plain(std::string_view username, std::string_view password, std::string_view authzid = {})
{
    std::string plain;
    plain.reserve(2 + authzid.size() + username.size() + password.size());
    plain += authzid;
    plain.push_back('\0');
    plain += username;
    plain.push_back('\0');
    plain += password;

    return base64::encode(plain);
}

/**
 * Encode text for SASL LOGIN mechanism.
 * Username and password are sent separately, one per continuation.
 */
inline std::string encode_login(std::string_view text)
{
    return base64::encode(text);
}

/**
 * Lowercase hex HMAC-MD5 of the challenge keyed by the secret (RFC 2195).
 */
inline result<std::string> hmac_md5_hex(std::string_view secret, std::string_view challenge)
{
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    const unsigned char* out = HMAC(EVP_md5(),
        secret.data(), static_cast<int>(secret.size()),
        reinterpret_cast<const unsigned char*>(challenge.data()), challenge.size(),
        digest, &digest_len);
    if (out == nullptr || digest_len == 0)
        return fail<std::string>(errc::internal_error, "HMAC-MD5 computation failed.");

    static constexpr char hex[] = "0123456789abcdef";
    std::string text;
    text.reserve(digest_len * 2);
    for (unsigned int i = 0; i < digest_len; ++i)
    {
        text.push_back(hex[(digest[i] >> 4) & 0x0f]);
        text.push_back(hex[digest[i] & 0x0f]);
    }
    return text;
}

/**
 * Answer a CRAM-MD5 challenge.
 *
 * @param username         The username.
 * @param password         The shared secret keying the HMAC.
 * @param challenge_base64 The server's 334 payload, still base64 encoded.
 * @return Base64 of "username SP hex(hmac)", or invalid_argument on a malformed challenge.
 */
inline result<std::string> encode_cram_md5(std::string_view username, std::string_view password,
    std::string_view challenge_base64)
{
    auto challenge = base64::decode(challenge_base64);
    if (!challenge)
        return fail<std::string>(std::move(challenge).error());

    auto digest = hmac_md5_hex(password, *challenge);
    if (!digest)
        return fail<std::string>(std::move(digest).error());

    std::string response;
    response.reserve(username.size() + 1 + digest->size());
    detail::append_sv(response, username);
    detail::append_space(response);
    detail::append_sv(response, *digest);
    return base64::encode(response);
}

/**
 * Encode credentials for XOAUTH2 mechanism (Google/Microsoft OAuth2).
 * Format: user=<email>\x01auth=Bearer <token>\x01\x01 (then base64 encoded)
 */
inline std::string encode_xoauth2(std::string_view username, std::string_view access_token)
{
    std::string xoauth2;
    xoauth2.reserve(5 + username.size() + 13 + access_token.size() + 2);
    xoauth2 += "user=";
    xoauth2 += username;
    xoauth2 += '\x01';
    xoauth2 += "auth=Bearer ";
    xoauth2 += access_token;
    xoauth2 += "\x01\x01";

    return base64::encode(xoauth2);
}

/**
 * Encode credentials for OAUTHBEARER mechanism (RFC 7628).
 * Format: n,a=<user>,\x01host=<host>\x01port=<port>\x01auth=Bearer <token>\x01\x01
 * The authorization identity is omitted ("n,,") for bare bearer tokens; in it ',' and '='
 * are written as "=2C" and "=3D" (RFC 5801 saslname).
 */
inline std::string encode_oauthbearer(std::string_view username, std::string_view access_token,
    std::string_view host, std::uint16_t port)
{
    std::string bearer;
    bearer.reserve(32 + username.size() + host.size() + access_token.size());
    bearer += "n,";
    if (!username.empty())
    {
        bearer += "a=";
        for (char ch : username)
        {
            if (ch == ',')
                bearer += "=2C";
            else if (ch == '=')
                bearer += "=3D";
            else
                bearer += ch;
        }
    }
    bearer += ',';
    if (!host.empty())
    {
        bearer += "\x01host=";
        bearer += host;
    }
    if (port != 0)
    {
        bearer += "\x01port=";
        detail::append_uint(bearer, port);
    }
    bearer += "\x01";
    bearer += "auth=Bearer ";
    bearer += access_token;
    bearer += "\x01\x01";

    return base64::encode(bearer);
}

} // namespace smtpxx::sasl
