/*

tls_context.hpp
---------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Builds the client ssl::context shared by every connection of a pool:
trust store, protocol floor and cipher list are applied once.

*/

#pragma once

#include <memory>
#include <string>

#include <openssl/err.h>
#include <openssl/ssl.h>

#include <smtpxx/detail/asio_decl.hpp>
#include <smtpxx/detail/result.hpp>
#include <smtpxx/net/tls_options.hpp>

namespace smtpxx::net
{

inline std::string openssl_error_message()
{
    const unsigned long err = ERR_get_error();
    if (err == 0)
        return {};
    char buffer[256];
    ERR_error_string_n(err, buffer, sizeof(buffer));
    return std::string(buffer);
}

/**
Configure the TLS trust store for a context.
**/
inline result<void> configure_trust_store(smtpxx::asio::ssl::context& ctx, const tls_options& options)
{
    smtpxx::asio::error_code ec;
    if (options.use_default_verify_paths)
    {
        ctx.set_default_verify_paths(ec);
        if (ec)
            return fail(errc::tls_verify_failed, "TLS trust store configuration failed.", ec.message(), ec);
    }

    for (const auto& file : options.ca_files)
    {
        if (file.empty())
            continue;
        ctx.load_verify_file(file, ec);
        if (ec)
            return fail(errc::tls_verify_failed, "Loading CA file failed: " + file, ec.message(), ec);
    }

    for (const auto& path : options.ca_paths)
    {
        if (path.empty())
            continue;
        ctx.add_verify_path(path, ec);
        if (ec)
            return fail(errc::tls_verify_failed, "Adding CA path failed: " + path, ec.message(), ec);
    }
    return ok();
}

/**
Create a client context honoring the protocol floor, cipher list and trust settings.

@param options TLS options, already validated.
@return        Shared context, or tls_handshake_failed / tls_verify_failed on OpenSSL errors.
**/
inline result<std::shared_ptr<smtpxx::asio::ssl::context>> make_tls_context(const tls_options& options)
{
    namespace ssl = smtpxx::asio::ssl;
    auto ctx = std::make_shared<ssl::context>(ssl::context::tls_client);
    ctx->set_options(ssl::context::default_workarounds | ssl::context::no_compression);

    if (options.min_tls_version.has_value()
        && SSL_CTX_set_min_proto_version(ctx->native_handle(), *options.min_tls_version) != 1)
    {
        return fail<std::shared_ptr<ssl::context>>(errc::tls_handshake_failed,
            "TLS min version configuration failed.", openssl_error_message());
    }

    if (!options.cipher_list.empty()
        && SSL_CTX_set_cipher_list(ctx->native_handle(), options.cipher_list.c_str()) != 1)
    {
        return fail<std::shared_ptr<ssl::context>>(errc::tls_handshake_failed,
            "TLS cipher list configuration failed.", openssl_error_message());
    }

    if (options.verify == verify_mode::peer)
    {
        auto trust = configure_trust_store(*ctx, options);
        if (!trust)
            return fail<std::shared_ptr<ssl::context>>(std::move(trust).error());
    }
    return ctx;
}

} // namespace smtpxx::net
