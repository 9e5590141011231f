/*

upgradable_stream.hpp
---------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <string>
#include <type_traits>
#include <utility>
#include <variant>

#include <boost/asio/ssl/host_name_verification.hpp>
#include <openssl/ssl.h>
#include <openssl/x509.h>
#include <openssl/x509_vfy.h>

#include <smtpxx/detail/asio_decl.hpp>
#include <smtpxx/detail/result.hpp>
#include <smtpxx/net/cert_pins.hpp>
#include <smtpxx/net/tls_options.hpp>

namespace smtpxx::net
{

/**
One stream type for the whole life of an SMTP connection: plain TCP until
STARTTLS (or right after connect for implicit TLS), then TLS over the same
socket. The dialog above it never changes type.
**/
class upgradable_stream
{
public:
    using tcp = asio::tcp;
    using ssl_stream = asio::ssl::stream<tcp::socket>;
    using executor_type = asio::any_io_executor;
    using lowest_layer_type = std::remove_reference_t<decltype(std::declval<ssl_stream&>().lowest_layer())>;

    explicit upgradable_stream(tcp::socket socket)
        : layer_(std::move(socket))
    {
    }

    executor_type get_executor()
    {
        return lowest_layer().get_executor();
    }

    lowest_layer_type& lowest_layer()
    {
        if (auto* tls = std::get_if<ssl_stream>(&layer_))
            return tls->lowest_layer();
        return std::get<tcp::socket>(layer_);
    }

    [[nodiscard]] bool is_tls() const noexcept
    {
        return std::holds_alternative<ssl_stream>(layer_);
    }

    /// "TLSv1.3" and the like once encrypted, empty while plaintext.
    [[nodiscard]] std::string tls_version()
    {
        auto* tls = std::get_if<ssl_stream>(&layer_);
        if (tls == nullptr)
            return {};
        const char* name = SSL_get_version(tls->native_handle());
        return name != nullptr ? name : "";
    }

    template<typename MutableBufferSequence, typename CompletionToken>
    auto async_read_some(const MutableBufferSequence& buffers, CompletionToken&& token)
    {
        return std::visit([&](auto& layer) -> decltype(auto)
        {
            return layer.async_read_some(buffers, std::forward<CompletionToken>(token));
        }, layer_);
    }

    template<typename ConstBufferSequence, typename CompletionToken>
    auto async_write_some(const ConstBufferSequence& buffers, CompletionToken&& token)
    {
        return std::visit([&](auto& layer) -> decltype(auto)
        {
            return layer.async_write_some(buffers, std::forward<CompletionToken>(token));
        }, layer_);
    }

    /**
    Switches the socket to TLS and performs the client handshake.

    @param context Shared client context, it must outlive the stream.
    @param sni     Server name sent as SNI and checked against the certificate.
    @param opt     Verification relaxations and pins.
    @return        `tls_verify_failed` when the chain or host name is rejected,
                   `tls_handshake_failed` for other handshake errors,
                   `tls_pinning_failed` when no pin matches.
    **/
    asio::awaitable<result<void>> start_tls(asio::ssl::context& context, std::string sni, const tls_options& opt)
    {
        if (is_tls())
            co_return ok();

        auto pins = cert_pins::parse(opt.pinned_cert_sha256, opt.pinned_spki_sha256);
        if (!pins)
            co_return fail(std::move(pins).error());
        if (opt.verify == verify_mode::peer && opt.verify_host && sni.empty())
            co_return fail(errc::tls_verify_failed, "TLS hostname verification requires a host name.");

        tcp::socket plain = std::move(std::get<tcp::socket>(layer_));
        auto& tls = layer_.emplace<ssl_stream>(std::move(plain), context);
        if (!sni.empty())
            SSL_set_tlsext_host_name(tls.native_handle(), sni.c_str());
        configure_verification(tls, sni, opt);

        asio::error_code ec;
        co_await tls.async_handshake(asio::ssl::stream_base::client, asio::redirect_error(asio::use_awaitable, ec));
        if (ec)
        {
            const long verdict = SSL_get_verify_result(tls.native_handle());
            if (verdict != X509_V_OK)
                co_return fail(errc::tls_verify_failed, "TLS certificate verification failed.",
                    X509_verify_cert_error_string(verdict), ec);
            co_return fail(errc::tls_handshake_failed, "TLS handshake failed.", ec.message(), ec);
        }
        co_return pins->check(tls.native_handle());
    }

    /// Hard close without the TLS close_notify, errors at teardown are moot.
    void close() noexcept
    {
        asio::error_code ignored;
        auto& socket = lowest_layer();
        socket.shutdown(tcp::socket::shutdown_both, ignored);
        socket.close(ignored);
    }

private:
    std::variant<tcp::socket, ssl_stream> layer_;

    static void configure_verification(ssl_stream& tls, const std::string& sni, const tls_options& opt)
    {
        if (opt.verify == verify_mode::none)
        {
            tls.set_verify_mode(asio::ssl::verify_none);
            return;
        }
        tls.set_verify_mode(asio::ssl::verify_peer);

        const bool relaxed = opt.allow_self_signed || opt.allow_expired;
        if (!opt.verify_host && !relaxed)
            return;

        tls.set_verify_callback(
            [check_host = opt.verify_host, verifier = asio::ssl::host_name_verification(sni),
                self_signed = opt.allow_self_signed, expired = opt.allow_expired]
            (bool preverified, asio::ssl::verify_context& ctx) mutable
            {
                if (!preverified && !tolerated(ctx, self_signed, expired))
                    return false;
                return !check_host || verifier(true, ctx);
            });
    }

    /// Chain errors the caller chose to accept.
    static bool tolerated(asio::ssl::verify_context& ctx, bool self_signed, bool expired) noexcept
    {
        X509_STORE_CTX* store = ctx.native_handle();
        if (store == nullptr)
            return false;
        switch (X509_STORE_CTX_get_error(store))
        {
            case X509_V_ERR_SELF_SIGNED_CERT_IN_CHAIN:
            case X509_V_ERR_DEPTH_ZERO_SELF_SIGNED_CERT:
                return self_signed;
            case X509_V_ERR_CERT_HAS_EXPIRED:
            case X509_V_ERR_CERT_NOT_YET_VALID:
                return expired;
            default:
                return false;
        }
    }
};

} // namespace smtpxx::net
