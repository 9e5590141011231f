/*

message.hpp
-----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <optional>
#include <random>
#include <string>
#include <string_view>
#include <unordered_set>
#include <utility>
#include <vector>

#include <smtpxx/detail/error_detail.hpp>
#include <smtpxx/detail/result.hpp>
#include <smtpxx/smtp/types.hpp>

namespace smtpxx
{

/**
 * Checks an envelope address: one '@', a 1-64 byte local part, a non-empty
 * domain, at most 254 bytes and no control characters.
 */
[[nodiscard]] inline result<void> validate_address(std::string_view address)
{
    auto invalid = [address](const char* why)
    {
        return fail(errc::invalid_address, why, detail::error_detail().add("address", address).str());
    };

    if (address.empty())
        return invalid("Email address is empty.");
    if (address.size() > 254)
        return invalid("Email address exceeds 254 bytes.");
    for (unsigned char ch : address)
    {
        if (ch < 0x20 || ch == 0x7f)
            return invalid("Email address contains control characters.");
    }

    const auto at = address.find('@');
    if (at == std::string_view::npos || address.find('@', at + 1) != std::string_view::npos)
        return invalid("Email address must contain exactly one '@'.");
    if (at == 0 || at > 64)
        return invalid("Local part must be 1-64 bytes.");
    if (at + 1 == address.size())
        return invalid("Domain is empty.");
    return ok();
}

/**
 * Logical message handed to the client. The content is transfer-ready bytes
 * unless a custom message_encoder builds them.
 */
struct email
{
    std::string from;
    std::vector<std::string> to;
    std::vector<std::string> cc;
    std::vector<std::string> bcc;
    std::string content;
    std::optional<std::string> message_id;

    /// to, cc and bcc in that order; an address repeated with a differently cased domain is sent one RCPT TO.
    [[nodiscard]] std::vector<std::string> all_recipients() const
    {
        std::vector<std::string> out;
        out.reserve(to.size() + cc.size() + bcc.size());
        std::unordered_set<std::string> seen;
        for (const auto* list : {&to, &cc, &bcc})
        {
            for (const auto& rcpt : *list)
            {
                if (seen.insert(smtp::mailbox_key(rcpt)).second)
                    out.push_back(rcpt);
            }
        }
        return out;
    }

    [[nodiscard]] std::size_t recipient_count() const noexcept
    {
        return to.size() + cc.size() + bcc.size();
    }
};

struct encoded_message
{
    std::string data;
    std::string message_id;
};

/**
 * Turns an email into the bytes sent after DATA.
 */
class message_encoder
{
public:
    virtual ~message_encoder() = default;

    virtual result<encoded_message> encode(const email& mail) = 0;
    virtual std::string generate_message_id() = 0;
};

/**
 * Passes pre-encoded content through after validating the envelope.
 * Identifiers look like `<8-4-4-4-12 hex.unix-seconds@domain>`.
 */
class raw_message_encoder : public message_encoder
{
public:
    explicit raw_message_encoder(std::string domain = "localhost")
        : domain_(std::move(domain))
    {
    }

    result<encoded_message> encode(const email& mail) override
    {
        if (auto valid = validate_address(mail.from); !valid)
            return fail<encoded_message>(std::move(valid).error());
        if (mail.recipient_count() == 0)
            return fail<encoded_message>(errc::invalid_argument, "Email has no recipients.");
        for (const auto& rcpt : mail.all_recipients())
        {
            if (auto valid = validate_address(rcpt); !valid)
                return fail<encoded_message>(std::move(valid).error());
        }

        encoded_message out;
        out.data = mail.content;
        out.message_id = mail.message_id ? *mail.message_id : generate_message_id();
        return out;
    }

    std::string generate_message_id() override
    {
        thread_local std::mt19937_64 rng(std::random_device{}());
        const std::uint64_t hi = rng();
        std::uint64_t lo = rng();
        // version 4, RFC 4122 variant
        const std::uint64_t hi_v4 = (hi & 0xFFFFFFFFFFFF0FFFull) | 0x0000000000004000ull;
        lo = (lo & 0x3FFFFFFFFFFFFFFFull) | 0x8000000000000000ull;

        char uuid[37];
        std::snprintf(uuid, sizeof(uuid), "%08x-%04x-%04x-%04x-%012llx",
            static_cast<unsigned>(hi_v4 >> 32),
            static_cast<unsigned>((hi_v4 >> 16) & 0xFFFF),
            static_cast<unsigned>(hi_v4 & 0xFFFF),
            static_cast<unsigned>(lo >> 48),
            static_cast<unsigned long long>(lo & 0xFFFFFFFFFFFFull));

        const auto seconds = std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();

        std::string id;
        id.reserve(64);
        id.push_back('<');
        id += uuid;
        id.push_back('.');
        id += std::to_string(seconds);
        id.push_back('@');
        id += domain_;
        id.push_back('>');
        return id;
    }

    [[nodiscard]] const std::string& domain() const noexcept { return domain_; }

private:
    std::string domain_;
};

} // namespace smtpxx
