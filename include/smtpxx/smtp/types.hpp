/*

types.hpp
---------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <charconv>
#include <cstdint>
#include <map>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/trim.hpp>

namespace smtpxx
{
namespace smtp
{

struct reply
{
    int status = 0;
    std::vector<std::string> lines;

    [[nodiscard]] bool is_positive_completion() const noexcept { return status / 100 == 2; }
    [[nodiscard]] bool is_positive_intermediate() const noexcept { return status / 100 == 3; }
    [[nodiscard]] bool is_transient_negative() const noexcept { return status / 100 == 4; }
    [[nodiscard]] bool is_permanent_negative() const noexcept { return status / 100 == 5; }

    [[nodiscard]] std::string message() const
    {
        if (lines.empty())
            return std::string();

        std::string out = lines.front();
        for (std::size_t i = 1; i < lines.size(); ++i)
        {
            out += "\n";
            out += lines[i];
        }
        return out;
    }

    /// "250 2.0.0 Ok" style rendering of the last line, used in send results.
    [[nodiscard]] std::string to_string() const
    {
        std::string out = std::to_string(status);
        if (!lines.empty())
        {
            out.push_back(' ');
            out += lines.back();
        }
        return out;
    }
};

/**
 * RFC 3463 enhanced status code found at the start of a reply line ("5.1.1").
 */
struct enhanced_status
{
    int cls = 0;
    int subject = 0;
    int detail = 0;

    [[nodiscard]] std::string to_string() const
    {
        return std::to_string(cls) + "." + std::to_string(subject) + "." + std::to_string(detail);
    }

    [[nodiscard]] static std::optional<enhanced_status> parse(std::string_view text)
    {
        enhanced_status out;
        int* parts[] = {&out.cls, &out.subject, &out.detail};
        const char* ptr = text.data();
        const char* end = text.data() + text.size();
        for (int i = 0; i < 3; ++i)
        {
            const auto res = std::from_chars(ptr, end, *parts[i]);
            if (res.ec != std::errc{} || res.ptr == ptr || res.ptr - ptr > 3)
                return std::nullopt;
            ptr = res.ptr;
            if (i < 2)
            {
                if (ptr == end || *ptr != '.')
                    return std::nullopt;
                ++ptr;
            }
        }
        if (ptr != end && *ptr != ' ')
            return std::nullopt;
        if (out.cls != 2 && out.cls != 4 && out.cls != 5)
            return std::nullopt;
        return out;
    }

    [[nodiscard]] static std::optional<enhanced_status> find(const reply& rep)
    {
        for (const auto& line : rep.lines)
        {
            const auto space = line.find(' ');
            if (auto found = parse(std::string_view(line).substr(0, space)))
                return found;
        }
        return std::nullopt;
    }
};

/**
 * ESMTP extensions advertised in an EHLO reply. Keywords are stored upper case.
 */
class capabilities
{
public:
    capabilities() = default;

    /// Builds the extension set from an EHLO reply; the first line is the server greeting.
    [[nodiscard]] static capabilities from_ehlo(const reply& rep)
    {
        capabilities caps;
        caps.raw_ = rep.lines;
        for (std::size_t i = 1; i < rep.lines.size(); ++i)
        {
            std::string line = boost::algorithm::trim_copy(rep.lines[i]);
            if (line.empty())
                continue;

            std::vector<std::string> tokens;
            boost::algorithm::split(tokens, line, boost::algorithm::is_any_of(" ="),
                boost::algorithm::token_compress_on);
            std::string keyword = boost::algorithm::to_upper_copy(tokens.front());
            auto& params = caps.entries_[keyword];
            for (std::size_t t = 1; t < tokens.size(); ++t)
                params.push_back(tokens[t]);
        }
        return caps;
    }

    /// Servers that only answered HELO advertise nothing.
    [[nodiscard]] static capabilities helo_only(const reply& rep)
    {
        capabilities caps;
        caps.raw_ = rep.lines;
        caps.helo_only_ = true;
        return caps;
    }

    [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }
    [[nodiscard]] bool is_helo_only() const noexcept { return helo_only_; }
    [[nodiscard]] const std::vector<std::string>& raw_lines() const noexcept { return raw_; }

    [[nodiscard]] bool supports(std::string_view keyword) const
    {
        return entries_.find(boost::algorithm::to_upper_copy(std::string(keyword))) != entries_.end();
    }

    [[nodiscard]] const std::vector<std::string>* parameters(std::string_view keyword) const
    {
        auto it = entries_.find(boost::algorithm::to_upper_copy(std::string(keyword)));
        return it == entries_.end() ? nullptr : &it->second;
    }

    [[nodiscard]] bool starttls() const { return supports("STARTTLS"); }
    [[nodiscard]] bool eight_bit_mime() const { return supports("8BITMIME"); }
    [[nodiscard]] bool pipelining() const { return supports("PIPELINING"); }
    [[nodiscard]] bool smtputf8() const { return supports("SMTPUTF8"); }
    [[nodiscard]] bool enhanced_status_codes() const { return supports("ENHANCEDSTATUSCODES"); }

    /// SIZE limit; nullopt when not advertised, 0 when advertised without a limit.
    [[nodiscard]] std::optional<std::uint64_t> max_size() const
    {
        const auto* params = parameters("SIZE");
        if (params == nullptr)
            return std::nullopt;
        std::uint64_t value = 0;
        if (!params->empty())
        {
            const std::string& text = params->front();
            const auto res = std::from_chars(text.data(), text.data() + text.size(), value);
            if (res.ec != std::errc{})
                value = 0;
        }
        return value;
    }

    /// Advertised SASL mechanisms, upper case, in server order.
    [[nodiscard]] std::vector<std::string> auth_mechanisms() const
    {
        std::vector<std::string> out;
        if (const auto* params = parameters("AUTH"))
        {
            for (const auto& p : *params)
            {
                std::string mech = boost::algorithm::to_upper_copy(p);
                bool seen = false;
                for (const auto& m : out)
                    seen = seen || m == mech;
                if (!seen)
                    out.push_back(std::move(mech));
            }
        }
        return out;
    }

    [[nodiscard]] bool supports_auth(std::string_view mechanism) const
    {
        for (const auto& m : auth_mechanisms())
        {
            if (boost::algorithm::iequals(m, mechanism))
                return true;
        }
        return false;
    }

private:
    std::map<std::string, std::vector<std::string>> entries_;
    std::vector<std::string> raw_;
    bool helo_only_ = false;
};

/**
 * Per-connection protocol state; decides which commands are legal next.
 */
enum class transaction_state
{
    initial,
    connected,
    greeted,
    tls_established,
    authenticated,
    in_transaction,
    recipients_added,
    sending_data,
    complete,
    closed
};

[[nodiscard]] constexpr std::string_view to_string(transaction_state state) noexcept
{
    switch (state)
    {
        case transaction_state::initial: return "initial";
        case transaction_state::connected: return "connected";
        case transaction_state::greeted: return "greeted";
        case transaction_state::tls_established: return "tls_established";
        case transaction_state::authenticated: return "authenticated";
        case transaction_state::in_transaction: return "in_transaction";
        case transaction_state::recipients_added: return "recipients_added";
        case transaction_state::sending_data: return "sending_data";
        case transaction_state::complete: return "complete";
        case transaction_state::closed: return "closed";
    }
    return "unknown";
}

inline std::ostream& operator<<(std::ostream& os, transaction_state state)
{
    return os << to_string(state);
}

/// States in which no transaction is open and a new one may start.
[[nodiscard]] constexpr bool is_stable(transaction_state state) noexcept
{
    return state == transaction_state::greeted
        || state == transaction_state::tls_established
        || state == transaction_state::authenticated;
}

[[nodiscard]] constexpr bool is_mid_transaction(transaction_state state) noexcept
{
    return state == transaction_state::in_transaction
        || state == transaction_state::recipients_added
        || state == transaction_state::sending_data;
}

[[nodiscard]] constexpr bool can_greet(transaction_state state) noexcept
{
    return state == transaction_state::connected || state == transaction_state::tls_established;
}

[[nodiscard]] constexpr bool can_starttls(transaction_state state) noexcept
{
    return state == transaction_state::greeted;
}

[[nodiscard]] constexpr bool can_authenticate(transaction_state state) noexcept
{
    return state == transaction_state::greeted || state == transaction_state::tls_established;
}

[[nodiscard]] constexpr bool can_mail_from(transaction_state state) noexcept
{
    return is_stable(state) || state == transaction_state::complete;
}

[[nodiscard]] constexpr bool can_rcpt_to(transaction_state state) noexcept
{
    return state == transaction_state::in_transaction || state == transaction_state::recipients_added;
}

[[nodiscard]] constexpr bool can_data(transaction_state state) noexcept
{
    return state == transaction_state::recipients_added;
}

[[nodiscard]] constexpr bool can_reset(transaction_state state) noexcept
{
    return state != transaction_state::initial
        && state != transaction_state::connected
        && state != transaction_state::closed;
}

/// Comparison key for a mailbox: the domain after the last '@' is folded to lower case,
/// the local part is kept as given.
[[nodiscard]] inline std::string mailbox_key(std::string_view address)
{
    const auto at = address.rfind('@');
    if (at == std::string_view::npos)
        return std::string(address);
    std::string key(address.substr(0, at + 1));
    key += boost::algorithm::to_lower_copy(std::string(address.substr(at + 1)));
    return key;
}

/// Outcome of one RCPT TO.
struct recipient_rejection
{
    std::string address;
    int status = 0;
    std::string message;
};

} // namespace smtp
} // namespace smtpxx
