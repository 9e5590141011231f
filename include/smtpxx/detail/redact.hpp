#pragma once

#include <string>
#include <string_view>

#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/predicate.hpp>

namespace smtpxx::detail
{

inline constexpr std::string_view REDACTED = "<redacted>";

/// A lone token on a command line that is a SASL response rather than a verb.
[[nodiscard]] inline bool is_sasl_token(const std::string& token)
{
    using namespace boost::algorithm;
    if (token.empty() || !all(token, is_alnum() || is_any_of("+/=")))
        return false;
    // SMTP verbs are short and purely alphabetic
    return token.size() >= 12 || !all(token, is_alpha());
}

/**
 * Mask credentials in a command line before it reaches a trace or an error
 * detail: the initial response of AUTH and bare base64 continuation lines
 * (LOGIN user name and password, CRAM-MD5 digest, an empty OAuth reply).
 * Leading blanks and the line ending are kept.
 */
[[nodiscard]] inline std::string redact_line(std::string_view line)
{
    const auto last = line.find_last_not_of(" \r\n");
    if (last == std::string_view::npos)
        return std::string(line);
    const auto first = line.find_first_not_of(' ');
    const std::string text(line.substr(first, last + 1 - first));
    const std::string_view tail = line.substr(last + 1);

    auto masked = [&](std::size_t keep)
    {
        std::string out(line.substr(0, first + keep));
        out.append(REDACTED);
        out.append(tail);
        return out;
    };

    if (boost::algorithm::istarts_with(text, "AUTH "))
    {
        const auto mech = text.find_first_not_of(' ', 5);
        const auto mech_end = mech == std::string::npos ? mech : text.find(' ', mech);
        if (mech_end == std::string::npos)
            return std::string(line);
        const auto response = text.find_first_not_of(' ', mech_end);
        return masked(response);
    }

    if (text.find(' ') == std::string::npos && is_sasl_token(text))
        return masked(0);
    return std::string(line);
}

} // namespace smtpxx::detail
