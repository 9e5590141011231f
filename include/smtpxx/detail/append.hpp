/*

append.hpp
----------

In-place builders for SMTP command lines.


Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <array>
#include <charconv>
#include <cstdint>
#include <string>
#include <string_view>

namespace smtpxx::detail
{

inline void append_sv(std::string& out, std::string_view text)
{
    out += text;
}

inline void append_space(std::string& out)
{
    out += ' ';
}

inline void append_crlf(std::string& out)
{
    out += "\r\n";
}

inline void append_uint(std::string& out, std::uint64_t value)
{
    // 20 digits hold the largest 64 bit value
    std::array<char, 20> digits{};
    const auto [end, ec] = std::to_chars(digits.data(), digits.data() + digits.size(), value);
    if (ec == std::errc{})
        out.append(digits.data(), end);
}

/// Path argument of MAIL FROM and RCPT TO, an empty sender gives the null path `<>`.
inline void append_angle_addr(std::string& out, std::string_view mailbox)
{
    out += '<';
    out += mailbox;
    out += '>';
}

/// ESMTP parameter of MAIL FROM, `SIZE=1024` or a bare keyword like `SMTPUTF8`.
inline void append_param(std::string& out, std::string_view keyword, std::string_view value)
{
    out += ' ';
    out += keyword;
    if (value.empty())
        return;
    out += '=';
    out += value;
}

} // namespace smtpxx::detail
