/*

base64.hpp
----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <cctype>
#include <cstdint>
#include <string>
#include <string_view>

#include <smtpxx/detail/result.hpp>


namespace smtpxx
{


/**
Base64 (RFC 4648) on a single line, the form SASL uses for AUTH initial
responses, 334 challenges and continuation lines.
**/
class base64
{
public:

    static constexpr std::string_view ALPHABET = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

    /**
    Encodes bytes with `=` padding and without line breaks.
    **/
    [[nodiscard]] static std::string encode(std::string_view bytes)
    {
        std::string out;
        out.reserve((bytes.size() + 2) / 3 * 4);

        std::size_t pos = 0;
        for (; pos + 3 <= bytes.size(); pos += 3)
            put_group(out, octet(bytes, pos) << 16 | octet(bytes, pos + 1) << 8 | octet(bytes, pos + 2), 4);

        switch (bytes.size() - pos)
        {
            case 1:
                put_group(out, octet(bytes, pos) << 16, 2);
                out += "==";
                break;
            case 2:
                put_group(out, octet(bytes, pos) << 16 | octet(bytes, pos + 1) << 8, 3);
                out += '=';
                break;
            default:
                break;
        }
        return out;
    }

    /**
    Decodes one line. Trailing whitespace is skipped and missing padding is accepted.

    @return Decoded bytes, or `invalid_argument` for a character outside the
            alphabet, data after the padding or a dangling sextet.
    **/
    [[nodiscard]] static result<std::string> decode(std::string_view text)
    {
        while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back())))
            text.remove_suffix(1);

        const auto padding = text.find('=');
        if (padding != std::string_view::npos && text.find_first_not_of('=', padding) != std::string_view::npos)
            return fail<std::string>(errc::invalid_argument, "Bad base64 padding.");
        const std::string_view data = text.substr(0, padding);

        std::string out;
        out.reserve(data.size() / 4 * 3 + 2);
        std::uint32_t bits = 0;
        int pending = 0;
        for (char ch : data)
        {
            const int value = sextet(ch);
            if (value < 0)
                return fail<std::string>(errc::invalid_argument, "Bad base64 character `" + std::string(1, ch) + "`.");
            bits = bits << 6 | static_cast<std::uint32_t>(value);
            pending += 6;
            if (pending >= 8)
            {
                pending -= 8;
                out += static_cast<char>(bits >> pending & 0xFF);
            }
        }
        if (data.size() % 4 == 1)
            return fail<std::string>(errc::invalid_argument, "Truncated base64 input.");
        return out;
    }

private:

    static std::uint32_t octet(std::string_view bytes, std::size_t pos)
    {
        return static_cast<unsigned char>(bytes[pos]);
    }

    /// Appends the top `count` sextets of a 24 bit group.
    static void put_group(std::string& out, std::uint32_t group, int count)
    {
        for (int shift = 18; count-- > 0; shift -= 6)
            out += ALPHABET[group >> shift & 0x3F];
    }

    static constexpr int sextet(char ch)
    {
        if (ch >= 'A' && ch <= 'Z')
            return ch - 'A';
        if (ch >= 'a' && ch <= 'z')
            return ch - 'a' + 26;
        if (ch >= '0' && ch <= '9')
            return ch - '0' + 52;
        if (ch == '+')
            return 62;
        if (ch == '/')
            return 63;
        return -1;
    }
};


} // namespace smtpxx
