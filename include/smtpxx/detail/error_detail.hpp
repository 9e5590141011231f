/*

error_detail.hpp
----------------

Builder for the `detail` text of an error_info, one `key=value` line per entry
so that diagnostics stay greppable and command lines can be redacted.


Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include <smtpxx/detail/append.hpp>
#include <smtpxx/detail/redact.hpp>

namespace smtpxx::detail
{

class error_detail
{
public:
    error_detail& add(std::string_view key, std::string_view value)
    {
        return entry(key, value);
    }

    error_detail& add_int(std::string_view key, std::uint64_t value)
    {
        begin(key);
        append_uint(text_, value);
        return end();
    }

    /// Numeric value followed by the category message, `asio=111 Connection refused`.
    error_detail& add_ec(std::string_view key, std::error_code ec)
    {
        begin(key);
        text_ += std::to_string(ec.value());
        if (const auto what = ec.message(); !what.empty())
        {
            append_space(text_);
            text_ += what;
        }
        return end();
    }

    /// Server reply or dialog lines as `prefix0=...`, `prefix1=...`.
    error_detail& add_lines(std::string_view prefix, const std::vector<std::string>& lines, bool redact = false)
    {
        std::uint64_t index = 0;
        for (const auto& line : lines)
        {
            text_ += prefix;
            append_uint(text_, index++);
            text_ += '=';
            text_ += redact ? redact_line(line) : line;
            text_ += '\n';
        }
        return *this;
    }

    template<class Rep, class Period>
    error_detail& add_ms(std::string_view key, std::chrono::duration<Rep, Period> span)
    {
        begin(key);
        append_uint(text_, static_cast<std::uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(span).count()));
        text_ += "ms";
        return end();
    }

    error_detail& add_bool(std::string_view key, bool flag)
    {
        return entry(key, flag ? "true" : "false");
    }

    [[nodiscard]] bool empty() const noexcept
    {
        return text_.empty();
    }

    [[nodiscard]] std::string str() const
    {
        return text_;
    }

private:
    std::string text_;

    error_detail& entry(std::string_view key, std::string_view value)
    {
        begin(key);
        text_ += value;
        return end();
    }

    void begin(std::string_view key)
    {
        text_ += key;
        text_ += '=';
    }

    error_detail& end()
    {
        text_ += '\n';
        return *this;
    }
};

} // namespace smtpxx::detail
