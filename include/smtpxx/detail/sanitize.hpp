/*

sanitize.hpp
------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <string>
#include <string_view>

#include <smtpxx/detail/result.hpp>

namespace smtpxx::detail
{

inline bool contains_crlf_or_nul(std::string_view value) noexcept
{
    constexpr char line_breakers[] = {'\r', '\n', '\0'};
    return value.find_first_of(std::string_view(line_breakers, sizeof(line_breakers))) != std::string_view::npos;
}

/// A caller supplied value placed on a command line must not start a new command.
[[nodiscard]] inline result<void> ensure_no_crlf_or_nul(std::string_view value, const char* field_name)
{
    if (contains_crlf_or_nul(value))
        return fail(errc::invalid_argument,
            std::string("Invalid ") + (field_name != nullptr ? field_name : "value") + ": CR/LF or NUL not allowed.");
    return ok();
}

} // namespace smtpxx::detail
