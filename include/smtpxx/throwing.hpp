/*

throwing.hpp
------------

Bridges smtpxx::result into exceptions for callers that prefer
exception-based error handling.

*/

#pragma once

#include <stdexcept>
#include <string>
#include <utility>

#include <smtpxx/config.hpp>
#include <smtpxx/detail/result.hpp>

namespace smtpxx
{

#if !SMTPXX_THROWING_ENABLED
#error "SMTPXX_NO_EXCEPTIONS is defined; throwing.hpp is disabled."
#endif

class exception : public std::runtime_error
{
public:
    explicit exception(error_info info)
        : std::runtime_error(info.to_string()),
          info_(std::move(info))
    {
    }

    [[nodiscard]] const error_info& info() const noexcept { return info_; }
    [[nodiscard]] errc code() const noexcept { return info_.code; }

private:
    error_info info_;
};

template<class T>
[[nodiscard]] inline T unwrap(result<T>&& r)
{
    if (!r)
        throw exception(std::move(r.error()));
    return std::move(*r);
}

inline void unwrap(result<void>&& r)
{
    if (!r)
        throw exception(std::move(r.error()));
}

} // namespace smtpxx
