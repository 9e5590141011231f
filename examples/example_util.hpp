#pragma once

#include <cstdlib>
#include <iostream>
#include <string>
#include <smtpxx/detail/result.hpp>

inline void print_error(const smtpxx::error_info& err)
{
    std::cout << "Error: " << smtpxx::to_string(err.code) << " (" << smtpxx::to_string(smtpxx::category(err.code))
              << ") - " << err.message << "\n";
    if (err.smtp_status != 0)
        std::cout << "Server: " << err.smtp_status << " " << err.enhanced_status << "\n";
    if (!err.detail.empty())
        std::cout << "Detail: " << err.detail << "\n";
    if (err.sys)
        std::cout << "Sys: " << err.sys.message() << "\n";
    std::cout << "Retryable: " << (smtpxx::is_retryable(err) ? "yes" : "no") << "\n";
    std::cout << "Where: " << err.where.file_name() << ":" << err.where.line()
              << " " << err.where.function_name() << "\n";
}

/// Value of an environment variable, or `fallback` when unset.
inline std::string env_or(const char* name, std::string fallback)
{
    const char* value = std::getenv(name);
    return value != nullptr ? std::string(value) : std::move(fallback);
}
