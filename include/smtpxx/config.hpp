/*

config.hpp
----------

Global build configuration for smtpxx.

Define SMTPXX_NO_EXCEPTIONS to disable exception-based wrappers.
Define SMTPXX_ALLOW_INSECURE_TLS to accept configurations that disable
certificate verification (test builds only).

*/

#pragma once

#if defined(SMTPXX_NO_EXCEPTIONS)
#define SMTPXX_THROWING_ENABLED 0
#else
#define SMTPXX_THROWING_ENABLED 1
#endif

#if defined(SMTPXX_ALLOW_INSECURE_TLS)
#define SMTPXX_INSECURE_TLS_ALLOWED 1
#else
#define SMTPXX_INSECURE_TLS_ALLOWED 0
#endif
