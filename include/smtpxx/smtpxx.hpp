#pragma once

#include <smtpxx/config.hpp>
#include <smtpxx/detail/log.hpp>

#include <smtpxx/codec/base64.hpp>

#include <smtpxx/net/dialog.hpp>
#include <smtpxx/net/tls_options.hpp>
#include <smtpxx/net/upgradable_stream.hpp>

#include <smtpxx/oauth2/token.hpp>
#include <smtpxx/oauth2/token_source.hpp>

#include <smtpxx/smtp/types.hpp>
#include <smtpxx/smtp/error_mapping.hpp>
#include <smtpxx/smtp/transport.hpp>
#include <smtpxx/smtp/asio_transport.hpp>
#include <smtpxx/smtp/auth.hpp>
#include <smtpxx/smtp/engine.hpp>

// Connection pooling
#include <smtpxx/pool/pool_config.hpp>
#include <smtpxx/pool/connection_pool.hpp>

// Rate limiting, circuit breaking and retries
#include <smtpxx/resilience/retry.hpp>
#include <smtpxx/resilience/circuit_breaker.hpp>
#include <smtpxx/resilience/rate_limiter.hpp>
#include <smtpxx/resilience/orchestrator.hpp>

#include <smtpxx/metrics.hpp>
#include <smtpxx/message.hpp>
#include <smtpxx/client_config.hpp>
#include <smtpxx/client.hpp>
