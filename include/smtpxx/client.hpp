/*

client.hpp
----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <smtpxx/client_config.hpp>
#include <smtpxx/detail/asio_decl.hpp>
#include <smtpxx/detail/log.hpp>
#include <smtpxx/detail/result.hpp>
#include <smtpxx/message.hpp>
#include <smtpxx/metrics.hpp>
#include <smtpxx/net/tls_context.hpp>
#include <smtpxx/pool/connection_pool.hpp>
#include <smtpxx/resilience/orchestrator.hpp>
#include <smtpxx/smtp/asio_transport.hpp>
#include <smtpxx/smtp/engine.hpp>
#include <smtpxx/smtp/transport.hpp>

namespace smtpxx
{

struct send_result
{
    std::string message_id;
    /// Queue id the server reported in its final reply, if any.
    std::optional<std::string> server_id;
    std::vector<std::string> accepted;
    std::vector<smtp::recipient_rejection> rejected;
    /// Final reply to the payload, e.g. "250 2.0.0 Ok: queued as 4F2A9C".
    std::string response;
    std::chrono::milliseconds duration{0};

    [[nodiscard]] bool complete_success() const noexcept { return rejected.empty(); }
};

struct batch_result
{
    std::vector<result<send_result>> results;
    std::size_t total = 0;
    std::size_t succeeded = 0;
    std::size_t failed = 0;
    std::chrono::milliseconds duration{0};

    [[nodiscard]] bool complete_success() const noexcept { return failed == 0; }
};

struct connection_info
{
    std::string host;
    std::uint16_t port = 0;
    bool tls = false;
    std::string tls_version;
    std::vector<std::string> capabilities;
    std::string banner;
    std::string authenticated_user;
};

/// Collaborators a client can be given instead of the defaults.
struct client_options
{
    std::shared_ptr<metrics_sink> metrics;
    /// raw_message_encoder when empty.
    std::shared_ptr<message_encoder> encoder;
    /// Opens a connection; an asio_transport to the configured host when empty.
    pool::connection_pool::factory_type connector;
};

/**
SMTP client: a connection pool, the resilience layers and the protocol
engine behind send(), send_batch() and test_connection().

Sends may run concurrently from several coroutines; each holds its own
pooled connection for the duration of one attempt.
**/
class client
{
public:
    /**
    Validates the configuration and builds the client.

    @param executor Executor every connection and timer runs on.
    @param config   Copied; later changes have no effect.
    @param options  Optional collaborators.
    @return         The client, or config_invalid.
    **/
    static result<std::unique_ptr<client>> create(asio::any_io_executor executor, client_config config,
        client_options options = {})
    {
        if (auto valid = config.validate(); !valid)
            return fail<std::unique_ptr<client>>(std::move(valid).error());
        if (!options.connector)
        {
            auto connector = make_connector(executor, config);
            if (!connector)
                return fail<std::unique_ptr<client>>(std::move(connector).error());
            options.connector = std::move(connector).value();
        }
        return std::unique_ptr<client>(new client(executor, std::move(config), std::move(options)));
    }

    client(const client&) = delete;
    client& operator=(const client&) = delete;

    /**
    Sends one email through the rate limiter, circuit breaker and retry loop.

    @return Accepted and rejected recipients, or the error of the last attempt.
    **/
    asio::awaitable<result<send_result>> send(const email& mail)
    {
        const auto start = std::chrono::steady_clock::now();

        auto encoded = encoder_->encode(mail);
        if (!encoded)
            co_return finish_failure(std::move(encoded).error(), start);

        smtp::envelope env;
        env.sender = mail.from;
        env.recipients = mail.all_recipients();
        env.payload = std::move(encoded->data);

        auto tx = co_await orchestrator_.execute([this, &env](std::size_t attempt)
        {
            return attempt_send(env, attempt);
        });
        if (!tx)
            co_return finish_failure(std::move(tx).error(), start);

        send_result out;
        out.message_id = std::move(encoded->message_id);
        out.server_id = queue_id(tx->final_reply);
        out.accepted = std::move(tx->accepted);
        out.rejected = std::move(tx->rejected);
        out.response = tx->final_reply.to_string();
        out.duration = elapsed(start);

        SMTPXX_INFO("CLIENT", "message " + out.message_id + " sent to " + std::to_string(out.accepted.size())
            + " recipient(s), " + std::to_string(out.rejected.size()) + " rejected");
        const auto accepted = out.accepted.size();
        const auto duration = out.duration;
        detail::notify(metrics_.get(), [&](metrics_sink& sink) { sink.on_send_success(duration, accepted); });
        co_return out;
    }

    /**
    Sends each email in order. Failures are isolated per item; the batch
    itself never fails.
    **/
    asio::awaitable<batch_result> send_batch(const std::vector<email>& mails)
    {
        const auto start = std::chrono::steady_clock::now();
        batch_result out;
        out.total = mails.size();
        out.results.reserve(mails.size());
        for (const auto& mail : mails)
        {
            auto res = co_await send(mail);
            if (res)
                ++out.succeeded;
            else
                ++out.failed;
            out.results.push_back(std::move(res));
        }
        out.duration = elapsed(start);
        co_return out;
    }

    /**
    Opens a fresh connection outside the pool, negotiates, upgrades and
    authenticates as a send would, reports what was found and closes.
    **/
    asio::awaitable<result<connection_info>> test_connection()
    {
        auto conn = co_await connector_();
        if (!conn)
            co_return fail<connection_info>(std::move(conn).error());
        auto& transport = **conn;

        smtp::engine eng(transport, engine_opts_, metrics_.get());
        auto ready = co_await eng.ensure_ready();
        if (!ready)
        {
            co_await transport.close();
            co_return fail<connection_info>(std::move(ready).error());
        }

        connection_info info;
        info.host = transport.host();
        info.port = transport.port();
        info.tls = transport.is_tls();
        info.tls_version = transport.tls_version();
        info.capabilities = transport.caps().raw_lines();
        info.banner = transport.banner();
        info.authenticated_user = transport.authenticated_user();

        co_await transport.close();
        co_return info;
    }

    /// Pre-opens pool.min_idle connections.
    asio::awaitable<result<void>> warmup()
    {
        co_return co_await pool_->warmup();
    }

    /// Closes idle connections; later sends fail with pool_closed.
    asio::awaitable<void> shutdown()
    {
        co_await pool_->close();
    }

    [[nodiscard]] pool::pool_status pool_status() const { return pool_->status(); }
    [[nodiscard]] pool::pool_stats pool_stats() const { return pool_->stats(); }

    [[nodiscard]] resilience::circuit_state circuit_state() { return orchestrator_.breaker().state(); }
    [[nodiscard]] resilience::circuit_stats circuit_stats() { return orchestrator_.breaker().stats(); }

    [[nodiscard]] const std::shared_ptr<metrics_sink>& metrics() const noexcept { return metrics_; }

    /// Closes the circuit and refills the rate limiter.
    void reset_resilience()
    {
        orchestrator_.reset();
    }

    [[nodiscard]] const client_config& config() const noexcept { return config_; }

private:
    client(asio::any_io_executor executor, client_config config, client_options options)
        : executor_(executor),
          config_(std::move(config)),
          metrics_(std::move(options.metrics)),
          encoder_(options.encoder ? std::move(options.encoder) : std::make_shared<raw_message_encoder>(
              config_.effective_client_id())),
          connector_(std::move(options.connector)),
          orchestrator_(executor_, resilience::resilience_config{config_.retry, config_.circuit_breaker,
              config_.rate_limit}, metrics_)
    {
        engine_opts_.client_id = config_.effective_client_id();
        engine_opts_.tls_policy = config_.tls_policy;
        engine_opts_.credentials = config_.credentials;
        engine_opts_.auth = config_.auth;
        engine_opts_.max_message_size = config_.max_message_size;
        pool_ = pool::make_pool(executor_, config_.pool, connector_);
    }

    /// Factory for asio_transport; owns copies of everything it needs so it can outlive the client.
    static result<pool::connection_pool::factory_type> make_connector(asio::any_io_executor executor,
        const client_config& cfg)
    {
        smtp::asio_transport_options opts;
        opts.host = cfg.host;
        opts.port = cfg.port;
        opts.tls_policy = cfg.tls_policy;
        opts.tls = cfg.tls;
        opts.connect_timeout = cfg.connect_timeout;
        opts.command_timeout = cfg.command_timeout;
        opts.max_line_length = cfg.max_line_length;
        opts.redact_secrets_in_trace = cfg.redact_secrets_in_trace;
        if (cfg.tls_policy != net::tls_policy::none)
        {
            // one context shared by every pooled connection
            auto ctx = net::make_tls_context(cfg.tls);
            if (!ctx)
                return fail<pool::connection_pool::factory_type>(std::move(ctx).error());
            opts.tls_context = std::move(ctx).value();
        }
        return pool::connection_pool::factory_type([executor, opts]()
        {
            return connect_transport(executor, opts);
        });
    }

    static asio::awaitable<result<std::unique_ptr<smtp::transport>>> connect_transport(asio::any_io_executor executor,
        smtp::asio_transport_options opts)
    {
        auto conn = co_await smtp::asio_transport::connect(executor, std::move(opts));
        if (!conn)
            co_return fail<std::unique_ptr<smtp::transport>>(std::move(conn).error());
        co_return std::unique_ptr<smtp::transport>(std::move(conn).value());
    }

    /// One attempt: a fresh lease, negotiation if needed, one transaction.
    asio::awaitable<result<smtp::transaction_result>> attempt_send(const smtp::envelope& env, std::size_t attempt)
    {
        auto leased = co_await pool_->acquire();
        if (!leased)
            co_return fail<smtp::transaction_result>(std::move(leased).error());
        pool::lease conn = std::move(leased).value();

        if (attempt > 1)
            SMTPXX_DEBUG("CLIENT", "attempt " + std::to_string(attempt) + " on connection to " + conn->host());

        smtp::engine eng(*conn, engine_opts_, metrics_.get());
        auto ready = co_await eng.ensure_ready();
        if (!ready)
            co_return fail<smtp::transaction_result>(std::move(ready).error());
        co_return co_await eng.run_transaction(env);
    }

    result<send_result> finish_failure(error_info err, std::chrono::steady_clock::time_point start)
    {
        const auto duration = elapsed(start);
        SMTPXX_ERROR("CLIENT", "send failed: " + err.to_string());
        const auto code = err.code;
        detail::notify(metrics_.get(), [&](metrics_sink& sink) { sink.on_send_failure(code, duration); });
        return fail<send_result>(std::move(err));
    }

    /// "queued as <id>" in the final reply, as Postfix and most MTAs report it.
    static std::optional<std::string> queue_id(const smtp::reply& rep)
    {
        static constexpr std::string_view marker = "queued as ";
        for (const auto& line : rep.lines)
        {
            const auto pos = line.find(marker);
            if (pos == std::string::npos)
                continue;
            std::string id = line.substr(pos + marker.size());
            const auto end = id.find_first_of(" \t");
            if (end != std::string::npos)
                id.erase(end);
            if (!id.empty())
                return id;
        }
        return std::nullopt;
    }

    static std::chrono::milliseconds elapsed(std::chrono::steady_clock::time_point start)
    {
        return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
    }

    asio::any_io_executor executor_;
    client_config config_;
    std::shared_ptr<metrics_sink> metrics_;
    std::shared_ptr<message_encoder> encoder_;
    pool::connection_pool::factory_type connector_;
    resilience::orchestrator orchestrator_;
    smtp::engine_options engine_opts_;
    std::shared_ptr<pool::connection_pool> pool_;
};

} // namespace smtpxx
