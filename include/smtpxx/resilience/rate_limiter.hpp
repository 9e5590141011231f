/*

rate_limiter.hpp
----------------

Token bucket admission control for sends, with an optional cap on the
number of operations in flight.

*/

#pragma once

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <mutex>
#include <optional>
#include <string_view>
#include <utility>

#include <smtpxx/detail/asio_decl.hpp>
#include <smtpxx/detail/error_detail.hpp>
#include <smtpxx/detail/result.hpp>
#include <smtpxx/detail/wait_queue.hpp>

namespace smtpxx::resilience
{

/// What acquire() does when no capacity is left.
enum class limit_action
{
    reject,
    wait,
    wait_with_timeout
};

[[nodiscard]] constexpr std::string_view to_string(limit_action action) noexcept
{
    switch (action)
    {
        case limit_action::reject: return "reject";
        case limit_action::wait: return "wait";
        case limit_action::wait_with_timeout: return "wait_with_timeout";
    }
    return "unknown";
}

/**
 * Rate limiter configuration.
 */
struct rate_limit_config
{
    bool enabled = false;

    /// Operations allowed per window; no token limit when empty.
    std::optional<std::size_t> max_operations;

    std::chrono::steady_clock::duration window = std::chrono::seconds{60};

    /// Operations allowed in flight at once; unlimited when empty.
    std::optional<std::size_t> max_concurrent;

    limit_action on_limit = limit_action::reject;

    /// Longest wait under limit_action::wait_with_timeout.
    std::chrono::steady_clock::duration wait_timeout = std::chrono::seconds{30};

    /**
     * Create config for N operations per minute.
     */
    static rate_limit_config per_minute(std::size_t n, limit_action action = limit_action::reject)
    {
        rate_limit_config cfg;
        cfg.enabled = true;
        cfg.max_operations = n;
        cfg.window = std::chrono::minutes{1};
        cfg.on_limit = action;
        return cfg;
    }
};

/**
 * Token bucket rate limiter.
 *
 * The bucket starts full with max_operations tokens and refills continuously
 * at max_operations per window. Waiting suspends on an asio timer and never
 * blocks the thread.
 */
class rate_limiter
{
public:
    using clock = std::chrono::steady_clock;

    /**
     * Move-only concurrency slot; released on destruction.
     */
    class permit
    {
    public:
        permit() noexcept = default;

        permit(const permit&) = delete;
        permit& operator=(const permit&) = delete;

        permit(permit&& other) noexcept
            : limiter_(std::exchange(other.limiter_, nullptr))
        {
        }

        permit& operator=(permit&& other) noexcept
        {
            if (this != &other)
            {
                release();
                limiter_ = std::exchange(other.limiter_, nullptr);
            }
            return *this;
        }

        ~permit()
        {
            release();
        }

        [[nodiscard]] bool holds_slot() const noexcept { return limiter_ != nullptr; }

        void release() noexcept
        {
            if (limiter_ != nullptr)
            {
                limiter_->release_slot();
                limiter_ = nullptr;
            }
        }

    private:
        friend class rate_limiter;

        explicit permit(rate_limiter& limiter) noexcept
            : limiter_(&limiter)
        {
        }

        rate_limiter* limiter_{nullptr};
    };

    /**
     * Construct rate limiter.
     * @param executor Asio executor for timers and waiters
     * @param config   Rate limiting configuration
     */
    rate_limiter(smtpxx::asio::any_io_executor executor, rate_limit_config config = {})
        : executor_(executor),
          config_(std::move(config)),
          waiters_(executor),
          tokens_(capacity()),
          last_refill_(clock::now())
    {
    }

    rate_limiter(const rate_limiter&) = delete;
    rate_limiter& operator=(const rate_limiter&) = delete;

    /**
     * Admit one operation, waiting if the configuration allows it.
     * @return Permit to hold for the whole operation, or rate_limited.
     */
    smtpxx::asio::awaitable<result<permit>> acquire()
    {
        if (!config_.enabled)
            co_return permit{};

        const auto deadline = config_.on_limit == limit_action::wait_with_timeout
            ? clock::now() + config_.wait_timeout : clock::time_point::max();

        for (;;)
        {
            const auto wait_time = try_take_token();
            if (wait_time == clock::duration::zero())
                break;

            if (config_.on_limit == limit_action::reject)
                co_return fail<permit>(errc::rate_limited, "Rate limit exceeded.",
                    detail::error_detail().add_ms("retry_after", wait_time).str());
            if (deadline != clock::time_point::max() && clock::now() + wait_time > deadline)
                co_return fail<permit>(errc::rate_limited, "Rate limit wait timed out.",
                    detail::error_detail().add_ms("retry_after", wait_time).str());

            smtpxx::asio::steady_timer timer(executor_);
            timer.expires_after(wait_time);
            smtpxx::asio::error_code ec;
            co_await timer.async_wait(smtpxx::asio::redirect_error(smtpxx::asio::use_awaitable, ec));
            if (ec)
                co_return fail<permit>(errc::net_cancelled, "Rate limit wait cancelled.", {}, ec);
        }

        co_return co_await acquire_slot(deadline);
    }

    /**
     * Take a token without waiting; ignores the concurrency cap.
     * @return true if a token was taken
     */
    bool try_acquire()
    {
        if (!config_.enabled)
            return true;
        return try_take_token() == clock::duration::zero();
    }

    /**
     * Time until the next token is available; zero if one is available now.
     */
    [[nodiscard]] clock::duration time_until_available()
    {
        if (!config_.enabled || !config_.max_operations.has_value())
            return clock::duration::zero();

        std::lock_guard<std::mutex> lock(mutex_);
        refill_tokens();
        if (tokens_ >= 1.0)
            return clock::duration::zero();
        return compute_wait_time();
    }

    /**
     * Approximate token count, for monitoring.
     */
    [[nodiscard]] double available_tokens()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        refill_tokens();
        return tokens_;
    }

    [[nodiscard]] std::size_t in_flight() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return in_flight_;
    }

    /**
     * Refill the bucket; operations in flight keep their slots.
     */
    void reset()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        tokens_ = capacity();
        last_refill_ = clock::now();
    }

    [[nodiscard]] const rate_limit_config& config() const noexcept { return config_; }

private:
    [[nodiscard]] double capacity() const noexcept
    {
        return config_.max_operations.has_value() ? static_cast<double>(*config_.max_operations) : 0.0;
    }

    /// Takes a token, or returns how long until one is available.
    clock::duration try_take_token()
    {
        if (!config_.max_operations.has_value())
            return clock::duration::zero();

        std::lock_guard<std::mutex> lock(mutex_);
        refill_tokens();
        if (tokens_ >= 1.0)
        {
            tokens_ -= 1.0;
            return clock::duration::zero();
        }
        return compute_wait_time();
    }

    smtpxx::asio::awaitable<result<permit>> acquire_slot(clock::time_point deadline)
    {
        if (!config_.max_concurrent.has_value())
            co_return permit{};

        detail::wait_queue::ticket waiter;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (in_flight_ < *config_.max_concurrent)
            {
                ++in_flight_;
                co_return permit(*this);
            }
            if (config_.on_limit == limit_action::reject)
                co_return fail<permit>(errc::rate_limited, "Too many concurrent operations.",
                    detail::error_detail().add_int("max_concurrent", *config_.max_concurrent).str());
            waiter = waiters_.enqueue(deadline);
        }

        // The slot is handed over by release_slot() without being given back.
        if (!co_await waiters_.wait(waiter))
            co_return fail<permit>(errc::rate_limited, "Timed out waiting for a concurrency slot.",
                detail::error_detail().add_int("max_concurrent", *config_.max_concurrent).str());
        co_return permit(*this);
    }

    void release_slot() noexcept
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!waiters_.notify_one() && in_flight_ > 0)
            --in_flight_;
    }

    /**
     * Refill tokens based on elapsed time.
     */
    void refill_tokens()
    {
        const auto now = clock::now();
        const auto window_ns = std::chrono::duration_cast<std::chrono::nanoseconds>(config_.window).count();
        const auto elapsed_ns = std::chrono::duration_cast<std::chrono::nanoseconds>(now - last_refill_).count();

        // tokens to add = (elapsed / window) * max_operations
        if (window_ns > 0 && elapsed_ns > 0)
        {
            const double to_add = (static_cast<double>(elapsed_ns) / static_cast<double>(window_ns)) * capacity();
            tokens_ = std::min(tokens_ + to_add, capacity());
            last_refill_ = now;
        }
    }

    /**
     * Compute wait time for one token.
     */
    clock::duration compute_wait_time() const
    {
        if (capacity() <= 0.0)
            return std::chrono::hours(24);

        const auto window_ns = std::chrono::duration_cast<std::chrono::nanoseconds>(config_.window).count();
        const double per_token_ns = static_cast<double>(window_ns) / capacity();
        const double needed = 1.0 - tokens_;
        const auto wait = std::chrono::nanoseconds(static_cast<long long>(per_token_ns * needed) + 1);
        return std::chrono::duration_cast<clock::duration>(wait);
    }

    smtpxx::asio::any_io_executor executor_;
    rate_limit_config config_;
    detail::wait_queue waiters_;

    mutable std::mutex mutex_;
    double tokens_;
    clock::time_point last_refill_;
    std::size_t in_flight_{0};
};

} // namespace smtpxx::resilience
