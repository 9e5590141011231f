/*

deadline.hpp
------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <chrono>
#include <memory>
#include <utility>

#include <smtpxx/detail/asio_decl.hpp>

namespace smtpxx::net
{

/**
Timer that runs a cancellation action if an operation outlives its budget.
Used for operations the dialog does not wrap (resolve, connect, TLS handshake).
Disarm it as soon as the guarded operation completes.
**/
class deadline
{
public:
    template<typename OnExpire>
    deadline(smtpxx::asio::any_io_executor executor, std::chrono::steady_clock::duration budget, OnExpire on_expire)
        : timer_(std::move(executor)),
          state_(std::make_shared<state_t>())
    {
        timer_.expires_after(budget);
        timer_.async_wait([state = state_, on_expire = std::move(on_expire)](const smtpxx::asio::error_code& ec) mutable
        {
            if (ec || state->disarmed)
                return;
            state->expired = true;
            on_expire();
        });
    }

    deadline(const deadline&) = delete;
    deadline& operator=(const deadline&) = delete;

    ~deadline()
    {
        disarm();
    }

    void disarm()
    {
        if (state_->disarmed)
            return;
        state_->disarmed = true;
        timer_.cancel();
    }

    [[nodiscard]] bool expired() const noexcept { return state_->expired; }

private:
    struct state_t
    {
        bool disarmed = false;
        bool expired = false;
    };

    smtpxx::asio::steady_timer timer_;
    std::shared_ptr<state_t> state_;
};

} // namespace smtpxx::net
