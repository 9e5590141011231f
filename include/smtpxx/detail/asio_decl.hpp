/*

asio_decl.hpp
-------------

Boost.Asio names used across smtpxx, gathered under `smtpxx::asio`.


Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <boost/asio/version.hpp>

// Boost 1.74 ships Asio 1.18, the first release with usable C++20 coroutines.
#if BOOST_ASIO_VERSION < 101800
#error "smtpxx needs Boost.Asio 1.18 (Boost 1.74) or newer"
#endif

#include <boost/asio.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/use_future.hpp>

#if !defined(BOOST_ASIO_HAS_CO_AWAIT)
#error "smtpxx needs a compiler with C++20 coroutine support"
#endif

namespace smtpxx::asio
{

// executors and coroutines
using boost::asio::any_io_executor;
using boost::asio::awaitable;
using boost::asio::co_spawn;
using boost::asio::detached;
using boost::asio::io_context;
using boost::asio::redirect_error;
using boost::asio::steady_timer;
using boost::asio::use_awaitable;
using boost::asio::use_future;
namespace this_coro = boost::asio::this_coro;

// sockets and streams
namespace ip = boost::asio::ip;
namespace ssl = boost::asio::ssl;
using tcp = boost::asio::ip::tcp;
using boost::asio::async_connect;
using boost::asio::async_read_until;
using boost::asio::async_write;
using boost::asio::buffer;
using boost::asio::dynamic_buffer;

namespace error = boost::asio::error;
using error_code = boost::system::error_code;

} // namespace smtpxx::asio
