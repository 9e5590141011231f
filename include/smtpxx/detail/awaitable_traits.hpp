/*

awaitable_traits.hpp
--------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <type_traits>

#include <smtpxx/detail/asio_decl.hpp>

namespace smtpxx::detail
{

template<class>
struct awaitable_value;

template<class T, class Executor>
struct awaitable_value<smtpxx::asio::awaitable<T, Executor>>
{
    using type = T;
};

template<class T>
using awaitable_value_t = typename awaitable_value<std::remove_cvref_t<T>>::type;

/// Value type of the result<T> produced by an awaitable<result<T>> factory.
template<class F>
using awaited_result_value_t = typename awaitable_value_t<std::invoke_result_t<F&>>::value_type;

} // namespace smtpxx::detail
