/*

asio_decl.hpp
-------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Centralized Boost.Asio declarations for mailcast.
This header simplifies async notation throughout the library.

*/

#pragma once

#include <boost/asio/version.hpp>
#if BOOST_ASIO_VERSION < 101800 // Boost.Asio 1.18.0
#error "Boost.Asio version 1.18.0 or higher is required (Boost 1.74+)"
#endif

#include <boost/asio.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/ssl.hpp>

#if defined(BOOST_ASIO_HAS_CO_AWAIT)
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/use_future.hpp>

namespace mailcast::asio
{
    // Core types
    using boost::asio::awaitable;
    using boost::asio::buffer;
    using boost::asio::co_spawn;
    using boost::asio::detached;
    using boost::asio::use_awaitable;
    using boost::asio::use_future;
    using boost::asio::io_context;
    using boost::asio::thread_pool;
    using boost::asio::any_io_executor;
    using boost::asio::steady_timer;
    using boost::asio::redirect_error;
    using boost::asio::make_strand;
    using boost::asio::post;

    namespace this_coro = boost::asio::this_coro;

    // IP networking
    namespace ip = boost::asio::ip;
    using tcp = boost::asio::ip::tcp;

    // Async operations
    using boost::asio::async_write;
    using boost::asio::async_read_until;
    using boost::asio::async_connect;
    using boost::asio::dynamic_buffer;

    namespace ssl = boost::asio::ssl;
    namespace error = boost::asio::error;

    using error_code = boost::system::error_code;
    using system_error = boost::system::system_error;

    /// Non-throwing awaitable: the error lands in `ec` instead of an exception
    [[nodiscard]] inline auto use_nothrow_awaitable(error_code& ec)
    {
        return boost::asio::redirect_error(boost::asio::use_awaitable, ec);
    }

} // namespace mailcast::asio

#else
#error "mailcast requires coroutine support (C++20) and Boost.Asio 1.18+ (Boost 1.74+)"
#endif

// Common chrono literals
namespace mailcast
{
    using namespace std::literals::chrono_literals;
    using std::chrono::steady_clock;
}
