/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#ifndef WAMPCORE_ASIODEFS_HPP
#define WAMPCORE_ASIODEFS_HPP

/** @file
    @brief Commonly used Boost.Asio type aliases. */

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/strand.hpp>

namespace wampcore
{

/** Queues and runs I/O completion handlers. */
using IoContext = boost::asio::io_context;

/** Polymorphic executor for I/O objects. */
using AnyIoExecutor = boost::asio::any_io_executor;

/** Serializes I/O operations. */
using IoStrand = boost::asio::strand<AnyIoExecutor>;

} // namespace wampcore

#endif // WAMPCORE_ASIODEFS_HPP
