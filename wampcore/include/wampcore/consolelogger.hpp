/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#ifndef WAMPCORE_CONSOLELOGGER_HPP
#define WAMPCORE_CONSOLELOGGER_HPP

//------------------------------------------------------------------------------
/** @file
    @brief Contains the ConsoleLogger class. */
//------------------------------------------------------------------------------

#include <memory>
#include <string>
#include "api.hpp"
#include "logging.hpp"

namespace wampcore
{

//------------------------------------------------------------------------------
/** Outputs log entries to the console.
    The format is per wampcore::toString(const LogEntry&).
    Entries below LogLevel::warning are output to std::clog, and all others
    are output to std::cerr. Concurrent output operations are not serialized.
    Instances are cheap to copy and may be used directly as a LogHandler. */
//------------------------------------------------------------------------------
class WAMPCORE_API ConsoleLogger
{
public:
    /** Default constructor. */
    ConsoleLogger();

    /** Constructor taking a custom origin label. */
    explicit ConsoleLogger(std::string originLabel, bool flushOnWrite = false);

    /** Outputs the given log entry to the console. */
    void operator()(const LogEntry& entry) const;

private:
    struct Impl;
    std::shared_ptr<Impl> impl_;
};

} // namespace wampcore

#ifndef WAMPCORE_COMPILED_LIB
#include "internal/consolelogger.inl.hpp"
#endif

#endif // WAMPCORE_CONSOLELOGGER_HPP
