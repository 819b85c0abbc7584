/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#ifndef WAMPCORE_LOGGING_HPP
#define WAMPCORE_LOGGING_HPP

/** @file
    @brief Log entries emitted by sessions and the connection manager. */

#include <chrono>
#include <functional>
#include <ostream>
#include <string>
#include <system_error>
#include "api.hpp"

namespace wampcore
{

//------------------------------------------------------------------------------
/** Severity of a log entry. A session only emits entries at or above the
    level set via SessionConfig::withLogLevel. */
//------------------------------------------------------------------------------
enum class LogLevel
{
    trace,   ///< Every WAMP message sent and received
    debug,   ///< Discarded results, events and stale replies
    info,    ///< Session opened, left or closed
    warning, ///< Unmatched replies and failing event slots
    error,   ///< Protocol violations and transport failures
    critical,
    off      ///< Emits nothing
};

/** Obtains the lowercase name of a level, as used in formatted entries. */
WAMPCORE_API const char* logLevelLabel(LogLevel level);

//------------------------------------------------------------------------------
/** Timestamped message, optionally carrying the error code that caused it. */
//------------------------------------------------------------------------------
class WAMPCORE_API LogEntry
{
public:
    using TimePoint = std::chrono::system_clock::time_point;

    LogEntry(LogLevel severity, std::string message, std::error_code ec = {});

    LogLevel severity() const;

    const std::string& message() const;

    const std::error_code& error() const;

    TimePoint when() const;

private:
    std::string message_;
    std::error_code ec_;
    TimePoint when_;
    LogLevel severity_;
};

/** Formats an entry as
    `<UTC timestamp> | <origin> | <level> | <message> | <error>`, where the
    error field is `-` if there is no error code.
    @relates LogEntry */
WAMPCORE_API std::ostream& toStream(std::ostream& out, const LogEntry& entry,
                                    const std::string& origin = "wampcore");

/** Same as toStream with the default origin.
    @relates LogEntry */
WAMPCORE_API std::string toString(const LogEntry& entry);

/** @relates LogEntry */
WAMPCORE_API std::ostream& operator<<(std::ostream& out, const LogEntry& entry);

/** Receives the entries of a session or connection manager. */
using LogHandler = std::function<void (const LogEntry&)>;

} // namespace wampcore

#ifndef WAMPCORE_COMPILED_LIB
#include "internal/logging.inl.hpp"
#endif

#endif // WAMPCORE_LOGGING_HPP
