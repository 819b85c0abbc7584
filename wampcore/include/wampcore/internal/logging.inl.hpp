/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#include "../logging.hpp"
#include <sstream>
#include <utility>
#include "../api.hpp"
#include "timeformatting.hpp"

namespace wampcore
{

WAMPCORE_INLINE const char* logLevelLabel(LogLevel level)
{
    switch (level)
    {
    case LogLevel::trace:    return "trace";
    case LogLevel::debug:    return "debug";
    case LogLevel::info:     return "info";
    case LogLevel::warning:  return "warning";
    case LogLevel::error:    return "error";
    case LogLevel::critical: return "critical";
    default:                 break;
    }
    return "off";
}

WAMPCORE_INLINE LogEntry::LogEntry(LogLevel severity, std::string message,
                                   std::error_code ec)
    : message_(std::move(message)),
      ec_(ec),
      when_(std::chrono::system_clock::now()),
      severity_(severity)
{}

WAMPCORE_INLINE LogLevel LogEntry::severity() const {return severity_;}

WAMPCORE_INLINE const std::string& LogEntry::message() const {return message_;}

WAMPCORE_INLINE const std::error_code& LogEntry::error() const {return ec_;}

WAMPCORE_INLINE LogEntry::TimePoint LogEntry::when() const {return when_;}

WAMPCORE_INLINE std::ostream& toStream(std::ostream& out, const LogEntry& entry,
                                       const std::string& origin)
{
    internal::outputRfc3339TimestampInMilliseconds(out, entry.when());
    out << " | " << origin
        << " | " << logLevelLabel(entry.severity())
        << " | " << entry.message() << " | ";

    const auto& ec = entry.error();
    if (!ec)
        return out << '-';
    return out << ec.category().name() << ':' << ec.value()
               << " (" << ec.message() << ')';
}

WAMPCORE_INLINE std::string toString(const LogEntry& entry)
{
    std::ostringstream oss;
    toStream(oss, entry);
    return oss.str();
}

WAMPCORE_INLINE std::ostream& operator<<(std::ostream& out,
                                         const LogEntry& entry)
{
    return toStream(out, entry);
}

} // namespace wampcore
