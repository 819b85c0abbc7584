/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#ifndef WAMPCORE_INTERNAL_TIMEFORMATTING_HPP
#define WAMPCORE_INTERNAL_TIMEFORMATTING_HPP

#include <chrono>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <locale>
#include <ostream>

namespace wampcore
{

namespace internal
{

//------------------------------------------------------------------------------
// Outputs YYYY-MM-DDTHH:MM:SS.sssZ
//------------------------------------------------------------------------------
inline std::ostream& outputRfc3339TimestampInMilliseconds(
    std::ostream& out, std::chrono::system_clock::time_point when)
{
    namespace chrono = std::chrono;
    auto sinceEpoch = when.time_since_epoch();
    auto secs = chrono::duration_cast<chrono::seconds>(sinceEpoch);
    if (secs > sinceEpoch)
        secs -= chrono::seconds{1};
    auto millis = chrono::duration_cast<chrono::milliseconds>(sinceEpoch - secs);

    std::time_t time = static_cast<std::time_t>(secs.count());
    std::tm tmb;
    std::memset(&tmb, 0, sizeof(tmb));
#if defined(_WIN32)
    ::gmtime_s(&tmb, &time);
#else
    ::gmtime_r(&time, &tmb);
#endif

    auto locale = out.getloc();
    out.imbue(std::locale::classic());
    auto fill = out.fill();
    out << std::put_time(&tmb, "%FT%T") << '.'
        << std::setfill('0') << std::setw(3) << millis.count() << 'Z';
    out.fill(fill);
    out.imbue(locale);
    return out;
}

} // namespace internal

} // namespace wampcore

#endif // WAMPCORE_INTERNAL_TIMEFORMATTING_HPP
