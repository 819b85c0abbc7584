/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#include "../consolelogger.hpp"
#include <iostream>
#include "../api.hpp"

namespace wampcore
{

//------------------------------------------------------------------------------
struct ConsoleLogger::Impl
{
    Impl(std::string origin, bool flush)
        : origin(std::move(origin)),
          flushOnWrite(flush)
    {}

    std::string origin;
    bool flushOnWrite = false;
};

WAMPCORE_INLINE ConsoleLogger::ConsoleLogger()
    : ConsoleLogger("wampcore")
{}

WAMPCORE_INLINE ConsoleLogger::ConsoleLogger(std::string originLabel,
                                             bool flushOnWrite)
    : impl_(std::make_shared<Impl>(std::move(originLabel), flushOnWrite))
{}

WAMPCORE_INLINE void ConsoleLogger::operator()(const LogEntry& entry) const
{
    auto& impl = *impl_;
    if (entry.severity() < LogLevel::warning)
    {
        toStream(std::clog, entry, impl.origin) << "\n";
        if (impl.flushOnWrite)
            std::clog << std::flush;
    }
    else
    {
        toStream(std::cerr, entry, impl.origin) << std::endl;
    }
}

} // namespace wampcore
