/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#include <chrono>
#include <sstream>
#include <string>
#include <catch2/catch.hpp>
#include <wampcore/consolelogger.hpp>
#include <wampcore/errorcodes.hpp>
#include <wampcore/logging.hpp>
#include <wampcore/internal/timeformatting.hpp>
#include "clienttesting.hpp"

using namespace wampcore;
using namespace wampcore::test;

//------------------------------------------------------------------------------
SCENARIO( "Log entries", "[Logging]" )
{
    WHEN( "constructing an entry without an error code" )
    {
        auto before = std::chrono::system_clock::now();
        LogEntry entry(LogLevel::info, "Joined realm");
        auto after = std::chrono::system_clock::now();

        CHECK( entry.severity() == LogLevel::info );
        CHECK( entry.message() == "Joined realm" );
        CHECK( !entry.error() );
        CHECK( entry.when() >= before );
        CHECK( entry.when() <= after );

        THEN( "it formats with a placeholder for the error field" )
        {
            auto text = toString(entry);
            CHECK_THAT( text, Catch::Matchers::EndsWith(
                " | wampcore | info | Joined realm | -") );
            CHECK( text.at(4) == '-' );
            CHECK( text.at(10) == 'T' );
            CHECK( text.find("Z | ") == 23 );
        }
    }

    WHEN( "constructing an entry with an error code" )
    {
        LogEntry entry(LogLevel::error, "Transport connection lost",
                       make_error_code(TransportErrc::disconnected));

        THEN( "the error code is included in the output" )
        {
            std::ostringstream oss;
            toStream(oss, entry, "myapp");
            CHECK_THAT( oss.str(), Catch::Matchers::Contains(
                " | myapp | error | Transport connection lost | "
                "wampcore::TransportCategory:2 "
                "(Transport closed by the remote peer)") );
        }
    }

    WHEN( "obtaining level labels" )
    {
        CHECK( std::string(logLevelLabel(LogLevel::trace)) == "trace" );
        CHECK( std::string(logLevelLabel(LogLevel::warning)) == "warning" );
        CHECK( std::string(logLevelLabel(LogLevel::off)) == "off" );
    }

    WHEN( "outputting the timestamp alone" )
    {
        using namespace std::chrono;
        LogEntry::TimePoint epoch{milliseconds(1500)};
        std::ostringstream oss;
        internal::outputRfc3339TimestampInMilliseconds(oss, epoch);
        CHECK( oss.str() == "1970-01-01T00:00:01.500Z" );
    }

    WHEN( "using a console logger as a handler" )
    {
        LogHandler handler = ConsoleLogger("wampcore-test", true);
        CHECK_NOTHROW( handler(LogEntry(LogLevel::debug, "to clog")) );
        CHECK_NOTHROW( handler(LogEntry(LogLevel::warning, "to cerr")) );
    }
}

//------------------------------------------------------------------------------
SCENARIO( "Session log filtering", "[Logging][Session]" )
{
    ClientFixture f;

    GIVEN( "a session logging at the default threshold" )
    {
        f.transport->respondTo(Kind::hello, {"[2,1,{}]"});
        auto config = f.config().withLogLevel(LogLevel::warning);
        f.session.open(std::move(config), [](ErrorOr<Welcome>) {});
        drain(f.ioctx);
        f.transport->inject("[17,99,1]");
        drain(f.ioctx);

        THEN( "only entries at or above warning are delivered" )
        {
            CHECK( f.countLogs(LogLevel::trace) == 0 );
            CHECK( f.countLogs(LogLevel::info) == 0 );
            CHECK( f.countLogs(LogLevel::warning) == 1 );
        }
    }

    GIVEN( "a session logging at trace level" )
    {
        f.join();

        THEN( "message traces and lifecycle milestones are delivered" )
        {
            CHECK( f.countLogs(LogLevel::trace) == 2 );
            CHECK( f.countLogs(LogLevel::info) == 1 );
        }
    }

    GIVEN( "a session with logging turned off" )
    {
        f.transport->respondTo(Kind::hello, {"[2,1,{}]"});
        f.session.open(f.config().withLogLevel(LogLevel::off),
                       [](ErrorOr<Welcome>) {});
        drain(f.ioctx);
        f.transport->fail(make_error_code(TransportErrc::failed));
        drain(f.ioctx);

        THEN( "nothing is delivered" )
        {
            CHECK( f.logs.empty() );
        }
    }
}
