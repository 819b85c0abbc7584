/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#include <chrono>
#include <vector>
#include <catch2/catch.hpp>
#include <wampcore/connectionmanager.hpp>
#include <wampcore/internal/backofftimer.hpp>
#include "clienttesting.hpp"

using namespace wampcore;
using namespace wampcore::test;

namespace
{

using Ms = std::chrono::milliseconds;

//------------------------------------------------------------------------------
// Produces a fresh scripted transport per connection attempt. Attempts
// listed in `refused` get no transport at all.
//------------------------------------------------------------------------------
struct TransportSupply
{
    explicit TransportSupply(IoContext& ioctx) : ioctx(ioctx) {}

    SessionConfig config()
    {
        return SessionConfig(
            testRealm,
            [this](AnyIoExecutor) -> Transporting::Ptr
            {
                auto n = attempts++;
                if (n < refusals)
                    return nullptr;
                auto t = MockTransport::create(ioctx.get_executor());
                t->respondTo(Kind::hello,
                             {"[2," + std::to_string(100 + n) + ",{}]"});
                transports.push_back(t);
                return t;
            })
            .withLogLevel(LogLevel::warning)
            .withLogHandler([this](const LogEntry& e) {logs.push_back(e);});
    }

    IoContext& ioctx;
    std::vector<MockTransport::Ptr> transports;
    std::vector<LogEntry> logs;
    std::size_t attempts = 0;
    std::size_t refusals = 0;
};

ConnectionManagerOptions fastRetries(std::size_t maxAttempts = 0)
{
    return ConnectionManagerOptions()
        .withBackoff(BinaryExponentialBackoff(Ms(1), Ms(4)))
        .withMaxAttempts(maxAttempts);
}

} // anonymous namespace

//------------------------------------------------------------------------------
SCENARIO( "ConnectionManager establishing a session", "[ConnectionManager]" )
{
    IoContext ioctx;
    TransportSupply supply(ioctx);
    std::vector<SessionId> established;
    std::vector<std::error_code> failures;

    auto onEstablished = [&established](Session& s, Welcome w)
    {
        CHECK( s.state() == SessionState::established );
        established.push_back(w.id());
    };
    auto onFailure = [&failures](std::error_code ec) {failures.push_back(ec);};

    GIVEN( "a router that accepts the first attempt" )
    {
        ConnectionManager mgr(ioctx.get_executor(), supply.config(),
                              fastRetries());
        mgr.start(onEstablished, onFailure);
        CHECK( mgr.isRunning() );
        drain(ioctx);

        THEN( "the session is established once" )
        {
            CHECK( established == (std::vector<SessionId>{100}) );
            CHECK( failures.empty() );
            CHECK( mgr.failureCount() == 0 );
            CHECK( mgr.session().state() == SessionState::established );
        }
    }

    GIVEN( "a router that is unreachable for two attempts" )
    {
        supply.refusals = 2;
        ConnectionManager mgr(ioctx.get_executor(), supply.config(),
                              fastRetries());
        mgr.start(onEstablished, onFailure);
        drain(ioctx);

        THEN( "the third attempt succeeds" )
        {
            CHECK( supply.attempts == 3 );
            CHECK( established == (std::vector<SessionId>{102}) );
            CHECK( failures.empty() );
            CHECK( mgr.failureCount() == 0 );
        }

        THEN( "each retry was logged as a warning" )
        {
            std::size_t retries = 0;
            for (const auto& e: supply.logs)
            {
                if (e.severity() == LogLevel::warning &&
                    e.message().find("retrying in") != std::string::npos)
                {
                    ++retries;
                }
            }
            CHECK( retries == 2 );
        }
    }

    GIVEN( "a router that is never reachable" )
    {
        supply.refusals = 100;
        ConnectionManager mgr(ioctx.get_executor(), supply.config(),
                              fastRetries(3));
        mgr.start(onEstablished, onFailure);
        drain(ioctx);

        THEN( "the manager gives up after the maximum number of attempts" )
        {
            CHECK( supply.attempts == 3 );
            CHECK( established.empty() );
            REQUIRE( failures.size() == 1 );
            CHECK( failures.front() == TransportErrc::failed );
            CHECK( mgr.failureCount() == 3 );
            CHECK_FALSE( mgr.isRunning() );
        }
    }
}

//------------------------------------------------------------------------------
SCENARIO( "ConnectionManager recovering from a dropped session",
          "[ConnectionManager]" )
{
    IoContext ioctx;
    TransportSupply supply(ioctx);
    std::vector<SessionId> established;

    ConnectionManager mgr(ioctx.get_executor(), supply.config(),
                          fastRetries());
    mgr.start([&established](Session&, Welcome w)
              {
                  established.push_back(w.id());
              });
    drain(ioctx);
    REQUIRE( established.size() == 1 );
    REQUIRE( supply.transports.size() == 1 );

    WHEN( "the transport is lost" )
    {
        supply.transports.back()->fail(
            make_error_code(TransportErrc::disconnected));
        drain(ioctx);

        THEN( "a new session is established over a new transport" )
        {
            CHECK( established == (std::vector<SessionId>{100, 101}) );
            CHECK( supply.transports.size() == 2 );
            CHECK( mgr.session().state() == SessionState::established );
            CHECK( mgr.session().id() == 101 );
        }
    }

    WHEN( "the router ends the session with GOODBYE" )
    {
        supply.transports.back()->inject(R"([6,{},"wamp.close.killed"])");
        drain(ioctx);

        THEN( "no reconnection is attempted" )
        {
            CHECK( established.size() == 1 );
            CHECK( supply.attempts == 1 );
            CHECK( mgr.session().state() == SessionState::closed );
        }
    }

    WHEN( "the manager is stopped" )
    {
        mgr.stop();
        drain(ioctx);

        THEN( "the session is closed and stays closed" )
        {
            CHECK_FALSE( mgr.isRunning() );
            CHECK( mgr.session().state() == SessionState::closed );
            CHECK( supply.transports.back()->isClosed() );
            CHECK( supply.attempts == 1 );
        }
    }
}

//------------------------------------------------------------------------------
SCENARIO( "Backoff options", "[ConnectionManager]" )
{
    WHEN( "using the defaults" )
    {
        BinaryExponentialBackoff b;
        CHECK( b.min() == std::chrono::seconds(1) );
        CHECK( b.max() == std::chrono::seconds(32) );
        ConnectionManagerOptions opts;
        CHECK( opts.maxAttempts() == 0 );
    }

    WHEN( "specifying invalid delays" )
    {
        ConnectionManagerOptions opts;
        CHECK_THROWS_AS(
            opts.withBackoff(BinaryExponentialBackoff(Ms(0), Ms(10))),
            error::Logic );
        CHECK_THROWS_AS(
            opts.withBackoff(BinaryExponentialBackoff(Ms(10), Ms(5))),
            error::Logic );
        CHECK_NOTHROW(
            opts.withBackoff(BinaryExponentialBackoff(Ms(10), Ms(10))) );
    }

    WHEN( "waiting repeatedly" )
    {
        IoContext ioctx;
        internal::BinaryExponentialBackoffTimer timer(
            ioctx.get_executor(), BinaryExponentialBackoff(Ms(1), Ms(5)));
        std::vector<Ms> delays;
        int fired = 0;

        for (int i=0; i<5; ++i)
        {
            timer.wait([&fired](boost::system::error_code) {++fired;});
            delays.push_back(
                std::chrono::duration_cast<Ms>(timer.currentDelay()));
            drain(ioctx);
        }

        THEN( "the delay doubles until saturating at the max" )
        {
            CHECK( fired == 5 );
            CHECK( delays == (std::vector<Ms>{Ms(1), Ms(2), Ms(4), Ms(5),
                                              Ms(5)}) );
        }

        THEN( "resetting restarts at the min delay" )
        {
            timer.reset();
            CHECK( timer.currentDelay() == Ms(0) );
            timer.wait([](boost::system::error_code) {});
            CHECK( timer.currentDelay() == Ms(1) );
            drain(ioctx);
        }
    }
}
