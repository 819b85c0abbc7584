/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#include <vector>
#include <catch2/catch.hpp>
#include "clienttesting.hpp"

using namespace wampcore;
using namespace wampcore::test;

namespace
{

//------------------------------------------------------------------------------
Outcome square(Invocation inv)
{
    int n = 0;
    inv.convertTo(n);
    return Result{n * n};
}

} // anonymous namespace

//------------------------------------------------------------------------------
SCENARIO( "Registering and invoking procedures", "[Session][RPC]" )
{
    ClientFixture f;
    f.join();
    f.transport->respondTo(Kind::enroll, {"[65,1,9]"});

    Captured<Registration> reg;
    f.session.enroll("com.math.square", &square, reg.handler());
    drain(f.ioctx);

    THEN( "a REGISTER is sent and the registration is returned" )
    {
        CHECK( f.transport->lastSent() ==
               (Array{64, 1, Object{}, "com.math.square"}) );
        REQUIRE( reg.done() );
        REQUIRE( reg.result.has_value() );
        CHECK( reg.result->id() == 9 );
        CHECK( reg.result->uri() == "com.math.square" );
    }

    WHEN( "the router sends an INVOCATION" )
    {
        f.transport->inject("[68,7,9,{},[4]]");
        drain(f.ioctx);

        THEN( "the result is yielded immediately" )
        {
            CHECK( f.transport->lastSent() ==
                   (Array{70, 7, Object{}, Array{16}}) );
            CHECK( f.transport->sentOfKind(Kind::yield).size() == 1 );
        }
    }

    WHEN( "the INVOCATION has bad argument types" )
    {
        f.transport->inject(R"([68,8,9,{},["four"]])");
        drain(f.ioctx);

        THEN( "an invalid_argument ERROR is returned to the router" )
        {
            auto msg = f.transport->lastSent();
            REQUIRE( msg.size() >= 5 );
            CHECK( msg[0] == 8 );
            CHECK( msg[1] == 68 );
            CHECK( msg[2] == 8 );
            CHECK( msg[4] == "wamp.error.invalid_argument" );
        }
    }

    WHEN( "the router invokes an unknown registration" )
    {
        f.transport->inject("[68,10,999,{},[4]]");
        drain(f.ioctx);

        THEN( "a no_such_registration ERROR is returned" )
        {
            CHECK( f.transport->lastSent() ==
                   (Array{8, 68, 10, Object{},
                          "wamp.error.no_such_registration"}) );
            CHECK( f.hasLogContaining(LogLevel::warning,
                                      "unknown registration ID 999") );
            CHECK( f.session.state() == SessionState::established );
        }
    }

    WHEN( "registering the same procedure again" )
    {
        auto count = f.transport->sentCount();
        Captured<Registration> dup;
        f.session.enroll("com.math.square", &square, dup.handler());
        drain(f.ioctx);

        THEN( "it fails locally without contacting the router" )
        {
            REQUIRE( dup.done() );
            REQUIRE_FALSE( dup.result.has_value() );
            CHECK( dup.result.error() == MiscErrc::duplicateRegistration );
            CHECK( f.transport->sentCount() == count );
        }
    }

    WHEN( "unregistering" )
    {
        f.transport->respondTo(Kind::unregister, {"[67,2]"});
        Captured<bool> done;
        f.session.unregister(*reg.result, done.handler());
        drain(f.ioctx);

        THEN( "an UNREGISTER is sent and the URI becomes available again" )
        {
            CHECK( f.transport->lastSent() == (Array{66, 2, 9}) );
            REQUIRE( done.done() );
            CHECK( done.result == true );

            f.transport->respondTo(Kind::enroll, {"[65,3,10]"});
            Captured<Registration> again;
            f.session.enroll("com.math.square", &square, again.handler());
            drain(f.ioctx);
            REQUIRE( again.result.has_value() );
            CHECK( again.result->id() == 10 );
        }

        THEN( "unregistering again completes with false" )
        {
            Captured<bool> again;
            f.session.unregister(*reg.result, again.handler());
            drain(f.ioctx);
            CHECK( again.result == false );
        }
    }
}

//------------------------------------------------------------------------------
SCENARIO( "Registration failures", "[Session][RPC]" )
{
    ClientFixture f;
    f.join();

    GIVEN( "a router that rejects the registration" )
    {
        f.transport->respondTo(
            Kind::enroll,
            {R"([8,64,1,{},"wamp.error.procedure_already_exists"])"});
        f.transport->respondTo(Kind::enroll, {"[65,2,4]"});

        Captured<Registration> reg;
        f.session.enroll("com.math.square", &square, reg.handler());
        drain(f.ioctx);

        THEN( "the error is reported and the URI can be retried" )
        {
            REQUIRE( reg.done() );
            CHECK( reg.result.error() == WampErrc::procedureAlreadyExists );

            Captured<Registration> retry;
            f.session.enroll("com.math.square", &square, retry.handler());
            drain(f.ioctx);
            CHECK( retry.result.has_value() );
        }
    }

    GIVEN( "an empty call slot" )
    {
        Captured<Registration> reg;
        CHECK_THROWS_AS(
            f.session.enroll("com.math.square", nullptr, reg.handler()),
            error::Logic );
    }
}

//------------------------------------------------------------------------------
SCENARIO( "Deferred invocation results", "[Session][RPC]" )
{
    ClientFixture f;
    f.join();
    f.transport->respondTo(Kind::enroll, {"[65,1,9]"});

    std::vector<Invocation> pending;
    Captured<Registration> reg;
    f.session.enroll(
        "com.math.slowsquare",
        [&pending](Invocation inv) -> Outcome
        {
            pending.push_back(std::move(inv));
            return deferment;
        },
        reg.handler());
    drain(f.ioctx);

    f.transport->inject("[68,7,9,{},[3]]");
    f.transport->inject("[68,8,9,{},[5]]");
    drain(f.ioctx);

    REQUIRE( pending.size() == 2 );
    CHECK( f.transport->sentOfKind(Kind::yield).empty() );

    WHEN( "yielding out of order" )
    {
        pending[1].yield(Result{25});
        pending[0].yield(Error(WampErrc::invalidArgument, "too slow"));
        drain(f.ioctx);

        THEN( "each invocation is answered with its own request ID" )
        {
            auto yields = f.transport->sentOfKind(Kind::yield);
            REQUIRE( yields.size() == 1 );
            CHECK( yields[0] == (Array{70, 8, Object{}, Array{25}}) );

            auto errors = f.transport->sentOfKind(Kind::error);
            REQUIRE( errors.size() == 1 );
            CHECK( errors[0] == (Array{8, 68, 7, Object{},
                                       "wamp.error.invalid_argument",
                                       Array{"too slow"}}) );
        }

        THEN( "yielding twice is discarded with a warning" )
        {
            pending[1].yield(Result{0});
            drain(f.ioctx);
            CHECK( f.transport->sentOfKind(Kind::yield).size() == 1 );
            CHECK( f.hasLogContaining(LogLevel::warning,
                                      "already answered") );
        }
    }

    WHEN( "yielding after the session is closed" )
    {
        f.session.close();
        drain(f.ioctx);
        auto count = f.transport->sentCount();
        pending[0].yield(Result{9});
        drain(f.ioctx);

        THEN( "the result is discarded" )
        {
            CHECK( f.transport->sentCount() == count );
        }
    }

    WHEN( "yielding a result held over from a previous session" )
    {
        f.session.close();
        drain(f.ioctx);
        f.renewTransport();
        f.join();
        f.transport->respondTo(Kind::enroll, {"[65,1,9]"});

        Captured<Registration> reg2;
        f.session.enroll(
            "com.math.slowsquare",
            [&pending](Invocation inv) -> Outcome
            {
                pending.push_back(std::move(inv));
                return deferment;
            },
            reg2.handler());
        drain(f.ioctx);
        REQUIRE( reg2.result.has_value() );

        f.transport->inject("[68,7,9,{},[4]]");
        drain(f.ioctx);
        REQUIRE( pending.size() == 3 );
        CHECK( pending[2].requestId() == pending[0].requestId() );

        pending[0].yield(Result{9});
        drain(f.ioctx);

        THEN( "the stale result does not answer the new invocation" )
        {
            CHECK( f.transport->sentOfKind(Kind::yield).empty() );
            CHECK( f.hasLogContaining(LogLevel::debug,
                                      "from a previous session") );
        }

        THEN( "the new invocation can still be answered" )
        {
            pending[2].yield(Result{16});
            drain(f.ioctx);
            auto yields = f.transport->sentOfKind(Kind::yield);
            REQUIRE( yields.size() == 1 );
            CHECK( yields[0] == (Array{70, 7, Object{}, Array{16}}) );
        }
    }

    WHEN( "the session object is gone" )
    {
        Invocation orphan;
        CHECK_FALSE( orphan.ready() );
        CHECK_NOTHROW( orphan.yield(Result{1}) );
    }
}

//------------------------------------------------------------------------------
SCENARIO( "Calling procedures", "[Session][RPC]" )
{
    ClientFixture f;
    f.join();

    WHEN( "the router returns a result" )
    {
        f.transport->respondTo(Kind::call,
                               {R"([50,1,{"progress":false},[16],{"k":"v"}])"});
        Captured<Result> result;
        f.session.call(Rpc("com.math.square").withArgs(4), result.handler());
        drain(f.ioctx);

        THEN( "a CALL is sent and the result is returned" )
        {
            CHECK( f.transport->lastSent() ==
                   (Array{48, 1, Object{}, "com.math.square", Array{4}}) );
            REQUIRE( result.done() );
            REQUIRE( result.result.has_value() );
            CHECK( result.result->requestId() == 1 );
            CHECK( result.result->args() == Array{16} );
            CHECK( result.result->kwargs() == (Object{{"k", "v"}}) );
            CHECK( result.result->details().at("progress") == false );

            int n = 0;
            CHECK( result.result->convertTo(n) == 1 );
            CHECK( n == 16 );
        }
    }

    WHEN( "the router returns an error" )
    {
        f.transport->respondTo(
            Kind::call,
            {R"([8,48,1,{"x":1},"wamp.error.invalid_argument",["bad"],{"y":2}])"});
        Error error;
        Captured<Result> result;
        f.session.call(Rpc("com.math.square").withArgs("four")
                                             .captureError(error),
                       result.handler());
        drain(f.ioctx);

        THEN( "the call fails and the error is captured" )
        {
            REQUIRE( result.done() );
            REQUIRE_FALSE( result.result.has_value() );
            CHECK( result.result.error() == WampErrc::invalidArgument );
            REQUIRE( bool(error) );
            CHECK( error.uri() == "wamp.error.invalid_argument" );
            CHECK( error.details().at("x") == 1 );
            CHECK( error.args() == Array{"bad"} );
            CHECK( error.kwargs() == (Object{{"y", 2}}) );
        }
    }

    WHEN( "the router returns an application-specific error" )
    {
        f.transport->respondTo(
            Kind::call, {R"([8,48,1,{},"com.myapp.error.overflow"])"});
        Error error;
        Captured<Result> result;
        f.session.call(Rpc("com.math.square").captureError(error),
                       result.handler());
        drain(f.ioctx);

        CHECK( result.result.error() == WampErrc::unknown );
        CHECK( error.uri() == "com.myapp.error.overflow" );
    }

    WHEN( "several calls are pending when the session is closed" )
    {
        const std::size_t n = 5;
        std::vector<ErrorOr<Result>> results;
        for (std::size_t i=0; i<n; ++i)
        {
            f.session.call(Rpc("com.myapp.slow").withArgs(i),
                           [&results](ErrorOr<Result> r)
                           {
                               results.push_back(std::move(r));
                           });
        }
        drain(f.ioctx);
        REQUIRE( results.empty() );
        CHECK( f.transport->sentOfKind(Kind::call).size() == n );

        f.session.close();
        drain(f.ioctx);

        THEN( "each call completes exactly once with abandoned" )
        {
            REQUIRE( results.size() == n );
            for (const auto& r: results)
                CHECK( r.error() == MiscErrc::abandoned );
        }

        THEN( "late replies are ignored" )
        {
            f.transport->inject("[50,1,{}]");
            drain(f.ioctx);
            CHECK( results.size() == n );
        }
    }

    WHEN( "results arrive out of order" )
    {
        Captured<Result> first;
        Captured<Result> second;
        f.session.call(Rpc("proc1"), first.handler());
        f.session.call(Rpc("proc2"), second.handler());
        drain(f.ioctx);

        f.transport->inject("[50,2,{},[\"two\"]]");
        f.transport->inject("[50,1,{},[\"one\"]]");
        drain(f.ioctx);

        THEN( "each is matched to its own call" )
        {
            REQUIRE( first.result.has_value() );
            REQUIRE( second.result.has_value() );
            CHECK( first.result->args() == Array{"one"} );
            CHECK( second.result->args() == Array{"two"} );
        }
    }
}

//------------------------------------------------------------------------------
SCENARIO( "Outcome objects", "[RPC]" )
{
    CHECK( Outcome().type() == Outcome::Type::result );
    CHECK( Outcome::deferred().type() == Outcome::Type::deferred );
    CHECK( Outcome(deferment).type() == Outcome::Type::deferred );

    Outcome r({1, "two"});
    REQUIRE( r.type() == Outcome::Type::result );
    CHECK( r.asResult().args() == (Array{1, "two"}) );

    Outcome e(Error("com.myapp.error"));
    REQUIRE( e.type() == Outcome::Type::error );
    CHECK( e.asError().uri() == "com.myapp.error" );
}
