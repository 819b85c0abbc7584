/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#include <stdexcept>
#include <string>
#include <catch2/catch.hpp>
#include <wampcore/pubsubinfo.hpp>
#include <wampcore/rpcinfo.hpp>
#include <wampcore/sessioninfo.hpp>

using namespace wampcore;

namespace
{

const Array testList{null, true, 42, "foo"};
const Object testMap{{"a", null}, {"b", true}, {"c", 42}, {"d", "foo"}};

} // anonymous namespace

//------------------------------------------------------------------------------
SCENARIO( "Empty payload", "[Payload]" )
{
    Rpc rpc("com.myapp.proc");
    CHECK( rpc.uri() == "com.myapp.proc" );
    CHECK( rpc.args().empty() );
    CHECK( rpc.kwargs().empty() );
    CHECK_FALSE( rpc.hasArgs() );
    CHECK( rpc.kwargByKey("a").is<Null>() );
    CHECK_THROWS_AS( rpc[0], std::out_of_range );
}

//------------------------------------------------------------------------------
SCENARIO( "Populating a payload", "[Payload]" )
{
    WHEN( "passing positional arguments of mixed types" )
    {
        Rpc rpc("p");
        rpc.withArgs(null, true, 42, "foo");
        CHECK( rpc.args() == testList );
        CHECK( rpc.hasArgs() );
        CHECK( rpc[1] == true );
        CHECK( rpc[2] == 42 );

        rpc[3] = "bar";
        CHECK( rpc.args().at(3) == "bar" );
    }

    WHEN( "passing an argument list" )
    {
        Pub pub("topic");
        pub.withArgList(testList);
        CHECK( pub.args() == testList );
        CHECK( pub.kwargs().empty() );
    }

    WHEN( "passing keyword arguments" )
    {
        Result result;
        result.withKwargs(testMap);
        CHECK( result.hasArgs() );
        CHECK( result.args().empty() );
        CHECK( result.kwargs() == testMap );
        CHECK( result.kwargByKey("c") == 42 );
        CHECK( result.kwargByKey("z").is<Null>() );

        result["e"] = 1.5;
        CHECK( result.kwargs().at("e") == 1.5 );
        CHECK( result["f"].is<Null>() );
        CHECK( result.kwargs().count("f") == 1 );
    }

    WHEN( "initializing a result from a list" )
    {
        Result result{null, true, 42, "foo"};
        CHECK( result.args() == testList );
    }

    WHEN( "moving the payload out" )
    {
        Rpc rpc("p");
        rpc.withArgs(1, 2).withKwargs({{"k", "v"}});
        Array args = std::move(rpc).args();
        CHECK( args == (Array{1, 2}) );
        Object kwargs = std::move(rpc).kwargs();
        CHECK( kwargs == (Object{{"k", "v"}}) );
    }
}

//------------------------------------------------------------------------------
SCENARIO( "Converting payload arguments", "[Payload]" )
{
    Result result{42, "foo", 1.5};

    WHEN( "converting all arguments" )
    {
        int n = 0;
        String s;
        double x = 0;
        CHECK( result.convertTo(n, s, x) == 3 );
        CHECK( n == 42 );
        CHECK( s == "foo" );
        CHECK( x == 1.5 );
    }

    WHEN( "converting fewer arguments than available" )
    {
        int n = 0;
        CHECK( result.convertTo(n) == 1 );
        CHECK( n == 42 );
    }

    WHEN( "converting more arguments than available" )
    {
        int n = 0;
        String s;
        double x = 0;
        bool b = true;
        CHECK( result.convertTo(n, s, x, b) == 3 );
        CHECK( b == true );
    }

    WHEN( "an argument has the wrong type" )
    {
        int n = 0;
        int m = 0;
        CHECK_THROWS_AS( result.convertTo(n, m), error::Conversion );
    }
}

//------------------------------------------------------------------------------
SCENARIO( "Accessing options", "[Payload][Options]" )
{
    Procedure proc("com.myapp.proc");
    proc.withOption("n", 7).withOption("s", "text");

    CHECK( proc.hasOption("n") );
    CHECK_FALSE( proc.hasOption("x") );
    CHECK( proc.optionByKey("s") == "text" );
    CHECK( proc.optionByKey("x").is<Null>() );

    WHEN( "using a fallback value" )
    {
        CHECK( proc.optionOr<int>("n", 0) == 7 );
        CHECK( proc.optionOr<int>("x", -1) == -1 );
        CHECK( proc.optionOr<int>("s", -2) == -2 );
        CHECK( proc.optionOr<String>("s", "") == "text" );
    }

    WHEN( "obtaining an option as an expected value" )
    {
        auto n = proc.optionAs<Int>("n");
        REQUIRE( n.has_value() );
        CHECK( *n == 7 );

        auto absent = proc.optionAs<Int>("x");
        REQUIRE_FALSE( absent.has_value() );
        CHECK( absent.error() == MiscErrc::absent );

        auto wrong = proc.optionAs<Int>("s");
        REQUIRE_FALSE( wrong.has_value() );
        CHECK( wrong.error() == MiscErrc::badType );
    }

    WHEN( "replacing all options" )
    {
        proc.withOptions({{"k", true}});
        CHECK( proc.options() == (Object{{"k", true}}) );
    }
}

//------------------------------------------------------------------------------
SCENARIO( "Topic match policies", "[Payload][Options]" )
{
    Topic topic("com.myapp");
    CHECK( topic.uri() == "com.myapp" );
    CHECK( topic.matchPolicy() == MatchPolicy::exact );
    CHECK( topic.options().empty() );

    WHEN( "selecting prefix matching" )
    {
        topic.withMatchPolicy(MatchPolicy::prefix);
        CHECK( topic.matchPolicy() == MatchPolicy::prefix );
        CHECK( topic.optionByKey("match") == "prefix" );
    }

    WHEN( "selecting wildcard then exact matching" )
    {
        topic.withMatchPolicy(MatchPolicy::wildcard);
        CHECK( topic.optionByKey("match") == "wildcard" );
        topic.withMatchPolicy(MatchPolicy::exact);
        CHECK_FALSE( topic.hasOption("match") );
    }

    WHEN( "selecting an unknown policy" )
    {
        CHECK_THROWS_AS( topic.withMatchPolicy(MatchPolicy::unknown),
                         error::Logic );
    }
}

//------------------------------------------------------------------------------
SCENARIO( "Publication options", "[Payload][Options]" )
{
    Pub pub("com.myapp.topic");
    CHECK( pub.excludeMe() );
    CHECK_FALSE( pub.discloseMe() );

    pub.withExcludeMe(false)
       .withDiscloseMe()
       .withExcludedSessions({1, 2})
       .withEligibleSessions({3});

    CHECK_FALSE( pub.excludeMe() );
    CHECK( pub.discloseMe() );
    CHECK( pub.optionByKey("exclude") == (Array{1, 2}) );
    CHECK( pub.optionByKey("eligible") == (Array{3}) );

    Rpc rpc("com.myapp.proc");
    CHECK_FALSE( rpc.discloseMe() );
    rpc.withDiscloseMe();
    CHECK( rpc.optionByKey("disclose_me") == true );
}

//------------------------------------------------------------------------------
SCENARIO( "Session reasons", "[Payload][Session]" )
{
    WHEN( "default constructing" )
    {
        Reason reason;
        CHECK( reason.uri() == "wamp.close.close_realm" );
        CHECK( reason.errorCode() == WampErrc::closeRealm );
        CHECK( reason.hint().empty() );
    }

    WHEN( "constructing from an error code with a hint" )
    {
        Reason reason(WampErrc::systemShutdown);
        reason.withHint("maintenance");
        CHECK( reason.uri() == "wamp.close.system_shutdown" );
        CHECK( reason.errorCode() == WampErrc::systemShutdown );
        CHECK( reason.hint() == "maintenance" );
        CHECK( reason.optionByKey("message") == "maintenance" );
    }

    WHEN( "constructing from an application URI" )
    {
        Reason reason("com.myapp.bye");
        CHECK( reason.errorCode() == WampErrc::unknown );
    }
}

//------------------------------------------------------------------------------
SCENARIO( "Default-constructed information objects", "[Payload]" )
{
    Welcome welcome;
    CHECK( welcome.id() == nullId() );
    CHECK( welcome.realm().empty() );
    CHECK( welcome.roles().empty() );
    CHECK_FALSE( welcome.supportsRole("broker") );
    CHECK( welcome.agentString().empty() );
    CHECK( welcome.authId().error() == MiscErrc::absent );

    Event event;
    CHECK_FALSE( event.ready() );
    CHECK( event.publisher().error() == MiscErrc::absent );

    Invocation inv;
    CHECK_FALSE( inv.ready() );
    CHECK( inv.procedure().error() == MiscErrc::absent );

    Authentication auth("sig");
    CHECK( auth.signature() == "sig" );
    Challenge challenge;
    CHECK( challenge.method().empty() );
    CHECK_NOTHROW( challenge.authenticate(Authentication("ignored")) );
}
