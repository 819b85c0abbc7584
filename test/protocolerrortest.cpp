/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#include <catch2/catch.hpp>
#include "clienttesting.hpp"

using namespace wampcore;
using namespace wampcore::test;

namespace
{

//------------------------------------------------------------------------------
struct ProtocolFixture : public ClientFixture
{
    ProtocolFixture()
    {
        session.setDisconnectHandler(
            [this](std::error_code ec) {++dropCount; dropError = ec;});
    }

    // Checks that the client aborted with a protocol_violation whose hint
    // starts with the given text.
    void checkAborted(const std::string& hintPrefix)
    {
        auto aborts = transport->sentOfKind(Kind::abort);
        REQUIRE( aborts.size() == 1 );
        const auto& abort = aborts.front();
        CHECK( abort.at(2) == "wamp.error.protocol_violation" );
        const auto& details = abort.at(1).as<Object>();
        REQUIRE( details.count("message") == 1 );
        CHECK_THAT( details.at("message").as<String>(),
                    Catch::Matchers::StartsWith(hintPrefix) );
        CHECK( session.state() == SessionState::closed );
        CHECK( transport->isClosed() );
        CHECK( hasLogContaining(LogLevel::error, "Protocol violation") );
    }

    int dropCount = 0;
    std::error_code dropError;
};

} // anonymous namespace

//------------------------------------------------------------------------------
SCENARIO( "Invalid messages from the router", "[Session][Protocol]" )
{
    ProtocolFixture f;
    f.join();

    Captured<Result> pending;
    f.session.call(Rpc("com.myapp.proc"), pending.handler());
    drain(f.ioctx);

    struct TestVector
    {
        std::string json;
        std::string hint;
    };

    const std::vector<TestVector> vectors =
    {
        {"[2,1234,{",                "deserialization failed"},
        {"",                         "deserialization failed"},
        {R"({"type":36})",           "message is not an array"},
        {"[99,1,{}]",                "invalid message type number"},
        {"[36,1]",                   "invalid number of message fields"},
        {R"([36,"1",2,{}])",         "invalid message field schema"},
        {"[36,-1,2,{}]",             "identifier out of range"},
        {R"([8,48,1,{},""])",        "empty URI"},
        {R"([1,"realm",{}])",        "Received HELLO message, which is only "
                                     "valid for routers"},
        {"[70,1,{}]",                "Received YIELD message, which is only "
                                     "valid for routers"},
        {"[2,1234,{}]",              "Received WELCOME message, which is "
                                     "invalid for the current session state"},
        {R"([4,"ticket",{}])",       "Received CHALLENGE message, which is "
                                     "invalid for the current session state"}
    };

    for (const auto& vec: vectors)
    {
        DYNAMIC_SECTION( "Receiving " << vec.json )
        {
            f.transport->inject(vec.json);
            drain(f.ioctx);

            f.checkAborted(vec.hint);

            CHECK( f.dropCount == 1 );
            CHECK( f.dropError == WampErrc::protocolViolation );
            REQUIRE( pending.done() );
            CHECK( pending.result.error() == WampErrc::protocolViolation );
        }
    }
}

//------------------------------------------------------------------------------
SCENARIO( "Messages invalid while connecting", "[Session][Protocol]" )
{
    ProtocolFixture f;
    f.transport->respondTo(Kind::hello, {"[36,1,2,{}]"});
    Captured<Welcome> welcome;
    f.session.open(f.config(), welcome.handler());
    drain(f.ioctx);

    THEN( "the session is aborted before being established" )
    {
        f.checkAborted("Received EVENT message, which is invalid for the "
                       "current session state");
        REQUIRE( welcome.done() );
        CHECK( welcome.result.error() == WampErrc::protocolViolation );
        CHECK( f.dropCount == 0 );
    }
}

//------------------------------------------------------------------------------
SCENARIO( "Replies that match no request", "[Session][Protocol]" )
{
    ProtocolFixture f;
    f.join();

    f.transport->inject("[50,42,{}]");
    f.transport->inject(R"([8,48,43,{},"wamp.error.invalid_argument"])");
    f.transport->inject("[33,44,1]");
    drain(f.ioctx);

    THEN( "they are discarded without aborting the session" )
    {
        CHECK( f.transport->sentOfKind(Kind::abort).empty() );
        CHECK( f.session.state() == SessionState::established );
        CHECK( f.hasLogContaining(LogLevel::warning,
                                  "RESULT reply with unmatched request ID 42") );
        CHECK( f.hasLogContaining(LogLevel::warning,
                                  "ERROR reply with unmatched request ID 43") );
        CHECK( f.hasLogContaining(LogLevel::warning,
                                  "SUBSCRIBED reply with unmatched request "
                                  "ID 44") );
    }
}
