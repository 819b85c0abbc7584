/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#include <catch2/catch.hpp>
#include <wampcore/errorcodes.hpp>
#include <wampcore/internal/messagecodec.hpp>

using namespace wampcore;
using namespace wampcore::internal;

namespace
{

//------------------------------------------------------------------------------
ErrorOr<Message> decode(const std::string& json, std::string& hint)
{
    MessageCodec codec;
    hint.clear();
    return codec.decode(toMessageBuffer(json), &hint);
}

//------------------------------------------------------------------------------
void checkRejected(const std::string& json, const std::string& expectedHint)
{
    INFO( "For message " << json );
    std::string hint;
    auto msg = decode(json, hint);
    REQUIRE_FALSE( msg.has_value() );
    CHECK( hint.find(expectedHint) == 0 );
}

//------------------------------------------------------------------------------
void checkAccepted(const std::string& json, MessageKind kind)
{
    INFO( "For message " << json );
    std::string hint;
    auto msg = decode(json, hint);
    REQUIRE( msg.has_value() );
    CHECK( msg->kind() == kind );
    CHECK( hint.empty() );
}

} // anonymous namespace

//------------------------------------------------------------------------------
SCENARIO( "Decoding valid WAMP messages", "[Message][Codec]" )
{
    checkAccepted(R"([2,1234,{}])", MessageKind::welcome);
    checkAccepted(R"([3,{},"wamp.error.no_such_realm"])", MessageKind::abort);
    checkAccepted(R"([4,"ticket",{}])", MessageKind::challenge);
    checkAccepted(R"([6,{},"wamp.close.close_realm"])", MessageKind::goodbye);
    checkAccepted(R"([8,48,1,{},"wamp.error.invalid_argument"])",
                  MessageKind::error);
    checkAccepted(R"([8,48,1,{},"com.myapp.error",[1],{"a":2}])",
                  MessageKind::error);
    checkAccepted(R"([17,1,2])", MessageKind::published);
    checkAccepted(R"([33,1,2])", MessageKind::subscribed);
    checkAccepted(R"([35,1])", MessageKind::unsubscribed);
    checkAccepted(R"([36,1,2,{}])", MessageKind::event);
    checkAccepted(R"([36,1,2,{},["hello"],{"x":1}])", MessageKind::event);
    checkAccepted(R"([50,1,{}])", MessageKind::result);
    checkAccepted(R"([50,1,{},[16]])", MessageKind::result);
    checkAccepted(R"([65,1,2])", MessageKind::registered);
    checkAccepted(R"([67,1])", MessageKind::unregistered);
    checkAccepted(R"([68,7,9,{},[4]])", MessageKind::invocation);
}

//------------------------------------------------------------------------------
SCENARIO( "Decoding invalid WAMP messages", "[Message][Codec]" )
{
    WHEN( "the text is not valid JSON" )
    {
        std::string hint;
        auto msg = decode("[2,1234,{", hint);
        REQUIRE_FALSE( msg.has_value() );
        CHECK( msg.error() == DecodingErrc::failed );
        CHECK( hint.find("deserialization failed") == 0 );
    }

    WHEN( "the text is empty" )
    {
        std::string hint;
        auto msg = decode("", hint);
        REQUIRE_FALSE( msg.has_value() );
        CHECK( msg.error() == DecodingErrc::emptyInput );
    }

    WHEN( "the message is not an array" )
    {
        std::string hint;
        auto msg = decode(R"({"type":2})", hint);
        REQUIRE_FALSE( msg.has_value() );
        CHECK( msg.error() == WampErrc::protocolViolation );
        CHECK( hint == "message is not an array" );
    }

    WHEN( "the message type is invalid" )
    {
        checkRejected("[]", "invalid message type number");
        checkRejected(R"(["2",1,{}])", "invalid message type number");
        checkRejected("[7,1,{}]", "invalid message type number");
        checkRejected("[-2,1,{}]", "invalid message type number");
        checkRejected("[300,1,{}]", "invalid message type number");
        checkRejected("[2.0,1,{}]", "invalid message type number");
    }

    WHEN( "the number of fields is wrong" )
    {
        checkRejected("[2,1234]", "invalid number of message fields");
        checkRejected("[2,1234,{},{}]", "invalid number of message fields");
        checkRejected("[36,1,2]", "invalid number of message fields");
        checkRejected("[36,1,2,{},[],{},1]",
                      "invalid number of message fields");
    }

    WHEN( "a field has the wrong type" )
    {
        checkRejected(R"([2,"1234",{}])", "invalid message field schema");
        checkRejected("[2,1234,[]]", "invalid message field schema");
        checkRejected(R"([36,1,2,{},{}])", "invalid message field schema");
        checkRejected(R"([50,1,{},[],[]])", "invalid message field schema");
        checkRejected(R"([2,1.5,{}])", "invalid message field schema");
    }

    WHEN( "an identifier is out of range" )
    {
        checkRejected("[2,-1,{}]", "identifier out of range");
        checkRejected("[2,9007199254740993,{}]", "identifier out of range");
        checkRejected("[33,1,18446744073709551615]",
                      "identifier out of range");
    }

    WHEN( "a URI is empty" )
    {
        checkRejected(R"([3,{},""])", "empty URI");
        checkRejected(R"([8,48,1,{},""])", "empty URI");
    }

    WHEN( "an ERROR refers to a non-request message type" )
    {
        checkRejected(R"([8,36,1,{},"wamp.error.invalid_argument"])",
                      "invalid request type in ERROR message");
    }
}

//------------------------------------------------------------------------------
SCENARIO( "Message properties", "[Message]" )
{
    GIVEN( "an outbound CALL message" )
    {
        Message msg(MessageKind::call, nullId(), Object{}, "com.math.square");
        msg.setRequestId(42);

        THEN( "its request ID and key are correct" )
        {
            CHECK( msg.name() == std::string("CALL") );
            CHECK( msg.hasRequestId() );
            CHECK( msg.requestId() == 42 );
            CHECK( msg.requestKey() == std::make_pair(MessageKind::call,
                                                      RequestId(42)) );
            CHECK_FALSE( msg.isReply() );
        }
    }

    GIVEN( "a RESULT and an ERROR replying to a CALL" )
    {
        std::string hint;
        auto result = decode("[50,42,{}]", hint);
        auto error = decode(R"([8,48,42,{},"wamp.error.invalid_argument"])",
                            hint);
        REQUIRE( result.has_value() );
        REQUIRE( error.has_value() );

        THEN( "both map onto the CALL's request key" )
        {
            auto key = std::make_pair(MessageKind::call, RequestId(42));
            CHECK( result->isReply() );
            CHECK( result->requestKey() == key );
            CHECK( error->isReply() );
            CHECK( error->repliesTo() == MessageKind::call );
            CHECK( error->requestKey() == key );
        }
    }

    GIVEN( "a GOODBYE message" )
    {
        Message msg(MessageKind::goodbye, Object{}, "wamp.close.close_realm");
        CHECK_FALSE( msg.hasRequestId() );
        CHECK( msg.requestId() == nullId() );
    }
}

//------------------------------------------------------------------------------
SCENARIO( "Message payload emission", "[Message][Codec]" )
{
    MessageCodec codec;
    auto encode = [&codec](const Message& m) {return toText(codec.encode(m));};

    WHEN( "there are no arguments" )
    {
        Message msg(MessageKind::publish, 1, Object{}, "com.myapp.topic1");
        msg.appendPayload({}, {});
        CHECK( encode(msg) == R"([16,1,{},"com.myapp.topic1"])" );
    }

    WHEN( "there are only positional arguments" )
    {
        Message msg(MessageKind::yield, 7, Object{});
        msg.appendPayload({16}, {});
        CHECK( encode(msg) == "[70,7,{},[16]]" );
    }

    WHEN( "there are only keyword arguments" )
    {
        Message msg(MessageKind::call, 2, Object{}, "com.myapp.proc");
        msg.appendPayload({}, {{"x", 1}});
        CHECK( encode(msg) == R"([48,2,{},"com.myapp.proc",[],{"x":1}])" );
    }

    WHEN( "there are both kinds of arguments" )
    {
        Message msg(MessageKind::publish, 3, Object{}, "com.myapp.topic1");
        msg.appendPayload({"hello"}, {{"y", true}});
        CHECK( encode(msg) ==
               R"([16,3,{},"com.myapp.topic1",["hello"],{"y":true}])" );
    }

    WHEN( "reading absent arguments" )
    {
        std::string hint;
        auto msg = decode("[36,1,2,{}]", hint);
        REQUIRE( msg.has_value() );
        CHECK( msg->argsAt(4).empty() );
        CHECK( msg->kwargsAt(5).empty() );
    }

    WHEN( "producing trace text" )
    {
        Message msg(MessageKind::yield, 7, Object{});
        msg.appendPayload({16}, {});
        CHECK( msg.toTraceString("TX") == R"(["TX","YIELD",7,{},[16]])" );
    }
}
