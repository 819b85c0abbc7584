/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#include <vector>
#include <catch2/catch.hpp>
#include <wampcore/internal/procedureregistry.hpp>
#include <wampcore/internal/readership.hpp>
#include <wampcore/internal/requestor.hpp>

using namespace wampcore;
using namespace wampcore::internal;

//------------------------------------------------------------------------------
SCENARIO( "Requestor correlates replies with requests", "[Registry]" )
{
    std::vector<Message> sent;
    Requestor requestor([&sent](Message&& m) {sent.push_back(std::move(m));});

    GIVEN( "several outstanding requests" )
    {
        std::vector<ErrorOr<Message>> replies;
        auto handler = [&replies](ErrorOr<Message> r)
        {
            replies.push_back(std::move(r));
        };

        auto id1 = requestor.request(
            Message(MessageKind::subscribe, nullId(), Object{}, "topic"),
            handler);
        auto id2 = requestor.request(
            Message(MessageKind::call, nullId(), Object{}, "proc"),
            handler);
        requestor.request(
            Message(MessageKind::publish, nullId(), Object{}, "topic"));

        THEN( "request IDs are sequential starting at 1" )
        {
            CHECK( id1 == 1 );
            CHECK( id2 == 2 );
            CHECK( requestor.lastRequestId() == 3 );
            REQUIRE( sent.size() == 3 );
            CHECK( sent[0].requestId() == 1 );
            CHECK( sent[1].requestId() == 2 );
            CHECK( sent[2].requestId() == 3 );
        }

        THEN( "only requests with handlers are tracked" )
        {
            CHECK( requestor.size() == 2 );
            CHECK( requestor.contains({MessageKind::subscribe, 1}) );
            CHECK( requestor.contains({MessageKind::call, 2}) );
            CHECK_FALSE( requestor.contains({MessageKind::publish, 3}) );
        }

        WHEN( "receiving a reply matching the request kind and ID" )
        {
            auto reply = Message::parse(Array{50, 2, Object{}, Array{16}});
            REQUIRE( reply.has_value() );
            CHECK( requestor.onReply(std::move(*reply)) );

            THEN( "the handler is called once and the request is dropped" )
            {
                REQUIRE( replies.size() == 1 );
                REQUIRE( replies[0].has_value() );
                CHECK( replies[0]->kind() == MessageKind::result );
                CHECK( replies[0]->argsAt(3) == Array{16} );
                CHECK( requestor.size() == 1 );
                CHECK_FALSE( requestor.contains({MessageKind::call, 2}) );
            }
        }

        WHEN( "receiving an ERROR reply" )
        {
            auto reply = Message::parse(
                Array{8, 32, 1, Object{}, "wamp.error.not_authorized"});
            REQUIRE( reply.has_value() );
            CHECK( requestor.onReply(std::move(*reply)) );
            REQUIRE( replies.size() == 1 );
            CHECK( replies[0]->kind() == MessageKind::error );
        }

        WHEN( "receiving a reply with a mismatched kind or ID" )
        {
            auto wrongKind = Message::parse(Array{65, 1, 99});
            auto wrongId = Message::parse(Array{33, 7, 99});
            REQUIRE( wrongKind.has_value() );
            REQUIRE( wrongId.has_value() );
            CHECK_FALSE( requestor.onReply(std::move(*wrongKind)) );
            CHECK_FALSE( requestor.onReply(std::move(*wrongId)) );
            CHECK( replies.empty() );
            CHECK( requestor.size() == 2 );
        }

        WHEN( "abandoning all requests" )
        {
            requestor.abandonAll(make_error_code(MiscErrc::abandoned));

            THEN( "every handler receives the error exactly once" )
            {
                REQUIRE( replies.size() == 2 );
                for (const auto& r: replies)
                {
                    REQUIRE_FALSE( r.has_value() );
                    CHECK( r.error() == MiscErrc::abandoned );
                }
                CHECK( requestor.empty() );
            }
        }

        WHEN( "resetting for a new session" )
        {
            requestor.reset();
            CHECK( requestor.empty() );
            CHECK( replies.empty() );
            auto id = requestor.request(
                Message(MessageKind::call, nullId(), Object{}, "proc"));
            CHECK( id == 1 );
        }
    }
}

//------------------------------------------------------------------------------
SCENARIO( "Readership tracks subscriptions and event slots", "[Registry]" )
{
    Readership readership;
    std::vector<int> hits;
    auto makeSlot = [&hits](int tag) -> Readership::EventSlot
    {
        return [&hits, tag](Event) {hits.push_back(tag);};
    };

    GIVEN( "two local slots sharing one router subscription" )
    {
        auto a = readership.insert(5, "topic", makeSlot(1));
        auto b = readership.insert(5, "topic", makeSlot(2));
        auto c = readership.insert(6, "other", makeSlot(3));

        THEN( "each has its own slot ID under the same subscription ID" )
        {
            CHECK( a.id() == 5 );
            CHECK( b.id() == 5 );
            CHECK( a.slotId() != b.slotId() );
            CHECK( a != b );
            CHECK( a.topic() == "topic" );
            CHECK( readership.size() == 2 );
            CHECK( readership.armedSlotCount(5) == 2 );
            CHECK( readership.topicOf(6) == "other" );
            CHECK( readership.topicOf(7).empty() );
        }

        THEN( "slots are looked up by subscription ID" )
        {
            auto slots = readership.slotsFor(5);
            REQUIRE( slots.size() == 2 );
            for (auto& s: slots)
                s(Event());
            CHECK( hits == (std::vector<int>{1, 2}) );
            CHECK( readership.slotsFor(99).empty() );
        }

        WHEN( "disarming a slot" )
        {
            readership.disarm(a);

            THEN( "it no longer receives events but the record remains" )
            {
                CHECK_FALSE( readership.contains(a) );
                CHECK( readership.contains(b) );
                CHECK( readership.slotsFor(5).size() == 1 );
                CHECK( readership.armedSlotCount(5) == 1 );
                CHECK( readership.hasSubscription(5) );
                CHECK_FALSE( readership.isRetiring(5) );
            }

            THEN( "disarming the last slot retires the subscription" )
            {
                readership.disarm(b);
                CHECK( readership.isRetiring(5) );
                CHECK_FALSE( readership.isRetiring(6) );
                CHECK_FALSE( readership.isRetiring(99) );
            }
        }

        WHEN( "removing every slot of a subscription" )
        {
            CHECK( readership.remove(a) );
            CHECK( readership.hasSubscription(5) );
            CHECK( readership.remove(b) );

            THEN( "the record is erased" )
            {
                CHECK_FALSE( readership.hasSubscription(5) );
                CHECK_FALSE( readership.remove(a) );
                CHECK( readership.size() == 1 );
            }
        }

        WHEN( "clearing" )
        {
            readership.clear();
            CHECK( readership.empty() );
            CHECK_FALSE( readership.contains(c) );
        }
    }

    GIVEN( "an empty subscription" )
    {
        Subscription empty;
        CHECK_FALSE( bool(empty) );
        CHECK_FALSE( readership.contains(empty) );
        CHECK_FALSE( readership.remove(empty) );
    }
}

//------------------------------------------------------------------------------
SCENARIO( "ProcedureRegistry tracks registrations and invocations",
          "[Registry]" )
{
    ProcedureRegistry registry;
    auto slot = [](Invocation) -> Outcome {return Result{1};};

    GIVEN( "a reserved procedure URI" )
    {
        REQUIRE( registry.reserve("com.math.square") );

        THEN( "it cannot be reserved again" )
        {
            CHECK( registry.isReserved("com.math.square") );
            CHECK_FALSE( registry.reserve("com.math.square") );
        }

        WHEN( "the registration fails and the URI is released" )
        {
            registry.release("com.math.square");
            CHECK_FALSE( registry.isReserved("com.math.square") );
            CHECK( registry.reserve("com.math.square") );
        }

        WHEN( "the registration succeeds" )
        {
            auto reg = registry.insert(9, "com.math.square", slot);
            REQUIRE( reg.has_value() );

            THEN( "the procedure is found by registration ID" )
            {
                CHECK( reg->id() == 9 );
                CHECK( reg->uri() == "com.math.square" );
                CHECK( registry.contains(*reg) );
                CHECK( registry.size() == 1 );
                CHECK( bool(registry.find(9)) );
                CHECK_FALSE( bool(registry.find(10)) );
            }

            THEN( "a second insertion under the same ID fails" )
            {
                auto dup = registry.insert(9, "com.math.cube", slot);
                REQUIRE_FALSE( dup.has_value() );
                CHECK( dup.error() == WampErrc::procedureAlreadyExists );
            }

            WHEN( "disarming it" )
            {
                registry.disarm(*reg);
                CHECK_FALSE( registry.contains(*reg) );
                CHECK( bool(registry.find(9)) );
            }

            WHEN( "removing it" )
            {
                CHECK( registry.remove(*reg) );
                CHECK_FALSE( registry.contains(*reg) );
                CHECK_FALSE( registry.isReserved("com.math.square") );
                CHECK_FALSE( registry.remove(*reg) );
                CHECK( registry.empty() );
            }
        }
    }

    GIVEN( "pending invocations" )
    {
        registry.trackInvocation(7, 9);
        registry.trackInvocation(8, 9);

        THEN( "each can be settled exactly once" )
        {
            CHECK( registry.pendingInvocationCount() == 2 );
            CHECK( registry.hasPendingInvocation(7) );
            CHECK( registry.settleInvocation(7) );
            CHECK_FALSE( registry.settleInvocation(7) );
            CHECK_FALSE( registry.hasPendingInvocation(7) );
            CHECK( registry.hasPendingInvocation(8) );
        }

        THEN( "clearing drops them" )
        {
            registry.clear();
            CHECK( registry.pendingInvocationCount() == 0 );
            CHECK_FALSE( registry.settleInvocation(8) );
        }
    }
}
