/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#include "messagetraits.hpp"
#include <algorithm>
#include <array>
#include "../api.hpp"

namespace wampcore
{

namespace internal
{

namespace
{

struct MessageTraitsEntry
{
    MessageKind kind;
    MessageTraits traits;
};

} // anonymous namespace

//------------------------------------------------------------------------------
WAMPCORE_INLINE const MessageTraits& MessageTraits::lookup(MessageKind kind)
{
    using K = MessageKind;
    constexpr TypeId n = TypeId::null;
    constexpr TypeId i = TypeId::integer;
    constexpr TypeId s = TypeId::string;
    constexpr TypeId a = TypeId::array;
    constexpr TypeId o = TypeId::object;
    constexpr bool T = true;
    constexpr bool F = false;

    static const MessageTraits unknown =
        {nullptr, K::none, 0,0,0,0, F,F,F,F,F,F, {i,n,n,n,n,n,n}};

    // Columns after the name and repliesTo:
    //     requestIdPosition, uriPosition, minSize, maxSize,
    //     isClientRx, isRouterRx,
    //     forConnecting, forAuthenticating, forEstablished,
    //     isRequest,
    //     fieldTypes
    static const std::array<MessageTraitsEntry, 22> table{{
{K::hello,       {"HELLO",        K::none,        0,1,3,3, F,T, T,F,F, F, {i,s,o,n,n,n,n}}},
{K::welcome,     {"WELCOME",      K::hello,       0,0,3,3, T,F, T,T,F, F, {i,i,o,n,n,n,n}}},
{K::abort,       {"ABORT",        K::hello,       0,2,3,3, T,T, T,T,T, F, {i,o,s,n,n,n,n}}},
{K::challenge,   {"CHALLENGE",    K::none,        0,0,3,3, T,F, T,F,F, F, {i,s,o,n,n,n,n}}},
{K::authenticate,{"AUTHENTICATE", K::none,        0,0,3,3, F,T, F,T,F, F, {i,s,o,n,n,n,n}}},
{K::goodbye,     {"GOODBYE",      K::goodbye,     0,2,3,3, T,T, F,F,T, F, {i,o,s,n,n,n,n}}},
{K::error,       {"ERROR",        K::error,       2,4,5,7, T,T, F,F,T, F, {i,i,i,o,s,a,o}}},
{K::publish,     {"PUBLISH",      K::none,        1,3,4,6, F,T, F,F,T, T, {i,i,o,s,a,o,n}}},
{K::published,   {"PUBLISHED",    K::publish,     1,0,3,3, T,F, F,F,T, F, {i,i,i,n,n,n,n}}},
{K::subscribe,   {"SUBSCRIBE",    K::none,        1,3,4,4, F,T, F,F,T, T, {i,i,o,s,n,n,n}}},
{K::subscribed,  {"SUBSCRIBED",   K::subscribe,   1,0,3,3, T,F, F,F,T, F, {i,i,i,n,n,n,n}}},
{K::unsubscribe, {"UNSUBSCRIBE",  K::none,        1,0,3,3, F,T, F,F,T, T, {i,i,i,n,n,n,n}}},
{K::unsubscribed,{"UNSUBSCRIBED", K::unsubscribe, 1,0,2,2, T,F, F,F,T, F, {i,i,n,n,n,n,n}}},
{K::event,       {"EVENT",        K::none,        0,0,4,6, T,F, F,F,T, F, {i,i,i,o,a,o,n}}},
{K::call,        {"CALL",         K::none,        1,3,4,6, F,T, F,F,T, T, {i,i,o,s,a,o,n}}},
{K::result,      {"RESULT",       K::call,        1,0,3,5, T,F, F,F,T, F, {i,i,o,a,o,n,n}}},
{K::enroll,      {"REGISTER",     K::none,        1,3,4,4, F,T, F,F,T, T, {i,i,o,s,n,n,n}}},
{K::registered,  {"REGISTERED",   K::enroll,      1,0,3,3, T,F, F,F,T, F, {i,i,i,n,n,n,n}}},
{K::unregister,  {"UNREGISTER",   K::none,        1,0,3,3, F,T, F,F,T, T, {i,i,i,n,n,n,n}}},
{K::unregistered,{"UNREGISTERED", K::unregister,  1,0,2,2, T,F, F,F,T, F, {i,i,n,n,n,n,n}}},
{K::invocation,  {"INVOCATION",   K::none,        1,0,4,6, T,F, F,F,T, F, {i,i,i,o,a,o,n}}},
{K::yield,       {"YIELD",        K::invocation,  1,0,3,5, F,T, F,F,T, F, {i,i,o,a,o,n,n}}}
    }};

    auto found = std::find_if(
        table.begin(), table.end(),
        [kind](const MessageTraitsEntry& e) {return e.kind == kind;});
    return (found == table.end()) ? unknown : found->traits;
}

//------------------------------------------------------------------------------
WAMPCORE_INLINE bool MessageTraits::isValidKind() const
{
    return minSize != 0;
}

//------------------------------------------------------------------------------
WAMPCORE_INLINE bool MessageTraits::isValidForState(SessionState state) const
{
    switch (state)
    {
    case SessionState::connecting:
        return forConnecting;

    case SessionState::authenticating:
        return forAuthenticating;

    case SessionState::established:
    case SessionState::closing:
        return forEstablished;

    default:
        break;
    }

    return false;
}

//------------------------------------------------------------------------------
WAMPCORE_INLINE const char* MessageTraits::nameOr(const char* fallback) const
{
    return (name == nullptr) ? fallback : name;
}

} // namespace internal

} // namespace wampcore
