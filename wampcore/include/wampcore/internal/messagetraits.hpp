/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#ifndef WAMPCORE_INTERNAL_MESSAGETRAITS_HPP
#define WAMPCORE_INTERNAL_MESSAGETRAITS_HPP

#include <cstddef>
#include <cstdint>
#include "../api.hpp"
#include "../variant.hpp"
#include "../wampdefs.hpp"

namespace wampcore
{

namespace internal
{

//------------------------------------------------------------------------------
enum class MessageKind : uint8_t
{
    none         = 0,
    hello        = 1,
    welcome      = 2,
    abort        = 3,
    challenge    = 4,
    authenticate = 5,
    goodbye      = 6,
    error        = 8,
    publish      = 16,
    published    = 17,
    subscribe    = 32,
    subscribed   = 33,
    unsubscribe  = 34,
    unsubscribed = 35,
    event        = 36,
    call         = 48,
    result       = 50,
    enroll       = 64,
    registered   = 65,
    unregister   = 66,
    unregistered = 67,
    invocation   = 68,
    yield        = 70
};

//------------------------------------------------------------------------------
// Static properties of each message kind. A position of zero means the
// message has no such field.
//------------------------------------------------------------------------------
struct WAMPCORE_API MessageTraits
{
    static constexpr std::size_t maxFieldCount = 7;

    static const MessageTraits& lookup(MessageKind kind);

    bool isValidKind() const;

    bool isValidForState(SessionState state) const;

    const char* nameOr(const char* fallback) const;

    const char* name;
    MessageKind repliesTo;
    std::size_t requestIdPosition;
    std::size_t uriPosition;
    std::size_t minSize;
    std::size_t maxSize;
    bool isClientRx;
    bool isRouterRx;
    bool forConnecting;
    bool forAuthenticating;
    bool forEstablished;
    bool isRequest;
    TypeId fieldTypes[maxFieldCount];
};

} // namespace internal

} // namespace wampcore

#ifndef WAMPCORE_COMPILED_LIB
#include "messagetraits.inl.hpp"
#endif

#endif // WAMPCORE_INTERNAL_MESSAGETRAITS_HPP
