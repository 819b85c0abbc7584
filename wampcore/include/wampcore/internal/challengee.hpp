/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#ifndef WAMPCORE_INTERNAL_CHALLENGEE_HPP
#define WAMPCORE_INTERNAL_CHALLENGEE_HPP

#include <cstdint>
#include <memory>

namespace wampcore
{

class Authentication;

namespace internal
{

//------------------------------------------------------------------------------
// Interface used by Challenge objects to send the AUTHENTICATE reply through
// the session that received the challenge. May be called from any thread.
//------------------------------------------------------------------------------
class Challengee
{
public:
    using WeakPtr = std::weak_ptr<Challengee>;

    virtual ~Challengee() = default;

    virtual void safeAuthenticate(std::uint64_t generation,
                                  Authentication&& auth) = 0;
};

} // namespace internal

} // namespace wampcore

#endif // WAMPCORE_INTERNAL_CHALLENGEE_HPP
