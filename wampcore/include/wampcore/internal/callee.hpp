/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#ifndef WAMPCORE_INTERNAL_CALLEE_HPP
#define WAMPCORE_INTERNAL_CALLEE_HPP

#include <cstdint>
#include <memory>
#include "../wampdefs.hpp"

namespace wampcore
{

class Error;
class Result;

namespace internal
{

//------------------------------------------------------------------------------
// Interface used by Invocation objects to send deferred results back through
// the session that received the invocation. The generation identifies the
// session run in which the invocation arrived. The safeYield functions may be
// called from any thread.
//------------------------------------------------------------------------------
class Callee
{
public:
    using WeakPtr = std::weak_ptr<Callee>;

    virtual ~Callee() = default;

    virtual void safeYield(std::uint64_t generation, RequestId invocationId,
                           Result&& result) = 0;

    virtual void safeYield(std::uint64_t generation, RequestId invocationId,
                           Error&& error) = 0;
};

} // namespace internal

} // namespace wampcore

#endif // WAMPCORE_INTERNAL_CALLEE_HPP
