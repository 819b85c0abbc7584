/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#include "../connectionoptions.hpp"
#include "../api.hpp"
#include "../exceptions.hpp"

namespace wampcore
{

//******************************************************************************
// BinaryExponentialBackoff
//******************************************************************************

WAMPCORE_INLINE BinaryExponentialBackoff::BinaryExponentialBackoff()
    : min_(std::chrono::seconds(1)),
      max_(std::chrono::seconds(32))
{}

WAMPCORE_INLINE BinaryExponentialBackoff::BinaryExponentialBackoff(
    Duration min, Duration max)
    : min_(min),
      max_(max)
{}

/** @throws error::Logic if the min delay is not positive, or if the max
                delay is shorter than the min delay. */
WAMPCORE_INLINE BinaryExponentialBackoff& BinaryExponentialBackoff::validate()
{
    WAMPCORE_LOGIC_CHECK(min_.count() > 0, "Min delay must be positive");
    WAMPCORE_LOGIC_CHECK(max_ >= min_,
                         "Max delay must not be shorter than min delay");
    return *this;
}


//******************************************************************************
// ConnectionManagerOptions
//******************************************************************************

/** @throws error::Logic if the backoff delays are invalid. */
WAMPCORE_INLINE ConnectionManagerOptions&
ConnectionManagerOptions::withBackoff(BinaryExponentialBackoff backoff)
{
    backoff_ = backoff.validate();
    return *this;
}

WAMPCORE_INLINE ConnectionManagerOptions&
ConnectionManagerOptions::withMaxAttempts(std::size_t n)
{
    maxAttempts_ = n;
    return *this;
}

WAMPCORE_INLINE const BinaryExponentialBackoff&
ConnectionManagerOptions::backoff() const
{
    return backoff_;
}

WAMPCORE_INLINE std::size_t ConnectionManagerOptions::maxAttempts() const
{
    return maxAttempts_;
}

} // namespace wampcore
