/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#ifndef WAMPCORE_CONNECTIONOPTIONS_HPP
#define WAMPCORE_CONNECTIONOPTIONS_HPP

//------------------------------------------------------------------------------
/** @file
    @brief Contains the retry policy settings used by ConnectionManager. */
//------------------------------------------------------------------------------

#include <chrono>
#include <cstddef>
#include "api.hpp"

namespace wampcore
{

//------------------------------------------------------------------------------
/** Contains the minimum and maximum delays of a binary exponential backoff
    policy. */
//------------------------------------------------------------------------------
class WAMPCORE_API BinaryExponentialBackoff
{
public:
    /** Duration type used for delays. */
    using Duration = std::chrono::steady_clock::duration;

    /** Default constructor, using delays between one and 32 seconds. */
    BinaryExponentialBackoff();

    /** Constructor taking the min and max delays. */
    BinaryExponentialBackoff(Duration min, Duration max);

    /** Obtains the initial delay. */
    Duration min() const {return min_;}

    /** Obtains the delay at which doubling saturates. */
    Duration max() const {return max_;}

    /** Checks that the delays are valid. */
    BinaryExponentialBackoff& validate();

private:
    Duration min_;
    Duration max_;
};

//------------------------------------------------------------------------------
/** Contains the settings used by ConnectionManager. */
//------------------------------------------------------------------------------
class WAMPCORE_API ConnectionManagerOptions
{
public:
    /** Specifies the backoff policy between consecutive attempts. */
    ConnectionManagerOptions& withBackoff(BinaryExponentialBackoff backoff);

    /** Specifies the number of consecutive failed attempts after which
        the manager gives up. Zero means unlimited. */
    ConnectionManagerOptions& withMaxAttempts(std::size_t n);

    const BinaryExponentialBackoff& backoff() const;

    std::size_t maxAttempts() const;

private:
    BinaryExponentialBackoff backoff_;
    std::size_t maxAttempts_ = 0;
};

} // namespace wampcore

#ifndef WAMPCORE_COMPILED_LIB
#include "internal/connectionoptions.inl.hpp"
#endif

#endif // WAMPCORE_CONNECTIONOPTIONS_HPP
