/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#ifndef WAMPCORE_INTERNAL_BACKOFFTIMER_HPP
#define WAMPCORE_INTERNAL_BACKOFFTIMER_HPP

#include <chrono>
#include <utility>
#include <boost/asio/steady_timer.hpp>
#include "../connectionoptions.hpp"

namespace wampcore
{

namespace internal
{

//------------------------------------------------------------------------------
// Waits for a delay that doubles upon every consecutive wait, starting from
// the backoff's min delay and saturating at its max delay.
//------------------------------------------------------------------------------
class BinaryExponentialBackoffTimer
{
public:
    using Backoff = BinaryExponentialBackoff;
    using Duration = Backoff::Duration;

    template <typename E>
    BinaryExponentialBackoffTimer(E&& executor, Backoff b)
        : timer_(std::forward<E>(executor)),
          backoff_(b)
    {}

    const Backoff& backoff() const {return backoff_;}

    // The delay used by the last wait, or zero if reset.
    Duration currentDelay() const {return delay_;}

    void cancel()
    {
        timer_.cancel();
        reset();
    }

    void reset() {delay_ = Duration{0};}

    template <typename F>
    void wait(F&& callback)
    {
        const bool inProgress = delay_ != Duration{0};

        if (inProgress)
        {
            if (delay_ > (backoff_.max() / 2))
                delay_ = backoff_.max();
            else
                delay_ *= 2;
        }
        else
        {
            delay_ = backoff_.min();
        }

        timer_.expires_after(delay_);
        timer_.async_wait(std::forward<F>(callback));
    }

private:
    boost::asio::steady_timer timer_;
    Backoff backoff_;
    Duration delay_ = Duration{0};
};

} // namespace internal

} // namespace wampcore

#endif // WAMPCORE_INTERNAL_BACKOFFTIMER_HPP
