/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#ifndef WAMPCORE_SUBSCRIPTION_HPP
#define WAMPCORE_SUBSCRIPTION_HPP

//------------------------------------------------------------------------------
/** @file
    @brief Contains the declaration of the Subscription class. */
//------------------------------------------------------------------------------

#include <cstdint>
#include <ostream>
#include <utility>
#include "api.hpp"
#include "wampdefs.hpp"
#include "internal/passkey.hpp"

namespace wampcore
{

//------------------------------------------------------------------------------
/** Represents a pub/sub event subscription.

    A Subscription is a lightweight value returned by Session::subscribe,
    which can later be passed to Session::unsubscribe. Several Subscription
    objects may share the same router subscription ID when the same topic is
    subscribed more than once; each is distinguished by a local slot ID.

    It is always safe to unsubscribe via a Subscription object. If the Session
    or the subscription no longer exists, the unsubscribe operation completes
    with `false`. */
//------------------------------------------------------------------------------
class WAMPCORE_API Subscription
{
public:
    /// Local identifier for an event slot.
    using SlotId = uint64_t;

    /** Constructs an empty subscription */
    Subscription() = default;

    /** Returns true if the subscription is non-empty. */
    explicit operator bool() const {return slotId_ != 0;}

    /** Obtains the router's ID number for this subscription. */
    SubscriptionId id() const {return subId_;}

    /** Obtains the local slot ID of this subscription. */
    SlotId slotId() const {return slotId_;}

    /** Obtains the topic URI. */
    const Uri& topic() const {return topic_;}

private:
    Uri topic_;
    SubscriptionId subId_ = nullId();
    SlotId slotId_ = 0;

public:
    // Internal use only
    Subscription(internal::PassKey, SubscriptionId subId, SlotId slotId,
                 Uri topic)
        : topic_(std::move(topic)),
          subId_(subId),
          slotId_(slotId)
    {}
};

/** Compares two subscriptions for equality.
    @relates Subscription */
inline bool operator==(const Subscription& lhs, const Subscription& rhs)
{
    return lhs.id() == rhs.id() && lhs.slotId() == rhs.slotId();
}

/** Compares two subscriptions for inequality.
    @relates Subscription */
inline bool operator!=(const Subscription& lhs, const Subscription& rhs)
{
    return !(lhs == rhs);
}

/** Outputs the subscription's topic and IDs.
    @relates Subscription */
inline std::ostream& operator<<(std::ostream& out, const Subscription& s)
{
    return out << s.topic() << " (id=" << s.id() << ", slot=" << s.slotId()
               << ")";
}

} // namespace wampcore

#endif // WAMPCORE_SUBSCRIPTION_HPP
