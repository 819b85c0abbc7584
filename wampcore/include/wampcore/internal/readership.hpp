/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#ifndef WAMPCORE_INTERNAL_READERSHIP_HPP
#define WAMPCORE_INTERNAL_READERSHIP_HPP

#include <functional>
#include <map>
#include <utility>
#include <vector>
#include "../pubsubinfo.hpp"
#include "../subscription.hpp"
#include "../wampdefs.hpp"

namespace wampcore
{

namespace internal
{

//------------------------------------------------------------------------------
// Holds the local event slots of a single router subscription.
//------------------------------------------------------------------------------
class SubscriptionRecord
{
public:
    using SlotId = Subscription::SlotId;
    using EventSlot = std::function<void (Event)>;

    explicit SubscriptionRecord(Uri topic) : topic_(std::move(topic)) {}

    void addSlot(SlotId slotId, EventSlot&& handler)
    {
        slots_.emplace(slotId, Slot{std::move(handler), true});
    }

    bool hasArmedSlot(SlotId slotId) const
    {
        auto kv = slots_.find(slotId);
        return kv != slots_.end() && kv->second.armed;
    }

    // Prevents the slot from receiving further events while an unsubscribe
    // is awaiting the router's acknowledgement.
    void disarmSlot(SlotId slotId)
    {
        auto kv = slots_.find(slotId);
        if (kv != slots_.end())
            kv->second.armed = false;
    }

    bool removeSlot(SlotId slotId) {return slots_.erase(slotId) != 0;}

    std::size_t armedCount() const
    {
        std::size_t n = 0;
        for (const auto& kv: slots_)
            n += kv.second.armed ? 1 : 0;
        return n;
    }

    void collectArmed(std::vector<EventSlot>& handlers) const
    {
        for (const auto& kv: slots_)
            if (kv.second.armed)
                handlers.push_back(kv.second.handler);
    }

    const Uri& topic() const {return topic_;}

    bool empty() const {return slots_.empty();}

private:
    struct Slot
    {
        EventSlot handler;
        bool armed;
    };

    std::map<SlotId, Slot> slots_;
    Uri topic_;
};

//------------------------------------------------------------------------------
// Subscription registry mapping router subscription IDs to topic URIs and
// local event slots. A lookup miss is a valid outcome for every operation.
//------------------------------------------------------------------------------
class Readership
{
public:
    using SlotId = Subscription::SlotId;
    using EventSlot = SubscriptionRecord::EventSlot;
    using SlotList = std::vector<EventSlot>;

    // Adds a local slot under the given subscription ID, creating the
    // record if necessary.
    Subscription insert(SubscriptionId subId, Uri topic, EventSlot handler)
    {
        auto kv = records_.find(subId);
        if (kv == records_.end())
            kv = records_.emplace(subId, SubscriptionRecord(topic)).first;
        auto slotId = ++nextSlotId_;
        kv->second.addSlot(slotId, std::move(handler));
        return Subscription{PassKey{}, subId, slotId, std::move(topic)};
    }

    // Returns false if the subscription was removed or is being removed.
    bool contains(const Subscription& sub) const
    {
        auto kv = records_.find(sub.id());
        return kv != records_.end() && kv->second.hasArmedSlot(sub.slotId());
    }

    std::size_t armedSlotCount(SubscriptionId subId) const
    {
        auto kv = records_.find(subId);
        return (kv == records_.end()) ? 0 : kv->second.armedCount();
    }

    // True if the record exists but all of its slots await an UNSUBSCRIBE
    // acknowledgement.
    bool isRetiring(SubscriptionId subId) const
    {
        auto kv = records_.find(subId);
        return kv != records_.end() && kv->second.armedCount() == 0;
    }

    void disarm(const Subscription& sub)
    {
        auto kv = records_.find(sub.id());
        if (kv != records_.end())
            kv->second.disarmSlot(sub.slotId());
    }

    // Removes the local slot, and the whole record if it has no slots left.
    // Returns false if the slot was not found.
    bool remove(const Subscription& sub)
    {
        auto kv = records_.find(sub.id());
        if (kv == records_.end())
            return false;
        bool erased = kv->second.removeSlot(sub.slotId());
        if (kv->second.empty())
            records_.erase(kv);
        return erased;
    }

    // Returns a copy of the armed slots, so that slots may subscribe or
    // unsubscribe while the event is being dispatched.
    SlotList slotsFor(SubscriptionId subId) const
    {
        SlotList handlers;
        auto kv = records_.find(subId);
        if (kv != records_.end())
            kv->second.collectArmed(handlers);
        return handlers;
    }

    Uri topicOf(SubscriptionId subId) const
    {
        auto kv = records_.find(subId);
        return (kv == records_.end()) ? Uri() : kv->second.topic();
    }

    bool hasSubscription(SubscriptionId subId) const
    {
        return records_.count(subId) != 0;
    }

    std::size_t size() const {return records_.size();}

    bool empty() const {return records_.empty();}

    void clear() {records_.clear();}

private:
    std::map<SubscriptionId, SubscriptionRecord> records_;
    SlotId nextSlotId_ = 0;
};

} // namespace internal

} // namespace wampcore

#endif // WAMPCORE_INTERNAL_READERSHIP_HPP
