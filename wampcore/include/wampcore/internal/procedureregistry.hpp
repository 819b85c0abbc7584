/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#ifndef WAMPCORE_INTERNAL_PROCEDUREREGISTRY_HPP
#define WAMPCORE_INTERNAL_PROCEDUREREGISTRY_HPP

#include <functional>
#include <map>
#include <set>
#include <utility>
#include "../errorcodes.hpp"
#include "../erroror.hpp"
#include "../registration.hpp"
#include "../rpcinfo.hpp"
#include "../wampdefs.hpp"

namespace wampcore
{

namespace internal
{

//------------------------------------------------------------------------------
struct ProcedureRecord
{
    using CallSlot = std::function<Outcome (Invocation)>;

    ProcedureRecord(Uri uri, CallSlot&& slot)
        : callSlot(std::move(slot)),
          uri(std::move(uri))
    {}

    CallSlot callSlot;
    Uri uri;
    bool armed = true; // Cleared while an unregister is awaiting the router
};

//------------------------------------------------------------------------------
// Registration registry mapping registration IDs to procedure URIs and local
// call slots. Also tracks procedure URIs whose REGISTER is in flight, and
// invocations that have not yet been answered.
//------------------------------------------------------------------------------
class ProcedureRegistry
{
public:
    using CallSlot = ProcedureRecord::CallSlot;

    // Returns false if the URI is already registered or being registered
    // by this session.
    bool reserve(const Uri& uri)
    {
        if (uris_.count(uri) != 0)
            return false;
        uris_.insert(uri);
        return true;
    }

    // Releases a reserved URI after a failed REGISTER.
    void release(const Uri& uri) {uris_.erase(uri);}

    bool isReserved(const Uri& uri) const {return uris_.count(uri) != 0;}

    ErrorOr<Registration> insert(RegistrationId regId, Uri uri,
                                 CallSlot slot)
    {
        auto emplaced = procedures_.emplace(
            regId, ProcedureRecord(uri, std::move(slot)));
        if (!emplaced.second)
            return makeUnexpectedError(WampErrc::procedureAlreadyExists);
        uris_.insert(uri);
        return Registration{PassKey{}, regId, std::move(uri)};
    }

    // Returns false if the registration was removed or is being removed.
    bool contains(const Registration& reg) const
    {
        auto kv = procedures_.find(reg.id());
        return kv != procedures_.end() && kv->second.armed &&
               kv->second.uri == reg.uri();
    }

    void disarm(const Registration& reg)
    {
        auto kv = procedures_.find(reg.id());
        if (kv != procedures_.end())
            kv->second.armed = false;
    }

    bool remove(const Registration& reg)
    {
        auto kv = procedures_.find(reg.id());
        if (kv == procedures_.end())
            return false;
        uris_.erase(kv->second.uri);
        procedures_.erase(kv);
        return true;
    }

    // Returns an empty slot if no procedure is registered under the given
    // ID. Procedures awaiting unregistration still receive invocations.
    CallSlot find(RegistrationId regId) const
    {
        auto kv = procedures_.find(regId);
        return (kv == procedures_.end()) ? CallSlot() : kv->second.callSlot;
    }

    void trackInvocation(RequestId invocationId, RegistrationId regId)
    {
        invocations_[invocationId] = regId;
    }

    // Returns false if the invocation is not pending, which occurs when it
    // was already answered.
    bool settleInvocation(RequestId invocationId)
    {
        return invocations_.erase(invocationId) != 0;
    }

    bool hasPendingInvocation(RequestId invocationId) const
    {
        return invocations_.count(invocationId) != 0;
    }

    std::size_t pendingInvocationCount() const {return invocations_.size();}

    std::size_t size() const {return procedures_.size();}

    bool empty() const {return procedures_.empty();}

    void clear()
    {
        procedures_.clear();
        uris_.clear();
        invocations_.clear();
    }

private:
    std::map<RegistrationId, ProcedureRecord> procedures_;
    std::map<RequestId, RegistrationId> invocations_;
    std::set<Uri> uris_;
};

} // namespace internal

} // namespace wampcore

#endif // WAMPCORE_INTERNAL_PROCEDUREREGISTRY_HPP
