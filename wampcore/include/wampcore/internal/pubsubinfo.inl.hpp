/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#include "../pubsubinfo.hpp"
#include "../api.hpp"

namespace wampcore
{

namespace internal
{

inline const String& matchPolicyOptionValue(MatchPolicy policy)
{
    static const String labels[] = {"", "exact", "prefix", "wildcard"};
    return labels[static_cast<unsigned>(policy)];
}

} // namespace internal


//******************************************************************************
// Topic
//******************************************************************************

WAMPCORE_INLINE Topic::Topic(Uri uri) : uri_(std::move(uri)) {}

WAMPCORE_INLINE Topic::Topic(const char* uri) : uri_(uri) {}

WAMPCORE_INLINE const Uri& Topic::uri() const {return uri_;}

//------------------------------------------------------------------------------
/** @details
    The `match` option is omitted for MatchPolicy::exact, which is the
    router's default.
    @throws error::Logic if the policy is MatchPolicy::unknown. */
//------------------------------------------------------------------------------
WAMPCORE_INLINE Topic& Topic::withMatchPolicy(MatchPolicy policy)
{
    WAMPCORE_LOGIC_CHECK(policy != MatchPolicy::unknown,
                         "wampcore::Topic::withMatchPolicy: "
                         "policy cannot be unknown");
    matchPolicy_ = policy;
    if (policy == MatchPolicy::exact)
        options().erase("match");
    else
        withOption("match", internal::matchPolicyOptionValue(policy));
    return *this;
}

WAMPCORE_INLINE MatchPolicy Topic::matchPolicy() const {return matchPolicy_;}


//******************************************************************************
// Pub
//******************************************************************************

WAMPCORE_INLINE Pub::Pub(Uri topic) : uri_(std::move(topic)) {}

WAMPCORE_INLINE Pub::Pub(const char* topic) : uri_(topic) {}

WAMPCORE_INLINE const Uri& Pub::uri() const {return uri_;}

WAMPCORE_INLINE Pub& Pub::withExcludedSessions(Array sessionIds)
{
    return withOption("exclude", std::move(sessionIds));
}

WAMPCORE_INLINE Pub& Pub::withEligibleSessions(Array sessionIds)
{
    return withOption("eligible", std::move(sessionIds));
}

WAMPCORE_INLINE Pub& Pub::withExcludeMe(bool excluded)
{
    return withOption("exclude_me", excluded);
}

WAMPCORE_INLINE bool Pub::excludeMe() const
{
    return optionOr<bool>("exclude_me", true);
}

WAMPCORE_INLINE Pub& Pub::withDiscloseMe(bool disclosed)
{
    return withOption("disclose_me", disclosed);
}

WAMPCORE_INLINE bool Pub::discloseMe() const
{
    return optionOr<bool>("disclose_me", false);
}


//******************************************************************************
// Event
//******************************************************************************

WAMPCORE_INLINE bool Event::ready() const {return subId_ != nullId();}

WAMPCORE_INLINE SubscriptionId Event::subscriptionId() const {return subId_;}

WAMPCORE_INLINE PublicationId Event::publicationId() const {return pubId_;}

WAMPCORE_INLINE const Object& Event::details() const {return options();}

WAMPCORE_INLINE ErrorOr<SessionId> Event::publisher() const
{
    return optionAs<SessionId>("publisher");
}

WAMPCORE_INLINE ErrorOr<Uri> Event::topic() const
{
    return optionAs<Uri>("topic");
}

WAMPCORE_INLINE Event::Event(internal::PassKey, SubscriptionId subId,
                             PublicationId pubId, Object details, Array args,
                             Object kwargs)
    : Payload<Event>(std::move(details), std::move(args), std::move(kwargs)),
      subId_(subId),
      pubId_(pubId)
{}

WAMPCORE_INLINE std::ostream& operator<<(std::ostream& out,
                                         const Event& event)
{
    out << "[sub=" << event.subscriptionId()
        << " pub=" << event.publicationId();
    if (!event.args().empty())
        out << " args=" << event.args();
    if (!event.kwargs().empty())
        out << " kwargs=" << event.kwargs();
    return out << "]";
}

} // namespace wampcore
