/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#ifndef WAMPCORE_PUBSUBINFO_HPP
#define WAMPCORE_PUBSUBINFO_HPP

//------------------------------------------------------------------------------
/** @file
    @brief Provides data structures for information exchanged via WAMP
           pub-sub messages. */
//------------------------------------------------------------------------------

#include <ostream>
#include "api.hpp"
#include "erroror.hpp"
#include "options.hpp"
#include "payload.hpp"
#include "variant.hpp"
#include "wampdefs.hpp"
#include "internal/passkey.hpp"

namespace wampcore
{

//------------------------------------------------------------------------------
/** Provides the topic URI and other options contained within WAMP
    `SUBSCRIBE' messages. */
//------------------------------------------------------------------------------
class WAMPCORE_API Topic : public Options<Topic>
{
public:
    /** Default constructor. */
    Topic() = default;

    /** Converting constructor taking a topic URI. */
    Topic(Uri uri);

    /** Converting constructor taking a topic URI string literal. */
    Topic(const char* uri);

    /** Obtains the topic URI. */
    const Uri& uri() const;

    /** @name Pattern-based Subscription
        @{ */
    /** Sets the matching policy to be used for this subscription. */
    Topic& withMatchPolicy(MatchPolicy policy);

    /** Obtains the matching policy used for this subscription. */
    MatchPolicy matchPolicy() const;
    /// @}

private:
    Uri uri_;
    MatchPolicy matchPolicy_ = MatchPolicy::exact;
};

//------------------------------------------------------------------------------
/** Provides the topic URI, options, and payload contained within WAMP
    `PUBLISH` messages. */
//------------------------------------------------------------------------------
class WAMPCORE_API Pub : public Payload<Pub>
{
public:
    /** Default constructor. */
    Pub() = default;

    /** Converting constructor taking a topic URI. */
    Pub(Uri topic);

    /** Converting constructor taking a topic URI string literal. */
    Pub(const char* topic);

    /** Obtains the topic URI. */
    const Uri& uri() const;

    /** @name Subscriber Allow/Deny Lists
        @{ */
    /** Specifies the list of (potential) _Subscriber_ session IDs that
        won't receive the published event. */
    Pub& withExcludedSessions(Array sessionIds);

    /** Specifies the list of (potential) _Subscriber_ session IDs that
        are allowed to receive the published event. */
    Pub& withEligibleSessions(Array sessionIds);
    /// @}

    /** @name Publisher Exclusion
        @{ */
    /** Specifies if this session should be excluded from receiving the
        event. */
    Pub& withExcludeMe(bool excluded = true);

    /** Determines if this session should be excluded from receiving the
        event. */
    bool excludeMe() const;
    /// @}

    /** @name Publisher Identification
        @{ */
    /** Requests that the identity of the publisher be disclosed
        in the event. */
    Pub& withDiscloseMe(bool disclosed = true);

    /** Determines if publisher disclosure was requested. */
    bool discloseMe() const;
    /// @}

private:
    Uri uri_;
};

//------------------------------------------------------------------------------
/** Provides the subscription/publication ids, details, and payload contained
    within WAMP `EVENT` messages. */
//------------------------------------------------------------------------------
class WAMPCORE_API Event : public Payload<Event>
{
public:
    /** Default constructor. */
    Event() = default;

    /** Determines if the Event has been initialized and is ready for use. */
    bool ready() const;

    /** Obtains the subscription ID associated with this event. */
    SubscriptionId subscriptionId() const;

    /** Obtains the publication ID associated with this event. */
    PublicationId publicationId() const;

    /** Accesses the details dictionary. */
    const Object& details() const;

    /** Obtains the publisher ID integer, if disclosed. */
    ErrorOr<SessionId> publisher() const;

    /** Obtains the original topic URI string used to make the publication,
        available for pattern-based subscriptions. */
    ErrorOr<Uri> topic() const;

private:
    SubscriptionId subId_ = nullId();
    PublicationId pubId_ = nullId();

public:
    // Internal use only
    Event(internal::PassKey, SubscriptionId subId, PublicationId pubId,
          Object details, Array args, Object kwargs);
};

/** Outputs the event's ids and payload.
    @relates Event */
WAMPCORE_API std::ostream& operator<<(std::ostream& out, const Event& event);

} // namespace wampcore

#ifndef WAMPCORE_COMPILED_LIB
#include "internal/pubsubinfo.inl.hpp"
#endif

#endif // WAMPCORE_PUBSUBINFO_HPP
