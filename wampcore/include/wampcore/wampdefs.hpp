/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#ifndef WAMPCORE_WAMPDEFS_HPP
#define WAMPCORE_WAMPDEFS_HPP

//------------------------------------------------------------------------------
/** @file
    @brief Contains type definitions related to WAMP IDs and sessions. */
//------------------------------------------------------------------------------

#include <cstdint>
#include <string>

namespace wampcore
{

using EphemeralId    = uint64_t;    ///< Ephemeral ID type
using SessionId      = EphemeralId; ///< Ephemeral ID associated with a WAMP session
using RequestId      = EphemeralId; ///< Ephemeral ID associated with a WAMP request
using SubscriptionId = EphemeralId; ///< Ephemeral ID associated with an topic subscription
using PublicationId  = EphemeralId; ///< Ephemeral ID associated with an event publication
using RegistrationId = EphemeralId; ///< Ephemeral ID associated with an RPC registration
using Uri            = std::string; ///< String type used for URIs

/// Obtains the value representing a blank ephemeral ID.
constexpr EphemeralId nullId() {return 0;}

/// Obtains the largest valid ephemeral ID (2^53).
constexpr EphemeralId maxEphemeralId() {return 9007199254740992ull;}

//------------------------------------------------------------------------------
/** Enumerates the possible states that a client session can be in. */
//------------------------------------------------------------------------------
enum class SessionState
{
    closed,         ///< No WAMP session and no transport
    connecting,     ///< HELLO sent, awaiting WELCOME
    authenticating, ///< CHALLENGE answered, awaiting WELCOME
    established,    ///< WAMP session is established
    closing         ///< GOODBYE sent, awaiting the router's GOODBYE
};

//------------------------------------------------------------------------------
/** Obtains a label for the given session state. */
//------------------------------------------------------------------------------
inline const std::string& sessionStateLabel(SessionState state)
{
    static const std::string labels[] =
        {"closed", "connecting", "authenticating", "established", "closing"};
    return labels[static_cast<unsigned>(state)];
}

//------------------------------------------------------------------------------
/** URI matching policy used for subscriptions. */
//------------------------------------------------------------------------------
enum class MatchPolicy
{
    unknown,
    exact,
    prefix,
    wildcard
};

} // namespace wampcore

#endif // WAMPCORE_WAMPDEFS_HPP
