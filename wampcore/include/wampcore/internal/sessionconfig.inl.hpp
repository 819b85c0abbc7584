/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#include "../sessionconfig.hpp"
#include "../api.hpp"
#include "../version.hpp"

namespace wampcore
{

namespace internal
{

inline const Object& clientRoles()
{
    static const Object roles =
    {
        {"callee",     Object{{"features", Object{}}}},
        {"caller",     Object{{"features", Object{
                            {"caller_identification", true}}}}},
        {"publisher",  Object{{"features", Object{
                            {"publisher_exclusion", true},
                            {"publisher_identification", true},
                            {"subscriber_blackwhite_listing", true}}}}},
        {"subscriber", Object{{"features", Object{
                            {"pattern_based_subscription", true},
                            {"publisher_identification", true}}}}}
    };
    return roles;
}

} // namespace internal

WAMPCORE_INLINE SessionConfig::SessionConfig()
    : agent_(Version::agentString())
{}

WAMPCORE_INLINE SessionConfig::SessionConfig(Uri realm,
                                             TransportFactory transportFactory)
    : realm_(std::move(realm)),
      transportFactory_(std::move(transportFactory)),
      agent_(Version::agentString())
{}

WAMPCORE_INLINE SessionConfig& SessionConfig::withAgent(String agent)
{
    agent_ = std::move(agent);
    return *this;
}

WAMPCORE_INLINE SessionConfig& SessionConfig::withLogHandler(LogHandler handler)
{
    logHandler_ = std::move(handler);
    return *this;
}

WAMPCORE_INLINE SessionConfig& SessionConfig::withLogLevel(LogLevel level)
{
    logLevel_ = level;
    return *this;
}

WAMPCORE_INLINE SessionConfig&
SessionConfig::withChallengeHandler(ChallengeHandler handler)
{
    challengeHandler_ = std::move(handler);
    return *this;
}

WAMPCORE_INLINE SessionConfig& SessionConfig::withHelloDetails(Object details)
{
    helloDetails_ = std::move(details);
    return *this;
}

WAMPCORE_INLINE SessionConfig& SessionConfig::withAuthId(String authId)
{
    authId_ = std::move(authId);
    return *this;
}

WAMPCORE_INLINE SessionConfig&
SessionConfig::withAuthMethods(std::vector<String> methods)
{
    authMethods_ = std::move(methods);
    return *this;
}

WAMPCORE_INLINE const Uri& SessionConfig::realm() const {return realm_;}

WAMPCORE_INLINE const TransportFactory& SessionConfig::transportFactory() const
{
    return transportFactory_;
}

WAMPCORE_INLINE const String& SessionConfig::agent() const {return agent_;}

WAMPCORE_INLINE const LogHandler& SessionConfig::logHandler() const
{
    return logHandler_;
}

WAMPCORE_INLINE LogLevel SessionConfig::logLevel() const {return logLevel_;}

WAMPCORE_INLINE const SessionConfig::ChallengeHandler&
SessionConfig::challengeHandler() const
{
    return challengeHandler_;
}

WAMPCORE_INLINE const Object& SessionConfig::helloDetails() const
{
    return helloDetails_;
}

WAMPCORE_INLINE const String& SessionConfig::authId() const {return authId_;}

WAMPCORE_INLINE const std::vector<String>& SessionConfig::authMethods() const
{
    return authMethods_;
}

//------------------------------------------------------------------------------
/** @details
    Entries set via withHelloDetails take precedence over the generated
    `agent`, `roles`, `authid`, and `authmethods` entries. */
//------------------------------------------------------------------------------
WAMPCORE_INLINE Object SessionConfig::makeHelloDetails() const
{
    Object details = helloDetails_;
    details.emplace("roles", internal::clientRoles());
    if (!agent_.empty())
        details.emplace("agent", agent_);
    if (!authId_.empty())
        details.emplace("authid", authId_);
    if (!authMethods_.empty())
    {
        Array methods(authMethods_.begin(), authMethods_.end());
        details.emplace("authmethods", std::move(methods));
    }
    return details;
}

} // namespace wampcore
