/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#ifndef WAMPCORE_SESSIONCONFIG_HPP
#define WAMPCORE_SESSIONCONFIG_HPP

//------------------------------------------------------------------------------
/** @file
    @brief Contains the SessionConfig class. */
//------------------------------------------------------------------------------

#include <functional>
#include <string>
#include <vector>
#include "api.hpp"
#include "logging.hpp"
#include "sessioninfo.hpp"
#include "transport.hpp"
#include "variant.hpp"
#include "wampdefs.hpp"

namespace wampcore
{

//------------------------------------------------------------------------------
/** Contains the settings used to open a session.

    The realm and transport factory are mandatory. All other settings have
    defaults: the agent string is Version::agentString(), log entries below
    LogLevel::warning are discarded, and no challenge handler is set. */
//------------------------------------------------------------------------------
class WAMPCORE_API SessionConfig
{
public:
    /// Type-erased handler invoked when the router issues a `CHALLENGE`.
    using ChallengeHandler = std::function<void (Challenge)>;

    /** Default constructor. */
    SessionConfig();

    /** Constructor taking the realm URI and transport factory. */
    SessionConfig(Uri realm, TransportFactory transportFactory);

    /** Sets the agent string sent in the `HELLO` details. */
    SessionConfig& withAgent(String agent);

    /** Sets the handler that receives log entries. */
    SessionConfig& withLogHandler(LogHandler handler);

    /** Sets the minimum severity of log entries passed to the log
        handler. */
    SessionConfig& withLogLevel(LogLevel level);

    /** Sets the handler invoked when the router issues a `CHALLENGE`.
        The handler must answer via Challenge::authenticate. */
    SessionConfig& withChallengeHandler(ChallengeHandler handler);

    /** Sets extra `HELLO` details to be merged with the generated ones. */
    SessionConfig& withHelloDetails(Object details);

    /** Sets the `authid` HELLO detail. */
    SessionConfig& withAuthId(String authId);

    /** Sets the `authmethods` HELLO detail. */
    SessionConfig& withAuthMethods(std::vector<String> methods);

    const Uri& realm() const;

    const TransportFactory& transportFactory() const;

    const String& agent() const;

    const LogHandler& logHandler() const;

    LogLevel logLevel() const;

    const ChallengeHandler& challengeHandler() const;

    const Object& helloDetails() const;

    const String& authId() const;

    const std::vector<String>& authMethods() const;

    /** Generates the complete details dictionary for the `HELLO` message,
        including the client roles. */
    Object makeHelloDetails() const;

private:
    Uri realm_;
    TransportFactory transportFactory_;
    String agent_;
    LogHandler logHandler_;
    ChallengeHandler challengeHandler_;
    Object helloDetails_;
    String authId_;
    std::vector<String> authMethods_;
    LogLevel logLevel_ = LogLevel::warning;
};

} // namespace wampcore

#ifndef WAMPCORE_COMPILED_LIB
#include "internal/sessionconfig.inl.hpp"
#endif

#endif // WAMPCORE_SESSIONCONFIG_HPP
