/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#ifndef WAMPCORE_SESSIONINFO_HPP
#define WAMPCORE_SESSIONINFO_HPP

//------------------------------------------------------------------------------
/** @file
    @brief Contains data structures for information exchanged during session
           establishment and teardown. */
//------------------------------------------------------------------------------

#include <ostream>
#include <system_error>
#include "api.hpp"
#include "errorcodes.hpp"
#include "erroror.hpp"
#include "options.hpp"
#include "variant.hpp"
#include "wampdefs.hpp"
#include "internal/challengee.hpp"
#include "internal/passkey.hpp"

namespace wampcore
{

//------------------------------------------------------------------------------
/** Provides the _reason_ URI and details contained within WAMP `ABORT` and
    `GOODBYE` messages. */
//------------------------------------------------------------------------------
class WAMPCORE_API Reason : public Options<Reason>
{
public:
    /** Default constructor, using `wamp.close.close_realm` as the reason
        URI. */
    Reason();

    /** Converting constructor taking a reason URI. */
    Reason(Uri uri);

    /** Converting constructor taking a reason URI string literal. */
    Reason(const char* uri);

    /** Converting constructor taking a WampErrc, converting it to a reason
        URI. */
    Reason(WampErrc errc);

    /** Sets the `message` details property. */
    Reason& withHint(String text);

    /** Obtains the reason URI. */
    const Uri& uri() const;

    /** Obtains the `message` details property, or an empty string if
        absent. */
    String hint() const;

    /** Attempts to convert the reason URI to a known error code. */
    WampErrc errorCode() const;

private:
    Uri uri_;

public:
    // Internal use only
    Reason(internal::PassKey, Object details, Uri uri);
};

/** Outputs the reason URI and hint.
    @relates Reason */
WAMPCORE_API std::ostream& operator<<(std::ostream& out, const Reason& r);

//------------------------------------------------------------------------------
/** Session information contained within WAMP `WELCOME` messages. */
//------------------------------------------------------------------------------
class WAMPCORE_API Welcome : public Options<Welcome>
{
public:
    /** Default constructor. */
    Welcome() = default;

    /** Obtains the WAMP session ID. */
    SessionId id() const;

    /** Obtains the realm URI. */
    const Uri& realm() const;

    /** Accesses the details dictionary. */
    const Object& details() const;

    /** Obtains the router's agent string, or an empty string if absent. */
    String agentString() const;

    /** Obtains the router roles dictionary, or an empty dictionary if
        absent. */
    Object roles() const;

    /** Determines if the router advertises the given role. */
    bool supportsRole(const String& role) const;

    /** Obtains the authentication ID assigned by the router. */
    ErrorOr<String> authId() const;

    /** Obtains the authentication role assigned by the router. */
    ErrorOr<String> authRole() const;

private:
    Uri realm_;
    SessionId id_ = nullId();

public:
    // Internal use only
    Welcome(internal::PassKey, SessionId sid, Uri realm, Object details);
};

//------------------------------------------------------------------------------
/** Provides the signature and extra information contained within WAMP
    `AUTHENTICATE` messages. */
//------------------------------------------------------------------------------
class WAMPCORE_API Authentication : public Options<Authentication>
{
public:
    /** Default constructor. */
    Authentication() = default;

    /** Converting constructor taking the authentication signature. */
    Authentication(String signature);

    /** Converting constructor taking a signature string literal. */
    Authentication(const char* signature);

    /** Obtains the authentication signature. */
    const String& signature() const;

private:
    String signature_;
};

//------------------------------------------------------------------------------
/** Provides the authentication method and extra information contained
    within WAMP `CHALLENGE` messages. */
//------------------------------------------------------------------------------
class WAMPCORE_API Challenge : public Options<Challenge>
{
public:
    /** Default constructor. */
    Challenge() = default;

    /** Obtains the authentication method string. */
    const String& method() const;

    /** Accesses the extra information dictionary. */
    const Object& extra() const;

    /** Sends an `AUTHENTICATE` in response to this challenge.
        May be called from any thread. Has no effect if the session is no
        longer authenticating. */
    void authenticate(Authentication auth) const;

private:
    internal::Challengee::WeakPtr challengee_;
    String method_;
    std::uint64_t generation_ = 0;

public:
    // Internal use only
    Challenge(internal::PassKey, internal::Challengee::WeakPtr challengee,
              std::uint64_t generation, String method, Object extra);
};

} // namespace wampcore

#ifndef WAMPCORE_COMPILED_LIB
#include "internal/sessioninfo.inl.hpp"
#endif

#endif // WAMPCORE_SESSIONINFO_HPP
