/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#include "../sessioninfo.hpp"
#include "../api.hpp"

namespace wampcore
{

//******************************************************************************
// Reason
//******************************************************************************

WAMPCORE_INLINE Reason::Reason() : uri_("wamp.close.close_realm") {}

WAMPCORE_INLINE Reason::Reason(Uri uri) : uri_(std::move(uri)) {}

WAMPCORE_INLINE Reason::Reason(const char* uri) : uri_(uri) {}

WAMPCORE_INLINE Reason::Reason(WampErrc errc) : uri_(errorCodeToUri(errc)) {}

WAMPCORE_INLINE Reason& Reason::withHint(String text)
{
    return withOption("message", std::move(text));
}

WAMPCORE_INLINE const Uri& Reason::uri() const {return uri_;}

WAMPCORE_INLINE String Reason::hint() const
{
    return optionOr<String>("message", String());
}

WAMPCORE_INLINE WampErrc Reason::errorCode() const
{
    return errorUriToCode(uri_);
}

WAMPCORE_INLINE Reason::Reason(internal::PassKey, Object details, Uri uri)
    : Options<Reason>(std::move(details)),
      uri_(std::move(uri))
{}

WAMPCORE_INLINE std::ostream& operator<<(std::ostream& out, const Reason& r)
{
    out << r.uri();
    auto hint = r.hint();
    if (!hint.empty())
        out << " (" << hint << ")";
    return out;
}


//******************************************************************************
// Welcome
//******************************************************************************

WAMPCORE_INLINE SessionId Welcome::id() const {return id_;}

WAMPCORE_INLINE const Uri& Welcome::realm() const {return realm_;}

WAMPCORE_INLINE const Object& Welcome::details() const {return options();}

WAMPCORE_INLINE String Welcome::agentString() const
{
    return optionOr<String>("agent", String());
}

WAMPCORE_INLINE Object Welcome::roles() const
{
    return optionOr<Object>("roles", Object());
}

WAMPCORE_INLINE bool Welcome::supportsRole(const String& role) const
{
    return roles().count(role) != 0;
}

WAMPCORE_INLINE ErrorOr<String> Welcome::authId() const
{
    return optionAs<String>("authid");
}

WAMPCORE_INLINE ErrorOr<String> Welcome::authRole() const
{
    return optionAs<String>("authrole");
}

WAMPCORE_INLINE Welcome::Welcome(internal::PassKey, SessionId sid, Uri realm,
                                 Object details)
    : Options<Welcome>(std::move(details)),
      realm_(std::move(realm)),
      id_(sid)
{}


//******************************************************************************
// Authentication
//******************************************************************************

WAMPCORE_INLINE Authentication::Authentication(String signature)
    : signature_(std::move(signature))
{}

WAMPCORE_INLINE Authentication::Authentication(const char* signature)
    : signature_(signature)
{}

WAMPCORE_INLINE const String& Authentication::signature() const
{
    return signature_;
}


//******************************************************************************
// Challenge
//******************************************************************************

WAMPCORE_INLINE const String& Challenge::method() const {return method_;}

WAMPCORE_INLINE const Object& Challenge::extra() const {return options();}

WAMPCORE_INLINE void Challenge::authenticate(Authentication auth) const
{
    auto challengee = challengee_.lock();
    if (challengee)
        challengee->safeAuthenticate(generation_, std::move(auth));
}

WAMPCORE_INLINE Challenge::Challenge(
    internal::PassKey, internal::Challengee::WeakPtr challengee,
    std::uint64_t generation, String method, Object extra)
    : Options<Challenge>(std::move(extra)),
      challengee_(std::move(challengee)),
      method_(std::move(method)),
      generation_(generation)
{}

} // namespace wampcore
