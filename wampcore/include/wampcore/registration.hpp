/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#ifndef WAMPCORE_REGISTRATION_HPP
#define WAMPCORE_REGISTRATION_HPP

//------------------------------------------------------------------------------
/** @file
    @brief Contains the declaration of the Registration class. */
//------------------------------------------------------------------------------

#include <ostream>
#include <utility>
#include "api.hpp"
#include "wampdefs.hpp"
#include "internal/passkey.hpp"

namespace wampcore
{

//------------------------------------------------------------------------------
/** Represents a remote procedure registration.

    A Registration is a lightweight value returned by Session::enroll, which
    can later be passed to Session::unregister. Unregistering a registration
    that no longer exists completes with `false`. */
//------------------------------------------------------------------------------
class WAMPCORE_API Registration
{
public:
    /** Constructs an empty registration. */
    Registration() = default;

    /** Returns true if the registration is non-empty. */
    explicit operator bool() const {return !uri_.empty();}

    /** Obtains the registration ID number. */
    RegistrationId id() const {return regId_;}

    /** Obtains the procedure URI. */
    const Uri& uri() const {return uri_;}

private:
    Uri uri_;
    RegistrationId regId_ = nullId();

public:
    // Internal use only
    Registration(internal::PassKey, RegistrationId regId, Uri uri)
        : uri_(std::move(uri)),
          regId_(regId)
    {}
};

/** Compares two registrations for equality.
    @relates Registration */
inline bool operator==(const Registration& lhs, const Registration& rhs)
{
    return lhs.id() == rhs.id() && lhs.uri() == rhs.uri();
}

/** Compares two registrations for inequality.
    @relates Registration */
inline bool operator!=(const Registration& lhs, const Registration& rhs)
{
    return !(lhs == rhs);
}

/** Outputs the registration's procedure URI and ID.
    @relates Registration */
inline std::ostream& operator<<(std::ostream& out, const Registration& r)
{
    return out << r.uri() << " (id=" << r.id() << ")";
}

} // namespace wampcore

#endif // WAMPCORE_REGISTRATION_HPP
