/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#ifndef WAMPCORE_ERROR_HPP
#define WAMPCORE_ERROR_HPP

//------------------------------------------------------------------------------
/** @file
    @brief Contains the Error class which carries WAMP `ERROR` payloads. */
//------------------------------------------------------------------------------

#include <ostream>
#include <system_error>
#include <utility>
#include "api.hpp"
#include "errorcodes.hpp"
#include "exceptions.hpp"
#include "payload.hpp"
#include "variant.hpp"
#include "wampdefs.hpp"
#include "internal/passkey.hpp"

namespace wampcore
{

//------------------------------------------------------------------------------
/** Provides the _reason_ URI, details, and payload arguments contained
    within WAMP `ERROR` messages.

    An Error can be returned or thrown from a call slot to have an `ERROR`
    message sent back to the caller. It is also used to capture the full
    `ERROR` payload of a failed call via Rpc::captureError. */
//------------------------------------------------------------------------------
class WAMPCORE_API Error : public Payload<Error>
{
public:
    /** Default constructor. */
    Error() = default;

    /** Converting constructor taking a reason URI and optional positional
        payload arguments. */
    template <typename... Ts>
    Error(Uri uri, Ts&&... args)
        : uri_(std::move(uri))
    {
        this->withArgs(std::forward<Ts>(args)...);
    }

    /** Converting constructor taking a reason URI given as a string
        literal. */
    template <typename... Ts>
    Error(const char* uri, Ts&&... args)
        : Error(Uri(uri), std::forward<Ts>(args)...)
    {}

    /** Converting constructor taking an error code, attempting to convert
        it to a reason URI, as well as optional positional payload
        arguments. */
    template <typename... Ts>
    Error(std::error_code ec, Ts&&... args)
        : Error(errorCodeToUri(ec), std::forward<Ts>(args)...)
    {}

    /** Converting constructor taking a WampErrc, converting it to a reason
        URI, as well as optional positional payload arguments. */
    template <typename... Ts>
    Error(WampErrc errc, Ts&&... args)
        : Error(errorCodeToUri(errc), std::forward<Ts>(args)...)
    {}

    /** Constructor taking an error::BadType exception and
        interpreting it as a `wamp.error.invalid_argument` reason URI. */
    explicit Error(const error::BadType& e);

    /** Conversion to bool operator, returning false if the error is empty. */
    explicit operator bool() const {return !uri_.empty();}

    /** Obtains the reason URI. */
    const Uri& uri() const & {return uri_;}

    /** Moves the reason URI. */
    Uri&& uri() && {return std::move(uri_);}

    /** Accesses the details dictionary. */
    const Object& details() const {return options();}

    /** Attempts to convert the reason URI to a known error code. */
    WampErrc errorCode() const;

private:
    Uri uri_;

public:
    // Internal use only
    Error(internal::PassKey, Uri uri, Object details, Array args,
          Object kwargs);
};

/** Outputs the error's URI and payload.
    @relates Error */
WAMPCORE_API std::ostream& operator<<(std::ostream& out, const Error& e);

} // namespace wampcore

#ifndef WAMPCORE_COMPILED_LIB
#include "internal/error.inl.hpp"
#endif

#endif // WAMPCORE_ERROR_HPP
