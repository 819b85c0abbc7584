/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#include "../error.hpp"
#include "../api.hpp"

namespace wampcore
{

//------------------------------------------------------------------------------
/** @details
    The exception message is passed as the sole positional argument. */
//------------------------------------------------------------------------------
WAMPCORE_INLINE Error::Error(const error::BadType& e)
    : Error(WampErrc::invalidArgument, String(e.what()))
{}

//------------------------------------------------------------------------------
WAMPCORE_INLINE WampErrc Error::errorCode() const
{
    return errorUriToCode(uri_);
}

//------------------------------------------------------------------------------
WAMPCORE_INLINE Error::Error(internal::PassKey, Uri uri, Object details,
                             Array args, Object kwargs)
    : Payload<Error>(std::move(details), std::move(args), std::move(kwargs)),
      uri_(std::move(uri))
{}

//------------------------------------------------------------------------------
WAMPCORE_INLINE std::ostream& operator<<(std::ostream& out, const Error& e)
{
    out << e.uri();
    if (!e.args().empty())
        out << " " << e.args();
    if (!e.kwargs().empty())
        out << " " << e.kwargs();
    return out;
}

} // namespace wampcore
