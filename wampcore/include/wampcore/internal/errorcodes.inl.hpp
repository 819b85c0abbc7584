/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#include "../errorcodes.hpp"
#include <algorithm>
#include <type_traits>
#include <boost/asio/error.hpp>
#include <jsoncons/json_error.hpp>
#include "../api.hpp"
#include "../exceptions.hpp"

namespace wampcore
{

namespace internal
{

// Message tables, indexed by enumerator value.

WAMPCORE_INLINE const char* const* transportErrcMessages()
{
    static const char* const table[] =
    {
        "Transport operation successful",
        "Transport I/O was cancelled",
        "Transport closed by the remote peer",
        "Transport broken or not started",
        "Transport reconnection attempts exhausted"
    };

    static_assert(std::extent<decltype(table)>::value ==
                  static_cast<std::size_t>(TransportErrc::count), "");
    return table;
}

WAMPCORE_INLINE const char* const* decodingErrcMessages()
{
    static const char* const table[] =
    {
        "Decoding successful",
        "Received bytes are not a valid document",
        "Received bytes contain no document"
    };

    static_assert(std::extent<decltype(table)>::value ==
                  static_cast<std::size_t>(DecodingErrc::count), "");
    return table;
}

WAMPCORE_INLINE const char* const* wampErrcMessages()
{
    static const char* const table[] =
    {
        "No error",
        "Unrecognized error URI",
        "Peer asked to close the realm",
        "GOODBYE acknowledged",
        "Session killed by the router",
        "Session closed normally",
        "Router shutting down",
        "WAMP protocol violation",
        "Invalid argument",
        "Invalid URI",
        "No such procedure",
        "No such realm",
        "No such registration",
        "No such subscription",
        "Procedure already registered by another callee",
        "Authentication failed",
        "Authorization denied",
        "Call cancelled",
        "Option not allowed by the router",
        "Caller disclosure not allowed by the router"
    };

    static_assert(std::extent<decltype(table)>::value ==
                  static_cast<std::size_t>(WampErrc::count), "");
    return table;
}

WAMPCORE_INLINE const char* const* miscErrcMessages()
{
    static const char* const table[] =
    {
        "No error",
        "Operation abandoned because the session closed",
        "Operation not allowed in the current session state",
        "Procedure already registered by this session",
        "Item is absent",
        "Item has the wrong type"
    };

    static_assert(std::extent<decltype(table)>::value ==
                  static_cast<std::size_t>(MiscErrc::count), "");
    return table;
}

WAMPCORE_INLINE const char* TabulatedCategory::name() const noexcept
{
    return name_;
}

WAMPCORE_INLINE std::string TabulatedCategory::message(int ev) const
{
    if (ev >= 0 && ev < size_)
        return messages_[ev];
    return std::string(name_) + ':' + std::to_string(ev);
}

} // namespace internal


//------------------------------------------------------------------------------
// Transport failures
//------------------------------------------------------------------------------

WAMPCORE_INLINE TransportCategory::TransportCategory()
    : TabulatedCategory("wampcore::TransportCategory",
                        internal::transportErrcMessages(),
                        TransportErrc::count)
{}

WAMPCORE_INLINE bool TransportCategory::equivalent(
    const std::error_code& code, int condition) const noexcept
{
    auto errc = static_cast<TransportErrc>(condition);

    if (code.category() == *this)
    {
        return code.value() == condition ||
               (errc == TransportErrc::failed &&
                code.value() > static_cast<int>(TransportErrc::failed));
    }

    namespace AE = boost::asio::error;
    switch (errc)
    {
    case TransportErrc::success:
        return !code;

    case TransportErrc::aborted:
        return code == std::errc::operation_canceled ||
               code == AE::make_error_code(AE::operation_aborted);

    case TransportErrc::disconnected:
        return code == std::errc::connection_reset ||
               code == AE::make_error_code(AE::connection_reset) ||
               code == AE::make_error_code(AE::eof);

    case TransportErrc::failed:
        return code && (code.category() == std::generic_category() ||
                        code.category() == std::system_category());

    default:
        return false;
    }
}

WAMPCORE_INLINE TransportCategory& transportCategory()
{
    static TransportCategory category;
    return category;
}

WAMPCORE_INLINE std::error_code make_error_code(TransportErrc errc)
{
    return {static_cast<int>(errc), transportCategory()};
}

WAMPCORE_INLINE std::error_condition make_error_condition(TransportErrc errc)
{
    return {static_cast<int>(errc), transportCategory()};
}


//------------------------------------------------------------------------------
// Protocol violations detected while decoding
//------------------------------------------------------------------------------

WAMPCORE_INLINE DecodingCategory::DecodingCategory()
    : TabulatedCategory("wampcore::DecodingCategory",
                        internal::decodingErrcMessages(),
                        DecodingErrc::count)
{}

WAMPCORE_INLINE bool DecodingCategory::equivalent(
    const std::error_code& code, int condition) const noexcept
{
    if (!code)
        return condition == static_cast<int>(DecodingErrc::success);

    bool ours = code.category() == *this;
    if (condition == static_cast<int>(DecodingErrc::failed))
        return ours || code.category() == jsoncons::json_error_category();
    return ours && code.value() == condition;
}

WAMPCORE_INLINE DecodingCategory& decodingCategory()
{
    static DecodingCategory category;
    return category;
}

WAMPCORE_INLINE std::error_code make_error_code(DecodingErrc errc)
{
    return {static_cast<int>(errc), decodingCategory()};
}

WAMPCORE_INLINE std::error_condition make_error_condition(DecodingErrc errc)
{
    return {static_cast<int>(errc), decodingCategory()};
}


//------------------------------------------------------------------------------
// Application errors and close reasons sent by the router
//------------------------------------------------------------------------------

WAMPCORE_INLINE WampCategory::WampCategory()
    : TabulatedCategory("wampcore::WampCategory", internal::wampErrcMessages(),
                        WampErrc::count)
{}

WAMPCORE_INLINE bool WampCategory::equivalent(
    const std::error_code& code, int condition) const noexcept
{
    if (code.category() != *this)
        return condition == static_cast<int>(WampErrc::success) && !code;

    if (code.value() == condition)
        return true;

    auto value = static_cast<WampErrc>(code.value());
    auto wanted = static_cast<WampErrc>(condition);
    if (wanted == WampErrc::goodbyeAndOut)
        return value == WampErrc::closedNormally;
    if (wanted == WampErrc::closedNormally)
        return value == WampErrc::goodbyeAndOut;
    if (wanted == WampErrc::optionNotAllowed)
        return value == WampErrc::discloseMeDisallowed;
    return false;
}

WAMPCORE_INLINE WampCategory& wampCategory()
{
    static WampCategory category;
    return category;
}

WAMPCORE_INLINE std::error_code make_error_code(WampErrc errc)
{
    return {static_cast<int>(errc), wampCategory()};
}

WAMPCORE_INLINE std::error_condition make_error_condition(WampErrc errc)
{
    return {static_cast<int>(errc), wampCategory()};
}

namespace internal
{

// Indexed by WampErrc value.
WAMPCORE_INLINE const std::string* wampErrcUris()
{
    static const std::string uris[] =
    {
        "wampcore.error.success",
        "wampcore.error.unknown",
        "wamp.close.close_realm",
        "wamp.close.goodbye_and_out",
        "wamp.close.killed",
        "wamp.close.normal",
        "wamp.close.system_shutdown",
        "wamp.error.protocol_violation",
        "wamp.error.invalid_argument",
        "wamp.error.invalid_uri",
        "wamp.error.no_such_procedure",
        "wamp.error.no_such_realm",
        "wamp.error.no_such_registration",
        "wamp.error.no_such_subscription",
        "wamp.error.procedure_already_exists",
        "wamp.error.authentication_failed",
        "wamp.error.authorization_denied",
        "wamp.error.canceled",
        "wamp.error.option_not_allowed",
        "wamp.error.option_disallowed.disclose_me"
    };

    static_assert(std::extent<decltype(uris)>::value ==
                  static_cast<std::size_t>(WampErrc::count), "");
    return uris;
}

} // namespace internal

WAMPCORE_INLINE WampErrc errorUriToCode(const std::string& uri)
{
    struct Alias
    {
        const char* uri;
        WampErrc errc;
    };

    // Spellings used by older routers.
    static const Alias legacy[] =
    {
        {"wamp.error.close_realm",     WampErrc::closeRealm},
        {"wamp.error.goodbye_and_out", WampErrc::goodbyeAndOut},
        {"wamp.error.not_authorized",  WampErrc::authorizationDenied},
        {"wamp.error.system_shutdown", WampErrc::systemShutdown}
    };

    const auto* uris = internal::wampErrcUris();
    const auto* end = uris + static_cast<int>(WampErrc::count);
    auto found = std::find(uris, end, uri);
    if (found != end)
        return static_cast<WampErrc>(found - uris);

    for (const auto& alias: legacy)
        if (uri == alias.uri)
            return alias.errc;

    return WampErrc::unknown;
}

WAMPCORE_INLINE const std::string& errorCodeToUri(WampErrc errc)
{
    auto n = static_cast<int>(errc);
    WAMPCORE_LOGIC_CHECK(n >= 0 && n < static_cast<int>(WampErrc::count),
                         "Not a WampErrc enumerator");
    return internal::wampErrcUris()[n];
}

WAMPCORE_INLINE std::string errorCodeToUri(std::error_code ec)
{
    if (ec.category() == wampCategory())
        return errorCodeToUri(static_cast<WampErrc>(ec.value()));
    return std::string("wampcore.error.") + ec.category().name() + '.' +
           std::to_string(ec.value());
}


//------------------------------------------------------------------------------
// Errors raised locally by the session
//------------------------------------------------------------------------------

WAMPCORE_INLINE MiscCategory::MiscCategory()
    : TabulatedCategory("wampcore::MiscCategory", internal::miscErrcMessages(),
                        MiscErrc::count)
{}

WAMPCORE_INLINE bool MiscCategory::equivalent(
    const std::error_code& code, int condition) const noexcept
{
    if (code.category() == *this)
        return code.value() == condition;
    return condition == static_cast<int>(MiscErrc::success) && !code;
}

WAMPCORE_INLINE MiscCategory& miscCategory()
{
    static MiscCategory category;
    return category;
}

WAMPCORE_INLINE std::error_code make_error_code(MiscErrc errc)
{
    return {static_cast<int>(errc), miscCategory()};
}

WAMPCORE_INLINE std::error_condition make_error_condition(MiscErrc errc)
{
    return {static_cast<int>(errc), miscCategory()};
}

} // namespace wampcore
