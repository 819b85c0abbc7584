/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#ifndef WAMPCORE_ERRORCODES_HPP
#define WAMPCORE_ERRORCODES_HPP

/** @file
    @brief Error codes reported through ErrorOr results and log entries.

    Each failure reported by a session belongs to one of these families:

    Family                 | Enumeration       | Effect on the session
    ---------------------- | ----------------- | -------------------------------
    Transport failure      | TransportErrc     | Torn down, pending ops fail
    Protocol violation     | DecodingErrc, WampErrc::protocolViolation | ABORT sent, torn down
    Application error      | WampErrc          | Only the rejected operation fails
    Local session error    | MiscErrc          | Only the attempted operation fails */

#include <string>
#include <system_error>
#include "api.hpp"

namespace wampcore
{

//------------------------------------------------------------------------------
/** Failures of the underlying message channel.

    Besides exact matches, these conditions are also met by:
    - `aborted`: `std::errc::operation_canceled` and Asio's
      `operation_aborted`
    - `disconnected`: `std::errc::connection_reset`, and Asio's
      `connection_reset` and `eof`
    - `failed`: `exhausted`, and any non-zero generic or system code */
//------------------------------------------------------------------------------
enum class TransportErrc
{
    success,      ///< No transport error
    aborted,      ///< I/O was cancelled locally
    disconnected, ///< Channel closed by the remote end
    failed,       ///< Channel broken or could not be started
    exhausted,    ///< Every reconnection attempt was refused
    count
};

//------------------------------------------------------------------------------
/** Failures to turn received bytes into a WAMP message.
    Every non-zero code, as well as any `jsoncons::json_errc`, meets the
    `failed` condition. */
//------------------------------------------------------------------------------
enum class DecodingErrc
{
    success,    ///< Bytes were decoded
    failed,     ///< Bytes are not a valid document
    emptyInput, ///< Nothing but whitespace was received
    count
};

//------------------------------------------------------------------------------
/** Reasons and errors carried by ABORT, GOODBYE and ERROR messages.
    Error URIs without an enumerator map to `unknown`.
    `goodbyeAndOut` and `closedNormally` meet each other's conditions, and
    `discloseMeDisallowed` meets the `optionNotAllowed` condition. */
//------------------------------------------------------------------------------
enum class WampErrc
{
    success,                ///< No error
    unknown,                ///< Error URI with no enumerator

    closeRealm,             ///< Peer asked to end the session
    goodbyeAndOut,          ///< Acknowledges a GOODBYE
    sessionKilled,          ///< Router killed the session
    closedNormally,         ///< Session ended without fault
    systemShutdown,         ///< Router is shutting down

    protocolViolation,      ///< Malformed or out-of-place message

    invalidArgument,        ///< Callee rejected the arguments
    invalidUri,             ///< URI is not well formed
    noSuchProcedure,        ///< Nothing is registered under the URI
    noSuchRealm,            ///< Realm does not exist
    noSuchRegistration,     ///< Registration ID is not known
    noSuchSubscription,     ///< Subscription ID is not known
    procedureAlreadyExists, ///< Another callee holds the URI
    authenticationFailed,   ///< Credentials were refused
    authorizationDenied,    ///< Action is not permitted
    cancelled,              ///< Call was cancelled
    optionNotAllowed,       ///< Router refused a request option
    discloseMeDisallowed,   ///< Router refused to disclose the caller
    count
};

//------------------------------------------------------------------------------
/** Errors raised by the session itself without involving the router. */
//------------------------------------------------------------------------------
enum class MiscErrc
{
    success,               ///< No error
    abandoned,             ///< Session closed before the reply came
    invalidState,          ///< Session is not in a state allowing this
    duplicateRegistration, ///< This session already registered the URI
    absent,                ///< Option or argument is missing
    badType,               ///< Option or argument has another type
    count
};

namespace internal
{

//------------------------------------------------------------------------------
// Error category whose messages come from a table indexed by code value.
//------------------------------------------------------------------------------
class WAMPCORE_API TabulatedCategory : public std::error_category
{
public:
    const char* name() const noexcept override;

    std::string message(int ev) const override;

protected:
    template <typename TErrc>
    TabulatedCategory(const char* name, const char* const* messages,
                      TErrc count)
        : name_(name),
          messages_(messages),
          size_(static_cast<int>(count))
    {}

private:
    const char* name_;
    const char* const* messages_;
    int size_;
};

} // namespace internal

/** Category of TransportErrc codes. */
class WAMPCORE_API TransportCategory : public internal::TabulatedCategory
{
public:
    bool equivalent(const std::error_code& code,
                    int condition) const noexcept override;

private:
    WAMPCORE_HIDDEN TransportCategory();
    friend TransportCategory& transportCategory();
};

/** Category of DecodingErrc codes. */
class WAMPCORE_API DecodingCategory : public internal::TabulatedCategory
{
public:
    bool equivalent(const std::error_code& code,
                    int condition) const noexcept override;

private:
    WAMPCORE_HIDDEN DecodingCategory();
    friend DecodingCategory& decodingCategory();
};

/** Category of WampErrc codes. */
class WAMPCORE_API WampCategory : public internal::TabulatedCategory
{
public:
    bool equivalent(const std::error_code& code,
                    int condition) const noexcept override;

private:
    WAMPCORE_HIDDEN WampCategory();
    friend WampCategory& wampCategory();
};

/** Category of MiscErrc codes. */
class WAMPCORE_API MiscCategory : public internal::TabulatedCategory
{
public:
    bool equivalent(const std::error_code& code,
                    int condition) const noexcept override;

private:
    WAMPCORE_HIDDEN MiscCategory();
    friend MiscCategory& miscCategory();
};

WAMPCORE_API TransportCategory& transportCategory();
WAMPCORE_API DecodingCategory& decodingCategory();
WAMPCORE_API WampCategory& wampCategory();
WAMPCORE_API MiscCategory& miscCategory();

WAMPCORE_API std::error_code make_error_code(TransportErrc errc);
WAMPCORE_API std::error_code make_error_code(DecodingErrc errc);
WAMPCORE_API std::error_code make_error_code(WampErrc errc);
WAMPCORE_API std::error_code make_error_code(MiscErrc errc);

WAMPCORE_API std::error_condition make_error_condition(TransportErrc errc);
WAMPCORE_API std::error_condition make_error_condition(DecodingErrc errc);
WAMPCORE_API std::error_condition make_error_condition(WampErrc errc);
WAMPCORE_API std::error_condition make_error_condition(MiscErrc errc);

/** Looks up the WampErrc for an ABORT, GOODBYE or ERROR URI, including the
    legacy spellings some routers still send. */
WAMPCORE_API WampErrc errorUriToCode(const std::string& uri);

/** Obtains the URI sent to the router for the given WampErrc.
    @throws error::Logic if `errc` is not a valid enumerator. */
WAMPCORE_API const std::string& errorCodeToUri(WampErrc errc);

/** Obtains a URI for any error code. Codes outside WampCategory produce
    `wampcore.error.<category name>.<value>`. */
WAMPCORE_API std::string errorCodeToUri(std::error_code ec);

} // namespace wampcore


namespace std
{

template <> struct is_error_condition_enum<wampcore::TransportErrc>
    : public true_type {};

template <> struct is_error_condition_enum<wampcore::DecodingErrc>
    : public true_type {};

template <> struct is_error_condition_enum<wampcore::WampErrc>
    : public true_type {};

template <> struct is_error_condition_enum<wampcore::MiscErrc>
    : public true_type {};

} // namespace std

#ifndef WAMPCORE_COMPILED_LIB
#include "internal/errorcodes.inl.hpp"
#endif

#endif // WAMPCORE_ERRORCODES_HPP
