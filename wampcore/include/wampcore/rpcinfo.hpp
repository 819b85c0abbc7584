/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#ifndef WAMPCORE_RPCINFO_HPP
#define WAMPCORE_RPCINFO_HPP

//------------------------------------------------------------------------------
/** @file
    @brief Provides data structures for information exchanged via WAMP
           RPC messages. */
//------------------------------------------------------------------------------

#include <initializer_list>
#include <ostream>
#include "api.hpp"
#include "error.hpp"
#include "erroror.hpp"
#include "options.hpp"
#include "payload.hpp"
#include "variant.hpp"
#include "wampdefs.hpp"
#include "internal/callee.hpp"
#include "internal/passkey.hpp"

namespace wampcore
{

//------------------------------------------------------------------------------
/** Provides the procedure URI and other options contained within WAMP
    `REGISTER' messages. */
//------------------------------------------------------------------------------
class WAMPCORE_API Procedure : public Options<Procedure>
{
public:
    /** Default constructor. */
    Procedure() = default;

    /** Converting constructor taking a procedure URI. */
    Procedure(Uri uri);

    /** Converting constructor taking a procedure URI string literal. */
    Procedure(const char* uri);

    /** Obtains the procedure URI. */
    const Uri& uri() const;

private:
    Uri uri_;
};

//------------------------------------------------------------------------------
/** Contains the procedure URI, options, and payload contained within
    WAMP `CALL` messages. */
//------------------------------------------------------------------------------
class WAMPCORE_API Rpc : public Payload<Rpc>
{
public:
    /** Default constructor. */
    Rpc() = default;

    /** Converting constructor taking a procedure URI. */
    Rpc(Uri uri);

    /** Converting constructor taking a procedure URI string literal. */
    Rpc(const char* uri);

    /** Obtains the procedure URI. */
    const Uri& uri() const;

    /** Specifies the Error object in which to store call errors returned
        by the callee.
        The referenced Error must outlive the call operation. */
    Rpc& captureError(Error& error);

    /** @name Caller Identification
        @{ */
    /** Requests that the identity of the caller be disclosed in the
        invocation. */
    Rpc& withDiscloseMe(bool disclosed = true);

    /** Determines if caller disclosure was requested. */
    bool discloseMe() const;
    /// @}

private:
    Uri uri_;
    Error* error_ = nullptr;

public:
    // Internal use only
    Error* error(internal::PassKey) const;
};

//------------------------------------------------------------------------------
/** Contains the details and payload of WAMP `RESULT` and `YIELD`
    messages. */
//------------------------------------------------------------------------------
class WAMPCORE_API Result : public Payload<Result>
{
public:
    /** Default constructor. */
    Result() = default;

    /** Constructor taking an initializer list of positional arguments. */
    Result(std::initializer_list<Variant> list);

    /** Obtains the request ID associated with the call. */
    RequestId requestId() const;

    /** Accesses the details dictionary. */
    const Object& details() const;

private:
    RequestId requestId_ = nullId();

public:
    // Internal use only
    Result(internal::PassKey, RequestId reqId, Object details, Array args,
           Object kwargs);
};

/** Outputs the result's payload.
    @relates Result */
WAMPCORE_API std::ostream& operator<<(std::ostream& out, const Result& r);

//------------------------------------------------------------------------------
/** Tag type that can be passed to Outcome to construct a deferred
    outcome. */
//------------------------------------------------------------------------------
struct WAMPCORE_API Deferment
{
    constexpr Deferment() = default;
};

/** Convenient Deferment instance that can be passed to Outcome. */
constexpr Deferment deferment;

//------------------------------------------------------------------------------
/** Contains the outcome of an RPC invocation.

    A call slot returns either a Result or an Error to have the corresponding
    `YIELD` or `ERROR` message sent immediately, or a deferred outcome to
    indicate that it will answer later via Invocation::yield. */
//------------------------------------------------------------------------------
class WAMPCORE_API Outcome
{
public:
    /** Enumerators representing the type of outcome being held. */
    enum class Type
    {
        deferred,
        result,
        error
    };

    /** Obtains an outcome signalling that the result will be sent later. */
    static Outcome deferred();

    /** Default-constructs an outcome containing an empty Result object. */
    Outcome();

    /** Converting constructor taking a Result object. */
    Outcome(Result result);

    /** Converting constructor taking a braced initializer list of
        positional arguments to be stored in a Result. */
    Outcome(std::initializer_list<Variant> args);

    /** Converting constructor taking an Error object. */
    Outcome(Error error);

    /** Converting constructor taking a deferment. */
    Outcome(Deferment);

    /** Obtains the object type being contained. */
    Type type() const;

    /** Accesses the stored Result object.
        @pre `this->type() == Type::result` */
    const Result& asResult() const &;

    /** Steals the stored Result object.
        @pre `this->type() == Type::result` */
    Result&& asResult() &&;

    /** Accesses the stored Error object.
        @pre `this->type() == Type::error` */
    const Error& asError() const &;

    /** Steals the stored Error object.
        @pre `this->type() == Type::error` */
    Error&& asError() &&;

private:
    Type type_;
    Result result_;
    Error error_;
};

//------------------------------------------------------------------------------
/** Contains the request ID, details, and payload of WAMP `INVOCATION`
    messages, as well as the means to answer deferred invocations. */
//------------------------------------------------------------------------------
class WAMPCORE_API Invocation : public Payload<Invocation>
{
public:
    /** Default constructor. */
    Invocation() = default;

    /** Determines if the Invocation has been initialized and is ready
        for use. */
    bool ready() const;

    /** Obtains the request ID associated with this invocation. */
    RequestId requestId() const;

    /** Obtains the registration ID associated with this invocation. */
    RegistrationId registrationId() const;

    /** Accesses the details dictionary. */
    const Object& details() const;

    /** Obtains the caller session ID, if disclosed. */
    ErrorOr<SessionId> caller() const;

    /** Obtains the original procedure URI used to make the call,
        available for pattern-based registrations. */
    ErrorOr<Uri> procedure() const;

    /** Manually sends a `YIELD` result back to the callee.
        May be called from any thread. Has no effect if the session is no
        longer established or the invocation was already answered. */
    void yield(Result result = Result()) const;

    /** Manually sends an `ERROR` result back to the callee.
        May be called from any thread. Has no effect if the session is no
        longer established or the invocation was already answered. */
    void yield(Error error) const;

private:
    internal::Callee::WeakPtr callee_;
    std::uint64_t generation_ = 0;
    RequestId requestId_ = nullId();
    RegistrationId registrationId_ = nullId();

public:
    // Internal use only
    Invocation(internal::PassKey, internal::Callee::WeakPtr callee,
               std::uint64_t generation, RequestId reqId, RegistrationId regId, Object details,
               Array args, Object kwargs);
};

/** Outputs the invocation's ids and payload.
    @relates Invocation */
WAMPCORE_API std::ostream& operator<<(std::ostream& out,
                                      const Invocation& inv);

} // namespace wampcore

#ifndef WAMPCORE_COMPILED_LIB
#include "internal/rpcinfo.inl.hpp"
#endif

#endif // WAMPCORE_RPCINFO_HPP
