/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#include "../rpcinfo.hpp"
#include <cassert>
#include "../api.hpp"

namespace wampcore
{

//******************************************************************************
// Procedure
//******************************************************************************

WAMPCORE_INLINE Procedure::Procedure(Uri uri) : uri_(std::move(uri)) {}

WAMPCORE_INLINE Procedure::Procedure(const char* uri) : uri_(uri) {}

WAMPCORE_INLINE const Uri& Procedure::uri() const {return uri_;}


//******************************************************************************
// Rpc
//******************************************************************************

WAMPCORE_INLINE Rpc::Rpc(Uri uri) : uri_(std::move(uri)) {}

WAMPCORE_INLINE Rpc::Rpc(const char* uri) : uri_(uri) {}

WAMPCORE_INLINE const Uri& Rpc::uri() const {return uri_;}

WAMPCORE_INLINE Rpc& Rpc::captureError(Error& error)
{
    error_ = &error;
    return *this;
}

WAMPCORE_INLINE Rpc& Rpc::withDiscloseMe(bool disclosed)
{
    return withOption("disclose_me", disclosed);
}

WAMPCORE_INLINE bool Rpc::discloseMe() const
{
    return optionOr<bool>("disclose_me", false);
}

WAMPCORE_INLINE Error* Rpc::error(internal::PassKey) const {return error_;}


//******************************************************************************
// Result
//******************************************************************************

WAMPCORE_INLINE Result::Result(std::initializer_list<Variant> list)
{
    withArgList(Array(list));
}

WAMPCORE_INLINE RequestId Result::requestId() const {return requestId_;}

WAMPCORE_INLINE const Object& Result::details() const {return options();}

WAMPCORE_INLINE Result::Result(internal::PassKey, RequestId reqId,
                               Object details, Array args, Object kwargs)
    : Payload<Result>(std::move(details), std::move(args), std::move(kwargs)),
      requestId_(reqId)
{}

WAMPCORE_INLINE std::ostream& operator<<(std::ostream& out, const Result& r)
{
    out << r.args();
    if (!r.kwargs().empty())
        out << " " << r.kwargs();
    return out;
}


//******************************************************************************
// Outcome
//******************************************************************************

WAMPCORE_INLINE Outcome Outcome::deferred() {return Outcome(deferment);}

WAMPCORE_INLINE Outcome::Outcome() : type_(Type::result) {}

WAMPCORE_INLINE Outcome::Outcome(Result result)
    : type_(Type::result),
      result_(std::move(result))
{}

WAMPCORE_INLINE Outcome::Outcome(std::initializer_list<Variant> args)
    : Outcome(Result(args))
{}

WAMPCORE_INLINE Outcome::Outcome(Error error)
    : type_(Type::error),
      error_(std::move(error))
{}

WAMPCORE_INLINE Outcome::Outcome(Deferment) : type_(Type::deferred) {}

WAMPCORE_INLINE Outcome::Type Outcome::type() const {return type_;}

WAMPCORE_INLINE const Result& Outcome::asResult() const &
{
    assert(type_ == Type::result);
    return result_;
}

WAMPCORE_INLINE Result&& Outcome::asResult() &&
{
    assert(type_ == Type::result);
    return std::move(result_);
}

WAMPCORE_INLINE const Error& Outcome::asError() const &
{
    assert(type_ == Type::error);
    return error_;
}

WAMPCORE_INLINE Error&& Outcome::asError() &&
{
    assert(type_ == Type::error);
    return std::move(error_);
}


//******************************************************************************
// Invocation
//******************************************************************************

WAMPCORE_INLINE bool Invocation::ready() const
{
    return requestId_ != nullId();
}

WAMPCORE_INLINE RequestId Invocation::requestId() const {return requestId_;}

WAMPCORE_INLINE RegistrationId Invocation::registrationId() const
{
    return registrationId_;
}

WAMPCORE_INLINE const Object& Invocation::details() const {return options();}

WAMPCORE_INLINE ErrorOr<SessionId> Invocation::caller() const
{
    return optionAs<SessionId>("caller");
}

WAMPCORE_INLINE ErrorOr<Uri> Invocation::procedure() const
{
    return optionAs<Uri>("procedure");
}

WAMPCORE_INLINE void Invocation::yield(Result result) const
{
    auto callee = callee_.lock();
    if (callee)
        callee->safeYield(generation_, requestId_, std::move(result));
}

WAMPCORE_INLINE void Invocation::yield(Error error) const
{
    auto callee = callee_.lock();
    if (callee)
        callee->safeYield(generation_, requestId_, std::move(error));
}

WAMPCORE_INLINE Invocation::Invocation(
    internal::PassKey, internal::Callee::WeakPtr callee,
    std::uint64_t generation, RequestId reqId, RegistrationId regId,
    Object details, Array args, Object kwargs)
    : Payload<Invocation>(std::move(details), std::move(args),
                          std::move(kwargs)),
      callee_(std::move(callee)),
      generation_(generation),
      requestId_(reqId),
      registrationId_(regId)
{}

WAMPCORE_INLINE std::ostream& operator<<(std::ostream& out,
                                         const Invocation& inv)
{
    out << "[inv=" << inv.requestId() << " reg=" << inv.registrationId();
    if (!inv.args().empty())
        out << " args=" << inv.args();
    if (!inv.kwargs().empty())
        out << " kwargs=" << inv.kwargs();
    return out << "]";
}

} // namespace wampcore
