/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#include "../session.hpp"
#include "../api.hpp"
#include "../exceptions.hpp"
#include "client.hpp"

namespace wampcore
{

//------------------------------------------------------------------------------
/** @details
    The session's strand is obtained from the given executor, which is also
    used to run completion handlers. */
//------------------------------------------------------------------------------
WAMPCORE_INLINE Session::Session(Executor exec)
    : impl_(internal::Client::create(std::move(exec)))
{}

//------------------------------------------------------------------------------
/** @details
    Automatically invokes close() on the session, which drops the
    connection and aborts all pending asynchronous operations. The
    internal state is kept alive until the abort completes. */
//------------------------------------------------------------------------------
WAMPCORE_INLINE Session::~Session()
{
    if (impl_)
        impl_->close();
}

//------------------------------------------------------------------------------
WAMPCORE_INLINE const Session::Executor& Session::executor() const
{
    return impl_->executor();
}

//------------------------------------------------------------------------------
WAMPCORE_INLINE const IoStrand& Session::strand() const
{
    return impl_->strand();
}

//------------------------------------------------------------------------------
WAMPCORE_INLINE SessionState Session::state() const
{
    return impl_->state();
}

//------------------------------------------------------------------------------
WAMPCORE_INLINE SessionId Session::id() const {return impl_->id();}

//------------------------------------------------------------------------------
WAMPCORE_INLINE Uri Session::realm() const {return impl_->realm();}

//------------------------------------------------------------------------------
/** @details
    The session transitions to SessionState::connecting, and then to
    SessionState::established upon receiving the router's `WELCOME`.
    If the router issues a `CHALLENGE`, the configured challenge handler
    is invoked while in the SessionState::authenticating state.

    @par Notable Error Codes
    - MiscErrc::invalidState if the session was not closed
    - TransportErrc::failed if the factory did not produce a transport
    - WampErrc::noSuchRealm if the realm does not exist
    - WampErrc::authenticationFailed if a challenge could not be answered */
//------------------------------------------------------------------------------
WAMPCORE_INLINE void Session::open(SessionConfig config,
                                   CompletionHandler<Welcome> handler)
{
    WAMPCORE_LOGIC_CHECK(!config.realm().empty(), "Realm URI cannot be empty");
    WAMPCORE_LOGIC_CHECK(bool(config.transportFactory()),
                         "Transport factory must be provided");
    impl_->open(std::move(config), std::move(handler));
}

//------------------------------------------------------------------------------
WAMPCORE_INLINE void Session::leave(CompletionHandler<Reason> handler)
{
    leave(Reason(), std::move(handler));
}

//------------------------------------------------------------------------------
/** @details
    All pending requests are aborted with MiscErrc::abandoned, and all
    subscriptions and registrations are discarded before the `GOODBYE` is
    sent. The transport is closed once the router replies. */
//------------------------------------------------------------------------------
WAMPCORE_INLINE void Session::leave(Reason reason,
                                    CompletionHandler<Reason> handler)
{
    impl_->leave(std::move(reason), std::move(handler));
}

//------------------------------------------------------------------------------
/** @details
    A best-effort `GOODBYE` is sent if the session is established. Pending
    operations are completed with MiscErrc::abandoned.
    @post `this->state() == SessionState::closed` once the strand has
          executed the request. */
//------------------------------------------------------------------------------
WAMPCORE_INLINE void Session::close()
{
    impl_->close();
}

//------------------------------------------------------------------------------
WAMPCORE_INLINE void Session::setDisconnectHandler(DisconnectHandler handler)
{
    impl_->setDisconnectHandler(std::move(handler));
}

//------------------------------------------------------------------------------
/** @details
    Subscribing more than once to the same topic yields distinct
    Subscription objects which share the router-assigned subscription ID.
    Each of their slots is invoked upon receiving an event. */
//------------------------------------------------------------------------------
WAMPCORE_INLINE void Session::subscribe(Topic topic, EventSlot slot,
                                        CompletionHandler<Subscription> handler)
{
    WAMPCORE_LOGIC_CHECK(bool(slot), "Event slot cannot be empty");
    impl_->subscribe(std::move(topic), std::move(slot), std::move(handler));
}

//------------------------------------------------------------------------------
WAMPCORE_INLINE void Session::unsubscribe(const Subscription& sub)
{
    impl_->unsubscribe(sub, nullptr);
}

//------------------------------------------------------------------------------
/** @details
    The `UNSUBSCRIBE` message is only sent once the last local slot
    sharing the subscription ID is removed. The slot stops receiving events
    immediately. */
//------------------------------------------------------------------------------
WAMPCORE_INLINE void Session::unsubscribe(const Subscription& sub,
                                          CompletionHandler<bool> handler)
{
    impl_->unsubscribe(sub, std::move(handler));
}

//------------------------------------------------------------------------------
/** @details
    The event is discarded, with a warning logged, if the session is not
    established. */
//------------------------------------------------------------------------------
WAMPCORE_INLINE void Session::publish(Pub pub)
{
    impl_->publish(std::move(pub));
}

//------------------------------------------------------------------------------
WAMPCORE_INLINE void Session::publish(Pub pub,
                                      CompletionHandler<PublicationId> handler)
{
    impl_->publish(std::move(pub), std::move(handler));
}

//------------------------------------------------------------------------------
WAMPCORE_INLINE void Session::enroll(Procedure procedure, CallSlot slot,
                                     CompletionHandler<Registration> handler)
{
    WAMPCORE_LOGIC_CHECK(bool(slot), "Call slot cannot be empty");
    impl_->enroll(std::move(procedure), std::move(slot), std::move(handler));
}

//------------------------------------------------------------------------------
WAMPCORE_INLINE void Session::unregister(const Registration& reg)
{
    impl_->unregister(reg, nullptr);
}

//------------------------------------------------------------------------------
WAMPCORE_INLINE void Session::unregister(const Registration& reg,
                                         CompletionHandler<bool> handler)
{
    impl_->unregister(reg, std::move(handler));
}

//------------------------------------------------------------------------------
/** @details
    If Rpc::captureError was used, the full payload of an `ERROR` reply is
    stored in the referenced Error object before the handler is
    invoked. */
//------------------------------------------------------------------------------
WAMPCORE_INLINE void Session::call(Rpc rpc, CompletionHandler<Result> handler)
{
    impl_->call(std::move(rpc), std::move(handler));
}

} // namespace wampcore
