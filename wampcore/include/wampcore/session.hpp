/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#ifndef WAMPCORE_SESSION_HPP
#define WAMPCORE_SESSION_HPP

//------------------------------------------------------------------------------
/** @file
    @brief Contains the Session API used by a client peer in WAMP
           applications. */
//------------------------------------------------------------------------------

#include <functional>
#include <memory>
#include <system_error>
#include "api.hpp"
#include "asiodefs.hpp"
#include "erroror.hpp"
#include "pubsubinfo.hpp"
#include "registration.hpp"
#include "rpcinfo.hpp"
#include "sessionconfig.hpp"
#include "sessioninfo.hpp"
#include "subscription.hpp"
#include "wampdefs.hpp"

namespace wampcore
{

// Forward declaration
namespace internal {class Client;}

//------------------------------------------------------------------------------
/** %Session API used by a _client_ peer in WAMP applications.

    @par Roles
    This API supports the basic WAMP _client_ roles:
    - _Callee_
    - _Caller_
    - _Publisher_
    - _Subscriber_

    @par Asynchronous Operations
    Most of Session's member functions are asynchronous and take a
    completion handler that is invoked via the Session's executor when the
    operation completes. All asynchronous operations emit an ErrorOr as the
    result, which makes it difficult for handlers to ignore error conditions.

    @par Aborting Asynchronous Operations
    All pending asynchronous operations can be _aborted_ by closing the
    session via Session::close, or by destroying the Session object. Pending
    post-join operations are also aborted via Session::leave.

    @par Thread-safety
    All operations are made sequential via the Session's execution
    [strand](https://www.boost.org/doc/libs/release/doc/html/boost_asio/overview/core/strands.html).
    This makes all of Session's methods thread-safe. Event and call slots
    are executed within the strand, in the order their messages were
    received.

    @par Notable Error Codes
    - MiscErrc::invalidState if the session was not in the appropriate state
      for a given operation
    - MiscErrc::abandoned if an operation was aborted by the user closing
      or leaving the session
    - MiscErrc::duplicateRegistration if the procedure is already registered
      by this session
    - WampErrc::protocolViolation if the router sent an invalid message
    - WampErrc::sessionKilled if an operation was aborted due the session
      being killed by the router
    - TransportErrc::disconnected if the transport was lost

    @see ErrorOr, Registration, Subscription. */
//------------------------------------------------------------------------------
class WAMPCORE_API Session
{
public:
    /** Executor type used for I/O operations. */
    using Executor = AnyIoExecutor;

    /** Enumerates the possible states that a Session can be in. */
    using State = SessionState;

    /** Type-erased wrapper around a WAMP event handler. */
    using EventSlot = std::function<void (Event)>;

    /** Type-erased wrapper around an RPC handler. */
    using CallSlot = std::function<Outcome (Invocation)>;

    /** Handler type called when an established session is dropped. */
    using DisconnectHandler = std::function<void (std::error_code)>;

    /** Type-erased handler used for asynchronous operation results. */
    template <typename T>
    using CompletionHandler = std::function<void (ErrorOr<T>)>;

    /** Constructor taking an executor. */
    explicit Session(Executor exec);

    /** @name Non-copyable */
    /// @{
    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;
    /// @}

    /** Destructor which closes the session. */
    ~Session();

    /// @name Observers
    /// @{
    /** Obtains the executor used to run handlers. */
    const Executor& executor() const;

    /** Obtains the strand used to serialize session operations. */
    const IoStrand& strand() const;

    /** Returns the current state of the session. */
    State state() const;

    /** Obtains the router-assigned session ID, or zero if not
        established. */
    SessionId id() const;

    /** Obtains the realm URI used by the last call to open(). */
    Uri realm() const;
    /// @}

    /// @name Session Lifecycle
    /// @{
    /** Opens a transport via the configured factory and joins the
        configured realm.
        @return A Welcome object containing the session ID and router
                details.
        @pre `!config.realm().empty()`
        @pre `config.transportFactory() != nullptr`
        @throws error::Logic if a precondition is not met. */
    void open(SessionConfig config, CompletionHandler<Welcome> handler);

    /** Leaves the realm with the `wamp.close.close_realm` reason.
        @return The Reason URI and details from the router's `GOODBYE`. */
    void leave(CompletionHandler<Reason> handler);

    /** Leaves the realm with the given reason.
        @return The Reason URI and details from the router's `GOODBYE`. */
    void leave(Reason reason, CompletionHandler<Reason> handler);

    /** Abruptly closes the session and its transport, aborting all pending
        operations. */
    void close();

    /** Sets the handler called when an established session is dropped due
        to a transport failure, a protocol violation, or a router `ABORT`. */
    void setDisconnectHandler(DisconnectHandler handler);
    /// @}

    /// @name Pub/Sub
    /// @{
    /** Subscribes to WAMP pub/sub events having the given topic.
        @return A Subscription object, which may be passed to
                unsubscribe().
        @pre `slot != nullptr`
        @throws error::Logic if a precondition is not met. */
    void subscribe(Topic topic, EventSlot slot,
                   CompletionHandler<Subscription> handler);

    /** Unsubscribes a subscription to a topic, without waiting for the
        outcome. */
    void unsubscribe(const Subscription& sub);

    /** Unsubscribes a subscription to a topic.
        @return `false` if the subscription was already removed. */
    void unsubscribe(const Subscription& sub,
                     CompletionHandler<bool> handler);

    /** Publishes an event without acknowledgement. */
    void publish(Pub pub);

    /** Publishes an event, requesting acknowledgement from the router.
        @return The publication ID. */
    void publish(Pub pub, CompletionHandler<PublicationId> handler);
    /// @}

    /// @name Remote Procedures
    /// @{
    /** Registers a WAMP remote procedure call.
        @return A Registration object, which may be passed to unregister().
        @pre `slot != nullptr`
        @throws error::Logic if a precondition is not met. */
    void enroll(Procedure procedure, CallSlot slot,
                CompletionHandler<Registration> handler);

    /** Unregisters a remote procedure call, without waiting for the
        outcome. */
    void unregister(const Registration& reg);

    /** Unregisters a remote procedure call.
        @return `false` if the registration was already removed. */
    void unregister(const Registration& reg,
                    CompletionHandler<bool> handler);

    /** Calls a remote procedure.
        @return The result of the call. */
    void call(Rpc rpc, CompletionHandler<Result> handler);
    /// @}

private:
    std::shared_ptr<internal::Client> impl_;
};

} // namespace wampcore

#ifndef WAMPCORE_COMPILED_LIB
#include "internal/session.inl.hpp"
#endif

#endif // WAMPCORE_SESSION_HPP
