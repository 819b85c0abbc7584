/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#ifndef WAMPCORE_INTERNAL_CLIENT_HPP
#define WAMPCORE_INTERNAL_CLIENT_HPP

#include <atomic>
#include <cassert>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <system_error>
#include <utility>
#include <boost/asio/dispatch.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include "../asiodefs.hpp"
#include "../errorcodes.hpp"
#include "../erroror.hpp"
#include "../logging.hpp"
#include "../pubsubinfo.hpp"
#include "../registration.hpp"
#include "../rpcinfo.hpp"
#include "../sessionconfig.hpp"
#include "../sessioninfo.hpp"
#include "../subscription.hpp"
#include "../transport.hpp"
#include "../wampdefs.hpp"
#include "callee.hpp"
#include "challengee.hpp"
#include "message.hpp"
#include "messagecodec.hpp"
#include "passkey.hpp"
#include "procedureregistry.hpp"
#include "readership.hpp"
#include "requestor.hpp"

namespace wampcore
{

namespace internal
{

//------------------------------------------------------------------------------
// Provides the WAMP client session state machine.
//
// All mutable state is accessed exclusively via the strand. Public member
// functions dispatch their work onto the strand so that they may be called
// from any thread, and take effect immediately when called from within an
// event or call slot. Completion handlers are posted via the user executor.
//------------------------------------------------------------------------------
class Client final : public std::enable_shared_from_this<Client>,
                     public Callee, public Challengee
{
public:
    using Ptr               = std::shared_ptr<Client>;
    using WeakPtr           = std::weak_ptr<Client>;
    using State             = SessionState;
    using EventSlot         = std::function<void (Event)>;
    using CallSlot          = std::function<Outcome (Invocation)>;
    using DisconnectHandler = std::function<void (std::error_code)>;

    template <typename TValue>
    using CompletionHandler = std::function<void (ErrorOr<TValue>)>;

    static Ptr create(AnyIoExecutor exec)
    {
        return Ptr(new Client(std::move(exec)));
    }

    ~Client() override = default;

    State state() const {return state_.load();}

    SessionId id() const {return sessionId_.load();}

    Uri realm() const
    {
        std::lock_guard<std::mutex> lock(realmMutex_);
        return realm_;
    }

    const AnyIoExecutor& executor() const {return executor_;}

    const IoStrand& strand() const {return strand_;}

    // Sets the handler called when an established session is dropped due to
    // a transport failure, protocol violation, or router ABORT.
    void setDisconnectHandler(DisconnectHandler handler)
    {
        struct Dispatched
        {
            Ptr self;
            DisconnectHandler f;
            void operator()() {self->disconnectHandler_ = std::move(f);}
        };

        safelyDispatch<Dispatched>(std::move(handler));
    }

    void open(SessionConfig&& c, CompletionHandler<Welcome>&& f)
    {
        struct Dispatched
        {
            Ptr self;
            SessionConfig c;
            CompletionHandler<Welcome> f;
            void operator()() {self->doOpen(std::move(c), std::move(f));}
        };

        safelyDispatch<Dispatched>(std::move(c), std::move(f));
    }

    void leave(Reason&& r, CompletionHandler<Reason>&& f)
    {
        struct Dispatched
        {
            Ptr self;
            Reason r;
            CompletionHandler<Reason> f;
            void operator()() {self->doLeave(std::move(r), std::move(f));}
        };

        safelyDispatch<Dispatched>(std::move(r), std::move(f));
    }

    void close()
    {
        struct Dispatched
        {
            Ptr self;
            void operator()() {self->doClose();}
        };

        safelyDispatch<Dispatched>();
    }

    void subscribe(Topic&& t, EventSlot&& s,
                   CompletionHandler<Subscription>&& f)
    {
        struct Dispatched
        {
            Ptr self;
            Topic t;
            EventSlot s;
            CompletionHandler<Subscription> f;

            void operator()()
            {
                self->doSubscribe(std::move(t), std::move(s), std::move(f));
            }
        };

        safelyDispatch<Dispatched>(std::move(t), std::move(s), std::move(f));
    }

    void unsubscribe(const Subscription& s, CompletionHandler<bool>&& f)
    {
        struct Dispatched
        {
            Ptr self;
            Subscription s;
            CompletionHandler<bool> f;
            void operator()() {self->doUnsubscribe(s, std::move(f));}
        };

        safelyDispatch<Dispatched>(s, std::move(f));
    }

    void publish(Pub&& p)
    {
        struct Dispatched
        {
            Ptr self;
            Pub p;
            void operator()() {self->doPublish(std::move(p));}
        };

        safelyDispatch<Dispatched>(std::move(p));
    }

    void publish(Pub&& p, CompletionHandler<PublicationId>&& f)
    {
        struct Dispatched
        {
            Ptr self;
            Pub p;
            CompletionHandler<PublicationId> f;
            void operator()() {self->doPublish(std::move(p), std::move(f));}
        };

        safelyDispatch<Dispatched>(std::move(p), std::move(f));
    }

    void enroll(Procedure&& p, CallSlot&& s,
                CompletionHandler<Registration>&& f)
    {
        struct Dispatched
        {
            Ptr self;
            Procedure p;
            CallSlot s;
            CompletionHandler<Registration> f;

            void operator()()
            {
                self->doEnroll(std::move(p), std::move(s), std::move(f));
            }
        };

        safelyDispatch<Dispatched>(std::move(p), std::move(s), std::move(f));
    }

    void unregister(const Registration& r, CompletionHandler<bool>&& f)
    {
        struct Dispatched
        {
            Ptr self;
            Registration r;
            CompletionHandler<bool> f;
            void operator()() {self->doUnregister(r, std::move(f));}
        };

        safelyDispatch<Dispatched>(r, std::move(f));
    }

    void call(Rpc&& r, CompletionHandler<Result>&& f)
    {
        struct Dispatched
        {
            Ptr self;
            Rpc r;
            CompletionHandler<Result> f;
            void operator()() {self->doCall(std::move(r), std::move(f));}
        };

        safelyDispatch<Dispatched>(std::move(r), std::move(f));
    }

    void safeYield(std::uint64_t generation, RequestId invocationId,
                   Result&& result) override
    {
        struct Dispatched
        {
            Ptr self;
            std::uint64_t gen;
            RequestId id;
            Result r;

            void operator()()
            {
                if (self->isCurrent(gen, id))
                    self->yieldResult(id, std::move(r));
            }
        };

        safelyDispatch<Dispatched>(generation, invocationId,
                                   std::move(result));
    }

    void safeYield(std::uint64_t generation, RequestId invocationId,
                   Error&& error) override
    {
        struct Dispatched
        {
            Ptr self;
            std::uint64_t gen;
            RequestId id;
            Error e;

            void operator()()
            {
                if (self->isCurrent(gen, id))
                    self->yieldError(id, std::move(e));
            }
        };

        safelyDispatch<Dispatched>(generation, invocationId,
                                   std::move(error));
    }

    void safeAuthenticate(std::uint64_t generation,
                          Authentication&& auth) override
    {
        struct Dispatched
        {
            Ptr self;
            std::uint64_t gen;
            Authentication a;

            void operator()()
            {
                if (gen == self->generation_)
                    return self->doAuthenticate(std::move(a));
                self->log(LogLevel::debug, "Discarding authentication for a "
                                           "challenge from a previous session");
            }
        };

        safelyDispatch<Dispatched>(generation, std::move(auth));
    }

private:
    using ChallengeHandler = SessionConfig::ChallengeHandler;

    template <typename T>
    struct Completed
    {
        CompletionHandler<T> handler;
        ErrorOr<T> result;
        void operator()() {handler(std::move(result));}
    };

    struct Received
    {
        WeakPtr self;
        std::uint64_t generation;
        MessageBuffer buffer;

        void operator()()
        {
            auto me = self.lock();
            if (me && me->generation_ == generation)
                me->onMessage(buffer);
        }
    };

    struct Disconnected
    {
        WeakPtr self;
        std::uint64_t generation;
        std::error_code ec;

        void operator()()
        {
            auto me = self.lock();
            if (me && me->generation_ == generation)
                me->onTransportClosed(ec);
        }
    };

    struct Challenged
    {
        ChallengeHandler handler;
        Challenge challenge;
        void operator()() {handler(std::move(challenge));}
    };

    struct Dropped
    {
        DisconnectHandler handler;
        std::error_code ec;
        void operator()() {handler(ec);}
    };

    explicit Client(AnyIoExecutor exec)
        : executor_(std::move(exec)),
          strand_(boost::asio::make_strand(executor_)),
          requestor_([this](Message&& m) {send(m);}),
          state_(State::closed),
          sessionId_(nullId())
    {}

    template <typename F, typename... Ts>
    void safelyDispatch(Ts&&... args)
    {
        F function{shared_from_this(), std::forward<Ts>(args)...};
        boost::asio::dispatch(strand_, std::move(function));
    }

    void setState(State s) {state_.store(s);}

    void doOpen(SessionConfig&& config, CompletionHandler<Welcome>&& handler)
    {
        if (state() != State::closed)
            return complete(handler, makeUnexpectedError(MiscErrc::invalidState));

        config_ = std::move(config);
        requestor_.reset();

        auto transport = config_.transportFactory()(executor_);
        if (!transport)
        {
            auto ec = make_error_code(TransportErrc::failed);
            log(LogLevel::error, "Transport factory produced no transport", ec);
            return complete(handler, UnexpectedError(ec));
        }

        {
            std::lock_guard<std::mutex> lock(realmMutex_);
            realm_ = config_.realm();
        }

        transport_ = std::move(transport);
        openHandler_ = std::move(handler);
        setState(State::connecting);

        // A transport that was already started would never deliver to this
        // session's handlers.
        bool fresh = transport_->state() == TransportState::initial;
        startTransport();
        if (!fresh || transport_->state() != TransportState::running)
        {
            auto ec = make_error_code(TransportErrc::failed);
            log(LogLevel::error, "Transport could not be started", ec);
            return teardown(ec, false);
        }

        send(Message(MessageKind::hello, config_.realm(),
                     config_.makeHelloDetails()));
    }

    void startTransport()
    {
        auto gen = ++generation_;
        WeakPtr self = shared_from_this();
        IoStrand strand = strand_;

        transport_->start(
            [self, gen, strand](MessageBuffer buffer)
            {
                boost::asio::post(strand,
                                  Received{self, gen, std::move(buffer)});
            },
            [self, gen, strand](std::error_code ec)
            {
                boost::asio::post(strand, Disconnected{self, gen, ec});
            });
    }

    void doAuthenticate(Authentication&& auth)
    {
        if (state() != State::authenticating)
        {
            log(LogLevel::debug,
                "Discarding authentication while not authenticating");
            return;
        }

        send(Message(MessageKind::authenticate, auth.signature(),
                     std::move(auth).options()));
    }

    void doLeave(Reason&& reason, CompletionHandler<Reason>&& handler)
    {
        if (!checkState(handler))
            return;

        setState(State::closing);
        requestor_.abandonAll(make_error_code(MiscErrc::abandoned));
        readership_.clear();
        registry_.clear();
        leaveHandler_ = std::move(handler);
        send(Message(MessageKind::goodbye, reason.options(), reason.uri()));
    }

    void doClose()
    {
        if (state() == State::closed)
            return;

        if (state() == State::established)
        {
            Reason reason;
            send(Message(MessageKind::goodbye, reason.options(),
                         reason.uri()));
        }

        log(LogLevel::info, "Session closed locally");
        teardown(make_error_code(MiscErrc::abandoned), false);
    }

    void doSubscribe(Topic&& topic, EventSlot&& slot,
                     CompletionHandler<Subscription>&& handler)
    {
        struct Requested
        {
            Ptr self;
            Topic topic;
            EventSlot slot;
            CompletionHandler<Subscription> handler;

            void operator()(ErrorOr<Message> reply)
            {
                auto& me = *self;
                if (!me.checkReply(reply, MessageKind::subscribed, handler))
                    return;
                auto subId = reply->to<SubscriptionId>(2);

                // The router answered with a subscription that an
                // UNSUBSCRIBE sent before this reply is about to remove.
                if (me.readership_.isRetiring(subId))
                {
                    me.log(LogLevel::debug,
                           "Subscription " + std::to_string(subId) +
                           " is being unsubscribed; resubscribing to '" +
                           topic.uri() + "'");
                    return me.doSubscribe(std::move(topic), std::move(slot),
                                          std::move(handler));
                }

                auto sub = me.readership_.insert(subId, topic.uri(),
                                                 std::move(slot));
                me.complete(handler, std::move(sub));
            }
        };

        if (!checkState(handler))
            return;

        Message msg(MessageKind::subscribe, nullId(), topic.options(),
                    topic.uri());
        requestor_.request(std::move(msg),
                           Requested{shared_from_this(), std::move(topic),
                                     std::move(slot), std::move(handler)});
    }

    void doUnsubscribe(const Subscription& sub,
                       CompletionHandler<bool>&& handler)
    {
        struct Requested
        {
            Ptr self;
            Subscription sub;
            CompletionHandler<bool> handler;

            void operator()(ErrorOr<Message> reply)
            {
                auto& me = *self;
                me.readership_.remove(sub);
                if (me.checkReply(reply, MessageKind::unsubscribed, handler))
                    me.complete(handler, true);
            }
        };

        if (!sub || !readership_.contains(sub))
            return complete(handler, false);

        // Other local slots still depend on the router subscription.
        if (readership_.armedSlotCount(sub.id()) > 1)
        {
            readership_.remove(sub);
            return complete(handler, true);
        }

        readership_.disarm(sub);
        requestor_.request(Message(MessageKind::unsubscribe, nullId(),
                                   sub.id()),
                           Requested{shared_from_this(), sub,
                                     std::move(handler)});
    }

    void doPublish(Pub&& pub)
    {
        if (state() != State::established)
        {
            log(LogLevel::warning,
                "Discarding PUBLISH to '" + pub.uri() +
                "' while session is not established");
            return;
        }

        Message msg(MessageKind::publish, nullId(), pub.options(), pub.uri());
        msg.appendPayload(std::move(pub).args(), std::move(pub).kwargs());
        requestor_.request(std::move(msg));
    }

    void doPublish(Pub&& pub, CompletionHandler<PublicationId>&& handler)
    {
        struct Requested
        {
            Ptr self;
            CompletionHandler<PublicationId> handler;

            void operator()(ErrorOr<Message> reply)
            {
                auto& me = *self;
                if (me.checkReply(reply, MessageKind::published, handler))
                    me.complete(handler, reply->to<PublicationId>(2));
            }
        };

        if (!checkState(handler))
            return;

        pub.withOption("acknowledge", true);
        Message msg(MessageKind::publish, nullId(), pub.options(), pub.uri());
        msg.appendPayload(std::move(pub).args(), std::move(pub).kwargs());
        requestor_.request(std::move(msg),
                           Requested{shared_from_this(), std::move(handler)});
    }

    void doEnroll(Procedure&& procedure, CallSlot&& slot,
                  CompletionHandler<Registration>&& handler)
    {
        struct Requested
        {
            Ptr self;
            Uri uri;
            CallSlot slot;
            CompletionHandler<Registration> handler;

            void operator()(ErrorOr<Message> reply)
            {
                auto& me = *self;
                if (!me.checkReply(reply, MessageKind::registered, handler))
                {
                    me.registry_.release(uri);
                    return;
                }

                auto regId = reply->to<RegistrationId>(2);
                auto reg = me.registry_.insert(regId, uri, std::move(slot));
                if (!reg)
                    me.registry_.release(uri);
                me.complete(handler, std::move(reg));
            }
        };

        if (!checkState(handler))
            return;

        if (!registry_.reserve(procedure.uri()))
        {
            return complete(
                handler, makeUnexpectedError(MiscErrc::duplicateRegistration));
        }

        Message msg(MessageKind::enroll, nullId(), procedure.options(),
                    procedure.uri());
        requestor_.request(std::move(msg),
                           Requested{shared_from_this(), procedure.uri(),
                                     std::move(slot), std::move(handler)});
    }

    void doUnregister(const Registration& reg,
                      CompletionHandler<bool>&& handler)
    {
        struct Requested
        {
            Ptr self;
            Registration reg;
            CompletionHandler<bool> handler;

            void operator()(ErrorOr<Message> reply)
            {
                auto& me = *self;
                me.registry_.remove(reg);
                if (me.checkReply(reply, MessageKind::unregistered, handler))
                    me.complete(handler, true);
            }
        };

        if (!reg || !registry_.contains(reg))
            return complete(handler, false);

        registry_.disarm(reg);
        requestor_.request(Message(MessageKind::unregister, nullId(),
                                   reg.id()),
                           Requested{shared_from_this(), reg,
                                     std::move(handler)});
    }

    void doCall(Rpc&& rpc, CompletionHandler<Result>&& handler)
    {
        struct Requested
        {
            Ptr self;
            Error* errorPtr;
            CompletionHandler<Result> handler;

            void operator()(ErrorOr<Message> reply)
            {
                auto& me = *self;
                if (!me.checkReply(reply, MessageKind::result, handler,
                                   errorPtr))
                {
                    return;
                }

                Result result(PassKey{}, reply->requestId(),
                              std::move(reply->as<Object>(2)),
                              reply->argsAt(3), reply->kwargsAt(4));
                me.complete(handler, std::move(result));
            }
        };

        if (!checkState(handler))
            return;

        Error* errorPtr = rpc.error(PassKey{});
        Message msg(MessageKind::call, nullId(), rpc.options(), rpc.uri());
        msg.appendPayload(std::move(rpc).args(), std::move(rpc).kwargs());
        requestor_.request(std::move(msg),
                           Requested{shared_from_this(), errorPtr,
                                     std::move(handler)});
    }

    void onMessage(const MessageBuffer& buffer)
    {
        std::string hint;
        auto decoded = codec_.decode(buffer, &hint);
        if (!decoded)
        {
            log(LogLevel::error, "Received invalid message: " + hint,
                decoded.error());
            return failProtocol(std::move(hint));
        }

        Message& msg = *decoded;
        trace(msg, "RX");

        if (!msg.traits().isClientRx)
        {
            return failProtocol(std::string("Received ") + msg.name() +
                                " message, which is only valid for routers");
        }

        if (!msg.traits().isValidForState(state()))
        {
            return failProtocol(std::string("Received ") + msg.name() +
                                " message, which is invalid for the current "
                                "session state");
        }

        switch (msg.kind())
        {
        case MessageKind::welcome:    return onWelcome(msg);
        case MessageKind::abort:      return onAbort(msg);
        case MessageKind::challenge:  return onChallenge(msg);
        case MessageKind::goodbye:    return onGoodbye(msg);
        case MessageKind::event:      return onEvent(msg);
        case MessageKind::invocation: return onInvocation(msg);
        default:                      return onReply(msg);
        }
    }

    void onWelcome(Message& msg)
    {
        auto sid = msg.to<SessionId>(1);
        sessionId_.store(sid);
        setState(State::established);
        log(LogLevel::info, "Joined realm '" + config_.realm() +
                            "' with session ID " + std::to_string(sid));
        Welcome welcome(PassKey{}, sid, config_.realm(),
                        std::move(msg.as<Object>(2)));
        complete(openHandler_, std::move(welcome));
    }

    void onAbort(Message& msg)
    {
        Reason reason(PassKey{}, std::move(msg.as<Object>(1)),
                      std::move(msg.as<String>(2)));
        auto ec = make_error_code(reason.errorCode());
        std::string why = "Session aborted by router with reason URI '" +
                          reason.uri() + "'";
        auto hint = reason.hint();
        if (!hint.empty())
            why += ": " + hint;
        log(LogLevel::warning, std::move(why), ec);
        teardown(ec, true);
    }

    void onChallenge(Message& msg)
    {
        const auto& handler = config_.challengeHandler();
        if (!handler)
        {
            static constexpr auto errc = WampErrc::authenticationFailed;
            std::string why = "No challenge handler for authentication "
                              "method '" + msg.as<String>(1) + "'";
            log(LogLevel::error, why, make_error_code(errc));
            Reason reason(errc);
            reason.withHint(std::move(why));
            send(Message(MessageKind::abort, reason.options(),
                         reason.uri()));
            return teardown(make_error_code(errc), false);
        }

        setState(State::authenticating);
        Challenge challenge(PassKey{}, shared_from_this(), generation_,
                            std::move(msg.as<String>(1)),
                            std::move(msg.as<Object>(2)));
        boost::asio::post(executor_,
                          Challenged{handler, std::move(challenge)});
    }

    void onGoodbye(Message& msg)
    {
        Reason reason(PassKey{}, std::move(msg.as<Object>(1)),
                      std::move(msg.as<String>(2)));
        auto ec = make_error_code(reason.errorCode());

        if (state() == State::closing)
        {
            log(LogLevel::info, "Left realm '" + config_.realm() + "'");
            complete(leaveHandler_, std::move(reason));
            return teardown(ec, false);
        }

        log(LogLevel::warning,
            "Session killed by router with reason URI '" + reason.uri() + "'",
            ec);
        Reason reply(WampErrc::goodbyeAndOut);
        send(Message(MessageKind::goodbye, reply.options(), reply.uri()));
        teardown(ec, false);
    }

    void onReply(Message& msg)
    {
        std::string name = msg.name();
        auto reqId = msg.requestId();
        if (!requestor_.onReply(std::move(msg)))
        {
            // Replies to abandoned requests can arrive while leaving.
            auto level = (state() == State::established) ? LogLevel::warning
                                                         : LogLevel::debug;
            log(level, "Discarding " + name + " reply with unmatched "
                       "request ID " + std::to_string(reqId));
        }
    }

    void onEvent(Message& msg)
    {
        auto subId = msg.to<SubscriptionId>(1);
        auto pubId = msg.to<PublicationId>(2);

        if (state() != State::established)
        {
            log(LogLevel::trace, "Discarding EVENT while not established");
            return;
        }

        auto slots = readership_.slotsFor(subId);
        if (slots.empty())
        {
            log(LogLevel::trace, "Discarding EVENT for unknown subscription "
                                 "ID " + std::to_string(subId));
            return;
        }

        Event event(PassKey{}, subId, pubId, std::move(msg.as<Object>(3)),
                    msg.argsAt(4), msg.kwargsAt(5));
        for (auto& slot: slots)
        {
            // A slot may have closed or left the session.
            if (state() != State::established)
                break;

            try
            {
                slot(event);
            }
            catch (const Error& e)
            {
                log(LogLevel::warning,
                    "Event slot for topic '" + readership_.topicOf(subId) +
                    "' threw an error with URI '" + e.uri() + "'");
            }
            catch (const error::BadType& e)
            {
                log(LogLevel::warning,
                    "Event slot for topic '" + readership_.topicOf(subId) +
                    "' threw a type error: " + e.what());
            }
        }
    }

    void onInvocation(Message& msg)
    {
        auto reqId = msg.to<RequestId>(1);
        auto regId = msg.to<RegistrationId>(2);

        if (state() != State::established)
        {
            log(LogLevel::debug, "Discarding INVOCATION while leaving");
            return;
        }

        auto slot = registry_.find(regId);
        if (!slot)
        {
            static constexpr auto errc = WampErrc::noSuchRegistration;
            log(LogLevel::warning,
                "Received INVOCATION for unknown registration ID " +
                std::to_string(regId), make_error_code(errc));
            send(Message(MessageKind::error,
                         static_cast<Int>(MessageKind::invocation), reqId,
                         Object{}, errorCodeToUri(errc)));
            return;
        }

        registry_.trackInvocation(reqId, regId);
        Invocation invocation(PassKey{}, shared_from_this(), generation_,
                              reqId, regId, std::move(msg.as<Object>(3)),
                              msg.argsAt(4), msg.kwargsAt(5));

        Outcome outcome;
        try
        {
            outcome = slot(std::move(invocation));
        }
        catch (Error& e)
        {
            outcome = std::move(e);
        }
        catch (const error::BadType& e)
        {
            outcome = Error(e);
        }

        switch (outcome.type())
        {
        case Outcome::Type::result:
            yieldResult(reqId, std::move(outcome).asResult());
            break;

        case Outcome::Type::error:
            yieldError(reqId, std::move(outcome).asError());
            break;

        default:
            break;
        }
    }

    void yieldResult(RequestId reqId, Result&& result)
    {
        if (!canYield(reqId))
            return;
        Message msg(MessageKind::yield, reqId, result.options());
        msg.appendPayload(std::move(result).args(),
                          std::move(result).kwargs());
        send(msg);
    }

    void yieldError(RequestId reqId, Error&& error)
    {
        if (!canYield(reqId))
            return;
        Message msg(MessageKind::error,
                    static_cast<Int>(MessageKind::invocation), reqId,
                    error.details(), error.uri());
        msg.appendPayload(std::move(error).args(), std::move(error).kwargs());
        send(msg);
    }

    // Invocation request IDs restart with each session, so a deferred
    // result is only valid within the session run that received it.
    bool isCurrent(std::uint64_t gen, RequestId reqId)
    {
        if (gen == generation_)
            return true;
        log(LogLevel::debug, "Discarding result of invocation " +
                             std::to_string(reqId) +
                             " from a previous session");
        return false;
    }

    bool canYield(RequestId reqId)
    {
        if (state() != State::established)
        {
            log(LogLevel::debug, "Discarding result of invocation " +
                                 std::to_string(reqId) +
                                 " while not established");
            return false;
        }

        if (!registry_.settleInvocation(reqId))
        {
            log(LogLevel::warning, "Discarding result of invocation " +
                                   std::to_string(reqId) +
                                   ", which was already answered");
            return false;
        }

        return true;
    }

    void onTransportClosed(std::error_code ec)
    {
        if (!ec)
            ec = make_error_code(TransportErrc::disconnected);
        log(LogLevel::error, "Transport connection lost", ec);
        teardown(ec, true);
    }

    void failProtocol(std::string why)
    {
        static constexpr auto errc = WampErrc::protocolViolation;
        log(LogLevel::error, "Protocol violation: " + why,
            make_error_code(errc));
        Reason reason(errc);
        reason.withHint(std::move(why));
        send(Message(MessageKind::abort, reason.options(), reason.uri()));
        teardown(make_error_code(errc), true);
    }

    // Returns to the closed state, resolving every pending operation with
    // the given error code and discarding all subscriptions and
    // registrations without contacting the router.
    void teardown(std::error_code ec, bool dropped)
    {
        bool wasEstablished = state() == State::established;

        ++generation_;
        if (transport_)
        {
            transport_->close();
            transport_.reset();
        }

        setState(State::closed);
        sessionId_.store(nullId());
        requestor_.abandonAll(ec);
        readership_.clear();
        registry_.clear();

        complete(openHandler_, UnexpectedError(ec));
        complete(leaveHandler_, UnexpectedError(ec));

        if (dropped && wasEstablished && disconnectHandler_)
            boost::asio::post(executor_, Dropped{disconnectHandler_, ec});
    }

    void send(const Message& msg)
    {
        if (!transport_)
            return;
        trace(msg, "TX");
        transport_->send(codec_.encode(msg));
    }

    template <typename T>
    bool checkState(CompletionHandler<T>& handler)
    {
        if (state() == State::established)
            return true;
        complete(handler, makeUnexpectedError(MiscErrc::invalidState));
        return false;
    }

    template <typename T>
    bool checkReply(ErrorOr<Message>& reply, MessageKind kind,
                    CompletionHandler<T>& handler, Error* errorPtr = nullptr)
    {
        if (!reply.has_value())
        {
            complete(handler, UnexpectedError(reply.error()));
            return false;
        }

        if (reply->kind() != MessageKind::error)
        {
            assert((reply->kind() == kind) && "Unexpected WAMP message type");
            return true;
        }

        Error error(PassKey{}, std::move(reply->as<String>(4)),
                    std::move(reply->as<Object>(3)), reply->argsAt(5),
                    reply->kwargsAt(6));
        const WampErrc errc = error.errorCode();
        if (errc == WampErrc::unknown)
        {
            log(LogLevel::debug,
                "Received ERROR with unknown URI '" + error.uri() + "'");
        }

        if (errorPtr != nullptr)
            *errorPtr = std::move(error);
        complete(handler, makeUnexpectedError(errc));
        return false;
    }

    // Posts the result to the handler via the user executor, leaving the
    // handler empty. Has no effect if the handler is already empty.
    template <typename T, typename V>
    void complete(CompletionHandler<T>& handler, V&& value)
    {
        if (!handler)
            return;
        Completed<T> completed{std::move(handler),
                               ErrorOr<T>(std::forward<V>(value))};
        handler = nullptr;
        boost::asio::post(executor_, std::move(completed));
    }

    void log(LogLevel level, std::string message, std::error_code ec = {})
    {
        const auto& handler = config_.logHandler();
        if (!handler || level < config_.logLevel())
            return;
        handler(LogEntry(level, std::move(message), ec));
    }

    void trace(const Message& msg, const char* direction)
    {
        if (config_.logHandler() && config_.logLevel() == LogLevel::trace)
            log(LogLevel::trace, msg.toTraceString(direction));
    }

    AnyIoExecutor executor_;
    IoStrand strand_;
    SessionConfig config_;
    Transporting::Ptr transport_;
    MessageCodec codec_;
    Requestor requestor_;
    Readership readership_;
    ProcedureRegistry registry_;
    CompletionHandler<Welcome> openHandler_;
    CompletionHandler<Reason> leaveHandler_;
    DisconnectHandler disconnectHandler_;
    Uri realm_;
    mutable std::mutex realmMutex_;
    std::atomic<State> state_;
    std::atomic<SessionId> sessionId_;
    std::uint64_t generation_ = 0;
};

} // namespace internal

} // namespace wampcore

#endif // WAMPCORE_INTERNAL_CLIENT_HPP
