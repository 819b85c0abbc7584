/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#ifndef WAMPCORE_EXAMPLES_LOOPBACKROUTER_HPP
#define WAMPCORE_EXAMPLES_LOOPBACKROUTER_HPP

#include <map>
#include <memory>
#include <set>
#include <string>
#include <utility>
#include <wampcore/json.hpp>
#include <wampcore/logging.hpp>
#include <wampcore/transport.hpp>
#include <wampcore/variant.hpp>
#include <wampcore/wampdefs.hpp>

// WAMP message type numbers understood by the loopback router.
namespace msgcode
{
const wampcore::Int hello        = 1;
const wampcore::Int welcome      = 2;
const wampcore::Int abort        = 3;
const wampcore::Int goodbye      = 6;
const wampcore::Int error        = 8;
const wampcore::Int publish      = 16;
const wampcore::Int published    = 17;
const wampcore::Int subscribe    = 32;
const wampcore::Int subscribed   = 33;
const wampcore::Int unsubscribe  = 34;
const wampcore::Int unsubscribed = 35;
const wampcore::Int event        = 36;
const wampcore::Int call         = 48;
const wampcore::Int result       = 50;
const wampcore::Int enroll       = 64;
const wampcore::Int registered   = 65;
const wampcore::Int unregister   = 66;
const wampcore::Int unregistered = 67;
const wampcore::Int invocation   = 68;
const wampcore::Int yield        = 70;
} // namespace msgcode

//------------------------------------------------------------------------------
// Minimal single-realm router living in the same process as its clients.
// It supports just enough of the basic profile to run the examples: joining,
// leaving, exact-match subscriptions, publications, registrations and calls.
// Every client is connected via a Peer transport that exchanges JSON text
// with the router through the shared I/O executor.
//------------------------------------------------------------------------------
class LoopbackRouter : public std::enable_shared_from_this<LoopbackRouter>
{
public:
    using Ptr = std::shared_ptr<LoopbackRouter>;
    using WeakPtr = std::weak_ptr<LoopbackRouter>;

    static Ptr create(wampcore::Uri realm, wampcore::LogHandler logger)
    {
        return Ptr(new LoopbackRouter(std::move(realm), std::move(logger)));
    }

    wampcore::TransportFactory transportFactory()
    {
        WeakPtr self = shared_from_this();
        return [self](wampcore::AnyIoExecutor exec)
                   -> wampcore::Transporting::Ptr
        {
            auto router = self.lock();
            if (!router)
                return nullptr;
            return router->connect(std::move(exec));
        };
    }

    const wampcore::Uri& realm() const {return realm_;}

private:
    class Peer;
    using PeerPtr = std::shared_ptr<Peer>;

    struct Topic
    {
        wampcore::SubscriptionId id;
        std::set<wampcore::SessionId> subscribers;
    };

    struct Procedure
    {
        wampcore::RegistrationId id;
        wampcore::SessionId callee;
    };

    struct PendingCall
    {
        wampcore::SessionId caller;
        wampcore::RequestId requestId;
    };

    // Client end of a loopback connection.
    class Peer : public wampcore::Transporting
    {
    public:
        Peer(wampcore::AnyIoExecutor exec, WeakPtr router)
            : Transporting(std::move(exec)),
              router_(std::move(router))
        {}

        wampcore::SessionId sessionId = wampcore::nullId();

        void deliver(std::string text)
        {
            auto self = std::static_pointer_cast<Peer>(shared_from_this());
            post([self, text]()
            {
                if (self->state() == State::running && self->rxHandler_)
                    self->rxHandler_(wampcore::toMessageBuffer(text));
            });
        }

    private:
        void onStart(RxHandler rxHandler, CloseHandler) override
        {
            rxHandler_ = std::move(rxHandler);
        }

        void onSend(wampcore::MessageBuffer message) override
        {
            auto self = std::static_pointer_cast<Peer>(shared_from_this());
            auto text = wampcore::toText(message);
            WeakPtr router = router_;
            post([self, router, text]()
            {
                auto r = router.lock();
                if (r)
                    r->onMessage(self, text);
            });
        }

        void onClose() override
        {
            rxHandler_ = nullptr;
            auto self = std::static_pointer_cast<Peer>(shared_from_this());
            WeakPtr router = router_;
            post([self, router]()
            {
                auto r = router.lock();
                if (r)
                    r->detach(*self);
            });
        }

        WeakPtr router_;
        RxHandler rxHandler_;
    };

    LoopbackRouter(wampcore::Uri realm, wampcore::LogHandler logger)
        : realm_(std::move(realm)),
          logger_(std::move(logger))
    {}

    wampcore::Transporting::Ptr connect(wampcore::AnyIoExecutor exec)
    {
        return std::make_shared<Peer>(std::move(exec), shared_from_this());
    }

    void log(wampcore::LogLevel level, std::string message)
    {
        if (logger_)
            logger_(wampcore::LogEntry(level, std::move(message)));
    }

    wampcore::EphemeralId nextId() {return ++idCounter_;}

    void onMessage(const PeerPtr& peer, const std::string& text)
    {
        wampcore::Variant v;
        auto ec = decoder_.decode(text, v);
        if (ec || !v.is<wampcore::Array>() || v.as<wampcore::Array>().empty())
        {
            log(wampcore::LogLevel::error, "Router received garbage: " + text);
            return;
        }

        auto& msg = v.as<wampcore::Array>();
        switch (msg.at(0).to<wampcore::Int>())
        {
        case msgcode::hello:       return onHello(peer, msg);
        case msgcode::abort:       return detach(*peer);
        case msgcode::goodbye:     return onGoodbye(peer);
        case msgcode::error:       return onInvocationError(msg);
        case msgcode::publish:     return onPublish(peer, msg);
        case msgcode::subscribe:   return onSubscribe(peer, msg);
        case msgcode::unsubscribe: return onUnsubscribe(peer, msg);
        case msgcode::call:        return onCall(peer, msg);
        case msgcode::enroll:      return onRegister(peer, msg);
        case msgcode::unregister:  return onUnregister(peer, msg);
        case msgcode::yield:       return onYield(msg);
        default:
            log(wampcore::LogLevel::warning,
                "Router ignoring unsupported message: " + text);
        }
    }

    void onHello(const PeerPtr& peer, wampcore::Array& msg)
    {
        using namespace wampcore;
        if (msg.at(1).as<String>() != realm_)
        {
            send(*peer, Array{msgcode::abort,
                              Object{{"message", "unknown realm"}},
                              "wamp.error.no_such_realm"});
            return;
        }

        peer->sessionId = nextId();
        peers_[peer->sessionId] = peer;
        log(LogLevel::info, "Router admitted session " +
                            std::to_string(peer->sessionId));
        Object roles{{"broker", Object{}}, {"dealer", Object{}}};
        send(*peer, Array{msgcode::welcome, peer->sessionId,
                          Object{{"agent", "loopbackrouter"},
                                 {"roles", std::move(roles)}}});
    }

    void onGoodbye(const PeerPtr& peer)
    {
        send(*peer, wampcore::Array{msgcode::goodbye, wampcore::Object{},
                                    "wamp.close.goodbye_and_out"});
        detach(*peer);
    }

    void onSubscribe(const PeerPtr& peer, wampcore::Array& msg)
    {
        auto reqId = msg.at(1).to<wampcore::RequestId>();
        auto& topic = topics_[msg.at(3).as<wampcore::String>()];
        if (topic.id == 0)
        {
            topic.id = nextId();
            topicUris_[topic.id] = msg.at(3).as<wampcore::String>();
        }
        topic.subscribers.insert(peer->sessionId);
        send(*peer, wampcore::Array{msgcode::subscribed, reqId, topic.id});
    }

    void onUnsubscribe(const PeerPtr& peer, wampcore::Array& msg)
    {
        auto reqId = msg.at(1).to<wampcore::RequestId>();
        auto subId = msg.at(2).to<wampcore::SubscriptionId>();
        auto found = topicUris_.find(subId);
        if (found == topicUris_.end() ||
            topics_[found->second].subscribers.erase(peer->sessionId) == 0)
        {
            return sendError(*peer, msgcode::unsubscribe, reqId,
                             "wamp.error.no_such_subscription");
        }
        send(*peer, wampcore::Array{msgcode::unsubscribed, reqId});
    }

    void onPublish(const PeerPtr& peer, wampcore::Array& msg)
    {
        using namespace wampcore;
        auto reqId = msg.at(1).to<RequestId>();
        const auto& options = msg.at(2).as<Object>();
        auto pubId = nextId();

        bool excludeMe = true;
        auto opt = options.find("exclude_me");
        if (opt != options.end() && opt->second.is<Bool>())
            excludeMe = opt->second.as<Bool>();

        auto topic = topics_.find(msg.at(3).as<String>());
        if (topic != topics_.end())
        {
            Array eventMsg{msgcode::event, topic->second.id, pubId, Object{}};
            appendPayload(eventMsg, msg, 4);
            for (auto sid: topic->second.subscribers)
            {
                if (excludeMe && sid == peer->sessionId)
                    continue;
                auto subscriber = peers_.find(sid);
                if (subscriber != peers_.end())
                    send(*subscriber->second, eventMsg);
            }
        }

        opt = options.find("acknowledge");
        if (opt != options.end() && opt->second == true)
            send(*peer, Array{msgcode::published, reqId, pubId});
    }

    void onRegister(const PeerPtr& peer, wampcore::Array& msg)
    {
        auto reqId = msg.at(1).to<wampcore::RequestId>();
        const auto& uri = msg.at(3).as<wampcore::String>();
        if (procedures_.count(uri) != 0)
        {
            return sendError(*peer, msgcode::enroll, reqId,
                             "wamp.error.procedure_already_exists");
        }
        Procedure proc{nextId(), peer->sessionId};
        procedures_[uri] = proc;
        procedureUris_[proc.id] = uri;
        send(*peer, wampcore::Array{msgcode::registered, reqId, proc.id});
    }

    void onUnregister(const PeerPtr& peer, wampcore::Array& msg)
    {
        auto reqId = msg.at(1).to<wampcore::RequestId>();
        auto regId = msg.at(2).to<wampcore::RegistrationId>();
        auto found = procedureUris_.find(regId);
        if (found == procedureUris_.end() ||
            procedures_[found->second].callee != peer->sessionId)
        {
            return sendError(*peer, msgcode::unregister, reqId,
                             "wamp.error.no_such_registration");
        }
        procedures_.erase(found->second);
        procedureUris_.erase(found);
        send(*peer, wampcore::Array{msgcode::unregistered, reqId});
    }

    void onCall(const PeerPtr& peer, wampcore::Array& msg)
    {
        using namespace wampcore;
        auto reqId = msg.at(1).to<RequestId>();
        auto proc = procedures_.find(msg.at(3).as<String>());
        if (proc == procedures_.end())
            return sendError(*peer, msgcode::call, reqId,
                             "wamp.error.no_such_procedure");

        auto callee = peers_.find(proc->second.callee);
        if (callee == peers_.end())
            return sendError(*peer, msgcode::call, reqId,
                             "wamp.error.no_such_procedure");

        auto invId = nextId();
        pendingCalls_[invId] = PendingCall{peer->sessionId, reqId};
        Array inv{msgcode::invocation, invId, proc->second.id, Object{}};
        appendPayload(inv, msg, 4);
        send(*callee->second, std::move(inv));
    }

    void onYield(wampcore::Array& msg)
    {
        using namespace wampcore;
        auto caller = takeCaller(msg.at(1).to<RequestId>());
        if (!caller.first)
            return;
        Array reply{msgcode::result, caller.second, Object{}};
        appendPayload(reply, msg, 3);
        send(*caller.first, std::move(reply));
    }

    void onInvocationError(wampcore::Array& msg)
    {
        using namespace wampcore;
        if (msg.at(1).to<wampcore::Int>() != msgcode::invocation)
            return;
        auto caller = takeCaller(msg.at(2).to<RequestId>());
        if (!caller.first)
            return;
        Array reply{msgcode::error, msgcode::call, caller.second, msg.at(3),
                    msg.at(4)};
        appendPayload(reply, msg, 5);
        send(*caller.first, std::move(reply));
    }

    std::pair<PeerPtr, wampcore::RequestId>
    takeCaller(wampcore::RequestId invocationId)
    {
        auto pending = pendingCalls_.find(invocationId);
        if (pending == pendingCalls_.end())
            return {nullptr, 0};
        auto info = pending->second;
        pendingCalls_.erase(pending);
        auto peer = peers_.find(info.caller);
        if (peer == peers_.end())
            return {nullptr, 0};
        return {peer->second, info.requestId};
    }

    void detach(Peer& peer)
    {
        auto sid = peer.sessionId;
        if (peers_.erase(sid) == 0)
            return;
        for (auto& topic: topics_)
            topic.second.subscribers.erase(sid);
        for (auto iter = procedures_.begin(); iter != procedures_.end();)
        {
            if (iter->second.callee == sid)
            {
                procedureUris_.erase(iter->second.id);
                iter = procedures_.erase(iter);
            }
            else
            {
                ++iter;
            }
        }
        log(wampcore::LogLevel::info, "Router detached session " +
                                      std::to_string(sid));
    }

    static void appendPayload(wampcore::Array& to, const wampcore::Array& from,
                              std::size_t pos)
    {
        for (; pos < from.size(); ++pos)
            to.push_back(from[pos]);
    }

    void sendError(Peer& peer, wampcore::Int requestType,
                   wampcore::RequestId reqId, wampcore::Uri uri)
    {
        send(peer, wampcore::Array{msgcode::error, requestType, reqId,
                                   wampcore::Object{}, std::move(uri)});
    }

    void send(Peer& peer, const wampcore::Array& msg)
    {
        std::string text;
        encoder_.encode(wampcore::Variant(msg), text);
        peer.deliver(std::move(text));
    }

    wampcore::Uri realm_;
    wampcore::LogHandler logger_;
    wampcore::JsonStringEncoder encoder_;
    wampcore::JsonStringDecoder decoder_;
    std::map<wampcore::SessionId, PeerPtr> peers_;
    std::map<wampcore::Uri, Topic> topics_;
    std::map<wampcore::SubscriptionId, wampcore::Uri> topicUris_;
    std::map<wampcore::Uri, Procedure> procedures_;
    std::map<wampcore::RegistrationId, wampcore::Uri> procedureUris_;
    std::map<wampcore::RequestId, PendingCall> pendingCalls_;
    wampcore::EphemeralId idCounter_ = 0;
};

#endif // WAMPCORE_EXAMPLES_LOOPBACKROUTER_HPP
