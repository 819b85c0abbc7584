/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#ifndef WAMPCORE_INTERNAL_REQUESTOR_HPP
#define WAMPCORE_INTERNAL_REQUESTOR_HPP

#include <cassert>
#include <functional>
#include <map>
#include <system_error>
#include <utility>
#include "../erroror.hpp"
#include "../wampdefs.hpp"
#include "message.hpp"

namespace wampcore
{

namespace internal
{

//------------------------------------------------------------------------------
// Generates request IDs and correlates replies with their pending requests.
// Request IDs start at 1, increase monotonically, and are never reused until
// reset() is called for a new session.
//------------------------------------------------------------------------------
class Requestor
{
public:
    using RequestKey = Message::RequestKey;
    using RequestHandler = std::function<void (ErrorOr<Message>)>;
    using Sender = std::function<void (Message&&)>;

    explicit Requestor(Sender sender) : sender_(std::move(sender)) {}

    // Assigns a fresh request ID to the given message and sends it,
    // registering the handler to be called upon the reply. An empty handler
    // means that no reply is expected.
    RequestId request(Message&& msg, RequestHandler handler = nullptr)
    {
        // Will take 285 years to overflow 2^53 at 1 million requests/sec
        assert(nextRequestId_ < maxEphemeralId());
        RequestId requestId = ++nextRequestId_;
        msg.setRequestId(requestId);
        auto key = msg.requestKey();

        if (handler)
        {
            auto emplaced = requests_.emplace(key, std::move(handler));
            assert(emplaced.second);
            (void)emplaced;
        }

        sender_(std::move(msg));
        return requestId;
    }

    // Returns true if the reply matched a pending request.
    bool onReply(Message&& msg)
    {
        assert(msg.isReply());
        auto kv = requests_.find(msg.requestKey());
        if (kv == requests_.end())
            return false;

        auto handler = std::move(kv->second);
        requests_.erase(kv);
        handler(std::move(msg));
        return true;
    }

    bool contains(const RequestKey& key) const
    {
        return requests_.count(key) != 0;
    }

    std::size_t size() const {return requests_.size();}

    bool empty() const {return requests_.empty();}

    RequestId lastRequestId() const {return nextRequestId_;}

    // Completes every pending request with the given error. Handlers may
    // issue new requests while this executes.
    void abandonAll(std::error_code ec)
    {
        auto requests = std::move(requests_);
        requests_.clear();
        for (auto& kv: requests)
            kv.second(UnexpectedError(ec));
    }

    void reset()
    {
        requests_.clear();
        nextRequestId_ = nullId();
    }

private:
    std::map<RequestKey, RequestHandler> requests_;
    Sender sender_;
    RequestId nextRequestId_ = nullId();
};

} // namespace internal

} // namespace wampcore

#endif // WAMPCORE_INTERNAL_REQUESTOR_HPP
