/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#ifndef WAMPCORE_INTERNAL_MESSAGE_HPP
#define WAMPCORE_INTERNAL_MESSAGE_HPP

#include <limits>
#include <sstream>
#include <string>
#include <type_traits>
#include <utility>
#include "../errorcodes.hpp"
#include "../erroror.hpp"
#include "../variant.hpp"
#include "../wampdefs.hpp"
#include "messagetraits.hpp"

namespace wampcore
{

namespace internal
{

//------------------------------------------------------------------------------
struct Message
{
    using RequestKey = std::pair<MessageKind, RequestId>;

    // Validates the schema of the given message fields. Upon failure, the
    // hint describes the offending part of the message.
    static ErrorOr<Message> parse(Array&& fields, std::string* hint = nullptr)
    {
        auto fail = [hint](const char* why) -> ErrorOr<Message>
        {
            if (hint != nullptr)
                *hint = why;
            return makeUnexpectedError(WampErrc::protocolViolation);
        };

        MessageKind kind = parseMsgType(fields);
        if (kind == MessageKind::none)
            return fail("invalid message type number");

        const auto& traits = MessageTraits::lookup(kind);
        if (fields.size() < traits.minSize || fields.size() > traits.maxSize)
            return fail("invalid number of message fields");

        for (std::size_t i=1; i<fields.size(); ++i)
        {
            const auto& field = fields[i];
            auto expected = traits.fieldTypes[i];
            if (expected == TypeId::integer)
            {
                if (!field.isInteger())
                    return fail("invalid message field schema");
                if (!isValidId(field))
                    return fail("identifier out of range");
            }
            else if (field.typeId() != expected)
            {
                return fail("invalid message field schema");
            }
        }

        if (traits.uriPosition != 0 &&
            fields.at(traits.uriPosition).as<String>().empty())
        {
            return fail("empty URI");
        }

        if (kind == MessageKind::error &&
            !MessageTraits::lookup(parseKindNumber(fields.at(1))).isRequest &&
            parseKindNumber(fields.at(1)) != MessageKind::invocation)
        {
            return fail("invalid request type in ERROR message");
        }

        return Message(std::move(fields), kind);
    }

    static MessageKind parseMsgType(const Array& fields)
    {
        if (fields.empty())
            return MessageKind::none;
        return parseKindNumber(fields.front());
    }

    static MessageKind parseKindNumber(const Variant& field)
    {
        if (!field.isInteger())
            return MessageKind::none;

        using T = std::underlying_type<MessageKind>::type;
        static constexpr auto max = std::numeric_limits<T>::max();
        bool inRange = field.is<Int>()
            ? (field.as<Int>() >= 0 && field.as<Int>() <= Int(max))
            : (field.as<UInt>() <= UInt(max));
        if (!inRange)
            return MessageKind::none;

        auto kind = static_cast<MessageKind>(field.to<T>());
        if (!MessageTraits::lookup(kind).isValidKind())
            return MessageKind::none;
        return kind;
    }

    static bool isValidId(const Variant& field)
    {
        if (field.is<Int>())
            return field.as<Int>() >= 0 &&
                   UInt(field.as<Int>()) <= maxEphemeralId();
        return field.as<UInt>() <= maxEphemeralId();
    }

    Message() : kind_(MessageKind::none) {}

    template <typename... Ts>
    explicit Message(MessageKind kind, Ts&&... fields)
        : kind_(kind),
          fields_(Array{Variant(static_cast<Int>(kind)),
                        Variant(std::forward<Ts>(fields))...})
    {}

    MessageKind kind() const {return kind_;}

    const MessageTraits& traits() const {return MessageTraits::lookup(kind_);}

    const char* name() const {return traits().nameOr("INVALID");}

    const Array& fields() const {return fields_;}

    Array& fields() {return fields_;}

    std::size_t size() const {return fields_.size();}

    Variant& at(std::size_t index) {return fields_.at(index);}

    const Variant& at(std::size_t index) const {return fields_.at(index);}

    template <typename T>
    T& as(std::size_t index) {return fields_.at(index).as<T>();}

    template <typename T>
    const T& as(std::size_t index) const {return fields_.at(index).as<T>();}

    template <typename T>
    T to(std::size_t index) const {return fields_.at(index).to<T>();}

    bool hasRequestId() const {return traits().requestIdPosition != 0;}

    RequestId requestId() const
    {
        auto idPos = traits().requestIdPosition;
        return (idPos == 0) ? nullId() : fields_.at(idPos).to<RequestId>();
    }

    void setRequestId(RequestId rid)
    {
        auto idPos = traits().requestIdPosition;
        if (idPos != 0)
            fields_.at(idPos) = rid;
    }

    bool isReply() const {return traits().repliesTo != MessageKind::none;}

    MessageKind repliesTo() const
    {
        return kind_ == MessageKind::error ? parseKindNumber(fields_.at(1))
                                           : traits().repliesTo;
    }

    // Key under which the request this message replies to is tracked.
    RequestKey requestKey() const
    {
        auto reqKind = isReply() ? repliesTo() : kind_;
        return std::make_pair(reqKind, requestId());
    }

    // Returns the positional arguments at the given position, or an empty
    // array if absent.
    Array argsAt(std::size_t pos) const
    {
        return pos < fields_.size() ? fields_[pos].as<Array>() : Array{};
    }

    // Returns the keyword arguments at the given position, or an empty
    // object if absent.
    Object kwargsAt(std::size_t pos) const
    {
        return pos < fields_.size() ? fields_[pos].as<Object>() : Object{};
    }

    // Appends positional and keyword arguments, omitting empty trailing
    // ones.
    void appendPayload(Array args, Object kwargs)
    {
        if (!args.empty() || !kwargs.empty())
            fields_.emplace_back(std::move(args));
        if (!kwargs.empty())
            fields_.emplace_back(std::move(kwargs));
    }

    // Produces the `["TX"|"RX","NAME",fields...]` text used for trace
    // logging.
    std::string toTraceString(const char* direction) const
    {
        std::ostringstream oss;
        oss << "[\"" << direction << "\",\"" << name() << "\"";
        for (std::size_t i=1; i<fields_.size(); ++i)
            oss << "," << fields_[i];
        oss << "]";
        return oss.str();
    }

private:
    Message(Array&& fields, MessageKind kind)
        : kind_(kind),
          fields_(std::move(fields))
    {}

    MessageKind kind_;
    Array fields_;
};

} // namespace internal

} // namespace wampcore

#endif // WAMPCORE_INTERNAL_MESSAGE_HPP
