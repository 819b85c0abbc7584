/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#ifndef WAMPCORE_INTERNAL_MESSAGECODEC_HPP
#define WAMPCORE_INTERNAL_MESSAGECODEC_HPP

#include <string>
#include <system_error>
#include "../erroror.hpp"
#include "../json.hpp"
#include "../messagebuffer.hpp"
#include "message.hpp"

namespace wampcore
{

namespace internal
{

//------------------------------------------------------------------------------
// Converts WAMP messages to/from JSON text held in MessageBuffer objects.
// Decoding never throws; failures are reported as an error code plus a hint.
//------------------------------------------------------------------------------
class MessageCodec
{
public:
    MessageBuffer encode(const Message& message)
    {
        encoder_.encode(Variant(message.fields()), text_);
        return MessageBuffer(text_.begin(), text_.end());
    }

    ErrorOr<Message> decode(const MessageBuffer& buffer,
                            std::string* hint = nullptr)
    {
        Variant v;
        auto ec = decoder_.decode(std::string(buffer.begin(), buffer.end()),
                                  v);
        if (ec)
        {
            setHint(hint, "deserialization failed: " + ec.message());
            return UnexpectedError(ec);
        }

        if (!v.is<Array>())
        {
            setHint(hint, "message is not an array");
            return makeUnexpectedError(WampErrc::protocolViolation);
        }

        return Message::parse(std::move(v.as<Array>()), hint);
    }

private:
    static void setHint(std::string* hint, std::string text)
    {
        if (hint != nullptr)
            *hint = std::move(text);
    }

    JsonStringEncoder encoder_;
    JsonStringDecoder decoder_;
    std::string text_;
};

} // namespace internal

} // namespace wampcore

#endif // WAMPCORE_INTERNAL_MESSAGECODEC_HPP
