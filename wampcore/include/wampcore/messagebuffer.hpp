/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#ifndef WAMPCORE_MESSAGEBUFFER_HPP
#define WAMPCORE_MESSAGEBUFFER_HPP

//------------------------------------------------------------------------------
/** @file
    @brief Contains the MessageBuffer definition. */
//------------------------------------------------------------------------------

#include <cstdint>
#include <string>
#include <vector>

namespace wampcore
{

//------------------------------------------------------------------------------
/** Container type used for encoded WAMP messages that are sent/received
    over a transport. */
//------------------------------------------------------------------------------
using MessageBuffer = std::vector<uint8_t>;

/** Copies the given text into a new MessageBuffer. */
inline MessageBuffer toMessageBuffer(const std::string& text)
{
    return MessageBuffer(text.begin(), text.end());
}

/** Copies the contents of the given MessageBuffer into a string. */
inline std::string toText(const MessageBuffer& buffer)
{
    return std::string(buffer.begin(), buffer.end());
}

} // namespace wampcore

#endif // WAMPCORE_MESSAGEBUFFER_HPP
