/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#include "../exceptions.hpp"
#include "../api.hpp"

namespace wampcore
{

namespace error
{

WAMPCORE_INLINE Failure::Failure(std::error_code ec)
    : std::system_error(ec, std::string(ec.category().name()) + ':' +
                                std::to_string(ec.value()))
{}

//------------------------------------------------------------------------------
/** @details
    Use WAMPCORE_LOGIC_CHECK, which fills in the source location. The
    exception's message has the form `<file>:<line>: <msg>`. */
//------------------------------------------------------------------------------
WAMPCORE_INLINE void Logic::check(bool condition, const char* file, int line,
                                  const std::string& msg)
{
    if (condition)
        return;
    throw Logic(std::string(file) + ':' + std::to_string(line) + ": " + msg);
}

WAMPCORE_INLINE BadType::BadType(const std::string& what)
    : std::runtime_error(what)
{}

WAMPCORE_INLINE Access::Access(const std::string& heldType,
                               const std::string& wantedType)
    : BadType("Variant holds " + heldType + ", not " + wantedType)
{}

WAMPCORE_INLINE Conversion::Conversion(const std::string& what)
    : BadType(what)
{}

} // namespace error

} // namespace wampcore
