/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#include "../version.hpp"
#include "../api.hpp"
#include "../config.hpp"

namespace wampcore
{

//------------------------------------------------------------------------------
WAMPCORE_INLINE Version Version::parts()
{
    return {WAMPCORE_MAJOR_VERSION,
            WAMPCORE_MINOR_VERSION,
            WAMPCORE_PATCH_VERSION};
}

//------------------------------------------------------------------------------
WAMPCORE_INLINE int Version::integer()
{
    return WAMPCORE_VERSION;
}

//------------------------------------------------------------------------------
WAMPCORE_INLINE const std::string& Version::asString()
{
    static const auto str = std::to_string(WAMPCORE_MAJOR_VERSION) + '.' +
                            std::to_string(WAMPCORE_MINOR_VERSION) + '.' +
                            std::to_string(WAMPCORE_PATCH_VERSION);
    return str;
}

//------------------------------------------------------------------------------
/** @details
The agent string is formatted as `wampcore/MAJOR.MINOR.PATCH (<system>)`. */
//------------------------------------------------------------------------------
WAMPCORE_INLINE const std::string& Version::agentString()
{
    static const auto str = std::string("wampcore/") + asString() +
                            " (" + WAMPCORE_SYSTEM_NAME + ")";
    return str;
}

} // namespace wampcore
