/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#ifndef WAMPCORE_VERSION_HPP
#define WAMPCORE_VERSION_HPP

#include <string>
#include "api.hpp"

//------------------------------------------------------------------------------
/** @file
    @brief Contains version information on the wampcore library. */
//------------------------------------------------------------------------------

/// Major version with incompatible API changes
#define WAMPCORE_MAJOR_VERSION 1

/// Minor version with functionality added in a backwards-compatible manner.
#define WAMPCORE_MINOR_VERSION 0

/// Patch version for backwards-compatible bug fixes.
#define WAMPCORE_PATCH_VERSION 0

/// Integer version number, computed as `(major*10000) + (minor*100) + patch`
#define WAMPCORE_VERSION \
    (WAMPCORE_MAJOR_VERSION * 10000 + \
     WAMPCORE_MINOR_VERSION * 100 + \
     WAMPCORE_PATCH_VERSION)

namespace wampcore
{

//------------------------------------------------------------------------------
/** Bundles the major, minor, and patch version numbers. */
//------------------------------------------------------------------------------
struct WAMPCORE_API Version
{
    /// Major version with incompatible API changes
    int major;

    /// Minor version with functionality added in a backwards-compatible manner.
    int minor;

    /// Patch version for backwards-compatible bug fixes.
    int patch;

    /** Obtains the current version of the library as
        major/minor/patch parts. */
    static Version parts();

    /** Obtains an integer representation of the library's current version. */
    static int integer();

    /** Obtains the library's current version as a `MAJOR.MINOR.PATCH`
        string. */
    static const std::string& asString();

    /** Obtains the agent string sent in `HELLO` messages. */
    static const std::string& agentString();
};

} // namespace wampcore

#ifndef WAMPCORE_COMPILED_LIB
#include "internal/version.inl.hpp"
#endif

#endif // WAMPCORE_VERSION_HPP
