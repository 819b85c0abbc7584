/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#ifndef WAMPCORE_CONFIG_HPP
#define WAMPCORE_CONFIG_HPP

//------------------------------------------------------------------------------
// Target system detection
//------------------------------------------------------------------------------
#if defined(_WIN32) || defined(__CYGWIN__)
#   define WAMPCORE_SYSTEM_IS_WINDOWS 1
#   define WAMPCORE_SYSTEM_NAME "Windows"
#elif defined(__APPLE__)
#   define WAMPCORE_SYSTEM_IS_APPLE 1
#   define WAMPCORE_SYSTEM_NAME "Apple"
#elif defined(__ANDROID__)
#   define WAMPCORE_SYSTEM_IS_ANDROID 1
#   define WAMPCORE_SYSTEM_NAME "Android"
#elif defined(__linux__)
#   define WAMPCORE_SYSTEM_IS_LINUX 1
#   define WAMPCORE_SYSTEM_NAME "Linux"
#elif defined(__unix__)
#   define WAMPCORE_SYSTEM_IS_UNIX 1
#   define WAMPCORE_SYSTEM_NAME "UNIX"
#else
#   define WAMPCORE_SYSTEM_IS_UNDETECTED 1
#   define WAMPCORE_SYSTEM_NAME "Undetected"
#endif

#ifdef WAMPCORE_CUSTOM_SYSTEM_NAME
#undef WAMPCORE_SYSTEM_NAME
#define WAMPCORE_SYSTEM_NAME WAMPCORE_CUSTOM_SYSTEM_NAME
#endif

//------------------------------------------------------------------------------
// Attributes
//------------------------------------------------------------------------------
#if defined(__has_cpp_attribute)
#   if __has_cpp_attribute(nodiscard) && (__cplusplus >= 201703L)
#       define WAMPCORE_NODISCARD [[nodiscard]]
#   endif
#endif

#ifndef WAMPCORE_NODISCARD
#   if defined(__GNUC__) || defined(__clang__)
#       define WAMPCORE_NODISCARD __attribute__((warn_unused_result))
#   else
#       define WAMPCORE_NODISCARD
#   endif
#endif

#endif // WAMPCORE_CONFIG_HPP
