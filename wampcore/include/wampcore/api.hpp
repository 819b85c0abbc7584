/*------------------------------------------------------------------------------
                Copyright Butterfly Energy Systems 2024.
           Distributed under the Boost Software License, Version 1.0.
              (See accompanying file LICENSE_1_0.txt or copy at
                    http://www.boost.org/LICENSE_1_0.txt)
------------------------------------------------------------------------------*/

#ifndef WAMPCORE_API_HPP
#define WAMPCORE_API_HPP

/** @file
    @brief Defines macros related to exporting/importing APIs. */

#ifdef WAMPCORE_COMPILED_LIB
#   define WAMPCORE_INLINE
#   if defined _WIN32 || defined __CYGWIN__
#       define WAMPCORE_API_IMPORT __declspec(dllimport)
#       define WAMPCORE_API_EXPORT __declspec(dllexport)
#       define WAMPCORE_API_HIDDEN
#   else
#       define WAMPCORE_API_IMPORT __attribute__((visibility("default")))
#       define WAMPCORE_API_EXPORT __attribute__((visibility("default")))
#       define WAMPCORE_API_HIDDEN __attribute__((visibility("hidden")))
#   endif
#   ifdef WAMPCORE_IS_STATIC
#       define WAMPCORE_API
#       define WAMPCORE_HIDDEN
#   else
#       ifdef wampcore_EXPORTS // We are building this library
#           define WAMPCORE_API WAMPCORE_API_EXPORT
#       else // We are using this library
#           define WAMPCORE_API WAMPCORE_API_IMPORT
#       endif
#       define WAMPCORE_HIDDEN WAMPCORE_API_HIDDEN
#   endif
#else
#   define WAMPCORE_INLINE inline
#   define WAMPCORE_API
#   define WAMPCORE_HIDDEN
#endif

#endif // WAMPCORE_API_HPP
