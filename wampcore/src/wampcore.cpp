/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#ifndef WAMPCORE_COMPILED_LIB
#error WAMPCORE_COMPILED_LIB must be defined to use this source file
#endif

#include <wampcore/config.hpp>

#include <wampcore/internal/connectionmanager.inl.hpp>
#include <wampcore/internal/connectionoptions.inl.hpp>
#include <wampcore/internal/consolelogger.inl.hpp>
#include <wampcore/internal/error.inl.hpp>
#include <wampcore/internal/errorcodes.inl.hpp>
#include <wampcore/internal/exceptions.inl.hpp>
#include <wampcore/internal/json.inl.hpp>
#include <wampcore/internal/logging.inl.hpp>
#include <wampcore/internal/messagetraits.inl.hpp>
#include <wampcore/internal/pubsubinfo.inl.hpp>
#include <wampcore/internal/rpcinfo.inl.hpp>
#include <wampcore/internal/session.inl.hpp>
#include <wampcore/internal/sessionconfig.inl.hpp>
#include <wampcore/internal/sessioninfo.inl.hpp>
#include <wampcore/internal/variant.inl.hpp>
#include <wampcore/internal/version.inl.hpp>
