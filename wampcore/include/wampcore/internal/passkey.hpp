/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#ifndef WAMPCORE_PASSKEY_HPP
#define WAMPCORE_PASSKEY_HPP

namespace wampcore
{

class Session;

namespace internal
{
    // Restricts access to library-internal constructors and accessors of
    // public types.
    class PassKey
    {
        constexpr PassKey() {};

        friend class wampcore::Session;
        friend class Client;
        friend class ProcedureRegistry;
        friend class Readership;
    };

} // namespace internal

} // namespace wampcore

#endif // WAMPCORE_PASSKEY_HPP
