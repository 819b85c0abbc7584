/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#ifndef WAMPCORE_EXCEPTIONS_HPP
#define WAMPCORE_EXCEPTIONS_HPP

/** @file
    @brief Exceptions thrown for misuse of the API and for dynamic type
           mismatches. Runtime failures are instead reported as error codes
           through ErrorOr. */

#include <stdexcept>
#include <string>
#include <system_error>
#include "api.hpp"

/** Throws error::Logic, tagged with the source location, unless `cond`
    holds. */
#define WAMPCORE_LOGIC_CHECK(cond, msg) \
    ::wampcore::error::Logic::check((cond), __FILE__, __LINE__, (msg))

namespace wampcore
{

namespace error
{

//------------------------------------------------------------------------------
/** Thrown by ErrorOr::value when the ErrorOr holds an error code. */
//------------------------------------------------------------------------------
class WAMPCORE_API Failure : public std::system_error
{
public:
    explicit Failure(std::error_code ec);
};

//------------------------------------------------------------------------------
/** Thrown when a precondition of an API call is violated, such as opening a
    session with an empty realm. */
//------------------------------------------------------------------------------
class WAMPCORE_API Logic : public std::logic_error
{
public:
    using std::logic_error::logic_error;

    static void check(bool condition, const char* file, int line,
                      const std::string& msg);
};

//------------------------------------------------------------------------------
/** Base of the exceptions thrown when a Variant does not hold the expected
    dynamic type. Invocation slots throwing it produce an
    `wamp.error.invalid_argument` reply. */
//------------------------------------------------------------------------------
class WAMPCORE_API BadType : public std::runtime_error
{
public:
    explicit BadType(const std::string& what);
};

/** Thrown when a Variant is accessed as a type it does not hold. */
class WAMPCORE_API Access : public BadType
{
public:
    Access(const std::string& heldType, const std::string& wantedType);
};

/** Thrown when a Variant cannot be converted to the requested type. */
class WAMPCORE_API Conversion : public BadType
{
public:
    explicit Conversion(const std::string& what);
};

} // namespace error

} // namespace wampcore

#ifndef WAMPCORE_COMPILED_LIB
#include "internal/exceptions.inl.hpp"
#endif

#endif // WAMPCORE_EXCEPTIONS_HPP
