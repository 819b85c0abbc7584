/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#ifndef WAMPCORE_JSON_HPP
#define WAMPCORE_JSON_HPP

//------------------------------------------------------------------------------
/** @file
    @brief Contains the JSON codec used to serialize Variant objects. */
//------------------------------------------------------------------------------

#include <memory>
#include <string>
#include <system_error>
#include "api.hpp"
#include "errorcodes.hpp"
#include "variant.hpp"

namespace wampcore
{

//------------------------------------------------------------------------------
/** Encodes a Variant into compact JSON text.
    Instances can be reused to encode multiple variants. */
//------------------------------------------------------------------------------
class WAMPCORE_API JsonStringEncoder
{
public:
    /** Default constructor. */
    JsonStringEncoder();

    /** Move constructor. */
    JsonStringEncoder(JsonStringEncoder&&) noexcept;

    /** Destructor. */
    ~JsonStringEncoder();

    /** Move assignment. */
    JsonStringEncoder& operator=(JsonStringEncoder&&) noexcept;

    /** Serializes the given variant, replacing the contents of the given
        output string. */
    void encode(const Variant& variant, std::string& output);

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

//------------------------------------------------------------------------------
/** Decodes JSON text into a Variant.
    Integers that fit in an Int are decoded as Int, and larger positive
    integers are decoded as UInt. */
//------------------------------------------------------------------------------
class WAMPCORE_API JsonStringDecoder
{
public:
    /** Default constructor. */
    JsonStringDecoder();

    /** Move constructor. */
    JsonStringDecoder(JsonStringDecoder&&) noexcept;

    /** Destructor. */
    ~JsonStringDecoder();

    /** Move assignment. */
    JsonStringDecoder& operator=(JsonStringDecoder&&) noexcept;

    /** Deserializes the given JSON text into the given variant.
        @returns a default-constructed error code upon success,
                 DecodingErrc::emptyInput if the text has no tokens,
                 or a `jsoncons::json_errc` code equivalent to
                 DecodingErrc::failed if the JSON is malformed. */
    std::error_code decode(const std::string& input, Variant& variant);

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

//------------------------------------------------------------------------------
/** Convenience function that encodes a variant to a JSON string. */
//------------------------------------------------------------------------------
WAMPCORE_API std::string toJson(const Variant& variant);

} // namespace wampcore

#ifndef WAMPCORE_COMPILED_LIB
#include "internal/json.inl.hpp"
#endif

#endif // WAMPCORE_JSON_HPP
