/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#include "../json.hpp"
#include <cctype>
#include <limits>
#include <utility>
#include <jsoncons/json.hpp>
#include <jsoncons/json_encoder.hpp>
#include <jsoncons/json_reader.hpp>
#include "../api.hpp"

namespace wampcore
{

namespace internal
{

//------------------------------------------------------------------------------
template <typename TEncoder>
class JsonVariantEncoder : public boost::static_visitor<>
{
public:
    explicit JsonVariantEncoder(TEncoder& encoder) : encoder_(encoder) {}

    void operator()(Null) const         {encoder_.null_value();}
    void operator()(Bool b) const       {encoder_.bool_value(b);}
    void operator()(Int n) const        {encoder_.int64_value(n);}
    void operator()(UInt n) const       {encoder_.uint64_value(n);}
    void operator()(Real x) const       {encoder_.double_value(x);}

    void operator()(const String& s) const
    {
        encoder_.string_value({s.data(), s.size()});
    }

    void operator()(const Array& array) const
    {
        encoder_.begin_array(array.size());
        for (const auto& elem: array)
            elem.visit(*this);
        encoder_.end_array();
    }

    void operator()(const Object& object) const
    {
        encoder_.begin_object(object.size());
        for (const auto& kv: object)
        {
            encoder_.key({kv.first.data(), kv.first.size()});
            kv.second.visit(*this);
        }
        encoder_.end_object();
    }

private:
    TEncoder& encoder_;
};

//------------------------------------------------------------------------------
inline Variant fromJsoncons(const jsoncons::json& j)
{
    if (j.is_null())
        return null;
    if (j.is_bool())
        return j.as<bool>();
    if (j.is_int64())
        return Variant(j.as<Int>());
    if (j.is_uint64())
    {
        auto n = j.as<UInt>();
        if (n <= static_cast<UInt>(std::numeric_limits<Int>::max()))
            return Variant(static_cast<Int>(n));
        return Variant(n);
    }
    if (j.is_double())
        return Variant(j.as<Real>());
    if (j.is_string())
        return Variant(j.as<String>());
    if (j.is_array())
    {
        Array array;
        array.reserve(j.size());
        for (const auto& elem: j.array_range())
            array.push_back(fromJsoncons(elem));
        return array;
    }
    if (j.is_object())
    {
        Object object;
        for (const auto& kv: j.object_range())
        {
            object.emplace(String(kv.key().data(), kv.key().size()),
                           fromJsoncons(kv.value()));
        }
        return object;
    }
    return null;
}

//------------------------------------------------------------------------------
inline bool hasNoTokens(const std::string& input)
{
    for (char c: input)
        if (!std::isspace(static_cast<unsigned char>(c)))
            return false;
    return true;
}

} // namespace internal


//******************************************************************************
// JSON encoder
//******************************************************************************

//------------------------------------------------------------------------------
class JsonStringEncoder::Impl
{
public:
    void encode(const Variant& variant, std::string& output)
    {
        output.clear();
        jsoncons::compact_json_string_encoder encoder(output);
        variant.visit(internal::JsonVariantEncoder<Encoder>(encoder));
        encoder.flush();
    }

private:
    using Encoder = jsoncons::compact_json_string_encoder;
};

WAMPCORE_INLINE JsonStringEncoder::JsonStringEncoder() : impl_(new Impl) {}

WAMPCORE_INLINE JsonStringEncoder::JsonStringEncoder(JsonStringEncoder&&)
    noexcept = default;

// Avoids incomplete type errors due to unique_ptr.
WAMPCORE_INLINE JsonStringEncoder::~JsonStringEncoder() = default;

WAMPCORE_INLINE JsonStringEncoder&
JsonStringEncoder::operator=(JsonStringEncoder&&) noexcept = default;

WAMPCORE_INLINE void JsonStringEncoder::encode(const Variant& variant,
                                               std::string& output)
{
    impl_->encode(variant, output);
}


//******************************************************************************
// JSON decoder
//******************************************************************************

//------------------------------------------------------------------------------
class JsonStringDecoder::Impl
{
public:
    std::error_code decode(const std::string& input, Variant& variant)
    {
        // jsoncons reports an input with no tokens as a generic
        // end-of-file error.
        if (internal::hasNoTokens(input))
            return make_error_code(DecodingErrc::emptyInput);

        jsoncons::json_decoder<jsoncons::json> decoder;
        jsoncons::json_string_reader reader(input, decoder);
        std::error_code ec;
        reader.read(ec);
        if (ec)
            return ec;
        if (!decoder.is_valid())
            return make_error_code(DecodingErrc::failed);

        variant = internal::fromJsoncons(decoder.get_result());
        return {};
    }
};

WAMPCORE_INLINE JsonStringDecoder::JsonStringDecoder() : impl_(new Impl) {}

WAMPCORE_INLINE JsonStringDecoder::JsonStringDecoder(JsonStringDecoder&&)
    noexcept = default;

WAMPCORE_INLINE JsonStringDecoder::~JsonStringDecoder() = default;

WAMPCORE_INLINE JsonStringDecoder&
JsonStringDecoder::operator=(JsonStringDecoder&&) noexcept = default;

WAMPCORE_INLINE std::error_code JsonStringDecoder::decode(
    const std::string& input, Variant& variant)
{
    return impl_->decode(input, variant);
}

//------------------------------------------------------------------------------
WAMPCORE_INLINE std::string toJson(const Variant& variant)
{
    std::string output;
    JsonStringEncoder().encode(variant, output);
    return output;
}

} // namespace wampcore
