/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#ifndef WAMPCORE_VARIANT_HPP
#define WAMPCORE_VARIANT_HPP

//------------------------------------------------------------------------------
/** @file
    @brief Contains the declaration of Variant and other closely related
           types/functions. */
//------------------------------------------------------------------------------

#include <cstdint>
#include <map>
#include <ostream>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>
#include <boost/numeric/conversion/cast.hpp>
#include <boost/variant/apply_visitor.hpp>
#include <boost/variant/get.hpp>
#include <boost/variant/recursive_wrapper.hpp>
#include <boost/variant/variant.hpp>
#include "api.hpp"
#include "exceptions.hpp"

namespace wampcore
{

//------------------------------------------------------------------------------
/** Type used to represent a null or empty Variant value. */
//------------------------------------------------------------------------------
struct WAMPCORE_API Null
{
    constexpr Null() {}
};

/** @relates Null */
inline bool operator==(Null, Null) {return true;}

/** @relates Null */
inline bool operator!=(Null, Null) {return false;}

/** Constant Null object that can be assigned to, or compared with a Variant. */
constexpr Null null;

class Variant;

using Bool   = bool;                     ///< Variant bound type for boolean values
using Int    = std::int64_t;             ///< Variant bound type for signed integers
using UInt   = std::uint64_t;            ///< Variant bound type for unsigned integers
using Real   = double;                   ///< Variant bound type for floating-point numbers
using String = std::string;              ///< Variant bound type for text strings
using Array  = std::vector<Variant>;     ///< Variant bound type for arrays of variants
using Object = std::map<String, Variant>;///< Variant bound type for maps of variants

//------------------------------------------------------------------------------
/** Integer ids used by Variant to identify its current dynamic type.
    The order matches the order of Variant's bound types. */
//------------------------------------------------------------------------------
enum class TypeId
{
    null,    ///< For Null
    boolean, ///< For Bool
    integer, ///< For Int
    uint,    ///< For UInt
    real,    ///< For Real
    string,  ///< For String
    array,   ///< For Array
    object   ///< For Object
};

/** Obtains a label for the given TypeId. */
WAMPCORE_API const std::string& typeIdLabel(TypeId id);

//------------------------------------------------------------------------------
/** Discriminated union container that represents a JSON value.

    A Variant can hold any of the bound types Null, Bool, Int, UInt, Real,
    String, Array, and Object. It is used for the fields of WAMP messages
    and for application payloads.

    Numeric comparisons between Int, UInt and Real hold when the values are
    mathematically equal, so that `Variant(2) == Variant(2u)` and
    `Variant(2) == Variant(2.0)`. */
//------------------------------------------------------------------------------
class WAMPCORE_API Variant
{
public:
    using SizeType = std::size_t;

    /** Constructs a null variant. */
    Variant() = default;

    /** Constructs a null variant. */
    Variant(Null) {}

    /** Constructs a boolean variant. */
    Variant(Bool b) : value_(b) {}

    /** Constructs an Int variant from any signed integral type. */
    template <typename T,
              typename std::enable_if<std::is_integral<T>::value &&
                                      std::is_signed<T>::value, int>::type = 0>
    Variant(T n) : value_(Int(n)) {}

    /** Constructs a UInt variant from any unsigned integral type. */
    template <typename T,
              typename std::enable_if<std::is_integral<T>::value &&
                                      std::is_unsigned<T>::value &&
                                      !std::is_same<T, bool>::value,
                                      int>::type = 0>
    Variant(T n) : value_(UInt(n)) {}

    /** Constructs a Real variant from any floating-point type. */
    template <typename T,
              typename std::enable_if<std::is_floating_point<T>::value,
                                      int>::type = 0>
    Variant(T x) : value_(Real(x)) {}

    /** Constructs a String variant. */
    Variant(String s) : value_(std::move(s)) {}

    /** Constructs a String variant from a null-terminated character array. */
    Variant(const char* s) : value_(String(s)) {}

    /** Constructs an Array variant. */
    Variant(Array a) : value_(std::move(a)) {}

    /** Constructs an Object variant. */
    Variant(Object o) : value_(std::move(o)) {}

    /** Returns the id of the variant's current dynamic type. */
    TypeId typeId() const {return static_cast<TypeId>(value_.which());}

    /** Returns `false` iff the variant is null. */
    explicit operator bool() const {return typeId() != TypeId::null;}

    /** Returns `true` iff the variant is null. */
    bool isNull() const {return typeId() == TypeId::null;}

    /** Returns `true` iff the variant holds an Int, UInt, or Real. */
    bool isNumber() const;

    /** Returns `true` iff the variant holds an Int or UInt. */
    bool isInteger() const;

    /** Returns `true` iff the current dynamic type matches the given bound
        type. */
    template <typename T>
    bool is() const {return boost::get<T>(&value_) != nullptr;}

    /** Accesses the variant as the given bound type.
        @throws error::Access if the dynamic type does not match. */
    template <typename T>
    T& as()
    {
        auto ptr = boost::get<T>(&value_);
        if (ptr == nullptr)
            throwAccess<T>();
        return *ptr;
    }

    /** Accesses the variant as the given bound type.
        @throws error::Access if the dynamic type does not match. */
    template <typename T>
    const T& as() const
    {
        auto ptr = boost::get<T>(&value_);
        if (ptr == nullptr)
            throwAccess<T>();
        return *ptr;
    }

    /** Converts the variant's value to the given type.
        Arithmetic target types are converted from any number, with range
        checking. Other target types must match the dynamic type exactly.
        @throws error::Conversion if the conversion is not possible. */
    template <typename T>
    T to() const;

    /** Returns the converted value, or the given fallback if the variant
        is null. */
    template <typename T>
    T valueOr(T fallback) const
    {
        if (isNull())
            return fallback;
        return to<T>();
    }

    /** Returns the number of elements of an Array or Object, zero for null,
        and one for all other types. */
    SizeType size() const;

    /** Applies a Boost.Variant static visitor to the variant's value.
        Array and Object values are passed unwrapped. */
    template <typename TVisitor>
    typename TVisitor::result_type visit(const TVisitor& visitor) const
    {
        return boost::apply_visitor(visitor, value_);
    }

    /** Compares for equality with another variant. */
    bool equals(const Variant& other) const;

    /** Swaps contents with another variant. */
    void swap(Variant& other) {value_.swap(other.value_);}

private:
    using Storage = boost::variant<Null, Bool, Int, UInt, Real, String,
                                   boost::recursive_wrapper<Array>,
                                   boost::recursive_wrapper<Object>>;

    template <typename T>
    [[noreturn]] void throwAccess() const
    {
        throw error::Access(typeIdLabel(typeId()),
                            typeIdLabel(Variant(T()).typeId()));
    }

    Storage value_;
};

/** Compares two variants for equality.
    @relates Variant */
inline bool operator==(const Variant& lhs, const Variant& rhs)
{
    return lhs.equals(rhs);
}

/** Compares two variants for inequality.
    @relates Variant */
inline bool operator!=(const Variant& lhs, const Variant& rhs)
{
    return !lhs.equals(rhs);
}

/** Outputs the variant in JSON-like notation.
    @relates Variant */
WAMPCORE_API std::ostream& operator<<(std::ostream& out, const Variant& v);

/** Outputs an Array in JSON-like notation.
    @relates Variant */
WAMPCORE_API std::ostream& operator<<(std::ostream& out, const Array& a);

/** Outputs an Object in JSON-like notation.
    @relates Variant */
WAMPCORE_API std::ostream& operator<<(std::ostream& out, const Object& o);

/** Obtains the JSON-like text representation of the variant.
    @relates Variant */
WAMPCORE_API std::string toString(const Variant& v);


namespace internal
{

//------------------------------------------------------------------------------
template <typename T, typename Enable = void>
struct VariantConverter
{
    static T convert(const Variant& v)
    {
        if (!v.is<T>())
        {
            throw error::Conversion(
                "Invalid conversion from " + typeIdLabel(v.typeId()));
        }
        return v.as<T>();
    }
};

//------------------------------------------------------------------------------
template <typename T>
struct VariantConverter<T, typename std::enable_if<
    std::is_arithmetic<T>::value && !std::is_same<T, bool>::value>::type>
{
    static T convert(const Variant& v)
    {
        try
        {
            switch (v.typeId())
            {
            case TypeId::integer: return boost::numeric_cast<T>(v.as<Int>());
            case TypeId::uint:    return boost::numeric_cast<T>(v.as<UInt>());
            case TypeId::real:    return boost::numeric_cast<T>(v.as<Real>());
            default: break;
            }
        }
        catch (const boost::numeric::bad_numeric_cast& e)
        {
            throw error::Conversion(std::string("Numeric value out of range: ") +
                                    e.what());
        }
        throw error::Conversion("Invalid conversion from " +
                                typeIdLabel(v.typeId()) + " to number");
    }
};

} // namespace internal


template <typename T>
T Variant::to() const
{
    return internal::VariantConverter<T>::convert(*this);
}

} // namespace wampcore

#ifndef WAMPCORE_COMPILED_LIB
#include "internal/variant.inl.hpp"
#endif

#endif // WAMPCORE_VARIANT_HPP
