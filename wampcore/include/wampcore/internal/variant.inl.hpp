/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#include "../variant.hpp"
#include <cstdio>
#include <limits>
#include <sstream>
#include <boost/variant/static_visitor.hpp>
#include "../api.hpp"

namespace wampcore
{

namespace internal
{

//------------------------------------------------------------------------------
class VariantEquivalence : public boost::static_visitor<bool>
{
public:
    template <typename T, typename U>
    bool operator()(const T&, const U&) const {return false;}

    template <typename T>
    bool operator()(const T& lhs, const T& rhs) const {return lhs == rhs;}

    bool operator()(Int lhs, UInt rhs) const
    {
        return (lhs >= 0) && (static_cast<UInt>(lhs) == rhs);
    }

    bool operator()(UInt lhs, Int rhs) const {return (*this)(rhs, lhs);}

    bool operator()(Int lhs, Real rhs) const
    {
        return static_cast<Real>(lhs) == rhs;
    }

    bool operator()(Real lhs, Int rhs) const {return (*this)(rhs, lhs);}

    bool operator()(UInt lhs, Real rhs) const
    {
        return static_cast<Real>(lhs) == rhs;
    }

    bool operator()(Real lhs, UInt rhs) const {return (*this)(rhs, lhs);}
};

//------------------------------------------------------------------------------
inline void outputJsonString(std::ostream& out, const String& s)
{
    out << '"';
    for (char c: s)
    {
        switch (c)
        {
        case '"':  out << "\\\""; break;
        case '\\': out << "\\\\"; break;
        case '\b': out << "\\b";  break;
        case '\f': out << "\\f";  break;
        case '\n': out << "\\n";  break;
        case '\r': out << "\\r";  break;
        case '\t': out << "\\t";  break;
        default:
            if (static_cast<unsigned char>(c) < 0x20)
            {
                char buf[8];
                std::snprintf(buf, sizeof(buf), "\\u%04x",
                              static_cast<unsigned>(c));
                out << buf;
            }
            else
            {
                out << c;
            }
        }
    }
    out << '"';
}

//------------------------------------------------------------------------------
class VariantOutput : public boost::static_visitor<>
{
public:
    explicit VariantOutput(std::ostream& out) : out_(out) {}

    void operator()(Null) const           {out_ << "null";}
    void operator()(Bool b) const         {out_ << (b ? "true" : "false");}
    void operator()(Int n) const          {out_ << n;}
    void operator()(UInt n) const         {out_ << n;}
    void operator()(const String& s) const {outputJsonString(out_, s);}
    void operator()(const Array& a) const {out_ << a;}
    void operator()(const Object& o) const {out_ << o;}

    void operator()(Real x) const
    {
        auto precision = out_.precision();
        out_.precision(std::numeric_limits<Real>::digits10 + 1);
        out_ << x;
        out_.precision(precision);
    }

private:
    std::ostream& out_;
};

} // namespace internal


//------------------------------------------------------------------------------
WAMPCORE_INLINE const std::string& typeIdLabel(TypeId id)
{
    static const std::string labels[] =
    {
        "Null", "Bool", "Int", "UInt", "Real", "String", "Array", "Object"
    };
    return labels[static_cast<unsigned>(id)];
}

//------------------------------------------------------------------------------
WAMPCORE_INLINE bool Variant::isNumber() const
{
    auto t = typeId();
    return t == TypeId::integer || t == TypeId::uint || t == TypeId::real;
}

//------------------------------------------------------------------------------
WAMPCORE_INLINE bool Variant::isInteger() const
{
    auto t = typeId();
    return t == TypeId::integer || t == TypeId::uint;
}

//------------------------------------------------------------------------------
WAMPCORE_INLINE Variant::SizeType Variant::size() const
{
    switch (typeId())
    {
    case TypeId::null:   return 0;
    case TypeId::array:  return as<Array>().size();
    case TypeId::object: return as<Object>().size();
    default:             return 1;
    }
}

//------------------------------------------------------------------------------
WAMPCORE_INLINE bool Variant::equals(const Variant& other) const
{
    return boost::apply_visitor(internal::VariantEquivalence(), value_,
                                other.value_);
}

//------------------------------------------------------------------------------
WAMPCORE_INLINE std::ostream& operator<<(std::ostream& out, const Variant& v)
{
    v.visit(internal::VariantOutput(out));
    return out;
}

//------------------------------------------------------------------------------
WAMPCORE_INLINE std::ostream& operator<<(std::ostream& out, const Array& a)
{
    out << '[';
    const char* sep = "";
    for (const auto& elem: a)
    {
        out << sep << elem;
        sep = ",";
    }
    return out << ']';
}

//------------------------------------------------------------------------------
WAMPCORE_INLINE std::ostream& operator<<(std::ostream& out, const Object& o)
{
    out << '{';
    const char* sep = "";
    for (const auto& kv: o)
    {
        out << sep;
        internal::outputJsonString(out, kv.first);
        out << ':' << kv.second;
        sep = ",";
    }
    return out << '}';
}

//------------------------------------------------------------------------------
WAMPCORE_INLINE std::string toString(const Variant& v)
{
    std::ostringstream oss;
    oss << v;
    return oss.str();
}

} // namespace wampcore
