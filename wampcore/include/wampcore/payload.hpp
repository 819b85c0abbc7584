/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#ifndef WAMPCORE_PAYLOAD_HPP
#define WAMPCORE_PAYLOAD_HPP

//------------------------------------------------------------------------------
/** @file
    @brief Provides facilities for accessing WAMP message payloads. */
//------------------------------------------------------------------------------

#include <cstddef>
#include <utility>
#include "api.hpp"
#include "options.hpp"
#include "variant.hpp"

namespace wampcore
{

//------------------------------------------------------------------------------
/** Base class for information objects containing payload arguments and an
    options dictionary. */
//------------------------------------------------------------------------------
template <typename TDerived>
class Payload : public Options<TDerived>
{
public:
    /** Sets the positional arguments for this payload. */
    template <typename... Ts>
    TDerived& withArgs(Ts&&... args);

    /** Sets the positional arguments for this payload from
        an array of variants. */
    TDerived& withArgList(Array list);

    /** Sets the keyword arguments for this payload. */
    TDerived& withKwargs(Object dict);

    /** Determines is there are any positional or keyward arguments. */
    bool hasArgs() const {return !args_.empty() || !kwargs_.empty();}

    /** Accesses the positional arguments. */
    const Array& args() const & {return args_;}

    /** Accesses the positional arguments. */
    Array& args() & {return args_;}

    /** Moves the positional arguments. */
    Array&& args() && {return std::move(args_);}

    /** Accesses the dictionary of keyword arguments. */
    const Object& kwargs() const & {return kwargs_;}

    /** Accesses the dictionary of keyword arguments. */
    Object& kwargs() & {return kwargs_;}

    /** Moves the dictionary of keyword arguments. */
    Object&& kwargs() && {return std::move(kwargs_);}

    /** Accesses a positional argument by index.
        @throws std::out_of_range if the index is not within the range
                of this->args(). */
    Variant& operator[](std::size_t index) {return args_.at(index);}

    /** Accesses a constant positional argument by index.
        @throws std::out_of_range if the index is not within the range
                of this->args(). */
    const Variant& operator[](std::size_t index) const
    {
        return args_.at(index);
    }

    /** Accesses a keyword argument by key, inserting a null variant if
        absent. */
    Variant& operator[](const String& keyword) {return kwargs_[keyword];}

    /** Obtains a keyword argument by key, or a null variant if absent. */
    const Variant& kwargByKey(const String& key) const;

    /** Converts the payload's positional arguments to the given value
        types. */
    template <typename... Ts>
    std::size_t convertTo(Ts&... values) const;

protected:
    Payload() = default;

    explicit Payload(Object opts) : Base(std::move(opts)) {}

    Payload(Object opts, Array args, Object kwargs)
        : Base(std::move(opts)),
          args_(std::move(args)),
          kwargs_(std::move(kwargs))
    {}

private:
    using Base = Options<TDerived>;

    static void bundle(Array&) {}

    template <typename T, typename... Ts>
    static void bundle(Array& array, T&& head, Ts&&... tail)
    {
        array.emplace_back(std::forward<T>(head));
        bundle(array, std::forward<Ts>(tail)...);
    }

    static void unbundleTo(const Array&, std::size_t&) {}

    template <typename T, typename... Ts>
    static void unbundleTo(const Array& array, std::size_t& index, T& head,
                           Ts&... tail)
    {
        if (index < array.size())
        {
            head = array[index].template to<T>();
            unbundleTo(array, ++index, tail...);
        }
    }

    Array args_;
    Object kwargs_;
};


//******************************************************************************
// Payload implementation
//******************************************************************************

//------------------------------------------------------------------------------
/** Each argument is converted to a Variant using its converting
    constructor. */
//------------------------------------------------------------------------------
template <typename D>
template <typename... Ts>
D& Payload<D>::withArgs(Ts&&... args)
{
    Array array;
    array.reserve(sizeof...(Ts));
    bundle(array, std::forward<Ts>(args)...);
    args_ = std::move(array);
    return static_cast<D&>(*this);
}

//------------------------------------------------------------------------------
template <typename D>
D& Payload<D>::withArgList(Array list)
{
    args_ = std::move(list);
    return static_cast<D&>(*this);
}

//------------------------------------------------------------------------------
template <typename D>
D& Payload<D>::withKwargs(Object dict)
{
    kwargs_ = std::move(dict);
    return static_cast<D&>(*this);
}

//------------------------------------------------------------------------------
template <typename D>
const Variant& Payload<D>::kwargByKey(const String& key) const
{
    static const Variant nullVariant;
    auto iter = kwargs_.find(key);
    if (iter != kwargs_.end())
        return iter->second;
    return nullVariant;
}

//------------------------------------------------------------------------------
/** @par Example
```
Result result = ...;
std::string s;
int n = 0;
result.convertTo(s, n);
```
@return The number of elements that were converted
@post `std::min(this->args()->size(), sizeof...(Ts))` elements are converted
@throws error::Conversion if an argument cannot be converted to the
        target type. */
//------------------------------------------------------------------------------
template <typename D>
template <typename... Ts>
std::size_t Payload<D>::convertTo(Ts&... values) const
{
    std::size_t index = 0;
    unbundleTo(args_, index, values...);
    return index;
}

} // namespace wampcore

#endif // WAMPCORE_PAYLOAD_HPP
