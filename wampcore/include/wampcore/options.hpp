/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#ifndef WAMPCORE_OPTIONS_HPP
#define WAMPCORE_OPTIONS_HPP

#include <utility>
#include "api.hpp"
#include "errorcodes.hpp"
#include "erroror.hpp"
#include "exceptions.hpp"
#include "variant.hpp"

//------------------------------------------------------------------------------
/** @file
    @brief Provides facilities for accessing WAMP message options. */
//------------------------------------------------------------------------------

namespace wampcore
{

//------------------------------------------------------------------------------
/** Base class for information objects having an options/details
    dictionary. Setters return a reference to the derived type so that they
    can be chained. */
//------------------------------------------------------------------------------
template <typename TDerived>
class Options
{
public:
    /** Adds an option, replacing any existing one under the same key. */
    TDerived& withOption(String key, Variant value);

    /** Sets all options at once. */
    TDerived& withOptions(Object opts);

    /** Accesses the entire dictionary of options. */
    const Object& options() const & {return options_;}

    /** Accesses the entire dictionary of options. */
    Object& options() & {return options_;}

    /** Moves the entire dictionary of options. */
    Object&& options() && {return std::move(options_);}

    /** Determines if an option is already set. */
    bool hasOption(const String& key) const;

    /** Obtains an option by key, or a null variant if absent. */
    const Variant& optionByKey(const String& key) const;

    /** Obtains an option by key, converted to the given type, or a
        fallback value. */
    template <typename T, typename U>
    T optionOr(const String& key, U&& fallback) const;

    /** Obtains an option by key, converted to the given type. */
    template <typename T>
    ErrorOr<T> optionAs(const String& key) const;

protected:
    Options() = default;

    explicit Options(Object opts) : options_(std::move(opts)) {}

private:
    Object options_;
};


//******************************************************************************
// Options implementation
//******************************************************************************

//------------------------------------------------------------------------------
template <typename D>
D& Options<D>::withOption(String key, Variant value)
{
    options_[std::move(key)] = std::move(value);
    return static_cast<D&>(*this);
}

//------------------------------------------------------------------------------
template <typename D>
D& Options<D>::withOptions(Object opts)
{
    options_ = std::move(opts);
    return static_cast<D&>(*this);
}

//------------------------------------------------------------------------------
template <typename D>
bool Options<D>::hasOption(const String& key) const
{
    return options_.count(key) != 0;
}

//------------------------------------------------------------------------------
template <typename D>
const Variant& Options<D>::optionByKey(const String& key) const
{
    static const Variant nullVariant;
    auto iter = options_.find(key);
    if (iter != options_.end())
        return iter->second;
    return nullVariant;
}

//------------------------------------------------------------------------------
/** @returns The converted option value, or the fallback if the option was
             not found or cannot be converted. */
//------------------------------------------------------------------------------
template <typename D>
template <typename T, typename U>
T Options<D>::optionOr(
    const String& key, /**< The key to search under. */
    U&& fallback       /**< The fallback value to return if the key was
                            not found or cannot be converted. */
    ) const
{
    auto iter = options_.find(key);
    if (iter == options_.end())
        return std::forward<U>(fallback);
    try
    {
        return iter->second.template to<T>();
    }
    catch (const error::Conversion&)
    {
        return std::forward<U>(fallback);
    }
}

//------------------------------------------------------------------------------
/** @returns The converted option value, or an error code of either
             MiscErrc::absent or MiscErrc::badType. */
//------------------------------------------------------------------------------
template <typename D>
template <typename T>
ErrorOr<T> Options<D>::optionAs(
    const String& key /**< The key to search under. */
    ) const
{
    auto iter = options_.find(key);
    if (iter == options_.end())
        return makeUnexpectedError(MiscErrc::absent);
    try
    {
        return iter->second.template to<T>();
    }
    catch (const error::Conversion&)
    {
        return makeUnexpectedError(MiscErrc::badType);
    }
}

} // namespace wampcore

#endif // WAMPCORE_OPTIONS_HPP
