/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#ifndef WAMPCORE_ERROROR_HPP
#define WAMPCORE_ERROROR_HPP

/** @file
    @brief Result type passed to every completion handler. */

#include <cassert>
#include <system_error>
#include <utility>
#include "api.hpp"
#include "exceptions.hpp"

namespace wampcore
{

//------------------------------------------------------------------------------
/** Tags an error code so that it initializes an ErrorOr as a failure. */
//------------------------------------------------------------------------------
class UnexpectedError
{
public:
    explicit UnexpectedError(std::error_code ec) : ec_(ec) {}

    const std::error_code& value() const {return ec_;}

    bool operator==(const UnexpectedError& rhs) const {return ec_ == rhs.ec_;}

private:
    std::error_code ec_;
};

/** Creates an UnexpectedError from any of the wampcore error enumerations.
    @relates UnexpectedError */
template <typename TErrc>
UnexpectedError makeUnexpectedError(TErrc errc)
{
    return UnexpectedError(make_error_code(errc));
}

//------------------------------------------------------------------------------
/** Holds either the outcome of an asynchronous operation or the error code
    explaining why it failed. */
//------------------------------------------------------------------------------
template <typename T>
class ErrorOr
{
public:
    using value_type = T;

    ErrorOr() = default;

    ErrorOr(T value) : value_(std::move(value)) {}

    ErrorOr(UnexpectedError unex) : ec_(unex.value()), failed_(true) {}

    ErrorOr& operator=(T value)
    {
        value_ = std::move(value);
        ec_.clear();
        failed_ = false;
        return *this;
    }

    bool has_value() const noexcept {return !failed_;}

    explicit operator bool() const noexcept {return !failed_;}

    /** @pre `this->has_value()` */
    T& operator*() {assert(!failed_); return value_;}

    /** @pre `this->has_value()` */
    const T& operator*() const {assert(!failed_); return value_;}

    T* operator->() {assert(!failed_); return &value_;}

    const T* operator->() const {assert(!failed_); return &value_;}

    /** @throws error::Failure if an error is held instead. */
    T& value() {throwIfFailed(); return value_;}

    /** @throws error::Failure if an error is held instead. */
    const T& value() const {throwIfFailed(); return value_;}

    /** @pre `!this->has_value()` */
    const std::error_code& error() const {assert(failed_); return ec_;}

    template <typename U>
    T value_or(U&& fallback) const
    {
        return failed_ ? T(std::forward<U>(fallback)) : value_;
    }

private:
    void throwIfFailed() const
    {
        if (failed_)
            throw error::Failure(ec_);
    }

    T value_ = T();
    std::error_code ec_;
    bool failed_ = false;
};

/** @relates ErrorOr */
template <typename T, typename U>
bool operator==(const ErrorOr<T>& x, const U& v)
{
    return x.has_value() && *x == v;
}

/** @relates ErrorOr */
template <typename T, typename U>
bool operator!=(const ErrorOr<T>& x, const U& v)
{
    return !(x == v);
}

/** @relates ErrorOr */
template <typename T>
bool operator==(const ErrorOr<T>& x, const UnexpectedError& e)
{
    return !x.has_value() && x.error() == e.value();
}

} // namespace wampcore

#endif // WAMPCORE_ERROROR_HPP
