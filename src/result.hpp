#pragma once

#include <system_error>
#include <type_traits>
#include <utility>
#include <variant>

#include "error.hpp"

template <typename T>
struct SuccessWrapper {
    T value;
};

template <typename T = std::monostate>
SuccessWrapper<T> success()
{
    return SuccessWrapper<T> { T {} };
}

template <typename T>
SuccessWrapper<std::decay_t<T>> success(T&& t)
{
    return SuccessWrapper<std::decay_t<T>> { std::forward<T>(t) };
}

template <typename E>
struct ErrorWrapper {
    E value;
};

template <typename E>
ErrorWrapper<std::decay_t<E>> error(E&& e)
{
    return ErrorWrapper<std::decay_t<E>> { std::forward<E>(e) };
}

// Everything that can fail in footy returns one of these. The error is always a std::error_code,
// mostly from the footy category (see error.hpp).
template <typename T, typename E = std::error_code>
class Result {
public:
    Result(const T& t)
        : value_(std::in_place_index<0>, t)
    {
    }

    Result(T&& t)
        : value_(std::in_place_index<0>, std::move(t))
    {
    }

    template <typename U>
    Result(SuccessWrapper<U>&& s)
        : value_(std::in_place_index<0>, std::move(s.value))
    {
    }

    template <typename U>
    Result(ErrorWrapper<U>&& e)
        : value_(std::in_place_index<1>, E { e.value })
    {
    }

    bool hasValue() const
    {
        return value_.index() == 0;
    }

    explicit operator bool() const
    {
        return hasValue();
    }

    const T& value() const&
    {
        return std::get<0>(value_);
    }

    T& value() &
    {
        return std::get<0>(value_);
    }

    T&& value() &&
    {
        return std::get<0>(std::move(value_));
    }

    const T* operator->() const
    {
        return &std::get<0>(value_);
    }

    const E& error() const
    {
        return std::get<1>(value_);
    }

private:
    std::variant<T, E> value_;
};
