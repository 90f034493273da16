#pragma once

#include "unitsync/core/error.hpp"

#include <optional>
#include <utility>
#include <variant>

namespace unitsync {

// Tag wrappers; they keep Result(T) and Result(E) apart even when T and E coincide
template<typename T>
struct OkValue {
    T value;
    explicit OkValue(T v) : value(std::move(v)) {}
};

template<typename E>
struct ErrValue {
    E error;
    explicit ErrValue(E e) : error(std::move(e)) {}
};

/**
 * @brief Value or Error, returned by every fallible operation in unitsync
 */
template<typename T, typename E = Error>
class Result {
public:
    Result(OkValue<T> ok) : data_(std::in_place_index<0>, std::move(ok.value)) {}
    Result(ErrValue<E> err) : data_(std::in_place_index<1>, std::move(err.error)) {}

    bool is_ok() const { return data_.index() == 0; }
    bool is_error() const { return data_.index() == 1; }

    T& value() { return std::get<0>(data_); }
    const T& value() const { return std::get<0>(data_); }

    E& error() { return std::get<1>(data_); }
    const E& error() const { return std::get<1>(data_); }

    T value_or(T fallback) const { return is_ok() ? value() : std::move(fallback); }

    /// Forward the error of a failed result into a result of another value type
    template<typename U>
    Result<U, E> forward_error() const { return Result<U, E>(ErrValue<E>(error())); }

private:
    std::variant<T, E> data_;
};

template<typename E>
class Result<void, E> {
public:
    Result() = default;
    Result(ErrValue<E> err) : error_(std::move(err.error)) {}

    bool is_ok() const { return !error_; }
    bool is_error() const { return error_.has_value(); }

    const E& error() const { return *error_; }

    template<typename U>
    Result<U, E> forward_error() const { return Result<U, E>(ErrValue<E>(*error_)); }

private:
    std::optional<E> error_;
};

template<typename T, typename E = Error>
Result<T, E> Ok(T value) { return Result<T, E>(OkValue<T>(std::move(value))); }

template<typename E = Error>
Result<void, E> Ok() { return Result<void, E>(); }

template<typename T, typename E = Error>
Result<T, E> Err(E error) { return Result<T, E>(ErrValue<E>(std::move(error))); }

/// Build an Error in place and fail with it
template<typename T>
Result<T> Fail(ErrorKind kind, std::string unit, std::string message, std::error_code cause = {}) {
    return Err<T>(Error(kind, std::move(unit), std::move(message), cause));
}

} // namespace unitsync
