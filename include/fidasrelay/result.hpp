#pragma once

#include <optional>
#include <utility>

namespace fidasrelay {

// ============================================================================
// Result Type (C++20-compatible alternative to std::expected)
// ============================================================================

template<typename T, typename E>
class Result {
private:
    std::optional<T> value_;
    std::optional<E> error_;

public:
    // Success constructor
    Result(T value) : value_(std::move(value)), error_(std::nullopt) {}

    // Error constructor
    Result(E error) : value_(std::nullopt), error_(error) {}

    explicit operator bool() const { return value_.has_value(); }
    bool has_value() const { return value_.has_value(); }

    T& operator*() & { return *value_; }
    const T& operator*() const & { return *value_; }
    T&& operator*() && { return std::move(*value_); }

    T* operator->() { return &(*value_); }
    const T* operator->() const { return &(*value_); }

    T& value() & { return *value_; }
    const T& value() const & { return *value_; }
    T&& value() && { return std::move(*value_); }

    E error() const { return *error_; }
};

// Specialization for void
template<typename E>
class Result<void, E> {
private:
    std::optional<E> error_;

public:
    // Success constructor
    Result() : error_(std::nullopt) {}

    // Error constructor
    Result(E error) : error_(error) {}

    static Result ok() { return Result(); }

    explicit operator bool() const { return !error_.has_value(); }
    bool has_value() const { return !error_.has_value(); }

    E error() const { return *error_; }
};

} // namespace fidasrelay
