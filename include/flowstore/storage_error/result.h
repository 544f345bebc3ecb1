// include/flowstore/storage_error/result.h
#pragma once

#include "storage_error.h"
#include <optional>
#include <stdexcept> // For std::logic_error in value()
#include <utility>

namespace flowstore {
namespace storage {

/**
 * @brief Result type that can contain either a value or an error
 */
template<typename T>
class Result {
private:
    std::optional<T> value_;
    std::optional<StorageError> error_;

public:
    Result(T val) : value_(std::move(val)) {}
    Result(StorageError err) : error_(std::move(err)) {}

    Result(const Result&) = default;
    Result(Result&&) = default;
    Result& operator=(const Result&) = default;
    Result& operator=(Result&&) = default;

    bool hasValue() const { return value_.has_value(); }
    bool hasError() const { return error_.has_value(); }
    bool isOk() const { return hasValue(); }
    explicit operator bool() const { return isOk(); }

    const T& value() const& {
        if (!hasValue()) throw std::logic_error("Result has no value: " + error_->toString());
        return *value_;
    }
    T& value() & {
        if (!hasValue()) throw std::logic_error("Result has no value: " + error_->toString());
        return *value_;
    }
    T&& value() && {
        if (!hasValue()) throw std::logic_error("Result has no value: " + error_->toString());
        return std::move(*value_);
    }

    const T* operator->() const { return &value(); }
    T* operator->() { return &value(); }
    const T& operator*() const& { return value(); }
    T& operator*() & { return value(); }

    const StorageError& error() const& {
        if (!hasError()) throw std::logic_error("Result has no error");
        return *error_;
    }
    StorageError& error() & {
        if (!hasError()) throw std::logic_error("Result has no error");
        return *error_;
    }
    StorageError&& error() && {
        if (!hasError()) throw std::logic_error("Result has no error");
        return std::move(*error_);
    }

    T valueOr(T default_value) const& {
        return hasValue() ? *value_ : std::move(default_value);
    }

    // Map: if Ok, applies func to value; if Error, propagates error
    template<typename F>
    auto map(F&& func) const& -> Result<decltype(func(std::declval<const T&>()))> {
        using U = decltype(func(std::declval<const T&>()));
        if (hasValue()) {
            return Result<U>(func(*value_));
        }
        return Result<U>(*error_);
    }
};

// Specialization for operations that produce no value
template<>
class Result<void> {
private:
    std::optional<StorageError> error_;

public:
    Result() = default;
    Result(StorageError err) : error_(std::move(err)) {}

    bool hasError() const { return error_.has_value(); }
    bool isOk() const { return !hasError(); }
    explicit operator bool() const { return isOk(); }

    const StorageError& error() const& {
        if (!hasError()) throw std::logic_error("Result<void> has no error");
        return *error_;
    }
    StorageError&& error() && {
        if (!hasError()) throw std::logic_error("Result<void> has no error");
        return std::move(*error_);
    }
};

using Status = Result<void>;

} // namespace storage
} // namespace flowstore
