#pragma once

#include <restorenom/error.hpp>
#include <variant>

namespace restorenom {

template<typename T>
class Result {
    std::variant<T, RestoreError> data_;

    explicit Result(T val) : data_(std::move(val)) {}

public:
    // Implicit from RestoreError so RESTORENOM_TRY can forward errors between Result<T> types
    Result(RestoreError err) : data_(std::move(err)) {}
    static Result ok(T val) { return Result(std::move(val)); }
    static Result err(RestoreError e) { return Result(std::move(e)); }

    bool is_ok() const { return std::holds_alternative<T>(data_); }
    bool is_err() const { return std::holds_alternative<RestoreError>(data_); }

    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    RestoreError& error() & { return std::get<RestoreError>(data_); }
    const RestoreError& error() const& { return std::get<RestoreError>(data_); }
    RestoreError&& error() && { return std::get<RestoreError>(std::move(data_)); }

    explicit operator bool() const { return is_ok(); }
};

// Returns the error of a failed Result from the enclosing function. Binds by
// reference, so a named result is checked in place and keeps its value.
#define RESTORENOM_TRY(expr) \
    do { \
        auto&& _restorenom_result = (expr); \
        if (_restorenom_result.is_err()) return std::move(_restorenom_result).error(); \
    } while(0)

} // namespace restorenom
