#pragma once

#include <stacy/error.hpp>
#include <variant>
#include <functional>

namespace stacy {

template<typename T>
class Result {
    std::variant<T, StacyError> data_;

    explicit Result(T val) : data_(std::move(val)) {}

public:
    // Implicit from StacyError so STACY_TRY can return errors across Result<T> types
    Result(StacyError err) : data_(std::move(err)) {}
    static Result ok(T val) { return Result(std::move(val)); }
    static Result err(StacyError e) { return Result(std::move(e)); }

    bool is_ok() const { return std::holds_alternative<T>(data_); }
    bool is_err() const { return std::holds_alternative<StacyError>(data_); }

    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    StacyError& error() & { return std::get<StacyError>(data_); }
    const StacyError& error() const& { return std::get<StacyError>(data_); }
    StacyError&& error() && { return std::get<StacyError>(std::move(data_)); }

    explicit operator bool() const { return is_ok(); }

    // Value or a fallback when this holds an error
    T value_or(T fallback) const& {
        if (is_ok()) return value();
        return fallback;
    }

    // Prefix the error message with what was being attempted
    Result context(const std::string& what) && {
        if (is_err()) {
            StacyError e = std::get<StacyError>(std::move(data_));
            e.message = what + ": " + e.message;
            return Result(std::move(e));
        }
        return std::move(*this);
    }

    // Rewrite the error, e.g. to name the package it concerns
    template<typename F>
    Result map_err(F&& f) && {
        if (is_err()) return Result(f(std::get<StacyError>(std::move(data_))));
        return std::move(*this);
    }

    template<typename F>
    auto map(F&& f) -> Result<decltype(f(std::declval<T&>()))> {
        using U = decltype(f(std::declval<T&>()));
        if (is_ok()) {
            return Result<U>::ok(f(value()));
        }
        return Result<U>::err(error());
    }

    template<typename F>
    auto and_then(F&& f) -> decltype(f(std::declval<T&>())) {
        if (is_ok()) {
            return f(value());
        }
        using RetType = decltype(f(std::declval<T&>()));
        return RetType::err(error());
    }

    template<typename F>
    Result or_else(F&& f) {
        if (is_ok()) {
            return *this;
        }
        return f(error());
    }
};

using Status = Result<std::monostate>;

inline Status ok_status() {
    return Status::ok(std::monostate{});
}

#define STACY_TRY(expr) \
    do { \
        auto _stacy_result = (expr); \
        if (_stacy_result.is_err()) return std::move(_stacy_result).error(); \
    } while(0)

} // namespace stacy
