#pragma once

#include <pepver/error.hpp>
#include <utility>
#include <variant>

namespace pepver {

// Value-or-error return type used across pepver instead of exceptions.
template<typename T>
class Result {
    std::variant<T, PepverError> data_;

    explicit Result(T val) : data_(std::move(val)) {}

public:
    // Implicit from PepverError so PEPVER_TRY can return errors across Result<T> types
    Result(PepverError err) : data_(std::move(err)) {}
    static Result ok(T val) { return Result(std::move(val)); }
    static Result err(PepverError e) { return Result(std::move(e)); }

    bool is_ok() const { return std::holds_alternative<T>(data_); }
    bool is_err() const { return std::holds_alternative<PepverError>(data_); }

    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    PepverError& error() & { return std::get<PepverError>(data_); }
    const PepverError& error() const& { return std::get<PepverError>(data_); }
    PepverError&& error() && { return std::get<PepverError>(std::move(data_)); }

    T value_or(T fallback) const& {
        if (is_ok()) return value();
        return fallback;
    }

    explicit operator bool() const { return is_ok(); }

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

    // Recovery hook: f receives the error and returns a replacement Result.
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

#define PEPVER_TRY(expr) \
    do { \
        auto _pepver_result = (expr); \
        if (_pepver_result.is_err()) return std::move(_pepver_result).error(); \
    } while(0)

} // namespace pepver
