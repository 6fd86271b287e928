#pragma once

#include <sexpr/error.hpp>
#include <variant>
#include <functional>

namespace sexpr {

template<typename T>
class Result {
    std::variant<T, SexprError> data_;

    explicit Result(T val) : data_(std::move(val)) {}

public:
    // Implicit from SexprError so SEXPR_TRY can forward errors across Result<T> types
    Result(SexprError err) : data_(std::move(err)) {}
    static Result ok(T val) { return Result(std::move(val)); }
    static Result err(SexprError e) { return Result(std::move(e)); }

    bool is_ok() const { return std::holds_alternative<T>(data_); }
    bool is_err() const { return std::holds_alternative<SexprError>(data_); }

    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    SexprError& error() & { return std::get<SexprError>(data_); }
    const SexprError& error() const& { return std::get<SexprError>(data_); }
    SexprError&& error() && { return std::get<SexprError>(std::move(data_)); }

    explicit operator bool() const { return is_ok(); }

    T value_or(T fallback) const& {
        return is_ok() ? std::get<T>(data_) : std::move(fallback);
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

#define SEXPR_TRY(expr) \
    do { \
        auto _sexpr_result = (expr); \
        if (_sexpr_result.is_err()) return std::move(_sexpr_result).error(); \
    } while(0)

} // namespace sexpr
