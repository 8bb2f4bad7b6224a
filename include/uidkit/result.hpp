#pragma once

#include <uidkit/error.hpp>
#include <variant>
#include <functional>

namespace uidkit {

template<typename T>
class Result {
    std::variant<T, UidError> data_;

    explicit Result(T val) : data_(std::move(val)) {}

public:
    // Implicit from UidError so UIDKIT_TRY can return errors across Result<T> types
    Result(UidError err) : data_(std::move(err)) {}
    static Result ok(T val) { return Result(std::move(val)); }
    static Result err(UidError e) { return Result(std::move(e)); }

    bool is_ok() const { return std::holds_alternative<T>(data_); }
    bool is_err() const { return std::holds_alternative<UidError>(data_); }

    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    UidError& error() & { return std::get<UidError>(data_); }
    const UidError& error() const& { return std::get<UidError>(data_); }
    UidError&& error() && { return std::get<UidError>(std::move(data_)); }

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

#define UIDKIT_TRY(expr) \
    do { \
        auto _uidkit_result = (expr); \
        if (_uidkit_result.is_err()) return std::move(_uidkit_result).error(); \
    } while(0)

} // namespace uidkit
