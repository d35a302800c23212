#pragma once

#include <monolith/error.hpp>
#include <variant>
#include <functional>

namespace monolith {

// Value-or-error return type used by every fallible operation that crosses
// a file or parse boundary. Template resolution failures never use it: they
// degrade to defaults instead (see resolver.hpp).
template<typename T>
class Result {
    std::variant<T, MonolithError> data_;

    explicit Result(T val) : data_(std::move(val)) {}

public:
    // Implicit from MonolithError so MONOLITH_TRY can return errors across Result<T> types
    Result(MonolithError err) : data_(std::move(err)) {}
    static Result ok(T val) { return Result(std::move(val)); }
    static Result err(MonolithError e) { return Result(std::move(e)); }

    bool is_ok() const { return std::holds_alternative<T>(data_); }
    bool is_err() const { return std::holds_alternative<MonolithError>(data_); }

    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    MonolithError& error() & { return std::get<MonolithError>(data_); }
    const MonolithError& error() const& { return std::get<MonolithError>(data_); }
    MonolithError&& error() && { return std::get<MonolithError>(std::move(data_)); }

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
};

using Status = Result<std::monostate>;

inline Status ok_status() {
    return Status::ok(std::monostate{});
}

#define MONOLITH_TRY(expr) \
    do { \
        auto _monolith_result = (expr); \
        if (_monolith_result.is_err()) return std::move(_monolith_result).error(); \
    } while(0)

} // namespace monolith
