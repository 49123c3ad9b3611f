#pragma once

#include <pkglint/error.hpp>
#include <variant>
#include <utility>

namespace pkglint {

template<typename T>
class Result {
    std::variant<T, LintError> data_;

    explicit Result(T val) : data_(std::move(val)) {}

public:
    // Implicit from LintError so PKGLINT_TRY can forward errors between Result<T> types
    Result(LintError err) : data_(std::move(err)) {}
    static Result ok(T val) { return Result(std::move(val)); }
    static Result err(LintError e) { return Result(std::move(e)); }

    bool is_ok() const { return std::holds_alternative<T>(data_); }
    bool is_err() const { return std::holds_alternative<LintError>(data_); }

    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    LintError& error() & { return std::get<LintError>(data_); }
    const LintError& error() const& { return std::get<LintError>(data_); }
    LintError&& error() && { return std::get<LintError>(std::move(data_)); }

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

    // Attach context to an error without changing its code
    Result with_file(const std::string& path) && {
        if (is_err() && error().file.empty()) {
            error().file = path;
        }
        return std::move(*this);
    }
};

using Status = Result<std::monostate>;

inline Status ok_status() {
    return Status::ok(std::monostate{});
}

#define PKGLINT_TRY(expr) \
    do { \
        auto _pkglint_result = (expr); \
        if (_pkglint_result.is_err()) return std::move(_pkglint_result).error(); \
    } while(0)

} // namespace pkglint
