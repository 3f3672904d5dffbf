#pragma once

#include <treeish/error.hpp>
#include <utility>
#include <variant>

namespace treeish {

template<typename T>
class Result {
    std::variant<T, TreeishError> data_;

    explicit Result(T val) : data_(std::move(val)) {}

public:
    // Implicit from TreeishError so TREEISH_TRY can forward errors across Result<T> types
    Result(TreeishError err) : data_(std::move(err)) {}
    static Result ok(T val) { return Result(std::move(val)); }
    static Result err(TreeishError e) { return Result(std::move(e)); }

    bool is_ok() const { return std::holds_alternative<T>(data_); }
    bool is_err() const { return std::holds_alternative<TreeishError>(data_); }

    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    TreeishError& error() & { return std::get<TreeishError>(data_); }
    const TreeishError& error() const& { return std::get<TreeishError>(data_); }
    TreeishError&& error() && { return std::get<TreeishError>(std::move(data_)); }

    explicit operator bool() const { return is_ok(); }

    // Consuming map: the value is moved into f.
    template<typename F>
    auto map(F&& f) && -> Result<decltype(f(std::declval<T&&>()))> {
        using U = decltype(f(std::declval<T&&>()));
        if (is_ok()) {
            return Result<U>::ok(f(std::move(*this).value()));
        }
        return Result<U>::err(std::move(*this).error());
    }

    // Consuming and_then: f returns a Result of its own.
    template<typename F>
    auto and_then(F&& f) && -> decltype(f(std::declval<T&&>())) {
        if (is_ok()) {
            return f(std::move(*this).value());
        }
        using RetType = decltype(f(std::declval<T&&>()));
        return RetType::err(std::move(*this).error());
    }

    template<typename F>
    Result or_else(F&& f) && {
        if (is_ok()) {
            return std::move(*this);
        }
        return f(std::move(*this).error());
    }

    // Attach the expression a failure came from, keeping anything already set.
    Result with_expression(const std::string& expression) && {
        if (is_err() && error().expression.empty()) {
            error().expression = expression;
        }
        return std::move(*this);
    }
};

using Status = Result<std::monostate>;

inline Status ok_status() {
    return Status::ok(std::monostate{});
}

#define TREEISH_TRY(expr) \
    do { \
        auto _treeish_result = (expr); \
        if (_treeish_result.is_err()) return std::move(_treeish_result).error(); \
    } while(0)

} // namespace treeish
