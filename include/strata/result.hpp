#pragma once

#include <strata/error.hpp>
#include <variant>
#include <utility>

namespace strata {

template<typename T>
class Result {
    std::variant<T, StrataError> data_;

    explicit Result(T val) : data_(std::move(val)) {}

public:
    // Implicit from StrataError so STRATA_TRY can return errors across Result<T> types
    Result(StrataError err) : data_(std::move(err)) {}
    static Result ok(T val) { return Result(std::move(val)); }
    static Result err(StrataError e) { return Result(std::move(e)); }

    bool is_ok() const { return std::holds_alternative<T>(data_); }
    bool is_err() const { return std::holds_alternative<StrataError>(data_); }

    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    StrataError& error() & { return std::get<StrataError>(data_); }
    const StrataError& error() const& { return std::get<StrataError>(data_); }
    StrataError&& error() && { return std::get<StrataError>(std::move(data_)); }

    explicit operator bool() const { return is_ok(); }

    // Attach context to the error, pass values through untouched
    Result with_context(const std::string& what) && {
        if (is_err()) {
            std::get<StrataError>(data_).context(what);
        }
        return std::move(*this);
    }
};

using Status = Result<std::monostate>;

inline Status ok_status() {
    return Status::ok(std::monostate{});
}

#define STRATA_TRY(expr) \
    do { \
        auto _strata_result = (expr); \
        if (_strata_result.is_err()) return std::move(_strata_result).error(); \
    } while(0)

} // namespace strata
