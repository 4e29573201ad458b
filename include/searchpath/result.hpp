#pragma once

#include <searchpath/error.hpp>
#include <variant>
#include <utility>

namespace searchpath {

template<typename T>
class Result {
    std::variant<T, SearchError> data_;

    explicit Result(T val) : data_(std::move(val)) {}

public:
    // Implicit from SearchError so SEARCHPATH_TRY can forward errors across Result<T> types
    Result(SearchError err) : data_(std::move(err)) {}
    static Result ok(T val) { return Result(std::move(val)); }
    static Result err(SearchError e) { return Result(std::move(e)); }

    bool is_ok() const { return std::holds_alternative<T>(data_); }
    bool is_err() const { return std::holds_alternative<SearchError>(data_); }

    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    T value_or(T fallback) const {
        return is_ok() ? std::get<T>(data_) : std::move(fallback);
    }

    SearchError& error() & { return std::get<SearchError>(data_); }
    const SearchError& error() const& { return std::get<SearchError>(data_); }
    SearchError&& error() && { return std::get<SearchError>(std::move(data_)); }

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

#define SEARCHPATH_TRY(expr) \
    do { \
        auto _sp_result = (expr); \
        if (_sp_result.is_err()) return std::move(_sp_result).error(); \
    } while(0)

} // namespace searchpath
