#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

#include "error.hpp"

namespace components::base {

    /// Success value or error_t. The core reports every expected failure through this type.
    template<class T>
    class result_t {
    public:
        result_t(const T& value)
            : data_(std::in_place_index<0>, value) {}
        result_t(T&& value)
            : data_(std::in_place_index<0>, std::move(value)) {}
        result_t(const error_t& error)
            : data_(std::in_place_index<1>, error) {}
        result_t(error_t&& error)
            : data_(std::in_place_index<1>, std::move(error)) {}

        bool is_ok() const noexcept { return data_.index() == 0; }
        bool is_error() const noexcept { return data_.index() == 1; }
        explicit operator bool() const noexcept { return is_ok(); }

        T& value() & { return std::get<0>(data_); }
        const T& value() const& { return std::get<0>(data_); }
        T&& value() && { return std::get<0>(std::move(data_)); }

        const error_t& error() const { return std::get<1>(data_); }
        error_code_t error_code() const { return std::get<1>(data_).type; }

    private:
        std::variant<T, error_t> data_;
    };

    template<>
    class result_t<void> {
    public:
        result_t() = default;
        result_t(const error_t& error)
            : error_(error) {}
        result_t(error_t&& error)
            : error_(std::move(error)) {}

        bool is_ok() const noexcept { return !error_.has_value(); }
        bool is_error() const noexcept { return error_.has_value(); }
        explicit operator bool() const noexcept { return is_ok(); }

        const error_t& error() const { return *error_; }
        error_code_t error_code() const { return error_->type; }

    private:
        std::optional<error_t> error_;
    };

    inline result_t<void> success() { return {}; }

    inline error_t make_error(error_code_t type, const std::string& what = std::string()) {
        return error_t(type, what);
    }

    /// Thrown by the raising twins of the result-returning operations.
    class raised_error_t final : public std::runtime_error {
    public:
        raised_error_t(std::string_view where, const error_t& error)
            : std::runtime_error(std::string(where) + " returned " + to_string(error))
            , error_(error) {}

        const error_t& error() const noexcept { return error_; }
        error_code_t type() const noexcept { return error_.type; }

    private:
        error_t error_;
    };

    template<class T>
    T unwrap_or_throw(result_t<T>&& result, std::string_view where) {
        if (result.is_error()) {
            throw raised_error_t(where, result.error());
        }
        return std::move(result).value();
    }

    inline void unwrap_or_throw(result_t<void>&& result, std::string_view where) {
        if (result.is_error()) {
            throw raised_error_t(where, result.error());
        }
    }

} // namespace components::base
