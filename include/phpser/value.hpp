#pragma once

/// @file value.hpp
/// @brief Value: the result of decoding one scalar node.
///
/// A closed tagged union over the kinds the value dispatcher produces:
/// null, bool, int64_t, double and string. Checked accessors throw
/// TypeError on a kind mismatch; get_or() never throws.

#include "config.hpp"
#include "error.hpp"
#include "fwd.hpp"

#include <cstdint>
#include <limits>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

namespace phpser {

class Value {
public:
    Value() noexcept : data_(std::nullptr_t{}) {}
    Value(std::nullptr_t) noexcept : data_(std::nullptr_t{}) {}
    Value(bool v) noexcept : data_(v) {}
    /// Any integral type except bool; values are stored as int64_t.
    template <typename T,
              std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, bool>, int> = 0>
    Value(T v) noexcept : data_(static_cast<int64_t>(v)) {}
    Value(double v) noexcept : data_(v) {}
    Value(const char* v) : data_(std::nullptr_t{}) {
        if (PHPSER_UNLIKELY(!v)) return;
        data_ = std::string(v);
    }
    Value(std::string_view v) : data_(std::string(v)) {}
    Value(const std::string& v) : data_(v) {}
    Value(std::string&& v) noexcept : data_(std::move(v)) {}

    [[nodiscard]] Type type() const noexcept { return static_cast<Type>(data_.index()); }
    [[nodiscard]] bool is_null()    const noexcept { return type() == Type::Null; }
    [[nodiscard]] bool is_bool()    const noexcept { return type() == Type::Bool; }
    [[nodiscard]] bool is_integer() const noexcept { return type() == Type::Integer; }
    [[nodiscard]] bool is_float()   const noexcept { return type() == Type::Float; }
    [[nodiscard]] bool is_string()  const noexcept { return type() == Type::String; }
    [[nodiscard]] bool is_number()  const noexcept { return is_integer() || is_float(); }

    bool as_bool() const {
        if (PHPSER_UNLIKELY(!is_bool()))
            throw TypeError("expected bool, got " + std::string(type_name(type())));
        return std::get<bool>(data_);
    }
    int64_t as_integer() const {
        if (PHPSER_UNLIKELY(!is_integer()))
            throw TypeError("expected integer, got " + std::string(type_name(type())));
        return std::get<int64_t>(data_);
    }
    double as_float() const {
        if (is_float()) return std::get<double>(data_);
        if (is_integer()) return static_cast<double>(std::get<int64_t>(data_));
        throw TypeError("expected number, got " + std::string(type_name(type())));
    }

    [[nodiscard]] std::string_view as_string_view() const {
        if (PHPSER_UNLIKELY(!is_string()))
            throw TypeError("expected string, got " + std::string(type_name(type())));
        return std::get<std::string>(data_);
    }
    [[nodiscard]] std::string as_string() const {
        return std::string(as_string_view());
    }

    template <typename T>
    [[nodiscard]] T get() const {
        if constexpr (std::is_same_v<T, bool>) return as_bool();
        else if constexpr (std::is_same_v<T, int64_t> || std::is_same_v<T, int> || std::is_same_v<T, long>)
            return static_cast<T>(as_integer());
        else if constexpr (std::is_same_v<T, double> || std::is_same_v<T, float>)
            return static_cast<T>(as_float());
        else if constexpr (std::is_same_v<T, std::string>) return as_string();
        else if constexpr (std::is_same_v<T, std::string_view>) return as_string_view();
        else static_assert(sizeof(T) == 0, "Unsupported type for get<T>()");
    }

    /// Type-safe value access with fallback; never throws.
    template <typename T>
    [[nodiscard]] T get_or(const T& dv) const noexcept {
        if constexpr (std::is_same_v<T, bool>) {
            return is_bool() ? std::get<bool>(data_) : dv;
        } else if constexpr (std::is_same_v<T, int64_t> || std::is_same_v<T, int> || std::is_same_v<T, long>) {
            return is_integer() ? static_cast<T>(std::get<int64_t>(data_)) : dv;
        } else if constexpr (std::is_same_v<T, double> || std::is_same_v<T, float>) {
            if (is_float()) return static_cast<T>(std::get<double>(data_));
            if (is_integer()) return static_cast<T>(std::get<int64_t>(data_));
            return dv;
        } else if constexpr (std::is_same_v<T, std::string_view>) {
            return is_string() ? std::string_view(std::get<std::string>(data_)) : dv;
        } else {
            static_assert(sizeof(T) == 0, "Unsupported type for get_or<T>()");
        }
    }

    [[nodiscard]] bool operator==(const Value& other) const {
        if (is_number() && other.is_number() && type() != other.type())
            return as_float() == other.as_float();
        return data_ == other.data_;
    }
    [[nodiscard]] bool operator!=(const Value& other) const { return !(*this == other); }

private:
    // Alternative order must match the Type enumerators.
    std::variant<std::nullptr_t, bool, int64_t, double, std::string> data_;
};

static_assert(std::variant_size_v<std::variant<std::nullptr_t, bool, int64_t, double, std::string>> ==
                  static_cast<size_t>(Type::String) + 1,
              "Value alternatives must cover every Type");

} // namespace phpser
