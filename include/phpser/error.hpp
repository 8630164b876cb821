#pragma once

/// @file error.hpp
/// @brief Error types for phpser: std::error_code system + exceptions.
///
/// Dual error reporting:
///   - Consumers return consumed<T> carrying a phpser::errc error_code and
///     the sentinel offset npos (never throw on malformed input)
///   - The top-level decode() / decode_object() throw DecodeError
///
/// Use try_decode(input) for exception-free top-level decoding.

#include "fwd.hpp"

#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace phpser {

// =====================================================================
// Source position for decode errors
// =====================================================================

/// @brief Position in the serialized input.
struct SourceLocation {
    size_t line   = 1;  ///< Line number (1-based)
    size_t column = 1;  ///< Column number (1-based)
    size_t offset = 0;  ///< Byte offset from the beginning
};

// =====================================================================
// Error code enumeration
// =====================================================================

/// @brief phpser error codes for std::error_code integration.
enum class errc : int {
    ok = 0,

    // Framing errors (1-49)
    unexpected_tag          = 1,
    malformed_count         = 2,
    malformed_string        = 3,
    numeric_parse_error     = 4,
    corrupt_stream          = 5,
    unsupported_tag         = 6,
    unexpected_end_of_input = 7,
    invalid_utf8            = 8,
    max_depth_exceeded      = 9,
    trailing_content        = 10,

    // Record binding errors (50-79)
    invalid_key             = 50,
    field_type_mismatch     = 51,
    integer_overflow        = 52,
};

// =====================================================================
// Error category
// =====================================================================

namespace detail {

class phpser_error_category_impl : public std::error_category {
public:
    const char* name() const noexcept override {
        return "phpser";
    }

    std::string message(int ev) const override {
        switch (static_cast<errc>(ev)) {
            case errc::ok:                      return "success";
            case errc::unexpected_tag:          return "unexpected type tag";
            case errc::malformed_count:         return "malformed count field";
            case errc::malformed_string:        return "malformed string";
            case errc::numeric_parse_error:     return "invalid numeric literal";
            case errc::corrupt_stream:          return "cursor past end of stream";
            case errc::unsupported_tag:         return "unsupported type tag";
            case errc::unexpected_end_of_input: return "unexpected end of input";
            case errc::invalid_utf8:            return "invalid UTF-8 encoding";
            case errc::max_depth_exceeded:      return "maximum nesting depth exceeded";
            case errc::trailing_content:        return "trailing content after value";
            case errc::invalid_key:             return "object key is not a string";
            case errc::field_type_mismatch:     return "value not assignable to field";
            case errc::integer_overflow:        return "integer out of range for field";
            default:                            return "unknown phpser error";
        }
    }
};

} // namespace detail

/// @brief Get the phpser error category singleton.
inline const std::error_category& phpser_category() noexcept {
    static const detail::phpser_error_category_impl instance;
    return instance;
}

/// @brief Create an error_code from phpser::errc.
inline std::error_code make_error_code(errc e) noexcept {
    return {static_cast<int>(e), phpser_category()};
}

/// @brief Create an error_condition from phpser::errc.
inline std::error_condition make_error_condition(errc e) noexcept {
    return {static_cast<int>(e), phpser_category()};
}

// =====================================================================
// Exception types
// =====================================================================

/// @brief Decode error with source position information.
class DecodeError : public std::system_error {
public:
    DecodeError(const std::string& message, SourceLocation loc, errc code)
        : std::system_error(make_error_code(code), format_message(message, loc))
        , location_(loc) {}

    /// @brief Error position in the serialized input.
    [[nodiscard]] const SourceLocation& location() const noexcept {
        return location_;
    }

private:
    static std::string format_message(const std::string& msg,
                                      const SourceLocation& loc) {
        return "PHP unserialize error at offset " + std::to_string(loc.offset) +
               " (line " + std::to_string(loc.line) +
               ", column " + std::to_string(loc.column) + "): " + msg;
    }

    SourceLocation location_;
};

/// @brief Type mismatch error when accessing a Value.
class TypeError : public std::system_error {
public:
    explicit TypeError(const std::string& msg)
        : std::system_error(make_error_code(errc::field_type_mismatch), msg) {}
};

// =====================================================================
// Result types for exception-free operations
// =====================================================================

/// @brief Simple result type: value + error_code.
/// Usage: auto [val, ec] = phpser::try_decode(input);
template <typename T>
struct result {
    T value;
    std::error_code ec;

    explicit operator bool() const noexcept { return !ec; }
    bool has_value() const noexcept { return !ec; }
};

/// @brief Outcome of one consumer call.
///
/// On success `offset` is the position just past the consumed node. On
/// failure `offset` is npos, `ec` names the failure and `error_offset` is
/// where the consumer stopped.
template <typename T>
struct consumed {
    T value{};
    size_t offset = npos;
    std::error_code ec;
    size_t error_offset = 0;

    explicit operator bool() const noexcept { return !ec; }
    bool has_value() const noexcept { return !ec; }
};

/// @brief Outcome of a consumer that only moves the cursor (objects).
template <>
struct consumed<void> {
    size_t offset = npos;
    std::error_code ec;
    size_t error_offset = 0;

    explicit operator bool() const noexcept { return !ec; }
    bool has_value() const noexcept { return !ec; }
};

namespace detail {

template <typename T>
consumed<T> success(T value, size_t offset) {
    consumed<T> r;
    r.value = std::move(value);
    r.offset = offset;
    return r;
}

inline consumed<void> success(size_t offset) noexcept {
    consumed<void> r;
    r.offset = offset;
    return r;
}

template <typename T>
consumed<T> failure(errc code, size_t at) {
    consumed<T> r;
    r.ec = make_error_code(code);
    r.error_offset = at;
    return r;
}

/// Re-wrap a failure from one consumer as the failure of another.
template <typename T, typename U>
consumed<T> propagate(const consumed<U>& inner) {
    consumed<T> r;
    r.ec = inner.ec;
    r.error_offset = inner.error_offset;
    return r;
}

/// @brief Compute line/column for a byte offset.
inline SourceLocation locate(std::string_view data, size_t offset) noexcept {
    SourceLocation loc;
    if (offset > data.size()) offset = data.size();
    loc.offset = offset;
    for (size_t i = 0; i < offset; ++i) {
        if (data[i] == '\n') { ++loc.line; loc.column = 1; }
        else { ++loc.column; }
    }
    return loc;
}

/// Longest tail quoted in an unsupported_tag message.
inline constexpr size_t kMaxQuotedTail = 64;

/// @brief Human-readable message for a failure at `at`.
/// unsupported_tag names the tag and quotes the remaining buffer tail.
inline std::string failure_message(const std::error_code& ec,
                                   std::string_view data, size_t at) {
    std::string msg = ec.message();
    if (ec == make_error_code(errc::unsupported_tag) && at < data.size()) {
        std::string_view tail = data.substr(at);
        msg += ": can not consume type '";
        msg += data[at];
        msg += "' in \"";
        if (tail.size() > kMaxQuotedTail) {
            msg.append(tail.data(), kMaxQuotedTail);
            msg += "...";
        } else {
            msg.append(tail.data(), tail.size());
        }
        msg += "\"";
    }
    return msg;
}

/// @brief Throw the DecodeError matching a failed consumer result.
[[noreturn]] inline void raise(const std::error_code& ec,
                               std::string_view data, size_t at) {
    throw DecodeError(failure_message(ec, data, at), locate(data, at),
                      static_cast<errc>(ec.value()));
}

} // namespace detail

} // namespace phpser

// Register phpser::errc as an error_code enum
namespace std {
template <>
struct is_error_code_enum<phpser::errc> : true_type {};
} // namespace std
