#pragma once

/// @file consume.hpp
/// @brief Scalar consumers, the text consumer and the value dispatcher.
///
/// Every consumer takes the whole buffer and the offset of its node and
/// returns consumed<T>: the decoded value plus the offset just past the
/// node, or an error code and the sentinel offset npos. Consumers never
/// read before their own offset and never throw on malformed input.

#include "config.hpp"
#include "decode_options.hpp"
#include "detail/scanner.hpp"
#include "detail/text.hpp"
#include "error.hpp"
#include "value.hpp"

#include <charconv>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace phpser {
namespace detail {

/// @brief errc::ok when the node at @p offset starts with "<tag>:".
inline errc check_tag(std::string_view data, char tag, size_t offset) noexcept {
    if (PHPSER_UNLIKELY(offset >= data.size())) return errc::unexpected_end_of_input;
    if (data[offset] != tag) return errc::unexpected_tag;
    if (PHPSER_UNLIKELY(offset + 1 >= data.size())) return errc::unexpected_end_of_input;
    if (data[offset + 1] != ':') return errc::unexpected_tag;
    return errc::ok;
}

/// @brief The literal of an i: or d: node: bytes up to the ';'.
/// Sets @p code and returns npos when the terminator is missing.
inline size_t literal_end(std::string_view data, size_t from, errc& code) noexcept {
    size_t end = find_byte(data, ';', from);
    code = end == npos ? errc::unexpected_end_of_input : errc::ok;
    return end;
}

inline bool parse_double(std::string_view text, double& out) {
    if (text.empty()) return false;
#if defined(__cpp_lib_to_chars) && __cpp_lib_to_chars >= 201611L
    auto [p, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
    return ec == std::errc{} && p == text.data() + text.size();
#else
    // strtod needs a terminated copy; it also accepts leading whitespace,
    // which the wire format never carries.
    if (text.front() == ' ' || text.front() == '\t') return false;
    std::string buf(text);
    char* end_ptr = nullptr;
    out = std::strtod(buf.c_str(), &end_ptr);
    return end_ptr == buf.c_str() + buf.size();
#endif
}

template <typename T>
consumed<Value> to_value(consumed<T>&& r) {
    if (!r) return propagate<Value>(r);
    return success(Value(std::move(r.value)), r.offset);
}

} // namespace detail

// ─── Scalar consumers ───────────────────────────────────────────────────────

/// @brief Decode "N;".
inline consumed<std::nullptr_t> consume_null(std::string_view data, size_t offset) {
    if (PHPSER_UNLIKELY(offset >= data.size()))
        return detail::failure<std::nullptr_t>(errc::unexpected_end_of_input, offset);
    if (data[offset] != 'N')
        return detail::failure<std::nullptr_t>(errc::unexpected_tag, offset);
    if (PHPSER_UNLIKELY(offset + 1 >= data.size()))
        return detail::failure<std::nullptr_t>(errc::unexpected_end_of_input, offset);
    if (data[offset + 1] != ';')
        return detail::failure<std::nullptr_t>(errc::unexpected_tag, offset);
    return detail::success(nullptr, offset + 2);
}

/// @brief Decode "b:0;" or "b:1;".
inline consumed<bool> consume_bool(std::string_view data, size_t offset) {
    if (auto code = detail::check_tag(data, 'b', offset); code != errc::ok)
        return detail::failure<bool>(code, offset);
    if (PHPSER_UNLIKELY(data.size() - offset < 4))
        return detail::failure<bool>(errc::unexpected_end_of_input, offset);

    const char flag = data[offset + 2];
    if (PHPSER_UNLIKELY((flag != '0' && flag != '1') || data[offset + 3] != ';'))
        return detail::failure<bool>(errc::numeric_parse_error, offset + 2);
    return detail::success(flag == '1', offset + 4);
}

/// @brief Decode "i:<digits>;" as a signed 64-bit integer.
inline consumed<int64_t> consume_int(std::string_view data, size_t offset) {
    if (auto code = detail::check_tag(data, 'i', offset); code != errc::ok)
        return detail::failure<int64_t>(code, offset);

    const size_t from = offset + 2;
    errc code;
    const size_t end = detail::literal_end(data, from, code);
    if (PHPSER_UNLIKELY(code != errc::ok))
        return detail::failure<int64_t>(code, offset);

    std::string_view text = data.substr(from, end - from);
    int64_t v = 0;
    auto [p, ec] = std::from_chars(text.data(), text.data() + text.size(), v);
    if (PHPSER_UNLIKELY(text.empty() || ec != std::errc{} ||
                        p != text.data() + text.size()))
        return detail::failure<int64_t>(errc::numeric_parse_error, from);

    // +1 skips the ';'
    return detail::success(v, end + 1);
}

/// @brief Decode "d:<decimal>;" as an IEEE double.
///
/// Accepts whatever std::from_chars accepts, which covers the INF, -INF
/// and NAN spellings PHP writes for non-finite values.
inline consumed<double> consume_float(std::string_view data, size_t offset) {
    if (auto code = detail::check_tag(data, 'd', offset); code != errc::ok)
        return detail::failure<double>(code, offset);

    const size_t from = offset + 2;
    errc code;
    const size_t end = detail::literal_end(data, from, code);
    if (PHPSER_UNLIKELY(code != errc::ok))
        return detail::failure<double>(code, offset);

    double v = 0.0;
    if (PHPSER_UNLIKELY(!detail::parse_double(data.substr(from, end - from), v)))
        return detail::failure<double>(errc::numeric_parse_error, from);
    return detail::success(v, end + 1);
}

// ─── Text ───────────────────────────────────────────────────────────────────

/// @brief Decode the `<length>:"<bytes>"<terminator>` framing at @p offset.
///
/// Shared by s: nodes (terminator ';') and class-name labels (terminator
/// ':'). The payload is sliced from the raw buffer by its byte length and
/// only then decoded, so multi-byte text never shifts the cursor.
inline consumed<std::string> consume_length_prefixed(std::string_view data,
                                                     size_t offset,
                                                     char terminator,
                                                     const DecodeOptions& opts = {}) {
    auto length = detail::read_count(data, offset);
    if (PHPSER_UNLIKELY(!length))
        return detail::failure<std::string>(errc::malformed_string, offset);

    size_t pos = length.offset;
    if (PHPSER_UNLIKELY(pos >= data.size() || data[pos] != '"'))
        return detail::failure<std::string>(errc::malformed_string, pos);

    // Skip the opening '"'
    const size_t start = pos + 1;
    const size_t len = length.value;
    // Payload plus the closing '"' and the terminator must fit.
    if (PHPSER_UNLIKELY(len > data.size() - start || data.size() - start - len < 2))
        return detail::failure<std::string>(errc::malformed_string, start);
    if (PHPSER_UNLIKELY(data[start + len] != '"' || data[start + len + 1] != terminator))
        return detail::failure<std::string>(errc::malformed_string, start + len);

    auto text = detail::decode_text(data.substr(start, len), opts.encoding);
    if (PHPSER_UNLIKELY(!text))
        return detail::failure<std::string>(errc::invalid_utf8, start);

    // +2 skips the closing '"' and the terminator
    return detail::success(std::move(*text), start + len + 2);
}

/// @brief Decode "s:<length>:\"<bytes>\";".
inline consumed<std::string> consume_text(std::string_view data, size_t offset,
                                          const DecodeOptions& opts = {}) {
    if (auto code = detail::check_tag(data, 's', offset); code != errc::ok)
        return detail::failure<std::string>(code, offset);
    return consume_length_prefixed(data, offset + 2, ';', opts);
}

// ─── Value dispatcher ───────────────────────────────────────────────────────

/// @brief Decode the scalar node at @p offset, whatever its kind.
///
/// Handles N, b, i, d and s. Every other tag, arrays and objects included,
/// fails with errc::unsupported_tag.
inline consumed<Value> consume_next(std::string_view data, size_t offset,
                                    const DecodeOptions& opts = {}) {
    if (PHPSER_UNLIKELY(offset >= data.size()))
        return detail::failure<Value>(errc::corrupt_stream, offset);

    switch (data[offset]) {
        case 'b': return detail::to_value(consume_bool(data, offset));
        case 'd': return detail::to_value(consume_float(data, offset));
        case 'i': return detail::to_value(consume_int(data, offset));
        case 's': return detail::to_value(consume_text(data, offset, opts));
        case 'N': return detail::to_value(consume_null(data, offset));
        default:
            return detail::failure<Value>(errc::unsupported_tag, offset);
    }
}

} // namespace phpser
