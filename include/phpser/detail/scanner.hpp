#pragma once

/// @file scanner.hpp
/// @brief Cursor scanner: delimiter search and count fields.

#include "../config.hpp"
#include "../error.hpp"
#include "../fwd.hpp"
#include "simd.hpp"

#include <charconv>
#include <cstddef>
#include <optional>
#include <string_view>
#include <system_error>
#include <utility>

namespace phpser::detail {

/// @brief Offset of the first @p byte at or after @p from, or npos.
///
/// Not finding the byte is a normal outcome, callers decide whether it
/// is an error.
inline size_t find_byte(std::string_view data, char byte, size_t from) noexcept {
    if (from >= data.size()) return npos;
    const char* end = data.data() + data.size();
    const char* hit = simd::find_byte(data.data() + from, end, byte);
    return hit == end ? npos : static_cast<size_t>(hit - data.data());
}

/// @brief The bytes in [from, next @p byte) and the offset of that byte.
///
/// Only meant for ASCII runs with a single-byte terminator (numbers,
/// counts); payloads are sliced by length instead.
inline std::optional<std::pair<std::string_view, size_t>>
read_until(std::string_view data, char byte, size_t from) noexcept {
    size_t at = find_byte(data, byte, from);
    if (at == npos) return std::nullopt;
    return std::make_pair(data.substr(from, at - from), at);
}

/// @brief Parse the decimal count at @p from, terminated by ':'.
/// @return The count and the offset just past the ':'.
inline consumed<size_t> read_count(std::string_view data, size_t from) {
    auto run = read_until(data, ':', from);
    if (PHPSER_UNLIKELY(!run || run->first.empty()))
        return failure<size_t>(errc::malformed_count, from);

    std::string_view digits = run->first;
    size_t count = 0;
    auto [p, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), count);
    if (PHPSER_UNLIKELY(ec != std::errc{} || p != digits.data() + digits.size()))
        return failure<size_t>(errc::malformed_count, from);

    return success(count, run->second + 1);
}

/// @brief errc::ok when the structural byte at @p pos is @p c.
inline errc expect_byte(std::string_view data, size_t pos, char c) noexcept {
    if (PHPSER_UNLIKELY(pos >= data.size())) return errc::unexpected_end_of_input;
    return data[pos] == c ? errc::ok : errc::unexpected_tag;
}

} // namespace phpser::detail
