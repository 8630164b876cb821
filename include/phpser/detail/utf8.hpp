#pragma once

/// @file utf8.hpp
/// @brief UTF-8 helpers for string payloads.
///
///   - Latin-1 byte to UTF-8 transcoding
///   - Well-formedness check over a length-sliced payload

#include <cstddef>
#include <string>
#include <string_view>

namespace phpser::detail::utf8 {

/// @brief Append the UTF-8 form of ISO-8859-1 byte @p b.
/// Latin-1 code points equal the byte value, so at most two bytes result.
inline void append_latin1(unsigned char b, std::string& out) {
    if (b < 0x80) {
        out.push_back(static_cast<char>(b));
        return;
    }
    out.push_back(static_cast<char>(0xC0 | (b >> 6)));
    out.push_back(static_cast<char>(0x80 | (b & 0x3F)));
}

/// @brief Length of the well-formed prefix of @p bytes.
///
/// Follows the well-formed byte sequence table of the Unicode standard
/// (section 3.9): the second byte range depends on the lead byte, which
/// rules out overlong forms, surrogates and code points past U+10FFFF.
inline size_t valid_prefix(std::string_view bytes) noexcept {
    const auto* s = reinterpret_cast<const unsigned char*>(bytes.data());
    const size_t n = bytes.size();
    size_t i = 0;
    while (i < n) {
        const unsigned char lead = s[i];
        if (lead < 0x80) {
            ++i;
            continue;
        }

        size_t len = 0;
        unsigned char lo = 0x80, hi = 0xBF;
        if (lead >= 0xC2 && lead <= 0xDF) {
            len = 2;
        } else if (lead >= 0xE0 && lead <= 0xEF) {
            len = 3;
            if (lead == 0xE0) lo = 0xA0;
            else if (lead == 0xED) hi = 0x9F;
        } else if (lead >= 0xF0 && lead <= 0xF4) {
            len = 4;
            if (lead == 0xF0) lo = 0x90;
            else if (lead == 0xF4) hi = 0x8F;
        } else {
            return i;
        }

        if (len > n - i) return i;
        if (s[i + 1] < lo || s[i + 1] > hi) return i;
        for (size_t k = 2; k < len; ++k)
            if ((s[i + k] & 0xC0) != 0x80) return i;
        i += len;
    }
    return n;
}

inline bool is_valid(std::string_view bytes) noexcept {
    return valid_prefix(bytes) == bytes.size();
}

} // namespace phpser::detail::utf8
