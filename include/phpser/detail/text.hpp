#pragma once

/// @file text.hpp
/// @brief Payload-to-text decoding and key normalization.

#include "../decode_options.hpp"
#include "utf8.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace phpser::detail {

/// @brief Turn an already length-sliced payload into text.
/// @return Empty optional when the bytes are invalid for @p encoding.
inline std::optional<std::string> decode_text(std::string_view bytes,
                                              TextEncoding encoding) {
    switch (encoding) {
        case TextEncoding::utf8:
            if (!utf8::is_valid(bytes)) return std::nullopt;
            return std::string(bytes);
        case TextEncoding::latin1: {
            std::string out;
            out.reserve(bytes.size() * 2);
            for (char c : bytes)
                utf8::append_latin1(static_cast<unsigned char>(c), out);
            return out;
        }
        case TextEncoding::raw:
            break;
    }
    return std::string(bytes);
}

inline char ascii_upper(char c) noexcept {
    return (c >= 'a' && c <= 'z') ? static_cast<char>(c - 'a' + 'A') : c;
}

/// @brief Field-name form of a key: first ASCII letter upper-cased.
inline std::string upper_case_first(std::string_view key) {
    std::string out(key);
    if (!out.empty()) out[0] = ascii_upper(out[0]);
    return out;
}

/// @brief Compare a wire key with a declared field name, both normalized.
inline bool field_name_matches(std::string_view key, std::string_view field) noexcept {
    if (key.size() != field.size()) return false;
    if (key.empty()) return true;
    if (ascii_upper(key[0]) != ascii_upper(field[0])) return false;
    return key.substr(1) == field.substr(1);
}

} // namespace phpser::detail
