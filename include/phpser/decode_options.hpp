#pragma once

/// @file decode_options.hpp
/// @brief Decoder configuration.
///
/// Available settings:
///   - How string payload bytes become text (raw, validated UTF-8, Latin-1)
///   - Object nesting depth limit
///   - Trailing bytes after a top-level node

#include <cstddef>
#include <cstdint>

namespace phpser {

/// @brief How the raw payload bytes of s: nodes and class names are decoded.
///
/// The payload is always sliced from the raw buffer by its byte length
/// first; the encoding only affects how that slice becomes a std::string.
enum class TextEncoding : uint8_t {
    raw    = 0,  ///< Bytes copied unchanged
    utf8   = 1,  ///< Bytes copied unchanged after UTF-8 validation
    latin1 = 2   ///< Each byte transcoded from ISO-8859-1 to UTF-8
};

/// @brief Decoder configuration.
struct DecodeOptions {
    /// Payload decoding for strings and class names.
    TextEncoding encoding = TextEncoding::raw;

    /// Maximum object nesting depth (0 = use PHPSER_MAX_DEPTH).
    size_t max_depth = 0;

    /// Accept bytes after the top-level node in decode()/decode_object().
    /// Consumers never look past the node they decode.
    bool allow_trailing_content = false;

    // ─── Factory methods ─────────────────────────────────────────────────

    /// Raw bytes, no trailing content.
    static constexpr DecodeOptions defaults() noexcept {
        return {};
    }

    /// Payloads must be valid UTF-8.
    static constexpr DecodeOptions strict() noexcept {
        DecodeOptions opts;
        opts.encoding = TextEncoding::utf8;
        return opts;
    }

    /// Data written by PHP installations with a Latin-1 default charset,
    /// often stored with padding after the value.
    static constexpr DecodeOptions legacy() noexcept {
        DecodeOptions opts;
        opts.encoding               = TextEncoding::latin1;
        opts.allow_trailing_content = true;
        return opts;
    }
};

} // namespace phpser
