#pragma once

/// @file phpser.hpp
/// @brief Main header file for the phpser library.
///
/// Decodes the output of PHP's serialize(). Two layers:
///   - consume_*(): cursor-threading consumers returning consumed<T>
///     (consume.hpp, object.hpp, array.hpp)
///   - decode() / decode_object(): whole-buffer entry points that throw
///     DecodeError, with try_* variants returning std::error_code
///
/// @code
///   struct Person { std::string Name; int Age = 0; };
///   PHPSER_DEFINE_RECORD(Person, Name, Age)
///
///   Person p;
///   phpser::decode_object(R"(O:6:"Person":2:{s:4:"Name";s:3:"Bob";s:3:"Age";i:30;})", p);
///   phpser::Value v = phpser::decode("d:3.5;");
/// @endcode

#include "config.hpp"
#include "fwd.hpp"
#include "error.hpp"
#include "value.hpp"
#include "decode_options.hpp"
#include "consume.hpp"
#include "record.hpp"
#include "object.hpp"
#include "array.hpp"

#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>

namespace phpser {
namespace detail {

/// A top-level node must cover the whole input unless the options say
/// otherwise.
template <typename T>
consumed<T> check_trailing(consumed<T>&& r, std::string_view input,
                           const DecodeOptions& opts) {
    if (r && !opts.allow_trailing_content && r.offset != input.size()) {
        const size_t at = r.offset;
        return failure<T>(errc::trailing_content, at);
    }
    return std::move(r);
}

inline consumed<Value> decode_value(std::string_view input, const DecodeOptions& opts) {
    return check_trailing(consume_next(input, 0, opts), input, opts);
}

inline consumed<void> decode_record(std::string_view input, RecordRef destination,
                                    const DecodeOptions& opts) {
    return check_trailing(consume_object(input, 0, destination, opts), input, opts);
}

} // namespace detail

// ─── Public decoding API ────────────────────────────────────────────────────

/// @brief Decode a buffer holding one scalar node (with exceptions).
/// @throws DecodeError on malformed input.
[[nodiscard]] inline Value decode(std::string_view input, const DecodeOptions& opts = {}) {
    auto r = detail::decode_value(input, opts);
    if (PHPSER_UNLIKELY(!r)) detail::raise(r.ec, input, r.error_offset);
    return std::move(r.value);
}

/// @brief Decode a buffer holding one scalar node (no exceptions).
[[nodiscard]] inline result<Value> try_decode(std::string_view input,
                                              const DecodeOptions& opts = {}) {
    auto r = detail::decode_value(input, opts);
    return {std::move(r.value), r.ec};
}

/// @brief Decode a buffer holding one O: node into @p destination.
/// @throws DecodeError on malformed input or a field that cannot take its value.
template <typename T, typename = std::enable_if_t<detail::is_record<T>::value>>
void decode_object(std::string_view input, T& destination, const DecodeOptions& opts = {}) {
    auto r = detail::decode_record(input, make_record_ref(destination), opts);
    if (PHPSER_UNLIKELY(!r)) detail::raise(r.ec, input, r.error_offset);
}

/// @brief Decode a buffer holding one O: node into @p destination (no exceptions).
template <typename T, typename = std::enable_if_t<detail::is_record<T>::value>>
[[nodiscard]] std::error_code try_decode_object(std::string_view input, T& destination,
                                                const DecodeOptions& opts = {}) {
    return detail::decode_record(input, make_record_ref(destination), opts).ec;
}

} // namespace phpser
