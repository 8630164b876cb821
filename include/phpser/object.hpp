#pragma once

/// @file object.hpp
/// @brief Object consumer: projects an O: node into a destination record.
///
/// Wire layout:
///   O:<len>:"<class>":<count>:{<key><value>...}
///
/// The class name is consumed and ignored. Each key is an s: node; the
/// value is either a scalar (decoded by consume_next() and written with
/// numeric widening) or a nested O: node (decoded recursively into the
/// matching nested record). Keys with no matching field are decoded into
/// a DiscardSink so the cursor stays in step with the wire data.

#include "config.hpp"
#include "consume.hpp"
#include "decode_options.hpp"
#include "detail/scanner.hpp"
#include "detail/text.hpp"
#include "error.hpp"
#include "record.hpp"

#include <cstddef>
#include <string_view>
#include <type_traits>
#include <utility>

namespace phpser {
namespace detail {

/// @param depth  Number of enclosing O: nodes.
inline consumed<void> consume_object_at(std::string_view data, size_t offset,
                                        RecordRef destination,
                                        const DecodeOptions& opts, size_t depth) {
    if (auto code = check_tag(data, 'O', offset); code != errc::ok)
        return failure<void>(code, offset);

    const size_t max_depth = opts.max_depth > 0 ? opts.max_depth : PHPSER_MAX_DEPTH;
    if (PHPSER_UNLIKELY(depth >= max_depth))
        return failure<void>(errc::max_depth_exceeded, offset);

    // The class name has the same framing as a string payload; it is read
    // only to find where it ends.
    auto class_name = consume_length_prefixed(data, offset + 2, ':', opts);
    if (PHPSER_UNLIKELY(!class_name)) return propagate<void>(class_name);

    auto count = read_count(data, class_name.offset);
    if (PHPSER_UNLIKELY(!count)) return propagate<void>(count);

    size_t pos = count.offset;
    if (auto code = expect_byte(data, pos, '{'); code != errc::ok)
        return failure<void>(code, pos);
    ++pos;

    for (size_t i = 0; i < count.value; ++i) {
        if (PHPSER_UNLIKELY(pos >= data.size()))
            return failure<void>(errc::unexpected_end_of_input, pos);
        if (PHPSER_UNLIKELY(data[pos] != 's'))
            return failure<void>(errc::invalid_key, pos);

        auto key = consume_text(data, pos, opts);
        if (PHPSER_UNLIKELY(!key)) return propagate<void>(key);
        pos = key.offset;

        const FieldSlot slot = destination.lookup(upper_case_first(key.value));

        if (PHPSER_UNLIKELY(pos >= data.size()))
            return failure<void>(errc::corrupt_stream, pos);

        if (data[pos] == 'O') {
            consumed<void> nested;
            if (!slot.matched()) {
                DiscardSink sink;
                nested = consume_object_at(data, pos, make_record_ref(sink), opts, depth + 1);
            } else if (slot.kind() == SlotKind::record) {
                nested = consume_object_at(data, pos, slot.as_record(), opts, depth + 1);
            } else {
                return failure<void>(errc::field_type_mismatch, pos);
            }
            if (PHPSER_UNLIKELY(!nested)) return nested;
            pos = nested.offset;
        } else {
            auto value = consume_next(data, pos, opts);
            if (PHPSER_UNLIKELY(!value)) return propagate<void>(value);
            if (errc code = assign_slot(slot, std::move(value.value)); code != errc::ok)
                return failure<void>(code, pos);
            pos = value.offset;
        }
    }

    if (auto code = expect_byte(data, pos, '}'); code != errc::ok)
        return failure<void>(code, pos);
    // +1 skips the '}'
    return success(pos + 1);
}

} // namespace detail

/// @brief Decode the O: node at @p offset into @p destination.
///
/// Partial writes made before a failure are kept; treat the destination
/// as unspecified when the result carries an error.
inline consumed<void> consume_object(std::string_view data, size_t offset,
                                     RecordRef destination,
                                     const DecodeOptions& opts = {}) {
    return detail::consume_object_at(data, offset, destination, opts, 0);
}

/// @brief Decode the O: node at @p offset into a PHPSER_DEFINE_RECORD type.
template <typename T, typename = std::enable_if_t<detail::is_record<T>::value>>
consumed<void> consume_object(std::string_view data, size_t offset, T& destination,
                              const DecodeOptions& opts = {}) {
    return consume_object(data, offset, make_record_ref(destination), opts);
}

} // namespace phpser
