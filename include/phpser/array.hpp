#pragma once

/// @file array.hpp
/// @brief Opt-in decoder for flat PHP arrays.
///
///   a:<count>:{<key><value>...}
///
/// Keys are i: or s: nodes, values are scalars. consume_next() never
/// routes here: callers that expect an array call consume_array()
/// explicitly. Nested arrays and objects fail with errc::unsupported_tag.

#include "config.hpp"
#include "consume.hpp"
#include "decode_options.hpp"
#include "detail/scanner.hpp"
#include "error.hpp"
#include "value.hpp"

#include <algorithm>
#include <cstddef>
#include <string_view>
#include <utility>
#include <vector>

namespace phpser {

/// Key/value pairs of a PHP array, in wire order.
using ArrayEntries = std::vector<std::pair<Value, Value>>;

inline consumed<ArrayEntries> consume_array(std::string_view data, size_t offset,
                                            const DecodeOptions& opts = {}) {
    if (auto code = detail::check_tag(data, 'a', offset); code != errc::ok)
        return detail::failure<ArrayEntries>(code, offset);

    auto count = detail::read_count(data, offset + 2);
    if (PHPSER_UNLIKELY(!count)) return detail::propagate<ArrayEntries>(count);

    size_t pos = count.offset;
    if (auto code = detail::expect_byte(data, pos, '{'); code != errc::ok)
        return detail::failure<ArrayEntries>(code, pos);
    ++pos;

    ArrayEntries entries;
    // The shortest pair, "i:0;N;", is 6 bytes.
    entries.reserve(std::min(count.value, (data.size() - pos) / 6));

    for (size_t i = 0; i < count.value; ++i) {
        if (PHPSER_UNLIKELY(pos >= data.size()))
            return detail::failure<ArrayEntries>(errc::unexpected_end_of_input, pos);
        if (PHPSER_UNLIKELY(data[pos] != 'i' && data[pos] != 's'))
            return detail::failure<ArrayEntries>(errc::invalid_key, pos);

        auto key = consume_next(data, pos, opts);
        if (PHPSER_UNLIKELY(!key)) return detail::propagate<ArrayEntries>(key);

        auto value = consume_next(data, key.offset, opts);
        if (PHPSER_UNLIKELY(!value)) return detail::propagate<ArrayEntries>(value);

        entries.emplace_back(std::move(key.value), std::move(value.value));
        pos = value.offset;
    }

    if (auto code = detail::expect_byte(data, pos, '}'); code != errc::ok)
        return detail::failure<ArrayEntries>(code, pos);

    return detail::success(std::move(entries), pos + 1);
}

} // namespace phpser
