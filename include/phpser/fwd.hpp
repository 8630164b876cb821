#pragma once

/// @file fwd.hpp
/// @brief Forward declarations and type aliases for phpser.

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace phpser {

// ─── Forward declarations ───────────────────────────────────────────────
class Value;
class FieldSlot;
class RecordRef;
struct DecodeOptions;

/// Decoded value kinds. Arrays and objects are never values: objects are
/// projected into records, arrays go through consume_array().
enum class Type : uint8_t {
    Null    = 0,
    Bool    = 1,
    Integer = 2,
    Float   = 3,
    String  = 4
};

/// @brief Returns the string representation of a type.
inline const char* type_name(Type t) noexcept {
    switch (t) {
        case Type::Null:    return "null";
        case Type::Bool:    return "bool";
        case Type::Integer: return "integer";
        case Type::Float:   return "float";
        case Type::String:  return "string";
    }
    return "unknown";
}

/// Sentinel offset returned by failed consumers and by find_byte() when
/// the byte is absent.
inline constexpr size_t npos = static_cast<size_t>(-1);

} // namespace phpser
