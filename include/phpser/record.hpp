#pragma once

/// @file record.hpp
/// @brief Binding decoded object pairs to the fields of C++ structs.
///
/// Provides:
///   - FieldSlot: a typed, settable view of one field (integer, unsigned,
///     float, opaque or nested record)
///   - make_field_slot(): builds the slot matching a field's C++ type
///   - RecordRef: non-owning, type-erased reference to a destination record
///   - DiscardSink: destination that matches no key
///   - PHPSER_DEFINE_RECORD() / PHPSER_DEFINE_RECORD_INTRUSIVE() macros
///
/// @example
/// @code
///   struct Person { std::string Name; int Age = 0; };
///   PHPSER_DEFINE_RECORD(Person, Name, Age)
///
///   Person p;
///   auto r = phpser::consume_object(data, 0, p);
/// @endcode

#include "config.hpp"
#include "detail/text.hpp"
#include "error.hpp"
#include "value.hpp"

#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace phpser {

/// @brief How a decoded value may be written into a field.
enum class SlotKind : uint8_t {
    none,              ///< No such field; the value is discarded
    integer,           ///< Signed integral field
    unsigned_integer,  ///< Unsigned integral field
    floating,          ///< float / double field
    opaque,            ///< Assigned unchanged when the kinds agree
    record             ///< Nested struct, filled from an O: node
};

class RecordRef {
public:
    using lookup_fn = FieldSlot (*)(void* record, std::string_view key);

    RecordRef(void* record, lookup_fn lookup) noexcept
        : record_(record), lookup_(lookup) {}

    /// @brief Slot for @p key, or a SlotKind::none slot.
    FieldSlot lookup(std::string_view key) const;

private:
    void* record_;
    lookup_fn lookup_;
};

/// @brief Settable view of one destination field.
///
/// Holds the field address plus the setter for its kind. Only valid while
/// the record it came from is alive.
class FieldSlot {
public:
    using int_setter    = bool (*)(void* field, int64_t v);
    using uint_setter   = bool (*)(void* field, uint64_t v);
    using float_setter  = void (*)(void* field, double v);
    using opaque_setter = errc (*)(void* field, Value&& v);

    FieldSlot() noexcept = default;

    static FieldSlot integer(void* field, int_setter set) noexcept {
        FieldSlot s(SlotKind::integer, field);
        s.set_int_ = set;
        return s;
    }
    static FieldSlot unsigned_integer(void* field, uint_setter set) noexcept {
        FieldSlot s(SlotKind::unsigned_integer, field);
        s.set_uint_ = set;
        return s;
    }
    static FieldSlot floating(void* field, float_setter set) noexcept {
        FieldSlot s(SlotKind::floating, field);
        s.set_float_ = set;
        return s;
    }
    static FieldSlot opaque(void* field, opaque_setter set) noexcept {
        FieldSlot s(SlotKind::opaque, field);
        s.set_opaque_ = set;
        return s;
    }
    static FieldSlot record(void* field, RecordRef::lookup_fn lookup) noexcept {
        FieldSlot s(SlotKind::record, field);
        s.lookup_ = lookup;
        return s;
    }

    [[nodiscard]] SlotKind kind() const noexcept { return kind_; }
    [[nodiscard]] bool matched() const noexcept { return kind_ != SlotKind::none; }

    /// @return false when @p v does not fit the field.
    bool set_integer(int64_t v) const { return set_int_(field_, v); }
    bool set_unsigned(uint64_t v) const { return set_uint_(field_, v); }
    void set_float(double v) const { set_float_(field_, v); }
    errc set_opaque(Value&& v) const { return set_opaque_(field_, std::move(v)); }

    /// @brief The nested record behind a SlotKind::record slot.
    RecordRef as_record() const noexcept { return RecordRef(field_, lookup_); }

private:
    FieldSlot(SlotKind kind, void* field) noexcept : kind_(kind), field_(field) {}

    SlotKind kind_ = SlotKind::none;
    void* field_ = nullptr;
    int_setter set_int_ = nullptr;
    uint_setter set_uint_ = nullptr;
    float_setter set_float_ = nullptr;
    opaque_setter set_opaque_ = nullptr;
    RecordRef::lookup_fn lookup_ = nullptr;
};

inline FieldSlot RecordRef::lookup(std::string_view key) const {
    return lookup_(record_, key);
}

// =====================================================================
// DiscardSink
// =====================================================================

/// @brief Destination with no fields: every pair decoded into it is dropped.
struct DiscardSink {};

inline FieldSlot lookup_field(DiscardSink&, std::string_view) noexcept {
    return FieldSlot();
}

// =====================================================================
// Record detection and slot construction
// =====================================================================

namespace detail {

template <typename T, typename = void>
struct is_record : std::false_type {};

/// A record is any type with an ADL-visible lookup_field(T&, string_view).
template <typename T>
struct is_record<T, std::void_t<decltype(lookup_field(std::declval<T&>(),
                                                      std::declval<std::string_view>()))>>
    : std::true_type {};

template <typename T>
struct is_optional : std::false_type {};
template <typename T>
struct is_optional<std::optional<T>> : std::true_type {};

template <typename T>
FieldSlot lookup_record(void* record, std::string_view key) {
    return lookup_field(*static_cast<T*>(record), key);
}

template <typename T>
bool set_signed(void* field, int64_t v) {
    if (v < static_cast<int64_t>(std::numeric_limits<T>::min()) ||
        v > static_cast<int64_t>(std::numeric_limits<T>::max()))
        return false;
    *static_cast<T*>(field) = static_cast<T>(v);
    return true;
}

template <typename T>
bool set_unsigned(void* field, uint64_t v) {
    if (v > static_cast<uint64_t>(std::numeric_limits<T>::max())) return false;
    *static_cast<T*>(field) = static_cast<T>(v);
    return true;
}

template <typename T>
void set_floating(void* field, double v) {
    *static_cast<T*>(field) = static_cast<T>(v);
}

inline errc set_bool(void* field, Value&& v) {
    if (!v.is_bool()) return errc::field_type_mismatch;
    *static_cast<bool*>(field) = v.as_bool();
    return errc::ok;
}

inline errc set_string(void* field, Value&& v) {
    if (!v.is_string()) return errc::field_type_mismatch;
    *static_cast<std::string*>(field) = v.as_string();
    return errc::ok;
}

inline errc set_value(void* field, Value&& v) {
    *static_cast<Value*>(field) = std::move(v);
    return errc::ok;
}

template <typename T>
errc set_optional(void* field, Value&& v);

} // namespace detail

/// @brief Build the slot for a field of type T.
template <typename T>
FieldSlot make_field_slot(T& field) {
    void* p = static_cast<void*>(&field);
    if constexpr (std::is_same_v<T, bool>) {
        return FieldSlot::opaque(p, &detail::set_bool);
    } else if constexpr (std::is_integral_v<T> && std::is_signed_v<T>) {
        return FieldSlot::integer(p, &detail::set_signed<T>);
    } else if constexpr (std::is_integral_v<T>) {
        return FieldSlot::unsigned_integer(p, &detail::set_unsigned<T>);
    } else if constexpr (std::is_floating_point_v<T>) {
        return FieldSlot::floating(p, &detail::set_floating<T>);
    } else if constexpr (std::is_same_v<T, std::string>) {
        return FieldSlot::opaque(p, &detail::set_string);
    } else if constexpr (std::is_same_v<T, Value>) {
        return FieldSlot::opaque(p, &detail::set_value);
    } else if constexpr (detail::is_optional<T>::value) {
        static_assert(!detail::is_record<typename T::value_type>::value,
                      "optional records are not supported as fields");
        return FieldSlot::opaque(p, &detail::set_optional<T>);
    } else if constexpr (detail::is_record<T>::value) {
        return FieldSlot::record(p, &detail::lookup_record<T>);
    } else {
        static_assert(sizeof(T) == 0,
                      "Unsupported field type: declare the type with PHPSER_DEFINE_RECORD "
                      "or use an arithmetic, std::string, Value or std::optional field");
    }
}

/// @brief Reference a destination record for consume_object().
template <typename T>
RecordRef make_record_ref(T& record) noexcept {
    static_assert(detail::is_record<T>::value,
                  "destination must be declared with PHPSER_DEFINE_RECORD");
    return RecordRef(static_cast<void*>(&record), &detail::lookup_record<T>);
}

namespace detail {

/// @brief Write @p v into @p slot, widening numbers to the field's kind.
inline errc assign_slot(const FieldSlot& slot, Value&& v) {
    switch (slot.kind()) {
        case SlotKind::none:
            return errc::ok;
        case SlotKind::integer:
            if (!v.is_integer()) return errc::field_type_mismatch;
            return slot.set_integer(v.as_integer()) ? errc::ok : errc::integer_overflow;
        case SlotKind::unsigned_integer: {
            if (!v.is_integer()) return errc::field_type_mismatch;
            const int64_t i = v.as_integer();
            if (i < 0) return errc::integer_overflow;
            return slot.set_unsigned(static_cast<uint64_t>(i)) ? errc::ok
                                                               : errc::integer_overflow;
        }
        case SlotKind::floating:
            if (!v.is_number()) return errc::field_type_mismatch;
            slot.set_float(v.as_float());
            return errc::ok;
        case SlotKind::opaque:
            return slot.set_opaque(std::move(v));
        case SlotKind::record:
            // N; is how PHP writes a null object property: keep the record.
            return v.is_null() ? errc::ok : errc::field_type_mismatch;
    }
    return errc::field_type_mismatch;
}

template <typename T>
errc set_optional(void* field, Value&& v) {
    auto& opt = *static_cast<T*>(field);
    if (v.is_null()) {
        opt.reset();
        return errc::ok;
    }
    typename T::value_type inner{};
    errc code = assign_slot(make_field_slot(inner), std::move(v));
    if (code == errc::ok) opt = std::move(inner);
    return code;
}

} // namespace detail

} // namespace phpser

// =====================================================================
// Preprocessor FOREACH utilities (support up to 20 fields)
// =====================================================================

// NOLINTBEGIN(cppcoreguidelines-macro-usage)

#define PHPSER_PP_CAT_I(a, b) a##b
#define PHPSER_PP_CAT(a, b) PHPSER_PP_CAT_I(a, b)

#define PHPSER_PP_NARG_I(...) \
    PHPSER_PP_ARG_N(__VA_ARGS__, \
    20,19,18,17,16,15,14,13,12,11,10,9,8,7,6,5,4,3,2,1,0)
#define PHPSER_PP_ARG_N( \
    _1,_2,_3,_4,_5,_6,_7,_8,_9,_10, \
    _11,_12,_13,_14,_15,_16,_17,_18,_19,_20, N,...) N

#define PHPSER_PP_FE_1(m,x) m(x)
#define PHPSER_PP_FE_2(m,x,...) m(x) PHPSER_PP_FE_1(m,__VA_ARGS__)
#define PHPSER_PP_FE_3(m,x,...) m(x) PHPSER_PP_FE_2(m,__VA_ARGS__)
#define PHPSER_PP_FE_4(m,x,...) m(x) PHPSER_PP_FE_3(m,__VA_ARGS__)
#define PHPSER_PP_FE_5(m,x,...) m(x) PHPSER_PP_FE_4(m,__VA_ARGS__)
#define PHPSER_PP_FE_6(m,x,...) m(x) PHPSER_PP_FE_5(m,__VA_ARGS__)
#define PHPSER_PP_FE_7(m,x,...) m(x) PHPSER_PP_FE_6(m,__VA_ARGS__)
#define PHPSER_PP_FE_8(m,x,...) m(x) PHPSER_PP_FE_7(m,__VA_ARGS__)
#define PHPSER_PP_FE_9(m,x,...) m(x) PHPSER_PP_FE_8(m,__VA_ARGS__)
#define PHPSER_PP_FE_10(m,x,...) m(x) PHPSER_PP_FE_9(m,__VA_ARGS__)
#define PHPSER_PP_FE_11(m,x,...) m(x) PHPSER_PP_FE_10(m,__VA_ARGS__)
#define PHPSER_PP_FE_12(m,x,...) m(x) PHPSER_PP_FE_11(m,__VA_ARGS__)
#define PHPSER_PP_FE_13(m,x,...) m(x) PHPSER_PP_FE_12(m,__VA_ARGS__)
#define PHPSER_PP_FE_14(m,x,...) m(x) PHPSER_PP_FE_13(m,__VA_ARGS__)
#define PHPSER_PP_FE_15(m,x,...) m(x) PHPSER_PP_FE_14(m,__VA_ARGS__)
#define PHPSER_PP_FE_16(m,x,...) m(x) PHPSER_PP_FE_15(m,__VA_ARGS__)
#define PHPSER_PP_FE_17(m,x,...) m(x) PHPSER_PP_FE_16(m,__VA_ARGS__)
#define PHPSER_PP_FE_18(m,x,...) m(x) PHPSER_PP_FE_17(m,__VA_ARGS__)
#define PHPSER_PP_FE_19(m,x,...) m(x) PHPSER_PP_FE_18(m,__VA_ARGS__)
#define PHPSER_PP_FE_20(m,x,...) m(x) PHPSER_PP_FE_19(m,__VA_ARGS__)

#define PHPSER_PP_FOREACH(m,...) \
    PHPSER_PP_CAT(PHPSER_PP_FE_, PHPSER_PP_NARG_I(__VA_ARGS__))(m, __VA_ARGS__)

// Field-level lookup: the key matches when both sides agree after the
// first letter is upper-cased.
#define PHPSER_DETAIL_LOOKUP_FIELD(fld) \
    if (::phpser::detail::field_name_matches(key, #fld)) \
        return ::phpser::make_field_slot(v.fld);

/// Non-intrusive: use in the same namespace as the type.
#define PHPSER_DEFINE_RECORD(Type, ...) \
    inline ::phpser::FieldSlot lookup_field(Type& v, ::std::string_view key) { \
        PHPSER_PP_FOREACH(PHPSER_DETAIL_LOOKUP_FIELD, __VA_ARGS__) \
        return ::phpser::FieldSlot(); \
    }

/// Intrusive: use inside the class/struct body (reaches private members).
#define PHPSER_DEFINE_RECORD_INTRUSIVE(Type, ...) \
    friend ::phpser::FieldSlot lookup_field(Type& v, ::std::string_view key) { \
        PHPSER_PP_FOREACH(PHPSER_DETAIL_LOOKUP_FIELD, __VA_ARGS__) \
        return ::phpser::FieldSlot(); \
    }

// NOLINTEND(cppcoreguidelines-macro-usage)
