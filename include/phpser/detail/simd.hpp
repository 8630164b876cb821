#pragma once

/// @file simd.hpp
/// @brief SIMD-accelerated delimiter search for the cursor scanner.
///
/// Supported platforms:
///   - x86_64: SSE2 (baseline), AVX2 (32 bytes/iteration)
///   - ARM/AArch64: NEON 16 bytes/iteration, AArch64 2×16 = 32 bytes/iteration
/// Falls back to scalar implementation when SIMD is unavailable.

#include <cstddef>
#include <cstdint>

// ─── Detection of available SIMD extensions ──────────────────────────────────
#if defined(PHPSER_SIMD_ENABLED)
    #if defined(__AVX2__)
        #define PHPSER_AVX2 1
        #include <immintrin.h>
    #elif defined(__SSE2__) || defined(_M_X64) || defined(_M_AMD64)
        #define PHPSER_SSE2 1
        #include <emmintrin.h>
    #endif
    #if defined(__ARM_NEON) || defined(__ARM_NEON__)
        #define PHPSER_NEON 1
        #include <arm_neon.h>
        #if defined(__aarch64__) || defined(_M_ARM64)
            #define PHPSER_NEON_64 1
        #endif
    #endif
#endif

namespace phpser::detail::simd {

// ─── Portable bit-scan helpers ───────────────────────────────────────────────
namespace {

[[maybe_unused]] inline int ctz32(uint32_t v) noexcept {
#if defined(_MSC_VER)
    unsigned long idx;
    _BitScanForward(&idx, v);
    return static_cast<int>(idx);
#else
    return __builtin_ctz(v);
#endif
}

#if defined(PHPSER_NEON)

/// @brief Convert 128-bit NEON comparison result to 16-bit bitmask.
/// Each byte of @p v must be 0x00 or 0xFF. Bit N corresponds to byte N.
inline uint16_t neon_movemask(uint8x16_t v) noexcept {
    static const uint8_t kBitMaskData[16] = {
        0x01, 0x02, 0x04, 0x08, 0x10, 0x20, 0x40, 0x80,
        0x01, 0x02, 0x04, 0x08, 0x10, 0x20, 0x40, 0x80
    };
    const uint8x16_t bit_mask = vld1q_u8(kBitMaskData);
    uint8x16_t masked = vandq_u8(v, bit_mask);
    uint8x8_t paired = vpadd_u8(vget_low_u8(masked), vget_high_u8(masked));
    paired = vpadd_u8(paired, paired);
    paired = vpadd_u8(paired, paired);
    return vget_lane_u16(vreinterpret_u16_u8(paired), 0);
}

#endif // PHPSER_NEON

} // anonymous namespace

// ═════════════════════════════════════════════════════════════════════════════
//  find_byte: first occurrence of a single byte
// ═════════════════════════════════════════════════════════════════════════════

/// @brief Return a pointer to the first @p needle in [ptr, end), or @p end.
inline const char* find_byte(const char* ptr, const char* end,
                             char needle) noexcept {
#if defined(PHPSER_AVX2)
    const __m256i n256 = _mm256_set1_epi8(needle);

    while (ptr + 32 <= end) {
        __m256i chunk = _mm256_loadu_si256(reinterpret_cast<const __m256i*>(ptr));
        uint32_t mask = static_cast<uint32_t>(
            _mm256_movemask_epi8(_mm256_cmpeq_epi8(chunk, n256)));
        if (mask != 0) return ptr + ctz32(mask);
        ptr += 32;
    }
    // Tail: SSE2 for remaining 16..31 bytes
    {
        const __m128i n128 = _mm_set1_epi8(needle);
        while (ptr + 16 <= end) {
            __m128i chunk = _mm_loadu_si128(reinterpret_cast<const __m128i*>(ptr));
            int mask16 = _mm_movemask_epi8(_mm_cmpeq_epi8(chunk, n128));
            if (mask16 != 0) return ptr + ctz32(static_cast<uint32_t>(mask16));
            ptr += 16;
        }
    }

#elif defined(PHPSER_SSE2)
    const __m128i n128 = _mm_set1_epi8(needle);

    while (ptr + 16 <= end) {
        __m128i chunk = _mm_loadu_si128(reinterpret_cast<const __m128i*>(ptr));
        int mask = _mm_movemask_epi8(_mm_cmpeq_epi8(chunk, n128));
        if (mask != 0) return ptr + ctz32(static_cast<uint32_t>(mask));
        ptr += 16;
    }

#elif defined(PHPSER_NEON)
    const uint8x16_t n128 = vdupq_n_u8(static_cast<uint8_t>(needle));

#if defined(PHPSER_NEON_64)
    while (ptr + 32 <= end) {
        uint8x16_t chunk0 = vld1q_u8(reinterpret_cast<const uint8_t*>(ptr));
        uint8x16_t chunk1 = vld1q_u8(reinterpret_cast<const uint8_t*>(ptr + 16));
        uint16_t mask0 = neon_movemask(vceqq_u8(chunk0, n128));
        if (mask0 != 0) return ptr + ctz32(mask0);
        uint16_t mask1 = neon_movemask(vceqq_u8(chunk1, n128));
        if (mask1 != 0) return ptr + 16 + ctz32(mask1);
        ptr += 32;
    }
#endif // PHPSER_NEON_64

    while (ptr + 16 <= end) {
        uint8x16_t chunk = vld1q_u8(reinterpret_cast<const uint8_t*>(ptr));
        uint16_t mask = neon_movemask(vceqq_u8(chunk, n128));
        if (mask != 0) return ptr + ctz32(mask);
        ptr += 16;
    }
#endif

    // Scalar fallback
    while (ptr < end) {
        if (*ptr == needle) return ptr;
        ++ptr;
    }
    return ptr;
}

} // namespace phpser::detail::simd
