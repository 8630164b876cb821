#pragma once

/// @file config.hpp
/// @brief Configuration macros for the phpser library.
///
/// Controls:
///   - Branch prediction hints
///   - SIMD opt-in for the cursor scanner
///   - Object nesting depth limit

// =====================================================================
// Branch prediction hints
// =====================================================================

#if defined(__GNUC__) || defined(__clang__)
    #define PHPSER_UNLIKELY(x) __builtin_expect(!!(x), 0)
#else
    #define PHPSER_UNLIKELY(x) (x)
#endif

// =====================================================================
// SIMD
// =====================================================================
// The delimiter scan in detail/simd.hpp uses SSE2/AVX2/NEON only when
// PHPSER_SIMD_ENABLED is defined (the CMake option PHPSER_SIMD does it).

// =====================================================================
// Recursion depth limit (stack overflow protection)
// =====================================================================
// Each nested O: node costs one level. DecodeOptions::max_depth == 0
// falls back to this value.

#if !defined(PHPSER_MAX_DEPTH)
    #define PHPSER_MAX_DEPTH 512
#endif
