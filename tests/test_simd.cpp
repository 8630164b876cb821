/// @file test_simd.cpp
/// @brief Dedicated tests for the SIMD delimiter search (SSE2/AVX2/NEON).
///
/// These tests exercise find_byte at various input lengths to cover:
///   - Scalar fallback (< 16 bytes)
///   - SSE2 / NEON path (16–31 bytes)
///   - AVX2 / NEON-64 path (≥ 32 bytes)
///   - Tail handling after SIMD blocks
///
/// Configure with -DPHPSER_SIMD=ON (and -march=native for AVX2) to run
/// the vector paths.

#include <gtest/gtest.h>
#include <phpser/phpser.hpp>
#include <phpser/detail/simd.hpp>

#include <iostream>
#include <string>

namespace simd = phpser::detail::simd;

// ═══════════════════════════════════════════════════════════════════════════════
// Report which SIMD path is active (informational)
// ═══════════════════════════════════════════════════════════════════════════════

TEST(SimdDetection, ReportActivePath) {
    std::string path = "scalar";
#if defined(PHPSER_AVX2)
    path = "AVX2 (32 bytes/iter)";
#elif defined(PHPSER_SSE2)
    path = "SSE2 (16 bytes/iter)";
#elif defined(PHPSER_NEON_64)
    path = "NEON AArch64 (2x16 bytes/iter)";
#elif defined(PHPSER_NEON)
    path = "NEON ARMv7 (16 bytes/iter)";
#endif
    std::cout << "[   INFO   ] Active SIMD path: " << path << std::endl;
    SUCCEED();
}

// ═══════════════════════════════════════════════════════════════════════════════
// find_byte
// ═══════════════════════════════════════════════════════════════════════════════

class FindByteTest : public ::testing::TestWithParam<size_t> {};

TEST_P(FindByteTest, AbsentReturnsEnd) {
    size_t n = GetParam();
    std::string s(n, '7');
    EXPECT_EQ(simd::find_byte(s.data(), s.data() + s.size(), ';'),
              s.data() + s.size())
        << "Failed for size " << n;
}

TEST_P(FindByteTest, NeedleAtEnd) {
    size_t n = GetParam();
    if (n == 0) return;
    std::string s(n - 1, '7');
    s.push_back(';');
    EXPECT_EQ(simd::find_byte(s.data(), s.data() + s.size(), ';'),
              s.data() + n - 1)
        << "Failed for size " << n;
}

TEST_P(FindByteTest, NeedleAtStart) {
    size_t n = GetParam();
    if (n == 0) return;
    std::string s(n, '7');
    s[0] = ';';
    EXPECT_EQ(simd::find_byte(s.data(), s.data() + s.size(), ';'), s.data())
        << "Failed for size " << n;
}

TEST_P(FindByteTest, FirstOfSeveral) {
    size_t n = GetParam();
    if (n < 3) return;
    std::string s(n, '7');
    s[n / 2] = ';';
    s[n - 1] = ';';
    EXPECT_EQ(simd::find_byte(s.data(), s.data() + s.size(), ';'),
              s.data() + n / 2)
        << "Failed for size " << n;
}

TEST_P(FindByteTest, HighByteNeedle) {
    size_t n = GetParam();
    if (n == 0) return;
    std::string s(n, 'a');
    s[n - 1] = '\xE9';
    EXPECT_EQ(simd::find_byte(s.data(), s.data() + s.size(), '\xE9'),
              s.data() + n - 1)
        << "Failed for size " << n;
}

INSTANTIATE_TEST_SUITE_P(
    Sizes, FindByteTest,
    ::testing::Values(0, 1, 7, 15, 16, 17, 31, 32, 33, 47, 48, 63, 64, 65, 100, 257));

TEST(SimdFindByte, CursorScannerUsesVectorPathOnLongRuns) {
    std::string payload(200, 'x');
    std::string s = "s:200:\"" + payload + "\";";
    EXPECT_EQ(phpser::detail::find_byte(s, ';', 7), s.size() - 1);
    EXPECT_EQ(phpser::detail::find_byte(s, '"', 7), s.size() - 2);
}
