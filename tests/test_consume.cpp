/// @file test_consume.cpp
/// @brief Unit tests for the scalar consumers, consume_text and consume_next.

#include <phpser/phpser.hpp>

#include <gtest/gtest.h>

#include <cmath>
#include <cstdint>
#include <limits>
#include <string>
#include <vector>

using namespace phpser;

// ═══════════════════════════════════════════════════════════════════════════════
// Null
// ═══════════════════════════════════════════════════════════════════════════════

TEST(ConsumeNull, Basic) {
    auto r = consume_null("N;", 0);
    ASSERT_TRUE(r);
    EXPECT_EQ(r.offset, 2u);
}

TEST(ConsumeNull, AtOffset) {
    auto r = consume_null("i:1;N;", 4);
    ASSERT_TRUE(r);
    EXPECT_EQ(r.offset, 6u);
}

TEST(ConsumeNull, Truncated) {
    auto r = consume_null("N", 0);
    EXPECT_EQ(r.ec, errc::unexpected_end_of_input);
    EXPECT_EQ(r.offset, npos);
}

TEST(ConsumeNull, WrongTag) {
    EXPECT_EQ(consume_null("i:1;", 0).ec, errc::unexpected_tag);
    EXPECT_EQ(consume_null("N:", 0).ec, errc::unexpected_tag);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Bool
// ═══════════════════════════════════════════════════════════════════════════════

TEST(ConsumeBool, TrueAndFalse) {
    auto t = consume_bool("b:1;", 0);
    ASSERT_TRUE(t);
    EXPECT_TRUE(t.value);
    EXPECT_EQ(t.offset, 4u);

    auto f = consume_bool("b:0;", 0);
    ASSERT_TRUE(f);
    EXPECT_FALSE(f.value);
    EXPECT_EQ(f.offset, 4u);
}

TEST(ConsumeBool, InvalidFlag) {
    auto r = consume_bool("b:2;", 0);
    EXPECT_EQ(r.ec, errc::numeric_parse_error);
    EXPECT_EQ(r.error_offset, 2u);
}

TEST(ConsumeBool, MissingTerminator) {
    EXPECT_EQ(consume_bool("b:1x", 0).ec, errc::numeric_parse_error);
}

TEST(ConsumeBool, Truncated) {
    EXPECT_EQ(consume_bool("b:1", 0).ec, errc::unexpected_end_of_input);
    EXPECT_EQ(consume_bool("b", 0).ec, errc::unexpected_end_of_input);
}

TEST(ConsumeBool, WrongTag) {
    EXPECT_EQ(consume_bool("i:1;", 0).ec, errc::unexpected_tag);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Integer
// ═══════════════════════════════════════════════════════════════════════════════

TEST(ConsumeInt, Positive) {
    auto r = consume_int("i:42;", 0);
    ASSERT_TRUE(r);
    EXPECT_EQ(r.value, 42);
    EXPECT_EQ(r.offset, 5u);
}

TEST(ConsumeInt, Negative) {
    auto r = consume_int("i:-100;", 0);
    ASSERT_TRUE(r);
    EXPECT_EQ(r.value, -100);
    EXPECT_EQ(r.offset, 7u);
}

TEST(ConsumeInt, Limits) {
    auto max = consume_int("i:9223372036854775807;", 0);
    ASSERT_TRUE(max);
    EXPECT_EQ(max.value, std::numeric_limits<int64_t>::max());

    auto min = consume_int("i:-9223372036854775808;", 0);
    ASSERT_TRUE(min);
    EXPECT_EQ(min.value, std::numeric_limits<int64_t>::min());
}

TEST(ConsumeInt, OutOfRange) {
    EXPECT_EQ(consume_int("i:9223372036854775808;", 0).ec, errc::numeric_parse_error);
}

TEST(ConsumeInt, NotANumber) {
    auto r = consume_int("i:abc;", 0);
    EXPECT_EQ(r.ec, errc::numeric_parse_error);
    EXPECT_EQ(r.error_offset, 2u);
    EXPECT_EQ(consume_int("i:;", 0).ec, errc::numeric_parse_error);
    EXPECT_EQ(consume_int("i:1.5;", 0).ec, errc::numeric_parse_error);
    EXPECT_EQ(consume_int("i:+1;", 0).ec, errc::numeric_parse_error);
}

TEST(ConsumeInt, MissingTerminator) {
    EXPECT_EQ(consume_int("i:42", 0).ec, errc::unexpected_end_of_input);
}

TEST(ConsumeInt, StopsAtFirstTerminator) {
    auto r = consume_int("i:7;i:8;", 0);
    ASSERT_TRUE(r);
    EXPECT_EQ(r.value, 7);
    EXPECT_EQ(r.offset, 4u);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Float
// ═══════════════════════════════════════════════════════════════════════════════

TEST(ConsumeFloat, Basic) {
    auto r = consume_float("d:3.5;", 0);
    ASSERT_TRUE(r);
    EXPECT_DOUBLE_EQ(r.value, 3.5);
    EXPECT_EQ(r.offset, 6u);
}

TEST(ConsumeFloat, NegativeAndExponent) {
    auto neg = consume_float("d:-0.5;", 0);
    ASSERT_TRUE(neg);
    EXPECT_DOUBLE_EQ(neg.value, -0.5);

    auto exp = consume_float("d:1.5E+25;", 0);
    ASSERT_TRUE(exp);
    EXPECT_DOUBLE_EQ(exp.value, 1.5e25);
}

TEST(ConsumeFloat, IntegralLiteral) {
    auto r = consume_float("d:1;", 0);
    ASSERT_TRUE(r);
    EXPECT_DOUBLE_EQ(r.value, 1.0);
}

TEST(ConsumeFloat, NonFinite) {
    auto inf = consume_float("d:INF;", 0);
    ASSERT_TRUE(inf);
    EXPECT_TRUE(std::isinf(inf.value));
    EXPECT_GT(inf.value, 0.0);

    auto ninf = consume_float("d:-INF;", 0);
    ASSERT_TRUE(ninf);
    EXPECT_TRUE(std::isinf(ninf.value));
    EXPECT_LT(ninf.value, 0.0);

    auto nan = consume_float("d:NAN;", 0);
    ASSERT_TRUE(nan);
    EXPECT_TRUE(std::isnan(nan.value));
}

TEST(ConsumeFloat, Invalid) {
    EXPECT_EQ(consume_float("d:x;", 0).ec, errc::numeric_parse_error);
    EXPECT_EQ(consume_float("d:;", 0).ec, errc::numeric_parse_error);
    EXPECT_EQ(consume_float("d:1.5x;", 0).ec, errc::numeric_parse_error);
}

TEST(ConsumeFloat, Truncated) {
    EXPECT_EQ(consume_float("d:3.5", 0).ec, errc::unexpected_end_of_input);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Text
// ═══════════════════════════════════════════════════════════════════════════════

TEST(ConsumeText, Basic) {
    auto r = consume_text(R"(s:5:"hello";)", 0);
    ASSERT_TRUE(r);
    EXPECT_EQ(r.value, "hello");
    EXPECT_EQ(r.offset, 12u);
}

TEST(ConsumeText, Empty) {
    auto r = consume_text(R"(s:0:"";)", 0);
    ASSERT_TRUE(r);
    EXPECT_TRUE(r.value.empty());
    EXPECT_EQ(r.offset, 7u);
}

TEST(ConsumeText, PayloadWithDelimiters) {
    // The payload is taken by length; quotes and ';' inside it are data.
    auto r = consume_text(R"(s:5:"a";b"";)", 0);
    ASSERT_TRUE(r);
    EXPECT_EQ(r.value, "a\";b\"");
    EXPECT_EQ(r.offset, 12u);
}

TEST(ConsumeText, MultiByteLengthIsInBytes) {
    std::string data = "s:12:\"\xD0\x9F\xD1\x80\xD0\xB8\xD0\xB2\xD0\xB5\xD1\x82\";i:1;";
    auto r = consume_text(data, 0);
    ASSERT_TRUE(r);
    EXPECT_EQ(r.value, "\xD0\x9F\xD1\x80\xD0\xB8\xD0\xB2\xD0\xB5\xD1\x82");
    EXPECT_EQ(r.offset, 20u);

    auto next = consume_int(data, r.offset);
    ASSERT_TRUE(next);
    EXPECT_EQ(next.value, 1);
}

TEST(ConsumeText, MalformedLength) {
    EXPECT_EQ(consume_text(R"(s:x:"a";)", 0).ec, errc::malformed_string);
    EXPECT_EQ(consume_text(R"(s:-1:"a";)", 0).ec, errc::malformed_string);
}

TEST(ConsumeText, LengthPastEnd) {
    auto r = consume_text(R"(s:5:"hi";)", 0);
    EXPECT_EQ(r.ec, errc::malformed_string);
    EXPECT_EQ(r.offset, npos);
}

TEST(ConsumeText, FramingCutAtBufferEnd) {
    // Every truncation of the framing is a string framing error.
    EXPECT_EQ(consume_text("s:2:", 0).ec, errc::malformed_string);
    EXPECT_EQ(consume_text(R"(s:2:")", 0).ec, errc::malformed_string);
    EXPECT_EQ(consume_text(R"(s:2:"a)", 0).ec, errc::malformed_string);
    EXPECT_EQ(consume_text(R"(s:2:"ab)", 0).ec, errc::malformed_string);
}

TEST(ConsumeText, LengthMismatch) {
    auto r = consume_text(R"(s:2:"abc";)", 0);
    EXPECT_EQ(r.ec, errc::malformed_string);
    EXPECT_EQ(r.error_offset, 7u);
}

TEST(ConsumeText, MissingOpeningQuote) {
    EXPECT_EQ(consume_text(R"(s:2:xab";)", 0).ec, errc::malformed_string);
}

TEST(ConsumeText, MissingTerminator) {
    EXPECT_EQ(consume_text(R"(s:2:"ab":)", 0).ec, errc::malformed_string);
    EXPECT_EQ(consume_text(R"(s:2:"ab")", 0).ec, errc::malformed_string);
}

TEST(ConsumeText, WrongTag) {
    EXPECT_EQ(consume_text("i:1;", 0).ec, errc::unexpected_tag);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Text encodings
// ═══════════════════════════════════════════════════════════════════════════════

TEST(ConsumeTextEncoding, RawKeepsBytes) {
    std::string data = std::string("s:4:\"caf") + "\xE9" + "\";";
    auto r = consume_text(data, 0);
    ASSERT_TRUE(r);
    EXPECT_EQ(r.value, std::string("caf") + "\xE9");
}

TEST(ConsumeTextEncoding, Latin1Transcodes) {
    std::string data = std::string("s:4:\"caf") + "\xE9" + "\";";
    auto r = consume_text(data, 0, DecodeOptions::legacy());
    ASSERT_TRUE(r);
    EXPECT_EQ(r.value, "caf\xC3\xA9");
    EXPECT_EQ(r.offset, data.size());
}

TEST(ConsumeTextEncoding, StrictAcceptsValidUtf8) {
    std::string data = "s:5:\"caf\xC3\xA9\";";
    auto r = consume_text(data, 0, DecodeOptions::strict());
    ASSERT_TRUE(r);
    EXPECT_EQ(r.value, "caf\xC3\xA9");
    EXPECT_EQ(r.offset, data.size());
}

TEST(ConsumeTextEncoding, StrictRejectsInvalidUtf8) {
    std::string data = std::string("s:4:\"caf") + "\xE9" + "\";";
    auto r = consume_text(data, 0, DecodeOptions::strict());
    EXPECT_EQ(r.ec, errc::invalid_utf8);
    EXPECT_EQ(r.error_offset, 5u);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Value dispatcher
// ═══════════════════════════════════════════════════════════════════════════════

TEST(ConsumeNext, EveryScalarKind) {
    auto n = consume_next("N;", 0);
    ASSERT_TRUE(n);
    EXPECT_TRUE(n.value.is_null());

    auto b = consume_next("b:1;", 0);
    ASSERT_TRUE(b);
    EXPECT_EQ(b.value, Value(true));

    auto i = consume_next("i:-3;", 0);
    ASSERT_TRUE(i);
    EXPECT_EQ(i.value.as_integer(), -3);

    auto d = consume_next("d:0.25;", 0);
    ASSERT_TRUE(d);
    EXPECT_TRUE(d.value.is_float());
    EXPECT_DOUBLE_EQ(d.value.as_float(), 0.25);

    auto s = consume_next(R"(s:3:"abc";)", 0);
    ASSERT_TRUE(s);
    EXPECT_EQ(s.value.as_string(), "abc");
    EXPECT_EQ(s.offset, 10u);
}

TEST(ConsumeNext, WalksASequence) {
    std::string data = R"(i:1;s:2:"ab";b:1;N;d:2.5;)";
    std::vector<Value> values;
    size_t pos = 0;
    while (pos < data.size()) {
        auto r = consume_next(data, pos);
        ASSERT_TRUE(r) << r.ec.message() << " at " << r.error_offset;
        values.push_back(std::move(r.value));
        pos = r.offset;
    }
    ASSERT_EQ(values.size(), 5u);
    EXPECT_EQ(values[0], Value(1));
    EXPECT_EQ(values[1], Value("ab"));
    EXPECT_EQ(values[2], Value(true));
    EXPECT_TRUE(values[3].is_null());
    EXPECT_EQ(values[4], Value(2.5));
    EXPECT_EQ(pos, data.size());
}

TEST(ConsumeNext, PastEndIsCorruptStream) {
    auto r = consume_next("i:1;", 4);
    EXPECT_EQ(r.ec, errc::corrupt_stream);
    EXPECT_EQ(r.offset, npos);
    EXPECT_EQ(consume_next("", 0).ec, errc::corrupt_stream);
}

TEST(ConsumeNext, UnsupportedTags) {
    EXPECT_EQ(consume_next("a:0:{}", 0).ec, errc::unsupported_tag);
    EXPECT_EQ(consume_next(R"(O:1:"A":0:{})", 0).ec, errc::unsupported_tag);
    EXPECT_EQ(consume_next("x:1;", 0).ec, errc::unsupported_tag);
}

TEST(ConsumeNext, PropagatesInnerFailure) {
    auto r = consume_next("i:x;", 0);
    EXPECT_EQ(r.ec, errc::numeric_parse_error);
    EXPECT_EQ(r.error_offset, 2u);
    EXPECT_EQ(r.offset, npos);
}
