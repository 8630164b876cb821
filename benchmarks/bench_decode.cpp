/// @file bench_decode.cpp
/// @brief Performance benchmarks for phpser.
///
/// Measured operations:
///   - Scalar decoding through the value dispatcher
///   - Long string payloads (delimiter search)
///   - Object projection into records (flat, nested, unknown keys)
///   - Flat arrays

#include <phpser/phpser.hpp>

#include <benchmark/benchmark.h>

#include <string>

using namespace phpser;

// ═══════════════════════════════════════════════════════════════════════════════
// Test data
// ═══════════════════════════════════════════════════════════════════════════════

namespace {

struct Address {
    std::string City;
    std::string Street;
    int Zip = 0;
};
PHPSER_DEFINE_RECORD(Address, City, Street, Zip)

struct User {
    int64_t Id = 0;
    std::string Name;
    std::string Email;
    double Score = 0.0;
    bool Active = false;
    Address Home;
};
PHPSER_DEFINE_RECORD(User, Id, Name, Email, Score, Active, Home)

std::string text_node(const std::string& s) {
    return "s:" + std::to_string(s.size()) + ":\"" + s + "\";";
}

std::string generate_user(int extra_keys) {
    std::string body;
    body += text_node("id") + "i:1042;";
    body += text_node("name") + text_node("John Smith");
    body += text_node("email") + text_node("john.smith@example.com");
    body += text_node("score") + "d:95.5;";
    body += text_node("active") + "b:1;";
    body += text_node("home") + R"(O:7:"Address":3:{)" + text_node("city") +
            text_node("Springfield") + text_node("street") +
            text_node("742 Evergreen Terrace") + text_node("zip") + "i:49007;}";
    for (int i = 0; i < extra_keys; ++i)
        body += text_node("unused_" + std::to_string(i)) + text_node("value");
    return R"(O:4:"User":)" + std::to_string(6 + extra_keys) + ":{" + body + "}";
}

std::string generate_array(int count) {
    std::string s = "a:" + std::to_string(count) + ":{";
    for (int i = 0; i < count; ++i)
        s += "i:" + std::to_string(i) + ";i:" + std::to_string(i * 7) + ";";
    return s + "}";
}

} // namespace

// ═══════════════════════════════════════════════════════════════════════════════
// Scalars
// ═══════════════════════════════════════════════════════════════════════════════

static void BM_DecodeInteger(benchmark::State& state) {
    std::string input = "i:-1234567890;";
    for (auto _ : state) {
        auto r = consume_next(input, 0);
        benchmark::DoNotOptimize(r);
    }
    state.SetBytesProcessed(state.iterations() *
                            static_cast<int64_t>(input.size()));
}
BENCHMARK(BM_DecodeInteger);

static void BM_DecodeFloat(benchmark::State& state) {
    std::string input = "d:3.141592653589793;";
    for (auto _ : state) {
        auto r = consume_next(input, 0);
        benchmark::DoNotOptimize(r);
    }
    state.SetBytesProcessed(state.iterations() *
                            static_cast<int64_t>(input.size()));
}
BENCHMARK(BM_DecodeFloat);

static void BM_DecodeString(benchmark::State& state) {
    std::string input = text_node(std::string(static_cast<size_t>(state.range(0)), 'x'));
    for (auto _ : state) {
        auto r = consume_next(input, 0);
        benchmark::DoNotOptimize(r);
    }
    state.SetBytesProcessed(state.iterations() *
                            static_cast<int64_t>(input.size()));
}
BENCHMARK(BM_DecodeString)->Arg(16)->Arg(256)->Arg(4096)->Arg(65536);

static void BM_DecodeStringStrict(benchmark::State& state) {
    std::string input = text_node(std::string(static_cast<size_t>(state.range(0)), 'x'));
    const auto opts = DecodeOptions::strict();
    for (auto _ : state) {
        auto r = consume_next(input, 0, opts);
        benchmark::DoNotOptimize(r);
    }
    state.SetBytesProcessed(state.iterations() *
                            static_cast<int64_t>(input.size()));
}
BENCHMARK(BM_DecodeStringStrict)->Arg(256)->Arg(65536);

// ═══════════════════════════════════════════════════════════════════════════════
// Objects
// ═══════════════════════════════════════════════════════════════════════════════

static void BM_DecodeObject(benchmark::State& state) {
    std::string input = generate_user(0);
    for (auto _ : state) {
        User u;
        auto r = consume_object(input, 0, u);
        benchmark::DoNotOptimize(r);
        benchmark::DoNotOptimize(u);
    }
    state.SetBytesProcessed(state.iterations() *
                            static_cast<int64_t>(input.size()));
}
BENCHMARK(BM_DecodeObject);

static void BM_DecodeObjectUnknownKeys(benchmark::State& state) {
    std::string input = generate_user(static_cast<int>(state.range(0)));
    for (auto _ : state) {
        User u;
        auto r = consume_object(input, 0, u);
        benchmark::DoNotOptimize(r);
    }
    state.SetBytesProcessed(state.iterations() *
                            static_cast<int64_t>(input.size()));
}
BENCHMARK(BM_DecodeObjectUnknownKeys)->Arg(10)->Arg(100);

static void BM_DecodeObjectThrowingApi(benchmark::State& state) {
    std::string input = generate_user(0);
    for (auto _ : state) {
        User u;
        decode_object(input, u);
        benchmark::DoNotOptimize(u);
    }
    state.SetBytesProcessed(state.iterations() *
                            static_cast<int64_t>(input.size()));
}
BENCHMARK(BM_DecodeObjectThrowingApi);

// ═══════════════════════════════════════════════════════════════════════════════
// Arrays
// ═══════════════════════════════════════════════════════════════════════════════

static void BM_DecodeArray(benchmark::State& state) {
    std::string input = generate_array(static_cast<int>(state.range(0)));
    for (auto _ : state) {
        auto r = consume_array(input, 0);
        benchmark::DoNotOptimize(r);
    }
    state.SetBytesProcessed(state.iterations() *
                            static_cast<int64_t>(input.size()));
}
BENCHMARK(BM_DecodeArray)->Arg(100)->Arg(1000)->Arg(10000);
