#include "benchmark/benchmark.h"

#include "float2str/float2str.h"
#include "float2str/itoa.h"

#include <cassert>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>

#include <algorithm>
#include <charconv>
#include <random>
#include <string>
#include <vector>

#define BENCH_STD_PRINTF()      1
#define BENCH_STD_CHARCONV()    1

#define BENCH_SINGLE()          1
#define BENCH_DOUBLE()          1
#define BENCH_INTEGERS()        1

#define BENCH_TO_DECIMAL()      0

//==================================================================================================
//
//==================================================================================================

struct D2S_Float2Str
{
    static char const* Name() { return "float2str"; }
    char* operator()(char* buf, int /*buflen*/, float f) const { return float2str::Ftoa(buf, f); }
    char* operator()(char* buf, int /*buflen*/, double f) const { return float2str::Dtoa(buf, f); }
};

#if BENCH_STD_PRINTF()
struct D2S_Printf
{
    static char const* Name() { return "std::printf"; }
    char* operator()(char* buf, int buflen, float f) const { return buf + std::snprintf(buf, static_cast<size_t>(buflen), "%.9g", static_cast<double>(f)); }
    char* operator()(char* buf, int buflen, double f) const { return buf + std::snprintf(buf, static_cast<size_t>(buflen), "%.17g", f); }
};
#endif

#if BENCH_STD_CHARCONV()
struct D2S_Charconv
{
    static char const* Name() { return "std::charconv"; }
    char* operator()(char* buf, int buflen, float f) const { return std::to_chars(buf, buf + buflen, f).ptr; }
    char* operator()(char* buf, int buflen, double f) const { return std::to_chars(buf, buf + buflen, f).ptr; }
};
#endif

//==================================================================================================
//
//==================================================================================================

template <typename Target, typename Source>
static Target ReinterpretBits(Source const& source)
{
    static_assert(sizeof(Target) == sizeof(Source), "size mismatch");

    Target target;
    std::memcpy(&target, &source, sizeof(Source));
    return target;
}

static std::mt19937 rng;

static constexpr int BufSize = 64;
static constexpr int NumFloats = 1 << 13;

// Benchmark names must outlive the registration.
static std::vector<std::string> names;

#if BENCH_TO_DECIMAL()
template <typename D2S, typename Float>
static inline void BenchIt(benchmark::State& state, std::vector<Float> const& numbers)
{
    int index = 0;
    for (auto _ : state)
    {
        benchmark::DoNotOptimize(float2str::ToDecimal(numbers[index]));
        index = (index + 1) & (NumFloats - 1);
    }
}
#else
template <typename D2S, typename Float>
static inline void BenchIt(benchmark::State& state, std::vector<Float> const& numbers)
{
    D2S d2s;

    int index = 0;

    uint64_t sum = 0;
    for (auto _ : state)
    {
        char buffer[BufSize];
        d2s(buffer, BufSize, numbers[index]);
        sum += static_cast<unsigned char>(buffer[0]);
        index = (index + 1) & (NumFloats - 1);
    }

    benchmark::DoNotOptimize(sum);
}
#endif

template <typename D2S, typename Float>
static inline void RegisterConverter(std::string const& name, std::vector<Float> const& numbers)
{
    const char* float_name = sizeof(Float) == 4 ? "single" : "double";

    names.push_back(std::string(float_name) + " - " + name + " - " + D2S::Name());
    auto* bench = benchmark::RegisterBenchmark(names.back().c_str(), BenchIt<D2S, Float>, numbers);

    bench->ComputeStatistics("min", [](const std::vector<double>& v) -> double {
        return *(std::min_element(std::begin(v), std::end(v)));
    });
    bench->Repetitions(3);
    bench->ReportAggregatesOnly();
}

template <typename Float>
static inline void RegisterBenchmarks(std::string const& name, std::vector<Float> const& numbers)
{
    RegisterConverter<D2S_Float2Str>(name, numbers);
#if BENCH_STD_PRINTF()
    RegisterConverter<D2S_Printf>(name, numbers);
#endif
#if BENCH_STD_CHARCONV()
    RegisterConverter<D2S_Charconv>(name, numbers);
#endif
}

//--------------------------------------------------------------------------------------------------
//
//--------------------------------------------------------------------------------------------------
static inline void Register_RandomBits_double()
{
    std::vector<double> numbers(NumFloats);

    std::uniform_int_distribution<uint64_t> gen(1, 0x7FF0000000000000ull - 1);
    std::generate(numbers.begin(), numbers.end(), [&] { return ReinterpretBits<double>(gen(rng)); });

    RegisterBenchmarks("Random-bits", numbers);
}

static inline void Register_RandomBits_single()
{
    std::vector<float> numbers(NumFloats);

    std::uniform_int_distribution<uint32_t> gen(1, 0x7F800000u - 1);
    std::generate(numbers.begin(), numbers.end(), [&] { return ReinterpretBits<float>(gen(rng)); });

    RegisterBenchmarks("Random-bits", numbers);
}

//--------------------------------------------------------------------------------------------------
//
//--------------------------------------------------------------------------------------------------
template <typename Float>
static inline void Register_Uniform(Float low, Float high)
{
    std::vector<Float> numbers(NumFloats);

    std::uniform_real_distribution<Float> gen(low, high);
    std::generate(numbers.begin(), numbers.end(), [&] { return gen(rng); });

    char name[64];
    std::snprintf(name, sizeof(name), "Uniform %.1g/%.1g", static_cast<double>(low), static_cast<double>(high));
    RegisterBenchmarks(name, numbers);
}

//--------------------------------------------------------------------------------------------------
//
//--------------------------------------------------------------------------------------------------
static constexpr int64_t kPow10_i64[] = {
    1,
    10,
    100,
    1000,
    10000,
    100000,
    1000000,
    10000000,
    100000000,
    1000000000,
    10000000000,
    100000000000,
    1000000000000,
    10000000000000,
    100000000000000,
    1000000000000000,
    10000000000000000,
    100000000000000000,
    1000000000000000000,
};
static constexpr double kPow10_f64[] = {
    1.0e+00,
    1.0e+01,
    1.0e+02,
    1.0e+03,
    1.0e+04,
    1.0e+05,
    1.0e+06,
    1.0e+07,
    1.0e+08,
    1.0e+09,
    1.0e+10,
    1.0e+11,
    1.0e+12,
    1.0e+13,
    1.0e+14,
    1.0e+15,
    1.0e+16,
    1.0e+17,
    1.0e+18,
    1.0e+19,
    1.0e+20,
    1.0e+21,
    1.0e+22,
};

// Numbers with the given number of significant digits, scaled by 10^e10.
static inline void Register_Digits_double(int digits, int e10)
{
    assert(digits >= 1);
    assert(digits <= 18);
    assert(e10 >= -22);
    assert(e10 <= 22);

    std::vector<double> numbers(NumFloats);

    std::uniform_int_distribution<int64_t> gen(kPow10_i64[digits - 1], kPow10_i64[digits] - 1);

    std::generate(numbers.begin(), numbers.end(), [&] {
        int64_t n = gen(rng);
        if (n % 10 == 0)
            n |= 1;
        double v = static_cast<double>(n);
        if (e10 < 0)
            v /= kPow10_f64[-e10];
        else
            v *= kPow10_f64[e10];
        return v;
    });

    char name[64];
    std::snprintf(name, sizeof(name), "%2d,%3d", digits, e10);
    RegisterBenchmarks(name, numbers);
}

static constexpr int32_t kPow10_i32[] = {
    1,
    10,
    100,
    1000,
    10000,
    100000,
    1000000,
    10000000,
    100000000,
    1000000000,
};
static constexpr float kPow10_f32[] = {
    1.0e+00f,
    1.0e+01f,
    1.0e+02f,
    1.0e+03f,
    1.0e+04f,
    1.0e+05f,
    1.0e+06f,
    1.0e+07f,
    1.0e+08f,
    1.0e+09f,
    1.0e+10f,
};

static inline void Register_Digits_single(int digits, int e10)
{
    assert(digits >= 1);
    assert(digits <= 9);
    assert(e10 >= -10);
    assert(e10 <= 10);

    std::vector<float> numbers(NumFloats);

    std::uniform_int_distribution<int32_t> gen(kPow10_i32[digits - 1], kPow10_i32[digits] - 1);

    std::generate(numbers.begin(), numbers.end(), [&] {
        int32_t n = gen(rng);
        if (n % 10 == 0)
            n |= 1;
        float v = static_cast<float>(n);
        if (e10 < 0)
            v /= kPow10_f32[-e10];
        else
            v *= kPow10_f32[e10];
        return v;
    });

    char name[64];
    std::snprintf(name, sizeof(name), "%2d,%3d", digits, e10);
    RegisterBenchmarks(name, numbers);
}

//--------------------------------------------------------------------------------------------------
//
//--------------------------------------------------------------------------------------------------

#if BENCH_INTEGERS()
static void BM_Itoa64(benchmark::State& state)
{
    std::vector<int64_t> numbers(NumFloats);

    std::uniform_int_distribution<int64_t> gen(INT64_MIN, INT64_MAX);
    std::generate(numbers.begin(), numbers.end(), [&] { return gen(rng); });

    int index = 0;
    for (auto _ : state)
    {
        char buffer[float2str::Int64MinBufferLength];
        char* end = float2str::Itoa(buffer, numbers[index]);
        benchmark::DoNotOptimize(end);
        index = (index + 1) & (NumFloats - 1);
    }
}
BENCHMARK(BM_Itoa64);

static void BM_Utoa32(benchmark::State& state)
{
    std::vector<uint32_t> numbers(NumFloats);

    std::uniform_int_distribution<uint32_t> gen(0, UINT32_MAX);
    std::generate(numbers.begin(), numbers.end(), [&] { return gen(rng); });

    int index = 0;
    for (auto _ : state)
    {
        char buffer[float2str::UInt32MinBufferLength];
        char* end = float2str::Utoa(buffer, numbers[index]);
        benchmark::DoNotOptimize(end);
        index = (index + 1) & (NumFloats - 1);
    }
}
BENCHMARK(BM_Utoa32);
#endif

//--------------------------------------------------------------------------------------------------
//
//--------------------------------------------------------------------------------------------------

int main(int argc, char** argv)
{
#if defined(__clang__)
    printf("clang %d.%d\n", __clang_major__, __clang_minor__);
#elif defined(__GNUC__)
    printf("gcc %s\n", __VERSION__);
#elif defined(_MSC_VER)
    printf("msc %d\n", _MSC_FULL_VER);
#endif

    printf("Preparing benchmarks...\n");

    // Registration stores pointers into names.
    names.reserve(1024);

#if BENCH_DOUBLE()
    Register_RandomBits_double();
    Register_Uniform(0.0, 1.0);
    Register_Uniform(0.0, 1.0e+308);
    Register_Uniform(1.0, 2.0);

    for (int d = 1; d <= 17; d += 4) {
        for (int e = -10; e <= 10; e += 5) {
            Register_Digits_double(d, e);
        }
    }
#endif

#if BENCH_SINGLE()
    Register_RandomBits_single();
    Register_Uniform(0.0f, 1.0f);
    Register_Uniform(0.0f, 1.0e+38f);
    Register_Uniform(1.0f, 2.0f);

    for (int d = 1; d <= 9; d += 2) {
        for (int e = -10; e <= 10; e += 5) {
            Register_Digits_single(d, e);
        }
    }
#endif

    benchmark::Initialize(&argc, argv);
    benchmark::RunSpecifiedBenchmarks();
}
