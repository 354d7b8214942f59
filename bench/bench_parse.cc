#include "benchmark/benchmark.h"

#include <cstdint>
#include <cstdio>
#include <cstdlib>

#include <algorithm>
#include <limits>
#include <random>
#include <string>
#include <vector>

#include "ieeeparse.h"

#ifndef IEEEPARSE_HAVE_DOUBLE_CONVERSION
#define IEEEPARSE_HAVE_DOUBLE_CONVERSION 0
#endif

#define BENCH_IEEEPARSE()           1
#define BENCH_STD_STRTOD()          1
#define BENCH_DOUBLE_CONVERSION()   IEEEPARSE_HAVE_DOUBLE_CONVERSION

static constexpr int NumFloats = 1 << 14;

#if BENCH_IEEEPARSE()
template <typename T>
struct S2FIeeeparse
{
    using value_type = T;

    value_type operator()(std::string const& str) const
    {
        value_type flt{};
        const auto res = ieeeparse::ParseFloat(str.data(), str.data() + str.size(), flt);
        if (res.status != ieeeparse::ParseStatus::ok)
            return value_type{};
        return flt;
    }
};
#endif

#if BENCH_STD_STRTOD()
struct S2DStdStrtod
{
    using value_type = double;

    value_type operator()(std::string const& str) const
    {
        value_type flt = std::strtod(str.c_str(), nullptr);
        return flt;
    }
};

struct S2FStdStrtof
{
    using value_type = float;

    value_type operator()(std::string const& str) const
    {
        value_type flt = std::strtof(str.c_str(), nullptr);
        return flt;
    }
};
#endif

#if BENCH_DOUBLE_CONVERSION()
#include "double-conversion/double-conversion.h"
struct S2DDoubleConversion
{
    using value_type = double;

    value_type operator()(std::string const& str) const
    {
        double_conversion::StringToDoubleConverter s2d(0, 0.0, 1.0, "inf", "nan");
        int processed_characters_count = 0;
        return s2d.StringToDouble(str.data(), static_cast<int>(str.size()), &processed_characters_count);
    }
};

struct S2FDoubleConversion
{
    using value_type = float;

    value_type operator()(std::string const& str) const
    {
        double_conversion::StringToDoubleConverter s2d(0, 0.0, 1.0, "inf", "nan");
        int processed_characters_count = 0;
        return s2d.StringToFloat(str.data(), static_cast<int>(str.size()), &processed_characters_count);
    }
};
#endif

template <typename Converter>
static void BenchIt(benchmark::State& state, std::vector<std::string> const& numbers)
{
    Converter convert;

    size_t index = 0;
    for (auto _ : state)
    {
        benchmark::DoNotOptimize( convert(numbers[index]) );
        index = (index + 1) & (NumFloats - 1);
    }
}

template <typename Converter>
static void RegisterBenchmarks(std::string const& name, std::vector<std::string> const& numbers)
{
    auto* bench = benchmark::RegisterBenchmark(name.c_str(), BenchIt<Converter>, numbers);

    bench->ComputeStatistics("min", [](std::vector<double> const& v) -> double {
        return *(std::min_element(std::begin(v), std::end(v)));
    });
    bench->ReportAggregatesOnly();
}

static std::mt19937 rng;

// Formats NumFloats uniformly distributed numbers with the given printf format.
static std::vector<std::string> GenerateNumbers(char const* format, double min, double max)
{
    std::vector<std::string> numbers(NumFloats);

    std::uniform_real_distribution<double> gen(min, max);

    std::generate(numbers.begin(), numbers.end(), [&] {
        char buf[128];
        const int len = std::snprintf(buf, 128, format, gen(rng));
        return std::string(buf, buf + len);
    });

    return numbers;
}

static inline void RegisterUniform_double(char const* name, double min, double max)
{
    const auto numbers = GenerateNumbers("%.17g", min, max);

#if BENCH_IEEEPARSE()
    RegisterBenchmarks<S2FIeeeparse<double>>(std::string(name) + " double ieeeparse", numbers);
    RegisterBenchmarks<S2FIeeeparse<ieeeparse::Float128>>(std::string(name) + " quad   ieeeparse", numbers);
#endif
#if BENCH_STD_STRTOD()
    RegisterBenchmarks<S2DStdStrtod>(std::string(name) + " double std::strtod", numbers);
#endif
#if BENCH_DOUBLE_CONVERSION()
    RegisterBenchmarks<S2DDoubleConversion>(std::string(name) + " double double_conversion", numbers);
#endif
}

static inline void RegisterUniform_single(char const* name, float min, float max)
{
    const auto numbers = GenerateNumbers("%.9g", min, max);

#if BENCH_IEEEPARSE()
    RegisterBenchmarks<S2FIeeeparse<float>>(std::string(name) + " single ieeeparse", numbers);
#endif
#if BENCH_STD_STRTOD()
    RegisterBenchmarks<S2FStdStrtof>(std::string(name) + " single std::strtof", numbers);
#endif
#if BENCH_DOUBLE_CONVERSION()
    RegisterBenchmarks<S2FDoubleConversion>(std::string(name) + " single double_conversion", numbers);
#endif
}

static inline void RegisterUniform_half(char const* name, float min, float max)
{
    const auto numbers = GenerateNumbers("%.5g", min, max);

#if BENCH_IEEEPARSE()
    RegisterBenchmarks<S2FIeeeparse<ieeeparse::Float16>>(std::string(name) + " half   ieeeparse", numbers);
#endif
}

int main(int argc, char** argv)
{
#if defined(__clang__)
    printf("clang %d.%d\n", __clang_major__, __clang_minor__);
#elif defined(__GNUC__)
    printf("gcc %s\n", __VERSION__);
#elif defined(_MSC_VER)
    printf("msc %d\n", _MSC_FULL_VER);
#endif

    RegisterUniform_double("warm up", 0, 1);

    RegisterUniform_double("uniform [0,1]", 0.0, 1.0);
    RegisterUniform_double("uniform [1,2]", 1.0, 2.0);
    RegisterUniform_double("uniform [8,2^10]", 8.0, 1ll << 10);
    RegisterUniform_double("uniform [2^10,2^20]", 1ll << 10, 1ll << 20);
    RegisterUniform_double("uniform [2^20,2^50]", 1ll << 20, 1ll << 50);
    RegisterUniform_double("uniform [0,max]", 0.0, std::numeric_limits<double>::max());

    RegisterUniform_single("uniform [0,1]", 0.0f, 1.0f);
    RegisterUniform_single("uniform [1,2]", 1.0f, 2.0f);
    RegisterUniform_single("uniform [0,max]", 0.0f, std::numeric_limits<float>::max());

    RegisterUniform_half("uniform [0,1]", 0.0f, 1.0f);
    RegisterUniform_half("uniform [0,65504]", 0.0f, 65504.0f);

    benchmark::Initialize(&argc, argv);
    benchmark::RunSpecifiedBenchmarks();

    return 0;
}
