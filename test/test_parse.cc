#include "catch2/catch.hpp"

#include "ieee.h"
#include "ieeeparse.h"

#include <cfloat>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <initializer_list>
#include <limits>
#include <random>
#include <string>

using namespace ieeeparse;

#define TEST_MANY_RANDOM() 0

//==================================================================================================
// Helpers
//==================================================================================================

template <typename T>
static T Parse(const std::string& str)
{
    T value{};
    const auto res = ParseFloat(str.data(), str.data() + str.size(), value);
    CHECK(res.status == ParseStatus::ok);
    CHECK(res.next == str.data() + str.size());
    return value;
}

static uint16_t ParseHalfBits(const std::string& str)
{
    return Parse<Float16>(str).bits;
}

static uint32_t ParseSingleBits(const std::string& str)
{
    return IEEE<float>::ToBits(Parse<float>(str));
}

static uint64_t ParseDoubleBits(const std::string& str)
{
    return IEEE<double>::ToBits(Parse<double>(str));
}

static Uint128 ParseQuadBits(const std::string& str)
{
    return Parse<Float128>(str).bits;
}

template <typename T>
static void CheckInvalid(const std::string& str, std::ptrdiff_t pos)
{
    T value{};
    const auto res = ParseFloat(str.data(), str.data() + str.size(), value);
    CHECK(res.status == ParseStatus::invalid_character);
    CHECK(res.next - str.data() == pos);
}

static void CheckInvalidAll(const std::string& str, std::ptrdiff_t pos)
{
    CAPTURE(str);
    CheckInvalid<Float16>(str, pos);
    CheckInvalid<float>(str, pos);
    CheckInvalid<double>(str, pos);
    CheckInvalid<Float128>(str, pos);
}

static void CheckQuad(const std::string& str, uint64_t hi, uint64_t lo)
{
    CAPTURE(str);
    const auto bits = ParseQuadBits(str);
    CHECK(hi == bits.hi);
    CHECK(lo == bits.lo);
}

//==================================================================================================
// Round trip
//==================================================================================================

template <typename Float>
static void CheckRoundTrip(Float value, const char* format)
{
    using bits_type = typename IEEE<Float>::bits_type;

    static constexpr int BUFLEN = 128;

    char buf[BUFLEN];
    const int len = std::snprintf(buf, BUFLEN, format, static_cast<double>(value));
    REQUIRE(len > 0);
    REQUIRE(len < BUFLEN);

    CAPTURE(buf);

    Float value2;
    const auto res = ParseFloat(buf, buf + len, value2);
    CHECK(res.status == ParseStatus::ok);
    CHECK(res.next == buf + len);

    if (std::isnan(value))
    {
        CHECK(std::isnan(value2));
    }
    else
    {
        const bits_type bits = IEEE<Float>::ToBits(value);
        const bits_type bits2 = IEEE<Float>::ToBits(value2);
        CHECK(bits == bits2);
    }
}

static void CheckDouble(double value)
{
    CheckRoundTrip(value, "%.17g");
    CheckRoundTrip(value, "%.16e");
}

static void CheckSingle(float value)
{
    CheckRoundTrip(value, "%.9g");
    CheckRoundTrip(value, "%.8e");
}

//==================================================================================================
// Special values
//==================================================================================================

TEST_CASE("ParseFloat - signed zero")
{
    CHECK(0x0000 == ParseHalfBits("0"));
    CHECK(0x8000 == ParseHalfBits("-0"));
    CHECK(0x00000000u == ParseSingleBits("0"));
    CHECK(0x80000000u == ParseSingleBits("-0"));
    CHECK(0x0000000000000000u == ParseDoubleBits("0"));
    CHECK(0x8000000000000000u == ParseDoubleBits("-0"));
    CheckQuad("0", 0, 0);
    CheckQuad("-0", 0x8000000000000000, 0);

    CHECK(0x0000000000000000u == ParseDoubleBits("+0.000e-12"));
    CHECK(0x8000000000000000u == ParseDoubleBits("-.0e+400"));
    CHECK(0x8000000000000000u == ParseDoubleBits("-."));
}

TEST_CASE("ParseFloat - nan")
{
    for (const char* str : {"nan", "NaN", "nAn", "NAN"})
    {
        CAPTURE(str);
        CHECK(0x7E00 == ParseHalfBits(str));
        CHECK(0x7FC00000u == ParseSingleBits(str));
        CHECK(0x7FF8000000000000u == ParseDoubleBits(str));
        CheckQuad(str, 0x7FFF800000000000, 0);
    }

    CheckInvalidAll("nan(1)", 0);
    CheckInvalidAll("-nan", 1);
    CheckInvalidAll("nanx", 0);
    CheckInvalidAll("\tnan", 0);
    CheckInvalidAll("\rnan", 0);
    CheckInvalidAll(" nan", 0);
    CheckInvalidAll("nan ", 0);
}

TEST_CASE("ParseFloat - infinity")
{
    for (const char* str : {"inf", "inF", "INF", "+inf", "+Inf"})
    {
        CAPTURE(str);
        CHECK(0x7C00 == ParseHalfBits(str));
        CHECK(0x7F800000u == ParseSingleBits(str));
        CHECK(0x7FF0000000000000u == ParseDoubleBits(str));
        CheckQuad(str, 0x7FFF000000000000, 0);
    }

    for (const char* str : {"-inf", "-INF", "-iNf"})
    {
        CAPTURE(str);
        CHECK(0xFC00 == ParseHalfBits(str));
        CHECK(0xFF800000u == ParseSingleBits(str));
        CHECK(0xFFF0000000000000u == ParseDoubleBits(str));
        CheckQuad(str, 0xFFFF000000000000, 0);
    }

    CheckInvalidAll("infinity", 0);
    CheckInvalidAll("in", 0);

    // Control characters must not be mistaken for signs when comparing case-insensitively.
    CheckInvalidAll("\rinf", 0);
    CheckInvalidAll("\rINF", 0);
    CheckInvalidAll("\vinf", 0);
    CheckInvalidAll("\tinf", 0);
    CheckInvalidAll(" inf", 0);
    CheckInvalidAll("inf ", 0);
    CheckInvalidAll("\r-inf", 0);
}

TEST_CASE("ParseFloat - out of range")
{
    CHECK(0x0000 == ParseHalfBits("1e-700"));
    CHECK(0x00000000u == ParseSingleBits("1e-700"));
    CHECK(0x0000000000000000u == ParseDoubleBits("1e-700"));
    CheckQuad("1e-700", 0, 0);

    CHECK(0x7C00 == ParseHalfBits("1e+700"));
    CHECK(0x7F800000u == ParseSingleBits("1e+700"));
    CHECK(0x7FF0000000000000u == ParseDoubleBits("1e+700"));
    CheckQuad("1e+700", 0x7FFF000000000000, 0);

    CHECK(0x8000000000000000u == ParseDoubleBits("-1e-700"));
    CHECK(0xFFF0000000000000u == ParseDoubleBits("-1e+700"));

    CHECK(0x7C00 == ParseHalfBits("65520"));
    CHECK(0x7BFF == ParseHalfBits("65519"));
    CHECK(0x0000 == ParseHalfBits("1e-8"));
    CHECK(0x7F800000u == ParseSingleBits("3.4028236e38"));
    CHECK(0x7F7FFFFFu == ParseSingleBits("3.4028235e38"));
    CHECK(0x7FF0000000000000u == ParseDoubleBits("1.7976931348623159e308"));
    CHECK(0x7FEFFFFFFFFFFFFFu == ParseDoubleBits("1.7976931348623157e308"));
}

TEST_CASE("ParseFloat - long exponent")
{
    const std::string nines(60, '9');

    CHECK(0x7C00 == ParseHalfBits("0.4e0066" + nines));
    CHECK(0x7F800000u == ParseSingleBits("0.4e0066" + nines));
    CHECK(0x7FF0000000000000u == ParseDoubleBits("0.4e0066" + nines));
    CheckQuad("0.4e0066" + nines, 0x7FFF000000000000, 0);

    CHECK(0xFFF0000000000000u == ParseDoubleBits("-0.4e0066" + nines));
    CHECK(0x0000000000000000u == ParseDoubleBits("0.4e-0066" + nines));
    CHECK(0x0000000000000000u == ParseDoubleBits("0e0066" + nines));
}

//==================================================================================================
// Exact values
//==================================================================================================

TEST_CASE("ParseFloat - exact")
{
    CHECK(0x67D0 == ParseHalfBits("2e3"));
    CHECK(2000.0f == Parse<float>("2e3"));
    CHECK(2000.0 == Parse<double>("2e3"));
    CheckQuad("2e3", 0x4009F40000000000, 0);

    CHECK(0x64D2 == ParseHalfBits("1.234e3"));
    CHECK(1234.0f == Parse<float>("1.234e3"));
    CHECK(1234.0 == Parse<double>("1.234e3"));
    CheckQuad("1.234e3", 0x4009348000000000, 0);

    CHECK(0.5 == Parse<double>(".5"));
    CHECK(5.0 == Parse<double>("5."));
    CHECK(1.0 == Parse<double>("1"));
    CHECK(1.0 == Parse<double>("+1.0"));
    CHECK(-1.0 == Parse<double>("-1.0"));
    CHECK(1e23 == Parse<double>("1e23"));
    CHECK(0.0625f == Parse<float>("625E-4"));
    CHECK(1048576.0 == Parse<double>("1048576"));
}

TEST_CASE("ParseFloat - ties to even")
{
    // 2^24 + 1 is halfway between 2^24 and 2^24 + 2.
    CHECK(0x4B800000u == ParseSingleBits("16777217"));
    CHECK(16777220.0f == Parse<float>("16777219"));

    // 2^53 + 1 is halfway between 2^53 and 2^53 + 2.
    CHECK(9007199254740992.0 == Parse<double>("9007199254740993"));
    CHECK(9007199254740996.0 == Parse<double>("9007199254740995"));

    // 2^11 + 1 is halfway between 2^11 and 2^11 + 2.
    CHECK(0x6800 == ParseHalfBits("2049"));
    CHECK(0x6802 == ParseHalfBits("2051"));

    // Quad precision rounds in double precision first.
    CheckQuad("9007199254740993", 0x4034000000000000, 0);

    // Halfway between the two smallest subnormals.
    CHECK(0.0 == Parse<double>("2.4703282292062327e-324"));
    CHECK(std::numeric_limits<double>::denorm_min() == Parse<double>("2.4703282292062328e-324"));
    CHECK(0.0f == Parse<float>("7.00649232e-46"));
    CHECK(std::numeric_limits<float>::denorm_min() == Parse<float>("7.00649233e-46"));
}

TEST_CASE("ParseFloat - approximate")
{
    CHECK(3.141 == Parse<double>("3.141"));
    CHECK(3.141f == Parse<float>("3.141"));
    CHECK(0x4248 == ParseHalfBits("3.141"));
    CheckQuad("3.141", 0x4000920C49BA5E35, 0x4000000000000000);

    CHECK(0.1 == Parse<double>("0.1"));
    CHECK(0.1f == Parse<float>("0.1"));
    CHECK(0x2E66 == ParseHalfBits("0.1"));

    CHECK(std::fabs(Parse<double>("3.141") - 3.141) <= 3.141 * DBL_EPSILON);
    CHECK(std::fabs(Parse<float>("3.141") - 3.141f) <= 3.141f * FLT_EPSILON);
}

TEST_CASE("ParseFloat - truncated digits")
{
    // Digits beyond the first 17 (9) do not contribute to the result.
    CHECK(Parse<double>("1.2345678901234567") == Parse<double>("1.234567890123456789999"));
    CHECK(Parse<float>("1.23456789") == Parse<float>("1.2345678999999"));
    CHECK(1e22 == Parse<double>("10000000000000000000000"));
    CHECK(1e22 == Parse<double>("10000000000000000000000.000000000000000000000000001"));
}

//==================================================================================================
// Syntax
//==================================================================================================

TEST_CASE("ParseFloat - invalid")
{
    CheckInvalidAll("", 0);
    CheckInvalidAll("   1", 0);
    CheckInvalidAll("1abc", 1);
    CheckInvalidAll("1 ", 1);
    CheckInvalidAll("1.2.3", 3);
    CheckInvalidAll("1e", 2);
    CheckInvalidAll("1e+", 3);
    CheckInvalidAll("1e+x", 3);
    CheckInvalidAll("0x10", 1);
    CheckInvalidAll("++1", 1);
    CheckInvalidAll("1e1234567x", 9);

    // Whitespace around the number.
    CheckInvalidAll("\t1", 0);
    CheckInvalidAll("\r1", 0);
    CheckInvalidAll("\v1", 0);
    CheckInvalidAll("\n1", 0);
    CheckInvalidAll("1\n", 1);
    CheckInvalidAll("-\r1", 1);
}

TEST_CASE("ParseFloat - value unchanged on error")
{
    double d = 42.0;
    const std::string str = "12x";
    const auto res = ParseFloat(str.data(), str.data() + str.size(), d);
    CHECK(res.status == ParseStatus::invalid_character);
    CHECK(42.0 == d);

    Float16 h{0x1234};
    CHECK(ParseFloat(str.data(), str.data() + str.size(), h).status == ParseStatus::invalid_character);
    CHECK(0x1234 == h.bits);

    Float128 q{{1, 2}};
    CHECK(ParseFloat(str.data(), str.data() + str.size(), q).status == ParseStatus::invalid_character);
    CHECK(1u == q.bits.hi);
    CHECK(2u == q.bits.lo);
}

//==================================================================================================
// Round trip
//==================================================================================================

TEST_CASE("ParseFloat - double boundaries")
{
    CheckDouble(std::numeric_limits<double>::min());
    CheckDouble(std::numeric_limits<double>::max());
    CheckDouble(std::numeric_limits<double>::denorm_min());
    CheckDouble(std::numeric_limits<double>::epsilon());
    CheckDouble(std::numeric_limits<double>::infinity());
    CheckDouble(-std::numeric_limits<double>::infinity());
    CheckDouble(std::numeric_limits<double>::quiet_NaN());

    CheckDouble(9007199254740991.0);
    CheckDouble(9007199254740992.0);
    CheckDouble(9007199254740994.0);
    CheckDouble(1.2999999999999999E+154);
    CheckDouble(7.3177701707893310e+15);
    CheckDouble(7.2057594037927933e+16);

    for (int i = 0; i < 64; ++i)
    {
        CheckDouble(IEEE<double>::FromBits(uint64_t{1} << i));
    }

    double d = std::numeric_limits<double>::denorm_min();
    for (int i = 0; i < 2100; ++i)
    {
        CheckDouble(d);
        CheckDouble(std::nextafter(d, 0.0));
        CheckDouble(std::nextafter(d, std::numeric_limits<double>::infinity()));
        d *= 2;
    }
}

TEST_CASE("ParseFloat - single boundaries")
{
    CheckSingle(std::numeric_limits<float>::min());
    CheckSingle(std::numeric_limits<float>::max());
    CheckSingle(std::numeric_limits<float>::denorm_min());
    CheckSingle(std::numeric_limits<float>::epsilon());
    CheckSingle(std::numeric_limits<float>::infinity());
    CheckSingle(std::numeric_limits<float>::quiet_NaN());

    float f = std::numeric_limits<float>::denorm_min();
    for (int i = 0; i < 280; ++i)
    {
        CheckSingle(f);
        CheckSingle(std::nextafter(f, 0.0f));
        CheckSingle(std::nextafter(f, std::numeric_limits<float>::infinity()));
        f *= 2;
    }
}

TEST_CASE("ParseFloat - Paxson, Kahan")
{
    // Stress inputs for conversion to 53-bit binary.
    CheckDouble(5e+125);
    CheckDouble(69e+267);
    CheckDouble(999e-26);
    CheckDouble(7861e-34);
    CheckDouble(75569e-254);
    CheckDouble(928609e-261);
    CheckDouble(9210917e+80);
    CheckDouble(84863171e+114);
    CheckDouble(653777767e+273);
    CheckDouble(5232604057e-298);
    CheckDouble(27235667517e-109);
    CheckDouble(653532977297e-123);
    CheckDouble(3142213164987e-294);
    CheckDouble(46202199371337e-72);
    CheckDouble(231010996856685e-73);
    CheckDouble(9324754620109615e+212);
    CheckDouble(78459735791271921e+49);
    CheckDouble(9e-265);
    CheckDouble(85e-37);
    CheckDouble(623e+100);
    CheckDouble(3571e+263);
    CheckDouble(81661e+153);
    CheckDouble(920657e-23);
    CheckDouble(4603277e-241);
    CheckDouble(87575437e-309);

    // Stress inputs for conversion to 24-bit binary.
    CheckSingle(5e-20f);
    CheckSingle(67e+14f);
    CheckSingle(985e+15f);
    CheckSingle(7693e-42f);
    CheckSingle(55895e-16f);
    CheckSingle(996622e-44f);
    CheckSingle(7038531e-32f);
    CheckSingle(60419369e-46f);
    CheckSingle(702990899e-20f);
    CheckSingle(6930161142e-48f);
    CheckSingle(25933168707e+13f);
    CheckSingle(596428896559e+20f);
}

TEST_CASE("ParseFloat - random doubles")
{
#if TEST_MANY_RANDOM()
    static constexpr int NumValues = 10000000;
#else
    static constexpr int NumValues = 100000;
#endif

    std::mt19937_64 random;
    for (int i = 0; i < NumValues; ++i)
    {
        const double value = IEEE<double>::FromBits(random());
        if (std::isnan(value))
            continue; // might print as "-nan"
        CheckDouble(value);
    }
}

TEST_CASE("ParseFloat - random singles")
{
#if TEST_MANY_RANDOM()
    static constexpr int NumValues = 10000000;
#else
    static constexpr int NumValues = 100000;
#endif

    std::mt19937 random;
    for (int i = 0; i < NumValues; ++i)
    {
        const float value = IEEE<float>::FromBits(static_cast<uint32_t>(random()));
        if (std::isnan(value))
            continue;
        CheckSingle(value);
    }
}

TEST_CASE("ParseFloat - all halves")
{
    for (uint32_t bits = 0; bits <= 0xFFFF; ++bits)
    {
        const Float16 h{static_cast<uint16_t>(bits)};
        const float f = Float16ToSingle(h);
        if (std::isnan(f))
            continue;

        char buf[64];
        const int len = std::snprintf(buf, sizeof(buf), "%.5g", static_cast<double>(f));
        CAPTURE(buf);

        Float16 h2{0};
        const auto res = ParseFloat(buf, buf + len, h2);
        CHECK(res.status == ParseStatus::ok);
        CHECK(bits == h2.bits);
    }
}
