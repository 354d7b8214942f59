#include "catch2/catch.hpp"

#include "ieee.h"
#include "ieeeparse.h"

#include <cmath>
#include <cstdint>
#include <limits>

using namespace ieeeparse;

static float FloatFromBits(uint32_t bits)
{
    return IEEE<float>::FromBits(bits);
}

static uint16_t ToHalfBits(float f)
{
    return SingleToFloat16(f).bits;
}

//==================================================================================================
// binary32 --> binary16
//==================================================================================================

TEST_CASE("SingleToFloat16 - normal")
{
    CHECK(0x3C00 == ToHalfBits(1.0f));
    CHECK(0xC000 == ToHalfBits(-2.0f));
    CHECK(0xBE00 == ToHalfBits(-1.5f));
    CHECK(0x3555 == ToHalfBits(0.333251953125f));
    CHECK(0x0400 == ToHalfBits(std::ldexp(1.0f, -14)));
    CHECK(0x7BFF == ToHalfBits(65504.0f));
    CHECK(0x7BFF == ToHalfBits(65519.0f));
}

TEST_CASE("SingleToFloat16 - ties to even")
{
    CHECK(0x3C01 == ToHalfBits(1.0f + std::ldexp(1.0f, -10)));
    CHECK(0x3C00 == ToHalfBits(1.0f + std::ldexp(1.0f, -11)));
    CHECK(0x3C02 == ToHalfBits(1.0f + std::ldexp(3.0f, -11)));
    CHECK(0x3C01 == ToHalfBits(1.0f + std::ldexp(1.0f, -11) + std::ldexp(1.0f, -20)));
    CHECK(0x6800 == ToHalfBits(2049.0f));
    CHECK(0x6802 == ToHalfBits(2051.0f));

    // Rounding up the carry into the exponent.
    CHECK(0x4000 == ToHalfBits(2.0f - std::ldexp(1.0f, -12)));
    // Halfway between the largest finite number and 2^16.
    CHECK(0x7C00 == ToHalfBits(65520.0f));
}

TEST_CASE("SingleToFloat16 - subnormal")
{
    CHECK(0x0001 == ToHalfBits(std::ldexp(1.0f, -24)));
    CHECK(0x0003 == ToHalfBits(std::ldexp(3.0f, -24)));
    CHECK(0x03FF == ToHalfBits(std::ldexp(1023.0f, -24)));
    CHECK(0x0000 == ToHalfBits(std::ldexp(1.0f, -25)));
    CHECK(0x0001 == ToHalfBits(std::ldexp(1.5f, -25)));
    CHECK(0x0002 == ToHalfBits(std::ldexp(3.0f, -25)));
    CHECK(0x0000 == ToHalfBits(std::ldexp(1.0f, -26)));
    CHECK(0x8000 == ToHalfBits(-1e-10f));
    CHECK(0x0000 == ToHalfBits(std::numeric_limits<float>::denorm_min()));
    // Rounds up into the smallest normal number.
    CHECK(0x0400 == ToHalfBits(std::ldexp(2047.0f, -25)));
}

TEST_CASE("SingleToFloat16 - special")
{
    CHECK(0x0000 == ToHalfBits(0.0f));
    CHECK(0x8000 == ToHalfBits(-0.0f));
    CHECK(0x7C00 == ToHalfBits(std::numeric_limits<float>::infinity()));
    CHECK(0xFC00 == ToHalfBits(-std::numeric_limits<float>::infinity()));
    CHECK(0x7C00 == ToHalfBits(std::numeric_limits<float>::max()));
    CHECK(0x7C00 == ToHalfBits(1e5f));
    CHECK(0x7E00 == ToHalfBits(FloatFromBits(0x7FC00000)));
    CHECK(0x7E00 == ToHalfBits(FloatFromBits(0x7F800001)));
    CHECK(0xFE00 == ToHalfBits(FloatFromBits(0xFFC00000)));
}

//==================================================================================================
// binary16 --> binary32
//==================================================================================================

TEST_CASE("Float16ToSingle - values")
{
    CHECK(1.0f == Float16ToSingle(Float16{0x3C00}));
    CHECK(-2.0f == Float16ToSingle(Float16{0xC000}));
    CHECK(65504.0f == Float16ToSingle(Float16{0x7BFF}));
    CHECK(std::ldexp(1.0f, -14) == Float16ToSingle(Float16{0x0400}));
    CHECK(std::ldexp(1.0f, -24) == Float16ToSingle(Float16{0x0001}));
    CHECK(std::ldexp(1023.0f, -24) == Float16ToSingle(Float16{0x03FF}));
    CHECK(std::isinf(Float16ToSingle(Float16{0x7C00})));
    CHECK(std::isnan(Float16ToSingle(Float16{0x7E00})));

    const float neg_zero = Float16ToSingle(Float16{0x8000});
    CHECK(neg_zero == 0.0f);
    CHECK(std::signbit(neg_zero));
}

TEST_CASE("Float16ToSingle - all")
{
    for (uint32_t bits = 0; bits <= 0xFFFF; ++bits)
    {
        const Float16 h{static_cast<uint16_t>(bits)};
        const float f = Float16ToSingle(h);
        if (std::isnan(f))
        {
            CHECK((bits & 0x7C00) == 0x7C00);
            CHECK((bits & 0x03FF) != 0);
            continue;
        }

        CAPTURE(bits);
        CHECK(bits == SingleToFloat16(f).bits);
    }
}

//==================================================================================================
// binary64 --> binary128
//==================================================================================================

static void CheckQuad(double value, uint64_t hi, uint64_t lo)
{
    const auto q = DoubleToFloat128(value);
    CHECK(hi == q.bits.hi);
    CHECK(lo == q.bits.lo);
}

TEST_CASE("DoubleToFloat128")
{
    CheckQuad( 0.0, 0x0000000000000000, 0);
    CheckQuad(-0.0, 0x8000000000000000, 0);
    CheckQuad( 1.0, 0x3FFF000000000000, 0);
    CheckQuad(-2.0, 0xC000000000000000, 0);
    CheckQuad(1.0 + std::ldexp(1.0, -52), 0x3FFF000000000000, 0x1000000000000000);
    CheckQuad(std::numeric_limits<double>::max(), 0x43FEFFFFFFFFFFFF, 0xF000000000000000);
    CheckQuad(std::numeric_limits<double>::min(), 0x3C01000000000000, 0);
    CheckQuad(std::numeric_limits<double>::denorm_min(), 0x3BCD000000000000, 0);
    CheckQuad(std::numeric_limits<double>::min() - std::numeric_limits<double>::denorm_min(), 0x3C00FFFFFFFFFFFF, 0xE000000000000000);
    CheckQuad(std::numeric_limits<double>::infinity(), 0x7FFF000000000000, 0);
    CheckQuad(-std::numeric_limits<double>::infinity(), 0xFFFF000000000000, 0);
    CheckQuad(std::numeric_limits<double>::quiet_NaN(), 0x7FFF800000000000, 0);
}
