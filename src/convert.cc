// Copyright 2019 Alexander Bolz
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "ieeeparse.h"

#include "ieee.h"
#include "pow5.h"

#include <cstdint>

using namespace ieeeparse;

//==================================================================================================
// binary32 <--> binary16
//==================================================================================================

static constexpr int      Half_MantissaBits  = Binary16Format.mantissa_bits;
static constexpr int      Half_ExponentBias  = Binary16Format.exponent_bias;
static constexpr uint32_t Half_MaxExponent   = static_cast<uint32_t>(Binary16Format.max_biased_exponent);
static constexpr uint32_t Half_SignMask      = uint32_t{1} << (Binary16Format.total_bits - 1);
static constexpr uint32_t Half_ExponentMask  = Half_MaxExponent << Half_MantissaBits;
static constexpr uint32_t Half_SignificandMask = (uint32_t{1} << Half_MantissaBits) - 1;
static constexpr uint32_t Half_QuietBit      = uint32_t{1} << (Half_MantissaBits - 1);

Float16 ieeeparse::SingleToFloat16(float value)
{
    using Single = IEEE<float>;

    // Number of fraction bits dropped when going from 23 to 10 bits.
    static constexpr int DroppedBits = Single::MantissaBits - Half_MantissaBits; // = 13

    const uint32_t bits = Single::ToBits(value);
    const uint32_t sign = (bits & Single::SignMask) != 0 ? Half_SignMask : 0;
    const int exponent = static_cast<int>((bits & Single::ExponentMask) >> Single::MantissaBits);
    const uint32_t fraction = bits & Single::SignificandMask;

    if (exponent == Single::MaxBiasedExponent)
    {
        if (fraction == 0)
            return {static_cast<uint16_t>(sign | Half_ExponentMask)};

        // Keep the upper payload bits, but make sure the result is a quiet NaN.
        return {static_cast<uint16_t>(sign | Half_ExponentMask | Half_QuietBit | (fraction >> DroppedBits))};
    }

    // Biased binary16 exponent, assuming a normalized result.
    const int half_exponent = exponent - Single::ExponentBias + Half_ExponentBias;
    if (half_exponent >= static_cast<int>(Half_MaxExponent))
    {
        // Overflow.
        return {static_cast<uint16_t>(sign | Half_ExponentMask)};
    }

    uint32_t significand;
    int shift;
    if (half_exponent <= 0)
    {
        // The result is subnormal (or zero).
        // Single-precision subnormals are far below the binary16 range and are handled here, too:
        // the shift is large enough to flush them to zero.
        significand = Single::HiddenBit | fraction;
        shift = DroppedBits + 1 - half_exponent;
        if (shift > Single::MantissaBits + 1)
        {
            // Less than or equal to half the smallest subnormal: rounds to +-0.
            return {static_cast<uint16_t>(sign)};
        }
    }
    else
    {
        // Subtract the hidden bit here, the exponent is added back below.
        significand = fraction;
        shift = DroppedBits;
    }

    // Round to nearest, ties to even.
    const uint32_t truncated = significand >> shift;
    const uint32_t last_removed_bit = (significand >> (shift - 1)) & 1;
    const bool trailing_zeros = pow5::MultipleOfPow2(significand, shift - 1);
    const bool round_up = last_removed_bit != 0 && (!trailing_zeros || (truncated & 1) != 0);

    // A carry out of the significand correctly increments the exponent, and rounding up the
    // largest finite number correctly produces infinity.
    const uint32_t biased_exponent = half_exponent <= 0 ? 0u : static_cast<uint32_t>(half_exponent);
    const uint32_t half = (biased_exponent << Half_MantissaBits) + truncated + (round_up ? 1u : 0u);

    return {static_cast<uint16_t>(sign | half)};
}

float ieeeparse::Float16ToSingle(Float16 value)
{
    using Single = IEEE<float>;

    static constexpr int DroppedBits = Single::MantissaBits - Half_MantissaBits;

    const uint32_t bits = value.bits;
    const uint32_t sign = (bits & Half_SignMask) != 0 ? Single::SignMask : 0;
    const uint32_t exponent = (bits & Half_ExponentMask) >> Half_MantissaBits;
    uint32_t fraction = bits & Half_SignificandMask;

    if (exponent == Half_MaxExponent)
        return Single::FromBits(sign | Single::ExponentMask | (fraction << DroppedBits));

    if (exponent == 0)
    {
        if (fraction == 0)
            return Single::FromBits(sign);

        // Normalize the subnormal input.
        const int msb = pow5::FloorLog2(fraction);
        fraction = (fraction << (Half_MantissaBits - msb)) & Half_SignificandMask;

        const int e = msb - Half_MantissaBits + 1 - Half_ExponentBias + Single::ExponentBias;
        return Single::FromBits(sign | static_cast<uint32_t>(e) << Single::MantissaBits | (fraction << DroppedBits));
    }

    const uint32_t e = exponent + static_cast<uint32_t>(Single::ExponentBias - Half_ExponentBias);
    return Single::FromBits(sign | e << Single::MantissaBits | (fraction << DroppedBits));
}

//==================================================================================================
// binary64 --> binary128
//==================================================================================================

Float128 ieeeparse::DoubleToFloat128(double value)
{
    using Double = IEEE<double>;

    static constexpr int      Quad_MantissaBits = Binary128Format.mantissa_bits;
    static constexpr int      Quad_ExponentBias = Binary128Format.exponent_bias;
    static constexpr uint64_t Quad_MaxExponent  = static_cast<uint64_t>(Binary128Format.max_biased_exponent);
    static constexpr uint64_t Quad_QuietBit     = uint64_t{1} << (Quad_MantissaBits - 1 - 64);

    // The 52-bit fraction is stored at the top of the 112-bit fraction:
    // the upper 48 bits end up in 'hi', the lower 4 bits in 'lo'.
    static constexpr int HiFractionBits = Quad_MantissaBits - 64;                 // = 48
    static constexpr int LoShift = 64 - (Double::MantissaBits - HiFractionBits);  // = 60

    const uint64_t bits = Double::ToBits(value);
    const uint64_t sign = bits & Double::SignMask;
    const int exponent = static_cast<int>((bits & Double::ExponentMask) >> Double::MantissaBits);
    uint64_t fraction = bits & Double::SignificandMask;

    uint64_t quad_exponent;
    if (exponent == Double::MaxBiasedExponent)
    {
        quad_exponent = Quad_MaxExponent;
    }
    else if (exponent == 0)
    {
        if (fraction == 0)
            return {{sign, 0}};

        // Normalize the subnormal input. Every subnormal double is a normal quad.
        const int msb = pow5::FloorLog2(fraction);
        fraction = (fraction << (Double::MantissaBits - msb)) & Double::SignificandMask;
        quad_exponent = static_cast<uint64_t>(msb - Double::MantissaBits + 1 - Double::ExponentBias + Quad_ExponentBias);
    }
    else
    {
        quad_exponent = static_cast<uint64_t>(exponent - Double::ExponentBias + Quad_ExponentBias);
    }

    uint64_t hi = sign | quad_exponent << HiFractionBits | (fraction >> (Double::MantissaBits - HiFractionBits));
    const uint64_t lo = fraction << LoShift;

    if (exponent == Double::MaxBiasedExponent && fraction != 0)
        hi |= Quad_QuietBit;

    return {{hi, lo}};
}
