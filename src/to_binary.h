// Copyright 2019 Ulf Adams
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

#pragma once

#include "ieee.h"
#include "pow5.h"

#include <algorithm>
#include <limits>

namespace ieeeparse {

// Returns the number of decimal digits in v.
template <typename UInt>
inline int DecimalLength(UInt v)
{
    int len = 1;
    for (UInt p = 10; len < std::numeric_limits<UInt>::digits10 + 1 && v >= p; p *= 10)
        ++len;
    return len;
}

template <typename Float>
struct BinaryValue {
    using bits_type = typename IEEE<Float>::bits_type;

    bits_type mantissa; // MantissaBits + 2 or MantissaBits + 3 bits
    int exponent;       // base 2
    bool is_exact;      // mantissa * 2^exponent is the exact value of the input
};

//==================================================================================================
// ToBinary
//
// Converts m10 * 10^e10 into m2 * 2^e2, where m2 holds at least MantissaBits + 2 bits, and
// records whether m2 * 2^e2 == m10 * 10^e10.
//
// PRE: m10 != 0
// PRE: m10_digits == DecimalLength(m10) <= MaxSignificantDigits
// PRE: MinDecimalExponent < m10_digits + e10 < MaxDecimalExponent
//==================================================================================================

template <typename Float>
IEEEPARSE_FORCE_INLINE BinaryValue<Float> ToBinary(typename IEEE<Float>::bits_type m10, int m10_digits, int e10)
{
    using Traits = IEEE<Float>;
    using bits_type = typename Traits::bits_type;

    static constexpr int MantissaBits = Traits::MantissaBits;
    static constexpr int BitsTypeWidth = std::numeric_limits<bits_type>::digits;

    IEEEPARSE_ASSERT(m10 != 0);
    IEEEPARSE_ASSERT(m10_digits == DecimalLength(m10));
    IEEEPARSE_ASSERT(m10_digits <= Traits::MaxSignificantDigits);
    IEEEPARSE_ASSERT(m10_digits + e10 > Traits::MinDecimalExponent);
    IEEEPARSE_ASSERT(m10_digits + e10 < Traits::MaxDecimalExponent);

    BinaryValue<Float> bin;

    if (e10 >= 0)
    {
        // The length of m10 * 10^e10 in bits is:
        //   log2(m10 * 10^e10) = log2(m10) + e10 + log2(5^e10)
        // We want to compute the (MantissaBits + 1) top-most bits (+1 for the implicit leading
        // one in IEEE format). We round down so that we get at least this many bits; better to
        // have an additional bit than to not have enough bits.
        bin.exponent = pow5::FloorLog2(m10) + e10 + pow5::FloorLog2Pow5(e10) - (MantissaBits + 1);

        // m2 = floor(m10 * 10^e10 / 2^e2)
        //    = floor(m10 * 5^e10 / 2^(e2 - e10))
        bin.mantissa = pow5::MulPow5DivPow2(m10, e10, bin.exponent - e10);

        // The result is exact iff 2^(e2 - e10) divides m10 * 5^e10, i.e. iff it divides m10.
        bin.is_exact = bin.exponent < e10
            || (bin.exponent - e10 < BitsTypeWidth && pow5::MultipleOfPow2(m10, bin.exponent - e10));
    }
    else
    {
        bin.exponent = pow5::FloorLog2(m10) + e10 - pow5::CeilLog2Pow5(-e10) - (MantissaBits + 1);

        // m2 = floor(m10 * 10^e10 / 2^e2)
        //    = floor(m10 / (5^-e10 * 2^(e2 - e10)))
        bin.mantissa = pow5::MulPow5InvDivPow2(m10, -e10, bin.exponent - e10);

        // If e2 > e10, the result is exact iff 5^-e10 * 2^(e2 - e10) divides m10.
        // Otherwise it is exact iff 5^-e10 divides m10 * 2^(e10 - e2), i.e. iff it divides m10.
        bin.is_exact = (bin.exponent < e10
                || (bin.exponent - e10 < BitsTypeWidth && pow5::MultipleOfPow2(m10, bin.exponent - e10)))
            && pow5::MultipleOfPow5(m10, -e10);
    }

    IEEEPARSE_ASSERT(bin.mantissa != 0);
    return bin;
}

//==================================================================================================
// ToIeee
//
// Rounds m2 * 2^e2 to the nearest representable number (ties-to-even) and returns the IEEE bit
// pattern, including the sign.
//==================================================================================================

inline int ExtractBit(uint32_t x, int n)
{
    IEEEPARSE_ASSERT(n >= 0);
    IEEEPARSE_ASSERT(n <= 31);
    return (x & (uint32_t{1} << n)) != 0;
}

inline int ExtractBit(uint64_t x, int n)
{
    IEEEPARSE_ASSERT(n >= 0);
    IEEEPARSE_ASSERT(n <= 63);
    return (x & (uint64_t{1} << n)) != 0;
}

template <typename Float>
IEEEPARSE_FORCE_INLINE typename IEEE<Float>::bits_type ToIeee(const BinaryValue<Float>& bin, bool sign)
{
    using Traits = IEEE<Float>;
    using bits_type = typename Traits::bits_type;

    static constexpr int MantissaBits = Traits::MantissaBits;
    static constexpr int ExponentBias = Traits::ExponentBias;

    const auto m2 = bin.mantissa;
    const auto e2 = bin.exponent;

    // Compute the final IEEE exponent.
    int ieee_e2 = std::max(0, e2 + ExponentBias + pow5::FloorLog2(m2));
    if (ieee_e2 > Traits::MaxBiasedExponent - 1)
    {
        // Overflow:
        // Final IEEE exponent is larger than the maximum representable.
        return Traits::Infinity(sign);
    }

    // We need to figure out how much we need to shift m2.
    // The tricky part is that we need to take the final IEEE exponent into account, so we need to
    // reverse the bias and also special-case the value 0.
    const int shift = (ieee_e2 == 0 ? 1 : ieee_e2) - e2 - ExponentBias - MantissaBits;
    IEEEPARSE_ASSERT(shift > 0);
    IEEEPARSE_ASSERT(shift < std::numeric_limits<bits_type>::digits);

    // We need to round up if the exact value is more than 0.5 above the value we computed. That's
    // equivalent to checking if the last removed bit was 1 and either the value was not just
    // trailing zeros or the result would otherwise be odd.
    const bool trailing_zeros
        = bin.is_exact && pow5::MultipleOfPow2(m2, shift - 1);
    const int last_removed_bit
        = ExtractBit(m2, shift - 1);
    const bool round_up
        = last_removed_bit != 0 && (!trailing_zeros || ExtractBit(m2, shift) != 0);

    bits_type significand = static_cast<bits_type>((m2 >> shift) + (round_up ? 1 : 0));
    IEEEPARSE_ASSERT(significand <= 2 * Traits::HiddenBit);

    significand &= Traits::SignificandMask;

    if (significand == 0 && round_up)
    {
        // Rounding up did overflow the p-bit significand.
        // Move a trailing zero of the significand into the exponent.
        // Due to how the IEEE represents +/-Infinity, we don't need to check for overflow here.
        ++ieee_e2;
    }

    IEEEPARSE_ASSERT(ieee_e2 <= Traits::MaxBiasedExponent);
    return Traits::Zero(sign) | static_cast<bits_type>(ieee_e2) << MantissaBits | significand;
}

} // namespace ieeeparse
