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

#include <cassert>
#include <cstdint>
#include <cstring>
#include <limits>

#ifndef IEEEPARSE_ASSERT
#define IEEEPARSE_ASSERT(X) assert(X)
#endif

#ifndef IEEEPARSE_FORCE_INLINE
#if _MSC_VER
#define IEEEPARSE_FORCE_INLINE __forceinline
#elif __GNUC__
#define IEEEPARSE_FORCE_INLINE __attribute__((always_inline)) inline
#else
#define IEEEPARSE_FORCE_INLINE inline
#endif
#endif

namespace ieeeparse {

//==================================================================================================
// Format descriptors
//==================================================================================================

struct FormatDescriptor
{
    int total_bits;
    int mantissa_bits;          // stored fraction bits, without the hidden bit
    int exponent_bits;
    int exponent_bias;
    int max_significant_digits; // digits beyond this are dropped by the lexer
    int min_dec_exponent;       // digits + e10 <= min_dec_exponent  ==>  +-0
    int max_dec_exponent;       // digits + e10 >= max_dec_exponent  ==>  +-Infinity
    int max_biased_exponent;    // all-ones exponent field
};

constexpr bool IsStandardLayout(const FormatDescriptor& f)
{
    return f.mantissa_bits + f.exponent_bits + 1 == f.total_bits
        && f.max_biased_exponent == (1 << f.exponent_bits) - 1
        && f.exponent_bias == (1 << (f.exponent_bits - 1)) - 1;
}

//                                               width mant  exp   bias digits   min_dec max_dec  max_biased
inline constexpr FormatDescriptor Binary16Format  {  16,  10,   5,    15,     5,      -8,      6,     0x1F  };
inline constexpr FormatDescriptor Binary32Format  {  32,  23,   8,   127,     9,     -46,     40,     0xFF  };
inline constexpr FormatDescriptor Binary64Format  {  64,  52,  11,  1023,    17,    -324,    310,    0x7FF  };
inline constexpr FormatDescriptor Binary128Format { 128, 112,  15, 16383,    36,   -4966,   4934,   0x7FFF  };

static_assert(IsStandardLayout(Binary16Format),  "invalid binary16 layout");
static_assert(IsStandardLayout(Binary32Format),  "invalid binary32 layout");
static_assert(IsStandardLayout(Binary64Format),  "invalid binary64 layout");
static_assert(IsStandardLayout(Binary128Format), "invalid binary128 layout");

//==================================================================================================
// IEEE traits for the natively supported formats
//==================================================================================================

namespace impl {

template <typename Dest, typename Source>
inline Dest ReinterpretBits(Source source)
{
    static_assert(sizeof(Dest) == sizeof(Source), "size mismatch");

    Dest dest;
    std::memcpy(&dest, &source, sizeof(Source));
    return dest;
}

template <int Precision> struct BitsType;
template <> struct BitsType<24> { using type = uint32_t; };
template <> struct BitsType<53> { using type = uint64_t; };

template <int Precision> struct FormatOf;
template <> struct FormatOf<24> { static constexpr FormatDescriptor value = Binary32Format; };
template <> struct FormatOf<53> { static constexpr FormatDescriptor value = Binary64Format; };

} // namespace impl

template <typename Float>
struct IEEE
{
    static_assert(std::numeric_limits<Float>::is_iec559 &&
                  ((std::numeric_limits<Float>::digits == 24 && std::numeric_limits<Float>::max_exponent == 128) ||
                   (std::numeric_limits<Float>::digits == 53 && std::numeric_limits<Float>::max_exponent == 1024)),
        "IEEE-754 single- or double-precision implementation required");

    using value_type = Float;
    using bits_type = typename impl::BitsType<std::numeric_limits<Float>::digits>::type;

    static constexpr FormatDescriptor Format = impl::FormatOf<std::numeric_limits<Float>::digits>::value;

    static constexpr int       MantissaBits         = Format.mantissa_bits;
    static constexpr int       ExponentBits         = Format.exponent_bits;
    static constexpr int       ExponentBias         = Format.exponent_bias;
    static constexpr int       MaxSignificantDigits = Format.max_significant_digits;
    static constexpr int       MinDecimalExponent   = Format.min_dec_exponent;
    static constexpr int       MaxDecimalExponent   = Format.max_dec_exponent;
    static constexpr int       MaxBiasedExponent    = Format.max_biased_exponent;

    static_assert(MantissaBits + 1 == std::numeric_limits<Float>::digits, "descriptor mismatch");
    static_assert(Format.total_bits == std::numeric_limits<bits_type>::digits, "descriptor mismatch");

    static constexpr bits_type HiddenBit            = bits_type{1} << MantissaBits;
    static constexpr bits_type SignificandMask      = HiddenBit - 1;
    static constexpr bits_type ExponentMask         = static_cast<bits_type>(MaxBiasedExponent) << MantissaBits;
    static constexpr bits_type SignMask             = ~(~bits_type{0} >> 1);
    static constexpr bits_type QuietBit             = HiddenBit >> 1;

    static constexpr bits_type Zero(bool sign) {
        return sign ? SignMask : bits_type{0};
    }

    static constexpr bits_type Infinity(bool sign) {
        return Zero(sign) | ExponentMask;
    }

    static constexpr bits_type QuietNaN() {
        return ExponentMask | QuietBit;
    }

    static value_type FromBits(bits_type bits) {
        return impl::ReinterpretBits<value_type>(bits);
    }

    static bits_type ToBits(value_type value) {
        return impl::ReinterpretBits<bits_type>(value);
    }
};

} // namespace ieeeparse
