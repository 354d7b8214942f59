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

#include "ieeeparse.h"

#include "decimal.h"
#include "ieee.h"
#include "to_binary.h"

#include <cstdint>

using namespace ieeeparse;

//==================================================================================================
// Special values
//==================================================================================================

namespace {
enum class SpecialKind {
    none,
    nan,
    positive_infinity,
    negative_infinity,
};
}

static inline bool IsLowerASCII(char ch)
{
    return 'a' <= ch && ch <= 'z';
}

static inline char ToLowerASCII(char ch)
{
    return static_cast<char>(static_cast<unsigned char>(ch) | 0x20);
}

// Returns whether [next, last) equals lower_case_str, ignoring the case of letters.
// Other characters must match exactly: folding '\r' with 0x20 would give '-'.
static inline bool EqualsIgnoreCase(const char* next, const char* last, const char* lower_case_str)
{
    for ( ; next != last && *lower_case_str != '\0'; ++next, ++lower_case_str)
    {
        const char ch = *lower_case_str;
        if (IsLowerASCII(ch) ? ToLowerASCII(*next) != ch : *next != ch)
            return false;
    }

    return next == last && *lower_case_str == '\0';
}

static inline SpecialKind ClassifySpecial(const char* next, const char* last)
{
    // All special literals have 3 or 4 characters.
    const auto len = last - next;
    if (len != 3 && len != 4)
        return SpecialKind::none;

    if (EqualsIgnoreCase(next, last, "nan"))
        return SpecialKind::nan;
    if (EqualsIgnoreCase(next, last, "inf") || EqualsIgnoreCase(next, last, "+inf"))
        return SpecialKind::positive_infinity;
    if (EqualsIgnoreCase(next, last, "-inf"))
        return SpecialKind::negative_infinity;

    return SpecialKind::none;
}

//==================================================================================================
// ParseFloat
//==================================================================================================

template <typename Float>
static inline ParseResult ParseIeee(const char* next, const char* last, typename IEEE<Float>::bits_type& bits)
{
    using Traits = IEEE<Float>;
    using bits_type = typename Traits::bits_type;

    switch (ClassifySpecial(next, last))
    {
    case SpecialKind::nan:
        bits = Traits::QuietNaN();
        return {last, ParseStatus::ok};
    case SpecialKind::positive_infinity:
        bits = Traits::Infinity(false);
        return {last, ParseStatus::ok};
    case SpecialKind::negative_infinity:
        bits = Traits::Infinity(true);
        return {last, ParseStatus::ok};
    case SpecialKind::none:
        break;
    }

    DecimalValue dec;
    const auto res = ScanDecimal(next, last, Traits::Format, dec);
    if (res.status != ParseStatus::ok)
        return res;

    switch (dec.kind)
    {
    case DecimalKind::zero:
        bits = Traits::Zero(dec.sign);
        break;
    case DecimalKind::infinity:
        bits = Traits::Infinity(dec.sign);
        break;
    case DecimalKind::finite:
        {
            // The lexer keeps at most MaxSignificantDigits digits, so the mantissa fits.
            const auto m10 = static_cast<bits_type>(dec.mantissa);
            IEEEPARSE_ASSERT(m10 == dec.mantissa);
            bits = ToIeee<Float>(ToBinary<Float>(m10, dec.mantissa_digits, dec.exponent), dec.sign);
        }
        break;
    }

    return res;
}

ParseResult ieeeparse::ParseFloat(const char* next, const char* last, float& value)
{
    uint32_t bits;
    const auto res = ParseIeee<float>(next, last, bits);
    if (res.status == ParseStatus::ok)
        value = IEEE<float>::FromBits(bits);

    return res;
}

ParseResult ieeeparse::ParseFloat(const char* next, const char* last, double& value)
{
    uint64_t bits;
    const auto res = ParseIeee<double>(next, last, bits);
    if (res.status == ParseStatus::ok)
        value = IEEE<double>::FromBits(bits);

    return res;
}

ParseResult ieeeparse::ParseFloat(const char* next, const char* last, Float16& value)
{
    // NaN maps directly to the canonical binary16 pattern, bypassing single precision.
    if (ClassifySpecial(next, last) == SpecialKind::nan)
    {
        value.bits = 0x7E00;
        return {last, ParseStatus::ok};
    }

    float f;
    const auto res = ParseFloat(next, last, f);
    if (res.status == ParseStatus::ok)
        value = SingleToFloat16(f);

    return res;
}

ParseResult ieeeparse::ParseFloat(const char* next, const char* last, Float128& value)
{
    // NaN maps directly to the canonical binary128 pattern, bypassing double precision.
    if (ClassifySpecial(next, last) == SpecialKind::nan)
    {
        value.bits = {0x7FFF800000000000, 0};
        return {last, ParseStatus::ok};
    }

    double f;
    const auto res = ParseFloat(next, last, f);
    if (res.status == ParseStatus::ok)
        value = DoubleToFloat128(f);

    return res;
}
