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

#include "decimal.h"

#include <cstddef>
#include <cstdint>

using namespace ieeeparse;

// Exponents with more significant digits than this are treated as +-infinity.
// The remaining digits are still scanned.
static constexpr int MaxExponentDigits = 6;

static inline bool IsDigit(char ch)
{
    return static_cast<unsigned>(ch - '0') <= 9u;
}

static inline int DigitValue(char ch)
{
    IEEEPARSE_ASSERT(IsDigit(ch));
    return ch - '0';
}

static inline void SetSpecial(DecimalValue& value, DecimalKind kind, bool sign)
{
    value.kind = kind;
    value.sign = sign;
    value.mantissa = 0;
    value.mantissa_digits = 0;
    value.exponent = 0;
}

ParseResult ieeeparse::ScanDecimal(const char* next, const char* last, const FormatDescriptor& format, DecimalValue& value)
{
    if (next == last)
        return {next, ParseStatus::invalid_character};

    uint64_t mantissa = 0;
    int mantissa_digits = 0;

    // Position of the decimal point.
    const char* dot = nullptr;
    // Position of the first digit which did not make it into the mantissa.
    const char* end = nullptr;

// [+-]

    const bool is_negative = (*next == '-');
    if (is_negative || *next == '+')
        ++next;

// int.frac

    for ( ; next != last; ++next)
    {
        const char ch = *next;
        if (ch == '.')
        {
            if (dot != nullptr)
                return {next, ParseStatus::invalid_character};

            dot = next;
            continue;
        }

        if (!IsDigit(ch))
            break;

        if (mantissa_digits < format.max_significant_digits)
        {
            // Leading zeros do not count as significant digits.
            mantissa = 10 * mantissa + static_cast<uint64_t>(DigitValue(ch));
            if (mantissa != 0)
                ++mantissa_digits;
        }
        else if (end == nullptr)
        {
            // Without bignums, we can't guarantee correct rounding here anyways.
            // Drop the digit, but remember where the mantissa ends.
            end = next;
        }
    }

    if (dot == nullptr)
        dot = next;
    if (end == nullptr)
        end = next;

    // Number of digits between the decimal point and the end of the mantissa.
    // This is negative if integral digits were dropped.
    int64_t num_fraction_digits = end - dot;
    if (end > dot)
        --num_fraction_digits;

// exp

    int64_t exponent = 0;
    if (next != last && (*next == 'e' || *next == 'E'))
    {
        ++next; // skip 'e' or 'E'

        bool exponent_is_negative = false;
        if (next != last && (*next == '-' || *next == '+'))
        {
            exponent_is_negative = (*next == '-');
            ++next;
        }

        if (next == last)
            return {next, ParseStatus::invalid_character};

        int parsed_exponent = 0;
        int exponent_digits = 0;
        bool exponent_overflow = false;
        for ( ; next != last; ++next)
        {
            if (!IsDigit(*next))
                return {next, ParseStatus::invalid_character};

            if (exponent_digits >= MaxExponentDigits)
            {
                exponent_overflow = true;
                continue;
            }

            parsed_exponent = 10 * parsed_exponent + DigitValue(*next);
            if (parsed_exponent != 0)
                ++exponent_digits;
        }

        if (exponent_overflow)
        {
            // x * 10^-inf = 0, 0 * 10^+inf = 0, and x * 10^+inf = inf.
            const bool is_zero = exponent_is_negative || mantissa == 0;
            SetSpecial(value, is_zero ? DecimalKind::zero : DecimalKind::infinity, is_negative);
            return {next, ParseStatus::ok};
        }

        exponent = exponent_is_negative ? -parsed_exponent : parsed_exponent;
    }

    if (next != last)
        return {next, ParseStatus::invalid_character};

    exponent -= num_fraction_digits;

    if (mantissa == 0 || mantissa_digits + exponent <= format.min_dec_exponent)
    {
        // Number is less than representable and should be rounded down to 0; return +/-0.0.
        SetSpecial(value, DecimalKind::zero, is_negative);
        return {next, ParseStatus::ok};
    }

    if (mantissa_digits + exponent >= format.max_dec_exponent)
    {
        // Number is larger than representable and should be rounded to +/-Infinity.
        SetSpecial(value, DecimalKind::infinity, is_negative);
        return {next, ParseStatus::ok};
    }

    value.kind = DecimalKind::finite;
    value.sign = is_negative;
    value.mantissa = mantissa;
    value.mantissa_digits = mantissa_digits;
    value.exponent = static_cast<int>(exponent);
    return {next, ParseStatus::ok};
}
