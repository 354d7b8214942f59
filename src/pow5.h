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

#include <cstdint>
#if _MSC_VER
#include <intrin.h>
#endif

//--------------------------------------------------------------------------------------------------
// Fixed-width arithmetic with powers of 5 and powers of 2.
//
// The 32-bit overloads serve single precision, the 64-bit overloads serve double precision.
// Both are exact for the exponent ranges which pass the lexer's early-out thresholds, i.e.
//  single:  0 <= e5 <= 38 (multiply), 0 <= e5 <= 54  (divide)
//  double:  0 <= e5 <= 308 (multiply), 0 <= e5 <= 340 (divide)
//--------------------------------------------------------------------------------------------------

namespace ieeeparse {
namespace pow5 {

// Returns floor(x / 2^n).
inline int FloorDivPow2(int x, int n)
{
    // Technically, right-shift of negative integers is implementation defined...
    // Should easily be optimized into SAR (or equivalent) instruction.
    return x < 0 ? ~(~x >> n) : (x >> n);
}

// Returns floor(log_2(5^e))
inline int FloorLog2Pow5(int e)
{
    IEEEPARSE_ASSERT(e >= -1764);
    IEEEPARSE_ASSERT(e <=  1763);
    return FloorDivPow2(e * 1217359, 19);
}

// Returns ceil(log_2(5^e)) for e > 0, and 1 for e = 0.
// This is the number of bits required to represent 5^e.
inline int CeilLog2Pow5(int e)
{
    return FloorLog2Pow5(e) + 1;
}

inline int FloorLog2(uint32_t x)
{
    IEEEPARSE_ASSERT(x != 0);

#if defined(__GNUC__) || defined(__clang__)
    return 31 - __builtin_clz(x);
#elif defined(_MSC_VER)
    unsigned long index;
    _BitScanReverse(&index, x);
    return static_cast<int>(index);
#else
    int l2 = 0;
    for (;;)
    {
        x >>= 1;
        if (x == 0)
            break;
        ++l2;
    }
    return l2;
#endif
}

inline int FloorLog2(uint64_t x)
{
    IEEEPARSE_ASSERT(x != 0);

#if defined(__GNUC__) || defined(__clang__)
    return 63 - __builtin_clzll(x);
#elif defined(_MSC_VER) && defined(_M_X64)
    unsigned long index;
    _BitScanReverse64(&index, x);
    return static_cast<int>(index);
#else
    int l2 = 0;
    for (;;)
    {
        x >>= 1;
        if (x == 0)
            break;
        ++l2;
    }
    return l2;
#endif
}

// Returns floor(value * 5^e5 / 2^e2).
uint32_t MulPow5DivPow2(uint32_t value, int e5, int e2);
uint64_t MulPow5DivPow2(uint64_t value, int e5, int e2);

// Returns floor(value / (5^e5 * 2^e2)).
// e2 may be negative, in which case the value is scaled up by 2^-e2.
uint32_t MulPow5InvDivPow2(uint32_t value, int e5, int e2);
uint64_t MulPow5InvDivPow2(uint64_t value, int e5, int e2);

// Returns whether value is divisible by 2^e2.
inline bool MultipleOfPow2(uint32_t value, int e2)
{
    IEEEPARSE_ASSERT(e2 >= 0);
    IEEEPARSE_ASSERT(e2 <= 31);

    return (value & ((uint32_t{1} << e2) - 1)) == 0;
}

inline bool MultipleOfPow2(uint64_t value, int e2)
{
    IEEEPARSE_ASSERT(e2 >= 0);
    IEEEPARSE_ASSERT(e2 <= 63);

    return (value & ((uint64_t{1} << e2) - 1)) == 0;
}

// Returns whether value is divisible by 5^e5.
bool MultipleOfPow5(uint32_t value, int e5);
bool MultipleOfPow5(uint64_t value, int e5);

} // namespace pow5
} // namespace ieeeparse
