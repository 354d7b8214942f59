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

#include <cstdint>

namespace ieeeparse {

// IEEE-754 binary16 bit pattern.
struct Float16 {
    uint16_t bits;
};

struct Uint128 {
    uint64_t hi; // sign, exponent and the upper 48 fraction bits
    uint64_t lo;
};

// IEEE-754 binary128 bit pattern.
struct Float128 {
    Uint128 bits;
};

enum class ParseStatus {
    ok,
    invalid_character,
};

struct ParseResult {
    const char* next;
    ParseStatus status;
};

//--------------------------------------------------------------------------------------------------
// ParseFloat converts the decimal number in [next, last) into the closest binary floating-point
// number (round-to-nearest, ties-to-even).
//
// Grammar:
//      "nan" | "inf" | "+inf" | "-inf"                           (case-insensitive)
//      [+-]? digit* ("." digit*)? ([eE] [+-]? digit+)?
//
// The whole input must match. Leading or trailing whitespace is an error. On success,
// 'value' is assigned and the result is {last, ok}. On failure, 'value' is left unchanged and
// 'next' points to the first offending character.
//
// Correct rounding is guaranteed if the input has at most 9 (single) or 17 (double)
// significant digits. Further digits are accepted, but truncated.
//
// Half precision is computed in single precision and rounded afterwards; quad precision is
// computed in double precision and converted exactly afterwards.
//--------------------------------------------------------------------------------------------------

ParseResult ParseFloat(const char* next, const char* last, Float16& value);
ParseResult ParseFloat(const char* next, const char* last, float& value);
ParseResult ParseFloat(const char* next, const char* last, double& value);
ParseResult ParseFloat(const char* next, const char* last, Float128& value);

// Round-to-nearest-even conversion from single to half precision.
Float16 SingleToFloat16(float value);

// Exact conversion from half to single precision.
float Float16ToSingle(Float16 value);

// Exact conversion from double to quad precision.
Float128 DoubleToFloat128(double value);

} // namespace ieeeparse
