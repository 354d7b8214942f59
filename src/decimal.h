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
#include "ieeeparse.h"

#include <cstdint>

namespace ieeeparse {

enum class DecimalKind {
    finite,   // mantissa * 10^exponent, within the format's decimal range
    zero,     // rounds to +-0
    infinity, // rounds to +-Infinity
};

struct DecimalValue {
    DecimalKind kind;
    bool sign;
    uint64_t mantissa;   // at most max_significant_digits digits
    int mantissa_digits; // number of decimal digits in mantissa
    int exponent;
};

// Decomposes [next, last) into sign * mantissa * 10^exponent.
// Only the numeric grammar is accepted here; special values must be handled by the caller.
ParseResult ScanDecimal(const char* next, const char* last, const FormatDescriptor& format, DecimalValue& value);

} // namespace ieeeparse
