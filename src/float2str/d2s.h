// Copyright 2020 Ulf Adams
// Copyright 2020 Alexander Bolz
//
// Distributed under the Boost Software License, Version 1.0.
//  (See accompanying file LICENSE_1_0.txt or copy at https://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include "float2str.h"

#include <cstdint>

namespace float2str {
namespace impl {

// Computes the shortest decimal representation mantissa * 10^exponent which rounds back to the
// double-precision number given by its stored mantissa and biased exponent fields.
//
// PRE: The number is finite and not zero, i.e. ieee_exponent != 2047 and
//      (ieee_exponent != 0 || ieee_mantissa != 0).
FloatingDecimal64 ToDecimal64(uint64_t ieee_mantissa, uint32_t ieee_exponent);

} // namespace impl
} // namespace float2str
