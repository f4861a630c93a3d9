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

// Single-precision version of ToDecimal64.
//
// PRE: The number is finite and not zero.
FloatingDecimal32 ToDecimal32(uint32_t ieee_mantissa, uint32_t ieee_exponent);

} // namespace impl
} // namespace float2str
