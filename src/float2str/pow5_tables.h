// Copyright 2020 Ulf Adams
// Copyright 2020 Alexander Bolz
//
// Distributed under the Boost Software License, Version 1.0.
//  (See accompanying file LICENSE_1_0.txt or copy at https://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include <cstdint>

namespace float2str {
namespace impl {

struct Uint64x2 {
    uint64_t hi;
    uint64_t lo;
};

// Number of significant bits stored per table entry.
constexpr int32_t DoublePow5InvBitCount = 125;
constexpr int32_t DoublePow5BitCount = 125;

// The single-precision engine only uses the upper halves.
constexpr int32_t FloatPow5InvBitCount = DoublePow5InvBitCount - 64;
constexpr int32_t FloatPow5BitCount = DoublePow5BitCount - 64;

constexpr int32_t DoublePow5InvTableSize = 342;
constexpr int32_t DoublePow5TableSize = 326;

// For k >= 0, stores 5^-k in the form: floor(2^(Pow5Bits(k) - 1 + 125) / 5^k) + 1
extern const Uint64x2 DoublePow5InvSplit[DoublePow5InvTableSize];

// For k >= 0, stores 5^k in the form: floor(5^k / 2^(Pow5Bits(k) - 125))
extern const Uint64x2 DoublePow5Split[DoublePow5TableSize];

} // namespace impl
} // namespace float2str
