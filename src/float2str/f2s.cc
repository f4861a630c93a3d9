// Copyright 2020 Ulf Adams
// Copyright 2020 Alexander Bolz
//
// Distributed under the Boost Software License, Version 1.0.
//  (See accompanying file LICENSE_1_0.txt or copy at https://www.boost.org/LICENSE_1_0.txt)

#include "f2s.h"

#include "common.h"
#include "ieee.h"
#include "pow5_tables.h"

#include <climits>
#include <cstdint>

namespace float2str {
namespace impl {

//==================================================================================================
// MulShift
//==================================================================================================

// Returns floor(m * factor / 2^shift).
//
// The single-precision engine only uses the upper 64 bits of the double-precision tables. For all
// inputs 54 <= shift <= 61 and m has at most 26 bits.
static inline uint32_t MulShift32(uint32_t m, uint64_t factor, int32_t shift)
{
    FLOAT2STR_ASSERT(shift > 32);

    const uint32_t factor_lo = static_cast<uint32_t>(factor);
    const uint32_t factor_hi = static_cast<uint32_t>(factor >> 32);
    const uint64_t bits0 = uint64_t{m} * factor_lo;
    const uint64_t bits1 = uint64_t{m} * factor_hi;

    const uint64_t sum = (bits0 >> 32) + bits1;
    const uint64_t shifted_sum = sum >> (shift - 32);
    FLOAT2STR_ASSERT(shifted_sum <= UINT32_MAX);
    return static_cast<uint32_t>(shifted_sum);
}

static inline uint32_t MulPow5InvDivPow2(uint32_t m, int32_t q, int32_t j)
{
    FLOAT2STR_ASSERT(q >= 0);
    FLOAT2STR_ASSERT(q < DoublePow5InvTableSize);
    // The truncated reciprocal must stay an upper bound after dropping the low half.
    return MulShift32(m, DoublePow5InvSplit[q].hi + 1, j);
}

static inline uint32_t MulPow5DivPow2(uint32_t m, int32_t i, int32_t j)
{
    FLOAT2STR_ASSERT(i >= 0);
    FLOAT2STR_ASSERT(i < DoublePow5TableSize);
    return MulShift32(m, DoublePow5Split[i].hi, j);
}

//==================================================================================================
// ToDecimal32
//==================================================================================================

FloatingDecimal32 ToDecimal32(uint32_t ieee_mantissa, uint32_t ieee_exponent)
{
    FLOAT2STR_ASSERT(ieee_exponent < Single::MaxIeeeExponent);
    FLOAT2STR_ASSERT(ieee_exponent != 0 || ieee_mantissa != 0);

    //
    // Step 1:
    // Decode the floating point number, and unify normalized and subnormal cases.
    //
    // We subtract 2 so that the bounds computation has 2 additional bits.

    int32_t e2;
    uint32_t m2;
    if (ieee_exponent == 0)
    {
        e2 = 1 - Single::ExponentBias - Single::MantissaBits - 2;
        m2 = ieee_mantissa;
    }
    else
    {
        e2 = static_cast<int32_t>(ieee_exponent) - Single::ExponentBias - Single::MantissaBits - 2;
        m2 = Single::HiddenBit | ieee_mantissa;
    }

    const bool even = (m2 & 1) == 0;
    const bool accept_bounds = even;

    //
    // Step 2:
    // Determine the interval of valid decimal representations.
    //

    const uint32_t mv = 4 * m2;
    const uint32_t mp = 4 * m2 + 2;
    const uint32_t mm_shift = (ieee_mantissa != 0 || ieee_exponent <= 1) ? 1 : 0;
    const uint32_t mm = 4 * m2 - 1 - mm_shift;

    //
    // Step 3:
    // Convert to a decimal power base using 64-bit arithmetic.
    //

    uint32_t vr;
    uint32_t vp;
    uint32_t vm;
    int32_t e10;
    bool vm_is_trailing_zeros = false;
    bool vr_is_trailing_zeros = false;
    uint32_t last_removed_digit = 0;
    if (e2 >= 0)
    {
        const int32_t q = Log10Pow2(e2);
        e10 = q;

        const int32_t k = FloatPow5InvBitCount + Pow5Bits(q) - 1;
        const int32_t i = -e2 + q + k;
        vr = MulPow5InvDivPow2(mv, q, i);
        vp = MulPow5InvDivPow2(mp, q, i);
        vm = MulPow5InvDivPow2(mm, q, i);

        if (q != 0 && (vp - 1) / 10 <= vm / 10)
        {
            // We need to know one removed digit even if we are not going to loop below.
            // Using q - 1 above would require 33 bits for the result.
            const int32_t l = FloatPow5InvBitCount + Pow5Bits(q - 1) - 1;
            last_removed_digit = MulPow5InvDivPow2(mv, q - 1, -e2 + q - 1 + l) % 10;
        }

        // 9 = floor(log_5(2^24))
        if (q <= 9)
        {
            // Only one of mp, mv, and mm can be a multiple of 5, if any.
            if (mv % 5 == 0)
            {
                vr_is_trailing_zeros = MultipleOfPow5(mv, q);
            }
            else if (accept_bounds)
            {
                vm_is_trailing_zeros = MultipleOfPow5(mm, q);
            }
            else
            {
                vp -= MultipleOfPow5(mp, q);
            }
        }
    }
    else
    {
        const int32_t q = Log10Pow5(-e2);
        e10 = q + e2;

        const int32_t i = -e2 - q;
        const int32_t k = Pow5Bits(i) - FloatPow5BitCount;
        int32_t j = q - k;
        vr = MulPow5DivPow2(mv, i, j);
        vp = MulPow5DivPow2(mp, i, j);
        vm = MulPow5DivPow2(mm, i, j);

        if (q != 0 && (vp - 1) / 10 <= vm / 10)
        {
            j = q - 1 - (Pow5Bits(i + 1) - FloatPow5BitCount);
            last_removed_digit = MulPow5DivPow2(mv, i + 1, j) % 10;
        }

        if (q <= 1)
        {
            // {vr,vp,vm} is trailing zeros if {mv,mp,mm} has at least q trailing 0 bits.
            // mv = 4 * m2, so it always has at least two trailing 0 bits.
            vr_is_trailing_zeros = true;
            if (accept_bounds)
            {
                // mm = mv - 1 - mm_shift, so it has 1 trailing 0 bit iff mm_shift == 1.
                vm_is_trailing_zeros = mm_shift == 1;
            }
            else
            {
                // mp = mv + 2, so it always has at least one trailing 0 bit.
                --vp;
            }
        }
        else if (q < 31)
        {
            vr_is_trailing_zeros = MultipleOfPow2(mv, q - 1);
        }
    }

    //
    // Step 4:
    // Find the shortest decimal representation in the interval of valid representations.
    //

    int32_t removed = 0;
    uint32_t output;
    if /*unlikely*/ (vm_is_trailing_zeros || vr_is_trailing_zeros)
    {
        // General case. Track whether all removed digits are zeros.
        while (vp / 10 > vm / 10)
        {
            vm_is_trailing_zeros &= vm % 10 == 0;
            vr_is_trailing_zeros &= last_removed_digit == 0;
            last_removed_digit = vr % 10;
            vr /= 10;
            vp /= 10;
            vm /= 10;
            ++removed;
        }

        if (vm_is_trailing_zeros)
        {
            while (vm % 10 == 0)
            {
                vr_is_trailing_zeros &= last_removed_digit == 0;
                last_removed_digit = vr % 10;
                vr /= 10;
                vp /= 10;
                vm /= 10;
                ++removed;
            }
        }

        if (vr_is_trailing_zeros && last_removed_digit == 5 && vr % 2 == 0)
        {
            // Round even if the exact number is .....50..0.
            last_removed_digit = 4;
        }

        // We need to take vr + 1 if vr is outside bounds or we need to round up.
        output = vr + ((vr == vm && (!accept_bounds || !vm_is_trailing_zeros)) || last_removed_digit >= 5);
    }
    else
    {
        // Specialized for the common case.
        while (vp / 10 > vm / 10)
        {
            last_removed_digit = vr % 10;
            vr /= 10;
            vp /= 10;
            vm /= 10;
            ++removed;
        }

        // We need to take vr + 1 if vr is outside bounds or we need to round up.
        output = vr + (vr == vm || last_removed_digit >= 5);
    }

    FLOAT2STR_ASSERT(output != 0);
    FLOAT2STR_ASSERT(output <= 999999999u);

    return {output, e10 + removed};
}

} // namespace impl
} // namespace float2str
