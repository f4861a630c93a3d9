// Copyright 2020 Ulf Adams
// Copyright 2020 Alexander Bolz
//
// Distributed under the Boost Software License, Version 1.0.
//  (See accompanying file LICENSE_1_0.txt or copy at https://www.boost.org/LICENSE_1_0.txt)

#include "d2s.h"

#include "common.h"
#include "ieee.h"
#include "pow5_tables.h"

#include <cstdint>
#if _MSC_VER
#include <intrin.h>
#endif

namespace float2str {
namespace impl {

static inline uint32_t Lo32(uint64_t x)
{
    return static_cast<uint32_t>(x & 0xFFFFFFFFu);
}

static inline uint32_t Hi32(uint64_t x)
{
    return static_cast<uint32_t>(x >> 32);
}

//==================================================================================================
// MulShift
//==================================================================================================

// Returns floor(m * mul / 2^j).
//
// m has at most 55 bits (4 * m2 + 2) and mul has 125 bits. For all double-precision inputs
// 118 <= j <= 125, so the result fits into 62 bits and the shift is always < 64.

#if defined(__SIZEOF_INT128__)

static inline uint64_t MulShift64(uint64_t m, const Uint64x2& mul, int32_t j)
{
    __extension__ using uint128_t = unsigned __int128;

    FLOAT2STR_ASSERT(j >= 64 + 1);
    FLOAT2STR_ASSERT(j <= 64 + 63);

    const uint128_t b0 = uint128_t{m} * mul.lo;
    const uint128_t b2 = uint128_t{m} * mul.hi;

    return static_cast<uint64_t>((b2 + static_cast<uint64_t>(b0 >> 64)) >> (j - 64));
}

#elif defined(_MSC_VER) && defined(_M_X64)

static inline uint64_t MulShift64(uint64_t m, const Uint64x2& mul, int32_t j)
{
    FLOAT2STR_ASSERT(j >= 64 + 1);
    FLOAT2STR_ASSERT(j <= 64 + 63);

    uint64_t b0_hi;
    uint64_t b0_lo = _umul128(m, mul.lo, &b0_hi);
    uint64_t b2_hi;
    uint64_t b2_lo = _umul128(m, mul.hi, &b2_hi);
    static_cast<void>(b0_lo);

    // b2 + (b0 >> 64)
    _addcarry_u64(_addcarry_u64(0, b2_lo, b0_hi, &b2_lo), b2_hi, 0, &b2_hi);

    // For the __shiftright128 intrinsic, the shift value is always modulo 64.
    return __shiftright128(b2_lo, b2_hi, static_cast<unsigned char>(j - 64));
}

#else

static inline Uint64x2 Mul128(uint64_t a, uint64_t b)
{
    const uint64_t b00 = uint64_t{Lo32(a)} * Lo32(b);
    const uint64_t b01 = uint64_t{Lo32(a)} * Hi32(b);
    const uint64_t b10 = uint64_t{Hi32(a)} * Lo32(b);
    const uint64_t b11 = uint64_t{Hi32(a)} * Hi32(b);

    const uint64_t mid1 = b10 + Hi32(b00);
    const uint64_t mid2 = b01 + Lo32(mid1);

    const uint64_t hi = b11 + Hi32(mid1) + Hi32(mid2);
    const uint64_t lo = Lo32(b00) | uint64_t{Lo32(mid2)} << 32;
    return {hi, lo};
}

static inline uint64_t ShiftRight128(uint64_t lo, uint64_t hi, int32_t n)
{
    FLOAT2STR_ASSERT(n >= 1);
    FLOAT2STR_ASSERT(n <= 63);

    return (hi << (64 - n)) | (lo >> n);
}

static inline uint64_t MulShift64(uint64_t m, const Uint64x2& mul, int32_t j)
{
    FLOAT2STR_ASSERT(j >= 64 + 1);
    FLOAT2STR_ASSERT(j <= 64 + 63);

    auto b0 = Mul128(m, mul.lo);
    auto b2 = Mul128(m, mul.hi);

    // b2 + (b0 >> 64)
    b2.lo += b0.hi;
    b2.hi += b2.lo < b0.hi;

    return ShiftRight128(b2.lo, b2.hi, j - 64);
}

#endif

// Computes (vr, vp, vm) = (4 * m2, 4 * m2 + 2, 4 * m2 - 1 - mm_shift) * mul / 2^j.
static inline uint64_t MulShiftAll64(uint64_t m2, const Uint64x2& mul, int32_t j, uint64_t& vp, uint64_t& vm, uint32_t mm_shift)
{
    vp = MulShift64(4 * m2 + 2, mul, j);
    vm = MulShift64(4 * m2 - 1 - mm_shift, mul, j);
    return MulShift64(4 * m2, mul, j);
}

//==================================================================================================
// ToDecimal64
//==================================================================================================

FloatingDecimal64 ToDecimal64(uint64_t ieee_mantissa, uint32_t ieee_exponent)
{
    FLOAT2STR_ASSERT(ieee_exponent < Double::MaxIeeeExponent);
    FLOAT2STR_ASSERT(ieee_exponent != 0 || ieee_mantissa != 0);

    //
    // Step 1:
    // Decode the floating point number, and unify normalized and subnormal cases.
    //
    // We subtract 2 so that the bounds computation has 2 additional bits.

    int32_t e2;
    uint64_t m2;
    if (ieee_exponent == 0)
    {
        e2 = 1 - Double::ExponentBias - Double::MantissaBits - 2;
        m2 = ieee_mantissa;
    }
    else
    {
        e2 = static_cast<int32_t>(ieee_exponent) - Double::ExponentBias - Double::MantissaBits - 2;
        m2 = Double::HiddenBit | ieee_mantissa;
    }

    const bool even = (m2 & 1) == 0;
    const bool accept_bounds = even;

    //
    // Step 2:
    // Determine the interval of valid decimal representations.
    //

    const uint64_t mv = 4 * m2;
    // The lower boundary is closer iff the mantissa field is zero and the number is normalized
    // (and not the smallest normalized number).
    const uint32_t mm_shift = (ieee_mantissa != 0 || ieee_exponent <= 1) ? 1 : 0;

    //
    // Step 3:
    // Convert to a decimal power base using 128-bit arithmetic.
    //

    uint64_t vr;
    uint64_t vp;
    uint64_t vm;
    int32_t e10;
    bool vm_is_trailing_zeros = false;
    bool vr_is_trailing_zeros = false;
    if (e2 >= 0)
    {
        // We remove only q = max(0, q' - 1) digits here, q' = log_10(2^e2), so that the loop
        // below runs at least once and determines the value of the last removed digit.
        const int32_t q = Log10Pow2(e2) - (e2 > 3);
        e10 = q;

        const int32_t k = DoublePow5InvBitCount + Pow5Bits(q) - 1;
        const int32_t i = -e2 + q + k;
        FLOAT2STR_ASSERT(q < DoublePow5InvTableSize);
        vr = MulShiftAll64(m2, DoublePow5InvSplit[q], i, vp, vm, mm_shift);

        // 21 = floor(log_5(2^53))
        if (q <= 21)
        {
            // Only one of mp, mv, and mm can be a multiple of 5, if any.
            const uint32_t mv_mod5 = Lo32(mv) - 5 * Lo32(mv / 5);
            if (mv_mod5 == 0)
            {
                vr_is_trailing_zeros = MultipleOfPow5(mv, q);
            }
            else if (accept_bounds)
            {
                // Same as min(e2 + (~mm & 1), pow5Factor(mm)) >= q
                // <=> e2 + (~mm & 1) >= q && pow5Factor(mm) >= q
                // <=> true && pow5Factor(mm) >= q, since e2 >= q.
                vm_is_trailing_zeros = MultipleOfPow5(mv - 1 - mm_shift, q);
            }
            else
            {
                // Same as min(e2 + 1, pow5Factor(mp)) >= q.
                vp -= MultipleOfPow5(mv + 2, q);
            }
        }
    }
    else
    {
        const int32_t q = Log10Pow5(-e2) - (-e2 > 1);
        e10 = q + e2;

        const int32_t i = -e2 - q;
        const int32_t k = Pow5Bits(i) - DoublePow5BitCount;
        const int32_t j = q - k;
        FLOAT2STR_ASSERT(i < DoublePow5TableSize);
        vr = MulShiftAll64(m2, DoublePow5Split[i], j, vp, vm, mm_shift);

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
        else if (q < 63)
        {
            // We want to know if the full product has at least q trailing zeros.
            // We need to compute min(p2(mv), p5(mv) - e2) >= q
            // <=> p2(mv) >= q (because -e2 >= q)
            vr_is_trailing_zeros = MultipleOfPow2(mv, q);
        }
    }

    //
    // Step 4:
    // Find the shortest decimal representation in the interval of valid representations.
    //

    int32_t removed = 0;
    uint32_t last_removed_digit = 0;
    uint64_t output;
    if /*unlikely*/ (vm_is_trailing_zeros || vr_is_trailing_zeros)
    {
        // General case. Track whether all removed digits are zeros.
        for (;;)
        {
            const uint64_t vp_div10 = vp / 10;
            const uint64_t vm_div10 = vm / 10;
            if (vp_div10 <= vm_div10)
                break;

            const uint32_t vm_mod10 = Lo32(vm) - 10 * Lo32(vm_div10);
            const uint64_t vr_div10 = vr / 10;
            const uint32_t vr_mod10 = Lo32(vr) - 10 * Lo32(vr_div10);
            vm_is_trailing_zeros &= vm_mod10 == 0;
            vr_is_trailing_zeros &= last_removed_digit == 0;
            last_removed_digit = vr_mod10;
            vr = vr_div10;
            vp = vp_div10;
            vm = vm_div10;
            ++removed;
        }

        if (vm_is_trailing_zeros)
        {
            for (;;)
            {
                const uint64_t vm_div10 = vm / 10;
                const uint32_t vm_mod10 = Lo32(vm) - 10 * Lo32(vm_div10);
                if (vm_mod10 != 0)
                    break;

                const uint64_t vp_div10 = vp / 10;
                const uint64_t vr_div10 = vr / 10;
                const uint32_t vr_mod10 = Lo32(vr) - 10 * Lo32(vr_div10);
                vr_is_trailing_zeros &= last_removed_digit == 0;
                last_removed_digit = vr_mod10;
                vr = vr_div10;
                vp = vp_div10;
                vm = vm_div10;
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
        bool round_up = false;

        const uint64_t vp_div100 = vp / 100;
        const uint64_t vm_div100 = vm / 100;
        if (vp_div100 > vm_div100) // Remove two digits at a time.
        {
            const uint64_t vr_div100 = vr / 100;
            const uint32_t vr_mod100 = Lo32(vr) - 100 * Lo32(vr_div100);
            round_up = vr_mod100 >= 50;
            vr = vr_div100;
            vp = vp_div100;
            vm = vm_div100;
            removed += 2;
        }

        for (;;)
        {
            const uint64_t vp_div10 = vp / 10;
            const uint64_t vm_div10 = vm / 10;
            if (vp_div10 <= vm_div10)
                break;

            const uint64_t vr_div10 = vr / 10;
            const uint32_t vr_mod10 = Lo32(vr) - 10 * Lo32(vr_div10);
            round_up = vr_mod10 >= 5;
            vr = vr_div10;
            vp = vp_div10;
            vm = vm_div10;
            ++removed;
        }

        // We need to take vr + 1 if vr is outside bounds or we need to round up.
        output = vr + (vr == vm || round_up);
    }

    FLOAT2STR_ASSERT(output != 0);
    FLOAT2STR_ASSERT(output <= 99999999999999999ull);

    return {output, e10 + removed};
}

} // namespace impl
} // namespace float2str
