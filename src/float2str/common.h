// Copyright 2020 Ulf Adams
// Copyright 2020 Alexander Bolz
//
// Distributed under the Boost Software License, Version 1.0.
//  (See accompanying file LICENSE_1_0.txt or copy at https://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include <cassert>
#include <cstdint>
#include <cstring>

#ifndef FLOAT2STR_ASSERT
#define FLOAT2STR_ASSERT(X) assert(X)
#endif

#ifndef FLOAT2STR_INLINE
#define FLOAT2STR_INLINE inline
#endif

namespace float2str {
namespace impl {

//==================================================================================================
// Integer approximations of logarithms
//==================================================================================================

// Returns floor(e * log_2(5)) + 1 = number of bits in 5^e.
FLOAT2STR_INLINE int32_t Pow5Bits(int32_t e)
{
    // e * 1217359 must fit into 32 bits.
    FLOAT2STR_ASSERT(e >= 0);
    FLOAT2STR_ASSERT(e <= 3528);
    return static_cast<int32_t>(((static_cast<uint32_t>(e) * 1217359) >> 19) + 1);
}

// Returns floor(e * log_10(2)).
FLOAT2STR_INLINE int32_t Log10Pow2(int32_t e)
{
    FLOAT2STR_ASSERT(e >= 0);
    FLOAT2STR_ASSERT(e <= 1650);
    return static_cast<int32_t>((static_cast<uint32_t>(e) * 78913) >> 18);
}

// Returns floor(e * log_10(5)).
FLOAT2STR_INLINE int32_t Log10Pow5(int32_t e)
{
    FLOAT2STR_ASSERT(e >= 0);
    FLOAT2STR_ASSERT(e <= 2620);
    return static_cast<int32_t>((static_cast<uint32_t>(e) * 732923) >> 20);
}

FLOAT2STR_INLINE int32_t DecimalLength9(uint32_t v)
{
    FLOAT2STR_ASSERT(v <= 999999999u);

    if (v >= 100000000u) { return 9; }
    if (v >= 10000000u) { return 8; }
    if (v >= 1000000u) { return 7; }
    if (v >= 100000u) { return 6; }
    if (v >= 10000u) { return 5; }
    if (v >= 1000u) { return 4; }
    if (v >= 100u) { return 3; }
    if (v >= 10u) { return 2; }
    return 1;
}

FLOAT2STR_INLINE int32_t DecimalLength17(uint64_t v)
{
    FLOAT2STR_ASSERT(v <= 99999999999999999ull);

    if (v >= 10000000000000000ull) { return 17; }
    if (v >= 1000000000000000ull) { return 16; }
    if (v >= 100000000000000ull) { return 15; }
    if (v >= 10000000000000ull) { return 14; }
    if (v >= 1000000000000ull) { return 13; }
    if (v >= 100000000000ull) { return 12; }
    if (v >= 10000000000ull) { return 11; }
    if (v >= 1000000000ull) { return 10; }
    if (v >= 100000000ull) { return 9; }
    if (v >= 10000000ull) { return 8; }
    if (v >= 1000000ull) { return 7; }
    if (v >= 100000ull) { return 6; }
    if (v >= 10000ull) { return 5; }
    if (v >= 1000ull) { return 4; }
    if (v >= 100ull) { return 3; }
    if (v >= 10ull) { return 2; }
    return 1;
}

//==================================================================================================
// Divisibility
//==================================================================================================

// Returns whether value is divisible by 5^e5
FLOAT2STR_INLINE bool MultipleOfPow5(uint64_t value, int32_t e5)
{
    // value is divisible by 5^e5 iff value * (5^e5)^-1 mod 2^64 <= floor((2^64 - 1) / 5^e5).
    struct MulCmp {
        uint64_t mul;
        uint64_t cmp;
    };

    static constexpr MulCmp Mod5[] = {
        {0x0000000000000001u, 0xFFFFFFFFFFFFFFFFu}, // 5^0
        {0xCCCCCCCCCCCCCCCDu, 0x3333333333333333u}, // 5^1
        {0x8F5C28F5C28F5C29u, 0x0A3D70A3D70A3D70u}, // 5^2
        {0x1CAC083126E978D5u, 0x020C49BA5E353F7Cu}, // 5^3
        {0xD288CE703AFB7E91u, 0x0068DB8BAC710CB2u}, // 5^4
        {0x5D4E8FB00BCBE61Du, 0x0014F8B588E368F0u}, // 5^5
        {0x790FB65668C26139u, 0x000431BDE82D7B63u}, // 5^6
        {0xE5032477AE8D46A5u, 0x0000D6BF94D5E57Au}, // 5^7
        {0xC767074B22E90E21u, 0x00002AF31DC46118u}, // 5^8
        {0x8E47CE423A2E9C6Du, 0x0000089705F4136Bu}, // 5^9
        {0x4FA7F60D3ED61F49u, 0x000001B7CDFD9D7Bu}, // 5^10
        {0x0FEE64690C913975u, 0x00000057F5FF85E5u}, // 5^11
        {0x3662E0E1CF503EB1u, 0x000000119799812Du}, // 5^12
        {0xA47A2CF9F6433FBDu, 0x0000000384B84D09u}, // 5^13
        {0x54186F653140A659u, 0x00000000B424DC35u}, // 5^14
        {0x7738164770402145u, 0x0000000024075F3Du}, // 5^15
        {0xE4A4D1417CD9A041u, 0x000000000734ACA5u}, // 5^16
        {0xC75429D9E5C5200Du, 0x000000000170EF54u}, // 5^17
        {0xC1773B91FAC10669u, 0x000000000049C977u}, // 5^18
        {0x26B172506559CE15u, 0x00000000000EC1E4u}, // 5^19
        {0xD489E3A9ADDEC2D1u, 0x000000000002F394u}, // 5^20
        {0x90E860BB892C8D5Du, 0x000000000000971Du}, // 5^21
        {0x502E79BF1B6F4F79u, 0x0000000000001E39u}, // 5^22
        {0xDCD618596BE30FE5u, 0x000000000000060Bu}, // 5^23
        {0x2C2AD1AB7BFA3661u, 0x0000000000000135u}, // 5^24
    };

    FLOAT2STR_ASSERT(e5 >= 0);
    FLOAT2STR_ASSERT(e5 <= 24);
    const auto m5 = Mod5[static_cast<unsigned>(e5)];

    return value * m5.mul <= m5.cmp;
}

// Returns whether value is divisible by 2^e2
FLOAT2STR_INLINE bool MultipleOfPow2(uint64_t value, int32_t e2)
{
    FLOAT2STR_ASSERT(e2 >= 0);
    FLOAT2STR_ASSERT(e2 <= 63);

    return (value & ((uint64_t{1} << e2) - 1)) == 0;
}

//==================================================================================================
// Digit output
//==================================================================================================

FLOAT2STR_INLINE char* Utoa_2Digits(char* buf, uint32_t digits)
{
    static constexpr char Digits100[200] = {
        '0','0','0','1','0','2','0','3','0','4','0','5','0','6','0','7','0','8','0','9',
        '1','0','1','1','1','2','1','3','1','4','1','5','1','6','1','7','1','8','1','9',
        '2','0','2','1','2','2','2','3','2','4','2','5','2','6','2','7','2','8','2','9',
        '3','0','3','1','3','2','3','3','3','4','3','5','3','6','3','7','3','8','3','9',
        '4','0','4','1','4','2','4','3','4','4','4','5','4','6','4','7','4','8','4','9',
        '5','0','5','1','5','2','5','3','5','4','5','5','5','6','5','7','5','8','5','9',
        '6','0','6','1','6','2','6','3','6','4','6','5','6','6','6','7','6','8','6','9',
        '7','0','7','1','7','2','7','3','7','4','7','5','7','6','7','7','7','8','7','9',
        '8','0','8','1','8','2','8','3','8','4','8','5','8','6','8','7','8','8','8','9',
        '9','0','9','1','9','2','9','3','9','4','9','5','9','6','9','7','9','8','9','9',
    };

    FLOAT2STR_ASSERT(digits <= 99);
    std::memcpy(buf, &Digits100[2 * digits], 2 * sizeof(char));
    return buf + 2;
}

FLOAT2STR_INLINE char* Utoa_4Digits(char* buf, uint32_t digits)
{
    FLOAT2STR_ASSERT(digits <= 9999);
    const uint32_t q = digits / 100;
    const uint32_t r = digits % 100;
    Utoa_2Digits(buf + 0, q);
    Utoa_2Digits(buf + 2, r);
    return buf + 4;
}

FLOAT2STR_INLINE char* Utoa_8Digits(char* buf, uint32_t digits)
{
    FLOAT2STR_ASSERT(digits <= 99999999);
    const uint32_t q = digits / 10000;
    const uint32_t r = digits % 10000;
    Utoa_4Digits(buf + 0, q);
    Utoa_4Digits(buf + 4, r);
    return buf + 8;
}

// Writes the decimal digits of output into the range ending at buf (exclusive), least
// significant digits first. Returns a pointer to the first digit written.
FLOAT2STR_INLINE char* WriteDigitsBackwards(char* buf, uint32_t output)
{
    while (output >= 10000)
    {
        const uint32_t q = output / 10000;
        const uint32_t r = output - 10000 * q; // = output % 10000
        output = q;
        buf -= 4;
        Utoa_4Digits(buf, r);
    }

    if (output >= 100)
    {
        const uint32_t q = output / 100;
        const uint32_t r = output % 100;
        output = q;
        buf -= 2;
        Utoa_2Digits(buf, r);
    }

    if (output >= 10)
    {
        buf -= 2;
        Utoa_2Digits(buf, output);
    }
    else
    {
        *--buf = static_cast<char>('0' + output);
    }

    return buf;
}

FLOAT2STR_INLINE char* WriteDigitsBackwards(char* buf, uint64_t output)
{
    // We prefer 32-bit operations, even on 64-bit platforms.
    // A decimal mantissa has at most 17 digits: after cutting off 8 digits with one 64-bit
    // division the rest fits into uint32_t. Integers may need a second cut (up to 20 digits).
    while (static_cast<uint32_t>(output >> 32) != 0)
    {
        const uint64_t q = output / 100000000;
        const uint32_t r = static_cast<uint32_t>(output - 100000000 * q); // = output % 10^8
        output = q;
        buf -= 8;
        Utoa_8Digits(buf, r);
    }

    return WriteDigitsBackwards(buf, static_cast<uint32_t>(output));
}

} // namespace impl
} // namespace float2str
