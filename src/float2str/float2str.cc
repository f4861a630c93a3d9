// Copyright 2020 Ulf Adams
// Copyright 2020 Alexander Bolz
//
// Distributed under the Boost Software License, Version 1.0.
//  (See accompanying file LICENSE_1_0.txt or copy at https://www.boost.org/LICENSE_1_0.txt)

#include "float2str.h"

#include "common.h"
#include "d2s.h"
#include "f2s.h"
#include "ieee.h"

#include <cstring>

namespace float2str {
namespace impl {

//==================================================================================================
// FormatDigits
//==================================================================================================

// Writes the exponent of a number in scientific notation. Negative exponents are written with a
// leading '-', positive exponents without a sign.
static inline char* WriteExponent(char* buffer, int32_t scientific_exponent)
{
    FLOAT2STR_ASSERT(scientific_exponent >= -999);
    FLOAT2STR_ASSERT(scientific_exponent <=  999);

    if (scientific_exponent < 0)
    {
        *buffer++ = '-';
    }

    const uint32_t k = static_cast<uint32_t>(scientific_exponent < 0 ? -scientific_exponent : scientific_exponent);
    if (k >= 100)
    {
        const uint32_t q = k / 100;
        const uint32_t r = k % 100;
        *buffer++ = static_cast<char>('0' + q);
        return Utoa_2Digits(buffer, r);
    }

    if (k >= 10)
    {
        return Utoa_2Digits(buffer, k);
    }

    *buffer++ = static_cast<char>('0' + k);
    return buffer;
}

static inline int32_t DecimalLength(uint64_t v) { return DecimalLength17(v); }
static inline int32_t DecimalLength(uint32_t v) { return DecimalLength9(v); }

// Renders digits * 10^decimal_exponent. The decimal point position decides between fixed and
// scientific notation:
//
//      decimal_exponent >= 0 and decimal_point <= MaxFixed   digits[000].0
//      0 < decimal_point <= MaxFixed                         dig.its
//      MinFixed < decimal_point <= 0                         0.[000]digits
//      num_digits == 1                                       de123
//      otherwise                                             d.igitse-123
template <int32_t MinFixedDecimalPoint, int32_t MaxFixedDecimalPoint, typename UInt>
static inline char* FormatDigits(char* buffer, UInt digits, int32_t decimal_exponent)
{
    static_assert(MinFixedDecimalPoint <= -1, "internal error");
    static_assert(MaxFixedDecimalPoint >= 1, "internal error");

    FLOAT2STR_ASSERT(digits >= 1);

    const int32_t num_digits = DecimalLength(digits);
    const int32_t decimal_point = num_digits + decimal_exponent;

    if (0 <= decimal_exponent && decimal_point <= MaxFixedDecimalPoint)
    {
        // digits[000].0
        WriteDigitsBackwards(buffer + num_digits, digits);
        std::memset(buffer + num_digits, '0', static_cast<size_t>(decimal_point - num_digits));
        buffer += decimal_point;
        std::memcpy(buffer, ".0", 2);
        return buffer + 2;
    }

    if (0 < decimal_point && decimal_point <= MaxFixedDecimalPoint)
    {
        // dig.its
        // Print the digits one position to the right and move the integral part back.
        WriteDigitsBackwards(buffer + num_digits + 1, digits);
        std::memmove(buffer, buffer + 1, static_cast<size_t>(decimal_point));
        buffer[decimal_point] = '.';
        return buffer + num_digits + 1;
    }

    if (MinFixedDecimalPoint < decimal_point && decimal_point <= 0)
    {
        // 0.[000]digits
        const int32_t offset = 2 - decimal_point;
        std::memcpy(buffer, "0.", 2);
        std::memset(buffer + 2, '0', static_cast<size_t>(-decimal_point));
        WriteDigitsBackwards(buffer + offset + num_digits, digits);
        return buffer + offset + num_digits;
    }

    const int32_t scientific_exponent = decimal_point - 1;

    if (num_digits == 1)
    {
        // de123
        buffer[0] = static_cast<char>('0' + digits);
        buffer[1] = 'e';
        return WriteExponent(buffer + 2, scientific_exponent);
    }

    // d.igitse123
    // Print the digits one position to the right and copy the first digit one place to the left.
    WriteDigitsBackwards(buffer + num_digits + 1, digits);
    buffer[0] = buffer[1];
    buffer[1] = '.';
    buffer[num_digits + 1] = 'e';
    return WriteExponent(buffer + num_digits + 2, scientific_exponent);
}

template <typename Float>
static inline char* FormatSpecial(char* buffer, IEEE<Float> v)
{
    FLOAT2STR_ASSERT(!v.IsFinite());

    if (v.IsNaN())
    {
        std::memcpy(buffer, "NAN", 3);
        return buffer + 3;
    }

    if (v.SignBit())
    {
        std::memcpy(buffer, "NEG_INFINITY", 12);
        return buffer + 12;
    }

    std::memcpy(buffer, "INFINITY", 8);
    return buffer + 8;
}

} // namespace impl

//==================================================================================================
// Dtoa / Ftoa
//==================================================================================================

char* Dtoa(char* buffer, double value)
{
    using impl::Double;

    const Double v(value);

    if (!v.IsFinite())
    {
        return impl::FormatSpecial(buffer, v);
    }

    buffer[0] = '-';
    buffer += v.SignBit();

    if (v.IsZero())
    {
        std::memcpy(buffer, "0.0", 3);
        return buffer + 3;
    }

    const auto dec = impl::ToDecimal64(v.IeeeMantissa(), v.IeeeExponent());
    return impl::FormatDigits</*MinFixedDecimalPoint*/ -5, /*MaxFixedDecimalPoint*/ 16>(buffer, dec.mantissa, dec.exponent);
}

char* Ftoa(char* buffer, float value)
{
    using impl::Single;

    const Single v(value);

    if (!v.IsFinite())
    {
        return impl::FormatSpecial(buffer, v);
    }

    buffer[0] = '-';
    buffer += v.SignBit();

    if (v.IsZero())
    {
        std::memcpy(buffer, "0.0", 3);
        return buffer + 3;
    }

    const auto dec = impl::ToDecimal32(v.IeeeMantissa(), v.IeeeExponent());
    return impl::FormatDigits</*MinFixedDecimalPoint*/ -6, /*MaxFixedDecimalPoint*/ 13>(buffer, dec.mantissa, dec.exponent);
}

//==================================================================================================
// FormatDouble / FormatFloat
//==================================================================================================

template <typename Float>
static inline FormatResult FormatChecked(char* buffer, int buffer_length, Float value, char* (*to_chars)(char*, Float))
{
    FLOAT2STR_ASSERT(buffer_length >= 0);
    FLOAT2STR_ASSERT(buffer != nullptr || buffer_length == 0);

    if (buffer_length >= MinBufferLength)
    {
        const int length = static_cast<int>(to_chars(buffer, value) - buffer);
        return {length, FormatStatus::ok};
    }

    // The output might still fit. Format into a scratch buffer and copy.
    char tmp[MinBufferLength];
    const int length = static_cast<int>(to_chars(tmp, value) - tmp);
    if (length > buffer_length)
    {
        return {length, FormatStatus::buffer_too_small};
    }

    std::memcpy(buffer, tmp, static_cast<size_t>(length));
    return {length, FormatStatus::ok};
}

FormatResult FormatDouble(char* buffer, int buffer_length, double value)
{
    return FormatChecked(buffer, buffer_length, value, &Dtoa);
}

FormatResult FormatFloat(char* buffer, int buffer_length, float value)
{
    return FormatChecked(buffer, buffer_length, value, &Ftoa);
}

std::string ToString(double value)
{
    char buffer[MinBufferLength];
    char* const end = Dtoa(buffer, value);
    return std::string(buffer, end);
}

std::string ToString(float value)
{
    char buffer[MinBufferLength];
    char* const end = Ftoa(buffer, value);
    return std::string(buffer, end);
}

//==================================================================================================
// ToDecimal
//==================================================================================================

FloatingDecimal64 ToDecimal(double value)
{
    const impl::Double v(value);
    FLOAT2STR_ASSERT(v.IsFinite());
    FLOAT2STR_ASSERT(!v.IsZero());

    return impl::ToDecimal64(v.IeeeMantissa(), v.IeeeExponent());
}

FloatingDecimal32 ToDecimal(float value)
{
    const impl::Single v(value);
    FLOAT2STR_ASSERT(v.IsFinite());
    FLOAT2STR_ASSERT(!v.IsZero());

    return impl::ToDecimal32(v.IeeeMantissa(), v.IeeeExponent());
}

} // namespace float2str
