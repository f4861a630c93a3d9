// Copyright 2020 Ulf Adams
// Copyright 2020 Alexander Bolz
//
// Distributed under the Boost Software License, Version 1.0.
//  (See accompanying file LICENSE_1_0.txt or copy at https://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace float2str {

// Decimal floating-point number mantissa * 10^exponent.
struct FloatingDecimal64 {
    uint64_t mantissa; // num_digits <= 17
    int32_t exponent;
};

struct FloatingDecimal32 {
    uint32_t mantissa; // num_digits <= 9
    int32_t exponent;
};

// Enough for any double or float, including sign, decimal point and exponent,
// e.g. "-2.2250738585072014e-308" or "-0.000012345678901234568".
constexpr int MinBufferLength = 24;

// char* output_end = Dtoa(buffer, value);
//
// Converts the given double-precision number into decimal form and stores the result in the given
// buffer.
//
// The buffer must be large enough, i.e. >= MinBufferLength.
// The output is _not_ null-terminated.
//
// The output is optimal, i.e. the output string
//  1. rounds back to the input number when read in (using round-to-nearest-even)
//  2. is as short as possible,
//  3. is as close to the input number as possible.
//
// Output format:
//  - NaN's are formatted as "NAN" (regardless of the sign bit).
//  - +/-Infinity is formatted as "INFINITY" and "NEG_INFINITY", resp.
//  - +/-0 is formatted as "0.0" and "-0.0", resp.
//  - Numbers with a decimal point position in (-5, 16] use fixed notation ("123.0", "1.25",
//    "0.001"), all other numbers use scientific notation ("1e30", "1.5e-7").
char* Dtoa(char* buffer, double value);

// Single-precision version of Dtoa.
// Numbers with a decimal point position in (-6, 13] use fixed notation.
char* Ftoa(char* buffer, float value);

enum class FormatStatus {
    ok,
    buffer_too_small,
};

struct FormatResult
{
    // On success, the number of characters written.
    // Otherwise, the number of characters required to hold the output.
    int length;
    FormatStatus status;

    // Test for success.
    explicit operator bool() const noexcept
    {
        return status == FormatStatus::ok;
    }
};

// FormatResult result = FormatDouble(buffer, buffer_length, value);
//
// Bounds checked version of Dtoa.
// If the output does not fit into [buffer, buffer + buffer_length), the buffer is left untouched
// and FormatStatus::buffer_too_small is returned.
FormatResult FormatDouble(char* buffer, int buffer_length, double value);

// Bounds checked version of Ftoa.
FormatResult FormatFloat(char* buffer, int buffer_length, float value);

template <size_t N>
inline int FormatDouble(char (&buffer)[N], double value)
{
    static_assert(N >= MinBufferLength, "buffer too small");
    return static_cast<int>(Dtoa(buffer, value) - buffer);
}

template <size_t N>
inline int FormatFloat(char (&buffer)[N], float value)
{
    static_assert(N >= MinBufferLength, "buffer too small");
    return static_cast<int>(Ftoa(buffer, value) - buffer);
}

std::string ToString(double value);
std::string ToString(float value);

// Returns the shortest decimal representation of |value|.
// PRE: value is finite and not zero.
FloatingDecimal64 ToDecimal(double value);
FloatingDecimal32 ToDecimal(float value);

} // namespace float2str
