// Copyright 2020 Ulf Adams
// Copyright 2020 Alexander Bolz
//
// Distributed under the Boost Software License, Version 1.0.
//  (See accompanying file LICENSE_1_0.txt or copy at https://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include <cstdint>

namespace float2str {

// Maximum number of characters required to print an integer of the given width,
// including the sign, if any. E.g. "-128", "-9223372036854775808", "18446744073709551615".
constexpr int Int8MinBufferLength = 4;
constexpr int Int16MinBufferLength = 6;
constexpr int Int32MinBufferLength = 11;
constexpr int Int64MinBufferLength = 20;
constexpr int UInt8MinBufferLength = 3;
constexpr int UInt16MinBufferLength = 5;
constexpr int UInt32MinBufferLength = 10;
constexpr int UInt64MinBufferLength = 20;

// char* output_end = Utoa(buffer, value);
//
// Converts the given integer into its decimal representation.
// The buffer must be large enough, i.e. >= [U]IntNMinBufferLength.
// The output is _not_ null-terminated.
char* Utoa(char* buffer, uint32_t value);
char* Utoa(char* buffer, uint64_t value);
char* Itoa(char* buffer, int32_t value);
char* Itoa(char* buffer, int64_t value);

inline char* Utoa(char* buffer, uint8_t value) { return Utoa(buffer, uint32_t{value}); }
inline char* Utoa(char* buffer, uint16_t value) { return Utoa(buffer, uint32_t{value}); }
inline char* Itoa(char* buffer, int8_t value) { return Itoa(buffer, int32_t{value}); }
inline char* Itoa(char* buffer, int16_t value) { return Itoa(buffer, int32_t{value}); }

} // namespace float2str
