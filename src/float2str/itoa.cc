// Copyright 2020 Ulf Adams
// Copyright 2020 Alexander Bolz
//
// Distributed under the Boost Software License, Version 1.0.
//  (See accompanying file LICENSE_1_0.txt or copy at https://www.boost.org/LICENSE_1_0.txt)

#include "itoa.h"

#include "common.h"

namespace float2str {
namespace impl {

static inline int32_t DecimalLength10(uint32_t v)
{
    if (v >= 1000000000u) { return 10; }
    return DecimalLength9(v);
}

static inline int32_t DecimalLength20(uint64_t v)
{
    if (v >= 10000000000000000000ull) { return 20; }
    if (v >= 1000000000000000000ull) { return 19; }
    if (v >= 100000000000000000ull) { return 18; }
    return DecimalLength17(v);
}

} // namespace impl

char* Utoa(char* buffer, uint32_t value)
{
    char* const end = buffer + impl::DecimalLength10(value);
    impl::WriteDigitsBackwards(end, value);
    return end;
}

char* Utoa(char* buffer, uint64_t value)
{
    char* const end = buffer + impl::DecimalLength20(value);
    impl::WriteDigitsBackwards(end, value);
    return end;
}

char* Itoa(char* buffer, int32_t value)
{
    // Negate in unsigned arithmetic. INT32_MIN has no positive counterpart.
    const uint32_t abs_value = value < 0 ? 0u - static_cast<uint32_t>(value) : static_cast<uint32_t>(value);

    buffer[0] = '-';
    buffer += value < 0;
    return Utoa(buffer, abs_value);
}

char* Itoa(char* buffer, int64_t value)
{
    const uint64_t abs_value = value < 0 ? 0u - static_cast<uint64_t>(value) : static_cast<uint64_t>(value);

    buffer[0] = '-';
    buffer += value < 0;
    return Utoa(buffer, abs_value);
}

} // namespace float2str
