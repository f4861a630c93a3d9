// Copyright 2020 Ulf Adams
// Copyright 2020 Alexander Bolz
//
// Distributed under the Boost Software License, Version 1.0.
//  (See accompanying file LICENSE_1_0.txt or copy at https://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include <cstdint>
#include <cstring>
#include <limits>

namespace float2str {
namespace impl {

template <typename Dest, typename Source>
inline Dest ReinterpretBits(Source source)
{
    static_assert(sizeof(Dest) == sizeof(Source), "size mismatch");

    Dest dest;
    std::memcpy(&dest, &source, sizeof(Source));
    return dest;
}

template <int Precision> struct FormatTraits;
template <> struct FormatTraits<24> { using bits_type = uint32_t; static constexpr int ExponentBits =  8; };
template <> struct FormatTraits<53> { using bits_type = uint64_t; static constexpr int ExponentBits = 11; };

template <typename Float>
struct IEEE
{
    static_assert(std::numeric_limits<Float>::is_iec559 &&
                  ((std::numeric_limits<Float>::digits == 24 && std::numeric_limits<Float>::max_exponent == 128) ||
                   (std::numeric_limits<Float>::digits == 53 && std::numeric_limits<Float>::max_exponent == 1024)),
        "IEEE-754 single- or double-precision implementation required");

    using value_type = Float;
    using traits_type = FormatTraits<std::numeric_limits<Float>::digits>;
    using bits_type = typename traits_type::bits_type;

    static constexpr int       MantissaBits    = std::numeric_limits<value_type>::digits - 1; // stored bits, excludes the hidden bit
    static constexpr int       ExponentBits    = traits_type::ExponentBits;
    static constexpr int       ExponentBias    = std::numeric_limits<value_type>::max_exponent - 1;
    static constexpr uint32_t  MaxIeeeExponent = (uint32_t{1} << ExponentBits) - 1;
    static constexpr bits_type HiddenBit       = bits_type{1} << MantissaBits;
    static constexpr bits_type MantissaMask    = HiddenBit - 1;
    static constexpr bits_type ExponentMask    = bits_type{MaxIeeeExponent} << MantissaBits;
    static constexpr bits_type SignMask        = ~(~bits_type{0} >> 1);

    static_assert(MantissaBits + ExponentBits + 1 == sizeof(bits_type) * 8, "internal error");

    bits_type bits;

    explicit IEEE(bits_type bits_) : bits(bits_) {}
    explicit IEEE(value_type value) : bits(ReinterpretBits<bits_type>(value)) {}

    bits_type IeeeMantissa() const {
        return bits & MantissaMask;
    }

    uint32_t IeeeExponent() const {
        return static_cast<uint32_t>((bits & ExponentMask) >> MantissaBits);
    }

    bool IsFinite() const {
        return (bits & ExponentMask) != ExponentMask;
    }

    bool IsInf() const {
        return (bits & ExponentMask) == ExponentMask && (bits & MantissaMask) == 0;
    }

    bool IsNaN() const {
        return (bits & ExponentMask) == ExponentMask && (bits & MantissaMask) != 0;
    }

    bool IsZero() const {
        return (bits & ~SignMask) == 0;
    }

    bool SignBit() const {
        return (bits & SignMask) != 0;
    }

    value_type Value() const {
        return ReinterpretBits<value_type>(bits);
    }
};

using Double = IEEE<double>;
using Single = IEEE<float>;

} // namespace impl
} // namespace float2str
