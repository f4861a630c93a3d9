#include <catch2/catch.hpp>

#include <double-conversion/double-conversion.h>

#include "float2str/float2str.h"

#include <cassert>
#include <cstdint>
#include <cstring>
#include <limits>
#include <random>
#include <string>

#include "scan_number.h"

constexpr int BufSize = 64;

//==================================================================================================
//
//==================================================================================================

static char* ftoa_double_conversion(char* buf, int buflen, float value)
{
    using namespace double_conversion;

    const auto& conv = DoubleToStringConverter::EcmaScriptConverter();
    StringBuilder builder(buf, buflen);
    conv.ToShortestSingle(value, &builder);
    return buf + builder.position();
}

static char* dtoa_double_conversion(char* buf, int buflen, double value)
{
    using namespace double_conversion;

    const auto& conv = DoubleToStringConverter::EcmaScriptConverter();
    StringBuilder builder(buf, buflen);
    conv.ToShortest(value, &builder);
    return buf + builder.position();
}

static float strtof_double_conversion(const char* buf, int len)
{
    double_conversion::StringToDoubleConverter s2d(0, 0.0, 0.0, "inf", "nan");
    int processed_characters_count = 0;
    return s2d.StringToFloat(buf, len, &processed_characters_count);
}

static double strtod_double_conversion(const char* buf, int len)
{
    double_conversion::StringToDoubleConverter s2d(0, 0.0, 0.0, "inf", "nan");
    int processed_characters_count = 0;
    return s2d.StringToDouble(buf, len, &processed_characters_count);
}

//==================================================================================================
//
//==================================================================================================

template <typename Dest, typename Source>
inline Dest ReinterpretBits(Source source)
{
    static_assert(sizeof(Dest) == sizeof(Source), "size mismatch");

    Dest dest;
    std::memcpy(&dest, &source, sizeof(Source));
    return dest;
}

static float MakeSingle(uint32_t sign_bit, uint32_t biased_exponent, uint32_t significand)
{
    assert(sign_bit == 0 || sign_bit == 1);
    assert(biased_exponent <= 0xFF);
    assert(significand <= 0x007FFFFF);

    uint32_t bits = 0;

    bits |= sign_bit << 31;
    bits |= biased_exponent << 23;
    bits |= significand;

    return ReinterpretBits<float>(bits);
}

// Returns f * 2^e. f and e must describe a finite, normal or subnormal number exactly.
static float MakeSingle(uint64_t f, int e)
{
    constexpr uint64_t kHiddenBit = 0x00800000;
    constexpr uint64_t kSignificandMask = 0x007FFFFF;
    constexpr int kPhysicalSignificandSize = 23;  // Excludes the hidden bit.
    constexpr int kExponentBias = 0x7F + kPhysicalSignificandSize;
    constexpr int kDenormalExponent = -kExponentBias + 1;

    assert(f <= kHiddenBit + kSignificandMask);
    assert(e >= kDenormalExponent);
    while (e > kDenormalExponent && (f & kHiddenBit) == 0) {
        f <<= 1;
        e--;
    }

    uint64_t biased_exponent;
    if (e == kDenormalExponent && (f & kHiddenBit) == 0)
        biased_exponent = 0;
    else
        biased_exponent = static_cast<uint64_t>(e + kExponentBias);

    uint64_t bits = (f & kSignificandMask) | (biased_exponent << kPhysicalSignificandSize);

    return ReinterpretBits<float>(static_cast<uint32_t>(bits));
}

static double MakeDouble(uint64_t sign_bit, uint64_t biased_exponent, uint64_t significand)
{
    assert(sign_bit == 0 || sign_bit == 1);
    assert(biased_exponent <= 0x7FF);
    assert(significand <= 0x000FFFFFFFFFFFFF);

    uint64_t bits = 0;

    bits |= sign_bit << 63;
    bits |= biased_exponent << 52;
    bits |= significand;

    return ReinterpretBits<double>(bits);
}

// Returns f * 2^e. f and e must describe a finite, normal or subnormal number exactly.
static double MakeDouble(uint64_t f, int e)
{
    constexpr uint64_t kHiddenBit = 0x0010000000000000;
    constexpr uint64_t kSignificandMask = 0x000FFFFFFFFFFFFF;
    constexpr int kPhysicalSignificandSize = 52;  // Excludes the hidden bit.
    constexpr int kExponentBias = 0x3FF + kPhysicalSignificandSize;
    constexpr int kDenormalExponent = -kExponentBias + 1;

    assert(f <= kHiddenBit + kSignificandMask);
    assert(e >= kDenormalExponent);
    while (e > kDenormalExponent && (f & kHiddenBit) == 0) {
        f <<= 1;
        e--;
    }

    uint64_t biased_exponent;
    if (e == kDenormalExponent && (f & kHiddenBit) == 0)
        biased_exponent = 0;
    else
        biased_exponent = static_cast<uint64_t>(e + kExponentBias);

    uint64_t bits = (f & kSignificandMask) | (biased_exponent << kPhysicalSignificandSize);

    return ReinterpretBits<double>(bits);
}

//==================================================================================================
//
//==================================================================================================

// Checks that the output of Ftoa rounds back to the input and has the same digits as the
// shortest, closest representation computed by double-conversion.
static void CheckSingle(float f0)
{
    CAPTURE(f0);

    char buf0[BufSize];
    char* end0 = float2str::Ftoa(buf0, f0);
    *end0 = '\0';
    const int length0 = static_cast<int>(end0 - buf0);

    CAPTURE(buf0);
    CHECK(length0 <= float2str::MinBufferLength);

    const float f1 = strtof_double_conversion(buf0, length0);

    const uint32_t bits0 = ReinterpretBits<uint32_t>(f0);
    const uint32_t bits1 = ReinterpretBits<uint32_t>(f1);
    CAPTURE(bits0);
    CAPTURE(bits1);
    CHECK(bits0 == bits1);

    char buf1[BufSize];
    char* end1 = ftoa_double_conversion(buf1, BufSize, f0);
    *end1 = '\0';

    CAPTURE(buf1);

    const auto num0 = ScanNumber(buf0, end0);
    const auto num1 = ScanNumber(buf1, end1);
    CHECK(num0.negative == num1.negative);
    CHECK(num0.digits == num1.digits);
    CHECK(num0.exponent == num1.exponent);
}

static void CheckSingleBits(uint32_t bits)
{
    CheckSingle(ReinterpretBits<float>(bits));
}

// Compares the decimal value, not the exact text.
static void CheckSingle(float value, const std::string& expected)
{
    CheckSingle(value);

    char buf[BufSize];
    char* end = float2str::Ftoa(buf, value);

    const auto num_actual = ScanNumber(buf, end);
    const auto num_expected = ScanNumber(expected);

    CAPTURE(value);
    CAPTURE(expected);
    CHECK(num_actual.digits == num_expected.digits);
    CHECK(num_actual.exponent == num_expected.exponent);
}

static void CheckSingleBits(uint32_t bits, const std::string& expected)
{
    CheckSingle(ReinterpretBits<float>(bits), expected);
}

static void CheckDouble(double f0)
{
    CAPTURE(f0);

    char buf0[BufSize];
    char* end0 = float2str::Dtoa(buf0, f0);
    *end0 = '\0';
    const int length0 = static_cast<int>(end0 - buf0);

    CAPTURE(buf0);
    CHECK(length0 <= float2str::MinBufferLength);

    const double f1 = strtod_double_conversion(buf0, length0);

    const uint64_t bits0 = ReinterpretBits<uint64_t>(f0);
    const uint64_t bits1 = ReinterpretBits<uint64_t>(f1);
    CAPTURE(bits0);
    CAPTURE(bits1);
    CHECK(bits0 == bits1);

    char buf1[BufSize];
    char* end1 = dtoa_double_conversion(buf1, BufSize, f0);
    *end1 = '\0';

    CAPTURE(buf1);

    const auto num0 = ScanNumber(buf0, end0);
    const auto num1 = ScanNumber(buf1, end1);
    CHECK(num0.negative == num1.negative);
    CHECK(num0.digits == num1.digits);
    CHECK(num0.exponent == num1.exponent);
}

static void CheckDoubleBits(uint64_t bits)
{
    CheckDouble(ReinterpretBits<double>(bits));
}

// Compares the decimal value, not the exact text.
static void CheckDouble(double value, const std::string& expected)
{
    CheckDouble(value);

    char buf[BufSize];
    char* end = float2str::Dtoa(buf, value);

    const auto num_actual = ScanNumber(buf, end);
    const auto num_expected = ScanNumber(expected);

    CAPTURE(value);
    CAPTURE(expected);
    CHECK(num_actual.digits == num_expected.digits);
    CHECK(num_actual.exponent == num_expected.exponent);
}

static void CheckDoubleBits(uint64_t bits, const std::string& expected)
{
    CheckDouble(ReinterpretBits<double>(bits), expected);
}

//==================================================================================================
// Output format
//==================================================================================================

TEST_CASE("Double - Special values")
{
    CHECK(float2str::ToString(std::numeric_limits<double>::quiet_NaN()) == "NAN");
    CHECK(float2str::ToString(MakeDouble(1, 0x7FF, 0x0008000000000000)) == "NAN");
    CHECK(float2str::ToString(MakeDouble(0, 0x7FF, 0x0000000000000001)) == "NAN");
    CHECK(float2str::ToString(MakeDouble(1, 0x7FF, 0x000FFFFFFFFFFFFF)) == "NAN");
    CHECK(float2str::ToString(std::numeric_limits<double>::infinity()) == "INFINITY");
    CHECK(float2str::ToString(-std::numeric_limits<double>::infinity()) == "NEG_INFINITY");
    CHECK(float2str::ToString(0.0) == "0.0");
    CHECK(float2str::ToString(-0.0) == "-0.0");
}

TEST_CASE("Double - Format")
{
    CHECK(float2str::ToString(1.0) == "1.0");
    CHECK(float2str::ToString(-1.5) == "-1.5");
    CHECK(float2str::ToString(3.14) == "3.14");
    CHECK(float2str::ToString(12.0) == "12.0");
    CHECK(float2str::ToString(100.0) == "100.0");
    CHECK(float2str::ToString(-123.456) == "-123.456");
    CHECK(float2str::ToString(123456.0) == "123456.0");
    CHECK(float2str::ToString(299792458.0) == "299792458.0");
    CHECK(float2str::ToString(0.1) == "0.1");
    CHECK(float2str::ToString(0.3) == "0.3");
    CHECK(float2str::ToString(0.1 + 0.2) == "0.30000000000000004");
    CHECK(float2str::ToString(0.001) == "0.001");
    CHECK(float2str::ToString(0.0001234) == "0.0001234");
    CHECK(float2str::ToString(0.00012345) == "0.00012345");
    CHECK(float2str::ToString(1.0000000000000002) == "1.0000000000000002");
    CHECK(float2str::ToString(123456789012345.6) == "123456789012345.6");
    CHECK(float2str::ToString(1e30) == "1e30");
    CHECK(float2str::ToString(1e-30) == "1e-30");
    CHECK(float2str::ToString(1e100) == "1e100");
    CHECK(float2str::ToString(1e-300) == "1e-300");
    CHECK(float2str::ToString(1.5e300) == "1.5e300");
    CHECK(float2str::ToString(2.5e-7) == "2.5e-7");
    CHECK(float2str::ToString(-1e-7) == "-1e-7");
    CHECK(float2str::ToString(1.23e-18) == "1.23e-18");
    CHECK(float2str::ToString(6.02214076e23) == "6.02214076e23");
    CHECK(float2str::ToString(9223372036854775808.0) == "9.223372036854776e18");
    CHECK(float2str::ToString(1.5745340942675811e+257) == "1.574534094267581e257");
}

TEST_CASE("Double - Fixed and scientific notation")
{
    // Decimal point position in (-5, 16] uses fixed notation.
    CHECK(float2str::ToString(1e15) == "1000000000000000.0");
    CHECK(float2str::ToString(999999999999999.9) == "999999999999999.9");
    CHECK(float2str::ToString(1234567890123456.0) == "1234567890123456.0");
    CHECK(float2str::ToString(9007199254740992.0) == "9007199254740992.0");
    CHECK(float2str::ToString(1234567890123456.7) == "1234567890123456.8");
    CHECK(float2str::ToString(1e16) == "1e16");
    CHECK(float2str::ToString(12345678901234567.0) == "1.2345678901234568e16");
    CHECK(float2str::ToString(1e21) == "1e21");
    CHECK(float2str::ToString(1e22) == "1e22");

    CHECK(float2str::ToString(1e-5) == "0.00001");
    CHECK(float2str::ToString(-1e-5) == "-0.00001");
    CHECK(float2str::ToString(1.2345e-5) == "0.000012345");
    CHECK(float2str::ToString(0.000012345678901234567) == "0.000012345678901234568");
    CHECK(float2str::ToString(1e-6) == "1e-6");
    CHECK(float2str::ToString(9.5e-6) == "9.5e-6");
    CHECK(float2str::ToString(1.2345e-6) == "1.2345e-6");
}

TEST_CASE("Double - Boundaries")
{
    CHECK(float2str::ToString(MakeDouble(0,    0, 0x0000000000000001)) == "5e-324");                  // min denormal
    CHECK(float2str::ToString(MakeDouble(0,    0, 0x0000000000000014)) == "1e-322");
    CHECK(float2str::ToString(MakeDouble(0,    0, 0x000FFFFFFFFFFFFF)) == "2.225073858507201e-308");  // max denormal
    CHECK(float2str::ToString(MakeDouble(0,    1, 0x0000000000000000)) == "2.2250738585072014e-308"); // min normal
    CHECK(float2str::ToString(MakeDouble(0, 2046, 0x000FFFFFFFFFFFFE)) == "1.7976931348623155e308");
    CHECK(float2str::ToString(MakeDouble(0, 2046, 0x000FFFFFFFFFFFFF)) == "1.7976931348623157e308"); // max normal

    CheckDouble(MakeDouble(0,    0, 0x0000000000000001), "5e-324"                 );
    CheckDouble(MakeDouble(0,    0, 0x000FFFFFFFFFFFFF), "2.225073858507201e-308" );
    CheckDouble(MakeDouble(0,    1, 0x0000000000000000), "2.2250738585072014e-308");
    CheckDouble(MakeDouble(0,    1, 0x0000000000000001), "2.225073858507202e-308" );
    CheckDouble(MakeDouble(0,    1, 0x000FFFFFFFFFFFFF), "4.4501477170144023e-308");
    CheckDouble(MakeDouble(0,    2, 0x0000000000000000), "4.450147717014403e-308" );
    CheckDouble(MakeDouble(0,    2, 0x0000000000000001), "4.450147717014404e-308" );
    CheckDouble(MakeDouble(0,    4, 0x0000000000000000), "1.7800590868057611e-307"); // asymmetric interval
    CheckDouble(MakeDouble(0,    5, 0x0000000000000000), "3.5601181736115222e-307");
    CheckDouble(MakeDouble(0,    6, 0x0000000000000000), "7.120236347223045e-307" );
    CheckDouble(MakeDouble(0,   10, 0x0000000000000000), "1.1392378155556871e-305");

    for (uint64_t e = 2; e < 2046; ++e)
    {
        CAPTURE(e);
        CheckDouble(MakeDouble(0, e-1, 0x000FFFFFFFFFFFFF));
        CheckDouble(MakeDouble(0, e,   0x0000000000000000));
        CheckDouble(MakeDouble(1, e,   0x0000000000000001));
    }
}

TEST_CASE("Double - Sign")
{
    std::mt19937_64 random(12345);
    std::uniform_int_distribution<uint64_t> gen(0, 0x7FEFFFFFFFFFFFFF);

    for (int i = 0; i < 1000; ++i)
    {
        const double value = ReinterpretBits<double>(gen(random));
        CAPTURE(value);

        const std::string pos = float2str::ToString(value);
        const std::string neg = float2str::ToString(-value);
        CHECK(neg == "-" + pos);
    }
}

TEST_CASE("Double - Output length")
{
    // Longest possible outputs.
    CHECK(float2str::ToString(-2.2250738585072014e-308).size() == 24u);
    CHECK(float2str::ToString(-1.2345678901234567e-5) == "-0.000012345678901234568");

    std::mt19937_64 random(54321);
    std::uniform_int_distribution<uint64_t> gen(0, UINT64_MAX);

    for (int i = 0; i < 10000; ++i)
    {
        const double value = ReinterpretBits<double>(gen(random));
        CAPTURE(value);
        CHECK(float2str::ToString(value).size() <= static_cast<size_t>(float2str::MinBufferLength));
    }
}

//==================================================================================================
// Shortest and correctly rounded
//==================================================================================================

TEST_CASE("Double - Paxson, Kahan")
{
    // V. Paxson and W. Kahan, "A Program for Testing IEEE Binary-Decimal Conversion", manuscript, May 1991,
    // ftp://ftp.ee.lbl.gov/testbase-report.ps.Z    (report)
    // ftp://ftp.ee.lbl.gov/testbase.tar.Z          (program)

    // Table 3: Stress Inputs for Converting 53-bit Binary to Decimal, < 1/2 ULP
    CheckDouble( MakeDouble(8511030020275656,  -342), "9.5e-88"                 );
    CheckDouble( MakeDouble(5201988407066741,  -824), "4.65e-233"               );
    CheckDouble( MakeDouble(6406892948269899,  +237), "1.415e+87"               );
    CheckDouble( MakeDouble(8431154198732492,   +72), "3.9815e+37"              );
    CheckDouble( MakeDouble(6475049196144587,   +99), "4.10405e+45"             );
    CheckDouble( MakeDouble(8274307542972842,  +726), "2.920845e+234"           );
    CheckDouble( MakeDouble(5381065484265332,  -456), "2.8919465e-122"          );
    CheckDouble( MakeDouble(6761728585499734, -1057), "4.37877185e-303"         );
    CheckDouble( MakeDouble(7976538478610756,  +376), "1.227701635e+129"        );
    CheckDouble( MakeDouble(5982403858958067,  +377), "1.8415524525e+129"       );
    CheckDouble( MakeDouble(5536995190630837,   +93), "5.48357443505e+43"       );
    CheckDouble( MakeDouble(7225450889282194,  +710), "3.891901811465e+229"     );
    CheckDouble( MakeDouble(7225450889282194,  +709), "1.9459509057325e+229"    );
    CheckDouble( MakeDouble(8703372741147379,  +117), "1.44609583816055e+51"    );
    CheckDouble( MakeDouble(8944262675275217, -1001), "4.173677474585315e-286"  );
    CheckDouble( MakeDouble(7459803696087692,  -707), "1.1079507728788885e-197" );
    CheckDouble( MakeDouble(6080469016670379,  -381), "1.234550136632744e-99"   );
    CheckDouble( MakeDouble(8385515147034757,  +721), "9.25031711960365e+232"   );
    CheckDouble( MakeDouble(7514216811389786,  -828), "4.19804715028489e-234"   );
    CheckDouble( MakeDouble(8397297803260511,  -345), "1.1716315319786511e-88"  );
    CheckDouble( MakeDouble(6733459239310543,  +202), "4.328100728446125e+76"   );
    CheckDouble( MakeDouble(8091450587292794,  -473), "3.317710118160031e-127"  );

    // Table 4: Stress Inputs for Converting 53-bit Binary to Decimal, > 1/2 ULP
    CheckDouble( MakeDouble(6567258882077402, +952), "2.5e+302"                );
    CheckDouble( MakeDouble(6712731423444934, +535), "7.55e+176"               );
    CheckDouble( MakeDouble(6712731423444934, +534), "3.775e+176"              );
    CheckDouble( MakeDouble(5298405411573037, -957), "4.3495e-273"             );
    CheckDouble( MakeDouble(5137311167659507, -144), "2.30365e-28"             );
    CheckDouble( MakeDouble(6722280709661868, +363), "1.263005e+125"           );
    CheckDouble( MakeDouble(5344436398034927, -169), "7.1422105e-36"           );
    CheckDouble( MakeDouble(8369123604277281, -853), "1.39345735e-241"         );
    CheckDouble( MakeDouble(8995822108487663, -780), "1.414634485e-219"        );
    CheckDouble( MakeDouble(8942832835564782, -383), "4.5392779195e-100"       );
    CheckDouble( MakeDouble(8942832835564782, -384), "2.26963895975e-100"      );
    CheckDouble( MakeDouble(8942832835564782, -385), "1.134819479875e-100"     );
    CheckDouble( MakeDouble(6965949469487146, -249), "7.7003665618895e-60"     );
    CheckDouble( MakeDouble(6965949469487146, -250), "3.85018328094475e-60"    );
    CheckDouble( MakeDouble(6965949469487146, -251), "1.925091640472375e-60"   );
    CheckDouble( MakeDouble(7487252720986826, +548), "6.8985865317742005e+180" );
    CheckDouble( MakeDouble(5592117679628511, +164), "1.3076622631878654e+65"  );
    CheckDouble( MakeDouble(8887055249355788, +665), "1.3605202075612124e+216" );
    CheckDouble( MakeDouble(6994187472632449, +690), "3.5928102174759597e+223" );
    CheckDouble( MakeDouble(8797576579012143, +588), "8.912519771248455e+192"  );
    CheckDouble( MakeDouble(7363326733505337, +272), "5.5876975736230114e+97"  );
    CheckDouble( MakeDouble(8549497411294502, -448), "1.1762578307285404e-119" );
}

TEST_CASE("Double - Regression")
{
    CheckDouble(1.6521200219181297e-180, "1.6521200219181297e-180");
    CheckDouble(4.6663180925160944e-302, "4.6663180925160944e-302");

    CheckDouble(18776091678571.0 / 64.0);

    CheckDouble(2.0919495182368195e+19, "2.0919495182368195e+19");
    CheckDouble(2.6760179287532483e+19, "2.6760179287532483e+19");
    CheckDouble(3.2942957306323907e+19, "3.2942957306323907e+19");
    CheckDouble(3.9702293349085635e+19, "3.9702293349085635e+19");
    CheckDouble(4.0647939013152195e+19, "4.0647939013152195e+19");

    CheckDouble(1.8014398509481984E16, "1.8014398509481984E16");
    CheckDouble(1.8014398509481985E16, "1.8014398509481984E16");

    CheckDoubleBits(0x40C3880000000000, "10000"                 );
    CheckDoubleBits(0x41324F8000000000, "1200000"               );
    CheckDoubleBits(0x2B70000000000000, "1.82877982605164e-99"  );
    CheckDoubleBits(0x3E13C42855500898, "1.1505466208671903e-9" );
    CheckDoubleBits(0x443E2A6B41CE4B23, "556458931337667200000" );
    CheckDoubleBits(0x404A8475527A8B30, "53.034830388866226"    );
    CheckDoubleBits(0x3F6141F8CE9A7906, "0.0021066531670178605" );
}

TEST_CASE("Double - Round to even")
{
    CheckDouble(1.00000000000000005, "1");
    CheckDouble(1.00000000000000015, "1.0000000000000002"); // 1.000000000000000222...
    CheckDouble(1.99999999999999985, "1.9999999999999998"); // 1.999999999999999777...
    CheckDouble(1.99999999999999995, "2");
    CheckDouble(1125899906842623.75, "1125899906842623.8");
    CheckDouble(1125899906842624.25, "1125899906842624.2");
    CheckDouble(562949953421312.25, "562949953421312.2");

    CheckDouble(2.20781707763671875, "22078170776367188e-16");
    CheckDouble(1.81835174560546875, "18183517456054688e-16");
    CheckDouble(3.94171905517578125, "39417190551757812e-16");
    CheckDouble(3.73860931396484375, "37386093139648438e-16");
    CheckDouble(3.96773529052734375, "39677352905273438e-16");
    CheckDouble(1.32802581787109375, "13280258178710938e-16");
    CheckDouble(0.96515655517578125, "9651565551757812e-16");
    CheckDouble(0.76709747314453125, "7670974731445312e-16");
}

TEST_CASE("Double - Integers")
{
    double value = 1.0;
    std::string expected = "1";
    for (int i = 0; i <= 15; ++i)
    {
        CAPTURE(i);
        CheckDouble(value, expected);
        CHECK(float2str::ToString(value) == expected + ".0");
        value *= 10.0;
        expected += '0';
    }

    CheckDouble(9007199254740000.0, "9007199254740000");
    CheckDouble(9007199254740992.0, "9007199254740992");
    CheckDouble(1e+22, "1e+22");
    CheckDouble(1e+23, "1e+23");
}

TEST_CASE("Double - Looks like pow5")
{
    // These numbers have a mantissa that is a multiple of the largest power of 5 that fits,
    // and an exponent that causes the computation for q to result in 22, which is a corner
    // case for Ryu.
    CHECK(float2str::ToString(ReinterpretBits<double>(uint64_t{0x4830F0CF064DD592})) == "5.764607523034235e39");
    CHECK(float2str::ToString(ReinterpretBits<double>(uint64_t{0x4840F0CF064DD592})) == "1.152921504606847e40");
    CheckDoubleBits(0x4850F0CF064DD592, "2.305843009213694e+40");
}

TEST_CASE("Double - Random")
{
    std::mt19937_64 random(0xF10A7);
    std::uniform_int_distribution<uint64_t> gen(0, 0x7FEFFFFFFFFFFFFF);

    for (int i = 0; i < 100000; ++i)
    {
        const uint64_t bits = gen(random);
        if (bits == 0)
            continue;
        CheckDoubleBits(bits);
    }
}

//==================================================================================================
// Single
//==================================================================================================

TEST_CASE("Single - Special values")
{
    CHECK(float2str::ToString(std::numeric_limits<float>::quiet_NaN()) == "NAN");
    CHECK(float2str::ToString(MakeSingle(1, 0xFF, 0x00400000)) == "NAN");
    CHECK(float2str::ToString(MakeSingle(0, 0xFF, 0x00000001)) == "NAN");
    CHECK(float2str::ToString(std::numeric_limits<float>::infinity()) == "INFINITY");
    CHECK(float2str::ToString(-std::numeric_limits<float>::infinity()) == "NEG_INFINITY");
    CHECK(float2str::ToString(0.0f) == "0.0");
    CHECK(float2str::ToString(-0.0f) == "-0.0");
}

TEST_CASE("Single - Format")
{
    CHECK(float2str::ToString(1.0f) == "1.0");
    CHECK(float2str::ToString(-2.5f) == "-2.5");
    CHECK(float2str::ToString(3.14f) == "3.14");
    CHECK(float2str::ToString(0.1f) == "0.1");
    CHECK(float2str::ToString(0.3f) == "0.3");
    CHECK(float2str::ToString(123.456f) == "123.456");
    CHECK(float2str::ToString(65504.0f) == "65504.0");
    CHECK(float2str::ToString(1234567.0f) == "1234567.0");
    CHECK(float2str::ToString(9999999.0f) == "9999999.0");
    CHECK(float2str::ToString(16777216.0f) == "16777216.0");
    CHECK(float2str::ToString(33554432.0f) == "33554432.0");
    CHECK(float2str::ToString(1e10f) == "10000000000.0");
    CHECK(float2str::ToString(0.0001234f) == "0.0001234");
    CHECK(float2str::ToString(1e30f) == "1e30");
    CHECK(float2str::ToString(1e-30f) == "1e-30");
    CHECK(float2str::ToString(1e-20f) == "1e-20");
    CHECK(float2str::ToString(1e-38f) == "1e-38");
    CHECK(float2str::ToString(7.0385307e-26f) == "7.038531e-26");
    CHECK(float2str::ToString(-1.2345678e-7f) == "-1.2345679e-7");
}

TEST_CASE("Single - Fixed and scientific notation")
{
    // Decimal point position in (-6, 13] uses fixed notation.
    CHECK(float2str::ToString(1e12f) == "1000000000000.0");
    CHECK(float2str::ToString(9.999999e12f) == "9999999000000.0");
    CHECK(float2str::ToString(1e13f) == "1e13");

    CHECK(float2str::ToString(1e-5f) == "0.00001");
    CHECK(float2str::ToString(1e-6f) == "0.000001");
    CHECK(float2str::ToString(1.5e-6f) == "0.0000015");
    CHECK(float2str::ToString(1e-7f) == "1e-7");
}

TEST_CASE("Single - Boundaries")
{
    CHECK(float2str::ToString(MakeSingle(0,   0, 0x00000001)) == "1e-45");         // min denormal
    CHECK(float2str::ToString(MakeSingle(0,   0, 0x007FFFFF)) == "1.1754942e-38"); // max denormal
    CHECK(float2str::ToString(MakeSingle(0,   1, 0x00000000)) == "1.1754944e-38"); // min normal
    CHECK(float2str::ToString(MakeSingle(0, 254, 0x007FFFFF)) == "3.4028235e38");  // max normal

    CheckSingle(MakeSingle(0,   1, 0x00000001), "1.1754945e-38");
    CheckSingle(MakeSingle(0,   1, 0x007FFFFF), "2.3509886e-38");
    CheckSingle(MakeSingle(0,   2, 0x00000000), "2.3509887e-38");
    CheckSingle(MakeSingle(0,   2, 0x00000001), "2.350989e-38" );
    CheckSingle(MakeSingle(0,  24, 0x00000000), "9.8607613e-32"); // asymmetric interval
    CheckSingle(MakeSingle(0,  30, 0x00000000), "6.3108872e-30");
    CheckSingle(MakeSingle(0,  31, 0x00000000), "1.2621775e-29");
    CheckSingle(MakeSingle(0,  57, 0x00000000), "8.4703295e-22");
    CheckSingle(MakeSingle(0, 254, 0x007FFFFE), "3.4028233e+38");

    for (uint32_t e = 2; e < 254; ++e)
    {
        CAPTURE(e);
        CheckSingle(MakeSingle(0, e-1, 0x007FFFFF));
        CheckSingle(MakeSingle(0, e,   0x00000000));
        CheckSingle(MakeSingle(1, e,   0x00000001));
    }
}

TEST_CASE("Single - Paxson, Kahan")
{
    // Table 16: Stress Inputs for Converting 24-bit Binary to Decimal, < 1/2 ULP
    CheckSingle(MakeSingle(12676506, -102), "2.5e-24"        );
    CheckSingle(MakeSingle(12676506, -103), "1.25e-24"       );
    CheckSingle(MakeSingle(15445013,  +86), "1.195e+33"      );
    CheckSingle(MakeSingle(13734123, -138), "3.9415e-35"     );
    CheckSingle(MakeSingle(12428269, -130), "9.13085e-33"    );
    CheckSingle(MakeSingle(15334037, -146), "1.719005e-37"   );
    CheckSingle(MakeSingle(11518287,  -41), "0.0000052379105");
    CheckSingle(MakeSingle(12584953, -145), "2.821644e-37"   );
    CheckSingle(MakeSingle(15961084, -125), "3.7524328e-31"  );
    CheckSingle(MakeSingle(14915817, -146), "1.6721209e-37"  );
    CheckSingle(MakeSingle(10845484, -102), "2.1388946e-24"  );
    CheckSingle(MakeSingle(16431059,  -61), "7.125836e-12"   );

    // Table 17: Stress Inputs for Converting 24-bit Binary to Decimal, > 1/2 ULP
    CheckSingle(MakeSingle(16093626,  +69), "9.5e+27"              );
    CheckSingle(MakeSingle( 9983778,  +25), "335000000000000"      );
    CheckSingle(MakeSingle(12745034, +104), "2.585e+38"            );
    CheckSingle(MakeSingle(12706553,  +72), "6.0005e+28"           );
    CheckSingle(MakeSingle(11005028,  +45), "387205000000000000000");
    CheckSingle(MakeSingle(15059547,  +71), "3.555835e+28"         );
    CheckSingle(MakeSingle(16015691,  -99), "2.5268305e-23"        );
    CheckSingle(MakeSingle( 8667859,  +56), "6.245851e+23"         );
    CheckSingle(MakeSingle(14855922,  -82), "3.0721327e-18"        );
    CheckSingle(MakeSingle(14855922,  -83), "1.5360663e-18"        );
    CheckSingle(MakeSingle(10144164, -110), "7.81478e-27"          );
    CheckSingle(MakeSingle(13248074,  +95), "5.2481028e+35"        );
}

TEST_CASE("Single - Regression")
{
    CheckSingle(7.0385307e-26f);

    CheckSingleBits(0x4C000009, "33554468");
    CheckSingleBits(0x4C800009, "67108936");
    CheckSingleBits(0x4D00001D, "134218190");
    CheckSingleBits(0x4E80004F, "1073751900");
    CheckSingleBits(0x50000437, "8591039000");
    CheckSingleBits(0x52000DFB, "137497590000");
    CheckSingleBits(0x53802665, "1100799900000");
    CheckSingleBits(0x56802665, "70451196000000");
    CheckSingleBits(0x58A3E9AB, "1441791900000000");
    CheckSingleBits(0x5A5F8475, "15728639000000000");
    CheckSingleBits(0x5BDF8475, "125829116000000000");

    CheckSingleBits(0x4D00001E, "134218200");
    CheckSingleBits(0x4F800050, "4295008000");
    CheckSingleBits(0x53802666, "1100800000000");
    CheckSingleBits(0x5A5F8476, "15728640000000000");

    CHECK(float2str::ToString(ReinterpretBits<float>(uint32_t{0x4C000009})) == "33554468.0");
    CHECK(float2str::ToString(ReinterpretBits<float>(uint32_t{0x5B5F8475})) == "6.2914558e16");
}

TEST_CASE("Single - Last removed digit")
{
    // Narrow intervals where the digit removal loop may not run at all.
    CheckSingleBits(0x3800000A, "0.000030517615");
    CheckSingleBits(0x3880001E, "0.000061035375");
    CheckSingleBits(0x390000FB, "0.00012207397");
    CheckSingleBits(0x3A80020F, "0.0009766239");
    CheckSingleBits(0x3C800028, "0.015625075");
    CheckSingleBits(0x3E000032, "0.12500075");
    CheckSingleBits(0x3F000024, "0.50000215");
    CheckSingleBits(0x3F80008A, "1.0000165");
    CheckSingleBits(0x418000E8, "16.000443");
    CheckSingleBits(0x4300003A, "128.00089");
    CheckSingleBits(0x448000B3, "1024.0219");
    CheckSingleBits(0x45800015, "4096.0103");

    CheckSingleBits(0x39800000, "0.00024414062");
    CheckSingleBits(0x3B200000, "0.0024414062");
    CheckSingleBits(0x3E810000, "0.25195312");
    CheckSingleBits(0x3F808000, "1.0039062");
    CheckSingleBits(0x43000400, "128.01562");
    CheckSingleBits(0x46800020, "16384.062");
    CheckSingleBits(0x48000008, "131072.12");
    CheckSingleBits(0x49800002, "1048576.2");

    CheckSingleBits(0x4F80001E, "4294982700");
    CheckSingleBits(0x51800142, "68722115000");
    CheckSingleBits(0x56004279, "35255747000000");
    CheckSingleBits(0x5984CC95, "4672454700000000");
    CheckSingleBits(0x5B99C7AD, "86570435000000000");

    CHECK(float2str::ToString(ReinterpretBits<float>(uint32_t{0x3800000A})) == "0.000030517615");
    CHECK(float2str::ToString(ReinterpretBits<float>(uint32_t{0x39800000})) == "0.00024414062");
    CHECK(float2str::ToString(ReinterpretBits<float>(uint32_t{0x4F80001E})) == "4294982700.0");
}

TEST_CASE("Single - Random")
{
    std::mt19937 random(0xF10A7);
    std::uniform_int_distribution<uint32_t> gen(1, 0x7F7FFFFF);

    for (int i = 0; i < 100000; ++i)
    {
        const uint32_t bits = gen(random);
        CheckSingleBits(bits);
        CheckSingleBits(bits | 0x80000000);
    }
}

//==================================================================================================
// Bounds checked API
//==================================================================================================

TEST_CASE("FormatDouble")
{
    char buf[BufSize];

    SECTION("large buffer")
    {
        const auto res = float2str::FormatDouble(buf, BufSize, 3.14);
        CHECK(res);
        CHECK(res.status == float2str::FormatStatus::ok);
        REQUIRE(res.length == 4);
        CHECK(std::string(buf, 4) == "3.14");
    }

    SECTION("exact fit")
    {
        std::memset(buf, 'x', sizeof(buf));
        const auto res = float2str::FormatDouble(buf, 4, -1.5);
        CHECK(res);
        REQUIRE(res.length == 4);
        CHECK(std::string(buf, 4) == "-1.5");
        CHECK(buf[4] == 'x');
    }

    SECTION("too small")
    {
        std::memset(buf, 'x', sizeof(buf));
        const auto res = float2str::FormatDouble(buf, 3, 3.14);
        CHECK(!res);
        CHECK(res.status == float2str::FormatStatus::buffer_too_small);
        CHECK(res.length == 4);
        CHECK(std::string(buf, 4) == "xxxx");
    }

    SECTION("empty")
    {
        const auto res = float2str::FormatDouble(nullptr, 0, 0.0);
        CHECK(res.status == float2str::FormatStatus::buffer_too_small);
        CHECK(res.length == 3);
    }

    SECTION("longest output")
    {
        const auto res1 = float2str::FormatDouble(buf, 23, -2.2250738585072014e-308);
        CHECK(res1.status == float2str::FormatStatus::buffer_too_small);
        CHECK(res1.length == 24);

        const auto res2 = float2str::FormatDouble(buf, 24, -2.2250738585072014e-308);
        CHECK(res2);
        REQUIRE(res2.length == 24);
        CHECK(std::string(buf, 24) == "-2.2250738585072014e-308");
    }

    SECTION("special values")
    {
        const auto res = float2str::FormatDouble(buf, 8, -std::numeric_limits<double>::infinity());
        CHECK(res.status == float2str::FormatStatus::buffer_too_small);
        CHECK(res.length == 12);
    }

    SECTION("array")
    {
        char arr[float2str::MinBufferLength];
        const int length = float2str::FormatDouble(arr, 1e-7);
        CHECK(std::string(arr, static_cast<size_t>(length)) == "1e-7");
    }
}

TEST_CASE("FormatFloat")
{
    char buf[BufSize];

    std::memset(buf, 'x', sizeof(buf));
    const auto res1 = float2str::FormatFloat(buf, 2, 3.4028235e38f);
    CHECK(res1.status == float2str::FormatStatus::buffer_too_small);
    CHECK(res1.length == 12);
    CHECK(buf[0] == 'x');

    const auto res2 = float2str::FormatFloat(buf, 12, 3.4028235e38f);
    CHECK(res2);
    REQUIRE(res2.length == 12);
    CHECK(std::string(buf, 12) == "3.4028235e38");

    char arr[float2str::MinBufferLength];
    const int length = float2str::FormatFloat(arr, 16777216.0f);
    CHECK(std::string(arr, static_cast<size_t>(length)) == "16777216.0");
}

//==================================================================================================
// ToDecimal
//==================================================================================================

TEST_CASE("ToDecimal - Double")
{
    const auto check = [](double value, uint64_t mantissa, int32_t exponent) {
        CAPTURE(value);
        const auto dec = float2str::ToDecimal(value);
        CHECK(dec.mantissa == mantissa);
        CHECK(dec.exponent == exponent);
    };

    check(1.0, 1, 0);
    check(-1.5, 15, -1);
    check(100.0, 1, 2);
    check(0.3, 3, -1);
    check(123456.0, 123456, 0);
    check(1e30, 1, 30);
    check(5e-324, 5, -324);
    check(9223372036854775808.0, 9223372036854776, 3);
    check(1.7976931348623157e308, 17976931348623157, 292);
}

TEST_CASE("ToDecimal - Single")
{
    const auto check = [](float value, uint32_t mantissa, int32_t exponent) {
        CAPTURE(value);
        const auto dec = float2str::ToDecimal(value);
        CHECK(dec.mantissa == mantissa);
        CHECK(dec.exponent == exponent);
    };

    check(3.14f, 314, -2);
    check(100.0f, 1, 2);
    check(0.1f, 1, -1);
    check(1e-45f, 1, -45);
    check(16777216.0f, 16777216, 0);
    check(3.4028235e38f, 34028235, 31);
}
