#include "scan/convert.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <cstdint>
#include <limits>
#include <string>
#include <vector>

using namespace instream;

namespace {

template <typename T>
ErrorKind kind_of(std::string_view token) {
    auto r = TokenConverter<T>::convert(token);
    EXPECT_TRUE(r.is_err()) << "expected '" << token << "' to fail";
    return r.is_err() ? r.error().kind : ErrorKind::Io;
}

} // namespace

// ============================================================================
// Capability
// ============================================================================

static_assert(TokenConvertible<int8_t>);
static_assert(TokenConvertible<uint64_t>);
static_assert(TokenConvertible<long long>);
static_assert(TokenConvertible<float>);
static_assert(TokenConvertible<long double>);
static_assert(TokenConvertible<char>);
static_assert(TokenConvertible<bool>);
static_assert(TokenConvertible<std::string>);
static_assert(TokenConvertible<std::vector<uint8_t>>);
static_assert(!TokenConvertible<wchar_t>);
static_assert(!TokenConvertible<std::vector<int>>);

// ============================================================================
// Integers
// ============================================================================

TEST(IntegerConvertTest, PlainDecimal) {
    EXPECT_EQ(TokenConverter<int32_t>::convert("42").value(), 42);
    EXPECT_EQ(TokenConverter<int32_t>::convert("-17").value(), -17);
    EXPECT_EQ(TokenConverter<int32_t>::convert("+5").value(), 5);
    EXPECT_EQ(TokenConverter<int32_t>::convert("007").value(), 7);
    EXPECT_EQ(TokenConverter<int32_t>::convert("-0").value(), 0);
}

TEST(IntegerConvertTest, Extremes) {
    EXPECT_EQ(TokenConverter<int8_t>::convert("127").value(), 127);
    EXPECT_EQ(TokenConverter<int8_t>::convert("-128").value(), -128);
    EXPECT_EQ(TokenConverter<uint8_t>::convert("255").value(), 255);
    EXPECT_EQ(TokenConverter<int64_t>::convert("9223372036854775807").value(),
              std::numeric_limits<int64_t>::max());
    EXPECT_EQ(TokenConverter<int64_t>::convert("-9223372036854775808").value(),
              std::numeric_limits<int64_t>::min());
    EXPECT_EQ(TokenConverter<uint64_t>::convert("18446744073709551615").value(),
              std::numeric_limits<uint64_t>::max());
}

TEST(IntegerConvertTest, OneStepPastTheEdgeOverflows) {
    EXPECT_EQ(kind_of<int8_t>("128"), ErrorKind::Overflow);
    EXPECT_EQ(kind_of<int8_t>("-129"), ErrorKind::Overflow);
    EXPECT_EQ(kind_of<uint8_t>("256"), ErrorKind::Overflow);
    EXPECT_EQ(kind_of<int64_t>("9223372036854775808"), ErrorKind::Overflow);
    EXPECT_EQ(kind_of<int64_t>("-9223372036854775809"), ErrorKind::Overflow);
    EXPECT_EQ(kind_of<uint64_t>("18446744073709551616"), ErrorKind::Overflow);
    EXPECT_EQ(kind_of<int32_t>("123456789012345678901234567890"), ErrorKind::Overflow);
}

TEST(IntegerConvertTest, MalformedTokens) {
    EXPECT_EQ(kind_of<int32_t>("abc"), ErrorKind::InvalidFormat);
    EXPECT_EQ(kind_of<int32_t>("-"), ErrorKind::InvalidFormat);
    EXPECT_EQ(kind_of<int32_t>("+"), ErrorKind::InvalidFormat);
    EXPECT_EQ(kind_of<int32_t>("123abc"), ErrorKind::InvalidFormat);
    EXPECT_EQ(kind_of<int32_t>("1.5"), ErrorKind::InvalidFormat);
    EXPECT_EQ(kind_of<int32_t>("--1"), ErrorKind::InvalidFormat);
    EXPECT_EQ(kind_of<int32_t>("0x10"), ErrorKind::InvalidFormat);
    EXPECT_EQ(kind_of<int32_t>(""), ErrorKind::InvalidFormat);
}

TEST(IntegerConvertTest, TrailingGarbageBeatsOverflow) {
    EXPECT_EQ(kind_of<int32_t>("99999999999999x"), ErrorKind::InvalidFormat);
}

TEST(IntegerConvertTest, UnsignedRejectsMinus) {
    EXPECT_EQ(kind_of<uint32_t>("-1"), ErrorKind::InvalidFormat);
    EXPECT_EQ(kind_of<uint32_t>("-0"), ErrorKind::InvalidFormat);
    EXPECT_EQ(TokenConverter<uint32_t>::convert("+1").value(), 1u);
}

TEST(IntegerConvertTest, SignedCharIsANumber) {
    EXPECT_EQ(TokenConverter<signed char>::convert("-5").value(), -5);
    EXPECT_EQ(TokenConverter<unsigned char>::convert("200").value(), 200);
}

TEST(IntegerConvertTest, ErrorNamesTargetType) {
    auto r = TokenConverter<uint16_t>::convert("70000");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error().message, "'70000' is out of range for u16");
}

TEST(IntegerConvertTest, EveryInt16RoundTrips) {
    for (int v = std::numeric_limits<int16_t>::min(); v <= std::numeric_limits<int16_t>::max(); ++v) {
        auto r = TokenConverter<int16_t>::convert(std::to_string(v));
        ASSERT_TRUE(r.is_ok()) << v;
        ASSERT_EQ(r.value(), v);
    }
}

// ============================================================================
// Floating point
// ============================================================================

TEST(FloatConvertTest, Forms) {
    EXPECT_DOUBLE_EQ(TokenConverter<double>::convert("3.14").value(), 3.14);
    EXPECT_DOUBLE_EQ(TokenConverter<double>::convert("-2.85").value(), -2.85);
    EXPECT_DOUBLE_EQ(TokenConverter<double>::convert("+12.5").value(), 12.5);
    EXPECT_DOUBLE_EQ(TokenConverter<double>::convert("5").value(), 5.0);
    EXPECT_DOUBLE_EQ(TokenConverter<double>::convert("5.").value(), 5.0);
    EXPECT_DOUBLE_EQ(TokenConverter<double>::convert(".5").value(), 0.5);
    EXPECT_DOUBLE_EQ(TokenConverter<double>::convert("1e3").value(), 1000.0);
    EXPECT_DOUBLE_EQ(TokenConverter<double>::convert("2.5E-2").value(), 0.025);
    EXPECT_DOUBLE_EQ(TokenConverter<double>::convert("1e+2").value(), 100.0);
    EXPECT_FLOAT_EQ(TokenConverter<float>::convert("0.1").value(), 0.1f);
}

TEST(FloatConvertTest, InfinityAndNan) {
    EXPECT_TRUE(std::isinf(TokenConverter<double>::convert("inf").value()));
    EXPECT_TRUE(std::isinf(TokenConverter<double>::convert("Infinity").value()));
    EXPECT_LT(TokenConverter<double>::convert("-inf").value(), 0.0);
    EXPECT_TRUE(std::isnan(TokenConverter<double>::convert("NaN").value()));
}

TEST(FloatConvertTest, MalformedTokens) {
    EXPECT_EQ(kind_of<double>("abc"), ErrorKind::InvalidFormat);
    EXPECT_EQ(kind_of<double>("."), ErrorKind::InvalidFormat);
    EXPECT_EQ(kind_of<double>("-"), ErrorKind::InvalidFormat);
    EXPECT_EQ(kind_of<double>("1e"), ErrorKind::InvalidFormat);
    EXPECT_EQ(kind_of<double>("1e+"), ErrorKind::InvalidFormat);
    EXPECT_EQ(kind_of<double>("1.2.3"), ErrorKind::InvalidFormat);
    EXPECT_EQ(kind_of<double>("3.14abc"), ErrorKind::InvalidFormat);
    EXPECT_EQ(kind_of<double>("0x1p3"), ErrorKind::InvalidFormat);
    EXPECT_EQ(kind_of<double>("nan(1)"), ErrorKind::InvalidFormat);
    EXPECT_EQ(kind_of<double>("1,5"), ErrorKind::InvalidFormat);
}

TEST(FloatConvertTest, TooLargeSaturatesToInfinity) {
    auto big = TokenConverter<double>::convert("1e400");
    ASSERT_TRUE(big.is_ok());
    EXPECT_TRUE(std::isinf(big.value()));
    EXPECT_GT(big.value(), 0.0);

    auto negative = TokenConverter<double>::convert("-123.4e400");
    ASSERT_TRUE(negative.is_ok());
    EXPECT_TRUE(std::isinf(negative.value()));
    EXPECT_LT(negative.value(), 0.0);

    EXPECT_TRUE(std::isinf(TokenConverter<float>::convert("1e40").value()));
}

TEST(FloatConvertTest, TooSmallSaturatesToSignedZero) {
    auto tiny = TokenConverter<double>::convert("1e-400");
    ASSERT_TRUE(tiny.is_ok());
    EXPECT_EQ(tiny.value(), 0.0);
    EXPECT_FALSE(std::signbit(tiny.value()));

    auto negative = TokenConverter<double>::convert("-0.0001e-400");
    ASSERT_TRUE(negative.is_ok());
    EXPECT_EQ(negative.value(), 0.0);
    EXPECT_TRUE(std::signbit(negative.value()));

    // Large mantissa, even larger negative exponent.
    EXPECT_EQ(TokenConverter<double>::convert("12345e-400").value(), 0.0);
    EXPECT_EQ(TokenConverter<float>::convert("1e-50").value(), 0.0f);
}

TEST(FloatConvertTest, SubnormalsAreKept) {
    auto r = TokenConverter<double>::convert("4e-320");
    ASSERT_TRUE(r.is_ok());
    EXPECT_GT(r.value(), 0.0);
}

// ============================================================================
// char, bool, strings
// ============================================================================

TEST(CharConvertTest, SingleByte) {
    EXPECT_EQ(TokenConverter<char>::convert("z").value(), 'z');
    EXPECT_EQ(kind_of<char>("zz"), ErrorKind::InvalidFormat);
}

TEST(BoolConvertTest, Words) {
    EXPECT_TRUE(TokenConverter<bool>::convert("true").value());
    EXPECT_FALSE(TokenConverter<bool>::convert("false").value());
    EXPECT_TRUE(TokenConverter<bool>::convert("1").value());
    EXPECT_FALSE(TokenConverter<bool>::convert("0").value());
    EXPECT_EQ(kind_of<bool>("True"), ErrorKind::InvalidFormat);
    EXPECT_EQ(kind_of<bool>("2"), ErrorKind::InvalidFormat);
    EXPECT_EQ(kind_of<bool>("yes"), ErrorKind::InvalidFormat);
}

TEST(StringConvertTest, TokenIsReturnedAsIs) {
    EXPECT_EQ(TokenConverter<std::string>::convert("neighbour,").value(), "neighbour,");
    EXPECT_EQ(TokenConverter<std::string>::convert("\"quoted\"").value(), "\"quoted\"");
}

TEST(BytesConvertTest, NonUtf8BytesSurvive) {
    auto r = TokenConverter<std::vector<uint8_t>>::convert("\xff\xfe");
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value(), (std::vector<uint8_t>{0xff, 0xfe}));
}
