#include "common/scan_error.hpp"

#include <gtest/gtest.h>

#include <string>
#include <system_error>

using namespace instream;

TEST(ScanErrorTest, KindNames) {
    EXPECT_EQ(error_kind_to_string(ErrorKind::UnexpectedEof), "unexpected end of input");
    EXPECT_EQ(error_kind_to_string(ErrorKind::InvalidFormat), "invalid format");
    EXPECT_EQ(error_kind_to_string(ErrorKind::Overflow), "overflow");
    EXPECT_EQ(error_kind_to_string(ErrorKind::LimitExceeded), "limit exceeded");
    EXPECT_EQ(error_kind_to_string(ErrorKind::Io), "I/O error");
}

TEST(ScanErrorTest, InvalidFormatQuotesToken) {
    auto e = ScanError::invalid_format("abc", "i32");
    EXPECT_EQ(e.kind, ErrorKind::InvalidFormat);
    EXPECT_EQ(e.message, "'abc' is not a valid i32");
    EXPECT_FALSE(e.io);
}

TEST(ScanErrorTest, LongTokensAreTruncated) {
    std::string token(100, '9');
    auto e = ScanError::overflow(token, "i32");
    EXPECT_EQ(e.kind, ErrorKind::Overflow);
    EXPECT_EQ(e.message, "'" + std::string(32, '9') + "...' is out of range for i32");
}

TEST(ScanErrorTest, LimitExceededNamesLimit) {
    auto e = ScanError::limit_exceeded(10);
    EXPECT_TRUE(e.is(ErrorKind::LimitExceeded));
    EXPECT_EQ(e.message, "token not delimited within 10 bytes");
}

TEST(ScanErrorTest, IoKeepsErrorCode) {
    auto ec = std::make_error_code(std::errc::connection_reset);
    auto e = ScanError::from_io(ec);
    EXPECT_EQ(e.kind, ErrorKind::Io);
    EXPECT_EQ(e.io, ec);
    EXPECT_EQ(e.message, ec.message());
}

TEST(ScanErrorTest, FormatError) {
    EXPECT_EQ(format_error(ScanError::unexpected_eof()),
              "unexpected end of input: end of input before a token");
    EXPECT_EQ(format_error(ScanError::invalid_format("x", "bool")),
              "invalid format: 'x' is not a valid bool");
}
