#include "common/stream_position.hpp"

#include <gtest/gtest.h>

#include <string_view>

using namespace instream;

TEST(StreamPositionTest, DefaultConstruction) {
    StreamPosition pos;
    EXPECT_EQ(pos.offset, 0u);
    EXPECT_EQ(pos.line, 1u);
    EXPECT_EQ(pos.column, 1u);
}

TEST(StreamPositionTest, AdvanceTracksLines) {
    StreamPosition pos;
    for (char c : std::string_view("ab\ncd")) {
        pos.advance(static_cast<uint8_t>(c));
    }
    EXPECT_EQ(pos.offset, 5u);
    EXPECT_EQ(pos.line, 2u);
    EXPECT_EQ(pos.column, 3u);
}

TEST(StreamPositionTest, CarriageReturnIsAColumn) {
    StreamPosition pos;
    pos.advance('\r');
    EXPECT_EQ(pos.line, 1u);
    EXPECT_EQ(pos.column, 2u);
}

TEST(StreamPositionTest, Equality) {
    StreamPosition a{4, 2, 1};
    StreamPosition b{4, 2, 1};
    StreamPosition c{5, 2, 2};
    EXPECT_EQ(a, b);
    EXPECT_NE(a, c);
}

TEST(StreamLocationTest, ToString) {
    StreamLocation loc{"numbers.txt", {42, 10, 5}};
    EXPECT_EQ(loc.to_string(), "numbers.txt:10:5");
}

TEST(StreamLocationTest, ToStringWithoutSource) {
    StreamLocation loc{"", {0, 3, 1}};
    EXPECT_EQ(loc.to_string(), "3:1");
}
