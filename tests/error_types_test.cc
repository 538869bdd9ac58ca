// SPDX-License-Identifier: MIT
#include <gtest/gtest.h>
#include "src/support/error_types.hpp"
#include <sstream>

using namespace arith;

TEST(TriangleErrorTest, DefaultsToZeroCoordinates) {
    TriangleError err(TriangleErrorCode::UnboundedIndex);
    EXPECT_EQ(err.row, 0);
    EXPECT_EQ(err.column, 0);
}

TEST(TriangleErrorTest, Equality) {
    EXPECT_EQ(TriangleError(TriangleErrorCode::InvalidIndex, 2, 3),
              TriangleError(TriangleErrorCode::InvalidIndex, 2, 3));
    EXPECT_NE(TriangleError(TriangleErrorCode::InvalidIndex, 2, 3),
              TriangleError(TriangleErrorCode::Overflow, 2, 3));
}

TEST(TriangleErrorTest, CodeNames) {
    EXPECT_EQ(to_string(TriangleErrorCode::InvalidIndex), "InvalidIndex");
    EXPECT_EQ(to_string(TriangleErrorCode::Overflow), "Overflow");
    EXPECT_EQ(to_string(TriangleErrorCode::UnboundedIndex), "UnboundedIndex");
    EXPECT_EQ(to_string(TriangleErrorCode::InvalidConfiguration), "InvalidConfiguration");
}

TEST(TriangleErrorTest, StreamOutput) {
    std::ostringstream os;
    os << TriangleError(TriangleErrorCode::Overflow, 63);
    EXPECT_EQ(os.str(), "TriangleError{code=Overflow, row=63, column=0}");
}

TEST(OverflowErrorTest, StreamOutput) {
    std::ostringstream os;
    os << OverflowError{7, 64};
    EXPECT_EQ(os.str(), "OverflowError{a=7, b=64}");
}
