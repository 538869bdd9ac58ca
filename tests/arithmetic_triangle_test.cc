// SPDX-License-Identifier: MIT
#include <gtest/gtest.h>
#include "src/triangle/arithmetic_triangle.hpp"
#include <cstdint>
#include <limits>
#include <string>
#include <vector>

namespace arith {
namespace {

int64_t brute_force_sum(const ArithmeticTriangle<int64_t>& t, ColumnRange columns, int64_t row) {
    int64_t sum = 0;
    for (int64_t c = columns.lower; c < columns.upper; ++c) {
        if (c >= 0 && c <= row) sum += t.value(row, c);
    }
    return sum;
}

// ===========================================================================
// Value engine
// ===========================================================================

TEST(ArithmeticTriangleTest, FirstAndLastColumnsAreBase) {
    ArithmeticTriangle<int64_t> t;
    for (int64_t row : {0, 1, 2, 3, 100}) {
        EXPECT_EQ(t.value(row, 0), 1) << "row " << row;
        EXPECT_EQ(t.value(row, row), 1) << "row " << row;
    }
}

TEST(ArithmeticTriangleTest, SecondAndPenultimateColumns) {
    ArithmeticTriangle<int64_t> t;
    EXPECT_EQ(t.value(2, 1), 2);
    EXPECT_EQ(t.value(3, 1), 3);
    EXPECT_EQ(t.value(42, 1), 42);
    EXPECT_EQ(t.value(100, 1), 100);

    EXPECT_EQ(t.value(3, 2), 3);
    EXPECT_EQ(t.value(42, 41), 42);
    EXPECT_EQ(t.value(100, 99), 100);
}

TEST(ArithmeticTriangleTest, MiddleColumns) {
    ArithmeticTriangle<int64_t> t;
    EXPECT_EQ(t.value(6, 2), 15);
    EXPECT_EQ(t.value(6, 3), 20);
    EXPECT_EQ(t.value(6, 4), 15);
    EXPECT_EQ(t.value(7, 2), 21);
    EXPECT_EQ(t.value(7, 3), 35);
    EXPECT_EQ(t.value(7, 4), 35);
    EXPECT_EQ(t.value(7, 5), 21);
    EXPECT_EQ(t.value(40, 20), 137846528820);
}

TEST(ArithmeticTriangleTest, OutsideTriangleIsZero) {
    ArithmeticTriangle<int64_t> t;
    EXPECT_EQ(t.value(-1, 0), 0);
    EXPECT_EQ(t.value(-5, -5), 0);
    EXPECT_EQ(t.value(3, -1), 0);
    EXPECT_EQ(t.value(3, 4), 0);
    EXPECT_EQ(t.value(0, 1), 0);
}

TEST(ArithmeticTriangleTest, BoundarySymmetryAndRecurrenceHold) {
    ArithmeticTriangle<int64_t> t(3);
    for (int64_t row = 0; row <= 40; ++row) {
        EXPECT_EQ(t.value(row, 0), 3);
        EXPECT_EQ(t.value(row, row), 3);
        for (int64_t column = 0; column <= row; ++column) {
            EXPECT_EQ(t.value(row, column), t.value(row, row - column));
            if (column > 0 && column < row) {
                EXPECT_EQ(t.value(row, column),
                          t.value(row - 1, column) + t.value(row - 1, column - 1));
            }
        }
    }
}

TEST(ArithmeticTriangleTest, SubscriptMatchesValue) {
    ArithmeticTriangle<int64_t> t;
    EXPECT_EQ(t[TriangleIndex(7, 3)], 35);
    EXPECT_EQ(t[TriangleIndex(0, 0)], 1);
}

TEST(ArithmeticTriangleTest, FloatingPointBase) {
    ArithmeticTriangle<double> t(0.5);
    EXPECT_DOUBLE_EQ(t.value(6, 2), 7.5);
    EXPECT_DOUBLE_EQ(t.value(7, 5), 10.5);
    EXPECT_DOUBLE_EQ(t.value(3, 7), 0.0);
}

TEST(ArithmeticTriangleTest, NumberOfColumns) {
    EXPECT_EQ(ArithmeticTriangle<int64_t>::number_of_columns(0), 1);
    EXPECT_EQ(ArithmeticTriangle<int64_t>::number_of_columns(5), 6);
    EXPECT_EQ(ArithmeticTriangle<int64_t>::number_of_columns(-1), 0);
}

// ===========================================================================
// Row sums
// ===========================================================================

TEST(ArithmeticTriangleTest, SumOfIntegersInRow) {
    ArithmeticTriangle<int64_t> t;
    EXPECT_EQ(t.sum_of_row(0), 1);
    EXPECT_EQ(t.sum_of_row(1), 2);
    EXPECT_EQ(t.sum_of_row(2), 4);
    EXPECT_EQ(t.sum_of_row(3), 8);
    EXPECT_EQ(t.sum_of_row(4), 16);
    EXPECT_EQ(t.sum_of_row(5), 32);
    EXPECT_EQ(t.sum_of_row(49), 562949953421312);
    EXPECT_EQ(t.sum_of_row(-1), 0);
}

TEST(ArithmeticTriangleTest, RowSumByHalvesMatchesShift) {
    ArithmeticTriangle<int64_t> t(5);
    for (int64_t row = 0; row <= 40; ++row) {
        EXPECT_EQ(t.sum_of_row_by_halves(row), t.sum_of_row(row)) << "row " << row;

        int64_t direct = 0;
        for (int64_t column = 0; column <= row; ++column) direct += t.value(row, column);
        EXPECT_EQ(t.sum_of_row(row), direct) << "row " << row;
    }
}

TEST(ArithmeticTriangleTest, GenericRowSumForFloatingPoint) {
    ArithmeticTriangle<double> t(0.5);
    EXPECT_DOUBLE_EQ(t.sum_of_row(0), 0.5);
    EXPECT_DOUBLE_EQ(t.sum_of_row(3), 4.0);
    EXPECT_DOUBLE_EQ(t.sum_of_row(10), 512.0);
    EXPECT_DOUBLE_EQ(t.sum_of_row(11), 1024.0);
    EXPECT_DOUBLE_EQ(t.sum_of_row(-3), 0.0);
}

TEST(ArithmeticTriangleTest, CheckedRowSumDetectsOverflow) {
    ArithmeticTriangle<int64_t> t;
    auto ok = t.checked_sum_of_row(62);
    ASSERT_TRUE(ok.has_value());
    EXPECT_EQ(ok.value(), int64_t{1} << 62);

    auto overflow = t.checked_sum_of_row(63);
    ASSERT_FALSE(overflow.has_value());
    EXPECT_EQ(overflow.error().code, TriangleErrorCode::Overflow);
    EXPECT_EQ(overflow.error().row, 63);

    ArithmeticTriangle<int64_t> three(3);
    EXPECT_FALSE(three.checked_sum_of_row(62).has_value());
    EXPECT_TRUE(three.checked_sum_of_row(61).has_value());
}

TEST(ArithmeticTriangleTest, CheckedRowSumForSmallIntegers) {
    ArithmeticTriangle<uint8_t> t;
    EXPECT_EQ(t.checked_sum_of_row(7).value(), 128);
    EXPECT_FALSE(t.checked_sum_of_row(8).has_value());
}

TEST(ArithmeticTriangleTest, UncheckedRowSumWrapsAround) {
    ArithmeticTriangle<uint8_t> t;
    EXPECT_EQ(t.sum_of_row(7), 128);
    EXPECT_EQ(t.sum_of_row(8), 0);
    EXPECT_EQ(t.sum_of_row(100), 0);

    ArithmeticTriangle<uint8_t> three(3);
    EXPECT_EQ(three.sum_of_row(7), 128);  // 384 mod 256
}

TEST(ArithmeticTriangleTest, CheckedRowSumForFloatingPointAlwaysSucceeds) {
    ArithmeticTriangle<double> t(1.0);
    auto result = t.checked_sum_of_row(200);
    ASSERT_TRUE(result.has_value());
    EXPECT_GT(result.value(), 1e59);
}

// ===========================================================================
// Range sums
// ===========================================================================

TEST(ArithmeticTriangleTest, SumOfSomeIntegersInRow) {
    ArithmeticTriangle<int64_t> t;
    auto closed = [](int64_t lo, int64_t hi) { return ClosedColumnRange{lo, hi}; };

    // First columns
    EXPECT_EQ(t.sum_of_columns(closed(0, 0), 0), 1);
    EXPECT_EQ(t.sum_of_columns(closed(0, 0), 1), 1);
    EXPECT_EQ(t.sum_of_columns(closed(0, 0), 2), 1);

    // Last columns
    EXPECT_EQ(t.sum_of_columns(closed(1, 1), 1), 1);
    EXPECT_EQ(t.sum_of_columns(closed(2, 2), 2), 1);

    EXPECT_EQ(t.sum_of_columns(closed(0, 1), 1), 2);
    EXPECT_EQ(t.sum_of_columns(closed(0, 2), 2), 4);
    EXPECT_EQ(t.sum_of_columns(closed(1, 2), 2), 3);
    EXPECT_EQ(t.sum_of_columns(closed(0, 1), 2), 3);
    EXPECT_EQ(t.sum_of_columns(closed(2, 2), 4), 6);
    EXPECT_EQ(t.sum_of_columns(closed(1, 3), 4), 14);
    EXPECT_EQ(t.sum_of_columns(closed(1, 3), 5), 25);
    EXPECT_EQ(t.sum_of_columns(closed(1, 5), 5), 31);
    EXPECT_EQ(t.sum_of_columns(closed(0, 4), 5), 31);
    EXPECT_EQ(t.sum_of_columns(closed(2, 3), 5), 20);
    EXPECT_EQ(t.sum_of_columns(closed(2, 3), 6), 35);
    EXPECT_EQ(t.sum_of_columns(closed(2, 4), 6), 50);
}

TEST(ArithmeticTriangleTest, HalfOpenRangeSums) {
    ArithmeticTriangle<int64_t> t;
    EXPECT_EQ(t.sum_of_columns(ColumnRange{2, 4}, 6), 35);
    EXPECT_EQ(t.sum_of_columns(ColumnRange{0, 7}, 6), 64);
    EXPECT_EQ(t.sum_of_columns(ColumnRange{3, 3}, 6), 0);
}

TEST(ArithmeticTriangleTest, ColumnsOutsideRowAreIgnored) {
    ArithmeticTriangle<int64_t> t;
    EXPECT_EQ(t.sum_of_columns(ColumnRange{-5, 100}, 6), 64);
    EXPECT_EQ(t.sum_of_columns(ColumnRange{-3, 1}, 6), 1);
    EXPECT_EQ(t.sum_of_columns(ColumnRange{7, 10}, 6), 0);
    EXPECT_EQ(t.sum_of_columns(ColumnRange{5, 20}, 6), 7);
    EXPECT_EQ(t.sum_of_columns(ColumnRange{0, 3}, -1), 0);
}

TEST(ArithmeticTriangleTest, BoundaryRangeThatSkipsInterior) {
    // Touches the left boundary but stops well short of the right one
    ArithmeticTriangle<int64_t> t;
    EXPECT_EQ(t.sum_of_columns(ClosedColumnRange{0, 3}, 10), 1 + 10 + 45 + 120);
    EXPECT_EQ(t.sum_of_columns(ClosedColumnRange{8, 10}, 10), 45 + 10 + 1);
}

TEST(ArithmeticTriangleTest, RangeSumRepresentableWhenRowSumIsNot) {
    // Row 63 sums to 2^63, which wraps in int64_t; columns [1, 62] do not
    ArithmeticTriangle<int64_t> t;
    const int64_t expected = std::numeric_limits<int64_t>::max() - 1;
    EXPECT_EQ(t.sum_of_columns(ColumnRange{1, 63}, 63), expected);
    EXPECT_EQ(t.sum_of_columns(ClosedColumnRange{1, 62}, 63), expected);
    EXPECT_EQ(t.sum_of_columns(ColumnRange{0, 63}, 63), std::numeric_limits<int64_t>::max());
}

TEST(ArithmeticTriangleTest, RangeSumRepresentableWhenRowSumIsNot32Bit) {
    ArithmeticTriangle<int32_t> t;
    EXPECT_EQ(t.sum_of_columns(ColumnRange{1, 31}, 31), std::numeric_limits<int32_t>::max() - 1);
    EXPECT_EQ(t.sum_of_columns(ClosedColumnRange{1, 31}, 31), std::numeric_limits<int32_t>::max());
}

TEST(ArithmeticTriangleTest, EveryRangeMatchesBruteForce) {
    ArithmeticTriangle<int64_t> t;
    ArithmeticTriangle<int64_t> reference;
    for (int64_t row = 0; row <= 12; ++row) {
        for (int64_t lo = -2; lo <= row + 2; ++lo) {
            for (int64_t hi = lo; hi <= row + 3; ++hi) {
                const ColumnRange columns{lo, hi};
                EXPECT_EQ(t.sum_of_columns(columns, row), brute_force_sum(reference, columns, row))
                    << "row " << row << " columns [" << lo << ", " << hi << ")";
            }
        }
    }
}

// ===========================================================================
// Elements without subtraction
// ===========================================================================

static_assert(AdditiveElement<std::string>);
static_assert(!SubtractiveElement<std::string>);
static_assert(SubtractiveElement<double>);
static_assert(IntegerElement<int64_t>);
static_assert(!IntegerElement<bool>);
static_assert(!IntegerElement<double>);

TEST(ArithmeticTriangleTest, ConcatenationElement) {
    ArithmeticTriangle<std::string> t("a");
    EXPECT_EQ(t.value(0, 0), "a");
    EXPECT_EQ(t.value(6, 2).size(), 15u);
    EXPECT_EQ(t.value(6, 7), "");
    EXPECT_EQ(t.sum_of_row(6).size(), 64u);

    // Covers the interior but not the boundary: summed directly
    EXPECT_EQ(t.sum_of_columns(ColumnRange{1, 6}, 6).size(), 62u);
    EXPECT_EQ(t.sum_of_columns(ColumnRange{0, 7}, 6).size(), 64u);
}

}  // namespace
}  // namespace arith
