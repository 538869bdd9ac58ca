// SPDX-License-Identifier: MIT
#pragma once

#include "src/sequence/interval.hpp"
#include <array>
#include <cstdint>
#include <limits>
#include <string_view>

namespace arith {

/// How a column-range sum is evaluated
///
/// | Strategy             | Range shape                                   | Cost          |
/// |----------------------|-----------------------------------------------|---------------|
/// | Empty                | no column of the row                          | O(1)          |
/// | SingleColumn         | exactly one column                            | one lookup    |
/// | FullRow              | [0, row]                                      | row sum       |
/// | SmallRow             | row < 4, every column is exterior             | O(row)        |
/// | Interior             | inside [2, row - 2]                           | O(length)     |
/// | FullRowMinusExterior | covers [2, row - 2] but not the full row      | row sum + 4   |
/// | Direct               | anything else                                 | O(length)     |
enum class RangeSumStrategy {
    Empty,
    SingleColumn,
    FullRow,
    SmallRow,
    Interior,
    FullRowMinusExterior,
    Direct
};

constexpr std::string_view to_string(RangeSumStrategy strategy) noexcept {
    switch (strategy) {
        case RangeSumStrategy::Empty: return "Empty";
        case RangeSumStrategy::SingleColumn: return "SingleColumn";
        case RangeSumStrategy::FullRow: return "FullRow";
        case RangeSumStrategy::SmallRow: return "SmallRow";
        case RangeSumStrategy::Interior: return "Interior";
        case RangeSumStrategy::FullRowMinusExterior: return "FullRowMinusExterior";
        case RangeSumStrategy::Direct: return "Direct";
    }
    return "Unknown";
}

/// Rows below this index have no interior columns
inline constexpr int64_t SMALL_ROW_LIMIT = 4;

/// All columns of a row as a half-open range (empty for row < 0)
///
/// Saturates for row == INT64_MAX: the result is [0, INT64_MAX), which
/// leaves out the last column of that row.
constexpr ColumnRange row_columns(int64_t row) noexcept {
    if (row < 0) return {0, 0};
    const int64_t upper = row == std::numeric_limits<int64_t>::max() ? row : row + 1;
    return {0, upper};
}

/// Interior columns of a row: every column except {0, 1, row - 1, row}
constexpr ColumnRange interior_columns(int64_t row) noexcept {
    return {2, row - 1};
}

/// Exterior columns of a row with at least SMALL_ROW_LIMIT + 1 columns
constexpr std::array<int64_t, 4> exterior_columns(int64_t row) noexcept {
    return {0, 1, row - 1, row};
}

/// Intersect a requested column range with the columns of a row
constexpr ColumnRange clip_to_row(const ColumnRange& columns, int64_t row) noexcept {
    return columns.clamped_to(row_columns(row));
}

/// Choose the evaluation strategy for a clipped column range
///
/// @param clipped Column range already clipped to the row (see clip_to_row)
/// @param row Row being summed
/// @param can_subtract Whether the element type supports subtraction;
///        FullRowMinusExterior is only selected when it does
constexpr RangeSumStrategy select_range_sum_strategy(const ColumnRange& clipped,
                                                     int64_t row,
                                                     bool can_subtract) noexcept {
    if (clipped.empty()) {
        return RangeSumStrategy::Empty;
    }
    if (clipped.size() == 1) {
        return RangeSumStrategy::SingleColumn;
    }
    if (clipped == row_columns(row)) {
        return RangeSumStrategy::FullRow;
    }
    if (row < SMALL_ROW_LIMIT) {
        return RangeSumStrategy::SmallRow;
    }

    const ColumnRange interior = interior_columns(row);
    if (interior.contains(clipped)) {
        return RangeSumStrategy::Interior;
    }
    if (can_subtract && clipped.contains(interior)) {
        return RangeSumStrategy::FullRowMinusExterior;
    }
    return RangeSumStrategy::Direct;
}

}  // namespace arith
