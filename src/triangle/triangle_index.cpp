// SPDX-License-Identifier: MIT
#include "src/triangle/triangle_index.hpp"
#include "src/math/safe_math.hpp"
#include "src/support/triangle_trace.h"
#include <cassert>
#include <cmath>

namespace arith {

namespace {

using int128_t = __int128;

int128_t triangular(int128_t row) {
    return row * (row + 1) / 2;
}

std::unexpected<TriangleError> invalid_index(int64_t row, int64_t column) {
    ARITH_TRACE_VALIDATION_ERROR(ARITH_MODULE_INDEX,
        static_cast<int>(TriangleErrorCode::InvalidIndex), row, column);
    return std::unexpected(TriangleError{TriangleErrorCode::InvalidIndex, row, column});
}

}  // namespace

TriangleIndex::TriangleIndex(int64_t row, int64_t column) noexcept
    : row_(row), column_(column) {
    assert(row >= 0 && "A row must have a non-negative index");
    assert(column >= 0 && "A column must have a non-negative index");
    assert(column <= row && "Column does not exist in row");
}

std::expected<TriangleIndex, TriangleError>
TriangleIndex::create(int64_t row, int64_t column) {
    if (row < 0 || column < 0 || column > row) {
        return invalid_index(row, column);
    }
    return TriangleIndex(row, column);
}

std::expected<TriangleIndex, TriangleError>
TriangleIndex::from_ordinal(int64_t ordinal) {
    if (ordinal < 0) {
        return invalid_index(ordinal, 0);
    }

    // Estimate row from the inverse of the triangular numbers, then correct
    // the floating point estimate in exact 128-bit arithmetic.
    const long double estimate =
        (std::sqrt(8.0L * static_cast<long double>(ordinal) + 1.0L) - 1.0L) / 2.0L;
    int128_t row = static_cast<int128_t>(estimate);
    while (row > 0 && triangular(row) > ordinal) {
        --row;
    }
    while (triangular(row + 1) <= ordinal) {
        ++row;
    }

    const int128_t column = ordinal - triangular(row);
    return TriangleIndex(static_cast<int64_t>(row), static_cast<int64_t>(column));
}

TriangleIndex TriangleIndex::next() const noexcept {
    if (column_ < row_) {
        return TriangleIndex(row_, column_ + 1);
    }
    return TriangleIndex(row_ + 1, 0);
}

std::expected<TriangleIndex, TriangleError> TriangleIndex::prev() const {
    if (column_ > 0) {
        return TriangleIndex(row_, column_ - 1);
    }
    if (row_ == 0) {
        return invalid_index(row_, column_ - 1);
    }
    return TriangleIndex(row_ - 1, row_ - 1);
}

TriangleIndex::Parents TriangleIndex::parents() const noexcept {
    Parents result;
    const int64_t row = row_ - 1;
    if (row < 0) {
        return result;
    }
    if (column_ <= row) {
        result.above = TriangleIndex(row, column_);
    }
    if (column_ - 1 >= 0) {
        result.above_left = TriangleIndex(row, column_ - 1);
    }
    return result;
}

std::expected<int64_t, TriangleError> TriangleIndex::ordinal() const {
    auto next_row = safe_add(row_, 1);
    if (!next_row) {
        return std::unexpected(TriangleError{TriangleErrorCode::Overflow, row_, column_});
    }

    // row * (row + 1) is always even; halve the even factor first so the
    // product only overflows when the final ordinal does.
    const int64_t a = (row_ % 2 == 0) ? row_ / 2 : row_;
    const int64_t b = (row_ % 2 == 0) ? *next_row : *next_row / 2;

    auto result = safe_multiply(a, b).and_then([this](int64_t first) {
        return safe_add(first, column_);
    });
    if (!result) {
        return std::unexpected(TriangleError{TriangleErrorCode::Overflow, row_, column_});
    }
    return *result;
}

}  // namespace arith
