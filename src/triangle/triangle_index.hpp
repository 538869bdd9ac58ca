// SPDX-License-Identifier: MIT
#pragma once

#include "src/support/error_types.hpp"
#include <compare>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <utility>
#include <variant>

namespace arith {

/**
 * TriangleIndex: (row, column) coordinate of an arithmetic triangle
 *
 * Invariant: 0 <= column <= row. Indexes order row-major (row first, then
 * column), which is also the enumeration order of the triangle.
 *
 * Use create() for coordinates coming from outside the library. The
 * constructor treats an invalid coordinate as a programming error and
 * asserts in debug builds.
 */
class TriangleIndex {
public:
    /// Parent coordinates of an index under the recurrence (defined below)
    struct Parents;

    /// Construct a coordinate known to be valid
    TriangleIndex(int64_t row, int64_t column) noexcept;

    /// Validated factory
    ///
    /// @return Index, or InvalidIndex if row < 0, column < 0 or column > row
    [[nodiscard]] static std::expected<TriangleIndex, TriangleError>
    create(int64_t row, int64_t column);

    /// Inverse of ordinal(): the index at a position of the row-major enumeration
    [[nodiscard]] static std::expected<TriangleIndex, TriangleError>
    from_ordinal(int64_t ordinal);

    int64_t row() const noexcept { return row_; }
    int64_t column() const noexcept { return column_; }

    /// Successor in row-major order (next column, or first column of next row)
    [[nodiscard]] TriangleIndex next() const noexcept;

    /// Predecessor in row-major order; (0, 0) has none
    [[nodiscard]] std::expected<TriangleIndex, TriangleError> prev() const;

    /// True iff the column is the first or last one of its row
    [[nodiscard]] bool is_column_first_or_last() const noexcept {
        return column_ == 0 || column_ == row_;
    }

    /// The two coordinates whose values add up to this one
    [[nodiscard]] Parents parents() const noexcept;

    /// Position in the row-major enumeration: row * (row + 1) / 2 + column
    [[nodiscard]] std::expected<int64_t, TriangleError> ordinal() const;

    auto operator<=>(const TriangleIndex&) const = default;

private:
    int64_t row_;
    int64_t column_;
};

/// A parent outside the triangle is std::nullopt (it contributes zero).
struct TriangleIndex::Parents {
    std::optional<TriangleIndex> above;       ///< (row - 1, column)
    std::optional<TriangleIndex> above_left;  ///< (row - 1, column - 1)
};

/// Tag for the end of the (infinite) index space
struct UnboundedIndex {
    auto operator<=>(const UnboundedIndex&) const = default;
};

/// Either a dereferenceable index or the unbounded end marker.
/// Every bounded index compares less than Unbounded.
using IndexBound = std::variant<TriangleIndex, UnboundedIndex>;

inline bool is_unbounded(const IndexBound& bound) noexcept {
    return std::holds_alternative<UnboundedIndex>(bound);
}

}  // namespace arith
