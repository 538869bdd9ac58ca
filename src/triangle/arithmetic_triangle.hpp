// SPDX-License-Identifier: MIT
/**
 * @file arithmetic_triangle.hpp
 * @brief Lazily evaluated arithmetic (Pascal's) triangle
 *
 * Rows 0 through 7 for base 1:
 *
 *   0:   1
 *   1:   1  1
 *   2:   1  2  1
 *   3:   1  3  3  1
 *   4:   1  4  6  4  1
 *   5:   1  5 10 10  5  1
 *   6:   1  6 15 20 15  6  1
 *   7:   1  7 21 35 35 21  7  1
 *
 * The first and last column of every row hold the base; every other value
 * is the sum of the value above and the value above-left. Entries outside
 * the triangle are zero.
 *
 * Values are computed on demand. Only interior values of the left half of
 * a row are memoized: boundary values are the base and the right half
 * mirrors the left half.
 *
 * Not thread-safe: lookups on a const triangle still populate the cache.
 */

#pragma once

#include "src/math/safe_math.hpp"
#include "src/sequence/interval.hpp"
#include "src/support/error_types.hpp"
#include "src/support/triangle_trace.h"
#include "src/triangle/element_concepts.hpp"
#include "src/triangle/range_sum_strategy.hpp"
#include "src/triangle/triangle_cache.hpp"
#include "src/triangle/triangle_config.hpp"
#include "src/triangle/triangle_index.hpp"
#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <iterator>
#include <optional>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace arith {

/// Infinite arithmetic triangle over an additive element type
///
/// @tparam Element Additive element; integer elements get O(1) row sums
template <AdditiveElement Element>
class ArithmeticTriangle {
public:
    using value_type = Element;

    /// Row-major input iterator over the triangle's elements.
    /// Pairs with std::unreachable_sentinel_t: the sequence never ends.
    class Iterator {
    public:
        using value_type = Element;
        using difference_type = std::ptrdiff_t;
        using iterator_concept = std::input_iterator_tag;

        Iterator() = default;

        Iterator(const ArithmeticTriangle* triangle, TriangleIndex index)
            : triangle_(triangle), index_(index) {}

        Element operator*() const { return (*triangle_)[index_]; }

        Iterator& operator++() {
            index_ = index_.next();
            return *this;
        }

        void operator++(int) { ++*this; }

        /// Coordinate of the element the iterator currently points at
        const TriangleIndex& index() const noexcept { return index_; }

    private:
        const ArithmeticTriangle* triangle_ = nullptr;
        TriangleIndex index_{0, 0};
    };

    /// Triangle with the given base in its first and last columns
    ///
    /// @param base Value of every row's first and last column
    /// @param config Cache configuration (see create() for validation)
    explicit ArithmeticTriangle(Element base, TriangleConfig config = {})
        : base_(std::move(base)), config_(config) {}

    /// Integer triangle with base 1 (the binomial coefficients)
    ArithmeticTriangle() requires IntegerElement<Element>
        : ArithmeticTriangle(Element{1}) {}

    /// Factory with configuration validation
    [[nodiscard]] static std::expected<ArithmeticTriangle, TriangleError>
    create(Element base, TriangleConfig config = {}) {
        return validate_config(config).transform([&]() {
            return ArithmeticTriangle(std::move(base), config);
        });
    }

    const Element& base() const noexcept { return base_; }
    const TriangleConfig& config() const noexcept { return config_; }

    /// Number of memoized interior values
    size_t cache_size() const { return cache_.size(); }

    /// Number of columns in a row: row + 1, or 0 for a negative row
    static constexpr int64_t number_of_columns(int64_t row) noexcept {
        return row < 0 ? 0 : row + 1;
    }

    // ------------------------------------------------------------------
    // Value engine
    // ------------------------------------------------------------------

    /// Element at (row, column)
    ///
    /// Coordinates outside the triangle (negative row, column < 0 or
    /// column > row) yield the additive zero.
    Element value(int64_t row, int64_t column) const {
        if (row < 0) {
            return Element{};
        }
        if (column == 0 || column == row) {
            return base_;
        }
        if (column < 0 || column > row) {
            return Element{};
        }
        if (column > row / 2) {
            column = row - column;
        }
        return interior_value(TriangleIndex(row, column));
    }

    Element operator[](const TriangleIndex& index) const {
        return value(index.row(), index.column());
    }

    /// Element at a bound; the unbounded end marker is not dereferenceable
    std::expected<Element, TriangleError> at(const IndexBound& bound) const {
        if (const auto* index = std::get_if<TriangleIndex>(&bound)) {
            return (*this)[*index];
        }
        ARITH_TRACE_VALIDATION_ERROR(ARITH_MODULE_VALUE_ENGINE,
            static_cast<int>(TriangleErrorCode::UnboundedIndex), 0, 0);
        return std::unexpected(TriangleError{TriangleErrorCode::UnboundedIndex});
    }

    // ------------------------------------------------------------------
    // Row sums
    // ------------------------------------------------------------------

    /// Sum of all elements of a row (zero for a negative row)
    ///
    /// Integer elements: base << row, O(1). The shift follows the modular
    /// arithmetic of the element type; use checked_sum_of_row() to detect
    /// overflow. Other elements: sum_of_row_by_halves(), O(row).
    Element sum_of_row(int64_t row) const {
        if constexpr (IntegerElement<Element>) {
            if (row < 0) {
                return Element{};
            }
            ARITH_TRACE_ROW_SUM(row, ARITH_ROW_SUM_SHIFT);
            return wrapping_shift_left(base_, row);
        } else {
            return sum_of_row_by_halves(row);
        }
    }

    /// Row sum that reports Overflow when base × 2^row is not representable
    /// in an integer element type
    std::expected<Element, TriangleError> checked_sum_of_row(int64_t row) const {
        if constexpr (IntegerElement<Element>) {
            if (row < 0) {
                return Element{};
            }
            auto shifted = safe_shift_left(base_, row);
            if (!shifted) {
                ARITH_TRACE_VALIDATION_ERROR(ARITH_MODULE_ROW_SUM,
                    static_cast<int>(TriangleErrorCode::Overflow), row, 0);
                return std::unexpected(TriangleError{TriangleErrorCode::Overflow, row});
            }
            ARITH_TRACE_ROW_SUM(row, ARITH_ROW_SUM_SHIFT);
            return *shifted;
        } else {
            return sum_of_row_by_halves(row);
        }
    }

    /// Row sum from the values themselves, for any additive element
    ///
    /// Rows 1-3 double the previous row's sum. Larger rows sum the left
    /// half, double it, and add the middle column when the column count
    /// is odd.
    Element sum_of_row_by_halves(int64_t row) const {
        if (row < 0) {
            return Element{};
        }
        if (row == 0) {
            return base_;
        }
        if (row < SMALL_ROW_LIMIT) {
            const Element previous = sum_of_row_by_halves(row - 1);
            return previous + previous;
        }

        ARITH_TRACE_ROW_SUM(row, ARITH_ROW_SUM_HALVES);
        const int64_t columns = number_of_columns(row);
        const int64_t midpoint = columns / 2;

        const Element half = sum_columns_directly(ColumnRange{0, midpoint}, row);
        Element total = half + half;
        if (columns % 2 == 1) {
            total = total + value(row, midpoint);
        }
        return total;
    }

    // ------------------------------------------------------------------
    // Range sums
    // ------------------------------------------------------------------

    /// Sum of the elements at the given columns of a row
    ///
    /// Columns outside [0, row] are ignored. The evaluation strategy is
    /// picked by select_range_sum_strategy().
    Element sum_of_columns(const ColumnRange& columns, int64_t row) const {
        const ColumnRange clipped = clip_to_row(columns, row);
        const RangeSumStrategy strategy =
            select_range_sum_strategy(clipped, row, SubtractiveElement<Element>);
        ARITH_TRACE_RANGE_SUM(row, clipped.lower, clipped.upper, static_cast<int>(strategy));

        switch (strategy) {
            case RangeSumStrategy::Empty:
                return Element{};
            case RangeSumStrategy::SingleColumn:
                return value(row, clipped.lower);
            case RangeSumStrategy::FullRow:
                return sum_of_row(row);
            case RangeSumStrategy::FullRowMinusExterior:
                if constexpr (SubtractiveElement<Element>) {
                    return sum_of_row_minus_exterior(clipped, row);
                }
                break;
            case RangeSumStrategy::SmallRow:
            case RangeSumStrategy::Interior:
            case RangeSumStrategy::Direct:
                break;
        }
        return sum_columns_directly(clipped, row);
    }

    Element sum_of_columns(const ClosedColumnRange& columns, int64_t row) const {
        return sum_of_columns(columns.to_half_open(), row);
    }

    // ------------------------------------------------------------------
    // Enumeration and index space
    // ------------------------------------------------------------------

    /// Fresh traversal from (0, 0)
    Iterator begin() const { return Iterator(this, start_index()); }

    std::unreachable_sentinel_t end() const noexcept { return std::unreachable_sentinel; }

    static TriangleIndex start_index() noexcept { return TriangleIndex(0, 0); }

    static IndexBound end_index() noexcept { return UnboundedIndex{}; }

    static TriangleIndex index_after(const TriangleIndex& index) noexcept {
        return index.next();
    }

    static std::expected<TriangleIndex, TriangleError> index_before(const TriangleIndex& index) {
        return index.prev();
    }

    /// Index `n` positions away in row-major order (n may be negative)
    static std::expected<TriangleIndex, TriangleError>
    index_offset(const TriangleIndex& index, int64_t n) {
        if (n == 0) {
            return index;
        }
        return index.ordinal()
            .and_then([n](int64_t position) -> std::expected<int64_t, TriangleError> {
                auto target = safe_add(position, n);
                if (!target) {
                    return std::unexpected(TriangleError{TriangleErrorCode::Overflow, position, n});
                }
                return *target;
            })
            .and_then(TriangleIndex::from_ordinal);
    }

    /// Number of steps from `from` to `to` (negative when `to` precedes `from`)
    static std::expected<int64_t, TriangleError>
    distance(const IndexBound& from, const IndexBound& to) {
        if (is_unbounded(from) && is_unbounded(to)) {
            return 0;
        }
        if (is_unbounded(from) || is_unbounded(to)) {
            return std::unexpected(TriangleError{TriangleErrorCode::UnboundedIndex});
        }
        auto start = std::get<TriangleIndex>(from).ordinal();
        if (!start) {
            return std::unexpected(start.error());
        }
        return std::get<TriangleIndex>(to).ordinal().transform([&](int64_t finish) {
            return finish - *start;
        });
    }

private:
    /// Value of an interior, left-half coordinate (0 < column <= row / 2)
    Element interior_value(const TriangleIndex& index) const {
        if (const Element* cached = cache_.get(index)) {
            ARITH_TRACE_CACHE_HIT(index.row(), index.column());
            return *cached;
        }
        ARITH_TRACE_CACHE_MISS(index.row(), index.column());

        if (config_.write_back == CacheWriteBack::Disabled) {
            return fill_bottom_up(index);
        }
        if (index.row() > config_.max_recursive_row) {
            return resolve_iteratively(index);
        }

        const auto parents = index.parents();
        Element sum = value_of(parents.above) + value_of(parents.above_left);
        cache_.insert(index, sum);
        return sum;
    }

    Element value_of(const std::optional<TriangleIndex>& index) const {
        return index ? (*this)[*index] : Element{};
    }

    /// Folded interior coordinate of (row, column) if it is not cached yet
    std::optional<TriangleIndex> uncached_interior(int64_t row, int64_t column) const {
        if (row < 0 || column <= 0 || column >= row) {
            return std::nullopt;
        }
        const TriangleIndex folded(row, std::min(column, row - column));
        if (cache_.contains(folded)) {
            return std::nullopt;
        }
        return folded;
    }

    /// Depth-first evaluation over an explicit work stack. Produces the same
    /// cache entries as the recursive path without growing the call stack.
    Element resolve_iteratively(const TriangleIndex& index) const {
        ARITH_TRACE_FILL_START(index.row(), index.column());
        std::vector<TriangleIndex> pending{index};
        int64_t cells = 0;

        while (!pending.empty()) {
            const TriangleIndex current = pending.back();
            if (cache_.contains(current)) {
                pending.pop_back();
                continue;
            }

            const int64_t row = current.row() - 1;
            const auto above = uncached_interior(row, current.column());
            const auto above_left = uncached_interior(row, current.column() - 1);
            if (above || above_left) {
                if (above) pending.push_back(*above);
                if (above_left) pending.push_back(*above_left);
                continue;
            }

            cache_.insert(current, value(row, current.column()) + value(row, current.column() - 1));
            ++cells;
            pending.pop_back();
        }

        ARITH_TRACE_FILL_COMPLETE(index.row(), index.column(), cells);
        return *cache_.get(index);
    }

    /// Read-only bottom-up fill over a scratch row of columns [0, column].
    /// Used when write-back is disabled; O(row * column) per call.
    Element fill_bottom_up(const TriangleIndex& index) const {
        ARITH_TRACE_FILL_START(index.row(), index.column());
        const int64_t column = index.column();
        std::vector<Element> scratch(static_cast<size_t>(column) + 1, Element{});
        scratch[0] = base_;
        int64_t cells = 0;

        for (int64_t r = 1; r <= index.row(); ++r) {
            for (int64_t c = std::min(r, column); c >= 1; --c) {
                const auto i = static_cast<size_t>(c);
                scratch[i] = (c == r) ? base_ : Element(scratch[i] + scratch[i - 1]);
                ++cells;
            }
        }

        ARITH_TRACE_FILL_COMPLETE(index.row(), index.column(), cells);
        return scratch[static_cast<size_t>(column)];
    }

    /// Sum of value(row, c) for c in an already clipped range
    Element sum_columns_directly(const ColumnRange& clipped, int64_t row) const {
        Element sum{};
        for (int64_t column = clipped.lower; column < clipped.upper; ++column) {
            sum = sum + value(row, column);
        }
        return sum;
    }

    /// Row sum minus the exterior columns the range leaves out
    ///
    /// The row sum of a signed integer element may already have wrapped
    /// while the range sum is still representable, so integers subtract in
    /// the unsigned type of the same width and convert back.
    Element sum_of_row_minus_exterior(const ColumnRange& clipped, int64_t row) const
        requires SubtractiveElement<Element>
    {
        if constexpr (IntegerElement<Element>) {
            using Unsigned = std::make_unsigned_t<Element>;
            Unsigned excluded = 0;
            for (int64_t column : exterior_columns(row)) {
                if (!clipped.contains(column)) {
                    excluded = static_cast<Unsigned>(excluded + static_cast<Unsigned>(value(row, column)));
                }
            }
            return static_cast<Element>(
                static_cast<Unsigned>(static_cast<Unsigned>(sum_of_row(row)) - excluded));
        }

        Element excluded{};
        for (int64_t column : exterior_columns(row)) {
            if (!clipped.contains(column)) {
                excluded = excluded + value(row, column);
            }
        }
        return sum_of_row(row) - excluded;
    }

    Element base_;
    TriangleConfig config_;
    mutable TriangleCache<Element> cache_;
};

}  // namespace arith
