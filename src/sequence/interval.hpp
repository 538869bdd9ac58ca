// SPDX-License-Identifier: MIT
#pragma once

#include <algorithm>
#include <concepts>
#include <cstdint>
#include <limits>

namespace arith {

template <std::integral T>
struct ClosedInterval;

/// Half-open integer interval [lower, upper)
///
/// An interval with upper <= lower is empty.
template <std::integral T>
struct HalfOpenInterval {
    T lower{};
    T upper{};

    [[nodiscard]] constexpr bool empty() const noexcept { return upper <= lower; }

    /// Number of values in the interval (0 when empty)
    [[nodiscard]] constexpr T size() const noexcept { return empty() ? T{0} : upper - lower; }

    [[nodiscard]] constexpr bool contains(T value) const noexcept {
        return lower <= value && value < upper;
    }

    /// True iff every value of `other` lies in this interval.
    /// An empty `other` is never contained.
    [[nodiscard]] constexpr bool contains(const HalfOpenInterval& other) const noexcept {
        if (other.empty()) return false;
        return lower <= other.lower && other.upper <= upper;
    }

    [[nodiscard]] constexpr bool contains(const ClosedInterval<T>& other) const noexcept;

    /// Intersection of two intervals; empty intervals collapse to [lower, lower)
    [[nodiscard]] constexpr HalfOpenInterval clamped_to(const HalfOpenInterval& bounds) const noexcept {
        const T lo = std::max(lower, bounds.lower);
        const T hi = std::min(upper, bounds.upper);
        return hi <= lo ? HalfOpenInterval{lo, lo} : HalfOpenInterval{lo, hi};
    }

    constexpr bool operator==(const HalfOpenInterval&) const = default;
};

/// Closed integer interval [lower, upper]
///
/// An interval with upper < lower is empty.
template <std::integral T>
struct ClosedInterval {
    T lower{};
    T upper{};

    [[nodiscard]] constexpr bool empty() const noexcept { return upper < lower; }

    [[nodiscard]] constexpr bool contains(T value) const noexcept {
        return lower <= value && value <= upper;
    }

    [[nodiscard]] constexpr bool contains(const ClosedInterval& other) const noexcept {
        if (other.empty()) return false;
        return lower <= other.lower && other.upper <= upper;
    }

    [[nodiscard]] constexpr bool contains(const HalfOpenInterval<T>& other) const noexcept {
        if (other.empty()) return false;
        return lower <= other.lower && other.upper - 1 <= upper;
    }

    /// Equivalent half-open interval, saturating at the maximum of T
    ///
    /// A half-open interval cannot name max() as a member, so an upper bound
    /// of max() maps to [lower, max()) and drops that one value.
    [[nodiscard]] constexpr HalfOpenInterval<T> to_half_open() const noexcept {
        if (empty()) return {lower, lower};
        const T hi = upper == std::numeric_limits<T>::max() ? upper : upper + 1;
        return {lower, hi};
    }

    constexpr bool operator==(const ClosedInterval&) const = default;
};

template <std::integral T>
constexpr bool HalfOpenInterval<T>::contains(const ClosedInterval<T>& other) const noexcept {
    if (other.empty()) return false;
    return lower <= other.lower && other.upper < upper;
}

/// Column ranges used by the triangle's range sums
using ColumnRange = HalfOpenInterval<int64_t>;
using ClosedColumnRange = ClosedInterval<int64_t>;

} // namespace arith
