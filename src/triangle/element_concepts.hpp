// SPDX-License-Identifier: MIT
#pragma once

#include <concepts>

namespace arith {

/// Element of an arithmetic triangle: a value-initialized E is the additive
/// identity and E + E yields E.
template <typename E>
concept AdditiveElement = std::regular<E> && requires(const E& a, const E& b) {
    { a + b } -> std::convertible_to<E>;
};

/// Additive element with subtraction (unlocks the full-row-minus-exterior
/// range sum).
template <typename E>
concept SubtractiveElement = AdditiveElement<E> && requires(const E& a, const E& b) {
    { a - b } -> std::convertible_to<E>;
};

/// Integer element: row sums reduce to base << row.
template <typename E>
concept IntegerElement = std::integral<E> && !std::same_as<E, bool>;

} // namespace arith
