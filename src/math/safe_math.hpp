// SPDX-License-Identifier: MIT
#pragma once

#include "src/support/error_types.hpp"
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <limits>
#include <type_traits>

namespace arith {

/// Safely multiply two int64_t values, detecting overflow via __int128
///
/// @param a First operand
/// @param b Second operand
/// @return Product if no overflow, OverflowError otherwise
[[nodiscard]] inline std::expected<int64_t, OverflowError>
safe_multiply(int64_t a, int64_t b) noexcept {
    using int128_t = __int128;

    int128_t product = static_cast<int128_t>(a) * static_cast<int128_t>(b);

    if (product > std::numeric_limits<int64_t>::max() ||
        product < std::numeric_limits<int64_t>::min()) {
        return std::unexpected(OverflowError{static_cast<uint64_t>(a),
                                             static_cast<uint64_t>(b)});
    }

    return static_cast<int64_t>(product);
}

/// Safely add two int64_t values
[[nodiscard]] inline std::expected<int64_t, OverflowError>
safe_add(int64_t a, int64_t b) noexcept {
    int64_t sum = 0;
    if (__builtin_add_overflow(a, b, &sum)) {
        return std::unexpected(OverflowError{static_cast<uint64_t>(a),
                                             static_cast<uint64_t>(b)});
    }
    return sum;
}

/// Shift an integer left by `bits`, failing when value × 2^bits is not
/// representable in T
///
/// Negative values are shifted arithmetically (C++20 defines left shift of
/// signed values as multiplication by 2^bits modulo 2^N), so the range check
/// is done against min >> bits and max >> bits.
///
/// @tparam T Integral type (bool excluded)
/// @param value Value to shift
/// @param bits Shift amount, must be non-negative
/// @return value × 2^bits if representable, OverflowError otherwise
template <std::integral T>
    requires (!std::same_as<T, bool>)
[[nodiscard]] constexpr std::expected<T, OverflowError>
safe_shift_left(T value, int64_t bits) noexcept {
    const auto overflow = std::unexpected(OverflowError{
        static_cast<uint64_t>(value), static_cast<uint64_t>(bits)});

    if (bits < 0) return overflow;
    if (value == 0) return T{0};
    constexpr int64_t width = std::numeric_limits<std::make_unsigned_t<T>>::digits;
    if (bits >= width) return overflow;

    if (value > (std::numeric_limits<T>::max() >> bits)) return overflow;
    if constexpr (std::is_signed_v<T>) {
        if (value < (std::numeric_limits<T>::min() >> bits)) return overflow;
    }

    return static_cast<T>(value << bits);
}

/// Shift an integer left by `bits` in the modular arithmetic of T
///
/// Bits shifted past the width of T are discarded; a shift of at least the
/// bit width yields 0.
template <std::integral T>
    requires (!std::same_as<T, bool>)
[[nodiscard]] constexpr T wrapping_shift_left(T value, int64_t bits) noexcept {
    using U = std::make_unsigned_t<T>;
    if (bits < 0 || bits >= std::numeric_limits<U>::digits) return T{0};
    return static_cast<T>(static_cast<U>(static_cast<U>(value) << bits));
}

} // namespace arith
