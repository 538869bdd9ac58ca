// SPDX-License-Identifier: MIT
/**
 * @file example_arithmetic_triangle.cc
 * @brief Walk-through of triangle lookups, row and range sums, and the
 *        sequence helpers
 */

#include "src/sequence/adjacent_pairs.hpp"
#include "src/sequence/partition.hpp"
#include "src/triangle/arithmetic_triangle.hpp"
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <ranges>

using namespace arith;

int main() {
    std::cout << "=== Arithmetic Triangle Example ===\n\n";

    ArithmeticTriangle<int64_t> triangle;

    // Example 1: first rows
    std::cout << "1. Rows 0-7:\n";
    for (int64_t row = 0; row < 8; ++row) {
        std::cout << "   " << std::setw(2) << row << ":";
        for (int64_t column = 0; column <= row; ++column) {
            std::cout << std::setw(4) << triangle.value(row, column);
        }
        std::cout << "\n";
    }
    std::cout << "\n";

    // Example 2: row sums
    std::cout << "2. Row sums:\n";
    std::cout << "   sum_of_row(10) = " << triangle.sum_of_row(10) << "\n";
    auto checked = triangle.checked_sum_of_row(63);
    if (!checked) {
        std::cout << "   checked_sum_of_row(63): " << checked.error() << "\n";
    }
    std::cout << "\n";

    // Example 3: range sums
    std::cout << "3. Range sums in row 10:\n";
    const ColumnRange ranges[] = {{0, 4}, {2, 9}, {1, 10}, {0, 11}, {-5, 3}};
    for (const auto& range : ranges) {
        const ColumnRange clipped = clip_to_row(range, 10);
        std::cout << "   [" << range.lower << ", " << range.upper << ") = "
                  << triangle.sum_of_columns(range, 10) << "  ("
                  << to_string(select_range_sum_strategy(clipped, 10, true)) << ")\n";
    }
    std::cout << "\n";

    // Example 4: a non-integer base
    std::cout << "4. Base 0.5:\n";
    ArithmeticTriangle<double> halves(0.5);
    std::cout << "   value(6, 3) = " << halves.value(6, 3)
              << ", sum_of_row(6) = " << halves.sum_of_row(6) << "\n\n";

    // Example 5: invalid configuration
    std::cout << "5. Configuration validation:\n";
    auto rejected = ArithmeticTriangle<int64_t>::create(1, TriangleConfig{.max_recursive_row = -1});
    if (!rejected) {
        std::cout << "   ✗ " << rejected.error() << "\n\n";
    }

    // Example 6: traversal and sequence helpers
    std::cout << "6. Adjacent pairs of the first ten elements:\n   ";
    for (auto [a, b] : adjacent_pairs(triangle | std::views::take(10))) {
        std::cout << "(" << a << "," << b << ") ";
    }
    std::cout << "\n";

    const auto row8 = std::views::iota(int64_t{0}, int64_t{9})
        | std::views::transform([&](int64_t column) { return triangle.value(8, column); });
    auto parts = partitioned(row8, [](int64_t v) { return v % 2 == 0; });
    std::cout << "   row 8 has " << parts.matching.size() << " even and "
              << parts.non_matching.size() << " odd values\n";

    return 0;
}
