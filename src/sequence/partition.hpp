// SPDX-License-Identifier: MIT
#pragma once

#include <cstddef>
#include <functional>
#include <iterator>
#include <ranges>
#include <vector>

namespace arith {

/// Elements split by a predicate, each part in original order
template <typename T>
struct Partition {
    std::vector<T> matching;
    std::vector<T> non_matching;
};

/// Elements split at a position
template <typename T>
struct Split {
    std::vector<T> prefix;  ///< Elements before the cut
    std::vector<T> suffix;  ///< Elements from the cut onwards
};

/// Split a range into the elements satisfying a predicate and the rest
template <std::ranges::input_range Range, typename Pred>
    requires std::indirect_unary_predicate<Pred, std::ranges::iterator_t<Range>>
[[nodiscard]] Partition<std::ranges::range_value_t<Range>>
partitioned(Range&& range, Pred pred) {
    Partition<std::ranges::range_value_t<Range>> result;
    for (auto&& element : range) {
        if (std::invoke(pred, element)) {
            result.matching.push_back(element);
        } else {
            result.non_matching.push_back(element);
        }
    }
    return result;
}

/// Split a range into its first `up_to` elements and the remainder.
/// A cut beyond the end puts every element in the prefix.
template <std::ranges::input_range Range>
[[nodiscard]] Split<std::ranges::range_value_t<Range>>
partitioned(Range&& range, size_t up_to) {
    Split<std::ranges::range_value_t<Range>> result;
    size_t position = 0;
    for (auto&& element : range) {
        if (position < up_to) {
            result.prefix.push_back(element);
        } else {
            result.suffix.push_back(element);
        }
        ++position;
    }
    return result;
}

}  // namespace arith
