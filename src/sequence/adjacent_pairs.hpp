// SPDX-License-Identifier: MIT
#pragma once

#include <algorithm>
#include <cstddef>
#include <iterator>
#include <optional>
#include <ranges>
#include <utility>

namespace arith {

/// Lazy view of each element paired with its successor
///
/// For x0, x1, ..., xn the view yields (x0, x1), (x1, x2), ..., (xn-1, xn).
/// With wrapping it also yields (xn, x0); a single element wraps onto
/// itself. An empty range yields nothing either way.
///
/// @tparam R Underlying view (forward, iterable through const)
template <std::ranges::view R>
    requires std::ranges::forward_range<const R>
class AdjacentPairsView : public std::ranges::view_interface<AdjacentPairsView<R>> {
    using base_iterator = std::ranges::iterator_t<const R>;
    using element_type = std::ranges::range_value_t<const R>;

public:
    class Iterator {
    public:
        using value_type = std::pair<element_type, element_type>;
        using difference_type = std::ptrdiff_t;
        using iterator_concept = std::forward_iterator_tag;

        Iterator() = default;

        Iterator(base_iterator first, base_iterator last, bool wrapping)
            : begin_(first), end_(last), current_(first), next_(first), wrapping_(wrapping) {
            if (current_ == end_) {
                return;
            }
            ++next_;
            step_past_end();
        }

        value_type operator*() const { return {*current_, *next_}; }

        Iterator& operator++() {
            if (wrapped_) {
                current_ = end_;
                return *this;
            }
            current_ = next_;
            ++next_;
            step_past_end();
            return *this;
        }

        Iterator operator++(int) {
            Iterator previous = *this;
            ++*this;
            return previous;
        }

        friend bool operator==(const Iterator& lhs, const Iterator& rhs) {
            return lhs.current_ == rhs.current_ && lhs.wrapped_ == rhs.wrapped_;
        }

        friend bool operator==(const Iterator& it, std::default_sentinel_t) {
            return it.current_ == it.end_;
        }

    private:
        /// When the successor runs off the end, either wrap it to the first
        /// element or finish
        void step_past_end() {
            if (next_ != end_) {
                return;
            }
            if (wrapping_) {
                next_ = begin_;
                wrapped_ = true;
            } else {
                current_ = end_;
            }
        }

        base_iterator begin_{};
        base_iterator end_{};
        base_iterator current_{};
        base_iterator next_{};
        bool wrapping_ = false;
        bool wrapped_ = false;
    };

    AdjacentPairsView() requires std::default_initializable<R> = default;

    AdjacentPairsView(R base, bool wrapping)
        : base_(std::move(base)), wrapping_(wrapping) {}

    Iterator begin() const {
        return Iterator(std::ranges::begin(base_), std::ranges::end(base_), wrapping_);
    }

    std::default_sentinel_t end() const noexcept { return std::default_sentinel; }

    auto size() const requires std::ranges::sized_range<const R> {
        const auto n = std::ranges::size(base_);
        if (wrapping_) {
            return n;
        }
        return n == 0 ? n : n - 1;
    }

    bool wrapping() const noexcept { return wrapping_; }

private:
    R base_{};
    bool wrapping_ = false;
};

/// Single-pass counterpart of AdjacentPairsView
///
/// Each element of the underlying range is read exactly once: the view keeps
/// the previous element, and the first one when wrapping, so it works over
/// input-only ranges such as std::views::istream or a prefix of the
/// triangle's enumeration. Like other single-pass views it can be iterated
/// only once and must not be moved while an iterator is in use.
template <std::ranges::view R>
    requires std::ranges::input_range<R>
class InputAdjacentPairsView
    : public std::ranges::view_interface<InputAdjacentPairsView<R>> {
    using element_type = std::ranges::range_value_t<R>;
    using pair_type = std::pair<element_type, element_type>;

public:
    class Iterator {
    public:
        using value_type = pair_type;
        using difference_type = std::ptrdiff_t;
        using iterator_concept = std::input_iterator_tag;

        explicit Iterator(InputAdjacentPairsView* parent) : parent_(parent) {}

        Iterator(Iterator&&) = default;
        Iterator& operator=(Iterator&&) = default;

        const value_type& operator*() const { return *parent_->current_; }

        Iterator& operator++() {
            parent_->advance();
            return *this;
        }

        void operator++(int) { ++*this; }

        friend bool operator==(const Iterator& it, std::default_sentinel_t) {
            return it.at_end();
        }

    private:
        bool at_end() const { return !parent_->current_.has_value(); }

        InputAdjacentPairsView* parent_;
    };

    InputAdjacentPairsView(R base, bool wrapping)
        : base_(std::move(base)), wrapping_(wrapping) {}

    Iterator begin() {
        position_.emplace(std::ranges::begin(base_));
        if (*position_ != std::ranges::end(base_)) {
            first_.emplace(**position_);
            previous_.emplace(*first_);
            ++*position_;
            advance();
        }
        return Iterator(this);
    }

    std::default_sentinel_t end() const noexcept { return std::default_sentinel; }

    bool wrapping() const noexcept { return wrapping_; }

private:
    /// Read the next element and pair it with the previous one; past the
    /// end, emit (last, first) once when wrapping
    void advance() {
        if (*position_ != std::ranges::end(base_)) {
            element_type next = **position_;
            ++*position_;
            current_.emplace(std::move(*previous_), next);
            previous_.emplace(std::move(next));
            return;
        }
        if (wrapping_ && !wrapped_) {
            wrapped_ = true;
            current_.emplace(std::move(*previous_), std::move(*first_));
            return;
        }
        current_.reset();
    }

    R base_;
    bool wrapping_ = false;
    bool wrapped_ = false;
    std::optional<std::ranges::iterator_t<R>> position_;
    std::optional<element_type> first_;
    std::optional<element_type> previous_;
    std::optional<pair_type> current_;
};

/// Pair each element of a range with its successor
///
/// Multipass ranges get the reiterable AdjacentPairsView; input-only ranges
/// get the single-pass InputAdjacentPairsView.
///
/// @param range Input range (taken by reference when an lvalue)
/// @param wrapping Also pair the last element with the first
template <std::ranges::viewable_range Range>
    requires std::ranges::input_range<std::views::all_t<Range>>
auto adjacent_pairs(Range&& range, bool wrapping = false) {
    using View = std::views::all_t<Range>;
    if constexpr (std::ranges::forward_range<const View>) {
        return AdjacentPairsView<View>(std::views::all(std::forward<Range>(range)), wrapping);
    } else {
        return InputAdjacentPairsView<View>(std::views::all(std::forward<Range>(range)), wrapping);
    }
}

}  // namespace arith
