// SPDX-License-Identifier: MIT
#pragma once

#include "src/triangle/element_concepts.hpp"
#include "src/triangle/triangle_index.hpp"
#include <cstddef>
#include <map>

namespace arith {

/// Memo table for interior, left-half triangle values.
///
/// Entries are never evicted: a value is a pure function of (row, column)
/// and the triangle's base.
template <AdditiveElement Element>
class TriangleCache {
public:
    [[nodiscard]] bool contains(const TriangleIndex& index) const {
        return data_.contains(index);
    }

    [[nodiscard]] const Element* get(const TriangleIndex& index) const {
        auto it = data_.find(index);
        return it != data_.end() ? &it->second : nullptr;
    }

    /// Store a value; an existing entry is left untouched.
    void insert(const TriangleIndex& index, const Element& value) {
        data_.try_emplace(index, value);
    }

    [[nodiscard]] size_t size() const { return data_.size(); }

private:
    std::map<TriangleIndex, Element> data_;
};

}  // namespace arith
