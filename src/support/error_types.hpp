// SPDX-License-Identifier: MIT
#pragma once

#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string_view>

namespace arith {

/// Error categories surfaced through expected results
enum class TriangleErrorCode {
    InvalidIndex,          ///< Coordinate outside the triangle (row < 0, column < 0 or column > row)
    Overflow,              ///< Result not representable in the element or index type
    UnboundedIndex,        ///< Operation needs a dereferenceable index but got the end marker
    InvalidConfiguration   ///< TriangleConfig failed validation
};

/// Detailed triangle error passed through expected failure path
struct TriangleError {
    TriangleErrorCode code;
    int64_t row;     ///< Offending row (0 if not applicable)
    int64_t column;  ///< Offending column or shift amount (0 if not applicable)

    TriangleError(TriangleErrorCode code,
                  int64_t row = 0,
                  int64_t column = 0)
        : code(code), row(row), column(column) {}

    bool operator==(const TriangleError&) const = default;
};

/// Operands of an arithmetic operation that overflowed
struct OverflowError {
    uint64_t operand_a;
    uint64_t operand_b;
};

constexpr std::string_view to_string(TriangleErrorCode code) noexcept {
    switch (code) {
        case TriangleErrorCode::InvalidIndex:
            return "InvalidIndex";
        case TriangleErrorCode::Overflow:
            return "Overflow";
        case TriangleErrorCode::UnboundedIndex:
            return "UnboundedIndex";
        case TriangleErrorCode::InvalidConfiguration:
            return "InvalidConfiguration";
    }
    return "Unknown";
}

/// Output stream operator for TriangleError
inline std::ostream& operator<<(std::ostream& os, const TriangleError& err) {
    os << "TriangleError{code=" << to_string(err.code)
       << ", row=" << err.row
       << ", column=" << err.column << "}";
    return os;
}

/// Output stream operator for OverflowError
inline std::ostream& operator<<(std::ostream& os, const OverflowError& err) {
    os << "OverflowError{a=" << err.operand_a
       << ", b=" << err.operand_b << "}";
    return os;
}

}  // namespace arith
