// SPDX-License-Identifier: MIT
#pragma once

#include "src/support/error_types.hpp"
#include "src/support/triangle_trace.h"
#include <cstdint>
#include <expected>

namespace arith {

/// Whether values computed on a cache miss are stored
enum class CacheWriteBack {
    Enabled,   ///< Store every computed interior value (amortized O(1) lookups)
    Disabled   ///< Lookups never mutate the cache; each miss costs O(row * column)
};

/// Arithmetic triangle configuration
///
/// The cache only ever holds interior values of the left half of a row;
/// boundary and right-half values are derived in O(1).
struct TriangleConfig {
    /// Cache write-back policy
    CacheWriteBack write_back = CacheWriteBack::Enabled;

    /// Deepest row whose cache misses are resolved by recursion.
    /// Misses in deeper rows are evaluated over an explicit work stack and
    /// produce the same cache entries.
    int64_t max_recursive_row = 1024;
};

/// Validate a configuration
///
/// @return void on success, InvalidConfiguration otherwise
[[nodiscard]] inline std::expected<void, TriangleError>
validate_config(const TriangleConfig& config) {
    if (config.max_recursive_row < 0) {
        ARITH_TRACE_VALIDATION_ERROR(ARITH_MODULE_CONFIG,
            static_cast<int>(TriangleErrorCode::InvalidConfiguration),
            config.max_recursive_row, 0);
        return std::unexpected(TriangleError{
            TriangleErrorCode::InvalidConfiguration, config.max_recursive_row});
    }
    return {};
}

}  // namespace arith
