// SPDX-License-Identifier: MIT
/**
 * @file triangle_trace.h
 * @brief USDT (User Statically-Defined Tracing) probes for the arith library
 *
 * Zero-overhead tracing points that can be enabled at runtime with
 * bpftrace, systemtap or perf. When tracing is disabled (default), probes
 * compile to single NOP instructions.
 *
 * Example usage with bpftrace:
 *   # Count cache misses per row
 *   sudo bpftrace -e 'usdt:./bin:arith:cache_miss { @[arg0] = count(); }'
 *
 *   # Histogram of range-sum strategies
 *   sudo bpftrace -e 'usdt:./bin:arith:range_sum { @[arg3] = count(); }'
 */

#ifndef ARITH_TRIANGLE_TRACE_H
#define ARITH_TRIANGLE_TRACE_H

#include <stddef.h>

/**
 * USDT Configuration
 *
 * On Linux with systemtap-sdt-dev installed, use sys/sdt.h
 * Otherwise, define no-op macros for compatibility
 */
#ifdef HAVE_SYSTEMTAP_SDT
#include <sys/sdt.h>
#else
#define DTRACE_PROBE(provider, probe) do {} while(0)
#define DTRACE_PROBE1(provider, probe, arg1) do {} while(0)
#define DTRACE_PROBE2(provider, probe, arg1, arg2) do {} while(0)
#define DTRACE_PROBE3(provider, probe, arg1, arg2, arg3) do {} while(0)
#define DTRACE_PROBE4(provider, probe, arg1, arg2, arg3, arg4) do {} while(0)
#endif

/**
 * Provider name for all arith library probes
 */
#define ARITH_PROVIDER arith

/**
 * Module identifiers, passed as the first parameter of the generic probes
 */
#define ARITH_MODULE_INDEX        1
#define ARITH_MODULE_VALUE_ENGINE 2
#define ARITH_MODULE_ROW_SUM      3
#define ARITH_MODULE_RANGE_SUM    4
#define ARITH_MODULE_CONFIG       5

/**
 * Row-sum path identifiers
 */
#define ARITH_ROW_SUM_SHIFT   1
#define ARITH_ROW_SUM_HALVES  2

/**
 * ============================================================================
 * Value Engine Probes
 * ============================================================================
 */

/**
 * Fired when an interior left-half coordinate is found in the cache
 * @param row: Row of the lookup
 * @param column: Column of the lookup (already folded to the left half)
 */
#define ARITH_TRACE_CACHE_HIT(row, column) \
    DTRACE_PROBE2(ARITH_PROVIDER, cache_hit, row, column)

/**
 * Fired when an interior left-half coordinate has to be computed
 * @param row: Row of the lookup
 * @param column: Column of the lookup (already folded to the left half)
 */
#define ARITH_TRACE_CACHE_MISS(row, column) \
    DTRACE_PROBE2(ARITH_PROVIDER, cache_miss, row, column)

/**
 * Fired when a miss is served by the iterative bottom-up fill
 * @param row: Target row
 * @param column: Target column
 */
#define ARITH_TRACE_FILL_START(row, column) \
    DTRACE_PROBE2(ARITH_PROVIDER, fill_start, row, column)

/**
 * Fired when the iterative bottom-up fill finishes
 * @param row: Target row
 * @param column: Target column
 * @param cells: Number of cells updated
 */
#define ARITH_TRACE_FILL_COMPLETE(row, column, cells) \
    DTRACE_PROBE3(ARITH_PROVIDER, fill_complete, row, column, cells)

/**
 * ============================================================================
 * Sum Engine Probes
 * ============================================================================
 */

/**
 * Fired when a whole-row sum is computed
 * @param row: Row being summed
 * @param path: ARITH_ROW_SUM_SHIFT or ARITH_ROW_SUM_HALVES
 */
#define ARITH_TRACE_ROW_SUM(row, path) \
    DTRACE_PROBE2(ARITH_PROVIDER, row_sum, row, path)

/**
 * Fired after the range-sum strategy has been selected
 * @param row: Row being summed
 * @param lower: First column of the clipped range
 * @param upper: One past the last column of the clipped range
 * @param strategy: RangeSumStrategy as an integer
 */
#define ARITH_TRACE_RANGE_SUM(row, lower, upper, strategy) \
    DTRACE_PROBE4(ARITH_PROVIDER, range_sum, row, lower, upper, strategy)

/**
 * ============================================================================
 * Validation and Error Probes
 * ============================================================================
 */

/**
 * Fired when input validation fails
 * @param module_id: Module identifier (ARITH_MODULE_* constant)
 * @param error_code: TriangleErrorCode as an integer
 * @param param1: Relevant parameter value
 * @param param2: Relevant parameter value
 */
#define ARITH_TRACE_VALIDATION_ERROR(module_id, error_code, param1, param2) \
    DTRACE_PROBE4(ARITH_PROVIDER, validation_error, module_id, error_code, param1, param2)

#endif // ARITH_TRIANGLE_TRACE_H
