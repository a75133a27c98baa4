// SPDX-License-Identifier: MIT
/**
 * @file tuckerkit_trace.h
 * @brief USDT (User Statically-Defined Tracing) probes for the tuckerkit library
 *
 * These probes are the library's diagnostic channel. They cost a single NOP
 * when nobody is listening and can be attached at runtime with bpftrace,
 * systemtap or perf without rebuilding.
 *
 * Example usage with bpftrace:
 *   # Every n-mode product with its GEMM dimensions
 *   sudo bpftrace -e 'usdt:./lib*.so:tuckerkit:mode_product { printf("mode=%d %dx%d\n", arg0, arg2, arg3); }'
 *
 *   # Every structural rejection
 *   sudo bpftrace -e 'usdt:./lib*.so:tuckerkit:validation_error { ... }'
 */

#ifndef TUCKERKIT_TRACE_H
#define TUCKERKIT_TRACE_H

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
#define DTRACE_PROBE5(provider, probe, arg1, arg2, arg3, arg4, arg5) do {} while(0)
#endif

/**
 * Provider name for all tuckerkit probes
 */
#define TUCKERKIT_PROVIDER tuckerkit

/**
 * Module identifiers, passed as the first argument of the lifecycle probes
 */
#define MODULE_TUCKER_VALIDATION    1
#define MODULE_MODE_PRODUCT         2
#define MODULE_TUCKER_RECONSTRUCT   3
#define MODULE_UNFOLD               4
#define MODULE_KRONECKER            5

/**
 * ============================================================================
 * Algorithm Lifecycle Probes
 * ============================================================================
 */

/**
 * Fired when an operation begins
 * @param module_id: Module identifier (MODULE_* constant)
 * @param param1: Module-specific parameter (e.g., number of modes)
 * @param param2: Module-specific parameter (e.g., skipped mode, -1 for none)
 * @param param3: Module-specific parameter (e.g., transpose flag)
 */
#define TUCKERKIT_TRACE_ALGO_START(module_id, param1, param2, param3) \
    DTRACE_PROBE4(TUCKERKIT_PROVIDER, algo_start, module_id, param1, param2, param3)

/**
 * Fired when an operation completes successfully
 * @param module_id: Module identifier
 * @param steps: Number of products / sub-steps performed
 * @param size: Number of elements in the result
 */
#define TUCKERKIT_TRACE_ALGO_COMPLETE(module_id, steps, size) \
    DTRACE_PROBE3(TUCKERKIT_PROVIDER, algo_complete, module_id, steps, size)

/**
 * ============================================================================
 * Kernel Probes
 * ============================================================================
 */

/**
 * Fired for every n-mode product, right before the GEMM
 * @param mode: Mode being contracted
 * @param rows_in: Extent of the mode before the product
 * @param rows_out: Extent of the mode after the product
 * @param cols: Number of columns of the unfolding
 */
#define TUCKERKIT_TRACE_MODE_PRODUCT(mode, rows_in, rows_out, cols) \
    DTRACE_PROBE4(TUCKERKIT_PROVIDER, mode_product, mode, rows_in, rows_out, cols)

/**
 * ============================================================================
 * Error Probes
 * ============================================================================
 */

/**
 * Fired when an input is rejected for structural reasons
 * @param module_id: Module identifier
 * @param error_code: StructuralErrorCode as integer
 * @param index: Offending mode / factor index
 * @param expected: Dimension required by the invariant
 * @param actual: Dimension that was provided
 */
#define TUCKERKIT_TRACE_VALIDATION_ERROR(module_id, error_code, index, expected, actual) \
    DTRACE_PROBE5(TUCKERKIT_PROVIDER, validation_error, module_id, error_code, index, expected, actual)

#endif  // TUCKERKIT_TRACE_H
