// SPDX-License-Identifier: MIT
#pragma once

/**
 * @file parallel.hpp
 * @brief Parallelization macros with an OpenMP backend and a sequential fallback
 *
 * The tensor kernels never spawn threads themselves. Loops whose iterations
 * touch disjoint output slabs are marked with these macros so that an
 * OpenMP-enabled build distributes them; a build without OpenMP compiles
 * the same loops sequentially.
 *
 * Usage:
 *   TUCKERKIT_PRAGMA_PARALLEL_FOR_IF(n_slabs >= TUCKERKIT_PARALLEL_MIN_SLABS)
 *   for (std::ptrdiff_t s = 0; s < n_slabs; ++s) { ... }
 */

/// Minimum number of independent slabs before a copy loop goes parallel.
/// Below this the thread fork costs more than the copy.
#ifndef TUCKERKIT_PARALLEL_MIN_SLABS
#define TUCKERKIT_PARALLEL_MIN_SLABS 64
#endif

#if defined(_OPENMP)
    #define TUCKERKIT_PRAGMA_STRINGIFY(x) #x
    #define TUCKERKIT_PRAGMA_PARALLEL_FOR_IF(cond) \
        _Pragma(TUCKERKIT_PRAGMA_STRINGIFY(omp parallel for schedule(static) if(cond)))
#else
    #define TUCKERKIT_PRAGMA_PARALLEL_FOR_IF(cond)
#endif

/**
 * Design notes:
 *
 * 1. _Pragma is used instead of #pragma so the directives can live inside
 *    macro definitions.
 *
 * 2. TUCKERKIT_PRAGMA_PARALLEL_FOR_IF forwards its condition to the OpenMP
 *    `if` clause; the loop runs on the calling thread when it is false.
 *
 * 3. Sequential builds (no -fopenmp) see empty macros, which is also the
 *    configuration to use when debugging a kernel.
 */
