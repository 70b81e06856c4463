#pragma once

/**
 * @file parallel.hpp
 * @brief Parallelization macros for OpenMP or sequential execution
 *
 * Loops over the path dimension are independent, so the library marks them
 * with these macros instead of raw pragmas. Random number generation is never
 * placed inside a parallel region: draws stay in a fixed sequential order so
 * seeded runs are bit-identical with or without OpenMP.
 *
 * Usage:
 *   LSMC_PRAGMA_SIMD
 *   for (size_t i = 0; i < n; ++i) { ... }
 *
 *   LSMC_PRAGMA_PARALLEL_FOR
 *   for (size_t i = 0; i < n; ++i) { ... }
 */

#if defined(_OPENMP)
    #define LSMC_PRAGMA_SIMD                   _Pragma("omp simd")
    #define LSMC_PRAGMA_PARALLEL_FOR           _Pragma("omp parallel for")
    #define LSMC_PRAGMA_PARALLEL_FOR_STATIC    _Pragma("omp parallel for schedule(static)")
#else
    #define LSMC_PRAGMA_SIMD
    #define LSMC_PRAGMA_PARALLEL_FOR
    #define LSMC_PRAGMA_PARALLEL_FOR_STATIC
#endif

/**
 * Design notes:
 *
 * 1. _Pragma instead of #pragma: the _Pragma operator allows using pragmas
 *    in macro definitions.
 *
 * 2. Static scheduling is used where every iteration costs the same (mini-path
 *    averaging), so each thread owns a contiguous block of paths.
 *
 * 3. Loop bodies must not write shared state other than their own element.
 */
