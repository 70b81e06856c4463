// SPDX-License-Identifier: MIT
/**
 * @file lsmc_trace.h
 * @brief USDT (User Statically-Defined Tracing) probes for the lsmc library
 *
 * Probes can be enabled at runtime with bpftrace, systemtap or perf. The
 * library has no other logging channel: a run is observed by attaching to
 * these probes.
 *
 * Example usage with bpftrace:
 *   # Trace every regression fit
 *   sudo bpftrace -e 'usdt:./liblsmc*:lsmc:regression_fit { printf("t=%d n=%d\n", arg0, arg1); }'
 *
 *   # Watch for fit failures
 *   sudo bpftrace -e 'usdt:./liblsmc*:lsmc:fit_failed { ... }'
 *
 * Probes are compiled in only when LSMC_HAVE_SYSTEMTAP_SDT is defined (the
 * build defines it when <sys/sdt.h> is available); otherwise every
 * LSMC_TRACE_* macro expands to an empty statement.
 */

#ifndef LSMC_TRACE_H
#define LSMC_TRACE_H

#include <stddef.h>

#ifdef LSMC_HAVE_SYSTEMTAP_SDT
#include <sys/sdt.h>
#define LSMC_PROBE2(probe, a1, a2) DTRACE_PROBE2(lsmc, probe, a1, a2)
#define LSMC_PROBE3(probe, a1, a2, a3) DTRACE_PROBE3(lsmc, probe, a1, a2, a3)
#define LSMC_PROBE4(probe, a1, a2, a3, a4) DTRACE_PROBE4(lsmc, probe, a1, a2, a3, a4)
#else
#define LSMC_PROBE2(probe, a1, a2) do {} while(0)
#define LSMC_PROBE3(probe, a1, a2, a3) do {} while(0)
#define LSMC_PROBE4(probe, a1, a2, a3, a4) do {} while(0)
#endif

/**
 * Module identifiers, passed as the first argument of lifecycle probes
 */
#define LSMC_MODULE_PATH_SIMULATOR     1
#define LSMC_MODULE_BACKWARD_INDUCTION 2
#define LSMC_MODULE_DUAL_BOUND         3
#define LSMC_MODULE_PRICER             4
#define LSMC_MODULE_BIAS_STUDY         5

/**
 * ============================================================================
 * Algorithm Lifecycle Probes
 * ============================================================================
 */

/**
 * Fired when an algorithm begins execution
 * @param module_id: LSMC_MODULE_* constant
 * @param n_timestep: Number of dates
 * @param n_path: Number of paths
 * @param param: Module-specific (polynomial order, mini-path count, ...)
 */
#define LSMC_TRACE_ALGO_START(module_id, n_timestep, n_path, param) \
    LSMC_PROBE4(algo_start, module_id, n_timestep, n_path, param)

/**
 * Fired when an algorithm completes successfully
 * @param module_id: LSMC_MODULE_* constant
 * @param n_path: Number of paths in the estimate
 * @param estimate: Final estimate (npv, upper bound, mean npv)
 */
#define LSMC_TRACE_ALGO_COMPLETE(module_id, n_path, estimate) \
    LSMC_PROBE3(algo_complete, module_id, n_path, estimate)

/**
 * ============================================================================
 * Regression Probes
 * ============================================================================
 */

/**
 * Fired after each successful continuation-value fit
 * @param timestep: Date index being fitted
 * @param n_samples: Paths used in the fit
 * @param order: Number of polynomial coefficients
 */
#define LSMC_TRACE_REGRESSION_FIT(timestep, n_samples, order) \
    LSMC_PROBE3(regression_fit, timestep, n_samples, order)

/**
 * Fired when the in-the-money subset at a date is empty and the
 * continuation value is set to zero
 * @param timestep: Date index
 * @param n_path: Cross-section size
 */
#define LSMC_TRACE_EMPTY_IN_THE_MONEY(timestep, n_path) \
    LSMC_PROBE2(empty_in_the_money, timestep, n_path)

/**
 * Fired when a regression fails and the run is aborted
 * @param timestep: Date index
 * @param error_code: FitErrorCode as int
 * @param n_samples: Paths used in the failed fit
 */
#define LSMC_TRACE_FIT_FAILED(timestep, error_code, n_samples) \
    LSMC_PROBE3(fit_failed, timestep, error_code, n_samples)

/**
 * ============================================================================
 * Validation and Dual Bound Probes
 * ============================================================================
 */

/**
 * Fired when input validation fails
 * @param module_id: LSMC_MODULE_* constant
 * @param error_code: ValidationErrorCode as int
 * @param value: Offending value
 */
#define LSMC_TRACE_VALIDATION_ERROR(module_id, error_code, value) \
    LSMC_PROBE3(validation_error, module_id, error_code, value)

/**
 * Fired after each date of the martingale construction
 * @param timestep: Date index
 * @param n_minipath: Mini-paths per outer path
 * @param mean_increment: Cross-sectional mean of the martingale increment
 */
#define LSMC_TRACE_DUAL_STEP(timestep, n_minipath, mean_increment) \
    LSMC_PROBE3(dual_step, timestep, n_minipath, mean_increment)

#endif  // LSMC_TRACE_H
