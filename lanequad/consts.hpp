/*
 * Copyright (c) 2025 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <limits>

namespace consts {

/* Machine constants. */
constexpr double epmach = std::numeric_limits<double>::epsilon(); /* Relative machine precision. */
constexpr double uflow = std::numeric_limits<double>::min();      /* Smallest positive normalized double. */

/* Default integration tolerances and budgets. */
constexpr double default_abs_tol = 1.0e-8;  /* Absolute error tolerance. */
constexpr double default_rel_tol = 1.0e-8;  /* Relative error tolerance. */
constexpr int default_max_evaluations = 10000; /* Maximum number of integrand calls. */
constexpr int default_max_intervals = 2000;    /* Maximum number of active subintervals. */

/* Running sums are recomputed from the interval pool every resync_interval subdivisions. */
constexpr int default_resync_interval = 256;

/* Roundoff floors, as multiples of epmach times the integral of |f|. */
constexpr double error_floor_factor = 50.0;        /* Lower bound of a single interval error estimate. */
constexpr double convergence_floor_factor = 100.0; /* Lower bound of the per-lane tolerance band. */

/* Scaling of the Kronrod-Gauss discrepancy into an error estimate (QUADPACK). */
constexpr double error_scale = 200.0;
constexpr double error_exponent = 1.5;

}; /* namespace consts */
