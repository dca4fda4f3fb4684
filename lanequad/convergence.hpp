/*
 * Copyright (c) 2025 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "lanequad/accumulator.hpp"

namespace integration {

/**
 * @brief Error a lane may carry and still count as converged.
 *
 * max(abs_tol, rel_tol * |estimate|). A lane whose estimate is at roundoff level under a purely relative tolerance
 * (abs_tol == 0, rel_tol > 0, |estimate| <= floor) gets floor = 100 * epmach * magnitude instead, which is never
 * smaller than the sum of the per-interval error floors applied by the rule evaluator. Any other tolerance below
 * those floors cannot be met and the run ends exhausted.
 *
 * @param estimate  Total estimate of the lane.
 * @param magnitude Total integral of |f| of the lane.
 * @param abs_tol   Absolute tolerance.
 * @param rel_tol   Relative tolerance.
 *
 * @return Tolerance band of the lane.
 */
double lane_tolerance(double estimate, double magnitude, double abs_tol, double rel_tol);

/**
 * @brief Check a single lane against its tolerance band.
 */
bool lane_converged(double estimate, double error, double magnitude, double abs_tol, double rel_tol);

/**
 * @brief Check whether every lane is converged.
 *
 * Intervals are shared by all lanes, so one unconverged lane keeps the whole run refining.
 *
 * @param totals  Current totals.
 * @param abs_tol Absolute tolerance.
 * @param rel_tol Relative tolerance.
 *
 * @return True if all lanes are converged.
 */
bool is_converged(const Totals &totals, double abs_tol, double rel_tol);

/**
 * @brief Number of lanes that are not converged yet.
 */
int count_unconverged(const Totals &totals, double abs_tol, double rel_tol);

}; /* namespace integration */
