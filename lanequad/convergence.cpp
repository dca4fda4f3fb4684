/*
 * Copyright (c) 2025 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <algorithm>
#include <cmath>

#include "lanequad/consts.hpp"
#include "lanequad/convergence.hpp"

namespace integration {

double lane_tolerance(double estimate, double magnitude, double abs_tol, double rel_tol) {
    const double floor = consts::convergence_floor_factor * consts::epmach * magnitude;
    if (abs_tol == 0.0 && rel_tol > 0.0 && std::abs(estimate) <= floor) {
        return floor;
    }
    return std::max(abs_tol, rel_tol * std::abs(estimate));
}

bool lane_converged(double estimate, double error, double magnitude, double abs_tol, double rel_tol) {
    return error <= lane_tolerance(estimate, magnitude, abs_tol, rel_tol);
}

bool is_converged(const Totals &totals, double abs_tol, double rel_tol) {
    for (unsigned int l = 0; l < totals.estimate.size(); ++l) {
        if (!lane_converged(totals.estimate[l], totals.error[l], totals.magnitude[l], abs_tol, rel_tol)) {
            return false;
        }
    }
    return true;
}

int count_unconverged(const Totals &totals, double abs_tol, double rel_tol) {
    int count = 0;
    for (unsigned int l = 0; l < totals.estimate.size(); ++l) {
        if (!lane_converged(totals.estimate[l], totals.error[l], totals.magnitude[l], abs_tol, rel_tol)) {
            ++count;
        }
    }
    return count;
}

}; /* namespace integration */
