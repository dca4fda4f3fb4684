/*
 * Copyright (c) 2025 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <algorithm>

#include "lanequad/accumulator.hpp"

namespace integration {

Accumulator::Accumulator(int n_lanes) : totals_{LaneArray({n_lanes}), LaneArray({n_lanes}), LaneArray({n_lanes})} {}

void Accumulator::add(const Interval &interval) {
    totals_.estimate += interval.estimate;
    totals_.error += interval.error;
    totals_.magnitude += interval.magnitude;
}

void Accumulator::remove(const Interval &interval) {
    totals_.estimate -= interval.estimate;
    totals_.error -= interval.error;
    totals_.magnitude -= interval.magnitude;

    /* errors and magnitudes are sums of non-negative terms */
    for (unsigned int l = 0; l < totals_.error.size(); ++l) {
        totals_.error[l] = std::max(totals_.error[l], 0.0);
        totals_.magnitude[l] = std::max(totals_.magnitude[l], 0.0);
    }
}

void Accumulator::resync(const IntervalPool &pool) {
    totals_.estimate = 0.0;
    totals_.error = 0.0;
    totals_.magnitude = 0.0;

    for (const auto &interval : pool) {
        add(interval);
    }
}

Totals Accumulator::snapshot() const {
    return {totals_.estimate.copy(), totals_.error.copy(), totals_.magnitude.copy()};
}

}; /* namespace integration */
