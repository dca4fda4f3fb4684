/*
 * Copyright (c) 2025 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "lanequad/interval_pool.hpp"
#include "lanequad/rule_evaluator.hpp"

namespace integration {

/**
 * @brief Per-lane totals over all active intervals.
 */
struct Totals {
    LaneArray estimate;
    LaneArray error;
    LaneArray magnitude;
};

/**
 * @class Accumulator
 * @brief Running per-lane sums of the estimates, errors and magnitudes of the active intervals.
 *
 * A subdivision step removes the parent and adds both children, which keeps each step O(lanes) instead of O(lanes *
 * intervals). Running sums drift through cancellation over many steps, so the owner calls resync() periodically to
 * rebuild the totals from the pool.
 */
class Accumulator {
public:
    /**
     * @brief Construct zero totals for n_lanes lanes.
     */
    explicit Accumulator(int n_lanes);

    /**
     * @brief Add the contribution of an interval.
     *
     * @throws std::invalid_argument if the interval has a different lane count.
     */
    void add(const Interval &interval);

    /**
     * @brief Subtract the contribution of an interval.
     *
     * @throws std::invalid_argument if the interval has a different lane count.
     */
    void remove(const Interval &interval);

    /**
     * @brief Recompute the totals by summing all intervals of the pool.
     */
    void resync(const IntervalPool &pool);

    /**
     * @brief Independent copy of the current totals.
     */
    Totals snapshot() const;

    /**
     * @brief Current totals without copying; valid until the next modification.
     */
    const Totals &totals() const noexcept { return totals_; }

    /**
     * @brief Sum over lanes of the total error.
     */
    double total_error() const noexcept { return totals_.error.sum(); }

private:
    Totals totals_;
};

}; /* namespace integration */
