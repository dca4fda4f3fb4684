/*
 * Copyright (c) 2025 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <vector>

#include "lanequad/rule_evaluator.hpp"

namespace integration {

/**
 * @brief Active subinterval with the rule output cached for exactly [low, high].
 */
struct Interval {
    double low, high;
    LaneArray estimate;
    LaneArray error;
    LaneArray magnitude;
    double priority; /* Largest lane error, used to order refinement. */

    double width() const noexcept { return high - low; }
};

/**
 * @brief Build an interval record from a rule evaluation.
 *
 * @param low      Lower bound.
 * @param high     Upper bound.
 * @param estimate Rule output for [low, high].
 *
 * @return Interval whose priority is the maximum lane error.
 */
Interval make_interval(double low, double high, IntervalEstimate estimate);

/**
 * @brief Refinement order: true if a should be refined after b.
 *
 * Larger priority is refined first, ties go to the wider interval and then to the one with the lower bound.
 */
bool refine_later(const Interval &a, const Interval &b) noexcept;

/**
 * @class IntervalPool
 * @brief Max-heap of the active intervals keyed by refine_later().
 *
 * Owned by a single integration run. Iteration visits all active intervals in heap order, which is used to resum the
 * global totals.
 */
class IntervalPool {
public:
    using const_iterator = std::vector<Interval>::const_iterator;

    /**
     * @brief Insert an interval in O(log n).
     */
    void insert(Interval interval);

    /**
     * @brief Remove and return the interval to refine next in O(log n).
     *
     * @throws std::out_of_range if the pool is empty.
     */
    Interval pop_worst();

    /**
     * @brief Priority of the interval that pop_worst() would return.
     *
     * @throws std::out_of_range if the pool is empty.
     */
    double peek_worst_priority() const;

    int size() const noexcept { return static_cast<int>(heap_.size()); }

    bool empty() const noexcept { return heap_.empty(); }

    const_iterator begin() const noexcept { return heap_.begin(); }

    const_iterator end() const noexcept { return heap_.end(); }

private:
    std::vector<Interval> heap_;
};

}; /* namespace integration */
