/*
 * Copyright (c) 2025 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <algorithm>
#include <stdexcept>
#include <utility>

#include "lanequad/interval_pool.hpp"

namespace integration {

Interval make_interval(double low, double high, IntervalEstimate estimate) {
    const double priority = estimate.error.max_abs();
    return {low,
            high,
            std::move(estimate.estimate),
            std::move(estimate.error),
            std::move(estimate.magnitude),
            priority};
}

bool refine_later(const Interval &a, const Interval &b) noexcept {
    if (a.priority != b.priority) {
        return a.priority < b.priority;
    }
    if (a.width() != b.width()) {
        return a.width() < b.width();
    }
    return a.low > b.low;
}

void IntervalPool::insert(Interval interval) {
    heap_.push_back(std::move(interval));
    std::push_heap(heap_.begin(), heap_.end(), refine_later);
}

Interval IntervalPool::pop_worst() {
    if (heap_.empty()) {
        throw std::out_of_range("Interval pool is empty");
    }
    std::pop_heap(heap_.begin(), heap_.end(), refine_later);
    Interval worst = std::move(heap_.back());
    heap_.pop_back();
    return worst;
}

double IntervalPool::peek_worst_priority() const {
    if (heap_.empty()) {
        throw std::out_of_range("Interval pool is empty");
    }
    return heap_.front().priority;
}

}; /* namespace integration */
