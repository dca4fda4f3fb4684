/*
 * Copyright (c) 2025 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <functional>

#include "lanequad/ndarray.hpp"
#include "lanequad/quadrature_rule.hpp"

namespace integration {

/**
 * @brief One value per lane, lanes being the flattened parameter shape.
 */
using LaneArray = ndarray::NDArray<double, 1>;

/**
 * @brief Integrand evaluated for all lanes at once at a single node.
 */
using LaneFunction = std::function<LaneArray(double)>;

/**
 * @brief Rule output for one interval.
 */
struct IntervalEstimate {
    LaneArray estimate;  /* Kronrod estimate of the integral. */
    LaneArray error;     /* Error estimate, always >= 0. */
    LaneArray magnitude; /* Kronrod estimate of the integral of |f|. */
};

/**
 * @class RuleEvaluator
 * @brief Applies an embedded Gauss-Kronrod pair to an interval for all lanes in one batch of integrand calls.
 *
 * The integrand is called once per Kronrod node and every call returns the values of all lanes, so the cost of an
 * interval is rule.n_nodes calls regardless of the number of lanes. The lane count is either declared up front or
 * inferred from the first call; from then on every result must have exactly that many lanes.
 */
class RuleEvaluator {
public:
    /**
     * @brief Construct an evaluator.
     *
     * @param rule    Quadrature rule tables.
     * @param f       Integrand.
     * @param n_lanes Number of lanes every integrand call must return, or -1 to infer it from the first call.
     *
     * @throws std::invalid_argument if n_lanes is neither positive nor -1.
     */
    RuleEvaluator(const QuadratureRule &rule, LaneFunction f, int n_lanes = -1);

    RuleEvaluator(const RuleEvaluator &) = delete;

    RuleEvaluator &operator=(const RuleEvaluator &) = delete;

    /**
     * @brief Evaluate the rule on [low, high].
     *
     * A zero-width interval yields zero estimate and zero error without calling the integrand.
     *
     * @param low  Lower bound.
     * @param high Upper bound.
     *
     * @return Estimate, error and magnitude per lane.
     *
     * @throws IntegrandError if the integrand throws (the original exception is nested) or returns a non-finite value.
     * @throws ShapeMismatchError if the integrand returns a different number of lanes.
     */
    IntervalEstimate evaluate(double low, double high);

    /**
     * @brief Number of integrand calls made so far.
     */
    int evaluations() const noexcept { return evaluations_; }

    /**
     * @brief Number of lanes, -1 while not yet inferred.
     */
    int n_lanes() const noexcept { return n_lanes_; }

    /**
     * @brief Rule used by this evaluator.
     */
    const QuadratureRule &rule() const noexcept { return rule_; }

private:
    /**
     * @brief Call the integrand at x and copy its lanes into row k of the node table.
     */
    void store_node(int k, double x);

    /**
     * @brief Allocate the node table once the lane count is known.
     */
    void set_lanes(int n_lanes);

    const QuadratureRule &rule_;

    LaneFunction f_;

    int n_lanes_;

    int evaluations_ = 0;

    /**
     * @brief Integrand values, one row per Kronrod node: center first, then (center - x_i, center + x_i) pairs.
     */
    ndarray::NDArray<double, 2> node_values_;
};

}; /* namespace integration */
