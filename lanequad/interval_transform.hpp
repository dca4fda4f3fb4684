/*
 * Copyright (c) 2025 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "lanequad/rule_evaluator.hpp"

namespace integration {

/**
 * @brief Shape of an integration domain with respect to infinite bounds.
 */
enum class DomainKind {
    finite,         /* [a, b] */
    upper_infinite, /* [a, inf) */
    lower_infinite, /* (-inf, b] */
    both_infinite,  /* (-inf, inf) */
};

/**
 * @class IntervalTransform
 * @brief Change of variable mapping a semi-infinite or infinite domain onto a finite one.
 *
 * - [a, inf):    x = a + t / (1 - t),     dx/dt = 1 / (1 - t)^2,               t in [0, 1)
 * - (-inf, b]:   x = b - t / (1 - t),     |dx/dt| = 1 / (1 - t)^2,             t in [0, 1)
 * - (-inf, inf): x = t / (1 - t^2),       dx/dt = (1 + t^2) / (1 - t^2)^2,    t in (-1, 1)
 *
 * Finite domains map onto themselves with unit Jacobian. The wrapped integrand clamps t one ulp inside the singular
 * endpoints, which can only be reached when bisection rounds a node onto them.
 */
class IntervalTransform {
public:
    /**
     * @brief Construct the transform for [low, high].
     *
     * @param low  Lower bound, may be -inf.
     * @param high Upper bound, may be +inf; must be greater than low.
     *
     * @throws std::invalid_argument if low >= high or a bound is infinite in the wrong direction.
     */
    IntervalTransform(double low, double high);

    DomainKind kind() const noexcept { return kind_; }

    /**
     * @brief Lower bound of the mapped finite domain.
     */
    double low() const noexcept { return low_; }

    /**
     * @brief Upper bound of the mapped finite domain.
     */
    double high() const noexcept { return high_; }

    /**
     * @brief Map t in the finite domain back to x in the original domain.
     */
    double to_x(double t) const noexcept;

    /**
     * @brief Absolute value of dx/dt at t.
     */
    double jacobian(double t) const noexcept;

    /**
     * @brief Compose the integrand with the change of variable and its Jacobian.
     *
     * @param f Integrand over the original domain.
     *
     * @return Integrand over the finite domain; f itself for a finite domain.
     */
    LaneFunction wrap(LaneFunction f) const;

private:
    /**
     * @brief Move t strictly inside the singular endpoints of the mapped domain.
     */
    double clamp(double t) const noexcept;

    DomainKind kind_;
    double origin_; /* Finite bound of a semi-infinite domain. */
    double low_, high_;
};

}; /* namespace integration */
