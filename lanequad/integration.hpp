/*
 * Copyright (c) 2025 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <array>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>

#include "fmt/format.h"

#include "lanequad/consts.hpp"
#include "lanequad/errors.hpp"
#include "lanequad/ndarray.hpp"
#include "lanequad/quadrature_rule.hpp"
#include "lanequad/rule_evaluator.hpp"

namespace integration {

/**
 * @brief Integrand over lane parameters of dimension N.
 */
template <unsigned int N>
using ParamFunction = std::function<ndarray::NDArray<double, N>(double, const ndarray::NDArray<double, N> &)>;

/**
 * @brief Outcome of an integration run that produced a result.
 */
enum class Status {
    converged, /* Every lane satisfies its tolerance. */
    exhausted, /* A budget was reached first; the result is the best estimate so far. */
};

/**
 * @brief Name of a status ("converged", "exhausted").
 */
std::string status_name(Status status);

/**
 * @brief Progress of a run after one subdivision.
 */
struct StepReport {
    int step;             /* 1-based subdivision counter. */
    double low, high;     /* Bounds of the interval that was bisected, in the mapped domain. */
    double total_error;   /* Total error summed over lanes after the step. */
    int evaluations_used; /* Integrand calls so far. */
    int intervals_used;   /* Active intervals after the step. */
};

/**
 * @brief Tolerances, budgets and rule selection of an integration run.
 */
struct Options {
    double abs_tol = consts::default_abs_tol;
    double rel_tol = consts::default_rel_tol;
    int max_evaluations = consts::default_max_evaluations;
    int max_intervals = consts::default_max_intervals;
    RuleKind rule = RuleKind::gauss_kronrod_61;
    int resync_interval = consts::default_resync_interval;
    std::function<void(const StepReport &)> on_step; /* Called after every subdivision when set. */
};

/**
 * @brief Result of an integration run.
 *
 * @tparam N Dimensionality of the lane shape.
 */
template <unsigned int N>
struct Result {
    ndarray::NDArray<double, N> estimate;
    ndarray::NDArray<double, N> error;
    Status status;
    int evaluations_used;
    int intervals_used;
};

/**
 * @brief Integrate a lane-valued function over [low, high] with adaptive Gauss-Kronrod quadrature.
 *
 * All lanes share one subdivision schedule: the interval with the largest lane error is bisected until every lane
 * satisfies error <= max(abs_tol, rel_tol * |estimate|) or a budget is reached. The lane count is inferred from the
 * first integrand call.
 *
 * Bounds may be infinite. low > high integrates over [high, low] and negates the estimate. low == high returns a
 * zero result without calling the integrand; since no call is made the result then has zero lanes.
 *
 * @param f       Integrand returning one value per lane.
 * @param low     Lower limit of integration.
 * @param high    Upper limit of integration.
 * @param options Tolerances, budgets and rule.
 *
 * @return Estimate, error, status and counters.
 *
 * @throws DomainError if a bound is NaN.
 * @throws IntegrandError if the integrand throws or returns a non-finite value.
 * @throws ShapeMismatchError if the lane count changes between calls.
 * @throws std::invalid_argument for invalid options.
 */
Result<1> integrate(const LaneFunction &f, double low, double high, const Options &options = Options());

/**
 * @brief Integrate a function of lane parameters over [low, high].
 *
 * The lane shape is the shape of params and every integrand result must have exactly that shape. Broadcasting of
 * parameters is the caller's responsibility.
 *
 * @tparam N      Dimensionality of the lane shape.
 * @param f       Integrand called as f(x, params).
 * @param low     Lower limit of integration.
 * @param high    Upper limit of integration.
 * @param params  Lane parameters, passed unchanged to every call.
 * @param options Tolerances, budgets and rule.
 *
 * @return Estimate and error with the shape of params.
 *
 * @throws ShapeMismatchError if a result differs in shape from params.
 */
template <unsigned int N>
Result<N> integrate(const std::type_identity_t<ParamFunction<N>> &f,
                    double low,
                    double high,
                    const ndarray::NDArray<double, N> &params,
                    const Options &options = Options());

/**
 * @brief Integrate a function with lanes of dimension N, the lane shape being inferred from the first call.
 *
 * @tparam N Dimensionality of the lane shape, given explicitly.
 *
 * @throws ShapeMismatchError if a later result differs in shape from the first one.
 */
template <unsigned int N>
Result<N> integrate_shaped(const std::function<ndarray::NDArray<double, N>(double)> &f,
                           double low,
                           double high,
                           const Options &options = Options());

/**
 * @brief Compute the integral of a function over [a, b] using adaptive 61-point Gauss-Kronrod quadrature.
 *
 * Single-lane convenience wrapper without an evaluation cap.
 *
 * @param f             Function to integrate.
 * @param a             Lower limit of integration.
 * @param b             Upper limit of integration.
 * @param eps_abs       Absolute error tolerance.
 * @param eps_rel       Relative error tolerance.
 * @param max_intervals Maximum number of subintervals allowed.
 *
 * @return Approximated integral of the function over [a, b].
 *
 * @throws std::runtime_error if the tolerance is not reached within max_intervals.
 */
double gauss_kronrod_61(
    const std::function<double(double)> &f, double a, double b, double eps_abs, double eps_rel, int max_intervals);

namespace detail {

/**
 * @brief Format an array shape as "(d0, d1, ...)".
 */
template <std::size_t N>
std::string format_shape(const std::array<int, N> &shape) {
    return fmt::format("({})", fmt::join(shape, ", "));
}

/**
 * @brief Core run over a flat lane array with an optionally declared lane count (-1 to infer).
 */
Result<1> integrate_lanes(const LaneFunction &f, double low, double high, const Options &options, int n_lanes);

/**
 * @brief Give a flat result the lane shape of the caller.
 */
template <unsigned int N>
Result<N> reshape_result(const Result<1> &flat, const std::array<int, N> &shape) {
    if (flat.estimate.size() == 0) {
        return {ndarray::NDArray<double, N>(shape), ndarray::NDArray<double, N>(shape), flat.status,
                flat.evaluations_used, flat.intervals_used};
    }
    return {flat.estimate.template reshape<N>(shape), flat.error.template reshape<N>(shape), flat.status,
            flat.evaluations_used, flat.intervals_used};
}

}; /* namespace detail */

template <unsigned int N>
Result<N> integrate(const std::type_identity_t<ParamFunction<N>> &f,
                    double low,
                    double high,
                    const ndarray::NDArray<double, N> &params,
                    const Options &options) {
    if (params.size() == 0) {
        throw std::invalid_argument("Lane parameters must not be empty");
    }

    const auto shape = params.shape();
    LaneFunction flat = [&f, &params, shape](double x) {
        ndarray::NDArray<double, N> values = f(x, params);
        if (values.shape() != shape) {
            throw ShapeMismatchError(fmt::format("Integrand returned shape {} at x={}, expected {}",
                                                 detail::format_shape(values.shape()), x,
                                                 detail::format_shape(shape)));
        }
        return values.flatten();
    };

    Result<1> result = detail::integrate_lanes(flat, low, high, options, static_cast<int>(params.size()));

    return detail::reshape_result<N>(result, shape);
}

template <unsigned int N>
Result<N> integrate_shaped(const std::function<ndarray::NDArray<double, N>(double)> &f,
                           double low,
                           double high,
                           const Options &options) {
    std::optional<std::array<int, N>> shape;

    LaneFunction flat = [&f, &shape](double x) {
        ndarray::NDArray<double, N> values = f(x);
        if (!shape) {
            shape = values.shape();
        } else if (values.shape() != *shape) {
            throw ShapeMismatchError(fmt::format("Integrand returned shape {} at x={}, expected {}",
                                                 detail::format_shape(values.shape()), x,
                                                 detail::format_shape(*shape)));
        }
        return values.flatten();
    };

    Result<1> result = detail::integrate_lanes(flat, low, high, options, -1);

    if (!shape) {
        return detail::reshape_result<N>(result, std::array<int, N>{});
    }
    return detail::reshape_result<N>(result, *shape);
}

}; /* namespace integration */
