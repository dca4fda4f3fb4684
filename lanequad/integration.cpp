/*
 * Copyright (c) 2025 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>
#include <utility>

#include "spdlog/spdlog.h"

#include "lanequad/accumulator.hpp"
#include "lanequad/convergence.hpp"
#include "lanequad/integration.hpp"
#include "lanequad/interval_pool.hpp"
#include "lanequad/interval_transform.hpp"
#include "lanequad/rule_evaluator.hpp"

namespace integration {

/**
 * @brief States of a single integration run.
 */
enum class State {
    seeded,    /* One interval spans the domain and has been evaluated. */
    refining,  /* Subdividing the worst interval. */
    converged, /* Every lane is within tolerance. */
    exhausted, /* A budget was reached before convergence. */
    failed,    /* The integrand failed, no result. */
};

/**
 * @brief Name of a run state for logging.
 */
static const char *state_name(State state);

/**
 * @brief Check options against the selected rule.
 *
 * @throws std::invalid_argument on an invalid option.
 */
static void validate_options(const Options &options, const QuadratureRule &rule);

/**
 * @brief Seed the pool with [low, high] and refine until convergence or exhaustion.
 *
 * @param evaluator Rule evaluator bound to the (transformed) integrand.
 * @param low       Lower bound of the finite domain.
 * @param high      Upper bound of the finite domain.
 * @param options   Tolerances and budgets.
 * @param state     Current state, updated on every transition.
 *
 * @return Flat result with the estimate in the orientation of [low, high].
 */
static Result<1> refine(RuleEvaluator &evaluator, double low, double high, const Options &options, State &state);

/**
 * @brief Move to a new state and log the transition.
 */
static void transition(State &state, State next);

std::string status_name(Status status) {
    switch (status) {
    case Status::converged:
        return "converged";
    case Status::exhausted:
        return "exhausted";
    default:
        return "unknown";
    }
}

Result<1> integrate(const LaneFunction &f, double low, double high, const Options &options) {
    return detail::integrate_lanes(f, low, high, options, -1);
}

double gauss_kronrod_61(
    const std::function<double(double)> &f, double a, double b, double eps_abs, double eps_rel, int max_intervals) {
    Options options;
    options.abs_tol = eps_abs;
    options.rel_tol = eps_rel;
    options.max_evaluations = std::numeric_limits<int>::max();
    options.max_intervals = max_intervals;
    options.rule = RuleKind::gauss_kronrod_61;

    LaneFunction lanes = [&f](double x) { return LaneArray({1}, {f(x)}); };

    Result<1> result = detail::integrate_lanes(lanes, a, b, options, 1);

    if (result.status != Status::converged) {
        throw std::runtime_error("Failed to converge within max_intervals.");
    }

    return result.estimate[0];
}

namespace detail {

Result<1> integrate_lanes(const LaneFunction &f, double low, double high, const Options &options, int n_lanes) {
    if (std::isnan(low) || std::isnan(high)) {
        throw DomainError(fmt::format("Invalid integration bounds [{}, {}]", low, high));
    }

    const QuadratureRule &rule = get_rule(options.rule);
    validate_options(options, rule);

    if (low == high) {
        spdlog::debug("Empty domain [{}, {}], integral is zero", low, high);
        const int n = std::max(n_lanes, 0);
        return {LaneArray({n}), LaneArray({n}), Status::converged, 0, 0};
    }

    double sign = 1.0;
    if (low > high) {
        std::swap(low, high);
        sign = -1.0;
    }

    const IntervalTransform transform(low, high);
    RuleEvaluator evaluator(rule, transform.wrap(f), n_lanes);

    spdlog::debug("Integrating over [{}, {}] mapped to [{}, {}] with {}, abs_tol={}, rel_tol={}",
                  low,
                  high,
                  transform.low(),
                  transform.high(),
                  rule.name,
                  options.abs_tol,
                  options.rel_tol);

    State state = State::seeded;
    Result<1> result;
    try {
        result = refine(evaluator, transform.low(), transform.high(), options, state);
    } catch (const IntegrationError &e) {
        transition(state, State::failed);
        spdlog::error("Integration failed after {} evaluations: {}", evaluator.evaluations(), e.what());
        throw;
    }

    result.estimate *= sign;

    return result;
}

}; /* namespace detail */

Result<1> refine(RuleEvaluator &evaluator, double low, double high, const Options &options, State &state) {
    IntervalPool pool;
    pool.insert(make_interval(low, high, evaluator.evaluate(low, high)));

    Accumulator accumulator(evaluator.n_lanes());
    accumulator.resync(pool);

    spdlog::debug(
        "State {}: {} lanes, {} evaluations", state_name(state), evaluator.n_lanes(), evaluator.evaluations());

    const long long step_cost = 2LL * evaluator.rule().n_nodes;
    int step = 0;

    transition(state, State::refining);

    while (state == State::refining) {
        if (is_converged(accumulator.totals(), options.abs_tol, options.rel_tol)) {
            transition(state, State::converged);
            break;
        }

        std::string stop_reason;
        if (evaluator.evaluations() + step_cost > options.max_evaluations) {
            stop_reason = fmt::format("evaluation budget of {} reached", options.max_evaluations);
        } else if (pool.size() + 1 > options.max_intervals) {
            stop_reason = fmt::format("interval budget of {} reached", options.max_intervals);
        } else {
            const Interval &worst = *pool.begin();
            const double mid = 0.5 * (worst.low + worst.high);
            if (!(worst.low < mid && mid < worst.high)) {
                stop_reason = fmt::format("interval [{}, {}] cannot be bisected", worst.low, worst.high);
            }
        }

        if (!stop_reason.empty()) {
            const Totals &totals = accumulator.totals();
            spdlog::warn("Integration exhausted after {} subdivisions: {}; {} of {} lanes not converged, max error {}",
                         step,
                         stop_reason,
                         count_unconverged(totals, options.abs_tol, options.rel_tol),
                         evaluator.n_lanes(),
                         totals.error.max_abs());
            transition(state, State::exhausted);
            break;
        }

        Interval parent = pool.pop_worst();
        const double mid = 0.5 * (parent.low + parent.high);

        Interval left = make_interval(parent.low, mid, evaluator.evaluate(parent.low, mid));
        Interval right = make_interval(mid, parent.high, evaluator.evaluate(mid, parent.high));

        accumulator.add(left);
        accumulator.add(right);
        accumulator.remove(parent);

        pool.insert(std::move(left));
        pool.insert(std::move(right));
        ++step;

        if (step % options.resync_interval == 0) {
            accumulator.resync(pool);
        }

        spdlog::trace("Step {}: split [{}, {}] (priority {}), total error {}, {} evaluations, {} intervals",
                      step,
                      parent.low,
                      parent.high,
                      parent.priority,
                      accumulator.total_error(),
                      evaluator.evaluations(),
                      pool.size());

        if (options.on_step) {
            options.on_step(
                {step, parent.low, parent.high, accumulator.total_error(), evaluator.evaluations(), pool.size()});
        }
    }

    if (state == State::converged) {
        spdlog::debug("Converged after {} subdivisions, {} evaluations", step, evaluator.evaluations());
    }

    Totals totals = accumulator.snapshot();

    return {totals.estimate,
            totals.error,
            state == State::converged ? Status::converged : Status::exhausted,
            evaluator.evaluations(),
            pool.size()};
}

void validate_options(const Options &options, const QuadratureRule &rule) {
    if (!(options.abs_tol >= 0.0) || !(options.rel_tol >= 0.0)) {
        throw std::invalid_argument("Tolerances must be non-negative");
    }
    if (options.max_evaluations < rule.n_nodes) {
        throw std::invalid_argument(
            fmt::format("max_evaluations must allow one {}-point rule evaluation", rule.n_nodes));
    }
    if (options.max_intervals < 1) {
        throw std::invalid_argument("max_intervals must be positive");
    }
    if (options.resync_interval < 1) {
        throw std::invalid_argument("resync_interval must be positive");
    }
}

void transition(State &state, State next) {
    spdlog::debug("State {} -> {}", state_name(state), state_name(next));
    state = next;
}

const char *state_name(State state) {
    switch (state) {
    case State::seeded:
        return "seeded";
    case State::refining:
        return "refining";
    case State::converged:
        return "converged";
    case State::exhausted:
        return "exhausted";
    case State::failed:
        return "failed";
    default:
        return "unknown";
    }
}

}; /* namespace integration */
