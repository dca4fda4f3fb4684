/*
 * Copyright (c) 2025 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <algorithm>
#include <cmath>
#include <exception>
#include <stdexcept>
#include <utility>

#include "spdlog/spdlog.h"

#include "lanequad/consts.hpp"
#include "lanequad/errors.hpp"
#include "lanequad/rule_evaluator.hpp"

namespace integration {

RuleEvaluator::RuleEvaluator(const QuadratureRule &rule, LaneFunction f, int n_lanes)
    : rule_(rule), f_(std::move(f)), n_lanes_(-1) {
    if (n_lanes == -1) {
        return;
    }
    if (n_lanes < 1) {
        throw std::invalid_argument("Number of lanes must be positive");
    }
    set_lanes(n_lanes);
}

IntervalEstimate RuleEvaluator::evaluate(double low, double high) {
    if (low == high) {
        const int n = std::max(n_lanes_, 0);
        return {LaneArray({n}), LaneArray({n}), LaneArray({n})};
    }

    const double center = 0.5 * (low + high);
    const double half_length = 0.5 * (high - low);
    const int n_half = static_cast<int>(rule_.xgk.size()) - 1;

    store_node(0, center);
    for (int i = 0; i < n_half; ++i) {
        const double absc = half_length * rule_.xgk[i];
        store_node(2 * i + 1, center - absc);
        store_node(2 * i + 2, center + absc);
    }

    const int n = n_lanes_;
    const double *values = node_values_.data();
    const double *f_center = values;

    LaneArray kronrod({n});
    LaneArray gauss({n});
    LaneArray magnitude({n});
    LaneArray asc({n});

    const double w_center = rule_.wgk[n_half];
    const double wg_center = rule_.gauss_center ? rule_.wg.back() : 0.0;

    for (int l = 0; l < n; ++l) {
        kronrod[l] = w_center * f_center[l];
        gauss[l] = wg_center * f_center[l];
        magnitude[l] = w_center * std::abs(f_center[l]);
    }

    for (int i = 0; i < n_half; ++i) {
        const double *f1 = values + (2 * i + 1) * n;
        const double *f2 = values + (2 * i + 2) * n;
        const double wk = rule_.wgk[i];

        for (int l = 0; l < n; ++l) {
            kronrod[l] += wk * (f1[l] + f2[l]);
            magnitude[l] += wk * (std::abs(f1[l]) + std::abs(f2[l]));
        }
        if (i % 2 == 1) { /* Gauss nodes are the odd entries of xgk */
            const double wg = rule_.wg[i / 2];
            for (int l = 0; l < n; ++l) {
                gauss[l] += wg * (f1[l] + f2[l]);
            }
        }
    }

    /* mean value of f over the reference interval [-1, 1] */
    for (int l = 0; l < n; ++l) {
        const double mean = 0.5 * kronrod[l];
        asc[l] = w_center * std::abs(f_center[l] - mean);
        for (int i = 0; i < n_half; ++i) {
            const double *f1 = values + (2 * i + 1) * n;
            const double *f2 = values + (2 * i + 2) * n;
            asc[l] += rule_.wgk[i] * (std::abs(f1[l] - mean) + std::abs(f2[l] - mean));
        }
    }

    const double scale = std::abs(half_length);
    kronrod *= half_length;
    gauss *= half_length;
    magnitude *= scale;
    asc *= scale;

    LaneArray error({n});
    for (int l = 0; l < n; ++l) {
        double err = std::abs(kronrod[l] - gauss[l]);

        if (asc[l] != 0.0 && err != 0.0) {
            const double ratio = std::pow(consts::error_scale * err / asc[l], consts::error_exponent);
            err = (ratio < 1.0) ? asc[l] * ratio : asc[l];
        }
        if (magnitude[l] > consts::uflow / (consts::error_floor_factor * consts::epmach)) {
            err = std::max(err, consts::error_floor_factor * consts::epmach * magnitude[l]);
        }

        error[l] = err;
    }

    return {kronrod, error, magnitude};
}

void RuleEvaluator::store_node(int k, double x) {
    LaneArray result;

    ++evaluations_;
    try {
        result = f_(x);
    } catch (const IntegrationError &) {
        throw;
    } catch (const std::exception &e) {
        std::throw_with_nested(IntegrandError(fmt::format("Integrand failed at x={}: {}", x, e.what())));
    } catch (...) {
        std::throw_with_nested(IntegrandError(fmt::format("Integrand failed at x={}", x)));
    }

    if (n_lanes_ < 0) {
        if (result.size() == 0) {
            throw ShapeMismatchError("Integrand returned no lanes");
        }
        set_lanes(static_cast<int>(result.size()));
        spdlog::debug("Inferred {} lanes from first integrand call", n_lanes_);
    }
    if (static_cast<int>(result.size()) != n_lanes_) {
        throw ShapeMismatchError(
            fmt::format("Integrand returned {} lanes at x={}, expected {}", result.size(), x, n_lanes_));
    }

    if (!result.all_finite()) {
        for (int l = 0; l < n_lanes_; ++l) {
            if (!std::isfinite(result[l])) {
                throw IntegrandError(
                    fmt::format("Integrand returned non-finite value {} in lane {} at x={}", result[l], l, x));
            }
        }
    }

    auto row = node_values_(k);
    row = result;
}

void RuleEvaluator::set_lanes(int n_lanes) {
    n_lanes_ = n_lanes;
    node_values_ = ndarray::NDArray<double, 2>({rule_.n_nodes, n_lanes_});
}

}; /* namespace integration */
