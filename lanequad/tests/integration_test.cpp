/*
 * Copyright (c) 2025 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include "lanequad/integration.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <cmath>
#include <functional>
#include <limits>
#include <numbers>
#include <stdexcept>
#include <vector>

#include "lanequad/ndarray.hpp"

using integration::LaneArray;
using integration::Status;

constexpr double eps_abs = 1.0e-6;
constexpr double eps_rel = 1.0e-6;
constexpr int max_intervals = 1000;

constexpr double inf = std::numeric_limits<double>::infinity();

TEST(Integration, GaussKronrodConst) {
    auto f = [](double) { return 1.0; };
    double a = 0;
    double b = 1;

    double result = integration::gauss_kronrod_61(f, a, b, eps_abs, eps_rel, max_intervals);

    ASSERT_NEAR(1.0, result, eps_rel);
}

TEST(Integration, GaussKronrodLinear) {
    auto f = [](double x) { return 2.0 * x + 1.0; };
    double a = 0;
    double b = 2;

    double result = integration::gauss_kronrod_61(f, a, b, eps_abs, eps_rel, max_intervals);

    ASSERT_NEAR(6.0, result, eps_rel);
}

TEST(Integration, GaussKronrodSquare) {
    auto f = [](double x) { return -x * x + 1.0; };
    double a = -1;
    double b = 1;

    double result = integration::gauss_kronrod_61(f, a, b, eps_abs, eps_rel, max_intervals);

    ASSERT_NEAR(4.0 / 3.0, result, eps_rel);
}

TEST(Integration, GaussKronrodSin) {
    auto f = [](double x) { return std::sin(x); };
    double a = 0;
    double b = std::numbers::pi;

    double result = integration::gauss_kronrod_61(f, a, b, eps_abs, eps_rel, max_intervals);

    ASSERT_NEAR(2.0, result, eps_rel);
}

TEST(Integration, GaussKronrodAbs) {
    auto f = [](double x) { return std::abs(x - 0.3); };
    double a = 0;
    double b = 1;

    double result = integration::gauss_kronrod_61(f, a, b, eps_abs, eps_rel, max_intervals);

    ASSERT_NEAR(0.29, result, eps_rel);
}

TEST(Integration, GaussKronrodSqrt) {
    auto f = [](double x) { return std::sqrt(x); };
    double a = 0;
    double b = 1;

    double result = integration::gauss_kronrod_61(f, a, b, eps_abs, eps_rel, max_intervals);

    ASSERT_NEAR(2.0 / 3.0, result, eps_rel);
}

TEST(Integration, GaussKronrodLog) {
    auto f = [](double x) { return std::log(x); };
    double a = 1.0e-5;
    double b = 1;

    double result = integration::gauss_kronrod_61(f, a, b, eps_abs, eps_rel, max_intervals);

    ASSERT_NEAR(-0.999874870746, result, eps_rel);
}

TEST(Integration, GaussKronrodOscillations) {
    auto f = [](double x) { return std::sin(20 * x); };
    double a = 0;
    double b = std::numbers::pi;

    double result = integration::gauss_kronrod_61(f, a, b, eps_abs, eps_rel, max_intervals);

    ASSERT_NEAR(0.0, result, eps_rel);
}

TEST(Integration, GaussKronrodSharpPeak) {
    auto f = [](double x) { return 1.0 / (1.0 + 1000.0 * (x - 0.5) * (x - 0.5)); };
    double a = 0;
    double b = 1;

    double result = integration::gauss_kronrod_61(f, a, b, eps_abs, eps_rel, max_intervals);

    ASSERT_NEAR(0.0953512032278, result, eps_rel);
}

TEST(Integration, GaussKronrodStep) {
    auto f = [](double x) { return (x < 0.5) ? 0.0 : 1.0; };
    double a = 0;
    double b = 1;

    double result = integration::gauss_kronrod_61(f, a, b, eps_abs, eps_rel, max_intervals);

    ASSERT_NEAR(0.5, result, eps_rel);
}

TEST(Integration, GaussKronrodNotConverged) {
    auto f = [](double x) { return std::sqrt(std::abs(x - 0.3)); };

    EXPECT_THROW({ integration::gauss_kronrod_61(f, 0.0, 1.0, 1.0e-14, 0.0, 5); }, std::runtime_error);
}

namespace {

/**
 * Integral of exp(-a (x - b)^2) over [low, high].
 */
double gaussian_integral(double a, double b, double low, double high) {
    const double s = std::sqrt(a);
    return 0.5 * std::sqrt(std::numbers::pi / a) * (std::erf(s * (high - b)) - std::erf(s * (low - b)));
}

}; /* namespace */

/**
 * Tests that a polynomial is integrated exactly by the seed interval alone.
 */
TEST(Integration, PolynomialNeedsNoSubdivision) {
    auto f = [](double x) { return LaneArray({3}, {1.0, x * x, x * x * x * x * x}); };

    auto result = integration::integrate(f, -1.0, 2.0);

    ASSERT_EQ(Status::converged, result.status);
    ASSERT_EQ(61, result.evaluations_used);
    ASSERT_EQ(1, result.intervals_used);
    ASSERT_NEAR(3.0, result.estimate[0], 1.0e-14);
    ASSERT_NEAR(3.0, result.estimate[1], 1.0e-14);
    ASSERT_NEAR(10.5, result.estimate[2], 1.0e-13);
}

/**
 * Tests Gaussians of three widths over [-1, 3] in one run.
 */
TEST(Integration, GaussianLanes) {
    ndarray::NDArray<double, 1> a({3}, {1.0, 2.0, 3.0});

    auto f = [](double x, const ndarray::NDArray<double, 1> &a) {
        ndarray::NDArray<double, 1> values({3});
        for (int i = 0; i < 3; ++i) {
            values[i] = std::exp(-a[i] * x * x);
        }
        return values;
    };

    for (auto rule : {integration::RuleKind::gauss_kronrod_61, integration::RuleKind::gauss_kronrod_15}) {
        integration::Options options;
        options.rule = rule;

        auto result = integration::integrate<1>(f, -1.0, 3.0, a, options);

        ASSERT_EQ(Status::converged, result.status);
        for (int i = 0; i < 3; ++i) {
            ASSERT_NEAR(gaussian_integral(a[i], 0.0, -1.0, 3.0), result.estimate[i], 1.0e-6);
            ASSERT_LE(result.error[i], 1.0e-8);
        }
    }
}

/**
 * Tests a 19x100 grid of shifted Gaussians against the analytic values and single-lane runs.
 */
TEST(Integration, ShiftedGaussianGrid) {
    constexpr int n_a = 19;
    constexpr int n_b = 100;

    ndarray::NDArray<double, 2> a({n_a, n_b});
    ndarray::NDArray<double, 2> b({n_a, n_b});
    for (int i = 0; i < n_a; ++i) {
        for (int j = 0; j < n_b; ++j) {
            a(i, j) = 1.0 + i;
            b(i, j) = -2.0 + 6.0 * j / (n_b - 1);
        }
    }

    auto f = [&b](double x, const ndarray::NDArray<double, 2> &a) {
        ndarray::NDArray<double, 2> values(a.shape());
        for (int i = 0; i < n_a; ++i) {
            for (int j = 0; j < n_b; ++j) {
                const double d = x - b(i, j);
                values(i, j) = std::exp(-a(i, j) * d * d);
            }
        }
        return values;
    };

    integration::Options options;
    options.abs_tol = 1.0e-10;
    options.rel_tol = 1.0e-8;

    auto result = integration::integrate<2>(f, -1.0, 3.0, a, options);

    ASSERT_EQ(Status::converged, result.status);
    ASSERT_EQ(n_a, result.estimate.shape()[0]);
    ASSERT_EQ(n_b, result.estimate.shape()[1]);
    ASSERT_LE(result.evaluations_used, options.max_evaluations);

    for (int i = 0; i < n_a; ++i) {
        for (int j = 0; j < n_b; ++j) {
            const double reference = gaussian_integral(a(i, j), b(i, j), -1.0, 3.0);
            const double tolerance = std::max(options.abs_tol, options.rel_tol * std::abs(reference));
            ASSERT_NEAR(reference, result.estimate(i, j), tolerance) << "a=" << a(i, j) << " b=" << b(i, j);
        }
    }

    for (int i : {0, 9, 18}) {
        for (int j : {0, 50, 99}) {
            auto lane = [&a, &b, i, j](double x) {
                const double d = x - b(i, j);
                return LaneArray({1}, {std::exp(-a(i, j) * d * d)});
            };
            auto single = integration::integrate(lane, -1.0, 3.0, options);
            const double tolerance = std::max(options.abs_tol, options.rel_tol * std::abs(single.estimate[0]));
            ASSERT_NEAR(single.estimate[0], result.estimate(i, j), 2.0 * tolerance);
        }
    }
}

/**
 * Tests Gaussians cut off at |x| <= a over the whole real line.
 */
TEST(Integration, CutOffGaussianInfiniteDomain) {
    ndarray::NDArray<double, 1> a({19});
    for (int i = 0; i < 19; ++i) {
        a[i] = 1.0 + i;
    }

    auto f = [](double x, const ndarray::NDArray<double, 1> &a) {
        ndarray::NDArray<double, 1> values({static_cast<int>(a.size())});
        for (unsigned int i = 0; i < a.size(); ++i) {
            values[i] = (-a[i] <= x && x <= a[i]) ? std::exp(-a[i] * x * x) : 0.0;
        }
        return values;
    };

    for (auto rule : {integration::RuleKind::gauss_kronrod_15, integration::RuleKind::gauss_kronrod_61}) {
        integration::Options options;
        options.abs_tol = 1.0e-8;
        options.rel_tol = 0.0;
        options.max_evaluations = 400000;
        options.max_intervals = 20000;
        options.rule = rule;

        auto result = integration::integrate<1>(f, -inf, inf, a, options);

        ASSERT_EQ(Status::converged, result.status);
        for (int i = 0; i < 19; ++i) {
            const double reference = std::sqrt(std::numbers::pi / a[i]) * std::erf(std::pow(a[i], 1.5));
            ASSERT_NEAR(reference, result.estimate[i], options.abs_tol) << "a=" << a[i];
        }
    }
}

TEST(Integration, SemiInfiniteDomains) {
    auto upper = integration::integrate(
        [](double x) { return LaneArray({2}, {std::exp(-x), 1.0 / (1.0 + x * x)}); }, 0.0, inf);
    auto lower = integration::integrate(
        [](double x) { return LaneArray({2}, {std::exp(x), 1.0 / (1.0 + x * x)}); }, -inf, 0.0);

    ASSERT_EQ(Status::converged, upper.status);
    ASSERT_NEAR(1.0, upper.estimate[0], 1.0e-8);
    ASSERT_NEAR(std::numbers::pi / 2.0, upper.estimate[1], 1.0e-8);
    ASSERT_EQ(Status::converged, lower.status);
    ASSERT_NEAR(1.0, lower.estimate[0], 1.0e-8);
    ASSERT_NEAR(std::numbers::pi / 2.0, lower.estimate[1], 1.0e-8);
}

TEST(Integration, DoublyInfiniteDomain) {
    auto f = [](double x) { return LaneArray({2}, {std::exp(-x * x), 1.0 / (1.0 + x * x)}); };

    auto result = integration::integrate(f, -inf, inf);

    ASSERT_EQ(Status::converged, result.status);
    ASSERT_NEAR(std::sqrt(std::numbers::pi), result.estimate[0], 1.0e-8);
    ASSERT_NEAR(std::numbers::pi, result.estimate[1], 1.0e-8);
}

/**
 * Tests that swapping the bounds negates the estimate.
 */
TEST(Integration, DomainSwap) {
    auto f = [](double x) { return LaneArray({3}, {std::exp(-x * x), std::exp(-2.0 * x * x), std::cos(x)}); };

    auto forward = integration::integrate(f, 1.0, 3.0);
    auto backward = integration::integrate(f, 3.0, 1.0);

    for (int i = 0; i < 3; ++i) {
        ASSERT_EQ(-forward.estimate[i], backward.estimate[i]);
        ASSERT_EQ(forward.error[i], backward.error[i]);
    }

    auto swapped = integration::integrate([](double x) { return LaneArray({1}, {std::exp(-x * x)}); }, inf, -inf);

    ASSERT_NEAR(-std::sqrt(std::numbers::pi), swapped.estimate[0], 1.0e-8);
}

/**
 * Tests that zero integrals converge through the roundoff floor with a purely relative tolerance.
 */
TEST(Integration, ZeroIntegralRelativeTolerance) {
    auto f = [](double x) { return LaneArray({2}, {std::sin(x), std::sin(20.0 * x)}); };

    for (auto rule : {integration::RuleKind::gauss_kronrod_15, integration::RuleKind::gauss_kronrod_61}) {
        integration::Options options;
        options.abs_tol = 0.0;
        options.rel_tol = 1.0e-8;
        options.rule = rule;

        auto result = integration::integrate(f, -std::numbers::pi, std::numbers::pi, options);

        ASSERT_EQ(Status::converged, result.status);
        ASSERT_NEAR(0.0, result.estimate[0], 1.0e-12);
        ASSERT_NEAR(0.0, result.estimate[1], 1.0e-12);
    }
}

/**
 * Tests that the summed error never grows on a smooth integrand.
 */
TEST(Integration, MonotoneErrorReduction) {
    auto f = [](double x) {
        return LaneArray({3}, {std::exp(-x * x), std::exp(-2.0 * x * x), std::exp(-3.0 * x * x)});
    };

    std::vector<integration::StepReport> steps;

    integration::Options options;
    options.abs_tol = 0.0;
    options.rel_tol = 1.0e-12;
    options.rule = integration::RuleKind::gauss_kronrod_15;
    options.on_step = [&steps](const integration::StepReport &report) { steps.push_back(report); };

    auto result = integration::integrate(f, -1.0, 3.0, options);

    ASSERT_EQ(Status::converged, result.status);
    ASSERT_FALSE(steps.empty());

    for (std::size_t i = 0; i < steps.size(); ++i) {
        ASSERT_EQ(static_cast<int>(i) + 1, steps[i].step);
        ASSERT_EQ(15 * (1 + 2 * steps[i].step), steps[i].evaluations_used);
        ASSERT_EQ(steps[i].step + 1, steps[i].intervals_used);
        if (i > 0) {
            ASSERT_LE(steps[i].total_error, steps[i - 1].total_error * (1.0 + 1.0e-12));
        }
    }
    ASSERT_EQ(result.evaluations_used, steps.back().evaluations_used);
}

/**
 * Tests that a converged result satisfies the tolerance in every lane.
 */
TEST(Integration, ConvergedImpliesTolerance) {
    auto f = [](double x) {
        return LaneArray({4}, {std::sqrt(x), std::log(x + 1.0e-3), 1.0 / (1.0 + 1000.0 * (x - 0.5) * (x - 0.5)), 2.0});
    };

    integration::Options options;
    options.abs_tol = 1.0e-9;
    options.rel_tol = 1.0e-7;

    auto result = integration::integrate(f, 0.0, 1.0, options);

    ASSERT_EQ(Status::converged, result.status);
    for (int i = 0; i < 4; ++i) {
        ASSERT_LE(result.error[i], std::max(options.abs_tol, options.rel_tol * std::abs(result.estimate[i])));
    }
}

/**
 * Tests that a relative tolerance below roundoff is reported as exhausted, not converged.
 */
TEST(Integration, ToleranceBelowRoundoff) {
    auto f = [](double x) { return LaneArray({1}, {std::exp(x)}); };

    for (auto rule : {integration::RuleKind::gauss_kronrod_15, integration::RuleKind::gauss_kronrod_61}) {
        integration::Options options;
        options.abs_tol = 0.0;
        options.rel_tol = 1.0e-15;
        options.rule = rule;

        auto result = integration::integrate(f, 0.0, 1.0, options);

        const double tolerance = options.rel_tol * std::abs(result.estimate[0]);
        ASSERT_EQ(Status::exhausted, result.status);
        ASSERT_GT(result.error[0], tolerance);
        ASSERT_LE(result.evaluations_used, options.max_evaluations);
        ASSERT_NEAR(std::numbers::e - 1.0, result.estimate[0], 1.0e-13);
    }
}

/**
 * Tests that the evaluation budget stops the run before it is exceeded.
 */
TEST(Integration, EvaluationBudget) {
    auto f = [](double x) { return LaneArray({1}, {std::sqrt(std::abs(x - 0.3))}); };

    integration::Options options;
    options.abs_tol = 1.0e-14;
    options.rel_tol = 0.0;
    options.max_evaluations = 1000;
    options.rule = integration::RuleKind::gauss_kronrod_15;

    auto result = integration::integrate(f, 0.0, 1.0, options);

    ASSERT_EQ(Status::exhausted, result.status);
    ASSERT_LE(result.evaluations_used, 1000);
    ASSERT_GT(result.evaluations_used + 30, 1000);
    ASSERT_NEAR(0.2 * std::sqrt(0.3) + 2.0 / 3.0 * std::pow(0.7, 1.5), result.estimate[0], 1.0e-6);
}

TEST(Integration, IntervalBudget) {
    auto f = [](double x) { return LaneArray({1}, {std::sqrt(std::abs(x - 0.3))}); };

    integration::Options options;
    options.abs_tol = 1.0e-14;
    options.rel_tol = 0.0;
    options.max_intervals = 10;
    options.rule = integration::RuleKind::gauss_kronrod_15;

    auto result = integration::integrate(f, 0.0, 1.0, options);

    ASSERT_EQ(Status::exhausted, result.status);
    ASSERT_EQ(10, result.intervals_used);
    ASSERT_EQ(15 * 19, result.evaluations_used);
}

TEST(Integration, ZeroWidthDomain) {
    int calls = 0;
    auto f = [&calls](double x) {
        ++calls;
        return LaneArray({2}, {x, x});
    };

    auto result = integration::integrate(f, 1.5, 1.5);

    ASSERT_EQ(0, calls);
    ASSERT_EQ(Status::converged, result.status);
    ASSERT_EQ(0, result.evaluations_used);
    ASSERT_EQ(0, result.estimate.size());

    ndarray::NDArray<double, 2> params({2, 2});
    auto shaped = integration::integrate<2>(
        [](double, const ndarray::NDArray<double, 2> &p) { return p; }, 1.5, 1.5, params);

    ASSERT_EQ(4, shaped.estimate.size());
    ASSERT_EQ(0.0, shaped.estimate.max_abs());
}

/**
 * Tests the lane shape inferred from the first call.
 */
TEST(Integration, InferredShape) {
    std::function<ndarray::NDArray<double, 2>(double)> f = [](double x) {
        return ndarray::NDArray<double, 2>({2, 3}, {1.0, x, x * x, 2.0, 2.0 * x, 2.0 * x * x});
    };

    auto result = integration::integrate_shaped<2>(f, 0.0, 3.0);

    ASSERT_EQ(Status::converged, result.status);
    ASSERT_EQ(2, result.estimate.shape()[0]);
    ASSERT_EQ(3, result.estimate.shape()[1]);
    ASSERT_NEAR(4.5, result.estimate(0, 1), 1.0e-13);
    ASSERT_NEAR(18.0, result.estimate(1, 2), 1.0e-13);
}

TEST(Integration, InferredShapeMismatch) {
    std::function<ndarray::NDArray<double, 2>(double)> f = [](double x) {
        return x < 0.5 ? ndarray::NDArray<double, 2>({2, 3}) : ndarray::NDArray<double, 2>({3, 2});
    };

    EXPECT_THROW({ integration::integrate_shaped<2>(f, 0.0, 1.0); }, integration::ShapeMismatchError);
}

TEST(Integration, ParamsShapeMismatch) {
    ndarray::NDArray<double, 1> params({3});
    auto f = [](double, const ndarray::NDArray<double, 1> &) { return ndarray::NDArray<double, 1>({2}); };

    EXPECT_THROW({ integration::integrate<1>(f, 0.0, 1.0, params); }, integration::ShapeMismatchError);
}

TEST(Integration, LaneCountChanges) {
    auto f = [](double x) { return x < 0.5 ? LaneArray({1}) : LaneArray({2}); };

    EXPECT_THROW({ integration::integrate(f, 0.0, 1.0); }, integration::ShapeMismatchError);
}

TEST(Integration, IntegrandThrows) {
    auto f = [](double x) -> LaneArray {
        if (x > 2.0) {
            throw std::out_of_range("table lookup");
        }
        return LaneArray({1}, {x});
    };

    EXPECT_THROW({ integration::integrate(f, 0.0, 3.0); }, integration::IntegrandError);
}

TEST(Integration, NonFiniteIntegrand) {
    /* the first node is the midpoint */
    auto f = [](double x) { return LaneArray({1}, {1.0 / (x - 0.5)}); };

    EXPECT_THROW({ integration::integrate(f, 0.0, 1.0); }, integration::IntegrandError);
}

TEST(Integration, NanBound) {
    auto f = [](double x) { return LaneArray({1}, {x}); };
    const double nan = std::numeric_limits<double>::quiet_NaN();

    EXPECT_THROW({ integration::integrate(f, nan, 1.0); }, integration::DomainError);
    EXPECT_THROW({ integration::integrate(f, 0.0, nan); }, integration::DomainError);
}

TEST(Integration, InvalidOptions) {
    auto f = [](double x) { return LaneArray({1}, {x}); };

    integration::Options negative_tol;
    negative_tol.abs_tol = -1.0;
    EXPECT_THROW({ integration::integrate(f, 0.0, 1.0, negative_tol); }, std::invalid_argument);

    integration::Options small_budget;
    small_budget.max_evaluations = 60;
    EXPECT_THROW({ integration::integrate(f, 0.0, 1.0, small_budget); }, std::invalid_argument);

    integration::Options no_intervals;
    no_intervals.max_intervals = 0;
    EXPECT_THROW({ integration::integrate(f, 0.0, 1.0, no_intervals); }, std::invalid_argument);

    integration::Options no_resync;
    no_resync.resync_interval = 0;
    EXPECT_THROW({ integration::integrate(f, 0.0, 1.0, no_resync); }, std::invalid_argument);
}

/**
 * Tests that frequent resynchronisation of the running sums does not change the result beyond roundoff.
 */
TEST(Integration, ResyncInterval) {
    auto f = [](double x) { return LaneArray({2}, {std::sqrt(x), std::exp(-x)}); };

    integration::Options options;
    options.rule = integration::RuleKind::gauss_kronrod_15;
    auto reference = integration::integrate(f, 0.0, 1.0, options);

    options.resync_interval = 1;
    auto resynced = integration::integrate(f, 0.0, 1.0, options);

    ASSERT_EQ(reference.evaluations_used, resynced.evaluations_used);
    ASSERT_NEAR(reference.estimate[0], resynced.estimate[0], 1.0e-14);
    ASSERT_NEAR(reference.estimate[1], resynced.estimate[1], 1.0e-14);
}

TEST(Integration, StatusName) {
    ASSERT_EQ("converged", integration::status_name(Status::converged));
    ASSERT_EQ("exhausted", integration::status_name(Status::exhausted));
}
