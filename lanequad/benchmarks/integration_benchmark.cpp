/*
 * Copyright (c) 2025 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include "lanequad/integration.hpp"

#include <benchmark/benchmark.h>

#include <cmath>
#include <limits>

#include "spdlog/spdlog.h"

#include "lanequad/ndarray.hpp"

constexpr double inf = std::numeric_limits<double>::infinity();

static ndarray::NDArray<double, 1> make_widths(int n);

static ndarray::NDArray<double, 1> cutoff_gaussian(double x, const ndarray::NDArray<double, 1> &a);

static integration::Options make_options(integration::RuleKind rule);

/**
 * All lanes share one subdivision schedule.
 */
static void BM_BatchedLanes(benchmark::State &state) {
    auto a = make_widths(static_cast<int>(state.range(0)));
    auto options = make_options(integration::RuleKind::gauss_kronrod_15);

    for (auto _ : state) {
        auto result = integration::integrate<1>(cutoff_gaussian, -inf, inf, a, options);
        benchmark::DoNotOptimize(result.estimate.data());
    }
}

/**
 * One run per lane.
 */
static void BM_PerLane(benchmark::State &state) {
    auto a = make_widths(static_cast<int>(state.range(0)));
    auto options = make_options(integration::RuleKind::gauss_kronrod_15);

    for (auto _ : state) {
        for (unsigned int i = 0; i < a.size(); ++i) {
            ndarray::NDArray<double, 1> lane({1}, {a[i]});
            auto result = integration::integrate<1>(cutoff_gaussian, -inf, inf, lane, options);
            benchmark::DoNotOptimize(result.estimate.data());
        }
    }
}

static void BM_Rule(benchmark::State &state) {
    auto a = make_widths(19);
    auto options = make_options(static_cast<integration::RuleKind>(state.range(0)));

    int evaluations = 0;
    for (auto _ : state) {
        auto result = integration::integrate<1>(cutoff_gaussian, -inf, inf, a, options);
        evaluations = result.evaluations_used;
        benchmark::DoNotOptimize(result.estimate.data());
    }
    state.counters["evaluations"] = evaluations;
}

ndarray::NDArray<double, 1> make_widths(int n) {
    ndarray::NDArray<double, 1> a({n});
    for (int i = 0; i < n; ++i) {
        a[i] = 1.0 + i;
    }
    return a;
}

ndarray::NDArray<double, 1> cutoff_gaussian(double x, const ndarray::NDArray<double, 1> &a) {
    ndarray::NDArray<double, 1> values({static_cast<int>(a.size())});
    for (unsigned int i = 0; i < a.size(); ++i) {
        if (std::abs(x) <= a[i]) {
            values[i] = std::exp(-a[i] * x * x);
        }
    }
    return values;
}

integration::Options make_options(integration::RuleKind rule) {
    integration::Options options;
    options.abs_tol = 1.0e-8;
    options.rel_tol = 0.0;
    options.max_evaluations = 400000;
    options.max_intervals = 20000;
    options.rule = rule;
    return options;
}

BENCHMARK(BM_BatchedLanes)->Arg(1)->Arg(4)->Arg(19);
BENCHMARK(BM_PerLane)->Arg(1)->Arg(4)->Arg(19);
BENCHMARK(BM_Rule)
    ->Arg(static_cast<int>(integration::RuleKind::gauss_kronrod_15))
    ->Arg(static_cast<int>(integration::RuleKind::gauss_kronrod_61));

int main(int argc, char **argv) {
    spdlog::set_level(spdlog::level::err);
    benchmark::Initialize(&argc, argv);
    if (benchmark::ReportUnrecognizedArguments(argc, argv)) {
        return 1;
    }
    benchmark::RunSpecifiedBenchmarks();
    benchmark::Shutdown();
    return 0;
}
