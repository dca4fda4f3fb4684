/*
 * Copyright (c) 2025 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <chrono>
#include <cmath>
#include <string>

#include "absl/flags/flag.h"
#include "absl/flags/parse.h"
#include "absl/flags/usage.h"
#include "spdlog/spdlog.h"

#include "lanequad/flags.hpp"
#include "lanequad/integration.hpp"
#include "lanequad/ndarray.hpp"

/* Define cli args */
ABSL_FLAG(double, a_min, 1.0, "Smallest Gaussian width parameter a");
ABSL_FLAG(double, a_max, 19.0, "Largest Gaussian width parameter a");
ABSL_FLAG(int, n_a, 19, "Number of lanes, a is spaced linearly in [a_min, a_max]");
ABSL_FLAG(double, b, 0.0, "Shift of the Gaussian");
ABSL_FLAG(std::string, low, "-inf", "Lower integration bound, may be -inf");
ABSL_FLAG(std::string, high, "inf", "Upper integration bound, may be inf");
ABSL_FLAG(bool, cutoff, false, "Restrict the integrand to |x| <= a");
ABSL_FLAG(double, abs_tol, consts::default_abs_tol, "Absolute error tolerance");
ABSL_FLAG(double, rel_tol, consts::default_rel_tol, "Relative error tolerance");
ABSL_FLAG(int, max_evaluations, consts::default_max_evaluations, "Maximum number of integrand calls");
ABSL_FLAG(int, max_intervals, consts::default_max_intervals, "Maximum number of subintervals");
ABSL_FLAG(integration::RuleKind, rule, integration::RuleKind::gauss_kronrod_61, "Quadrature rule (gk15, gk61)");
ABSL_FLAG(spdlog::level::level_enum, verbosity, spdlog::level::info, "Logging verbosity");

int main(int argc, char *argv[]) {
    absl::SetProgramUsageMessage("Integrates exp(-a (x - b)^2) for a range of a in one adaptive run");
    absl::ParseCommandLine(argc, argv);

    auto a_min = absl::GetFlag(FLAGS_a_min);
    auto a_max = absl::GetFlag(FLAGS_a_max);
    auto n_a = absl::GetFlag(FLAGS_n_a);
    auto b = absl::GetFlag(FLAGS_b);
    auto cutoff = absl::GetFlag(FLAGS_cutoff);
    auto verbosity = absl::GetFlag(FLAGS_verbosity);

    spdlog::set_level(verbosity);

    double low, high;
    std::string error;
    if (!integration::parse_bound(absl::GetFlag(FLAGS_low), &low, &error) ||
        !integration::parse_bound(absl::GetFlag(FLAGS_high), &high, &error)) {
        spdlog::error("{}", error);
        return 1;
    }
    if (n_a < 1) {
        spdlog::error("n_a must be positive");
        return 1;
    }

    integration::Options options;
    options.abs_tol = absl::GetFlag(FLAGS_abs_tol);
    options.rel_tol = absl::GetFlag(FLAGS_rel_tol);
    options.max_evaluations = absl::GetFlag(FLAGS_max_evaluations);
    options.max_intervals = absl::GetFlag(FLAGS_max_intervals);
    options.rule = absl::GetFlag(FLAGS_rule);

    spdlog::info("Parameters:");
    spdlog::info("\ta: [{}, {}] ({} lanes)", a_min, a_max, n_a);
    spdlog::info("\tb: {}", b);
    spdlog::info("\tdomain: [{}, {}]", low, high);
    spdlog::info("\tcutoff: {}", cutoff);
    spdlog::info("\tabs_tol: {}, rel_tol: {}", options.abs_tol, options.rel_tol);
    spdlog::info("\tmax_evaluations: {}, max_intervals: {}", options.max_evaluations, options.max_intervals);
    spdlog::info("\trule: {}", integration::rule_name(options.rule));

    ndarray::NDArray<double, 1> a({n_a});
    for (int i = 0; i < n_a; ++i) {
        a[i] = (n_a == 1) ? a_min : a_min + (a_max - a_min) * i / (n_a - 1);
    }

    auto gaussian = [b, cutoff](double x, const ndarray::NDArray<double, 1> &params) {
        ndarray::NDArray<double, 1> values({static_cast<int>(params.size())});
        for (unsigned int i = 0; i < params.size(); ++i) {
            if (cutoff && std::abs(x) > params[i]) {
                continue;
            }
            values[i] = std::exp(-params[i] * (x - b) * (x - b));
        }
        return values;
    };

    auto start = std::chrono::system_clock::now();

    integration::Result<1> result;
    try {
        result = integration::integrate<1>(gaussian, low, high, a, options);
    } catch (const std::exception &e) {
        spdlog::error("Integration failed: {}", e.what());
        return 1;
    }

    std::chrono::duration<double> elapsed_seconds = std::chrono::system_clock::now() - start;

    for (int i = 0; i < n_a; ++i) {
        spdlog::info("a={:8.4f} estimate={:.15e} error={:.3e}", a[i], result.estimate[i], result.error[i]);
    }
    spdlog::info("Status {}, {} evaluations, {} intervals, {:.3f}s",
                 integration::status_name(result.status),
                 result.evaluations_used,
                 result.intervals_used,
                 elapsed_seconds.count());

    return result.status == integration::Status::converged ? 0 : 2;
}
