/*
 * Copyright (c) 2025 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <vector>

#include "lanequad/integration.hpp"
#include "lanequad/rule_evaluator.hpp"

namespace integration {

/**
 * @brief One independent integration problem.
 */
struct Problem {
    LaneFunction f;
    double low, high;
    Options options;
};

/**
 * @brief Integrate independent problems on a pool of worker threads.
 *
 * Problem indices are fed to the workers through a bounded queue; every problem runs as its own integrate() call with
 * its own interval pool and accumulator. Integrands of different problems may run concurrently and must not share
 * mutable state.
 *
 * @param problems  Problems to integrate.
 * @param n_threads Number of worker threads.
 *
 * @return Results in the order of problems.
 *
 * @throws std::invalid_argument if n_threads < 1.
 * @throws The exception of the first failed problem in problem order, after all workers have joined.
 */
std::vector<Result<1>> integrate_batch(const std::vector<Problem> &problems, int n_threads);

}; /* namespace integration */
