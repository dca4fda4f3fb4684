/*
 * Copyright (c) 2025 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <exception>
#include <functional>
#include <optional>
#include <stdexcept>
#include <thread>
#include <vector>

#include "spdlog/spdlog.h"

#include "lanequad/batch.hpp"
#include "lanequad/utils.hpp"

namespace integration {

/**
 * @brief Take problem indices from the queue until it is closed and drained.
 */
static void run_worker(const std::vector<Problem> &problems,
                       utils::ConcurrentQueue<std::size_t> &queue,
                       std::vector<std::optional<Result<1>>> &results,
                       std::vector<std::exception_ptr> &failures);

std::vector<Result<1>> integrate_batch(const std::vector<Problem> &problems, int n_threads) {
    if (n_threads < 1) {
        throw std::invalid_argument("Number of threads must be positive");
    }

    auto start = std::chrono::system_clock::now();

    const int n_workers = std::min(n_threads, static_cast<int>(std::max<std::size_t>(problems.size(), 1)));

    spdlog::info("Integrating {} problems on {} threads", problems.size(), n_workers);

    /* each slot is written by exactly one worker */
    std::vector<std::optional<Result<1>>> results(problems.size());
    std::vector<std::exception_ptr> failures(problems.size());

    utils::ConcurrentQueue<std::size_t> queue(2 * n_workers);

    std::vector<std::thread> workers;
    workers.reserve(n_workers);
    for (int i = 0; i < n_workers; ++i) {
        workers.emplace_back(run_worker, std::cref(problems), std::ref(queue), std::ref(results), std::ref(failures));
    }

    for (std::size_t i = 0; i < problems.size(); ++i) {
        queue.enqueue(i);
    }
    queue.close();

    for (auto &worker : workers) {
        worker.join();
    }

    for (std::size_t i = 0; i < problems.size(); ++i) {
        if (failures[i]) {
            spdlog::error("Problem {} failed", i);
            std::rethrow_exception(failures[i]);
        }
    }

    std::vector<Result<1>> ordered;
    ordered.reserve(problems.size());
    for (auto &result : results) {
        ordered.push_back(std::move(*result));
    }

    std::chrono::duration<double> elapsed_seconds = std::chrono::system_clock::now() - start;
    spdlog::info("Batch done in {:.3f}s", elapsed_seconds.count());

    return ordered;
}

void run_worker(const std::vector<Problem> &problems,
                utils::ConcurrentQueue<std::size_t> &queue,
                std::vector<std::optional<Result<1>>> &results,
                std::vector<std::exception_ptr> &failures) {
    while (auto index = queue.dequeue()) {
        const Problem &problem = problems[*index];
        try {
            results[*index] = integrate(problem.f, problem.low, problem.high, problem.options);
        } catch (...) {
            failures[*index] = std::current_exception();
        }
    }
}

}; /* namespace integration */
