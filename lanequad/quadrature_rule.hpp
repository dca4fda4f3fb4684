/*
 * Copyright (c) 2025 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <span>
#include <string>

namespace integration {

/**
 * @brief Embedded Gauss-Kronrod pairs available to the rule evaluator.
 */
enum class RuleKind {
    gauss_kronrod_15, /* 7-point Gauss embedded in 15-point Kronrod. */
    gauss_kronrod_61, /* 30-point Gauss embedded in 61-point Kronrod. */
};

/**
 * @brief Node and weight tables of an embedded Gauss-Kronrod pair on the reference interval [-1, 1].
 *
 * Only the non-negative half of the symmetric rule is stored. xgk is sorted in descending order and its last entry is
 * the center node 0. The Gauss nodes are xgk[1], xgk[3], ... and their weights are stored in the same order in wg;
 * when the Gauss rule has an odd number of nodes the center is one of them and its weight is the last entry of wg.
 */
struct QuadratureRule {
    RuleKind kind;
    const char *name;                /* Short name used on the command line. */
    int n_nodes;                     /* Number of Kronrod nodes, equal to integrand calls per interval. */
    int gauss_degree;                /* Polynomial exactness of the Gauss rule. */
    int kronrod_degree;              /* Polynomial exactness of the Kronrod rule. */
    std::span<const double> xgk;     /* Kronrod nodes in [0, 1). */
    std::span<const double> wgk;     /* Kronrod weights. */
    std::span<const double> wg;      /* Gauss weights. */
    bool gauss_center;               /* True if the center node belongs to the Gauss rule. */
};

/**
 * @brief Look up the tables of a rule.
 *
 * @param kind Rule to look up.
 *
 * @return Reference to a statically allocated rule description.
 *
 * @throws std::invalid_argument for an unknown rule kind.
 */
const QuadratureRule &get_rule(RuleKind kind);

/**
 * @brief Short name of a rule ("gk15", "gk61").
 */
std::string rule_name(RuleKind kind);

}; /* namespace integration */
