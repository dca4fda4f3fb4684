/*
 * Copyright (c) 2025 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <cmath>
#include <limits>
#include <string>

#include "absl/strings/numbers.h"
#include "fmt/format.h"

#include "lanequad/flags.hpp"

namespace spdlog::level {

bool AbslParseFlag(absl::string_view text, level_enum *level, std::string *error) {
    if (text == "trace") {
        *level = trace;
        return true;
    }
    if (text == "debug") {
        *level = debug;
        return true;
    }
    if (text == "info") {
        *level = info;
        return true;
    }
    if (text == "warn") {
        *level = warn;
        return true;
    }
    if (text == "err") {
        *level = err;
        return true;
    }
    if (text == "critical") {
        *level = critical;
        return true;
    }
    if (text == "off") {
        *level = off;
        return true;
    }
    *error = fmt::format("Invalid verbosity {}", std::string(text));
    return false;
}

std::string AbslUnparseFlag(level_enum level) {
    switch (level) {
    case trace:
        return "trace";
    case debug:
        return "debug";
    case info:
        return "info";
    case warn:
        return "warn";
    case err:
        return "err";
    case critical:
        return "critical";
    case off:
        return "off";
    default:
        return "unknown";
    }
}

}; /* namespace spdlog::level */

namespace integration {

bool AbslParseFlag(absl::string_view text, RuleKind *rule, std::string *error) {
    if (text == "gk15") {
        *rule = RuleKind::gauss_kronrod_15;
        return true;
    }
    if (text == "gk61") {
        *rule = RuleKind::gauss_kronrod_61;
        return true;
    }
    *error = fmt::format("Invalid quadrature rule {}, expected gk15 or gk61", std::string(text));
    return false;
}

std::string AbslUnparseFlag(RuleKind rule) { return rule_name(rule); }

bool parse_bound(absl::string_view text, double *bound, std::string *error) {
    constexpr double inf = std::numeric_limits<double>::infinity();

    if (text == "inf" || text == "+inf") {
        *bound = inf;
        return true;
    }
    if (text == "-inf") {
        *bound = -inf;
        return true;
    }

    double value;
    if (!absl::SimpleAtod(text, &value) || std::isnan(value)) {
        *error = fmt::format("Invalid integration bound {}", std::string(text));
        return false;
    }

    *bound = value;
    return true;
}

}; /* namespace integration */
