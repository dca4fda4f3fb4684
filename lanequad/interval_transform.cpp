/*
 * Copyright (c) 2025 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>

#include "lanequad/interval_transform.hpp"

namespace integration {

IntervalTransform::IntervalTransform(double low, double high) : origin_(0.0) {
    if (!(low < high)) {
        throw std::invalid_argument("Transform requires low < high");
    }

    const bool low_inf = std::isinf(low);
    const bool high_inf = std::isinf(high);

    if (low_inf && high_inf) {
        kind_ = DomainKind::both_infinite;
        low_ = -1.0;
        high_ = 1.0;
    } else if (high_inf) {
        kind_ = DomainKind::upper_infinite;
        origin_ = low;
        low_ = 0.0;
        high_ = 1.0;
    } else if (low_inf) {
        kind_ = DomainKind::lower_infinite;
        origin_ = high;
        low_ = 0.0;
        high_ = 1.0;
    } else {
        kind_ = DomainKind::finite;
        low_ = low;
        high_ = high;
    }
}

double IntervalTransform::to_x(double t) const noexcept {
    switch (kind_) {
    case DomainKind::upper_infinite:
        return origin_ + t / (1.0 - t);
    case DomainKind::lower_infinite:
        return origin_ - t / (1.0 - t);
    case DomainKind::both_infinite:
        return t / ((1.0 - t) * (1.0 + t));
    default:
        return t;
    }
}

double IntervalTransform::jacobian(double t) const noexcept {
    switch (kind_) {
    case DomainKind::upper_infinite:
    case DomainKind::lower_infinite: {
        const double s = 1.0 - t;
        return 1.0 / (s * s);
    }
    case DomainKind::both_infinite: {
        const double s = (1.0 - t) * (1.0 + t);
        return (1.0 + t * t) / (s * s);
    }
    default:
        return 1.0;
    }
}

double IntervalTransform::clamp(double t) const noexcept {
    switch (kind_) {
    case DomainKind::upper_infinite:
    case DomainKind::lower_infinite:
        return std::min(t, std::nextafter(1.0, 0.0));
    case DomainKind::both_infinite:
        return std::clamp(t, std::nextafter(-1.0, 0.0), std::nextafter(1.0, 0.0));
    default:
        return t;
    }
}

LaneFunction IntervalTransform::wrap(LaneFunction f) const {
    if (kind_ == DomainKind::finite) {
        return f;
    }

    return [transform = *this, f = std::move(f)](double t) {
        const double u = transform.clamp(t);
        /* the integrand may hand out a buffer it keeps, so scale a copy */
        LaneArray values = f(transform.to_x(u)).copy();
        values *= transform.jacobian(u);
        return values;
    };
}

}; /* namespace integration */
