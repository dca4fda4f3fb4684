/*
 * Copyright (c) 2025 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <stdexcept>
#include <string>

namespace integration {

/**
 * @brief Base class of errors that abort an integration run without a result.
 */
class IntegrationError : public std::runtime_error {
public:
    explicit IntegrationError(const std::string &what) : std::runtime_error(what) {}
};

/**
 * @brief The integrand threw or returned a non-finite value.
 *
 * When the integrand itself threw, the original exception is nested and can be retrieved with
 * std::rethrow_if_nested.
 */
class IntegrandError : public IntegrationError {
public:
    explicit IntegrandError(const std::string &what) : IntegrationError(what) {}
};

/**
 * @brief The integrand returned an array whose lane shape differs from the declared or inferred one.
 */
class ShapeMismatchError : public IntegrationError {
public:
    explicit ShapeMismatchError(const std::string &what) : IntegrationError(what) {}
};

/**
 * @brief The integration bounds do not describe a domain (NaN bound).
 */
class DomainError : public IntegrationError {
public:
    explicit DomainError(const std::string &what) : IntegrationError(what) {}
};

}; /* namespace integration */
