#pragma once

#include <cmath>
#include <string>
#include <vector>
#include "errors.hpp"

namespace grocery {
namespace validation {

/**
 * Require that a value is non-negative (zero or greater).
 */
template<typename T>
void require_non_negative(T value, const std::string& field_name = "value") {
    if (value < 0) {
        throw OrderRejectedError(field_name + " must be non-negative");
    }
}

/**
 * Require that a floating-point value is neither NaN nor infinite.
 */
inline void require_finite(double value, const std::string& field_name = "value") {
    if (!std::isfinite(value)) {
        throw OrderRejectedError(field_name + " must be a finite number");
    }
}

/**
 * Require that a string is not empty.
 */
inline void require_not_empty(const std::string& value, const std::string& field_name = "value") {
    if (value.empty()) {
        throw OrderRejectedError(field_name + " must not be empty");
    }
}

/**
 * Require that a collection is not empty.
 */
template<typename T>
void require_not_empty(const std::vector<T>& collection, const std::string& field_name = "collection") {
    if (collection.empty()) {
        throw OrderRejectedError(field_name + " must not be empty");
    }
}

} // namespace validation
} // namespace grocery
