#pragma once

#include <chrono>
#include <string>
#include "errors.hpp"
#include "subjects.hpp"

namespace lattice {
namespace validation {

/**
 * Require that a string is not empty.
 */
inline void require_not_empty(const std::string& value, const std::string& field_name = "value") {
    if (value.empty()) {
        throw InvalidArgumentError(field_name + " must not be empty");
    }
}

/**
 * Require that a value can be used as a single subject token.
 */
inline void require_subject_token(const std::string& value, const std::string& field_name = "value") {
    require_not_empty(value, field_name);
    if (!subjects::is_valid_token(value)) {
        throw InvalidArgumentError(field_name + " must not contain '.', '*', '>' or whitespace: " + value);
    }
}

/**
 * Require that a duration is positive.
 */
template<typename Rep, typename Period>
void require_positive(std::chrono::duration<Rep, Period> value, const std::string& field_name = "timeout") {
    if (value.count() <= 0) {
        throw InvalidArgumentError(field_name + " must be positive");
    }
}

} // namespace validation
} // namespace lattice
