#pragma once

#include <nlohmann/json.hpp>

namespace extraction_eval {

/// Options controlling how scalar and list values are matched.
struct ComparisonConfig {
    // Absolute difference at or below which two numbers are equal; 0 = exact
    double numeric_tolerance = 0.0;
    // Lower-case and collapse whitespace before comparing strings
    bool fuzzy_strings = false;
    // Compare lists positionally instead of as sets
    bool list_order_matters = false;
};

/// Throws std::invalid_argument when numeric_tolerance is negative or not finite.
void validate(const ComparisonConfig& config);

void to_json(nlohmann::json& j, const ComparisonConfig& config);

/// Missing keys keep their defaults; the result is validated.
void from_json(const nlohmann::json& j, ComparisonConfig& config);

} // namespace extraction_eval
