// Type-dispatched comparison of an automated value against its ground truth.
#pragma once

#include <extraction_eval/comparison_config.hpp>
#include <extraction_eval/count.hpp>
#include <extraction_eval/value.hpp>

namespace extraction_eval {

/// @brief Compare an automated value with the ground truth.
///
/// Dispatch is on the type of truth, which defines the expected shape. A
/// shape mismatch between the two sides is an outcome (fp and/or fn), never an
/// error. Recursion depth is bounded by the nesting depth of truth.
///
/// @param automated Machine-produced value (null when absent).
/// @param truth Annotated value (null when the field is expected empty).
/// @param config Matching options.
/// @return The counts for this value and everything below it.
Count compare(
    const Value& automated, const Value& truth, const ComparisonConfig& config);

/// Boolean truth: match is tp (a number equal to 1 or 0 matches true or
/// false), truthy vs false is fp, falsy vs true is fn.
/// Anything left (e.g. null against false) is a true negative.
Count compare_boolean(const Value& automated, bool truth);

/// Numeric equality within tolerance (tolerance 0 means exact equality).
bool numbers_match(const Value& automated, double truth, double tolerance);

/// Both null match; one null does not; otherwise compare the (optionally
/// normalized) textual forms.
bool strings_match(const Value& automated, const Value& truth, bool fuzzy);

/// @brief List rule.
///
/// Ordered: index-wise matches are tp, surplus automated entries fp, missing
/// entries fn. Unordered: set intersection/differences over normalized
/// elements, so duplicates collapse to one unit.
Count compare_list(
    const Value& automated,
    const Value& truth,
    bool order_matters,
    bool fuzzy);

/// Field-by-field comparison over the union of keys of both sides. A side
/// that is not an object is treated as an empty object.
Count compare_mapping(
    const Value& automated, const Value& truth, const ComparisonConfig& config);

} // namespace extraction_eval
