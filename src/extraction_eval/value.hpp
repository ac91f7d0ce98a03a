#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <set>
#include <string>

namespace extraction_eval {

/// JSON-like value tree compared by the engine.
/// null | boolean | number | string | array | object
using Value = nlohmann::json;

/// Textual form used when a non-string is compared against a string:
/// strings as-is, everything else as its compact JSON dump. Booleans and null
/// therefore read "true", "false" and "null" in lower case.
std::string to_text(const Value& v);

/// Lower-case and collapse runs of whitespace when fuzzy is set; otherwise
/// return the input unchanged.
std::string normalize_string(const std::string& s, bool fuzzy);

/// Null, false, zero, "", [] and {} are falsy.
bool is_truthy(const Value& v);

/// Null, "" and [] count as an empty answer.
bool is_empty_answer(const Value& v);

/// Numeric reading of a value: numbers, booleans (1/0) and strings that
/// parse fully as a floating point number. std::nullopt otherwise.
std::optional<double> as_number(const Value& v);

/// Keys present in either side; non-objects contribute none.
std::set<std::string> union_of_keys(const Value& a, const Value& b);

/// Value of key in an object, or null when absent or when v is not an object.
const Value& field_or_null(const Value& v, const std::string& key);

} // namespace extraction_eval
