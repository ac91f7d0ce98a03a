#include "comparator.hpp"

#include <extraction_eval/utils/logger.hpp>

#include <algorithm>
#include <cmath>
#include <iterator>
#include <set>
#include <string>
#include <vector>

namespace extraction_eval {

namespace {

    // null -> [], scalar -> [scalar]
    std::vector<Value> as_list(const Value& v)
    {
        if (v.is_null()) {
            return {};
        }
        if (v.is_array()) {
            return v.get<std::vector<Value>>();
        }
        return { v };
    }

    std::set<Value> as_set(const std::vector<Value>& items, bool fuzzy)
    {
        std::set<Value> out;
        for (const Value& item : items) {
            if (fuzzy) {
                out.emplace(normalize_string(to_text(item), true));
            } else {
                out.insert(item);
            }
        }
        return out;
    }

    size_t difference_size(const std::set<Value>& a, const std::set<Value>& b)
    {
        std::vector<Value> diff;
        std::set_difference(
            a.begin(), a.end(), b.begin(), b.end(), std::back_inserter(diff));
        return diff.size();
    }

} // namespace

Count compare_boolean(const Value& automated, bool truth)
{
    if (automated.is_boolean() && automated.get<bool>() == truth) {
        return Count::tp();
    }
    // 1 / 0 are the same answer as true / false
    if (automated.is_number() && automated.get<double>() == (truth ? 1.0 : 0.0)) {
        return Count::tp();
    }
    const bool said_yes = is_truthy(automated);
    if (said_yes && !truth) {
        return Count::fp();
    }
    if (!said_yes && truth) {
        return Count::fn();
    }
    return Count::tn();
}

bool numbers_match(const Value& automated, double truth, double tolerance)
{
    const std::optional<double> a = as_number(automated);
    if (!a) {
        return false;
    }
    if (tolerance > 0) {
        return std::abs(*a - truth) <= tolerance;
    }
    return *a == truth;
}

bool strings_match(const Value& automated, const Value& truth, bool fuzzy)
{
    if (automated.is_null() && truth.is_null()) {
        return true;
    }
    if (automated.is_null() || truth.is_null()) {
        return false;
    }
    return normalize_string(to_text(automated), fuzzy)
        == normalize_string(to_text(truth), fuzzy);
}

Count compare_list(
    const Value& automated,
    const Value& truth,
    bool order_matters,
    bool fuzzy)
{
    const std::vector<Value> auto_items = as_list(automated);
    const std::vector<Value> truth_items = as_list(truth);

    Count c;
    if (order_matters) {
        const size_t n = std::min(auto_items.size(), truth_items.size());
        for (size_t i = 0; i < n; ++i) {
            if (strings_match(auto_items[i], truth_items[i], fuzzy)) {
                ++c.true_positives;
            }
        }
        if (auto_items.size() > truth_items.size()) {
            c.false_positives = auto_items.size() - truth_items.size();
        } else {
            c.false_negatives = truth_items.size() - auto_items.size();
        }
        return c;
    }

    const std::set<Value> auto_set = as_set(auto_items, fuzzy);
    const std::set<Value> truth_set = as_set(truth_items, fuzzy);

    std::vector<Value> inter;
    std::set_intersection(
        auto_set.begin(), auto_set.end(), truth_set.begin(), truth_set.end(),
        std::back_inserter(inter));
    c.true_positives = inter.size();
    c.false_positives = difference_size(auto_set, truth_set);
    c.false_negatives = difference_size(truth_set, auto_set);
    return c;
}

Count compare_mapping(
    const Value& automated, const Value& truth, const ComparisonConfig& config)
{
    if (!automated.is_null() && !automated.is_object()) {
        logger().trace(
            "expected an object, got {}; comparing as empty object",
            automated.type_name());
    }

    const std::set<std::string> keys = union_of_keys(automated, truth);

    Count total;
    for (const std::string& key : keys) {
        total += compare(
            field_or_null(automated, key), field_or_null(truth, key), config);
    }
    return total;
}

Count compare(
    const Value& automated, const Value& truth, const ComparisonConfig& config)
{
    switch (truth.type()) {
    case Value::value_t::boolean:
        return compare_boolean(automated, truth.get<bool>());

    case Value::value_t::number_integer:
    case Value::value_t::number_unsigned:
    case Value::value_t::number_float:
        return numbers_match(
                   automated, truth.get<double>(), config.numeric_tolerance)
            ? Count::tp()
            : Count::mismatch();

    case Value::value_t::string:
        return strings_match(automated, truth, config.fuzzy_strings)
            ? Count::tp()
            : Count::mismatch();

    case Value::value_t::null:
        // nothing to miss
        return is_empty_answer(automated) ? Count::tp() : Count::fp();

    case Value::value_t::array:
        return compare_list(
            automated, truth, config.list_order_matters, config.fuzzy_strings);

    case Value::value_t::object:
        return compare_mapping(automated, truth, config);

    case Value::value_t::binary:
    case Value::value_t::discarded:
        break;
    }

    logger().trace("fallback comparison for truth of type {}", truth.type_name());
    return automated == truth ? Count::tp() : Count::mismatch();
}

} // namespace extraction_eval
