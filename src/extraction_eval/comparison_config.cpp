#include "comparison_config.hpp"

#include <cmath>
#include <stdexcept>
#include <string>

namespace extraction_eval {

void validate(const ComparisonConfig& config)
{
    if (!std::isfinite(config.numeric_tolerance)
        || config.numeric_tolerance < 0.0) {
        throw std::invalid_argument(
            "numeric_tolerance must be a non-negative number, got "
            + std::to_string(config.numeric_tolerance));
    }
}

void to_json(nlohmann::json& j, const ComparisonConfig& config)
{
    j = {
        { "numeric_tolerance", config.numeric_tolerance },
        { "fuzzy_strings", config.fuzzy_strings },
        { "list_order_matters", config.list_order_matters },
    };
}

void from_json(const nlohmann::json& j, ComparisonConfig& config)
{
    if (!j.is_object()) {
        throw std::invalid_argument("comparison config must be a JSON object");
    }
    try {
        config.numeric_tolerance =
            j.value("numeric_tolerance", config.numeric_tolerance);
        config.fuzzy_strings = j.value("fuzzy_strings", config.fuzzy_strings);
        config.list_order_matters =
            j.value("list_order_matters", config.list_order_matters);
    } catch (const nlohmann::json::type_error& e) {
        throw std::invalid_argument(
            std::string("invalid comparison config: ") + e.what());
    }
    validate(config);
}

} // namespace extraction_eval
