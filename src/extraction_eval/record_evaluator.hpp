// Evaluation of one corpus item (automated extraction vs. ground truth).
#pragma once

#include <extraction_eval/comparison_config.hpp>
#include <extraction_eval/count.hpp>
#include <extraction_eval/value.hpp>

#include <nlohmann/json.hpp>

#include <map>
#include <string>
#include <vector>

namespace extraction_eval {

/// Top-level field holding the list of extracted sub-records.
inline constexpr const char* RECORDS_FIELD = "records";

enum class EvaluationStatus { NOT_ANNOTATED, EVALUATED };

/// Metrics of one positionally paired sub-record.
struct RecordDetail {
    size_t record_index = 0;
    Metrics metrics;
};

struct FieldEvaluation {
    // Feeds the item and corpus sums. For the records field this is the
    // count-level comparison, not the per-index detail.
    Count count;
    // Set for the records field only
    bool has_record_details = false;
    std::vector<RecordDetail> record_details;

    Metrics metrics() const { return calculate_metrics(count); }
};

struct ItemEvaluation {
    std::string paper_id;
    EvaluationStatus status = EvaluationStatus::NOT_ANNOTATED;
    std::map<std::string, FieldEvaluation> fields;
    Metrics overall;

    bool is_evaluated() const { return status == EvaluationStatus::EVALUATED; }
};

/// @brief Evaluate one item.
///
/// A null truth means the item has not been annotated yet. Otherwise every
/// field in the union of both sides is compared; the records field gets a
/// count-level comparison (sub-records as opaque set elements) plus a
/// per-index detail. The per-index detail pairs sub-records by position, so
/// reordered or inserted records are attributed to the wrong partner; the
/// count-level result is unaffected.
ItemEvaluation evaluate_item(
    const std::string& paper_id,
    const Value& automated,
    const Value& truth,
    const ComparisonConfig& config);

void to_json(nlohmann::json& j, const ItemEvaluation& e);

/// paper_id is not part of the JSON form and is left untouched.
void from_json(const nlohmann::json& j, ItemEvaluation& e);

} // namespace extraction_eval
