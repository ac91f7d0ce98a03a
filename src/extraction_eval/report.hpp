// Report writers: structured JSON, narrative text and simple HTML.
#pragma once

#include <extraction_eval/aggregator.hpp>
#include <extraction_eval/comparison_config.hpp>
#include <extraction_eval/record_evaluator.hpp>

#include <nlohmann/json.hpp>

#include <filesystem>
#include <string>
#include <vector>

namespace extraction_eval {

/// Fields below this recall (or precision) are listed as common issues.
inline constexpr double ISSUE_THRESHOLD = 0.70;

struct FieldIssue {
    std::string field;
    Metrics metrics;
};

/// Replace the five HTML special characters with entities.
std::string html_escape(const std::string& text);

/// Fields with recall < ISSUE_THRESHOLD and at least one false negative,
/// ascending by recall.
std::vector<FieldIssue> low_recall_fields(const AggregatedReport& report);

/// Fields with precision < ISSUE_THRESHOLD and at least one false positive,
/// ascending by precision.
std::vector<FieldIssue> low_precision_fields(const AggregatedReport& report);

/// {summary, by_paper, config}
nlohmann::json make_structured_report(
    const AggregatedReport& report,
    const std::vector<ItemEvaluation>& items,
    const ComparisonConfig& config);

/// Narrative report: overall metrics, per-field table and common issues.
/// num_skipped is the number of items left out of the computation.
std::string
make_text_report(const AggregatedReport& report, size_t num_skipped = 0);

/// Standalone HTML page (no external assets) with the same content plus a
/// per-paper table.
std::string make_html_report(
    const AggregatedReport& report, const std::vector<ItemEvaluation>& items);

// Write JSON to path (pretty).
void write_json(const std::filesystem::path& path, const nlohmann::json& j);

void write_text(const std::filesystem::path& path, const std::string& text);

} // namespace extraction_eval
