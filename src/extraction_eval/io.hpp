// Annotation, configuration and metrics file loading.
#pragma once

#include <extraction_eval/aggregator.hpp>
#include <extraction_eval/comparison_config.hpp>
#include <extraction_eval/record_evaluator.hpp>

#include <nlohmann/json.hpp>

#include <filesystem>
#include <string>
#include <vector>

namespace extraction_eval {

struct AnnotationSet {
    std::vector<CorpusItem> items;
    // ids of entries that are not objects and could not be evaluated
    std::vector<std::string> malformed;

    size_t num_annotated() const;
};

/// Read and parse a JSON file (comments allowed).
/// Throws std::runtime_error naming the file on open or parse failure.
nlohmann::json read_json(const std::filesystem::path& path);

/// Items from {"validation_papers": {id: {automated_extraction, ground_truth}}}.
/// A missing automated_extraction is an empty object; a missing or null
/// ground_truth marks the item as not annotated.
AnnotationSet parse_annotations(const nlohmann::json& j);

AnnotationSet load_annotations(const std::filesystem::path& path);

/// Flat {numeric_tolerance, fuzzy_strings, list_order_matters} object.
ComparisonConfig load_config(const std::filesystem::path& path);

/// Item evaluations stored in the by_paper section of a structured report.
/// When config is not null it receives the config the report was built with.
std::vector<ItemEvaluation> load_item_evaluations(
    const std::filesystem::path& path, ComparisonConfig* config = nullptr);

} // namespace extraction_eval
