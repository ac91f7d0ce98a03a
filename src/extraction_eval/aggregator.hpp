// Corpus-wide aggregation of item evaluations.
#pragma once

#include <extraction_eval/comparison_config.hpp>
#include <extraction_eval/count.hpp>
#include <extraction_eval/record_evaluator.hpp>
#include <extraction_eval/value.hpp>

#include <nlohmann/json.hpp>

#include <map>
#include <string>
#include <vector>

namespace extraction_eval {

/// One item of the corpus as read from the annotation file.
struct CorpusItem {
    std::string paper_id;
    Value automated;
    // null when not annotated yet
    Value ground_truth;
};

/// Integer sums from which every aggregated ratio is derived.
/// Merging is associative and commutative so partial sums from any split of
/// the corpus can be combined in any order.
struct CorpusCounts {
    Count overall;
    std::map<std::string, Count> by_field;
    size_t num_evaluated = 0;

    CorpusCounts& operator+=(const CorpusCounts& other);
};

struct AggregatedReport {
    Metrics overall;
    std::map<std::string, Metrics> by_field;
    size_t num_papers_evaluated = 0;
};

/// Counts contributed by a single item (empty for not-annotated items).
CorpusCounts item_counts(const ItemEvaluation& item);

/// Re-derive metrics from summed counts.
AggregatedReport finalize(const CorpusCounts& counts);

/// @brief Aggregate a corpus.
///
/// Only evaluated items take part. Counts are summed per field (ratios are
/// never averaged) and the overall metrics sum every field. The reduction
/// runs in parallel with oneTBB.
AggregatedReport aggregate(const std::vector<ItemEvaluation>& items);

/// Evaluate every item, in parallel. The output keeps the input order.
std::vector<ItemEvaluation> evaluate_corpus(
    const std::vector<CorpusItem>& corpus, const ComparisonConfig& config);

void to_json(nlohmann::json& j, const AggregatedReport& r);

} // namespace extraction_eval
