#include "aggregator.hpp"

#include <extraction_eval/utils/logger.hpp>

#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>
#include <tbb/parallel_reduce.h>

namespace extraction_eval {

CorpusCounts& CorpusCounts::operator+=(const CorpusCounts& other)
{
    overall += other.overall;
    for (const auto& [field, count] : other.by_field) {
        by_field[field] += count;
    }
    num_evaluated += other.num_evaluated;
    return *this;
}

CorpusCounts item_counts(const ItemEvaluation& item)
{
    CorpusCounts c;
    if (!item.is_evaluated()) {
        return c;
    }
    for (const auto& [field, fe] : item.fields) {
        c.by_field[field] += fe.count;
        c.overall += fe.count;
    }
    c.num_evaluated = 1;
    return c;
}

AggregatedReport finalize(const CorpusCounts& counts)
{
    AggregatedReport r;
    r.overall = calculate_metrics(counts.overall);
    for (const auto& [field, count] : counts.by_field) {
        r.by_field.emplace(field, calculate_metrics(count));
    }
    r.num_papers_evaluated = counts.num_evaluated;
    return r;
}

AggregatedReport aggregate(const std::vector<ItemEvaluation>& items)
{
    const CorpusCounts total = tbb::parallel_reduce(
        tbb::blocked_range<size_t>(0, items.size()), CorpusCounts {},
        [&](const tbb::blocked_range<size_t>& r, CorpusCounts partial) {
            for (size_t i = r.begin(); i != r.end(); ++i) {
                partial += item_counts(items[i]);
            }
            return partial;
        },
        [](CorpusCounts a, const CorpusCounts& b) {
            a += b;
            return a;
        });

    logger().debug(
        "aggregated {} of {} items over {} fields", total.num_evaluated,
        items.size(), total.by_field.size());
    return finalize(total);
}

std::vector<ItemEvaluation> evaluate_corpus(
    const std::vector<CorpusItem>& corpus, const ComparisonConfig& config)
{
    std::vector<ItemEvaluation> out(corpus.size());
    tbb::parallel_for(
        tbb::blocked_range<size_t>(0, corpus.size()),
        [&](const tbb::blocked_range<size_t>& r) {
            for (size_t i = r.begin(); i != r.end(); ++i) {
                const CorpusItem& item = corpus[i];
                out[i] = evaluate_item(
                    item.paper_id, item.automated, item.ground_truth, config);
            }
        });
    return out;
}

void to_json(nlohmann::json& j, const AggregatedReport& r)
{
    nlohmann::json by_field = nlohmann::json::object();
    for (const auto& [field, m] : r.by_field) {
        by_field[field] = m;
    }
    j = { { "overall", r.overall },
          { "by_field", by_field },
          { "num_papers_evaluated", r.num_papers_evaluated } };
}

} // namespace extraction_eval
