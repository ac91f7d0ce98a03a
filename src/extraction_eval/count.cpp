#include "count.hpp"

namespace extraction_eval {

Metrics calculate_metrics(const Count& count)
{
    Metrics m;
    m.count = count;

    const size_t tp = count.true_positives;
    const size_t predicted = tp + count.false_positives;
    const size_t actual = tp + count.false_negatives;

    m.precision = predicted > 0 ? double(tp) / double(predicted) : 0.0;
    m.recall = actual > 0 ? double(tp) / double(actual) : 0.0;
    const double pr = m.precision + m.recall;
    m.f1 = pr > 0 ? 2.0 * m.precision * m.recall / pr : 0.0;
    return m;
}

void to_json(nlohmann::json& j, const Metrics& m)
{
    j = {
        { "precision", m.precision },
        { "recall", m.recall },
        { "f1", m.f1 },
        { "tp", m.count.true_positives },
        { "fp", m.count.false_positives },
        { "fn", m.count.false_negatives },
        { "tn", m.count.true_negatives },
    };
}

void from_json(const nlohmann::json& j, Metrics& m)
{
    Count c;
    c.true_positives = j.at("tp").get<size_t>();
    c.false_positives = j.at("fp").get<size_t>();
    c.false_negatives = j.at("fn").get<size_t>();
    c.true_negatives = j.value("tn", size_t(0));
    m = calculate_metrics(c);
}

} // namespace extraction_eval
