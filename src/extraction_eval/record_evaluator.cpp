#include "record_evaluator.hpp"

#include <extraction_eval/comparator.hpp>
#include <extraction_eval/utils/logger.hpp>

#include <algorithm>
#include <set>
#include <stdexcept>

namespace extraction_eval {

namespace {

    bool is_list_or_absent(const Value& v) { return v.is_array() || v.is_null(); }

    FieldEvaluation evaluate_records(
        const Value& automated, const Value& truth, const ComparisonConfig& config)
    {
        FieldEvaluation fe;
        fe.has_record_details = true;
        // Presence bookkeeping: every sub-record is one opaque unit
        fe.count = compare_list(automated, truth, false, false);

        if (!automated.is_array() || !truth.is_array()) {
            return fe;
        }
        const size_t n = std::min(automated.size(), truth.size());
        fe.record_details.reserve(n);
        for (size_t i = 0; i < n; ++i) {
            RecordDetail rd;
            rd.record_index = i;
            rd.metrics = calculate_metrics(
                compare_mapping(automated[i], truth[i], config));
            fe.record_details.push_back(rd);
        }
        return fe;
    }

} // namespace

ItemEvaluation evaluate_item(
    const std::string& paper_id,
    const Value& automated,
    const Value& truth,
    const ComparisonConfig& config)
{
    ItemEvaluation e;
    e.paper_id = paper_id;
    if (truth.is_null()) {
        e.status = EvaluationStatus::NOT_ANNOTATED;
        return e;
    }
    e.status = EvaluationStatus::EVALUATED;

    const std::set<std::string> keys = union_of_keys(automated, truth);

    Count total;
    for (const std::string& field : keys) {
        const Value& a = field_or_null(automated, field);
        const Value& t = field_or_null(truth, field);

        FieldEvaluation fe;
        if (field == RECORDS_FIELD && is_list_or_absent(a)
            && is_list_or_absent(t) && (a.is_array() || t.is_array())) {
            fe = evaluate_records(a, t, config);
        } else {
            fe.count = compare(a, t, config);
        }
        total += fe.count;
        e.fields.emplace(field, std::move(fe));
    }
    e.overall = calculate_metrics(total);

    logger().debug(
        "{}: {} fields, tp={} fp={} fn={}", paper_id, e.fields.size(),
        total.true_positives, total.false_positives, total.false_negatives);
    return e;
}

void to_json(nlohmann::json& j, const ItemEvaluation& e)
{
    if (!e.is_evaluated()) {
        j = { { "status", "not_annotated" },
              { "message", "Ground truth not provided" } };
        return;
    }

    nlohmann::json fields = nlohmann::json::object();
    for (const auto& [name, fe] : e.fields) {
        if (fe.has_record_details) {
            nlohmann::json details = nlohmann::json::array();
            for (const RecordDetail& rd : fe.record_details) {
                details.push_back(
                    { { "record_index", rd.record_index },
                      { "metrics", rd.metrics } });
            }
            fields[name] = { { "count_metrics", fe.metrics() },
                             { "record_details", details } };
        } else {
            fields[name] = fe.metrics();
        }
    }
    j = { { "status", "evaluated" },
          { "field_metrics", fields },
          { "overall", e.overall } };
}

void from_json(const nlohmann::json& j, ItemEvaluation& e)
{
    const std::string status = j.at("status").get<std::string>();
    e.fields.clear();
    e.overall = Metrics {};
    if (status == "not_annotated") {
        e.status = EvaluationStatus::NOT_ANNOTATED;
        return;
    }
    if (status != "evaluated") {
        throw std::runtime_error("unknown evaluation status: " + status);
    }
    e.status = EvaluationStatus::EVALUATED;

    Count total;
    for (const auto& item : j.at("field_metrics").items()) {
        const nlohmann::json& fj = item.value();
        FieldEvaluation fe;
        if (fj.contains("count_metrics")) {
            fe.has_record_details = true;
            fe.count = fj.at("count_metrics").get<Metrics>().count;
            for (const auto& dj : fj.value("record_details", nlohmann::json::array())) {
                RecordDetail rd;
                rd.record_index = dj.at("record_index").get<size_t>();
                rd.metrics = dj.at("metrics").get<Metrics>();
                fe.record_details.push_back(rd);
            }
        } else {
            fe.count = fj.get<Metrics>().count;
        }
        total += fe.count;
        e.fields.emplace(item.key(), std::move(fe));
    }
    e.overall = calculate_metrics(total);
}

} // namespace extraction_eval
