#include "report.hpp"

#include <algorithm>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace extraction_eval {

namespace {

    const std::string RULE(80, '=');
    const std::string THIN_RULE(80, '-');

    std::string percent(double v, int digits)
    {
        std::ostringstream os;
        os << std::fixed << std::setprecision(digits) << v * 100.0 << '%';
        return os.str();
    }

    std::vector<FieldIssue> collect_issues(
        const AggregatedReport& report,
        double Metrics::*ratio,
        size_t Count::*errors)
    {
        std::vector<FieldIssue> out;
        for (const auto& [field, m] : report.by_field) {
            if (m.*ratio < ISSUE_THRESHOLD && m.count.*errors > 0) {
                out.push_back({ field, m });
            }
        }
        std::stable_sort(
            out.begin(), out.end(),
            [ratio](const FieldIssue& a, const FieldIssue& b) {
                return a.metrics.*ratio < b.metrics.*ratio;
            });
        return out;
    }

    const char* entity(char c)
    {
        switch (c) {
        case '&': return "&amp;";
        case '<': return "&lt;";
        case '>': return "&gt;";
        case '"': return "&quot;";
        default: return "&#39;";
        }
    }

    void write_metrics_cells(std::ostringstream& os, const Metrics& m)
    {
        os << "<td>" << percent(m.precision, 1) << "</td>";
        os << "<td>" << percent(m.recall, 1) << "</td>";
        os << "<td>" << percent(m.f1, 1) << "</td>";
        os << "<td>" << m.count.true_positives << "</td>";
        os << "<td>" << m.count.false_positives << "</td>";
        os << "<td>" << m.count.false_negatives << "</td>";
    }

} // namespace

std::string html_escape(const std::string& text)
{
    static const char* const SPECIAL = "&<>\"'";

    std::string out;
    out.reserve(text.size());
    size_t start = 0;
    for (size_t pos = text.find_first_of(SPECIAL); pos != std::string::npos;
         pos = text.find_first_of(SPECIAL, start)) {
        out.append(text, start, pos - start);
        out += entity(text[pos]);
        start = pos + 1;
    }
    out.append(text, start, std::string::npos);
    return out;
}

std::vector<FieldIssue> low_recall_fields(const AggregatedReport& report)
{
    return collect_issues(report, &Metrics::recall, &Count::false_negatives);
}

std::vector<FieldIssue> low_precision_fields(const AggregatedReport& report)
{
    return collect_issues(report, &Metrics::precision, &Count::false_positives);
}

nlohmann::json make_structured_report(
    const AggregatedReport& report,
    const std::vector<ItemEvaluation>& items,
    const ComparisonConfig& config)
{
    nlohmann::json by_paper = nlohmann::json::object();
    for (const ItemEvaluation& item : items) {
        by_paper[item.paper_id] = item;
    }
    return { { "summary", report },
             { "by_paper", by_paper },
             { "config", config } };
}

std::string make_text_report(const AggregatedReport& report, size_t num_skipped)
{
    std::ostringstream os;
    os << RULE << "\n";
    os << "EXTRACTION VALIDATION REPORT\n";
    os << RULE << "\n\n";

    const Metrics& overall = report.overall;
    os << "OVERALL METRICS\n";
    os << THIN_RULE << "\n";
    os << "Papers evaluated: " << report.num_papers_evaluated << "\n";
    if (num_skipped > 0) {
        os << "Papers skipped:   " << num_skipped << "\n";
    }
    os << "Precision: " << percent(overall.precision, 2) << "\n";
    os << "Recall:    " << percent(overall.recall, 2) << "\n";
    os << "F1 Score:  " << percent(overall.f1, 2) << "\n";
    os << "True Positives:  " << overall.count.true_positives << "\n";
    os << "False Positives: " << overall.count.false_positives << "\n";
    os << "False Negatives: " << overall.count.false_negatives << "\n";
    os << "True Negatives:  " << overall.count.true_negatives << "\n\n";

    os << "METRICS BY FIELD\n";
    os << THIN_RULE << "\n";
    os << std::left << std::setw(30) << "Field" << std::right << " "
       << std::setw(10) << "Precision" << " " << std::setw(10) << "Recall"
       << " " << std::setw(10) << "F1" << "\n";
    os << THIN_RULE << "\n";
    // by_field is a std::map, already sorted by field name
    for (const auto& [field, m] : report.by_field) {
        os << std::left << std::setw(30) << field << std::right << " "
           << std::setw(9) << percent(m.precision, 1) << " " << std::setw(9)
           << percent(m.recall, 1) << " " << std::setw(9) << percent(m.f1, 1)
           << "\n";
    }
    os << "\n";

    os << "COMMON ISSUES\n";
    os << THIN_RULE << "\n";
    const auto low_recall = low_recall_fields(report);
    if (!low_recall.empty()) {
        os << "\nFields with low recall (missed information):\n";
        for (const FieldIssue& issue : low_recall) {
            os << "  - " << issue.field << ": "
               << percent(issue.metrics.recall, 1) << " recall, "
               << issue.metrics.count.false_negatives << " missed items\n";
        }
    }
    const auto low_precision = low_precision_fields(report);
    if (!low_precision.empty()) {
        os << "\nFields with low precision (incorrect extractions):\n";
        for (const FieldIssue& issue : low_precision) {
            os << "  - " << issue.field << ": "
               << percent(issue.metrics.precision, 1) << " precision, "
               << issue.metrics.count.false_positives << " incorrect items\n";
        }
    }
    os << "\n" << RULE;
    return os.str();
}

std::string make_html_report(
    const AggregatedReport& report, const std::vector<ItemEvaluation>& items)
{
    std::ostringstream os;
    os << "<!doctype html><html><head><meta charset=\"utf-8\"/>";
    os << "<title>Extraction Validation Report</title>";
    os << "<style>body{font-family:Arial,Helvetica,sans-serif;margin:24px}table{border-collapse:collapse}th,td{border:1px solid #ddd;padding:6px 10px}th{background:#f4f4f4} .ok{color:#117733} .fail{color:#aa2222} .muted{color:#777}</style>";
    os << "</head><body>";

    const size_t skipped = static_cast<size_t>(std::count_if(
        items.begin(), items.end(),
        [](const ItemEvaluation& e) { return !e.is_evaluated(); }));
    os << "<h1>Extraction Validation Report</h1>";
    os << "<p class=\"muted\">Papers evaluated: " << report.num_papers_evaluated
       << ", not annotated: " << skipped << "</p>";

    const std::string header =
        "<th>Precision</th><th>Recall</th><th>F1</th><th>TP</th><th>FP</th><th>FN</th>";

    os << "<h2>Overall</h2><table><tr>" << header << "</tr><tr>";
    write_metrics_cells(os, report.overall);
    os << "</tr></table>";

    os << "<h2>By field</h2><table><tr><th>Field</th>" << header << "</tr>";
    for (const auto& [field, m] : report.by_field) {
        const bool weak = (m.recall < ISSUE_THRESHOLD && m.count.false_negatives > 0)
            || (m.precision < ISSUE_THRESHOLD && m.count.false_positives > 0);
        os << "<tr><td class=\"" << (weak ? "fail" : "ok") << "\">" << html_escape(field)
           << "</td>";
        write_metrics_cells(os, m);
        os << "</tr>";
    }
    os << "</table>";

    os << "<h2>By paper</h2><table><tr><th>Paper</th><th>Status</th>" << header
       << "</tr>";
    for (const ItemEvaluation& item : items) {
        os << "<tr><td>" << html_escape(item.paper_id) << "</td>";
        if (item.is_evaluated()) {
            os << "<td>evaluated</td>";
            write_metrics_cells(os, item.overall);
        } else {
            os << "<td class=\"muted\">not annotated</td><td colspan=\"6\"></td>";
        }
        os << "</tr>";
    }
    os << "</table>";
    os << "</body></html>";
    return os.str();
}

void write_json(const std::filesystem::path& path, const nlohmann::json& j)
{
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path());
    }
    std::ofstream out(path);
    if (!out.good()) {
        throw std::runtime_error("cannot write " + path.string());
    }
    out << j.dump(2, ' ', false, nlohmann::json::error_handler_t::replace)
        << std::endl;
}

void write_text(const std::filesystem::path& path, const std::string& text)
{
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path());
    }
    std::ofstream out(path);
    if (!out.good()) {
        throw std::runtime_error("cannot write " + path.string());
    }
    out << text;
}

} // namespace extraction_eval
