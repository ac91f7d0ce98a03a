// Merge several metrics JSON files (e.g. shards of one corpus) into one report.
// Counts are additive, so re-aggregating the per-paper evaluations gives the
// same result as evaluating the whole corpus at once.

#include <extraction_eval/aggregator.hpp>
#include <extraction_eval/io.hpp>
#include <extraction_eval/report.hpp>

#include <spdlog/spdlog.h>

#include <filesystem>
#include <iostream>
#include <set>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace extraction_eval;

int main(int argc, char** argv)
{
    if (argc < 3) {
        std::cerr << "Usage: " << argv[0] << " OUT_DIR metrics1.json [metrics2.json ...]\n";
        return 1;
    }
    fs::path out_dir = argv[1];

    std::vector<ItemEvaluation> items;
    std::set<std::string> seen;
    ComparisonConfig config;
    bool have_config = false;
    for (int i = 2; i < argc; ++i) {
        if (!fs::exists(argv[i])) {
            spdlog::warn("Skipping missing file: {}", argv[i]);
            continue;
        }
        ComparisonConfig file_config;
        std::vector<ItemEvaluation> loaded;
        try {
            loaded = load_item_evaluations(argv[i], &file_config);
        } catch (const std::exception& e) {
            spdlog::error("{}", e.what());
            return 1;
        }
        if (!have_config) {
            config = file_config;
            have_config = true;
        } else if (file_config.numeric_tolerance != config.numeric_tolerance
                   || file_config.fuzzy_strings != config.fuzzy_strings
                   || file_config.list_order_matters != config.list_order_matters) {
            spdlog::warn("{} was evaluated with a different comparison config", argv[i]);
        }
        for (auto& e : loaded) {
            // 同一篇论文只计一次，保留先出现的结果
            if (!seen.insert(e.paper_id).second) {
                spdlog::warn("Duplicate paper {} in {}; keeping the first occurrence", e.paper_id, argv[i]);
                continue;
            }
            items.push_back(std::move(e));
        }
    }

    const AggregatedReport report = aggregate(items);
    const size_t skipped = items.size() - report.num_papers_evaluated;
    try {
        write_json(out_dir / "aggregate.json", make_structured_report(report, items, config));
        write_text(out_dir / "aggregate.txt", make_text_report(report, skipped));
        write_text(out_dir / "aggregate.html", make_html_report(report, items));
    } catch (const std::exception& e) {
        spdlog::error("{}", e.what());
        return 1;
    }
    std::cout << "Aggregate report written to: " << (out_dir / "aggregate.html").string() << "\n";
    return 0;
}
