// Extraction evaluator
// - 读取标注文件（自动抽取结果 + 人工真值）
// - 逐篇比较并统计 tp/fp/fn
// - 汇总全语料的 precision/recall/F1
// - 生成 JSON + 文本（可选 HTML）报告

#include <extraction_eval/aggregator.hpp>
#include <extraction_eval/comparison_config.hpp>
#include <extraction_eval/config.hpp>
#include <extraction_eval/io.hpp>
#include <extraction_eval/report.hpp>
#include <extraction_eval/utils/logger.hpp>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <tbb/global_control.h>
#include <tbb/info.h>

#include <cstdlib>
#include <exception>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace extraction_eval;

static void usage(const char* argv0)
{
    std::cout << "Usage: " << argv0 << " --annotations FILE [--output FILE] [--report FILE] [--html FILE]\n";
    std::cout << "                 [--numeric-tolerance X] [--fuzzy-strings] [--list-order-matters]\n";
    std::cout << "                 [--config FILE] [--threads N] [--log N] [--log-file FILE] [--version]\n";
    std::cout << "Compares automated extractions with ground truth annotations and reports\n";
    std::cout << "field-level and corpus-level precision, recall and F1.\n";
}

int main(int argc, char** argv)
{
    fs::path annotations_path;
    fs::path output_path = "validation_metrics.json";
    fs::path report_path = "validation_report.txt";
    fs::path html_path;
    fs::path log_path;
    int log_level = spdlog::level::info;
    int num_threads = tbb::info::default_concurrency();
    ComparisonConfig config;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--help" || arg == "-h") {
                usage(argv[0]);
                return 0;
            } else if (arg == "--version") {
                std::cout << EXTRACTION_EVAL_NAME << " " << EXTRACTION_EVAL_VER << "\n";
                return 0;
            } else if (arg == "--annotations" && i + 1 < argc) {
                annotations_path = argv[++i];
            } else if (arg == "--output" && i + 1 < argc) {
                output_path = argv[++i];
            } else if (arg == "--report" && i + 1 < argc) {
                report_path = argv[++i];
            } else if (arg == "--html" && i + 1 < argc) {
                html_path = argv[++i];
            } else if (arg == "--config" && i + 1 < argc) {
                // 之后出现的命令行选项覆盖配置文件
                config = load_config(argv[++i]);
            } else if (arg == "--numeric-tolerance" && i + 1 < argc) {
                config.numeric_tolerance = std::stod(argv[++i]);
            } else if (arg == "--fuzzy-strings") {
                config.fuzzy_strings = true;
            } else if (arg == "--list-order-matters") {
                config.list_order_matters = true;
            } else if (arg == "--threads" && i + 1 < argc) {
                num_threads = std::atoi(argv[++i]);
                if (num_threads <= 0) num_threads = tbb::info::default_concurrency();
            } else if (arg == "--log" && i + 1 < argc) {
                log_level = std::atoi(argv[++i]);
            } else if (arg == "--log-file" && i + 1 < argc) {
                log_path = argv[++i];
            } else {
                std::cerr << "Unknown or incomplete option: " << arg << "\n";
                usage(argv[0]);
                return 2;
            }
        }
        validate(config);
    } catch (const std::exception& e) {
        std::cerr << "Invalid arguments: " << e.what() << "\n";
        return 2;
    }

    // 同时输出到终端和日志文件
    if (!log_path.empty()) {
        try {
            auto console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            auto file = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
                log_path.string(), /*truncate=*/true);
            auto file_logger = std::make_shared<spdlog::logger>(
                "extraction_evaluator", spdlog::sinks_init_list { console, file });
            set_logger(file_logger);
            spdlog::set_default_logger(file_logger);
        } catch (const spdlog::spdlog_ex& e) {
            std::cerr << "Cannot open log file " << log_path << ": " << e.what() << "\n";
            return 2;
        }
    }

    spdlog::set_level(static_cast<spdlog::level::level_enum>(log_level));
    logger().set_level(static_cast<spdlog::level::level_enum>(log_level));

    if (annotations_path.empty()) {
        usage(argv[0]);
        return 2;
    }

    tbb::global_control thread_limiter(
        tbb::global_control::max_allowed_parallelism, num_threads);

    AnnotationSet annotations;
    try {
        annotations = load_annotations(annotations_path);
    } catch (const std::exception& e) {
        spdlog::error("{}", e.what());
        return 1;
    }

    const size_t total = annotations.items.size() + annotations.malformed.size();
    const size_t annotated = annotations.num_annotated();
    spdlog::info("Loaded {} validation papers", total);
    spdlog::info("Papers with ground truth: {}", annotated);
    if (annotated == 0) {
        spdlog::error("No ground truth annotations found; fill in the 'ground_truth' field of each paper.");
        return 1;
    }

    const std::vector<ItemEvaluation> evaluations =
        evaluate_corpus(annotations.items, config);
    for (const ItemEvaluation& e : evaluations) {
        if (!e.is_evaluated()) continue;
        spdlog::info("{}: P={:.2f}% R={:.2f}% F1={:.2f}%", e.paper_id,
                     e.overall.precision * 100, e.overall.recall * 100, e.overall.f1 * 100);
    }

    const AggregatedReport report = aggregate(evaluations);
    const size_t skipped = total - report.num_papers_evaluated;
    if (skipped > 0) {
        spdlog::warn("{} of {} papers could not be evaluated ({} not annotated, {} malformed)",
                     skipped, total, evaluations.size() - report.num_papers_evaluated,
                     annotations.malformed.size());
    }

    // 已计算出的逐篇结果在写文件失败时仍然有效，这里只报告错误
    int status = 0;
    try {
        write_json(output_path, make_structured_report(report, evaluations, config));
        spdlog::info("Detailed metrics saved to: {}", output_path.string());
    } catch (const std::exception& e) {
        spdlog::error("{}", e.what());
        status = 1;
    }

    const std::string text = make_text_report(report, skipped);
    std::cout << text << std::endl;
    try {
        write_text(report_path, text);
        spdlog::info("Validation report saved to: {}", report_path.string());
        if (!html_path.empty()) {
            write_text(html_path, make_html_report(report, evaluations));
            spdlog::info("HTML report saved to: {}", html_path.string());
        }
    } catch (const std::exception& e) {
        spdlog::error("{}", e.what());
        status = 1;
    }
    return status;
}
