#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <extraction_eval/io.hpp>
#include <extraction_eval/report.hpp>
#include <extraction_eval/utils/logger.hpp>

#include "test_utils.hpp"

#include <spdlog/sinks/ostream_sink.h>

#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;
using namespace extraction_eval;
using namespace extraction_eval::tests;
using nlohmann::json;
using Catch::Approx;

namespace {

const fs::path data(EXTRACTION_EVAL_TEST_DATA_DIR);

} // namespace

TEST_CASE("Parse annotation entries", "[io]")
{
    const json j = {
        { "validation_papers",
          {
              { "a", { { "automated_extraction", { { "x", 1 } } }, { "ground_truth", { { "x", 1 } } } } },
              { "b", { { "ground_truth", { { "x", 1 } } } } },
              { "c", { { "automated_extraction", { { "x", 1 } } } } },
              { "d", 42 },
          } },
    };
    const AnnotationSet set = parse_annotations(j);

    REQUIRE(set.items.size() == 3);
    CHECK(set.num_annotated() == 2);
    REQUIRE(set.malformed.size() == 1);
    CHECK(set.malformed[0] == "d");

    // missing automated extraction is an empty object
    CHECK(set.items[1].paper_id == "b");
    CHECK(set.items[1].automated == json::object());
    CHECK(set.items[2].ground_truth.is_null());
}

TEST_CASE("Skipped entries are logged through the installed logger", "[io][logger]")
{
    std::ostringstream out;
    auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(out);
    set_logger(std::make_shared<spdlog::logger>("io_test", sink));

    const AnnotationSet set = parse_annotations(
        { { "validation_papers", { { "broken", "not an object" } } } });
    set_logger(nullptr);

    CHECK(set.malformed.size() == 1);
    CHECK(out.str().find("broken: expected an object") != std::string::npos);
}

TEST_CASE("Annotation file without papers", "[io]")
{
    CHECK(parse_annotations(json::object()).items.empty());
    CHECK_THROWS_AS(parse_annotations(json::array()), std::runtime_error);
    CHECK_THROWS_AS(
        parse_annotations({ { "validation_papers", json::array() } }),
        std::runtime_error);
}

TEST_CASE("Unreadable input is reported", "[io]")
{
    CHECK_THROWS_AS(read_json(data / "does_not_exist.json"), std::runtime_error);

    const fs::path bad = fs::temp_directory_path() / "extraction_eval_bad.json";
    std::ofstream(bad) << "{ \"validation_papers\": ";
    CHECK_THROWS_AS(load_annotations(bad), std::runtime_error);
    fs::remove(bad);
}

TEST_CASE("Comparison config from JSON", "[io][config]")
{
    const auto cfg = json { { "numeric_tolerance", 0.25 }, { "fuzzy_strings", true } }
                         .get<ComparisonConfig>();
    CHECK(cfg.numeric_tolerance == Approx(0.25));
    CHECK(cfg.fuzzy_strings);
    CHECK_FALSE(cfg.list_order_matters);

    CHECK_THROWS_AS(
        (json { { "numeric_tolerance", -1.0 } }.get<ComparisonConfig>()),
        std::invalid_argument);
    CHECK_THROWS_AS(
        (json { { "fuzzy_strings", "yes" } }.get<ComparisonConfig>()),
        std::invalid_argument);
}

TEST_CASE("End to end on the sample annotation file", "[io][e2e]")
{
    const AnnotationSet set = load_annotations(data / "validation_set.json");
    REQUIRE(set.items.size() == 3);
    CHECK(set.num_annotated() == 2);
    CHECK(set.malformed.size() == 1);

    SECTION("exact matching")
    {
        const auto items = evaluate_corpus(set.items, ComparisonConfig {});
        const AggregatedReport r = aggregate(items);

        CHECK(r.num_papers_evaluated == 2);
        check_count(r.overall.count, 7, 4, 5);
        CHECK(r.overall.precision == Approx(7.0 / 11.0));
        CHECK(r.overall.recall == Approx(7.0 / 12.0));

        check_count(r.by_field.at("species").count, 1, 1, 1);
        check_count(r.by_field.at("sample_size").count, 1, 1, 1);
        check_count(r.by_field.at("is_field_study").count, 1, 1, 0);
        check_count(r.by_field.at("locations").count, 3, 0, 1);
        check_count(r.by_field.at("records").count, 1, 1, 2);

        const auto low_recall = low_recall_fields(r);
        REQUIRE(low_recall.size() == 3);
        CHECK(low_recall[0].field == "records");
        CHECK(low_recall[1].field == "sample_size");
        CHECK(low_recall[2].field == "species");

        const ItemEvaluation& p1 = items[0];
        CHECK(p1.paper_id == "paper_001");
        check_count(p1.overall.count, 6, 1, 2);
        const auto& details = p1.fields.at(RECORDS_FIELD).record_details;
        REQUIRE(details.size() == 2);
        check_count(details[1].metrics.count, 1, 1, 1);
    }
    SECTION("fuzzy strings and tolerance")
    {
        ComparisonConfig cfg;
        cfg.fuzzy_strings = true;
        cfg.numeric_tolerance = 0.05;
        const auto items = evaluate_corpus(set.items, cfg);
        const AggregatedReport r = aggregate(items);

        check_count(r.overall.count, 8, 3, 4);
        check_count(r.by_field.at("species").count, 2, 0, 0);
        const auto& details = items[0].fields.at(RECORDS_FIELD).record_details;
        check_count(details[1].metrics.count, 2, 0, 0);
    }
}

TEST_CASE("Metrics files merge back to the same summary", "[io][merge]")
{
    const AnnotationSet set = load_annotations(data / "validation_set.json");
    const auto items = evaluate_corpus(set.items, ComparisonConfig {});

    // 分成两个分片分别写出，再合并
    const std::vector<ItemEvaluation> first(items.begin(), items.begin() + 1);
    const std::vector<ItemEvaluation> second(items.begin() + 1, items.end());

    const fs::path dir = fs::temp_directory_path() / "extraction_eval_merge";
    fs::remove_all(dir);
    ComparisonConfig cfg;
    cfg.list_order_matters = true;
    write_json(dir / "a.json", make_structured_report(aggregate(first), first, cfg));
    write_json(dir / "b.json", make_structured_report(aggregate(second), second, cfg));

    ComparisonConfig loaded_cfg;
    std::vector<ItemEvaluation> merged = load_item_evaluations(dir / "a.json", &loaded_cfg);
    const auto more = load_item_evaluations(dir / "b.json");
    merged.insert(merged.end(), more.begin(), more.end());
    fs::remove_all(dir);

    CHECK(loaded_cfg.list_order_matters);
    REQUIRE(merged.size() == items.size());

    const AggregatedReport expected = aggregate(items);
    const AggregatedReport actual = aggregate(merged);
    CHECK(actual.num_papers_evaluated == expected.num_papers_evaluated);
    CHECK(actual.overall.count == expected.overall.count);
    CHECK(actual.by_field.size() == expected.by_field.size());
}
