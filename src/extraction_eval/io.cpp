#include "io.hpp"

#include <extraction_eval/utils/logger.hpp>

#include <algorithm>
#include <fstream>
#include <stdexcept>

namespace extraction_eval {

size_t AnnotationSet::num_annotated() const
{
    return static_cast<size_t>(
        std::count_if(items.begin(), items.end(), [](const CorpusItem& i) {
            return !i.ground_truth.is_null();
        }));
}

nlohmann::json read_json(const std::filesystem::path& path)
{
    std::ifstream in(path);
    if (!in.good()) {
        throw std::runtime_error("cannot open " + path.string());
    }
    try {
        return nlohmann::json::parse(in, nullptr, true, true);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error(
            "invalid JSON in " + path.string() + ": " + e.what());
    }
}

AnnotationSet parse_annotations(const nlohmann::json& j)
{
    if (!j.is_object()) {
        throw std::runtime_error("annotation file must contain a JSON object");
    }
    AnnotationSet set;
    const auto papers = j.find("validation_papers");
    if (papers == j.end() || papers->is_null()) {
        return set;
    }
    if (!papers->is_object()) {
        throw std::runtime_error("validation_papers must be an object");
    }

    for (const auto& entry : papers->items()) {
        const nlohmann::json& paper = entry.value();
        if (!paper.is_object()) {
            logger().warn(
                "{}: expected an object, got {}; skipped", entry.key(),
                paper.type_name());
            set.malformed.push_back(entry.key());
            continue;
        }
        CorpusItem item;
        item.paper_id = entry.key();
        item.automated = paper.value("automated_extraction", nlohmann::json::object());
        item.ground_truth = field_or_null(paper, "ground_truth");
        set.items.push_back(std::move(item));
    }
    return set;
}

AnnotationSet load_annotations(const std::filesystem::path& path)
{
    return parse_annotations(read_json(path));
}

ComparisonConfig load_config(const std::filesystem::path& path)
{
    return read_json(path).get<ComparisonConfig>();
}

std::vector<ItemEvaluation> load_item_evaluations(
    const std::filesystem::path& path, ComparisonConfig* config)
{
    const nlohmann::json j = read_json(path);
    std::vector<ItemEvaluation> out;
    try {
        for (const auto& entry : j.at("by_paper").items()) {
            ItemEvaluation e = entry.value().get<ItemEvaluation>();
            e.paper_id = entry.key();
            out.push_back(std::move(e));
        }
        if (config && j.contains("config")) {
            *config = j["config"].get<ComparisonConfig>();
        }
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error(
            "malformed metrics file " + path.string() + ": " + e.what());
    }
    return out;
}

} // namespace extraction_eval
