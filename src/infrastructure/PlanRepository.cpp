/**
 * @file PlanRepository.cpp
 * @brief Implementation of PlanRepository.
 */

#include "infrastructure/PlanRepository.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <utility>
#include <vector>

namespace learnpath::infrastructure {

using json = nlohmann::json;

PlanRepository::PlanRepository(PersistenceService& persistence) : m_persistence(persistence) {}

json PlanRepository::ToJson(const domain::LearningPlan& plan) {
    const auto& meta = plan.getMeta();
    const auto& info = plan.getInfo();

    json topics = json::array();
    for (const auto& topic : plan.getTopics()) {
        json passages = json::array();
        for (const auto& passage : plan.getPassages(topic.id)) {
            passages.push_back({
                {"rank", passage.rank},
                {"score", passage.relevanceScore},
                {"start_offset", passage.startOffset},
                {"text", passage.text}
            });
        }
        topics.push_back({
            {"id", topic.id},
            {"ordinal", topic.ordinal},
            {"title", topic.title},
            {"description", topic.description},
            {"importance", domain::ImportanceToString(topic.importance)},
            {"first_unit", topic.firstUnitIndex},
            {"keywords", topic.keywords},
            {"passages", passages}
        });
    }

    return {
        {"version", kFormatVersion},
        {"document", {
            {"title", meta.title},
            {"author", meta.author},
            {"source_path", meta.sourcePath},
            {"word_count", meta.wordCount},
            {"char_count", meta.charCount}
        }},
        {"processing", {
            {"segmentation", domain::SegmentationModeToString(info.segmentation)},
            {"unit_count", info.unitCount},
            {"detected_sections", info.detectedSections},
            {"candidate_count", info.candidateCount},
            {"ranking", domain::RankingStrategyToString(info.ranking)},
            {"model", info.model},
            {"cache_key", info.cacheKey},
            {"created_at", info.createdAt}
        }},
        {"topics", topics}
    };
}

std::optional<domain::LearningPlan> PlanRepository::FromJson(const json& j) {
    try {
        if (!j.is_object() || !j.contains("topics") || !j.at("topics").is_array()) {
            return std::nullopt;
        }

        domain::DocumentMeta meta;
        const json& doc = j.at("document");
        meta.title = doc.at("title").get<std::string>();
        meta.author = doc.value("author", "");
        meta.sourcePath = doc.value("source_path", "");
        meta.wordCount = doc.value("word_count", std::size_t{0});
        meta.charCount = doc.value("char_count", std::size_t{0});

        domain::ProcessingInfo info;
        if (j.contains("processing")) {
            const json& p = j.at("processing");
            info.segmentation = domain::SegmentationModeFromString(p.value("segmentation", ""));
            info.unitCount = p.value("unit_count", std::size_t{0});
            info.detectedSections = p.value("detected_sections", std::size_t{0});
            info.candidateCount = p.value("candidate_count", std::size_t{0});
            info.ranking = domain::RankingStrategyFromString(p.value("ranking", ""));
            info.model = p.value("model", "");
            info.cacheKey = p.value("cache_key", "");
            info.createdAt = p.value("created_at", "");
        }

        std::vector<domain::Topic> topics;
        std::map<std::string, std::vector<domain::Passage>> passages;
        for (const auto& item : j.at("topics")) {
            domain::Topic topic;
            topic.id = item.at("id").get<std::string>();
            topic.ordinal = item.at("ordinal").get<std::size_t>();
            topic.title = item.at("title").get<std::string>();
            topic.description = item.value("description", "");
            topic.importance = domain::ImportanceFromString(item.value("importance", "Medium"));
            topic.firstUnitIndex = item.value("first_unit", std::size_t{0});
            topic.keywords = item.value("keywords", std::vector<std::string>{});

            auto& list = passages[topic.id];
            if (item.contains("passages")) {
                for (const auto& p : item.at("passages")) {
                    domain::Passage passage;
                    passage.rank = p.at("rank").get<std::size_t>();
                    passage.relevanceScore = p.value("score", 0.0);
                    passage.startOffset = p.value("start_offset", std::size_t{0});
                    passage.text = p.at("text").get<std::string>();
                    list.push_back(std::move(passage));
                }
            }
            topics.push_back(std::move(topic));
        }

        return domain::LearningPlan(std::move(meta), std::move(topics), std::move(passages), std::move(info));
    } catch (const json::exception& e) {
        std::cerr << "[PlanRepository] Invalid plan document: " << e.what() << std::endl;
        return std::nullopt;
    }
}

bool PlanRepository::save(const domain::LearningPlan& plan, const std::string& path) {
    saveAsync(plan, path);
    if (!m_persistence.flush()) {
        std::cerr << "[PlanRepository] Failed to write " << path << std::endl;
        return false;
    }
    return true;
}

void PlanRepository::saveAsync(const domain::LearningPlan& plan, const std::string& path) {
    m_persistence.saveTextAsync(path, ToJson(plan).dump(2));
}

std::optional<domain::LearningPlan> PlanRepository::Load(const std::string& path) {
    if (!std::filesystem::exists(path)) {
        return std::nullopt;
    }
    std::ifstream f(path);
    if (!f.is_open()) {
        std::cerr << "[PlanRepository] Could not open " << path << std::endl;
        return std::nullopt;
    }
    try {
        return FromJson(json::parse(f));
    } catch (const json::parse_error& e) {
        std::cerr << "[PlanRepository] Error reading " << path << ": " << e.what() << std::endl;
        return std::nullopt;
    }
}

} // namespace learnpath::infrastructure
