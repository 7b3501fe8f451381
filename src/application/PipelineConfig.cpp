/**
 * @file PipelineConfig.cpp
 * @brief Validation and fingerprint of PipelineConfig.
 */

#include "application/PipelineConfig.hpp"
#include "domain/PipelineErrors.hpp"

#include <nlohmann/json.hpp>

namespace learnpath::application {

namespace {

void ValidateSplitter(const domain::segmentation::SplitterOptions& options, const std::string& name) {
    if (options.unitSize == 0) {
        throw domain::ConfigError(name + ".unit_size must be greater than zero");
    }
    if (options.overlapSize >= options.unitSize) {
        throw domain::ConfigError(name + ".overlap (" + std::to_string(options.overlapSize) +
                                  ") must be smaller than " + name + ".unit_size (" +
                                  std::to_string(options.unitSize) + ")");
    }
}

} // namespace

void PipelineConfig::validate() const {
    ValidateSplitter(chunking, "chunking");
    ValidateSplitter(passages, "passages");

    if (sections.minSections > sections.maxSections) {
        throw domain::ConfigError("sections.min must not exceed sections.max");
    }
    if (topics.maxTopics == 0) {
        throw domain::ConfigError("topics.max must be greater than zero");
    }
    if (topics.minTopics > topics.maxTopics) {
        throw domain::ConfigError("topics.min must not exceed topics.max");
    }
    if (extraction.concurrency == 0) {
        throw domain::ConfigError("extraction.concurrency must be at least 1");
    }
    if (extraction.maxAttempts < 1) {
        throw domain::ConfigError("extraction.max_attempts must be at least 1");
    }
    if (extraction.backoffMs < 0 || extraction.timeoutSeconds <= 0 || extraction.maxTokens <= 0) {
        throw domain::ConfigError("extraction.backoff_ms, timeout_seconds and max_tokens must be positive");
    }
    if (ranking.topK == 0) {
        throw domain::ConfigError("ranking.top_k must be greater than zero");
    }
}

std::string PipelineConfig::fingerprint(const std::string& resolvedModel) const {
    nlohmann::json fp = {
        {"model", resolvedModel},
        {"chunking", {{"unit_size", chunking.unitSize}, {"overlap", chunking.overlapSize}, {"separator", chunking.separator}}},
        {"passages", {{"unit_size", passages.unitSize}, {"overlap", passages.overlapSize}, {"separator", passages.separator}}},
        {"sections", {{"enabled", sections.enabled}, {"min", sections.minSections}, {"max", sections.maxSections}}},
        {"topics", {{"min", topics.minTopics}, {"max", topics.maxTopics}}},
        {"extraction", {{"temperature", extraction.temperature}, {"max_tokens", extraction.maxTokens}}},
        {"ranking", {{"strategy", domain::RankingStrategyToString(ranking.strategy)},
                     {"top_k", ranking.topK},
                     {"max_judged_passages", ranking.maxJudgedPassages}}}
    };
    // nlohmann::json orders object keys, so dump() is canonical.
    return fp.dump();
}

} // namespace learnpath::application
