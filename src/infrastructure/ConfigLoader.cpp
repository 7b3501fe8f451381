/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include "domain/PipelineErrors.hpp"
#include "infrastructure/PersistenceService.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <nlohmann/json.hpp>

namespace learnpath::infrastructure {

using json = nlohmann::json;

namespace {

const json* Child(const json& j, const char* key) {
    if (j.is_object() && j.contains(key)) {
        return &j.at(key);
    }
    return nullptr;
}

void ReadSize(const json& section, const char* key, const std::string& name, std::size_t& target) {
    const json* value = Child(section, key);
    if (!value) return;
    if (!value->is_number_integer() || value->get<long long>() < 0) {
        throw domain::ConfigError(name + " must be a non-negative integer");
    }
    target = value->get<std::size_t>();
}

void ReadInt(const json& section, const char* key, const std::string& name, int& target) {
    const json* value = Child(section, key);
    if (!value) return;
    if (!value->is_number_integer()) {
        throw domain::ConfigError(name + " must be an integer");
    }
    target = value->get<int>();
}

void ReadDouble(const json& section, const char* key, const std::string& name, double& target) {
    const json* value = Child(section, key);
    if (!value) return;
    if (!value->is_number()) {
        throw domain::ConfigError(name + " must be a number");
    }
    target = value->get<double>();
}

void ReadBool(const json& section, const char* key, const std::string& name, bool& target) {
    const json* value = Child(section, key);
    if (!value) return;
    if (!value->is_boolean()) {
        throw domain::ConfigError(name + " must be true or false");
    }
    target = value->get<bool>();
}

void ReadString(const json& section, const char* key, const std::string& name, std::string& target) {
    const json* value = Child(section, key);
    if (!value) return;
    if (!value->is_string()) {
        throw domain::ConfigError(name + " must be a string");
    }
    target = value->get<std::string>();
}

void ReadStringList(const json& section, const char* key, const std::string& name, std::vector<std::string>& target) {
    const json* value = Child(section, key);
    if (!value) return;
    if (!value->is_array()) {
        throw domain::ConfigError(name + " must be a list of strings");
    }
    std::vector<std::string> items;
    for (const auto& item : *value) {
        if (!item.is_string()) {
            throw domain::ConfigError(name + " must be a list of strings");
        }
        items.push_back(item.get<std::string>());
    }
    target = std::move(items);
}

void ReadSplitter(const json& root, const char* sectionName, domain::segmentation::SplitterOptions& options) {
    const json* section = Child(root, sectionName);
    if (!section) return;
    const std::string prefix = std::string(sectionName) + ".";
    ReadSize(*section, "unit_size", prefix + "unit_size", options.unitSize);
    ReadSize(*section, "overlap", prefix + "overlap", options.overlapSize);
    ReadString(*section, "separator", prefix + "separator", options.separator);
}

application::PipelineConfig FromJson(const json& root) {
    application::PipelineConfig config;
    if (!root.is_object()) {
        throw domain::ConfigError("settings must be a JSON object");
    }

    if (const json* ollama = Child(root, "ollama")) {
        ReadString(*ollama, "host", "ollama.host", config.ollama.host);
        ReadInt(*ollama, "port", "ollama.port", config.ollama.port);
        ReadString(*ollama, "model", "ollama.model", config.ollama.model);
        ReadStringList(*ollama, "preferred_models", "ollama.preferred_models", config.ollama.preferredModels);
    }

    ReadSplitter(root, "chunking", config.chunking);
    ReadSplitter(root, "passages", config.passages);

    if (const json* sections = Child(root, "sections")) {
        ReadBool(*sections, "enabled", "sections.enabled", config.sections.enabled);
        ReadSize(*sections, "min", "sections.min", config.sections.minSections);
        ReadSize(*sections, "max", "sections.max", config.sections.maxSections);
    }

    if (const json* topics = Child(root, "topics")) {
        ReadSize(*topics, "min", "topics.min", config.topics.minTopics);
        ReadSize(*topics, "max", "topics.max", config.topics.maxTopics);
    }

    if (const json* extraction = Child(root, "extraction")) {
        ReadSize(*extraction, "concurrency", "extraction.concurrency", config.extraction.concurrency);
        ReadInt(*extraction, "max_attempts", "extraction.max_attempts", config.extraction.maxAttempts);
        ReadInt(*extraction, "backoff_ms", "extraction.backoff_ms", config.extraction.backoffMs);
        ReadInt(*extraction, "timeout_seconds", "extraction.timeout_seconds", config.extraction.timeoutSeconds);
        ReadDouble(*extraction, "temperature", "extraction.temperature", config.extraction.temperature);
        ReadInt(*extraction, "max_tokens", "extraction.max_tokens", config.extraction.maxTokens);
    }

    if (const json* ranking = Child(root, "ranking")) {
        std::string strategy = domain::RankingStrategyToString(config.ranking.strategy);
        ReadString(*ranking, "strategy", "ranking.strategy", strategy);
        if (strategy != "keyword" && strategy != "completion" && strategy != "llm") {
            throw domain::ConfigError("ranking.strategy must be 'keyword' or 'completion'");
        }
        config.ranking.strategy = domain::RankingStrategyFromString(strategy);
        ReadSize(*ranking, "top_k", "ranking.top_k", config.ranking.topK);
        ReadSize(*ranking, "max_judged_passages", "ranking.max_judged_passages", config.ranking.maxJudgedPassages);
        ReadInt(*ranking, "timeout_seconds", "ranking.timeout_seconds", config.ranking.timeoutSeconds);
    }

    if (const json* storage = Child(root, "storage")) {
        ReadString(*storage, "plans_dir", "storage.plans_dir", config.plansDir);
    }
    return config;
}

json ToJson(const application::PipelineConfig& config) {
    return {
        {"ollama", {{"host", config.ollama.host},
                    {"port", config.ollama.port},
                    {"model", config.ollama.model},
                    {"preferred_models", config.ollama.preferredModels}}},
        {"chunking", {{"unit_size", config.chunking.unitSize},
                      {"overlap", config.chunking.overlapSize},
                      {"separator", config.chunking.separator}}},
        {"passages", {{"unit_size", config.passages.unitSize},
                      {"overlap", config.passages.overlapSize},
                      {"separator", config.passages.separator}}},
        {"sections", {{"enabled", config.sections.enabled},
                      {"min", config.sections.minSections},
                      {"max", config.sections.maxSections}}},
        {"topics", {{"min", config.topics.minTopics}, {"max", config.topics.maxTopics}}},
        {"extraction", {{"concurrency", config.extraction.concurrency},
                        {"max_attempts", config.extraction.maxAttempts},
                        {"backoff_ms", config.extraction.backoffMs},
                        {"timeout_seconds", config.extraction.timeoutSeconds},
                        {"temperature", config.extraction.temperature},
                        {"max_tokens", config.extraction.maxTokens}}},
        {"ranking", {{"strategy", domain::RankingStrategyToString(config.ranking.strategy)},
                     {"top_k", config.ranking.topK},
                     {"max_judged_passages", config.ranking.maxJudgedPassages},
                     {"timeout_seconds", config.ranking.timeoutSeconds}}},
        {"storage", {{"plans_dir", config.plansDir}}}
    };
}

} // namespace

application::PipelineConfig ConfigLoader::FromJsonText(const std::string& text) {
    return FromJson(json::parse(text));
}

application::PipelineConfig ConfigLoader::Load(const std::string& path) {
    application::PipelineConfig config;

    if (!path.empty() && std::filesystem::exists(path)) {
        std::ifstream f(path);
        std::stringstream buffer;
        buffer << f.rdbuf();
        try {
            config = FromJsonText(buffer.str());
            std::cout << "[ConfigLoader] Loaded " << path << std::endl;
        } catch (const json::parse_error& e) {
            std::cerr << "[ConfigLoader] Error reading " << path << ": " << e.what()
                      << ". Using defaults." << std::endl;
        }
    }

    ApplyEnvironment(config);
    return config;
}

bool ConfigLoader::Save(const std::string& path, const application::PipelineConfig& config) {
    return PersistenceService::WriteAtomic(path, ToJson(config).dump(4));
}

void ConfigLoader::ApplyEnvironment(application::PipelineConfig& config) {
    if (const char* host = std::getenv("LEARNPATH_OLLAMA_HOST"); host && *host) {
        config.ollama.host = host;
    }
    if (const char* port = std::getenv("LEARNPATH_OLLAMA_PORT"); port && *port) {
        try {
            config.ollama.port = std::stoi(port);
        } catch (const std::exception&) {
            throw domain::ConfigError(std::string("LEARNPATH_OLLAMA_PORT is not a number: ") + port);
        }
    }
    if (const char* model = std::getenv("LEARNPATH_MODEL"); model && *model) {
        config.ollama.model = model;
    }
}

} // namespace learnpath::infrastructure
