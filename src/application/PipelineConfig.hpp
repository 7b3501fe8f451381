/**
 * @file PipelineConfig.hpp
 * @brief Tunables of one learning plan pipeline session.
 */

#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "domain/Passage.hpp"
#include "domain/segmentation/TextSplitter.hpp"

namespace learnpath::application {

struct OllamaSettings {
    std::string host = "localhost";
    int port = 11434;
    std::string model = "auto"; ///< "auto" picks an installed model.
    /// Order in which "auto" tries installed models; exact names or fragments.
    std::vector<std::string> preferredModels = {"qwen2.5", "llama3.1", "mistral-nemo", "gemma2", "llama3"};
};

struct SectionSettings {
    bool enabled = true;
    std::size_t minSections = 3;
    std::size_t maxSections = 20;
};

struct TopicSettings {
    std::size_t minTopics = 8;
    std::size_t maxTopics = 15;
};

struct ExtractionSettings {
    std::size_t concurrency = 2;
    int maxAttempts = 3;
    int backoffMs = 500;
    int timeoutSeconds = 600;
    double temperature = 0.3;
    int maxTokens = 4000;
};

struct RankingSettings {
    domain::RankingStrategy strategy = domain::RankingStrategy::Keyword;
    std::size_t topK = 5;
    std::size_t maxJudgedPassages = 50;
    int timeoutSeconds = 120;
};

/**
 * @struct PipelineConfig
 * @brief Plain settings aggregate. Defaults give about 2457 words per
 * extraction unit with a 10% overlap and 1000-character passages with 20%.
 */
struct PipelineConfig {
    OllamaSettings ollama;
    domain::segmentation::SplitterOptions chunking{14742, 1470, "\n\n"};
    domain::segmentation::SplitterOptions passages{1000, 200, "\n\n"};
    SectionSettings sections;
    TopicSettings topics;
    ExtractionSettings extraction;
    RankingSettings ranking;
    std::string plansDir; ///< Empty means PathUtils::GetPlansDir().

    /** @throws domain::ConfigError on the first invalid value. */
    void validate() const;

    /**
     * @brief Canonical text of every setting that changes the produced plan.
     * Host, port, concurrency and storage are left out.
     */
    std::string fingerprint(const std::string& resolvedModel) const;
};

} // namespace learnpath::application
