/**
 * @file LearningPlanPipeline.hpp
 * @brief End-to-end generation of a learning plan from a document.
 */

#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "application/ParallelExecutor.hpp"
#include "application/PipelineConfig.hpp"
#include "application/TopicOrchestrator.hpp"
#include "domain/CompletionService.hpp"
#include "domain/Document.hpp"
#include "domain/LearningPlan.hpp"
#include "domain/TextUnit.hpp"

namespace learnpath::infrastructure {
class PlanCache;
}

namespace learnpath::application {

/**
 * @struct RunOptions
 * @brief Per-run inputs that are not configuration.
 */
struct RunOptions {
    std::string tocText;                          ///< Optional pasted table of contents.
    const CancellationToken* cancel = nullptr;
    StatusCallback statusCallback;
    bool useCache = true;
};

/**
 * @struct SegmentationResult
 * @brief Extraction units plus how they were obtained.
 */
struct SegmentationResult {
    std::vector<domain::TextUnit> units;
    domain::SegmentationMode mode = domain::SegmentationMode::CharacterSplit;
    std::size_t detectedSections = 0; ///< Raw detector count, even when rejected.
};

struct PipelineResult {
    domain::LearningPlan plan;
    ExtractionResult extraction;
    bool fromCache = false;
    bool cancelled = false; ///< Set when cancellation hit extraction or ranking; never cached.
};

/**
 * @class LearningPlanPipeline
 * @brief Session object owning the configuration, the completion service and
 * an optional plan cache. Holds no global state; several pipelines may run
 * side by side.
 *
 * Flow: validate -> cache lookup -> segment -> extract -> merge -> rank ->
 * assemble -> cache store.
 */
class LearningPlanPipeline {
public:
    LearningPlanPipeline(PipelineConfig config,
                         std::shared_ptr<domain::CompletionService> completion,
                         std::shared_ptr<infrastructure::PlanCache> cache = nullptr);

    /**
     * @throws domain::ConfigError for an invalid configuration,
     *         domain::PipelineError for an empty document or zero units.
     */
    PipelineResult run(const domain::Document& document, const RunOptions& options = RunOptions{});

    /**
     * @brief Units for extraction: TOC sections, then detected headings, then
     * plain splitting. Section counts outside the configured band are discarded.
     */
    SegmentationResult segment(const std::string& text, const std::string& tocText = "") const;

    /** @brief SHA-256 over document text, configuration fingerprint and TOC text. */
    std::string cacheKey(const domain::Document& document, const std::string& tocText) const;

    const PipelineConfig& config() const { return m_config; }

private:
    std::vector<domain::TextUnit> unitsFromSections(const std::string& text,
                                                    const std::vector<domain::Section>& sections) const;

    static std::string DocumentId(const domain::Document& document);

    PipelineConfig m_config;
    std::shared_ptr<domain::CompletionService> m_completion;
    std::shared_ptr<infrastructure::PlanCache> m_cache;
};

} // namespace learnpath::application
