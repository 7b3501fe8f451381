/**
 * @file LearningPlanPipeline.cpp
 * @brief Implementation of LearningPlanPipeline.
 */

#include "application/LearningPlanPipeline.hpp"
#include "application/PassageRanker.hpp"
#include "application/PlanAssembler.hpp"
#include "domain/PipelineErrors.hpp"
#include "domain/segmentation/SectionDetector.hpp"
#include "domain/segmentation/SegmentationPolicy.hpp"
#include "domain/segmentation/TextSplitter.hpp"
#include "domain/segmentation/TocParser.hpp"
#include "domain/topics/TopicMerger.hpp"
#include "infrastructure/ContentHasher.hpp"
#include "infrastructure/PlanCache.hpp"

#include <iostream>
#include <map>
#include <utility>

namespace learnpath::application {

using domain::segmentation::SectionDetector;
using domain::segmentation::SegmentationPolicy;
using domain::segmentation::TextSplitter;
using domain::segmentation::TocParser;

LearningPlanPipeline::LearningPlanPipeline(PipelineConfig config,
                                           std::shared_ptr<domain::CompletionService> completion,
                                           std::shared_ptr<infrastructure::PlanCache> cache)
    : m_config(std::move(config)), m_completion(std::move(completion)), m_cache(std::move(cache)) {}

std::string LearningPlanPipeline::DocumentId(const domain::Document& document) {
    const auto& meta = document.getMeta();
    return meta.sourcePath.empty() ? meta.title : meta.sourcePath;
}

std::string LearningPlanPipeline::cacheKey(const domain::Document& document, const std::string& tocText) const {
    const std::string model = m_completion ? m_completion->getCurrentModel() : "";
    return infrastructure::ContentHasher::Sha256Hex(
        std::vector<std::string>{document.getText(), m_config.fingerprint(model), tocText});
}

std::vector<domain::TextUnit> LearningPlanPipeline::unitsFromSections(
    const std::string& text, const std::vector<domain::Section>& sections) const {
    TextSplitter splitter(m_config.chunking);
    std::vector<domain::TextUnit> units;

    for (const auto& section : sections) {
        if (section.endOffset <= section.startOffset) continue;
        std::string slice = text.substr(section.startOffset, section.endOffset - section.startOffset);

        if (slice.size() <= m_config.chunking.unitSize) {
            domain::TextUnit unit;
            unit.startOffset = section.startOffset;
            unit.endOffset = section.endOffset;
            unit.title = section.title;
            unit.text = std::move(slice);
            units.push_back(std::move(unit));
            continue;
        }

        // Oversized section: overlap only inside its own range.
        for (auto& unit : splitter.split(slice, section.startOffset)) {
            unit.title = section.title;
            units.push_back(std::move(unit));
        }
    }
    return units;
}

SegmentationResult LearningPlanPipeline::segment(const std::string& text, const std::string& tocText) const {
    SegmentationResult result;
    if (text.empty()) {
        return result;
    }

    const SegmentationPolicy policy(m_config.sections.minSections, m_config.sections.maxSections);

    auto tryAccept = [&](const std::vector<domain::Section>& sections, domain::SegmentationMode mode) {
        result.detectedSections = sections.size();
        if (sections.empty()) {
            return false;
        }
        if (!policy.accepts(sections.size())) {
            std::cerr << "[Segmentation] Anomaly: " << sections.size() << " "
                      << domain::SegmentationModeToString(mode) << " sections outside ["
                      << policy.minSections() << ", " << policy.maxSections()
                      << "], discarding them" << std::endl;
            return false;
        }
        result.units = unitsFromSections(text, sections);
        result.mode = mode;
        return !result.units.empty();
    };

    if (!tocText.empty()) {
        const auto entries = TocParser::Parse(tocText);
        std::cout << "[Segmentation] Table of contents lists " << entries.size() << " chapters" << std::endl;
        if (tryAccept(SectionDetector::DetectFromToc(text, entries), domain::SegmentationMode::TableOfContents)) {
            return result;
        }
    }

    if (m_config.sections.enabled &&
        tryAccept(SectionDetector::Detect(text), domain::SegmentationMode::DetectedSections)) {
        return result;
    }

    result.units = TextSplitter(m_config.chunking).split(text);
    result.mode = domain::SegmentationMode::CharacterSplit;
    return result;
}

PipelineResult LearningPlanPipeline::run(const domain::Document& document, const RunOptions& options) {
    m_config.validate();

    auto status = [&](const std::string& message) {
        std::cout << "[Pipeline] " << message << std::endl;
        if (options.statusCallback) options.statusCallback(message);
    };

    if (document.isBlank()) {
        throw domain::PipelineError("document '" + document.getMeta().title + "' has no text");
    }
    if (!m_completion) {
        throw domain::PipelineError("no completion service configured");
    }

    const std::string key = cacheKey(document, options.tocText);
    const std::string documentId = DocumentId(document);
    if (m_cache && options.useCache) {
        if (auto cached = m_cache->get(documentId, key)) {
            status("Using cached plan for '" + document.getMeta().title + "'");
            PipelineResult result{std::move(*cached), ExtractionResult{}, true, false};
            return result;
        }
    }

    status("Segmenting " + std::to_string(document.getMeta().wordCount) + " words");
    SegmentationResult segmentation = segment(document.getText(), options.tocText);
    if (segmentation.units.empty()) {
        throw domain::PipelineError("segmentation produced no units");
    }
    status(std::to_string(segmentation.units.size()) + " units (" +
           domain::SegmentationModeToString(segmentation.mode) + ")");

    TopicOrchestrator orchestrator(m_completion, m_config.extraction);
    ExtractionResult extraction =
        orchestrator.extract(segmentation.units, document.getMeta().title, options.cancel, options.statusCallback);
    if (extraction.cancelled) {
        status("Cancelled, continuing with partial results");
    }

    std::vector<domain::Topic> topics =
        domain::topics::TopicMerger::Merge(extraction.candidates, m_config.topics.minTopics, m_config.topics.maxTopics);
    status(std::to_string(extraction.candidates.size()) + " candidates merged into " +
           std::to_string(topics.size()) + " topics");

    PassageRanker ranker(m_completion, m_config.passages, m_config.ranking, m_config.extraction.concurrency);
    const auto passageUnits = ranker.splitPassages(document.getText());

    std::map<std::string, std::vector<domain::Passage>> passagesByTopic;
    for (const auto& topic : topics) {
        passagesByTopic[topic.id] =
            ranker.rank(topic, passageUnits, m_config.ranking.strategy, m_config.ranking.topK, options.cancel);
    }

    const bool cancelled = extraction.cancelled || (options.cancel && options.cancel->isCancelled());
    if (cancelled && !extraction.cancelled) {
        status("Cancelled during passage ranking, some passages were not judged");
    }

    domain::ProcessingInfo info;
    info.segmentation = segmentation.mode;
    info.unitCount = segmentation.units.size();
    info.detectedSections = segmentation.detectedSections;
    info.candidateCount = extraction.candidates.size();
    info.ranking = m_config.ranking.strategy;
    info.model = m_completion->getCurrentModel();
    info.cacheKey = key;

    domain::LearningPlan plan = PlanAssembler::Assemble(document.getMeta(), topics, passagesByTopic, info);

    if (m_cache && !cancelled) {
        m_cache->update(documentId, key, plan);
        if (!m_cache->persist()) {
            std::cerr << "[Pipeline] Plan cache could not be written" << std::endl;
        }
    }

    status("Plan ready: " + std::to_string(plan.getTopics().size()) + " topics");
    return PipelineResult{std::move(plan), std::move(extraction), false, cancelled};
}

} // namespace learnpath::application
