/**
 * @file LearningPlan.hpp
 * @brief The single unit of persistence: topics plus their passages.
 */

#pragma once
#include <map>
#include <string>
#include <vector>
#include <cstddef>
#include <utility>
#include "Document.hpp"
#include "Passage.hpp"
#include "TextUnit.hpp"
#include "Topic.hpp"

namespace learnpath::domain {

/**
 * @struct ProcessingInfo
 * @brief How the plan was produced. Informational only.
 */
struct ProcessingInfo {
    SegmentationMode segmentation = SegmentationMode::CharacterSplit;
    std::size_t unitCount = 0;
    std::size_t detectedSections = 0;
    std::size_t candidateCount = 0;
    RankingStrategy ranking = RankingStrategy::Keyword;
    std::string model;
    std::string cacheKey;
    std::string createdAt;
};

/**
 * @class LearningPlan
 * @brief Document metadata, ordered topics and ranked passages per topic id.
 *
 * Fully replaced on reprocessing.
 */
class LearningPlan {
public:
    LearningPlan() = default;
    LearningPlan(DocumentMeta meta,
                 std::vector<Topic> topics,
                 std::map<std::string, std::vector<Passage>> passages,
                 ProcessingInfo info)
        : m_meta(std::move(meta)),
          m_topics(std::move(topics)),
          m_passages(std::move(passages)),
          m_info(std::move(info)) {}

    const DocumentMeta& getMeta() const { return m_meta; }
    const std::vector<Topic>& getTopics() const { return m_topics; }
    const ProcessingInfo& getInfo() const { return m_info; }
    const std::map<std::string, std::vector<Passage>>& getAllPassages() const { return m_passages; }

    /** @brief Ranked passages for a topic, or an empty list for unknown ids. */
    const std::vector<Passage>& getPassages(const std::string& topicId) const {
        static const std::vector<Passage> kEmpty;
        auto it = m_passages.find(topicId);
        return it != m_passages.end() ? it->second : kEmpty;
    }

    const Topic* findTopic(const std::string& topicId) const {
        for (const auto& topic : m_topics) {
            if (topic.id == topicId) return &topic;
        }
        return nullptr;
    }

private:
    DocumentMeta m_meta;
    std::vector<Topic> m_topics;
    std::map<std::string, std::vector<Passage>> m_passages;
    ProcessingInfo m_info;
};

} // namespace learnpath::domain
