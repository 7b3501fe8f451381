/**
 * @file PassageRanker.hpp
 * @brief Retrieves the passages that best support a topic.
 */

#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "application/ParallelExecutor.hpp"
#include "application/PipelineConfig.hpp"
#include "domain/CompletionService.hpp"
#include "domain/Passage.hpp"
#include "domain/TextUnit.hpp"
#include "domain/Topic.hpp"

namespace learnpath::application {

/**
 * @class PassageRanker
 * @brief Scores passage-sized slices of the document against a topic.
 *
 * Keyword strategy: the score is the total number of non-overlapping,
 * case-insensitive occurrences of the topic keywords. Pure and deterministic.
 *
 * Completion strategy: the best keyword-scored passages (up to
 * maxJudgedPassages) are judged 0-10 by the completion service; everything
 * else, and every failed judgment, scores 0.
 *
 * Results are ordered by score descending, then start offset ascending.
 */
class PassageRanker {
public:
    /** @param completion May be null when only the keyword strategy is used. */
    PassageRanker(std::shared_ptr<domain::CompletionService> completion,
                  domain::segmentation::SplitterOptions passageOptions,
                  RankingSettings settings,
                  std::size_t concurrency = 1);

    /** @brief Splits the document into passages with the passage options. */
    std::vector<domain::TextUnit> splitPassages(const std::string& documentText) const;

    /** @brief Returns exactly min(topK, passage count) passages, ranks 1..n. */
    std::vector<domain::Passage> rank(const domain::Topic& topic,
                                      const std::string& documentText,
                                      domain::RankingStrategy strategy,
                                      std::size_t topK,
                                      const CancellationToken* cancel = nullptr) const;

    /** @brief Same as above over passages that were already split. */
    std::vector<domain::Passage> rank(const domain::Topic& topic,
                                      const std::vector<domain::TextUnit>& passages,
                                      domain::RankingStrategy strategy,
                                      std::size_t topK,
                                      const CancellationToken* cancel = nullptr) const;

    /**
     * @brief Lower-cased words of title, description and keywords, minus stop
     * words and words of 3 letters or less, deduplicated in first-seen order.
     */
    static std::vector<std::string> ExtractKeywords(const domain::Topic& topic);

    static double KeywordScore(const std::string& text, const std::vector<std::string>& keywords);

    /** @brief Reads {"score": n} or the first number of the response, clamped to [0, 10]. */
    static std::optional<double> ParseRelevanceScore(const std::string& response);

private:
    std::vector<double> judgeWithCompletion(const domain::Topic& topic,
                                            const std::vector<domain::TextUnit>& passages,
                                            const std::vector<double>& keywordScores,
                                            const CancellationToken* cancel) const;

    std::shared_ptr<domain::CompletionService> m_completion;
    domain::segmentation::SplitterOptions m_passageOptions;
    RankingSettings m_settings;
    std::size_t m_concurrency;
};

} // namespace learnpath::application
