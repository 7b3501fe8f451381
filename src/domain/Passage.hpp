/**
 * @file Passage.hpp
 * @brief Ranked supporting excerpt for a topic.
 */

#pragma once
#include <string>
#include <cstddef>

namespace learnpath::domain {

/**
 * @enum RankingStrategy
 * @brief How passages are scored against a topic.
 */
enum class RankingStrategy {
    Keyword,   ///< Deterministic keyword occurrence count.
    Completion ///< One relevance judgment per passage from the completion service.
};

inline const char* RankingStrategyToString(RankingStrategy strategy) {
    return strategy == RankingStrategy::Completion ? "completion" : "keyword";
}

inline RankingStrategy RankingStrategyFromString(const std::string& value) {
    if (value == "completion" || value == "llm") return RankingStrategy::Completion;
    return RankingStrategy::Keyword;
}

/**
 * @struct Passage
 * @brief Created fresh per (topic, strategy) ranking. Not persisted on its own.
 */
struct Passage {
    std::string text;
    std::size_t startOffset = 0;
    double relevanceScore = 0.0;
    std::size_t rank = 0; ///< 1-based.
};

} // namespace learnpath::domain
