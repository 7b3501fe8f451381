/**
 * @file TopicMerger.hpp
 * @brief Reconciles per-unit topic candidates into one bounded topic list.
 */

#pragma once
#include <cstddef>
#include <string>
#include <vector>

#include "domain/Topic.hpp"

namespace learnpath::domain::topics {

/**
 * @class TopicMerger
 * @brief Deterministic grouping of near-duplicate candidates.
 *
 * Candidates are ordered by (sourceUnitIndex, positionInUnit) before
 * anything else, so the outcome does not depend on the order in which
 * completions arrived. Titles match when their normalized forms are equal
 * or when the compact form of the shorter one (at least 4 characters) is
 * contained in the compact form of the longer one.
 */
class TopicMerger {
public:
    /**
     * @brief Groups, merges and bounds candidates.
     * @throws ConfigError when targetMax is 0 or targetMin > targetMax.
     * @return At most targetMax topics in order of first appearance.
     *         Fewer than targetMin is returned as is.
     */
    static std::vector<Topic> Merge(const std::vector<TopicCandidate>& candidates,
                                    std::size_t targetMin,
                                    std::size_t targetMax);

    /** @brief Lower-case, non-alphanumerics collapsed to single spaces, trimmed. */
    static std::string NormalizeTitle(const std::string& title);

    static bool TitlesMatch(const std::string& a, const std::string& b);

    /** @brief "Joining Tables!" -> "joining-tables". */
    static std::string Slugify(const std::string& title);

    /** @brief "t03-joining-tables" */
    static std::string MakeTopicId(std::size_t ordinal, const std::string& title);
};

} // namespace learnpath::domain::topics
