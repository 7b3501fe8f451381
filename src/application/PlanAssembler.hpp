/**
 * @file PlanAssembler.hpp
 * @brief Builds the final LearningPlan aggregate.
 */

#pragma once

#include <map>
#include <string>
#include <vector>

#include "domain/LearningPlan.hpp"

namespace learnpath::application {

class PlanAssembler {
public:
    /**
     * @brief Combines metadata, topics and passages into a plan.
     *
     * Every topic must have a passages entry (possibly empty); extra entries
     * for unknown topic ids are dropped. createdAt is stamped when empty.
     * @throws std::logic_error if a topic has no passages entry.
     */
    static domain::LearningPlan Assemble(const domain::DocumentMeta& meta,
                                         const std::vector<domain::Topic>& topics,
                                         const std::map<std::string, std::vector<domain::Passage>>& passagesByTopic,
                                         domain::ProcessingInfo info);

    /** @brief Current UTC time as "YYYY-MM-DDTHH:MM:SSZ". */
    static std::string CurrentTimestamp();
};

} // namespace learnpath::application
