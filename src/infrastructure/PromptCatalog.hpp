/**
 * @file PromptCatalog.hpp
 * @brief Central storage for the prompts sent to the completion model.
 */

#pragma once

#include <string>

namespace learnpath::infrastructure {

class PromptCatalog {
public:
    /**
     * @brief Prompt asking for the learning topics of one unit, as a JSON array.
     * @param unitTitle Section title when the unit is a detected section, empty otherwise.
     */
    static std::string TopicExtraction(const std::string& documentTitle,
                                       const std::string& unitTitle,
                                       const std::string& unitText);

    /** @brief Prompt asking for a 0-10 relevance score of one passage for one topic. */
    static std::string PassageRelevance(const std::string& topicTitle,
                                        const std::string& topicDescription,
                                        const std::string& passageText);
};

} // namespace learnpath::infrastructure
