#include "infrastructure/PromptCatalog.hpp"

namespace learnpath::infrastructure {

std::string PromptCatalog::TopicExtraction(const std::string& documentTitle,
                                           const std::string& unitTitle,
                                           const std::string& unitText) {
    std::string scope = unitTitle.empty()
        ? "an excerpt of the book \"" + documentTitle + "\""
        : "the section \"" + unitTitle + "\" of the book \"" + documentTitle + "\"";

    return
        "You are an expert educator analyzing " + scope + ".\n\n"
        "Identify the key learning topics a student should understand from this text.\n"
        "For each topic:\n"
        "1. Provide a clear, concise title\n"
        "2. Write a brief description (1-2 sentences) of what will be covered\n"
        "3. Estimate the importance level (High/Medium/Low)\n"
        "4. List up to 5 keywords that appear in the text\n\n"
        "CRITICAL INSTRUCTIONS:\n"
        "- Respond with ONLY valid JSON, no explanations and no markdown\n"
        "- Start your response with [ and end with ]\n"
        "- Return an empty array [] if the text has no teachable content\n\n"
        "Format:\n"
        "[\n"
        "  {\"topic_number\": 1, \"title\": \"Topic Title\", \"description\": \"What this topic covers\", "
        "\"importance\": \"High\", \"keywords\": [\"term\"]}\n"
        "]\n\n"
        "Text:\n" + unitText;
}

std::string PromptCatalog::PassageRelevance(const std::string& topicTitle,
                                            const std::string& topicDescription,
                                            const std::string& passageText) {
    return
        "Topic: " + topicTitle + "\n"
        "Description: " + topicDescription + "\n\n"
        "Rate how relevant the passage below is for learning this topic, from 0 (unrelated) to 10 "
        "(directly explains the topic). A passage is relevant if it discusses the topic, gives essential "
        "background, or contains key examples.\n\n"
        "Passage:\n" + passageText + "\n\n"
        "Respond ONLY with JSON: {\"score\": <number 0-10>}";
}

} // namespace learnpath::infrastructure
