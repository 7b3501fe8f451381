/**
 * @file Topic.hpp
 * @brief Topic candidates and canonical topics.
 */

#pragma once
#include <string>
#include <vector>
#include <cctype>
#include <cstddef>

namespace learnpath::domain {

/**
 * @enum Importance
 * @brief Importance level reported by the model. Ordered High > Medium > Low.
 */
enum class Importance {
    Low = 0,
    Medium = 1,
    High = 2
};

inline std::string ImportanceToString(Importance importance) {
    switch (importance) {
        case Importance::High: return "High";
        case Importance::Medium: return "Medium";
        case Importance::Low: return "Low";
    }
    return "Medium";
}

/** @brief Case-insensitive parse; anything unrecognized is Medium. */
inline Importance ImportanceFromString(const std::string& value) {
    std::string token;
    for (char ch : value) {
        unsigned char c = static_cast<unsigned char>(ch);
        if (std::isalpha(c)) token.push_back(static_cast<char>(std::tolower(c)));
    }
    if (token == "high" || token == "critical" || token == "essential") return Importance::High;
    if (token == "low" || token == "optional") return Importance::Low;
    return Importance::Medium;
}

/**
 * @struct TopicCandidate
 * @brief Unreconciled topic proposal from a single unit. Lives for one pipeline run.
 */
struct TopicCandidate {
    std::string title;
    std::string description;
    Importance importance = Importance::Medium;
    std::size_t sourceUnitIndex = 0;
    std::size_t positionInUnit = 0; ///< Order of the candidate inside its unit's response.
    std::vector<std::string> keywords;
};

/**
 * @struct Topic
 * @brief Canonical, deduplicated learning concept. Immutable once merged.
 */
struct Topic {
    std::string id;          ///< Stable key for passages and downstream study state.
    std::string title;
    std::string description;
    Importance importance = Importance::Medium;
    std::size_t ordinal = 0; ///< 1-based position in the plan.
    std::size_t firstUnitIndex = 0;
    std::vector<std::string> keywords;
};

} // namespace learnpath::domain
