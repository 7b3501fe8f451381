/**
 * @file TextUnit.hpp
 * @brief Slices of a document used as extraction or ranking inputs.
 */

#pragma once
#include <string>
#include <cstddef>

namespace learnpath::domain {

/**
 * @struct TextUnit
 * @brief A (text, start, end) triple. Offsets are byte positions into the document text.
 *
 * Invariant: endOffset - startOffset == text.size().
 */
struct TextUnit {
    std::string text;
    std::size_t startOffset = 0;
    std::size_t endOffset = 0;
    std::string title; ///< Section title when produced from a detected section.

    std::size_t length() const { return endOffset - startOffset; }
};

/**
 * @struct Section
 * @brief A logical section (chapter) detected in the document.
 */
struct Section {
    std::string title;
    std::size_t startOffset = 0;
    std::size_t endOffset = 0;
};

/**
 * @enum SegmentationMode
 * @brief Which segmentation produced the extraction units.
 */
enum class SegmentationMode {
    CharacterSplit,
    DetectedSections,
    TableOfContents
};

inline const char* SegmentationModeToString(SegmentationMode mode) {
    switch (mode) {
        case SegmentationMode::CharacterSplit: return "character_split";
        case SegmentationMode::DetectedSections: return "detected_sections";
        case SegmentationMode::TableOfContents: return "table_of_contents";
    }
    return "character_split";
}

inline SegmentationMode SegmentationModeFromString(const std::string& value) {
    if (value == "detected_sections") return SegmentationMode::DetectedSections;
    if (value == "table_of_contents") return SegmentationMode::TableOfContents;
    return SegmentationMode::CharacterSplit;
}

} // namespace learnpath::domain
