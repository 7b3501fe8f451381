/**
 * @file SectionDetector.hpp
 * @brief Finds chapter-like headings in plain text.
 */

#pragma once
#include <string>
#include <vector>

#include "domain/TextUnit.hpp"
#include "domain/segmentation/TocParser.hpp"

namespace learnpath::domain::segmentation {

/**
 * @class SectionDetector
 * @brief Stateless heading detection.
 *
 * Both detectors return sections that cover the whole text: the first
 * section starts at 0 and each section ends where the next one begins.
 * An empty result means nothing usable was found.
 */
class SectionDetector {
public:
    /**
     * @brief Heading patterns on line starts: "Chapter N", "CHAPTER N",
     * "N. Title", "PART IV" and ALL-CAPS lines of 15 to 60 characters.
     */
    static std::vector<Section> Detect(const std::string& text);

    /**
     * @brief Locates each TOC title in the text, in order.
     * Entries that cannot be found are skipped.
     */
    static std::vector<Section> DetectFromToc(const std::string& text,
                                              const std::vector<TocEntry>& entries);

    /** @brief True when a single (trimmed) line looks like a heading. */
    static bool IsHeading(const std::string& line);

private:
    struct Anchor {
        std::string title;
        std::size_t offset;
    };
    static std::vector<Section> BuildSections(const std::vector<Anchor>& anchors, std::size_t textSize);
};

} // namespace learnpath::domain::segmentation
