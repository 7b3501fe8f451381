/**
 * @file TocParser.hpp
 * @brief Parses a pasted table of contents into chapter entries.
 */

#pragma once
#include <optional>
#include <string>
#include <vector>

namespace learnpath::domain::segmentation {

/**
 * @struct TocEntry
 * @brief One chapter line of a table of contents.
 */
struct TocEntry {
    std::string title;
    std::string number;       ///< "3", "IV"... empty when the line had no number.
    std::optional<int> page;
};

/**
 * @class TocParser
 * @brief Understands the usual TOC shapes:
 *  - "Chapter 1: Introduction ............ 1"
 *  - "4. Joining Tables ........ 89"
 *  - "Part II: Advanced Topics"
 *  - "Advanced Topics ........... 150"
 */
class TocParser {
public:
    static std::vector<TocEntry> Parse(const std::string& tocText);

    /** @brief Parses a single line; nullopt for blanks and front/back matter. */
    static std::optional<TocEntry> ParseLine(const std::string& line);

private:
    static std::vector<TocEntry> FilterEntries(std::vector<TocEntry> entries);
};

} // namespace learnpath::domain::segmentation
