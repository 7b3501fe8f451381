/**
 * @file TextSplitter.hpp
 * @brief Character-precise overlapping chunking of long text.
 */

#pragma once
#include <string>
#include <vector>
#include <cstddef>
#include "domain/TextUnit.hpp"

namespace learnpath::domain::segmentation {

/**
 * @struct SplitterOptions
 * @brief Sizes are byte counts. overlapSize must be smaller than unitSize.
 */
struct SplitterOptions {
    std::size_t unitSize = 1000;
    std::size_t overlapSize = 200;
    std::string separator = "\n\n";
};

/**
 * @class TextSplitter
 * @brief Splits text into ordered, gap-free units with controlled overlap.
 *
 * Cuts prefer, in order: the last paragraph separator, the last sentence end,
 * the last whitespace, and finally a hard cut at unitSize. Every unit after the
 * first starts overlapSize bytes before the previous end, moved back to a
 * whitespace boundary so the overlap does not begin mid-token.
 */
class TextSplitter {
public:
    /** @throws ConfigError when unitSize is zero or overlapSize >= unitSize. */
    explicit TextSplitter(SplitterOptions options);

    /**
     * @brief Splits the text. Deterministic for a given text and options.
     * @return Units covering [0, text.size()); empty for empty input.
     */
    std::vector<TextUnit> split(const std::string& text) const;

    /**
     * @brief Same as split() but offsets are shifted by baseOffset.
     * Used when a range of a larger document is split on its own.
     */
    std::vector<TextUnit> split(const std::string& text, std::size_t baseOffset) const;

    /**
     * @brief Start of the unit that follows [unitStart, unitEnd).
     *
     * unitEnd - overlapSize clamped back to the nearest preceding whitespace
     * boundary, never further than overlapSize bytes and never at or before
     * unitStart. With a zero overlap this is unitEnd.
     */
    std::size_t overlapStart(const std::string& text, std::size_t unitStart, std::size_t unitEnd) const;

    const SplitterOptions& options() const { return m_options; }

    /** @brief Convenience wrapper: validates and splits in one call. */
    static std::vector<TextUnit> Split(const std::string& text,
                                       std::size_t unitSize,
                                       std::size_t overlapSize,
                                       const std::string& separator = "\n\n");

private:
    std::size_t findCut(const std::string& text, std::size_t start) const;
    std::size_t minimumUnitLength() const;

    SplitterOptions m_options;
};

} // namespace learnpath::domain::segmentation
