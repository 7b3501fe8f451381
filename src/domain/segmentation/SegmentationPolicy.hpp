/**
 * @file SegmentationPolicy.hpp
 * @brief Plausibility band for detected section counts.
 */

#pragma once
#include <cstddef>
#include <string>

#include "domain/PipelineErrors.hpp"

namespace learnpath::domain::segmentation {

/**
 * @class SegmentationPolicy
 * @brief Decides whether a detected section count is believable.
 *
 * Heading detection on real books regularly reports hundreds of "sections"
 * (running headers, ALL-CAPS captions). Counts outside [min, max] are
 * discarded and the caller falls back to plain splitting.
 */
class SegmentationPolicy {
public:
    SegmentationPolicy(std::size_t minSections = 3, std::size_t maxSections = 20)
        : m_min(minSections), m_max(maxSections) {
        if (m_min > m_max) {
            throw ConfigError("sections.min (" + std::to_string(m_min) +
                              ") must not exceed sections.max (" + std::to_string(m_max) + ")");
        }
    }

    bool accepts(std::size_t sectionCount) const {
        return sectionCount >= m_min && sectionCount <= m_max;
    }

    std::size_t minSections() const { return m_min; }
    std::size_t maxSections() const { return m_max; }

private:
    std::size_t m_min;
    std::size_t m_max;
};

} // namespace learnpath::domain::segmentation
