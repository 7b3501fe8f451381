/**
 * @file TextSplitter.cpp
 * @brief Implementation of TextSplitter.
 */

#include "domain/segmentation/TextSplitter.hpp"
#include "domain/PipelineErrors.hpp"

#include <algorithm>
#include <cctype>
#include <string>
#include <utility>

namespace learnpath::domain::segmentation {

namespace {

bool IsSpace(char ch) {
    return std::isspace(static_cast<unsigned char>(ch)) != 0;
}

bool IsSentenceEnd(char ch) {
    return ch == '.' || ch == '!' || ch == '?';
}

bool IsUtf8Continuation(char ch) {
    return (static_cast<unsigned char>(ch) & 0xC0) == 0x80;
}

} // namespace

TextSplitter::TextSplitter(SplitterOptions options) : m_options(std::move(options)) {
    if (m_options.unitSize == 0) {
        throw ConfigError("unit size must be greater than zero");
    }
    if (m_options.overlapSize >= m_options.unitSize) {
        throw ConfigError("overlap size (" + std::to_string(m_options.overlapSize) +
                          ") must be smaller than unit size (" + std::to_string(m_options.unitSize) + ")");
    }
}

std::vector<TextUnit> TextSplitter::Split(const std::string& text,
                                          std::size_t unitSize,
                                          std::size_t overlapSize,
                                          const std::string& separator) {
    SplitterOptions options;
    options.unitSize = unitSize;
    options.overlapSize = overlapSize;
    options.separator = separator;
    return TextSplitter(options).split(text);
}

std::vector<TextUnit> TextSplitter::split(const std::string& text) const {
    return split(text, 0);
}

std::vector<TextUnit> TextSplitter::split(const std::string& text, std::size_t baseOffset) const {
    std::vector<TextUnit> units;
    if (text.empty()) {
        return units;
    }

    std::size_t start = 0;
    while (start < text.size()) {
        std::size_t end = (text.size() - start <= m_options.unitSize) ? text.size() : findCut(text, start);

        TextUnit unit;
        unit.startOffset = baseOffset + start;
        unit.endOffset = baseOffset + end;
        unit.text = text.substr(start, end - start);
        units.push_back(std::move(unit));

        if (end == text.size()) {
            break;
        }
        start = overlapStart(text, start, end);
    }
    return units;
}

std::size_t TextSplitter::minimumUnitLength() const {
    // Keeps every cut far enough from the unit start that the next unit still advances.
    return std::max(m_options.unitSize / 2, m_options.overlapSize + 1);
}

std::size_t TextSplitter::findCut(const std::string& text, std::size_t start) const {
    const std::size_t limit = start + m_options.unitSize;
    const std::size_t earliest = start + minimumUnitLength();

    // 1. Paragraph separator, cut after it.
    const std::string& sep = m_options.separator;
    if (!sep.empty() && sep.size() <= m_options.unitSize) {
        std::size_t pos = text.rfind(sep, limit - sep.size());
        if (pos != std::string::npos && pos >= start) {
            std::size_t cut = pos + sep.size();
            if (cut >= earliest) {
                return cut;
            }
        }
    }

    // 2. Sentence end followed by whitespace, cut after the whitespace.
    for (std::size_t i = limit; i > earliest; --i) {
        const std::size_t ws = i - 1;
        if (ws >= 1 && IsSpace(text[ws]) && IsSentenceEnd(text[ws - 1])) {
            return i;
        }
    }

    // 3. Any whitespace.
    for (std::size_t i = limit; i > earliest; --i) {
        if (IsSpace(text[i - 1])) {
            return i;
        }
    }

    // 4. Hard cut, without splitting a UTF-8 sequence.
    std::size_t cut = limit;
    while (cut > earliest && IsUtf8Continuation(text[cut])) {
        --cut;
    }
    return cut;
}

std::size_t TextSplitter::overlapStart(const std::string& text, std::size_t unitStart, std::size_t unitEnd) const {
    if (m_options.overlapSize == 0) {
        return unitEnd;
    }
    const std::size_t candidate = unitEnd - m_options.overlapSize;
    const std::size_t floor = std::max(unitStart + 1,
                                       candidate > m_options.overlapSize ? candidate - m_options.overlapSize : 0);

    for (std::size_t pos = candidate; pos >= floor && pos > 0; --pos) {
        if (IsSpace(text[pos - 1]) && !IsSpace(text[pos])) {
            return pos;
        }
    }

    std::size_t pos = candidate;
    while (pos > unitStart + 1 && IsUtf8Continuation(text[pos])) {
        --pos;
    }
    return pos;
}

} // namespace learnpath::domain::segmentation
