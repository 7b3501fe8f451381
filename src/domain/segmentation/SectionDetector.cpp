/**
 * @file SectionDetector.cpp
 * @brief Implementation of SectionDetector.
 */

#include "domain/segmentation/SectionDetector.hpp"

#include <algorithm>
#include <cctype>
#include <regex>
#include <sstream>

namespace learnpath::domain::segmentation {

namespace {

constexpr std::size_t kMaxHeadingLength = 100;

std::string Trim(const std::string& value) {
    const auto first = value.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    const auto last = value.find_last_not_of(" \t\r\n");
    return value.substr(first, last - first + 1);
}

std::string ToLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::string FirstWords(const std::string& title, std::size_t count) {
    std::istringstream ss(title);
    std::string word;
    std::string out;
    for (std::size_t i = 0; i < count && ss >> word; ++i) {
        if (!out.empty()) out += ' ';
        out += word;
    }
    return out;
}

bool IsTocLine(const std::string& line) {
    static const std::regex kLeaderWithPage(R"((\.{2,}|\s{3,})\s*\d+\s*$)");
    return std::regex_search(line, kLeaderWithPage);
}

/// Finds needle (lower-cased) in lowerText at a line start, skipping
/// table-of-contents lines that also carry the title.
std::size_t FindAtLineStart(const std::string& lowerText, const std::string& needle, std::size_t from) {
    if (needle.empty()) return std::string::npos;
    std::size_t pos = lowerText.find(needle, from);
    while (pos != std::string::npos) {
        std::size_t lineStart = pos;
        while (lineStart > 0 && lowerText[lineStart - 1] != '\n' &&
               std::isspace(static_cast<unsigned char>(lowerText[lineStart - 1]))) {
            --lineStart;
        }
        if (lineStart == 0 || lowerText[lineStart - 1] == '\n') {
            std::size_t lineEnd = lowerText.find('\n', pos);
            if (lineEnd == std::string::npos) lineEnd = lowerText.size();
            if (!IsTocLine(lowerText.substr(lineStart, lineEnd - lineStart))) {
                return lineStart;
            }
        }
        pos = lowerText.find(needle, pos + 1);
    }
    return std::string::npos;
}

} // namespace

bool SectionDetector::IsHeading(const std::string& line) {
    if (line.empty() || line.size() >= kMaxHeadingLength) {
        return false;
    }

    static const std::regex kChapter(R"(^chapter\s+(\d+|[ivxlc]+)\b.*)", std::regex::icase);
    static const std::regex kPart(R"(^part\s+([ivx]+|\d+)\b.*)", std::regex::icase);
    static const std::regex kNumbered(R"(^\d+\.\s+[A-Z][a-z]+.*)");
    static const std::regex kAllCaps(R"(^[A-Z][A-Z\s]{14,59}$)");

    return std::regex_match(line, kChapter) || std::regex_match(line, kPart) ||
           std::regex_match(line, kNumbered) || std::regex_match(line, kAllCaps);
}

std::vector<Section> SectionDetector::Detect(const std::string& text) {
    std::vector<Anchor> anchors;
    std::size_t lineStart = 0;
    while (lineStart < text.size()) {
        std::size_t lineEnd = text.find('\n', lineStart);
        if (lineEnd == std::string::npos) lineEnd = text.size();

        const std::string line = Trim(text.substr(lineStart, lineEnd - lineStart));
        if (IsHeading(line)) {
            anchors.push_back({line, lineStart});
        }
        lineStart = lineEnd + 1;
    }
    return BuildSections(anchors, text.size());
}

std::vector<Section> SectionDetector::DetectFromToc(const std::string& text,
                                                    const std::vector<TocEntry>& entries) {
    const std::string lowerText = ToLower(text);
    std::vector<Anchor> anchors;
    std::size_t searchFrom = 0;

    for (const auto& entry : entries) {
        const std::string title = ToLower(Trim(entry.title));
        std::size_t pos = FindAtLineStart(lowerText, title, searchFrom);
        if (pos == std::string::npos) {
            pos = FindAtLineStart(lowerText, FirstWords(title, 3), searchFrom);
        }
        if (pos == std::string::npos) {
            continue;
        }
        anchors.push_back({entry.title, pos});
        searchFrom = pos + 1;
    }
    return BuildSections(anchors, text.size());
}

std::vector<Section> SectionDetector::BuildSections(const std::vector<Anchor>& anchors, std::size_t textSize) {
    std::vector<Section> sections;
    if (anchors.empty()) {
        return sections;
    }

    sections.reserve(anchors.size());
    for (std::size_t i = 0; i < anchors.size(); ++i) {
        Section section;
        section.title = anchors[i].title;
        section.startOffset = (i == 0) ? 0 : anchors[i].offset;
        section.endOffset = (i + 1 < anchors.size()) ? anchors[i + 1].offset : textSize;
        sections.push_back(section);
    }
    return sections;
}

} // namespace learnpath::domain::segmentation
