/**
 * @file TocParser.cpp
 * @brief Implementation of TocParser.
 */

#include "domain/segmentation/TocParser.hpp"

#include <algorithm>
#include <cctype>
#include <regex>
#include <sstream>

namespace learnpath::domain::segmentation {

namespace {

std::string Trim(const std::string& value) {
    const auto first = value.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    const auto last = value.find_last_not_of(" \t\r\n");
    return value.substr(first, last - first + 1);
}

std::string StripLeaders(const std::string& title) {
    static const std::regex kLeaders(R"(\.{2,}\s*\d*\s*$)");
    return Trim(std::regex_replace(title, kLeaders, ""));
}

/// "Preface ........ v" -> "Preface"
std::string StripPageReference(const std::string& line) {
    static const std::regex kPageRef(R"((\.{2,}|\s{2,})\s*(\d+|[ivxlc]+)\s*$)", std::regex::icase);
    return Trim(std::regex_replace(line, kPageRef, ""));
}

std::optional<int> ToPage(const std::ssub_match& match) {
    if (!match.matched || match.length() == 0) return std::nullopt;
    try {
        return std::stoi(match.str());
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

bool IsFrontOrBackMatter(const std::string& line) {
    static const std::regex kSkip(
        R"(^(preface|foreword|acknowledgments?|about( the author)?|copyright|index|appendix|glossary|bibliography|references|table of contents|contents|part\s+[ivxlc]+)$)",
        std::regex::icase);
    return std::regex_match(line, kSkip);
}

bool LooksLikeChapterTitle(const std::string& line) {
    static const char* kKeywords[] = {"introduction", "chapter", "getting started", "basic",
                                      "advanced", "conclusion", "summary"};
    std::string lower = line;
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) { return std::tolower(c); });
    for (const char* kw : kKeywords) {
        if (lower.find(kw) != std::string::npos) return true;
    }
    return std::isupper(static_cast<unsigned char>(line[0])) != 0;
}

} // namespace

std::optional<TocEntry> TocParser::ParseLine(const std::string& rawLine) {
    const std::string line = Trim(rawLine);
    if (line.empty() || IsFrontOrBackMatter(line) || IsFrontOrBackMatter(StripPageReference(line))) {
        return std::nullopt;
    }

    static const std::regex kChapterWithPage(
        R"(^(?:chapter\s+)?(\d+|[ivxlc]+)[:.\-\s]+(.+?)(?:\.{2,}|\s{2,})\s*(\d+)\s*$)", std::regex::icase);
    static const std::regex kChapterNoPage(R"(^chapter\s+(\d+|[ivxlc]+)[:.\-\s]+(.+)$)", std::regex::icase);
    static const std::regex kPart(R"(^part\s+(\d+|[ivxlc]+)[:.\-\s]+(.+?)(?:(?:\.{2,}|\s{2,})\s*(\d+))?\s*$)",
                                  std::regex::icase);
    static const std::regex kNumbered(R"(^(\d+)[.)\s]+(.+)$)");
    static const std::regex kTitleWithPage(R"(^(.+?)(?:\.{2,}|\s{3,})\s*(\d+)\s*$)");

    std::smatch m;
    TocEntry entry;

    if (std::regex_match(line, m, kPart)) {
        entry.number = m[1].str();
        entry.title = "Part " + m[1].str() + ": " + StripLeaders(m[2].str());
        entry.page = ToPage(m[3]);
        return entry;
    }
    if (std::regex_match(line, m, kChapterWithPage)) {
        entry.number = m[1].str();
        entry.title = Trim(m[2].str());
        entry.page = ToPage(m[3]);
        return entry;
    }
    if (std::regex_match(line, m, kChapterNoPage)) {
        entry.number = m[1].str();
        entry.title = StripLeaders(m[2].str());
        return entry;
    }
    if (std::regex_match(line, m, kNumbered)) {
        entry.number = m[1].str();
        entry.title = StripLeaders(m[2].str());
        return entry;
    }
    if (std::regex_match(line, m, kTitleWithPage)) {
        std::string title = Trim(m[1].str());
        if (title.size() > 3) {
            entry.title = title;
            entry.page = ToPage(m[2]);
            return entry;
        }
    }
    if (line.size() > 5 && LooksLikeChapterTitle(line) &&
        !std::all_of(line.begin(), line.end(), [](unsigned char c) { return std::isdigit(c); })) {
        entry.title = line;
        return entry;
    }
    return std::nullopt;
}

std::vector<TocEntry> TocParser::Parse(const std::string& tocText) {
    std::vector<TocEntry> entries;
    std::istringstream ss(tocText);
    std::string line;
    while (std::getline(ss, line)) {
        if (auto entry = ParseLine(line)) {
            if (!entry->title.empty()) entries.push_back(*entry);
        }
    }
    return FilterEntries(std::move(entries));
}

std::vector<TocEntry> TocParser::FilterEntries(std::vector<TocEntry> entries) {
    if (entries.size() <= 3) {
        return entries;
    }

    std::vector<TocEntry> filtered;
    for (auto& entry : entries) {
        if (entry.title.size() > 3) filtered.push_back(std::move(entry));
    }

    std::vector<TocEntry> numbered;
    for (const auto& entry : filtered) {
        if (!entry.number.empty()) numbered.push_back(entry);
    }
    if (numbered.size() >= 3) {
        return numbered;
    }
    return filtered;
}

} // namespace learnpath::domain::segmentation
