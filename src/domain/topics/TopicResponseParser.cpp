/**
 * @file TopicResponseParser.cpp
 * @brief Implementation of TopicResponseParser.
 */

#include "domain/topics/TopicResponseParser.hpp"

#include <cctype>
#include <initializer_list>
#include <utility>
#include <nlohmann/json.hpp>

namespace learnpath::domain::topics {

using json = nlohmann::json;

namespace {

std::string Trim(const std::string& value) {
    const auto first = value.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    const auto last = value.find_last_not_of(" \t\r\n");
    return value.substr(first, last - first + 1);
}

std::string StripCodeFences(const std::string& text) {
    const std::string fence = "```";
    const auto open = text.find(fence);
    if (open == std::string::npos) {
        return text;
    }
    auto bodyStart = text.find('\n', open);
    if (bodyStart == std::string::npos) {
        return text;
    }
    ++bodyStart;
    const auto close = text.find(fence, bodyStart);
    if (close == std::string::npos) {
        return text.substr(bodyStart);
    }
    return text.substr(bodyStart, close - bodyStart);
}

std::vector<std::string> ReadKeywords(const json& item) {
    std::vector<std::string> keywords;
    for (const char* key : {"keywords", "key_points"}) {
        if (!item.contains(key) || !item[key].is_array()) continue;
        for (const auto& value : item[key]) {
            if (value.is_string()) {
                std::string kw = Trim(value.get<std::string>());
                if (!kw.empty()) keywords.push_back(kw);
            }
        }
    }
    return keywords;
}

/// Index of the bracket closing the one at start, string-aware; npos if unbalanced.
std::size_t MatchingClose(const std::string& text, std::size_t start) {
    int depth = 0;
    bool inString = false;
    bool escaped = false;
    for (std::size_t i = start; i < text.size(); ++i) {
        const char c = text[i];
        if (inString) {
            if (escaped) {
                escaped = false;
            } else if (c == '\\') {
                escaped = true;
            } else if (c == '"') {
                inString = false;
            }
            continue;
        }
        if (c == '"') {
            inString = true;
        } else if (c == '[' || c == '{') {
            ++depth;
        } else if (c == ']' || c == '}') {
            if (--depth == 0) {
                return i;
            }
        }
    }
    return std::string::npos;
}

/// An array that is empty or holds at least one object, or an object with a topics array.
bool HasTopicShape(const json& value) {
    if (value.is_object()) {
        return value.contains("topics") && value["topics"].is_array();
    }
    if (!value.is_array()) {
        return false;
    }
    if (value.empty()) {
        return true;
    }
    for (const auto& item : value) {
        if (item.is_object()) return true;
    }
    return false;
}

} // namespace

std::string TopicResponseParser::ExtractJsonBlock(const std::string& text) {
    auto blocks = ExtractJsonBlocks(text);
    return blocks.empty() ? std::string() : blocks.front();
}

std::vector<std::string> TopicResponseParser::ExtractJsonBlocks(const std::string& text) {
    std::vector<std::string> blocks;
    std::size_t start = text.find_first_of("[{");
    while (start != std::string::npos) {
        const std::size_t end = MatchingClose(text, start);
        if (end == std::string::npos) {
            // Unbalanced opener; an inner block may still be complete.
            start = text.find_first_of("[{", start + 1);
            continue;
        }
        blocks.push_back(text.substr(start, end - start + 1));
        start = text.find_first_of("[{", end + 1);
    }
    return blocks;
}

std::string TopicResponseParser::StripTrailingCommas(const std::string& input) {
    std::string out;
    out.reserve(input.size());
    bool inString = false;
    bool escaped = false;
    for (std::size_t i = 0; i < input.size(); ++i) {
        const char c = input[i];
        if (inString) {
            out.push_back(c);
            if (escaped) {
                escaped = false;
            } else if (c == '\\') {
                escaped = true;
            } else if (c == '"') {
                inString = false;
            }
            continue;
        }
        if (c == '"') {
            inString = true;
        } else if (c == ',') {
            std::size_t next = i + 1;
            while (next < input.size() && std::isspace(static_cast<unsigned char>(input[next]))) ++next;
            if (next < input.size() && (input[next] == ']' || input[next] == '}')) {
                continue;
            }
        }
        out.push_back(c);
    }
    return out;
}

ParsedTopics TopicResponseParser::Parse(const std::string& raw, std::size_t sourceUnitIndex) {
    const auto blocks = ExtractJsonBlocks(StripCodeFences(raw));
    if (blocks.empty()) {
        return MalformedResponse{raw, "no JSON array or object found"};
    }

    json parsed;
    bool found = false;
    std::string firstProblem;
    for (const auto& block : blocks) {
        json candidate;
        try {
            candidate = json::parse(StripTrailingCommas(block));
        } catch (const json::parse_error& e) {
            if (firstProblem.empty()) firstProblem = std::string("invalid JSON: ") + e.what();
            continue;
        }
        if (!HasTopicShape(candidate)) {
            if (firstProblem.empty()) {
                firstProblem = candidate.is_object() ? "object without a topics array"
                                                     : "no array of topic objects";
            }
            continue;
        }
        parsed = candidate.is_object() ? candidate["topics"] : candidate;
        found = true;
        break;
    }
    if (!found) {
        return MalformedResponse{raw, firstProblem};
    }

    TopicList topics;
    for (const auto& item : parsed) {
        if (!item.is_object()) continue;
        if (!item.contains("title") || !item["title"].is_string()) continue;
        if (!item.contains("description") || !item["description"].is_string()) continue;

        TopicCandidate candidate;
        candidate.title = Trim(item["title"].get<std::string>());
        candidate.description = Trim(item["description"].get<std::string>());
        if (candidate.title.empty()) continue;

        if (item.contains("importance") && item["importance"].is_string()) {
            candidate.importance = ImportanceFromString(item["importance"].get<std::string>());
        }
        candidate.keywords = ReadKeywords(item);
        candidate.sourceUnitIndex = sourceUnitIndex;
        candidate.positionInUnit = topics.size();
        topics.push_back(std::move(candidate));
    }

    if (topics.empty() && !parsed.empty()) {
        return MalformedResponse{raw, "no item had a title and a description"};
    }
    return topics;
}

} // namespace learnpath::domain::topics
