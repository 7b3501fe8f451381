/**
 * @file TopicResponseParser.hpp
 * @brief Turns raw completion output into topic candidates.
 */

#pragma once
#include <cstddef>
#include <string>
#include <variant>
#include <vector>

#include "domain/Topic.hpp"

namespace learnpath::domain::topics {

using TopicList = std::vector<TopicCandidate>;

/**
 * @struct MalformedResponse
 * @brief Completion output that held no usable topic list.
 */
struct MalformedResponse {
    std::string raw;
    std::string reason;
};

/// Either the candidates of one unit (possibly none) or a malformed marker.
using ParsedTopics = std::variant<TopicList, MalformedResponse>;

/**
 * @class TopicResponseParser
 * @brief Tolerant parser for model output.
 *
 * Models wrap JSON in prose, code fences and trailing commas. The parser
 * walks the balanced blocks of the reply in order and takes the first that
 * is a JSON array of objects, or an object holding a "topics" array, so
 * bracketed prose such as "[Chapter 1]" is skipped. It keeps the items that
 * carry a string title and description.
 * A well-formed empty array is a valid, empty result.
 */
class TopicResponseParser {
public:
    static ParsedTopics Parse(const std::string& raw, std::size_t sourceUnitIndex);

    /** @brief First balanced [...] or {...} block, string-aware. Empty if none. */
    static std::string ExtractJsonBlock(const std::string& text);

    /** @brief Every top-level balanced block in order of appearance. */
    static std::vector<std::string> ExtractJsonBlocks(const std::string& text);

    /** @brief Removes commas directly preceding ] or } outside string literals. */
    static std::string StripTrailingCommas(const std::string& json);
};

} // namespace learnpath::domain::topics
