#include <cassert>
#include <iostream>
#include <string>
#include <variant>

#include "domain/topics/TopicResponseParser.hpp"

using namespace learnpath::domain;
using namespace learnpath::domain::topics;

int main() {
    std::cout << "[Test] Starting TopicResponseParser Test..." << std::endl;

    // Clean array.
    {
        auto parsed = TopicResponseParser::Parse(
            R"([{"topic_number": 1, "title": "Joins", "description": "Combining tables.", "importance": "High"},
                {"topic_number": 2, "title": "Indexes", "description": "Speeding up lookups."}])", 4);
        auto* topics = std::get_if<TopicList>(&parsed);
        assert(topics && topics->size() == 2);
        assert((*topics)[0].title == "Joins");
        assert((*topics)[0].importance == Importance::High);
        assert((*topics)[1].importance == Importance::Medium && "Importance defaults to Medium.");
        assert((*topics)[1].sourceUnitIndex == 4);
        assert((*topics)[1].positionInUnit == 1);
        std::cout << "[PASS] Clean JSON array." << std::endl;
    }

    // Prose, code fences and trailing commas.
    {
        const std::string raw =
            "Sure! Here is the learning plan:\n```json\n"
            "[\n  {\"title\": \"Normal forms [1NF-3NF]\", \"description\": \"Removing redundancy, step by step.\","
            " \"importance\": \"low\", \"key_points\": [\"1NF\", \"3NF\",],},\n]\n```\nHope this helps.";
        auto parsed = TopicResponseParser::Parse(raw, 0);
        auto* topics = std::get_if<TopicList>(&parsed);
        assert(topics && topics->size() == 1);
        assert((*topics)[0].title == "Normal forms [1NF-3NF]" && "Brackets inside strings must not end the block.");
        assert((*topics)[0].importance == Importance::Low);
        assert((*topics)[0].keywords.size() == 2);
        std::cout << "[PASS] Fenced output with trailing commas." << std::endl;
    }

    // Object wrapper.
    {
        auto parsed = TopicResponseParser::Parse(
            R"({"topics": [{"title": "Transactions", "description": "ACID.", "keywords": ["commit"]}]})", 2);
        auto* topics = std::get_if<TopicList>(&parsed);
        assert(topics && topics->size() == 1);
        assert((*topics)[0].keywords.front() == "commit");
        std::cout << "[PASS] Object with a topics array." << std::endl;
    }

    // Empty array is a valid empty answer.
    {
        auto parsed = TopicResponseParser::Parse("[]", 0);
        auto* topics = std::get_if<TopicList>(&parsed);
        assert(topics && topics->empty());
        std::cout << "[PASS] Empty array is not malformed." << std::endl;
    }

    // Malformed outputs.
    {
        assert(std::holds_alternative<MalformedResponse>(TopicResponseParser::Parse("I cannot help with that.", 0)));
        assert(std::holds_alternative<MalformedResponse>(TopicResponseParser::Parse("[{\"title\": \"Cut off", 0)));
        assert(std::holds_alternative<MalformedResponse>(TopicResponseParser::Parse("{\"answer\": 42}", 0)));
        assert(std::holds_alternative<MalformedResponse>(
            TopicResponseParser::Parse("[{\"name\": \"No title field\"}]", 0)));

        auto parsed = TopicResponseParser::Parse("[{\"title\": \"Kept\", \"description\": \"ok\"}, {\"title\": 3}]", 0);
        auto* topics = std::get_if<TopicList>(&parsed);
        assert(topics && topics->size() == 1 && "Invalid items are dropped, valid ones kept.");
        std::cout << "[PASS] Malformed output is tagged, not thrown." << std::endl;
    }

    // Bracketed prose before the real answer.
    {
        auto parsed = TopicResponseParser::Parse(
            "Topics for [Chapter 1]:\n[{\"title\": \"Joins\", \"description\": \"Combining tables.\"}]", 1);
        auto* topics = std::get_if<TopicList>(&parsed);
        assert(topics && topics->size() == 1);
        assert((*topics)[0].title == "Joins");

        parsed = TopicResponseParser::Parse(
            "Based on {the outline} and [1], here you go: "
            "{\"topics\": [{\"title\": \"Views\", \"description\": \"Stored queries.\"}]}", 0);
        topics = std::get_if<TopicList>(&parsed);
        assert(topics && topics->size() == 1 && (*topics)[0].title == "Views");

        assert(std::holds_alternative<MalformedResponse>(
            TopicResponseParser::Parse("See [Chapter 1] and {notes}, then [2, 3].", 0)));
        std::cout << "[PASS] Leading bracketed prose is skipped." << std::endl;
    }

    // Helpers.
    {
        assert(TopicResponseParser::StripTrailingCommas("[1, 2, ]") == "[1, 2 ]");
        assert(TopicResponseParser::StripTrailingCommas("[\"a, ]\"]") == "[\"a, ]\"]");
        assert(TopicResponseParser::ExtractJsonBlock("x {\"a\": \"}\"} y") == "{\"a\": \"}\"}");
        assert(TopicResponseParser::ExtractJsonBlock("no json here").empty());
        auto blocks = TopicResponseParser::ExtractJsonBlocks("[Chapter 1] then {\"a\": [1]} and [2");
        assert(blocks.size() == 2);
        assert(blocks[0] == "[Chapter 1]" && blocks[1] == "{\"a\": [1]}");
        std::cout << "[PASS] Block extraction and comma stripping." << std::endl;
    }

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
