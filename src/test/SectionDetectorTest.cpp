#include <cassert>
#include <iostream>
#include <string>

#include "domain/PipelineErrors.hpp"
#include "domain/segmentation/SectionDetector.hpp"
#include "domain/segmentation/SegmentationPolicy.hpp"
#include "domain/segmentation/TocParser.hpp"

using namespace learnpath::domain;
using namespace learnpath::domain::segmentation;

namespace {

std::string Filler(int sentences) {
    std::string out;
    for (int i = 0; i < sentences; ++i) {
        out += "This paragraph explains an idea in plain words. ";
    }
    return out + "\n\n";
}

void CheckCovers(const std::string& text, const std::vector<Section>& sections) {
    assert(!sections.empty());
    assert(sections.front().startOffset == 0);
    assert(sections.back().endOffset == text.size());
    for (std::size_t i = 0; i + 1 < sections.size(); ++i) {
        assert(sections[i].endOffset == sections[i + 1].startOffset);
    }
}

} // namespace

int main() {
    std::cout << "[Test] Starting SectionDetector Test..." << std::endl;

    // Heading patterns.
    {
        assert(SectionDetector::IsHeading("Chapter 1: Getting Started"));
        assert(SectionDetector::IsHeading("CHAPTER 12"));
        assert(SectionDetector::IsHeading("PART IV"));
        assert(SectionDetector::IsHeading("3. Joining Tables"));
        assert(SectionDetector::IsHeading("THE RELATIONAL MODEL"));
        assert(!SectionDetector::IsHeading("SHORT CAPS"));
        assert(!SectionDetector::IsHeading("This is an ordinary sentence in the body."));
        assert(!SectionDetector::IsHeading("3. the lower case item"));
        assert(!SectionDetector::IsHeading("Chapter 1 " + std::string(120, 'x')));
        std::cout << "[PASS] Heading patterns." << std::endl;
    }

    // Detected sections cover the document.
    {
        std::string text = "Preface text before any chapter.\n\n";
        text += "Chapter 1: Basics\n" + Filler(5);
        text += "Chapter 2: Queries\n" + Filler(5);
        text += "Chapter 3: Joins\n" + Filler(5);
        text += "Chapter 4: Indexes\n" + Filler(5);

        auto sections = SectionDetector::Detect(text);
        assert(sections.size() == 4);
        CheckCovers(text, sections);
        assert(sections[1].title == "Chapter 2: Queries");
        assert(text.compare(sections[2].startOffset, 16, "Chapter 3: Joins") == 0);
        std::cout << "[PASS] Detected sections cover the text." << std::endl;
    }

    // No headings.
    {
        assert(SectionDetector::Detect(Filler(20)).empty());
        std::cout << "[PASS] Plain prose has no sections." << std::endl;
    }

    // Plausibility band.
    {
        SegmentationPolicy policy(3, 20);
        assert(!policy.accepts(0));
        assert(!policy.accepts(2));
        assert(policy.accepts(3));
        assert(policy.accepts(20));
        assert(!policy.accepts(21));
        assert(!policy.accepts(361));

        bool threw = false;
        try {
            SegmentationPolicy bad(10, 5);
        } catch (const ConfigError&) {
            threw = true;
        }
        assert(threw);
        std::cout << "[PASS] Segmentation policy band." << std::endl;
    }

    // Table of contents parsing.
    {
        const std::string toc =
            "Contents\n"
            "Preface ..................... v\n"
            "Chapter 1: Introduction ..... 1\n"
            "Chapter 2: Selecting Data ... 15\n"
            "Chapter 3: Joining Tables ... 42\n"
            "Chapter 4: Aggregation ...... 77\n"
            "Index ....................... 301\n";
        auto entries = TocParser::Parse(toc);
        assert(entries.size() == 4);
        assert(entries[0].title == "Introduction");
        assert(entries[0].number == "1");
        assert(entries[0].page && *entries[0].page == 1);
        assert(entries[2].title == "Joining Tables");
        assert(entries[3].page && *entries[3].page == 77);

        auto numbered = TocParser::Parse("1. Foundations\n2. Modelling Data\n3. Normal Forms\nSome Loose Heading\n");
        assert(numbered.size() == 3 && "Numbered entries win when three or more exist.");
        assert(numbered[1].title == "Modelling Data");

        auto part = TocParser::ParseLine("Part II: Advanced Topics");
        assert(part && part->title == "Part II: Advanced Topics");
        assert(!TocParser::ParseLine("   "));
        assert(!TocParser::ParseLine("Index"));
        std::cout << "[PASS] Table of contents parsing." << std::endl;
    }

    // Sections from a table of contents, skipping the TOC lines in the text.
    {
        std::string text = "Contents\nIntroduction ........ 1\nSelecting Data ...... 15\nJoining Tables ...... 42\n\n";
        text += "Introduction\n" + Filler(4);
        text += "Selecting Data\n" + Filler(4);
        text += "Joining Tables\n" + Filler(4);

        std::vector<TocEntry> entries = {{"Introduction", "1", 1}, {"Selecting Data", "2", 15},
                                         {"Joining Tables", "3", 42}, {"Missing Chapter", "4", 99}};
        auto sections = SectionDetector::DetectFromToc(text, entries);
        assert(sections.size() == 3 && "Entries not found in the text are skipped.");
        CheckCovers(text, sections);
        assert(sections[1].title == "Selecting Data");
        assert(text.compare(sections[1].startOffset, 14, "Selecting Data") == 0);
        assert(sections[1].startOffset > text.find("\n\nIntroduction"));
        std::cout << "[PASS] Sections from a table of contents." << std::endl;
    }

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
