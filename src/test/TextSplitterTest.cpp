#include <cassert>
#include <iostream>
#include <string>

#include "domain/PipelineErrors.hpp"
#include "domain/segmentation/TextSplitter.hpp"

using namespace learnpath::domain;
using namespace learnpath::domain::segmentation;

namespace {

void CheckCoverage(const std::string& text, const std::vector<TextUnit>& units) {
    assert(!units.empty());
    assert(units.front().startOffset == 0 && "First unit must start at 0.");
    assert(units.back().endOffset == text.size() && "Last unit must end at the text end.");
    for (std::size_t i = 0; i < units.size(); ++i) {
        const auto& u = units[i];
        assert(u.endOffset - u.startOffset == u.text.size());
        assert(text.compare(u.startOffset, u.text.size(), u.text) == 0 && "Unit text must be the slice at its offsets.");
        if (i + 1 < units.size()) {
            assert(units[i + 1].startOffset <= u.endOffset && "No gaps between units.");
            assert(units[i + 1].startOffset > u.startOffset && "Units must advance.");
        }
    }
}

std::string Reconstruct(const std::vector<TextUnit>& units) {
    std::string out = units.front().text;
    for (std::size_t i = 1; i < units.size(); ++i) {
        const std::size_t shared = units[i - 1].endOffset - units[i].startOffset;
        out += units[i].text.substr(shared);
    }
    return out;
}

std::string MakeBook(int paragraphs) {
    std::string text;
    for (int p = 0; p < paragraphs; ++p) {
        for (int s = 0; s < 6; ++s) {
            text += "Sentence " + std::to_string(s) + " of paragraph " + std::to_string(p) +
                    " talks about relational databases and joins. ";
        }
        text += "\n\n";
    }
    return text;
}

} // namespace

int main() {
    std::cout << "[Test] Starting TextSplitter Test..." << std::endl;

    // Three short paragraphs, unit 20, overlap 5.
    {
        const std::string text = "AAAA BBBB.\n\nCCCC DDDD.\n\nEEEE FFFF.";
        TextSplitter splitter({20, 5, "\n\n"});
        auto units = splitter.split(text);
        CheckCoverage(text, units);
        assert(units.size() == 3);
        assert(units[0].startOffset == 0 && units[0].endOffset == 12);
        assert(units[1].startOffset == 5 && units[1].endOffset == 24);
        assert(units[2].startOffset == 17 && units[2].endOffset == 34);
        for (std::size_t i = 0; i + 1 < units.size(); ++i) {
            assert(units[i].endOffset - units[i + 1].startOffset >= 5 && "Consecutive units share the overlap.");
        }
        assert(Reconstruct(units) == text);
        std::cout << "[PASS] Paragraph scenario splits at separators with overlap." << std::endl;
    }

    // Coverage and overlap on a longer text.
    {
        const std::string text = MakeBook(40);
        TextSplitter splitter({1000, 200, "\n\n"});
        auto units = splitter.split(text);
        CheckCoverage(text, units);
        for (std::size_t i = 0; i + 1 < units.size(); ++i) {
            assert(units[i].text.size() <= 1000);
            assert(units[i + 1].startOffset ==
                   splitter.overlapStart(text, units[i].startOffset, units[i].endOffset));
            assert(units[i].endOffset - units[i + 1].startOffset >= 200);
        }
        assert(Reconstruct(units) == text);
        std::cout << "[PASS] Coverage and overlap hold on " << units.size() << " units." << std::endl;
    }

    // Zero overlap gives contiguous, non-overlapping units.
    {
        const std::string text = MakeBook(10);
        auto units = TextSplitter::Split(text, 300, 0);
        CheckCoverage(text, units);
        for (std::size_t i = 0; i + 1 < units.size(); ++i) {
            assert(units[i + 1].startOffset == units[i].endOffset);
        }
        std::cout << "[PASS] Zero overlap is contiguous." << std::endl;
    }

    // No whitespace at all: hard cuts never split a UTF-8 sequence.
    {
        std::string text;
        for (int i = 0; i < 200; ++i) text += "\xC3\xA9"; // é
        auto units = TextSplitter::Split(text, 51, 10);
        CheckCoverage(text, units);
        for (const auto& u : units) {
            assert((static_cast<unsigned char>(u.text.front()) & 0xC0) != 0x80 && "Unit starts mid-character.");
            assert((static_cast<unsigned char>(u.text.back()) & 0xC0) != 0xC0 && "Unit ends after a lead byte.");
        }
        std::cout << "[PASS] Hard cuts respect UTF-8 boundaries." << std::endl;
    }

    // Degenerate inputs.
    {
        assert(TextSplitter::Split("", 100, 10).empty());
        auto single = TextSplitter::Split("short text", 100, 10);
        assert(single.size() == 1 && single[0].text == "short text");

        bool threw = false;
        try {
            TextSplitter::Split("abc", 10, 10);
        } catch (const ConfigError&) {
            threw = true;
        }
        assert(threw && "overlap >= unit size must be rejected.");

        threw = false;
        try {
            TextSplitter::Split("abc", 0, 0);
        } catch (const ConfigError&) {
            threw = true;
        }
        assert(threw && "zero unit size must be rejected.");

        auto rebased = TextSplitter({20, 5, "\n\n"}).split("AAAA BBBB.\n\nCCCC DDDD.", 100);
        assert(rebased.front().startOffset == 100);
        assert(rebased.back().endOffset == 122);
        std::cout << "[PASS] Empty input, single unit, bad options and rebasing." << std::endl;
    }

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
