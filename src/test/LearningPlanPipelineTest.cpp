#include <cassert>
#include <filesystem>
#include <iostream>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "application/LearningPlanPipeline.hpp"
#include "application/PlanAssembler.hpp"
#include "domain/PipelineErrors.hpp"
#include "domain/segmentation/TextSplitter.hpp"
#include "infrastructure/PersistenceService.hpp"
#include "infrastructure/PlanCache.hpp"
#include "FakeCompletionService.hpp"

using namespace learnpath;
using namespace learnpath::application;
using learnpath::test::FakeCompletionService;
using learnpath::test::FindMarker;
namespace fs = std::filesystem;

namespace {

const char* kTopicNames[] = {
    "Storage Engines", "Query Planning", "Index Structures", "Transaction Isolation", "Replication Logs"
};

std::string ManyChapters(int count) {
    std::string text;
    for (int i = 1; i <= count; ++i) {
        text += "CHAPTER " + std::to_string(i) + "\n";
        text += "The body of this chapter explains one idea in a few plain words.\n\n";
    }
    return text;
}

/// Five chapters; the third is much longer than one extraction unit.
std::string FiveChapterBook() {
    std::string text = "A short preface before the first chapter.\n\n";
    for (int i = 0; i < 5; ++i) {
        text += "Chapter " + std::to_string(i + 1) + " " + kTopicNames[i] + "\n";
        text += "SECTION-" + std::to_string(i) + " introduces " + kTopicNames[i] + " and why they matter.\n\n";
        const int sentences = (i == 2) ? 40 : 4;
        for (int s = 0; s < sentences; ++s) {
            text += "This paragraph discusses " + std::string(kTopicNames[i]) + " in practical detail. ";
        }
        text += "\n\n";
    }
    return text;
}

PipelineConfig TestConfig() {
    PipelineConfig config;
    config.chunking = {500, 50, "\n\n"};
    config.passages = {300, 60, "\n\n"};
    config.topics.minTopics = 1;
    config.topics.maxTopics = 15;
    config.extraction.concurrency = 2;
    config.extraction.backoffMs = 1;
    return config;
}

std::shared_ptr<FakeCompletionService> TopicPerSection() {
    return std::make_shared<FakeCompletionService>([](const std::string& prompt) -> std::string {
        const int section = FindMarker(prompt, "SECTION-");
        if (section < 0 || section > 4) return "[]";
        return std::string("[{\"title\": \"") + kTopicNames[section] + "\", \"description\": \"What " +
               kTopicNames[section] + " are and how they work.\", \"importance\": \"High\", \"keywords\": [\"" +
               kTopicNames[section] + "\"]}]";
    });
}

} // namespace

int main() {
    std::cout << "[Test] Starting LearningPlanPipeline Test..." << std::endl;

    const std::string cacheDir = "test_learnpath_cache";
    fs::remove_all(cacheDir);

    // 361 chapter headings are an anomaly: fall back to plain splitting.
    {
        PipelineConfig config;
        LearningPlanPipeline pipeline(config, nullptr);
        const std::string text = ManyChapters(361);

        auto result = pipeline.segment(text);
        assert(result.mode == domain::SegmentationMode::CharacterSplit);
        assert(result.detectedSections == 361);

        auto expected = domain::segmentation::TextSplitter(config.chunking).split(text);
        assert(result.units.size() == expected.size());
        for (std::size_t i = 0; i < expected.size(); ++i) {
            assert(result.units[i].startOffset == expected[i].startOffset);
            assert(result.units[i].endOffset == expected[i].endOffset);
        }
        std::cout << "[PASS] Section anomaly falls back to character split." << std::endl;
    }

    // Accepted sections; the oversized one is split within its own range.
    {
        LearningPlanPipeline pipeline(TestConfig(), nullptr);
        const std::string text = FiveChapterBook();

        auto result = pipeline.segment(text);
        assert(result.mode == domain::SegmentationMode::DetectedSections);
        assert(result.detectedSections == 5);
        assert(result.units.size() > 5);
        assert(result.units.front().startOffset == 0 && "The preface joins the first section.");
        assert(result.units.back().endOffset == text.size());

        const std::size_t thirdStart = text.find("Chapter 3");
        const std::size_t thirdEnd = text.find("Chapter 4");
        std::size_t thirdUnits = 0;
        for (const auto& unit : result.units) {
            assert(unit.text == text.substr(unit.startOffset, unit.length()));
            assert(unit.length() <= 500);
            if (unit.title.find("Index Structures") != std::string::npos) {
                ++thirdUnits;
                assert(unit.startOffset >= thirdStart);
                assert(unit.endOffset <= thirdEnd);
            }
        }
        assert(thirdUnits > 1);
        std::cout << "[PASS] Oversized section split inside its range." << std::endl;
    }

    // Full run, then a cache hit, then invalidation.
    {
        infrastructure::PersistenceService persistence;
        auto cache = std::make_shared<infrastructure::PlanCache>(cacheDir, persistence);
        auto fake = TopicPerSection();
        LearningPlanPipeline pipeline(TestConfig(), fake, cache);

        const auto document = domain::Document::fromText("Database Internals", FiveChapterBook());
        auto first = pipeline.run(document);
        assert(!first.fromCache);
        assert(!first.cancelled);
        assert(first.plan.getTopics().size() == 5);
        assert(first.plan.getInfo().segmentation == domain::SegmentationMode::DetectedSections);
        assert(!first.plan.getInfo().createdAt.empty());
        for (const auto& topic : first.plan.getTopics()) {
            const auto& passages = first.plan.getPassages(topic.id);
            assert(!passages.empty());
            assert(passages.size() <= 5);
            assert(passages.front().rank == 1);
        }
        assert(first.plan.getTopics().front().title == "Storage Engines");

        const int callsAfterFirst = fake->callCount();
        auto second = pipeline.run(document);
        assert(second.fromCache);
        assert(fake->callCount() == callsAfterFirst && "A cache hit makes no completion calls.");
        assert(second.plan.getTopics().size() == 5);
        assert(second.plan.getInfo().cacheKey == first.plan.getInfo().cacheKey);

        // A persisted index survives a fresh cache instance.
        auto reloaded = std::make_shared<infrastructure::PlanCache>(cacheDir, persistence);
        reloaded->load();
        assert(reloaded->size() == 1);

        const auto edited = domain::Document::fromText("Database Internals", FiveChapterBook() + "Appendix.\n");
        auto third = pipeline.run(edited);
        assert(!third.fromCache);
        assert(fake->callCount() > callsAfterFirst);

        PipelineConfig otherConfig = TestConfig();
        otherConfig.ranking.topK = 2;
        LearningPlanPipeline otherPipeline(otherConfig, fake, cache);
        assert(otherPipeline.cacheKey(edited, "") != pipeline.cacheKey(edited, ""));
        auto fourth = otherPipeline.run(edited);
        assert(!fourth.fromCache);
        for (const auto& topic : fourth.plan.getTopics()) {
            assert(fourth.plan.getPassages(topic.id).size() <= 2);
        }

        assert(pipeline.cacheKey(edited, "") != pipeline.cacheKey(edited, "Chapter 1 Storage Engines"));

        RunOptions noCache;
        noCache.useCache = false;
        auto fifth = otherPipeline.run(edited, noCache);
        assert(!fifth.fromCache);
        std::cout << "[PASS] Plan cache hit and invalidation." << std::endl;
    }

    // A cancelled run returns a partial plan and is not cached.
    {
        infrastructure::PersistenceService persistence;
        auto cache = std::make_shared<infrastructure::PlanCache>(cacheDir, persistence);
        auto fake = TopicPerSection();
        LearningPlanPipeline pipeline(TestConfig(), fake, cache);

        CancellationToken token;
        token.cancel();
        RunOptions options;
        options.cancel = &token;

        const auto document = domain::Document::fromText("Cancelled Book", FiveChapterBook());
        auto result = pipeline.run(document, options);
        assert(result.extraction.cancelled);
        assert(result.cancelled);
        assert(fake->callCount() == 0);
        assert(result.plan.getTopics().empty());
        assert(!cache->get("Cancelled Book", pipeline.cacheKey(document, "")));
        std::cout << "[PASS] Cancelled run is not cached." << std::endl;
    }

    // Cancelling while passages are judged also marks the run and keeps it out of the cache.
    {
        infrastructure::PersistenceService persistence;
        auto cache = std::make_shared<infrastructure::PlanCache>(cacheDir, persistence);
        CancellationToken token;
        auto topics = TopicPerSection();
        auto fake = std::make_shared<FakeCompletionService>([&](const std::string& prompt) -> std::string {
            if (prompt.find("Rate how relevant") != std::string::npos) {
                token.cancel();
                return "{\"score\": 9}";
            }
            return topics->complete(prompt, domain::CompletionOptions{});
        });

        PipelineConfig config = TestConfig();
        config.extraction.concurrency = 1;
        config.ranking.strategy = domain::RankingStrategy::Completion;
        LearningPlanPipeline pipeline(config, fake, cache);

        RunOptions options;
        options.cancel = &token;
        const auto document = domain::Document::fromText("Ranking Book", FiveChapterBook());
        const int extractionCalls = static_cast<int>(pipeline.segment(document.getText()).units.size());

        auto result = pipeline.run(document, options);
        assert(!result.extraction.cancelled && "Extraction finished before the cancel.");
        assert(result.cancelled);
        assert(fake->callCount() == extractionCalls + 1 && "No judgment starts after the cancel.");
        assert(!result.plan.getTopics().empty());
        assert(!cache->get("Ranking Book", pipeline.cacheKey(document, "")));
        assert(cache->size() == 0);
        std::cout << "[PASS] Cancel during ranking is not cached." << std::endl;
    }

    // Errors and degenerate input.
    {
        auto fake = TopicPerSection();
        LearningPlanPipeline pipeline(TestConfig(), fake);

        bool threw = false;
        try {
            pipeline.run(domain::Document::fromText("Blank", "  \n\t\n"));
        } catch (const domain::PipelineError&) {
            threw = true;
        }
        assert(threw && "A blank document is rejected.");

        PipelineConfig invalid = TestConfig();
        invalid.chunking.overlapSize = invalid.chunking.unitSize;
        LearningPlanPipeline invalidPipeline(invalid, fake);
        threw = false;
        try {
            invalidPipeline.run(domain::Document::fromText("Book", FiveChapterBook()));
        } catch (const domain::ConfigError&) {
            threw = true;
        }
        assert(threw && "Overlap equal to unit size is a configuration error.");

        auto silent = std::make_shared<FakeCompletionService>([](const std::string&) { return std::string("[]"); });
        LearningPlanPipeline quietPipeline(TestConfig(), silent);
        auto result = quietPipeline.run(domain::Document::fromText("Book", FiveChapterBook()));
        assert(result.plan.getTopics().empty());
        assert(result.plan.getAllPassages().empty());
        assert(result.extraction.unitsEmpty == result.plan.getInfo().unitCount);
        std::cout << "[PASS] Errors and empty results." << std::endl;
    }

    // The assembler refuses a topic without a passages entry.
    {
        domain::Topic topic;
        topic.id = "t01-orphan";
        topic.title = "Orphan";
        bool threw = false;
        try {
            PlanAssembler::Assemble(domain::DocumentMeta{}, {topic}, {}, domain::ProcessingInfo{});
        } catch (const std::logic_error&) {
            threw = true;
        }
        assert(threw);

        std::map<std::string, std::vector<domain::Passage>> passages;
        passages[topic.id] = {};
        passages["t99-unknown"] = {domain::Passage{}};
        auto plan = PlanAssembler::Assemble(domain::DocumentMeta{}, {topic}, passages, domain::ProcessingInfo{});
        assert(plan.getAllPassages().size() == 1 && "Entries for unknown topics are dropped.");
        assert(plan.getPassages(topic.id).empty());
        std::cout << "[PASS] Plan assembly invariant." << std::endl;
    }

    fs::remove_all(cacheDir);
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
