#include <algorithm>
#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "application/PassageRanker.hpp"
#include "domain/PipelineErrors.hpp"
#include "FakeCompletionService.hpp"

using namespace learnpath;
using namespace learnpath::application;
using learnpath::test::FakeCompletionService;

namespace {

std::string MakeDocument() {
    std::string text;
    for (int i = 0; i < 20; ++i) {
        text += "PASSAGE-" + std::to_string(i) + " ";
        if (i == 6) {
            text += "Joins combine rows from two tables. An inner join keeps matching rows, an outer join keeps all rows. ";
        } else if (i == 13) {
            text += "A join condition compares columns. Joins over indexed columns are fast. ";
        } else {
            text += "Storage engines write pages to disk and keep a buffer pool in memory for speed. ";
        }
        text += "\n\n";
    }
    return text;
}

domain::Topic JoinTopic() {
    domain::Topic topic;
    topic.id = "t01-joins";
    topic.title = "Relational Joins";
    topic.description = "Combining rows from several tables with a join condition.";
    topic.keywords = {"inner join"};
    return topic;
}

domain::segmentation::SplitterOptions PassageOptions() {
    return {400, 50, "\n\n"};
}

} // namespace

int main() {
    std::cout << "[Test] Starting PassageRanker Test..." << std::endl;

    const std::string document = MakeDocument();

    // Keyword extraction.
    {
        auto keywords = PassageRanker::ExtractKeywords(JoinTopic());
        assert(std::find(keywords.begin(), keywords.end(), "joins") != keywords.end());
        assert(std::find(keywords.begin(), keywords.end(), "inner") != keywords.end());
        assert(std::find(keywords.begin(), keywords.end(), "from") == keywords.end() && "Stop words are removed.");
        assert(std::find(keywords.begin(), keywords.end(), "with") == keywords.end());
        assert(std::count(keywords.begin(), keywords.end(), "join") == 1 && "Keywords are deduplicated.");
        std::cout << "[PASS] Keyword extraction." << std::endl;
    }

    // Keyword strategy: deterministic, bounded, best passages first.
    {
        PassageRanker ranker(nullptr, PassageOptions(), RankingSettings{});
        auto first = ranker.rank(JoinTopic(), document, domain::RankingStrategy::Keyword, 3);
        auto second = ranker.rank(JoinTopic(), document, domain::RankingStrategy::Keyword, 3);
        assert(first.size() == 3);
        for (std::size_t i = 0; i < first.size(); ++i) {
            assert(first[i].startOffset == second[i].startOffset);
            assert(first[i].relevanceScore == second[i].relevanceScore);
            assert(first[i].rank == i + 1);
            if (i + 1 < first.size()) {
                assert(first[i].relevanceScore >= first[i + 1].relevanceScore);
            }
        }
        assert(first[0].text.find("inner join") != std::string::npos);

        const auto passageCount = ranker.splitPassages(document).size();
        auto all = ranker.rank(JoinTopic(), document, domain::RankingStrategy::Keyword, 1000);
        assert(all.size() == passageCount && "topK larger than the passage count returns every passage.");
        std::cout << "[PASS] Keyword ranking is deterministic." << std::endl;
    }

    // Adding keyword occurrences never lowers a passage's score.
    {
        auto keywords = PassageRanker::ExtractKeywords(JoinTopic());
        std::string passage = "Storage engines write pages to disk.";
        double previous = PassageRanker::KeywordScore(passage, keywords);
        for (int i = 0; i < 5; ++i) {
            passage += " Joins again.";
            const double score = PassageRanker::KeywordScore(passage, keywords);
            assert(score >= previous);
            previous = score;
        }
        assert(PassageRanker::KeywordScore("JOINS joins JoInS", {"joins"}) == 3.0);
        assert(PassageRanker::KeywordScore("aaaa", {"aa"}) == 2.0 && "Occurrences do not overlap.");
        std::cout << "[PASS] Keyword score monotonicity." << std::endl;
    }

    // Completion strategy: judged by the model, failures score 0, pre-filter respected.
    {
        auto fake = std::make_shared<FakeCompletionService>([](const std::string& prompt) -> std::string {
            if (prompt.find("indexed columns") != std::string::npos) return "{\"score\": 9.5}";
            if (prompt.find("inner join") != std::string::npos) throw domain::TimeoutError("slow");
            return "{\"score\": 2}";
        });
        RankingSettings settings;
        settings.strategy = domain::RankingStrategy::Completion;
        settings.maxJudgedPassages = 4;
        PassageRanker ranker(fake, PassageOptions(), settings, 2);

        auto ranked = ranker.rank(JoinTopic(), document, domain::RankingStrategy::Completion, 2);
        assert(ranked.size() == 2);
        assert(ranked[0].text.find("indexed columns") != std::string::npos);
        assert(ranked[0].relevanceScore == 9.5);
        assert(ranker.splitPassages(document).size() > 4);
        assert(fake->callCount() == 4 && "Only pre-filtered passages are judged.");
        for (const auto& passage : ranked) {
            assert(passage.text.find("inner join") == std::string::npos || passage.relevanceScore == 0.0);
        }
        std::cout << "[PASS] Completion ranking." << std::endl;
    }

    // Relevance answer parsing.
    {
        assert(*PassageRanker::ParseRelevanceScore("{\"score\": 7}") == 7.0);
        assert(*PassageRanker::ParseRelevanceScore("Relevance: 12 out of 10") == 10.0);
        assert(*PassageRanker::ParseRelevanceScore("{\"score\": -3}") == 0.0);
        assert(!PassageRanker::ParseRelevanceScore("not relevant at all"));
        assert(*PassageRanker::ParseRelevanceScore("Score for [passage 2]: {\"score\": 6}") == 6.0);
        std::cout << "[PASS] Relevance parsing." << std::endl;
    }

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
