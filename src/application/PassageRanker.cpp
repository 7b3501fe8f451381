/**
 * @file PassageRanker.cpp
 * @brief Implementation of PassageRanker.
 */

#include "application/PassageRanker.hpp"
#include "domain/PipelineErrors.hpp"
#include "domain/topics/TopicResponseParser.hpp"
#include "infrastructure/PromptCatalog.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <numeric>
#include <regex>
#include <set>
#include <utility>

#include <nlohmann/json.hpp>

namespace learnpath::application {

namespace {

const std::set<std::string>& StopWords() {
    static const std::set<std::string> kStopWords = {
        "the", "a", "an", "and", "or", "but", "in", "on", "at", "to", "for", "of",
        "with", "by", "from", "as", "is", "was", "are", "were", "been", "be", "have",
        "has", "had", "do", "does", "did", "will", "would", "should", "could", "may",
        "might", "must", "can", "this", "that", "these", "those", "what", "which",
        "who", "when", "where", "why", "how", "about", "into", "their", "there", "they"
    };
    return kStopWords;
}

std::string ToLower(const std::string& value) {
    std::string out(value);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

void CollectWords(const std::string& text, std::vector<std::string>& out, std::set<std::string>& seen) {
    std::string word;
    auto flush = [&]() {
        if (word.size() > 3 && StopWords().count(word) == 0 && seen.insert(word).second) {
            out.push_back(word);
        }
        word.clear();
    };
    for (char ch : text) {
        const unsigned char c = static_cast<unsigned char>(ch);
        if (std::isalpha(c)) {
            word.push_back(static_cast<char>(std::tolower(c)));
        } else {
            flush();
        }
    }
    flush();
}

} // namespace

PassageRanker::PassageRanker(std::shared_ptr<domain::CompletionService> completion,
                             domain::segmentation::SplitterOptions passageOptions,
                             RankingSettings settings,
                             std::size_t concurrency)
    : m_completion(std::move(completion)),
      m_passageOptions(std::move(passageOptions)),
      m_settings(settings),
      m_concurrency(concurrency) {}

std::vector<std::string> PassageRanker::ExtractKeywords(const domain::Topic& topic) {
    std::vector<std::string> keywords;
    std::set<std::string> seen;
    CollectWords(topic.title, keywords, seen);
    CollectWords(topic.description, keywords, seen);
    for (const auto& kw : topic.keywords) {
        CollectWords(kw, keywords, seen);
    }
    return keywords;
}

double PassageRanker::KeywordScore(const std::string& text, const std::vector<std::string>& keywords) {
    const std::string lower = ToLower(text);
    double score = 0.0;
    for (const auto& keyword : keywords) {
        if (keyword.empty()) continue;
        std::size_t pos = lower.find(keyword);
        while (pos != std::string::npos) {
            score += 1.0;
            pos = lower.find(keyword, pos + keyword.size());
        }
    }
    return score;
}

std::optional<double> PassageRanker::ParseRelevanceScore(const std::string& response) {
    double value = 0.0;
    bool found = false;

    for (const auto& block : domain::topics::TopicResponseParser::ExtractJsonBlocks(response)) {
        try {
            auto parsed = nlohmann::json::parse(block);
            if (parsed.is_object() && parsed.contains("score") && parsed["score"].is_number()) {
                value = parsed["score"].get<double>();
                found = true;
                break;
            }
        } catch (const nlohmann::json::exception&) {
            // try the next block, then the plain number scan
        }
    }

    if (!found) {
        static const std::regex kNumber(R"((\d+(?:\.\d+)?))");
        std::smatch match;
        if (std::regex_search(response, match, kNumber)) {
            value = std::stod(match[1].str());
            found = true;
        }
    }

    if (!found) {
        return std::nullopt;
    }
    return std::clamp(value, 0.0, 10.0);
}

std::vector<domain::TextUnit> PassageRanker::splitPassages(const std::string& documentText) const {
    return domain::segmentation::TextSplitter(m_passageOptions).split(documentText);
}

std::vector<domain::Passage> PassageRanker::rank(const domain::Topic& topic,
                                                 const std::string& documentText,
                                                 domain::RankingStrategy strategy,
                                                 std::size_t topK,
                                                 const CancellationToken* cancel) const {
    return rank(topic, splitPassages(documentText), strategy, topK, cancel);
}

std::vector<domain::Passage> PassageRanker::rank(const domain::Topic& topic,
                                                 const std::vector<domain::TextUnit>& passages,
                                                 domain::RankingStrategy strategy,
                                                 std::size_t topK,
                                                 const CancellationToken* cancel) const {
    const auto keywords = ExtractKeywords(topic);

    std::vector<double> scores(passages.size(), 0.0);
    for (std::size_t i = 0; i < passages.size(); ++i) {
        scores[i] = KeywordScore(passages[i].text, keywords);
    }

    if (strategy == domain::RankingStrategy::Completion) {
        if (m_completion) {
            scores = judgeWithCompletion(topic, passages, scores, cancel);
        } else {
            std::cerr << "[PassageRanker] No completion service, falling back to keyword scores" << std::endl;
        }
    }

    std::vector<std::size_t> order(passages.size());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(), [&](std::size_t a, std::size_t b) {
        if (scores[a] != scores[b]) return scores[a] > scores[b];
        return passages[a].startOffset < passages[b].startOffset;
    });

    const std::size_t count = std::min(topK, passages.size());
    std::vector<domain::Passage> ranked;
    ranked.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        const auto& unit = passages[order[i]];
        domain::Passage passage;
        passage.text = unit.text;
        passage.startOffset = unit.startOffset;
        passage.relevanceScore = scores[order[i]];
        passage.rank = i + 1;
        ranked.push_back(std::move(passage));
    }
    return ranked;
}

std::vector<double> PassageRanker::judgeWithCompletion(const domain::Topic& topic,
                                                       const std::vector<domain::TextUnit>& passages,
                                                       const std::vector<double>& keywordScores,
                                                       const CancellationToken* cancel) const {
    std::vector<std::size_t> candidates(passages.size());
    std::iota(candidates.begin(), candidates.end(), 0);
    std::stable_sort(candidates.begin(), candidates.end(), [&](std::size_t a, std::size_t b) {
        if (keywordScores[a] != keywordScores[b]) return keywordScores[a] > keywordScores[b];
        return passages[a].startOffset < passages[b].startOffset;
    });
    if (candidates.size() > m_settings.maxJudgedPassages) {
        candidates.resize(m_settings.maxJudgedPassages);
    }

    domain::CompletionOptions options;
    options.maxTokens = 50;
    options.temperature = 0.0;
    options.timeoutSeconds = m_settings.timeoutSeconds;
    options.forceJson = true;

    std::vector<double> judged(passages.size(), 0.0);
    ParallelExecutor executor(m_concurrency);
    const std::size_t started = executor.forEach(candidates.size(), [&](std::size_t slot) {
        const std::size_t index = candidates[slot];
        const std::string prompt =
            infrastructure::PromptCatalog::PassageRelevance(topic.title, topic.description, passages[index].text);
        try {
            auto score = ParseRelevanceScore(m_completion->complete(prompt, options));
            if (score) {
                judged[index] = *score;
            } else {
                std::cerr << "[PassageRanker] Unparsable relevance for passage at "
                          << passages[index].startOffset << std::endl;
            }
        } catch (const domain::CompletionError& e) {
            std::cerr << "[PassageRanker] Relevance call failed for passage at "
                      << passages[index].startOffset << ": " << e.what() << std::endl;
        }
    }, cancel);

    if (started < candidates.size()) {
        std::cerr << "[PassageRanker] Cancelled after " << started << " of " << candidates.size()
                  << " judgments for '" << topic.title << "'" << std::endl;
    } else {
        std::cout << "[PassageRanker] Judged " << started << " passages for '" << topic.title << "'" << std::endl;
    }
    return judged;
}

} // namespace learnpath::application
