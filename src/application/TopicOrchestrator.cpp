/**
 * @file TopicOrchestrator.cpp
 * @brief Implementation of TopicOrchestrator.
 */

#include "application/TopicOrchestrator.hpp"
#include "domain/PipelineErrors.hpp"
#include "domain/topics/TopicResponseParser.hpp"
#include "infrastructure/PromptCatalog.hpp"

#include <chrono>
#include <iostream>
#include <mutex>
#include <thread>
#include <utility>
#include <variant>

namespace learnpath::application {

TopicOrchestrator::TopicOrchestrator(std::shared_ptr<domain::CompletionService> completion,
                                     ExtractionSettings settings)
    : m_completion(std::move(completion)), m_settings(settings) {}

int TopicOrchestrator::backoffForAttempt(int attempt) const {
    if (attempt < 1) return 0;
    long long delay = m_settings.backoffMs;
    for (int i = 1; i < attempt && delay < 60000; ++i) {
        delay *= 2;
    }
    return static_cast<int>(delay);
}

TopicOrchestrator::UnitResult TopicOrchestrator::extractUnit(const domain::TextUnit& unit,
                                                             std::size_t unitIndex,
                                                             const std::string& documentTitle,
                                                             const CancellationToken* cancel) const {
    UnitResult result;

    domain::CompletionOptions options;
    options.maxTokens = m_settings.maxTokens;
    options.temperature = m_settings.temperature;
    options.timeoutSeconds = m_settings.timeoutSeconds;

    const std::string prompt = infrastructure::PromptCatalog::TopicExtraction(documentTitle, unit.title, unit.text);

    std::string response;
    bool answered = false;
    for (int attempt = 1; attempt <= m_settings.maxAttempts; ++attempt) {
        if (cancel && cancel->isCancelled()) {
            return result;
        }
        try {
            response = m_completion->complete(prompt, options);
            answered = true;
            break;
        } catch (const domain::TimeoutError& e) {
            std::cerr << "[TopicOrchestrator] Unit " << unitIndex << " timed out: " << e.what() << std::endl;
            result.outcome = UnitOutcome::TimedOut;
            return result;
        } catch (const domain::CompletionError& e) {
            std::cerr << "[TopicOrchestrator] Unit " << unitIndex << " attempt " << attempt << "/"
                      << m_settings.maxAttempts << " failed: " << e.what() << std::endl;
            if (attempt < m_settings.maxAttempts) {
                const int delay = backoffForAttempt(attempt);
                if (delay > 0) {
                    std::this_thread::sleep_for(std::chrono::milliseconds(delay));
                }
            }
        }
    }

    if (!answered) {
        std::cerr << "[TopicOrchestrator] Skipping unit " << unitIndex << " after "
                  << m_settings.maxAttempts << " attempts" << std::endl;
        result.outcome = UnitOutcome::Failed;
        return result;
    }

    auto parsed = domain::topics::TopicResponseParser::Parse(response, unitIndex);
    if (auto* malformed = std::get_if<domain::topics::MalformedResponse>(&parsed)) {
        std::cerr << "[TopicOrchestrator] Unit " << unitIndex << " returned malformed output ("
                  << malformed->reason << ")" << std::endl;
        result.outcome = UnitOutcome::Malformed;
        return result;
    }

    result.candidates = std::move(std::get<domain::topics::TopicList>(parsed));
    result.outcome = result.candidates.empty() ? UnitOutcome::Empty : UnitOutcome::Succeeded;
    return result;
}

ExtractionResult TopicOrchestrator::extract(const std::vector<domain::TextUnit>& units,
                                            const std::string& documentTitle,
                                            const CancellationToken* cancel,
                                            const StatusCallback& statusCallback) const {
    std::vector<UnitResult> slots(units.size());
    std::mutex statusMutex;
    std::size_t finished = 0;

    ParallelExecutor executor(m_settings.concurrency);
    executor.forEach(units.size(), [&](std::size_t index) {
        slots[index] = extractUnit(units[index], index, documentTitle, cancel);
        if (statusCallback) {
            std::lock_guard<std::mutex> lock(statusMutex);
            ++finished;
            statusCallback("Extracted topics from unit " + std::to_string(finished) + "/" +
                           std::to_string(units.size()));
        }
    }, cancel);

    ExtractionResult result;
    for (auto& slot : slots) {
        switch (slot.outcome) {
            case UnitOutcome::NotRun: ++result.unitsSkipped; break;
            case UnitOutcome::Succeeded: ++result.unitsSucceeded; break;
            case UnitOutcome::Empty: ++result.unitsEmpty; break;
            case UnitOutcome::Malformed: ++result.unitsMalformed; break;
            case UnitOutcome::TimedOut: ++result.unitsTimedOut; break;
            case UnitOutcome::Failed: ++result.unitsFailed; break;
        }
        for (auto& candidate : slot.candidates) {
            result.candidates.push_back(std::move(candidate));
        }
    }
    result.cancelled = cancel && cancel->isCancelled();

    std::cout << "[TopicOrchestrator] " << units.size() << " units: " << result.unitsSucceeded << " ok, "
              << result.unitsEmpty << " empty, " << result.unitsMalformed << " malformed, "
              << result.unitsTimedOut << " timed out, " << result.unitsFailed << " failed, "
              << result.unitsSkipped << " skipped; " << result.candidates.size() << " candidates" << std::endl;
    return result;
}

} // namespace learnpath::application
