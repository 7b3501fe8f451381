/**
 * @file TopicOrchestrator.hpp
 * @brief Fans topic extraction out over extraction units.
 */

#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "application/ParallelExecutor.hpp"
#include "application/PipelineConfig.hpp"
#include "domain/CompletionService.hpp"
#include "domain/TextUnit.hpp"
#include "domain/Topic.hpp"

namespace learnpath::application {

using StatusCallback = std::function<void(const std::string&)>;

/**
 * @struct ExtractionResult
 * @brief Candidates of every unit in unit order, with per-outcome counters.
 */
struct ExtractionResult {
    std::vector<domain::TopicCandidate> candidates;
    std::size_t unitsSucceeded = 0;
    std::size_t unitsEmpty = 0;     ///< Valid response without topics.
    std::size_t unitsMalformed = 0; ///< Response held no parsable topic list.
    std::size_t unitsTimedOut = 0;
    std::size_t unitsFailed = 0;    ///< Transport or model errors after every retry.
    std::size_t unitsSkipped = 0;   ///< Never started because of cancellation.
    bool cancelled = false;
};

/**
 * @class TopicOrchestrator
 * @brief One completion call per unit on a bounded worker pool.
 *
 * A failing unit never aborts the run: transport and model errors are
 * retried with exponential backoff, timeouts and malformed output count as
 * an empty contribution.
 */
class TopicOrchestrator {
public:
    TopicOrchestrator(std::shared_ptr<domain::CompletionService> completion, ExtractionSettings settings);

    ExtractionResult extract(const std::vector<domain::TextUnit>& units,
                             const std::string& documentTitle,
                             const CancellationToken* cancel = nullptr,
                             const StatusCallback& statusCallback = nullptr) const;

    /** @brief Delay before retry number `attempt` (1-based): backoff_ms * 2^(attempt-1). */
    int backoffForAttempt(int attempt) const;

private:
    enum class UnitOutcome { NotRun, Succeeded, Empty, Malformed, TimedOut, Failed };

    struct UnitResult {
        UnitOutcome outcome = UnitOutcome::NotRun;
        std::vector<domain::TopicCandidate> candidates;
    };

    UnitResult extractUnit(const domain::TextUnit& unit,
                           std::size_t unitIndex,
                           const std::string& documentTitle,
                           const CancellationToken* cancel) const;

    std::shared_ptr<domain::CompletionService> m_completion;
    ExtractionSettings m_settings;
};

} // namespace learnpath::application
