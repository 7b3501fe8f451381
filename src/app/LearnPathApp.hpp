/**
 * @file LearnPathApp.hpp
 * @brief Wires configuration, completion backend, cache and pipeline for one CLI run.
 */

#pragma once

#include <memory>
#include <string>

#include "app/CliOptions.hpp"
#include "application/ParallelExecutor.hpp"
#include "application/PipelineConfig.hpp"

namespace learnpath::infrastructure {
class OllamaClient;
class PersistenceService;
class PlanCache;
}

namespace learnpath::app {

/** Process exit codes. */
enum ExitCode : int {
    kExitOk = 0,
    kExitUsage = 1,
    kExitConfig = 2,
    kExitPipeline = 3
};

/**
 * @class LearnPathApp
 * @brief Orchestrates the run lifecycle: initialization, generation, output and shutdown.
 */
class LearnPathApp {
public:
    explicit LearnPathApp(application::CancellationToken& cancel);
    ~LearnPathApp();

    /** @return One of the ExitCode values. */
    int Run(const CliOptions& options);

private:
    /** @brief Loads config and builds services. @throws domain::ConfigError */
    void Init(const CliOptions& options);

    void Shutdown();

    std::string defaultOutputPath(const std::string& documentTitle) const;

    application::CancellationToken& m_cancel;
    application::PipelineConfig m_config;
    std::shared_ptr<infrastructure::PersistenceService> m_persistence;
    std::shared_ptr<infrastructure::OllamaClient> m_completion;
    std::shared_ptr<infrastructure::PlanCache> m_cache;
};

} // namespace learnpath::app
