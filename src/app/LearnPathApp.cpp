/**
 * @file LearnPathApp.cpp
 * @brief Implementation of LearnPathApp.
 */

#include "app/LearnPathApp.hpp"
#include "application/LearningPlanPipeline.hpp"
#include "domain/PipelineErrors.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/DocumentLoader.hpp"
#include "infrastructure/ModelSelector.hpp"
#include "infrastructure/OllamaClient.hpp"
#include "infrastructure/PathUtils.hpp"
#include "infrastructure/PersistenceService.hpp"
#include "infrastructure/PlanCache.hpp"
#include "infrastructure/PlanRepository.hpp"

#include <filesystem>
#include <iostream>
#include <utility>

namespace fs = std::filesystem;

namespace learnpath::app {

LearnPathApp::LearnPathApp(application::CancellationToken& cancel) : m_cancel(cancel) {}

LearnPathApp::~LearnPathApp() {
    Shutdown();
}

void LearnPathApp::Init(const CliOptions& options) {
    const std::string configPath = options.configPath.empty()
        ? infrastructure::PathUtils::GetDefaultConfigPath().string()
        : options.configPath;
    if (!options.configPath.empty() && !fs::exists(configPath)) {
        throw domain::ConfigError("config file not found: " + configPath);
    }

    m_config = infrastructure::ConfigLoader::Load(configPath);
    if (!options.strategy.empty()) {
        m_config.ranking.strategy = domain::RankingStrategyFromString(options.strategy);
    }
    if (options.topK) {
        m_config.ranking.topK = *options.topK;
    }
    if (m_config.plansDir.empty()) {
        m_config.plansDir = infrastructure::PathUtils::GetPlansDir().string();
    }
    m_config.validate();

    m_persistence = std::make_shared<infrastructure::PersistenceService>();
    infrastructure::ModelPreferences preferences;
    preferences.priorities = m_config.ollama.preferredModels;
    preferences.requiredContext = infrastructure::ModelSelector::RequiredContext(
        m_config.chunking.unitSize, m_config.extraction.maxTokens);
    m_completion = std::make_shared<infrastructure::OllamaClient>(
        m_config.ollama.host, m_config.ollama.port, m_config.ollama.model, std::move(preferences));

    if (options.useCache) {
        m_cache = std::make_shared<infrastructure::PlanCache>(m_config.plansDir, *m_persistence);
        m_cache->load();
    }
}

void LearnPathApp::Shutdown() {
    m_cache.reset();
    if (m_persistence) {
        m_persistence->stop();
    }
}

std::string LearnPathApp::defaultOutputPath(const std::string& documentTitle) const {
    std::string name = documentTitle.empty() ? "learning_plan" : documentTitle;
    return (fs::path(m_config.plansDir) / (name + ".plan.json")).string();
}

int LearnPathApp::Run(const CliOptions& options) {
    try {
        Init(options);
    } catch (const domain::ConfigError& e) {
        std::cerr << "[LearnPath] Configuration error: " << e.what() << std::endl;
        return kExitConfig;
    }

    auto printStatus = [](const std::string& message) {
        std::cout << "  ... " << message << std::endl;
    };

    auto document = infrastructure::DocumentLoader::Load(options.documentPath, printStatus);
    if (!document) {
        std::cerr << "[LearnPath] Could not read document: " << options.documentPath << std::endl;
        return kExitPipeline;
    }

    application::RunOptions runOptions;
    runOptions.cancel = &m_cancel;
    runOptions.statusCallback = printStatus;
    runOptions.useCache = options.useCache;
    if (!options.tocPath.empty()) {
        auto toc = infrastructure::DocumentLoader::ReadText(options.tocPath);
        if (!toc) {
            std::cerr << "[LearnPath] Could not read table of contents: " << options.tocPath << std::endl;
            return kExitUsage;
        }
        runOptions.tocText = *toc;
    }

    try {
        m_completion->resolveModel();

        application::LearningPlanPipeline pipeline(m_config, m_completion, m_cache);
        application::PipelineResult result = pipeline.run(*document, runOptions);

        const std::string outPath = options.outPath.empty()
            ? defaultOutputPath(document->getMeta().title)
            : options.outPath;
        infrastructure::PlanRepository repository(*m_persistence);
        if (!repository.save(result.plan, outPath)) {
            std::cerr << "[LearnPath] Failed to write plan to " << outPath << std::endl;
            return kExitPipeline;
        }

        std::cout << "\nLearning plan for \"" << result.plan.getMeta().title << "\""
                  << (result.fromCache ? " (cached)" : "") << "\n";
        for (const auto& topic : result.plan.getTopics()) {
            std::cout << "  " << topic.ordinal << ". " << topic.title << " ["
                      << domain::ImportanceToString(topic.importance) << "]\n";
        }
        if (result.cancelled) {
            std::cout << "\nRun was cancelled; the plan is partial and was not cached.\n";
        }
        std::cout << "\nSaved to " << outPath << std::endl;
        return kExitOk;
    } catch (const domain::ConfigError& e) {
        std::cerr << "[LearnPath] Configuration error: " << e.what() << std::endl;
        return kExitConfig;
    } catch (const domain::PipelineError& e) {
        std::cerr << "[LearnPath] Pipeline error: " << e.what() << std::endl;
        return kExitPipeline;
    } catch (const domain::CompletionError& e) {
        std::cerr << "[LearnPath] Completion backend unavailable: " << e.what() << std::endl;
        return kExitPipeline;
    }
}

} // namespace learnpath::app
