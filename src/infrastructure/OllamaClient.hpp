/**
 * @file OllamaClient.hpp
 * @brief Completion service backed by the Ollama REST API.
 */

#pragma once

#include <cstddef>
#include <mutex>
#include <string>
#include <vector>

#include "domain/CompletionService.hpp"
#include "infrastructure/ModelSelector.hpp"

namespace learnpath::infrastructure {

/**
 * @class OllamaClient
 * @brief Implements domain::CompletionService over POST /api/generate.
 *
 * Each call opens its own httplib::Client, so concurrent calls from the
 * extraction workers share nothing but the model name.
 */
class OllamaClient : public domain::CompletionService {
public:
    /**
     * @param model Model name, or "auto" to pick one with ModelSelector on first use.
     * @param preferences Selection policy for "auto".
     */
    OllamaClient(const std::string& host = "localhost", int port = 11434, const std::string& model = "auto",
                 ModelPreferences preferences = {});

    /**
     * @throws domain::TransportError when the server cannot be reached,
     *         domain::TimeoutError when the read timeout expires,
     *         domain::ModelError on non-200 answers or an envelope without "response".
     */
    std::string complete(const std::string& prompt, const domain::CompletionOptions& options) override;

    std::string getCurrentModel() const override;

    /** @brief Fetches available models from /api/tags. Empty on any failure. */
    std::vector<std::string> getAvailableModels() const;

    /** @brief Context window reported by POST /api/show, 0 when unknown. */
    std::size_t getContextLength(const std::string& model) const;

    /** @brief Resolves "auto" against the installed models. Idempotent. */
    std::string resolveModel();

private:
    std::string m_host;
    int m_port;
    ModelPreferences m_preferences;
    mutable std::mutex m_modelMutex;
    std::string m_model;
};

} // namespace learnpath::infrastructure
