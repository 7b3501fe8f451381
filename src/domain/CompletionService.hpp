/**
 * @file CompletionService.hpp
 * @brief Port for the external text-generation capability.
 */

#pragma once
#include <string>
#include <vector>

namespace learnpath::domain {

/**
 * @struct CompletionOptions
 * @brief Per-call generation settings.
 */
struct CompletionOptions {
    int maxTokens = 2000;
    double temperature = 0.3;
    int timeoutSeconds = 600; ///< Read timeout for this call only.
    bool forceJson = false;   ///< Ask the backend to constrain output to JSON.
};

/**
 * @class CompletionService
 * @brief Abstract interface for services that turn a prompt into generated text.
 *
 * Implementations must be safe to call from several worker threads at once.
 */
class CompletionService {
public:
    virtual ~CompletionService() = default;

    /**
     * @brief Generates a completion for the prompt.
     * @param prompt Full prompt text.
     * @param options Generation settings.
     * @return The generated text.
     * @throws TransportError, TimeoutError or ModelError (see PipelineErrors.hpp).
     */
    virtual std::string complete(const std::string& prompt, const CompletionOptions& options) = 0;

    /** @brief Name of the model answering the calls, recorded in persisted plans. */
    virtual std::string getCurrentModel() const = 0;
};

} // namespace learnpath::domain
