/**
 * @file PipelineErrors.hpp
 * @brief Error taxonomy for the learning plan pipeline.
 */

#pragma once
#include <stdexcept>
#include <string>

namespace learnpath::domain {

/**
 * @class ConfigError
 * @brief Invalid size, overlap, band or target parameters. Raised before any processing.
 */
class ConfigError : public std::invalid_argument {
public:
    explicit ConfigError(const std::string& message) : std::invalid_argument(message) {}
};

/**
 * @class CompletionError
 * @brief Base class for failures of the completion capability.
 */
class CompletionError : public std::runtime_error {
public:
    explicit CompletionError(const std::string& message) : std::runtime_error(message) {}
};

/** @brief Network level failure (connection refused, reset...). Retryable. */
class TransportError : public CompletionError {
public:
    explicit TransportError(const std::string& message) : CompletionError(message) {}
};

/** @brief The call exceeded its own timeout. Counts as an empty response. */
class TimeoutError : public TransportError {
public:
    explicit TimeoutError(const std::string& message) : TransportError(message) {}
};

/** @brief The backend rejected the request or answered with an unusable envelope. Retryable. */
class ModelError : public CompletionError {
public:
    explicit ModelError(const std::string& message) : CompletionError(message) {}
};

/**
 * @class PipelineError
 * @brief Fatal pipeline condition (empty document, no units produced).
 */
class PipelineError : public std::runtime_error {
public:
    explicit PipelineError(const std::string& message) : std::runtime_error(message) {}
};

} // namespace learnpath::domain
