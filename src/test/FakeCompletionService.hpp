/**
 * @file FakeCompletionService.hpp
 * @brief Scripted completion backend for tests.
 */

#pragma once

#include <atomic>
#include <functional>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "domain/CompletionService.hpp"

namespace learnpath::test {

/**
 * @class FakeCompletionService
 * @brief Answers every call with a handler; the handler may throw the
 * CompletionError family to simulate failures.
 */
class FakeCompletionService : public domain::CompletionService {
public:
    using Handler = std::function<std::string(const std::string& prompt)>;

    explicit FakeCompletionService(Handler handler, std::string model = "fake-model")
        : m_handler(std::move(handler)), m_model(std::move(model)) {}

    std::string complete(const std::string& prompt, const domain::CompletionOptions& options) override {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_prompts.push_back(prompt);
            m_lastOptions = options;
        }
        ++m_calls;
        return m_handler(prompt);
    }

    std::string getCurrentModel() const override { return m_model; }

    int callCount() const { return m_calls.load(); }

    std::vector<std::string> prompts() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_prompts;
    }

private:
    Handler m_handler;
    std::string m_model;
    std::atomic<int> m_calls{0};
    mutable std::mutex m_mutex;
    std::vector<std::string> m_prompts;
    domain::CompletionOptions m_lastOptions;
};

/** @brief Extracts the integer following marker in text, or -1. */
inline int FindMarker(const std::string& text, const std::string& marker) {
    const auto pos = text.find(marker);
    if (pos == std::string::npos) return -1;
    std::size_t i = pos + marker.size();
    int value = 0;
    bool any = false;
    while (i < text.size() && text[i] >= '0' && text[i] <= '9') {
        value = value * 10 + (text[i] - '0');
        any = true;
        ++i;
    }
    return any ? value : -1;
}

} // namespace learnpath::test
