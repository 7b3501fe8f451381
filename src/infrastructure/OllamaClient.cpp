#include "infrastructure/OllamaClient.hpp"
#include "domain/PipelineErrors.hpp"
#include "infrastructure/ModelSelector.hpp"

#include <httplib.h>
#include <nlohmann/json.hpp>
#include <iostream>
#include <utility>

namespace learnpath::infrastructure {

using json = nlohmann::json;

namespace {
constexpr double kDeterministicTopP = 1.0;
constexpr int kDeterministicSeed = 42;
constexpr int kConnectTimeoutSeconds = 10;
constexpr const char* kAutoModel = "auto";
}

OllamaClient::OllamaClient(const std::string& host, int port, const std::string& model,
                           ModelPreferences preferences)
    : m_host(host),
      m_port(port),
      m_preferences(std::move(preferences)),
      m_model(model.empty() ? kAutoModel : model) {}

std::string OllamaClient::getCurrentModel() const {
    std::lock_guard<std::mutex> lock(m_modelMutex);
    return m_model;
}

std::string OllamaClient::resolveModel() {
    {
        std::lock_guard<std::mutex> lock(m_modelMutex);
        if (m_model != kAutoModel) {
            return m_model;
        }
    }

    const auto available = getAvailableModels();
    if (available.empty()) {
        std::cerr << "[OllamaClient] Failed to list models. Is Ollama running?" << std::endl;
        throw domain::TransportError("no models available from Ollama at " + m_host + ":" + std::to_string(m_port));
    }

    std::vector<ModelInfo> models;
    for (const auto& name : available) {
        ModelInfo info;
        info.name = name;
        if (!ModelSelector::IsEmbeddingModel(name)) {
            info.contextLength = getContextLength(name);
        }
        models.push_back(info);
    }

    const std::string selected = ModelSelector::Select(models, m_preferences);
    for (const auto& info : models) {
        if (info.name == selected && info.contextLength != 0 &&
            info.contextLength < m_preferences.requiredContext) {
            std::cerr << "[OllamaClient] No installed model has a " << m_preferences.requiredContext
                      << "-token window; " << selected << " (" << info.contextLength
                      << ") may truncate extraction units" << std::endl;
        }
    }
    std::cout << "[OllamaClient] Auto-selected model: " << selected << std::endl;

    std::lock_guard<std::mutex> lock(m_modelMutex);
    m_model = selected;
    return m_model;
}

std::string OllamaClient::complete(const std::string& prompt, const domain::CompletionOptions& options) {
    const std::string model = resolveModel();

    httplib::Client cli(m_host, m_port);
    cli.set_connection_timeout(kConnectTimeoutSeconds, 0);
    cli.set_read_timeout(options.timeoutSeconds, 0);

    json requestData = {
        {"model", model},
        {"prompt", prompt},
        {"stream", false},
        {"options", {
            {"temperature", options.temperature},
            {"top_p", kDeterministicTopP},
            {"seed", kDeterministicSeed},
            {"num_predict", options.maxTokens}
        }}
    };
    if (options.forceJson) {
        requestData["format"] = "json";
    }

    auto res = cli.Post("/api/generate", requestData.dump(), "application/json");
    if (!res) {
        const auto error = res.error();
        // httplib reports an expired read timeout as a read error.
        if (error == httplib::Error::Read) {
            throw domain::TimeoutError("no answer from " + model + " within " +
                                       std::to_string(options.timeoutSeconds) + "s");
        }
        throw domain::TransportError("connection to Ollama failed (httplib error " + std::to_string(static_cast<int>(error)) + ")");
    }

    if (res->status != 200) {
        std::cerr << "[OllamaClient] HTTP Error " << res->status << ": " << res->body << std::endl;
        throw domain::ModelError("Ollama answered HTTP " + std::to_string(res->status));
    }

    try {
        auto body = json::parse(res->body);
        if (body.contains("response") && body["response"].is_string()) {
            return body["response"].get<std::string>();
        }
        if (body.contains("error") && body["error"].is_string()) {
            throw domain::ModelError("Ollama error: " + body["error"].get<std::string>());
        }
    } catch (const json::exception& e) {
        std::cerr << "[OllamaClient] JSON Parse Error: " << e.what() << std::endl;
        throw domain::ModelError(std::string("unreadable Ollama envelope: ") + e.what());
    }
    throw domain::ModelError("Ollama envelope has no 'response' field");
}

std::size_t OllamaClient::getContextLength(const std::string& model) const {
    httplib::Client cli(m_host, m_port);
    cli.set_connection_timeout(kConnectTimeoutSeconds, 0);
    cli.set_read_timeout(5, 0);

    const json request = {{"model", model}};
    auto res = cli.Post("/api/show", request.dump(), "application/json");
    if (!res || res->status != 200) {
        return 0;
    }
    try {
        auto body = json::parse(res->body);
        if (body.contains("model_info") && body["model_info"].is_object()) {
            // Keys are "<architecture>.context_length", e.g. "llama.context_length".
            const std::string suffix = ".context_length";
            for (const auto& [key, value] : body["model_info"].items()) {
                if (key.size() > suffix.size() &&
                    key.compare(key.size() - suffix.size(), suffix.size(), suffix) == 0 &&
                    value.is_number_unsigned()) {
                    return value.get<std::size_t>();
                }
            }
        }
    } catch (const json::exception& e) {
        std::cerr << "[OllamaClient] Error parsing model info for " << model << ": " << e.what() << std::endl;
    }
    return 0;
}

std::vector<std::string> OllamaClient::getAvailableModels() const {
    httplib::Client cli(m_host, m_port);
    cli.set_connection_timeout(kConnectTimeoutSeconds, 0);
    cli.set_read_timeout(5, 0);

    auto res = cli.Get("/api/tags");
    std::vector<std::string> models;
    if (res && res->status == 200) {
        try {
            auto body = json::parse(res->body);
            if (body.contains("models") && body["models"].is_array()) {
                for (const auto& item : body["models"]) {
                    if (item.contains("name") && item["name"].is_string()) {
                        models.push_back(item["name"].get<std::string>());
                    }
                }
            }
        } catch (const json::exception& e) {
            std::cerr << "[OllamaClient] Error parsing models: " << e.what() << std::endl;
        }
    }
    return models;
}

} // namespace learnpath::infrastructure
