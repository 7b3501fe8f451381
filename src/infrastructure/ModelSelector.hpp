/**
 * @file ModelSelector.hpp
 * @brief Chooses the completion model used when the configured model is "auto".
 */

#pragma once
#include <cstddef>
#include <string>
#include <vector>

namespace learnpath::infrastructure {

/**
 * @struct ModelInfo
 * @brief An installed model as reported by Ollama.
 */
struct ModelInfo {
    std::string name;
    std::size_t contextLength = 0; ///< Tokens; 0 when /api/show did not report it.
};

/**
 * @struct ModelPreferences
 * @brief Selection policy taken from settings.json.
 */
struct ModelPreferences {
    std::vector<std::string> priorities;  ///< Exact names or name fragments, best first.
    std::size_t requiredContext = 0;      ///< Prompt plus answer budget in tokens.
};

/**
 * @class ModelSelector
 * @brief Separates model selection policy from client I/O.
 *
 * A whole extraction unit goes into a single prompt, so a model whose
 * context window cannot hold unit plus answer would silently truncate the
 * book. Such models, and embedding-only models, are never picked while a
 * usable alternative is installed.
 */
class ModelSelector {
public:
    /** @brief Rough token budget for one extraction call: ~4 bytes per token plus the prompt frame. */
    static std::size_t RequiredContext(std::size_t unitBytes, int maxOutputTokens) {
        constexpr std::size_t kPromptFrameTokens = 512;
        const std::size_t output = maxOutputTokens > 0 ? static_cast<std::size_t>(maxOutputTokens) : 0;
        return unitBytes / 4 + kPromptFrameTokens + output;
    }

    static bool IsEmbeddingModel(const std::string& name) {
        return name.find("embed") != std::string::npos;
    }

    /**
     * @brief Picks a model.
     *
     * Only generative models whose window is large enough are considered
     * (unknown windows count as large enough). For each priority entry in
     * turn, an exact name beats a name that merely contains it. Without any
     * match, the largest known window wins. When every model is filtered
     * out, the first generative model.
     * @return Empty only when available is empty.
     */
    static std::string Select(const std::vector<ModelInfo>& available, const ModelPreferences& preferences) {
        std::vector<const ModelInfo*> generative;
        std::vector<const ModelInfo*> usable;
        for (const auto& model : available) {
            if (IsEmbeddingModel(model.name)) continue;
            generative.push_back(&model);
            if (model.contextLength == 0 || model.contextLength >= preferences.requiredContext) {
                usable.push_back(&model);
            }
        }

        if (usable.empty()) {
            if (!generative.empty()) return generative.front()->name;
            return available.empty() ? std::string() : available.front().name;
        }

        for (const auto& priority : preferences.priorities) {
            const ModelInfo* fragmentMatch = nullptr;
            for (const auto* model : usable) {
                if (model->name == priority) return model->name;
                if (!fragmentMatch && model->name.find(priority) != std::string::npos) fragmentMatch = model;
            }
            if (fragmentMatch) return fragmentMatch->name;
        }

        const ModelInfo* widest = usable.front();
        for (const auto* model : usable) {
            if (model->contextLength > widest->contextLength) widest = model;
        }
        return widest->name;
    }
};

} // namespace learnpath::infrastructure
