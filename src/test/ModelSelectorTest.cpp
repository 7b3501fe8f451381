#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "infrastructure/ModelSelector.hpp"

using learnpath::infrastructure::ModelInfo;
using learnpath::infrastructure::ModelPreferences;
using learnpath::infrastructure::ModelSelector;

int main() {
    std::cout << "[Test] Starting ModelSelector Test..." << std::endl;

    const std::size_t required = ModelSelector::RequiredContext(14742, 4000);
    assert(required == 14742 / 4 + 512 + 4000);

    ModelPreferences preferences;
    preferences.priorities = {"qwen2.5", "llama3.1"};
    preferences.requiredContext = required;

    // A preferred model with a window too small for one unit is passed over.
    {
        std::vector<ModelInfo> installed = {
            {"nomic-embed-text:latest", 0},
            {"qwen2.5:0.5b-4k", 4096},
            {"llama3.1:8b", 131072},
            {"phi3:mini", 128000}
        };
        assert(ModelSelector::Select(installed, preferences) == "llama3.1:8b");
        std::cout << "[PASS] Small context windows are skipped." << std::endl;
    }

    // Exact names beat fragments; unknown windows count as usable.
    {
        std::vector<ModelInfo> installed = {
            {"qwen2.5:14b", 0},
            {"llama3.1", 0}
        };
        ModelPreferences exact = preferences;
        exact.priorities = {"llama3.1", "qwen2.5"};
        assert(ModelSelector::Select(installed, exact) == "llama3.1");
        assert(ModelSelector::Select(installed, preferences) == "qwen2.5:14b");

        std::vector<ModelInfo> tagged = {{"llama3.1:70b", 0}, {"llama3.1", 0}};
        assert(ModelSelector::Select(tagged, exact) == "llama3.1");
        std::cout << "[PASS] Priority order." << std::endl;
    }

    // Nothing on the priority list: widest known window wins.
    {
        std::vector<ModelInfo> installed = {
            {"tinyllama", 2048},
            {"phi3:medium", 128000},
            {"gemma:7b", 8192}
        };
        assert(ModelSelector::Select(installed, preferences) == "phi3:medium");
        std::cout << "[PASS] Widest window fallback." << std::endl;
    }

    // Embedding models are never chosen while a generative one exists.
    {
        std::vector<ModelInfo> installed = {
            {"mxbai-embed-large", 0},
            {"tinyllama", 2048}
        };
        assert(ModelSelector::IsEmbeddingModel("mxbai-embed-large"));
        assert(ModelSelector::Select(installed, preferences) == "tinyllama");
        std::vector<ModelInfo> onlyEmbedding = {{"mxbai-embed-large", 0}};
        assert(ModelSelector::Select(onlyEmbedding, preferences) == "mxbai-embed-large");
        assert(ModelSelector::Select(std::vector<ModelInfo>{}, preferences).empty());
        std::cout << "[PASS] Embedding models and degenerate lists." << std::endl;
    }

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
