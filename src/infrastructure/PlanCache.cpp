/**
 * @file PlanCache.cpp
 * @brief Implementation of PlanCache.
 */

#include "infrastructure/PlanCache.hpp"
#include "infrastructure/ContentHasher.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace learnpath::infrastructure {

PlanCache::PlanCache(const std::string& cacheDir, PersistenceService& persistence)
    : m_cacheDir(cacheDir), m_persistence(persistence), m_repository(persistence) {}

std::string PlanCache::indexPath() const {
    return (fs::path(m_cacheDir) / ".plan_cache.json").string();
}

std::string PlanCache::planPathFor(const std::string& documentId) const {
    const std::string name = ContentHasher::Sha256Hex(documentId).substr(0, 16) + ".plan.json";
    return (fs::path(m_cacheDir) / name).string();
}

std::optional<domain::LearningPlan> PlanCache::get(const std::string& documentId, const std::string& cacheKey) const {
    std::string planFile;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_entries.find(documentId);
        if (it == m_entries.end() || it->second.key != cacheKey) {
            return std::nullopt;
        }
        planFile = it->second.planFile;
    }
    return PlanRepository::Load(planFile);
}

void PlanCache::update(const std::string& documentId, const std::string& cacheKey, const domain::LearningPlan& plan) {
    const std::string planFile = planPathFor(documentId);
    m_repository.saveAsync(plan, planFile);

    std::lock_guard<std::mutex> lock(m_mutex);
    m_entries[documentId] = {cacheKey, planFile};
}

bool PlanCache::persist() {
    if (m_cacheDir.empty()) return false;

    json j = json::object();
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (const auto& [id, entry] : m_entries) {
            j[id] = { {"key", entry.key}, {"plan", entry.planFile} };
        }
    }
    m_persistence.saveTextAsync(indexPath(), j.dump(4));
    return m_persistence.flush();
}

void PlanCache::load() {
    if (m_cacheDir.empty()) return;
    const fs::path p = indexPath();
    if (!fs::exists(p)) return;

    try {
        std::ifstream f(p);
        if (!f.is_open()) return;

        json j = json::parse(f);
        std::lock_guard<std::mutex> lock(m_mutex);
        m_entries.clear();
        for (auto it = j.begin(); it != j.end(); ++it) {
            const json& value = it.value();
            if (value.contains("key") && value.contains("plan")) {
                m_entries[it.key()] = {value["key"].get<std::string>(), value["plan"].get<std::string>()};
            }
        }
    } catch (const json::exception& e) {
        std::cerr << "[PlanCache] Ignoring unreadable index " << p << ": " << e.what() << std::endl;
    }
}

std::size_t PlanCache::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_entries.size();
}

} // namespace learnpath::infrastructure
