/**
 * @file PlanCache.hpp
 * @brief Content-hash keyed cache of generated plans.
 */

#pragma once
#include <map>
#include <mutex>
#include <optional>
#include <string>

#include "domain/LearningPlan.hpp"
#include "infrastructure/PersistenceService.hpp"
#include "infrastructure/PlanRepository.hpp"

namespace learnpath::infrastructure {

/**
 * @class PlanCache
 * @brief Avoids re-running extraction for an unchanged document and configuration.
 *
 * One entry per document id: the cache key it was generated with and the
 * plan file. A new key for the same document replaces the entry.
 * The index lives in <cacheDir>/.plan_cache.json.
 */
class PlanCache {
public:
    PlanCache(const std::string& cacheDir, PersistenceService& persistence);

    /** @brief The cached plan if the stored key equals cacheKey. */
    std::optional<domain::LearningPlan> get(const std::string& documentId, const std::string& cacheKey) const;

    /** @brief Stores the plan file and replaces the index entry. */
    void update(const std::string& documentId, const std::string& cacheKey, const domain::LearningPlan& plan);

    /** @brief Writes the index and waits for every pending write. */
    bool persist();

    /** @brief Loads the index from disk. A missing or broken index means an empty cache. */
    void load();

    std::size_t size() const;

    std::string indexPath() const;

private:
    struct CacheEntry {
        std::string key;
        std::string planFile;
    };

    std::string planPathFor(const std::string& documentId) const;

    std::string m_cacheDir;
    PersistenceService& m_persistence;
    PlanRepository m_repository;
    mutable std::mutex m_mutex;
    std::map<std::string, CacheEntry> m_entries;
};

} // namespace learnpath::infrastructure
