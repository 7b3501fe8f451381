/**
 * @file PlanRepository.hpp
 * @brief JSON persistence of learning plans.
 */

#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "domain/LearningPlan.hpp"
#include "infrastructure/PersistenceService.hpp"

namespace learnpath::infrastructure {

/**
 * @class PlanRepository
 * @brief Stores a plan as one JSON document, replaced wholesale on every save.
 *
 * Layout: {"version", "document", "processing", "topics": [{..., "passages": [...]}]}.
 * Topics and passages are ordered lists; passages are nested in their topic.
 */
class PlanRepository {
public:
    static constexpr int kFormatVersion = 1;

    explicit PlanRepository(PersistenceService& persistence);

    static nlohmann::json ToJson(const domain::LearningPlan& plan);

    /** @return nullopt when required fields are missing or of the wrong type. */
    static std::optional<domain::LearningPlan> FromJson(const nlohmann::json& j);

    /** @brief Atomic write through the persistence queue; waits for it to land. */
    bool save(const domain::LearningPlan& plan, const std::string& path);

    /** @brief Queues the write without waiting. */
    void saveAsync(const domain::LearningPlan& plan, const std::string& path);

    static std::optional<domain::LearningPlan> Load(const std::string& path);

private:
    PersistenceService& m_persistence;
};

} // namespace learnpath::infrastructure
