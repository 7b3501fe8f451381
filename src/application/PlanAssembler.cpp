/**
 * @file PlanAssembler.cpp
 * @brief Implementation of PlanAssembler.
 */

#include "application/PlanAssembler.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace learnpath::application {

namespace {

std::tm ToUtcTime(std::time_t tt) {
    std::tm tm = {};
#if defined(_WIN32)
    gmtime_s(&tm, &tt);
#else
    gmtime_r(&tt, &tm);
#endif
    return tm;
}

} // namespace

std::string PlanAssembler::CurrentTimestamp() {
    const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    const std::tm tm = ToUtcTime(now);
    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return ss.str();
}

domain::LearningPlan PlanAssembler::Assemble(const domain::DocumentMeta& meta,
                                             const std::vector<domain::Topic>& topics,
                                             const std::map<std::string, std::vector<domain::Passage>>& passagesByTopic,
                                             domain::ProcessingInfo info) {
    std::map<std::string, std::vector<domain::Passage>> passages;
    for (const auto& topic : topics) {
        auto it = passagesByTopic.find(topic.id);
        if (it == passagesByTopic.end()) {
            throw std::logic_error("topic '" + topic.id + "' has no passages entry");
        }
        passages.emplace(topic.id, it->second);
    }

    if (info.createdAt.empty()) {
        info.createdAt = CurrentTimestamp();
    }
    return domain::LearningPlan(meta, topics, std::move(passages), std::move(info));
}

} // namespace learnpath::application
