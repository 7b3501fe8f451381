/**
 * @file TopicMerger.cpp
 * @brief Implementation of TopicMerger.
 */

#include "domain/topics/TopicMerger.hpp"
#include "domain/PipelineErrors.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <numeric>
#include <set>
#include <utility>

namespace learnpath::domain::topics {

namespace {

constexpr std::size_t kMinContainmentLength = 4;
constexpr std::size_t kMaxSlugLength = 48;

std::string Compact(const std::string& normalized) {
    std::string out;
    out.reserve(normalized.size());
    for (char c : normalized) {
        if (c != ' ') out.push_back(c);
    }
    return out;
}

struct Group {
    std::vector<TopicCandidate> members; ///< In candidate order.
};

/// Union-find over candidate indices. The root is always the smallest index.
class DisjointSet {
public:
    explicit DisjointSet(std::size_t size) : m_parent(size) {
        std::iota(m_parent.begin(), m_parent.end(), 0);
    }

    std::size_t find(std::size_t i) {
        while (m_parent[i] != i) {
            m_parent[i] = m_parent[m_parent[i]];
            i = m_parent[i];
        }
        return i;
    }

    void unite(std::size_t a, std::size_t b) {
        a = find(a);
        b = find(b);
        if (a == b) return;
        if (b < a) std::swap(a, b);
        m_parent[b] = a;
    }

private:
    std::vector<std::size_t> m_parent;
};

bool CompactMatch(const std::string& na, const std::string& ca,
                  const std::string& nb, const std::string& cb) {
    if (na == nb) return true;
    const std::string& shorter = ca.size() <= cb.size() ? ca : cb;
    const std::string& longer = ca.size() <= cb.size() ? cb : ca;
    return shorter.size() >= kMinContainmentLength && longer.find(shorter) != std::string::npos;
}

Topic Collapse(const Group& group) {
    Topic topic;
    const TopicCandidate& first = group.members.front();
    topic.title = first.title;
    topic.description = first.description;
    topic.importance = first.importance;
    topic.firstUnitIndex = first.sourceUnitIndex;

    std::set<std::string> seenKeywords;
    for (const auto& member : group.members) {
        if (member.title.size() > topic.title.size()) topic.title = member.title;
        if (member.description.size() > topic.description.size()) topic.description = member.description;
        if (member.importance > topic.importance) topic.importance = member.importance;
        for (const auto& kw : member.keywords) {
            if (seenKeywords.insert(kw).second) {
                topic.keywords.push_back(kw);
            }
        }
    }
    return topic;
}

} // namespace

std::string TopicMerger::NormalizeTitle(const std::string& title) {
    std::string out;
    out.reserve(title.size());
    bool pendingSpace = false;
    for (char ch : title) {
        const unsigned char c = static_cast<unsigned char>(ch);
        if (std::isalnum(c) || c >= 0x80) {
            if (pendingSpace && !out.empty()) out.push_back(' ');
            pendingSpace = false;
            out.push_back(static_cast<char>(std::tolower(c)));
        } else {
            pendingSpace = true;
        }
    }
    return out;
}

bool TopicMerger::TitlesMatch(const std::string& a, const std::string& b) {
    const std::string na = NormalizeTitle(a);
    const std::string nb = NormalizeTitle(b);
    if (na.empty() || nb.empty()) {
        return false;
    }
    if (na == nb) {
        return true;
    }
    return CompactMatch(na, Compact(na), nb, Compact(nb));
}

std::string TopicMerger::Slugify(const std::string& title) {
    std::string slug;
    for (char c : NormalizeTitle(title)) {
        if (slug.size() >= kMaxSlugLength) break;
        const unsigned char uc = static_cast<unsigned char>(c);
        if (c == ' ') {
            slug.push_back('-');
        } else if (uc < 0x80) {
            slug.push_back(c);
        }
    }
    while (!slug.empty() && slug.back() == '-') slug.pop_back();
    return slug.empty() ? "topic" : slug;
}

std::string TopicMerger::MakeTopicId(std::size_t ordinal, const std::string& title) {
    std::string number = std::to_string(ordinal);
    if (number.size() < 2) number.insert(0, 2 - number.size(), '0');
    return "t" + number + "-" + Slugify(title);
}

std::vector<Topic> TopicMerger::Merge(const std::vector<TopicCandidate>& candidates,
                                      std::size_t targetMin,
                                      std::size_t targetMax) {
    if (targetMax == 0) {
        throw ConfigError("topics.max must be greater than zero");
    }
    if (targetMin > targetMax) {
        throw ConfigError("topics.min (" + std::to_string(targetMin) +
                          ") must not exceed topics.max (" + std::to_string(targetMax) + ")");
    }

    std::vector<TopicCandidate> sorted = candidates;
    std::stable_sort(sorted.begin(), sorted.end(), [](const TopicCandidate& a, const TopicCandidate& b) {
        if (a.sourceUnitIndex != b.sourceUnitIndex) return a.sourceUnitIndex < b.sourceUnitIndex;
        return a.positionInUnit < b.positionInUnit;
    });

    sorted.erase(std::remove_if(sorted.begin(), sorted.end(),
                                [](const TopicCandidate& c) { return NormalizeTitle(c.title).empty(); }),
                 sorted.end());

    std::vector<std::string> normalized;
    std::vector<std::string> compact;
    normalized.reserve(sorted.size());
    compact.reserve(sorted.size());
    for (const auto& candidate : sorted) {
        normalized.push_back(NormalizeTitle(candidate.title));
        compact.push_back(Compact(normalized.back()));
    }

    // Matching is closed transitively: a candidate that matches two groups
    // joins them, which keeps a second merge pass a no-op.
    DisjointSet sets(sorted.size());
    for (std::size_t i = 0; i < sorted.size(); ++i) {
        for (std::size_t j = i + 1; j < sorted.size(); ++j) {
            if (CompactMatch(normalized[i], compact[i], normalized[j], compact[j])) {
                sets.unite(i, j);
            }
        }
    }

    std::vector<Group> groups;
    std::vector<std::size_t> groupOfRoot(sorted.size(), sorted.size());
    for (std::size_t i = 0; i < sorted.size(); ++i) {
        const std::size_t root = sets.find(i);
        if (groupOfRoot[root] == sorted.size()) {
            groupOfRoot[root] = groups.size();
            groups.emplace_back();
        }
        groups[groupOfRoot[root]].members.push_back(sorted[i]);
    }

    std::vector<Topic> merged;
    merged.reserve(groups.size());
    for (const auto& group : groups) {
        merged.push_back(Collapse(group));
    }

    if (merged.size() > targetMax) {
        // Groups are in first-appearance order, so a stable sort by importance
        // keeps first appearance as the tie breaker.
        std::vector<std::size_t> order(merged.size());
        std::iota(order.begin(), order.end(), 0);
        std::stable_sort(order.begin(), order.end(), [&](std::size_t a, std::size_t b) {
            return merged[a].importance > merged[b].importance;
        });
        order.resize(targetMax);
        std::sort(order.begin(), order.end());

        std::vector<Topic> kept;
        kept.reserve(targetMax);
        for (std::size_t index : order) kept.push_back(merged[index]);
        std::cout << "[TopicMerger] Trimmed " << merged.size() << " topics to " << targetMax << std::endl;
        merged = std::move(kept);
    }

    if (merged.size() < targetMin) {
        std::cerr << "[TopicMerger] Only " << merged.size() << " topics found (target minimum "
                  << targetMin << ")" << std::endl;
    }

    for (std::size_t i = 0; i < merged.size(); ++i) {
        merged[i].ordinal = i + 1;
        merged[i].id = MakeTopicId(i + 1, merged[i].title);
    }
    return merged;
}

} // namespace learnpath::domain::topics
