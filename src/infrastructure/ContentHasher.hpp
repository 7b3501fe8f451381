/**
 * @file ContentHasher.hpp
 * @brief SHA-256 digests for cache keys.
 */

#pragma once
#include <string>
#include <vector>

namespace learnpath::infrastructure {

class ContentHasher {
public:
    /** @brief Lower-case hex SHA-256 of the bytes of content. */
    static std::string Sha256Hex(const std::string& content);

    /**
     * @brief Digest of several parts, each prefixed by its length so that
     * ("ab", "c") and ("a", "bc") never collide.
     */
    static std::string Sha256Hex(const std::vector<std::string>& parts);
};

} // namespace learnpath::infrastructure
