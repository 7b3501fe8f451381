// PathUtils Header
#pragma once
#include <string>
#include <filesystem>

namespace learnpath::infrastructure {

class PathUtils {
public:
    static std::filesystem::path GetDataHome();
    static std::filesystem::path GetConfigHome();

    /** @brief $XDG_CONFIG_HOME/LearnPath/settings.json */
    static std::filesystem::path GetDefaultConfigPath();

    /** @brief $XDG_DATA_HOME/LearnPath/plans, created on first use. */
    static std::filesystem::path GetPlansDir();
};

} // namespace learnpath::infrastructure
