/**
 * @file CliOptions.hpp
 * @brief Command line of the learnpath tool.
 */

#pragma once

#include <cstddef>
#include <optional>
#include <string>

namespace learnpath::app {

struct CliOptions {
    std::string documentPath;
    std::string tocPath;
    std::string configPath;  ///< Empty means PathUtils::GetDefaultConfigPath().
    std::string outPath;     ///< Empty means <plans dir>/<document stem>.plan.json.
    std::string strategy;    ///< Overrides ranking.strategy when set.
    std::optional<std::size_t> topK;
    bool useCache = true;
    bool showHelp = false;
};

extern const char* const kUsage;

/**
 * @brief Parses argv. Prints the problem and returns nullopt on bad usage.
 */
std::optional<CliOptions> ParseCli(int argc, char** argv);

} // namespace learnpath::app
