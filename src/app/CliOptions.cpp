/**
 * @file CliOptions.cpp
 * @brief Argument parsing for the learnpath command.
 */

#include "app/CliOptions.hpp"

#include <iostream>
#include <stdexcept>
#include <string>

namespace learnpath::app {

const char* const kUsage =
"learnpath <document> [--toc FILE] [--config FILE] [--out FILE]\n"
"                     [--strategy keyword|completion] [--top-k N] [--no-cache]\n"
"\n"
"  <document>     plain-text (.txt, .md) or PDF book\n"
"  --toc FILE     table of contents pasted into a text file, used for chapter segmentation\n"
"  --config FILE  settings.json (default: $XDG_CONFIG_HOME/LearnPath/settings.json)\n"
"  --out FILE     where to write the plan JSON (default: plans directory)\n"
"  --strategy S   passage ranking: keyword (fast) or completion (asks the model)\n"
"  --top-k N      passages kept per topic\n"
"  --no-cache     ignore and do not consult the plan cache\n";

std::optional<CliOptions> ParseCli(int argc, char** argv) {
    CliOptions options;
    int i = 1;

    while (i < argc) {
        std::string flag = argv[i++];
        bool missingValue = false;
        auto next = [&](std::string& dst) {
            if (i >= argc) {
                std::cerr << "Missing value after " << flag << "\n";
                missingValue = true;
                return;
            }
            dst = argv[i++];
        };

        if (flag == "-h" || flag == "--help") {
            options.showHelp = true;
            return options;
        } else if (flag == "--toc") {
            next(options.tocPath);
        } else if (flag == "--config") {
            next(options.configPath);
        } else if (flag == "--out") {
            next(options.outPath);
        } else if (flag == "--strategy") {
            next(options.strategy);
            if (!missingValue && options.strategy != "keyword" && options.strategy != "completion") {
                std::cerr << "Unknown strategy: " << options.strategy << "\n";
                return std::nullopt;
            }
        } else if (flag == "--top-k") {
            std::string value;
            next(value);
            if (!missingValue) {
                try {
                    const long long k = std::stoll(value);
                    if (k <= 0) throw std::out_of_range("top-k");
                    options.topK = static_cast<std::size_t>(k);
                } catch (const std::exception&) {
                    std::cerr << "--top-k expects a positive integer, got '" << value << "'\n";
                    return std::nullopt;
                }
            }
        } else if (flag == "--no-cache") {
            options.useCache = false;
        } else if (!flag.empty() && flag[0] == '-') {
            std::cerr << "Unknown flag: " << flag << "\n";
            return std::nullopt;
        } else if (options.documentPath.empty()) {
            options.documentPath = flag;
        } else {
            std::cerr << "Unexpected argument: " << flag << "\n";
            return std::nullopt;
        }

        if (missingValue) {
            return std::nullopt;
        }
    }

    if (options.documentPath.empty()) {
        std::cerr << "Missing <document>\n";
        return std::nullopt;
    }
    return options;
}

} // namespace learnpath::app
