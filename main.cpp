#include <csignal>
#include <iostream>

#include "app/CliOptions.hpp"
#include "app/LearnPathApp.hpp"
#include "application/ParallelExecutor.hpp"

namespace {

learnpath::application::CancellationToken g_cancel;

void HandleInterrupt(int) {
    g_cancel.cancel();
}

} // namespace

int main(int argc, char** argv) {
    auto options = learnpath::app::ParseCli(argc, argv);
    if (!options) {
        std::cerr << learnpath::app::kUsage;
        return learnpath::app::kExitUsage;
    }
    if (options->showHelp) {
        std::cout << learnpath::app::kUsage;
        return learnpath::app::kExitOk;
    }

    std::signal(SIGINT, HandleInterrupt);

    learnpath::app::LearnPathApp app(g_cancel);
    return app.Run(*options);
}
