#include "cli/cli_dispatcher.hpp"
#include "cli/solver_commands.hpp"

#include <fstream>
#include <iostream>
#include <optional>

int main(int argc, char* argv[]) {
    CliDispatcher dispatcher("ZeroSumSolver", Version{ .major = 1, .minor = 0, .patch = 0 });
    SolverContext context{ .settings = std::nullopt, .lastReport = std::nullopt, .numThreads = 1 };
    registerAllCommands(dispatcher, context);

    if (argc > 2) {
        std::cerr << "Usage: " << argv[0] << " [command file]\n";
        return 1;
    }

    // With a command file, run it as a script and report failures through the exit status
    if (argc == 2) {
        std::ifstream script(argv[1]);
        if (!script.is_open()) {
            std::cerr << "Error: Could not open command file " << argv[1] << ".\n";
            return 1;
        }
        return (dispatcher.run(script, false) == 0) ? 0 : 1;
    }

    dispatcher.run();

    return 0;
}
