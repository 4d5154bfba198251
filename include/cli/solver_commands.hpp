#ifndef SOLVER_COMMANDS_HPP
#define SOLVER_COMMANDS_HPP

#include "cli/cli_dispatcher.hpp"
#include "io/output.hpp"
#include "io/settings.hpp"

#include <optional>

struct SolverContext {
    std::optional<SolverSettings> settings;

    // Report of the last "solve", written by "export"
    std::optional<json> lastReport;

    int numThreads;
};

bool registerAllCommands(CliDispatcher& dispatcher, SolverContext& context);

#endif // SOLVER_COMMANDS_HPP
