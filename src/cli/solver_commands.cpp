#include "cli/solver_commands.hpp"

#include "cli/cli_dispatcher.hpp"
#include "game/game_utils.hpp"
#include "io/output.hpp"
#include "io/settings.hpp"
#include "runner/game_runner.hpp"
#include "util/result.hpp"
#include "util/string_utils.hpp"

#include <cstddef>
#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace {
bool isContextValid(const SolverContext& context) {
    return context.settings.has_value();
}

void printInvalidContextError() {
    std::cerr << "Error: Settings not loaded. Please run \"load <file>\" first.\n";
}

bool handleLoad(SolverContext& context, const std::string& argument) {
    Result<SolverSettings> settingsResult = loadSettingsFromFile(argument);
    if (settingsResult.isError()) {
        std::cerr << "Error: " << settingsResult.getError() << "\n";
        return false;
    }

    context.settings = settingsResult.getValue();
    context.lastReport = std::nullopt;

    const SolverSettings& settings = *context.settings;
    std::cout << "Successfully loaded " << settings.games.size() << " games. Numeric representation: "
        << getNumericKindName(settings.numericKind) << ", epsilon: " << settings.epsilon
        << ", maximum iterations: " << settings.maxIterations << "\n";
    return true;
}

bool handleSetEpsilon(SolverContext& context, const std::string& argument) {
    if (!isContextValid(context)) {
        printInvalidContextError();
        return false;
    }

    if (std::optional<std::string> error = getEpsilonError(argument)) {
        std::cerr << "Error: " << *error << "\n";
        return false;
    }

    context.settings->epsilon = argument;
    std::cout << "Successfully set epsilon to " << argument << ".\n";
    return true;
}

bool handleSetIterations(SolverContext& context, const std::string& argument) {
    if (!isContextValid(context)) {
        printInvalidContextError();
        return false;
    }

    std::optional<std::uint64_t> maxIterationsOption = parseUnsigned(argument);
    if (!maxIterationsOption || *maxIterationsOption == 0) {
        std::cerr << "Error: Maximum iterations must be a positive integer.\n";
        return false;
    }

    context.settings->maxIterations = static_cast<std::size_t>(*maxIterationsOption);
    std::cout << "Successfully set maximum iterations to " << *maxIterationsOption << ".\n";
    return true;
}

bool handleSetNumeric(SolverContext& context, const std::string& argument) {
    if (!isContextValid(context)) {
        printInvalidContextError();
        return false;
    }

    Result<NumericKind> numericKindResult = getNumericKindFromName(argument);
    if (numericKindResult.isError()) {
        std::cerr << "Error: " << numericKindResult.getError() << "\n";
        return false;
    }

    context.settings->numericKind = numericKindResult.getValue();
    std::cout << "Successfully set numeric representation to " << getNumericKindName(context.settings->numericKind) << ".\n";
    return true;
}

bool handleSetSeed(SolverContext& context, const std::string& argument) {
    if (!isContextValid(context)) {
        printInvalidContextError();
        return false;
    }

    std::optional<std::uint64_t> seedOption = parseUnsigned(argument);
    if (!seedOption) {
        std::cerr << "Error: Seed must be a non-negative integer.\n";
        return false;
    }

    context.settings->seed = *seedOption;
    std::cout << "Successfully set seed to " << *seedOption << ".\n";
    return true;
}

bool handleSetNumThreads(SolverContext& context, const std::string& argument) {
    #ifdef _OPENMP
    std::optional<int> numThreadsOption = parseInt(argument);
    if (!numThreadsOption) {
        std::cerr << "Error: Thread count must be an integer.\n";
        return false;
    }

    int numThreads = *numThreadsOption;
    if (numThreads < 1 || numThreads > omp_get_num_procs()) {
        std::cerr << "Error: Thread count must be between 1 and " << omp_get_num_procs() << ".\n";
        return false;
    }

    context.numThreads = numThreads;
    std::cout << "Successfully set number of threads to " << numThreads << ".\n";
    return true;
    #else
    context.numThreads = 1;
    std::cerr << "Error: OpenMP is not enabled, ignoring " << argument << ". Only single-threaded mode is supported.\n";
    return false;
    #endif
}

bool handleSolve(SolverContext& context) {
    if (!isContextValid(context)) {
        printInvalidContextError();
        return false;
    }

    const SolverSettings& settings = *context.settings;

    #ifdef _OPENMP
    std::cout << "Solving " << settings.games.size() << " games in parallel with " << context.numThreads << " threads.\n\n" << std::flush;
    #else
    std::cout << "Solving " << settings.games.size() << " games in single-threaded mode.\n\n" << std::flush;
    #endif

    std::vector<GameRunResult> results = runGames(settings, context.numThreads);

    int numSolved = 0;
    int numConverged = 0;
    for (const GameRunResult& result : results) {
        std::cout << result.log << "\n";
        if (result.isSuccess) {
            ++numSolved;
        }
        if (result.isConverged) {
            ++numConverged;
        }
    }

    std::cout << "Finished solving. " << numSolved << " of " << results.size() << " games solved, "
        << numConverged << " converged.\n";

    context.lastReport = buildJSONRunReport(settings, results);
    return numSolved == static_cast<int>(results.size());
}

bool handleExport(SolverContext& context, const std::string& argument) {
    if (!context.lastReport) {
        std::cerr << "Error: Nothing to export. Please run \"solve\" first.\n";
        return false;
    }

    if (!outputJSONToFile(*context.lastReport, argument)) {
        std::cerr << "Error: Could not write results to " << argument << ".\n";
        return false;
    }

    std::cout << "Results saved to " << argument << ".\n";
    return true;
}
} // namespace

bool registerAllCommands(CliDispatcher& dispatcher, SolverContext& context) {
    bool allSuccess = true;

    allSuccess &= dispatcher.registerCommand(
        "load",
        "file",
        "Loads games and solver settings from a given .yml configuration file.",
        [&context](const std::string& argument) { return handleLoad(context, argument); }
    );

    allSuccess &= dispatcher.registerCommand(
        "epsilon",
        "value",
        "Sets the accepted gap between the upper and lower value estimates. Settings must be loaded first.",
        [&context](const std::string& argument) { return handleSetEpsilon(context, argument); }
    );

    allSuccess &= dispatcher.registerCommand(
        "iterations",
        "count",
        "Sets the maximum number of iterations per game. Settings must be loaded first.",
        [&context](const std::string& argument) { return handleSetIterations(context, argument); }
    );

    allSuccess &= dispatcher.registerCommand(
        "numeric",
        "rational|float",
        "Sets the numeric representation: exact rational or floating point arithmetic. Settings must be loaded first.",
        [&context](const std::string& argument) { return handleSetNumeric(context, argument); }
    );

    allSuccess &= dispatcher.registerCommand(
        "seed",
        "value",
        "Sets the seed for random tie-breaking and random starting points. Settings must be loaded first.",
        [&context](const std::string& argument) { return handleSetSeed(context, argument); }
    );

    allSuccess &= dispatcher.registerCommand(
        "threads",
        "count",
        "Sets the number of games solved in parallel. One thread is used by default. Calls to this command will be ignored if OpenMP is not enabled.",
        [&context](const std::string& argument) { return handleSetNumThreads(context, argument); }
    );

    allSuccess &= dispatcher.registerCommand(
        "solve",
        "Solves every loaded game: matrix games with the Brown-Robinson method, continuous games by saddle-point iteration.",
        [&context]() { return handleSolve(context); }
    );

    allSuccess &= dispatcher.registerCommand(
        "export",
        "file",
        "Writes the results of the last solve to a JSON file.",
        [&context](const std::string& argument) { return handleExport(context, argument); }
    );

    return allSuccess;
}
