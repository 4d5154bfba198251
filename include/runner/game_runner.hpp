#ifndef GAME_RUNNER_HPP
#define GAME_RUNNER_HPP

#include "io/output.hpp"
#include "io/settings.hpp"

#include <string>
#include <vector>

struct GameRunResult {
    std::string name;

    // False if the game could not be parsed, validated or solved
    bool isSuccess;

    bool isConverged;

    // Progress and summary lines, printed once the run is finished
    std::string log;

    json report;
};

// Parses, validates and solves one game in the numeric representation chosen by the settings
GameRunResult runGame(const GameEntry& entry, const SolverSettings& settings);

// Solves every game of the settings, in parallel when OpenMP is enabled.
// Results are in the order of the games.
std::vector<GameRunResult> runGames(const SolverSettings& settings, int numThreads);

json buildJSONRunReport(const SolverSettings& settings, const std::vector<GameRunResult>& results);

#endif // GAME_RUNNER_HPP
