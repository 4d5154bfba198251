#ifndef SETTINGS_HPP
#define SETTINGS_HPP

#include "numeric/field.hpp"
#include "solver/brown_robinson.hpp"
#include "solver/saddle_point.hpp"
#include "util/result.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <yaml-cpp/yaml.h>

struct GameEntry {
    std::string name;

    // Matrix or continuous game literal
    std::string specification;
};

struct SolverSettings {
    std::vector<GameEntry> games;
    NumericKind numericKind;

    // Kept as text so rational solves read it exactly
    std::string epsilon;

    std::size_t maxIterations;
    std::optional<std::uint64_t> seed;
    TieBreak tieBreak;
    StartPolicy startPolicy;
    double stepScale;
    std::size_t gapCheckFrequency;

    // Grid approximation of continuous games
    std::size_t gridWindowSize;
    std::size_t gridMaxSize;

    // Print a progress line every logFrequency iterations, 0 for none
    std::size_t logFrequency;
};

SolverSettings getDefaultSettings();

// Error message if the epsilon literal is not a positive number
std::optional<std::string> getEpsilonError(const std::string& epsilon);

Result<SolverSettings> loadSettings(const YAML::Node& root);
Result<SolverSettings> loadSettingsFromString(const std::string& input);
Result<SolverSettings> loadSettingsFromFile(const std::string& filePath);

#endif // SETTINGS_HPP
