#include "io/settings.hpp"

#include "game/game_utils.hpp"
#include "numeric/field.hpp"
#include "solver/brown_robinson.hpp"
#include "solver/saddle_point.hpp"
#include "util/result.hpp"
#include "util/string_utils.hpp"

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include <yaml-cpp/yaml.h>

namespace {
// Numeric indices select entries of YAML sequences, e.g. { "games", "0", "spec" }
template <typename T>
bool loadField(T& field, const YAML::Node& node, const std::vector<std::string>& indices, std::size_t depth) {
    if (!node.IsDefined() || node.IsNull()) {
        return false;
    }

    if (depth == indices.size()) {
        try {
            field = node.as<T>();
            std::cout << "Successfully loaded field " << join(indices, "::") << ".\n";
            return true;
        }
        catch (const YAML::Exception& e) {
            return false;
        }
    }

    if (node.IsSequence()) {
        std::optional<std::uint64_t> index = parseUnsigned(indices[depth]);
        if (!index || *index >= node.size()) {
            return false;
        }
        return loadField(field, node[static_cast<std::size_t>(*index)], indices, depth + 1);
    }

    if (!node.IsMap()) {
        return false;
    }
    return loadField(field, node[indices[depth]], indices, depth + 1);
}

std::string getFieldError(const std::vector<std::string>& indices) {
    return "Could not load field " + join(indices, "::") + ".";
}

template <typename T>
bool loadFieldRequired(T& field, const YAML::Node& root, const std::vector<std::string>& indices) {
    return loadField(field, root, indices, 0);
}

template <typename T>
void loadFieldOptional(T& field, const YAML::Node& root, const std::vector<std::string>& indices, const T& defaultValue) {
    bool success = loadField(field, root, indices, 0);
    if (!success) {
        std::cout << "Could not load field " << join(indices, "::") << ", using default.\n";
        field = defaultValue;
    }
}

Result<std::size_t> loadCount(const YAML::Node& root, const std::string& name, std::size_t defaultValue, bool allowZero) {
    long long value;
    loadFieldOptional(value, root, { name }, static_cast<long long>(defaultValue));
    if (value < 0 || (value == 0 && !allowZero)) {
        return "Field " + name + " must be " + (allowZero ? "non-negative" : "positive") + ", got " + std::to_string(value) + ".";
    }
    return static_cast<std::size_t>(value);
}
} // namespace

SolverSettings getDefaultSettings() {
    return SolverSettings{
        .games = {},
        .numericKind = NumericKind::Float,
        .epsilon = "0.01",
        .maxIterations = 100000,
        .seed = std::nullopt,
        .tieBreak = TieBreak::SmallestIndex,
        .startPolicy = StartPolicy::Midpoint,
        .stepScale = 0.5,
        .gapCheckFrequency = 1,
        .gridWindowSize = 5,
        .gridMaxSize = 30,
        .logFrequency = 0
    };
}

std::optional<std::string> getEpsilonError(const std::string& epsilon) {
    std::optional<double> value = FieldTraits<double>::fromLiteral(epsilon);
    if (!value) {
        return "Epsilon must be a number, got \"" + epsilon + "\".";
    }
    if (*value <= 0.0) {
        return "Epsilon must be positive, got " + epsilon + ".";
    }
    return std::nullopt;
}

Result<SolverSettings> loadSettings(const YAML::Node& root) {
    if (!root.IsMap()) {
        return "Settings must be a YAML map.";
    }

    SolverSettings settings = getDefaultSettings();

    // Load games
    const YAML::Node gamesNode = root["games"];
    if (!gamesNode.IsDefined() || !gamesNode.IsSequence() || gamesNode.size() == 0) {
        return getFieldError({ "games" }) + " Expected a non-empty list of games.";
    }

    for (std::size_t i = 0; i < gamesNode.size(); ++i) {
        std::string index = std::to_string(i);
        GameEntry entry;

        if (!loadFieldRequired(entry.specification, root, { "games", index, "spec" })) {
            return getFieldError({ "games", index, "spec" });
        }
        loadFieldOptional(entry.name, root, { "games", index, "name" }, "game-" + std::to_string(i + 1));

        settings.games.push_back(entry);
    }

    // Load numeric representation
    std::string numericName;
    loadFieldOptional(numericName, root, { "numeric" }, getNumericKindName(settings.numericKind));
    Result<NumericKind> numericKindResult = getNumericKindFromName(numericName);
    if (numericKindResult.isError()) {
        return numericKindResult.getError();
    }
    settings.numericKind = numericKindResult.getValue();

    // Load convergence criterion
    std::string epsilon;
    loadFieldOptional(epsilon, root, { "epsilon" }, settings.epsilon);
    epsilon = trim(epsilon);
    if (std::optional<std::string> error = getEpsilonError(epsilon)) {
        return *error;
    }
    settings.epsilon = epsilon;

    Result<std::size_t> maxIterationsResult = loadCount(root, "max-iterations", settings.maxIterations, false);
    if (maxIterationsResult.isError()) {
        return maxIterationsResult.getError();
    }
    settings.maxIterations = maxIterationsResult.getValue();

    // Load seed
    std::string seedString;
    loadFieldOptional(seedString, root, { "seed" }, std::string{});
    if (!seedString.empty()) {
        std::optional<std::uint64_t> seed = parseUnsigned(trim(seedString));
        if (!seed) {
            return "Seed must be a non-negative integer, got \"" + seedString + "\".";
        }
        settings.seed = *seed;
    }

    // Load tie-break and start policies
    std::string tieBreakName;
    loadFieldOptional(tieBreakName, root, { "tie-break" }, getTieBreakName(settings.tieBreak));
    Result<TieBreak> tieBreakResult = getTieBreakFromName(tieBreakName);
    if (tieBreakResult.isError()) {
        return tieBreakResult.getError();
    }
    settings.tieBreak = tieBreakResult.getValue();

    std::string startName;
    loadFieldOptional(startName, root, { "start" }, getStartPolicyName(settings.startPolicy));
    Result<StartPolicy> startResult = getStartPolicyFromName(startName);
    if (startResult.isError()) {
        return startResult.getError();
    }
    if (startResult.getValue() == StartPolicy::Explicit) {
        return "Field start must be \"midpoint\" or \"random\".";
    }
    settings.startPolicy = startResult.getValue();

    // Load continuous solver parameters
    loadFieldOptional(settings.stepScale, root, { "step-scale" }, settings.stepScale);
    if (!std::isfinite(settings.stepScale) || settings.stepScale <= 0.0) {
        return "Field step-scale must be positive.";
    }

    Result<std::size_t> gapCheckFrequencyResult = loadCount(root, "gap-check-frequency", settings.gapCheckFrequency, false);
    if (gapCheckFrequencyResult.isError()) {
        return gapCheckFrequencyResult.getError();
    }
    settings.gapCheckFrequency = gapCheckFrequencyResult.getValue();

    Result<std::size_t> gridWindowSizeResult = loadCount(root, "grid-window-size", settings.gridWindowSize, false);
    if (gridWindowSizeResult.isError()) {
        return gridWindowSizeResult.getError();
    }
    settings.gridWindowSize = gridWindowSizeResult.getValue();

    Result<std::size_t> gridMaxSizeResult = loadCount(root, "grid-max-size", settings.gridMaxSize, false);
    if (gridMaxSizeResult.isError()) {
        return gridMaxSizeResult.getError();
    }
    if (gridMaxSizeResult.getValue() < 2) {
        return "Field grid-max-size must be at least 2, got " + std::to_string(gridMaxSizeResult.getValue()) + ".";
    }
    settings.gridMaxSize = gridMaxSizeResult.getValue();

    Result<std::size_t> logFrequencyResult = loadCount(root, "log-frequency", settings.logFrequency, true);
    if (logFrequencyResult.isError()) {
        return logFrequencyResult.getError();
    }
    settings.logFrequency = logFrequencyResult.getValue();

    return settings;
}

Result<SolverSettings> loadSettingsFromString(const std::string& input) {
    YAML::Node root;

    try {
        root = YAML::Load(input);
    }
    catch (const YAML::Exception& e) {
        return std::string{ "Could not parse settings. " } + e.what();
    }

    return loadSettings(root);
}

Result<SolverSettings> loadSettingsFromFile(const std::string& filePath) {
    YAML::Node root;

    try {
        root = YAML::LoadFile(filePath);
    }
    catch (const YAML::Exception& e) {
        return std::string{ "Could not load settings file. " } + e.what();
    }

    std::cout << "Loading settings from " << filePath << ":\n";
    return loadSettings(root);
}
