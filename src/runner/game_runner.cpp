#include "runner/game_runner.hpp"

#include "game/continuous_game.hpp"
#include "game/game_types.hpp"
#include "game/game_utils.hpp"
#include "game/matrix_game.hpp"
#include "io/output.hpp"
#include "io/settings.hpp"
#include "numeric/field.hpp"
#include "numeric/rational.hpp"
#include "parser/game_parser.hpp"
#include "parser/game_writer.hpp"
#include "solver/brown_robinson.hpp"
#include "solver/grid_approximation.hpp"
#include "solver/saddle_point.hpp"
#include "solver/solve_result.hpp"
#include "util/errors.hpp"
#include "util/result.hpp"

#include <cassert>
#include <cstddef>
#include <optional>
#include <sstream>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace {
constexpr int DisplayPrecision = 5;

GameRunResult buildFailure(const std::string& name, const std::string& message, std::ostringstream& log) {
    log << "Error: " << message << "\n";
    return GameRunResult{
        .name = name,
        .isSuccess = false,
        .isConverged = false,
        .log = log.str(),
        .report = buildJSONGameError(name, message)
    };
}

template <NumericField T>
std::string formatStrategy(const MixedStrategy<T>& strategy) {
    std::string output = "[";
    for (std::size_t i = 0; i < strategy.size(); ++i) {
        if (i > 0) {
            output += ", ";
        }
        output += formatFixed(strategy[i], DisplayPrecision);
    }
    output += "]";
    return output;
}

template <NumericField T>
std::string formatBounds(const ValueBounds<T>& bounds) {
    return "[" + formatFixed(bounds.lower, DisplayPrecision) + ", " + formatFixed(bounds.upper, DisplayPrecision) + "]";
}

template <NumericField T>
std::string formatPoint(const Point<T>& point) {
    return "(" + formatFixed(point.x, DisplayPrecision) + ", " + formatFixed(point.y, DisplayPrecision) + ")";
}

void printTermination(std::ostringstream& log, const std::string& solverName, TerminationReason reason, std::size_t iterations, const std::string& errorMessage) {
    switch (reason) {
        case TerminationReason::Converged:
            log << solverName << " converged after " << iterations << " iterations.\n";
            break;
        case TerminationReason::MaxIterationsExceeded:
            log << solverName << " did not converge within " << iterations << " iterations.\n";
            break;
        case TerminationReason::NumericFailure:
            log << solverName << " stopped after " << iterations << " iterations: " << errorMessage << "\n";
            break;
        default:
            assert(false);
            break;
    }
}

template <NumericField T>
GameRunResult runMatrixGame(const std::string& name, PayoffMatrix<T> payoffs, const T& epsilon, const SolverSettings& settings, std::ostringstream& log) {
    Result<MatrixGame<T>, ValidationError> gameResult = MatrixGame<T>::create(std::move(payoffs));
    if (gameResult.isError()) {
        return buildFailure(name, "Invalid game " + name + ": " + gameResult.getError().message, log);
    }
    const MatrixGame<T>& game = gameResult.getValue();

    log << "Matrix game with " << game.getNumStrategies(Player::Row) << " row and "
        << game.getNumStrategies(Player::Column) << " column strategies.\n";

    PurePrice<T> lowerPrice = game.getLowerPrice();
    PurePrice<T> upperPrice = game.getUpperPrice();
    log << "Lower price (maximin): " << formatFixed(lowerPrice.value, DisplayPrecision) << " at row " << lowerPrice.index << ".\n";
    log << "Upper price (minimax): " << formatFixed(upperPrice.value, DisplayPrecision) << " at column " << upperPrice.index << ".\n";

    std::optional<PureSaddlePoint<T>> saddlePoint = game.findPureSaddlePoint();
    if (saddlePoint) {
        log << "Pure saddle point at row " << saddlePoint->row << ", column " << saddlePoint->column << ".\n";
    }

    BrownRobinsonOptions<T> options{
        .criterion = ConvergenceCriterion<T>{ epsilon, settings.maxIterations },
        .initialStrategies = std::nullopt,
        .tieBreak = settings.tieBreak,
        .seed = settings.seed.value_or(0),
        .observer = {}
    };

    if (settings.logFrequency > 0) {
        std::size_t logFrequency = settings.logFrequency;
        options.observer = [&log, logFrequency](const BrownRobinsonIteration<T>& iteration) {
            if (iteration.iteration % logFrequency == 0) {
                log << "Finished iteration " << iteration.iteration << ". Bounds: " << formatBounds(iteration.bounds)
                    << " Best bounds: " << formatBounds(iteration.bestBounds) << "\n";
            }
        };
    }

    Result<MatrixSolveResult<T>, ValidationError> solveResult = solveBrownRobinson(game, options);
    if (solveResult.isError()) {
        return buildFailure(name, "Could not solve game " + name + ": " + solveResult.getError().message, log);
    }
    const MatrixSolveResult<T>& result = solveResult.getValue();

    printTermination(log, "Brown-Robinson", result.reason, result.iterations, result.errorMessage);
    log << "Value: " << formatFixed(result.value, DisplayPrecision) << "\n";
    log << "Bounds: " << formatBounds(result.bounds) << " Best bounds: " << formatBounds(result.bestBounds) << "\n";
    log << "Row strategy: " << formatStrategy(result.rowStrategy) << "\n";
    log << "Column strategy: " << formatStrategy(result.columnStrategy) << "\n";

    std::optional<MatrixSolution<T>> fullyMixedSolution;
    if (!saddlePoint) {
        try {
            fullyMixedSolution = game.solveFullyMixed();
        }
        catch (const NumericError& e) {
            log << "Could not solve the indifference equations: " << e.what() << "\n";
        }
    }

    if (fullyMixedSolution) {
        log << "Fully mixed solution: value " << formatFixed(fullyMixedSolution->value, DisplayPrecision)
            << ", row strategy " << formatStrategy(fullyMixedSolution->rowStrategy)
            << ", column strategy " << formatStrategy(fullyMixedSolution->columnStrategy) << "\n";
    }

    return GameRunResult{
        .name = name,
        .isSuccess = (result.reason != TerminationReason::NumericFailure),
        .isConverged = result.isConverged(),
        .log = log.str(),
        .report = buildJSONMatrixGame(name, game, result, fullyMixedSolution)
    };
}

// Cross-check of the subgradient solution on successively finer grids
template <NumericField T>
std::optional<GridSolveResult<T>> runGridApproximation(const ConvexConcaveGame<T>& game, const T& epsilon, const SolverSettings& settings, std::ostringstream& log) {
    GridApproximationOptions<T> options{
        .accuracy = epsilon,
        .windowSize = settings.gridWindowSize,
        .maxGridSize = settings.gridMaxSize,
        .brownRobinsonMaxIterations = settings.maxIterations,
        .tieBreak = settings.tieBreak,
        .seed = settings.seed.value_or(0),
        .observer = {}
    };

    if (settings.logFrequency > 0) {
        std::size_t logFrequency = settings.logFrequency;
        options.observer = [&log, logFrequency](const GridIteration<T>& iteration) {
            if (iteration.step % logFrequency == 0) {
                log << "Solved grid of size " << iteration.gridSize << (iteration.isPureSaddlePoint ? " at a pure saddle point" : " with Brown-Robinson")
                    << ". Point: " << formatPoint(iteration.point) << " Value: " << formatFixed(iteration.value, DisplayPrecision)
                    << " Window change: " << formatFixed(iteration.windowChange, DisplayPrecision) << "\n";
            }
        };
    }

    Result<GridSolveResult<T>, ValidationError> gridResult = solveByGridApproximation(game, options);
    if (gridResult.isError()) {
        log << "Could not run the grid approximation: " << gridResult.getError().message << "\n";
        return std::nullopt;
    }
    const GridSolveResult<T>& result = gridResult.getValue();

    printTermination(log, "Grid approximation", result.reason, result.steps, result.errorMessage);
    if (result.steps > 0) {
        log << "Grid point: " << formatPoint(result.point) << " on a grid of size " << result.gridSize
            << " with value " << formatFixed(result.value, DisplayPrecision) << "\n";
    }
    return result;
}

template <NumericField T>
GameRunResult runContinuousGame(
    const std::string& name,
    ContinuousGameSpecification<T> specification,
    const T& epsilon,
    const SolverSettings& settings,
    std::ostringstream& log
) {
    Result<ConvexConcaveGame<T>, ValidationError> gameResult = ConvexConcaveGame<T>::create(std::move(specification));
    if (gameResult.isError()) {
        return buildFailure(name, "Invalid game " + name + ": " + gameResult.getError().message, log);
    }
    const ConvexConcaveGame<T>& game = gameResult.getValue();

    log << "Continuous game " << formatContinuousGame(game.getSpecification()) << "\n";

    SaddlePointOptions<T> options{
        .criterion = ConvergenceCriterion<T>{ epsilon, settings.maxIterations },
        .start = settings.startPolicy,
        .startPoint = std::nullopt,
        .seed = settings.seed.value_or(0),
        .stepScale = settings.stepScale,
        .gapCheckFrequency = settings.gapCheckFrequency,
        .observer = {}
    };

    if (settings.logFrequency > 0) {
        std::size_t logFrequency = settings.logFrequency;
        options.observer = [&log, logFrequency](const SaddlePointIteration<T>& iteration) {
            if (iteration.iteration % logFrequency == 0) {
                log << "Finished iteration " << iteration.iteration << ". Average point: " << formatPoint(iteration.average);
                if (iteration.bestGap) {
                    log << " Best gap: " << formatFixed(*iteration.bestGap, DisplayPrecision);
                }
                log << "\n";
            }
        };
    }

    Result<ContinuousSolveResult<T>, ValidationError> solveResult = solveSaddlePoint(game, options);
    if (solveResult.isError()) {
        return buildFailure(name, "Could not solve game " + name + ": " + solveResult.getError().message, log);
    }
    const ContinuousSolveResult<T>& result = solveResult.getValue();

    printTermination(log, "Saddle-point iteration", result.reason, result.iterations, result.errorMessage);
    log << "Point: " << formatPoint(result.point) << "\n";
    log << "Value: " << formatFixed(result.value, DisplayPrecision) << "\n";
    log << "Duality gap: " << formatFixed(result.gap, DisplayPrecision) << " Bounds: " << formatBounds(result.bounds) << "\n";

    std::optional<GridSolveResult<T>> gridSolution = runGridApproximation(game, epsilon, settings, log);

    std::optional<ContinuousSolution<T>> analyticSolution;
    try {
        analyticSolution = solveQuadraticAnalytically(game);
    }
    catch (const NumericError& e) {
        log << "Could not solve the payoff analytically: " << e.what() << "\n";
    }

    if (analyticSolution) {
        log << "Analytic saddle point: " << formatPoint(analyticSolution->point)
            << " with value " << formatFixed(analyticSolution->value, DisplayPrecision) << "\n";
    }

    return GameRunResult{
        .name = name,
        .isSuccess = (result.reason != TerminationReason::NumericFailure),
        .isConverged = result.isConverged(),
        .log = log.str(),
        .report = buildJSONContinuousGame(name, game, result, gridSolution, analyticSolution)
    };
}

template <NumericField T>
GameRunResult runGameInField(const GameEntry& entry, const SolverSettings& settings) {
    std::ostringstream log;
    log << "Solving game " << entry.name << " with " << getNumericKindName(FieldTraits<T>::Kind) << " arithmetic.\n";

    std::optional<T> epsilon = FieldTraits<T>::fromLiteral(settings.epsilon);
    if (!epsilon) {
        return buildFailure(entry.name, "Invalid epsilon \"" + settings.epsilon + "\".", log);
    }

    Result<GameSpecification<T>, ParseError> specificationResult = parseGameSpecification<T>(entry.specification);
    if (specificationResult.isError()) {
        return buildFailure(entry.name, "Could not parse game " + entry.name + " at " + specificationResult.getError().toString(), log);
    }

    GameSpecification<T>& specification = specificationResult.getValue();
    if (PayoffMatrix<T>* payoffs = std::get_if<PayoffMatrix<T>>(&specification)) {
        return runMatrixGame(entry.name, std::move(*payoffs), *epsilon, settings, log);
    }
    return runContinuousGame(entry.name, std::move(std::get<ContinuousGameSpecification<T>>(specification)), *epsilon, settings, log);
}
} // namespace

GameRunResult runGame(const GameEntry& entry, const SolverSettings& settings) {
    switch (settings.numericKind) {
        case NumericKind::Rational:
            return runGameInField<Rational>(entry, settings);
        case NumericKind::Float:
            return runGameInField<double>(entry, settings);
        default:
            assert(false);
            return runGameInField<double>(entry, settings);
    }
}

std::vector<GameRunResult> runGames(const SolverSettings& settings, int numThreads) {
    std::vector<GameRunResult> results(settings.games.size());
    int numGames = static_cast<int>(settings.games.size());

    #ifdef _OPENMP
    #pragma omp parallel for schedule(dynamic) num_threads(numThreads)
    #else
    static_cast<void>(numThreads);
    #endif
    for (int i = 0; i < numGames; ++i) {
        results[i] = runGame(settings.games[i], settings);
    }

    return results;
}

json buildJSONRunReport(const SolverSettings& settings, const std::vector<GameRunResult>& results) {
    json j;
    j["Numeric"] = getNumericKindName(settings.numericKind);
    j["Epsilon"] = settings.epsilon;
    j["MaxIterations"] = settings.maxIterations;
    if (settings.seed) {
        j["Seed"] = *settings.seed;
    }
    else {
        j["Seed"] = nullptr;
    }
    j["TieBreak"] = getTieBreakName(settings.tieBreak);

    json& games = j["Games"];
    games = json::array();
    for (const GameRunResult& result : results) {
        games.push_back(result.report);
    }
    return j;
}
