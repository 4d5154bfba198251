#ifndef GRID_APPROXIMATION_HPP
#define GRID_APPROXIMATION_HPP

#include "game/continuous_game.hpp"
#include "game/game_types.hpp"
#include "game/matrix_game.hpp"
#include "numeric/field.hpp"
#include "solver/brown_robinson.hpp"
#include "solver/solve_result.hpp"
#include "util/errors.hpp"
#include "util/result.hpp"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

template <typename T>
struct GridIteration {
    std::size_t step;
    std::size_t gridSize;
    Point<T> point;
    T value;

    // False if Brown-Robinson was needed for this grid
    bool isPureSaddlePoint;
    std::size_t brownRobinsonIterations;

    // Sum of the value changes in the current window
    T windowChange;
};

template <typename T>
struct GridApproximationOptions {
    // Used both for the window of value changes and for Brown-Robinson on each grid
    T accuracy;

    // Number of consecutive value changes that must sum to at most accuracy
    std::size_t windowSize = 5;

    // Grids go from 2 up to maxGridSize intervals per axis
    std::size_t maxGridSize = 30;

    std::size_t brownRobinsonMaxIterations = 100000;
    TieBreak tieBreak = TieBreak::SmallestIndex;
    std::uint64_t seed = 0;

    std::function<void(const GridIteration<T>&)> observer;
};

namespace grid_approximation_detail {
template <NumericField T>
std::vector<T> getGridCoordinates(const Interval<T>& interval, std::size_t gridSize) {
    T width = interval.upper - interval.lower;
    T divisor = FieldTraits<T>::fromInteger(static_cast<std::int64_t>(gridSize));

    std::vector<T> coordinates;
    coordinates.reserve(gridSize + 1);
    for (std::size_t i = 0; i <= gridSize; ++i) {
        T offset = divide(T(width * FieldTraits<T>::fromInteger(static_cast<std::int64_t>(i))), divisor);
        coordinates.push_back(T(interval.lower + offset));
    }
    return coordinates;
}

template <typename T>
struct GridEstimate {
    Point<T> point;
    T value;
    bool isPureSaddlePoint;
    std::size_t brownRobinsonIterations;
};
} // namespace grid_approximation_detail

// Approximates a continuous game by a sequence of finer and finer matrix games on a uniform grid.
// Rows of each grid game are the y choices of the maximizing player, columns the x choices of the
// minimizing player. A grid with a pure saddle point is solved exactly, any other grid with
// Brown-Robinson. The run converges once windowSize consecutive changes of the value sum to at
// most accuracy.
template <NumericField T>
Result<GridSolveResult<T>, ValidationError> solveByGridApproximation(const ConvexConcaveGame<T>& game, const GridApproximationOptions<T>& options) {
    Result<ConvergenceCriterion<T>, ValidationError> criterionResult =
        makeConvergenceCriterion(options.accuracy, options.brownRobinsonMaxIterations);
    if (criterionResult.isError()) {
        return criterionResult.getError();
    }
    if (options.windowSize == 0) {
        return ValidationError{ "Window size must be positive." };
    }
    if (options.maxGridSize < 2) {
        return ValidationError{ "Maximum grid size must be at least 2, got " + std::to_string(options.maxGridSize) + "." };
    }

    const T zero = FieldTraits<T>::zero();

    GridSolveResult<T> result{
        .point = Point<T>{ zero, zero },
        .value = zero,
        .gridSize = 0,
        .steps = 0,
        .reason = TerminationReason::MaxIterationsExceeded,
        .errorMessage = ""
    };

    BrownRobinsonOptions<T> brownRobinsonOptions{
        .criterion = criterionResult.getValue(),
        .initialStrategies = std::nullopt,
        .tieBreak = options.tieBreak,
        .seed = options.seed,
        .observer = {}
    };

    std::deque<T> changes;
    std::optional<T> previousValue;

    try {
        for (std::size_t gridSize = 2; gridSize <= options.maxGridSize; ++gridSize) {
            std::vector<T> xs = grid_approximation_detail::getGridCoordinates(game.getInterval(Player::Row), gridSize);
            std::vector<T> ys = grid_approximation_detail::getGridCoordinates(game.getInterval(Player::Column), gridSize);

            PayoffMatrix<T> payoffs(ys.size(), std::vector<T>(xs.size(), zero));
            for (std::size_t row = 0; row < ys.size(); ++row) {
                for (std::size_t column = 0; column < xs.size(); ++column) {
                    payoffs[row][column] = game.getPayoff(xs[column], ys[row]);
                }
            }

            Result<MatrixGame<T>, ValidationError> gridGameResult = MatrixGame<T>::create(std::move(payoffs));
            if (gridGameResult.isError()) {
                throw NumericError{ gridGameResult.getError().message };
            }
            const MatrixGame<T>& gridGame = gridGameResult.getValue();

            grid_approximation_detail::GridEstimate<T> estimate;
            if (std::optional<PureSaddlePoint<T>> saddlePoint = gridGame.findPureSaddlePoint()) {
                estimate = grid_approximation_detail::GridEstimate<T>{
                    .point = Point<T>{ xs[saddlePoint->column], ys[saddlePoint->row] },
                    .value = saddlePoint->value,
                    .isPureSaddlePoint = true,
                    .brownRobinsonIterations = 0
                };
            }
            else {
                Result<MatrixSolveResult<T>, ValidationError> solveResult = solveBrownRobinson(gridGame, brownRobinsonOptions);
                if (solveResult.isError()) {
                    return solveResult.getError();
                }

                const MatrixSolveResult<T>& solution = solveResult.getValue();
                if (solution.reason == TerminationReason::NumericFailure) {
                    throw NumericError{ solution.errorMessage };
                }

                // The most frequently played grid points
                estimate = grid_approximation_detail::GridEstimate<T>{
                    .point = Point<T>{ xs[getIndexOfMaximum(solution.columnStrategy)], ys[getIndexOfMaximum(solution.rowStrategy)] },
                    .value = solution.value,
                    .isPureSaddlePoint = false,
                    .brownRobinsonIterations = solution.iterations
                };
            }

            if (previousValue) {
                T change = absoluteValue(T(estimate.value - *previousValue));
                checkFinite(change, "value change");
                changes.push_back(change);
                if (changes.size() > options.windowSize) {
                    changes.pop_front();
                }
            }
            previousValue = estimate.value;

            T windowChange = zero;
            for (const T& change : changes) {
                windowChange = windowChange + change;
            }

            result.point = estimate.point;
            result.value = estimate.value;
            result.gridSize = gridSize;
            ++result.steps;

            if (options.observer) {
                options.observer(GridIteration<T>{
                    .step = result.steps,
                    .gridSize = gridSize,
                    .point = estimate.point,
                    .value = estimate.value,
                    .isPureSaddlePoint = estimate.isPureSaddlePoint,
                    .brownRobinsonIterations = estimate.brownRobinsonIterations,
                    .windowChange = windowChange
                });
            }

            if (changes.size() == options.windowSize && !(options.accuracy < windowChange)) {
                result.reason = TerminationReason::Converged;
                return result;
            }
        }
    }
    catch (const NumericError& error) {
        result.reason = TerminationReason::NumericFailure;
        result.errorMessage = error.what();
        return result;
    }

    return result;
}

#endif // GRID_APPROXIMATION_HPP
