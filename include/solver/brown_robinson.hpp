#ifndef BROWN_ROBINSON_HPP
#define BROWN_ROBINSON_HPP

#include "game/game_types.hpp"
#include "game/game_utils.hpp"
#include "game/matrix_game.hpp"
#include "numeric/field.hpp"
#include "solver/solve_result.hpp"
#include "util/errors.hpp"
#include "util/result.hpp"

#include <cassert>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <random>
#include <string>
#include <utility>
#include <vector>

enum class TieBreak : std::uint8_t {
    SmallestIndex,
    Random
};

std::string getTieBreakName(TieBreak tieBreak);
Result<TieBreak> getTieBreakFromName(const std::string& name);

template <typename T>
struct BrownRobinsonIteration {
    std::size_t iteration;
    PlayerArray<std::size_t> choices;
    ValueBounds<T> bounds;
    ValueBounds<T> bestBounds;
};

template <typename T>
struct BrownRobinsonOptions {
    ConvergenceCriterion<T> criterion;

    // Pure strategies played in the first iteration, index 0 for both players if not set
    std::optional<PlayerArray<std::size_t>> initialStrategies;

    TieBreak tieBreak = TieBreak::SmallestIndex;
    std::uint64_t seed = 0;

    // Called after every completed iteration
    std::function<void(const BrownRobinsonIteration<T>&)> observer;
};

template <typename T>
struct BrownRobinsonState {
    std::size_t iteration;

    // rowScores[i] is the total payoff row i would have earned against the column player's play so far,
    // columnScores[j] the total payoff column j would have conceded against the row player's play
    std::vector<T> rowScores;
    std::vector<T> columnScores;

    // Number of times each pure strategy was played
    std::vector<std::size_t> rowCounts;
    std::vector<std::size_t> columnCounts;

    PlayerArray<std::size_t> nextChoices;

    ValueBounds<T> bounds;
    ValueBounds<T> bestBounds;
};

namespace brown_robinson_detail {
template <NumericField T>
std::size_t chooseBestIndex(const std::vector<T>& scores, bool isMaximizing, TieBreak tieBreak, std::mt19937_64& generator) {
    std::size_t bestIndex = isMaximizing ? getIndexOfMaximum(scores) : getIndexOfMinimum(scores);
    if (tieBreak == TieBreak::SmallestIndex) {
        return bestIndex;
    }

    std::vector<std::size_t> tiedIndices = getIndicesEqualTo(scores, scores[bestIndex]);
    assert(!tiedIndices.empty());
    if (tiedIndices.size() == 1) {
        return bestIndex;
    }

    std::uniform_int_distribution<std::size_t> distribution(0, tiedIndices.size() - 1);
    return tiedIndices[distribution(generator)];
}

template <NumericField T>
MatrixSolveResult<T> makeResult(const BrownRobinsonState<T>& state, TerminationReason reason, const std::string& errorMessage) {
    const T two = FieldTraits<T>::fromInteger(2);

    MatrixSolveResult<T> result{
        .value = FieldTraits<T>::zero(),
        .bounds = state.bounds,
        .bestBounds = state.bestBounds,
        .rowStrategy = {},
        .columnStrategy = {},
        .iterations = state.iteration,
        .reason = reason,
        .errorMessage = errorMessage
    };

    if (state.iteration == 0) {
        result.rowStrategy = getPureStrategy<T>(state.nextChoices[Player::Row], state.rowCounts.size());
        result.columnStrategy = getPureStrategy<T>(state.nextChoices[Player::Column], state.columnCounts.size());
        return result;
    }

    // Bounds of a committed state are finite, so this cannot overflow into an error
    result.value = T(state.bounds.lower + state.bounds.upper) / two;
    result.rowStrategy = getFrequencyStrategy<T>(state.rowCounts, state.iteration);
    result.columnStrategy = getFrequencyStrategy<T>(state.columnCounts, state.iteration);
    return result;
}
} // namespace brown_robinson_detail

// Fictitious play: in every iteration each player plays a pure best response to the
// opponent's empirical mixed strategy. The state of an iteration is committed only after
// every value of that iteration was computed, so a NumericError leaves the previous
// iteration's state as the result.
template <NumericField T>
Result<MatrixSolveResult<T>, ValidationError> solveBrownRobinson(const MatrixGame<T>& game, const BrownRobinsonOptions<T>& options) {
    std::size_t numRows = game.getNumStrategies(Player::Row);
    std::size_t numColumns = game.getNumStrategies(Player::Column);

    PlayerArray<std::size_t> initialStrategies = options.initialStrategies.value_or(PlayerArray<std::size_t>{ 0, 0 });
    if (initialStrategies[Player::Row] >= numRows || initialStrategies[Player::Column] >= numColumns) {
        return ValidationError{
            "Initial strategies (" + std::to_string(initialStrategies[Player::Row]) + ", "
            + std::to_string(initialStrategies[Player::Column]) + ") are out of range for a "
            + std::to_string(numRows) + "x" + std::to_string(numColumns) + " game."
        };
    }

    Result<ConvergenceCriterion<T>, ValidationError> criterionResult =
        makeConvergenceCriterion(options.criterion.epsilon, options.criterion.maxIterations);
    if (criterionResult.isError()) {
        return criterionResult.getError();
    }
    const ConvergenceCriterion<T>& criterion = criterionResult.getValue();

    const T zero = FieldTraits<T>::zero();

    BrownRobinsonState<T> state{
        .iteration = 0,
        .rowScores = std::vector<T>(numRows, zero),
        .columnScores = std::vector<T>(numColumns, zero),
        .rowCounts = std::vector<std::size_t>(numRows, 0),
        .columnCounts = std::vector<std::size_t>(numColumns, 0),
        .nextChoices = initialStrategies,
        .bounds = ValueBounds<T>{ zero, zero },
        .bestBounds = ValueBounds<T>{ zero, zero }
    };

    std::mt19937_64 generator(options.seed);

    // Scores of the iteration in progress, swapped into the state once the iteration is complete
    std::vector<T> nextRowScores = state.rowScores;
    std::vector<T> nextColumnScores = state.columnScores;

    try {
        while (state.iteration < criterion.maxIterations) {
            std::size_t row = state.nextChoices[Player::Row];
            std::size_t column = state.nextChoices[Player::Column];

            for (std::size_t i = 0; i < numRows; ++i) {
                nextRowScores[i] = state.rowScores[i] + game.getPayoff(i, column);
                checkFinite(nextRowScores[i], "cumulative payoff");
            }
            for (std::size_t j = 0; j < numColumns; ++j) {
                nextColumnScores[j] = state.columnScores[j] + game.getPayoff(row, j);
                checkFinite(nextColumnScores[j], "cumulative payoff");
            }

            std::size_t iteration = state.iteration + 1;
            T iterationCount = FieldTraits<T>::fromInteger(static_cast<std::int64_t>(iteration));
            ValueBounds<T> bounds{
                .lower = divide(nextColumnScores[getIndexOfMinimum(nextColumnScores)], iterationCount),
                .upper = divide(nextRowScores[getIndexOfMaximum(nextRowScores)], iterationCount)
            };

            T gap = bounds.upper - bounds.lower;
            checkFinite(gap, "bound gap");

            // Nothing below throws
            state.rowScores.swap(nextRowScores);
            state.columnScores.swap(nextColumnScores);
            ++state.rowCounts[row];
            ++state.columnCounts[column];
            state.iteration = iteration;

            if (iteration == 1) {
                state.bestBounds = bounds;
            }
            else {
                if (bounds.upper < state.bestBounds.upper) {
                    state.bestBounds.upper = bounds.upper;
                }
                if (state.bestBounds.lower < bounds.lower) {
                    state.bestBounds.lower = bounds.lower;
                }
            }
            state.bounds = std::move(bounds);

            state.nextChoices[Player::Row] = brown_robinson_detail::chooseBestIndex(state.rowScores, true, options.tieBreak, generator);
            state.nextChoices[Player::Column] = brown_robinson_detail::chooseBestIndex(state.columnScores, false, options.tieBreak, generator);

            if (options.observer) {
                options.observer(BrownRobinsonIteration<T>{
                    .iteration = state.iteration,
                    .choices = PlayerArray<std::size_t>{ row, column },
                    .bounds = state.bounds,
                    .bestBounds = state.bestBounds
                });
            }

            if (!(criterion.epsilon < gap)) {
                return brown_robinson_detail::makeResult(state, TerminationReason::Converged, "");
            }
        }
    }
    catch (const NumericError& error) {
        return brown_robinson_detail::makeResult(state, TerminationReason::NumericFailure, error.what());
    }

    return brown_robinson_detail::makeResult(state, TerminationReason::MaxIterationsExceeded, "");
}

#endif // BROWN_ROBINSON_HPP
