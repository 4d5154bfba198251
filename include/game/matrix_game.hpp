#ifndef MATRIX_GAME_HPP
#define MATRIX_GAME_HPP

#include "game/game_types.hpp"
#include "game/game_utils.hpp"
#include "numeric/field.hpp"
#include "numeric/linear_system.hpp"
#include "util/errors.hpp"
#include "util/result.hpp"

#include <cassert>
#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

template <typename T>
struct PurePrice {
    std::size_t index;
    T value;
};

template <typename T>
struct PureSaddlePoint {
    std::size_t row;
    std::size_t column;
    T value;
};

template <typename T>
struct MatrixSolution {
    MixedStrategy<T> rowStrategy;
    MixedStrategy<T> columnStrategy;
    T value;
};

// Ties resolve to the smallest index
template <NumericField T>
std::size_t getIndexOfMaximum(const std::vector<T>& values) {
    assert(!values.empty());

    std::size_t bestIndex = 0;
    for (std::size_t i = 1; i < values.size(); ++i) {
        if (values[bestIndex] < values[i]) {
            bestIndex = i;
        }
    }
    return bestIndex;
}

template <NumericField T>
std::size_t getIndexOfMinimum(const std::vector<T>& values) {
    assert(!values.empty());

    std::size_t bestIndex = 0;
    for (std::size_t i = 1; i < values.size(); ++i) {
        if (values[i] < values[bestIndex]) {
            bestIndex = i;
        }
    }
    return bestIndex;
}

template <NumericField T>
std::vector<std::size_t> getIndicesEqualTo(const std::vector<T>& values, const T& target) {
    std::vector<std::size_t> indices;
    for (std::size_t i = 0; i < values.size(); ++i) {
        if (values[i] == target) {
            indices.push_back(i);
        }
    }
    return indices;
}

template <NumericField T>
class MatrixGame {
public:
    static Result<MatrixGame, ValidationError> create(PayoffMatrix<T> payoffs) {
        if (payoffs.empty()) {
            return ValidationError{ "Payoff matrix has no rows." };
        }

        std::size_t numColumns = payoffs[0].size();
        if (numColumns == 0) {
            return ValidationError{ "Payoff matrix has no columns." };
        }

        for (std::size_t row = 0; row < payoffs.size(); ++row) {
            if (payoffs[row].size() != numColumns) {
                return ValidationError{
                    "Payoff matrix is not rectangular: row " + std::to_string(row) + " has " + std::to_string(payoffs[row].size())
                    + " entries, expected " + std::to_string(numColumns) + "."
                };
            }

            for (const T& payoff : payoffs[row]) {
                if (!FieldTraits<T>::isFinite(payoff)) {
                    return ValidationError{ "Payoff matrix contains a non-finite entry in row " + std::to_string(row) + "." };
                }
            }
        }

        return MatrixGame{ std::move(payoffs) };
    }

    std::size_t getNumStrategies(Player player) const {
        return (player == Player::Row) ? m_payoffs.size() : m_payoffs[0].size();
    }

    const T& getPayoff(std::size_t row, std::size_t column) const {
        assert(row < m_payoffs.size());
        assert(column < m_payoffs[row].size());
        return m_payoffs[row][column];
    }

    const PayoffMatrix<T>& getPayoffs() const {
        return m_payoffs;
    }

    // The row player's expected payoff against each pure strategy of `player`'s opponent
    std::vector<T> getExpectedPayoffs(Player player, const MixedStrategy<T>& strategy) const {
        assert(strategy.size() == getNumStrategies(player));

        Player opponent = getOpposingPlayer(player);
        std::size_t numOpponentStrategies = getNumStrategies(opponent);
        std::vector<T> expectedPayoffs(numOpponentStrategies, FieldTraits<T>::zero());

        for (std::size_t opponentIndex = 0; opponentIndex < numOpponentStrategies; ++opponentIndex) {
            T total = FieldTraits<T>::zero();
            for (std::size_t index = 0; index < strategy.size(); ++index) {
                if (strategy[index] == FieldTraits<T>::zero()) {
                    continue;
                }

                const T& payoff = (player == Player::Row) ? getPayoff(index, opponentIndex) : getPayoff(opponentIndex, index);
                total = total + strategy[index] * payoff;
            }
            checkFinite(total, "expected payoff");
            expectedPayoffs[opponentIndex] = total;
        }

        return expectedPayoffs;
    }

    // The row player maximizes the expected payoff, the column player minimizes it
    std::size_t getBestResponse(Player responder, const MixedStrategy<T>& opponentStrategy) const {
        std::vector<T> expectedPayoffs = getExpectedPayoffs(getOpposingPlayer(responder), opponentStrategy);
        return (responder == Player::Row) ? getIndexOfMaximum(expectedPayoffs) : getIndexOfMinimum(expectedPayoffs);
    }

    T getExpectedValue(const MixedStrategy<T>& rowStrategy, const MixedStrategy<T>& columnStrategy) const {
        std::vector<T> againstColumns = getExpectedPayoffs(Player::Row, rowStrategy);
        assert(againstColumns.size() == columnStrategy.size());

        T value = FieldTraits<T>::zero();
        for (std::size_t column = 0; column < columnStrategy.size(); ++column) {
            value = value + againstColumns[column] * columnStrategy[column];
        }
        return value;
    }

    // Maximin over pure strategies: the row player's guaranteed payoff
    PurePrice<T> getLowerPrice() const {
        std::vector<T> rowMinimums;
        rowMinimums.reserve(m_payoffs.size());
        for (const auto& row : m_payoffs) {
            rowMinimums.push_back(row[getIndexOfMinimum(row)]);
        }

        std::size_t bestRow = getIndexOfMaximum(rowMinimums);
        return PurePrice<T>{ bestRow, rowMinimums[bestRow] };
    }

    // Minimax over pure strategies: the column player's guaranteed loss
    PurePrice<T> getUpperPrice() const {
        std::size_t numColumns = getNumStrategies(Player::Column);
        std::vector<T> columnMaximums;
        columnMaximums.reserve(numColumns);
        for (std::size_t column = 0; column < numColumns; ++column) {
            T columnMaximum = m_payoffs[0][column];
            for (const auto& row : m_payoffs) {
                if (columnMaximum < row[column]) {
                    columnMaximum = row[column];
                }
            }
            columnMaximums.push_back(columnMaximum);
        }

        std::size_t bestColumn = getIndexOfMinimum(columnMaximums);
        return PurePrice<T>{ bestColumn, columnMaximums[bestColumn] };
    }

    std::optional<PureSaddlePoint<T>> findPureSaddlePoint() const {
        PurePrice<T> lower = getLowerPrice();
        PurePrice<T> upper = getUpperPrice();
        if (!(lower.value == upper.value)) {
            return std::nullopt;
        }
        return PureSaddlePoint<T>{ lower.index, upper.index, lower.value };
    }

    // Solves the indifference equations of a square game whose optimal strategies use every pure strategy.
    // Returns std::nullopt when the system is singular or a probability comes out negative.
    std::optional<MatrixSolution<T>> solveFullyMixed() const {
        std::size_t size = m_payoffs.size();
        if (getNumStrategies(Player::Column) != size) {
            return std::nullopt;
        }

        auto solveFor = [this, size](Player player) -> std::optional<std::vector<T>> {
            // Unknowns are the player's probabilities followed by the value
            std::vector<std::vector<T>> augmented;
            for (std::size_t opponentIndex = 0; opponentIndex < size; ++opponentIndex) {
                std::vector<T> equation;
                for (std::size_t index = 0; index < size; ++index) {
                    equation.push_back((player == Player::Row) ? getPayoff(index, opponentIndex) : getPayoff(opponentIndex, index));
                }
                equation.push_back(T(-FieldTraits<T>::one()));
                equation.push_back(FieldTraits<T>::zero());
                augmented.push_back(std::move(equation));
            }

            std::vector<T> normalization(size, FieldTraits<T>::one());
            normalization.push_back(FieldTraits<T>::zero());
            normalization.push_back(FieldTraits<T>::one());
            augmented.push_back(std::move(normalization));

            return solveLinearSystem(std::move(augmented));
        };

        std::optional<std::vector<T>> rowSolution = solveFor(Player::Row);
        std::optional<std::vector<T>> columnSolution = solveFor(Player::Column);
        if (!rowSolution || !columnSolution) {
            return std::nullopt;
        }

        MatrixSolution<T> solution{
            .rowStrategy = MixedStrategy<T>(rowSolution->begin(), rowSolution->begin() + size),
            .columnStrategy = MixedStrategy<T>(columnSolution->begin(), columnSolution->begin() + size),
            .value = (*rowSolution)[size]
        };

        for (Player player : { Player::Row, Player::Column }) {
            const MixedStrategy<T>& strategy = (player == Player::Row) ? solution.rowStrategy : solution.columnStrategy;
            for (const T& probability : strategy) {
                if (probability < FieldTraits<T>::zero()) {
                    return std::nullopt;
                }
            }
        }

        return solution;
    }

private:
    explicit MatrixGame(PayoffMatrix<T> payoffs) : m_payoffs{ std::move(payoffs) } {}

    PayoffMatrix<T> m_payoffs;
};

#endif // MATRIX_GAME_HPP
