#ifndef GAME_WRITER_HPP
#define GAME_WRITER_HPP

#include "game/continuous_game.hpp"
#include "game/game_types.hpp"
#include "numeric/field.hpp"

#include <cstddef>
#include <string>

// Inverse of the parser: the output of these functions parses back to an equivalent game

template <NumericField T>
std::string formatMatrixLiteral(const PayoffMatrix<T>& matrix) {
    std::string output = "[";
    for (std::size_t row = 0; row < matrix.size(); ++row) {
        if (row > 0) {
            output += ", ";
        }

        output += "[";
        for (std::size_t column = 0; column < matrix[row].size(); ++column) {
            if (column > 0) {
                output += ", ";
            }
            output += FieldTraits<T>::toString(matrix[row][column]);
        }
        output += "]";
    }
    output += "]";
    return output;
}

template <NumericField T>
std::string formatInterval(const Interval<T>& interval) {
    return "[" + FieldTraits<T>::toString(interval.lower) + ", " + FieldTraits<T>::toString(interval.upper) + "]";
}

template <NumericField T>
std::string formatContinuousGame(const ContinuousGameSpecification<T>& specification) {
    const std::string& xName = specification.variableNames[Player::Row];
    const std::string& yName = specification.variableNames[Player::Column];

    return specification.functionName + "(" + xName + ", " + yName + ") = "
        + specification.payoff.toString(xName, yName)
        + ", " + xName + " in " + formatInterval(specification.intervals[Player::Row])
        + ", " + yName + " in " + formatInterval(specification.intervals[Player::Column]);
}

#endif // GAME_WRITER_HPP
