#ifndef LINEAR_SYSTEM_HPP
#define LINEAR_SYSTEM_HPP

#include "numeric/field.hpp"

#include <cassert>
#include <cstddef>
#include <optional>
#include <utility>
#include <vector>

// Solves A * x = b by Gaussian elimination with partial pivoting.
// Each row of `augmented` is [A_i0, ..., A_i(n-1), b_i].
// Returns std::nullopt if A is singular.
template <NumericField T>
std::optional<std::vector<T>> solveLinearSystem(std::vector<std::vector<T>> augmented) {
    std::size_t size = augmented.size();
    for (const auto& row : augmented) {
        assert(row.size() == size + 1);
    }

    for (std::size_t pivotColumn = 0; pivotColumn < size; ++pivotColumn) {
        std::size_t pivotRow = pivotColumn;
        for (std::size_t row = pivotColumn + 1; row < size; ++row) {
            if (absoluteValue(augmented[pivotRow][pivotColumn]) < absoluteValue(augmented[row][pivotColumn])) {
                pivotRow = row;
            }
        }

        if (augmented[pivotRow][pivotColumn] == FieldTraits<T>::zero()) {
            return std::nullopt;
        }
        std::swap(augmented[pivotRow], augmented[pivotColumn]);

        for (std::size_t row = pivotColumn + 1; row < size; ++row) {
            if (augmented[row][pivotColumn] == FieldTraits<T>::zero()) {
                continue;
            }

            T factor = divide(augmented[row][pivotColumn], augmented[pivotColumn][pivotColumn]);
            for (std::size_t column = pivotColumn; column <= size; ++column) {
                augmented[row][column] = augmented[row][column] - factor * augmented[pivotColumn][column];
            }
        }
    }

    // Back substitution
    std::vector<T> solution(size, FieldTraits<T>::zero());
    for (std::size_t i = size; i-- > 0;) {
        T remainder = augmented[i][size];
        for (std::size_t column = i + 1; column < size; ++column) {
            remainder = remainder - augmented[i][column] * solution[column];
        }
        solution[i] = divide(remainder, augmented[i][i]);
    }

    return solution;
}

#endif // LINEAR_SYSTEM_HPP
