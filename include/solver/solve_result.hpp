#ifndef SOLVE_RESULT_HPP
#define SOLVE_RESULT_HPP

#include "game/game_types.hpp"
#include "numeric/field.hpp"
#include "util/errors.hpp"
#include "util/result.hpp"

#include <cstddef>
#include <cstdint>
#include <string>

template <typename T>
struct ConvergenceCriterion {
    // Accepted gap between the upper and lower value estimates
    T epsilon;

    std::size_t maxIterations;
};

template <NumericField T>
Result<ConvergenceCriterion<T>, ValidationError> makeConvergenceCriterion(const T& epsilon, std::size_t maxIterations) {
    if (!FieldTraits<T>::isFinite(epsilon) || !(FieldTraits<T>::zero() < epsilon)) {
        return ValidationError{ "Epsilon must be a positive number, got " + FieldTraits<T>::toString(epsilon) + "." };
    }
    if (maxIterations == 0) {
        return ValidationError{ "Maximum number of iterations must be positive." };
    }
    return ConvergenceCriterion<T>{ epsilon, maxIterations };
}

enum class TerminationReason : std::uint8_t {
    Converged,
    MaxIterationsExceeded,
    NumericFailure
};

std::string getTerminationReasonName(TerminationReason reason);

template <typename T>
struct ValueBounds {
    T lower;
    T upper;

    bool operator==(const ValueBounds&) const = default;
};

// Result of a Brown-Robinson run. If the run failed before the first iteration
// completed, the bounds and value are zero and the strategies are the initial pure strategies.
template <typename T>
struct MatrixSolveResult {
    // Midpoint of the final bounds
    T value;

    ValueBounds<T> bounds;

    // Minimum upper bound and maximum lower bound over all iterations
    ValueBounds<T> bestBounds;

    MixedStrategy<T> rowStrategy;
    MixedStrategy<T> columnStrategy;

    std::size_t iterations;
    TerminationReason reason;

    // Set when reason is NumericFailure
    std::string errorMessage;

    bool isConverged() const {
        return reason == TerminationReason::Converged;
    }
};

// Result of a saddle-point run. point is the averaged iterate with the smallest duality gap.
// If the run failed before any gap was computed, point is the last iterate and the other values are zero.
template <typename T>
struct ContinuousSolveResult {
    Point<T> point;
    T value;

    // [min over x of f(x, y), max over y of f(x, y)] at point
    ValueBounds<T> bounds;
    T gap;

    // Last raw iterate
    Point<T> lastIterate;

    std::size_t iterations;
    TerminationReason reason;
    std::string errorMessage;

    bool isConverged() const {
        return reason == TerminationReason::Converged;
    }
};

// Result of a grid approximation run: the estimate of the finest grid solved.
// If no grid was solved, point and value are zero.
template <typename T>
struct GridSolveResult {
    Point<T> point;
    T value;

    // Number of intervals per axis of the finest grid solved
    std::size_t gridSize;

    // Number of grids solved
    std::size_t steps;

    TerminationReason reason;
    std::string errorMessage;

    bool isConverged() const {
        return reason == TerminationReason::Converged;
    }
};

#endif // SOLVE_RESULT_HPP
