#ifndef SADDLE_POINT_HPP
#define SADDLE_POINT_HPP

#include "game/continuous_game.hpp"
#include "game/expression.hpp"
#include "game/game_types.hpp"
#include "numeric/field.hpp"
#include "solver/solve_result.hpp"
#include "util/errors.hpp"
#include "util/result.hpp"

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <random>
#include <string>
#include <utility>

enum class StartPolicy : std::uint8_t {
    Midpoint,
    Explicit,
    Random
};

std::string getStartPolicyName(StartPolicy policy);
Result<StartPolicy> getStartPolicyFromName(const std::string& name);

template <typename T>
struct SaddlePointIteration {
    std::size_t iteration;

    // Raw iterate after this iteration's update
    Point<T> iterate;

    // Average of the iterates at which the gradients were taken so far
    Point<T> average;

    // Set on iterations where the duality gap was computed
    std::optional<T> gap;

    std::optional<T> bestGap;
};

template <typename T>
struct SaddlePointOptions {
    ConvergenceCriterion<T> criterion;

    StartPolicy start = StartPolicy::Midpoint;

    // Required for StartPolicy::Explicit
    std::optional<Point<T>> startPoint;

    // Used by StartPolicy::Random
    std::uint64_t seed = 0;

    // Step of iteration k is stepScale * (interval width) / sqrt(k)
    double stepScale = 0.5;

    std::size_t gapCheckFrequency = 1;

    std::function<void(const SaddlePointIteration<T>&)> observer;
};

template <typename T>
struct DualityGap {
    ValueBounds<T> bounds;
    T gap;
};

namespace saddle_point_detail {
constexpr int NumTernarySearchIterations = 100;

// Ternary search for the extremum of a unimodal function, also comparing both endpoints
template <NumericField T, typename Function>
T optimizeOnInterval(const Function& function, const Interval<T>& interval, bool isMaximizing) {
    const T three = FieldTraits<T>::fromInteger(3);
    const T two = FieldTraits<T>::fromInteger(2);

    auto isBetter = [isMaximizing](const T& candidate, const T& incumbent) {
        return isMaximizing ? (incumbent < candidate) : (candidate < incumbent);
    };

    T low = interval.lower;
    T high = interval.upper;
    for (int i = 0; i < NumTernarySearchIterations; ++i) {
        T third = divide(T(high - low), three);
        T left = FieldTraits<T>::approximate(T(low + third));
        T right = FieldTraits<T>::approximate(T(high - third));

        if (isBetter(function(right), function(left))) {
            low = left;
        }
        else {
            high = right;
        }
    }

    T best = function(interval.lower);
    T atUpper = function(interval.upper);
    if (isBetter(atUpper, best)) {
        best = atUpper;
    }
    T atCenter = function(FieldTraits<T>::approximate(divide(T(low + high), two)));
    if (isBetter(atCenter, best)) {
        best = atCenter;
    }
    return best;
}

template <typename T>
struct Estimate {
    Point<T> point;
    T value;
    DualityGap<T> gap;
};

template <typename T>
struct SaddlePointState {
    std::size_t iteration;
    Point<T> iterate;
    Point<T> average;
    std::optional<Estimate<T>> best;
};

template <NumericField T>
T stayInside(const T& value, const Interval<T>& interval) {
    return clampToInterval(FieldTraits<T>::approximate(clampToInterval(value, interval.lower, interval.upper)), interval.lower, interval.upper);
}

template <NumericField T>
ContinuousSolveResult<T> makeResult(const SaddlePointState<T>& state, TerminationReason reason, const std::string& errorMessage) {
    const T zero = FieldTraits<T>::zero();

    ContinuousSolveResult<T> result{
        .point = state.iterate,
        .value = zero,
        .bounds = ValueBounds<T>{ zero, zero },
        .gap = zero,
        .lastIterate = state.iterate,
        .iterations = state.iteration,
        .reason = reason,
        .errorMessage = errorMessage
    };

    if (state.best) {
        result.point = state.best->point;
        result.value = state.best->value;
        result.bounds = state.best->gap.bounds;
        result.gap = state.best->gap.gap;
    }
    return result;
}
} // namespace saddle_point_detail

// max over y' of f(x, y') minus min over x' of f(x', y), clamped at zero
template <NumericField T>
DualityGap<T> computeDualityGap(const ConvexConcaveGame<T>& game, const Point<T>& point) {
    T upper = saddle_point_detail::optimizeOnInterval<T>(
        [&game, &point](const T& y) { return game.getPayoff(point.x, y); },
        game.getInterval(Player::Column),
        true
    );
    T lower = saddle_point_detail::optimizeOnInterval<T>(
        [&game, &point](const T& x) { return game.getPayoff(x, point.y); },
        game.getInterval(Player::Row),
        false
    );

    T gap = upper - lower;
    checkFinite(gap, "duality gap");
    if (gap < FieldTraits<T>::zero()) {
        gap = FieldTraits<T>::zero();
    }
    return DualityGap<T>{ ValueBounds<T>{ lower, upper }, gap };
}

// Projected subgradient descent in x and ascent in y with step sizes proportional to 1 / sqrt(k).
// Convergence is judged on the running average of the iterates, whose duality gap goes to zero
// for convex-concave payoffs even when the raw iterates cycle.
template <NumericField T>
Result<ContinuousSolveResult<T>, ValidationError> solveSaddlePoint(const ConvexConcaveGame<T>& game, const SaddlePointOptions<T>& options) {
    Result<ConvergenceCriterion<T>, ValidationError> criterionResult =
        makeConvergenceCriterion(options.criterion.epsilon, options.criterion.maxIterations);
    if (criterionResult.isError()) {
        return criterionResult.getError();
    }
    const ConvergenceCriterion<T>& criterion = criterionResult.getValue();

    if (!std::isfinite(options.stepScale) || options.stepScale <= 0.0) {
        return ValidationError{ "Step scale must be a positive number." };
    }
    if (options.gapCheckFrequency == 0) {
        return ValidationError{ "Gap check frequency must be positive." };
    }

    const Interval<T>& xInterval = game.getInterval(Player::Row);
    const Interval<T>& yInterval = game.getInterval(Player::Column);

    Point<T> start = game.getMidpoint();
    switch (options.start) {
        case StartPolicy::Midpoint:
            break;
        case StartPolicy::Explicit:
            if (!options.startPoint) {
                return ValidationError{ "Explicit start requires a start point." };
            }
            if (!game.contains(*options.startPoint)) {
                return ValidationError{
                    "Start point (" + FieldTraits<T>::toString(options.startPoint->x) + ", "
                    + FieldTraits<T>::toString(options.startPoint->y) + ") lies outside the strategy intervals."
                };
            }
            start = *options.startPoint;
            break;
        case StartPolicy::Random: {
            std::mt19937_64 generator(options.seed);
            auto drawFrom = [&generator](const Interval<T>& interval) {
                std::uniform_real_distribution<double> distribution(
                    FieldTraits<T>::toDouble(interval.lower),
                    FieldTraits<T>::toDouble(interval.upper)
                );
                return clampToInterval(FieldTraits<T>::fromDouble(distribution(generator)), interval.lower, interval.upper);
            };
            start.x = drawFrom(xInterval);
            start.y = drawFrom(yInterval);
            break;
        }
    }

    const double xWidth = FieldTraits<T>::toDouble(T(xInterval.upper - xInterval.lower));
    const double yWidth = FieldTraits<T>::toDouble(T(yInterval.upper - yInterval.lower));

    saddle_point_detail::SaddlePointState<T> state{
        .iteration = 0,
        .iterate = start,
        .average = start,
        .best = std::nullopt
    };

    try {
        while (state.iteration < criterion.maxIterations) {
            saddle_point_detail::SaddlePointState<T> next = state;
            ++next.iteration;

            T count = FieldTraits<T>::fromInteger(static_cast<std::int64_t>(next.iteration));
            next.average.x = saddle_point_detail::stayInside(T(next.average.x + divide(T(next.iterate.x - next.average.x), count)), xInterval);
            next.average.y = saddle_point_detail::stayInside(T(next.average.y + divide(T(next.iterate.y - next.average.y), count)), yInterval);

            ValueWithGradient<T> gradient = game.getPayoffWithGradient(next.iterate.x, next.iterate.y);

            double rootCount = std::sqrt(static_cast<double>(next.iteration));
            T xStep = FieldTraits<T>::fromDouble(options.stepScale * xWidth / rootCount);
            T yStep = FieldTraits<T>::fromDouble(options.stepScale * yWidth / rootCount);

            next.iterate.x = saddle_point_detail::stayInside(T(next.iterate.x - xStep * gradient.dx), xInterval);
            next.iterate.y = saddle_point_detail::stayInside(T(next.iterate.y + yStep * gradient.dy), yInterval);

            std::optional<T> checkedGap;
            if (next.iteration % options.gapCheckFrequency == 0 || next.iteration == criterion.maxIterations) {
                DualityGap<T> gap = computeDualityGap(game, next.average);
                checkedGap = gap.gap;

                if (!next.best || gap.gap < next.best->gap.gap) {
                    next.best = saddle_point_detail::Estimate<T>{
                        .point = next.average,
                        .value = game.getPayoff(next.average.x, next.average.y),
                        .gap = gap
                    };
                }
            }

            state = std::move(next);

            if (options.observer) {
                std::optional<T> bestGap;
                if (state.best) {
                    bestGap = state.best->gap.gap;
                }

                options.observer(SaddlePointIteration<T>{
                    .iteration = state.iteration,
                    .iterate = state.iterate,
                    .average = state.average,
                    .gap = checkedGap,
                    .bestGap = bestGap
                });
            }

            if (state.best && !(criterion.epsilon < state.best->gap.gap)) {
                return saddle_point_detail::makeResult(state, TerminationReason::Converged, "");
            }
        }
    }
    catch (const NumericError& error) {
        return saddle_point_detail::makeResult(state, TerminationReason::NumericFailure, error.what());
    }

    return saddle_point_detail::makeResult(state, TerminationReason::MaxIterationsExceeded, "");
}

#endif // SADDLE_POINT_HPP
