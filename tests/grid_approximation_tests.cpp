#include <gtest/gtest.h>

#include "game/continuous_game.hpp"
#include "game/game_types.hpp"
#include "numeric/rational.hpp"
#include "parser/game_parser.hpp"
#include "solver/grid_approximation.hpp"
#include "solver/solve_result.hpp"
#include "util/errors.hpp"
#include "util/result.hpp"

#include <algorithm>
#include <cstddef>
#include <string>
#include <vector>

namespace {
template <NumericField T>
ConvexConcaveGame<T> createGame(const std::string& input) {
    Result<ContinuousGameSpecification<T>, ParseError> specification = parseContinuousLiteral<T>(input);
    EXPECT_TRUE(specification.isValue()) << input;

    Result<ConvexConcaveGame<T>, ValidationError> game = ConvexConcaveGame<T>::create(specification.getValue());
    EXPECT_TRUE(game.isValue()) << input;
    return game.getValue();
}

template <NumericField T>
GridSolveResult<T> solve(const ConvexConcaveGame<T>& game, const GridApproximationOptions<T>& options) {
    Result<GridSolveResult<T>, ValidationError> result = solveByGridApproximation(game, options);
    EXPECT_TRUE(result.isValue());
    return result.getValue();
}

const std::string SaddleGame = "f(x,y) = x^2 - y^2, x in [-1,1], y in [-1,1]";
const std::string ShiftedGame = "f(x,y) = (x - 0.3)^2 - (y + 0.2)^2 + x*y, x in [-1,1], y in [-1,1]";
} // namespace

TEST(GridApproximationTest, GridCoordinates) {
    std::vector<Rational> coordinates = grid_approximation_detail::getGridCoordinates(Interval<Rational>{ Rational(-1), Rational(2) }, 3);
    EXPECT_EQ(coordinates, (std::vector<Rational>{ Rational(-1), Rational(0), Rational(1), Rational(2) }));
}

TEST(GridApproximationTest, SaddleGameHasPureSaddlePointOnEveryGrid) {
    ConvexConcaveGame<Rational> game = createGame<Rational>(SaddleGame);

    GridApproximationOptions<Rational> options{ .accuracy = Rational(1, 100) };
    std::vector<GridIteration<Rational>> iterations;
    options.observer = [&iterations](const GridIteration<Rational>& iteration) {
        iterations.push_back(iteration);
    };

    // Grids 2 to 7 give five value changes, all zero
    GridSolveResult<Rational> result = solve(game, options);
    EXPECT_EQ(result.reason, TerminationReason::Converged);
    EXPECT_EQ(result.steps, 6);
    EXPECT_EQ(result.gridSize, 7);
    EXPECT_EQ(result.value, Rational(0));

    // On odd grids the points closest to zero are +-1/7, ties go to the smallest index
    EXPECT_EQ(result.point, (Point<Rational>{ Rational(-1, 7), Rational(-1, 7) }));

    ASSERT_EQ(iterations.size(), 6);
    EXPECT_EQ(iterations[0].gridSize, 2);
    EXPECT_EQ(iterations[0].point, (Point<Rational>{ Rational(0), Rational(0) }));
    for (const GridIteration<Rational>& iteration : iterations) {
        EXPECT_TRUE(iteration.isPureSaddlePoint);
        EXPECT_EQ(iteration.brownRobinsonIterations, 0);
        EXPECT_EQ(iteration.windowChange, Rational(0));
    }
}

TEST(GridApproximationTest, ShiftedGameApproachesAnalyticSolution) {
    ConvexConcaveGame<double> game = createGame<double>(ShiftedGame);

    GridApproximationOptions<double> options{ .accuracy = 0.01 };
    std::vector<GridIteration<double>> iterations;
    options.observer = [&iterations](const GridIteration<double>& iteration) {
        iterations.push_back(iteration);
    };

    GridSolveResult<double> result = solve(game, options);
    ASSERT_EQ(result.reason, TerminationReason::Converged);

    // The analytic saddle point is (0.32, -0.04) with value -0.038
    EXPECT_NEAR(result.point.x, 0.32, 0.06);
    EXPECT_NEAR(result.point.y, -0.04, 0.06);
    EXPECT_NEAR(result.value, -0.038, 0.01);

    EXPECT_EQ(iterations.size(), result.steps);
    EXPECT_TRUE(std::any_of(iterations.begin(), iterations.end(), [](const GridIteration<double>& iteration) {
        return !iteration.isPureSaddlePoint && iteration.brownRobinsonIterations > 0;
    }));
    EXPECT_LE(iterations.back().windowChange, 0.01);
}

TEST(GridApproximationTest, StopsAtMaximumGridSize) {
    ConvexConcaveGame<double> game = createGame<double>(ShiftedGame);

    GridSolveResult<double> result = solve(game, GridApproximationOptions<double>{ .accuracy = 0.01, .windowSize = 5, .maxGridSize = 4 });
    EXPECT_EQ(result.reason, TerminationReason::MaxIterationsExceeded);
    EXPECT_FALSE(result.isConverged());
    EXPECT_EQ(result.steps, 3);
    EXPECT_EQ(result.gridSize, 4);
}

TEST(GridApproximationTest, NumericFailureKeepsLastSolvedGrid) {
    // y = 1/3 is first a grid point on the grid of size 3
    ConvexConcaveGame<Rational> game = createGame<Rational>("f(x,y) = x^2 - y^2 + 1/(3y - 1), x in [0,1], y in [0,1]");

    GridSolveResult<Rational> result = solve(game, GridApproximationOptions<Rational>{ .accuracy = Rational(1, 100) });
    EXPECT_EQ(result.reason, TerminationReason::NumericFailure);
    EXPECT_EQ(result.errorMessage, "Division by zero.");
    EXPECT_EQ(result.steps, 1);
    EXPECT_EQ(result.gridSize, 2);
    EXPECT_TRUE(game.contains(result.point));
}

TEST(GridApproximationTest, RejectsInvalidOptions) {
    ConvexConcaveGame<double> game = createGame<double>(SaddleGame);

    Result<GridSolveResult<double>, ValidationError> zeroAccuracy = solveByGridApproximation(game, GridApproximationOptions<double>{ .accuracy = 0.0 });
    EXPECT_TRUE(zeroAccuracy.isError());

    Result<GridSolveResult<double>, ValidationError> emptyWindow =
        solveByGridApproximation(game, GridApproximationOptions<double>{ .accuracy = 0.01, .windowSize = 0 });
    ASSERT_TRUE(emptyWindow.isError());
    EXPECT_EQ(emptyWindow.getError().message, "Window size must be positive.");

    Result<GridSolveResult<double>, ValidationError> tinyGrid =
        solveByGridApproximation(game, GridApproximationOptions<double>{ .accuracy = 0.01, .windowSize = 5, .maxGridSize = 1 });
    ASSERT_TRUE(tinyGrid.isError());
    EXPECT_EQ(tinyGrid.getError().message, "Maximum grid size must be at least 2, got 1.");

    Result<GridSolveResult<double>, ValidationError> noIterations = solveByGridApproximation(
        game, GridApproximationOptions<double>{ .accuracy = 0.01, .windowSize = 5, .maxGridSize = 10, .brownRobinsonMaxIterations = 0 }
    );
    EXPECT_TRUE(noIterations.isError());
}
