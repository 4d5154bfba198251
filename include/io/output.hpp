#ifndef OUTPUT_HPP
#define OUTPUT_HPP

#include "game/continuous_game.hpp"
#include "game/game_types.hpp"
#include "game/matrix_game.hpp"
#include "numeric/field.hpp"
#include "parser/game_writer.hpp"
#include "solver/solve_result.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

using json = nlohmann::ordered_json;

// Rationals are written as exact "p/q" strings, floats as JSON numbers
template <NumericField T>
json buildJSONNumber(const T& value) {
    if constexpr (FieldTraits<T>::Kind == NumericKind::Rational) {
        return FieldTraits<T>::toString(value);
    }
    else {
        return FieldTraits<T>::toDouble(value);
    }
}

template <NumericField T>
json buildJSONStrategy(const MixedStrategy<T>& strategy) {
    json j = json::array();
    for (const T& probability : strategy) {
        j.push_back(buildJSONNumber(probability));
    }
    return j;
}

template <NumericField T>
json buildJSONBounds(const ValueBounds<T>& bounds) {
    json j;
    j["Lower"] = buildJSONNumber(bounds.lower);
    j["Upper"] = buildJSONNumber(bounds.upper);
    return j;
}

template <NumericField T>
json buildJSONPoint(const Point<T>& point) {
    json j;
    j["X"] = buildJSONNumber(point.x);
    j["Y"] = buildJSONNumber(point.y);
    return j;
}

template <NumericField T>
json buildJSONMatrixResult(const MatrixSolveResult<T>& result) {
    json j;
    j["Termination"] = getTerminationReasonName(result.reason);
    j["Iterations"] = result.iterations;
    j["Value"] = buildJSONNumber(result.value);
    j["Bounds"] = buildJSONBounds(result.bounds);
    j["BestBounds"] = buildJSONBounds(result.bestBounds);
    j["RowStrategy"] = buildJSONStrategy(result.rowStrategy);
    j["ColumnStrategy"] = buildJSONStrategy(result.columnStrategy);
    if (!result.errorMessage.empty()) {
        j["Error"] = result.errorMessage;
    }
    return j;
}

template <NumericField T>
json buildJSONMatrixGame(
    const std::string& name,
    const MatrixGame<T>& game,
    const MatrixSolveResult<T>& result,
    const std::optional<MatrixSolution<T>>& fullyMixedSolution
) {
    json j;
    j["Name"] = name;
    j["Type"] = "Matrix";
    j["Specification"] = formatMatrixLiteral(game.getPayoffs());
    j["Rows"] = game.getNumStrategies(Player::Row);
    j["Columns"] = game.getNumStrategies(Player::Column);

    PurePrice<T> lowerPrice = game.getLowerPrice();
    PurePrice<T> upperPrice = game.getUpperPrice();
    j["LowerPrice"] = { { "Row", lowerPrice.index }, { "Value", buildJSONNumber(lowerPrice.value) } };
    j["UpperPrice"] = { { "Column", upperPrice.index }, { "Value", buildJSONNumber(upperPrice.value) } };

    std::optional<PureSaddlePoint<T>> saddlePoint = game.findPureSaddlePoint();
    if (saddlePoint) {
        j["PureSaddlePoint"] = {
            { "Row", saddlePoint->row },
            { "Column", saddlePoint->column },
            { "Value", buildJSONNumber(saddlePoint->value) }
        };
    }
    else {
        j["PureSaddlePoint"] = nullptr;
    }

    j["Result"] = buildJSONMatrixResult(result);

    if (fullyMixedSolution) {
        json& solution = j["FullyMixedSolution"];
        solution["Value"] = buildJSONNumber(fullyMixedSolution->value);
        solution["RowStrategy"] = buildJSONStrategy(fullyMixedSolution->rowStrategy);
        solution["ColumnStrategy"] = buildJSONStrategy(fullyMixedSolution->columnStrategy);
    }

    return j;
}

template <NumericField T>
json buildJSONGridResult(const GridSolveResult<T>& result) {
    json j;
    j["Termination"] = getTerminationReasonName(result.reason);
    j["Steps"] = result.steps;
    j["GridSize"] = result.gridSize;
    j["Point"] = buildJSONPoint(result.point);
    j["Value"] = buildJSONNumber(result.value);
    if (!result.errorMessage.empty()) {
        j["Error"] = result.errorMessage;
    }
    return j;
}

template <NumericField T>
json buildJSONContinuousGame(
    const std::string& name,
    const ConvexConcaveGame<T>& game,
    const ContinuousSolveResult<T>& result,
    const std::optional<GridSolveResult<T>>& gridSolution,
    const std::optional<ContinuousSolution<T>>& analyticSolution
) {
    json j;
    j["Name"] = name;
    j["Type"] = "Continuous";
    j["Specification"] = formatContinuousGame(game.getSpecification());

    json& resultJSON = j["Result"];
    resultJSON["Termination"] = getTerminationReasonName(result.reason);
    resultJSON["Iterations"] = result.iterations;
    resultJSON["Point"] = buildJSONPoint(result.point);
    resultJSON["Value"] = buildJSONNumber(result.value);
    resultJSON["Bounds"] = buildJSONBounds(result.bounds);
    resultJSON["Gap"] = buildJSONNumber(result.gap);
    resultJSON["LastIterate"] = buildJSONPoint(result.lastIterate);
    if (!result.errorMessage.empty()) {
        resultJSON["Error"] = result.errorMessage;
    }

    if (gridSolution) {
        j["GridSolution"] = buildJSONGridResult(*gridSolution);
    }

    if (analyticSolution) {
        json& solution = j["AnalyticSolution"];
        solution["Point"] = buildJSONPoint(analyticSolution->point);
        solution["Value"] = buildJSONNumber(analyticSolution->value);
    }

    return j;
}

json buildJSONGameError(const std::string& name, const std::string& error);

// Returns false if the file could not be written
bool outputJSONToFile(const json& j, const std::string& filePath);

#endif // OUTPUT_HPP
