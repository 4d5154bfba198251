#ifndef CONTINUOUS_GAME_HPP
#define CONTINUOUS_GAME_HPP

#include "game/expression.hpp"
#include "game/game_types.hpp"
#include "numeric/field.hpp"
#include "util/errors.hpp"
#include "util/result.hpp"

#include <cassert>
#include <optional>
#include <string>
#include <utility>

// Parsed form of "f(x,y) = <expression>, x in [a,b], y in [c,d]"
template <typename T>
struct ContinuousGameSpecification {
    std::string functionName;
    PlayerArray<std::string> variableNames;
    Expression<T> payoff;
    PlayerArray<Interval<T>> intervals;
};

template <typename T>
struct ContinuousSolution {
    Point<T> point;
    T value;
};

// H(x, y) = ax^2 + by^2 + cxy + dx + ey + g
template <typename T>
struct QuadraticCoefficients {
    T a;
    T b;
    T c;
    T d;
    T e;
    T g;
};

// A zero-sum game on [a,b] x [c,d]. The row player picks x and minimizes the payoff,
// the column player picks y and maximizes it. The payoff is assumed convex in x and
// concave in y; nothing here checks that.
template <NumericField T>
class ConvexConcaveGame {
public:
    static Result<ConvexConcaveGame, ValidationError> create(ContinuousGameSpecification<T> specification) {
        if (specification.payoff.isEmpty()) {
            return ValidationError{ "Payoff function is empty." };
        }

        for (Player player : { Player::Row, Player::Column }) {
            const std::string& name = specification.variableNames[player];
            if (name.empty()) {
                return ValidationError{ "Strategy variable name is empty." };
            }

            const Interval<T>& interval = specification.intervals[player];
            if (!FieldTraits<T>::isFinite(interval.lower) || !FieldTraits<T>::isFinite(interval.upper)) {
                return ValidationError{ "Interval of " + name + " has a non-finite bound." };
            }
            if (interval.upper < interval.lower) {
                return ValidationError{
                    "Interval of " + name + " is empty: [" + FieldTraits<T>::toString(interval.lower) + ", "
                    + FieldTraits<T>::toString(interval.upper) + "]."
                };
            }
        }

        if (specification.variableNames[Player::Row] == specification.variableNames[Player::Column]) {
            return ValidationError{ "Both players use the variable name " + specification.variableNames[Player::Row] + "." };
        }

        return ConvexConcaveGame{ std::move(specification) };
    }

    T getPayoff(const T& x, const T& y) const {
        return m_specification.payoff.evaluate(x, y);
    }

    ValueWithGradient<T> getPayoffWithGradient(const T& x, const T& y) const {
        return m_specification.payoff.evaluateWithGradient(x, y);
    }

    // Row player's interval is x, column player's interval is y
    const Interval<T>& getInterval(Player player) const {
        return m_specification.intervals[player];
    }

    const std::string& getVariableName(Player player) const {
        return m_specification.variableNames[player];
    }

    const std::string& getFunctionName() const {
        return m_specification.functionName;
    }

    const ContinuousGameSpecification<T>& getSpecification() const {
        return m_specification;
    }

    Point<T> getMidpoint() const {
        const T two = FieldTraits<T>::fromInteger(2);
        const Interval<T>& xInterval = getInterval(Player::Row);
        const Interval<T>& yInterval = getInterval(Player::Column);
        return Point<T>{
            divide(T(xInterval.lower + xInterval.upper), two),
            divide(T(yInterval.lower + yInterval.upper), two)
        };
    }

    bool contains(const Point<T>& point) const {
        const Interval<T>& xInterval = getInterval(Player::Row);
        const Interval<T>& yInterval = getInterval(Player::Column);
        return !(point.x < xInterval.lower) && !(xInterval.upper < point.x)
            && !(point.y < yInterval.lower) && !(yInterval.upper < point.y);
    }

    // Recovers the coefficients from payoff samples when the payoff is a polynomial of degree at most two
    std::optional<QuadraticCoefficients<T>> getQuadraticCoefficients() const {
        std::optional<int> degree = m_specification.payoff.getPolynomialDegree();
        if (!degree || *degree > 2) {
            return std::nullopt;
        }

        const T zero = FieldTraits<T>::zero();
        const T one = FieldTraits<T>::one();
        const T minusOne = T(-one);
        const T two = FieldTraits<T>::fromInteger(2);

        T atOrigin = getPayoff(zero, zero);
        T atPlusX = getPayoff(one, zero);
        T atMinusX = getPayoff(minusOne, zero);
        T atPlusY = getPayoff(zero, one);
        T atMinusY = getPayoff(zero, minusOne);
        T atPlusXY = getPayoff(one, one);

        QuadraticCoefficients<T> coefficients{
            .a = T(divide(T(atPlusX + atMinusX), two) - atOrigin),
            .b = T(divide(T(atPlusY + atMinusY), two) - atOrigin),
            .c = zero,
            .d = divide(T(atPlusX - atMinusX), two),
            .e = divide(T(atPlusY - atMinusY), two),
            .g = atOrigin
        };
        coefficients.c = atPlusXY - coefficients.a - coefficients.b - coefficients.d - coefficients.e - coefficients.g;
        return coefficients;
    }

private:
    explicit ConvexConcaveGame(ContinuousGameSpecification<T> specification) : m_specification{ std::move(specification) } {}

    ContinuousGameSpecification<T> m_specification;
};

// Closed-form saddle point of a strictly convex-concave quadratic payoff.
// Solves the first-order conditions
//   2a x + c y + d = 0
//   c x + 2b y + e = 0
// and returns the solution only if it lies inside both intervals.
template <NumericField T>
std::optional<ContinuousSolution<T>> solveQuadraticAnalytically(const ConvexConcaveGame<T>& game) {
    std::optional<QuadraticCoefficients<T>> coefficientsOption = game.getQuadraticCoefficients();
    if (!coefficientsOption) {
        return std::nullopt;
    }

    const QuadraticCoefficients<T>& k = *coefficientsOption;
    const T zero = FieldTraits<T>::zero();
    if (!(zero < k.a) || !(k.b < zero)) {
        return std::nullopt;
    }

    const T two = FieldTraits<T>::fromInteger(2);
    const T four = FieldTraits<T>::fromInteger(4);
    T determinant = four * k.a * k.b - k.c * k.c;

    Point<T> point{
        divide(T(k.c * k.e - two * k.b * k.d), determinant),
        divide(T(k.c * k.d - two * k.a * k.e), determinant)
    };

    if (!game.contains(point)) {
        return std::nullopt;
    }

    return ContinuousSolution<T>{ point, game.getPayoff(point.x, point.y) };
}

#endif // CONTINUOUS_GAME_HPP
