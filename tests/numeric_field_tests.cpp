#include <gtest/gtest.h>

#include "numeric/field.hpp"
#include "numeric/linear_system.hpp"
#include "numeric/rational.hpp"
#include "util/errors.hpp"
#include "util/string_utils.hpp"

#include <cmath>
#include <limits>
#include <optional>
#include <string>
#include <vector>

static constexpr double Epsilon = 1e-12;

TEST(NumericLiteralTest, SplitsDecimalLiteral) {
    std::optional<NumericLiteral> parts = splitNumericLiteral("-12.50e3");
    ASSERT_TRUE(parts.has_value());
    EXPECT_TRUE(parts->isNegative);
    EXPECT_EQ(parts->integerDigits, "12");
    EXPECT_EQ(parts->fractionDigits, "50");
    EXPECT_EQ(parts->exponent, 3);
    EXPECT_TRUE(parts->denominatorDigits.empty());
}

TEST(NumericLiteralTest, SplitsFractionLiteral) {
    std::optional<NumericLiteral> parts = splitNumericLiteral("3/4");
    ASSERT_TRUE(parts.has_value());
    EXPECT_FALSE(parts->isNegative);
    EXPECT_EQ(parts->integerDigits, "3");
    EXPECT_EQ(parts->denominatorDigits, "4");
}

TEST(NumericLiteralTest, RejectsMalformedLiterals) {
    for (const std::string& literal : { "", "-", ".", "1e", "1e+", "1.2.3", "/4", "3/", "3/4/5", "abc", "1x" }) {
        EXPECT_FALSE(splitNumericLiteral(literal).has_value()) << literal;
    }
}

TEST(DoubleFieldTest, ParsesLiterals) {
    EXPECT_DOUBLE_EQ(*FieldTraits<double>::fromLiteral("0.25"), 0.25);
    EXPECT_DOUBLE_EQ(*FieldTraits<double>::fromLiteral("-1.5e2"), -150.0);
    EXPECT_DOUBLE_EQ(*FieldTraits<double>::fromLiteral(".5"), 0.5);
    EXPECT_DOUBLE_EQ(*FieldTraits<double>::fromLiteral("1/4"), 0.25);
    EXPECT_FALSE(FieldTraits<double>::fromLiteral("1/0").has_value());
    EXPECT_FALSE(FieldTraits<double>::fromLiteral("1e999").has_value());
}

TEST(DoubleFieldTest, ToStringReadsBack) {
    for (double value : { 0.1, -2.5, 1.0 / 3.0, 1e-7, 123456789.0 }) {
        std::optional<double> parsed = FieldTraits<double>::fromLiteral(FieldTraits<double>::toString(value));
        ASSERT_TRUE(parsed.has_value()) << FieldTraits<double>::toString(value);
        EXPECT_EQ(*parsed, value);
    }
}

TEST(DoubleFieldTest, DivisionByZeroThrows) {
    EXPECT_THROW(divide(1.0, 0.0), NumericError);
    EXPECT_THROW(divide(0.0, 0.0), NumericError);
    EXPECT_NEAR(divide(1.0, 4.0), 0.25, Epsilon);
}

TEST(DoubleFieldTest, CheckFiniteThrowsOnOverflow) {
    double huge = std::numeric_limits<double>::max();
    EXPECT_THROW(checkFinite(huge * 2.0, "test"), NumericError);
    EXPECT_THROW(divide(huge, 0.5), NumericError);
    EXPECT_NO_THROW(checkFinite(huge, "test"));
}

TEST(RationalFieldTest, ParsesLiteralsExactly) {
    EXPECT_EQ(*FieldTraits<Rational>::fromLiteral("0.1"), Rational(1, 10));
    EXPECT_EQ(*FieldTraits<Rational>::fromLiteral("-2.5e-1"), Rational(-1, 4));
    EXPECT_EQ(*FieldTraits<Rational>::fromLiteral("6/8"), Rational(3, 4));
    EXPECT_EQ(*FieldTraits<Rational>::fromLiteral("-6/8"), Rational(-3, 4));
    EXPECT_EQ(*FieldTraits<Rational>::fromLiteral("12e2"), Rational(1200));
    EXPECT_FALSE(FieldTraits<Rational>::fromLiteral("1/0").has_value());
}

TEST(RationalFieldTest, ToStringReadsBack) {
    for (const Rational& value : { Rational(1, 3), Rational(-7, 2), Rational(0), Rational(42) }) {
        std::optional<Rational> parsed = FieldTraits<Rational>::fromLiteral(FieldTraits<Rational>::toString(value));
        ASSERT_TRUE(parsed.has_value());
        EXPECT_EQ(*parsed, value);
    }
}

TEST(RationalFieldTest, ArithmeticIsExact) {
    Rational third = divide(FieldTraits<Rational>::one(), FieldTraits<Rational>::fromInteger(3));
    Rational sum = third + third + third;
    EXPECT_EQ(sum, FieldTraits<Rational>::one());
    EXPECT_THROW(divide(third, FieldTraits<Rational>::zero()), NumericError);
}

TEST(RationalFieldTest, FromDoubleIsExact) {
    EXPECT_EQ(FieldTraits<Rational>::fromDouble(0.75), Rational(3, 4));
    EXPECT_THROW(FieldTraits<Rational>::fromDouble(std::numeric_limits<double>::infinity()), NumericError);
}

TEST(RationalFieldTest, ApproximateRoundsToDouble) {
    Rational third(1, 3);
    Rational approximated = FieldTraits<Rational>::approximate(third);
    EXPECT_EQ(approximated.get_d(), 1.0 / 3.0);
    EXPECT_NE(approximated, third);
    EXPECT_EQ(FieldTraits<Rational>::approximate(Rational(1, 4)), Rational(1, 4));
}

TEST(FieldHelpersTest, AbsoluteValueAndSign) {
    EXPECT_EQ(absoluteValue(-2.0), 2.0);
    EXPECT_EQ(absoluteValue(Rational(-1, 2)), Rational(1, 2));
    EXPECT_EQ(signOf(-3.0), -1);
    EXPECT_EQ(signOf(0.0), 0);
    EXPECT_EQ(signOf(Rational(1, 5)), 1);
}

TEST(FieldHelpersTest, ClampToInterval) {
    EXPECT_EQ(clampToInterval(2.0, -1.0, 1.0), 1.0);
    EXPECT_EQ(clampToInterval(-2.0, -1.0, 1.0), -1.0);
    EXPECT_EQ(clampToInterval(Rational(1, 2), Rational(0), Rational(1)), Rational(1, 2));
}

TEST(FieldHelpersTest, FormatFixed) {
    EXPECT_EQ(formatFixed(0.5, 3), "0.500");
    EXPECT_EQ(formatFixed(Rational(1, 3), 4), "0.3333");
}

TEST(LinearSystemTest, SolvesRationalSystemExactly) {
    // x + y = 3, x - y = 1
    std::vector<std::vector<Rational>> augmented = {
        { Rational(1), Rational(1), Rational(3) },
        { Rational(1), Rational(-1), Rational(1) }
    };

    std::optional<std::vector<Rational>> solution = solveLinearSystem(augmented);
    ASSERT_TRUE(solution.has_value());
    EXPECT_EQ((*solution)[0], Rational(2));
    EXPECT_EQ((*solution)[1], Rational(1));
}

TEST(LinearSystemTest, DetectsSingularSystem) {
    std::vector<std::vector<double>> augmented = {
        { 1.0, 2.0, 3.0 },
        { 2.0, 4.0, 6.0 }
    };
    EXPECT_FALSE(solveLinearSystem(augmented).has_value());
}

TEST(StringUtilsTest, ParsesWholeStringsOnly) {
    EXPECT_EQ(parseInt("42"), 42);
    EXPECT_FALSE(parseInt("42abc").has_value());
    EXPECT_EQ(parseUnsigned("18446744073709551615"), 18446744073709551615ULL);
    EXPECT_FALSE(parseUnsigned("-1").has_value());
    EXPECT_FALSE(parseDouble("").has_value());
    EXPECT_EQ(trim("  a b \n"), "a b");
    EXPECT_EQ(toLower("RaTiOnAl"), "rational");
}
