#include <gtest/gtest.h>

#include "game/continuous_game.hpp"
#include "game/game_types.hpp"
#include "numeric/rational.hpp"
#include "parser/game_parser.hpp"
#include "parser/game_writer.hpp"
#include "parser/lexer.hpp"
#include "util/errors.hpp"
#include "util/result.hpp"

#include <string>
#include <variant>
#include <vector>

static constexpr double Epsilon = 1e-12;

TEST(LexerTest, TokenizesMatrixLiteral) {
    Result<std::vector<Token>, ParseError> tokens = tokenize("[[1, -2.5e3]]");
    ASSERT_TRUE(tokens.isValue());

    std::vector<TokenType> expectedTypes = {
        TokenType::LeftBracket,
        TokenType::LeftBracket,
        TokenType::Number,
        TokenType::Comma,
        TokenType::Minus,
        TokenType::Number,
        TokenType::RightBracket,
        TokenType::RightBracket,
        TokenType::End
    };

    const std::vector<Token>& tokenList = tokens.getValue();
    ASSERT_EQ(tokenList.size(), expectedTypes.size());
    for (std::size_t i = 0; i < expectedTypes.size(); ++i) {
        EXPECT_EQ(tokenList[i].type, expectedTypes[i]) << "token " << i;
    }
    EXPECT_EQ(tokenList[5].text, "2.5e3");
    EXPECT_EQ(tokenList[5].location, (SourceLocation{ 6, 1, 7 }));
}

TEST(LexerTest, NumberFollowedByIdentifier) {
    // "2e" is a number times a variable named e, not an incomplete exponent
    Result<std::vector<Token>, ParseError> tokens = tokenize("2e");
    ASSERT_TRUE(tokens.isValue());
    ASSERT_EQ(tokens.getValue().size(), 3);
    EXPECT_EQ(tokens.getValue()[0].text, "2");
    EXPECT_EQ(tokens.getValue()[1].type, TokenType::Identifier);
    EXPECT_EQ(tokens.getValue()[1].text, "e");
}

TEST(LexerTest, ReportsUnexpectedCharacter) {
    Result<std::vector<Token>, ParseError> tokens = tokenize("[[1,\n #]]");
    ASSERT_TRUE(tokens.isError());
    EXPECT_EQ(tokens.getError().location, (SourceLocation{ 6, 2, 2 }));
    EXPECT_EQ(tokens.getError().toString(), "line 2, column 2: Unexpected character '#'.");
}

TEST(LexerTest, ReportsNonASCIICharacters) {
    // U+2212 MINUS SIGN is reported as the whole character
    Result<std::vector<Token>, ParseError> minusSign = tokenize("[[1,\xE2\x88\x92 1],[-1,1]]");
    ASSERT_TRUE(minusSign.isError());
    EXPECT_EQ(minusSign.getError().location.column, 5);
    EXPECT_EQ(minusSign.getError().message, "Unexpected character '\xE2\x88\x92'.");

    // Bytes that do not start a well-formed sequence are shown in hex
    Result<std::vector<Token>, ParseError> truncated = tokenize("[[\xE2\x88");
    ASSERT_TRUE(truncated.isError());
    EXPECT_EQ(truncated.getError().message, "Unexpected byte 0xE2.");

    Result<std::vector<Token>, ParseError> invalid = tokenize("[[\xFF" "1]]");
    ASSERT_TRUE(invalid.isError());
    EXPECT_EQ(invalid.getError().message, "Unexpected byte 0xFF.");

    Result<std::vector<Token>, ParseError> control = tokenize("[[\x01]]");
    ASSERT_TRUE(control.isError());
    EXPECT_EQ(control.getError().message, "Unexpected byte 0x01.");
}

TEST(MatrixParserTest, ParsesBracketForm) {
    Result<PayoffMatrix<double>, ParseError> matrix = parseMatrixLiteral<double>("[[1,-1],[-1,1]]");
    ASSERT_TRUE(matrix.isValue());

    PayoffMatrix<double> expected = { { 1.0, -1.0 }, { -1.0, 1.0 } };
    EXPECT_EQ(matrix.getValue(), expected);
}

TEST(MatrixParserTest, ParsesBraceForm) {
    Result<PayoffMatrix<double>, ParseError> matrix = parseMatrixLiteral<double>("{[1, 2, 3]; [4, 5, 6]}");
    ASSERT_TRUE(matrix.isValue());

    PayoffMatrix<double> expected = { { 1.0, 2.0, 3.0 }, { 4.0, 5.0, 6.0 } };
    EXPECT_EQ(matrix.getValue(), expected);
}

TEST(MatrixParserTest, ParsesRationalLiteralsExactly) {
    Result<PayoffMatrix<Rational>, ParseError> matrix = parseMatrixLiteral<Rational>("[[1/2, -3/4], [0.25, +2e1]]");
    ASSERT_TRUE(matrix.isValue());

    const PayoffMatrix<Rational>& payoffs = matrix.getValue();
    EXPECT_EQ(payoffs[0][0], Rational(1, 2));
    EXPECT_EQ(payoffs[0][1], Rational(-3, 4));
    EXPECT_EQ(payoffs[1][0], Rational(1, 4));
    EXPECT_EQ(payoffs[1][1], Rational(20));
}

TEST(MatrixParserTest, KeepsNonRectangularRows) {
    // Shape is checked when the game is created, not while parsing
    Result<PayoffMatrix<double>, ParseError> matrix = parseMatrixLiteral<double>("[[1, 2], [3]]");
    ASSERT_TRUE(matrix.isValue());
    EXPECT_EQ(matrix.getValue().size(), 2);
    EXPECT_EQ(matrix.getValue()[1].size(), 1);
}

TEST(MatrixParserTest, ReportsErrorLocation) {
    Result<PayoffMatrix<double>, ParseError> matrix = parseMatrixLiteral<double>("[[1, 2],\n [3, x]]");
    ASSERT_TRUE(matrix.isError());

    const ParseError& error = matrix.getError();
    EXPECT_EQ(error.location.offset, 14);
    EXPECT_EQ(error.location.line, 2);
    EXPECT_EQ(error.location.column, 6);
    EXPECT_EQ(error.message, "Expected a number but found identifier \"x\".");
}

TEST(MatrixParserTest, RejectsTrailingInput) {
    Result<PayoffMatrix<double>, ParseError> matrix = parseMatrixLiteral<double>("[[1]] 5");
    ASSERT_TRUE(matrix.isError());
    EXPECT_EQ(matrix.getError().location.column, 7);
    EXPECT_EQ(matrix.getError().message, "Expected end of input but found number 5.");
}

TEST(MatrixParserTest, RejectsMismatchedSeparators) {
    EXPECT_TRUE(parseMatrixLiteral<double>("[[1, 2]; [3, 4]]").isError());
    EXPECT_TRUE(parseMatrixLiteral<double>("{[1, 2], [3, 4]}").isError());
    EXPECT_TRUE(parseMatrixLiteral<double>("[[1, 2], [3, 4]").isError());
    EXPECT_TRUE(parseMatrixLiteral<double>("[[1, 2/]]").isError());
}

TEST(MatrixParserTest, RejectsZeroDenominator) {
    Result<PayoffMatrix<Rational>, ParseError> matrix = parseMatrixLiteral<Rational>("[[1, 3/0]]");
    ASSERT_TRUE(matrix.isError());
    EXPECT_EQ(matrix.getError().location.column, 6);
    EXPECT_EQ(matrix.getError().message, "Invalid numeric literal \"3/0\".");
}

TEST(MatrixParserTest, RoundTripsThroughWriter) {
    for (const std::string& input : { "[[1/2, -3/4], [1/4, 20]]", "{[0.1, 2, 3]; [-4, 5.5e-3, 6]}", "[[7]]" }) {
        Result<PayoffMatrix<Rational>, ParseError> first = parseMatrixLiteral<Rational>(input);
        ASSERT_TRUE(first.isValue()) << input;

        std::string written = formatMatrixLiteral(first.getValue());
        Result<PayoffMatrix<Rational>, ParseError> second = parseMatrixLiteral<Rational>(written);
        ASSERT_TRUE(second.isValue()) << written;
        EXPECT_EQ(first.getValue(), second.getValue()) << written;
    }

    Result<PayoffMatrix<double>, ParseError> floating = parseMatrixLiteral<double>("[[0.1, 1e-7], [1, 2]]");
    ASSERT_TRUE(floating.isValue());
    EXPECT_EQ(formatMatrixLiteral(floating.getValue()), "[[0.1, 1e-07], [1, 2]]");
}

TEST(ContinuousParserTest, ParsesGame) {
    Result<ContinuousGameSpecification<double>, ParseError> specification =
        parseContinuousLiteral<double>("f(x,y) = x^2 - y^2, x in [-1,1], y in [-1,1]");
    ASSERT_TRUE(specification.isValue());

    const ContinuousGameSpecification<double>& game = specification.getValue();
    EXPECT_EQ(game.functionName, "f");
    EXPECT_EQ(game.variableNames[Player::Row], "x");
    EXPECT_EQ(game.variableNames[Player::Column], "y");
    EXPECT_EQ(game.intervals[Player::Row], (Interval<double>{ -1.0, 1.0 }));
    EXPECT_EQ(game.intervals[Player::Column], (Interval<double>{ -1.0, 1.0 }));
    EXPECT_NEAR(game.payoff.evaluate(0.5, 0.25), 0.1875, Epsilon);
}

TEST(ContinuousParserTest, DeclarationsInEitherOrder) {
    Result<ContinuousGameSpecification<double>, ParseError> specification =
        parseContinuousLiteral<double>("payoff(u, v) = u*v, v in [2, 3], u in [0, 1]");
    ASSERT_TRUE(specification.isValue());
    EXPECT_EQ(specification.getValue().intervals[Player::Row], (Interval<double>{ 0.0, 1.0 }));
    EXPECT_EQ(specification.getValue().intervals[Player::Column], (Interval<double>{ 2.0, 3.0 }));
}

TEST(ContinuousParserTest, OperatorPrecedence) {
    Result<ContinuousGameSpecification<double>, ParseError> specification =
        parseContinuousLiteral<double>("f(x,y) = -x^2 + 2*y/4 - (x - y)*3, x in [0,1], y in [0,1]");
    ASSERT_TRUE(specification.isValue());

    // -(4) + 0.5 - (1)*3 at (2, 1)
    EXPECT_NEAR(specification.getValue().payoff.evaluate(2.0, 1.0), -6.5, Epsilon);
}

TEST(ContinuousParserTest, ImplicitMultiplication) {
    Result<ContinuousGameSpecification<double>, ParseError> specification =
        parseContinuousLiteral<double>("g(a,b) = 2a - 3(b + 1) + 0.5a^2, a in [0,1], b in [0,1]");
    ASSERT_TRUE(specification.isValue());

    // 1 - 3.75 + 0.125 at (0.5, 0.25)
    EXPECT_NEAR(specification.getValue().payoff.evaluate(0.5, 0.25), -2.625, Epsilon);
}

TEST(ContinuousParserTest, Functions) {
    Result<ContinuousGameSpecification<double>, ParseError> specification =
        parseContinuousLiteral<double>("h(x,y) = abs(x) - max(y, 0) + min(x, y), x in [-1,1], y in [-1,1]");
    ASSERT_TRUE(specification.isValue());

    const Expression<double>& payoff = specification.getValue().payoff;
    EXPECT_NEAR(payoff.evaluate(-0.5, 0.25), 0.5 - 0.25 - 0.5, Epsilon);
    EXPECT_NEAR(payoff.evaluate(0.75, -0.5), 0.75 - 0.0 - 0.5, Epsilon);
}

TEST(ContinuousParserTest, LimitsNestingDepth) {
    auto parsePayoff = [](const std::string& payoff) {
        return parseContinuousLiteral<double>("f(x,y) = " + payoff + ", x in [0,1], y in [0,1]");
    };

    Result<ContinuousGameSpecification<double>, ParseError> shallow = parsePayoff(std::string(200, '(') + "x" + std::string(200, ')'));
    ASSERT_TRUE(shallow.isValue());
    EXPECT_NEAR(shallow.getValue().payoff.evaluate(0.5, 0.0), 0.5, Epsilon);

    // The 257th parenthesis starts at column 266
    Result<ContinuousGameSpecification<double>, ParseError> deep = parsePayoff(std::string(300, '(') + "x" + std::string(300, ')'));
    ASSERT_TRUE(deep.isError());
    EXPECT_EQ(deep.getError().location.column, 266);
    EXPECT_EQ(deep.getError().message, "Expression is nested too deeply.");

    Result<ContinuousGameSpecification<double>, ParseError> veryDeep = parsePayoff(std::string(200000, '(') + "x" + std::string(200000, ')'));
    ASSERT_TRUE(veryDeep.isError());
    EXPECT_EQ(veryDeep.getError().message, "Expression is nested too deeply.");

    Result<ContinuousGameSpecification<double>, ParseError> negations = parsePayoff(std::string(10, '-') + "x");
    ASSERT_TRUE(negations.isValue());
    EXPECT_NEAR(negations.getValue().payoff.evaluate(0.5, 0.0), 0.5, Epsilon);

    Result<ContinuousGameSpecification<double>, ParseError> longNegations = parsePayoff(std::string(200000, '-') + "x");
    ASSERT_TRUE(longNegations.isError());
    EXPECT_EQ(longNegations.getError().location.column, 266);
    EXPECT_EQ(longNegations.getError().message, "Expression is nested too deeply.");

    std::string nestedCalls;
    for (int i = 0; i < 300; ++i) {
        nestedCalls += "abs(";
    }
    nestedCalls += "x" + std::string(300, ')');
    EXPECT_TRUE(parsePayoff(nestedCalls).isError());
}

TEST(ContinuousParserTest, LongOperatorChains) {
    // Chains are flat in the input but nest in the expression tree
    std::string payoff = "x";
    for (int i = 0; i < 100000; ++i) {
        payoff += " + x";
    }

    Result<ContinuousGameSpecification<double>, ParseError> specification =
        parseContinuousLiteral<double>("f(x,y) = " + payoff + ", x in [0,1], y in [0,1]");
    ASSERT_TRUE(specification.isValue());

    const Expression<double>& expression = specification.getValue().payoff;
    EXPECT_NEAR(expression.evaluate(1.0, 0.0), 100001.0, Epsilon);
    EXPECT_EQ(expression.toString("x", "y"), payoff);
}

TEST(ContinuousParserTest, ReportsUnknownIdentifier) {
    Result<ContinuousGameSpecification<double>, ParseError> specification =
        parseContinuousLiteral<double>("f(x,y) = x + z, x in [0,1], y in [0,1]");
    ASSERT_TRUE(specification.isError());
    EXPECT_EQ(specification.getError().location.line, 1);
    EXPECT_EQ(specification.getError().location.column, 14);
    EXPECT_EQ(specification.getError().message, "Unknown identifier \"z\". Expected x, y, abs, min or max.");
}

TEST(ContinuousParserTest, RejectsInvalidVariables) {
    // Reserved name
    EXPECT_TRUE(parseContinuousLiteral<double>("f(in,y) = y, in in [0,1], y in [0,1]").isError());
    EXPECT_TRUE(parseContinuousLiteral<double>("f(x,abs) = x, x in [0,1], abs in [0,1]").isError());

    // Same name twice
    Result<ContinuousGameSpecification<double>, ParseError> sameName =
        parseContinuousLiteral<double>("f(x,x) = x, x in [0,1], x in [0,1]");
    ASSERT_TRUE(sameName.isError());
    EXPECT_EQ(sameName.getError().location.column, 5);
}

TEST(ContinuousParserTest, RejectsInvalidDeclarations) {
    Result<ContinuousGameSpecification<double>, ParseError> duplicate =
        parseContinuousLiteral<double>("f(x,y) = x, x in [0,1], x in [0,1]");
    ASSERT_TRUE(duplicate.isError());
    EXPECT_EQ(duplicate.getError().message, "Interval of \"x\" is declared twice.");

    Result<ContinuousGameSpecification<double>, ParseError> missingKeyword =
        parseContinuousLiteral<double>("f(x,y) = x, x on [0,1], y in [0,1]");
    ASSERT_TRUE(missingKeyword.isError());
    EXPECT_EQ(missingKeyword.getError().message, "Expected \"in\" but found identifier \"on\".");

    Result<ContinuousGameSpecification<double>, ParseError> missingDeclaration =
        parseContinuousLiteral<double>("f(x,y) = x, x in [0,1]");
    ASSERT_TRUE(missingDeclaration.isError());
    EXPECT_EQ(missingDeclaration.getError().message, "Expected ',' but found end of input.");

    EXPECT_TRUE(parseContinuousLiteral<double>("f(x,y) = x, x in [0,1], z in [0,1]").isError());
}

TEST(ContinuousParserTest, RejectsInvalidExponents) {
    EXPECT_TRUE(parseContinuousLiteral<double>("f(x,y) = x^2.5, x in [0,1], y in [0,1]").isError());
    EXPECT_TRUE(parseContinuousLiteral<double>("f(x,y) = x^65, x in [0,1], y in [0,1]").isError());
    EXPECT_TRUE(parseContinuousLiteral<double>("f(x,y) = x^y, x in [0,1], y in [0,1]").isError());
    EXPECT_TRUE(parseContinuousLiteral<double>("f(x,y) = x^64, x in [0,1], y in [0,1]").isValue());
}

TEST(ContinuousParserTest, RoundTripsThroughWriter) {
    Result<ContinuousGameSpecification<double>, ParseError> first =
        parseContinuousLiteral<double>("f(x,y) = x^2 - y^2, x in [-1,1], y in [-1,1]");
    ASSERT_TRUE(first.isValue());

    std::string written = formatContinuousGame(first.getValue());
    EXPECT_EQ(written, "f(x, y) = x^2 - y^2, x in [-1, 1], y in [-1, 1]");

    for (const std::string& input : {
        "f(x,y) = -(x - 1/3)^2 + 2(x*y) - y/(2 + x), x in [0,1], y in [-1,1]",
        "p(s, t) = abs(s - t) - 3 - -s + max(s, t)*min(s, -t), s in [-2, 2], t in [1/2, 3/2]"
    }) {
        Result<ContinuousGameSpecification<Rational>, ParseError> parsed = parseContinuousLiteral<Rational>(input);
        ASSERT_TRUE(parsed.isValue()) << input;

        std::string text = formatContinuousGame(parsed.getValue());
        Result<ContinuousGameSpecification<Rational>, ParseError> reparsed = parseContinuousLiteral<Rational>(text);
        ASSERT_TRUE(reparsed.isValue()) << text;

        EXPECT_EQ(reparsed.getValue().intervals[Player::Row], parsed.getValue().intervals[Player::Row]);
        EXPECT_EQ(reparsed.getValue().intervals[Player::Column], parsed.getValue().intervals[Player::Column]);
        for (const Rational& x : { Rational(0), Rational(1, 3), Rational(-7, 5) }) {
            for (const Rational& y : { Rational(1), Rational(-2, 3) }) {
                EXPECT_EQ(reparsed.getValue().payoff.evaluate(x, y), parsed.getValue().payoff.evaluate(x, y)) << text;
            }
        }
    }
}

TEST(GameSpecificationParserTest, DetectsGameKind) {
    Result<GameSpecification<double>, ParseError> matrix = parseGameSpecification<double>("[[1, 2], [3, 4]]");
    ASSERT_TRUE(matrix.isValue());
    EXPECT_TRUE(std::holds_alternative<PayoffMatrix<double>>(matrix.getValue()));

    Result<GameSpecification<double>, ParseError> continuous =
        parseGameSpecification<double>("f(x,y) = x*y, x in [0,1], y in [0,1]");
    ASSERT_TRUE(continuous.isValue());
    EXPECT_TRUE(std::holds_alternative<ContinuousGameSpecification<double>>(continuous.getValue()));

    Result<GameSpecification<double>, ParseError> invalid = parseGameSpecification<double>("5");
    ASSERT_TRUE(invalid.isError());
    EXPECT_EQ(invalid.getError().location, (SourceLocation{ 0, 1, 1 }));
}
