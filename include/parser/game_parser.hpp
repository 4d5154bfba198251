#ifndef GAME_PARSER_HPP
#define GAME_PARSER_HPP

#include "game/continuous_game.hpp"
#include "game/expression.hpp"
#include "game/game_types.hpp"
#include "numeric/field.hpp"
#include "parser/lexer.hpp"
#include "util/errors.hpp"
#include "util/result.hpp"

#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

template <typename T>
using GameSpecification = std::variant<PayoffMatrix<T>, ContinuousGameSpecification<T>>;

// Recursive descent parser for game specifications:
//
//   specification := matrix | continuous
//   matrix        := "[" [row {"," row}] "]" | "{" [row {";" row}] "}"
//   row           := "[" [number {"," number}] "]"
//   number        := ["+" | "-"] NUMBER ["/" NUMBER]
//   continuous    := IDENT "(" IDENT "," IDENT ")" "=" expression declaration declaration
//   declaration   := "," IDENT "in" "[" number "," number "]"
//   expression    := term {("+" | "-") term}
//   term          := unary {("*" | "/") unary | implicit-product}
//   unary         := ("-" | "+") unary | power
//   power         := primary ["^" NUMBER]
//   primary       := NUMBER | IDENT | IDENT "(" expression ["," expression] ")" | "(" expression ")"
//
// Parsing stops at the first error.
template <NumericField T>
class GameParser {
public:
    explicit GameParser(std::vector<Token> tokens) : m_tokens{ std::move(tokens) }, m_position{ 0 }, m_expression{ nullptr }, m_depth{ 0 } {}

    Result<GameSpecification<T>, ParseError> parseSpecification() {
        if (check(TokenType::LeftBracket) || check(TokenType::LeftBrace)) {
            Result<PayoffMatrix<T>, ParseError> matrix = parseMatrixGame();
            if (matrix.isError()) {
                return matrix.getError();
            }
            return GameSpecification<T>{ std::in_place_index<0>, std::move(matrix.getValue()) };
        }

        if (check(TokenType::Identifier)) {
            Result<ContinuousGameSpecification<T>, ParseError> continuous = parseContinuousGame();
            if (continuous.isError()) {
                return continuous.getError();
            }
            return GameSpecification<T>{ std::in_place_index<1>, std::move(continuous.getValue()) };
        }

        return makeError(peek(), "Expected a matrix literal or a payoff function definition but found " + getTokenDescription(peek()) + ".");
    }

    Result<PayoffMatrix<T>, ParseError> parseMatrixGame() {
        bool isBraceForm = check(TokenType::LeftBrace);
        TokenType open = isBraceForm ? TokenType::LeftBrace : TokenType::LeftBracket;
        TokenType close = isBraceForm ? TokenType::RightBrace : TokenType::RightBracket;
        TokenType separator = isBraceForm ? TokenType::Semicolon : TokenType::Comma;

        if (std::optional<ParseError> error = expect(open)) {
            return *error;
        }

        PayoffMatrix<T> matrix;
        if (!check(close)) {
            do {
                Result<std::vector<T>, ParseError> row = parseRow();
                if (row.isError()) {
                    return row.getError();
                }
                matrix.push_back(std::move(row.getValue()));
            } while (match(separator));
        }

        if (std::optional<ParseError> error = expect(close)) {
            return *error;
        }
        if (std::optional<ParseError> error = expect(TokenType::End)) {
            return *error;
        }

        return matrix;
    }

    Result<ContinuousGameSpecification<T>, ParseError> parseContinuousGame() {
        ContinuousGameSpecification<T> specification;

        const Token& functionToken = peek();
        if (std::optional<ParseError> error = expect(TokenType::Identifier)) {
            return *error;
        }
        specification.functionName = functionToken.text;

        if (std::optional<ParseError> error = expect(TokenType::LeftParen)) {
            return *error;
        }

        for (Player player : { Player::Row, Player::Column }) {
            if (player == Player::Column) {
                if (std::optional<ParseError> error = expect(TokenType::Comma)) {
                    return *error;
                }
            }

            const Token& variableToken = peek();
            if (std::optional<ParseError> error = expect(TokenType::Identifier)) {
                return *error;
            }
            if (isReservedName(variableToken.text)) {
                return makeError(variableToken, "\"" + variableToken.text + "\" is reserved and cannot name a variable.");
            }
            if (player == Player::Column && variableToken.text == specification.variableNames[Player::Row]) {
                return makeError(variableToken, "Both variables are named \"" + variableToken.text + "\".");
            }
            specification.variableNames[player] = variableToken.text;
        }

        if (std::optional<ParseError> error = expect(TokenType::RightParen)) {
            return *error;
        }
        if (std::optional<ParseError> error = expect(TokenType::Equals)) {
            return *error;
        }

        m_variableNames = specification.variableNames;
        m_expression = &specification.payoff;
        Result<std::size_t, ParseError> root = parseExpression();
        m_expression = nullptr;
        if (root.isError()) {
            return root.getError();
        }

        PlayerArray<bool> isDeclared{ false, false };
        for (int i = 0; i < 2; ++i) {
            if (std::optional<ParseError> error = expect(TokenType::Comma)) {
                return *error;
            }

            const Token& variableToken = peek();
            if (std::optional<ParseError> error = expect(TokenType::Identifier)) {
                return *error;
            }

            std::optional<Player> player;
            for (Player candidate : { Player::Row, Player::Column }) {
                if (variableToken.text == specification.variableNames[candidate]) {
                    player = candidate;
                }
            }
            if (!player) {
                return makeError(variableToken, "\"" + variableToken.text + "\" is not a variable of " + specification.functionName + ".");
            }
            if (isDeclared[*player]) {
                return makeError(variableToken, "Interval of \"" + variableToken.text + "\" is declared twice.");
            }

            const Token& keywordToken = peek();
            if (keywordToken.type != TokenType::Identifier || keywordToken.text != "in") {
                return makeError(keywordToken, "Expected \"in\" but found " + getTokenDescription(keywordToken) + ".");
            }
            advance();

            Result<Interval<T>, ParseError> interval = parseInterval();
            if (interval.isError()) {
                return interval.getError();
            }

            specification.intervals[*player] = interval.getValue();
            isDeclared[*player] = true;
        }

        if (std::optional<ParseError> error = expect(TokenType::End)) {
            return *error;
        }

        return specification;
    }

private:
    static constexpr std::size_t MaxExponent = 64;

    // Limit on parentheses, function calls and unary signs nested inside each other
    static constexpr std::size_t MaxNestingDepth = 256;

    static bool isReservedName(const std::string& name) {
        return name == "abs" || name == "min" || name == "max" || name == "in";
    }

    const Token& peek() const {
        return m_tokens[m_position];
    }

    bool check(TokenType type) const {
        return peek().type == type;
    }

    void advance() {
        if (peek().type != TokenType::End) {
            ++m_position;
        }
    }

    bool match(TokenType type) {
        if (!check(type)) {
            return false;
        }
        advance();
        return true;
    }

    std::optional<ParseError> expect(TokenType type) {
        if (!check(type)) {
            return makeError(peek(), "Expected " + getTokenTypeName(type) + " but found " + getTokenDescription(peek()) + ".");
        }
        advance();
        return std::nullopt;
    }

    static ParseError makeError(const Token& token, const std::string& message) {
        return ParseError{ token.location, message };
    }

    Result<std::vector<T>, ParseError> parseRow() {
        if (std::optional<ParseError> error = expect(TokenType::LeftBracket)) {
            return *error;
        }

        std::vector<T> row;
        if (!check(TokenType::RightBracket)) {
            do {
                Result<T, ParseError> value = parseNumber();
                if (value.isError()) {
                    return value.getError();
                }
                row.push_back(value.getValue());
            } while (match(TokenType::Comma));
        }

        if (std::optional<ParseError> error = expect(TokenType::RightBracket)) {
            return *error;
        }
        return row;
    }

    Result<T, ParseError> parseNumber() {
        const Token& startToken = peek();
        std::string literal;

        if (check(TokenType::Plus) || check(TokenType::Minus)) {
            literal = peek().text;
            advance();
        }

        if (!check(TokenType::Number)) {
            return makeError(peek(), "Expected a number but found " + getTokenDescription(peek()) + ".");
        }
        literal += peek().text;
        advance();

        if (match(TokenType::Slash)) {
            if (!check(TokenType::Number)) {
                return makeError(peek(), "Expected a denominator but found " + getTokenDescription(peek()) + ".");
            }
            literal += "/" + peek().text;
            advance();
        }

        std::optional<T> value = FieldTraits<T>::fromLiteral(literal);
        if (!value) {
            return makeError(startToken, "Invalid numeric literal \"" + literal + "\".");
        }
        return *value;
    }

    Result<Interval<T>, ParseError> parseInterval() {
        if (std::optional<ParseError> error = expect(TokenType::LeftBracket)) {
            return *error;
        }

        Result<T, ParseError> lower = parseNumber();
        if (lower.isError()) {
            return lower.getError();
        }

        if (std::optional<ParseError> error = expect(TokenType::Comma)) {
            return *error;
        }

        Result<T, ParseError> upper = parseNumber();
        if (upper.isError()) {
            return upper.getError();
        }

        if (std::optional<ParseError> error = expect(TokenType::RightBracket)) {
            return *error;
        }

        return Interval<T>{ lower.getValue(), upper.getValue() };
    }

    Result<std::size_t, ParseError> parseExpression() {
        Result<std::size_t, ParseError> lhs = parseTerm();
        if (lhs.isError()) {
            return lhs.getError();
        }

        std::size_t node = lhs.getValue();
        while (check(TokenType::Plus) || check(TokenType::Minus)) {
            ExpressionNodeType type = check(TokenType::Plus) ? ExpressionNodeType::Add : ExpressionNodeType::Subtract;
            advance();

            Result<std::size_t, ParseError> rhs = parseTerm();
            if (rhs.isError()) {
                return rhs.getError();
            }
            node = m_expression->addBinary(type, node, rhs.getValue());
        }

        return node;
    }

    Result<std::size_t, ParseError> parseTerm() {
        // A number directly followed by a variable or parenthesis is a product, as in "2x" or "3(x + y)"
        bool isNumberFactor = check(TokenType::Number);

        Result<std::size_t, ParseError> lhs = parseUnary();
        if (lhs.isError()) {
            return lhs.getError();
        }

        std::size_t node = lhs.getValue();
        while (true) {
            ExpressionNodeType type;
            if (check(TokenType::Star) || check(TokenType::Slash)) {
                type = check(TokenType::Star) ? ExpressionNodeType::Multiply : ExpressionNodeType::Divide;
                advance();
                isNumberFactor = check(TokenType::Number);
            }
            else if (isNumberFactor && (check(TokenType::Identifier) || check(TokenType::LeftParen))) {
                type = ExpressionNodeType::Multiply;
                isNumberFactor = false;
            }
            else {
                break;
            }

            Result<std::size_t, ParseError> rhs = parseUnary();
            if (rhs.isError()) {
                return rhs.getError();
            }
            node = m_expression->addBinary(type, node, rhs.getValue());
        }

        return node;
    }

    Result<std::size_t, ParseError> parseUnary() {
        if (check(TokenType::Minus) || check(TokenType::Plus)) {
            bool isNegation = check(TokenType::Minus);
            if (std::optional<ParseError> error = enterNesting()) {
                return *error;
            }
            advance();

            Result<std::size_t, ParseError> operand = parseUnary();
            --m_depth;
            if (operand.isError() || !isNegation) {
                return operand;
            }
            return m_expression->addUnary(ExpressionNodeType::Negate, operand.getValue());
        }

        return parsePower();
    }

    std::optional<ParseError> enterNesting() {
        if (m_depth >= MaxNestingDepth) {
            return makeError(peek(), "Expression is nested too deeply.");
        }
        ++m_depth;
        return std::nullopt;
    }

    Result<std::size_t, ParseError> parsePower() {
        Result<std::size_t, ParseError> base = parsePrimary();
        if (base.isError() || !match(TokenType::Caret)) {
            return base;
        }

        const Token& exponentToken = peek();
        std::optional<int> exponent;
        if (exponentToken.type == TokenType::Number && exponentToken.text.find_first_not_of("0123456789") == std::string::npos) {
            exponent = parseInt(exponentToken.text);
        }
        if (!exponent || *exponent < 0 || static_cast<std::size_t>(*exponent) > MaxExponent) {
            return makeError(exponentToken, "Exponent must be an integer between 0 and " + std::to_string(MaxExponent) + ".");
        }
        advance();

        return m_expression->addPower(base.getValue(), static_cast<std::size_t>(*exponent));
    }

    Result<std::size_t, ParseError> parsePrimary() {
        const Token& token = peek();

        switch (token.type) {
            case TokenType::Number: {
                std::optional<T> value = FieldTraits<T>::fromLiteral(token.text);
                if (!value) {
                    return makeError(token, "Invalid numeric literal \"" + token.text + "\".");
                }
                advance();
                return m_expression->addConstant(*value);
            }
            case TokenType::Identifier: {
                if (token.text == m_variableNames[Player::Row]) {
                    advance();
                    return m_expression->addVariableX();
                }
                if (token.text == m_variableNames[Player::Column]) {
                    advance();
                    return m_expression->addVariableY();
                }
                if (token.text == "abs" || token.text == "min" || token.text == "max") {
                    if (std::optional<ParseError> error = enterNesting()) {
                        return *error;
                    }
                    Result<std::size_t, ParseError> call = parseFunctionCall();
                    --m_depth;
                    return call;
                }
                return makeError(
                    token,
                    "Unknown identifier \"" + token.text + "\". Expected " + m_variableNames[Player::Row] + ", "
                    + m_variableNames[Player::Column] + ", abs, min or max."
                );
            }
            case TokenType::LeftParen: {
                if (std::optional<ParseError> error = enterNesting()) {
                    return *error;
                }
                advance();
                Result<std::size_t, ParseError> inner = parseExpression();
                --m_depth;
                if (inner.isError()) {
                    return inner;
                }
                if (std::optional<ParseError> error = expect(TokenType::RightParen)) {
                    return *error;
                }
                return inner;
            }
            default:
                return makeError(token, "Expected an expression but found " + getTokenDescription(token) + ".");
        }
    }

    Result<std::size_t, ParseError> parseFunctionCall() {
        const Token& nameToken = peek();
        advance();

        bool isUnary = (nameToken.text == "abs");

        if (std::optional<ParseError> error = expect(TokenType::LeftParen)) {
            return *error;
        }

        Result<std::size_t, ParseError> first = parseExpression();
        if (first.isError()) {
            return first;
        }

        std::size_t node;
        if (isUnary) {
            node = m_expression->addUnary(ExpressionNodeType::Abs, first.getValue());
        }
        else {
            if (std::optional<ParseError> error = expect(TokenType::Comma)) {
                return *error;
            }

            Result<std::size_t, ParseError> second = parseExpression();
            if (second.isError()) {
                return second;
            }

            ExpressionNodeType type = (nameToken.text == "min") ? ExpressionNodeType::Min : ExpressionNodeType::Max;
            node = m_expression->addBinary(type, first.getValue(), second.getValue());
        }

        if (std::optional<ParseError> error = expect(TokenType::RightParen)) {
            return *error;
        }
        return node;
    }

    std::vector<Token> m_tokens;
    std::size_t m_position;

    // State while parsing a payoff expression
    PlayerArray<std::string> m_variableNames;
    Expression<T>* m_expression;
    std::size_t m_depth;
};

template <NumericField T>
Result<GameSpecification<T>, ParseError> parseGameSpecification(const std::string& input) {
    Result<std::vector<Token>, ParseError> tokens = tokenize(input);
    if (tokens.isError()) {
        return tokens.getError();
    }

    GameParser<T> parser(std::move(tokens.getValue()));
    return parser.parseSpecification();
}

template <NumericField T>
Result<PayoffMatrix<T>, ParseError> parseMatrixLiteral(const std::string& input) {
    Result<std::vector<Token>, ParseError> tokens = tokenize(input);
    if (tokens.isError()) {
        return tokens.getError();
    }

    GameParser<T> parser(std::move(tokens.getValue()));
    return parser.parseMatrixGame();
}

template <NumericField T>
Result<ContinuousGameSpecification<T>, ParseError> parseContinuousLiteral(const std::string& input) {
    Result<std::vector<Token>, ParseError> tokens = tokenize(input);
    if (tokens.isError()) {
        return tokens.getError();
    }

    GameParser<T> parser(std::move(tokens.getValue()));
    return parser.parseContinuousGame();
}

#endif // GAME_PARSER_HPP
