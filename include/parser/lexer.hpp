#ifndef LEXER_HPP
#define LEXER_HPP

#include "util/errors.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <string>
#include <vector>

enum class TokenType : std::uint8_t {
    Number,
    Identifier,
    LeftBracket,
    RightBracket,
    LeftBrace,
    RightBrace,
    LeftParen,
    RightParen,
    Comma,
    Semicolon,
    Plus,
    Minus,
    Star,
    Slash,
    Caret,
    Equals,
    End
};

struct Token {
    TokenType type;

    // Source text of the token (empty for End)
    std::string text;

    SourceLocation location;
};

std::string getTokenDescription(const Token& token);
std::string getTokenTypeName(TokenType type);

// Splits the input into tokens, always ending with an End token.
// Numbers are unsigned; signs and rational slashes are separate tokens.
Result<std::vector<Token>, ParseError> tokenize(const std::string& input);

#endif // LEXER_HPP
