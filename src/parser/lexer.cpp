#include "parser/lexer.hpp"

#include "util/errors.hpp"
#include "util/result.hpp"

#include <cassert>
#include <cctype>
#include <cstddef>
#include <iomanip>
#include <sstream>
#include <string>
#include <vector>

namespace {
bool isDigit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

bool isIdentifierStart(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) != 0 || c == '_';
}

bool isIdentifierPart(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
}

class Lexer {
public:
    explicit Lexer(const std::string& input) : m_input{ input }, m_position{ 0 }, m_line{ 1 }, m_column{ 1 } {}

    Result<std::vector<Token>, ParseError> run() {
        std::vector<Token> tokens;

        while (true) {
            skipWhitespace();

            SourceLocation location = getLocation();
            if (isAtEnd()) {
                tokens.push_back(Token{ TokenType::End, "", location });
                return tokens;
            }

            char c = peek();
            if (isDigit(c) || (c == '.' && isDigit(peek(1)))) {
                tokens.push_back(Token{ TokenType::Number, readNumber(), location });
                continue;
            }

            if (isIdentifierStart(c)) {
                std::size_t start = m_position;
                while (!isAtEnd() && isIdentifierPart(peek())) {
                    advance();
                }
                tokens.push_back(Token{ TokenType::Identifier, m_input.substr(start, m_position - start), location });
                continue;
            }

            TokenType type;
            switch (c) {
                case '[': type = TokenType::LeftBracket; break;
                case ']': type = TokenType::RightBracket; break;
                case '{': type = TokenType::LeftBrace; break;
                case '}': type = TokenType::RightBrace; break;
                case '(': type = TokenType::LeftParen; break;
                case ')': type = TokenType::RightParen; break;
                case ',': type = TokenType::Comma; break;
                case ';': type = TokenType::Semicolon; break;
                case '+': type = TokenType::Plus; break;
                case '-': type = TokenType::Minus; break;
                case '*': type = TokenType::Star; break;
                case '/': type = TokenType::Slash; break;
                case '^': type = TokenType::Caret; break;
                case '=': type = TokenType::Equals; break;
                default:
                    return ParseError{ location, "Unexpected " + describeCharacter() + "." };
            }

            advance();
            tokens.push_back(Token{ type, std::string(1, c), location });
        }
    }

private:
    // Multi-byte characters are shown whole so that messages stay valid UTF-8, stray bytes in hex
    std::string describeCharacter() const {
        unsigned char lead = static_cast<unsigned char>(peek());
        if (lead < 0x80 && std::isprint(lead)) {
            return "character '" + std::string(1, static_cast<char>(lead)) + "'";
        }

        std::size_t length = getUTF8SequenceLength();
        if (length > 0) {
            return "character '" + m_input.substr(m_position, length) + "'";
        }

        std::ostringstream description;
        description << "byte 0x" << std::hex << std::uppercase << std::setw(2) << std::setfill('0') << static_cast<int>(lead);
        return description.str();
    }

    // Length of the well-formed UTF-8 sequence starting at the current position, 0 if there is none
    std::size_t getUTF8SequenceLength() const {
        unsigned char lead = static_cast<unsigned char>(peek());

        std::size_t length;
        unsigned char secondMin = 0x80;
        unsigned char secondMax = 0xBF;
        if (lead >= 0xC2 && lead <= 0xDF) {
            length = 2;
        }
        else if (lead >= 0xE0 && lead <= 0xEF) {
            length = 3;
            if (lead == 0xE0) {
                secondMin = 0xA0;
            }
            if (lead == 0xED) {
                secondMax = 0x9F;
            }
        }
        else if (lead >= 0xF0 && lead <= 0xF4) {
            length = 4;
            if (lead == 0xF0) {
                secondMin = 0x90;
            }
            if (lead == 0xF4) {
                secondMax = 0x8F;
            }
        }
        else {
            return 0;
        }

        if (m_position + length > m_input.size()) {
            return 0;
        }

        for (std::size_t i = 1; i < length; ++i) {
            unsigned char byte = static_cast<unsigned char>(m_input[m_position + i]);
            unsigned char minimum = (i == 1) ? secondMin : 0x80;
            unsigned char maximum = (i == 1) ? secondMax : 0xBF;
            if (byte < minimum || byte > maximum) {
                return 0;
            }
        }
        return length;
    }

    bool isAtEnd() const {
        return m_position >= m_input.size();
    }

    char peek(std::size_t lookahead = 0) const {
        std::size_t index = m_position + lookahead;
        return (index < m_input.size()) ? m_input[index] : '\0';
    }

    void advance() {
        assert(!isAtEnd());
        if (m_input[m_position] == '\n') {
            ++m_line;
            m_column = 1;
        }
        else {
            ++m_column;
        }
        ++m_position;
    }

    void skipWhitespace() {
        while (!isAtEnd() && std::isspace(static_cast<unsigned char>(peek()))) {
            advance();
        }
    }

    SourceLocation getLocation() const {
        return SourceLocation{ m_position, m_line, m_column };
    }

    // digits [. digits] [(e|E) [+|-] digits]
    std::string readNumber() {
        std::size_t start = m_position;

        while (isDigit(peek())) {
            advance();
        }

        if (peek() == '.') {
            advance();
            while (isDigit(peek())) {
                advance();
            }
        }

        // Only an exponent if digits follow, so "2e" stays a number times an identifier
        if (peek() == 'e' || peek() == 'E') {
            bool hasSign = (peek(1) == '+' || peek(1) == '-');
            if (isDigit(peek(hasSign ? 2 : 1))) {
                advance();
                if (hasSign) {
                    advance();
                }
                while (isDigit(peek())) {
                    advance();
                }
            }
        }

        return m_input.substr(start, m_position - start);
    }

    const std::string& m_input;
    std::size_t m_position;
    std::size_t m_line;
    std::size_t m_column;
};
} // namespace

std::string getTokenTypeName(TokenType type) {
    switch (type) {
        case TokenType::Number: return "number";
        case TokenType::Identifier: return "identifier";
        case TokenType::LeftBracket: return "'['";
        case TokenType::RightBracket: return "']'";
        case TokenType::LeftBrace: return "'{'";
        case TokenType::RightBrace: return "'}'";
        case TokenType::LeftParen: return "'('";
        case TokenType::RightParen: return "')'";
        case TokenType::Comma: return "','";
        case TokenType::Semicolon: return "';'";
        case TokenType::Plus: return "'+'";
        case TokenType::Minus: return "'-'";
        case TokenType::Star: return "'*'";
        case TokenType::Slash: return "'/'";
        case TokenType::Caret: return "'^'";
        case TokenType::Equals: return "'='";
        case TokenType::End: return "end of input";
        default:
            assert(false);
            return "";
    }
}

std::string getTokenDescription(const Token& token) {
    switch (token.type) {
        case TokenType::Number:
            return "number " + token.text;
        case TokenType::Identifier:
            return "identifier \"" + token.text + "\"";
        default:
            return getTokenTypeName(token.type);
    }
}

Result<std::vector<Token>, ParseError> tokenize(const std::string& input) {
    Lexer lexer(input);
    return lexer.run();
}
