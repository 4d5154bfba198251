#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <cstddef>
#include <stdexcept>
#include <string>

struct SourceLocation {
    // Byte offset into the input, starting at 0
    std::size_t offset;

    // Line and column, starting at 1
    std::size_t line;
    std::size_t column;

    bool operator==(const SourceLocation&) const = default;
};

struct ParseError {
    SourceLocation location;
    std::string message;

    std::string toString() const;
};

struct ValidationError {
    std::string message;
};

// Thrown by the checked field operations on division by zero or a non-finite result
class NumericError : public std::runtime_error {
public:
    explicit NumericError(const std::string& message) : std::runtime_error{ message } {}
};

#endif // ERRORS_HPP
