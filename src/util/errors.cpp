#include "util/errors.hpp"

#include <string>

std::string ParseError::toString() const {
    return "line " + std::to_string(location.line) + ", column " + std::to_string(location.column) + ": " + message;
}
