#include "numeric/field.hpp"

#include <cctype>
#include <charconv>
#include <cmath>
#include <cstddef>
#include <optional>
#include <string>
#include <system_error>

namespace {
constexpr int MaxExponentMagnitude = 100000;

bool isDigit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

std::string readDigits(const std::string& input, std::size_t& position) {
    std::size_t start = position;
    while (position < input.size() && isDigit(input[position])) {
        ++position;
    }
    return input.substr(start, position - start);
}
} // namespace

std::optional<NumericLiteral> splitNumericLiteral(const std::string& literal) {
    NumericLiteral parts{ .isNegative = false, .integerDigits = "", .fractionDigits = "", .exponent = 0, .denominatorDigits = "" };

    std::size_t position = 0;
    if (position < literal.size() && (literal[position] == '+' || literal[position] == '-')) {
        parts.isNegative = (literal[position] == '-');
        ++position;
    }

    parts.integerDigits = readDigits(literal, position);

    if (position < literal.size() && literal[position] == '/') {
        ++position;
        if (parts.integerDigits.empty()) {
            return std::nullopt;
        }

        parts.denominatorDigits = readDigits(literal, position);
        if (parts.denominatorDigits.empty() || position != literal.size()) {
            return std::nullopt;
        }
        return parts;
    }

    if (position < literal.size() && literal[position] == '.') {
        ++position;
        parts.fractionDigits = readDigits(literal, position);
    }

    if (parts.integerDigits.empty() && parts.fractionDigits.empty()) {
        return std::nullopt;
    }

    if (position < literal.size() && (literal[position] == 'e' || literal[position] == 'E')) {
        ++position;

        bool isExponentNegative = false;
        if (position < literal.size() && (literal[position] == '+' || literal[position] == '-')) {
            isExponentNegative = (literal[position] == '-');
            ++position;
        }

        std::string exponentDigits = readDigits(literal, position);
        if (exponentDigits.empty() || exponentDigits.size() > 6) {
            return std::nullopt;
        }

        int exponent = std::stoi(exponentDigits);
        if (exponent > MaxExponentMagnitude) {
            return std::nullopt;
        }
        parts.exponent = isExponentNegative ? -exponent : exponent;
    }

    if (position != literal.size()) {
        return std::nullopt;
    }

    return parts;
}

std::optional<double> FieldTraits<double>::fromLiteral(const std::string& literal) {
    std::optional<NumericLiteral> partsOption = splitNumericLiteral(literal);
    if (!partsOption) {
        return std::nullopt;
    }

    const NumericLiteral& parts = *partsOption;
    if (!parts.denominatorDigits.empty()) {
        std::optional<double> numerator = parseDouble(parts.integerDigits);
        std::optional<double> denominator = parseDouble(parts.denominatorDigits);
        if (!numerator || !denominator || *denominator == 0.0) {
            return std::nullopt;
        }

        double value = *numerator / *denominator;
        return parts.isNegative ? -value : value;
    }

    std::string canonical = parts.isNegative ? "-" : "";
    canonical += parts.integerDigits.empty() ? "0" : parts.integerDigits;
    if (!parts.fractionDigits.empty()) {
        canonical += "." + parts.fractionDigits;
    }
    canonical += "e" + std::to_string(parts.exponent);

    std::optional<double> value = parseDouble(canonical);
    if (!value || !std::isfinite(*value)) {
        return std::nullopt;
    }
    return value;
}

std::string FieldTraits<double>::toString(double value) {
    // Shortest representation that reads back to the same double
    char buffer[64];
    std::to_chars_result result = std::to_chars(buffer, buffer + sizeof(buffer), value);
    if (result.ec != std::errc{}) {
        return formatFixedPoint(value, 17);
    }
    return std::string(buffer, result.ptr);
}
