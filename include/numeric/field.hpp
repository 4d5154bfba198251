#ifndef FIELD_HPP
#define FIELD_HPP

#include "util/errors.hpp"
#include "util/string_utils.hpp"

#include <cmath>
#include <concepts>
#include <cstdint>
#include <optional>
#include <string>

enum class NumericKind : std::uint8_t {
    Rational,
    Float
};

// A numeric literal split into its parts, e.g. "-12.5e3" or "3/4"
struct NumericLiteral {
    bool isNegative;
    std::string integerDigits;
    std::string fractionDigits;
    int exponent;

    // Non-empty only for literals of the form "p/q"
    std::string denominatorDigits;
};

std::optional<NumericLiteral> splitNumericLiteral(const std::string& literal);

template <typename T>
struct FieldTraits;

template <>
struct FieldTraits<double> {
    static constexpr NumericKind Kind = NumericKind::Float;

    static double zero() { return 0.0; }
    static double one() { return 1.0; }
    static double fromInteger(std::int64_t value) { return static_cast<double>(value); }
    static double fromDouble(double value) { return value; }
    static std::optional<double> fromLiteral(const std::string& literal);
    static double toDouble(double value) { return value; }
    static std::string toString(double value);
    static bool isFinite(double value) { return std::isfinite(value); }
    static double approximate(double value) { return value; }
};

template <typename T>
concept NumericField = requires(const T& a, const T& b) {
    { a + b } -> std::convertible_to<T>;
    { a - b } -> std::convertible_to<T>;
    { a * b } -> std::convertible_to<T>;
    { a / b } -> std::convertible_to<T>;
    { -a } -> std::convertible_to<T>;
    { a < b } -> std::convertible_to<bool>;
    { a == b } -> std::convertible_to<bool>;
    { FieldTraits<T>::zero() } -> std::same_as<T>;
    { FieldTraits<T>::one() } -> std::same_as<T>;
    { FieldTraits<T>::fromInteger(std::int64_t{ 0 }) } -> std::same_as<T>;
    { FieldTraits<T>::fromDouble(0.0) } -> std::same_as<T>;
    { FieldTraits<T>::fromLiteral(std::string{}) } -> std::same_as<std::optional<T>>;
    { FieldTraits<T>::toDouble(a) } -> std::same_as<double>;
    { FieldTraits<T>::toString(a) } -> std::same_as<std::string>;
    { FieldTraits<T>::isFinite(a) } -> std::same_as<bool>;
    { FieldTraits<T>::approximate(a) } -> std::same_as<T>;
};

template <NumericField T>
void checkFinite(const T& value, const std::string& context) {
    if (!FieldTraits<T>::isFinite(value)) {
        throw NumericError{ "Non-finite value produced by " + context + "." };
    }
}

template <NumericField T>
T divide(const T& numerator, const T& denominator) {
    if (denominator == FieldTraits<T>::zero()) {
        throw NumericError{ "Division by zero." };
    }

    T quotient = numerator / denominator;
    checkFinite(quotient, "division");
    return quotient;
}

template <NumericField T>
T absoluteValue(const T& value) {
    if (value < FieldTraits<T>::zero()) {
        return T(-value);
    }
    return value;
}

template <NumericField T>
int signOf(const T& value) {
    if (value < FieldTraits<T>::zero()) return -1;
    if (FieldTraits<T>::zero() < value) return 1;
    return 0;
}

template <NumericField T>
T clampToInterval(const T& value, const T& lower, const T& upper) {
    if (value < lower) return lower;
    if (upper < value) return upper;
    return value;
}

// Fixed-precision display form
template <NumericField T>
std::string formatFixed(const T& value, int precision) {
    return formatFixedPoint(FieldTraits<T>::toDouble(value), precision);
}

#endif // FIELD_HPP
