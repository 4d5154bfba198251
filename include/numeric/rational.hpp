#ifndef RATIONAL_HPP
#define RATIONAL_HPP

#include "numeric/field.hpp"

#include <cstdint>
#include <optional>
#include <string>

#include <gmpxx.h>

using Rational = mpq_class;

template <>
struct FieldTraits<mpq_class> {
    static constexpr NumericKind Kind = NumericKind::Rational;

    static mpq_class zero() { return mpq_class{ 0 }; }
    static mpq_class one() { return mpq_class{ 1 }; }
    static mpq_class fromInteger(std::int64_t value);
    static mpq_class fromDouble(double value);
    static std::optional<mpq_class> fromLiteral(const std::string& literal);
    static double toDouble(const mpq_class& value) { return value.get_d(); }
    static std::string toString(const mpq_class& value) { return value.get_str(); }
    static bool isFinite(const mpq_class&) { return true; }

    // Nearest rational with a double-representable value
    static mpq_class approximate(const mpq_class& value);
};

#endif // RATIONAL_HPP
