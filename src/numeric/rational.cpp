#include "numeric/rational.hpp"

#include "numeric/field.hpp"
#include "util/errors.hpp"

#include <cmath>
#include <cstdint>
#include <optional>
#include <string>

#include <gmpxx.h>

namespace {
mpz_class powerOfTen(int exponent) {
    mpz_class result;
    mpz_ui_pow_ui(result.get_mpz_t(), 10, static_cast<unsigned long>(exponent));
    return result;
}
} // namespace

mpq_class FieldTraits<mpq_class>::fromInteger(std::int64_t value) {
    return mpq_class{ static_cast<signed long>(value) };
}

mpq_class FieldTraits<mpq_class>::fromDouble(double value) {
    if (!std::isfinite(value)) {
        throw NumericError{ "Cannot represent a non-finite double as a rational." };
    }

    // Exact: every finite double is a dyadic rational
    return mpq_class{ value };
}

std::optional<mpq_class> FieldTraits<mpq_class>::fromLiteral(const std::string& literal) {
    std::optional<NumericLiteral> partsOption = splitNumericLiteral(literal);
    if (!partsOption) {
        return std::nullopt;
    }

    const NumericLiteral& parts = *partsOption;
    mpq_class value;

    if (!parts.denominatorDigits.empty()) {
        mpz_class numerator{ parts.integerDigits, 10 };
        mpz_class denominator{ parts.denominatorDigits, 10 };
        if (denominator == 0) {
            return std::nullopt;
        }

        value = mpq_class{ numerator, denominator };
    }
    else {
        // Treat "12.345e2" as 12345 * 10^(2 - 3)
        std::string digits = parts.integerDigits + parts.fractionDigits;
        int scale = parts.exponent - static_cast<int>(parts.fractionDigits.size());

        mpz_class mantissa{ digits, 10 };
        if (scale >= 0) {
            mpz_class scaled = mantissa * powerOfTen(scale);
            value = mpq_class{ scaled };
        }
        else {
            value = mpq_class{ mantissa, powerOfTen(-scale) };
        }
    }

    value.canonicalize();
    if (parts.isNegative) {
        value = -value;
    }
    return value;
}

mpq_class FieldTraits<mpq_class>::approximate(const mpq_class& value) {
    double nearest = value.get_d();
    if (!std::isfinite(nearest)) {
        return value;
    }
    return mpq_class{ nearest };
}
