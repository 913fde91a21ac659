/**
 * @file decimal.hpp
 * @brief Decimal string validation and fixed-point reduction.
 *
 * A decimal fraction "0.d1d2...dk" is reduced to the exact rational
 * numerator / 10^k, kept as a (digit_count, numerator) pair.
 */

#ifndef FRACPACK_DECIMAL_HPP
#define FRACPACK_DECIMAL_HPP

#include <string_view>

#include "config.hpp"
#include "error.hpp"

namespace fracpack {

/**
 * @brief Exact fixed-point form of a decimal fraction.
 *
 * Represents numerator / 10^digit_count. Leading zeros of the fractional
 * part live in digit_count, trailing zeros in numerator:
 * "0.0150" -> {4, 150}.
 */
struct DecimalFixedPoint {
    std::uint32_t digit_count = 0; ///< Number of fractional digits
    std::uint32_t numerator = 0;   ///< Fractional digits as a base-10 integer

    [[nodiscard]] constexpr bool operator==(const DecimalFixedPoint& other) const noexcept {
        return digit_count == other.digit_count && numerator == other.numerator;
    }
};

/**
 * @brief Compute 10^exponent.
 *
 * @warning Caller must ensure exponent <= MAX_FRACTION_DIGITS.
 */
[[nodiscard]] constexpr std::uint32_t power_of_ten(std::uint32_t exponent) noexcept {
    std::uint32_t value = 1U;
    for (std::uint32_t i = 0; i < exponent; ++i) {
        value *= 10U;
    }
    return value;
}

/**
 * @brief Structural check of a decimal string.
 *
 * Accepts ASCII digits with at most one '.' separator. Magnitude is not
 * checked: "3300" passes.
 *
 * @param s Candidate string
 * @return true if every character is a digit or the single '.'
 */
[[nodiscard]] bool is_valid(std::string_view s) noexcept;

/**
 * @brief Reduce a decimal fraction string to fixed-point form.
 *
 * The string must pass is_valid(), contain a '.', have between 1 and
 * MAX_FRACTION_DIGITS fractional digits, and have an integer part made of
 * zeros only (or empty, as in ".5").
 *
 * @param s Decimal string such as "0.0150"
 * @param[out] out Fixed-point pair, untouched on failure
 * @return Error::Ok on success, Error::InvalidInput otherwise
 */
Error parse_fraction(std::string_view s, DecimalFixedPoint& out) noexcept;

} // namespace fracpack

#endif // FRACPACK_DECIMAL_HPP
