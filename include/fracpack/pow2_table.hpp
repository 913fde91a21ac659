/**
 * @file pow2_table.hpp
 * @brief Exact decimal expansions of negative powers of two.
 *
 * 2^-e = 5^e / 10^e, so every negative power of two has a finite decimal
 * expansion with exactly e fractional digits. The decoder multiplies the
 * significand by 5^e and places the decimal point e digits from the right,
 * which keeps decoding free of floating-point rounding.
 */

#ifndef FRACPACK_POW2_TABLE_HPP
#define FRACPACK_POW2_TABLE_HPP

#include <array>

#include "config.hpp"
#include "error.hpp"

namespace fracpack {

/**
 * @brief Decimal form of 2^-e: numerator / 10^digits.
 */
struct Pow2Decimal {
    uint128_t numerator;  ///< 5^e
    std::uint32_t digits; ///< e
};

namespace detail {

/// Indexed by exponent; entry 0 is unused.
inline constexpr std::array<Pow2Decimal, MAX_EXPONENT + 1> POW2_DECIMALS = {{
    {0U, 0U},                   // 0: unused
    {5U, 1U},                   // 2^-1  = 0.5
    {25U, 2U},                  // 2^-2  = 0.25
    {125U, 3U},                 // 2^-3  = 0.125
    {625U, 4U},                 // 2^-4  = 0.0625
    {3125U, 5U},                // 2^-5  = 0.03125
    {15625U, 6U},               // 2^-6  = 0.015625
    {78125U, 7U},               // 2^-7  = 0.0078125
    {390625U, 8U},              // 2^-8
    {1953125U, 9U},             // 2^-9
    {9765625U, 10U},            // 2^-10
    {48828125U, 11U},           // 2^-11
    {244140625U, 12U},          // 2^-12
    {1220703125U, 13U},         // 2^-13
    {6103515625U, 14U},         // 2^-14
    {30517578125U, 15U},        // 2^-15
    {152587890625U, 16U},       // 2^-16
    {762939453125U, 17U},       // 2^-17
    {3814697265625U, 18U},      // 2^-18
    {19073486328125U, 19U},     // 2^-19
    {95367431640625U, 20U},     // 2^-20
    {476837158203125U, 21U},    // 2^-21
    {2384185791015625U, 22U},   // 2^-22
    {11920928955078125U, 23U},  // 2^-23 = 0.00000011920928955078125
}};

constexpr bool pow2_table_is_exact() noexcept {
    uint128_t five_pow = 1U;
    for (std::uint32_t e = 1; e <= MAX_EXPONENT; ++e) {
        five_pow *= 5U;
        if (POW2_DECIMALS[e].numerator != five_pow || POW2_DECIMALS[e].digits != e) {
            return false;
        }
    }
    return true;
}

static_assert(pow2_table_is_exact(), "POW2_DECIMALS must hold 5^e with e digits");

} // namespace detail

/**
 * @brief Look up the decimal expansion of 2^-exponent.
 *
 * @param exponent Binary exponent magnitude, valid in [1, MAX_EXPONENT]
 * @param[out] out Table entry, untouched on failure
 * @return Error::Ok on success, Error::UnsupportedExponent on a miss
 */
inline Error pow2_lookup(std::uint32_t exponent, Pow2Decimal& out) noexcept {
    if (exponent == 0U || exponent > MAX_EXPONENT) [[unlikely]] {
        return Error::UnsupportedExponent;
    }
    out = detail::POW2_DECIMALS[exponent];
    return Error::Ok;
}

} // namespace fracpack

#endif // FRACPACK_POW2_TABLE_HPP
