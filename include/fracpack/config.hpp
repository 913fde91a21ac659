/**
 * @file config.hpp
 * @brief fracpack compile-time configuration and format constants.
 *
 * Packed layout (most significant bit first):
 *
 * @code
 *   31 | 30 ........ 23 | 22 ........................ 0
 *  sign|  exponent (8)  |        significand (23)
 * @endcode
 */

#ifndef FRACPACK_CONFIG_HPP
#define FRACPACK_CONFIG_HPP

#include <cstddef>
#include <cstdint>

namespace fracpack {

/**
 * @defgroup version Version Information
 * @{
 */
inline constexpr int VERSION_MAJOR = 0;
inline constexpr int VERSION_MINOR = 1;
inline constexpr int VERSION_PATCH = 0;
/** @} */

/**
 * @defgroup config Configuration Constants
 * @{
 */

/// Longest accepted fractional part, in decimal digits.
/// 10^9 is the largest power of ten whose doubled numerator fits in 32 bits.
#ifndef FRACPACK_MAX_FRACTION_DIGITS
#define FRACPACK_MAX_FRACTION_DIGITS 9U
#endif

static_assert(FRACPACK_MAX_FRACTION_DIGITS >= 1U && FRACPACK_MAX_FRACTION_DIGITS <= 9U,
              "FRACPACK_MAX_FRACTION_DIGITS must be in [1, 9]");

inline constexpr std::uint32_t MAX_FRACTION_DIGITS = FRACPACK_MAX_FRACTION_DIGITS;

/// 32-bit carrier word
using word_t = std::uint32_t;
inline constexpr std::uint32_t BITS_PER_WORD = 32U;

inline constexpr std::uint32_t SIGN_BIT = 31U;
inline constexpr std::uint32_t EXPONENT_SHIFT = 23U;
inline constexpr std::uint32_t EXPONENT_BITS = 8U;
inline constexpr word_t EXPONENT_MASK = (1U << EXPONENT_BITS) - 1U;
inline constexpr std::uint32_t SIGNIFICAND_BITS = 23U;
inline constexpr word_t SIGNIFICAND_MASK = (1U << SIGNIFICAND_BITS) - 1U;

/// Largest exponent with an exact decimal expansion in the power-of-two table.
/// Tied to the significand width: the encoder never consumes more bit positions.
inline constexpr std::uint32_t MAX_EXPONENT = SIGNIFICAND_BITS;

/// Longest decoded string: "0." followed by at most 23 digits.
inline constexpr std::size_t MAX_DECIMAL_LENGTH = 2U + SIGNIFICAND_BITS;

static_assert(EXPONENT_SHIFT == SIGNIFICAND_BITS, "exponent field must follow the significand");
static_assert(1U + EXPONENT_BITS + SIGNIFICAND_BITS == BITS_PER_WORD, "fields must fill a word");

/// Unsigned 128-bit integer for exact decode products (5^23 * (2^23 - 1) > 2^64).
__extension__ typedef unsigned __int128 uint128_t;

/** @} */

/**
 * @defgroup exceptions Exception Configuration
 *
 * Define FRACPACK_NO_EXCEPTIONS=1 to compile out the throwing overloads.
 * @{
 */
#ifndef FRACPACK_NO_EXCEPTIONS
#define FRACPACK_NO_EXCEPTIONS 0
#endif
/** @} */

} // namespace fracpack

#endif // FRACPACK_CONFIG_HPP
