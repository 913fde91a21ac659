/**
 * @file bits.hpp
 * @brief Single-word bit primitives.
 *
 * @par Bit Numbering Convention
 * - Bit 0 = LSB
 * - Bit 31 = MSB (the sign bit of a packed value)
 *
 * All functions are pure and operate on 32-bit words by value.
 */

#ifndef FRACPACK_BITS_HPP
#define FRACPACK_BITS_HPP

#include "config.hpp"

namespace fracpack {

/**
 * @brief Set or clear one bit of a word.
 *
 * @warning Caller must ensure n < 32.
 * @param word Source word
 * @param n Bit position (0 = LSB)
 * @param value New bit value
 * @return Copy of word with bit n replaced
 */
[[nodiscard]] constexpr word_t set_bit(word_t word, std::uint32_t n, bool value) noexcept {
    if (value) {
        return word | (1U << n);
    }
    return word & ~(1U << n);
}

/**
 * @brief Read one bit of a word.
 *
 * @warning Caller must ensure n < 32.
 * @param word Source word
 * @param n Bit position (0 = LSB)
 * @return true if the bit is set
 */
[[nodiscard]] constexpr bool get_bit(word_t word, std::uint32_t n) noexcept {
    return ((word >> n) & 1U) != 0U;
}

/**
 * @brief Reverse all 32 bits of a word.
 * @param word Operand
 * @return Word with bit i moved to bit 31 - i
 */
[[nodiscard]] constexpr word_t reverse_word(word_t word) noexcept {
    word = ((word & 0x55555555U) << 1) | ((word >> 1) & 0x55555555U);
    word = ((word & 0x33333333U) << 2) | ((word >> 2) & 0x33333333U);
    word = ((word & 0x0F0F0F0FU) << 4) | ((word >> 4) & 0x0F0F0F0FU);
    word = ((word & 0x00FF00FFU) << 8) | ((word >> 8) & 0x00FF00FFU);
    return (word << 16) | (word >> 16);
}

/**
 * @brief Reverse the order of the lowest count bits of a word.
 *
 * Bit 0 swaps with bit count-1, bit 1 with bit count-2, and so on. Bits at
 * or above position count are dropped from the result.
 *
 * @code
 *   reverse_low_bits(0b100111001, 6) == 0b100111
 * @endcode
 *
 * @param word Operand
 * @param count Number of low bits to reverse (0 yields 0, above 32 acts as 32)
 * @return Reversed low bits, aligned at bit 0
 */
[[nodiscard]] constexpr word_t reverse_low_bits(word_t word, std::uint32_t count) noexcept {
    if (count == 0U) {
        return 0U;
    }
    if (count > BITS_PER_WORD) {
        count = BITS_PER_WORD;
    }
    // After a full reversal the low bits sit at the top; shift them back down.
    return reverse_word(word) >> (BITS_PER_WORD - count);
}

} // namespace fracpack

#endif // FRACPACK_BITS_HPP
