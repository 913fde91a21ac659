/**
 * @file encoder.cpp
 * @brief Decimal fixed-point to packed value encoding.
 */

#include <fracpack/bits.hpp>
#include <fracpack/encoder.hpp>

namespace fracpack {

Error encode(const DecimalFixedPoint& fixed_point, PackedValue& out, bool* truncated) noexcept {
    if (fixed_point.digit_count == 0U || fixed_point.digit_count > MAX_FRACTION_DIGITS) {
        return Error::InvalidInput;
    }

    const std::uint32_t edge = power_of_ten(fixed_point.digit_count);
    if (fixed_point.numerator >= edge) {
        return Error::InvalidInput;
    }

    // Digits are collected nearest-to-the-point first: position 0 holds 2^-1.
    word_t digits = 0;
    std::uint32_t position = 0;
    std::uint32_t remainder = fixed_point.numerator;
    bool cut = false;

    for (;;) {
        remainder <<= 1;
        if (remainder >= edge) {
            digits = set_bit(digits, position, true);
            remainder -= edge;
        }
        if (remainder == 0U) {
            break;
        }
        if (position + 1U == SIGNIFICAND_BITS) {
            cut = true;
            break;
        }
        ++position;
    }

    const std::uint32_t consumed = position + 1U;
    word_t bits = reverse_low_bits(digits, consumed);
    bits |= consumed << EXPONENT_SHIFT;
    bits = set_bit(bits, SIGN_BIT, false);

    out = PackedValue(bits);
    if (truncated != nullptr) {
        *truncated = cut;
    }
    return Error::Ok;
}

} // namespace fracpack
