/**
 * @file encoder.hpp
 * @brief Decimal fixed-point to packed value encoding.
 *
 * The fractional numerator is scanned by repeated doubling against the
 * fixed-point denominator 10^k: each doubling that reaches the denominator
 * emits a binary 1, otherwise a 0. Scanning stops at the first zero
 * remainder (exact binary fraction) or after SIGNIFICAND_BITS positions
 * (truncated).
 */

#ifndef FRACPACK_ENCODER_HPP
#define FRACPACK_ENCODER_HPP

#include "config.hpp"
#include "decimal.hpp"
#include "error.hpp"
#include "packed_value.hpp"

namespace fracpack {

/**
 * @brief Encode a fixed-point fraction.
 *
 * A zero numerator encodes as exponent 1, significand 0.
 *
 * @param fixed_point Fraction numerator / 10^digit_count
 * @param[out] out Packed value, untouched on failure
 * @param[out] truncated Optional; set to true when the binary expansion did
 *             not terminate within SIGNIFICAND_BITS digits
 * @return Error::Ok on success, Error::InvalidInput if digit_count is 0 or
 *         above MAX_FRACTION_DIGITS, or numerator >= 10^digit_count
 */
Error encode(const DecimalFixedPoint& fixed_point, PackedValue& out,
             bool* truncated = nullptr) noexcept;

} // namespace fracpack

#endif // FRACPACK_ENCODER_HPP
