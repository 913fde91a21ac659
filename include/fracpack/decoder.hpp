/**
 * @file decoder.hpp
 * @brief Packed value to exact decimal string decoding.
 *
 * The significand is read as a plain integer and multiplied by the exact
 * decimal expansion of 2^-exponent from the power-of-two table. The product
 * is left-padded with zeros to the table entry's digit width and prefixed
 * with "0.". No floating-point arithmetic is involved.
 *
 * @note The significand carries no hidden leading 1. This mirrors the
 *       encoder, which stores every consumed binary digit explicitly.
 */

#ifndef FRACPACK_DECODER_HPP
#define FRACPACK_DECODER_HPP

#include <string>

#include "config.hpp"
#include "error.hpp"
#include "packed_value.hpp"

namespace fracpack {

/**
 * @brief Decode into a caller-provided buffer.
 *
 * The sign bit is ignored. A non-canonical significand whose product is
 * wider than the table entry is written without padding.
 *
 * @param value Packed value
 * @param buffer Destination, NUL-terminated on success
 * @param buffer_size Capacity of buffer; MAX_DECIMAL_LENGTH + 1 always suffices
 * @param[out] length Characters written, excluding the terminator
 * @return Error::Ok, Error::UnsupportedExponent, or Error::BufferTooSmall
 */
Error decode(PackedValue value, char* buffer, std::size_t buffer_size,
             std::size_t& length) noexcept;

/**
 * @brief Decode into a string.
 *
 * @param value Packed value
 * @param[out] out Decimal string, untouched on failure
 * @return Error::Ok or Error::UnsupportedExponent
 */
Error decode(PackedValue value, std::string& out);

} // namespace fracpack

#endif // FRACPACK_DECODER_HPP
