/**
 * @file fracpack.hpp
 * @brief High-level fracpack API.
 *
 * Provides string-level encode_decimal() and decode_to_decimal() on top of
 * the parser, encoder and decoder.
 *
 * @code
 *   auto value = fracpack::encode_decimal("0.625");   // exponent 3, significand 5
 *   std::string text;
 *   fracpack::decode_to_decimal(*value, text);         // "0.625"
 * @endcode
 */

#ifndef FRACPACK_HPP
#define FRACPACK_HPP

#include <optional>
#include <string>
#include <string_view>

#include "bits.hpp"
#include "config.hpp"
#include "decimal.hpp"
#include "decoder.hpp"
#include "encoder.hpp"
#include "error.hpp"
#include "packed_value.hpp"
#include "pow2_table.hpp"

namespace fracpack {

/**
 * @brief Encode a decimal string, reporting truncation.
 *
 * @param input Decimal fraction in (0, 1), e.g. "0.75" or ".75"
 * @param[out] out Packed value, untouched on failure
 * @param[out] truncated Optional truncation flag, see encode()
 * @return Error::Ok or Error::InvalidInput
 */
inline Error encode_decimal(std::string_view input, PackedValue& out,
                            bool* truncated = nullptr) noexcept {
    DecimalFixedPoint fixed_point;
    auto result = parse_fraction(input, fixed_point);
    if (result != Error::Ok) {
        return result;
    }
    return encode(fixed_point, out, truncated);
}

/**
 * @brief Encode a decimal string.
 *
 * Inputs needing more than SIGNIFICAND_BITS binary digits are truncated
 * silently; use encode_decimal_exact() to detect that.
 *
 * @param input Decimal fraction in (0, 1)
 * @return Packed value, or std::nullopt for invalid input
 */
[[nodiscard]] inline std::optional<PackedValue> encode_decimal(std::string_view input) noexcept {
    PackedValue value;
    if (encode_decimal(input, value) != Error::Ok) {
        return std::nullopt;
    }
    return value;
}

/**
 * @brief Encode a decimal string only if it round-trips exactly.
 *
 * @param input Decimal fraction in (0, 1)
 * @param[out] out Packed value, untouched on failure
 * @return Error::Ok, Error::InvalidInput, or Error::PrecisionTruncated
 */
inline Error encode_decimal_exact(std::string_view input, PackedValue& out) noexcept {
    PackedValue value;
    bool truncated = false;
    auto result = encode_decimal(input, value, &truncated);
    if (result != Error::Ok) {
        return result;
    }
    if (truncated) {
        return Error::PrecisionTruncated;
    }
    out = value;
    return Error::Ok;
}

/**
 * @brief Decode a packed value to its exact decimal string.
 *
 * @param value Packed value
 * @param[out] out Decimal string, untouched on failure
 * @return Error::Ok or Error::UnsupportedExponent
 */
inline Error decode_to_decimal(PackedValue value, std::string& out) {
    return decode(value, out);
}

#if !FRACPACK_NO_EXCEPTIONS
/**
 * @brief Decode a packed value to its exact decimal string.
 * @throws UnsupportedExponentException
 */
[[nodiscard]] inline std::string decode_to_decimal(PackedValue value) {
    return value.to_string();
}
#endif

/**
 * @brief Get library version.
 * @return Version string
 */
inline const char* version() noexcept {
    return "0.1.0";
}

} // namespace fracpack

#endif // FRACPACK_HPP
