/**
 * @file packed_value.hpp
 * @brief 32-bit packed carrier for decimal fractions in (0, 1).
 *
 * The layout follows IEEE-754 single precision (sign, 8-bit exponent,
 * 23-bit significand) but the meaning differs:
 * - sign is always 0
 * - exponent is the number of binary fraction digits consumed by the encoder
 * - significand holds those digits as a plain integer, first fractional bit
 *   most significant, with no hidden leading 1
 *
 * The represented value is therefore significand * 2^-exponent. For
 * example 0.625 = 0.101b is stored as exponent 3, significand 0b101 = 5.
 */

#ifndef FRACPACK_PACKED_VALUE_HPP
#define FRACPACK_PACKED_VALUE_HPP

#include <optional>
#include <string>
#include <string_view>

#include "bits.hpp"
#include "config.hpp"
#include "error.hpp"

namespace fracpack {

class PackedValue {
public:
    /**
     * @brief Default constructor - all bits zero (exponent 0, not decodable).
     */
    constexpr PackedValue() noexcept : bits_(0) {}

    /**
     * @brief Wrap a raw 32-bit pattern.
     * @param bits Packed word
     */
    explicit constexpr PackedValue(word_t bits) noexcept : bits_(bits) {}

    /**
     * @brief Build a value from its fields.
     *
     * Each field is masked to its width; the sign bit is left clear.
     *
     * @param exponent Exponent field (8 bits)
     * @param significand Significand field (23 bits)
     * @return Packed value
     */
    [[nodiscard]] static constexpr PackedValue from_fields(std::uint32_t exponent,
                                                           std::uint32_t significand) noexcept {
        return PackedValue(((exponent & EXPONENT_MASK) << EXPONENT_SHIFT) |
                           (significand & SIGNIFICAND_MASK));
    }

    /**
     * @brief Encode a decimal string.
     *
     * @param s Decimal fraction such as "0.625"
     * @return Packed value, or std::nullopt for invalid input
     */
    [[nodiscard]] static std::optional<PackedValue> from_decimal(std::string_view s) noexcept;

    [[nodiscard]] constexpr word_t bits() const noexcept {
        return bits_;
    }

    [[nodiscard]] constexpr bool sign() const noexcept {
        return get_bit(bits_, SIGN_BIT);
    }

    [[nodiscard]] constexpr std::uint32_t exponent() const noexcept {
        return set_bit(bits_, SIGN_BIT, false) >> EXPONENT_SHIFT;
    }

    [[nodiscard]] constexpr std::uint32_t significand() const noexcept {
        return bits_ & SIGNIFICAND_MASK;
    }

    /**
     * @brief Check the value is one the encoder could have produced.
     *
     * Canonical values have a clear sign, an exponent in [1, MAX_EXPONENT]
     * and a significand below 2^exponent, so they decode to a string with
     * exactly exponent fractional digits.
     */
    [[nodiscard]] constexpr bool is_canonical() const noexcept {
        std::uint32_t exp = exponent();
        if (sign() || exp == 0U || exp > MAX_EXPONENT) {
            return false;
        }
        return (significand() >> exp) == 0U;
    }

    /**
     * @brief Decode to an exact decimal string.
     *
     * @param[out] out Decimal string such as "0.625"
     * @return Error::Ok or Error::UnsupportedExponent
     */
    Error to_decimal(std::string& out) const;

#if !FRACPACK_NO_EXCEPTIONS
    /**
     * @brief Encode a decimal string, throwing on invalid input.
     * @throws InvalidInputException
     */
    [[nodiscard]] static PackedValue parse(std::string_view s);

    /**
     * @brief Decode to an exact decimal string.
     * @throws UnsupportedExponentException
     */
    [[nodiscard]] std::string to_string() const;
#endif

    [[nodiscard]] constexpr bool operator==(const PackedValue& other) const noexcept {
        return bits_ == other.bits_;
    }

    [[nodiscard]] constexpr bool operator!=(const PackedValue& other) const noexcept {
        return bits_ != other.bits_;
    }

private:
    word_t bits_;
};

} // namespace fracpack

#endif // FRACPACK_PACKED_VALUE_HPP
