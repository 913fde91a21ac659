/**
 * @file decoder.cpp
 * @brief Packed value to exact decimal string decoding.
 */

#include <fracpack/decoder.hpp>
#include <fracpack/pow2_table.hpp>

namespace fracpack {

Error decode(PackedValue value, char* buffer, std::size_t buffer_size,
             std::size_t& length) noexcept {
    Pow2Decimal entry{};
    auto result = pow2_lookup(value.exponent(), entry);
    if (result != Error::Ok) {
        return result;
    }

    uint128_t product = entry.numerator * static_cast<uint128_t>(value.significand());

    // Least significant digit first
    char digits[MAX_DECIMAL_LENGTH];
    std::size_t num_digits = 0;
    do {
        digits[num_digits] = static_cast<char>('0' + static_cast<int>(product % 10U));
        ++num_digits;
        product /= 10U;
    } while (product != 0U && num_digits < sizeof(digits));

    std::size_t width = entry.digits > num_digits ? entry.digits : num_digits;
    std::size_t total = 2U + width;
    if (buffer == nullptr || buffer_size <= total) {
        return Error::BufferTooSmall;
    }

    std::size_t pos = 0;
    buffer[pos++] = '0';
    buffer[pos++] = '.';
    for (std::size_t i = num_digits; i < width; ++i) {
        buffer[pos++] = '0';
    }
    while (num_digits > 0) {
        buffer[pos++] = digits[--num_digits];
    }
    buffer[pos] = '\0';

    length = pos;
    return Error::Ok;
}

Error decode(PackedValue value, std::string& out) {
    char buffer[MAX_DECIMAL_LENGTH + 1];
    std::size_t length = 0;
    auto result = decode(value, buffer, sizeof(buffer), length);
    if (result != Error::Ok) {
        return result;
    }
    out.assign(buffer, length);
    return Error::Ok;
}

} // namespace fracpack
