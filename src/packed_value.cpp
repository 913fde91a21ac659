/**
 * @file packed_value.cpp
 * @brief PackedValue string entry points.
 */

#include <fracpack/fracpack.hpp>

namespace fracpack {

std::optional<PackedValue> PackedValue::from_decimal(std::string_view s) noexcept {
    return encode_decimal(s);
}

Error PackedValue::to_decimal(std::string& out) const {
    return decode(*this, out);
}

#if !FRACPACK_NO_EXCEPTIONS

PackedValue PackedValue::parse(std::string_view s) {
    PackedValue value;
    if (encode_decimal(s, value) != Error::Ok) {
        throw InvalidInputException("not a decimal fraction in (0, 1): \"" + std::string(s) +
                                    "\"");
    }
    return value;
}

std::string PackedValue::to_string() const {
    std::string out;
    if (decode(*this, out) != Error::Ok) {
        throw UnsupportedExponentException("no decimal expansion for exponent " +
                                           std::to_string(exponent()));
    }
    return out;
}

#endif // !FRACPACK_NO_EXCEPTIONS

} // namespace fracpack
