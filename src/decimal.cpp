/**
 * @file decimal.cpp
 * @brief Decimal string validation and fixed-point reduction.
 */

#include <fracpack/decimal.hpp>

namespace fracpack {

namespace {

constexpr bool is_digit(char c) noexcept {
    return c >= '0' && c <= '9';
}

} // namespace

bool is_valid(std::string_view s) noexcept {
    std::size_t num_dots = 0;
    for (char c : s) {
        if (c == '.') {
            ++num_dots;
            continue;
        }
        if (!is_digit(c)) {
            return false;
        }
    }
    return num_dots <= 1;
}

Error parse_fraction(std::string_view s, DecimalFixedPoint& out) noexcept {
    if (!is_valid(s)) {
        return Error::InvalidInput;
    }

    std::size_t dot = s.find('.');
    if (dot == std::string_view::npos) {
        return Error::InvalidInput;
    }

    // Values >= 1 are outside the representable range
    std::string_view integer_part = s.substr(0, dot);
    for (char c : integer_part) {
        if (c != '0') {
            return Error::InvalidInput;
        }
    }

    std::string_view fraction = s.substr(dot + 1);
    if (fraction.empty() || fraction.size() > MAX_FRACTION_DIGITS) {
        return Error::InvalidInput;
    }

    std::uint32_t numerator = 0;
    for (char c : fraction) {
        numerator = (numerator * 10U) + static_cast<std::uint32_t>(c - '0');
    }

    out.digit_count = static_cast<std::uint32_t>(fraction.size());
    out.numerator = numerator;
    return Error::Ok;
}

} // namespace fracpack
