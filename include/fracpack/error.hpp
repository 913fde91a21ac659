/**
 * @file error.hpp
 * @brief fracpack error handling.
 *
 * Provides both error-code-based and exception-based error handling.
 * The error-code API is always available; exceptions can be compiled out
 * with FRACPACK_NO_EXCEPTIONS=1.
 */

#ifndef FRACPACK_ERROR_HPP
#define FRACPACK_ERROR_HPP

#include "config.hpp"

#if !FRACPACK_NO_EXCEPTIONS
#include <stdexcept>
#include <string>
#endif

namespace fracpack {

/**
 * @brief Error codes returned by every fallible operation.
 */
enum class Error {
    Ok = 0,                   ///< Success
    InvalidInput = -1,        ///< Malformed decimal string or fixed-point pair
    UnsupportedExponent = -2, ///< Exponent outside the power-of-two table
    PrecisionTruncated = -3,  ///< Fraction needs more than SIGNIFICAND_BITS binary digits
    BufferTooSmall = -4       ///< Output buffer cannot hold the decoded string
};

/**
 * @brief Get error message for error code.
 * @param error Error code
 * @return Human-readable error message
 */
inline const char* error_string(Error error) noexcept {
    switch (error) {
    case Error::Ok:
        return "Success";
    case Error::InvalidInput:
        return "Invalid decimal input";
    case Error::UnsupportedExponent:
        return "Unsupported exponent";
    case Error::PrecisionTruncated:
        return "Precision truncated";
    case Error::BufferTooSmall:
        return "Buffer too small";
    default:
        return "Unknown error";
    }
}

#if !FRACPACK_NO_EXCEPTIONS

/**
 * @brief Base exception for fracpack errors.
 */
class FracpackException : public std::runtime_error {
public:
    explicit FracpackException(const std::string& message, Error code = Error::InvalidInput)
        : std::runtime_error(message), error_code_(code) {}

    Error code() const noexcept {
        return error_code_;
    }

private:
    Error error_code_;
};

/**
 * @brief Exception for strings that do not describe a fraction in (0, 1).
 */
class InvalidInputException : public FracpackException {
public:
    explicit InvalidInputException(const std::string& message)
        : FracpackException(message, Error::InvalidInput) {}
};

/**
 * @brief Exception for packed values whose exponent has no table entry.
 */
class UnsupportedExponentException : public FracpackException {
public:
    explicit UnsupportedExponentException(const std::string& message)
        : FracpackException(message, Error::UnsupportedExponent) {}
};

#endif // !FRACPACK_NO_EXCEPTIONS

} // namespace fracpack

#endif // FRACPACK_ERROR_HPP
