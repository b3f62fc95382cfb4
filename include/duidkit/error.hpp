/**
 * @file error.hpp
 * @brief duidkit error handling.
 *
 * Provides both exception-based and error-code-based error handling
 * for builds with -fno-exceptions.
 */

#ifndef DUIDKIT_ERROR_HPP
#define DUIDKIT_ERROR_HPP

#include "config.hpp"

#if !DUIDKIT_NO_EXCEPTIONS
#include <stdexcept>
#include <string>
#endif

namespace duidkit {

/**
 * @brief Error codes for error-code-based error handling.
 */
enum class Error {
    Ok = 0,                  ///< Success
    Overflow = -1,           ///< Buffer overflow
    Underflow = -2,          ///< Buffer underflow (not enough data)
    InvalidHexEncoding = -3, ///< Non-hex characters or odd digit count
    MalformedDuid = -4       ///< Structurally invalid DUID
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
    case Error::Overflow:
        return "Buffer overflow";
    case Error::Underflow:
        return "Buffer underflow";
    case Error::InvalidHexEncoding:
        return "Invalid hex encoding";
    case Error::MalformedDuid:
        return "Malformed DUID";
    default:
        return "Unknown error";
    }
}

#if !DUIDKIT_NO_EXCEPTIONS

/**
 * @brief Base exception for duidkit errors.
 */
class DuidException : public std::runtime_error {
public:
    DuidException(const std::string& message, Error code)
        : std::runtime_error(message), error_code_(code) {}

    Error code() const noexcept {
        return error_code_;
    }

private:
    Error error_code_;
};

/**
 * @brief Exception for text that is not valid hex.
 */
class InvalidHexException : public DuidException {
public:
    explicit InvalidHexException(const std::string& message)
        : DuidException(message, Error::InvalidHexEncoding) {}
};

/**
 * @brief Exception for byte sequences that are not a valid DUID.
 */
class MalformedDuidException : public DuidException {
public:
    explicit MalformedDuidException(const std::string& message)
        : DuidException(message, Error::MalformedDuid) {}
};

#endif // !DUIDKIT_NO_EXCEPTIONS

} // namespace duidkit

#endif // DUIDKIT_ERROR_HPP
