/**
 * @file error.hpp
 * @brief qrngkit error handling.
 *
 * Error codes name every failure kind; the exception classes below carry
 * one of them so callers can branch on code() without string matching.
 */

#ifndef QRNGKIT_ERROR_HPP
#define QRNGKIT_ERROR_HPP

#include "config.hpp"

#include <stdexcept>
#include <string>

namespace qrngkit {

/**
 * @brief Error codes.
 */
enum class Error {
    Ok = 0,                 ///< Success
    InvalidParameter = -1,  ///< Rejected before any work began
    SourceUnavailable = -2, ///< Raw-bit acquisition failed
    ExtractionStalled = -3, ///< Adaptive extraction hit its round or raw-bit bound
    DegenerateInput = -4,   ///< Empty input to a test (TestResult::status, never thrown)
    CipherFailure = -5      ///< Block cipher adapter failed
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
    case Error::InvalidParameter:
        return "Invalid parameter";
    case Error::SourceUnavailable:
        return "Raw bit source unavailable";
    case Error::ExtractionStalled:
        return "Extraction stalled";
    case Error::DegenerateInput:
        return "Degenerate input";
    case Error::CipherFailure:
        return "Cipher failure";
    default:
        return "Unknown error";
    }
}

/**
 * @brief Base exception for qrngkit errors.
 */
class QrngException : public std::runtime_error {
public:
    explicit QrngException(const std::string& message, Error code = Error::InvalidParameter)
        : std::runtime_error(message), error_code_(code) {}

    Error code() const noexcept {
        return error_code_;
    }

private:
    Error error_code_;
};

/**
 * @brief Exception for invalid arguments.
 */
class InvalidParameterException : public QrngException {
public:
    explicit InvalidParameterException(const std::string& message)
        : QrngException(message, Error::InvalidParameter) {}
};

/**
 * @brief Exception for a failed raw-bit source.
 */
class SourceUnavailableException : public QrngException {
public:
    explicit SourceUnavailableException(const std::string& message)
        : QrngException(message, Error::SourceUnavailable) {}
};

/**
 * @brief Exception for an extraction loop that exceeded its round limit.
 */
class ExtractionStalledException : public QrngException {
public:
    explicit ExtractionStalledException(const std::string& message)
        : QrngException(message, Error::ExtractionStalled) {}
};

/**
 * @brief Exception for cipher adapter failures.
 */
class CipherException : public QrngException {
public:
    explicit CipherException(const std::string& message)
        : QrngException(message, Error::CipherFailure) {}
};

} // namespace qrngkit

#endif // QRNGKIT_ERROR_HPP
