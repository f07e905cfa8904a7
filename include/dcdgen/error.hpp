/**
 * @file error.hpp
 * @brief dcdgen error handling.
 *
 * Provides both exception-based and error-code-based error handling
 * for embedded compatibility (-fno-exceptions).
 */

#ifndef DCDGEN_ERROR_HPP
#define DCDGEN_ERROR_HPP

#include "config.hpp"

#if !DCDGEN_NO_EXCEPTIONS
#include <stdexcept>
#include <string>
#endif

namespace dcdgen {

/**
 * @brief Error codes for error-code-based error handling.
 *
 * Used by every noexcept API, and on their own when exceptions are
 * disabled (DCDGEN_NO_EXCEPTIONS=1).
 */
enum class Error {
    Ok = 0,              ///< Success
    InvalidArg = -1,     ///< Invalid argument
    OversizedBlock = -2, ///< Block length exceeds MAX_BLOCK_LENGTH
    SinkFailure = -3,    ///< Output sink rejected a write
    InvalidData = -4     ///< Malformed block or script
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
    case Error::InvalidArg:
        return "Invalid argument";
    case Error::OversizedBlock:
        return "DCD byte length too large";
    case Error::SinkFailure:
        return "Output sink write failed";
    case Error::InvalidData:
        return "Invalid or corrupted data";
    default:
        return "Unknown error";
    }
}

#if !DCDGEN_NO_EXCEPTIONS

/**
 * @brief Base exception for dcdgen errors.
 */
class DcdException : public std::runtime_error {
public:
    explicit DcdException(const std::string& message, Error code = Error::InvalidArg)
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
class InvalidArgumentException : public DcdException {
public:
    explicit InvalidArgumentException(const std::string& message)
        : DcdException(message, Error::InvalidArg) {}
};

/**
 * @brief Exception for blocks that do not fit the 16-bit length field.
 */
class OversizedBlockException : public DcdException {
public:
    explicit OversizedBlockException(const std::string& message)
        : DcdException(message, Error::OversizedBlock) {}
};

/**
 * @brief Exception for a failing output sink.
 */
class SinkException : public DcdException {
public:
    explicit SinkException(const std::string& message)
        : DcdException(message, Error::SinkFailure) {}
};

/**
 * @brief Exception for invalid/corrupted data.
 */
class InvalidDataException : public DcdException {
public:
    explicit InvalidDataException(const std::string& message)
        : DcdException(message, Error::InvalidData) {}
};

/**
 * @brief Throw the exception matching an error code.
 *
 * Does nothing for Error::Ok.
 *
 * @param error Error code
 * @param context Prefix for the exception message
 */
inline void throw_if_error(Error error, const std::string& context) {
    if (error == Error::Ok) {
        return;
    }
    std::string message = context + ": " + error_string(error);
    switch (error) {
    case Error::OversizedBlock:
        throw OversizedBlockException(message);
    case Error::SinkFailure:
        throw SinkException(message);
    case Error::InvalidData:
        throw InvalidDataException(message);
    case Error::InvalidArg:
        throw InvalidArgumentException(message);
    default:
        throw DcdException(message, error);
    }
}

#endif // !DCDGEN_NO_EXCEPTIONS

} // namespace dcdgen

#endif // DCDGEN_ERROR_HPP
