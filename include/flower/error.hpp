/**
 * @file error.hpp
 * @brief flower error handling.
 *
 * Provides both exception-based and error-code-based error handling.
 * Library operations return error codes; throw_if_error() converts a code
 * for callers that prefer exceptions.
 */

#ifndef FLOWER_ERROR_HPP
#define FLOWER_ERROR_HPP

#include "config.hpp"

#if !FLOWER_NO_EXCEPTIONS
#include <stdexcept>
#include <string>
#endif

namespace flower {

/**
 * @brief Error codes returned by every fallible operation.
 */
enum class Error {
    Ok = 0,               ///< Success
    InvalidArg = -1,      ///< Invalid argument
    AllocationError = -2, ///< Storage or chunk buffer allocation failed
    IndexOutOfRange = -3, ///< Bit index or byte range outside the array
    InvalidData = -4      ///< Invalid/corrupted serialized data
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
    case Error::AllocationError:
        return "Allocation failed";
    case Error::IndexOutOfRange:
        return "Index out of range";
    case Error::InvalidData:
        return "Invalid or corrupted data";
    default:
        return "Unknown error";
    }
}

#if !FLOWER_NO_EXCEPTIONS

/**
 * @brief Base exception for flower errors.
 */
class FlowerException : public std::runtime_error {
public:
    explicit FlowerException(const std::string& message, Error code = Error::InvalidArg)
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
class InvalidArgumentException : public FlowerException {
public:
    explicit InvalidArgumentException(const std::string& message)
        : FlowerException(message, Error::InvalidArg) {}
};

/**
 * @brief Exception for failed allocations.
 */
class AllocationException : public FlowerException {
public:
    explicit AllocationException(const std::string& message)
        : FlowerException(message, Error::AllocationError) {}
};

/**
 * @brief Exception for out-of-range indices and offsets.
 */
class IndexOutOfRangeException : public FlowerException {
public:
    explicit IndexOutOfRangeException(const std::string& message)
        : FlowerException(message, Error::IndexOutOfRange) {}
};

/**
 * @brief Exception for invalid/corrupted data.
 */
class InvalidDataException : public FlowerException {
public:
    explicit InvalidDataException(const std::string& message)
        : FlowerException(message, Error::InvalidData) {}
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
    const std::string message = context + ": " + error_string(error);
    switch (error) {
    case Error::AllocationError:
        throw AllocationException(message);
    case Error::IndexOutOfRange:
        throw IndexOutOfRangeException(message);
    case Error::InvalidData:
        throw InvalidDataException(message);
    case Error::InvalidArg:
        throw InvalidArgumentException(message);
    default:
        throw FlowerException(message, error);
    }
}

#endif // !FLOWER_NO_EXCEPTIONS

} // namespace flower

#endif // FLOWER_ERROR_HPP
