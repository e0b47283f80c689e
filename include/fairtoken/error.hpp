#pragma once

#include "fairtoken/common.hpp"
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

namespace fairtoken {

// Error codes for structured error handling
enum class ErrorCode {
    // Generic errors
    Success = 0,
    Unknown,

    // Alphabet errors
    AlphabetEmpty,
    AlphabetUnsupported,
    AlphabetTooLarge,

    // Generation errors
    LengthNotPositive,
    RandomSourceUnavailable,

    // Configuration errors
    ConfigFileNotFound,
    ConfigParseFailed,
    ConfigInvalidValue
};

// Convert error code to string
const char* error_code_to_string(ErrorCode code);

// Error class with structured information
class Error {
public:
    Error(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    Error(ErrorCode code, std::string message, std::string details)
        : code_(code), message_(std::move(message)), details_(std::move(details)) {}

    ErrorCode code() const { return code_; }
    const std::string& message() const { return message_; }
    const std::string& details() const { return details_; }

    std::string to_string() const;

private:
    ErrorCode code_;
    std::string message_;
    std::string details_;
};

// Result type for non-throwing paths
template<typename T>
class Result {
public:
    static Result Ok(T value) {
        return Result(std::move(value));
    }

    static Result Err(Error error) {
        return Result(std::move(error));
    }

    static Result Err(ErrorCode code, const std::string& message) {
        return Result(Error(code, message));
    }

    bool is_ok() const { return std::holds_alternative<T>(value_); }
    bool is_err() const { return std::holds_alternative<Error>(value_); }

    // Get the value (throws if error)
    T& value() {
        if (is_err()) {
            throw std::runtime_error("Called value() on error Result: " + error().to_string());
        }
        return std::get<T>(value_);
    }

    const T& value() const {
        if (is_err()) {
            throw std::runtime_error("Called value() on error Result: " + error().to_string());
        }
        return std::get<T>(value_);
    }

    // Get the error (throws if ok)
    const Error& error() const {
        if (is_ok()) {
            throw std::runtime_error("Called error() on ok Result");
        }
        return std::get<Error>(value_);
    }

private:
    explicit Result(T value) : value_(std::move(value)) {}
    explicit Result(Error error) : value_(std::move(error)) {}

    std::variant<T, Error> value_;
};

// Custom exception classes
class FairtokenException : public std::runtime_error {
public:
    FairtokenException(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    ErrorCode code() const { return code_; }

private:
    ErrorCode code_;
};

/**
 * Raised when the generator cannot be set up: empty or unsupported
 * alphabet, or no secure random source. Never retried automatically.
 */
class ConfigurationError : public FairtokenException {
public:
    ConfigurationError(ErrorCode code, const std::string& message)
        : FairtokenException(code, message) {}
};

/**
 * Raised when a caller-supplied argument is out of its domain.
 */
class ValidationError : public FairtokenException {
public:
    ValidationError(ErrorCode code, const std::string& message)
        : FairtokenException(code, message) {}
};

} // namespace fairtoken
