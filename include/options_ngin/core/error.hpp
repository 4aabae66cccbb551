// include/options_ngin/core/error.hpp

#pragma once

#include <exception>
#include <memory>
#include <stdexcept>
#include <string>

namespace options_ngin {

/**
 * @brief Error codes for the scanner
 * Groups follow the pipeline stages that can produce them
 */
enum class ErrorCode {
    NONE = 0,
    UNKNOWN_ERROR = 1,
    INVALID_ARGUMENT = 2,
    NOT_INITIALIZED = 3,

    // Data errors
    DATA_NOT_FOUND = 4,
    INVALID_DATA = 5,
    CONVERSION_ERROR = 6,

    // Upstream collaborators
    MARKET_DATA_ERROR = 7,
    NEWS_DATA_ERROR = 8,

    // Sentiment model errors
    MODEL_UNAVAILABLE = 9,
    MODEL_INFERENCE_ERROR = 10,

    // Scheduling
    TIMEOUT_ERROR = 11,
    CANCELLED = 12,

    // Orchestration bugs (scorer invoked with mismatched inputs)
    CONTRACT_VIOLATION = 13,

    // File and I/O errors
    FILE_NOT_FOUND = 14,
    FILE_IO_ERROR = 15,

    // JSON and parsing errors
    JSON_PARSE_ERROR = 16,

    // Pricing engine startup verification
    SELF_TEST_FAILED = 17,

    // Custom error range
    CUSTOM_ERROR_START = 1000
};

/**
 * @brief Convert an error code to its symbolic name
 */
inline std::string error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::NONE:
            return "NONE";
        case ErrorCode::UNKNOWN_ERROR:
            return "UNKNOWN_ERROR";
        case ErrorCode::INVALID_ARGUMENT:
            return "INVALID_ARGUMENT";
        case ErrorCode::NOT_INITIALIZED:
            return "NOT_INITIALIZED";
        case ErrorCode::DATA_NOT_FOUND:
            return "DATA_NOT_FOUND";
        case ErrorCode::INVALID_DATA:
            return "INVALID_DATA";
        case ErrorCode::CONVERSION_ERROR:
            return "CONVERSION_ERROR";
        case ErrorCode::MARKET_DATA_ERROR:
            return "MARKET_DATA_ERROR";
        case ErrorCode::NEWS_DATA_ERROR:
            return "NEWS_DATA_ERROR";
        case ErrorCode::MODEL_UNAVAILABLE:
            return "MODEL_UNAVAILABLE";
        case ErrorCode::MODEL_INFERENCE_ERROR:
            return "MODEL_INFERENCE_ERROR";
        case ErrorCode::TIMEOUT_ERROR:
            return "TIMEOUT_ERROR";
        case ErrorCode::CANCELLED:
            return "CANCELLED";
        case ErrorCode::CONTRACT_VIOLATION:
            return "CONTRACT_VIOLATION";
        case ErrorCode::FILE_NOT_FOUND:
            return "FILE_NOT_FOUND";
        case ErrorCode::FILE_IO_ERROR:
            return "FILE_IO_ERROR";
        case ErrorCode::JSON_PARSE_ERROR:
            return "JSON_PARSE_ERROR";
        case ErrorCode::SELF_TEST_FAILED:
            return "SELF_TEST_FAILED";
        default:
            return "CUSTOM_ERROR";
    }
}

/**
 * @brief Exception type carried by every failed Result
 */
class TradeError : public std::runtime_error {
public:
    /**
     * @brief Constructor for TradeError
     * @param code The error code
     * @param message Detailed error message
     * @param component Component where error occurred
     */
    TradeError(ErrorCode code, const std::string& message, const std::string& component = "")
        : std::runtime_error(message), code_(code), component_(component) {}

    ErrorCode code() const noexcept {
        return code_;
    }

    const std::string& component() const noexcept {
        return component_;
    }

    /**
     * @brief Convert error to string representation
     * @return Formatted error string
     */
    std::string to_string() const {
        return "Error in " + component_ + ": " + what() + " (" + error_code_to_string(code_) +
               ")";
    }

private:
    ErrorCode code_;
    std::string component_;
};

/**
 * @brief Result type for operations that can fail
 * @tparam T The type of the successful result
 */
template <typename T>
class Result {
public:
    template <typename U = T>
    Result(U&& value) : value_(std::forward<U>(value)), error_(nullptr) {}

    Result(std::unique_ptr<TradeError> error) : error_(std::move(error)) {}

    Result(Result&& other) noexcept
        : value_(std::move(other.value_)), error_(std::move(other.error_)) {}

    Result& operator=(Result&& other) noexcept {
        if (this != &other) {
            value_ = std::move(other.value_);
            error_ = std::move(other.error_);
        }
        return *this;
    }

    Result(const Result&) = delete;
    Result& operator=(const Result&) = delete;

    bool is_ok() const {
        return error_ == nullptr;
    }

    bool is_error() const {
        return error_ != nullptr;
    }

    /**
     * @brief Get the success value
     * @return Reference to the contained value
     * @throws TradeError if result represents an error
     */
    const T& value() const {
        if (error_)
            throw *error_;
        return value_;
    }

    /**
     * @brief Move the success value out, leaving a moved-from value behind
     * @throws TradeError if result represents an error
     */
    T take() {
        if (error_)
            throw *error_;
        return std::move(value_);
    }

    /**
     * @brief Get the error if present
     * @return Pointer to the error, or nullptr if success
     */
    const TradeError* error() const {
        return error_.get();
    }

private:
    T value_;
    std::unique_ptr<TradeError> error_;
};

// Specialization for void
template <>
class Result<void> {
public:
    Result() : error_(nullptr) {}
    Result(std::unique_ptr<TradeError> error) : error_(std::move(error)) {}

    bool is_ok() const {
        return error_ == nullptr;
    }
    bool is_error() const {
        return error_ != nullptr;
    }

    void value() const {
        if (error_)
            throw *error_;
    }

    const TradeError* error() const {
        return error_.get();
    }

private:
    std::unique_ptr<TradeError> error_;
};

/**
 * @brief Helper for creating error results
 * @param code The error code
 * @param message The error message
 * @param component The component where error occurred
 */
template <typename T>
Result<T> make_error(ErrorCode code, const std::string& message,
                     const std::string& component = "") {
    return Result<T>(std::make_unique<TradeError>(code, message, component));
}

/**
 * @brief Re-raise an upstream error under this component, keeping its code
 * @param context Prepended to the upstream message as "context: message" when set
 */
template <typename T>
Result<T> forward_error(const TradeError& upstream, const std::string& component,
                        const std::string& context = "") {
    std::string message = context.empty() ? std::string(upstream.what())
                                          : context + ": " + upstream.what();
    return make_error<T>(upstream.code(), message, component);
}

}  // namespace options_ngin
