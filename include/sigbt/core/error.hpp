// include/sigbt/core/error.hpp
#pragma once

#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace sigbt {

enum class ErrorCode {
    UNKNOWN_ERROR = 1,
    INVALID_ARGUMENT = 2,
    NOT_INITIALIZED = 3,

    // Rejected inputs; a run never starts
    INVALID_CONFIG = 10,  // Out-of-range simulation or analysis parameter
    INVALID_DATA = 11,    // Bar breaks the OHLC, signal or ordering contract
    CONVERSION_ERROR = 12,

    // Files
    FILE_NOT_FOUND = 20,
    FILE_IO_ERROR = 21,
    JSON_PARSE_ERROR = 22
};

inline std::string error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::UNKNOWN_ERROR:
            return "UNKNOWN_ERROR";
        case ErrorCode::INVALID_ARGUMENT:
            return "INVALID_ARGUMENT";
        case ErrorCode::NOT_INITIALIZED:
            return "NOT_INITIALIZED";
        case ErrorCode::INVALID_CONFIG:
            return "INVALID_CONFIG";
        case ErrorCode::INVALID_DATA:
            return "INVALID_DATA";
        case ErrorCode::CONVERSION_ERROR:
            return "CONVERSION_ERROR";
        case ErrorCode::FILE_NOT_FOUND:
            return "FILE_NOT_FOUND";
        case ErrorCode::FILE_IO_ERROR:
            return "FILE_IO_ERROR";
        case ErrorCode::JSON_PARSE_ERROR:
            return "JSON_PARSE_ERROR";
    }
    return "UNKNOWN_ERROR";
}

/**
 * @brief Error carried by a failed Result, thrown by Result::value()
 */
class SimError : public std::runtime_error {
public:
    SimError(ErrorCode code, const std::string& message, const std::string& component = "")
        : std::runtime_error(message), code_(code), component_(component) {}

    ErrorCode code() const noexcept {
        return code_;
    }

    const std::string& component() const noexcept {
        return component_;
    }

    // "[component] message (CODE)", suitable for a single log line
    std::string to_string() const {
        std::string text;
        if (!component_.empty()) {
            text += "[" + component_ + "] ";
        }
        return text + what() + " (" + error_code_to_string(code_) + ")";
    }

private:
    ErrorCode code_;
    std::string component_;
};

/**
 * @brief Value or error returned by every fallible operation
 *
 * Move-only. Check is_ok() before value(); value() and take_value() rethrow
 * the stored SimError when called on a failure.
 */
template <typename T>
class Result {
public:
    template <typename U = T>
    Result(U&& value) : value_(std::forward<U>(value)) {}

    Result(std::unique_ptr<SimError> error) : error_(std::move(error)) {}

    Result(Result&&) = default;
    Result& operator=(Result&&) = default;
    Result(const Result&) = delete;
    Result& operator=(const Result&) = delete;

    bool is_ok() const {
        return error_ == nullptr;
    }

    bool is_error() const {
        return error_ != nullptr;
    }

    const T& value() const {
        if (error_)
            throw *error_;
        return *value_;
    }

    // Leaves the result holding a moved-from value
    T take_value() {
        if (error_)
            throw *error_;
        return std::move(*value_);
    }

    const SimError* error() const {
        return error_.get();
    }

private:
    std::optional<T> value_;
    std::unique_ptr<SimError> error_;
};

template <>
class Result<void> {
public:
    Result() = default;
    Result(std::unique_ptr<SimError> error) : error_(std::move(error)) {}

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

    const SimError* error() const {
        return error_.get();
    }

private:
    std::unique_ptr<SimError> error_;
};

template <typename T>
Result<T> make_error(ErrorCode code, const std::string& message,
                     const std::string& component = "") {
    return Result<T>(std::make_unique<SimError>(code, message, component));
}

/**
 * @brief Re-raise a failure from a callee under the caller's component
 *
 * Keeps the callee's code and message, so a config error surfacing through
 * the runner is still INVALID_CONFIG.
 */
template <typename T>
Result<T> forward_error(const SimError& error, const std::string& component) {
    return make_error<T>(error.code(), error.what(), component);
}

}  // namespace sigbt
