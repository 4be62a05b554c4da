#pragma once

#include <variant>
#include <string>
#include <stdexcept>
#include <utility>

namespace folio {

// Error codes for the collection store
enum class ErrorCode {
    OK = 0,
    // File level
    IO_ERROR,
    PAGE_NUMBER_TOO_HIGH,
    CORRUPTION,
    INVALID_ARGUMENT,
    // Page level
    NO_FREE_SPACE,
    DOCUMENT_NOT_FOUND,
    // Collection level
    DOCUMENT_TOO_BIG,
    DUPLICATE_ID,
    NOT_FOUND
};

// Error with code and message
class Error {
public:
    Error() : code_(ErrorCode::OK) {}
    Error(ErrorCode code, std::string message = "")
        : code_(code), message_(std::move(message)) {}

    ErrorCode code() const { return code_; }
    const std::string& message() const { return message_; }

    bool ok() const { return code_ == ErrorCode::OK; }
    explicit operator bool() const { return !ok(); }

    std::string to_string() const {
        if (message_.empty()) {
            return std::string(error_code_name(code_));
        }
        return std::string(error_code_name(code_)) + ": " + message_;
    }

    static const char* error_code_name(ErrorCode code) {
        switch (code) {
            case ErrorCode::OK: return "OK";
            case ErrorCode::IO_ERROR: return "IO_ERROR";
            case ErrorCode::PAGE_NUMBER_TOO_HIGH: return "PAGE_NUMBER_TOO_HIGH";
            case ErrorCode::CORRUPTION: return "CORRUPTION";
            case ErrorCode::INVALID_ARGUMENT: return "INVALID_ARGUMENT";
            case ErrorCode::NO_FREE_SPACE: return "NO_FREE_SPACE";
            case ErrorCode::DOCUMENT_NOT_FOUND: return "DOCUMENT_NOT_FOUND";
            case ErrorCode::DOCUMENT_TOO_BIG: return "DOCUMENT_TOO_BIG";
            case ErrorCode::DUPLICATE_ID: return "DUPLICATE_ID";
            case ErrorCode::NOT_FOUND: return "NOT_FOUND";
            default: return "UNKNOWN";
        }
    }

private:
    ErrorCode code_;
    std::string message_;
};

// Result type for operations that can fail.
// Holds either a value or an Error; value() on an error throws.
template<typename T>
class Result {
public:
    Result(T value) : data_(std::move(value)) {}

    Result(Error error) : data_(std::move(error)) {}
    Result(ErrorCode code, std::string message = "")
        : data_(Error(code, std::move(message))) {}

    bool ok() const { return std::holds_alternative<T>(data_); }
    explicit operator bool() const { return ok(); }

    T& value() & {
        if (!ok()) {
            throw std::runtime_error(error().to_string());
        }
        return std::get<T>(data_);
    }

    const T& value() const& {
        if (!ok()) {
            throw std::runtime_error(error().to_string());
        }
        return std::get<T>(data_);
    }

    T&& value() && {
        if (!ok()) {
            throw std::runtime_error(error().to_string());
        }
        return std::move(std::get<T>(data_));
    }

    // Access error (throws if success)
    const Error& error() const {
        if (ok()) {
            throw std::logic_error("Result has no error");
        }
        return std::get<Error>(data_);
    }

    ErrorCode error_code() const {
        if (ok()) {
            return ErrorCode::OK;
        }
        return error().code();
    }

    T* operator->() { return &value(); }
    const T* operator->() const { return &value(); }
    T& operator*() & { return value(); }
    const T& operator*() const& { return value(); }

private:
    std::variant<T, Error> data_;
};

// Specialization for void results
template<>
class Result<void> {
public:
    Result() : error_() {}
    Result(Error error) : error_(std::move(error)) {}
    Result(ErrorCode code, std::string message = "")
        : error_(Error(code, std::move(message))) {}

    bool ok() const { return error_.ok(); }
    explicit operator bool() const { return ok(); }

    const Error& error() const { return error_; }
    ErrorCode error_code() const { return error_.code(); }

    void value() const {
        if (!ok()) {
            throw std::runtime_error(error_.to_string());
        }
    }

private:
    Error error_;
};

inline Result<void> Ok() { return Result<void>(); }

}  // namespace folio
