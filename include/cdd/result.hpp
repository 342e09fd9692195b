#pragma once

/**
 * @file result.hpp
 * @brief Error handling types shared by the cdd library
 *
 * Operations that either produce a value or fail outright return Result<T>.
 * Operations whose failures must travel into a report (step results,
 * assertion results, diagnostics) carry string codes instead.
 *
 * @example
 * ```cpp
 * auto doc = cdd::load_contract_document("contracts/feature.yaml");
 * if (doc.isErr()) {
 *     std::cerr << doc.error().message() << "\n";
 * }
 * ```
 */

#include <optional>
#include <string>
#include <utility>

namespace cdd {

// ============================================================================
// Error Handling
// ============================================================================

/**
 * @brief Error codes for cdd library operations
 */
enum class ErrorCode {
    // System / IO
    FILE_NOT_FOUND,
    IO_ERROR,

    // Contract documents
    PARSE_ERROR,
    INVALID_CONTRACT,
    UNSUPPORTED_FEATURE,

    // Executors
    UNKNOWN_EXECUTOR,
    DUPLICATE_EXECUTOR,

    // Isolation
    NO_PROJECT_ROOT,
    INVALID_PATH,
    SETUP_FAILED,
};

inline const char* error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::FILE_NOT_FOUND: return "file_not_found";
        case ErrorCode::IO_ERROR: return "io_error";
        case ErrorCode::PARSE_ERROR: return "parse_error";
        case ErrorCode::INVALID_CONTRACT: return "invalid_contract";
        case ErrorCode::UNSUPPORTED_FEATURE: return "unsupported_feature";
        case ErrorCode::UNKNOWN_EXECUTOR: return "unknown_executor";
        case ErrorCode::DUPLICATE_EXECUTOR: return "duplicate_executor";
        case ErrorCode::NO_PROJECT_ROOT: return "no_project_root";
        case ErrorCode::INVALID_PATH: return "invalid_path";
        case ErrorCode::SETUP_FAILED: return "setup_failed";
        default: return "unknown";
    }
}

/**
 * @brief Error type with code and message
 */
class Error {
public:
    Error(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    ErrorCode code() const { return code_; }
    const std::string& message() const { return message_; }

private:
    ErrorCode code_;
    std::string message_;
};

// ============================================================================
// Result Type
// ============================================================================

/**
 * @brief Result type for fallible operations
 * @tparam T The success value type
 * @tparam E The error type (default: Error)
 *
 * Check isOk() before accessing value(), or isErr() before error().
 */
template<typename T, typename E = Error>
class Result {
public:
    static Result ok(T value) { return Result(std::move(value)); }
    static Result err(E error) { return Result(std::move(error)); }

    bool isOk() const { return has_value_; }
    bool isErr() const { return !has_value_; }

    T& value() { return value_.value(); }
    const T& value() const { return value_.value(); }
    E& error() { return error_.value(); }
    const E& error() const { return error_.value(); }

private:
    explicit Result(T value) : has_value_(true), value_(std::move(value)) {}
    explicit Result(E error) : has_value_(false), error_(std::move(error)) {}

    bool has_value_;
    std::optional<T> value_;
    std::optional<E> error_;
};

template<typename E>
class Result<void, E> {
public:
    static Result ok() { return Result(true, std::nullopt); }
    static Result err(E error) { return Result(false, std::move(error)); }

    bool isOk() const { return has_value_; }
    bool isErr() const { return !has_value_; }

    void value() const {}
    E& error() { return error_.value(); }
    const E& error() const { return error_.value(); }

private:
    Result(bool hv, std::optional<E> err) : has_value_(hv), error_(std::move(err)) {}
    bool has_value_;
    std::optional<E> error_;
};

} // namespace cdd
