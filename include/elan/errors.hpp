#pragma once

/**
 * @file errors.hpp
 * @brief Error and Result types used across the elan library
 *
 * Library operations never throw across the public API. Fallible calls
 * return Result<T>; exceptions raised by std::filesystem or third-party
 * parsers are caught at the call site and turned into an Error.
 *
 * @example
 * ```cpp
 * auto desc = elan::ToolchainDesc::fromResolvedStr("leanprover/lean4:v4.9.0");
 * if (desc.isErr()) {
 *     std::cerr << desc.error().message() << "\n";
 * }
 * ```
 */

#include <optional>
#include <string>
#include <utility>

namespace elan {

// ============================================================================
// Error Codes
// ============================================================================

/**
 * @brief Error kinds reported by elan operations
 */
enum class ErrorCode {
    // Names and configuration
    INVALID_NAME,
    INVALID_CONFIG_FILE,
    NO_DEFAULT_TOOLCHAIN,

    // Remote resolution and download
    NETWORK_UNAVAILABLE,
    REMOTE_FETCH_FAILED,
    UNSUPPORTED_CHANNEL,
    ASSET_NOT_FOUND_FOR_PLATFORM,
    CHECKSUM_FAILED,

    // Installation
    ARCHIVE_FORMAT_UNSUPPORTED,
    ALREADY_INSTALLED,
    NOT_INSTALLED,
    BINARY_NOT_FOUND,
    RECURSION_LIMIT,

    // System / IO
    IO_ERROR,
};

/// Stable identifier for an error code (used in JSON output)
const char* error_code_to_string(ErrorCode code);

/**
 * @brief Error type with code and message
 */
class Error {
public:
    Error(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    Error& withContext(const std::string& context) {
        message_ = context + ": " + message_;
        return *this;
    }

    ErrorCode code() const { return code_; }
    const std::string& message() const { return message_; }
    std::string toString() const { return message_; }

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

using VoidResult = Result<void>;

} // namespace elan
