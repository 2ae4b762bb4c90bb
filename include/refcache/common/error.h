// =============================================================================
// refcache - Error Handling Framework
// =============================================================================
// Error handling for the refcache library.
//
// This module provides:
// - ErrorCode enum matching CLI exit codes
// - RefCacheException hierarchy for structured error handling
// - Result<T, E> type for functional error handling (using std::expected)
// - Error context and message support
//
// Exit Code Convention:
// - 0: Success
// - 1: Usage/argument error
// - 2: I/O error (file not found, read/write failure)
// - 3: Format error (malformed input data)
// - 4: Fetch failure (non-success HTTP response, transport error, timeout)
// - 5: Unsupported format (GTF annotation, unrecognized compression)
// - 6: External tool or indexing library failure
// - 7: Lock wait exceeded the configured timeout
// - 8: Inventory store inconsistency
// - 9: Inventory store (SQLite) error
// - 10: Configuration / catalog error
//
// Naming Conventions:
// - Enums: PascalCase with kConstant values
// - Classes: PascalCase
// - Functions: camelCase
// - Constants: kConstant
// =============================================================================

#ifndef REFCACHE_COMMON_ERROR_H
#define REFCACHE_COMMON_ERROR_H

#include <cstdint>
#include <exception>
#include <expected>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>
#include <variant>

namespace refcache {

// =============================================================================
// Error Code Enumeration
// =============================================================================

/// @brief Error codes matching CLI exit codes.
/// @note These values are used as process exit codes.
enum class ErrorCode : std::uint8_t {
    /// @brief Operation completed successfully.
    kSuccess = 0,

    /// @brief Usage or argument error.
    kUsageError = 1,

    /// @brief I/O error.
    /// @note File not found, read/write failure, rename failure, etc.
    kIOError = 2,

    /// @brief Malformed input data (e.g. a feature line without a start column).
    kFormatError = 3,

    /// @brief Remote retrieval failed.
    /// @note Any response other than success or "not modified", transport
    ///       errors and timeouts.
    kFetchFailure = 4,

    /// @brief Input is in a format the cache refuses to handle.
    /// @note GTF-family annotation, unrecognized compression.
    kUnsupportedFormat = 5,

    /// @brief External compress/sort/index step exited abnormally.
    kToolFailure = 6,

    /// @brief Lock wait exceeded the configured bound.
    kLockTimeout = 7,

    /// @brief A stored record violates the store invariants.
    kStoreInconsistency = 8,

    /// @brief The inventory database reported an error.
    kStoreError = 9,

    /// @brief Invalid configuration or catalog.
    kConfigError = 10
};

/// @brief Convert ErrorCode to its integer exit code value.
/// @param code The error code.
/// @return Integer exit code suitable for process exit.
[[nodiscard]] constexpr int toExitCode(ErrorCode code) noexcept {
    return static_cast<int>(code);
}

/// @brief Convert ErrorCode to string representation.
/// @param code The error code.
/// @return Human-readable string describing the error category.
[[nodiscard]] constexpr std::string_view errorCodeToString(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::kSuccess:
            return "success";
        case ErrorCode::kUsageError:
            return "usage error";
        case ErrorCode::kIOError:
            return "I/O error";
        case ErrorCode::kFormatError:
            return "format error";
        case ErrorCode::kFetchFailure:
            return "fetch failure";
        case ErrorCode::kUnsupportedFormat:
            return "unsupported format";
        case ErrorCode::kToolFailure:
            return "tool failure";
        case ErrorCode::kLockTimeout:
            return "lock timeout";
        case ErrorCode::kStoreInconsistency:
            return "store inconsistency";
        case ErrorCode::kStoreError:
            return "store error";
        case ErrorCode::kConfigError:
            return "config error";
    }
    return "unknown error";
}

// =============================================================================
// Error Context Structure
// =============================================================================

/// @brief Additional context information for errors.
/// @note Provides detailed information about where and why an error occurred.
struct ErrorContext {
    /// @brief File path associated with the error (if applicable).
    std::string filePath;

    /// @brief Remote URL associated with the error (if applicable).
    std::string url;

    /// @brief Natural key of the genome being processed, as "provider/species/assembly".
    std::string genomeKey;

    /// @brief Line number in a text input (if applicable).
    std::optional<std::uint64_t> lineNumber;

    /// @brief Source location where the error was created.
    std::source_location location;

    /// @brief Default constructor with current source location.
    ErrorContext(std::source_location loc = std::source_location::current()) : location(loc) {}

    /// @brief Construct with file path.
    explicit ErrorContext(std::string path,
                          std::source_location loc = std::source_location::current())
        : filePath(std::move(path)), location(loc) {}

    /// @brief Set the file path.
    /// @return Reference to this for method chaining.
    ErrorContext& withFile(std::string path) {
        filePath = std::move(path);
        return *this;
    }

    /// @brief Set the remote URL.
    /// @return Reference to this for method chaining.
    ErrorContext& withUrl(std::string value) {
        url = std::move(value);
        return *this;
    }

    /// @brief Set the genome key.
    /// @return Reference to this for method chaining.
    ErrorContext& withKey(std::string key) {
        genomeKey = std::move(key);
        return *this;
    }

    /// @brief Set the line number.
    /// @return Reference to this for method chaining.
    ErrorContext& withLine(std::uint64_t line) {
        lineNumber = line;
        return *this;
    }

    /// @brief Format context as a string for error messages.
    [[nodiscard]] std::string format() const;
};

// =============================================================================
// Base Exception Class
// =============================================================================

/// @brief Base exception class for all refcache errors.
/// @note Provides error code, message, and optional context.
class RefCacheException : public std::exception {
public:
    /// @brief Construct with error code and message.
    RefCacheException(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {
        formatWhat();
    }

    /// @brief Construct with error code, message, and context.
    RefCacheException(ErrorCode code, std::string message, ErrorContext context)
        : code_(code), message_(std::move(message)), context_(std::move(context)) {
        formatWhat();
    }

    ~RefCacheException() override = default;

    RefCacheException(const RefCacheException&) = default;
    RefCacheException(RefCacheException&&) noexcept = default;
    RefCacheException& operator=(const RefCacheException&) = default;
    RefCacheException& operator=(RefCacheException&&) noexcept = default;

    /// @brief Get the formatted error message including category and context.
    [[nodiscard]] const char* what() const noexcept override { return what_.c_str(); }

    /// @brief Get the error code.
    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    /// @brief Get the exit code for this error.
    [[nodiscard]] int exitCode() const noexcept { return toExitCode(code_); }

    /// @brief Get the error message (without context).
    [[nodiscard]] const std::string& message() const noexcept { return message_; }

    /// @brief Get the error context.
    [[nodiscard]] const std::optional<ErrorContext>& context() const noexcept { return context_; }

protected:
    /// @brief Format the what() string from message and context.
    void formatWhat();

    ErrorCode code_;
    std::string message_;
    std::optional<ErrorContext> context_;
    std::string what_;
};

// =============================================================================
// Specific Exception Classes
// =============================================================================

/// @brief Exception for usage and argument errors (exit code 1).
class UsageError : public RefCacheException {
public:
    explicit UsageError(std::string message)
        : RefCacheException(ErrorCode::kUsageError, std::move(message)) {}

    UsageError(std::string message, ErrorContext context)
        : RefCacheException(ErrorCode::kUsageError, std::move(message), std::move(context)) {}
};

/// @brief Exception for I/O errors (exit code 2).
/// @note Thrown for open/read/write/rename failures, permission denied,
///       disk full, etc.
class IOError : public RefCacheException {
public:
    /// @brief Construct with message.
    explicit IOError(std::string message)
        : RefCacheException(ErrorCode::kIOError, std::move(message)) {}

    /// @brief Construct with message and context.
    IOError(std::string message, ErrorContext context)
        : RefCacheException(ErrorCode::kIOError, std::move(message), std::move(context)) {}

    /// @brief Construct from system error code.
    IOError(std::string message, std::error_code ec)
        : RefCacheException(ErrorCode::kIOError, formatWithSystemError(message, ec)),
          systemError_(ec) {}

    /// @brief Construct from system error code with context.
    IOError(std::string message, std::error_code ec, ErrorContext context)
        : RefCacheException(ErrorCode::kIOError, formatWithSystemError(message, ec),
                            std::move(context)),
          systemError_(ec) {}

    /// @brief Get the system error code (if available).
    [[nodiscard]] const std::optional<std::error_code>& systemError() const noexcept {
        return systemError_;
    }

private:
    static std::string formatWithSystemError(const std::string& message, std::error_code ec);

    std::optional<std::error_code> systemError_;
};

/// @brief Exception for malformed input data (exit code 3).
class FormatError : public RefCacheException {
public:
    explicit FormatError(std::string message)
        : RefCacheException(ErrorCode::kFormatError, std::move(message)) {}

    FormatError(std::string message, ErrorContext context)
        : RefCacheException(ErrorCode::kFormatError, std::move(message), std::move(context)) {}
};

/// @brief Exception for failed remote retrieval (exit code 4).
/// @note Carries the HTTP status when the origin answered at all.
class FetchFailure : public RefCacheException {
public:
    /// @brief Construct for a transport-level failure (no HTTP status).
    explicit FetchFailure(std::string message)
        : RefCacheException(ErrorCode::kFetchFailure, std::move(message)) {}

    /// @brief Construct for a transport-level failure with context.
    FetchFailure(std::string message, ErrorContext context)
        : RefCacheException(ErrorCode::kFetchFailure, std::move(message), std::move(context)) {}

    /// @brief Construct for an unexpected HTTP status.
    FetchFailure(long httpStatus, ErrorContext context)
        : RefCacheException(ErrorCode::kFetchFailure, formatHttpStatus(httpStatus),
                            std::move(context)),
          httpStatus_(httpStatus) {}

    /// @brief Get the HTTP status code (if the origin responded).
    [[nodiscard]] std::optional<long> httpStatus() const noexcept { return httpStatus_; }

private:
    static std::string formatHttpStatus(long httpStatus);

    std::optional<long> httpStatus_;
};

/// @brief Exception for formats the cache refuses to process (exit code 5).
class UnsupportedFormat : public RefCacheException {
public:
    explicit UnsupportedFormat(std::string message)
        : RefCacheException(ErrorCode::kUnsupportedFormat, std::move(message)) {}

    UnsupportedFormat(std::string message, ErrorContext context)
        : RefCacheException(ErrorCode::kUnsupportedFormat, std::move(message),
                            std::move(context)) {}
};

/// @brief Exception for external compress/sort/index failures (exit code 6).
/// @note Raised both for subprocesses that exit abnormally and for htslib
///       index builders that report failure.
class ToolFailure : public RefCacheException {
public:
    explicit ToolFailure(std::string message)
        : RefCacheException(ErrorCode::kToolFailure, std::move(message)) {}

    ToolFailure(std::string message, ErrorContext context)
        : RefCacheException(ErrorCode::kToolFailure, std::move(message), std::move(context)) {}

    /// @brief Construct with the failing tool name and its exit status.
    ToolFailure(std::string_view tool, int exitStatus, ErrorContext context)
        : RefCacheException(ErrorCode::kToolFailure, formatExitStatus(tool, exitStatus),
                            std::move(context)),
          exitStatus_(exitStatus) {}

    /// @brief Get the tool's exit status (if a subprocess was involved).
    [[nodiscard]] std::optional<int> exitStatus() const noexcept { return exitStatus_; }

private:
    static std::string formatExitStatus(std::string_view tool, int exitStatus);

    std::optional<int> exitStatus_;
};

/// @brief Exception for a lock wait that exceeded its bound (exit code 7).
class LockTimeout : public RefCacheException {
public:
    explicit LockTimeout(std::string message)
        : RefCacheException(ErrorCode::kLockTimeout, std::move(message)) {}

    LockTimeout(std::string message, ErrorContext context)
        : RefCacheException(ErrorCode::kLockTimeout, std::move(message), std::move(context)) {}
};

/// @brief Exception for records that violate store invariants (exit code 8).
class StoreInconsistency : public RefCacheException {
public:
    explicit StoreInconsistency(std::string message)
        : RefCacheException(ErrorCode::kStoreInconsistency, std::move(message)) {}

    StoreInconsistency(std::string message, ErrorContext context)
        : RefCacheException(ErrorCode::kStoreInconsistency, std::move(message),
                            std::move(context)) {}
};

/// @brief Exception for SQLite failures (exit code 9).
class StoreError : public RefCacheException {
public:
    explicit StoreError(std::string message)
        : RefCacheException(ErrorCode::kStoreError, std::move(message)) {}

    StoreError(std::string message, ErrorContext context)
        : RefCacheException(ErrorCode::kStoreError, std::move(message), std::move(context)) {}
};

/// @brief Exception for invalid configuration or catalog (exit code 10).
class ConfigError : public RefCacheException {
public:
    explicit ConfigError(std::string message)
        : RefCacheException(ErrorCode::kConfigError, std::move(message)) {}

    ConfigError(std::string message, ErrorContext context)
        : RefCacheException(ErrorCode::kConfigError, std::move(message), std::move(context)) {}
};

// =============================================================================
// Result Type (using std::expected)
// =============================================================================

/// @brief Error type for Result, wrapping ErrorCode and message.
class Error {
public:
    Error(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    /// @brief Construct from a RefCacheException, keeping its message and context.
    explicit Error(const RefCacheException& ex) : code_(ex.code()), message_(ex.message()) {
        if (ex.context().has_value()) {
            auto detail = ex.context()->format();
            if (!detail.empty()) {
                message_ += " (" + detail + ")";
            }
        }
    }

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    [[nodiscard]] const std::string& message() const noexcept { return message_; }

    [[nodiscard]] int exitCode() const noexcept { return toExitCode(code_); }

    /// @brief Throw the exception type matching the error code.
    [[noreturn]] void throwException() const;

private:
    ErrorCode code_;
    std::string message_;
};

/// @brief Result type for operations that can fail.
template <typename T, typename E = Error>
using Result = std::expected<T, E>;

/// @brief Result type for operations that return nothing on success.
using VoidResult = Result<std::monostate>;

[[nodiscard]] inline VoidResult makeVoidSuccess() {
    return VoidResult{std::monostate{}};
}

[[nodiscard]] inline VoidResult makeVoidError(ErrorCode code, std::string message) {
    return std::unexpected(Error{code, std::move(message)});
}

// =============================================================================
// Utility Functions
// =============================================================================

/// @brief Convert a Result to an exception if it contains an error.
/// @throws RefCacheException (or derived) if the result contains an error.
template <typename T>
[[nodiscard]] T unwrapOrThrow(Result<T> result) {
    if (result.has_value()) {
        return std::move(result.value());
    }
    result.error().throwException();
}

/// @brief Convert a Result to an exception if it contains an error (void version).
inline void unwrapOrThrow(VoidResult result) {
    if (!result.has_value()) {
        result.error().throwException();
    }
}

/// @brief Execute a function and convert exceptions to Result.
template <typename F>
[[nodiscard]] auto tryExecute(F&& func)
    -> Result<std::conditional_t<std::is_void_v<decltype(func())>, std::monostate,
                                 decltype(func())>> {
    using ReturnType = decltype(func());
    try {
        if constexpr (std::is_void_v<ReturnType>) {
            func();
            return std::monostate{};
        } else {
            return func();
        }
    } catch (const RefCacheException& ex) {
        return std::unexpected(Error{ex});
    } catch (const std::exception& ex) {
        return std::unexpected(Error{ErrorCode::kIOError, ex.what()});
    }
}

}  // namespace refcache

#endif  // REFCACHE_COMMON_ERROR_H
