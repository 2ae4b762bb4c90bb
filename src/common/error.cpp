// =============================================================================
// refcache - Error Handling Framework Implementation
// =============================================================================

#include "refcache/common/error.h"

#include <format>
#include <sstream>

namespace refcache {

// =============================================================================
// ErrorContext Implementation
// =============================================================================

std::string ErrorContext::format() const {
    std::ostringstream oss;
    bool hasContent = false;

    auto separate = [&]() {
        if (hasContent) {
            oss << ", ";
        }
        hasContent = true;
    };

    if (!genomeKey.empty()) {
        separate();
        oss << "genome: " << genomeKey;
    }

    if (!url.empty()) {
        separate();
        oss << "url: " << url;
    }

    if (!filePath.empty()) {
        separate();
        oss << "file: " << filePath;
    }

    if (lineNumber.has_value()) {
        separate();
        oss << "line: " << *lineNumber;
    }

#ifndef NDEBUG
    if (hasContent) {
        oss << " (at " << location.file_name() << ":" << location.line() << ")";
    }
#endif

    return oss.str();
}

// =============================================================================
// RefCacheException Implementation
// =============================================================================

void RefCacheException::formatWhat() {
    std::ostringstream oss;
    oss << "[" << errorCodeToString(code_) << "] " << message_;

    if (context_.has_value()) {
        std::string contextStr = context_->format();
        if (!contextStr.empty()) {
            oss << " (" << contextStr << ")";
        }
    }

    what_ = oss.str();
}

// =============================================================================
// Specific Exception Helpers
// =============================================================================

std::string IOError::formatWithSystemError(const std::string& message, std::error_code ec) {
    return std::format("{}: {} (error code: {})", message, ec.message(), ec.value());
}

std::string FetchFailure::formatHttpStatus(long httpStatus) {
    return std::format("origin answered with HTTP status {}", httpStatus);
}

std::string ToolFailure::formatExitStatus(std::string_view tool, int exitStatus) {
    return std::format("{} exited with status {}", tool, exitStatus);
}

// =============================================================================
// Error Implementation
// =============================================================================

[[noreturn]] void Error::throwException() const {
    switch (code_) {
        case ErrorCode::kUsageError:
            throw UsageError(message_);
        case ErrorCode::kIOError:
            throw IOError(message_);
        case ErrorCode::kFormatError:
            throw FormatError(message_);
        case ErrorCode::kFetchFailure:
            throw FetchFailure(message_);
        case ErrorCode::kUnsupportedFormat:
            throw UnsupportedFormat(message_);
        case ErrorCode::kToolFailure:
            throw ToolFailure(message_);
        case ErrorCode::kLockTimeout:
            throw LockTimeout(message_);
        case ErrorCode::kStoreInconsistency:
            throw StoreInconsistency(message_);
        case ErrorCode::kStoreError:
            throw StoreError(message_);
        case ErrorCode::kConfigError:
            throw ConfigError(message_);
        case ErrorCode::kSuccess:
            break;
    }
    throw RefCacheException(code_, message_);
}

}  // namespace refcache
