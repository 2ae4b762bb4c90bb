// =============================================================================
// refcache - Cache Configuration Implementation
// =============================================================================

#include "refcache/common/config.h"

#include <format>

namespace refcache {

std::string_view indexerBackendToString(IndexerBackend backend) noexcept {
    switch (backend) {
        case IndexerBackend::kHtslib:
            return "htslib";
        case IndexerBackend::kExternalTools:
            return "tools";
    }
    return "htslib";
}

std::optional<IndexerBackend> indexerBackendFromString(std::string_view value) noexcept {
    if (value == "htslib") {
        return IndexerBackend::kHtslib;
    }
    if (value == "tools") {
        return IndexerBackend::kExternalTools;
    }
    return std::nullopt;
}

std::string_view annotationIndexKindToString(AnnotationIndexKind kind) noexcept {
    switch (kind) {
        case AnnotationIndexKind::kTbi:
            return "tbi";
        case AnnotationIndexKind::kCsi:
            return "csi";
    }
    return "tbi";
}

std::optional<AnnotationIndexKind> annotationIndexKindFromString(std::string_view value) noexcept {
    if (value == "tbi") {
        return AnnotationIndexKind::kTbi;
    }
    if (value == "csi") {
        return AnnotationIndexKind::kCsi;
    }
    return std::nullopt;
}

VoidResult CacheConfig::validate() const {
    if (baseDir.empty()) {
        return makeVoidError(ErrorCode::kConfigError, "base directory must not be empty");
    }
    if (compressionLevel < 1 || compressionLevel > 9) {
        return makeVoidError(ErrorCode::kConfigError,
                             std::format("compression level must be in 1-9, got {}",
                                         compressionLevel));
    }
    if (httpTimeout.count() <= 0) {
        return makeVoidError(ErrorCode::kConfigError, "HTTP timeout must be positive");
    }
    if (lockBackoff.count() <= 0) {
        return makeVoidError(ErrorCode::kConfigError, "lock backoff must be positive");
    }
    if (lockTimeout && lockTimeout->count() <= 0) {
        return makeVoidError(ErrorCode::kConfigError, "lock timeout must be positive");
    }
    if (lockStaleAfter && lockStaleAfter->count() <= 0) {
        return makeVoidError(ErrorCode::kConfigError, "lock lease must be positive");
    }
    if (refreshInterval.count() <= 0) {
        return makeVoidError(ErrorCode::kConfigError, "refresh interval must be positive");
    }
    return makeVoidSuccess();
}

VoidResult validateKeyComponent(std::string_view field, std::string_view value) {
    if (value.empty()) {
        return makeVoidError(ErrorCode::kConfigError, std::format("{} must not be empty", field));
    }
    if (value == "." || value == "..") {
        return makeVoidError(ErrorCode::kConfigError,
                             std::format("{} must not be '{}'", field, value));
    }
    if (value.find('/') != std::string_view::npos || value.find('\\') != std::string_view::npos ||
        value.find('\0') != std::string_view::npos) {
        return makeVoidError(ErrorCode::kConfigError,
                             std::format("{} '{}' must not contain path separators", field, value));
    }
    return makeVoidSuccess();
}

}  // namespace refcache
