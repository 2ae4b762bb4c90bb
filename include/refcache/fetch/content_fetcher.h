// =============================================================================
// refcache - Content Fetcher
// =============================================================================
// Conditional retrieval of remote genome sources.
//
// The fetcher keeps the origin's validators next to each download as two
// sidecar files (`<target>.etag`, `<target>.lastmod`) and sends them back on
// the next request for the same URL. A third sidecar (`<target>.url`) records
// where the download came from; validators are never sent to another URL. A 304 answer leaves the local copy as it is; a 2xx answer
// streams the body into a temporary that is renamed over the target only once
// the transfer completed.
//
// HttpTransport is the seam between the fetcher and the network. Production
// code uses CurlTransport; tests provide an in-memory transport.
// =============================================================================

#ifndef REFCACHE_FETCH_CONTENT_FETCHER_H
#define REFCACHE_FETCH_CONTENT_FETCHER_H

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <ostream>
#include <string>

#include "refcache/common/error.h"
#include "refcache/common/types.h"

namespace refcache::fetch {

// =============================================================================
// Transport Abstraction
// =============================================================================

/// @brief One GET request, optionally conditional.
struct HttpRequest {
    std::string url;
    std::optional<std::string> ifNoneMatch;
    std::optional<std::string> ifModifiedSince;
};

/// @brief Outcome of a GET as seen by the fetcher.
struct HttpResponse {
    /// @brief Final HTTP status after redirects.
    long status = 0;

    std::optional<std::string> etag;
    std::optional<std::string> lastModified;

    /// @brief Body bytes written to the sink.
    std::uint64_t bytesReceived = 0;
};

/// @brief Performs HTTP GET requests.
///
/// Implementations write the response body into `body` and report the final
/// status; they throw FetchFailure for transport-level failures (DNS, connect,
/// timeout, truncated transfer). Non-2xx statuses are returned, not thrown.
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    /// @brief Execute a GET request.
    /// @throws FetchFailure on transport errors.
    virtual HttpResponse get(const HttpRequest& request, std::ostream& body) = 0;

protected:
    HttpTransport() = default;
};

/// @brief Options for CurlTransport.
struct CurlTransportOptions {
    std::string userAgent = "refcache/1.0";
    std::chrono::seconds timeout{600};
    std::chrono::seconds connectTimeout{30};
    long maxRedirects = 10;
};

/// @brief HttpTransport backed by libcurl.
///
/// Redirects are followed. `file://` URLs are accepted; libcurl reports no
/// HTTP status for them, which is treated as 200 so local sources always count
/// as changed.
class CurlTransport final : public HttpTransport {
public:
    explicit CurlTransport(CurlTransportOptions options = {});
    ~CurlTransport() override;

    CurlTransport(const CurlTransport&) = delete;
    CurlTransport& operator=(const CurlTransport&) = delete;

    HttpResponse get(const HttpRequest& request, std::ostream& body) override;

private:
    CurlTransportOptions options_;
};

// =============================================================================
// ContentFetcher
// =============================================================================

/// @brief Result of a fetch.
struct FetchResult {
    /// @brief True when new content replaced the target.
    bool changed = false;

    /// @brief Validators now associated with the target.
    RevalidationToken token;

    /// @brief Body bytes transferred (0 on 304).
    std::uint64_t bytes = 0;
};

/// @brief Conditional downloader writing into the raw cache.
class ContentFetcher {
public:
    explicit ContentFetcher(HttpTransport& transport) : transport_(transport) {}

    /// @brief Retrieve `url` into `target`, revalidating an existing copy.
    ///
    /// Validators are only sent when `target` exists and was downloaded from
    /// `url`, so a lost download or a moved source is always fetched in full.
    ///
    /// @throws FetchFailure for non-2xx/304 statuses and transport errors; the
    ///         existing target and its sidecars are left untouched.
    /// @throws IOError if the download cannot be written locally.
    FetchResult fetch(const std::string& url, const std::filesystem::path& target);

    /// @brief Read the stored validators of a target.
    [[nodiscard]] static RevalidationToken readToken(const std::filesystem::path& target);

    /// @brief Drop the stored validators so the next fetch is unconditional.
    static void invalidateValidators(const std::filesystem::path& target) noexcept;

    /// @brief Sidecar path holding the entity tag.
    [[nodiscard]] static std::filesystem::path etagPath(const std::filesystem::path& target);

    /// @brief Sidecar path holding the Last-Modified value.
    [[nodiscard]] static std::filesystem::path lastModifiedPath(
        const std::filesystem::path& target);

    /// @brief Sidecar path holding the source URL.
    [[nodiscard]] static std::filesystem::path sourceUrlPath(const std::filesystem::path& target);

private:
    static void storeToken(const std::filesystem::path& target, const std::string& url,
                           const RevalidationToken& token);

    HttpTransport& transport_;
};

}  // namespace refcache::fetch

#endif  // REFCACHE_FETCH_CONTENT_FETCHER_H
