// =============================================================================
// refcache - Content Fetcher Implementation
// =============================================================================

#include "refcache/fetch/content_fetcher.h"

#include <curl/curl.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <format>
#include <memory>
#include <mutex>
#include <string_view>
#include <system_error>

#include "refcache/common/logger.h"
#include "refcache/io/atomic_file.h"

namespace refcache::fetch {

namespace {

// =============================================================================
// libcurl helpers
// =============================================================================

struct CurlEasyDeleter {
    void operator()(CURL* handle) const noexcept { curl_easy_cleanup(handle); }
};

struct CurlSlistDeleter {
    void operator()(curl_slist* list) const noexcept { curl_slist_free_all(list); }
};

using CurlEasyPtr = std::unique_ptr<CURL, CurlEasyDeleter>;
using CurlSlistPtr = std::unique_ptr<curl_slist, CurlSlistDeleter>;

std::once_flag gCurlInitFlag;
CURLcode gCurlInitResult = CURLE_OK;

/// @brief State shared with the libcurl callbacks during one transfer.
struct TransferState {
    std::ostream* body = nullptr;
    HttpResponse response;
    bool sinkFailed = false;
};

std::string_view trim(std::string_view value) noexcept {
    while (!value.empty() && std::isspace(static_cast<unsigned char>(value.front()))) {
        value.remove_prefix(1);
    }
    while (!value.empty() && std::isspace(static_cast<unsigned char>(value.back()))) {
        value.remove_suffix(1);
    }
    return value;
}

bool iequals(std::string_view lhs, std::string_view rhs) noexcept {
    return lhs.size() == rhs.size() &&
           std::equal(lhs.begin(), lhs.end(), rhs.begin(), [](char a, char b) {
               return std::tolower(static_cast<unsigned char>(a)) ==
                      std::tolower(static_cast<unsigned char>(b));
           });
}

std::size_t writeCallback(char* data, std::size_t size, std::size_t count, void* userData) {
    auto* state = static_cast<TransferState*>(userData);
    const std::size_t length = size * count;
    state->body->write(data, static_cast<std::streamsize>(length));
    if (!*state->body) {
        state->sinkFailed = true;
        return 0;  // aborts the transfer with CURLE_WRITE_ERROR
    }
    state->response.bytesReceived += length;
    return length;
}

std::size_t headerCallback(char* data, std::size_t size, std::size_t count, void* userData) {
    auto* state = static_cast<TransferState*>(userData);
    const std::size_t length = size * count;
    std::string_view line(data, length);

    // Every response in a redirect chain starts with a status line
    if (line.starts_with("HTTP/")) {
        state->response.etag.reset();
        state->response.lastModified.reset();
        return length;
    }

    const auto colon = line.find(':');
    if (colon == std::string_view::npos) {
        return length;
    }
    const auto name = trim(line.substr(0, colon));
    const auto value = trim(line.substr(colon + 1));
    if (value.empty()) {
        return length;
    }
    if (iequals(name, "ETag")) {
        state->response.etag = std::string(value);
    } else if (iequals(name, "Last-Modified")) {
        state->response.lastModified = std::string(value);
    }
    return length;
}

template <typename T>
void setOption(CURL* handle, CURLoption option, T value, const std::string& url) {
    CURLcode rc = curl_easy_setopt(handle, option, value);
    if (rc != CURLE_OK) {
        throw FetchFailure(std::format("libcurl option rejected: {}", curl_easy_strerror(rc)),
                           ErrorContext().withUrl(url));
    }
}

}  // namespace

// =============================================================================
// CurlTransport Implementation
// =============================================================================

CurlTransport::CurlTransport(CurlTransportOptions options) : options_(std::move(options)) {
    std::call_once(gCurlInitFlag, [] { gCurlInitResult = curl_global_init(CURL_GLOBAL_DEFAULT); });
    if (gCurlInitResult != CURLE_OK) {
        throw FetchFailure(std::format("libcurl initialization failed: {}",
                                       curl_easy_strerror(gCurlInitResult)));
    }
}

CurlTransport::~CurlTransport() = default;

HttpResponse CurlTransport::get(const HttpRequest& request, std::ostream& body) {
    CurlEasyPtr handle(curl_easy_init());
    if (!handle) {
        throw FetchFailure("Failed to create libcurl handle", ErrorContext().withUrl(request.url));
    }

    TransferState state;
    state.body = &body;

    curl_slist* rawHeaders = nullptr;
    if (request.ifNoneMatch) {
        rawHeaders = curl_slist_append(rawHeaders,
                                       std::format("If-None-Match: {}", *request.ifNoneMatch).c_str());
    }
    if (request.ifModifiedSince) {
        rawHeaders = curl_slist_append(
            rawHeaders, std::format("If-Modified-Since: {}", *request.ifModifiedSince).c_str());
    }
    CurlSlistPtr headers(rawHeaders);

    std::array<char, CURL_ERROR_SIZE> errorBuffer{};

    CURL* h = handle.get();
    setOption(h, CURLOPT_URL, request.url.c_str(), request.url);
    setOption(h, CURLOPT_FOLLOWLOCATION, 1L, request.url);
    setOption(h, CURLOPT_MAXREDIRS, options_.maxRedirects, request.url);
    setOption(h, CURLOPT_USERAGENT, options_.userAgent.c_str(), request.url);
    setOption(h, CURLOPT_TIMEOUT, static_cast<long>(options_.timeout.count()), request.url);
    setOption(h, CURLOPT_CONNECTTIMEOUT, static_cast<long>(options_.connectTimeout.count()),
              request.url);
    setOption(h, CURLOPT_NOSIGNAL, 1L, request.url);
    setOption(h, CURLOPT_ERRORBUFFER, errorBuffer.data(), request.url);
    setOption(h, CURLOPT_WRITEFUNCTION, &writeCallback, request.url);
    setOption(h, CURLOPT_WRITEDATA, static_cast<void*>(&state), request.url);
    setOption(h, CURLOPT_HEADERFUNCTION, &headerCallback, request.url);
    setOption(h, CURLOPT_HEADERDATA, static_cast<void*>(&state), request.url);
    if (headers) {
        setOption(h, CURLOPT_HTTPHEADER, headers.get(), request.url);
    }

    REFCACHE_LOG_DEBUG("GET {} (conditional: {})", request.url,
                       request.ifNoneMatch || request.ifModifiedSince);

    CURLcode rc = curl_easy_perform(h);
    if (state.sinkFailed) {
        throw IOError("Failed to write response body", ErrorContext().withUrl(request.url));
    }
    if (rc != CURLE_OK) {
        std::string detail = errorBuffer[0] != '\0' ? std::string(errorBuffer.data())
                                                    : std::string(curl_easy_strerror(rc));
        throw FetchFailure(std::format("Transfer failed: {}", detail),
                           ErrorContext().withUrl(request.url));
    }

    long status = 0;
    rc = curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &status);
    if (rc != CURLE_OK) {
        throw FetchFailure(std::format("Failed to read response status: {}", curl_easy_strerror(rc)),
                           ErrorContext().withUrl(request.url));
    }
    // Non-HTTP schemes (file://) report no status
    state.response.status = status == 0 ? 200 : status;
    return state.response;
}

// =============================================================================
// ContentFetcher Implementation
// =============================================================================

std::filesystem::path ContentFetcher::etagPath(const std::filesystem::path& target) {
    return std::filesystem::path(target.string() + std::string(kEtagSuffix));
}

std::filesystem::path ContentFetcher::lastModifiedPath(const std::filesystem::path& target) {
    return std::filesystem::path(target.string() + std::string(kLastModifiedSuffix));
}

std::filesystem::path ContentFetcher::sourceUrlPath(const std::filesystem::path& target) {
    return std::filesystem::path(target.string() + std::string(kSourceUrlSuffix));
}

RevalidationToken ContentFetcher::readToken(const std::filesystem::path& target) {
    RevalidationToken token;
    token.etag = io::readTrimmedFile(etagPath(target));
    token.lastModified = io::readTrimmedFile(lastModifiedPath(target));
    return token;
}

void ContentFetcher::invalidateValidators(const std::filesystem::path& target) noexcept {
    io::removeIfExists(etagPath(target));
    io::removeIfExists(lastModifiedPath(target));
    io::removeIfExists(sourceUrlPath(target));
}

void ContentFetcher::storeToken(const std::filesystem::path& target, const std::string& url,
                                const RevalidationToken& token) {
    if (token.etag) {
        io::writeFileAtomic(etagPath(target), *token.etag + "\n");
    }
    if (token.lastModified) {
        io::writeFileAtomic(lastModifiedPath(target), *token.lastModified + "\n");
    }
    // Written last: validators only count once they are tied to their URL
    io::writeFileAtomic(sourceUrlPath(target), url + "\n");
}

FetchResult ContentFetcher::fetch(const std::string& url, const std::filesystem::path& target) {
    std::error_code ec;
    std::filesystem::create_directories(target.parent_path(), ec);
    if (ec) {
        throw IOError("Failed to create download directory", ec,
                      ErrorContext(target.parent_path().string()));
    }

    HttpRequest request;
    request.url = url;
    RevalidationToken stored;
    if (std::filesystem::exists(target)) {
        if (io::readTrimmedFile(sourceUrlPath(target)) == url) {
            stored = readToken(target);
            request.ifNoneMatch = stored.etag;
            request.ifModifiedSince = stored.lastModified;
        } else {
            REFCACHE_LOG_DEBUG("Source moved to {}; fetching unconditionally", url);
        }
    }

    io::AtomicFileWriter writer(target);
    HttpResponse response = transport_.get(request, writer.stream());

    if (response.status == 304) {
        writer.abort();
        if (!request.ifNoneMatch && !request.ifModifiedSince) {
            throw FetchFailure("Origin answered 304 to an unconditional request",
                               ErrorContext(target.string()).withUrl(url));
        }
        REFCACHE_LOG_DEBUG("Not modified: {}", url);
        return FetchResult{false, stored, 0};
    }

    if (response.status < 200 || response.status >= 300) {
        writer.abort();
        throw FetchFailure(response.status, ErrorContext(target.string()).withUrl(url));
    }

    // Old validators must not outlive the content they describe
    invalidateValidators(target);
    writer.commit();

    RevalidationToken fresh{response.etag, response.lastModified};
    storeToken(target, url, fresh);

    REFCACHE_LOG_INFO("Fetched {} ({} bytes)", url, response.bytesReceived);
    return FetchResult{true, std::move(fresh), response.bytesReceived};
}

}  // namespace refcache::fetch
