// =============================================================================
// refcache - Test Support
// =============================================================================
// Helpers shared by the unit and property tests:
// - TempDir: scratch directory removed after the test
// - text file helpers
// - in-memory gzip / bzip2 / xz encoders for building fixtures
// - FakeTransport: scripted HttpTransport honoring conditional requests
// =============================================================================

#ifndef REFCACHE_TESTS_TEST_SUPPORT_H
#define REFCACHE_TESTS_TEST_SUPPORT_H

#include <bzlib.h>
#include <lzma.h>
#include <zlib.h>

#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <map>
#include <mutex>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "refcache/fetch/content_fetcher.h"

namespace refcache::test {

// =============================================================================
// Temporary Directory
// =============================================================================

/// @brief Unique scratch directory, removed with its contents on destruction.
class TempDir {
public:
    TempDir() {
        std::string pattern =
            (std::filesystem::temp_directory_path() / "refcache-test-XXXXXX").string();
        std::vector<char> buffer(pattern.begin(), pattern.end());
        buffer.push_back('\0');
        if (::mkdtemp(buffer.data()) == nullptr) {
            throw std::runtime_error("mkdtemp failed");
        }
        path_ = buffer.data();
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

    [[nodiscard]] std::filesystem::path operator/(const std::string& name) const {
        return path_ / name;
    }

private:
    std::filesystem::path path_;
};

// =============================================================================
// File Helpers
// =============================================================================

inline void writeText(const std::filesystem::path& path, const std::string& content) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
    if (!out) {
        throw std::runtime_error("write failed: " + path.string());
    }
}

[[nodiscard]] inline std::string readText(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw std::runtime_error("read failed: " + path.string());
    }
    std::ostringstream oss;
    oss << in.rdbuf();
    return oss.str();
}

// =============================================================================
// Compression Fixtures
// =============================================================================

/// @brief Encode as a single gzip member.
[[nodiscard]] inline std::string gzipString(const std::string& data) {
    z_stream zs{};
    if (deflateInit2(&zs, Z_DEFAULT_COMPRESSION, Z_DEFLATED, 15 + 16, 8, Z_DEFAULT_STRATEGY) !=
        Z_OK) {
        throw std::runtime_error("deflateInit2 failed");
    }
    std::string out(deflateBound(&zs, static_cast<uLong>(data.size())) + 32, '\0');
    zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data.data()));
    zs.avail_in = static_cast<uInt>(data.size());
    zs.next_out = reinterpret_cast<Bytef*>(out.data());
    zs.avail_out = static_cast<uInt>(out.size());
    const int ret = deflate(&zs, Z_FINISH);
    out.resize(zs.total_out);
    deflateEnd(&zs);
    if (ret != Z_STREAM_END) {
        throw std::runtime_error("deflate failed");
    }
    return out;
}

/// @brief Encode as a bzip2 stream.
[[nodiscard]] inline std::string bzip2String(const std::string& data) {
    auto capacity = static_cast<unsigned int>(data.size() + data.size() / 100 + 600);
    std::string out(capacity, '\0');
    const int ret = BZ2_bzBuffToBuffCompress(out.data(), &capacity,
                                             const_cast<char*>(data.data()),
                                             static_cast<unsigned int>(data.size()), 9, 0, 0);
    if (ret != BZ_OK) {
        throw std::runtime_error("BZ2_bzBuffToBuffCompress failed");
    }
    out.resize(capacity);
    return out;
}

/// @brief Encode as an xz stream.
[[nodiscard]] inline std::string xzString(const std::string& data) {
    std::string out(lzma_stream_buffer_bound(data.size()), '\0');
    std::size_t written = 0;
    const lzma_ret ret = lzma_easy_buffer_encode(
        6, LZMA_CHECK_CRC64, nullptr, reinterpret_cast<const std::uint8_t*>(data.data()),
        data.size(), reinterpret_cast<std::uint8_t*>(out.data()), &written, out.size());
    if (ret != LZMA_OK) {
        throw std::runtime_error("lzma_easy_buffer_encode failed");
    }
    out.resize(written);
    return out;
}

// =============================================================================
// Fake Transport
// =============================================================================

/// @brief Scripted origin: serves registered bodies and honors If-None-Match.
class FakeTransport final : public fetch::HttpTransport {
public:
    struct Resource {
        std::string body;
        std::optional<std::string> etag;
        std::optional<std::string> lastModified;

        /// @brief Status forced for every request (0 = normal behavior).
        long forcedStatus = 0;
    };

    void serve(const std::string& url, std::string body, std::optional<std::string> etag,
               std::optional<std::string> lastModified = std::nullopt) {
        std::lock_guard<std::mutex> lock(mutex_);
        resources_[url] = Resource{std::move(body), std::move(etag), std::move(lastModified), 0};
    }

    void fail(const std::string& url, long status) {
        std::lock_guard<std::mutex> lock(mutex_);
        resources_[url].forcedStatus = status;
    }

    fetch::HttpResponse get(const fetch::HttpRequest& request, std::ostream& body) override {
        Resource resource;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++calls_;
            requests_.push_back(request);
            auto it = resources_.find(request.url);
            if (it == resources_.end()) {
                return fetch::HttpResponse{404, std::nullopt, std::nullopt, 0};
            }
            resource = it->second;
        }

        if (resource.forcedStatus != 0) {
            return fetch::HttpResponse{resource.forcedStatus, std::nullopt, std::nullopt, 0};
        }
        const bool etagMatches =
            resource.etag && request.ifNoneMatch && *resource.etag == *request.ifNoneMatch;
        const bool dateMatches = !resource.etag && resource.lastModified &&
                                 request.ifModifiedSince &&
                                 *resource.lastModified == *request.ifModifiedSince;
        if (etagMatches || dateMatches) {
            return fetch::HttpResponse{304, resource.etag, resource.lastModified, 0};
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++fullTransfers_;
        }
        body.write(resource.body.data(), static_cast<std::streamsize>(resource.body.size()));
        return fetch::HttpResponse{200, resource.etag, resource.lastModified,
                                   resource.body.size()};
    }

    [[nodiscard]] std::size_t calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_;
    }

    [[nodiscard]] std::size_t fullTransfers() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return fullTransfers_;
    }

    [[nodiscard]] std::vector<fetch::HttpRequest> requests() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

private:
    mutable std::mutex mutex_;
    std::map<std::string, Resource> resources_;
    std::vector<fetch::HttpRequest> requests_;
    std::size_t calls_ = 0;
    std::size_t fullTransfers_ = 0;
};

}  // namespace refcache::test

#endif  // REFCACHE_TESTS_TEST_SUPPORT_H
