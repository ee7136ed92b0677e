#pragma once

/*
 * bunkget Downloader - Public Types and Service Interfaces (C++20)
 *
 * This header defines the public data types and abstract interfaces for the
 * downloader subsystem. It intentionally contains no implementation details.
 *
 * Design principles:
 * - A partially written file never appears under its final name (".temp" staging + promote)
 * - An existing destination file is never overwritten
 * - Clear separation of concerns (HTTP adapter, page features, disk writer, server health)
 * - Retry decisions are plain values, computed without I/O
 */

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace bunkget::downloader {

// ================================
// Fundamental enums and constants
// ================================

/**
 * Kind of resource a host link points at, derived from its path.
 */
enum class ResourceKind { Album, File, Video, Unknown };

/**
 * Advisory state of an edge node as reported by the status page.
 */
enum class ServerState { Operational, NonOperational };

/**
 * Canonical error codes for downloader operations.
 * Note: Not a std::error_code category to keep this header implementation-free.
 */
enum class ErrorCode {
    None = 0,
    InvalidArgument,
    UnsupportedResource,
    NetworkError,
    Timeout,
    TlsVerificationFailed,
    ServerError,
    IoError,
    ResolutionFailed,
    IncompleteTransfer,
    AlreadyExists,
    Unknown
};

[[nodiscard]] const char* toString(ResourceKind kind) noexcept;
[[nodiscard]] const char* toString(ErrorCode code) noexcept;

// ===================
// Small data objects
// ===================

/**
 * HTTP header key/value pair.
 */
struct Header {
    std::string name;
    std::string value;
};

/**
 * TLS configuration.
 */
struct TlsConfig {
    bool insecure{false};
    std::string caPath; // empty = system default
};

/**
 * Per-request transport options.
 */
struct RequestOptions {
    std::vector<Header> headers;
    std::chrono::milliseconds timeout{30000};
    TlsConfig tls{};
    std::optional<std::string> proxy;
    bool followRedirects{true};
};

/**
 * Buffered HTTP response (pages, API calls). Any status is a response, not an error.
 */
struct HttpResponse {
    long status{0};
    std::string body;
    std::optional<std::uint64_t> contentLength{};
};

/**
 * Downloader configuration. Defaults match the live host.
 */
struct DownloaderConfig {
    std::string apiUrl{"https://bunkr.cr/api/vs"};
    std::string statusPageUrl{"https://status.bunkr.ru/"}; // empty = never fetch status
    std::string hostPattern{R"(bunkr\.\w+)"};
    std::string userAgent{"Mozilla/5.0 (Macintosh; Intel Mac OS X 10_15_7) AppleWebKit/537.36 "
                          "(KHTML, like Gecko) Chrome/138.0.0.0 Safari/537.36"};
    std::string downloadReferer{"https://get.bunkrr.su/"};

    int maxAttempts{5};
    std::size_t maxFilenameLength{120};
    int concurrency{4};

    std::chrono::seconds statusTtl{300};
    std::chrono::milliseconds pageTimeout{15000};
    std::chrono::milliseconds apiTimeout{15000};
    std::chrono::milliseconds downloadTimeout{30000};
    std::chrono::milliseconds statusTimeout{10000};

    std::chrono::milliseconds interItemDelayMin{500};
    std::chrono::milliseconds interItemDelayMax{2000};

    TlsConfig tls{};
    std::optional<std::string> proxy;
};

/**
 * A link broken down into kind and identifier. Ephemeral, never persisted.
 */
struct ResourceReference {
    std::string url;
    ResourceKind kind{ResourceKind::Unknown};
    std::string identifier;
};

struct ServerStatusEntry {
    std::string subdomain;
    ServerState state{ServerState::NonOperational};
    std::string stateText; // as shown on the status page
    std::chrono::steady_clock::time_point observedAt{};
};

/**
 * Real download URL and the filename derived for it.
 */
struct AssetDescriptor {
    std::string resolvedUrl;
    std::string filename;
};

/**
 * Canonical error object.
 */
struct Error {
    ErrorCode code{ErrorCode::None};
    std::string message;
    std::optional<long> httpStatus{};
};

/**
 * Result of the per-item pipeline.
 */
struct DownloadOutcome {
    std::string itemUrl;
    bool success{false};
    bool skipped{false};
    std::optional<std::string> filename{};
    std::optional<Error> error{};
};

/**
 * Result of one orchestrator call.
 * Invariant: succeeded + failed + skipped == attempted.
 */
struct AggregateResult {
    std::string url;
    ResourceKind kind{ResourceKind::Unknown};
    bool success{false};
    std::optional<std::string> albumName{};

    std::size_t attempted{0};
    std::size_t succeeded{0};
    std::size_t failed{0};
    std::size_t skipped{0};

    std::vector<std::string> downloadedFiles;
    std::vector<std::string> skippedFiles;
    std::vector<std::string> failedFiles;

    std::optional<Error> error{};
};

/**
 * A single orchestrator request.
 */
struct DownloadRequest {
    std::string url;
    std::filesystem::path destinationDir{"downloads"};
    std::vector<std::string> ignorePatterns;
    std::vector<std::string> includePatterns;
    bool concurrent{false};
};

// =========================
// Lightweight Expected<T>
// =========================

/**
 * Minimal Expected<T> for interfaces (header-only, no exceptions required).
 * - If ok() is true, value() is valid; otherwise error() is set.
 */
template <typename T> class Expected {
public:
    Expected() = default;
    Expected(const T& v) : _ok(true), _value(v) {}
    Expected(T&& v) noexcept : _ok(true), _value(std::move(v)) {}
    Expected(const Error& e) : _ok(false), _error(e) {}
    Expected(Error&& e) noexcept : _ok(false), _error(std::move(e)) {}

    [[nodiscard]] bool ok() const noexcept { return _ok; }
    [[nodiscard]] const T& value() const& { return _value; }
    [[nodiscard]] T& value() & { return _value; }
    [[nodiscard]] T&& value() && { return std::move(_value); }
    [[nodiscard]] const Error& error() const& { return _error; }

private:
    bool _ok{false};
    T _value{};
    Error _error{};
};

// Specialization for Expected<void>
template <> class Expected<void> {
public:
    Expected() : _ok(true) {}
    Expected(const Error& e) : _ok(false), _error(e) {}
    Expected(Error&& e) noexcept : _ok(false), _error(std::move(e)) {}

    [[nodiscard]] bool ok() const noexcept { return _ok; }
    [[nodiscard]] const Error& error() const& { return _error; }

private:
    bool _ok{true};
    Error _error{};
};

// ===================
// Callback signatures
// ===================

using ByteSink = std::function<Expected<void>(std::span<const std::byte>)>;

/**
 * Callbacks for a streamed GET. onStart runs once, after a successful status line and
 * headers and before the first body byte.
 */
struct StreamHandlers {
    std::function<Expected<void>(std::optional<std::uint64_t> contentLength)> onStart;
    ByteSink onData;
};

/**
 * Injected time and randomness. Tests replace both to run retry paths instantly.
 */
struct Timing {
    std::function<void(std::chrono::milliseconds)> sleep;
    std::function<double(double lo, double hi)> uniform;
};

/**
 * Real sleep and a per-thread Mersenne Twister.
 */
Timing makeDefaultTiming();

// ==========================
// Service interface classes
// ==========================

/**
 * HTTP adapter abstraction (libcurl-based implementation satisfies this).
 */
class IHttpAdapter {
public:
    virtual ~IHttpAdapter() = default;

    /**
     * Buffered GET. Transport failures are errors; HTTP statuses are returned as-is.
     */
    virtual Expected<HttpResponse> get(std::string_view url, const RequestOptions& options) = 0;

    /**
     * Buffered POST with the given body and content type.
     */
    virtual Expected<HttpResponse> post(std::string_view url, std::string_view body,
                                        std::string_view contentType,
                                        const RequestOptions& options) = 0;

    /**
     * Streamed GET. HTTP status >= 400 is reported as ErrorCode::ServerError with httpStatus
     * set; a handler error aborts the transfer and is returned unchanged.
     */
    virtual Expected<void> fetchStream(std::string_view url, const RequestOptions& options,
                                       const StreamHandlers& handlers) = 0;
};

/**
 * Staging and promotion of downloaded files.
 * promote() must be atomic and must never replace an existing destination.
 */
class IDiskWriter {
public:
    virtual ~IDiskWriter() = default;

    /**
     * Create (or truncate) "<dest>.temp" beside the destination and return its path.
     */
    virtual Expected<std::filesystem::path>
    createStagingFile(const std::filesystem::path& destination) = 0;

    virtual Expected<void> append(const std::filesystem::path& stagingFile,
                                  std::span<const std::byte> data) = 0;

    /**
     * Ensure data durability (fsync file and its directory).
     */
    virtual Expected<void> sync(const std::filesystem::path& stagingFile) = 0;

    virtual Expected<void> promote(const std::filesystem::path& stagingFile,
                                   const std::filesystem::path& destination) = 0;
};

/**
 * Download orchestrator abstraction: the single operation exposed to collaborators.
 */
class IAssetDownloader {
public:
    virtual ~IAssetDownloader() = default;

    /**
     * Validation failures (unsupported host, unknown kind) are returned as errors before any
     * I/O. Every runtime or network condition ends up inside the AggregateResult.
     */
    virtual Expected<AggregateResult> downloadAsset(const DownloadRequest& request) = 0;

    [[nodiscard]] virtual DownloaderConfig config() const = 0;
};

// ======================
// Utility helpers
// ======================

/**
 * Browsing headers (pages, API, status page).
 */
[[nodiscard]] std::vector<Header> browsingHeaders(const DownloaderConfig& cfg);

/**
 * Browsing headers plus the download referer.
 */
[[nodiscard]] std::vector<Header> downloadHeaders(const DownloaderConfig& cfg);

[[nodiscard]] RequestOptions makeRequestOptions(const DownloaderConfig& cfg,
                                                std::vector<Header> headers,
                                                std::chrono::milliseconds timeout);

/**
 * "<dest>.temp" for a destination path.
 */
[[nodiscard]] inline std::filesystem::path stagingPathFor(const std::filesystem::path& destination) {
    auto staging = destination;
    staging += ".temp";
    return staging;
}

std::unique_ptr<IHttpAdapter> makeCurlHttpAdapter();
std::unique_ptr<IDiskWriter> makeDiskWriter();

class ServerHealthTracker;

/**
 * Factory for the default wiring. When no tracker is passed, the downloader owns one.
 */
std::unique_ptr<IAssetDownloader>
makeAssetDownloader(const DownloaderConfig& cfg,
                    std::shared_ptr<ServerHealthTracker> tracker = nullptr);

} // namespace bunkget::downloader
