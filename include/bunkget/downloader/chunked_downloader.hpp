#pragma once

#include <bunkget/downloader/downloader.hpp>
#include <bunkget/downloader/server_health.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string_view>

namespace bunkget::downloader {

inline constexpr std::uint64_t kKiB = 1024;
inline constexpr std::uint64_t kMiB = 1024 * kKiB;
inline constexpr std::uint64_t kGiB = 1024 * kMiB;

// Write buffer size for an expected transfer size. Unknown size uses the smallest tier.
[[nodiscard]] std::size_t chunkSizeFor(std::optional<std::uint64_t> expectedSize) noexcept;

/**
 * What to do after a failed attempt. The delay is
 * backoffSeconds + uniform(jitterMinSeconds, jitterMaxSeconds).
 */
struct RetryDecision {
    enum class Action {
        Continue, // sleep, then try again
        Abort,    // attempts exhausted
        Fatal     // stop now, retrying cannot help
    };

    Action action{Action::Abort};
    double backoffSeconds{0.0};
    double jitterMinSeconds{0.0};
    double jitterMaxSeconds{0.0};
    bool markOffline{false};
};

[[nodiscard]] const char* toString(RetryDecision::Action action) noexcept;

/**
 * Pure failure classification for attempt `attempt` (0-based) out of `maxAttempts`.
 *
 *  521           -> Fatal, mark the subdomain offline
 *  429 / 503     -> 3^(attempt+1) + U(1,3) s
 *  502           -> Fatal
 *  short stream  -> Fatal (the .temp file is kept)
 *  dest exists   -> Fatal
 *  network/HTTP  -> 2^attempt + U(1,2) s
 *  anything else -> 2 s
 *
 * Retryable failures on the last attempt become Abort.
 */
[[nodiscard]] RetryDecision classifyFailure(const Error& error, int attempt, int maxAttempts);

using UniformFn = std::function<double(double lo, double hi)>;

[[nodiscard]] std::chrono::milliseconds backoffDelay(const RetryDecision& decision,
                                                     const UniformFn& uniform);

/**
 * Streams one asset to "<dest>.temp" and promotes it to dest when complete.
 *
 * A destination is only promoted when the byte count matches Content-Length (or the length
 * was not announced). Offline subdomains, as reported by the shared ServerHealthTracker, are
 * not contacted.
 */
class ChunkedDownloader {
public:
    ChunkedDownloader(std::shared_ptr<IHttpAdapter> http, ServerHealthTracker& health,
                      DownloaderConfig config, Timing timing = makeDefaultTiming(),
                      std::unique_ptr<IDiskWriter> writer = nullptr);

    Expected<void> download(std::string_view url, const std::filesystem::path& destination,
                            std::optional<int> maxAttempts = std::nullopt);

private:
    Expected<void> attemptOnce(std::string_view url, const std::filesystem::path& destination);

    std::shared_ptr<IHttpAdapter> http_;
    ServerHealthTracker& health_;
    DownloaderConfig config_;
    Timing timing_;
    std::unique_ptr<IDiskWriter> writer_;
};

} // namespace bunkget::downloader
