#include <bunkget/downloader/chunked_downloader.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cmath>
#include <exception>
#include <utility>
#include <vector>

namespace bunkget::downloader {

namespace {

namespace fs = std::filesystem;

struct SizeTier {
    std::uint64_t below;
    std::size_t chunk;
};

constexpr std::array<SizeTier, 7> kTiers{{
    {1 * kMiB, 32 * kKiB},
    {10 * kMiB, 128 * kKiB},
    {50 * kMiB, 512 * kKiB},
    {100 * kMiB, 1 * kMiB},
    {250 * kMiB, 2 * kMiB},
    {500 * kMiB, 4 * kMiB},
    {1 * kGiB, 8 * kMiB},
}};
constexpr std::size_t kLargestChunk = 16 * kMiB;

constexpr std::uint64_t kProgressEveryChunks = 100;

bool isRateLimited(long status) {
    return status == 429 || status == 503;
}

bool isTransportFailure(ErrorCode code) {
    switch (code) {
        case ErrorCode::NetworkError:
        case ErrorCode::Timeout:
        case ErrorCode::TlsVerificationFailed:
        case ErrorCode::ServerError:
            return true;
        default:
            return false;
    }
}

// Per-attempt transfer state; handlers write into it while curl drives the stream.
struct Transfer {
    fs::path staging;
    std::optional<std::uint64_t> expected;
    std::uint64_t written{0};
    std::uint64_t chunks{0};
    std::size_t chunkSize{0};
    std::vector<std::byte> buffer;
};

} // namespace

std::size_t chunkSizeFor(std::optional<std::uint64_t> expectedSize) noexcept {
    if (!expectedSize)
        return kTiers.front().chunk;
    for (const auto& tier : kTiers) {
        if (*expectedSize < tier.below)
            return tier.chunk;
    }
    return kLargestChunk;
}

const char* toString(RetryDecision::Action action) noexcept {
    switch (action) {
        case RetryDecision::Action::Continue:
            return "continue";
        case RetryDecision::Action::Abort:
            return "abort";
        case RetryDecision::Action::Fatal:
            return "fatal";
    }
    return "abort";
}

RetryDecision classifyFailure(const Error& error, int attempt, int maxAttempts) {
    using Action = RetryDecision::Action;
    RetryDecision d;
    const bool lastAttempt = attempt >= maxAttempts - 1;

    if (error.code == ErrorCode::IncompleteTransfer || error.code == ErrorCode::AlreadyExists) {
        d.action = Action::Fatal;
        return d;
    }

    if (error.httpStatus) {
        const long status = *error.httpStatus;
        if (status == 521) {
            d.action = Action::Fatal;
            d.markOffline = true;
            return d;
        }
        if (status == 502) {
            d.action = Action::Fatal;
            return d;
        }
        if (isRateLimited(status) && !lastAttempt) {
            d.action = Action::Continue;
            d.backoffSeconds = std::pow(3.0, attempt + 1);
            d.jitterMinSeconds = 1.0;
            d.jitterMaxSeconds = 3.0;
            return d;
        }
    }

    if (lastAttempt) {
        d.action = Action::Abort;
        return d;
    }

    d.action = Action::Continue;
    if (error.httpStatus || isTransportFailure(error.code)) {
        d.backoffSeconds = std::pow(2.0, attempt);
        d.jitterMinSeconds = 1.0;
        d.jitterMaxSeconds = 2.0;
    } else {
        d.backoffSeconds = 2.0;
    }
    return d;
}

std::chrono::milliseconds backoffDelay(const RetryDecision& decision, const UniformFn& uniform) {
    double seconds = decision.backoffSeconds;
    if (decision.jitterMaxSeconds > decision.jitterMinSeconds && uniform) {
        seconds += uniform(decision.jitterMinSeconds, decision.jitterMaxSeconds);
    } else {
        seconds += decision.jitterMinSeconds;
    }
    return std::chrono::milliseconds(static_cast<std::int64_t>(std::llround(seconds * 1000.0)));
}

ChunkedDownloader::ChunkedDownloader(std::shared_ptr<IHttpAdapter> http,
                                     ServerHealthTracker& health, DownloaderConfig config,
                                     Timing timing, std::unique_ptr<IDiskWriter> writer)
    : http_(std::move(http)), health_(health), config_(std::move(config)),
      timing_(std::move(timing)), writer_(std::move(writer)) {
    auto defaults = makeDefaultTiming();
    if (!timing_.sleep)
        timing_.sleep = std::move(defaults.sleep);
    if (!timing_.uniform)
        timing_.uniform = std::move(defaults.uniform);
    if (!writer_)
        writer_ = makeDiskWriter();
}

Expected<void> ChunkedDownloader::attemptOnce(std::string_view url, const fs::path& destination) {
    Transfer t;

    auto flush = [&]() -> Expected<void> {
        if (t.buffer.empty())
            return Expected<void>{};
        auto r = writer_->append(t.staging, t.buffer);
        if (!r.ok())
            return r;
        t.written += t.buffer.size();
        t.buffer.clear();
        ++t.chunks;
        if (t.expected && *t.expected > 0 && t.chunks % kProgressEveryChunks == 0) {
            spdlog::info("{}: {:.1f}% ({}/{} bytes)", destination.filename().string(),
                         100.0 * static_cast<double>(t.written) / static_cast<double>(*t.expected),
                         t.written, *t.expected);
        }
        return Expected<void>{};
    };

    StreamHandlers handlers;
    handlers.onStart = [&](std::optional<std::uint64_t> contentLength) -> Expected<void> {
        t.expected = contentLength;
        if (!contentLength) {
            spdlog::warn("No Content-Length for {}, size unknown", url);
        }
        t.chunkSize = chunkSizeFor(contentLength);
        t.buffer.reserve(t.chunkSize);

        auto staging = writer_->createStagingFile(destination);
        if (!staging.ok())
            return staging.error();
        t.staging = staging.value();
        spdlog::debug("Streaming {} into {} (chunk {} bytes)", url, t.staging.string(),
                      t.chunkSize);
        return Expected<void>{};
    };
    handlers.onData = [&](std::span<const std::byte> data) -> Expected<void> {
        if (t.staging.empty())
            return Error{ErrorCode::IoError, "Body received before stream start"};
        while (!data.empty()) {
            const auto room = t.chunkSize - t.buffer.size();
            const auto take = std::min(room, data.size());
            t.buffer.insert(t.buffer.end(), data.begin(), data.begin() + take);
            data = data.subspan(take);
            if (t.buffer.size() == t.chunkSize) {
                auto r = flush();
                if (!r.ok())
                    return r;
            }
        }
        return Expected<void>{};
    };

    auto incomplete = [&]() -> Error {
        spdlog::warn("Incomplete transfer for {}: {} of {} bytes, keeping {}", url, t.written,
                     *t.expected, t.staging.string());
        return Error{ErrorCode::IncompleteTransfer, "Received " + std::to_string(t.written) +
                                                        " of " + std::to_string(*t.expected) +
                                                        " bytes"};
    };

    auto opts = makeRequestOptions(config_, downloadHeaders(config_), config_.downloadTimeout);
    auto streamed = http_->fetchStream(url, opts, handlers);
    if (!streamed.ok()) {
        const auto& err = streamed.error();
        if (t.staging.empty() || err.httpStatus)
            return streamed;
        // The connection dropped mid-body: keep what arrived in the staging file.
        if (auto r = flush(); !r.ok())
            return r;
        const bool dropped = err.code == ErrorCode::NetworkError ||
                             err.code == ErrorCode::Timeout ||
                             err.code == ErrorCode::IncompleteTransfer;
        if (dropped && t.expected && t.written < *t.expected)
            return incomplete();
        return streamed;
    }

    if (t.staging.empty())
        return Error{ErrorCode::IoError, "Stream finished without creating a staging file"};

    if (auto r = flush(); !r.ok())
        return r;

    if (t.expected && t.written != *t.expected)
        return incomplete();

    if (auto r = writer_->sync(t.staging); !r.ok())
        return r;
    if (auto r = writer_->promote(t.staging, destination); !r.ok())
        return r;

    spdlog::info("Downloaded {} ({} bytes)", destination.filename().string(), t.written);
    return Expected<void>{};
}

Expected<void> ChunkedDownloader::download(std::string_view url, const fs::path& destination,
                                           std::optional<int> maxAttempts) {
    const int attempts = std::max(1, maxAttempts.value_or(config_.maxAttempts));
    Error last{ErrorCode::Unknown, "No download attempt was made"};

    for (int attempt = 0; attempt < attempts; ++attempt) {
        if (health_.isOffline(url)) {
            const auto subdomain = ServerHealthTracker::subdomainOf(url);
            last = Error{ErrorCode::ServerError, "Server " + subdomain + " is offline"};
            if (attempt == attempts - 1) {
                spdlog::error("Giving up on {}: server {} is offline", url, subdomain);
                return last;
            }
            spdlog::warn("Server {} is offline, skipping attempt {}/{}", subdomain, attempt + 1,
                         attempts);
            continue;
        }

        Expected<void> result;
        try {
            result = attemptOnce(url, destination);
        } catch (const std::exception& e) {
            result = Error{ErrorCode::Unknown, e.what()};
        }
        if (result.ok())
            return result;

        last = result.error();
        const auto decision = classifyFailure(last, attempt, attempts);
        if (decision.markOffline) {
            const auto subdomain = health_.markOffline(url);
            spdlog::warn("Server {} returned 521, marked offline", subdomain);
        }

        switch (decision.action) {
            case RetryDecision::Action::Fatal:
            case RetryDecision::Action::Abort:
                spdlog::error("Download of {} failed ({}, attempt {}/{}): {}", url,
                              toString(decision.action), attempt + 1, attempts, last.message);
                return last;
            case RetryDecision::Action::Continue: {
                const auto delay = backoffDelay(decision, timing_.uniform);
                spdlog::warn("Attempt {}/{} for {} failed: {}. Retrying in {} ms", attempt + 1,
                             attempts, url, last.message, delay.count());
                timing_.sleep(delay);
                break;
            }
        }
    }
    return last;
}

} // namespace bunkget::downloader
