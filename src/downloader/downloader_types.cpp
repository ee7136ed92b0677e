#include <bunkget/downloader/downloader.hpp>

#include <random>
#include <thread>

namespace bunkget::downloader {

const char* toString(ResourceKind kind) noexcept {
    switch (kind) {
        case ResourceKind::Album:
            return "album";
        case ResourceKind::File:
            return "file";
        case ResourceKind::Video:
            return "video";
        case ResourceKind::Unknown:
            return "unknown";
    }
    return "unknown";
}

const char* toString(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::None:
            return "None";
        case ErrorCode::InvalidArgument:
            return "InvalidArgument";
        case ErrorCode::UnsupportedResource:
            return "UnsupportedResource";
        case ErrorCode::NetworkError:
            return "NetworkError";
        case ErrorCode::Timeout:
            return "Timeout";
        case ErrorCode::TlsVerificationFailed:
            return "TlsVerificationFailed";
        case ErrorCode::ServerError:
            return "ServerError";
        case ErrorCode::IoError:
            return "IoError";
        case ErrorCode::ResolutionFailed:
            return "ResolutionFailed";
        case ErrorCode::IncompleteTransfer:
            return "IncompleteTransfer";
        case ErrorCode::AlreadyExists:
            return "AlreadyExists";
        case ErrorCode::Unknown:
            return "Unknown";
    }
    return "Unknown";
}

std::vector<Header> browsingHeaders(const DownloaderConfig& cfg) {
    return {
        {"User-Agent", cfg.userAgent},
        {"Accept", "text/html,application/xhtml+xml,application/xml;q=0.9,image/avif,image/webp,"
                   "image/apng,*/*;q=0.8,application/signed-exchange;v=b3;q=0.7"},
        {"Accept-Language", "en-US,en;q=0.9"},
        {"DNT", "1"},
        {"Connection", "keep-alive"},
        {"Upgrade-Insecure-Requests", "1"},
    };
}

std::vector<Header> downloadHeaders(const DownloaderConfig& cfg) {
    auto headers = browsingHeaders(cfg);
    headers.push_back({"Referer", cfg.downloadReferer});
    return headers;
}

RequestOptions makeRequestOptions(const DownloaderConfig& cfg, std::vector<Header> headers,
                                  std::chrono::milliseconds timeout) {
    RequestOptions opts;
    opts.headers = std::move(headers);
    opts.timeout = timeout;
    opts.tls = cfg.tls;
    opts.proxy = cfg.proxy;
    opts.followRedirects = true;
    return opts;
}

Timing makeDefaultTiming() {
    Timing timing;
    timing.sleep = [](std::chrono::milliseconds d) {
        if (d.count() > 0)
            std::this_thread::sleep_for(d);
    };
    timing.uniform = [](double lo, double hi) {
        thread_local std::mt19937_64 rng{std::random_device{}()};
        if (hi <= lo)
            return lo;
        std::uniform_real_distribution<double> dist(lo, hi);
        return dist(rng);
    };
    return timing;
}

} // namespace bunkget::downloader
