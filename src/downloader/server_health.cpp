#include <bunkget/downloader/server_health.hpp>
#include <bunkget/downloader/url_util.hpp>

#include <spdlog/spdlog.h>

#include <cctype>
#include <exception>

namespace bunkget::downloader {

namespace {

constexpr std::string_view kOperational = "Operational";
constexpr std::string_view kNonOperational = "Non-operational";

} // namespace

ServerHealthTracker::ServerHealthTracker(std::shared_ptr<IHttpAdapter> http,
                                         std::shared_ptr<const IPageFeatureExtractor> extractor,
                                         DownloaderConfig config, Clock clock)
    : http_(std::move(http)), extractor_(std::move(extractor)), config_(std::move(config)),
      clock_(std::move(clock)) {
    if (!clock_)
        clock_ = [] { return std::chrono::steady_clock::now(); };
}

std::string ServerHealthTracker::subdomainOf(std::string_view url) {
    auto host = url::split(url).host;
    auto label = host.substr(0, host.find('.'));
    // First letter upper, the rest lower
    for (std::size_t i = 0; i < label.size(); ++i) {
        const auto c = static_cast<unsigned char>(label[i]);
        label[i] = static_cast<char>(i == 0 ? std::toupper(c) : std::tolower(c));
    }
    return label;
}

bool ServerHealthTracker::freshLocked(std::chrono::steady_clock::time_point now) const {
    return everRefreshed_ && !cache_.empty() && now - lastRefresh_ < config_.statusTtl;
}

ServerHealthTracker::StatusMap ServerHealthTracker::status() {
    {
        std::shared_lock lk(mutex_);
        if (freshLocked(clock_()))
            return cache_;
    }

    if (config_.statusPageUrl.empty() || !http_ || !extractor_) {
        std::shared_lock lk(mutex_);
        return cache_;
    }

    // Single flight: whoever loses the race waits here, then sees the refreshed cache.
    std::lock_guard refreshLock(refreshMutex_);
    {
        std::shared_lock lk(mutex_);
        if (freshLocked(clock_()))
            return cache_;
    }
    refresh();

    std::shared_lock lk(mutex_);
    return cache_;
}

void ServerHealthTracker::refresh() {
    try {
        auto opts = makeRequestOptions(config_, browsingHeaders(config_), config_.statusTimeout);
        auto resp = http_->get(config_.statusPageUrl, opts);
        if (!resp.ok()) {
            spdlog::warn("Failed to fetch server status: {}", resp.error().message);
            return;
        }
        if (resp.value().status != 200) {
            spdlog::warn("Failed to fetch server status: HTTP {}", resp.value().status);
            return;
        }

        const auto now = clock_();
        StatusMap fresh;
        for (auto& [name, stateText] : extractor_->statusRows(resp.value().body)) {
            ServerStatusEntry entry;
            entry.subdomain = name;
            entry.state =
                stateText == kOperational ? ServerState::Operational : ServerState::NonOperational;
            entry.stateText = std::move(stateText);
            entry.observedAt = now;
            fresh[name] = std::move(entry);
        }
        spdlog::debug("Server status refreshed: {} entries", fresh.size());

        std::unique_lock lk(mutex_);
        cache_ = std::move(fresh);
        lastRefresh_ = now;
        everRefreshed_ = true;
    } catch (const std::exception& e) {
        spdlog::warn("Failed to fetch server status: {}", e.what());
    }
}

ServerHealthTracker::StatusMap ServerHealthTracker::offlineServers() {
    StatusMap offline;
    for (auto& [name, entry] : status()) {
        if (entry.state != ServerState::Operational)
            offline.emplace(name, entry);
    }
    return offline;
}

bool ServerHealthTracker::isOffline(std::string_view url) {
    const auto offline = offlineServers();
    return offline.find(subdomainOf(url)) != offline.end();
}

std::string ServerHealthTracker::markOffline(std::string_view url) {
    auto subdomain = subdomainOf(url);
    ServerStatusEntry entry;
    entry.subdomain = subdomain;
    entry.state = ServerState::NonOperational;
    entry.stateText = std::string(kNonOperational);
    entry.observedAt = clock_();

    std::unique_lock lk(mutex_);
    cache_[subdomain] = std::move(entry);
    return subdomain;
}

} // namespace bunkget::downloader
