#pragma once

#include <bunkget/downloader/downloader.hpp>
#include <bunkget/downloader/page_extractor.hpp>

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <string_view>

namespace bunkget::downloader {

/**
 * Advisory cache of edge-node health, keyed by capitalized subdomain ("Kebab").
 *
 * Owned explicitly and shared by reference between the components of one downloader.
 * Reads are concurrent; a TTL refresh runs once even when several callers find the cache
 * stale at the same time. markOffline() takes effect immediately regardless of the TTL.
 */
class ServerHealthTracker {
public:
    using Clock = std::function<std::chrono::steady_clock::time_point()>;
    using StatusMap = std::map<std::string, ServerStatusEntry>;

    ServerHealthTracker(std::shared_ptr<IHttpAdapter> http,
                        std::shared_ptr<const IPageFeatureExtractor> extractor,
                        DownloaderConfig config, Clock clock = {});

    ServerHealthTracker(const ServerHealthTracker&) = delete;
    ServerHealthTracker& operator=(const ServerHealthTracker&) = delete;

    /**
     * Cached status when fresh and non-empty; otherwise refetch the status page. A failed
     * fetch leaves the previous cache in place and returns it.
     */
    StatusMap status();

    // Entries of status() that are not Operational.
    StatusMap offlineServers();

    bool isOffline(std::string_view url);

    /**
     * Force the URL's subdomain to "Non-operational" and return the subdomain name.
     */
    std::string markOffline(std::string_view url);

    // "https://kebab.example.org/x" -> "Kebab"
    [[nodiscard]] static std::string subdomainOf(std::string_view url);

private:
    bool freshLocked(std::chrono::steady_clock::time_point now) const;
    void refresh();

    std::shared_ptr<IHttpAdapter> http_;
    std::shared_ptr<const IPageFeatureExtractor> extractor_;
    DownloaderConfig config_;
    Clock clock_;

    mutable std::shared_mutex mutex_;
    std::mutex refreshMutex_;
    StatusMap cache_;
    std::chrono::steady_clock::time_point lastRefresh_{};
    bool everRefreshed_{false};
};

} // namespace bunkget::downloader
