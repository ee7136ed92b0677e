#pragma once

#include <bunkget/downloader/album_expander.hpp>
#include <bunkget/downloader/asset_resolver.hpp>
#include <bunkget/downloader/chunked_downloader.hpp>
#include <bunkget/downloader/downloader.hpp>
#include <bunkget/downloader/page_extractor.hpp>
#include <bunkget/downloader/server_health.hpp>
#include <bunkget/downloader/task_scheduler.hpp>

#include <filesystem>
#include <memory>
#include <string_view>

namespace bunkget::downloader {

/**
 * classify -> (expand) -> resolve -> sanitize/skip -> download, per item.
 *
 * Albums run sequentially with a random pause between items, or on a thread pool when the
 * request asks for it. Per-item failures end up in the AggregateResult; only an unsupported
 * host or resource kind is returned as an error.
 */
class DownloadOrchestrator final : public IAssetDownloader {
public:
    DownloadOrchestrator(DownloaderConfig config, std::shared_ptr<IHttpAdapter> http,
                         std::shared_ptr<const IPageFeatureExtractor> extractor,
                         std::shared_ptr<ServerHealthTracker> health = nullptr,
                         Timing timing = makeDefaultTiming(),
                         std::unique_ptr<IDiskWriter> writer = nullptr);

    Expected<AggregateResult> downloadAsset(const DownloadRequest& request) override;

    DownloaderConfig config() const override { return config_; }

    ServerHealthTracker& health() noexcept { return *health_; }

private:
    DownloadOutcome runItem(std::string_view itemUrl, const DownloadRequest& request);
    std::unique_ptr<ITaskScheduler> schedulerFor(const DownloadRequest& request) const;

    DownloaderConfig config_;
    std::shared_ptr<IHttpAdapter> http_;
    std::shared_ptr<const IPageFeatureExtractor> extractor_;
    std::shared_ptr<ServerHealthTracker> health_;
    Timing timing_;
    AssetResolver resolver_;
    AlbumExpander expander_;
    ChunkedDownloader downloader_;
};

} // namespace bunkget::downloader
