#include <bunkget/downloader/download_orchestrator.hpp>
#include <bunkget/downloader/filename_util.hpp>
#include <bunkget/downloader/link_classifier.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>
#include <system_error>
#include <utility>
#include <vector>

namespace bunkget::downloader {

namespace fs = std::filesystem;

namespace {

void addOutcome(AggregateResult& result, const DownloadOutcome& outcome) {
    const auto& label = outcome.filename ? *outcome.filename : outcome.itemUrl;
    ++result.attempted;
    if (outcome.success) {
        ++result.succeeded;
        result.downloadedFiles.push_back(label);
    } else if (outcome.skipped) {
        ++result.skipped;
        result.skippedFiles.push_back(label);
    } else {
        ++result.failed;
        result.failedFiles.push_back(label);
    }
}

DownloadOutcome failedOutcome(std::string_view itemUrl, Error error) {
    DownloadOutcome o;
    o.itemUrl = std::string(itemUrl);
    o.error = std::move(error);
    return o;
}

} // namespace

DownloadOrchestrator::DownloadOrchestrator(DownloaderConfig config,
                                           std::shared_ptr<IHttpAdapter> http,
                                           std::shared_ptr<const IPageFeatureExtractor> extractor,
                                           std::shared_ptr<ServerHealthTracker> health,
                                           Timing timing, std::unique_ptr<IDiskWriter> writer)
    : config_(std::move(config)), http_(std::move(http)), extractor_(std::move(extractor)),
      health_(health ? std::move(health)
                     : std::make_shared<ServerHealthTracker>(http_, extractor_, config_)),
      timing_(std::move(timing)), resolver_(http_, extractor_, config_),
      expander_(http_, extractor_, config_),
      downloader_(http_, *health_, config_, timing_, std::move(writer)) {}

std::unique_ptr<ITaskScheduler>
DownloadOrchestrator::schedulerFor(const DownloadRequest& request) const {
    if (request.concurrent) {
        return std::make_unique<ThreadPoolScheduler>(
            static_cast<std::size_t>(std::max(1, config_.concurrency)));
    }
    return std::make_unique<SequentialScheduler>(timing_, config_.interItemDelayMin,
                                                 config_.interItemDelayMax);
}

DownloadOutcome DownloadOrchestrator::runItem(std::string_view itemUrl,
                                              const DownloadRequest& request) {
    auto asset = resolver_.resolve(itemUrl);
    if (!asset) {
        return failedOutcome(itemUrl,
                             Error{ErrorCode::ResolutionFailed, "Could not resolve download link"});
    }

    DownloadOutcome outcome;
    outcome.itemUrl = std::string(itemUrl);
    const auto filename = sanitizeFilename(asset->filename, config_.maxFilenameLength);
    outcome.filename = filename;
    const auto destination = request.destinationDir / filename;

    std::error_code ec;
    if (fs::exists(destination, ec)) {
        spdlog::info("{} already exists, skipping", filename);
        outcome.skipped = true;
        return outcome;
    }
    if (shouldSkip(filename, request.ignorePatterns, request.includePatterns)) {
        outcome.skipped = true;
        return outcome;
    }

    spdlog::info("Downloading {} -> {}", itemUrl, destination.string());
    auto r = downloader_.download(asset->resolvedUrl, destination);
    if (r.ok()) {
        outcome.success = true;
    } else {
        outcome.error = r.error();
    }
    return outcome;
}

Expected<AggregateResult> DownloadOrchestrator::downloadAsset(const DownloadRequest& request) {
    if (!isSupportedHost(request.url, config_.hostPattern)) {
        return Error{ErrorCode::InvalidArgument, "Not a supported host URL: " + request.url};
    }
    const auto kind = classify(request.url);
    if (kind == ResourceKind::Unknown) {
        return Error{ErrorCode::UnsupportedResource, "Unsupported link type: " + request.url};
    }

    AggregateResult result;
    result.url = request.url;
    result.kind = kind;

    try {
        std::error_code ec;
        fs::create_directories(request.destinationDir, ec);
        if (ec) {
            result.error = Error{ErrorCode::IoError, "Cannot create " +
                                                         request.destinationDir.string() + ": " +
                                                         ec.message()};
            spdlog::error("{}", result.error->message);
            return result;
        }

        if (kind == ResourceKind::Album) {
            auto listing = expander_.expandListing(request.url);
            result.albumName = listing.name;
            if (listing.items.empty()) {
                result.error = Error{ErrorCode::ResolutionFailed, "No items found in album"};
                spdlog::error("No items found in album {}", request.url);
                return result;
            }

            std::vector<DownloadOutcome> outcomes(listing.items.size());
            std::vector<ITaskScheduler::Task> tasks;
            tasks.reserve(listing.items.size());
            for (std::size_t i = 0; i < listing.items.size(); ++i) {
                tasks.emplace_back([this, &request, &listing, &outcomes, i]() {
                    const auto& item = listing.items[i];
                    try {
                        outcomes[i] = runItem(item, request);
                    } catch (const std::exception& e) {
                        spdlog::error("Item {} failed: {}", item, e.what());
                        outcomes[i] = failedOutcome(item, Error{ErrorCode::Unknown, e.what()});
                    }
                    if (!outcomes[i].success && !outcomes[i].skipped) {
                        spdlog::warn("Item {} failed", item);
                    }
                });
            }
            schedulerFor(request)->runAll(std::move(tasks));

            for (const auto& outcome : outcomes)
                addOutcome(result, outcome);
            result.success = result.succeeded > 0;
        } else {
            auto outcome = runItem(request.url, request);
            addOutcome(result, outcome);
            result.success = outcome.success;
            if (!outcome.success && !outcome.skipped)
                result.error = outcome.error;
        }
    } catch (const std::exception& e) {
        spdlog::error("Download of {} aborted: {}", request.url, e.what());
        result.error = Error{ErrorCode::Unknown, e.what()};
        result.success = false;
    }

    spdlog::info("Finished {}: {} downloaded, {} failed, {} skipped", request.url,
                 result.succeeded, result.failed, result.skipped);
    return result;
}

std::unique_ptr<IAssetDownloader> makeAssetDownloader(const DownloaderConfig& cfg,
                                                      std::shared_ptr<ServerHealthTracker> tracker) {
    std::shared_ptr<IHttpAdapter> http = makeCurlHttpAdapter();
    std::shared_ptr<const IPageFeatureExtractor> extractor = makeHtmlPageExtractor();
    return std::make_unique<DownloadOrchestrator>(cfg, std::move(http), std::move(extractor),
                                                  std::move(tracker));
}

} // namespace bunkget::downloader
