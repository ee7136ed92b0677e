#include <bunkget/downloader/album_expander.hpp>
#include <bunkget/downloader/url_util.hpp>

#include <spdlog/spdlog.h>

#include <exception>

namespace bunkget::downloader {

AlbumExpander::AlbumExpander(std::shared_ptr<IHttpAdapter> http,
                             std::shared_ptr<const IPageFeatureExtractor> extractor,
                             DownloaderConfig config)
    : http_(std::move(http)), extractor_(std::move(extractor)), config_(std::move(config)) {}

std::vector<std::string> AlbumExpander::expand(std::string_view albumUrl) const {
    return expandListing(albumUrl).items;
}

AlbumListing AlbumExpander::expandListing(std::string_view albumUrl) const {
    AlbumListing listing;
    if (!http_ || !extractor_) {
        return listing;
    }
    try {
        auto opts = makeRequestOptions(config_, browsingHeaders(config_), config_.pageTimeout);
        auto resp = http_->get(albumUrl, opts);
        if (!resp.ok()) {
            spdlog::error("Failed to fetch album page {}: {}", albumUrl, resp.error().message);
            return listing;
        }
        if (resp.value().status != 200) {
            spdlog::error("Failed to fetch album page {}: HTTP {}", albumUrl, resp.value().status);
            return listing;
        }

        const auto& html = resp.value().body;
        const auto host = url::origin(albumUrl);
        listing.name = extractor_->albumName(html);

        for (const auto& href : extractor_->itemLinks(html)) {
            if (href.empty() || href.front() != '/' || href.rfind("//", 0) == 0) {
                spdlog::debug("Ignoring non-relative album link {}", href);
                continue;
            }
            listing.items.push_back(host + href);
        }
        spdlog::info("Album {}: {} item(s){}", albumUrl, listing.items.size(),
                     listing.name ? " in '" + *listing.name + "'" : std::string{});
    } catch (const std::exception& e) {
        spdlog::error("Failed to expand album {}: {}", albumUrl, e.what());
        listing.items.clear();
    }
    return listing;
}

} // namespace bunkget::downloader
