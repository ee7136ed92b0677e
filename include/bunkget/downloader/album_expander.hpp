#pragma once

#include <bunkget/downloader/downloader.hpp>
#include <bunkget/downloader/page_extractor.hpp>

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace bunkget::downloader {

struct AlbumListing {
    std::optional<std::string> name;
    std::vector<std::string> items;
};

/**
 * Lists the item pages of an album. Only relative item links are kept; they are resolved
 * against the album's scheme and host and returned in document order.
 */
class AlbumExpander {
public:
    AlbumExpander(std::shared_ptr<IHttpAdapter> http,
                  std::shared_ptr<const IPageFeatureExtractor> extractor, DownloaderConfig config);

    // Empty on any fetch or parse failure.
    std::vector<std::string> expand(std::string_view albumUrl) const;

    AlbumListing expandListing(std::string_view albumUrl) const;

private:
    std::shared_ptr<IHttpAdapter> http_;
    std::shared_ptr<const IPageFeatureExtractor> extractor_;
    DownloaderConfig config_;
};

} // namespace bunkget::downloader
