#pragma once

#include <bunkget/downloader/downloader.hpp>
#include <bunkget/downloader/page_extractor.hpp>

#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace bunkget::downloader {

/**
 * Turns an item page into a direct download URL and a filename.
 *
 * page GET -> identifier -> POST {"slug": id} to the key API -> decrypt the returned URL
 * with the hourly key -> merge the displayed filename with the URL's last segment.
 */
class AssetResolver {
public:
    AssetResolver(std::shared_ptr<IHttpAdapter> http,
                  std::shared_ptr<const IPageFeatureExtractor> extractor, DownloaderConfig config);

    // Empty on any failure. Never throws.
    std::optional<AssetDescriptor> resolve(std::string_view itemUrl) const;

    /**
     * Parse a key API response body and decrypt its URL.
     * Requires {"timestamp": number, "url": string}; an empty decrypted URL is an error.
     */
    [[nodiscard]] static Expected<std::string> decryptApiResponse(std::string_view body);

private:
    std::optional<std::string> fetchPage(std::string_view itemUrl) const;
    std::optional<std::string> requestCipher(const std::string& slug) const;

    std::shared_ptr<IHttpAdapter> http_;
    std::shared_ptr<const IPageFeatureExtractor> extractor_;
    DownloaderConfig config_;
};

} // namespace bunkget::downloader
