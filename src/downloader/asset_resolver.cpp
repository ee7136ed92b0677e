#include <bunkget/downloader/asset_resolver.hpp>
#include <bunkget/downloader/filename_util.hpp>
#include <bunkget/downloader/url_cipher.hpp>
#include <bunkget/downloader/url_util.hpp>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <cmath>
#include <exception>

namespace bunkget::downloader {

using json = nlohmann::json;

namespace {

// Far beyond any real epoch value, and small enough for the hour bucket to fit in int64.
constexpr double kMaxTimestamp = 1e15;

} // namespace

AssetResolver::AssetResolver(std::shared_ptr<IHttpAdapter> http,
                             std::shared_ptr<const IPageFeatureExtractor> extractor,
                             DownloaderConfig config)
    : http_(std::move(http)), extractor_(std::move(extractor)), config_(std::move(config)) {}

Expected<std::string> AssetResolver::decryptApiResponse(std::string_view body) {
    auto doc = json::parse(body.begin(), body.end(), nullptr, /*allow_exceptions=*/false);
    if (doc.is_discarded() || !doc.is_object()) {
        return Error{ErrorCode::ResolutionFailed, "Key API returned invalid JSON"};
    }
    auto ts = doc.find("timestamp");
    auto cipherText = doc.find("url");
    if (ts == doc.end() || !ts->is_number()) {
        return Error{ErrorCode::ResolutionFailed, "Key API response has no numeric 'timestamp'"};
    }
    if (cipherText == doc.end() || !cipherText->is_string()) {
        return Error{ErrorCode::ResolutionFailed, "Key API response has no 'url' string"};
    }

    const auto timestamp = ts->get<double>();
    if (!std::isfinite(timestamp) || std::fabs(timestamp) > kMaxTimestamp) {
        return Error{ErrorCode::ResolutionFailed, "Key API timestamp out of range"};
    }

    auto plain = cipher::decryptUrl(timestamp, cipherText->get_ref<const std::string&>());
    if (!plain.ok()) {
        return plain.error();
    }
    if (plain.value().empty()) {
        return Error{ErrorCode::ResolutionFailed, "Decrypted URL is empty"};
    }
    return plain;
}

std::optional<std::string> AssetResolver::fetchPage(std::string_view itemUrl) const {
    auto opts = makeRequestOptions(config_, browsingHeaders(config_), config_.pageTimeout);
    auto resp = http_->get(itemUrl, opts);
    if (!resp.ok()) {
        spdlog::error("Failed to fetch item page {}: {}", itemUrl, resp.error().message);
        return std::nullopt;
    }
    if (resp.value().status != 200) {
        spdlog::error("Failed to fetch item page {}: HTTP {}", itemUrl, resp.value().status);
        return std::nullopt;
    }
    return std::move(resp).value().body;
}

std::optional<std::string> AssetResolver::requestCipher(const std::string& slug) const {
    const json payload = {{"slug", slug}};
    auto opts = makeRequestOptions(config_, browsingHeaders(config_), config_.apiTimeout);
    auto resp = http_->post(config_.apiUrl, payload.dump(), "application/json", opts);
    if (!resp.ok()) {
        spdlog::error("Key request for slug '{}' failed: {}", slug, resp.error().message);
        return std::nullopt;
    }
    if (resp.value().status != 200) {
        spdlog::warn("Key request for slug '{}' failed: HTTP {}", slug, resp.value().status);
        return std::nullopt;
    }
    return std::move(resp).value().body;
}

std::optional<AssetDescriptor> AssetResolver::resolve(std::string_view itemUrl) const {
    if (!http_ || !extractor_) {
        return std::nullopt;
    }
    try {
        auto page = fetchPage(itemUrl);
        if (!page) {
            return std::nullopt;
        }

        const auto slug = extractor_->identifier(itemUrl, *page);
        auto body = requestCipher(slug);
        if (!body) {
            return std::nullopt;
        }

        auto downloadUrl = decryptApiResponse(*body);
        if (!downloadUrl.ok()) {
            spdlog::error("Could not resolve {}: {}", itemUrl, downloadUrl.error().message);
            return std::nullopt;
        }
        spdlog::debug("Resolved {} -> {}", itemUrl, downloadUrl.value().substr(0, 50));

        std::string pageName{kUnknownFilename};
        if (auto shown = extractor_->displayedFilename(*page); shown && !shown->empty()) {
            pageName = cipher::repairLatin1Mojibake(*shown);
        }

        const auto urlName = url::lastPathSegment(downloadUrl.value());

        AssetDescriptor asset;
        asset.resolvedUrl = std::move(downloadUrl).value();
        asset.filename = mergeFilename(pageName, urlName);
        return asset;
    } catch (const std::exception& e) {
        spdlog::error("Could not resolve {}: {}", itemUrl, e.what());
        return std::nullopt;
    }
}

} // namespace bunkget::downloader
