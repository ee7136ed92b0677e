#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace bunkget::downloader {

/**
 * Narrow view over host markup. Everything that depends on the page structure lives behind
 * this interface so the pipeline can be driven by fixed inputs in tests.
 */
class IPageFeatureExtractor {
public:
    virtual ~IPageFeatureExtractor() = default;

    // Slug (or album id) for the decryption API.
    virtual std::string identifier(std::string_view pageUrl, std::string_view html) const = 0;

    // Filename shown on an item page.
    virtual std::optional<std::string> displayedFilename(std::string_view html) const = 0;

    // Title shown on an album page.
    virtual std::optional<std::string> albumName(std::string_view html) const = 0;

    // Raw href values of item links on an album page, in document order.
    virtual std::vector<std::string> itemLinks(std::string_view html) const = 0;

    // (display name, state text) pairs from the status page.
    virtual std::vector<std::pair<std::string, std::string>>
    statusRows(std::string_view html) const = 0;
};

/**
 * Class markers used by the host's current templates. An element matches when its class
 * list contains every token of the marker.
 */
struct PageMarkers {
    std::string itemLinkClass{"after:absolute after:z-10 after:inset-0"};
    std::string filenameClass{"text-subs font-semibold text-base sm:text-lg truncate"};
    std::string albumNameClass{"text-subs font-semibold flex text-base sm:text-lg"};
    std::string statusRowClass{"flex items-center gap-4 py-4 border-b border-soft last:border-b-0"};
};

std::unique_ptr<IPageFeatureExtractor> makeHtmlPageExtractor(PageMarkers markers = {});

namespace html {

// Decode the common named entities plus decimal/hex character references (UTF-8 output).
std::string decodeEntities(std::string_view text);

// Remove tags, decode entities, collapse whitespace runs and trim.
std::string textContent(std::string_view fragment);

} // namespace html

} // namespace bunkget::downloader
