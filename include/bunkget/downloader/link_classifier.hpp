#pragma once

#include <bunkget/downloader/downloader.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace bunkget::downloader {

/**
 * Kind from the second-to-last path segment: a -> Album, f -> File, v -> Video.
 * The URL is percent-decoded first; query, fragment and trailing slashes are ignored.
 */
[[nodiscard]] ResourceKind classify(std::string_view url);

/**
 * Identifier used for the decryption API (media slug) or album id.
 * Pure and deterministic in (url, pageContent); never throws.
 */
[[nodiscard]] std::string identify(std::string_view url,
                                   std::optional<std::string_view> pageContent = std::nullopt);

[[nodiscard]] ResourceReference
makeReference(std::string_view url, std::optional<std::string_view> pageContent = std::nullopt);

// Letters, digits, '_' and '-' only.
[[nodiscard]] bool isValidSlug(std::string_view candidate);

// Captured value of `const slug = "<value>"` in page content, if any.
[[nodiscard]] std::optional<std::string> findSlugAssignment(std::string_view content);

// True if the URL's host matches the supported host pattern (ECMAScript regex, searched).
[[nodiscard]] bool isSupportedHost(std::string_view url, const std::string& hostPattern);

} // namespace bunkget::downloader
