#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace bunkget::downloader {

inline constexpr std::string_view kUnknownFilename = "unknown_file";

/**
 * Split "name.ext" into {"name", ".ext"}. A leading dot (".bashrc") or a trailing dot is not
 * an extension.
 */
[[nodiscard]] std::pair<std::string_view, std::string_view> splitExtension(std::string_view name);

/**
 * Combine the filename shown on the item page with the last segment of the resolved URL.
 *
 *  - identical names are used as-is
 *  - if the URL stem contains the page stem, the URL name wins
 *  - otherwise "<page-stem>-<url-stem><ext>", ext taken from the page name, or from the URL
 *    name when the page name has none
 *
 * An empty URL name yields the page name.
 */
[[nodiscard]] std::string mergeFilename(std::string_view pageName, std::string_view urlName);

/**
 * Replace characters that are unsafe in filenames (<>:"/\|?* and control bytes) with '_',
 * then truncate to maxBytes keeping the extension and never splitting a UTF-8 sequence.
 * Empty, "." and ".." become "unknown_file".
 */
[[nodiscard]] std::string sanitizeFilename(std::string_view name, std::size_t maxBytes);

/**
 * Substring filters: any ignore pattern contained in the name skips it; when include
 * patterns are given, a name containing none of them is skipped too.
 */
[[nodiscard]] bool shouldSkip(std::string_view filename, const std::vector<std::string>& ignore,
                              const std::vector<std::string>& include);

} // namespace bunkget::downloader
