#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace bunkget::downloader::url {

struct UrlParts {
    std::string scheme; // lower-case, empty when the input has none
    std::string host;   // lower-case, without userinfo and port
    std::string path;   // raw path, without query and fragment
};

// Split an absolute URL. Inputs without "://" are treated as a bare path.
UrlParts split(std::string_view url);

// Decode %XX escapes. Malformed escapes are kept verbatim; '+' is left alone.
std::string percentDecode(std::string_view in);

// Non-empty segments of a path, in order.
std::vector<std::string> pathSegments(std::string_view path);

// Text after the last '/' of the URL path (may be empty for a trailing slash).
std::string lastPathSegment(std::string_view url);

// "scheme://host" of an absolute URL.
std::string origin(std::string_view url);

// Resolve an href found on a page against that page's URL.
// - absolute http(s) hrefs are returned unchanged
// - "//host/x" takes the page's scheme
// - "/x" is appended to the page origin
// - anything else is resolved against the page's directory
std::string resolveAgainst(std::string_view pageUrl, std::string_view href);

} // namespace bunkget::downloader::url
