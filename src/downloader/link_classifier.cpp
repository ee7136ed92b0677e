#include <bunkget/downloader/link_classifier.hpp>
#include <bunkget/downloader/url_util.hpp>

#include <spdlog/spdlog.h>

#include <cctype>
#include <regex>

namespace bunkget::downloader {

namespace {

std::vector<std::string> decodedSegments(std::string_view rawUrl) {
    auto decoded = url::percentDecode(rawUrl);
    return url::pathSegments(url::split(decoded).path);
}

ResourceKind kindFromSegments(const std::vector<std::string>& segments) {
    if (segments.size() < 2)
        return ResourceKind::Unknown;
    const auto& marker = segments[segments.size() - 2];
    if (marker == "a")
        return ResourceKind::Album;
    if (marker == "f")
        return ResourceKind::File;
    if (marker == "v")
        return ResourceKind::Video;
    return ResourceKind::Unknown;
}

} // namespace

ResourceKind classify(std::string_view url) {
    return kindFromSegments(decodedSegments(url));
}

bool isValidSlug(std::string_view candidate) {
    if (candidate.empty())
        return false;
    for (unsigned char c : candidate) {
        if (!(std::isalnum(c) || c == '_' || c == '-'))
            return false;
    }
    return true;
}

std::optional<std::string> findSlugAssignment(std::string_view content) {
    static const std::regex re(R"re(const\s+slug\s*=\s*"([a-zA-Z0-9_-]+)")re");
    std::match_results<std::string_view::const_iterator> m;
    if (std::regex_search(content.begin(), content.end(), m, re))
        return m[1].str();
    return std::nullopt;
}

std::string identify(std::string_view url, std::optional<std::string_view> pageContent) {
    const auto segments = decodedSegments(url);
    const std::string last = segments.empty() ? std::string{} : segments.back();

    if (kindFromSegments(segments) == ResourceKind::Album)
        return last.empty() ? std::string("unknown") : last;

    if (isValidSlug(last))
        return last;

    if (pageContent) {
        if (auto slug = findSlugAssignment(*pageContent))
            return *slug;
    }

    spdlog::warn("No media slug found for {}", url);
    if (!last.empty())
        return last;
    auto raw = url::lastPathSegment(url);
    return raw.empty() ? std::string("unknown") : raw;
}

ResourceReference makeReference(std::string_view url, std::optional<std::string_view> pageContent) {
    ResourceReference ref;
    ref.url = std::string(url);
    ref.kind = classify(url);
    ref.identifier = identify(url, pageContent);
    return ref;
}

bool isSupportedHost(std::string_view url, const std::string& hostPattern) {
    const auto host = url::split(url).host;
    if (host.empty())
        return false;
    try {
        const std::regex re(hostPattern, std::regex::ECMAScript | std::regex::icase);
        return std::regex_search(host, re);
    } catch (const std::regex_error& e) {
        spdlog::error("Invalid host pattern '{}': {}", hostPattern, e.what());
        return false;
    }
}

} // namespace bunkget::downloader
