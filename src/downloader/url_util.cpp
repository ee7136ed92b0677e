#include <bunkget/downloader/url_util.hpp>

#include <algorithm>
#include <cctype>

namespace bunkget::downloader::url {

namespace {

std::string to_lower(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s)
        out.push_back(static_cast<char>(std::tolower(c)));
    return out;
}

int hex_value(char c) {
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return -1;
}

} // namespace

UrlParts split(std::string_view url) {
    UrlParts parts;
    std::string_view rest = url;

    auto schemeEnd = rest.find("://");
    if (schemeEnd != std::string_view::npos) {
        parts.scheme = to_lower(rest.substr(0, schemeEnd));
        rest.remove_prefix(schemeEnd + 3);

        auto authorityEnd = rest.find_first_of("/?#");
        std::string_view authority = rest.substr(0, authorityEnd);
        rest = authorityEnd == std::string_view::npos ? std::string_view{}
                                                      : rest.substr(authorityEnd);

        if (auto at = authority.rfind('@'); at != std::string_view::npos)
            authority.remove_prefix(at + 1);
        if (!authority.empty() && authority.front() == '[') {
            // [v6]:port
            auto close = authority.find(']');
            authority = authority.substr(0, close == std::string_view::npos ? authority.size()
                                                                             : close + 1);
        } else if (auto colon = authority.find(':'); colon != std::string_view::npos) {
            authority = authority.substr(0, colon);
        }
        parts.host = to_lower(authority);
    }

    auto pathEnd = rest.find_first_of("?#");
    parts.path = std::string(rest.substr(0, pathEnd));
    return parts;
}

std::string percentDecode(std::string_view in) {
    std::string out;
    out.reserve(in.size());
    for (std::size_t i = 0; i < in.size(); ++i) {
        if (in[i] == '%' && i + 2 < in.size()) {
            int hi = hex_value(in[i + 1]);
            int lo = hex_value(in[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out.push_back(static_cast<char>((hi << 4) | lo));
                i += 2;
                continue;
            }
        }
        out.push_back(in[i]);
    }
    return out;
}

std::vector<std::string> pathSegments(std::string_view path) {
    std::vector<std::string> segments;
    std::size_t start = 0;
    while (start <= path.size()) {
        auto end = path.find('/', start);
        if (end == std::string_view::npos)
            end = path.size();
        if (end > start)
            segments.emplace_back(path.substr(start, end - start));
        start = end + 1;
    }
    return segments;
}

std::string lastPathSegment(std::string_view url) {
    auto path = split(url).path;
    auto slash = path.rfind('/');
    return slash == std::string::npos ? path : path.substr(slash + 1);
}

std::string origin(std::string_view url) {
    auto parts = split(url);
    if (parts.host.empty())
        return {};
    return (parts.scheme.empty() ? std::string("https") : parts.scheme) + "://" + parts.host;
}

std::string resolveAgainst(std::string_view pageUrl, std::string_view href) {
    auto lower = to_lower(href.substr(0, std::min<std::size_t>(href.size(), 8)));
    if (lower.rfind("http://", 0) == 0 || lower.rfind("https://", 0) == 0)
        return std::string(href);

    auto parts = split(pageUrl);
    const std::string scheme = parts.scheme.empty() ? std::string("https") : parts.scheme;
    if (href.rfind("//", 0) == 0)
        return scheme + ":" + std::string(href);

    const std::string base = scheme + "://" + parts.host;
    if (!href.empty() && href.front() == '/')
        return base + std::string(href);

    const auto slash = parts.path.rfind('/');
    auto dir = slash == std::string::npos ? std::string{} : parts.path.substr(0, slash + 1);
    if (dir.empty())
        dir = "/";
    return base + dir + std::string(href);
}

} // namespace bunkget::downloader::url
