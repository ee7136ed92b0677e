#include <bunkget/downloader/filename_util.hpp>

#include <spdlog/spdlog.h>

namespace bunkget::downloader {

namespace {

bool isUnsafe(unsigned char c) {
    switch (c) {
        case '<':
        case '>':
        case ':':
        case '"':
        case '/':
        case '\\':
        case '|':
        case '?':
        case '*':
            return true;
        default:
            return c < 0x20 || c == 0x7f;
    }
}

// Largest n' <= n such that s[0, n') ends on a UTF-8 code point boundary.
std::size_t utf8Floor(std::string_view s, std::size_t n) {
    if (n >= s.size())
        return s.size();
    while (n > 0 && (static_cast<unsigned char>(s[n]) & 0xC0) == 0x80)
        --n;
    return n;
}

} // namespace

std::pair<std::string_view, std::string_view> splitExtension(std::string_view name) {
    const auto dot = name.rfind('.');
    if (dot == std::string_view::npos || dot == 0 || dot + 1 == name.size())
        return {name, {}};
    return {name.substr(0, dot), name.substr(dot)};
}

std::string mergeFilename(std::string_view pageName, std::string_view urlName) {
    if (urlName.empty() || pageName == urlName)
        return std::string(pageName);

    const auto [pageStem, pageExt] = splitExtension(pageName);
    const auto [urlStem, urlExt] = splitExtension(urlName);

    if (urlStem.find(pageStem) != std::string_view::npos)
        return std::string(urlName);

    std::string merged;
    merged.reserve(pageName.size() + urlName.size() + 1);
    merged.append(pageStem).append("-").append(urlStem);
    merged.append(pageExt.empty() ? urlExt : pageExt);
    return merged;
}

std::string sanitizeFilename(std::string_view name, std::size_t maxBytes) {
    std::string safe;
    safe.reserve(name.size());
    for (char ch : name)
        safe.push_back(isUnsafe(static_cast<unsigned char>(ch)) ? '_' : ch);

    if (safe.size() > maxBytes) {
        const auto [stem, ext] = splitExtension(safe);
        if (ext.size() < maxBytes) {
            const auto keep = utf8Floor(stem, maxBytes - ext.size());
            safe = std::string(stem.substr(0, keep)) + std::string(ext);
        } else {
            safe.resize(utf8Floor(safe, maxBytes));
        }
    }

    if (safe.empty() || safe == "." || safe == "..")
        return std::string(kUnknownFilename);
    return safe;
}

bool shouldSkip(std::string_view filename, const std::vector<std::string>& ignore,
                const std::vector<std::string>& include) {
    for (const auto& pattern : ignore) {
        if (!pattern.empty() && filename.find(pattern) != std::string_view::npos) {
            spdlog::info("Skipping {}: matches ignore pattern '{}'", filename, pattern);
            return true;
        }
    }
    if (include.empty())
        return false;
    for (const auto& pattern : include) {
        if (filename.find(pattern) != std::string_view::npos)
            return false;
    }
    spdlog::info("Skipping {}: matches no include pattern", filename);
    return true;
}

} // namespace bunkget::downloader
