/*
 * page_extractor.cpp
 *
 * Minimal tag scanner for the host's server-rendered pages. It is not a general HTML parser:
 * it finds start tags by name, reads their attributes, and pairs them with the matching end
 * tag by depth counting. Comments and <script>/<style> bodies are skipped.
 */

#include <bunkget/downloader/link_classifier.hpp>
#include <bunkget/downloader/page_extractor.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cstdint>

namespace bunkget::downloader {

namespace {

struct Tag {
    std::string name;
    std::vector<std::pair<std::string, std::string>> attrs;
    std::size_t start{0};        // position of '<'
    std::size_t contentStart{0}; // position after '>'
    bool selfClosing{false};

    std::optional<std::string> attr(std::string_view key) const {
        for (const auto& [k, v] : attrs) {
            if (k == key)
                return v;
        }
        return std::nullopt;
    }
};

char lower(char c) {
    return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

bool startsWithCaseless(std::string_view s, std::size_t pos, std::string_view prefix) {
    if (pos + prefix.size() > s.size())
        return false;
    for (std::size_t i = 0; i < prefix.size(); ++i) {
        if (lower(s[pos + i]) != lower(prefix[i]))
            return false;
    }
    return true;
}

bool isNameChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == ':' || c == '_';
}

std::size_t skipSpace(std::string_view s, std::size_t pos) {
    while (pos < s.size() && std::isspace(static_cast<unsigned char>(s[pos])))
        ++pos;
    return pos;
}

// Parse the tag starting at html[lt] == '<'. Returns nullopt for end tags, comments,
// doctypes and malformed input; `next` is always advanced past what was consumed.
std::optional<Tag> parseTagAt(std::string_view html, std::size_t lt, std::size_t& next) {
    next = lt + 1;
    if (startsWithCaseless(html, lt, "<!--")) {
        auto end = html.find("-->", lt + 4);
        next = end == std::string_view::npos ? html.size() : end + 3;
        return std::nullopt;
    }
    if (lt + 1 >= html.size() || !std::isalpha(static_cast<unsigned char>(html[lt + 1]))) {
        auto gt = html.find('>', lt + 1);
        next = gt == std::string_view::npos ? html.size() : gt + 1;
        return std::nullopt;
    }

    Tag tag;
    tag.start = lt;
    std::size_t pos = lt + 1;
    while (pos < html.size() && isNameChar(html[pos]))
        tag.name.push_back(lower(html[pos++]));

    while (pos < html.size()) {
        pos = skipSpace(html, pos);
        if (pos >= html.size())
            break;
        if (html[pos] == '>') {
            ++pos;
            break;
        }
        if (html[pos] == '/') {
            tag.selfClosing = true;
            ++pos;
            continue;
        }

        std::string key;
        while (pos < html.size() && !std::isspace(static_cast<unsigned char>(html[pos])) &&
               html[pos] != '=' && html[pos] != '>' && html[pos] != '/') {
            key.push_back(lower(html[pos++]));
        }
        if (key.empty()) {
            ++pos;
            continue;
        }

        std::string value;
        pos = skipSpace(html, pos);
        if (pos < html.size() && html[pos] == '=') {
            pos = skipSpace(html, pos + 1);
            if (pos < html.size() && (html[pos] == '"' || html[pos] == '\'')) {
                const char quote = html[pos];
                auto close = html.find(quote, pos + 1);
                if (close == std::string_view::npos)
                    close = html.size();
                value = std::string(html.substr(pos + 1, close - pos - 1));
                pos = std::min(close + 1, html.size());
            } else {
                while (pos < html.size() && !std::isspace(static_cast<unsigned char>(html[pos])) &&
                       html[pos] != '>')
                    value.push_back(html[pos++]);
            }
        }
        tag.attrs.emplace_back(std::move(key), html::decodeEntities(value));
    }

    tag.contentStart = pos;
    next = pos;
    return tag;
}

// Index just past the end tag matching an element named `name` opened before `from`.
// Returns {innerEnd, afterEnd}; both are html.size() when the element is never closed.
std::pair<std::size_t, std::size_t> findClose(std::string_view html, std::size_t from,
                                              const std::string& name) {
    const std::string open = "<" + name;
    const std::string close = "</" + name;
    int depth = 1;
    std::size_t pos = from;
    while (pos < html.size()) {
        auto lt = html.find('<', pos);
        if (lt == std::string_view::npos)
            break;
        if (startsWithCaseless(html, lt, close) &&
            (lt + close.size() >= html.size() || !isNameChar(html[lt + close.size()]))) {
            if (--depth == 0) {
                auto gt = html.find('>', lt);
                return {lt, gt == std::string_view::npos ? html.size() : gt + 1};
            }
            pos = lt + close.size();
            continue;
        }
        if (startsWithCaseless(html, lt, open) &&
            (lt + open.size() < html.size() && !isNameChar(html[lt + open.size()]))) {
            std::size_t next = 0;
            auto nested = parseTagAt(html, lt, next);
            if (nested && !nested->selfClosing)
                ++depth;
            pos = next;
            continue;
        }
        pos = lt + 1;
    }
    return {html.size(), html.size()};
}

// All start tags named `name`, in document order. Raw-text elements are skipped over.
std::vector<Tag> findTags(std::string_view html, std::string_view name) {
    std::vector<Tag> out;
    std::size_t pos = 0;
    while (pos < html.size()) {
        auto lt = html.find('<', pos);
        if (lt == std::string_view::npos)
            break;
        std::size_t next = 0;
        auto tag = parseTagAt(html, lt, next);
        pos = next;
        if (!tag)
            continue;
        if (tag->name == name) {
            out.push_back(*tag);
        } else if ((tag->name == "script" || tag->name == "style") && !tag->selfClosing) {
            pos = findClose(html, tag->contentStart, tag->name).second;
        }
    }
    return out;
}

std::string_view innerOf(std::string_view html, const Tag& tag) {
    if (tag.selfClosing)
        return {};
    const auto innerEnd = findClose(html, tag.contentStart, tag.name).first;
    return html.substr(tag.contentStart, innerEnd - tag.contentStart);
}

std::vector<std::string> splitTokens(std::string_view s) {
    std::vector<std::string> tokens;
    std::size_t pos = 0;
    while (pos < s.size()) {
        pos = skipSpace(s, pos);
        auto end = pos;
        while (end < s.size() && !std::isspace(static_cast<unsigned char>(s[end])))
            ++end;
        if (end > pos)
            tokens.emplace_back(s.substr(pos, end - pos));
        pos = end;
    }
    return tokens;
}

bool hasClasses(const Tag& tag, const std::vector<std::string>& required) {
    auto cls = tag.attr("class");
    if (!cls)
        return false;
    const auto have = splitTokens(*cls);
    return std::all_of(required.begin(), required.end(), [&](const std::string& token) {
        return std::find(have.begin(), have.end(), token) != have.end();
    });
}

std::optional<std::string> firstText(std::string_view fragment, std::string_view tagName) {
    auto tags = findTags(fragment, tagName);
    if (tags.empty())
        return std::nullopt;
    return html::textContent(innerOf(fragment, tags.front()));
}

void appendUtf8(std::string& out, std::uint32_t cp) {
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

class HtmlPageExtractor final : public IPageFeatureExtractor {
public:
    explicit HtmlPageExtractor(PageMarkers markers)
        : itemLink_(splitTokens(markers.itemLinkClass)),
          filename_(splitTokens(markers.filenameClass)),
          albumName_(splitTokens(markers.albumNameClass)),
          statusRow_(splitTokens(markers.statusRowClass)) {}

    std::string identifier(std::string_view pageUrl, std::string_view html) const override {
        return identify(pageUrl, html);
    }

    std::optional<std::string> displayedFilename(std::string_view html) const override {
        for (const auto& tag : findTags(html, "h1")) {
            if (!hasClasses(tag, filename_))
                continue;
            auto text = html::textContent(innerOf(html, tag));
            if (!text.empty())
                return text;
        }
        return std::nullopt;
    }

    std::optional<std::string> albumName(std::string_view html) const override {
        for (const auto& tag : findTags(html, "div")) {
            if (!hasClasses(tag, albumName_))
                continue;
            auto name = firstText(innerOf(html, tag), "h1");
            if (name && !name->empty())
                return name;
        }
        return std::nullopt;
    }

    std::vector<std::string> itemLinks(std::string_view html) const override {
        std::vector<std::string> links;
        for (const auto& tag : findTags(html, "a")) {
            if (!hasClasses(tag, itemLink_))
                continue;
            auto href = tag.attr("href");
            if (href && !href->empty())
                links.push_back(*href);
        }
        spdlog::debug("Found {} item links", links.size());
        return links;
    }

    std::vector<std::pair<std::string, std::string>>
    statusRows(std::string_view html) const override {
        std::vector<std::pair<std::string, std::string>> rows;
        for (const auto& tag : findTags(html, "div")) {
            if (!hasClasses(tag, statusRow_))
                continue;
            auto inner = innerOf(html, tag);
            auto name = firstText(inner, "p");
            auto state = firstText(inner, "span");
            if (!name || !state || name->empty())
                continue;
            rows.emplace_back(std::move(*name), std::move(*state));
        }
        return rows;
    }

private:
    std::vector<std::string> itemLink_;
    std::vector<std::string> filename_;
    std::vector<std::string> albumName_;
    std::vector<std::string> statusRow_;
};

} // namespace

namespace html {

std::string decodeEntities(std::string_view text) {
    static const std::vector<std::pair<std::string_view, std::string_view>> entities = {
        {"&amp;", "&"},   {"&lt;", "<"},    {"&gt;", ">"},     {"&quot;", "\""},
        {"&apos;", "'"},  {"&nbsp;", " "},  {"&ndash;", "\xE2\x80\x93"},  {"&mdash;", "\xE2\x80\x94"},
        {"&hellip;", "…"}, {"&lsquo;", "‘"}, {"&rsquo;", "’"}, {"&ldquo;", "“"},
        {"&rdquo;", "”"}};

    std::string out;
    out.reserve(text.size());
    std::size_t pos = 0;
    while (pos < text.size()) {
        if (text[pos] != '&') {
            out.push_back(text[pos++]);
            continue;
        }

        bool decoded = false;
        for (const auto& [entity, replacement] : entities) {
            if (text.compare(pos, entity.size(), entity) == 0) {
                out.append(replacement);
                pos += entity.size();
                decoded = true;
                break;
            }
        }
        if (decoded)
            continue;

        // &#123; or &#x1F;
        if (pos + 2 < text.size() && text[pos + 1] == '#') {
            const bool hex = text[pos + 2] == 'x' || text[pos + 2] == 'X';
            const std::size_t digits = pos + (hex ? 3 : 2);
            auto semi = text.find(';', digits);
            if (semi != std::string_view::npos && semi > digits && semi - digits <= 8) {
                std::uint32_t cp = 0;
                bool valid = true;
                for (std::size_t i = digits; i < semi && valid; ++i) {
                    const auto c = static_cast<unsigned char>(text[i]);
                    if (hex && std::isxdigit(c)) {
                        cp = cp * 16 + static_cast<std::uint32_t>(
                                           std::isdigit(c) ? c - '0' : std::tolower(c) - 'a' + 10);
                    } else if (!hex && std::isdigit(c)) {
                        cp = cp * 10 + static_cast<std::uint32_t>(c - '0');
                    } else {
                        valid = false;
                    }
                }
                if (valid && cp > 0 && cp <= 0x10FFFF && !(cp >= 0xD800 && cp <= 0xDFFF)) {
                    appendUtf8(out, cp);
                    pos = semi + 1;
                    continue;
                }
            }
        }

        out.push_back(text[pos++]);
    }
    return out;
}

std::string textContent(std::string_view fragment) {
    std::string stripped;
    stripped.reserve(fragment.size());
    bool inTag = false;
    for (char c : fragment) {
        if (c == '<') {
            inTag = true;
        } else if (c == '>' && inTag) {
            inTag = false;
        } else if (!inTag) {
            stripped.push_back(c);
        }
    }

    auto decoded = decodeEntities(stripped);
    std::string out;
    out.reserve(decoded.size());
    bool pendingSpace = false;
    for (char c : decoded) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            pendingSpace = !out.empty();
            continue;
        }
        if (pendingSpace) {
            out.push_back(' ');
            pendingSpace = false;
        }
        out.push_back(c);
    }
    return out;
}

} // namespace html

std::unique_ptr<IPageFeatureExtractor> makeHtmlPageExtractor(PageMarkers markers) {
    return std::make_unique<HtmlPageExtractor>(std::move(markers));
}

} // namespace bunkget::downloader
