#pragma once

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace bunkget::config {

// String trimming utilities
inline void ltrim(std::string& s) {
    s.erase(s.begin(),
            std::find_if(s.begin(), s.end(), [](unsigned char ch) { return !std::isspace(ch); }));
}

inline void rtrim(std::string& s) {
    s.erase(std::find_if(s.rbegin(), s.rend(), [](unsigned char ch) { return !std::isspace(ch); })
                .base(),
            s.end());
}

inline void trim(std::string& s) {
    ltrim(s);
    rtrim(s);
}

// Quote handling
inline std::string unquote(std::string val) {
    trim(val);
    if (val.size() >= 2 && ((val.front() == '"' && val.back() == '"') ||
                            (val.front() == '\'' && val.back() == '\''))) {
        return val.substr(1, val.size() - 2);
    }
    return val;
}

// Tilde expansion
inline std::filesystem::path expand_tilde(const std::string& path) {
    if (!path.empty() && path[0] == '~') {
        const char* home = std::getenv("HOME");
        if (home) {
            return path.size() > 1 ? std::filesystem::path(home) / path.substr(2)
                                   : std::filesystem::path(home);
        }
    }
    return path;
}

// Terminal sanitization: control bytes become '?', UTF-8 passes through
inline std::string sanitize_for_terminal(std::string_view in) {
    std::string out;
    out.reserve(in.size());
    for (unsigned char c : in) {
        if (c >= 0x20 && c != 0x7F) {
            out.push_back(static_cast<char>(c));
        } else if (c == '\n' || c == '\t') {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('?');
        }
    }
    return out;
}

// Parse a value from TOML config file
std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key);

// All key/value pairs of one [section], unquoted. Later duplicates win.
std::map<std::string, std::string> parse_config_section(const std::filesystem::path& config_path,
                                                        const std::string& section);

// Parse a comma- or TOML-array-separated list of strings.
// Accepts forms like "a,b" or ["a", "b"]. Empty items are dropped.
std::vector<std::string> parse_string_list(const std::string& raw);

// Parse "true"/"false"/"1"/"0"/"yes"/"no" (case-insensitive). Anything else is `fallback`.
bool parse_bool(std::string_view raw, bool fallback);

// Get standard config path
// override_path > $BUNKGET_CONFIG > $XDG_CONFIG_HOME/bunkget/config.toml > ~/.config/bunkget/config.toml
std::filesystem::path get_config_path(const std::string& override_path = "");

} // namespace bunkget::config
