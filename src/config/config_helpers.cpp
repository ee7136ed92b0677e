#include <fstream>
#include <map>
#include <bunkget/config/config_helpers.h>

namespace bunkget::config {

namespace {

// Drop a trailing "# comment" that is not inside quotes.
std::string strip_inline_comment(const std::string& v) {
    char quote = '\0';
    for (size_t i = 0; i < v.size(); ++i) {
        const char c = v[i];
        if (quote) {
            if (c == quote)
                quote = '\0';
        } else if (c == '"' || c == '\'') {
            quote = c;
        } else if (c == '#') {
            return v.substr(0, i);
        }
    }
    return v;
}

// Calls fn(section, key, value) for every key/value line of the file.
template <typename Fn> void for_each_entry(const std::filesystem::path& config_path, Fn&& fn) {
    std::ifstream file(config_path);
    if (!file) {
        return;
    }

    std::string line;
    std::string currentSection;

    while (std::getline(file, line)) {
        trim(line);

        // Skip comments and empty lines
        if (line.empty() || line[0] == '#') {
            continue;
        }

        // Check for section headers [section]
        if (line[0] == '[') {
            size_t end = line.find(']');
            if (end != std::string::npos) {
                currentSection = line.substr(1, end - 1);
                trim(currentSection);
            }
            continue;
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            continue;
        }
        std::string k = line.substr(0, eq);
        std::string v = strip_inline_comment(line.substr(eq + 1));
        trim(k);
        trim(v);
        if (!fn(currentSection, k, unquote(v))) {
            return;
        }
    }
}

} // namespace

std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key) {
    std::string found;
    for_each_entry(config_path, [&](const std::string& s, const std::string& k, std::string v) {
        if ((section.empty() || s == section) && k == key) {
            found = std::move(v);
            return false;
        }
        return true;
    });
    return found;
}

std::map<std::string, std::string> parse_config_section(const std::filesystem::path& config_path,
                                                        const std::string& section) {
    std::map<std::string, std::string> values;
    for_each_entry(config_path, [&](const std::string& s, const std::string& k, std::string v) {
        // Support both "downloader.key" at top level and "[downloader] key"
        if (s == section) {
            values[k] = std::move(v);
        } else if (s.empty() && k.size() > section.size() + 1 && k.rfind(section + ".", 0) == 0) {
            values[k.substr(section.size() + 1)] = std::move(v);
        }
        return true;
    });
    return values;
}

std::vector<std::string> parse_string_list(const std::string& raw) {
    std::string s = raw;
    trim(s);
    if (s.size() >= 2 && s.front() == '[' && s.back() == ']') {
        s = s.substr(1, s.size() - 2);
    }

    std::vector<std::string> out;
    std::string item;
    char quote = '\0';
    auto flush = [&]() {
        auto v = unquote(item);
        if (!v.empty())
            out.push_back(std::move(v));
        item.clear();
    };
    for (char c : s) {
        if (quote) {
            if (c == quote)
                quote = '\0';
            item.push_back(c);
        } else if (c == '"' || c == '\'') {
            quote = c;
            item.push_back(c);
        } else if (c == ',') {
            flush();
        } else {
            item.push_back(c);
        }
    }
    flush();
    return out;
}

bool parse_bool(std::string_view raw, bool fallback) {
    std::string v(raw);
    trim(v);
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (v == "true" || v == "1" || v == "yes" || v == "on")
        return true;
    if (v == "false" || v == "0" || v == "no" || v == "off")
        return false;
    return fallback;
}

std::filesystem::path get_config_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return expand_tilde(override_path);
    }
    if (const char* env = std::getenv("BUNKGET_CONFIG"); env && *env) {
        return std::filesystem::path(env);
    }

    const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME");
    const char* homeEnv = std::getenv("HOME");

    std::filesystem::path configHome;
    if (xdgConfigHome && *xdgConfigHome) {
        configHome = std::filesystem::path(xdgConfigHome);
    } else if (homeEnv) {
        configHome = std::filesystem::path(homeEnv) / ".config";
    } else {
        return std::filesystem::path("~/.config") / "bunkget" / "config.toml";
    }

    return configHome / "bunkget" / "config.toml";
}

} // namespace bunkget::config
