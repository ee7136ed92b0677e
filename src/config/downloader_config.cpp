#include <bunkget/config/config_helpers.h>
#include <bunkget/config/downloader_config.h>

#include <spdlog/spdlog.h>

#include <charconv>
#include <limits>
#include <optional>
#include <system_error>

namespace bunkget::config {

using downloader::DownloaderConfig;
using downloader::DownloadRequest;
using downloader::Error;
using downloader::ErrorCode;
using downloader::Expected;

namespace {

constexpr const char* kSection = "downloader";

using Section = std::map<std::string, std::string>;

// Reads an integer key in [lo, hi]; absent keys leave `out` untouched.
std::optional<Error> read_int(const Section& values, const std::string& key, long long lo,
                              long long hi, long long& out) {
    auto it = values.find(key);
    if (it == values.end())
        return std::nullopt;

    const auto& raw = it->second;
    long long parsed = 0;
    auto res = std::from_chars(raw.data(), raw.data() + raw.size(), parsed);
    if (res.ec != std::errc() || res.ptr != raw.data() + raw.size()) {
        return Error{ErrorCode::InvalidArgument,
                     "Invalid number for downloader." + key + ": '" + raw + "'"};
    }
    if (parsed < lo || parsed > hi) {
        return Error{ErrorCode::InvalidArgument, "Value out of range for downloader." + key +
                                                     ": " + raw};
    }
    out = parsed;
    return std::nullopt;
}

template <typename Duration>
std::optional<Error> read_duration(const Section& values, const std::string& key, Duration& out) {
    long long v = out.count();
    if (auto err = read_int(values, key, 0, std::numeric_limits<int>::max(), v))
        return err;
    out = Duration(v);
    return std::nullopt;
}

void read_string(const Section& values, const std::string& key, std::string& out) {
    if (auto it = values.find(key); it != values.end() && !it->second.empty())
        out = it->second;
}

} // namespace

Expected<DownloaderConfig> loadDownloaderConfig(const std::filesystem::path& config_path) {
    DownloaderConfig cfg;
    std::error_code ec;
    if (config_path.empty() || !std::filesystem::exists(config_path, ec)) {
        spdlog::debug("No config at '{}', using defaults", config_path.string());
        return cfg;
    }

    const auto values = parse_config_section(config_path, kSection);

    read_string(values, "api_url", cfg.apiUrl);
    read_string(values, "host_pattern", cfg.hostPattern);
    read_string(values, "user_agent", cfg.userAgent);
    read_string(values, "download_referer", cfg.downloadReferer);
    read_string(values, "ca_path", cfg.tls.caPath);
    // An explicitly empty status page disables health fetching
    if (auto it = values.find("status_page_url"); it != values.end())
        cfg.statusPageUrl = it->second;
    if (auto it = values.find("proxy"); it != values.end() && !it->second.empty())
        cfg.proxy = it->second;
    if (auto it = values.find("tls_insecure"); it != values.end())
        cfg.tls.insecure = parse_bool(it->second, cfg.tls.insecure);

    long long attempts = cfg.maxAttempts;
    long long nameLen = static_cast<long long>(cfg.maxFilenameLength);
    long long concurrency = cfg.concurrency;
    if (auto err = read_int(values, "max_attempts", 1, 100, attempts))
        return *err;
    if (auto err = read_int(values, "max_filename_length", 16, 255, nameLen))
        return *err;
    if (auto err = read_int(values, "concurrency", 1, 64, concurrency))
        return *err;
    cfg.maxAttempts = static_cast<int>(attempts);
    cfg.maxFilenameLength = static_cast<std::size_t>(nameLen);
    cfg.concurrency = static_cast<int>(concurrency);

    for (auto [key, field] : {std::pair{"page_timeout_ms", &cfg.pageTimeout},
                              std::pair{"api_timeout_ms", &cfg.apiTimeout},
                              std::pair{"download_timeout_ms", &cfg.downloadTimeout},
                              std::pair{"status_timeout_ms", &cfg.statusTimeout},
                              std::pair{"inter_item_delay_min_ms", &cfg.interItemDelayMin},
                              std::pair{"inter_item_delay_max_ms", &cfg.interItemDelayMax}}) {
        if (auto err = read_duration(values, key, *field))
            return *err;
    }
    if (auto err = read_duration(values, "status_ttl_s", cfg.statusTtl))
        return *err;

    if (cfg.interItemDelayMax < cfg.interItemDelayMin) {
        return Error{ErrorCode::InvalidArgument,
                     "downloader.inter_item_delay_max_ms is below inter_item_delay_min_ms"};
    }

    spdlog::debug("Loaded downloader config from {}", config_path.string());
    return cfg;
}

Expected<DownloadRequest> loadRequestDefaults(const std::filesystem::path& config_path) {
    DownloadRequest req;
    std::error_code ec;
    if (config_path.empty() || !std::filesystem::exists(config_path, ec))
        return req;

    const auto values = parse_config_section(config_path, kSection);
    if (auto it = values.find("output_dir"); it != values.end() && !it->second.empty())
        req.destinationDir = expand_tilde(it->second);
    if (auto it = values.find("ignore"); it != values.end())
        req.ignorePatterns = parse_string_list(it->second);
    if (auto it = values.find("include"); it != values.end())
        req.includePatterns = parse_string_list(it->second);
    if (auto it = values.find("concurrent"); it != values.end())
        req.concurrent = parse_bool(it->second, req.concurrent);
    return req;
}

} // namespace bunkget::config
