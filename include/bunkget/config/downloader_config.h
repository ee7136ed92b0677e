#pragma once

#include <bunkget/downloader/downloader.hpp>

#include <filesystem>

namespace bunkget::config {

/**
 * Read the [downloader] section of a TOML-style config file on top of the built-in defaults.
 *
 * A missing file yields the defaults. Keys that are present but malformed (non-numeric or
 * out-of-range numbers) are reported as ErrorCode::InvalidArgument naming the key.
 *
 * Recognized keys:
 *   api_url, status_page_url, host_pattern, user_agent, download_referer, proxy, ca_path,
 *   tls_insecure, max_attempts, max_filename_length, concurrency, status_ttl_s,
 *   page_timeout_ms, api_timeout_ms, download_timeout_ms, status_timeout_ms,
 *   inter_item_delay_min_ms, inter_item_delay_max_ms
 */
downloader::Expected<downloader::DownloaderConfig>
loadDownloaderConfig(const std::filesystem::path& config_path);

/**
 * Request defaults from the same section: output_dir, ignore, include (lists), concurrent.
 * The url is left empty.
 */
downloader::Expected<downloader::DownloadRequest>
loadRequestDefaults(const std::filesystem::path& config_path);

} // namespace bunkget::config
