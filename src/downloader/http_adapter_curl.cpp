/*
 * http_adapter_curl.cpp
 *
 * Notes
 * - Implements IHttpAdapter with the libcurl easy API, one handle per request.
 * - Honors timeout, TLS verify/CA, proxy, headers and redirects.
 * - get()/post() buffer the body and return any HTTP status to the caller.
 * - fetchStream() uses CURLOPT_FAILONERROR so error bodies never reach the sink; the status
 *   is reported through Error::httpStatus.
 * - Buffered requests negotiate compression; streamed downloads do not, so byte counts
 *   stay comparable to Content-Length.
 *
 * Build
 * - Linked via CURL::libcurl.
 * - Depends on spdlog for logging.
 */

#include <bunkget/downloader/downloader.hpp>

#include <spdlog/spdlog.h>
#include <curl/curl.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <mutex>
#include <stdexcept>
#include <string_view>

namespace bunkget::downloader {

// Local helper: lowercase copy
static std::string to_lower(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s)
        out.push_back(static_cast<char>(std::tolower(c)));
    return out;
}

// Local helper: trim whitespace
static std::string trim(std::string_view s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b])))
        ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1])))
        --e;
    return std::string{s.substr(b, e - b)};
}

static void ensure_curl_initialized() {
    static std::once_flag flag;
    std::call_once(flag, [] {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
            throw std::runtime_error("Failed to initialize libcurl");
        }
        std::atexit([] { curl_global_cleanup(); });
    });
}

// Map CURLcode to Error
static Error makeCurlError(CURLcode code, std::string_view where) {
    Error err;
    err.message = std::string(where) + ": " + curl_easy_strerror(code);
    switch (code) {
        case CURLE_OK:
            err.code = ErrorCode::None;
            break;
        case CURLE_OPERATION_TIMEDOUT:
            err.code = ErrorCode::Timeout;
            break;
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_PEER_FAILED_VERIFICATION:
        /* CURLE_SSL_CACERT is an alias of CURLE_PEER_FAILED_VERIFICATION in newer libcurl */
        case CURLE_SSL_CACERT_BADFILE:
        case CURLE_SSL_CERTPROBLEM:
        case CURLE_SSL_CIPHER:
        case CURLE_SSL_ISSUER_ERROR:
            err.code = ErrorCode::TlsVerificationFailed;
            break;
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
        case CURLE_COULDNT_CONNECT:
        case CURLE_RECV_ERROR:
        case CURLE_SEND_ERROR:
        case CURLE_GOT_NOTHING:
        case CURLE_HTTP2:
        case CURLE_HTTP2_STREAM:
            err.code = ErrorCode::NetworkError;
            break;
        case CURLE_PARTIAL_FILE:
            err.code = ErrorCode::IncompleteTransfer;
            break;
        default:
            err.code = ErrorCode::Unknown;
            break;
    }
    return err;
}

// Header parser context
struct HeaderParseContext {
    std::optional<std::uint64_t> contentLength{};
};

// CURL header callback. Content-Length of the last response in a redirect chain wins.
static size_t header_cb(char* buffer, size_t size, size_t nitems, void* userdata) {
    const size_t total = size * nitems;
    if (total == 0 || userdata == nullptr)
        return 0;

    auto* ctx = static_cast<HeaderParseContext*>(userdata);
    std::string_view line(buffer, total);

    while (!line.empty() && (line.back() == '\r' || line.back() == '\n'))
        line.remove_suffix(1);

    // New status line: forget values from a previous (redirect) response
    if (line.rfind("HTTP/", 0) == 0) {
        ctx->contentLength.reset();
        return total;
    }

    auto colon = line.find(':');
    if (colon == std::string_view::npos)
        return total;

    auto key = to_lower(trim(line.substr(0, colon)));
    auto val = trim(line.substr(colon + 1));

    if (key == "content-length") {
        std::uint64_t tmp{0};
        auto res = std::from_chars(val.data(), val.data() + val.size(), tmp);
        if (res.ec == std::errc()) {
            ctx->contentLength = tmp;
        }
    }
    return total;
}

// Buffer sink for get()/post()
static size_t buffer_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    const size_t total = size * nmemb;
    if (userdata == nullptr)
        return 0;
    static_cast<std::string*>(userdata)->append(ptr, total);
    return total;
}

// Write sink context for fetchStream
struct StreamContext {
    const StreamHandlers* handlers{nullptr};
    HeaderParseContext* headers{nullptr};
    bool started{false};
    std::optional<Error> handlerError{};
};

static Expected<void> start_stream(StreamContext& ctx) {
    if (ctx.started)
        return {};
    ctx.started = true;
    if (ctx.handlers->onStart)
        return ctx.handlers->onStart(ctx.headers->contentLength);
    return {};
}

// CURL write callback
static size_t stream_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    const size_t total = size * nmemb;
    if (userdata == nullptr)
        return 0;
    auto* ctx = static_cast<StreamContext*>(userdata);
    if (total == 0)
        return 0;

    auto sr = start_stream(*ctx);
    if (!sr.ok()) {
        ctx->handlerError = sr.error();
        return 0; // signal error to curl => CURLE_WRITE_ERROR
    }

    std::span<const std::byte> bytes{reinterpret_cast<const std::byte*>(ptr), total};
    auto r = ctx->handlers->onData ? ctx->handlers->onData(bytes)
                                   : Expected<void>{Error{ErrorCode::IoError, "No sink provided"}};
    if (!r.ok()) {
        ctx->handlerError = r.error();
        return 0;
    }
    return total;
}

// Helper to build curl_slist from headers
static curl_slist* build_header_list(const std::vector<Header>& headers) {
    curl_slist* list = nullptr;
    for (const auto& h : headers) {
        std::string line = h.name;
        line.append(": ");
        line.append(h.value);
        list = curl_slist_append(list, line.c_str());
    }
    return list;
}

// Common CURL easy handle configuration
static void configure_common(CURL* curl, const RequestOptions& opts) {
    // Timeouts
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(opts.timeout.count()));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS,
                     static_cast<long>(std::min<long>(opts.timeout.count(), 30000)));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    // Redirects
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, opts.followRedirects ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 5L);

    // TLS
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, opts.tls.insecure ? 0L : 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, opts.tls.insecure ? 0L : 2L);
    if (!opts.tls.caPath.empty()) {
        curl_easy_setopt(curl, CURLOPT_CAINFO, opts.tls.caPath.c_str());
    }

    // Proxy
    if (opts.proxy && !opts.proxy->empty()) {
        curl_easy_setopt(curl, CURLOPT_PROXY, opts.proxy->c_str());
    }

    // Robustness
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPALIVE, 1L);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPIDLE, 30L);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPINTVL, 15L);
    curl_easy_setopt(curl, CURLOPT_HTTP_VERSION, CURL_HTTP_VERSION_2TLS);
}

// Owns an easy handle and its header list for the duration of one request.
class EasyRequest {
public:
    EasyRequest(std::string_view url, const RequestOptions& opts)
        : curl_(curl_easy_init()), url_(url), headers_(build_header_list(opts.headers)) {
        if (!curl_)
            return;
        curl_easy_setopt(curl_, CURLOPT_URL, url_.c_str());
        curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, headers_);
        configure_common(curl_, opts);
    }
    ~EasyRequest() {
        if (headers_)
            curl_slist_free_all(headers_);
        if (curl_)
            curl_easy_cleanup(curl_);
    }
    EasyRequest(const EasyRequest&) = delete;
    EasyRequest& operator=(const EasyRequest&) = delete;

    CURL* get() const noexcept { return curl_; }

    long status() const {
        long http_status = 0;
        curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &http_status);
        return http_status;
    }

private:
    CURL* curl_;
    std::string url_;
    curl_slist* headers_;
};

class CurlHttpAdapter final : public IHttpAdapter {
public:
    CurlHttpAdapter() { ensure_curl_initialized(); }
    ~CurlHttpAdapter() override = default;

    Expected<HttpResponse> get(std::string_view url, const RequestOptions& options) override {
        EasyRequest req(url, options);
        if (!req.get()) {
            return Error{ErrorCode::Unknown, "curl_easy_init failed"};
        }
        curl_easy_setopt(req.get(), CURLOPT_HTTPGET, 1L);
        return performBuffered(req, "get");
    }

    Expected<HttpResponse> post(std::string_view url, std::string_view body,
                                std::string_view contentType,
                                const RequestOptions& options) override {
        RequestOptions withType = options;
        withType.headers.push_back({"Content-Type", std::string(contentType)});
        EasyRequest req(url, withType);
        if (!req.get()) {
            return Error{ErrorCode::Unknown, "curl_easy_init failed"};
        }
        curl_easy_setopt(req.get(), CURLOPT_POST, 1L);
        curl_easy_setopt(req.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
        curl_easy_setopt(req.get(), CURLOPT_COPYPOSTFIELDS, std::string(body).c_str());
        return performBuffered(req, "post");
    }

    Expected<void> fetchStream(std::string_view url, const RequestOptions& options,
                               const StreamHandlers& handlers) override {
        EasyRequest req(url, options);
        if (!req.get()) {
            return Error{ErrorCode::Unknown, "curl_easy_init failed"};
        }

        HeaderParseContext hctx{};
        StreamContext sctx;
        sctx.handlers = &handlers;
        sctx.headers = &hctx;

        curl_easy_setopt(req.get(), CURLOPT_HTTPGET, 1L);
        curl_easy_setopt(req.get(), CURLOPT_FAILONERROR, 1L);
        curl_easy_setopt(req.get(), CURLOPT_HEADERFUNCTION, header_cb);
        curl_easy_setopt(req.get(), CURLOPT_HEADERDATA, &hctx);
        curl_easy_setopt(req.get(), CURLOPT_WRITEFUNCTION, stream_cb);
        curl_easy_setopt(req.get(), CURLOPT_WRITEDATA, &sctx);

        CURLcode rc = curl_easy_perform(req.get());
        const long http_status = req.status();

        if (sctx.handlerError) {
            return *sctx.handlerError;
        }
        if (rc == CURLE_HTTP_RETURNED_ERROR || http_status >= 400) {
            Error err{ErrorCode::ServerError, "HTTP error " + std::to_string(http_status)};
            err.httpStatus = http_status;
            return err;
        }
        if (rc != CURLE_OK) {
            auto err = makeCurlError(rc, "fetchStream(GET)");
            if (http_status > 0)
                err.httpStatus = http_status;
            return err;
        }

        // Empty body: the handlers still need to see the headers
        auto sr = start_stream(sctx);
        if (!sr.ok()) {
            return sr.error();
        }
        spdlog::debug("fetchStream {} finished with HTTP {}", url, http_status);
        return Expected<void>{};
    }

private:
    static Expected<HttpResponse> performBuffered(EasyRequest& req, std::string_view where) {
        HttpResponse resp;
        HeaderParseContext hctx{};
        curl_easy_setopt(req.get(), CURLOPT_ACCEPT_ENCODING, "");
        curl_easy_setopt(req.get(), CURLOPT_WRITEFUNCTION, buffer_cb);
        curl_easy_setopt(req.get(), CURLOPT_WRITEDATA, &resp.body);
        curl_easy_setopt(req.get(), CURLOPT_HEADERFUNCTION, header_cb);
        curl_easy_setopt(req.get(), CURLOPT_HEADERDATA, &hctx);

        CURLcode rc = curl_easy_perform(req.get());
        if (rc != CURLE_OK) {
            return makeCurlError(rc, where);
        }
        resp.status = req.status();
        resp.contentLength = hctx.contentLength;
        return resp;
    }
};

/// Factory: higher layers get the adapter through the interface only.
std::unique_ptr<IHttpAdapter> makeCurlHttpAdapter() {
    return std::make_unique<CurlHttpAdapter>();
}

} // namespace bunkget::downloader
