/*
 * convey/src/downloader/http_adapter_curl.cpp
 *
 * Notes
 * - probe(): HEAD first, falling back to GET "Range: bytes=0-0" for servers that reject HEAD.
 * - fetchRange(): single GET from an offset; the body is pushed to the sink as curl delivers it.
 * - A Range request answered with 200 aborts before any byte reaches the sink and reports
 *   RangeNotHonored, so the caller never appends a full body to a partial file.
 * - The timeout is a stall timeout (connect + low-speed), not a cap on total transfer time.
 *
 * Build
 * - Linked via CURL::libcurl.
 * - Depends on spdlog for logging.
 */

#include <convey/downloader/downloader.hpp>
#include <convey/downloader/http_headers.hpp>

#include <curl/curl.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <charconv>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

namespace convey::downloader {

namespace {

std::once_flag g_curlInitOnce;

void ensure_curl_global_init() {
    std::call_once(g_curlInitOnce, [] {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
            spdlog::error("curl_global_init failed");
        }
    });
}

struct CurlEasyDeleter {
    void operator()(CURL* c) const noexcept {
        if (c)
            curl_easy_cleanup(c);
    }
};
struct CurlSlistDeleter {
    void operator()(curl_slist* l) const noexcept {
        if (l)
            curl_slist_free_all(l);
    }
};
using CurlHandle = std::unique_ptr<CURL, CurlEasyDeleter>;
using CurlSlist = std::unique_ptr<curl_slist, CurlSlistDeleter>;

bool is_transient_status(long status) {
    return status >= 500 || status == 408 || status == 429;
}

// Map a CURLcode observed while streaming. Everything that can heal by reconnecting is
// transient; TLS and protocol misconfiguration is not.
Error makeCurlError(CURLcode code, std::string_view where) {
    Error err;
    err.message = std::string(where) + ": " + curl_easy_strerror(code);
    switch (code) {
        case CURLE_OK:
            err.code = ErrorCode::None;
            break;
        case CURLE_OPERATION_TIMEDOUT:
            err.code = ErrorCode::Timeout;
            break;
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
        case CURLE_COULDNT_CONNECT:
        case CURLE_RECV_ERROR:
        case CURLE_SEND_ERROR:
        case CURLE_GOT_NOTHING:
        case CURLE_PARTIAL_FILE:
        case CURLE_HTTP2:
        case CURLE_HTTP2_STREAM:
            err.code = ErrorCode::TransientNetwork;
            break;
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_PEER_FAILED_VERIFICATION:
        case CURLE_SSL_CACERT_BADFILE:
        case CURLE_SSL_CERTPROBLEM:
        case CURLE_SSL_CIPHER:
        case CURLE_UNSUPPORTED_PROTOCOL:
        case CURLE_URL_MALFORMAT:
        case CURLE_TOO_MANY_REDIRECTS:
            err.code = ErrorCode::ServerError;
            break;
        default:
            err.code = ErrorCode::Unknown;
            break;
    }
    return err;
}

// Response metadata; reset on every status line so only the final response of a redirect
// chain is kept.
struct HeaderParseContext {
    long status{0};
    bool acceptRangesBytes{false};
    std::optional<std::uint64_t> contentLength{};
    std::optional<std::uint64_t> contentRangeTotal{};
    std::optional<std::string> etag;
    std::optional<std::string> lastModified;
    std::optional<std::string> contentType;
    std::optional<std::string> declaredFilename;
};

std::optional<long> parse_status_line(std::string_view line) {
    if (line.size() < 5 || !http::iequals(line.substr(0, 5), "HTTP/"))
        return std::nullopt;
    auto sp = line.find(' ');
    if (sp == std::string_view::npos)
        return std::nullopt;
    auto rest = line.substr(sp + 1);
    long code = 0;
    auto res = std::from_chars(rest.data(), rest.data() + rest.size(), code);
    if (res.ec != std::errc())
        return std::nullopt;
    return code;
}

size_t header_cb(char* buffer, size_t size, size_t nitems, void* userdata) {
    const size_t total = size * nitems;
    if (total == 0 || userdata == nullptr)
        return total;

    auto* ctx = static_cast<HeaderParseContext*>(userdata);
    std::string_view line(buffer, total);

    if (auto status = parse_status_line(line)) {
        *ctx = HeaderParseContext{};
        ctx->status = *status;
        return total;
    }

    auto parsed = http::parseHeaderLine(line);
    if (!parsed)
        return total;
    const auto& key = parsed->name;
    const auto& val = parsed->value;

    if (key == "accept-ranges") {
        if (http::toLower(val) == "bytes")
            ctx->acceptRangesBytes = true;
    } else if (key == "content-length") {
        ctx->contentLength = http::parseContentLength(val);
    } else if (key == "content-range") {
        ctx->contentRangeTotal = http::parseContentRangeTotal(val);
    } else if (key == "etag") {
        ctx->etag = http::unquoteValidator(val);
    } else if (key == "last-modified") {
        ctx->lastModified = val;
    } else if (key == "content-type") {
        ctx->contentType = val;
    } else if (key == "content-disposition") {
        ctx->declaredFilename = http::parseContentDispositionFilename(val);
    }
    return total;
}

// Body sink for the GET fallback probe: accept the single ranged byte, abort on more.
struct ProbeBody {
    std::size_t received{0};
    bool truncated{false};
};

size_t probe_body_cb(char*, size_t size, size_t nmemb, void* userdata) {
    auto* body = static_cast<ProbeBody*>(userdata);
    body->received += size * nmemb;
    if (body->received > 1) {
        body->truncated = true;
        return 0;
    }
    return size * nmemb;
}

// Write sink context for fetchRange
struct WriteContext {
    const ByteSink* sink{nullptr};
    const HeaderParseContext* headers{nullptr};
    std::uint64_t offset{0};
    std::uint64_t delivered{0};
    bool checkedStatus{false};
    bool rangeIgnored{false};
    std::optional<Error> sinkError{};
};

size_t write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    const size_t total = size * nmemb;
    if (userdata == nullptr || total == 0)
        return 0;

    auto* ctx = static_cast<WriteContext*>(userdata);
    if (!ctx->checkedStatus) {
        ctx->checkedStatus = true;
        if (ctx->offset > 0 && ctx->headers->status != 206) {
            ctx->rangeIgnored = true;
            return 0; // CURLE_WRITE_ERROR
        }
    }

    std::span<const std::byte> bytes{reinterpret_cast<const std::byte*>(ptr), total};
    auto r = (*ctx->sink)(bytes);
    if (!r.ok()) {
        ctx->sinkError = r.error();
        return 0;
    }
    ctx->delivered += total;
    return total;
}

CurlSlist build_header_list(const HttpOptions& options) {
    curl_slist* list = nullptr;
    for (const auto& h : options.headers) {
        std::string line = h.name;
        line.append(": ");
        line.append(h.value);
        list = curl_slist_append(list, line.c_str());
    }
    return CurlSlist{list};
}

CurlSlist append_header(CurlSlist list, const std::string& line) {
    curl_slist* raw = curl_slist_append(list.get(), line.c_str());
    if (!raw)
        return list; // allocation failed; keep what we have
    (void)list.release();
    return CurlSlist{raw};
}

// Common CURL easy handle configuration
void configure_common(CURL* curl, const HttpOptions& options) {
    const auto timeout = options.timeout.count() > 0 ? options.timeout
                                                     : std::chrono::milliseconds{60000};

    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(timeout.count()));
    // Abort when fewer than 1 byte/s arrive for the whole timeout window.
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME,
                     static_cast<long>(std::max<long long>(1, timeout.count() / 1000)));

    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, options.followRedirects ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 10L);

    const auto& ua = options.userAgent.empty() ? std::string(kDefaultUserAgent)
                                               : options.userAgent;
    curl_easy_setopt(curl, CURLOPT_USERAGENT, ua.c_str());

    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, options.tls.insecure ? 0L : 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, options.tls.insecure ? 0L : 2L);
    if (!options.tls.caPath.empty()) {
        curl_easy_setopt(curl, CURLOPT_CAINFO, options.tls.caPath.c_str());
    }

    if (options.proxy && !options.proxy->empty()) {
        curl_easy_setopt(curl, CURLOPT_PROXY, options.proxy->c_str());
    }

    curl_easy_setopt(curl, CURLOPT_TCP_KEEPALIVE, 1L);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPIDLE, 30L);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPINTVL, 15L);
    curl_easy_setopt(curl, CURLOPT_HTTP_VERSION, CURL_HTTP_VERSION_2TLS);
}

class CurlHttpAdapter final : public IHttpAdapter {
public:
    CurlHttpAdapter() { ensure_curl_global_init(); }
    ~CurlHttpAdapter() override = default;

    Expected<RemoteResource> probe(std::string_view url, const HttpOptions& options) override {
        CurlHandle curl{curl_easy_init()};
        if (!curl) {
            return Error{ErrorCode::Unknown, "curl_easy_init failed"};
        }

        const std::string urlStr(url);
        auto list = build_header_list(options);
        HeaderParseContext hctx{};

        curl_easy_setopt(curl.get(), CURLOPT_URL, urlStr.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_NOBODY, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, header_cb);
        curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &hctx);
        curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, list.get());
        configure_common(curl.get(), options);
        curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS,
                         static_cast<long>(std::max<long long>(1000, options.timeout.count())));

        CURLcode rc = curl_easy_perform(curl.get());
        long http_status = 0;
        curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &http_status);

        if (rc != CURLE_OK || http_status >= 400) {
            // Some servers reject HEAD; try GET range 0-0 as fallback
            spdlog::debug("HEAD probe for {} failed ({}, HTTP {}), attempting GET Range 0-0",
                          urlStr, curl_easy_strerror(rc), http_status);
            hctx = HeaderParseContext{};
            ProbeBody body;
            curl_easy_setopt(curl.get(), CURLOPT_NOBODY, 0L);
            curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
            curl_easy_setopt(curl.get(), CURLOPT_RANGE, "0-0");
            curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, probe_body_cb);
            curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &body);
            rc = curl_easy_perform(curl.get());
            http_status = 0;
            curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &http_status);

            // Server ignored the range and started a full body: headers are all we need.
            if (rc == CURLE_WRITE_ERROR && body.truncated)
                rc = CURLE_OK;
            if (rc != CURLE_OK) {
                auto err = makeCurlError(rc, "probe(GET range)");
                return Error{ErrorCode::Unreachable, "Cannot open " + urlStr + ": " + err.message};
            }
            if (http_status >= 400) {
                return Error{ErrorCode::Unreachable, "Cannot open " + urlStr + ": HTTP " +
                                                         std::to_string(http_status)};
            }
            if (http_status == 206) {
                hctx.acceptRangesBytes = true;
                hctx.contentLength = hctx.contentRangeTotal;
            }
        }

        RemoteResource res;
        res.url = urlStr;
        res.httpStatus = static_cast<int>(http_status);
        res.acceptsRanges = hctx.acceptRangesBytes;
        res.contentLength = hctx.contentLength;
        res.etag = hctx.etag;
        res.lastModified = hctx.lastModified;
        res.contentType = hctx.contentType;
        res.declaredFilename = hctx.declaredFilename;

        if (hctx.etag) {
            spdlog::debug("HTTP probe captured ETag: {}", *hctx.etag);
        }
        if (hctx.lastModified) {
            spdlog::debug("HTTP probe captured Last-Modified: {}", *hctx.lastModified);
        }
        spdlog::debug("HTTP probe {} -> status={} length={} ranges={}", urlStr, http_status,
                      res.contentLength ? std::to_string(*res.contentLength) : "unknown",
                      res.acceptsRanges);
        return res;
    }

    Expected<void> fetchRange(std::string_view url, const HttpOptions& options,
                              std::uint64_t offset, const std::optional<std::string>& ifRange,
                              const ByteSink& sink) override {
        CurlHandle curl{curl_easy_init()};
        if (!curl) {
            return Error{ErrorCode::Unknown, "curl_easy_init failed"};
        }

        const std::string urlStr(url);
        auto list = build_header_list(options);
        if (offset > 0) {
            list = append_header(std::move(list), "Range: bytes=" + std::to_string(offset) + "-");
            if (ifRange && !ifRange->empty()) {
                list = append_header(std::move(list), "If-Range: " + *ifRange);
            }
        }

        HeaderParseContext hctx{};
        WriteContext wctx;
        wctx.sink = &sink;
        wctx.headers = &hctx;
        wctx.offset = offset;

        curl_easy_setopt(curl.get(), CURLOPT_URL, urlStr.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, list.get());
        curl_easy_setopt(curl.get(), CURLOPT_FAILONERROR, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_cb);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &wctx);
        curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, header_cb);
        curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &hctx);
        configure_common(curl.get(), options);

        CURLcode rc = curl_easy_perform(curl.get());

        long http_status = 0;
        curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &http_status);

        if (wctx.sinkError) {
            return *wctx.sinkError;
        }
        if (wctx.rangeIgnored) {
            return Error{ErrorCode::RangeNotHonored,
                         "Server answered HTTP " + std::to_string(http_status) +
                             " to a range request at offset " + std::to_string(offset)};
        }
        if (rc == CURLE_HTTP_RETURNED_ERROR) {
            if (offset > 0 && http_status == 416) {
                return Error{ErrorCode::RangeNotHonored,
                             "Range at offset " + std::to_string(offset) + " not satisfiable"};
            }
            return Error{is_transient_status(http_status) ? ErrorCode::TransientNetwork
                                                          : ErrorCode::ServerError,
                         "HTTP error " + std::to_string(http_status) + " for " + urlStr};
        }
        if (rc != CURLE_OK) {
            return makeCurlError(rc, "fetchRange(GET)");
        }
        if (offset > 0 && !wctx.checkedStatus && http_status != 206) {
            // Empty body, so write_cb never ran
            return Error{ErrorCode::RangeNotHonored,
                         "Server answered HTTP " + std::to_string(http_status) +
                             " to a range request at offset " + std::to_string(offset)};
        }

        spdlog::debug("fetchRange {} from {} delivered {} bytes (HTTP {})", urlStr, offset,
                      wctx.delivered, http_status);
        return Expected<void>{};
    }
};

} // namespace

std::unique_ptr<IHttpAdapter> makeCurlHttpAdapter() {
    return std::make_unique<CurlHttpAdapter>();
}

} // namespace convey::downloader
