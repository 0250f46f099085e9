/*
 * http_adapter_curl.cpp
 *
 * Notes
 * - Single GET per call using the libcurl easy API, optional open-ended Range.
 * - Honors timeout, TLS verify/CA, proxy and redirects. libcurl also reads
 *   http_proxy / https_proxy / no_proxy from the environment.
 * - The body sink sees the response status with every block so callers can
 *   refuse a body before any byte reaches disk.
 * - Cooperative cancellation from the write callback.
 *
 * Build
 * - Linked via CURL::libcurl.
 * - Depends on spdlog for logging.
 */

#include <depfetch/downloader/downloader.hpp>

#include <curl/curl.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <mutex>
#include <string_view>

namespace depfetch::downloader {

// Map CURLcode to Error
static Error makeCurlError(CURLcode code, std::string_view where) {
    Error err;
    err.message = std::string(where) + ": " + curl_easy_strerror(code);
    switch (code) {
        case CURLE_OK:
            err.code = ErrorCode::Success;
            break;
        case CURLE_OPERATION_TIMEDOUT:
            err.code = ErrorCode::Timeout;
            break;
        default:
            // DNS, connect, TLS, premature close and friends are all retryable
            err.code = ErrorCode::TransportError;
            break;
    }
    return err;
}

static void ensure_global_init() {
    static std::once_flag once;
    std::call_once(once, [] {
        CURLcode rc = curl_global_init(CURL_GLOBAL_DEFAULT);
        if (rc != CURLE_OK) {
            spdlog::error("curl_global_init failed: {}", curl_easy_strerror(rc));
        }
    });
}

// Write sink context for get()
struct WriteContext {
    CURL* curl{nullptr};
    const BodySink* sink{nullptr};
    const ShouldCancel* shouldCancel{nullptr};
    std::uint64_t received{0};
    bool cancelRequested{false};
    std::optional<Error> sinkError;
};

// CURL write callback
static size_t write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    const size_t total = size * nmemb;
    if (userdata == nullptr)
        return 0;

    auto* ctx = static_cast<WriteContext*>(userdata);
    if (total == 0)
        return 0;

    if (ctx->shouldCancel && *ctx->shouldCancel && (*ctx->shouldCancel)()) {
        ctx->cancelRequested = true;
        return 0; // signal error to curl => CURLE_WRITE_ERROR
    }

    long status = 0;
    curl_easy_getinfo(ctx->curl, CURLINFO_RESPONSE_CODE, &status);

    std::span<const std::byte> bytes{reinterpret_cast<const std::byte*>(ptr), total};
    auto r = (ctx->sink && *ctx->sink)
                 ? (*ctx->sink)(status, bytes)
                 : Result<void>{Error{ErrorCode::IoError, "No sink provided"}};
    if (!r) {
        ctx->sinkError = r.error();
        return 0;
    }

    ctx->received += static_cast<std::uint64_t>(total);
    return total;
}

// Transfer-progress callback; lets a cancel interrupt a stalled connection
static int xferinfo_cb(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* ctx = static_cast<WriteContext*>(userdata);
    if (ctx && ctx->shouldCancel && *ctx->shouldCancel && (*ctx->shouldCancel)()) {
        ctx->cancelRequested = true;
        return 1;
    }
    return 0;
}

// Common CURL easy handle configuration
static void configure_common(CURL* curl, const HttpGetRequest& req) {
    // Timeouts
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(req.timeout.count()));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS,
                     static_cast<long>(std::min<long>(req.timeout.count(), 30000)));

    // Redirects
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, req.followRedirects ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 5L);

    // TLS
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, req.tls.insecure ? 0L : 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, req.tls.insecure ? 0L : 2L);
    if (!req.tls.caPath.empty()) {
        curl_easy_setopt(curl, CURLOPT_CAINFO, req.tls.caPath.c_str());
    }

    // Proxy
    if (req.proxy && !req.proxy->empty()) {
        curl_easy_setopt(curl, CURLOPT_PROXY, req.proxy->c_str());
    }

    // Robustness
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPALIVE, 1L);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPIDLE, 30L);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPINTVL, 15L);
    curl_easy_setopt(curl, CURLOPT_BUFFERSIZE,
                     static_cast<long>(std::clamp<std::size_t>(req.bufferSize, 1024,
                                                               CURL_MAX_READ_SIZE)));
}

class CurlHttpAdapter final : public IHttpAdapter {
public:
    CurlHttpAdapter() { ensure_global_init(); }
    ~CurlHttpAdapter() override = default;

    Result<HttpGetResult> get(const HttpGetRequest& request, const BodySink& sink,
                              const ShouldCancel& shouldCancel) override {
        CURL* curl = curl_easy_init();
        if (!curl) {
            return Error{ErrorCode::TransportError, "curl_easy_init failed"};
        }

        curl_slist* list = nullptr;
        if (request.offset > 0) {
            std::string rangeHeader = "Range: bytes=" + std::to_string(request.offset) + "-";
            list = curl_slist_append(list, rangeHeader.c_str());
        }

        curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
        curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
        if (list)
            curl_easy_setopt(curl, CURLOPT_HTTPHEADER, list);

        WriteContext wctx;
        wctx.curl = curl;
        wctx.sink = &sink;
        wctx.shouldCancel = &shouldCancel;

        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_cb);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &wctx);
        curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, xferinfo_cb);
        curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &wctx);
        curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);

        configure_common(curl, request);

        spdlog::debug("GET {} (offset {})", request.url, request.offset);
        CURLcode rc = curl_easy_perform(curl);

        long http_status = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_status);

        if (list)
            curl_slist_free_all(list);
        curl_easy_cleanup(curl);

        if (wctx.cancelRequested) {
            return Error{ErrorCode::OperationCancelled, "Transfer cancelled: " + request.url};
        }
        if (wctx.sinkError) {
            return *wctx.sinkError;
        }
        if (rc != CURLE_OK) {
            return makeCurlError(rc, "GET " + request.url);
        }

        spdlog::debug("GET {} -> HTTP {} ({} bytes)", request.url, http_status, wctx.received);
        return HttpGetResult{http_status, wctx.received};
    }
};

std::unique_ptr<IHttpAdapter> makeCurlHttpAdapter() {
    return std::make_unique<CurlHttpAdapter>();
}

} // namespace depfetch::downloader
