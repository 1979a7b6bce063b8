// libcurl backend: one easy handle per request, redirects followed,
// response headers parsed to announce the body length before the first chunk.
#include "mediagrab/CurlHttpClient.hpp"
#include "mediagrab/Log.hpp"
#include <curl/curl.h>

#include <cctype>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>

namespace mediagrab {

namespace {

using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;

// Global libcurl initialization (once per process)
void ensureCurlInitialized() {
    static std::once_flag flag;
    std::call_once(flag, [] {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
            throw std::runtime_error("Failed to initialize libcurl");
        }
        std::atexit([] { curl_global_cleanup(); });
        LOGI("libcurl initialized: %s", curl_version());
    });
}

// State shared with the header/write callbacks of a streaming GET.
struct GetContext {
    CURL* curl = nullptr;
    const HttpClient::ResponseCB* onResponse = nullptr;
    const HttpClient::DataCB* onData = nullptr;
    const HttpClient::CancelCB* shouldCancel = nullptr;
    std::uint64_t contentLength = 0;  // of the current header block
    bool responded = false;
    bool aborted = false;             // a callback asked to stop
};

bool startsWithNoCase(const std::string& s, const char* prefix) {
    std::size_t i = 0;
    for (; prefix[i]; ++i) {
        if (i >= s.size()) return false;
        if (std::tolower(static_cast<unsigned char>(s[i])) !=
            std::tolower(static_cast<unsigned char>(prefix[i])))
            return false;
    }
    return true;
}

bool announceResponse(GetContext& ctx) {
    ctx.responded = true;
    if (ctx.onResponse && *ctx.onResponse && !(*ctx.onResponse)(ctx.contentLength)) {
        ctx.aborted = true;
        return false;
    }
    return true;
}

size_t headerCallback(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* ctx = static_cast<GetContext*>(userdata);
    const size_t total = size * nitems;
    if (!ctx) return 0;

    const std::string line(buffer, total);
    if (startsWithNoCase(line, "HTTP/")) {
        // New header block (redirect hop, 100-continue or final response)
        ctx->contentLength = 0;
        return total;
    }
    if (startsWithNoCase(line, "content-length:")) {
        const char* v = line.c_str() + std::strlen("content-length:");
        ctx->contentLength = static_cast<std::uint64_t>(std::strtoull(v, nullptr, 10));
        return total;
    }
    if (line == "\r\n" || line == "\n") {
        long code = 0;
        curl_easy_getinfo(ctx->curl, CURLINFO_RESPONSE_CODE, &code);
        // Only the final 2xx block is announced; 1xx/3xx are intermediate
        if (code >= 200 && code < 300 && !ctx->responded) {
            if (!announceResponse(*ctx)) return 0;
        }
    }
    return total;
}

size_t writeCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* ctx = static_cast<GetContext*>(userdata);
    const size_t total = size * nmemb;
    if (!ctx) return 0;
    if (!ctx->responded && !announceResponse(*ctx)) return 0;
    if (total == 0) return 0;
    if (ctx->onData && *ctx->onData && !(*ctx->onData)(ptr, total)) {
        ctx->aborted = true;
        return 0;
    }
    return total;
}

// Runs about once per second even when the connection is stalled.
int xferInfoCallback(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* ctx = static_cast<GetContext*>(clientp);
    if (ctx && ctx->shouldCancel && *ctx->shouldCancel && (*ctx->shouldCancel)()) {
        ctx->aborted = true;
        return 1;
    }
    return 0;
}

size_t appendCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* out = static_cast<std::string*>(userdata);
    if (!out) return 0;
    out->append(ptr, size * nmemb);
    return size * nmemb;
}

} // namespace

CurlHttpClient::CurlHttpClient() : CurlHttpClient(Options{}) {}

CurlHttpClient::CurlHttpClient(Options opt) : opt_(std::move(opt)) {
    ensureCurlInitialized();
}

CurlHttpClient::~CurlHttpClient() = default;

bool CurlHttpClient::get(const std::string& url,
                         std::string& err,
                         ErrorKind& kind,
                         ResponseCB onResponse,
                         DataCB onData,
                         CancelCB shouldCancel) {
    kind = ErrorKind::None;
    CurlHandle curl{curl_easy_init(), &curl_easy_cleanup};
    if (!curl) {
        err = "Failed to allocate curl handle";
        kind = ErrorKind::Network;
        return false;
    }

    GetContext ctx;
    ctx.curl = curl.get();
    ctx.onResponse = &onResponse;
    ctx.onData = &onData;
    ctx.shouldCancel = &shouldCancel;

    char errbuf[CURL_ERROR_SIZE] = {0};
    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_FAILONERROR, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, &xferInfoCallback);
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFODATA, &ctx);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, opt_.userAgent.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_BUFFERSIZE, static_cast<long>(opt_.chunkSize));
    curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, errbuf);
    curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, &headerCallback);
    curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &ctx);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, &writeCallback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &ctx);

    const CURLcode res = curl_easy_perform(curl.get());
    if (ctx.aborted) {
        err = "Transfer aborted";
        return false;
    }
    long code = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &code);
    if (res == CURLE_HTTP_RETURNED_ERROR) {
        err = "HTTP status " + std::to_string(code);
        kind = ErrorKind::HttpStatus;
        return false;
    }
    if (res != CURLE_OK) {
        err = std::string("curl error: ") + (errbuf[0] ? errbuf : curl_easy_strerror(res));
        kind = ErrorKind::Network;
        return false;
    }
    if (code < 200 || code >= 300) {
        err = "Unexpected HTTP status " + std::to_string(code);
        kind = ErrorKind::HttpStatus;
        return false;
    }
    // Empty 2xx body without a blank header line (HTTP/0.9 style servers)
    if (!ctx.responded && !announceResponse(ctx)) {
        err = "Transfer aborted";
        return false;
    }
    return true;
}

bool CurlHttpClient::fetchText(const std::string& url,
                               std::string& out,
                               std::string& err) {
    CurlHandle curl{curl_easy_init(), &curl_easy_cleanup};
    if (!curl) {
        err = "Failed to allocate curl handle";
        return false;
    }

    out.clear();
    char errbuf[CURL_ERROR_SIZE] = {0};
    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_FAILONERROR, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, opt_.pageTimeoutSec);
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, opt_.userAgent.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_ACCEPT_ENCODING, "");
    curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, errbuf);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, &appendCallback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &out);

    const CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        if (res == CURLE_HTTP_RETURNED_ERROR) {
            long code = 0;
            curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &code);
            err = "HTTP status " + std::to_string(code);
        } else {
            err = std::string("curl error: ") + (errbuf[0] ? errbuf : curl_easy_strerror(res));
        }
        out.clear();
        return false;
    }
    return true;
}

} // namespace mediagrab
