// HttpClient implementation using libcurl (easy interface).
// Stateless: every call owns its own easy handle, so one instance can be shared
// by all transfer workers.
#pragma once
#include "HttpClient.hpp"
#include <string>

namespace mediagrab {

class CurlHttpClient : public HttpClient {
public:
    struct Options {
        std::size_t chunkSize = 64 * 1024;  // receive buffer, bounds each onData chunk
        long pageTimeoutSec = 10;           // fetchText only; transfers have no timeout
        std::string userAgent = "MediaGrab/1.0";
    };

    CurlHttpClient();
    explicit CurlHttpClient(Options opt);
    ~CurlHttpClient() override;

    bool get(const std::string& url,
             std::string& err,
             ErrorKind& kind,
             ResponseCB onResponse,
             DataCB onData,
             CancelCB shouldCancel = {}) override;

    bool fetchText(const std::string& url,
                   std::string& out,
                   std::string& err) override;

    const Options& options() const { return opt_; }

private:
    Options opt_;
};

} // namespace mediagrab
