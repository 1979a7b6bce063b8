// Simulated HTTP client for testing without network.
#pragma once
#include "HttpClient.hpp"
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <string>
#include <unordered_map>

namespace mediagrab {

class MockHttpClient : public HttpClient {
public:
    struct Resource {
        std::string body;
        bool reportLength = true;      // send Content-Length
        std::size_t chunkSize = 1024;
        int httpStatus = 200;          // non-2xx fails before the response callback
        long failAfterBytes = -1;      // >= 0: network failure once that many bytes were sent
        long gateAfterChunks = -1;     // >= 0: block after that many chunks until openGate()
        bool abortableGate = false;    // a blocked transfer honors shouldCancel
    };

    void addResource(const std::string& url, Resource r);
    void addPage(const std::string& url, std::string html);

    // Unblock a gated resource; every transfer of that URL continues.
    void openGate(const std::string& url);
    // Block until at least n transfers of url are waiting at the gate.
    bool waitForGate(const std::string& url, int n = 1, int timeoutMs = 5000);

    bool get(const std::string& url,
             std::string& err,
             ErrorKind& kind,
             ResponseCB onResponse,
             DataCB onData,
             CancelCB shouldCancel = {}) override;

    bool fetchText(const std::string& url,
                   std::string& out,
                   std::string& err) override;

    int activeGets() const;
    int peakActiveGets() const;
    int getCount(const std::string& url) const;

private:
    struct Entry {
        Resource res;
        bool gateOpen = false;
        int waiting = 0;   // transfers blocked at the gate
        int requests = 0;
    };

    mutable std::mutex mtx_;
    std::condition_variable cv_;
    std::unordered_map<std::string, Entry> resources_;
    std::unordered_map<std::string, std::string> pages_;
    int active_ = 0;
    int peak_ = 0;
};

} // namespace mediagrab
