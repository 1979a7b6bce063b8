// Mock implementation: serves in-memory bodies in fixed chunks, with optional
// failures and a gate to hold transfers mid-stream.
#include "mediagrab/MockHttpClient.hpp"
#include <algorithm>
#include <chrono>

namespace mediagrab {

void MockHttpClient::addResource(const std::string& url, Resource r) {
    std::lock_guard<std::mutex> lk(mtx_);
    Entry e;
    e.res = std::move(r);
    resources_[url] = std::move(e);
}

void MockHttpClient::addPage(const std::string& url, std::string html) {
    std::lock_guard<std::mutex> lk(mtx_);
    pages_[url] = std::move(html);
}

void MockHttpClient::openGate(const std::string& url) {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        auto it = resources_.find(url);
        if (it == resources_.end()) return;
        it->second.gateOpen = true;
    }
    cv_.notify_all();
}

bool MockHttpClient::waitForGate(const std::string& url, int n, int timeoutMs) {
    std::unique_lock<std::mutex> lk(mtx_);
    return cv_.wait_for(lk, std::chrono::milliseconds(timeoutMs), [&] {
        auto it = resources_.find(url);
        return it != resources_.end() && it->second.waiting >= n;
    });
}

bool MockHttpClient::get(const std::string& url,
                         std::string& err,
                         ErrorKind& kind,
                         ResponseCB onResponse,
                         DataCB onData,
                         CancelCB shouldCancel) {
    kind = ErrorKind::None;
    Resource res;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        auto it = resources_.find(url);
        if (it == resources_.end()) {
            err = "HTTP status 404";
            kind = ErrorKind::HttpStatus;
            return false;
        }
        it->second.requests += 1;
        res = it->second.res;
        active_ += 1;
        peak_ = std::max(peak_, active_);
    }
    struct ActiveGuard {
        MockHttpClient* self;
        ~ActiveGuard() {
            std::lock_guard<std::mutex> lk(self->mtx_);
            self->active_ -= 1;
        }
    } guard{this};

    if (res.httpStatus < 200 || res.httpStatus >= 300) {
        err = "HTTP status " + std::to_string(res.httpStatus);
        kind = ErrorKind::HttpStatus;
        return false;
    }

    const std::uint64_t announced = res.reportLength ? res.body.size() : 0;
    if (onResponse && !onResponse(announced)) {
        err = "Transfer aborted";
        return false;
    }

    const std::size_t chunk = std::max<std::size_t>(1, res.chunkSize);
    std::size_t sent = 0;
    long chunks = 0;
    while (sent < res.body.size()) {
        if (res.gateAfterChunks >= 0 && chunks >= res.gateAfterChunks) {
            std::unique_lock<std::mutex> lk(mtx_);
            Entry& e = resources_[url];
            if (!e.gateOpen) {
                e.waiting += 1;
                cv_.notify_all();
                bool cancelled = false;
                if (res.abortableGate && shouldCancel) {
                    // Stalled connection: only the cancel poll can end the wait
                    while (!resources_[url].gateOpen) {
                        if (shouldCancel()) { cancelled = true; break; }
                        cv_.wait_for(lk, std::chrono::milliseconds(10));
                    }
                } else {
                    cv_.wait(lk, [&] { return resources_[url].gateOpen; });
                }
                resources_[url].waiting -= 1;
                if (cancelled) {
                    err = "Transfer aborted";
                    return false;
                }
            }
        }
        if (res.failAfterBytes >= 0 && sent >= static_cast<std::size_t>(res.failAfterBytes)) {
            err = "Connection reset by peer";
            kind = ErrorKind::Network;
            return false;
        }
        std::size_t n = std::min(chunk, res.body.size() - sent);
        if (res.failAfterBytes >= 0)
            n = std::min(n, static_cast<std::size_t>(res.failAfterBytes) - sent);
        if (onData && !onData(res.body.data() + sent, n)) {
            err = "Transfer aborted";
            return false;
        }
        sent += n;
        chunks += 1;
    }
    return true;
}

bool MockHttpClient::fetchText(const std::string& url,
                               std::string& out,
                               std::string& err) {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = pages_.find(url);
    if (it == pages_.end()) {
        err = "HTTP status 404";
        return false;
    }
    out = it->second;
    return true;
}

int MockHttpClient::activeGets() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return active_;
}

int MockHttpClient::peakActiveGets() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return peak_;
}

int MockHttpClient::getCount(const std::string& url) const {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = resources_.find(url);
    return it == resources_.end() ? 0 : it->second.requests;
}

} // namespace mediagrab
