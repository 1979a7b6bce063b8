// Single download executed on a dedicated thread.
#pragma once
#include "HttpClient.hpp"
#include "Types.hpp"
#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <thread>

namespace mediagrab {

// Streams one URL into a destination file and reports through a callback:
// a Downloading status first, progress after every written chunk, then exactly
// one terminal status (Completed, Error or Paused). The callback runs on the
// worker thread, so the owner must not destroy the worker from inside it.
class TransferWorker {
public:
    using EventCB = std::function<void(const ItemEvent&)>;

    TransferWorker(ItemId id,
                   std::string sourceUrl,
                   std::string destinationPath,
                   std::shared_ptr<HttpClient> http,
                   EventCB onEvent);
    ~TransferWorker();

    TransferWorker(const TransferWorker&) = delete;
    TransferWorker& operator=(const TransferWorker&) = delete;

    // Launch the thread; returns immediately. Only the first call has effect.
    void start();
    // Cooperative stop, honored at the next chunk boundary. Never blocks.
    void stop() { stop_.store(true); }
    bool stopRequested() const { return stop_.load(); }

    void join();
    bool runsOnThisThread() const { return thread_.get_id() == std::this_thread::get_id(); }

    ItemId id() const { return id_; }
    const std::string& destinationPath() const { return dest_; }

private:
    void run();
    ItemEvent transfer();

    ItemId id_;
    std::string url_;
    std::string dest_;
    std::shared_ptr<HttpClient> http_;
    EventCB onEvent_;
    std::atomic<bool> stop_{false};
    bool started_ = false;
    std::thread thread_;
};

} // namespace mediagrab
