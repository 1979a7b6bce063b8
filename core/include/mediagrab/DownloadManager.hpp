// Download manager: item table, FIFO queue and bounded set of running workers.
#pragma once
#include "HttpClient.hpp"
#include "TransferWorker.hpp"
#include "Types.hpp"
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace mediagrab {

struct ManagerOptions {
    int concurrencyCap = 2;       // clamped to >= 1
    std::string saveDirectory;    // empty: current working directory
};

// Owns every item discovered in the session and schedules their downloads.
//
// All state lives behind one mutex. Admission (queue head -> new worker) is the
// only place workers are created, and it runs after every enqueue, cap change
// and terminal worker event, so |active| <= cap holds after each pass.
// A running item leaves the active set only when its worker confirms a
// terminal event; pause() and cancel() merely ask the worker to stop.
//
// Listener events are delivered in the order the state changed, one at a time,
// without the internal lock held (the listener may call back into the manager).
class DownloadManager {
public:
    using Listener = std::function<void(const ItemEvent&)>;

    explicit DownloadManager(std::shared_ptr<HttpClient> http, ManagerOptions opt = {});
    ~DownloadManager();

    DownloadManager(const DownloadManager&) = delete;
    DownloadManager& operator=(const DownloadManager&) = delete;

    void setListener(Listener listener);

    // Create Pending items for links not seen before in this session.
    // Display names are unique within the session ("Name (2).ext", ...), so
    // two items never share a destination file. Returns the ids created, in
    // input order.
    std::vector<ItemId> addDiscovered(const std::vector<Resource>& found);

    // Read when an item is admitted, not when it is discovered.
    void setSaveDirectory(const std::string& dir);
    std::string saveDirectory() const;

    // Pending items -> Queued, appended in table order.
    void enqueueAll();
    // Queue at the head (Pending, Queued, Paused or Error). False if the id is
    // unknown, already running, or in a terminal state.
    bool enqueueNow(ItemId id);
    // Queue several items at the head, keeping the given order ahead of the
    // rest of the queue. Ineligible ids are skipped. Returns how many moved.
    std::size_t enqueueNowBatch(const std::vector<ItemId>& ids);
    void setConcurrencyCap(int n);
    int concurrencyCap() const;

    // Running: stop the worker, item becomes Paused once it confirms.
    // Queued: removed from the queue and Cancelled.
    bool pause(ItemId id);
    // Running: stop the worker, then delete the partial file and mark Cancelled.
    // Queued/Pending: Cancelled without touching the disk.
    // Paused/Error: Cancelled, partial file from the earlier run deleted.
    bool cancel(ItemId id);
    void cancelAll();

    // Reconciliation entry point for worker events (called on worker threads).
    void onWorkerEvent(const ItemEvent& ev);

    std::vector<Item> items() const;
    std::optional<Item> item(ItemId id) const;
    std::vector<ItemId> queuedIds() const;
    std::vector<ItemId> activeIds() const;
    std::size_t activeCount() const;
    std::size_t knownLinkCount() const;

    // Wait until nothing is queued, running or waiting to be delivered.
    // Must not be called from the listener.
    bool waitForIdle(std::chrono::milliseconds timeout);

private:
    enum class StopIntent { None, Pause, Cancel };

    struct Active {
        std::unique_ptr<TransferWorker> worker;
        StopIntent intent = StopIntent::None;
    };

    Item* findLocked(ItemId id);
    const Item* findLocked(ItemId id) const;
    bool removeFromQueueLocked(ItemId id);
    bool cancelLocked(ItemId id);
    void admitLocked();
    void setStatusLocked(Item& item, ItemStatus status);
    void notifyLocked(ItemEvent ev);
    bool idleLocked() const;
    void deletePartialLocked(const Item& item);
    std::string uniqueNameLocked(const std::string& name);
    bool pushFrontLocked(ItemId id);

    void dispatch();
    void reapRetired();

    std::shared_ptr<HttpClient> http_;

    mutable std::mutex mtx_;             // protects everything below
    std::condition_variable idleCv_;
    std::vector<Item> items_;            // index = id - 1
    std::deque<ItemId> queue_;
    std::unordered_map<ItemId, Active> active_;
    std::vector<std::unique_ptr<TransferWorker>> retired_;  // finished, not joined yet
    std::unordered_set<std::string> knownLinks_;
    std::unordered_set<std::string> usedNames_;   // lowercased display names
    int cap_ = 2;
    std::string saveDir_;
    ItemId nextId_ = 1;
    bool shuttingDown_ = false;

    Listener listener_;
    std::deque<ItemEvent> pending_;      // events not delivered yet
    bool draining_ = false;
};

} // namespace mediagrab
