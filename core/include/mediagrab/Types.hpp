// Basic types shared between UI and core: item status, events and snapshots.
// Kept as plain structures so they can be copied freely across threads.
#pragma once
#include <string>
#include <cstdint>
#include <utility>

namespace mediagrab {

using ItemId = std::uint64_t;

// Lifecycle of a download item:
//  - Pending: discovered, not requested yet
//  - Queued: waiting for a free slot
//  - Downloading: a worker is running (or was told to stop and has not confirmed)
//  - Paused: stopped by the user, partial file kept
//  - Completed: whole body written
//  - Error: network, HTTP status or filesystem failure
//  - Cancelled: stopped by the user, partial file removed
enum class ItemStatus { Pending, Queued, Downloading, Paused, Completed, Error, Cancelled };

// Failure classes reported by the HTTP layer and the worker.
enum class ErrorKind {
    None,
    Network,     // connect/DNS/transfer failure
    HttpStatus,  // non-2xx response
    Filesystem   // cannot create/write/delete the destination
};

// Record produced by link discovery.
struct Resource {
    std::string sourceUrl;
    std::string name;   // raw name; the manager sanitizes it
};

struct Item {
    ItemId      id = 0;
    std::string sourceUrl;
    std::string displayName;
    std::string destinationPath;   // set at admission
    ItemStatus  status = ItemStatus::Pending;
    int         progressPercent = 0;   // 0..100, 0 while the size is unknown
    ErrorKind   error = ErrorKind::None;
    std::string errorMessage;
};

// Event emitted by workers and forwarded by the manager to its listener.
struct ItemEvent {
    enum class Type { Progress, Status };

    ItemId      id = 0;
    Type        type = Type::Status;
    ItemStatus  status = ItemStatus::Pending;  // Status events
    int         percent = 0;                   // Progress events
    ErrorKind   error = ErrorKind::None;       // Status == Error
    std::string message;
};

inline ItemEvent progressEvent(ItemId id, int percent) {
    ItemEvent e;
    e.id = id;
    e.type = ItemEvent::Type::Progress;
    e.status = ItemStatus::Downloading;
    e.percent = percent;
    return e;
}

inline ItemEvent statusEvent(ItemId id, ItemStatus status,
                             ErrorKind error = ErrorKind::None,
                             std::string message = {}) {
    ItemEvent e;
    e.id = id;
    e.type = ItemEvent::Type::Status;
    e.status = status;
    e.error = error;
    e.message = std::move(message);
    return e;
}

// Terminal for a worker run (the item itself may be re-queued from Paused/Error).
inline bool isTerminal(ItemStatus s) {
    return s == ItemStatus::Completed || s == ItemStatus::Error ||
           s == ItemStatus::Paused || s == ItemStatus::Cancelled;
}

const char* statusName(ItemStatus s);
const char* errorKindName(ErrorKind k);

} // namespace mediagrab
