// Display names for status and error enums.
#include "mediagrab/Types.hpp"

namespace mediagrab {

const char* statusName(ItemStatus s) {
    switch (s) {
        case ItemStatus::Pending: return "Pending";
        case ItemStatus::Queued: return "Queued";
        case ItemStatus::Downloading: return "Downloading";
        case ItemStatus::Paused: return "Paused";
        case ItemStatus::Completed: return "Completed";
        case ItemStatus::Error: return "Error";
        case ItemStatus::Cancelled: return "Cancelled";
    }
    return "?";
}

const char* errorKindName(ErrorKind k) {
    switch (k) {
        case ErrorKind::None: return "none";
        case ErrorKind::Network: return "network";
        case ErrorKind::HttpStatus: return "http-status";
        case ErrorKind::Filesystem: return "filesystem";
    }
    return "?";
}

} // namespace mediagrab
