// Transfer worker: streaming GET into a local file with chunk-level stop checks.
#include "mediagrab/TransferWorker.hpp"
#include "mediagrab/Log.hpp"
#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <system_error>

namespace mediagrab {

namespace fs = std::filesystem;

namespace {

struct FileDeleter {
    void operator()(FILE* fp) const noexcept {
        if (fp) std::fclose(fp);
    }
};

using FilePtr = std::unique_ptr<FILE, FileDeleter>;

} // namespace

TransferWorker::TransferWorker(ItemId id,
                               std::string sourceUrl,
                               std::string destinationPath,
                               std::shared_ptr<HttpClient> http,
                               EventCB onEvent)
    : id_(id),
      url_(std::move(sourceUrl)),
      dest_(std::move(destinationPath)),
      http_(std::move(http)),
      onEvent_(std::move(onEvent)) {}

TransferWorker::~TransferWorker() {
    stop();
    join();
}

void TransferWorker::start() {
    if (started_) return;
    started_ = true;
    thread_ = std::thread([this]() { run(); });
}

void TransferWorker::join() {
    if (thread_.joinable() && !runsOnThisThread()) thread_.join();
}

void TransferWorker::run() {
    if (onEvent_) onEvent_(statusEvent(id_, ItemStatus::Downloading));

    ItemEvent terminal;
    try {
        terminal = transfer();
    } catch (const fs::filesystem_error& ex) {
        terminal = statusEvent(id_, ItemStatus::Error, ErrorKind::Filesystem, ex.what());
    } catch (const std::exception& ex) {
        terminal = statusEvent(id_, ItemStatus::Error, ErrorKind::Network, ex.what());
    }

    if (terminal.status == ItemStatus::Error) {
        LOGE("item %llu failed (%s): %s", (unsigned long long)id_,
             errorKindName(terminal.error), terminal.message.c_str());
    }
    if (onEvent_) onEvent_(terminal);
}

ItemEvent TransferWorker::transfer() {
    if (stop_.load()) return statusEvent(id_, ItemStatus::Paused);

    FilePtr file;
    std::uint64_t total = 0;
    std::uint64_t written = 0;
    bool stopped = false;
    std::string fsErr;

    // The file is created only once the server answered with a success status
    auto onResponse = [&](std::uint64_t contentLength) -> bool {
        if (stop_.load()) { stopped = true; return false; }
        total = contentLength;
        if (total == 0) LOGW("item %llu: size unknown, progress stays at 0", (unsigned long long)id_);
        const fs::path p(dest_);
        if (p.has_parent_path()) {
            std::error_code ec;
            fs::create_directories(p.parent_path(), ec);
            if (ec) {
                fsErr = "Cannot create folder " + p.parent_path().string() + ": " + ec.message();
                return false;
            }
        }
        file.reset(std::fopen(dest_.c_str(), "wb"));
        if (!file) {
            fsErr = "Cannot open " + dest_ + ": " + std::strerror(errno);
            return false;
        }
        return true;
    };

    auto onData = [&](const char* data, std::size_t size) -> bool {
        // Stop is honored between chunks, never inside a write
        if (stop_.load()) { stopped = true; return false; }
        if (!file) {
            fsErr = "Destination not open";
            return false;
        }
        if (std::fwrite(data, 1, size, file.get()) != size) {
            fsErr = "Write to " + dest_ + " failed: " + std::strerror(errno);
            return false;
        }
        written += size;
        const int pct = total > 0
            ? static_cast<int>(std::min<std::uint64_t>(100, written * 100 / total))
            : 0;
        if (onEvent_) onEvent_(progressEvent(id_, pct));
        return true;
    };

    std::string err;
    ErrorKind kind = ErrorKind::None;
    const bool ok = http_->get(url_, err, kind, onResponse, onData,
                               [this]() { return stop_.load(); });

    bool closeFailed = false;
    if (file) closeFailed = std::fclose(file.release()) != 0;

    // A stop seen by the client's cancel poll ends the call without a chunk
    if (stopped || (!ok && fsErr.empty() && kind == ErrorKind::None && stop_.load())) {
        return statusEvent(id_, ItemStatus::Paused);
    }
    if (!fsErr.empty()) return statusEvent(id_, ItemStatus::Error, ErrorKind::Filesystem, fsErr);
    if (!ok) {
        if (kind == ErrorKind::None) kind = ErrorKind::Network;
        return statusEvent(id_, ItemStatus::Error, kind, err);
    }
    if (closeFailed) {
        return statusEvent(id_, ItemStatus::Error, ErrorKind::Filesystem, "Cannot flush " + dest_);
    }
    return statusEvent(id_, ItemStatus::Completed);
}

} // namespace mediagrab
