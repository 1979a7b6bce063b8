// Download manager: admission, stop intents and event reconciliation.
#include "mediagrab/DownloadManager.hpp"
#include "mediagrab/FileNames.hpp"
#include "mediagrab/LinkDiscovery.hpp"
#include "mediagrab/Log.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <stdexcept>
#include <system_error>

namespace mediagrab {

namespace fs = std::filesystem;

DownloadManager::DownloadManager(std::shared_ptr<HttpClient> http, ManagerOptions opt)
    : http_(std::move(http)),
      cap_(std::max(1, opt.concurrencyCap)),
      saveDir_(std::move(opt.saveDirectory)) {
    if (!http_) throw std::invalid_argument("DownloadManager requires an HTTP client");
}

DownloadManager::~DownloadManager() {
    {
        std::unique_lock<std::mutex> lk(mtx_);
        shuttingDown_ = true;
        listener_ = nullptr;
        pending_.clear();
        queue_.clear();
        for (auto& kv : active_) kv.second.worker->stop();
        idleCv_.wait(lk, [this]() { return active_.empty(); });
    }
    std::vector<std::unique_ptr<TransferWorker>> done;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        done.swap(retired_);
    }
    done.clear();
}

void DownloadManager::setListener(Listener listener) {
    std::lock_guard<std::mutex> lk(mtx_);
    listener_ = std::move(listener);
}

std::vector<ItemId> DownloadManager::addDiscovered(const std::vector<Resource>& found) {
    reapRetired();
    std::vector<ItemId> added;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        for (const auto& r : found) {
            const std::string key = normalizeUrl(r.sourceUrl);
            if (key.empty() || !knownLinks_.insert(key).second) continue;

            Item it;
            it.id = nextId_++;
            it.sourceUrl = r.sourceUrl;
            std::string name = sanitizeFileName(r.name);
            if (name.empty()) name = fallbackFileName();
            it.displayName = uniqueNameLocked(name);
            it.status = ItemStatus::Pending;
            items_.push_back(it);
            added.push_back(it.id);
            notifyLocked(statusEvent(it.id, ItemStatus::Pending));
        }
        if (!added.empty()) LOGI("discovered %zu new link(s)", added.size());
    }
    dispatch();
    return added;
}

std::string DownloadManager::uniqueNameLocked(const std::string& name) {
    auto lower = [](std::string s) {
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return s;
    };
    if (usedNames_.insert(lower(name)).second) return name;

    // Counter goes before the extension; a leading dot is part of the stem
    const std::size_t dot = name.rfind('.');
    const bool hasExt = dot != std::string::npos && dot > 0;
    const std::string stem = hasExt ? name.substr(0, dot) : name;
    const std::string ext = hasExt ? name.substr(dot) : std::string();
    for (int n = 2;; ++n) {
        std::string candidate = stem + " (" + std::to_string(n) + ")" + ext;
        if (usedNames_.insert(lower(candidate)).second) return candidate;
    }
}

void DownloadManager::setSaveDirectory(const std::string& dir) {
    std::lock_guard<std::mutex> lk(mtx_);
    saveDir_ = dir;
}

std::string DownloadManager::saveDirectory() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return saveDir_;
}

void DownloadManager::enqueueAll() {
    reapRetired();
    {
        std::lock_guard<std::mutex> lk(mtx_);
        for (auto& it : items_) {
            if (it.status != ItemStatus::Pending) continue;
            queue_.push_back(it.id);
            setStatusLocked(it, ItemStatus::Queued);
        }
        admitLocked();
    }
    dispatch();
}

bool DownloadManager::pushFrontLocked(ItemId id) {
    Item* it = findLocked(id);
    if (!it || active_.count(id)) return false;
    switch (it->status) {
        case ItemStatus::Pending:
        case ItemStatus::Queued:
        case ItemStatus::Paused:
        case ItemStatus::Error:
            break;
        default:
            return false;
    }
    removeFromQueueLocked(id);
    queue_.push_front(id);
    setStatusLocked(*it, ItemStatus::Queued);
    return true;
}

bool DownloadManager::enqueueNow(ItemId id) {
    reapRetired();
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (!pushFrontLocked(id)) return false;
        admitLocked();
    }
    dispatch();
    return true;
}

std::size_t DownloadManager::enqueueNowBatch(const std::vector<ItemId>& ids) {
    reapRetired();
    std::size_t moved = 0;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        // Last id first, so the first one ends up at the head
        for (auto it = ids.crbegin(); it != ids.crend(); ++it) {
            if (pushFrontLocked(*it)) ++moved;
        }
        if (moved > 0) admitLocked();
    }
    dispatch();
    return moved;
}

void DownloadManager::setConcurrencyCap(int n) {
    reapRetired();
    {
        std::lock_guard<std::mutex> lk(mtx_);
        cap_ = std::max(1, n);
        LOGI("concurrency cap set to %d", cap_);
        // Lowering the cap never stops running workers; it only throttles admission
        admitLocked();
    }
    dispatch();
}

int DownloadManager::concurrencyCap() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return cap_;
}

bool DownloadManager::pause(ItemId id) {
    reapRetired();
    bool changed = false;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        auto a = active_.find(id);
        if (a != active_.end()) {
            if (a->second.intent == StopIntent::None) a->second.intent = StopIntent::Pause;
            a->second.worker->stop();
            return true;
        }
        Item* it = findLocked(id);
        if (it && it->status == ItemStatus::Queued) {
            removeFromQueueLocked(id);
            setStatusLocked(*it, ItemStatus::Cancelled);
            idleCv_.notify_all();
            changed = true;
        }
    }
    dispatch();
    return changed;
}

bool DownloadManager::cancel(ItemId id) {
    reapRetired();
    bool changed = false;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        changed = cancelLocked(id);
        idleCv_.notify_all();
    }
    dispatch();
    return changed;
}

void DownloadManager::cancelAll() {
    reapRetired();
    {
        std::lock_guard<std::mutex> lk(mtx_);
        for (const auto& it : items_) cancelLocked(it.id);
        idleCv_.notify_all();
    }
    dispatch();
}

bool DownloadManager::cancelLocked(ItemId id) {
    auto a = active_.find(id);
    if (a != active_.end()) {
        a->second.intent = StopIntent::Cancel;
        a->second.worker->stop();
        return true;
    }
    Item* it = findLocked(id);
    if (!it) return false;
    switch (it->status) {
        case ItemStatus::Queued:
            removeFromQueueLocked(id);
            break;
        case ItemStatus::Pending:
            break;
        case ItemStatus::Paused:
        case ItemStatus::Error:
            deletePartialLocked(*it);
            break;
        default:
            return false;
    }
    setStatusLocked(*it, ItemStatus::Cancelled);
    return true;
}

void DownloadManager::onWorkerEvent(const ItemEvent& ev) {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        auto a = active_.find(ev.id);
        if (a == active_.end()) return; // late event from a retired run
        Item* it = findLocked(ev.id);
        if (!it) return;

        if (ev.type == ItemEvent::Type::Progress) {
            if (ev.percent > it->progressPercent) {
                it->progressPercent = std::min(100, ev.percent);
                notifyLocked(progressEvent(it->id, it->progressPercent));
            }
        } else if (isTerminal(ev.status)) {
            const StopIntent intent = a->second.intent;
            retired_.push_back(std::move(a->second.worker));
            active_.erase(a);

            if (intent == StopIntent::Cancel) {
                deletePartialLocked(*it);
                setStatusLocked(*it, ItemStatus::Cancelled);
            } else if (ev.status == ItemStatus::Error) {
                it->error = ev.error;
                it->errorMessage = ev.message;
                it->status = ItemStatus::Error;
                notifyLocked(statusEvent(it->id, ItemStatus::Error, ev.error, ev.message));
            } else {
                if (ev.status == ItemStatus::Completed && it->progressPercent < 100) {
                    it->progressPercent = 100;
                    notifyLocked(progressEvent(it->id, 100));
                }
                setStatusLocked(*it, ev.status);
            }
            LOGI("item %llu finished: %s", (unsigned long long)it->id, statusName(it->status));

            admitLocked();
            idleCv_.notify_all();
        }
        // Downloading was already published at admission
    }
    dispatch();
}

std::vector<Item> DownloadManager::items() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return items_;
}

std::optional<Item> DownloadManager::item(ItemId id) const {
    std::lock_guard<std::mutex> lk(mtx_);
    const Item* it = findLocked(id);
    if (!it) return std::nullopt;
    return *it;
}

std::vector<ItemId> DownloadManager::queuedIds() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return std::vector<ItemId>(queue_.begin(), queue_.end());
}

std::vector<ItemId> DownloadManager::activeIds() const {
    std::lock_guard<std::mutex> lk(mtx_);
    std::vector<ItemId> ids;
    ids.reserve(active_.size());
    for (const auto& kv : active_) ids.push_back(kv.first);
    std::sort(ids.begin(), ids.end());
    return ids;
}

std::size_t DownloadManager::activeCount() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return active_.size();
}

std::size_t DownloadManager::knownLinkCount() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return knownLinks_.size();
}

bool DownloadManager::waitForIdle(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lk(mtx_);
    return idleCv_.wait_for(lk, timeout, [this]() { return idleLocked(); });
}

Item* DownloadManager::findLocked(ItemId id) {
    if (id == 0 || id > items_.size()) return nullptr;
    return &items_[id - 1];
}

const Item* DownloadManager::findLocked(ItemId id) const {
    if (id == 0 || id > items_.size()) return nullptr;
    return &items_[id - 1];
}

bool DownloadManager::removeFromQueueLocked(ItemId id) {
    auto pos = std::find(queue_.begin(), queue_.end(), id);
    if (pos == queue_.end()) return false;
    queue_.erase(pos);
    return true;
}

void DownloadManager::admitLocked() {
    if (shuttingDown_) return;
    while (static_cast<int>(active_.size()) < cap_ && !queue_.empty()) {
        const ItemId id = queue_.front();
        queue_.pop_front();
        Item* it = findLocked(id);
        if (!it || it->status != ItemStatus::Queued) continue;

        fs::path dir(saveDir_);
        if (dir.empty()) {
            std::error_code ec;
            dir = fs::current_path(ec);
        }
        it->destinationPath = (dir / it->displayName).string();
        it->progressPercent = 0;
        it->error = ErrorKind::None;
        it->errorMessage.clear();
        setStatusLocked(*it, ItemStatus::Downloading);
        notifyLocked(progressEvent(id, 0));

        auto worker = std::make_unique<TransferWorker>(
            id, it->sourceUrl, it->destinationPath, http_,
            [this](const ItemEvent& ev) { onWorkerEvent(ev); });
        TransferWorker* w = worker.get();
        active_[id].worker = std::move(worker);
        try {
            w->start();
        } catch (const std::system_error& ex) {
            active_.erase(id);
            it->status = ItemStatus::Error;
            it->errorMessage = std::string("Cannot start download thread: ") + ex.what();
            LOGE("item %llu: %s", (unsigned long long)id, it->errorMessage.c_str());
            notifyLocked(statusEvent(id, ItemStatus::Error, ErrorKind::None, it->errorMessage));
            continue;
        }
        LOGI("item %llu started -> %s", (unsigned long long)id, it->destinationPath.c_str());
    }
}

void DownloadManager::setStatusLocked(Item& item, ItemStatus status) {
    if (item.status == status) return;
    item.status = status;
    notifyLocked(statusEvent(item.id, status));
}

void DownloadManager::notifyLocked(ItemEvent ev) {
    if (listener_) pending_.push_back(std::move(ev));
}

bool DownloadManager::idleLocked() const {
    return active_.empty() && queue_.empty() && pending_.empty() && !draining_;
}

void DownloadManager::deletePartialLocked(const Item& item) {
    if (item.destinationPath.empty()) return;
    std::error_code ec;
    fs::remove(item.destinationPath, ec);
    if (ec) {
        LOGE("cannot delete partial file %s: %s", item.destinationPath.c_str(), ec.message().c_str());
    }
}

// One thread at a time drains the pending events; others just enqueue.
void DownloadManager::dispatch() {
    std::unique_lock<std::mutex> lk(mtx_);
    if (draining_) return;
    draining_ = true;
    while (!pending_.empty()) {
        ItemEvent ev = std::move(pending_.front());
        pending_.pop_front();
        Listener l = listener_;
        lk.unlock();
        if (l) {
            try {
                l(ev);
            } catch (const std::exception& ex) {
                LOGE("listener failed for item %llu: %s", (unsigned long long)ev.id, ex.what());
            }
        }
        lk.lock();
    }
    draining_ = false;
    idleCv_.notify_all();
}

void DownloadManager::reapRetired() {
    std::vector<std::unique_ptr<TransferWorker>> done;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        for (auto& w : retired_) {
            if (w->runsOnThisThread()) continue;
            done.push_back(std::move(w));
        }
        retired_.erase(std::remove(retired_.begin(), retired_.end(), nullptr), retired_.end());
    }
    done.clear(); // joins outside the lock
}

} // namespace mediagrab
