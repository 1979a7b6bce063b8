// Controller: page fetch thread, manager intents and GUI-thread event delivery.
#include "DownloadController.hpp"
#include "mediagrab/CurlHttpClient.hpp"
#include "mediagrab/DownloadManager.hpp"
#include "mediagrab/LinkDiscovery.hpp"
#include "mediagrab/Log.hpp"
#include <QMetaObject>
#include <string>

DownloadController::DownloadController(QObject* parent)
    : DownloadController(std::make_shared<mediagrab::CurlHttpClient>(), parent) {}

DownloadController::DownloadController(std::shared_ptr<mediagrab::HttpClient> http, QObject* parent)
    : QObject(parent), http_(std::move(http)) {
    mgr_ = std::make_unique<mediagrab::DownloadManager>(http_);
    mgr_->setListener([this](const mediagrab::ItemEvent& ev) {
        // Worker thread: hop to the GUI thread before touching anything Qt
        QMetaObject::invokeMethod(this, [this, ev] { onManagerEvent(ev); }, Qt::QueuedConnection);
    });
}

DownloadController::~DownloadController() {
    joinFetch();
    // Stops and joins every worker; no listener call happens after this
    mgr_.reset();
}

void DownloadController::joinFetch() {
    if (fetchThread_.joinable()) fetchThread_.join();
}

bool DownloadController::fetchLinks(const QString& pageUrl) {
    if (fetching_.exchange(true)) return false;
    joinFetch();

    const std::string url = pageUrl.trimmed().toStdString();
    fetchThread_ = std::thread([this, url] {
        std::string html, err;
        if (!http_->fetchText(url, html, err)) {
            LOGE("fetch %s failed: %s", url.c_str(), err.c_str());
            const QString msg = QString::fromStdString(err);
            QMetaObject::invokeMethod(this, [this, msg] {
                fetching_ = false;
                emit discoveryFailed(msg);
            }, Qt::QueuedConnection);
            return;
        }
        const auto found = mediagrab::extractMediaLinks(html, url);
        const auto added = mgr_->addDiscovered(found);
        LOGI("page %s: %zu audio link(s), %zu new", url.c_str(), found.size(), added.size());
        const int nFound = static_cast<int>(found.size());
        const int nAdded = static_cast<int>(added.size());
        QMetaObject::invokeMethod(this, [this, nFound, nAdded] {
            fetching_ = false;
            emit discoveryFinished(nFound, nAdded);
        }, Qt::QueuedConnection);
    });
    return true;
}

void DownloadController::setSaveDirectory(const QString& dir) {
    mgr_->setSaveDirectory(dir.toStdString());
}

QString DownloadController::saveDirectory() const {
    return QString::fromStdString(mgr_->saveDirectory());
}

void DownloadController::setMaxConcurrent(int n) { mgr_->setConcurrencyCap(n); }
int DownloadController::maxConcurrent() const { return mgr_->concurrencyCap(); }

void DownloadController::startAll() { mgr_->enqueueAll(); }
void DownloadController::downloadNow(const QList<quint64>& ids) {
    mgr_->enqueueNowBatch(std::vector<mediagrab::ItemId>(ids.begin(), ids.end()));
}
void DownloadController::pauseItem(quint64 id) { mgr_->pause(id); }
void DownloadController::cancelItem(quint64 id) { mgr_->cancel(id); }
void DownloadController::cancelAll() { mgr_->cancelAll(); }

std::optional<mediagrab::Item> DownloadController::item(quint64 id) const {
    return mgr_->item(id);
}

std::vector<mediagrab::Item> DownloadController::items() const {
    return mgr_->items();
}

void DownloadController::onManagerEvent(const mediagrab::ItemEvent& ev) {
    if (ev.type == mediagrab::ItemEvent::Type::Progress) {
        emit itemProgress(ev.id, ev.percent);
        return;
    }
    // Items are born Pending and never return to it
    if (ev.status == mediagrab::ItemStatus::Pending) emit itemAdded(ev.id);
    else emit itemStatusChanged(ev.id);
}
