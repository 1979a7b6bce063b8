// Qt bridge over the core download manager.
#pragma once
#include <QList>
#include <QObject>
#include <QString>
#include <atomic>
#include <memory>
#include <optional>
#include <thread>
#include <vector>
#include "mediagrab/Types.hpp"

namespace mediagrab { class DownloadManager; class HttpClient; }

// Owns the HTTP client and the download manager for the window.
// Manager events arrive on worker threads; they are re-posted to this object's
// thread before any signal is emitted, so widgets can connect directly.
class DownloadController : public QObject {
    Q_OBJECT
public:
    explicit DownloadController(QObject* parent = nullptr);
    // Inject a client (tests, alternative backends)
    DownloadController(std::shared_ptr<mediagrab::HttpClient> http, QObject* parent = nullptr);
    ~DownloadController();

    // Fetch the page and add its audio links. Runs on a background thread;
    // returns false if a fetch is already in progress.
    bool fetchLinks(const QString& pageUrl);
    bool fetching() const { return fetching_.load(); }

    void setSaveDirectory(const QString& dir);
    QString saveDirectory() const;
    void setMaxConcurrent(int n);
    int maxConcurrent() const;

    void startAll();                 // every Pending item
    void downloadNow(const QList<quint64>& ids);    // queue head, in the given order
    void pauseItem(quint64 id);
    void cancelItem(quint64 id);
    void cancelAll();

    std::optional<mediagrab::Item> item(quint64 id) const;
    std::vector<mediagrab::Item> items() const;

signals:
    void itemAdded(quint64 id);
    void itemStatusChanged(quint64 id);
    void itemProgress(quint64 id, int percent);
    // found = audio links on the page, added = links not seen before
    void discoveryFinished(int found, int added);
    void discoveryFailed(const QString& error);

private:
    void onManagerEvent(const mediagrab::ItemEvent& ev);
    void joinFetch();

    std::shared_ptr<mediagrab::HttpClient> http_;
    std::unique_ptr<mediagrab::DownloadManager> mgr_;
    std::thread fetchThread_;
    std::atomic<bool> fetching_{false};
};
