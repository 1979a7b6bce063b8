// Table of discovered items with per-row actions.
#pragma once
#include <QHash>
#include <QTableWidget>

class DownloadController;
class QProgressBar;

// One row per item: file name, status and a progress bar.
// The context menu offers Download / Pause / Cancel on the selected rows.
class DownloadTable : public QTableWidget {
    Q_OBJECT
public:
    explicit DownloadTable(DownloadController* ctl, QWidget* parent = nullptr);

    int countWithStatus(const QString& statusText) const;

private slots:
    void onItemAdded(quint64 id);
    void onItemStatusChanged(quint64 id);
    void onItemProgress(quint64 id, int percent);
    void showContextMenu(const QPoint& pos);

private:
    QList<quint64> selectedIds() const;
    QProgressBar* progressAt(int row) const;

    DownloadController* ctl_;        // not owned
    QHash<quint64, int> rowForId_;   // rows are only appended
};
