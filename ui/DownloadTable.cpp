// Download table: rows follow controller signals; menu actions go back to it.
#include "DownloadTable.hpp"
#include "DownloadController.hpp"
#include <QAbstractItemView>
#include <QHeaderView>
#include <QMenu>
#include <QProgressBar>
#include <QTableWidgetItem>
#include <algorithm>

namespace {

enum Column { ColName = 0, ColStatus = 1, ColProgress = 2 };

QString statusText(const mediagrab::Item& it) {
    const QString s = QString::fromLatin1(mediagrab::statusName(it.status));
    if (it.status == mediagrab::ItemStatus::Error && !it.errorMessage.empty())
        return s + ": " + QString::fromStdString(it.errorMessage);
    return s;
}

} // namespace

DownloadTable::DownloadTable(DownloadController* ctl, QWidget* parent)
    : QTableWidget(parent), ctl_(ctl) {
    setColumnCount(3);
    setHorizontalHeaderLabels({ tr("File Name"), tr("Status"), tr("Progress") });
    horizontalHeader()->setSectionResizeMode(QHeaderView::Interactive);
    horizontalHeader()->setStretchLastSection(true);
    verticalHeader()->setVisible(false);
    setColumnWidth(ColName, 320);
    setColumnWidth(ColStatus, 160);
    setSelectionBehavior(QAbstractItemView::SelectRows);
    setSelectionMode(QAbstractItemView::ExtendedSelection);
    setEditTriggers(QAbstractItemView::NoEditTriggers);
    setWordWrap(true);
    setAlternatingRowColors(true);
    setContextMenuPolicy(Qt::CustomContextMenu);

    connect(ctl_, &DownloadController::itemAdded, this, &DownloadTable::onItemAdded);
    connect(ctl_, &DownloadController::itemStatusChanged, this, &DownloadTable::onItemStatusChanged);
    connect(ctl_, &DownloadController::itemProgress, this, &DownloadTable::onItemProgress);
    connect(this, &QTableWidget::customContextMenuRequested, this, &DownloadTable::showContextMenu);
}

void DownloadTable::onItemAdded(quint64 id) {
    if (rowForId_.contains(id)) return;
    const auto it = ctl_->item(id);
    if (!it) return;

    const int row = rowCount();
    insertRow(row);
    auto* name = new QTableWidgetItem(QString::fromStdString(it->displayName));
    name->setData(Qt::UserRole, QVariant::fromValue<quint64>(id));
    name->setToolTip(QString::fromStdString(it->sourceUrl));
    setItem(row, ColName, name);
    setItem(row, ColStatus, new QTableWidgetItem(statusText(*it)));
    auto* bar = new QProgressBar(this);
    bar->setRange(0, 100);
    bar->setValue(it->progressPercent);
    setCellWidget(row, ColProgress, bar);
    rowForId_.insert(id, row);
}

void DownloadTable::onItemStatusChanged(quint64 id) {
    auto r = rowForId_.find(id);
    if (r == rowForId_.end()) return;
    const auto it = ctl_->item(id);
    if (!it) return;
    // Snapshot may be newer than the event; show the current state
    item(*r, ColStatus)->setText(statusText(*it));
    if (QProgressBar* bar = progressAt(*r)) bar->setValue(it->progressPercent);
}

void DownloadTable::onItemProgress(quint64 id, int percent) {
    auto r = rowForId_.find(id);
    if (r == rowForId_.end()) return;
    if (QProgressBar* bar = progressAt(*r)) bar->setValue(std::clamp(percent, 0, 100));
}

QProgressBar* DownloadTable::progressAt(int row) const {
    return qobject_cast<QProgressBar*>(cellWidget(row, ColProgress));
}

QList<quint64> DownloadTable::selectedIds() const {
    QList<quint64> ids;
    auto sel = selectionModel();
    if (!sel || !sel->hasSelection()) return ids;
    QModelIndexList rows = sel->selectedRows();
    std::sort(rows.begin(), rows.end(),
              [](const QModelIndex& a, const QModelIndex& b) { return a.row() < b.row(); });
    for (const QModelIndex& r : rows) {
        const QTableWidgetItem* name = item(r.row(), ColName);
        if (name) ids.push_back(name->data(Qt::UserRole).value<quint64>());
    }
    return ids;
}

int DownloadTable::countWithStatus(const QString& text) const {
    int n = 0;
    for (int row = 0; row < rowCount(); ++row) {
        const QTableWidgetItem* st = item(row, ColStatus);
        if (st && st->text().startsWith(text)) ++n;
    }
    return n;
}

void DownloadTable::showContextMenu(const QPoint& pos) {
    const QModelIndex idx = indexAt(pos);
    if (idx.isValid() && !selectionModel()->isRowSelected(idx.row(), QModelIndex())) {
        selectRow(idx.row());
    }
    const QList<quint64> ids = selectedIds();
    if (ids.isEmpty()) return;

    QMenu menu(this);
    QAction* download = menu.addAction(tr("Download"));
    QAction* pause = menu.addAction(tr("Pause"));
    QAction* cancel = menu.addAction(tr("Cancel"));
    QAction* chosen = menu.exec(viewport()->mapToGlobal(pos));
    if (!chosen) return;
    if (chosen == download) {
        ctl_->downloadNow(ids);
        return;
    }
    for (quint64 id : ids) {
        if (chosen == pause) ctl_->pauseItem(id);
        else if (chosen == cancel) ctl_->cancelItem(id);
    }
}
