// Main window: page URL, folder and concurrency controls over the download table.
#include "MainWindow.hpp"
#include "DownloadController.hpp"
#include "DownloadTable.hpp"
#include <QCheckBox>
#include <QDir>
#include <QFileDialog>
#include <QHBoxLayout>
#include <QLabel>
#include <QLineEdit>
#include <QPushButton>
#include <QSettings>
#include <QSpinBox>
#include <QStatusBar>
#include <QVBoxLayout>
#include <QWidget>

namespace {

constexpr double kDefaultIntervalSec = 5.0;

} // namespace

MainWindow::MainWindow(QWidget* parent) : QMainWindow(parent) {
    ctl_ = new DownloadController(this);
    buildUi();
    loadSettings();

    connect(ctl_, &DownloadController::discoveryFinished, this, &MainWindow::onDiscoveryFinished);
    connect(ctl_, &DownloadController::discoveryFailed, this, &MainWindow::onDiscoveryFailed);
    connect(ctl_, &DownloadController::itemAdded, this, &MainWindow::updateSummary);
    connect(ctl_, &DownloadController::itemStatusChanged, this, &MainWindow::updateSummary);
    connect(&refreshTimer_, &QTimer::timeout, this, &MainWindow::checkNewLinks);
}

MainWindow::~MainWindow() {
    refreshTimer_.stop();
}

void MainWindow::buildUi() {
    setWindowTitle(tr("MediaGrab"));
    resize(900, 600);

    auto* central = new QWidget(this);
    auto* lay = new QVBoxLayout(central);

    // Row 1: page URL and fetch
    auto* urlRow = new QHBoxLayout();
    urlEdit_ = new QLineEdit(central);
    urlEdit_->setPlaceholderText(tr("Enter page URL..."));
    auto* fetchBtn = new QPushButton(tr("Fetch Links"), central);
    urlRow->addWidget(urlEdit_);
    urlRow->addWidget(fetchBtn);
    lay->addLayout(urlRow);

    // Row 2: download folder
    folderLabel_ = new QLabel(central);
    folderLabel_->setAlignment(Qt::AlignCenter);
    lay->addWidget(folderLabel_);
    auto* folderBtn = new QPushButton(tr("Select Download Folder"), central);
    lay->addWidget(folderBtn);

    // Row 3: periodic re-check of the page
    auto* keepRow = new QHBoxLayout();
    keepLoadingCheck_ = new QCheckBox(tr("Keep Loading (re-check page)"), central);
    intervalEdit_ = new QLineEdit(QString::number(kDefaultIntervalSec), central);
    intervalEdit_->setFixedWidth(50);
    startTimedBtn_ = new QPushButton(tr("Start Timed Loading"), central);
    startTimedBtn_->setEnabled(false);
    keepRow->addWidget(keepLoadingCheck_);
    keepRow->addWidget(new QLabel(tr("Interval (s):"), central));
    keepRow->addWidget(intervalEdit_);
    keepRow->addWidget(startTimedBtn_);
    keepRow->addStretch();
    lay->addLayout(keepRow);

    // Row 4: concurrency and bulk actions
    auto* runRow = new QHBoxLayout();
    concurrencySpin_ = new QSpinBox(central);
    concurrencySpin_->setRange(1, 50);
    concurrencySpin_->setValue(ctl_->maxConcurrent());
    startDownloadBtn_ = new QPushButton(tr("Start Download"), central);
    startDownloadBtn_->setEnabled(false);
    cancelAllBtn_ = new QPushButton(tr("Cancel All"), central);
    runRow->addWidget(new QLabel(tr("Max Concurrency:"), central));
    runRow->addWidget(concurrencySpin_);
    runRow->addWidget(startDownloadBtn_);
    runRow->addWidget(cancelAllBtn_);
    runRow->addStretch();
    lay->addLayout(runRow);

    // Row 5: items
    table_ = new DownloadTable(ctl_, central);
    lay->addWidget(table_);

    statusLabel_ = new QLabel(central);
    statusLabel_->setWordWrap(true);
    lay->addWidget(statusLabel_);

    setCentralWidget(central);
    summaryLabel_ = new QLabel(this);
    statusBar()->addPermanentWidget(summaryLabel_);

    connect(fetchBtn, &QPushButton::clicked, this, &MainWindow::fetchLinksOnce);
    connect(urlEdit_, &QLineEdit::returnPressed, this, &MainWindow::fetchLinksOnce);
    connect(folderBtn, &QPushButton::clicked, this, &MainWindow::chooseDownloadFolder);
    connect(keepLoadingCheck_, &QCheckBox::toggled, this, &MainWindow::onKeepLoadingToggled);
    connect(startTimedBtn_, &QPushButton::clicked, this, &MainWindow::startTimedLoading);
    connect(concurrencySpin_, qOverload<int>(&QSpinBox::valueChanged), this, &MainWindow::onConcurrencyChanged);
    connect(startDownloadBtn_, &QPushButton::clicked, this, &MainWindow::startDownloads);
    connect(cancelAllBtn_, &QPushButton::clicked, ctl_, &DownloadController::cancelAll);
}

// Restore persisted folder, concurrency, last URL and refresh interval.
void MainWindow::loadSettings() {
    QSettings s("MediaGrab", "MediaGrab");
    const QString dir = s.value("Downloads/directory", QDir::currentPath()).toString();
    ctl_->setSaveDirectory(dir);
    setFolderLabel(dir);

    const int maxConc = s.value("Downloads/maxConcurrent", 2).toInt();
    concurrencySpin_->setValue(qBound(1, maxConc, 50));
    ctl_->setMaxConcurrent(concurrencySpin_->value());

    urlEdit_->setText(s.value("Discovery/lastUrl").toString());
    intervalEdit_->setText(s.value("Discovery/intervalSec", QString::number(kDefaultIntervalSec)).toString());
}

void MainWindow::setStatus(const QString& text) {
    statusLabel_->setText(text);
}

void MainWindow::setFolderLabel(const QString& dir) {
    folderLabel_->setText(tr("Download Folder: %1").arg(QDir::toNativeSeparators(dir)));
}

void MainWindow::fetchLinksOnce() {
    const QString url = urlEdit_->text().trimmed();
    if (url.isEmpty()) {
        setStatus(tr("Please enter a valid URL."));
        return;
    }
    if (!ctl_->fetchLinks(url)) {
        setStatus(tr("A fetch is already running..."));
        return;
    }
    timedFetch_ = false;
    QSettings s("MediaGrab", "MediaGrab");
    s.setValue("Discovery/lastUrl", url);
    setStatus(tr("Fetching links..."));
}

void MainWindow::onDiscoveryFinished(int found, int added) {
    if (timedFetch_) {
        setStatus(added > 0 ? tr("Added %1 new links.").arg(added)
                            : tr("No new audio links found."));
    } else if (found == 0) {
        setStatus(tr("No audio links found."));
    } else {
        setStatus(tr("Found: %1 audio links. %2 new.").arg(found).arg(added));
    }
    if (found > 0 || !ctl_->items().empty()) {
        startDownloadBtn_->setEnabled(true);
        startTimedBtn_->setEnabled(true);
    }
}

void MainWindow::onDiscoveryFailed(const QString& error) {
    setStatus(tr("Error fetching URL: %1").arg(error));
}

void MainWindow::chooseDownloadFolder() {
    const QString dir = QFileDialog::getExistingDirectory(this, tr("Select Download Folder"), ctl_->saveDirectory());
    if (dir.isEmpty()) return;
    ctl_->setSaveDirectory(dir);
    setFolderLabel(dir);
    QSettings s("MediaGrab", "MediaGrab");
    s.setValue("Downloads/directory", dir);
}

void MainWindow::onKeepLoadingToggled(bool on) {
    if (!on) refreshTimer_.stop();
}

void MainWindow::startTimedLoading() {
    if (!keepLoadingCheck_->isChecked()) return;

    bool ok = false;
    double seconds = intervalEdit_->text().trimmed().toDouble(&ok);
    if (!ok) seconds = kDefaultIntervalSec;
    else if (seconds < 1.0) seconds = 1.0;
    intervalEdit_->setText(QString::number(seconds));

    QSettings s("MediaGrab", "MediaGrab");
    s.setValue("Discovery/intervalSec", seconds);

    refreshTimer_.stop();
    refreshTimer_.setInterval(static_cast<int>(seconds * 1000));
    refreshTimer_.start();
    setStatus(tr("Auto-refresh every %1 seconds...").arg(seconds));
}

void MainWindow::checkNewLinks() {
    if (!keepLoadingCheck_->isChecked()) {
        refreshTimer_.stop();
        return;
    }
    const QString url = urlEdit_->text().trimmed();
    if (url.isEmpty()) return;
    // Skip this tick if the previous fetch is still running
    if (ctl_->fetchLinks(url)) timedFetch_ = true;
}

void MainWindow::onConcurrencyChanged(int n) {
    ctl_->setMaxConcurrent(n);
    QSettings s("MediaGrab", "MediaGrab");
    s.setValue("Downloads/maxConcurrent", n);
}

void MainWindow::startDownloads() {
    ctl_->startAll();
}

void MainWindow::updateSummary() {
    summaryLabel_->setText(tr("Total: %1  |  Queued: %2  |  Downloading: %3  |  Completed: %4  |  Error: %5")
        .arg(table_->rowCount())
        .arg(table_->countWithStatus(QStringLiteral("Queued")))
        .arg(table_->countWithStatus(QStringLiteral("Downloading")))
        .arg(table_->countWithStatus(QStringLiteral("Completed")))
        .arg(table_->countWithStatus(QStringLiteral("Error"))));
}
