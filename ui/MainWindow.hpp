// Declaration of the main window and its state/actions.
#pragma once
#include <QMainWindow>
#include <QTimer>

class DownloadController;
class DownloadTable;
class QCheckBox;
class QLabel;
class QLineEdit;
class QPushButton;
class QSpinBox;

class MainWindow : public QMainWindow {
    Q_OBJECT
public:
    explicit MainWindow(QWidget* parent = nullptr);
    ~MainWindow();

private slots:
    void fetchLinksOnce();              // "Fetch Links"
    void chooseDownloadFolder();
    void onKeepLoadingToggled(bool on);
    void startTimedLoading();
    void checkNewLinks();               // timer tick
    void onConcurrencyChanged(int n);
    void startDownloads();              // "Start Download"
    void onDiscoveryFinished(int found, int added);
    void onDiscoveryFailed(const QString& error);
    void updateSummary();

private:
    void buildUi();
    void loadSettings();
    void setStatus(const QString& text);
    void setFolderLabel(const QString& dir);

    DownloadController* ctl_ = nullptr;   // child QObject
    DownloadTable* table_ = nullptr;

    QLineEdit* urlEdit_ = nullptr;
    QLabel* folderLabel_ = nullptr;
    QLabel* statusLabel_ = nullptr;
    QLabel* summaryLabel_ = nullptr;
    QCheckBox* keepLoadingCheck_ = nullptr;
    QLineEdit* intervalEdit_ = nullptr;
    QPushButton* startTimedBtn_ = nullptr;
    QSpinBox* concurrencySpin_ = nullptr;
    QPushButton* startDownloadBtn_ = nullptr;
    QPushButton* cancelAllBtn_ = nullptr;

    QTimer refreshTimer_;
    bool timedFetch_ = false;   // current fetch was started by the timer
};
