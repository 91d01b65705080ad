#ifndef MAINWINDOW_H
#define MAINWINDOW_H

#include <QLabel>
#include <QMainWindow>

#include "models/pendingitem.h"
#include "services/uploadsettings.h"

class ErrorHandler;
class HfsApiClient;
class HttpUploadTransport;
class SseNotificationChannel;
class UploadIntake;
class UploadPanel;
class UploadQueue;
class UploadState;

class MainWindow : public QMainWindow
{
    Q_OBJECT

public:
    explicit MainWindow(const UploadSettings &settings, QWidget *parent = nullptr);
    ~MainWindow() override;

    [[nodiscard]] UploadIntake *intake() const { return intake_; }

protected:
    void closeEvent(QCloseEvent *event) override;

private slots:
    void onUploadConcluded(const UploadSummary &summary);
    void onServerChanged();
    void onStatusMessage(const QString &message, int timeout);
    void updateWindowTitle();

private:
    void setupUi();
    void setupMenus();
    void setupConnections();
    void applyServerUrl(const QString &url);

    UploadSettings settings_;

    // Core (owned through QObject parenting)
    UploadState *state_ = nullptr;
    HttpUploadTransport *transport_ = nullptr;
    SseNotificationChannel *channel_ = nullptr;
    UploadQueue *queue_ = nullptr;
    UploadIntake *intake_ = nullptr;
    HfsApiClient *api_ = nullptr;
    ErrorHandler *errorHandler_ = nullptr;

    // UI
    UploadPanel *panel_ = nullptr;
    QLabel *serverLabel_ = nullptr;
};

#endif // MAINWINDOW_H
