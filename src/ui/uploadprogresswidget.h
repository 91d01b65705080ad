#ifndef UPLOADPROGRESSWIDGET_H
#define UPLOADPROGRESSWIDGET_H

#include <QLabel>
#include <QProgressBar>
#include <QPushButton>
#include <QWidget>

class UploadQueue;
class UploadState;

/**
 * @brief Progress bar of the active upload with speed, ETA and queue controls.
 */
class UploadProgressWidget : public QWidget
{
    Q_OBJECT

public:
    explicit UploadProgressWidget(QWidget *parent = nullptr);

    void setUploadQueue(UploadQueue *queue);

private slots:
    void onProgressChanged(qint64 partialBytes, double fraction);
    void onEstimateChanged(double bytesPerSecond, qint64 etaSeconds);
    void onPausedChanged(bool paused);
    void updateDisplay();

private:
    void setupUi();

    // Dependencies (not owned)
    UploadQueue *queue_ = nullptr;
    UploadState *state_ = nullptr;

    // UI widgets
    QLabel *fileLabel_ = nullptr;
    QProgressBar *progressBar_ = nullptr;
    QLabel *statsLabel_ = nullptr;
    QLabel *countersLabel_ = nullptr;
    QPushButton *pauseButton_ = nullptr;
    QPushButton *clearButton_ = nullptr;
};

#endif // UPLOADPROGRESSWIDGET_H
