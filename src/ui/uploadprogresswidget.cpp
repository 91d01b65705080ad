#include "uploadprogresswidget.h"
#include "models/uploadqueue.h"
#include "models/uploadstate.h"
#include "utils/transferformat.h"

#include <QHBoxLayout>
#include <QVBoxLayout>

UploadProgressWidget::UploadProgressWidget(QWidget *parent)
    : QWidget(parent)
{
    setupUi();
}

void UploadProgressWidget::setupUi()
{
    auto *layout = new QVBoxLayout(this);
    layout->setContentsMargins(8, 4, 8, 4);

    auto *topRow = new QHBoxLayout();
    fileLabel_ = new QLabel(tr("Idle"));
    fileLabel_->setMinimumWidth(200);
    topRow->addWidget(fileLabel_);

    progressBar_ = new QProgressBar();
    progressBar_->setMinimum(0);
    progressBar_->setMaximum(100);
    progressBar_->setValue(0);
    topRow->addWidget(progressBar_, 1);

    pauseButton_ = new QPushButton(tr("Pause"));
    pauseButton_->setMaximumWidth(80);
    topRow->addWidget(pauseButton_);

    clearButton_ = new QPushButton(tr("Clear"));
    clearButton_->setMaximumWidth(80);
    clearButton_->setToolTip(tr("Remove all queued files and stop the current upload"));
    topRow->addWidget(clearButton_);
    layout->addLayout(topRow);

    auto *bottomRow = new QHBoxLayout();
    statsLabel_ = new QLabel();
    bottomRow->addWidget(statsLabel_, 1);
    countersLabel_ = new QLabel();
    countersLabel_->setAlignment(Qt::AlignRight | Qt::AlignVCenter);
    bottomRow->addWidget(countersLabel_);
    layout->addLayout(bottomRow);
}

void UploadProgressWidget::setUploadQueue(UploadQueue *queue)
{
    if (state_) {
        disconnect(state_, nullptr, this, nullptr);
    }
    if (queue_) {
        disconnect(pauseButton_, nullptr, queue_, nullptr);
        disconnect(clearButton_, nullptr, queue_, nullptr);
    }

    queue_ = queue;
    state_ = queue ? queue->state() : nullptr;

    if (state_) {
        connect(state_, &UploadState::progressChanged,
                this, &UploadProgressWidget::onProgressChanged);
        connect(state_, &UploadState::estimateChanged,
                this, &UploadProgressWidget::onEstimateChanged);
        connect(state_, &UploadState::pausedChanged,
                this, &UploadProgressWidget::onPausedChanged);
        connect(state_, &UploadState::activeChanged,
                this, &UploadProgressWidget::updateDisplay);
        connect(state_, &UploadState::queueChanged,
                this, &UploadProgressWidget::updateDisplay);
        connect(state_, &UploadState::countersChanged,
                this, &UploadProgressWidget::updateDisplay);
        connect(pauseButton_, &QPushButton::clicked, queue_, &UploadQueue::togglePause);
        connect(clearButton_, &QPushButton::clicked, queue_, &UploadQueue::clear);
    }

    updateDisplay();
}

void UploadProgressWidget::onProgressChanged(qint64 partialBytes, double fraction)
{
    Q_UNUSED(partialBytes)
    progressBar_->setValue(static_cast<int>(fraction * 100));
}

void UploadProgressWidget::onEstimateChanged(double bytesPerSecond, qint64 etaSeconds)
{
    Q_UNUSED(bytesPerSecond)
    Q_UNUSED(etaSeconds)
    updateDisplay();
}

void UploadProgressWidget::onPausedChanged(bool paused)
{
    pauseButton_->setText(paused ? tr("Resume") : tr("Pause"));
    updateDisplay();
}

void UploadProgressWidget::updateDisplay()
{
    if (!state_) {
        setEnabled(false);
        return;
    }
    setEnabled(true);

    if (state_->hasActive()) {
        fileLabel_->setText(state_->active()->relativePath);
        progressBar_->setValue(static_cast<int>(state_->progressFraction() * 100));
    } else {
        fileLabel_->setText(state_->isPaused() ? tr("Paused") : tr("Idle"));
        progressBar_->setValue(0);
    }

    // The active file is still in its entry until it completes
    int inQueue = state_->queuedItemCount() - (state_->hasActive() ? 1 : 0);

    QStringList stats;
    if (state_->speed() > 0) {
        stats << TransferFormat::speed(state_->speed());
    }
    if (state_->etaSeconds() > 0) {
        stats << tr("%1 left").arg(TransferFormat::duration(state_->etaSeconds(), 2));
    }
    if (inQueue > 0) {
        stats << tr("%n in queue", nullptr, inQueue);
    }
    statsLabel_->setText(stats.join(QStringLiteral("  ")));

    QString counters = tr("Done: %1 (%2)")
        .arg(state_->doneCount())
        .arg(TransferFormat::bytes(state_->doneBytes()));
    if (state_->errorCount() > 0) {
        counters += tr("  Errors: %1").arg(state_->errorCount());
    }
    countersLabel_->setText(counters);

    bool busy = queue_->hasPendingUploads();
    pauseButton_->setEnabled(busy || state_->isPaused());
    clearButton_->setEnabled(busy);
}
