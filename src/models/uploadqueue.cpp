#include "uploadqueue.h"
#include "uploadstate.h"
#include "services/conflictnegotiator.h"
#include "services/inotificationchannel.h"
#include "services/iuploadtransport.h"
#include "services/transferestimator.h"
#include "utils/logging.h"

#include <QDebug>

UploadQueue::UploadQueue(UploadState *state,
                         IUploadTransport *transport,
                         INotificationChannel *channel,
                         QObject *parent)
    : QAbstractListModel(parent)
    , state_(state)
    , transport_(transport)
    , negotiator_(new ConflictNegotiator(channel, state, this))
    , estimator_(new TransferEstimator(state, this))
    , channelWaitTimer_(new QTimer(this))
    , refreshTimer_(new QTimer(this))
{
    channelWaitTimer_->setSingleShot(true);
    channelWaitTimer_->setInterval(ChannelWaitMs);
    connect(channelWaitTimer_, &QTimer::timeout, this, &UploadQueue::onChannelWaitTimeout);

    refreshTimer_->setSingleShot(true);
    refreshTimer_->setInterval(RefreshDebounceMs);
    connect(refreshTimer_, &QTimer::timeout, this, &UploadQueue::onRefreshTimeout);

    connect(state_, &UploadState::queueChanged, this, &UploadQueue::onQueueChanged);
    connect(state_, &UploadState::activeChanged, this, &UploadQueue::onActiveChanged);
    connect(state_, &UploadState::progressChanged, this, &UploadQueue::onProgressChanged);
    connect(negotiator_, &ConflictNegotiator::channelReady, this, &UploadQueue::onChannelReady);
}

UploadQueue::~UploadQueue()
{
    // Members referenced from these connections are gone once QObject's destructor runs
    disconnect(state_, nullptr, this, nullptr);
    if (activeTransfer_) {
        disconnect(activeTransfer_, nullptr, this, nullptr);
    }
}

void UploadQueue::scheduleProcessNext()
{
    eventQueue_.enqueue([this]() { processNext(); });

    if (!eventProcessingScheduled_) {
        eventProcessingScheduled_ = true;
        QTimer::singleShot(0, this, &UploadQueue::processEventQueue);
    }
}

void UploadQueue::processEventQueue()
{
    eventProcessingScheduled_ = false;

    if (processingEvents_) {
        if (!eventQueue_.isEmpty() && !eventProcessingScheduled_) {
            eventProcessingScheduled_ = true;
            QTimer::singleShot(0, this, &UploadQueue::processEventQueue);
        }
        return;
    }

    processingEvents_ = true;
    while (!eventQueue_.isEmpty()) {
        auto event = eventQueue_.dequeue();
        event();
    }
    processingEvents_ = false;
}

void UploadQueue::flushEventQueue()
{
    if (processingEvents_) {
        return;
    }

    eventProcessingScheduled_ = false;
    processingEvents_ = true;
    while (!eventQueue_.isEmpty()) {
        auto event = eventQueue_.dequeue();
        event();
    }
    processingEvents_ = false;
}

void UploadQueue::enqueue(const QList<PendingItem> &items, const QString &destination)
{
    int rejected = 0;
    QList<PendingItem> accepted = policy_.filter(items, &rejected);
    if (rejected > 0) {
        qDebug() << "UploadQueue:" << rejected << "files rejected by accept policy";
        emit filesRejected(rejected);
    }

    int added = state_->appendToDestination(destination, accepted);
    qDebug() << "UploadQueue: Enqueued" << added << "files for" << destination;
    if (added > 0) {
        scheduleProcessNext();
    }
}

int UploadQueue::commitAdding(const QString &destination)
{
    QList<PendingItem> items = state_->takeAdding();
    if (items.isEmpty()) {
        return 0;
    }
    int before = state_->queuedItemCount();
    enqueue(items, destination);
    return state_->queuedItemCount() - before;
}

bool UploadQueue::isPaused() const
{
    return state_->isPaused();
}

void UploadQueue::togglePause()
{
    setPaused(!state_->isPaused());
}

void UploadQueue::setPaused(bool paused)
{
    if (state_->isPaused() == paused) {
        return;
    }
    state_->setPaused(paused);
    qDebug() << "UploadQueue:" << (paused ? "Paused" : "Resumed");

    if (paused) {
        if (state_->hasActive() && !pauseNoticeShown_) {
            pauseNoticeShown_ = true;
            emit pauseNoticeNeeded();
        }
        return;
    }
    scheduleProcessNext();
}

void UploadQueue::setSkipExisting(bool skip)
{
    state_->setSkipExisting(skip);
}

void UploadQueue::clear()
{
    qDebug() << "UploadQueue: Clearing" << state_->queuedItemCount() << "queued files";
    state_->clearQueue();

    if (activeTransfer_) {
        cancelRequested_ = true;
        activeTransfer_->abort();
    }
    renewCycleIfIdle();
}

bool UploadQueue::removeFromQueue(const QString &destination, const QString &relativePath)
{
    if (state_->isActive(destination, relativePath) && activeTransfer_) {
        qDebug() << "UploadQueue: Removing active file" << relativePath;
        cancelRequested_ = true;
        activeTransfer_->abort();
        return true;
    }

    bool removed = state_->removeFromDestination(destination, relativePath);
    if (removed) {
        renewCycleIfIdle();
    }
    return removed;
}

void UploadQueue::setTransferUiVisible(bool visible)
{
    if (transferUiVisible_ == visible) {
        return;
    }
    transferUiVisible_ = visible;

    if (visible) {
        if (state_->isQueueEmpty() && !state_->hasActive()) {
            state_->resetCounters();
        }
        return;
    }

    if (remoteDirty_) {
        remoteDirty_ = false;
        emit remoteRefreshRequested(lastFinishedDestination_);
    }
}

void UploadQueue::acknowledgeSummary()
{
    state_->resetCounters();
}

bool UploadQueue::hasPendingUploads() const
{
    return !state_->isQueueEmpty() || state_->hasActive();
}

void UploadQueue::processNext()
{
    if (activeTransfer_ || state_->hasActive()) {
        return;
    }
    if (state_->isPaused() || state_->isQueueEmpty()) {
        return;
    }
    if (transport_->isBusy()) {
        qDebug() << "UploadQueue: Transport still busy, waiting for its completion";
        return;
    }

    negotiator_->prepareChannel();
    if (!negotiator_->isChannelReady() && !channelWaitExpired_) {
        if (!channelWaitTimer_->isActive()) {
            HFSUPLOAD_LOG_VERBOSE() << "UploadQueue: Waiting for notification channel";
            channelWaitTimer_->start();
        }
        return;
    }
    channelWaitTimer_->stop();

    const QueueEntry &head = state_->queue().first();
    startTransfer(head.entries.first(), head.destination, 0);
}

void UploadQueue::startTransfer(const PendingItem &item, const QString &destination, qint64 resumeOffset)
{
    state_->setActive(item, destination, resumeOffset);
    cancelRequested_ = false;

    auto *transfer = new SingleTransfer(transport_, state_, item, destination, resumeOffset, this);
    connect(transfer, &SingleTransfer::bytesSent, estimator_, &TransferEstimator::addBytesSent);
    connect(transfer, &SingleTransfer::uploadFailed, this, &UploadQueue::uploadFailed);
    connect(transfer, &SingleTransfer::finished, this,
            [this, transfer](SingleTransfer::Outcome outcome, int status) {
                Q_UNUSED(status)
                onTransferFinished(transfer, outcome);
            });

    activeTransfer_ = transfer;
    negotiator_->track(transfer);
    if (!estimator_->isRunning()) {
        estimator_->start();
    }

    transfer->start(negotiator_->channelId());
    emit transferStarted(destination, item.relativePath, resumeOffset);
}

void UploadQueue::onTransferFinished(SingleTransfer *transfer, SingleTransfer::Outcome outcome)
{
    if (transfer != activeTransfer_) {
        return;
    }

    PendingItem item = transfer->item();
    QString destination = transfer->destination();
    bool cancelled = cancelRequested_;

    negotiator_->track(nullptr);
    activeTransfer_ = nullptr;
    cancelRequested_ = false;
    transfer->deleteLater();

    emit transferFinished(item.relativePath, outcome);

    if (outcome == SingleTransfer::Outcome::Aborted && transfer->isResuming() && !cancelled
        && state_->entryIndex(destination) >= 0
        && state_->queue().at(state_->entryIndex(destination)).indexOf(item.relativePath) >= 0) {
        qDebug() << "UploadQueue: Restarting" << item.relativePath << "at" << transfer->resumeTarget();
        startTransfer(item, destination, transfer->resumeTarget());
        return;
    }

    bool removed = state_->removeFromDestination(destination, item.relativePath);
    state_->clearActive();

    if (outcome == SingleTransfer::Outcome::Succeeded) {
        lastFinishedDestination_ = destination;
        if (transferUiVisible_) {
            remoteDirty_ = true;
        }
    }

    if (state_->isQueueEmpty()) {
        if (removed) {
            handleDrained(destination);
        }
        renewCycleIfIdle();
        return;
    }

    scheduleProcessNext();
}

void UploadQueue::handleDrained(const QString &lastDestination)
{
    qDebug() << "UploadQueue: Queue drained";
    emit queueDrained();

    refreshDestination_ = lastDestination;
    refreshTimer_->start();

    // The host presents the summary and calls acknowledgeSummary()
    if (!transferUiVisible_) {
        emit uploadConcluded(state_->summary());
    }
}

void UploadQueue::renewCycleIfIdle()
{
    if (!state_->isQueueEmpty() || state_->hasActive() || activeTransfer_) {
        return;
    }
    channelWaitTimer_->stop();
    channelWaitExpired_ = false;
    negotiator_->resetChannel();
    estimator_->stop();
}

void UploadQueue::onQueueChanged()
{
    beginResetModel();
    rows_.clear();
    for (const QueueEntry &entry : state_->queue()) {
        for (const PendingItem &item : entry.entries) {
            rows_.append(Row{entry.destination, item});
        }
    }
    endResetModel();
}

int UploadQueue::activeRow() const
{
    if (!state_->hasActive()) {
        return -1;
    }
    for (int i = 0; i < rows_.size(); ++i) {
        if (state_->isActive(rows_[i].destination, rows_[i].item.relativePath)) {
            return i;
        }
    }
    return -1;
}

void UploadQueue::onActiveChanged()
{
    if (rows_.isEmpty()) {
        return;
    }
    emit dataChanged(index(0), index(rows_.size() - 1), {ActiveRole, ProgressRole});
}

void UploadQueue::onProgressChanged(qint64 partialBytes, double fraction)
{
    HFSUPLOAD_LOG_VERBOSE() << "UploadQueue: Progress" << partialBytes << fraction;
    int row = activeRow();
    if (row >= 0) {
        emit dataChanged(index(row), index(row), {ProgressRole});
    }
}

void UploadQueue::onChannelReady()
{
    if (channelWaitTimer_->isActive()) {
        channelWaitTimer_->stop();
    }
    scheduleProcessNext();
}

void UploadQueue::onChannelWaitTimeout()
{
    qWarning() << "UploadQueue: Notification channel not ready after" << ChannelWaitMs
               << "ms, uploading without it";
    channelWaitExpired_ = true;
    scheduleProcessNext();
}

void UploadQueue::onRefreshTimeout()
{
    emit remoteRefreshRequested(refreshDestination_);
}

int UploadQueue::rowCount(const QModelIndex &parent) const
{
    if (parent.isValid()) return 0;
    return rows_.size();
}

QVariant UploadQueue::data(const QModelIndex &index, int role) const
{
    if (!index.isValid() || index.row() >= rows_.size()) {
        return QVariant();
    }

    const Row &row = rows_[index.row()];
    bool active = state_->isActive(row.destination, row.item.relativePath);

    switch (role) {
    case Qt::DisplayRole:
        return row.item.relativePath;
    case DestinationRole:
        return row.destination;
    case RelativePathRole:
        return row.item.relativePath;
    case FileNameRole:
        return row.item.fileName();
    case SizeRole:
        return row.item.size;
    case CommentRole:
        return row.item.comment;
    case ActiveRole:
        return active;
    case ProgressRole:
        return active ? static_cast<int>(state_->progressFraction() * 100) : 0;
    }

    return QVariant();
}

QHash<int, QByteArray> UploadQueue::roleNames() const
{
    QHash<int, QByteArray> roles;
    roles[DestinationRole] = "destination";
    roles[RelativePathRole] = "relativePath";
    roles[FileNameRole] = "fileName";
    roles[SizeRole] = "size";
    roles[CommentRole] = "comment";
    roles[ActiveRole] = "active";
    roles[ProgressRole] = "progress";
    return roles;
}
