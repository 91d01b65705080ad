/**
 * @file uploadqueue.h
 * @brief Per-destination upload queue and the scheduler that drains it.
 */

#ifndef UPLOADQUEUE_H
#define UPLOADQUEUE_H

#include <QAbstractListModel>
#include <QPointer>
#include <QQueue>
#include <QTimer>
#include <functional>

#include "models/pendingitem.h"
#include "services/acceptpolicy.h"
#include "services/singletransfer.h"

class ConflictNegotiator;
class INotificationChannel;
class IUploadTransport;
class TransferEstimator;
class UploadState;

/**
 * @brief Queues files per destination and uploads them one at a time.
 *
 * Destinations are drained in the order their first file was queued, and
 * files within a destination in enqueue order. Whenever the state changes
 * the scheduler looks at the head entry and starts a SingleTransfer for its
 * first item, provided nothing is in flight and the queue is not paused.
 * The first request of a cycle waits up to ChannelWaitMs for the
 * notification channel so resume offers can reach it.
 *
 * Completion (success, skip or error) removes the item and moves on. An
 * abort that is a resume handoff restarts the same item at the offered
 * offset instead. When the queue drains, the notification channel is
 * renewed, a listing refresh is requested RefreshDebounceMs later, and if
 * the transfer UI is hidden uploadConcluded() carries the summary; the
 * counters reset once the host calls acknowledgeSummary().
 *
 * The model exposes one row per queued item across all destinations.
 */
class UploadQueue : public QAbstractListModel
{
    Q_OBJECT

public:
    static constexpr int RefreshDebounceMs = 500;
    static constexpr int ChannelWaitMs = 3000;

    enum Roles {
        DestinationRole = Qt::UserRole + 1,
        RelativePathRole,
        FileNameRole,
        SizeRole,
        CommentRole,
        ActiveRole,
        ProgressRole
    };

    UploadQueue(UploadState *state,
                IUploadTransport *transport,
                INotificationChannel *channel,
                QObject *parent = nullptr);
    ~UploadQueue() override;

    [[nodiscard]] UploadState *state() const { return state_; }
    [[nodiscard]] ConflictNegotiator *negotiator() const { return negotiator_; }
    [[nodiscard]] TransferEstimator *estimator() const { return estimator_; }
    [[nodiscard]] SingleTransfer *activeTransfer() const { return activeTransfer_; }

    void setAcceptPolicy(const AcceptPolicy &policy) { policy_ = policy; }
    [[nodiscard]] const AcceptPolicy &acceptPolicy() const { return policy_; }

    /**
     * @brief Queues @p items for @p destination.
     *
     * Items refused by the accept policy are dropped and reported through
     * filesRejected(). Relative paths already queued for the destination
     * are skipped.
     */
    void enqueue(const QList<PendingItem> &items, const QString &destination);

    /**
     * @brief Moves the whole adding set into the queue for @p destination.
     * @return Number of items queued.
     */
    int commitAdding(const QString &destination);

    void togglePause();

    /// @brief Pausing never interrupts the file already being sent.
    void setPaused(bool paused);
    [[nodiscard]] bool isPaused() const;

    void setSkipExisting(bool skip);

    /// @brief Drops every queued item and aborts the one in flight.
    void clear();

    /**
     * @brief Removes one queued item; for the active item this aborts it.
     * @return True if the item was queued.
     */
    bool removeFromQueue(const QString &destination, const QString &relativePath);

    /**
     * @brief Tells the queue whether the user is looking at the transfer UI.
     *
     * Showing it while the queue is empty starts a fresh tally. Hiding it
     * requests a listing refresh if uploads finished while it was shown.
     */
    void setTransferUiVisible(bool visible);
    [[nodiscard]] bool isTransferUiVisible() const { return transferUiVisible_; }

    /// @brief Resets the cumulative counters once their summary was presented.
    void acknowledgeSummary();

    /// @brief True while anything is queued or being sent.
    [[nodiscard]] bool hasPendingUploads() const;

    // QAbstractListModel interface
    [[nodiscard]] int rowCount(const QModelIndex &parent = QModelIndex()) const override;
    [[nodiscard]] QVariant data(const QModelIndex &index, int role = Qt::DisplayRole) const override;
    [[nodiscard]] QHash<int, QByteArray> roleNames() const override;

    /**
     * @brief Runs deferred scheduling work now.
     *
     * Scheduling normally runs on the next event loop pass; tests call this
     * to drive it synchronously.
     */
    void flushEventQueue();

signals:
    void filesRejected(int count);
    void transferStarted(const QString &destination, const QString &relativePath, qint64 resumeOffset);
    void transferFinished(const QString &relativePath, SingleTransfer::Outcome outcome);
    void uploadFailed(const QString &fileName, int status);
    void queueDrained();
    void remoteRefreshRequested(const QString &destination);
    void uploadConcluded(const UploadSummary &summary);
    void pauseNoticeNeeded();

private slots:
    void onQueueChanged();
    void onActiveChanged();
    void onProgressChanged(qint64 partialBytes, double fraction);
    void onChannelReady();
    void onChannelWaitTimeout();
    void onRefreshTimeout();

private:
    struct Row {
        QString destination;
        PendingItem item;
    };

    void scheduleProcessNext();
    void processEventQueue();
    void processNext();

    void startTransfer(const PendingItem &item, const QString &destination, qint64 resumeOffset);
    void onTransferFinished(SingleTransfer *transfer, SingleTransfer::Outcome outcome);
    void handleDrained(const QString &lastDestination);
    void renewCycleIfIdle();
    [[nodiscard]] int activeRow() const;

    UploadState *state_ = nullptr;
    IUploadTransport *transport_ = nullptr;
    ConflictNegotiator *negotiator_ = nullptr;
    TransferEstimator *estimator_ = nullptr;
    AcceptPolicy policy_;

    QPointer<SingleTransfer> activeTransfer_;
    bool cancelRequested_ = false;

    QList<Row> rows_;

    QTimer *channelWaitTimer_ = nullptr;
    bool channelWaitExpired_ = false;

    QTimer *refreshTimer_ = nullptr;
    QString refreshDestination_;

    bool transferUiVisible_ = false;
    bool remoteDirty_ = false;
    QString lastFinishedDestination_;
    bool pauseNoticeShown_ = false;

    // Deferred scheduling
    QQueue<std::function<void()>> eventQueue_;
    bool eventProcessingScheduled_ = false;
    bool processingEvents_ = false;
};

#endif // UPLOADQUEUE_H
