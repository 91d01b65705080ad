/**
 * @file uploadstate.h
 * @brief Shared aggregate holding the whole upload state.
 *
 * Every field the queue, the active transfer, the negotiator and the
 * estimator share lives here, behind one mutation API that keeps the
 * cross-field invariants intact.
 */

#ifndef UPLOADSTATE_H
#define UPLOADSTATE_H

#include <QList>
#include <QObject>
#include <QString>
#include <optional>

#include "models/pendingitem.h"

/**
 * @brief Single owned aggregate of upload queue, progress and counters.
 *
 * Invariants maintained by the mutators:
 * - a QueueEntry with no items is removed in the same call that emptied it
 * - a relative path appears at most once per destination
 * - progressFraction() is within [0,1] and is reset when no item is active
 *
 * All mutation happens on the thread owning this object (the GUI thread).
 */
class UploadState : public QObject
{
    Q_OBJECT

public:
    explicit UploadState(QObject *parent = nullptr);
    ~UploadState() override;

    /// @name Adding set (selected but not yet queued)
    /// @{
    [[nodiscard]] const QList<PendingItem> &adding() const { return adding_; }
    [[nodiscard]] qint64 addingBytes() const;

    /**
     * @brief Appends items to the adding set, skipping relative paths already present.
     * @return Number of items actually appended.
     */
    int addToAdding(const QList<PendingItem> &items);
    bool removeFromAdding(const QString &relativePath);
    bool setAddingComment(const QString &relativePath, const QString &comment);
    QList<PendingItem> takeAdding();
    void clearAdding();
    /// @}

    /// @name Queue
    /// @{
    [[nodiscard]] const QList<QueueEntry> &queue() const { return queue_; }
    [[nodiscard]] bool isQueueEmpty() const { return queue_.isEmpty(); }
    [[nodiscard]] int queuedItemCount() const;
    [[nodiscard]] qint64 queuedBytes() const;
    [[nodiscard]] int entryIndex(const QString &destination) const;

    /**
     * @brief Appends items to the entry for @p destination, creating it if needed.
     *
     * Items whose relative path already exists in that entry, or repeats
     * within @p items, are dropped.
     *
     * @return Number of items actually appended.
     */
    int appendToDestination(const QString &destination, const QList<PendingItem> &items);

    /**
     * @brief Removes one item, pruning its entry if it became empty.
     * @return True if the item was found.
     */
    bool removeFromDestination(const QString &destination, const QString &relativePath);

    void clearQueue();
    /// @}

    /// @name Active transfer
    /// @{
    [[nodiscard]] bool hasActive() const { return active_.has_value(); }
    [[nodiscard]] const std::optional<PendingItem> &active() const { return active_; }
    [[nodiscard]] QString activeDestination() const { return activeDestination_; }
    [[nodiscard]] bool isActive(const QString &destination, const QString &relativePath) const;

    /**
     * @brief Makes @p item the active transfer.
     * @param initialPartial Bytes already on the server; a resume restart
     *        seeds progress with its offset instead of starting from zero.
     */
    void setActive(const PendingItem &item, const QString &destination, qint64 initialPartial = 0);

    /// @brief Clears the active item and resets partial progress.
    void clearActive();

    [[nodiscard]] qint64 partialBytes() const { return partialBytes_; }

    /// @brief Fraction of the active file sent; meaningful only while hasActive().
    [[nodiscard]] double progressFraction() const { return progressFraction_; }

    void setProgress(qint64 partialBytes, double fraction);
    /// @}

    /// @name Policy flags
    /// @{
    [[nodiscard]] bool isPaused() const { return paused_; }
    void setPaused(bool paused);

    [[nodiscard]] bool skipExisting() const { return skipExisting_; }
    void setSkipExisting(bool skip);
    /// @}

    /// @name Counters
    /// @{
    [[nodiscard]] int doneCount() const { return summary_.doneCount; }
    [[nodiscard]] qint64 doneBytes() const { return summary_.doneBytes; }
    [[nodiscard]] int errorCount() const { return summary_.errorCount; }
    [[nodiscard]] UploadSummary summary() const { return summary_; }

    void recordSuccess(qint64 bytes);

    /**
     * @brief Increments the error counter.
     * @return The error count before this call (0 for the first error of a batch).
     */
    int recordError();

    void resetCounters();
    /// @}

    /// @name Estimates
    /// @{
    [[nodiscard]] double speed() const { return speed_; }
    [[nodiscard]] qint64 etaSeconds() const { return etaSeconds_; }
    void setEstimate(double bytesPerSecond, qint64 etaSeconds);
    /// @}

signals:
    void addingChanged();
    void queueChanged();
    void activeChanged();
    void progressChanged(qint64 partialBytes, double fraction);
    void pausedChanged(bool paused);
    void skipExistingChanged(bool skip);
    void countersChanged();
    void estimateChanged(double bytesPerSecond, qint64 etaSeconds);

private:
    QList<PendingItem> adding_;
    QList<QueueEntry> queue_;

    std::optional<PendingItem> active_;
    QString activeDestination_;
    qint64 partialBytes_ = 0;
    double progressFraction_ = 0.0;

    bool paused_ = false;
    bool skipExisting_ = false;

    UploadSummary summary_;

    double speed_ = 0.0;
    qint64 etaSeconds_ = 0;
};

#endif // UPLOADSTATE_H
