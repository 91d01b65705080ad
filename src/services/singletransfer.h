/**
 * @file singletransfer.h
 * @brief One resumable HTTP upload of a single file.
 */

#ifndef SINGLETRANSFER_H
#define SINGLETRANSFER_H

#include <QObject>
#include <QPointer>
#include <QString>

#include "models/pendingitem.h"
#include "iuploadtransport.h"

class UploadState;

/**
 * @brief Executes the upload of one PendingItem, optionally from a byte offset.
 *
 * The transfer posts the file tail starting at resumeOffset() and publishes
 * progress into UploadState as `partialBytes = sentThisRequest + resumeOffset`
 * so progress stays continuous across a resume restart. When the transport
 * reports completion the status is classified and applied to the counters:
 * - below 400 (other than 0 and 409): success, doneCount and doneBytes grow
 * - 409 Conflict (skip-existing): no counter changes
 * - 413, any other status from 400 up, or a network failure: errorCount grows;
 *   only the first error since the counters were reset emits uploadFailed()
 * - 0 (aborted by the client): no counter changes
 *
 * An error status (400 and up) pushed out-of-band through overrideStatus()
 * aborts the request and replaces the transport's own status when
 * classifying; lower codes are ignored.
 *
 * A transfer is single-use: after finished() it must be discarded. A resume
 * handoff aborts this transfer and the owner starts a new one for the same
 * item at resumeTarget().
 */
class SingleTransfer : public QObject
{
    Q_OBJECT

public:
    enum class Outcome {
        Succeeded,  ///< Stored by the server
        Skipped,    ///< Server declined because the file exists (skip-existing)
        Failed,     ///< HTTP error or network failure
        Aborted     ///< Aborted by the client, no counters touched
    };
    Q_ENUM(Outcome)

    SingleTransfer(IUploadTransport *transport,
                   UploadState *state,
                   const PendingItem &item,
                   const QString &destination,
                   qint64 resumeOffset = 0,
                   QObject *parent = nullptr);
    ~SingleTransfer() override;

    /**
     * @brief Issues the upload request.
     * @param channelId Notification channel id sent with the request.
     */
    void start(const QString &channelId);

    /**
     * @brief Aborts the request; the owner advances past the item afterwards.
     */
    void abort();

    /**
     * @brief Aborts the request so the same item can restart at @p offset.
     */
    void abortForResume(qint64 offset);

    /**
     * @brief Aborts with an error status that replaces the transport's at completion.
     *
     * Codes below 400 are ignored.
     * @param status Status pushed by the server for this item.
     */
    void overrideStatus(int status);

    /// @brief Maps an effective status to its outcome.
    [[nodiscard]] static Outcome classify(int status);

    /**
     * @brief Builds the request for an item.
     * @return Request with channel, resume, comment and (when set) skipExisting=1.
     */
    [[nodiscard]] static UploadRequest buildRequest(const PendingItem &item,
                                                    const QString &destination,
                                                    const QString &channelId,
                                                    qint64 resumeOffset,
                                                    bool skipExisting);

    [[nodiscard]] const PendingItem &item() const { return item_; }
    [[nodiscard]] QString destination() const { return destination_; }
    [[nodiscard]] qint64 resumeOffset() const { return resumeOffset_; }
    [[nodiscard]] quint64 requestId() const { return requestId_; }
    [[nodiscard]] bool isStarted() const { return started_; }
    [[nodiscard]] bool isFinished() const { return finished_; }

    /// @brief True once a resume handoff was requested for this transfer.
    [[nodiscard]] bool isResuming() const { return resumeTarget_ >= 0; }
    [[nodiscard]] qint64 resumeTarget() const { return resumeTarget_; }

signals:
    /**
     * @brief Emitted with each progress step.
     * @param bytes Bytes sent since the previous step.
     */
    void bytesSent(qint64 bytes);

    /**
     * @brief Emitted for the first failure since the counters were reset.
     * @param fileName Name of the file that failed.
     * @param status Effective status (413 for too large, -1 for network failure).
     */
    void uploadFailed(const QString &fileName, int status);

    /**
     * @brief Emitted once, when the request reached a terminal state.
     * @param outcome Classified outcome.
     * @param status Effective status.
     */
    void finished(SingleTransfer::Outcome outcome, int status);

private slots:
    void onUploadProgress(quint64 requestId, qint64 bytesSent, qint64 bytesTotal);
    void onUploadFinished(quint64 requestId, int status);

private:
    void complete(int transportStatus);

    QPointer<IUploadTransport> transport_;
    UploadState *state_ = nullptr;
    PendingItem item_;
    QString destination_;
    qint64 resumeOffset_ = 0;

    quint64 requestId_ = 0;
    qint64 lastSent_ = 0;
    int overrideStatus_ = 0;
    qint64 resumeTarget_ = -1;
    bool started_ = false;
    bool finished_ = false;
    bool cancelled_ = false;
};

#endif // SINGLETRANSFER_H
