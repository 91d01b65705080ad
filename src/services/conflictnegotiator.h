/**
 * @file conflictnegotiator.h
 * @brief Reacts to server-pushed resume offers and status overrides.
 */

#ifndef CONFLICTNEGOTIATOR_H
#define CONFLICTNEGOTIATOR_H

#include <QDateTime>
#include <QJsonValue>
#include <QObject>
#include <QPointer>
#include <QString>
#include <QTimer>
#include <optional>

class INotificationChannel;
class SingleTransfer;
class UploadState;

/**
 * @brief A partial upload the server already holds for one relative path.
 */
struct ResumeOffer
{
    qint64 size = 0;
    QDateTime expires;  ///< Invalid when the server gave no expiry

    /**
     * @brief Reads the offer for @p relativePath out of an upload.resumable payload.
     *
     * The entry may be an object `{size, expires}` or a bare size. An
     * `expires` at the top level of the payload applies when the entry has
     * none. Expiry values are ISO-8601 strings or epoch milliseconds.
     *
     * @return The offer, or nullopt when the payload has none for this path.
     */
    [[nodiscard]] static std::optional<ResumeOffer> parse(const QJsonValue &payload,
                                                          const QString &relativePath);

    /// @brief Milliseconds until expiry from @p now; -1 when there is no expiry.
    [[nodiscard]] qint64 remainingMs(const QDateTime &now) const;
};

/**
 * @brief Owns the notification channel and applies its events to the active transfer.
 *
 * Channel ids are random and renewed each time the queue drains, so events
 * from an earlier cycle cannot reach a later one. Events are acted on only
 * for the transfer passed to track(), and only while its relative path is
 * the one named in the event; anything else is stale and ignored.
 *
 * upload.resumable: an offer larger than the file is dropped. Otherwise
 * resumeConfirmationNeeded() asks the user. The prompt is dismissed without
 * action when it times out, when the transfer already sent at least the
 * offered bytes, or when the transfer finishes. Acceptance aborts the
 * transfer as a resume handoff so the queue restarts the item at the offer.
 *
 * upload.status: the code becomes the transfer's effective status; error
 * codes abort it right away.
 */
class ConflictNegotiator : public QObject
{
    Q_OBJECT

public:
    static constexpr const char *ResumableEvent = "upload.resumable";
    static constexpr const char *StatusEvent = "upload.status";

    ConflictNegotiator(INotificationChannel *channel, UploadState *state,
                       QObject *parent = nullptr);
    ~ConflictNegotiator() override;

    /// @brief Subscribes with a fresh id if no channel is open yet.
    void prepareChannel();

    /// @brief Drops the current channel; the next prepareChannel() picks a new id.
    void resetChannel();

    [[nodiscard]] QString channelId() const { return channelId_; }
    [[nodiscard]] bool isChannelReady() const;

    /// @brief Sets the transfer events apply to. Passing nullptr stops tracking.
    void track(SingleTransfer *transfer);
    [[nodiscard]] SingleTransfer *trackedTransfer() const { return transfer_; }

    /// @brief True while a resume prompt is waiting for an answer.
    [[nodiscard]] bool hasPendingOffer() const { return pending_.has_value(); }
    [[nodiscard]] qint64 pendingOfferSize() const { return pending_ ? pending_->size : -1; }

    /**
     * @brief Answers the open resume prompt.
     *
     * Accepting is ignored if the transfer the offer was made for is no
     * longer the active one.
     */
    void respondToResume(bool accept);

    /// @brief Random id of the form "upload-xxxxxxxx".
    [[nodiscard]] static QString generateChannelId();

signals:
    void channelReady(const QString &channelId);

    /**
     * @brief Asks the user whether to continue a partial upload.
     * @param fileName File the offer is for.
     * @param offset Bytes the server already holds.
     * @param totalSize File size.
     * @param timeoutMs Time left to answer; 0 means no countdown.
     */
    void resumeConfirmationNeeded(const QString &fileName, qint64 offset,
                                  qint64 totalSize, qint64 timeoutMs);

    /// @brief The open prompt is no longer relevant and should close.
    void resumeConfirmationDismissed();

private slots:
    void onNotification(const QString &name, const QJsonValue &data);
    void onChannelReady(const QString &channelId);
    void onChannelError(const QString &message);
    void onProgressChanged(qint64 partialBytes, double fraction);
    void onOfferExpired();

private:
    struct PendingOffer
    {
        QPointer<SingleTransfer> transfer;
        quint64 requestId = 0;
        qint64 size = 0;
    };

    void handleResumable(const QJsonValue &data);
    void handleStatus(const QJsonValue &data);
    void dismissOffer();

    INotificationChannel *channel_ = nullptr;
    UploadState *state_ = nullptr;
    QString channelId_;
    QPointer<SingleTransfer> transfer_;
    std::optional<PendingOffer> pending_;
    QTimer *expiryTimer_ = nullptr;
};

#endif // CONFLICTNEGOTIATOR_H
