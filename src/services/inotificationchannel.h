/**
 * @file inotificationchannel.h
 * @brief Interface for the server-push notification channel.
 */

#ifndef INOTIFICATIONCHANNEL_H
#define INOTIFICATIONCHANNEL_H

#include <QJsonValue>
#include <QObject>
#include <QString>

/**
 * @brief Abstract server-to-client event stream keyed by a channel id.
 *
 * The client picks the channel id and passes it both here and with each
 * upload request, so the server can address out-of-band events about that
 * upload to this client.
 */
class INotificationChannel : public QObject
{
    Q_OBJECT

public:
    explicit INotificationChannel(QObject *parent = nullptr) : QObject(parent) {}
    ~INotificationChannel() override = default;

    /**
     * @brief Opens the stream for @p channelId, closing any previous one.
     *
     * ready() is emitted once the server accepted the subscription.
     */
    virtual void subscribe(const QString &channelId) = 0;

    /**
     * @brief Closes the stream. No further events are delivered.
     */
    virtual void close() = 0;

    [[nodiscard]] virtual QString channelId() const = 0;

    /// @brief True once the current subscription has been accepted by the server.
    [[nodiscard]] virtual bool isReady() const = 0;

signals:
    /**
     * @brief Emitted when the subscription is established.
     * @param channelId The subscribed channel.
     */
    void ready(const QString &channelId);

    /**
     * @brief Emitted for each event pushed by the server.
     * @param name Event name, e.g. "upload.resumable".
     * @param data Event payload.
     */
    void notificationReceived(const QString &name, const QJsonValue &data);

    /**
     * @brief Emitted when the stream fails or is closed by the server.
     * @param message Error description.
     */
    void channelError(const QString &message);
};

#endif // INOTIFICATIONCHANNEL_H
