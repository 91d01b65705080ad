/**
 * @file ssenotificationchannel.h
 * @brief Notification channel over an HTTP Server-Sent Events stream.
 */

#ifndef SSENOTIFICATIONCHANNEL_H
#define SSENOTIFICATIONCHANNEL_H

#include <QByteArray>
#include <QList>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QPointer>
#include <QUrl>

#include "inotificationchannel.h"

/**
 * @brief One dispatched Server-Sent Events message.
 */
struct SseEvent {
    QString event;   ///< Value of the "event:" field, empty if absent
    QString data;    ///< "data:" lines joined with '\n'
    QString id;      ///< Value of the "id:" field, empty if absent
};

/**
 * @brief Incremental text/event-stream parser.
 *
 * Bytes may arrive split at any point, including inside a line or between
 * the CR and LF of a line break.
 */
class SseParser
{
public:
    /**
     * @brief Feeds a chunk of the stream.
     * @param chunk Raw bytes as received.
     * @return Events completed by this chunk, in stream order.
     */
    QList<SseEvent> feed(const QByteArray &chunk);

    void reset();

private:
    void processLine(const QByteArray &line, QList<SseEvent> *events);

    QByteArray buffer_;
    bool skipNextLf_ = false;
    SseEvent current_;
    bool hasData_ = false;
};

/**
 * @brief INotificationChannel implementation reading a Server-Sent Events stream.
 *
 * Subscribes with `GET <base>/~/api/get_notifications?channel=<id>`.
 * An event is decoded either from a named SSE event ("event: upload.status"
 * with a JSON "data:" payload) or from an unnamed one whose data is a JSON
 * array `[name, payload]`.
 */
class SseNotificationChannel : public INotificationChannel
{
    Q_OBJECT

public:
    static constexpr const char *NotificationsEndpoint = "/~/api/get_notifications";

    explicit SseNotificationChannel(QObject *parent = nullptr);
    ~SseNotificationChannel() override;

    void setBaseUrl(const QUrl &url);
    [[nodiscard]] QUrl baseUrl() const { return baseUrl_; }

    void subscribe(const QString &channelId) override;
    void close() override;
    [[nodiscard]] QString channelId() const override { return channelId_; }
    [[nodiscard]] bool isReady() const override { return ready_; }

    /**
     * @brief Decodes an SSE message into a notification name and payload.
     * @return False if the message carries no usable notification.
     */
    static bool decodeEvent(const SseEvent &event, QString *name, QJsonValue *payload);

private slots:
    void onMetaDataChanged();
    void onReadyRead();
    void onFinished();

private:
    QNetworkAccessManager *networkManager_ = nullptr;
    QUrl baseUrl_;
    QPointer<QNetworkReply> reply_;
    QString channelId_;
    bool ready_ = false;
    SseParser parser_;
};

#endif // SSENOTIFICATIONCHANNEL_H
