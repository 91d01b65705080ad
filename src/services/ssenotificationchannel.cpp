#include "ssenotificationchannel.h"
#include "utils/logging.h"

#include <QJsonArray>
#include <QJsonDocument>
#include <QNetworkRequest>
#include <QUrlQuery>

QList<SseEvent> SseParser::feed(const QByteArray &chunk)
{
    QList<SseEvent> events;

    for (char c : chunk) {
        if (skipNextLf_) {
            skipNextLf_ = false;
            if (c == '\n') {
                continue;
            }
        }

        if (c == '\r' || c == '\n') {
            skipNextLf_ = (c == '\r');
            processLine(buffer_, &events);
            buffer_.clear();
            continue;
        }

        buffer_.append(c);
    }

    return events;
}

void SseParser::reset()
{
    buffer_.clear();
    skipNextLf_ = false;
    current_ = SseEvent();
    hasData_ = false;
}

void SseParser::processLine(const QByteArray &line, QList<SseEvent> *events)
{
    // Blank line dispatches the pending event
    if (line.isEmpty()) {
        if (hasData_) {
            events->append(current_);
        }
        current_ = SseEvent();
        hasData_ = false;
        return;
    }

    // Comment (often used as keep-alive)
    if (line.startsWith(':')) {
        return;
    }

    QByteArray field = line;
    QByteArray value;
    int colon = line.indexOf(':');
    if (colon >= 0) {
        field = line.left(colon);
        value = line.mid(colon + 1);
        if (value.startsWith(' ')) {
            value.remove(0, 1);
        }
    }

    if (field == "event") {
        current_.event = QString::fromUtf8(value);
    } else if (field == "data") {
        if (hasData_) {
            current_.data += '\n';
        }
        current_.data += QString::fromUtf8(value);
        hasData_ = true;
    } else if (field == "id") {
        current_.id = QString::fromUtf8(value);
    }
    // "retry" and unknown fields are ignored
}

SseNotificationChannel::SseNotificationChannel(QObject *parent)
    : INotificationChannel(parent)
    , networkManager_(new QNetworkAccessManager(this))
{
}

SseNotificationChannel::~SseNotificationChannel()
{
    if (reply_) {
        disconnect(reply_, nullptr, this, nullptr);
        reply_->abort();
    }
}

void SseNotificationChannel::setBaseUrl(const QUrl &url)
{
    baseUrl_ = url;
    QString path = baseUrl_.path();
    if (path.endsWith('/')) {
        path.chop(1);
        baseUrl_.setPath(path);
    }
}

void SseNotificationChannel::subscribe(const QString &channelId)
{
    close();

    channelId_ = channelId;

    QUrl url(baseUrl_);
    url.setPath(baseUrl_.path() + NotificationsEndpoint);
    QUrlQuery query;
    query.addQueryItem("channel", channelId);
    url.setQuery(query);

    QNetworkRequest request(url);
    request.setRawHeader("Accept", "text/event-stream");
    request.setRawHeader("Cache-Control", "no-cache");
    request.setAttribute(QNetworkRequest::CacheLoadControlAttribute, QNetworkRequest::AlwaysNetwork);

    qDebug() << "SseNotificationChannel: Subscribing to" << channelId;

    reply_ = networkManager_->get(request);
    connect(reply_, &QNetworkReply::metaDataChanged,
            this, &SseNotificationChannel::onMetaDataChanged);
    connect(reply_, &QNetworkReply::readyRead,
            this, &SseNotificationChannel::onReadyRead);
    connect(reply_, &QNetworkReply::finished,
            this, &SseNotificationChannel::onFinished);
}

void SseNotificationChannel::close()
{
    ready_ = false;
    parser_.reset();

    if (reply_) {
        QNetworkReply *reply = reply_;
        reply_ = nullptr;
        disconnect(reply, nullptr, this, nullptr);
        reply->abort();
        reply->deleteLater();
        qDebug() << "SseNotificationChannel: Closed" << channelId_;
    }
    channelId_.clear();
}

bool SseNotificationChannel::decodeEvent(const SseEvent &event, QString *name, QJsonValue *payload)
{
    // Wrapping in an array lets scalar payloads ("413", "true") parse too
    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson("[" + event.data.toUtf8() + "]", &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isArray() || doc.array().isEmpty()) {
        return false;
    }
    QJsonValue data = doc.array().first();

    if (!event.event.isEmpty() && event.event != QLatin1String("message")) {
        *name = event.event;
        *payload = data;
        return true;
    }

    if (!data.isArray()) {
        return false;
    }
    QJsonArray pair = data.toArray();
    if (pair.isEmpty() || !pair.at(0).isString()) {
        return false;
    }
    *name = pair.at(0).toString();
    *payload = pair.size() > 1 ? pair.at(1) : QJsonValue();
    return true;
}

void SseNotificationChannel::onMetaDataChanged()
{
    if (!reply_ || ready_) {
        return;
    }

    int status = reply_->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    if (status < 200 || status >= 300) {
        qWarning() << "SseNotificationChannel: Subscription refused with status" << status;
        return;
    }

    ready_ = true;
    qDebug() << "SseNotificationChannel: Channel ready" << channelId_;
    emit ready(channelId_);
}

void SseNotificationChannel::onReadyRead()
{
    if (!reply_) {
        return;
    }

    const QList<SseEvent> events = parser_.feed(reply_->readAll());
    for (const SseEvent &event : events) {
        QString name;
        QJsonValue payload;
        if (!decodeEvent(event, &name, &payload)) {
            qWarning() << "SseNotificationChannel: Ignoring malformed event" << event.event << event.data.left(200);
            continue;
        }
        HFSUPLOAD_LOG_VERBOSE() << "SseNotificationChannel: Event" << name << "on" << channelId_;
        emit notificationReceived(name, payload);
    }
}

void SseNotificationChannel::onFinished()
{
    if (!reply_) {
        return;
    }

    QNetworkReply *reply = reply_;
    reply_ = nullptr;
    reply->deleteLater();
    ready_ = false;

    QString message = reply->error() != QNetworkReply::NoError
        ? reply->errorString()
        : tr("Notification stream closed by server");
    qWarning() << "SseNotificationChannel:" << channelId_ << "-" << message;
    emit channelError(message);
}
