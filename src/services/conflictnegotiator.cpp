#include "conflictnegotiator.h"
#include "inotificationchannel.h"
#include "singletransfer.h"
#include "models/uploadstate.h"
#include "utils/logging.h"

#include <QDebug>
#include <QJsonObject>
#include <QRandomGenerator>
#include <limits>

namespace {

QDateTime parseExpiry(const QJsonValue &value)
{
    if (value.isString()) {
        QDateTime dt = QDateTime::fromString(value.toString(), Qt::ISODateWithMs);
        if (!dt.isValid()) {
            dt = QDateTime::fromString(value.toString(), Qt::ISODate);
        }
        return dt;
    }
    if (value.isDouble()) {
        return QDateTime::fromMSecsSinceEpoch(static_cast<qint64>(value.toDouble()));
    }
    return QDateTime();
}

} // namespace

std::optional<ResumeOffer> ResumeOffer::parse(const QJsonValue &payload, const QString &relativePath)
{
    if (!payload.isObject()) {
        return std::nullopt;
    }
    QJsonObject obj = payload.toObject();
    if (!obj.contains(relativePath)) {
        return std::nullopt;
    }

    QJsonValue entry = obj.value(relativePath);
    ResumeOffer offer;
    QJsonValue expires = obj.value("expires");

    if (entry.isObject()) {
        QJsonObject entryObj = entry.toObject();
        QJsonValue size = entryObj.value("size");
        if (!size.isDouble()) {
            return std::nullopt;
        }
        offer.size = static_cast<qint64>(size.toDouble());
        if (entryObj.contains("expires")) {
            expires = entryObj.value("expires");
        }
    } else if (entry.isDouble()) {
        offer.size = static_cast<qint64>(entry.toDouble());
    } else {
        return std::nullopt;
    }

    if (offer.size < 0) {
        return std::nullopt;
    }
    offer.expires = parseExpiry(expires);
    return offer;
}

qint64 ResumeOffer::remainingMs(const QDateTime &now) const
{
    if (!expires.isValid()) {
        return -1;
    }
    return qMax<qint64>(now.msecsTo(expires), 0);
}

ConflictNegotiator::ConflictNegotiator(INotificationChannel *channel, UploadState *state,
                                       QObject *parent)
    : QObject(parent)
    , channel_(channel)
    , state_(state)
    , expiryTimer_(new QTimer(this))
{
    expiryTimer_->setSingleShot(true);
    connect(expiryTimer_, &QTimer::timeout, this, &ConflictNegotiator::onOfferExpired);

    connect(channel_, &INotificationChannel::notificationReceived,
            this, &ConflictNegotiator::onNotification);
    connect(channel_, &INotificationChannel::ready,
            this, &ConflictNegotiator::onChannelReady);
    connect(channel_, &INotificationChannel::channelError,
            this, &ConflictNegotiator::onChannelError);
    connect(state_, &UploadState::progressChanged,
            this, &ConflictNegotiator::onProgressChanged);
}

ConflictNegotiator::~ConflictNegotiator()
{
    if (channel_) {
        disconnect(channel_, nullptr, this, nullptr);
    }
}

QString ConflictNegotiator::generateChannelId()
{
    quint32 value = QRandomGenerator::global()->generate();
    return QStringLiteral("upload-%1").arg(value, 8, 16, QLatin1Char('0'));
}

void ConflictNegotiator::prepareChannel()
{
    if (!channelId_.isEmpty()) {
        return;
    }
    channelId_ = generateChannelId();
    qDebug() << "ConflictNegotiator: Subscribing to channel" << channelId_;
    channel_->subscribe(channelId_);
}

void ConflictNegotiator::resetChannel()
{
    dismissOffer();
    if (channelId_.isEmpty()) {
        return;
    }
    qDebug() << "ConflictNegotiator: Closing channel" << channelId_;
    channel_->close();
    channelId_.clear();
}

bool ConflictNegotiator::isChannelReady() const
{
    return !channelId_.isEmpty() && channel_->isReady()
        && channel_->channelId() == channelId_;
}

void ConflictNegotiator::track(SingleTransfer *transfer)
{
    if (transfer_ == transfer) {
        return;
    }
    if (transfer_) {
        disconnect(transfer_, nullptr, this, nullptr);
    }
    transfer_ = transfer;

    if (pending_ && pending_->transfer != transfer_) {
        dismissOffer();
    }

    if (transfer_) {
        connect(transfer_, &SingleTransfer::finished, this, [this]() {
            if (pending_) {
                qDebug() << "ConflictNegotiator: Transfer finished before resume answer";
                dismissOffer();
            }
        });
    }
}

void ConflictNegotiator::respondToResume(bool accept)
{
    if (!pending_) {
        return;
    }
    PendingOffer offer = *pending_;
    pending_.reset();
    expiryTimer_->stop();

    if (!accept) {
        qDebug() << "ConflictNegotiator: Resume declined";
        return;
    }

    if (!offer.transfer || offer.transfer != transfer_ || offer.transfer->isFinished()
        || offer.transfer->requestId() != offer.requestId) {
        qDebug() << "ConflictNegotiator: Resume accepted too late, ignoring";
        return;
    }

    qDebug() << "ConflictNegotiator: Resume accepted at" << offer.size;
    offer.transfer->abortForResume(offer.size);
}

void ConflictNegotiator::onNotification(const QString &name, const QJsonValue &data)
{
    HFSUPLOAD_LOG_VERBOSE() << "ConflictNegotiator: Event" << name << data;

    if (name == QLatin1String(ResumableEvent)) {
        handleResumable(data);
    } else if (name == QLatin1String(StatusEvent)) {
        handleStatus(data);
    }
}

void ConflictNegotiator::handleResumable(const QJsonValue &data)
{
    if (!transfer_ || transfer_->isFinished() || transfer_->isResuming()) {
        return;
    }

    const PendingItem &item = transfer_->item();
    std::optional<ResumeOffer> offer = ResumeOffer::parse(data, item.relativePath);
    if (!offer) {
        return;
    }

    if (offer->size > item.size) {
        qWarning() << "ConflictNegotiator: Ignoring resume offer larger than file"
                   << item.relativePath << offer->size << ">" << item.size;
        return;
    }

    qint64 timeoutMs = offer->remainingMs(QDateTime::currentDateTimeUtc());
    if (timeoutMs == 0) {
        qDebug() << "ConflictNegotiator: Resume offer already expired for" << item.relativePath;
        return;
    }

    if (state_->partialBytes() >= offer->size) {
        qDebug() << "ConflictNegotiator: Already past offered size for" << item.relativePath;
        return;
    }

    dismissOffer();

    PendingOffer pending;
    pending.transfer = transfer_;
    pending.requestId = transfer_->requestId();
    pending.size = offer->size;
    pending_ = pending;

    if (timeoutMs > 0) {
        expiryTimer_->start(static_cast<int>(qMin<qint64>(timeoutMs, std::numeric_limits<int>::max())));
    }

    qDebug() << "ConflictNegotiator: Resume offer for" << item.relativePath
             << "at" << offer->size << "timeout" << timeoutMs;
    emit resumeConfirmationNeeded(item.fileName(), offer->size, item.size,
                                  qMax<qint64>(timeoutMs, 0));
}

void ConflictNegotiator::handleStatus(const QJsonValue &data)
{
    if (!transfer_ || transfer_->isFinished() || !data.isObject()) {
        return;
    }

    QJsonValue value = data.toObject().value(transfer_->item().relativePath);
    if (value.isUndefined() || value.isNull()) {
        return;
    }

    bool ok = value.isDouble();
    int status = value.toInt();
    if (!ok && value.isString()) {
        status = value.toString().toInt(&ok);
    }
    if (!ok) {
        qWarning() << "ConflictNegotiator: Malformed status override" << value;
        return;
    }

    transfer_->overrideStatus(status);
}

void ConflictNegotiator::onChannelReady(const QString &channelId)
{
    if (channelId != channelId_) {
        return;
    }
    emit channelReady(channelId);
}

void ConflictNegotiator::onChannelError(const QString &message)
{
    qWarning() << "ConflictNegotiator: Notification channel error:" << message;
}

void ConflictNegotiator::onProgressChanged(qint64 partialBytes, double fraction)
{
    Q_UNUSED(fraction)
    if (pending_ && partialBytes >= pending_->size) {
        qDebug() << "ConflictNegotiator: Upload passed offered size, dismissing prompt";
        dismissOffer();
    }
}

void ConflictNegotiator::onOfferExpired()
{
    if (pending_) {
        qDebug() << "ConflictNegotiator: Resume offer expired";
        dismissOffer();
    }
}

void ConflictNegotiator::dismissOffer()
{
    expiryTimer_->stop();
    if (!pending_) {
        return;
    }
    pending_.reset();
    emit resumeConfirmationDismissed();
}
