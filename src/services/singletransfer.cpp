#include "singletransfer.h"
#include "models/uploadstate.h"
#include "utils/logging.h"

#include <QTimer>

SingleTransfer::SingleTransfer(IUploadTransport *transport,
                               UploadState *state,
                               const PendingItem &item,
                               const QString &destination,
                               qint64 resumeOffset,
                               QObject *parent)
    : QObject(parent)
    , transport_(transport)
    , state_(state)
    , item_(item)
    , destination_(destination)
    , resumeOffset_(qBound<qint64>(0, resumeOffset, item.size))
{
}

SingleTransfer::~SingleTransfer()
{
    if (transport_) {
        disconnect(transport_, nullptr, this, nullptr);
    }
}

UploadRequest SingleTransfer::buildRequest(const PendingItem &item,
                                           const QString &destination,
                                           const QString &channelId,
                                           qint64 resumeOffset,
                                           bool skipExisting)
{
    UploadRequest request;
    request.destination = destination;
    request.localPath = item.localPath;
    request.offset = resumeOffset;
    request.partName = item.relativePath;

    request.query.addQueryItem("channel", channelId);
    request.query.addQueryItem("resume", QString::number(resumeOffset));
    request.query.addQueryItem("comment", item.comment);
    if (skipExisting) {
        request.query.addQueryItem("skipExisting", "1");
    }
    return request;
}

SingleTransfer::Outcome SingleTransfer::classify(int status)
{
    if (status == IUploadTransport::AbortedStatus) {
        return Outcome::Aborted;
    }
    if (status == IUploadTransport::ConflictStatus) {
        return Outcome::Skipped;
    }
    if (status < 0 || status >= 400) {
        return Outcome::Failed;
    }
    return Outcome::Succeeded;
}

void SingleTransfer::start(const QString &channelId)
{
    if (started_) {
        qWarning() << "SingleTransfer: start called twice for" << item_.relativePath;
        return;
    }
    started_ = true;

    state_->setProgress(resumeOffset_, item_.size > 0
                            ? static_cast<double>(resumeOffset_) / static_cast<double>(item_.size)
                            : 0.0);

    if (!transport_) {
        QTimer::singleShot(0, this, [this]() { complete(IUploadTransport::NetworkFailureStatus); });
        return;
    }

    connect(transport_, &IUploadTransport::uploadProgress,
            this, &SingleTransfer::onUploadProgress);
    connect(transport_, &IUploadTransport::uploadFinished,
            this, &SingleTransfer::onUploadFinished);

    UploadRequest request = buildRequest(item_, destination_, channelId,
                                         resumeOffset_, state_->skipExisting());
    requestId_ = transport_->post(request);

    if (requestId_ == 0) {
        qWarning() << "SingleTransfer: Transport refused request for" << item_.relativePath;
        QTimer::singleShot(0, this, [this]() { complete(IUploadTransport::NetworkFailureStatus); });
        return;
    }

    qDebug() << "SingleTransfer: Started" << item_.relativePath << "to" << destination_
             << "request" << requestId_ << "resume" << resumeOffset_;
}

void SingleTransfer::abort()
{
    if (finished_) {
        return;
    }
    if (!transport_ || requestId_ == 0) {
        // No request in flight; the pending deferred completion reports the abort
        cancelled_ = true;
        return;
    }
    qDebug() << "SingleTransfer: Aborting" << item_.relativePath;
    transport_->abort(requestId_);
}

void SingleTransfer::abortForResume(qint64 offset)
{
    if (finished_) {
        return;
    }
    resumeTarget_ = qBound<qint64>(0, offset, item_.size);
    qDebug() << "SingleTransfer: Handing off" << item_.relativePath << "to resume at" << resumeTarget_;
    abort();
}

void SingleTransfer::overrideStatus(int status)
{
    if (finished_) {
        return;
    }
    if (status < 400) {
        qDebug() << "SingleTransfer: Ignoring non-error status override" << status << "for" << item_.relativePath;
        return;
    }
    overrideStatus_ = status;
    qDebug() << "SingleTransfer: Status for" << item_.relativePath << "overridden to" << status;
    abort();
}

void SingleTransfer::onUploadProgress(quint64 requestId, qint64 bytesSent, qint64 bytesTotal)
{
    if (requestId != requestId_ || finished_) {
        return;
    }

    qint64 delta = bytesSent - lastSent_;
    lastSent_ = bytesSent;

    qint64 partial = bytesSent + resumeOffset_;
    double fraction = 0.0;
    if (item_.size > 0) {
        fraction = static_cast<double>(partial) / static_cast<double>(item_.size);
    } else if (bytesTotal > 0) {
        fraction = static_cast<double>(bytesSent) / static_cast<double>(bytesTotal);
    }

    state_->setProgress(partial, fraction);
    if (delta > 0) {
        emit bytesSent(delta);
    }
}

void SingleTransfer::onUploadFinished(quint64 requestId, int status)
{
    if (requestId != requestId_) {
        return;
    }
    complete(status);
}

void SingleTransfer::complete(int transportStatus)
{
    if (finished_) {
        return;
    }
    finished_ = true;

    if (transport_) {
        disconnect(transport_, nullptr, this, nullptr);
    }

    if (cancelled_) {
        transportStatus = IUploadTransport::AbortedStatus;
    }
    int status = overrideStatus_ != 0 ? overrideStatus_ : transportStatus;
    Outcome outcome = classify(status);

    switch (outcome) {
    case Outcome::Succeeded:
        state_->recordSuccess(item_.size);
        break;
    case Outcome::Failed:
        if (state_->recordError() == 0) {
            emit uploadFailed(item_.fileName(), status);
        } else {
            qDebug() << "SingleTransfer: Further failure counted silently:" << item_.relativePath << status;
        }
        break;
    case Outcome::Skipped:
    case Outcome::Aborted:
        break;
    }

    qDebug() << "SingleTransfer: Finished" << item_.relativePath << "status" << status << outcome;
    emit finished(outcome, status);
}
