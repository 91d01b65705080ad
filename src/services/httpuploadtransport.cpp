#include "httpuploadtransport.h"
#include "fileslicedevice.h"
#include "utils/logging.h"

#include <QHttpMultiPart>
#include <QTimer>

HttpUploadTransport::HttpUploadTransport(QObject *parent)
    : IUploadTransport(parent)
    , networkManager_(new QNetworkAccessManager(this))
{
    connect(networkManager_, &QNetworkAccessManager::finished,
            this, &HttpUploadTransport::onReplyFinished);
}

HttpUploadTransport::~HttpUploadTransport()
{
    // Disconnect before members go away; the manager's own destructor
    // would otherwise deliver finished() for the aborted reply to us.
    disconnect(networkManager_, nullptr, this, nullptr);
    if (reply_) {
        reply_->abort();
    }
}

void HttpUploadTransport::setBaseUrl(const QUrl &url)
{
    baseUrl_ = url;
    QString path = baseUrl_.path();
    if (path.endsWith('/')) {
        path.chop(1);
        baseUrl_.setPath(path);
    }
}

QUrl HttpUploadTransport::buildUrl(const QUrl &base, const UploadRequest &request)
{
    QUrl url(base);
    QString destination = request.destination;
    if (!destination.startsWith('/')) {
        destination.prepend('/');
    }
    url.setPath(base.path() + destination);
    url.setQuery(request.query);
    return url;
}

quint64 HttpUploadTransport::post(const UploadRequest &request)
{
    if (isBusy()) {
        qWarning() << "HttpUploadTransport: post refused, request" << currentId_ << "still in flight";
        return 0;
    }

    quint64 requestId = nextId_++;
    currentId_ = requestId;
    aborting_ = false;

    auto *body = new FileSliceDevice(request.localPath, request.offset);
    if (!body->open(QIODevice::ReadOnly)) {
        qWarning() << "HttpUploadTransport: Cannot read" << request.localPath << "-" << body->errorString();
        delete body;
        failLater(requestId);
        return requestId;
    }

    auto *multiPart = new QHttpMultiPart(QHttpMultiPart::FormDataType);

    QString partName = request.partName;
    partName.replace('"', QLatin1String("%22"));

    QHttpPart filePart;
    filePart.setRawHeader("Content-Disposition",
                          "form-data; name=\"file\"; filename=\"" + partName.toUtf8() + "\"");
    filePart.setHeader(QNetworkRequest::ContentTypeHeader, "application/octet-stream");
    filePart.setBodyDevice(body);
    body->setParent(multiPart);
    multiPart->append(filePart);

    QUrl url = buildUrl(baseUrl_, request);
    QNetworkRequest networkRequest(url);

    qDebug() << "HttpUploadTransport: POST" << url.toString(QUrl::RemoveUserInfo)
             << "bytes" << body->size() << "from offset" << request.offset;

    reply_ = networkManager_->post(networkRequest, multiPart);
    multiPart->setParent(reply_);

    connect(reply_, &QNetworkReply::uploadProgress,
            this, &HttpUploadTransport::onUploadProgress);

    return requestId;
}

void HttpUploadTransport::abort(quint64 requestId)
{
    if (requestId == 0 || requestId != currentId_) {
        return;
    }

    aborting_ = true;
    if (reply_) {
        reply_->abort();
    }
}

void HttpUploadTransport::failLater(quint64 requestId)
{
    QTimer::singleShot(0, this, [this, requestId]() {
        if (currentId_ != requestId) {
            return;
        }
        currentId_ = 0;
        emit uploadFinished(requestId, aborting_ ? AbortedStatus : NetworkFailureStatus);
    });
}

void HttpUploadTransport::onUploadProgress(qint64 bytesSent, qint64 bytesTotal)
{
    if (sender() != reply_.data() || currentId_ == 0) {
        return;
    }
    HFSUPLOAD_LOG_REQUEST(currentId_) << "HttpUploadTransport: progress" << bytesSent << "/" << bytesTotal;
    emit uploadProgress(currentId_, bytesSent, bytesTotal);
}

void HttpUploadTransport::onReplyFinished(QNetworkReply *reply)
{
    reply->deleteLater();

    if (reply != reply_.data()) {
        return;
    }

    quint64 requestId = currentId_;
    reply_ = nullptr;
    currentId_ = 0;

    int status = NetworkFailureStatus;
    QVariant statusAttribute = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute);

    if (aborting_ || reply->error() == QNetworkReply::OperationCanceledError) {
        status = AbortedStatus;
    } else if (statusAttribute.isValid()) {
        status = statusAttribute.toInt();
    } else {
        qWarning() << "HttpUploadTransport: Request" << requestId << "failed without HTTP status -"
                   << reply->errorString();
    }

    aborting_ = false;
    qDebug() << "HttpUploadTransport: Request" << requestId << "finished with status" << status;
    emit uploadFinished(requestId, status);
}
