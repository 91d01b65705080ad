/**
 * @file httpuploadtransport.h
 * @brief Upload transport posting multipart bodies over HTTP.
 */

#ifndef HTTPUPLOADTRANSPORT_H
#define HTTPUPLOADTRANSPORT_H

#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QPointer>
#include <QUrl>

#include "iuploadtransport.h"

/**
 * @brief IUploadTransport implementation built on QNetworkAccessManager.
 *
 * Each request is sent as `POST <base><destination>?<query>` with a
 * single-part multipart/form-data body named "file" whose filename is the
 * item's relative path and whose content is the file from the requested
 * offset to its end.
 *
 * @par Example usage:
 * @code
 * HttpUploadTransport *transport = new HttpUploadTransport(this);
 * transport->setBaseUrl(QUrl("http://nas.local:8080"));
 * connect(transport, &IUploadTransport::uploadFinished, this, &MyClass::onFinished);
 * @endcode
 */
class HttpUploadTransport : public IUploadTransport
{
    Q_OBJECT

public:
    explicit HttpUploadTransport(QObject *parent = nullptr);
    ~HttpUploadTransport() override;

    void setBaseUrl(const QUrl &url);
    [[nodiscard]] QUrl baseUrl() const { return baseUrl_; }

    quint64 post(const UploadRequest &request) override;
    void abort(quint64 requestId) override;
    [[nodiscard]] bool isBusy() const override { return currentId_ != 0; }

    /**
     * @brief Resolves a request's destination and query against a base URL.
     * @param base Server root, e.g. "http://host:8080".
     * @param request The request to address.
     * @return The full upload URL.
     */
    static QUrl buildUrl(const QUrl &base, const UploadRequest &request);

private slots:
    void onReplyFinished(QNetworkReply *reply);
    void onUploadProgress(qint64 bytesSent, qint64 bytesTotal);

private:
    void failLater(quint64 requestId);

    QNetworkAccessManager *networkManager_ = nullptr;
    QUrl baseUrl_;

    QPointer<QNetworkReply> reply_;
    quint64 currentId_ = 0;
    quint64 nextId_ = 1;
    bool aborting_ = false;
};

#endif // HTTPUPLOADTRANSPORT_H
