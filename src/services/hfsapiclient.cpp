#include "hfsapiclient.h"

#include <QDebug>
#include <QJsonArray>
#include <QJsonDocument>
#include <QUrlQuery>

HfsApiClient::HfsApiClient(QObject *parent)
    : QObject(parent)
    , networkManager_(new QNetworkAccessManager(this))
{
    qRegisterMetaType<FolderProps>();
    qRegisterMetaType<QList<RemoteEntry>>();
    connect(networkManager_, &QNetworkAccessManager::finished,
            this, &HfsApiClient::onReplyFinished);
}

HfsApiClient::~HfsApiClient() = default;

void HfsApiClient::setBaseUrl(const QString &url)
{
    baseUrl_ = url;
    if (baseUrl_.endsWith('/')) {
        baseUrl_.chop(1);
    }
    if (!baseUrl_.startsWith("http://") && !baseUrl_.startsWith("https://")) {
        baseUrl_ = "http://" + baseUrl_;
    }
}

QNetworkRequest HfsApiClient::createRequest(const QString &endpoint) const
{
    QUrl url(baseUrl_ + QLatin1String(ApiPrefix) + endpoint);
    QNetworkRequest request(url);
    request.setHeader(QNetworkRequest::ContentTypeHeader, "application/json");
    return request;
}

void HfsApiClient::createFolder(const QString &uri, const QString &name)
{
    QJsonObject body;
    body["uri"] = uri;
    body["name"] = name;

    QNetworkReply *reply = networkManager_->post(createRequest("create_folder"),
                                                 QJsonDocument(body).toJson(QJsonDocument::Compact));
    pendingOperations_[reply] = PendingOperation{"create_folder", uri, name};
}

void HfsApiClient::getFileList(const QString &uri)
{
    QNetworkRequest request = createRequest("get_file_list");
    QUrl url = request.url();
    QUrlQuery query;
    query.addQueryItem("uri", uri);
    url.setQuery(query);
    request.setUrl(url);

    QNetworkReply *reply = networkManager_->get(request);
    pendingOperations_[reply] = PendingOperation{"get_file_list", uri, QString()};
}

QList<RemoteEntry> HfsApiClient::parseEntries(const QJsonObject &json)
{
    QList<RemoteEntry> entries;
    const QJsonArray list = json.value("list").toArray();
    for (const QJsonValue &value : list) {
        QJsonObject obj = value.toObject();
        RemoteEntry entry;
        entry.name = obj.value("n").toString();
        if (entry.name.isEmpty()) {
            continue;
        }
        if (obj.contains("s")) {
            entry.size = static_cast<qint64>(obj.value("s").toDouble());
        }
        entries.append(entry);
    }
    return entries;
}

FolderProps HfsApiClient::parseProps(const QJsonObject &json)
{
    QJsonObject props = json.value("props").isObject() ? json.value("props").toObject() : json;
    FolderProps result;
    result.canUpload = props.value("can_upload").toBool();
    QJsonValue accept = props.value("accept");
    if (accept.isString()) {
        result.accept = accept.toString();
    }
    return result;
}

void HfsApiClient::onReplyFinished(QNetworkReply *reply)
{
    reply->deleteLater();

    if (!pendingOperations_.contains(reply)) {
        return;
    }
    PendingOperation operation = pendingOperations_.take(reply);

    if (reply->error() == QNetworkReply::ConnectionRefusedError ||
        reply->error() == QNetworkReply::HostNotFoundError ||
        reply->error() == QNetworkReply::TimeoutError) {
        emit connectionError(reply->errorString());
        return;
    }

    int status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();

    if (operation.name == "create_folder" && status == ConflictStatus) {
        qDebug() << "HfsApiClient: Folder already exists:" << operation.folderName;
        emit folderExists(operation.folderName);
        return;
    }

    if (reply->error() != QNetworkReply::NoError) {
        QString errorMsg = reply->errorString();
        QByteArray errorData = reply->readAll();
        if (!errorData.isEmpty()) {
            errorMsg += " - Response: " + QString::fromUtf8(errorData).left(ErrorResponsePreviewLength);
        }
        qDebug() << "HfsApiClient: Error for" << operation.name << ":" << errorMsg;
        emit operationFailed(operation.name, errorMsg);
        return;
    }

    if (operation.name == "create_folder") {
        qDebug() << "HfsApiClient: Created folder" << operation.folderName << "in" << operation.uri;
        emit folderCreated(operation.uri, operation.folderName);
        return;
    }

    QJsonDocument doc = QJsonDocument::fromJson(reply->readAll());
    if (!doc.isObject()) {
        emit operationFailed(operation.name, "Invalid JSON response");
        return;
    }

    QJsonObject json = doc.object();
    emit fileListReceived(operation.uri, parseEntries(json), parseProps(json));
}
