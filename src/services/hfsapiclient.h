/**
 * @file hfsapiclient.h
 * @brief JSON RPC client for the server's folder API.
 *
 * Covers the two calls the upload panel needs besides the upload itself:
 * creating a folder and listing one.
 */

#ifndef HFSAPICLIENT_H
#define HFSAPICLIENT_H

#include <QHash>
#include <QJsonObject>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QObject>
#include <QStringList>

/**
 * @brief Capabilities the server presents for a folder.
 */
struct FolderProps {
    bool canUpload = false;  ///< Whether the current user may upload here
    QString accept;          ///< Raw accept pattern string, empty for anything
};

/**
 * @brief One entry of a folder listing.
 */
struct RemoteEntry {
    QString name;         ///< Entry name; folders end with '/'
    qint64 size = -1;     ///< Size in bytes, -1 for folders
};

/**
 * @brief Asynchronous client for `/~/api/` calls.
 *
 * Results are delivered through signals. Requests that fail to reach the
 * server at all emit connectionError(); other failures emit
 * operationFailed() with the operation name.
 */
class HfsApiClient : public QObject
{
    Q_OBJECT

public:
    static constexpr const char *ApiPrefix = "/~/api/";
    static constexpr int ConflictStatus = 409;
    /// Maximum characters to include from error response body
    static constexpr int ErrorResponsePreviewLength = 200;

    explicit HfsApiClient(QObject *parent = nullptr);
    ~HfsApiClient() override;

    /**
     * @brief Sets the server base URL, e.g. "http://localhost:8080".
     */
    void setBaseUrl(const QString &url);
    [[nodiscard]] QString baseUrl() const { return baseUrl_; }

    /**
     * @brief Creates folder @p name inside @p uri.
     *
     * Emits folderCreated() on success or folderExists() if the server
     * answers 409.
     */
    void createFolder(const QString &uri, const QString &name);

    /**
     * @brief Lists folder @p uri. Emits fileListReceived().
     */
    void getFileList(const QString &uri);

    /// @brief Parses a get_file_list response body.
    [[nodiscard]] static QList<RemoteEntry> parseEntries(const QJsonObject &json);
    [[nodiscard]] static FolderProps parseProps(const QJsonObject &json);

signals:
    void folderCreated(const QString &uri, const QString &name);
    void folderExists(const QString &name);
    void fileListReceived(const QString &uri, const QList<RemoteEntry> &entries,
                          const FolderProps &props);
    void operationFailed(const QString &operation, const QString &error);
    void connectionError(const QString &error);

private slots:
    void onReplyFinished(QNetworkReply *reply);

private:
    struct PendingOperation {
        QString name;
        QString uri;
        QString folderName;
    };

    [[nodiscard]] QNetworkRequest createRequest(const QString &endpoint) const;

    QNetworkAccessManager *networkManager_ = nullptr;
    QString baseUrl_;
    QHash<QNetworkReply *, PendingOperation> pendingOperations_;
};

Q_DECLARE_METATYPE(FolderProps)
Q_DECLARE_METATYPE(RemoteEntry)

#endif // HFSAPICLIENT_H
