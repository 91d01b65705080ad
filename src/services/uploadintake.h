/**
 * @file uploadintake.h
 * @brief Turns dropped or picked files into PendingItems in the adding set.
 */

#ifndef UPLOADINTAKE_H
#define UPLOADINTAKE_H

#include <QList>
#include <QMimeDatabase>
#include <QObject>
#include <QStringList>
#include <QUrl>

#include "acceptpolicy.h"
#include "models/pendingitem.h"

class QMimeData;
class UploadState;

/**
 * @brief Entry point for files chosen by drag-and-drop or file/folder pickers.
 *
 * Every candidate is tested against the current AcceptPolicy. Rejected
 * files are dropped and filesRejected() reports how many, once per batch.
 * Accepted files go into the adding set of UploadState with no comment.
 * No network calls are made here.
 */
class UploadIntake : public QObject
{
    Q_OBJECT

public:
    explicit UploadIntake(UploadState *state, QObject *parent = nullptr);
    ~UploadIntake() override;

    void setAcceptPolicy(const AcceptPolicy &policy) { policy_ = policy; }
    [[nodiscard]] const AcceptPolicy &acceptPolicy() const { return policy_; }

    /**
     * @brief Adds individually picked files; each keeps its bare file name.
     * @return Number of items added to the adding set.
     */
    int addFiles(const QStringList &paths);

    /**
     * @brief Adds every file under @p dirPath recursively.
     *
     * Relative paths start with the folder's own name, e.g. "photos/2024/a.jpg".
     *
     * @return Number of items added to the adding set.
     */
    int addFolder(const QString &dirPath);

    /// @brief Adds local files and folders from a list of URLs.
    int addUrls(const QList<QUrl> &urls);

    /// @brief Adds the local URLs carried by a drop.
    int addFromMimeData(const QMimeData *mimeData);

    /// @brief Whether a drag carries anything this intake can take.
    [[nodiscard]] static bool canAccept(const QMimeData *mimeData);

    bool setComment(const QString &relativePath, const QString &comment);
    bool remove(const QString &relativePath);
    void clear();

    /// @brief Builds an item for a file on disk under the given relative path.
    [[nodiscard]] PendingItem makeItem(const QString &localPath, const QString &relativePath) const;

signals:
    /**
     * @brief Some candidates of a batch failed the accept policy.
     * @param count Number of files dropped.
     */
    void filesRejected(int count);

private:
    void collectFolder(const QString &dirPath, QList<PendingItem> &items) const;
    int accept(const QList<PendingItem> &candidates);

    UploadState *state_ = nullptr;
    AcceptPolicy policy_;
    QMimeDatabase mimeDb_;
};

#endif // UPLOADINTAKE_H
