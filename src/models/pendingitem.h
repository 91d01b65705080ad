/**
 * @file pendingitem.h
 * @brief Value types describing files waiting to be uploaded.
 */

#ifndef PENDINGITEM_H
#define PENDINGITEM_H

#include <QList>
#include <QMetaType>
#include <QString>

/**
 * @brief A local file selected for upload, with an optional comment.
 *
 * Identity within a destination is the relative path: the path below the
 * picked folder for folder selections, or the bare file name otherwise.
 */
struct PendingItem {
    QString localPath;     ///< Absolute path of the file on disk
    QString relativePath;  ///< Stable identity within a destination
    QString mimeType;      ///< Declared MIME type (e.g. "image/png")
    qint64 size = 0;       ///< File size in bytes at selection time
    QString comment;       ///< Optional comment sent with the upload

    /// @brief Last path component of the relative path.
    [[nodiscard]] QString fileName() const
    {
        int slash = relativePath.lastIndexOf('/');
        return slash >= 0 ? relativePath.mid(slash + 1) : relativePath;
    }

    [[nodiscard]] bool isSameFile(const PendingItem &other) const
    {
        return relativePath == other.relativePath;
    }
};

/**
 * @brief All pending items bound for one destination, in enqueue order.
 *
 * An entry never stays in the queue with an empty item list.
 */
struct QueueEntry {
    QString destination;
    QList<PendingItem> entries;

    [[nodiscard]] int indexOf(const QString &relativePath) const
    {
        for (int i = 0; i < entries.size(); ++i) {
            if (entries[i].relativePath == relativePath) {
                return i;
            }
        }
        return -1;
    }

    [[nodiscard]] qint64 totalBytes() const
    {
        qint64 total = 0;
        for (const auto &item : entries) {
            total += item.size;
        }
        return total;
    }
};

/**
 * @brief Cumulative results since the counters were last reset.
 */
struct UploadSummary {
    int doneCount = 0;
    qint64 doneBytes = 0;
    int errorCount = 0;

    [[nodiscard]] bool isEmpty() const { return doneCount == 0 && errorCount == 0; }
};

Q_DECLARE_METATYPE(PendingItem)
Q_DECLARE_METATYPE(UploadSummary)

#endif // PENDINGITEM_H
