#include "uploadintake.h"
#include "models/uploadstate.h"
#include "utils/logging.h"

#include <QDebug>
#include <algorithm>
#include <QDir>
#include <QDirIterator>
#include <QFileInfo>
#include <QMimeData>

UploadIntake::UploadIntake(UploadState *state, QObject *parent)
    : QObject(parent)
    , state_(state)
{
}

UploadIntake::~UploadIntake() = default;

PendingItem UploadIntake::makeItem(const QString &localPath, const QString &relativePath) const
{
    QFileInfo info(localPath);
    PendingItem item;
    item.localPath = info.absoluteFilePath();
    item.relativePath = relativePath;
    item.mimeType = mimeDb_.mimeTypeForFile(info).name();
    item.size = info.size();
    return item;
}

int UploadIntake::addFiles(const QStringList &paths)
{
    QList<PendingItem> candidates;
    for (const QString &path : paths) {
        QFileInfo info(path);
        if (!info.isFile()) {
            qWarning() << "UploadIntake: Not a readable file:" << path;
            continue;
        }
        candidates.append(makeItem(path, info.fileName()));
    }
    return accept(candidates);
}

int UploadIntake::addFolder(const QString &dirPath)
{
    QList<PendingItem> candidates;
    collectFolder(dirPath, candidates);
    return accept(candidates);
}

int UploadIntake::addUrls(const QList<QUrl> &urls)
{
    QList<PendingItem> candidates;
    for (const QUrl &url : urls) {
        if (!url.isLocalFile()) {
            continue;
        }
        QString path = url.toLocalFile();
        QFileInfo info(path);
        if (info.isDir()) {
            collectFolder(path, candidates);
        } else if (info.isFile()) {
            candidates.append(makeItem(path, info.fileName()));
        }
    }
    return accept(candidates);
}

int UploadIntake::addFromMimeData(const QMimeData *mimeData)
{
    if (!canAccept(mimeData)) {
        return 0;
    }
    return addUrls(mimeData->urls());
}

bool UploadIntake::canAccept(const QMimeData *mimeData)
{
    if (!mimeData || !mimeData->hasUrls()) {
        return false;
    }
    const QList<QUrl> urls = mimeData->urls();
    for (const QUrl &url : urls) {
        if (url.isLocalFile()) {
            return true;
        }
    }
    return false;
}

bool UploadIntake::setComment(const QString &relativePath, const QString &comment)
{
    return state_->setAddingComment(relativePath, comment);
}

bool UploadIntake::remove(const QString &relativePath)
{
    return state_->removeFromAdding(relativePath);
}

void UploadIntake::clear()
{
    state_->clearAdding();
}

void UploadIntake::collectFolder(const QString &dirPath, QList<PendingItem> &items) const
{
    QDir root(dirPath);
    if (!root.exists()) {
        qWarning() << "UploadIntake: Folder does not exist:" << dirPath;
        return;
    }

    QString folderName = QFileInfo(root.absolutePath()).fileName();
    QDirIterator it(root.absolutePath(), QDir::Files | QDir::NoDotAndDotDot | QDir::Hidden,
                    QDirIterator::Subdirectories);

    QList<PendingItem> found;
    while (it.hasNext()) {
        QString filePath = it.next();
        QString relative = root.relativeFilePath(filePath);
        QString relativePath = folderName.isEmpty() ? relative : folderName + '/' + relative;
        found.append(makeItem(filePath, QDir::cleanPath(relativePath)));
    }

    // Directory iteration order is filesystem-dependent
    std::sort(found.begin(), found.end(), [](const PendingItem &a, const PendingItem &b) {
        return a.relativePath < b.relativePath;
    });
    items.append(found);

    HFSUPLOAD_LOG_VERBOSE() << "UploadIntake: Collected" << found.size() << "files from" << dirPath;
}

int UploadIntake::accept(const QList<PendingItem> &candidates)
{
    if (candidates.isEmpty()) {
        return 0;
    }

    int rejected = 0;
    QList<PendingItem> accepted = policy_.filter(candidates, &rejected);
    if (rejected > 0) {
        qDebug() << "UploadIntake:" << rejected << "files rejected by accept policy"
                 << policy_.patternString();
        emit filesRejected(rejected);
    }

    int added = state_->addToAdding(accepted);
    qDebug() << "UploadIntake: Added" << added << "of" << candidates.size() << "files";
    return added;
}
