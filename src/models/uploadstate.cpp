#include "uploadstate.h"

#include <algorithm>
#include <QSet>

UploadState::UploadState(QObject *parent)
    : QObject(parent)
{
    qRegisterMetaType<PendingItem>();
    qRegisterMetaType<UploadSummary>();
}

UploadState::~UploadState() = default;

qint64 UploadState::addingBytes() const
{
    qint64 total = 0;
    for (const auto &item : adding_) {
        total += item.size;
    }
    return total;
}

int UploadState::addToAdding(const QList<PendingItem> &items)
{
    int added = 0;
    for (const auto &item : items) {
        bool present = std::any_of(adding_.cbegin(), adding_.cend(),
                                   [&item](const PendingItem &existing) { return existing.isSameFile(item); });
        if (present) {
            continue;
        }
        adding_.append(item);
        added++;
    }

    if (added > 0) {
        emit addingChanged();
    }
    return added;
}

bool UploadState::removeFromAdding(const QString &relativePath)
{
    for (int i = 0; i < adding_.size(); ++i) {
        if (adding_[i].relativePath == relativePath) {
            adding_.removeAt(i);
            emit addingChanged();
            return true;
        }
    }
    return false;
}

bool UploadState::setAddingComment(const QString &relativePath, const QString &comment)
{
    for (auto &item : adding_) {
        if (item.relativePath == relativePath) {
            item.comment = comment;
            emit addingChanged();
            return true;
        }
    }
    return false;
}

QList<PendingItem> UploadState::takeAdding()
{
    QList<PendingItem> taken;
    taken.swap(adding_);
    if (!taken.isEmpty()) {
        emit addingChanged();
    }
    return taken;
}

void UploadState::clearAdding()
{
    if (adding_.isEmpty()) {
        return;
    }
    adding_.clear();
    emit addingChanged();
}

int UploadState::queuedItemCount() const
{
    int count = 0;
    for (const auto &entry : queue_) {
        count += entry.entries.size();
    }
    return count;
}

qint64 UploadState::queuedBytes() const
{
    qint64 total = 0;
    for (const auto &entry : queue_) {
        total += entry.totalBytes();
    }
    return total;
}

int UploadState::entryIndex(const QString &destination) const
{
    for (int i = 0; i < queue_.size(); ++i) {
        if (queue_[i].destination == destination) {
            return i;
        }
    }
    return -1;
}

int UploadState::appendToDestination(const QString &destination, const QList<PendingItem> &items)
{
    int idx = entryIndex(destination);

    QSet<QString> seen;
    if (idx >= 0) {
        for (const auto &existing : queue_[idx].entries) {
            seen.insert(existing.relativePath);
        }
    }

    QList<PendingItem> missing;
    for (const auto &item : items) {
        if (seen.contains(item.relativePath)) {
            continue;
        }
        seen.insert(item.relativePath);
        missing.append(item);
    }

    if (missing.isEmpty()) {
        return 0;
    }

    if (idx < 0) {
        QueueEntry entry;
        entry.destination = destination;
        entry.entries = missing;
        queue_.append(entry);
    } else {
        queue_[idx].entries.append(missing);
    }

    emit queueChanged();
    return missing.size();
}

bool UploadState::removeFromDestination(const QString &destination, const QString &relativePath)
{
    int idx = entryIndex(destination);
    if (idx < 0) {
        return false;
    }

    int itemIdx = queue_[idx].indexOf(relativePath);
    if (itemIdx < 0) {
        return false;
    }

    queue_[idx].entries.removeAt(itemIdx);
    if (queue_[idx].entries.isEmpty()) {
        queue_.removeAt(idx);
    }

    emit queueChanged();
    return true;
}

void UploadState::clearQueue()
{
    if (queue_.isEmpty()) {
        return;
    }
    queue_.clear();
    emit queueChanged();
}

bool UploadState::isActive(const QString &destination, const QString &relativePath) const
{
    return active_.has_value()
        && activeDestination_ == destination
        && active_->relativePath == relativePath;
}

void UploadState::setActive(const PendingItem &item, const QString &destination, qint64 initialPartial)
{
    active_ = item;
    activeDestination_ = destination;
    partialBytes_ = qBound<qint64>(0, initialPartial, qMax<qint64>(item.size, 0));
    progressFraction_ = item.size > 0
        ? static_cast<double>(partialBytes_) / static_cast<double>(item.size)
        : 0.0;
    emit activeChanged();
    emit progressChanged(partialBytes_, progressFraction_);
}

void UploadState::clearActive()
{
    if (!active_.has_value() && partialBytes_ == 0) {
        return;
    }
    active_.reset();
    activeDestination_.clear();
    partialBytes_ = 0;
    progressFraction_ = 0.0;
    emit activeChanged();
    emit progressChanged(partialBytes_, progressFraction_);
}

void UploadState::setProgress(qint64 partialBytes, double fraction)
{
    partialBytes_ = qMax<qint64>(partialBytes, 0);
    progressFraction_ = qBound(0.0, fraction, 1.0);
    emit progressChanged(partialBytes_, progressFraction_);
}

void UploadState::setPaused(bool paused)
{
    if (paused_ == paused) {
        return;
    }
    paused_ = paused;
    emit pausedChanged(paused_);
}

void UploadState::setSkipExisting(bool skip)
{
    if (skipExisting_ == skip) {
        return;
    }
    skipExisting_ = skip;
    emit skipExistingChanged(skipExisting_);
}

void UploadState::recordSuccess(qint64 bytes)
{
    summary_.doneCount++;
    summary_.doneBytes += bytes;
    emit countersChanged();
}

int UploadState::recordError()
{
    int previous = summary_.errorCount++;
    emit countersChanged();
    return previous;
}

void UploadState::resetCounters()
{
    summary_ = UploadSummary();
    emit countersChanged();
}

void UploadState::setEstimate(double bytesPerSecond, qint64 etaSeconds)
{
    speed_ = bytesPerSecond;
    etaSeconds_ = etaSeconds;
    emit estimateChanged(speed_, etaSeconds_);
}
