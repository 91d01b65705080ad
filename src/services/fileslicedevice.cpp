#include "fileslicedevice.h"

#include <QDebug>
#include <QFileInfo>

FileSliceDevice::FileSliceDevice(const QString &filePath, qint64 offset, QObject *parent)
    : QIODevice(parent)
    , file_(filePath)
    , offset_(qMax<qint64>(offset, 0))
{
}

FileSliceDevice::~FileSliceDevice()
{
    if (isOpen()) {
        close();
    }
}

bool FileSliceDevice::open(OpenMode mode)
{
    if ((mode & QIODevice::WriteOnly) != 0) {
        setErrorString(tr("FileSliceDevice is read-only"));
        return false;
    }

    if (!file_.open(QIODevice::ReadOnly)) {
        setErrorString(file_.errorString());
        qWarning() << "FileSliceDevice: Cannot open" << file_.fileName() << "-" << file_.errorString();
        return false;
    }

    if (offset_ > file_.size()) {
        setErrorString(tr("Offset %1 is beyond the end of %2").arg(offset_).arg(file_.fileName()));
        file_.close();
        return false;
    }

    if (!file_.seek(offset_)) {
        setErrorString(file_.errorString());
        file_.close();
        return false;
    }

    return QIODevice::open(mode | QIODevice::Unbuffered);
}

void FileSliceDevice::close()
{
    QIODevice::close();
    file_.close();
}

qint64 FileSliceDevice::size() const
{
    if (file_.isOpen()) {
        return qMax<qint64>(file_.size() - offset_, 0);
    }
    QFileInfo info(file_.fileName());
    return qMax<qint64>(info.size() - offset_, 0);
}

bool FileSliceDevice::seek(qint64 pos)
{
    if (pos < 0 || pos > size()) {
        return false;
    }
    if (!file_.seek(offset_ + pos)) {
        return false;
    }
    return QIODevice::seek(pos);
}

qint64 FileSliceDevice::readData(char *data, qint64 maxSize)
{
    return file_.read(data, maxSize);
}

qint64 FileSliceDevice::writeData(const char *data, qint64 maxSize)
{
    Q_UNUSED(data)
    Q_UNUSED(maxSize)
    return -1;
}
