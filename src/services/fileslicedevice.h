/**
 * @file fileslicedevice.h
 * @brief Read-only device exposing the tail of a file from a byte offset.
 */

#ifndef FILESLICEDEVICE_H
#define FILESLICEDEVICE_H

#include <QFile>
#include <QIODevice>

/**
 * @brief Presents bytes [offset, end) of a file as a seekable device.
 *
 * Position 0 of this device corresponds to @p offset in the file, so a
 * multipart body built on it carries only the part of the file not yet
 * stored on the server.
 */
class FileSliceDevice : public QIODevice
{
    Q_OBJECT

public:
    FileSliceDevice(const QString &filePath, qint64 offset, QObject *parent = nullptr);
    ~FileSliceDevice() override;

    /**
     * @brief Opens the underlying file; only ReadOnly is supported.
     * @return False if the file cannot be read or the offset lies beyond its end.
     */
    bool open(OpenMode mode) override;
    void close() override;

    [[nodiscard]] bool isSequential() const override { return false; }
    [[nodiscard]] qint64 size() const override;
    bool seek(qint64 pos) override;

    [[nodiscard]] qint64 offset() const { return offset_; }
    [[nodiscard]] QString filePath() const { return file_.fileName(); }

protected:
    qint64 readData(char *data, qint64 maxSize) override;
    qint64 writeData(const char *data, qint64 maxSize) override;

private:
    QFile file_;
    qint64 offset_ = 0;
};

#endif // FILESLICEDEVICE_H
