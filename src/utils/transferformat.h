/**
 * @file transferformat.h
 * @brief Human-readable formatting of sizes, speeds and durations.
 */

#ifndef TRANSFERFORMAT_H
#define TRANSFERFORMAT_H

#include <QString>
#include <QtGlobal>

/**
 * @brief Formats transfer figures for labels and dialogs.
 *
 * All size units are binary (1 KB = 1024 bytes).
 */
class TransferFormat
{
public:
    /**
     * @brief Formats a byte count, e.g. "512 B", "1.5 KB", "9.5 MB".
     * @param bytes The byte count.
     * @return Formatted string with one decimal above the byte range.
     */
    static QString bytes(qint64 bytes);

    /**
     * @brief Formats a throughput, e.g. "1.2 MB/s".
     * @param bytesPerSecond The speed in bytes per second.
     */
    static QString speed(double bytesPerSecond);

    /**
     * @brief Formats a fraction in [0,1] as a percentage, e.g. "40%".
     */
    static QString percent(double fraction);

    /**
     * @brief Formats a duration as a compact string.
     * @param seconds Duration in whole seconds.
     * @param maxUnits Maximum number of most-significant units kept.
     * @return e.g. "45s", "3m05s", "1h02m03s", "2d04h" (with maxUnits = 2).
     */
    static QString duration(qint64 seconds, int maxUnits = 3);

private:
    TransferFormat() = default;
};

#endif // TRANSFERFORMAT_H
