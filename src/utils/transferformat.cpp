#include "transferformat.h"

#include <QStringList>

QString TransferFormat::bytes(qint64 bytes)
{
    constexpr qint64 KB = 1024;
    static const char *const units[] = { "KB", "MB", "GB", "TB" };

    if (bytes < KB) {
        return QString("%1 B").arg(qMax<qint64>(bytes, 0));
    }

    double value = static_cast<double>(bytes) / static_cast<double>(KB);
    int unit = 0;
    while (value >= 1024.0 && unit < 3) {
        value /= 1024.0;
        ++unit;
    }
    return QString("%1 %2").arg(value, 0, 'f', 1).arg(QLatin1String(units[unit]));
}

QString TransferFormat::speed(double bytesPerSecond)
{
    return bytes(static_cast<qint64>(bytesPerSecond)) + "/s";
}

QString TransferFormat::percent(double fraction)
{
    return QString("%1%").arg(qRound(qBound(0.0, fraction, 1.0) * 100.0));
}

QString TransferFormat::duration(qint64 seconds, int maxUnits)
{
    struct Unit {
        char suffix;
        qint64 modulus;
        int padding;
    };
    // Units from least to most significant; the last modulus is effectively unbounded
    static const Unit units[] = {
        { 's', 60, 2 }, { 'm', 60, 2 }, { 'h', 24, 2 }, { 'd', 365, 0 }, { 'y', 0, 0 }
    };

    if (seconds < 0) {
        seconds = 0;
    }

    QStringList parts;
    qint64 remaining = seconds;
    for (const Unit &unit : units) {
        qint64 value = unit.modulus > 0 ? remaining % unit.modulus : remaining;
        parts.prepend(QString("%1%2").arg(value, unit.padding, 10, QChar('0')).arg(QChar(unit.suffix)));
        if (unit.modulus == 0) {
            break;
        }
        remaining /= unit.modulus;
        if (remaining < 1) {
            break;
        }
    }

    // Drop leading zero padding on the most significant unit ("05s" -> "5s")
    QString &first = parts.first();
    while (first.size() > 2 && first.startsWith('0')) {
        first.remove(0, 1);
    }

    return parts.mid(0, qMax(1, maxUnits)).join(QString());
}
