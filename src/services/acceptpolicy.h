/**
 * @file acceptpolicy.h
 * @brief Compiled accept pattern deciding which files a destination takes.
 */

#ifndef ACCEPTPOLICY_H
#define ACCEPTPOLICY_H

#include <QList>
#include <QString>
#include <QStringList>

struct PendingItem;

/**
 * @brief Matches files against a destination's accept pattern string.
 *
 * The pattern string is a list separated by commas or pipes, for example
 * ".png, .jpg" or "image/*|application/pdf". Each pattern is one of:
 * - a leading-dot extension, matched as a case-sensitive suffix of the file name
 * - a MIME pattern ending in "*", matched as a prefix of the declared MIME type
 * - anything else, matched exactly against the declared MIME type
 *
 * An empty pattern string accepts everything.
 *
 * @par Example usage:
 * @code
 * AcceptPolicy policy(".png|image/*");
 * policy.accepts("photo.png", "");          // true
 * policy.accepts("scan.tif", "image/tiff"); // true
 * policy.accepts("report.pdf", "application/pdf"); // false
 * @endcode
 */
class AcceptPolicy
{
public:
    AcceptPolicy() = default;
    explicit AcceptPolicy(const QString &patterns);

    /**
     * @brief Normalizes a raw pattern string: pipes become commas, spaces are dropped.
     */
    static QString normalize(const QString &patterns);

    [[nodiscard]] bool acceptsAll() const { return rules_.isEmpty(); }

    /// @brief The normalized pattern string, suitable for a file dialog filter.
    [[nodiscard]] QString patternString() const { return normalized_; }

    [[nodiscard]] bool accepts(const QString &fileName, const QString &mimeType) const;
    [[nodiscard]] bool accepts(const PendingItem &item) const;

    /**
     * @brief Splits @p items into accepted ones (returned) and a rejected count.
     * @param items Candidate items.
     * @param rejected Receives the number of items dropped, if non-null.
     */
    [[nodiscard]] QList<PendingItem> filter(const QList<PendingItem> &items, int *rejected = nullptr) const;

    /// @brief Name filters for QFileDialog built from the extension rules.
    [[nodiscard]] QStringList nameFilters() const;

private:
    struct Rule {
        enum class Kind { Suffix, MimePrefix, MimeExact };
        Kind kind = Kind::MimeExact;
        QString text;
    };

    QString normalized_;
    QList<Rule> rules_;
};

#endif // ACCEPTPOLICY_H
