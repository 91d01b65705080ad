#include "acceptpolicy.h"
#include "models/pendingitem.h"

#include <QRegularExpression>

AcceptPolicy::AcceptPolicy(const QString &patterns)
    : normalized_(normalize(patterns))
{
    const QStringList parts = normalized_.split(',', Qt::SkipEmptyParts);
    for (const QString &part : parts) {
        Rule rule;
        if (part.startsWith('.')) {
            rule.kind = Rule::Kind::Suffix;
            rule.text = part;
        } else if (part == QLatin1String("*/*")) {
            rule.kind = Rule::Kind::MimePrefix;
        } else if (part.endsWith('*')) {
            rule.kind = Rule::Kind::MimePrefix;
            rule.text = part.chopped(1);
        } else {
            rule.kind = Rule::Kind::MimeExact;
            rule.text = part;
        }
        rules_.append(rule);
    }
}

QString AcceptPolicy::normalize(const QString &patterns)
{
    QString result = patterns;
    result.replace('|', ',');
    result.remove(QRegularExpression(QStringLiteral("\\s+")));
    return result;
}

bool AcceptPolicy::accepts(const QString &fileName, const QString &mimeType) const
{
    if (rules_.isEmpty()) {
        return true;
    }

    for (const Rule &rule : rules_) {
        switch (rule.kind) {
        case Rule::Kind::Suffix:
            if (fileName.endsWith(rule.text)) {
                return true;
            }
            break;
        case Rule::Kind::MimePrefix:
            if (rule.text.isEmpty() || (!mimeType.isEmpty() && mimeType.startsWith(rule.text))) {
                return true;
            }
            break;
        case Rule::Kind::MimeExact:
            if (!mimeType.isEmpty() && mimeType == rule.text) {
                return true;
            }
            break;
        }
    }
    return false;
}

bool AcceptPolicy::accepts(const PendingItem &item) const
{
    return accepts(item.fileName(), item.mimeType);
}

QList<PendingItem> AcceptPolicy::filter(const QList<PendingItem> &items, int *rejected) const
{
    QList<PendingItem> accepted;
    int dropped = 0;
    for (const auto &item : items) {
        if (accepts(item)) {
            accepted.append(item);
        } else {
            dropped++;
        }
    }
    if (rejected) {
        *rejected = dropped;
    }
    return accepted;
}

QStringList AcceptPolicy::nameFilters() const
{
    QStringList filters;
    for (const Rule &rule : rules_) {
        if (rule.kind == Rule::Kind::Suffix) {
            filters << "*" + rule.text;
        }
    }
    return filters;
}
