#include "uploadsettings.h"

#include <QSettings>

void UploadSettings::load()
{
    QSettings settings;
    serverUrl_ = settings.value(ServerUrlKey, DefaultServerUrl).toString();
    skipExisting_ = settings.value(SkipExistingKey, false).toBool();
    lastDestination_ = normalizeDestination(
        settings.value(LastDestinationKey, DefaultDestination).toString());
}

void UploadSettings::save() const
{
    QSettings settings;
    settings.setValue(ServerUrlKey, serverUrl_);
    settings.setValue(SkipExistingKey, skipExisting_);
    settings.setValue(LastDestinationKey, lastDestination_);
}

void UploadSettings::setLastDestination(const QString &destination)
{
    lastDestination_ = normalizeDestination(destination);
}

QString UploadSettings::normalizeDestination(const QString &destination)
{
    QString result = destination.trimmed();
    if (!result.startsWith('/')) {
        result.prepend('/');
    }
    if (!result.endsWith('/')) {
        result.append('/');
    }
    while (result.contains("//")) {
        result.replace("//", "/");
    }
    return result;
}
