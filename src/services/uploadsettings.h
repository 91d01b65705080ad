/**
 * @file uploadsettings.h
 * @brief Persistent preferences of the upload client.
 */

#ifndef UPLOADSETTINGS_H
#define UPLOADSETTINGS_H

#include <QString>

/**
 * @brief Values kept in QSettings between runs.
 *
 * load() and save() use the application's default QSettings location, so
 * QCoreApplication organisation and application names must be set first.
 */
class UploadSettings
{
public:
    static constexpr const char *ServerUrlKey = "server/url";
    static constexpr const char *SkipExistingKey = "upload/skipExisting";
    static constexpr const char *LastDestinationKey = "upload/lastDestination";

    static constexpr const char *DefaultServerUrl = "http://localhost";
    static constexpr const char *DefaultDestination = "/";

    void load();
    void save() const;

    [[nodiscard]] QString serverUrl() const { return serverUrl_; }
    void setServerUrl(const QString &url) { serverUrl_ = url; }

    [[nodiscard]] bool skipExisting() const { return skipExisting_; }
    void setSkipExisting(bool skip) { skipExisting_ = skip; }

    [[nodiscard]] QString lastDestination() const { return lastDestination_; }

    /// @brief Stores a destination folder, normalized to start and end with '/'.
    void setLastDestination(const QString &destination);

    [[nodiscard]] static QString normalizeDestination(const QString &destination);

private:
    QString serverUrl_ = DefaultServerUrl;
    bool skipExisting_ = false;
    QString lastDestination_ = DefaultDestination;
};

#endif // UPLOADSETTINGS_H
