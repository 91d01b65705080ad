#include "errorhandler.h"

#include <QDebug>
#include <QMessageBox>

ErrorHandler::ErrorHandler(QWidget *parentWidget, QObject *parent)
    : QObject(parent)
    , parentWidget_(parentWidget)
{
}

void ErrorHandler::handleError(ErrorCategory category,
                               ErrorSeverity severity,
                               const QString &title,
                               const QString &details)
{
    logError(category, severity, title, details);

    emit statusMessage(details.isEmpty() || details == title
                           ? title
                           : tr("%1: %2").arg(title, details),
                       timeoutForSeverity(severity));

    if (severity == ErrorSeverity::Critical && dialogsEnabled_) {
        showErrorDialog(title, details.isEmpty() ? title : details);
    }
}

void ErrorHandler::handleConnectionError(const QString &message)
{
    handleError(ErrorCategory::Connection,
                ErrorSeverity::Critical,
                tr("Connection Error"),
                message);
}

QString ErrorHandler::uploadFailureText(int status)
{
    if (status == PayloadTooLargeStatus) {
        return tr("File too large");
    }
    if (status < 0) {
        return tr("Network failure");
    }
    return tr("Server answered %1").arg(status);
}

void ErrorHandler::handleUploadFailed(const QString &fileName, int status)
{
    handleError(ErrorCategory::Upload,
                ErrorSeverity::Critical,
                tr("Upload failed: %1").arg(fileName),
                uploadFailureText(status));
}

void ErrorHandler::handleFilesRejected(int count)
{
    handleError(ErrorCategory::Policy,
                ErrorSeverity::Warning,
                tr("Some files were not accepted"),
                tr("%n file(s) skipped", nullptr, count));
}

void ErrorHandler::handleFolderExists(const QString &name)
{
    handleError(ErrorCategory::Policy,
                ErrorSeverity::Warning,
                tr("Folder with same name already exists"),
                name);
}

void ErrorHandler::handleOperationFailed(const QString &operation, const QString &error)
{
    handleError(ErrorCategory::System,
                ErrorSeverity::Warning,
                tr("%1 failed").arg(operation),
                error);
}

void ErrorHandler::showErrorDialog(const QString &title, const QString &message)
{
    QMessageBox::warning(parentWidget_, title, message);
}

void ErrorHandler::logError(ErrorCategory category,
                            ErrorSeverity severity,
                            const QString &title,
                            const QString &details)
{
    const QString line = details.isEmpty() || details == title
        ? QString("ErrorHandler: %1 %2").arg(logTag(category, severity), title)
        : QString("ErrorHandler: %1 %2 (%3)").arg(logTag(category, severity), title, details);

    if (severity == ErrorSeverity::Info) {
        qInfo().noquote() << line;
    } else if (severity == ErrorSeverity::Warning) {
        qWarning().noquote() << line;
    } else {
        qCritical().noquote() << line;
    }

    emit errorLogged(category, severity, title, details);
}

int ErrorHandler::timeoutForSeverity(ErrorSeverity severity)
{
    // Critical messages stay in the status bar until the next one replaces them
    static constexpr int timeouts[] = {3000, 5000, 0};
    return timeouts[static_cast<int>(severity)];
}

QString ErrorHandler::logTag(ErrorCategory category, ErrorSeverity severity)
{
    static const char *const categories[] = {"connection", "upload", "policy", "system"};
    static const char *const severities[] = {"info", "warning", "critical"};
    return QStringLiteral("<%1:%2>")
        .arg(QLatin1String(categories[static_cast<int>(category)]),
             QLatin1String(severities[static_cast<int>(severity)]));
}
