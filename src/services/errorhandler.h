/**
 * @file errorhandler.h
 * @brief Central place where upload, policy and connection errors are presented.
 *
 * Services report failures through signals; this handler decides how loud
 * each one is: a status bar line, a dialog, or both.
 */

#ifndef ERRORHANDLER_H
#define ERRORHANDLER_H

#include <QObject>
#include <QString>

class QWidget;

/**
 * @brief Categories of errors for appropriate handling.
 */
enum class ErrorCategory {
    Connection,  ///< Server unreachable, notification channel lost
    Upload,      ///< A file failed to upload
    Policy,      ///< Files refused by the folder's accept policy or a name clash
    System       ///< Local problems (unreadable files, settings)
};

/**
 * @brief Severity levels determining how errors are displayed.
 */
enum class ErrorSeverity {
    Info,      ///< Status bar only, short timeout
    Warning,   ///< Status bar, longer timeout
    Critical   ///< Status bar and a dialog
};

/**
 * @brief Centralized error presentation.
 *
 * @par Example usage:
 * @code
 * ErrorHandler *handler = new ErrorHandler(mainWindow, this);
 * connect(queue, &UploadQueue::uploadFailed,
 *         handler, &ErrorHandler::handleUploadFailed);
 * connect(handler, &ErrorHandler::statusMessage,
 *         statusBar, &QStatusBar::showMessage);
 * @endcode
 */
class ErrorHandler : public QObject
{
    Q_OBJECT

public:
    static constexpr int PayloadTooLargeStatus = 413;

    /**
     * @brief Constructs an error handler.
     * @param parentWidget Widget to use as parent for dialogs (not owned, may be null).
     * @param parent Optional parent QObject for memory management.
     */
    explicit ErrorHandler(QWidget *parentWidget, QObject *parent = nullptr);
    ~ErrorHandler() override = default;

    /**
     * @brief Handles an error with specified category and severity.
     * @param category The error category.
     * @param severity The error severity.
     * @param title Short error title/summary.
     * @param details Detailed error message.
     */
    void handleError(ErrorCategory category,
                     ErrorSeverity severity,
                     const QString &title,
                     const QString &details = QString());

    /// @brief Disables dialogs; critical errors only reach the status bar and log.
    void setDialogsEnabled(bool enabled) { dialogsEnabled_ = enabled; }
    [[nodiscard]] bool dialogsEnabled() const { return dialogsEnabled_; }

    /// @name Convenience Methods for Common Error Sources
    /// @{

    /// @brief Server unreachable (critical).
    void handleConnectionError(const QString &message);

    /**
     * @brief First failed upload of a batch (critical).
     * @param fileName Name of the file.
     * @param status HTTP status, or -1 when no response was received.
     */
    void handleUploadFailed(const QString &fileName, int status);

    /// @brief Files dropped by the accept policy (warning).
    void handleFilesRejected(int count);

    /// @brief Create-folder refused because the name is taken (warning).
    void handleFolderExists(const QString &name);

    /// @brief Any other failed request (warning).
    void handleOperationFailed(const QString &operation, const QString &error);
    /// @}

    /// @brief User-facing text for an upload failure status.
    [[nodiscard]] static QString uploadFailureText(int status);

signals:
    /**
     * @brief Emitted to display a status bar message.
     * @param message The message text.
     * @param timeout Display timeout in milliseconds (0 for no timeout).
     */
    void statusMessage(const QString &message, int timeout);

    /**
     * @brief Emitted when an error is logged.
     */
    void errorLogged(ErrorCategory category,
                     ErrorSeverity severity,
                     const QString &title,
                     const QString &details);

private:
    void showErrorDialog(const QString &title, const QString &message);
    void logError(ErrorCategory category,
                  ErrorSeverity severity,
                  const QString &title,
                  const QString &details);

    [[nodiscard]] static int timeoutForSeverity(ErrorSeverity severity);
    [[nodiscard]] static QString logTag(ErrorCategory category, ErrorSeverity severity);

    QWidget *parentWidget_ = nullptr;
    bool dialogsEnabled_ = true;
};

#endif // ERRORHANDLER_H
