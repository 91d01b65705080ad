/**
 * @file logging.h
 * @brief Verbose logging switch for the upload engine.
 *
 * Progress ticks and notification events are too chatty for normal runs;
 * they only reach the log when the application is started with --verbose.
 */

#ifndef LOGGING_H
#define LOGGING_H

#include <QDebug>

namespace hfsupload {

/// Set from the --verbose command line option before any service is created
inline bool verboseLogging = false;

/// Prefix used to correlate log lines of one transport request
inline QString requestTag(quint64 requestId)
{
    return QStringLiteral("[req %1]").arg(requestId);
}

} // namespace hfsupload

/// Log only when verbose mode is enabled
#define HFSUPLOAD_LOG_VERBOSE() if (hfsupload::verboseLogging) qDebug()

/// Verbose log line tagged with a transport request id
#define HFSUPLOAD_LOG_REQUEST(id) HFSUPLOAD_LOG_VERBOSE().noquote() << hfsupload::requestTag(id)

#endif // LOGGING_H
