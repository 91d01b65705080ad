/**
 * @file iuploadtransport.h
 * @brief Interface for the HTTP upload transport.
 *
 * This interface allows dependency injection of the transport, enabling
 * runtime swapping between the network implementation and a mock for testing.
 */

#ifndef IUPLOADTRANSPORT_H
#define IUPLOADTRANSPORT_H

#include <QObject>
#include <QString>
#include <QUrlQuery>

/**
 * @brief One upload request: the tail of a local file posted to a destination.
 */
struct UploadRequest {
    QString destination;  ///< Remote folder path, e.g. "/docs/"
    QUrlQuery query;      ///< channel, resume, comment and skipExisting parameters
    QString localPath;    ///< File whose bytes are sent
    qint64 offset = 0;    ///< First byte of the file included in the body
    QString partName;     ///< Filename of the form part (the item's relative path)
};

/**
 * @brief Abstract interface for upload transports.
 *
 * A transport carries at most one request at a time. Each accepted request
 * gets a fresh id; progress and completion signals carry that id so a
 * listener can ignore events belonging to a request it no longer owns.
 *
 * Completion always arrives through uploadFinished(), including after
 * abort(). The reported status is the HTTP status code, AbortedStatus when
 * the client aborted, or NetworkFailureStatus when no HTTP status was
 * received at all.
 *
 * @par Example usage:
 * @code
 * // Production code
 * IUploadTransport *transport = new HttpUploadTransport(this);
 *
 * // Test code
 * IUploadTransport *transport = new MockUploadTransport(this);
 *
 * quint64 id = transport->post(request);
 * @endcode
 */
class IUploadTransport : public QObject
{
    Q_OBJECT

public:
    static constexpr int AbortedStatus = 0;
    static constexpr int NetworkFailureStatus = -1;
    static constexpr int ConflictStatus = 409;
    static constexpr int PayloadTooLargeStatus = 413;

    /**
     * @brief Constructs a transport interface.
     * @param parent Optional parent QObject for memory management.
     */
    explicit IUploadTransport(QObject *parent = nullptr) : QObject(parent) {}

    /**
     * @brief Virtual destructor.
     */
    ~IUploadTransport() override = default;

    /**
     * @brief Starts posting a request.
     * @param request The request to send.
     * @return Id of the new request, or 0 if the transport is still busy.
     */
    virtual quint64 post(const UploadRequest &request) = 0;

    /**
     * @brief Aborts the request with the given id, if it is still in flight.
     *
     * The transport then reports AbortedStatus through uploadFinished().
     */
    virtual void abort(quint64 requestId) = 0;

    /**
     * @brief Checks whether a request is in flight.
     * @return True until the current request's uploadFinished() was emitted.
     */
    [[nodiscard]] virtual bool isBusy() const = 0;

signals:
    /**
     * @brief Emitted as body bytes of the current request are sent.
     * @param requestId The request the progress belongs to.
     * @param bytesSent Bytes sent so far in this request.
     * @param bytesTotal Total bytes of this request's body.
     */
    void uploadProgress(quint64 requestId, qint64 bytesSent, qint64 bytesTotal);

    /**
     * @brief Emitted once per request when it reaches a terminal state.
     * @param requestId The request that finished.
     * @param status HTTP status, AbortedStatus or NetworkFailureStatus.
     */
    void uploadFinished(quint64 requestId, int status);
};

#endif // IUPLOADTRANSPORT_H
