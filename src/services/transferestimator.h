/**
 * @file transferestimator.h
 * @brief Periodic speed and ETA sampling for the upload queue.
 */

#ifndef TRANSFERESTIMATOR_H
#define TRANSFERESTIMATOR_H

#include <QElapsedTimer>
#include <QObject>
#include <QTimer>

class UploadState;

/**
 * @brief Converts sent-byte counters into speed and ETA on a fixed interval.
 *
 * Bytes are accumulated through addBytesSent(). Every SampleIntervalMs the
 * accumulated count is divided by the elapsed time to produce a speed. If
 * less than MinimumWindowSeconds passed and a speed is already known, the
 * sample is skipped and the window keeps growing, so a short tick never
 * reports a noisy near-zero speed.
 *
 * The ETA is the number of bytes still to send across every queued item
 * (queued bytes minus what the active transfer already sent) divided by the
 * speed, or 0 when the speed is 0. Both values are advisory.
 */
class TransferEstimator : public QObject
{
    Q_OBJECT

public:
    static constexpr int SampleIntervalMs = 5000;
    static constexpr double MinimumWindowSeconds = 3.0;

    explicit TransferEstimator(UploadState *state, QObject *parent = nullptr);
    ~TransferEstimator() override;

    void start();
    void stop();
    [[nodiscard]] bool isRunning() const { return timer_->isActive(); }

    /// @brief Adds bytes sent since the last call.
    void addBytesSent(qint64 bytes);

    [[nodiscard]] qint64 pendingBytes() const { return bytesSinceSample_; }

    /**
     * @brief Takes a sample as if @p nowMs milliseconds passed on the estimator clock.
     *
     * Called by the interval timer with the real clock; exposed so the
     * arithmetic can be driven deterministically.
     */
    void sampleAt(qint64 nowMs);

private slots:
    void onTick();

private:
    UploadState *state_ = nullptr;
    QTimer *timer_ = nullptr;
    QElapsedTimer clock_;
    qint64 lastSampleMs_ = 0;
    qint64 bytesSinceSample_ = 0;
};

#endif // TRANSFERESTIMATOR_H
