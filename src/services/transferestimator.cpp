#include "transferestimator.h"
#include "models/uploadstate.h"
#include "utils/logging.h"

#include <cmath>

TransferEstimator::TransferEstimator(UploadState *state, QObject *parent)
    : QObject(parent)
    , state_(state)
    , timer_(new QTimer(this))
{
    timer_->setInterval(SampleIntervalMs);
    connect(timer_, &QTimer::timeout, this, &TransferEstimator::onTick);
    clock_.start();
}

TransferEstimator::~TransferEstimator() = default;

void TransferEstimator::start()
{
    if (timer_->isActive()) {
        return;
    }
    lastSampleMs_ = clock_.elapsed();
    bytesSinceSample_ = 0;
    timer_->start();
}

void TransferEstimator::stop()
{
    timer_->stop();
    bytesSinceSample_ = 0;
    state_->setEstimate(0.0, 0);
}

void TransferEstimator::addBytesSent(qint64 bytes)
{
    if (bytes > 0) {
        bytesSinceSample_ += bytes;
    }
}

void TransferEstimator::onTick()
{
    sampleAt(clock_.elapsed());
}

void TransferEstimator::sampleAt(qint64 nowMs)
{
    double seconds = static_cast<double>(nowMs - lastSampleMs_) / 1000.0;
    if (seconds <= 0.0) {
        return;
    }
    if (seconds < MinimumWindowSeconds && state_->speed() > 0.0) {
        return;
    }

    double speed = static_cast<double>(bytesSinceSample_) / seconds;
    bytesSinceSample_ = 0;
    lastSampleMs_ = nowMs;

    qint64 remaining = qMax<qint64>(state_->queuedBytes() - state_->partialBytes(), 0);
    qint64 eta = speed > 0.0 ? static_cast<qint64>(std::llround(static_cast<double>(remaining) / speed)) : 0;

    HFSUPLOAD_LOG_VERBOSE() << "TransferEstimator: speed" << speed << "B/s, remaining" << remaining << "eta" << eta << "s";
    state_->setEstimate(speed, eta);
}
