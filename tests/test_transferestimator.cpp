/**
 * @file test_transferestimator.cpp
 * @brief Unit tests for TransferEstimator speed and ETA sampling.
 *
 * The estimator is driven through sampleAt() so no real time passes.
 */

#include <QtTest>
#include <QSignalSpy>

#include "models/uploadstate.h"
#include "services/transferestimator.h"

class TestTransferEstimator : public QObject
{
    Q_OBJECT

private:
    UploadState *state = nullptr;
    TransferEstimator *estimator = nullptr;

    void queueBytes(qint64 size)
    {
        PendingItem item;
        item.localPath = "/tmp/big.iso";
        item.relativePath = "big.iso";
        item.size = size;
        state->appendToDestination("/isos/", {item});
    }

private slots:
    void init()
    {
        state = new UploadState(this);
        estimator = new TransferEstimator(state, this);
    }

    void cleanup()
    {
        delete estimator;
        delete state;
        estimator = nullptr;
        state = nullptr;
    }

    void testFirstSampleComputesSpeedAndEta()
    {
        queueBytes(10000000);
        QSignalSpy spy(state, &UploadState::estimateChanged);

        estimator->addBytesSent(3000000);
        estimator->sampleAt(3000);

        QCOMPARE(spy.count(), 1);
        QCOMPARE(state->speed(), 1000000.0);
        QCOMPARE(state->etaSeconds(), qint64(10));
        QCOMPARE(estimator->pendingBytes(), qint64(0));
    }

    void testEtaSubtractsPartialBytes()
    {
        queueBytes(10000000);
        state->setActive(state->queue().first().entries.first(), "/isos/");
        state->setProgress(4000000, 0.4);

        estimator->addBytesSent(2000000);
        estimator->sampleAt(4000);

        QCOMPARE(state->speed(), 500000.0);
        QCOMPARE(state->etaSeconds(), qint64(12));
    }

    void testShortWindowSkippedOnceSpeedKnown()
    {
        queueBytes(1000000);
        estimator->addBytesSent(300000);
        estimator->sampleAt(3000);
        QCOMPARE(state->speed(), 100000.0);

        QSignalSpy spy(state, &UploadState::estimateChanged);
        estimator->addBytesSent(600);
        estimator->sampleAt(4000);

        // One second is below the minimum window: nothing published, bytes kept
        QCOMPARE(spy.count(), 0);
        QCOMPARE(estimator->pendingBytes(), qint64(600));

        estimator->sampleAt(6000);
        QCOMPARE(spy.count(), 1);
        QCOMPARE(state->speed(), 200.0);
    }

    void testShortWindowAcceptedWithoutSpeed()
    {
        queueBytes(1000);
        estimator->addBytesSent(500);
        estimator->sampleAt(1000);

        QCOMPARE(state->speed(), 500.0);
        QCOMPARE(state->etaSeconds(), qint64(2));
    }

    void testZeroSpeedGivesZeroEta()
    {
        queueBytes(1000);
        estimator->sampleAt(5000);

        QCOMPARE(state->speed(), 0.0);
        QCOMPARE(state->etaSeconds(), qint64(0));
    }

    void testNegativeBytesIgnored()
    {
        estimator->addBytesSent(-100);
        estimator->addBytesSent(0);
        QCOMPARE(estimator->pendingBytes(), qint64(0));
    }

    void testStartStop()
    {
        QVERIFY(!estimator->isRunning());
        estimator->start();
        QVERIFY(estimator->isRunning());

        state->setEstimate(123.0, 45);
        estimator->addBytesSent(10);
        estimator->stop();

        QVERIFY(!estimator->isRunning());
        QCOMPARE(estimator->pendingBytes(), qint64(0));
        QCOMPARE(state->speed(), 0.0);
        QCOMPARE(state->etaSeconds(), qint64(0));
    }
};

QTEST_MAIN(TestTransferEstimator)
#include "test_transferestimator.moc"
