/**
 * @file test_conflictnegotiator.cpp
 * @brief Unit tests for ConflictNegotiator and ResumeOffer.
 *
 * Tests verify:
 * - Channel lifecycle (fresh id per cycle, readiness)
 * - Resume offers prompt the user and hand off on acceptance
 * - Offers that are oversized, expired, overtaken or stale are dropped
 * - Status overrides reach the tracked transfer
 */

#include <QtTest>
#include <QJsonObject>
#include <QRegularExpression>
#include <QSignalSpy>

#include "mocks/mocknotificationchannel.h"
#include "mocks/mockuploadtransport.h"
#include "models/uploadstate.h"
#include "services/conflictnegotiator.h"
#include "services/singletransfer.h"

class TestConflictNegotiator : public QObject
{
    Q_OBJECT

private:
    MockNotificationChannel *channel = nullptr;
    MockUploadTransport *transport = nullptr;
    UploadState *state = nullptr;
    ConflictNegotiator *negotiator = nullptr;
    SingleTransfer *transfer = nullptr;

    static PendingItem bigItem()
    {
        PendingItem item;
        item.localPath = "/data/big.iso";
        item.relativePath = "isos/big.iso";
        item.size = 10000000;
        return item;
    }

    void startTracked()
    {
        negotiator->prepareChannel();
        transfer = new SingleTransfer(transport, state, bigItem(), "/backup/", 0, this);
        negotiator->track(transfer);
        transfer->start(negotiator->channelId());
    }

    static QJsonObject offer(qint64 size, const QDateTime &expires = QDateTime())
    {
        QJsonObject entry;
        entry["size"] = size;
        if (expires.isValid()) {
            entry["expires"] = expires.toString(Qt::ISODateWithMs);
        }
        QJsonObject payload;
        payload["isos/big.iso"] = entry;
        return payload;
    }

private slots:
    void init()
    {
        channel = new MockNotificationChannel(this);
        transport = new MockUploadTransport(this);
        state = new UploadState(this);
        negotiator = new ConflictNegotiator(channel, state, this);
        transfer = nullptr;
    }

    void cleanup()
    {
        delete transfer;
        delete negotiator;
        delete state;
        delete transport;
        delete channel;
        transfer = nullptr;
        negotiator = nullptr;
        state = nullptr;
        transport = nullptr;
        channel = nullptr;
    }

    // === Channel lifecycle ===

    void testGenerateChannelId()
    {
        QString id = ConflictNegotiator::generateChannelId();
        QVERIFY(QRegularExpression("^upload-[0-9a-f]{8}$").match(id).hasMatch());
    }

    void testPrepareChannelSubscribesOnce()
    {
        QSignalSpy readySpy(negotiator, &ConflictNegotiator::channelReady);

        negotiator->prepareChannel();
        negotiator->prepareChannel();

        QCOMPARE(channel->mockSubscriptions().size(), 1);
        QCOMPARE(channel->mockSubscriptions().first(), negotiator->channelId());
        QVERIFY(negotiator->isChannelReady());
        QCOMPARE(readySpy.count(), 1);
    }

    void testChannelNotReadyUntilAccepted()
    {
        channel->mockSetAutoReady(false);
        negotiator->prepareChannel();
        QVERIFY(!negotiator->isChannelReady());

        channel->mockSetReady();
        QVERIFY(negotiator->isChannelReady());
    }

    void testResetChannelRenewsId()
    {
        negotiator->prepareChannel();
        QString first = negotiator->channelId();

        negotiator->resetChannel();
        QVERIFY(negotiator->channelId().isEmpty());
        QCOMPARE(channel->mockCloseCount(), 1);
        QVERIFY(!negotiator->isChannelReady());

        negotiator->prepareChannel();
        QCOMPARE(channel->mockSubscriptions().size(), 2);
        QVERIFY(!negotiator->channelId().isEmpty());
        QVERIFY(negotiator->channelId() != first);
    }

    // === Resume offers ===

    void testResumeOfferPromptsAndAccepts()
    {
        startTracked();
        QSignalSpy promptSpy(negotiator, &ConflictNegotiator::resumeConfirmationNeeded);
        QSignalSpy finishedSpy(transfer, &SingleTransfer::finished);

        transport->mockProgress(1000, 10000000);
        channel->mockPush(ConflictNegotiator::ResumableEvent, offer(4000000));

        QCOMPARE(promptSpy.count(), 1);
        QCOMPARE(promptSpy.at(0).at(0).toString(), QString("big.iso"));
        QCOMPARE(promptSpy.at(0).at(1).toLongLong(), qint64(4000000));
        QCOMPARE(promptSpy.at(0).at(2).toLongLong(), qint64(10000000));
        QCOMPARE(promptSpy.at(0).at(3).toLongLong(), qint64(0));
        QVERIFY(negotiator->hasPendingOffer());
        QCOMPARE(negotiator->pendingOfferSize(), qint64(4000000));

        negotiator->respondToResume(true);

        QVERIFY(!negotiator->hasPendingOffer());
        QCOMPARE(transport->mockAbortCount(), 1);
        QVERIFY(transfer->isResuming());
        QCOMPARE(transfer->resumeTarget(), qint64(4000000));
        QCOMPARE(finishedSpy.count(), 1);
    }

    void testResumeOfferWithExpiryHasCountdown()
    {
        startTracked();
        QSignalSpy promptSpy(negotiator, &ConflictNegotiator::resumeConfirmationNeeded);

        channel->mockPush(ConflictNegotiator::ResumableEvent,
                          offer(4000000, QDateTime::currentDateTimeUtc().addSecs(60)));

        QCOMPARE(promptSpy.count(), 1);
        qint64 timeoutMs = promptSpy.at(0).at(3).toLongLong();
        QVERIFY(timeoutMs > 50000);
        QVERIFY(timeoutMs <= 60000);
    }

    void testDeclineLeavesTransferRunning()
    {
        startTracked();
        channel->mockPush(ConflictNegotiator::ResumableEvent, offer(4000000));

        negotiator->respondToResume(false);

        QVERIFY(!negotiator->hasPendingOffer());
        QCOMPARE(transport->mockAbortCount(), 0);
        QVERIFY(!transfer->isFinished());
    }

    void testOfferLargerThanFileIgnored()
    {
        startTracked();
        QSignalSpy promptSpy(negotiator, &ConflictNegotiator::resumeConfirmationNeeded);

        channel->mockPush(ConflictNegotiator::ResumableEvent, offer(20000000));

        QCOMPARE(promptSpy.count(), 0);
        QVERIFY(!negotiator->hasPendingOffer());
    }

    void testExpiredOfferIgnored()
    {
        startTracked();
        QSignalSpy promptSpy(negotiator, &ConflictNegotiator::resumeConfirmationNeeded);

        channel->mockPush(ConflictNegotiator::ResumableEvent,
                          offer(4000000, QDateTime::currentDateTimeUtc().addSecs(-5)));

        QCOMPARE(promptSpy.count(), 0);
    }

    void testOfferForOtherFileIgnored()
    {
        startTracked();
        QSignalSpy promptSpy(negotiator, &ConflictNegotiator::resumeConfirmationNeeded);

        QJsonObject payload;
        payload["other.iso"] = 4000000;
        channel->mockPush(ConflictNegotiator::ResumableEvent, payload);

        QCOMPARE(promptSpy.count(), 0);
    }

    void testOfferAlreadyOvertakenIgnored()
    {
        startTracked();
        QSignalSpy promptSpy(negotiator, &ConflictNegotiator::resumeConfirmationNeeded);

        transport->mockProgress(5000000, 10000000);
        channel->mockPush(ConflictNegotiator::ResumableEvent, offer(4000000));

        QCOMPARE(promptSpy.count(), 0);
    }

    void testProgressPastOfferDismissesPrompt()
    {
        startTracked();
        QSignalSpy dismissSpy(negotiator, &ConflictNegotiator::resumeConfirmationDismissed);

        channel->mockPush(ConflictNegotiator::ResumableEvent, offer(4000000));
        QVERIFY(negotiator->hasPendingOffer());

        transport->mockProgress(3999999, 10000000);
        QVERIFY(negotiator->hasPendingOffer());

        transport->mockProgress(4000000, 10000000);
        QVERIFY(!negotiator->hasPendingOffer());
        QCOMPARE(dismissSpy.count(), 1);

        // A late answer does nothing
        negotiator->respondToResume(true);
        QCOMPARE(transport->mockAbortCount(), 0);
    }

    void testTransferFinishDismissesPrompt()
    {
        startTracked();
        QSignalSpy dismissSpy(negotiator, &ConflictNegotiator::resumeConfirmationDismissed);

        channel->mockPush(ConflictNegotiator::ResumableEvent, offer(4000000));
        transport->mockFinish(200);

        QCOMPARE(dismissSpy.count(), 1);
        QVERIFY(!negotiator->hasPendingOffer());

        negotiator->respondToResume(true);
        QVERIFY(!transfer->isResuming());
    }

    void testOfferExpiryDismissesPrompt()
    {
        startTracked();
        QSignalSpy dismissSpy(negotiator, &ConflictNegotiator::resumeConfirmationDismissed);

        channel->mockPush(ConflictNegotiator::ResumableEvent,
                          offer(4000000, QDateTime::currentDateTimeUtc().addMSecs(200)));
        QVERIFY(negotiator->hasPendingOffer());

        QVERIFY(dismissSpy.wait(2000));
        QVERIFY(!negotiator->hasPendingOffer());
    }

    void testUntrackedEventsIgnored()
    {
        negotiator->prepareChannel();
        QSignalSpy promptSpy(negotiator, &ConflictNegotiator::resumeConfirmationNeeded);

        channel->mockPush(ConflictNegotiator::ResumableEvent, offer(4000000));
        QCOMPARE(promptSpy.count(), 0);
    }

    // === Status overrides ===

    void testStatusOverrideAbortsWithError()
    {
        startTracked();
        QSignalSpy finishedSpy(transfer, &SingleTransfer::finished);

        QJsonObject payload;
        payload["isos/big.iso"] = 413;
        channel->mockPush(ConflictNegotiator::StatusEvent, payload);

        QCOMPARE(finishedSpy.count(), 1);
        QCOMPARE(finishedSpy.at(0).at(1).toInt(), 413);
        QCOMPARE(state->errorCount(), 1);
    }

    void testStatusOverrideAcceptsNumericString()
    {
        startTracked();
        QSignalSpy finishedSpy(transfer, &SingleTransfer::finished);

        QJsonObject payload;
        payload["isos/big.iso"] = "409";
        channel->mockPush(ConflictNegotiator::StatusEvent, payload);

        QCOMPARE(finishedSpy.count(), 1);
        QCOMPARE(finishedSpy.at(0).at(0).value<SingleTransfer::Outcome>(), SingleTransfer::Outcome::Skipped);
        QCOMPARE(state->doneCount(), 0);
        QCOMPARE(state->errorCount(), 0);
    }

    void testMalformedStatusIgnored()
    {
        startTracked();
        QJsonObject payload;
        payload["isos/big.iso"] = "broken";
        channel->mockPush(ConflictNegotiator::StatusEvent, payload);

        transport->mockFinish(200);
        QCOMPARE(state->doneCount(), 1);
    }

    // === ResumeOffer parsing ===

    void testParseOfferForms()
    {
        QJsonObject entry;
        entry["size"] = 1234;
        entry["expires"] = 1700000000000.0;
        QJsonObject payload;
        payload["a.bin"] = entry;
        payload["b.bin"] = 99;
        payload["c.bin"] = "nope";
        payload["expires"] = "2030-01-01T00:00:00Z";

        auto a = ResumeOffer::parse(payload, "a.bin");
        QVERIFY(a.has_value());
        QCOMPARE(a->size, qint64(1234));
        QCOMPARE(a->expires.toMSecsSinceEpoch(), qint64(1700000000000));

        // Bare size falls back to the top-level expiry
        auto b = ResumeOffer::parse(payload, "b.bin");
        QVERIFY(b.has_value());
        QCOMPARE(b->size, qint64(99));
        QCOMPARE(b->expires.toUTC().toString(Qt::ISODate), QString("2030-01-01T00:00:00Z"));

        QVERIFY(!ResumeOffer::parse(payload, "c.bin").has_value());
        QVERIFY(!ResumeOffer::parse(payload, "missing.bin").has_value());
        QVERIFY(!ResumeOffer::parse(QJsonValue(5), "a.bin").has_value());
    }

    void testRemainingMs()
    {
        QDateTime now = QDateTime::currentDateTimeUtc();

        ResumeOffer none;
        QCOMPARE(none.remainingMs(now), qint64(-1));

        ResumeOffer future;
        future.expires = now.addMSecs(1500);
        QCOMPARE(future.remainingMs(now), qint64(1500));

        ResumeOffer past;
        past.expires = now.addSecs(-1);
        QCOMPARE(past.remainingMs(now), qint64(0));
    }
};

QTEST_MAIN(TestConflictNegotiator)
#include "test_conflictnegotiator.moc"
