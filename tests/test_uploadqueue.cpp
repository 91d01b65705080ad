#include <QtTest>
#include <QJsonObject>
#include <QSignalSpy>

#include "mocks/mocknotificationchannel.h"
#include "mocks/mockuploadtransport.h"
#include "models/uploadqueue.h"
#include "models/uploadstate.h"
#include "services/conflictnegotiator.h"

class TestUploadQueue : public QObject
{
    Q_OBJECT

private:
    UploadState *state;
    MockUploadTransport *mockTransport;
    MockNotificationChannel *mockChannel;
    UploadQueue *queue;

    static PendingItem makeItem(const QString &relativePath, qint64 size,
                                const QString &mimeType = QString())
    {
        PendingItem item;
        item.localPath = "/home/user/" + relativePath;
        item.relativePath = relativePath;
        item.mimeType = mimeType;
        item.size = size;
        return item;
    }

    // Paths of every request posted so far, in order
    QStringList postedPaths() const
    {
        QStringList paths;
        for (const UploadRequest &request : mockTransport->mockRequests()) {
            paths << request.destination + request.partName;
        }
        return paths;
    }

    // Completes the in-flight request and lets the scheduler react
    void finishCurrent(int status)
    {
        mockTransport->mockFinish(status);
        queue->flushEventQueue();
    }

    void verifyInvariants()
    {
        for (const QueueEntry &entry : state->queue()) {
            QVERIFY(!entry.entries.isEmpty());
        }
        QVERIFY(state->progressFraction() >= 0.0);
        QVERIFY(state->progressFraction() <= 1.0);
        // At most one transfer in flight
        QCOMPARE(queue->activeTransfer() != nullptr, state->hasActive());
    }

private slots:
    void initTestCase()
    {
        qRegisterMetaType<SingleTransfer::Outcome>();
        qRegisterMetaType<UploadSummary>();
    }

    void init()
    {
        state = new UploadState(this);
        mockTransport = new MockUploadTransport(this);
        mockChannel = new MockNotificationChannel(this);
        queue = new UploadQueue(state, mockTransport, mockChannel, this);
    }

    void cleanup()
    {
        delete queue;
        delete mockChannel;
        delete mockTransport;
        delete state;
        queue = nullptr;
        mockChannel = nullptr;
        mockTransport = nullptr;
        state = nullptr;
    }

    // === Basic flow ===

    void testSingleUploadSucceeds()
    {
        QSignalSpy drainedSpy(queue, &UploadQueue::queueDrained);

        queue->enqueue({makeItem("report.pdf", 10000000)}, "/docs/");
        QCOMPARE(queue->rowCount(), 1);
        queue->flushEventQueue();

        QCOMPARE(mockTransport->mockRequestCount(), 1);
        UploadRequest request = mockTransport->mockLastRequest();
        QCOMPARE(request.destination, QString("/docs/"));
        QCOMPARE(request.query.queryItemValue("resume"), QString("0"));
        QCOMPARE(request.query.queryItemValue("channel"), queue->negotiator()->channelId());
        QVERIFY(state->hasActive());
        verifyInvariants();

        mockTransport->mockProgress(10000000, 10000000);
        QCOMPARE(state->progressFraction(), 1.0);
        finishCurrent(200);

        QCOMPARE(state->doneCount(), 1);
        QCOMPARE(state->doneBytes(), qint64(10000000));
        QCOMPARE(state->errorCount(), 0);
        QVERIFY(state->isQueueEmpty());
        QVERIFY(!state->hasActive());
        QCOMPARE(queue->rowCount(), 0);
        QCOMPARE(drainedSpy.count(), 1);
        verifyInvariants();
    }

    void testSkipExistingConflict()
    {
        queue->setSkipExisting(true);
        queue->enqueue({makeItem("a.bin", 100), makeItem("b.bin", 200)}, "/up/");
        queue->flushEventQueue();

        QCOMPARE(mockTransport->mockLastRequest().query.queryItemValue("skipExisting"), QString("1"));
        finishCurrent(409);

        QCOMPARE(state->doneCount(), 0);
        QCOMPARE(state->errorCount(), 0);
        // Queue advanced to the next file
        QCOMPARE(mockTransport->mockRequestCount(), 2);
        QCOMPARE(mockTransport->mockLastRequest().partName, QString("b.bin"));
    }

    void testEnqueueDeduplicates()
    {
        queue->setPaused(true);
        queue->enqueue({makeItem("a.bin", 100)}, "/up/");
        queue->enqueue({makeItem("a.bin", 100), makeItem("b.bin", 50)}, "/up/");
        queue->enqueue({makeItem("a.bin", 100)}, "/other/");

        QCOMPARE(state->queue().size(), 2);
        QCOMPARE(state->queue()[0].entries.size(), 2);
        QCOMPARE(state->queue()[1].entries.size(), 1);
        QCOMPARE(queue->rowCount(), 3);
        QCOMPARE(state->queuedBytes(), qint64(250));
    }

    void testAcceptPolicyRejectsOncePerBatch()
    {
        queue->setPaused(true);
        queue->setAcceptPolicy(AcceptPolicy(".png"));
        QSignalSpy rejectedSpy(queue, &UploadQueue::filesRejected);

        queue->enqueue({makeItem("report.pdf", 100, "application/pdf"),
                        makeItem("photo.png", 100, "image/png"),
                        makeItem("notes.txt", 10, "text/plain")}, "/pics/");

        QCOMPARE(rejectedSpy.count(), 1);
        QCOMPARE(rejectedSpy.at(0).at(0).toInt(), 2);
        QCOMPARE(state->queuedItemCount(), 1);
        QCOMPARE(state->queue().first().entries.first().relativePath, QString("photo.png"));
    }

    void testRejectedOnlyBatchNeverQueued()
    {
        queue->setAcceptPolicy(AcceptPolicy(".png"));
        QSignalSpy rejectedSpy(queue, &UploadQueue::filesRejected);

        queue->enqueue({makeItem("report.pdf", 100, "application/pdf")}, "/pics/");
        queue->flushEventQueue();

        QCOMPARE(rejectedSpy.count(), 1);
        QVERIFY(state->isQueueEmpty());
        QCOMPARE(mockTransport->mockRequestCount(), 0);
    }

    void testCommitAdding()
    {
        state->addToAdding({makeItem("a.bin", 1), makeItem("b.bin", 2)});

        QCOMPARE(queue->commitAdding("/up/"), 2);
        QVERIFY(state->adding().isEmpty());
        QCOMPARE(state->queuedItemCount(), 2);
        QCOMPARE(queue->commitAdding("/up/"), 0);
    }

    // === Ordering ===

    void testFifoWithinDestination()
    {
        queue->enqueue({makeItem("a.bin", 10), makeItem("b.bin", 10)}, "/up/");
        queue->flushEventQueue();

        QCOMPARE(mockTransport->mockRequestCount(), 1);
        QCOMPARE(mockTransport->mockLastRequest().partName, QString("a.bin"));

        // B must not start while A is in flight
        queue->flushEventQueue();
        QCOMPARE(mockTransport->mockRequestCount(), 1);

        finishCurrent(500);
        QCOMPARE(mockTransport->mockRequestCount(), 2);
        QCOMPARE(mockTransport->mockLastRequest().partName, QString("b.bin"));
    }

    void testFifoAcrossDestinations()
    {
        queue->enqueue({makeItem("a1.bin", 10), makeItem("a2.bin", 10)}, "/A/");
        queue->enqueue({makeItem("b1.bin", 10)}, "/B/");
        queue->enqueue({makeItem("a3.bin", 10)}, "/A/");
        queue->flushEventQueue();

        for (int i = 0; i < 4; ++i) {
            verifyInvariants();
            finishCurrent(200);
        }

        QCOMPARE(postedPaths(), QStringList({"/A/a1.bin", "/A/a2.bin", "/A/a3.bin", "/B/b1.bin"}));
        QCOMPARE(state->doneCount(), 4);
        QVERIFY(state->isQueueEmpty());
    }

    void testErrorsNeverHaltQueue()
    {
        QSignalSpy failedSpy(queue, &UploadQueue::uploadFailed);

        queue->enqueue({makeItem("huge.bin", 10), makeItem("b.bin", 10), makeItem("c.bin", 10)}, "/up/");
        queue->flushEventQueue();

        finishCurrent(413);
        mockTransport->mockFail();
        queue->flushEventQueue();
        finishCurrent(200);

        QCOMPARE(state->errorCount(), 2);
        QCOMPARE(state->doneCount(), 1);
        // Only the first error of the batch is surfaced
        QCOMPARE(failedSpy.count(), 1);
        QCOMPARE(failedSpy.at(0).at(0).toString(), QString("huge.bin"));
        QCOMPARE(failedSpy.at(0).at(1).toInt(), 413);
        QVERIFY(state->isQueueEmpty());
    }

    // === Pause ===

    void testPauseLetsActiveFileFinish()
    {
        QSignalSpy noticeSpy(queue, &UploadQueue::pauseNoticeNeeded);

        queue->enqueue({makeItem("a.bin", 10), makeItem("b.bin", 10)}, "/up/");
        queue->flushEventQueue();

        queue->togglePause();
        QVERIFY(queue->isPaused());
        QCOMPARE(noticeSpy.count(), 1);
        QCOMPARE(mockTransport->mockAbortCount(), 0);

        finishCurrent(200);
        QCOMPARE(state->doneCount(), 1);
        QCOMPARE(mockTransport->mockRequestCount(), 1);
        QVERIFY(!state->hasActive());

        queue->togglePause();
        queue->flushEventQueue();
        QCOMPARE(mockTransport->mockRequestCount(), 2);
        QCOMPARE(mockTransport->mockLastRequest().partName, QString("b.bin"));

        // The notice is shown once per session
        queue->togglePause();
        QCOMPARE(noticeSpy.count(), 1);
    }

    void testPausedQueueDoesNotStart()
    {
        queue->setPaused(true);
        queue->enqueue({makeItem("a.bin", 10)}, "/up/");
        queue->flushEventQueue();

        QCOMPARE(mockTransport->mockRequestCount(), 0);
        QVERIFY(queue->hasPendingUploads());
    }

    // === Cancellation ===

    void testClearAbortsActive()
    {
        QSignalSpy drainedSpy(queue, &UploadQueue::queueDrained);

        queue->enqueue({makeItem("a.bin", 10), makeItem("b.bin", 10)}, "/up/");
        queue->flushEventQueue();
        mockTransport->mockProgress(5, 10);

        queue->clear();
        queue->flushEventQueue();

        QCOMPARE(mockTransport->mockAbortCount(), 1);
        QVERIFY(state->isQueueEmpty());
        QVERIFY(!state->hasActive());
        QVERIFY(!queue->hasPendingUploads());
        QCOMPARE(state->doneCount(), 0);
        QCOMPARE(state->errorCount(), 0);
        QCOMPARE(mockTransport->mockRequestCount(), 1);
        QCOMPARE(drainedSpy.count(), 0);
        QVERIFY(queue->negotiator()->channelId().isEmpty());
    }

    void testRemoveActiveAdvances()
    {
        queue->enqueue({makeItem("a.bin", 10), makeItem("b.bin", 10)}, "/up/");
        queue->flushEventQueue();

        QVERIFY(queue->removeFromQueue("/up/", "a.bin"));
        queue->flushEventQueue();

        QCOMPARE(mockTransport->mockAbortCount(), 1);
        QCOMPARE(state->errorCount(), 0);
        QCOMPARE(mockTransport->mockRequestCount(), 2);
        QCOMPARE(mockTransport->mockLastRequest().partName, QString("b.bin"));
        QCOMPARE(state->queuedItemCount(), 1);
    }

    void testRemoveQueuedItemPrunesEntry()
    {
        queue->enqueue({makeItem("a.bin", 10)}, "/up/");
        queue->enqueue({makeItem("b.bin", 10)}, "/other/");
        queue->flushEventQueue();

        QVERIFY(queue->removeFromQueue("/other/", "b.bin"));
        QCOMPARE(state->queue().size(), 1);
        QCOMPARE(mockTransport->mockAbortCount(), 0);
        QVERIFY(!queue->removeFromQueue("/other/", "b.bin"));
        verifyInvariants();
    }

    // === Resume handoff ===

    void testResumeHandoff()
    {
        QSignalSpy startedSpy(queue, &UploadQueue::transferStarted);
        QSignalSpy promptSpy(queue->negotiator(), &ConflictNegotiator::resumeConfirmationNeeded);

        queue->enqueue({makeItem("big.iso", 10000000), makeItem("next.bin", 10)}, "/isos/");
        queue->flushEventQueue();
        mockTransport->mockProgress(1000000, 10000000);

        QJsonObject entry;
        entry["size"] = 4000000;
        entry["expires"] = QDateTime::currentDateTimeUtc().addSecs(30).toString(Qt::ISODate);
        QJsonObject payload;
        payload["big.iso"] = entry;
        mockChannel->mockPush(ConflictNegotiator::ResumableEvent, payload);
        QCOMPARE(promptSpy.count(), 1);

        QSignalSpy progressSpy(state, &UploadState::progressChanged);
        queue->negotiator()->respondToResume(true);
        queue->flushEventQueue();

        // The restart is seeded at the offset; progress never drops back to zero
        QVERIFY(!progressSpy.isEmpty());
        for (const QList<QVariant> &args : progressSpy) {
            QVERIFY2(args.at(0).toLongLong() >= 4000000,
                     qPrintable(QString("progress dropped to %1").arg(args.at(0).toLongLong())));
            QVERIFY(args.at(1).toDouble() >= 0.4);
        }

        QCOMPARE(mockTransport->mockAbortCount(), 1);
        QCOMPARE(mockTransport->mockRequestCount(), 2);
        UploadRequest resumed = mockTransport->mockLastRequest();
        QCOMPARE(resumed.partName, QString("big.iso"));
        QCOMPARE(resumed.offset, qint64(4000000));
        QCOMPARE(resumed.query.queryItemValue("resume"), QString("4000000"));
        QCOMPARE(startedSpy.count(), 2);
        QCOMPARE(startedSpy.at(1).at(2).toLongLong(), qint64(4000000));

        // Progress continues from the offset
        QCOMPARE(state->partialBytes(), qint64(4000000));
        mockTransport->mockProgress(1000, 6000000);
        QCOMPARE(state->partialBytes(), qint64(4001000));

        // The aborted request counted nothing
        QCOMPARE(state->doneCount(), 0);
        QCOMPARE(state->errorCount(), 0);

        mockTransport->mockProgress(6000000, 6000000);
        finishCurrent(200);
        QCOMPARE(state->doneCount(), 1);
        QCOMPARE(state->doneBytes(), qint64(10000000));
        QCOMPARE(mockTransport->mockLastRequest().partName, QString("next.bin"));
    }

    void testStatusOverrideFailsActive()
    {
        QSignalSpy failedSpy(queue, &UploadQueue::uploadFailed);

        queue->enqueue({makeItem("a.bin", 10), makeItem("b.bin", 10)}, "/up/");
        queue->flushEventQueue();

        QJsonObject payload;
        payload["a.bin"] = 413;
        mockChannel->mockPush(ConflictNegotiator::StatusEvent, payload);
        queue->flushEventQueue();

        QCOMPARE(state->errorCount(), 1);
        QCOMPARE(failedSpy.count(), 1);
        QCOMPARE(failedSpy.at(0).at(1).toInt(), 413);
        QCOMPARE(mockTransport->mockLastRequest().partName, QString("b.bin"));
    }

    // === Channel ===

    void testWaitsForChannel()
    {
        mockChannel->mockSetAutoReady(false);
        queue->enqueue({makeItem("a.bin", 10)}, "/up/");
        queue->flushEventQueue();

        QCOMPARE(mockChannel->mockSubscriptions().size(), 1);
        QCOMPARE(mockTransport->mockRequestCount(), 0);

        mockChannel->mockSetReady();
        queue->flushEventQueue();
        QCOMPARE(mockTransport->mockRequestCount(), 1);
        QCOMPARE(mockTransport->mockLastRequest().query.queryItemValue("channel"),
                 mockChannel->mockSubscriptions().first());
    }

    void testStartsWithoutChannelAfterTimeout()
    {
        mockChannel->mockSetAutoReady(false);
        queue->enqueue({makeItem("a.bin", 10)}, "/up/");
        queue->flushEventQueue();
        QCOMPARE(mockTransport->mockRequestCount(), 0);

        QTRY_COMPARE_WITH_TIMEOUT(mockTransport->mockRequestCount(), 1, UploadQueue::ChannelWaitMs + 2000);
    }

    void testChannelRenewedPerCycle()
    {
        queue->enqueue({makeItem("a.bin", 10)}, "/up/");
        queue->flushEventQueue();
        QString firstChannel = mockTransport->mockLastRequest().query.queryItemValue("channel");
        finishCurrent(200);

        QCOMPARE(mockChannel->mockCloseCount(), 1);
        QVERIFY(queue->negotiator()->channelId().isEmpty());

        queue->enqueue({makeItem("b.bin", 10)}, "/up/");
        queue->flushEventQueue();
        QString secondChannel = mockTransport->mockLastRequest().query.queryItemValue("channel");

        QCOMPARE(mockChannel->mockSubscriptions().size(), 2);
        QVERIFY(!secondChannel.isEmpty());
        QVERIFY(secondChannel != firstChannel);
    }

    // === Drain ===

    void testDrainRequestsDebouncedRefresh()
    {
        QSignalSpy refreshSpy(queue, &UploadQueue::remoteRefreshRequested);

        queue->enqueue({makeItem("a.bin", 10)}, "/docs/");
        queue->flushEventQueue();
        finishCurrent(200);

        QCOMPARE(refreshSpy.count(), 0);
        QVERIFY(refreshSpy.wait(UploadQueue::RefreshDebounceMs + 2000));
        QCOMPARE(refreshSpy.at(0).at(0).toString(), QString("/docs/"));
    }

    void testSummaryWhenUiHidden()
    {
        QSignalSpy concludedSpy(queue, &UploadQueue::uploadConcluded);

        queue->enqueue({makeItem("a.bin", 10), makeItem("b.bin", 20)}, "/up/");
        queue->flushEventQueue();
        finishCurrent(200);
        finishCurrent(500);

        QCOMPARE(concludedSpy.count(), 1);
        UploadSummary summary = concludedSpy.at(0).at(0).value<UploadSummary>();
        QCOMPARE(summary.doneCount, 1);
        QCOMPARE(summary.doneBytes, qint64(10));
        QCOMPARE(summary.errorCount, 1);

        queue->acknowledgeSummary();
        QVERIFY(state->summary().isEmpty());
    }

    void testNoSummaryWhenUiVisible()
    {
        QSignalSpy concludedSpy(queue, &UploadQueue::uploadConcluded);
        QSignalSpy refreshSpy(queue, &UploadQueue::remoteRefreshRequested);
        queue->setTransferUiVisible(true);

        queue->enqueue({makeItem("a.bin", 10)}, "/up/");
        queue->flushEventQueue();
        finishCurrent(200);

        QCOMPARE(concludedSpy.count(), 0);
        QCOMPARE(state->doneCount(), 1);

        // Leaving the transfer UI refreshes the listing that changed meanwhile
        queue->setTransferUiVisible(false);
        QVERIFY(refreshSpy.count() >= 1);
        QCOMPARE(refreshSpy.last().at(0).toString(), QString("/up/"));

        // Coming back with nothing queued starts a fresh tally
        queue->setTransferUiVisible(true);
        QVERIFY(state->summary().isEmpty());
    }

    // === Model ===

    void testModelData()
    {
        queue->enqueue({makeItem("photos/a.jpg", 100)}, "/pics/");
        queue->enqueue({makeItem("b.jpg", 50)}, "/other/");
        queue->flushEventQueue();
        mockTransport->mockProgress(40, 100);

        QCOMPARE(queue->rowCount(), 2);
        QModelIndex first = queue->index(0);
        QCOMPARE(queue->data(first, UploadQueue::DestinationRole).toString(), QString("/pics/"));
        QCOMPARE(queue->data(first, UploadQueue::FileNameRole).toString(), QString("a.jpg"));
        QCOMPARE(queue->data(first, UploadQueue::SizeRole).toLongLong(), qint64(100));
        QVERIFY(queue->data(first, UploadQueue::ActiveRole).toBool());
        QCOMPARE(queue->data(first, UploadQueue::ProgressRole).toInt(), 40);

        QModelIndex second = queue->index(1);
        QVERIFY(!queue->data(second, UploadQueue::ActiveRole).toBool());
        QCOMPARE(queue->data(second, UploadQueue::ProgressRole).toInt(), 0);
        QVERIFY(!queue->data(queue->index(5), Qt::DisplayRole).isValid());
    }
};

QTEST_MAIN(TestUploadQueue)
#include "test_uploadqueue.moc"
